/**
 * @file mode_prescanner.hpp
 * @brief First pass detecting extended (KB) record files.
 */

#ifndef VIF2CSV_MODE_PRESCANNER_HPP
#define VIF2CSV_MODE_PRESCANNER_HPP

#include <istream>

namespace vif2csv {

/**
 * @brief Detect whether a stream contains extended (KB) records.
 *
 * Walks the stream with its own cursor, independent of any StreamScanner.
 * After each "VIB" marker the 9 header bytes are read; a type byte of
 * 0x8A ends the pass, otherwise the rest of the record is skipped using
 * its declared size.
 *
 * @param source Stream positioned at the first byte; left at an
 *        unspecified position, callers rewind it
 * @return true if any record has the extended type
 */
bool detect_kb_mode(std::istream& source);

} // namespace vif2csv

#endif // VIF2CSV_MODE_PRESCANNER_HPP
