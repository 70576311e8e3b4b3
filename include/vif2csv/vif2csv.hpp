/**
 * @file vif2csv.hpp
 * @brief High-level VIB log to CSV conversion API.
 *
 * Provides a one-call decode() for converting a whole log held in a
 * stream, suitable for file-level operations.
 */

#ifndef VIF2CSV_HPP
#define VIF2CSV_HPP

#include <ostream>

#include "bytereader.hpp"
#include "config.hpp"
#include "csv_writer.hpp"
#include "error.hpp"
#include "field_codec.hpp"
#include "mode_prescanner.hpp"
#include "odd_format.hpp"
#include "options.hpp"
#include "pipeline.hpp"
#include "record.hpp"
#include "record_decoder.hpp"
#include "record_validator.hpp"
#include "stream_scanner.hpp"

namespace vif2csv {

/**
 * @brief Convert a VIB log to CSV.
 *
 * @param in Seekable input positioned at the start of the log
 * @param out CSV destination
 * @param options Decode options
 * @param[out] stats Counters of the pass
 * @param encoding Output text encoding
 * @return Error::Ok on success
 */
inline Error decode(std::istream& in, std::ostream& out, const DecodeOptions& options,
                    PipelineStats& stats, OutputEncoding encoding = OutputEncoding::Utf8) {
    CsvWriter writer(out, encoding);
    DecodePipeline pipeline(options);
    Error result = pipeline.run(in, writer);
    stats = pipeline.stats();
    return result;
}

/**
 * @brief Get library version.
 * @return Version string
 */
inline const char* version() noexcept {
    return "1.10";
}

} // namespace vif2csv

#endif // VIF2CSV_HPP
