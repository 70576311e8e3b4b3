/**
 * @file stream_scanner.hpp
 * @brief Resynchronizing scanner for VIB record boundaries.
 *
 * The scanner does not trust fixed-width framing. It searches the byte
 * stream for the "VIB" marker, reads the declared size, and moves on by at
 * least the minimum header so a corrupt size field cannot stall it.
 * Filler bytes, truncated records and misaligned data between markers
 * are skipped.
 */

#ifndef VIF2CSV_STREAM_SCANNER_HPP
#define VIF2CSV_STREAM_SCANNER_HPP

#include <istream>
#include <optional>
#include <vector>

#include "config.hpp"
#include "error.hpp"
#include "record.hpp"

namespace vif2csv {

/**
 * @brief Finds candidate records in a byte stream.
 *
 * The read type of a candidate depends on the distance to the next
 * marker, so candidates are emitted one behind discovery: next() returns
 * the previous candidate once its successor has been found, and the last
 * candidate is flushed with READ_TYPE_NORMAL at end of stream.
 *
 * Unconsumed bytes live in a window that is compacted before it grows
 * and doubles in capacity when full.
 */
class StreamScanner {
public:
    /**
     * @brief Construct a scanner over a byte source.
     *
     * @param source Stream to read from, positioned at the first byte
     * @param initial_capacity Initial window capacity in bytes
     */
    explicit StreamScanner(std::istream& source,
                           std::size_t initial_capacity = INITIAL_WINDOW_SIZE);

    StreamScanner(const StreamScanner&) = delete;
    StreamScanner& operator=(const StreamScanner&) = delete;

    /**
     * @brief Get the next candidate and its read type.
     *
     * @param[out] out Next scanned record
     * @return Error::Ok with a record, Error::EndOfStream when drained,
     *         Error::Io if the source failed
     */
    Error next(ScannedRecord& out);

    /**
     * @brief Read type implied by the distance between two markers.
     */
    static int read_type_from_delta(std::uint64_t delta) noexcept {
        return (delta == NORMAL_DELTA) ? READ_TYPE_NORMAL : READ_TYPE_IRREGULAR;
    }

    /// Number of complete candidates found so far
    [[nodiscard]] std::size_t records_found() const noexcept {
        return records_found_;
    }

    /// Current window capacity in bytes
    [[nodiscard]] std::size_t window_capacity() const noexcept {
        return window_.size();
    }

private:
    bool ensure_available(std::size_t count);
    void compact() noexcept;
    bool find_candidate(RawRecordCandidate& out);

    std::istream& source_;
    std::vector<std::uint8_t> window_;
    std::size_t length_ = 0;           ///< Valid bytes in the window
    std::size_t scan_ = 0;             ///< Scan cursor into the window
    std::uint64_t window_start_ = 0;   ///< Stream offset of window_[0]
    std::optional<RawRecordCandidate> pending_;
    std::size_t records_found_ = 0;
    bool finished_ = false;
    bool source_failed_ = false;
};

} // namespace vif2csv

#endif // VIF2CSV_STREAM_SCANNER_HPP
