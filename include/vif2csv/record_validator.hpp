/**
 * @file record_validator.hpp
 * @brief Acceptance checks for scanned candidates.
 */

#ifndef VIF2CSV_RECORD_VALIDATOR_HPP
#define VIF2CSV_RECORD_VALIDATOR_HPP

#include <optional>
#include <string>

#include "options.hpp"
#include "record.hpp"

namespace vif2csv {

/**
 * @brief Reason a candidate was not accepted.
 */
enum class Rejection {
    None,     ///< Accepted
    ReadType, ///< Read type outside the accepted mask
    Size,     ///< Declared size is not RECORD_SIZE
    Type,     ///< Record type is not a VIB measurement
    DateTime, ///< Calendar fields out of range
    Filter    ///< Excluded by the date or today filter
};

const char* rejection_string(Rejection rejection) noexcept;

/**
 * @brief Decides which scanned candidates are decoded.
 *
 * Checks run in a fixed order: read type and size, record type, calendar
 * fields, then the optional date filters. Every rejection counts as a
 * skipped record.
 */
class RecordValidator {
public:
    /**
     * @brief Construct a validator.
     *
     * The local date is sampled once here when filter_today is set and no
     * override is given.
     */
    explicit RecordValidator(const DecodeOptions& options);

    /**
     * @brief Check a scanned candidate.
     *
     * @param scanned Candidate and its read type
     * @param[out] accepted Date, time and block of an accepted record
     * @return Rejection::None if accepted
     */
    Rejection check(const ScannedRecord& scanned, AcceptedRecord& accepted) const;

    /// Read type passes the mask and the size is the decodable one
    static bool is_valid_to_process(std::uint16_t record_size, int read_type) noexcept;

    /// Days in a month; February has 29 days when (yy & 3) == 0
    static int days_in_month(int month, int year_yy) noexcept;

    /// Range check of the six raw calendar bytes
    static bool datetime_valid(int second, int minute, int hour, int day, int month,
                               int year_yy) noexcept;

private:
    std::optional<CalendarDate> today_;
    std::optional<std::string> date_filter_;
};

} // namespace vif2csv

#endif // VIF2CSV_RECORD_VALIDATOR_HPP
