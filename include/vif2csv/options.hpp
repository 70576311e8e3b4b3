/**
 * @file options.hpp
 * @brief Runtime configuration of a decode run.
 */

#ifndef VIF2CSV_OPTIONS_HPP
#define VIF2CSV_OPTIONS_HPP

#include <optional>
#include <string>

#include "record.hpp"

namespace vif2csv {

/**
 * @brief Options consumed by the decoder, set from the command line.
 */
struct DecodeOptions {
    bool print_header = false;  ///< Emit the names and units rows first
    bool print_counter = true;  ///< Emit the running counter column
    bool filter_today = false;  ///< Keep only records dated today
    bool long_format = false;   ///< 4 decimals everywhere instead of 1-2

    /// Keep only records of this day, normalized to YYYY-MM-DD
    std::optional<std::string> date_filter;

    /// Overrides the local date used by filter_today
    std::optional<CalendarDate> today;

    /// Decimals used for most measured values
    [[nodiscard]] int value_decimals() const noexcept {
        return long_format ? 4 : 2;
    }

    /// Decimals used for fixed-point and temperature values
    [[nodiscard]] int coarse_decimals() const noexcept {
        return long_format ? 4 : 1;
    }
};

/**
 * @brief Check a date filter argument.
 *
 * @param text "YYYY-MM-DD" or "YY-MM-DD"
 * @return true if the text has one of the two shapes
 */
bool validate_date_string(const std::string& text) noexcept;

/**
 * @brief Normalize a date filter argument to YYYY-MM-DD.
 *
 * Two-digit years are taken as 20YY.
 *
 * @throws InvalidArgumentException if the text is not a valid date filter
 */
std::string normalize_date_string(const std::string& text);

/**
 * @brief Current date in the local time zone.
 */
CalendarDate local_today();

} // namespace vif2csv

#endif // VIF2CSV_OPTIONS_HPP
