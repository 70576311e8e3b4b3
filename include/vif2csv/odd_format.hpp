/**
 * @file odd_format.hpp
 * @brief Fixed-decimal formatting with round-half-to-odd tie breaking.
 *
 * The instrument vendor's export tools round ties at the last reported
 * digit to the odd neighbour (2.5 -> 3, 3.5 -> 3). Values are compared to
 * the tie with a 1e-7 tolerance on the scaled fraction, so binary
 * representation noise such as 13.500000000000002 still counts as a tie.
 */

#ifndef VIF2CSV_ODD_FORMAT_HPP
#define VIF2CSV_ODD_FORMAT_HPP

#include <cmath>
#include <cstdint>
#include <cstdio>
#include <string>

namespace vif2csv {

/// Tolerance around .5 of the scaled fraction that still counts as a tie
inline constexpr double TIE_EPSILON = 1e-7;

/**
 * @brief Round a value to @p decimals places, ties to odd.
 *
 * @param value Value to round
 * @param decimals Number of decimal places (0-9)
 * @return Rounded value
 */
inline double round_half_odd(double value, int decimals) noexcept {
    double scale = std::pow(10.0, decimals);
    double scaled = value * scale;
    double sign = (scaled > 0.0) ? 1.0 : ((scaled < 0.0) ? -1.0 : 0.0);
    double abs_scaled = std::fabs(scaled);
    double floor_part = std::floor(abs_scaled);
    double frac = abs_scaled - floor_part;

    double rounded;
    if (frac > 0.5 + TIE_EPSILON) {
        rounded = floor_part + 1.0;
    } else if (frac < 0.5 - TIE_EPSILON) {
        rounded = floor_part;
    } else {
        rounded = (static_cast<std::int64_t>(floor_part) % 2 == 0) ? floor_part + 1.0 : floor_part;
    }

    return (rounded * sign) / scale;
}

/**
 * @brief Format a value with exactly @p decimals places, ties to odd.
 *
 * @param value Value to format
 * @param decimals Number of decimal places (0-9)
 * @return Formatted string, e.g. "0.13" for (0.135, 2)
 */
inline std::string format_fixed_odd(double value, int decimals) {
    char buf[64];
    int len = std::snprintf(buf, sizeof(buf), "%.*f", decimals, round_half_odd(value, decimals));
    if (len < 0) {
        return {};
    }
    std::size_t n = static_cast<std::size_t>(len);
    return std::string(buf, (n < sizeof(buf)) ? n : sizeof(buf) - 1);
}

} // namespace vif2csv

#endif // VIF2CSV_ODD_FORMAT_HPP
