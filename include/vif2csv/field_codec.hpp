/**
 * @file field_codec.hpp
 * @brief Raw field decoding of VIB records.
 *
 * Pure conversions from the fixed-width integers stored in a record to
 * physical quantities and their rendered strings. The bit widths, shift
 * amounts and mask constants below are the instrument's calibration
 * contract and must not be changed.
 */

#ifndef VIF2CSV_FIELD_CODEC_HPP
#define VIF2CSV_FIELD_CODEC_HPP

#include <cmath>
#include <limits>
#include <optional>
#include <string>

#include "bytereader.hpp"
#include "config.hpp"
#include "odd_format.hpp"

namespace vif2csv {

/**
 * @brief Validity of a measured value.
 *
 * The negative codes are reserved decoded values written by the device,
 * Overload is raised by the classifier for out-of-range magnitudes.
 */
enum class ValidityStatus : std::int32_t {
    Ok = 0,
    Disconnected = -1,
    DataInvalid = -2,
    NoData = -3,
    NotResponding = -4,
    Overload = std::numeric_limits<std::int32_t>::max()
};

/**
 * @brief Decode the device's 16-bit custom float to an integer mantissa.
 *
 * Bits 11-15 hold a biased exponent, bits 0-10 the mantissa without its
 * implicit leading one. Exponents outside the table (including the
 * wrapped value of a zero exponent field) leave the raw value as is,
 * which is how the sentinels -1..-4 and small literals are stored.
 *
 * @param raw Raw field value
 * @return Decoded value in micro-units
 */
inline std::int32_t sv_from_float16(std::int16_t raw) noexcept {
    std::uint32_t exponent = (static_cast<std::uint32_t>(static_cast<std::uint16_t>(raw)) >> 11) - 1U;
    if (exponent <= 0x13U) {
        std::uint32_t mantissa = (static_cast<std::uint32_t>(static_cast<std::uint16_t>(raw)) & 0x7FFU);
        mantissa |= 0x800U;
        return static_cast<std::int32_t>(mantissa << exponent);
    }
    return raw;
}

/**
 * @brief Classify a raw custom-float field.
 *
 * @param raw Raw field value
 * @return Ok for a plausible value, the stored sentinel, or Overload
 */
inline ValidityStatus sv_is_value_valid(std::uint16_t raw) noexcept {
    std::uint32_t exponent = (static_cast<std::uint32_t>(raw) >> 11) - 1U;

    if (exponent > 0x13U) {
        auto value = static_cast<std::int32_t>(static_cast<std::int16_t>(raw));
        if (static_cast<std::uint32_t>(value) < 0xFFFFFFFCU) {
            return ValidityStatus::Ok;
        }
        return static_cast<ValidityStatus>(value);
    }

    std::uint32_t mantissa = static_cast<std::uint32_t>(raw) & 0x7FFU;
    mantissa = (mantissa & 0xFFU) | (((mantissa >> 8) | 8U) << 8);
    auto value = static_cast<std::int32_t>(mantissa << exponent);
    if (value <= OVERLOAD_LIMIT) {
        return ValidityStatus::Ok;
    }
    return ValidityStatus::Overload;
}

/// Decoded value is one of the device sentinels -1..-4
inline constexpr bool is_special_value(std::int32_t value) noexcept {
    return value >= -4 && value <= -1;
}

/// Decoded value is out of the measurable range
inline constexpr bool is_overload(std::int32_t value) noexcept {
    return value > OVERLOAD_LIMIT;
}

/**
 * @brief Status column text.
 */
inline const char* status_string(ValidityStatus status) noexcept {
    switch (status) {
    case ValidityStatus::Disconnected:
        return "DISCONNECTED";
    case ValidityStatus::DataInvalid:
        return "DATA INVALID";
    case ValidityStatus::NoData:
        return "NO DATA";
    case ValidityStatus::NotResponding:
        return "NOT RESPONDING";
    case ValidityStatus::Overload:
        return "OVERLOAD";
    default:
        return "";
    }
}

/**
 * @brief Status of one axis sub-block.
 *
 * Checks v, u, a and cv in that order and reports the first fault.
 *
 * @param rec Record reader
 * @param offset Offset of the axis sub-block
 */
inline ValidityStatus axis_status(const ByteReader& rec, std::size_t offset) noexcept {
    static constexpr std::size_t checked[] = {0, 6, 8, 10};
    for (std::size_t field : checked) {
        ValidityStatus status = sv_is_value_valid(rec.u16_le(offset + field));
        if (status != ValidityStatus::Ok) {
            return status;
        }
    }
    return ValidityStatus::Ok;
}

/**
 * @brief Combine the three axis states into the record state.
 *
 * Overload on any axis wins, then the first fault in x, y, z order.
 */
inline ValidityStatus overall_status(ValidityStatus x, ValidityStatus y,
                                     ValidityStatus z) noexcept {
    if (x == ValidityStatus::Overload || y == ValidityStatus::Overload ||
        z == ValidityStatus::Overload) {
        return ValidityStatus::Overload;
    }
    if (x != ValidityStatus::Ok) {
        return x;
    }
    if (y != ValidityStatus::Ok) {
        return y;
    }
    return z;
}

/**
 * @brief Physical value of a custom-float field.
 *
 * @return Value in base units, or nullopt for sentinels and overloads
 */
inline std::optional<float> decode_float16(std::uint16_t raw) noexcept {
    std::int32_t value = sv_from_float16(static_cast<std::int16_t>(raw));
    if (is_special_value(value) || is_overload(value)) {
        return std::nullopt;
    }
    return static_cast<float>(value) / FLOAT16_DIVISOR;
}

/**
 * @brief Physical value of a signed fixed-point (half unit) field.
 *
 * @return Value, or nullopt for sentinels
 */
inline std::optional<float> decode_int16(std::int16_t raw) noexcept {
    if (is_special_value(raw)) {
        return std::nullopt;
    }
    return static_cast<float>(raw) / INT16_DIVISOR;
}

inline std::string format_float16(std::uint16_t raw, int decimals) {
    auto value = decode_float16(raw);
    return value ? format_fixed_odd(*value, decimals) : std::string();
}

inline std::string format_int16(std::int16_t raw, int decimals) {
    auto value = decode_int16(raw);
    return value ? format_fixed_odd(*value, decimals) : std::string();
}

/**
 * @brief KB metric of an extended record axis.
 *
 * Square root of the decoded custom float scaled by 0.01. Results up to
 * 0.1 (and a negative radicand) are reported as zero.
 */
inline double kb_metric(std::int16_t raw) noexcept {
    std::int32_t value = sv_from_float16(raw);
    if (value <= 0) {
        return 0.0;
    }
    double kb = std::sqrt(static_cast<double>(value)) * 0.01;
    return (kb <= 0.1) ? 0.0 : kb;
}

/**
 * @brief Zero-crossing frequency of a standard record axis.
 *
 * @param period Raw zero-crossing period in 1/1024 s
 * @return Frequency in Hz, or nullopt when no period was measured
 */
inline std::optional<double> zero_crossing_frequency(std::int16_t period) noexcept {
    if (period <= 0) {
        return std::nullopt;
    }
    return 1024.0 / static_cast<double>(period);
}

/**
 * @brief Geophone type and serial.
 *
 * The top two bits select the sensor family, the low 14 bits are the
 * serial number: 0x4005 -> "TDA00005", 0x0007 -> "unknown00007". The
 * reserved family 0xC000 always renders as "???00000".
 */
std::string geophone_string(std::uint16_t raw);

/**
 * @brief Signal quality bucket of the 5-bit modem strength.
 */
inline const char* signal_quality(unsigned raw) noexcept {
    if (raw == 0) {
        return "Unknown";
    }
    if (raw > 23) {
        return "Excellent";
    }
    if (raw > 15) {
        return "Good";
    }
    if (raw > 7) {
        return "Low";
    }
    return "Bad";
}

/// Signal strength in dBm (2 * raw - 113), empty when unknown
std::string signal_strength_dbm(unsigned raw);

inline const char* peak_type_category(unsigned peak_type) noexcept {
    switch (peak_type) {
    case 0:
        return "vcatnone";
    case 1:
        return "vcat1";
    case 2:
        return "vcat2";
    case 3:
        return "vcat3";
    default:
        return "vcat";
    }
}

/// Temperature in degrees Celsius
inline constexpr double temperature_celsius(std::uint8_t raw) noexcept {
    return raw * 0.5 - 27.5;
}

/// Battery voltage in volts
inline constexpr double battery_voltage(std::uint8_t raw) noexcept {
    return raw * 0.01 + 2.45;
}

} // namespace vif2csv

#endif // VIF2CSV_FIELD_CODEC_HPP
