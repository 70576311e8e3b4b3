/**
 * @file record.hpp
 * @brief Record types flowing through the decode pipeline.
 *
 * Byte layout of a VIB record (little-endian):
 *
 *   0..2   "VIB" marker
 *   3      record type (0x88 standard, 0x8A extended/KB)
 *   4..5   declared size
 *   6..11  second, minute, hour, day, month, year - 2000
 *   12..13 overall magnitude (custom float)
 *   14..55 three 14-byte axis blocks (x, y, z)
 *   56..63 temperature, voltage, memory/USB, signal, peak/code/clock,
 *          error code, geophone id
 *   64..66 running counter
 */

#ifndef VIF2CSV_RECORD_HPP
#define VIF2CSV_RECORD_HPP

#include <array>
#include <string>

#include "bytereader.hpp"
#include "config.hpp"

namespace vif2csv {

/// Field offsets within a record
namespace offsets {
inline constexpr std::size_t TYPE = 3;
inline constexpr std::size_t SIZE = 4;
inline constexpr std::size_t SECOND = 6;
inline constexpr std::size_t MINUTE = 7;
inline constexpr std::size_t HOUR = 8;
inline constexpr std::size_t DAY = 9;
inline constexpr std::size_t MONTH = 10;
inline constexpr std::size_t YEAR = 11;
inline constexpr std::size_t MAGNITUDE = 12;
inline constexpr std::size_t AXIS_X = 14;
inline constexpr std::size_t AXIS_Y = 28;
inline constexpr std::size_t AXIS_Z = 42;
inline constexpr std::size_t TEMPERATURE = 56;
inline constexpr std::size_t VOLTAGE = 57;
inline constexpr std::size_t MEMORY = 58;
inline constexpr std::size_t SIGNAL = 59;
inline constexpr std::size_t PEAK = 60;
inline constexpr std::size_t ERROR_CODE = 61;
inline constexpr std::size_t GEOPHONE = 62;
inline constexpr std::size_t COUNTER = 64;

/// Offsets within an axis block
inline constexpr std::size_t AXIS_V = 0;
inline constexpr std::size_t AXIS_KBZC = 2;
inline constexpr std::size_t AXIS_FT = 4;
inline constexpr std::size_t AXIS_U = 6;
inline constexpr std::size_t AXIS_A = 8;
inline constexpr std::size_t AXIS_CV = 10;
inline constexpr std::size_t AXIS_CF = 12;
} // namespace offsets

/**
 * @brief One candidate record as found by the stream scanner.
 *
 * Holds the first RECORD_BUFFER_SIZE bytes of the candidate, zero padded.
 */
struct RawRecordCandidate {
    std::array<std::uint8_t, RECORD_BUFFER_SIZE> bytes{};
    std::uint64_t offset = 0; ///< Absolute position of the marker in the stream

    [[nodiscard]] ByteReader reader() const noexcept {
        return ByteReader(bytes.data(), bytes.size());
    }

    [[nodiscard]] std::uint8_t type() const noexcept {
        return bytes[offsets::TYPE];
    }

    [[nodiscard]] std::uint16_t declared_size() const noexcept {
        return reader().u16_le(offsets::SIZE);
    }
};

/**
 * @brief Candidate paired with its read type.
 */
struct ScannedRecord {
    RawRecordCandidate candidate;
    int read_type = READ_TYPE_NORMAL;
};

/**
 * @brief Calendar date.
 */
struct CalendarDate {
    int year = 0;
    int month = 0;
    int day = 0;

    bool operator==(const CalendarDate& other) const noexcept = default;
};

/**
 * @brief A record that passed structural, temporal and filter checks.
 */
struct AcceptedRecord {
    const RawRecordCandidate* candidate = nullptr;
    CalendarDate date;
    int hour = 0;
    int minute = 0;
    int second = 0;
    std::string date_text; ///< YYYY-MM-DD
    std::string time_text; ///< hh:mm:ss
};

/**
 * @brief Rendered values of one axis.
 *
 * All values are empty unless the axis state is OK.
 */
struct AxisSample {
    std::string state;
    std::string v;
    std::string kb_or_zc;
    std::string ft;
    std::string u;
    std::string a;
    std::string cv;
    std::string cf;
};

/**
 * @brief All rendered columns of one decoded record.
 */
struct DecodedRecord {
    std::string date;
    std::string time;
    std::string counter;
    std::string state;
    std::string magnitude;
    AxisSample x;
    AxisSample y;
    AxisSample z;
    std::string temperature;
    std::string voltage;
    std::string memory_use;
    std::string usb_powered;
    std::string signal_strength;
    std::string signal_quality;
    std::string transmitted;
    std::string all_transmitted;
    std::string peak_type;
    std::string code;
    std::string error_code;
    std::string geophone;
    std::string clock_changed;
};

} // namespace vif2csv

#endif // VIF2CSV_RECORD_HPP
