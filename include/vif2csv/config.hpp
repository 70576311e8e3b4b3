/**
 * @file config.hpp
 * @brief VIF2CSV compile-time configuration.
 *
 * Fixed layout constants of the VIB record format and the tuning knobs of
 * the stream scanner.
 */

#ifndef VIF2CSV_CONFIG_HPP
#define VIF2CSV_CONFIG_HPP

#include <cstddef>
#include <cstdint>

namespace vif2csv {

/**
 * @defgroup version Version Information
 * @{
 */
inline constexpr int VERSION_MAJOR = 1;
inline constexpr int VERSION_MINOR = 10;
inline constexpr int VERSION_PATCH = 0;
/** @} */

/**
 * @defgroup config Configuration Constants
 * @{
 */

/// Bytes pulled from the source per read while scanning
#ifndef VIF2CSV_SCAN_CHUNK_SIZE
#define VIF2CSV_SCAN_CHUNK_SIZE (256U * 1024U)
#endif

inline constexpr std::size_t SCAN_CHUNK_SIZE = VIF2CSV_SCAN_CHUNK_SIZE;

/// Initial capacity of the scanner lookahead window
inline constexpr std::size_t INITIAL_WINDOW_SIZE = SCAN_CHUNK_SIZE * 2U;

/// Record start marker "VIB"
inline constexpr std::uint8_t MARKER[3] = {'V', 'I', 'B'};
inline constexpr std::size_t MARKER_SIZE = 3U;

/// Size of the only decodable record variant
inline constexpr std::size_t RECORD_SIZE = 68U;

/// Minimum header consumed per candidate (marker, type, size, date/time)
inline constexpr std::size_t MIN_RECORD_BYTES = 12U;

/// Holding buffer for one candidate, zero padded
inline constexpr std::size_t RECORD_BUFFER_SIZE = 70U;

/// Record type bytes
inline constexpr std::uint8_t TYPE_STANDARD = 0x88U;
inline constexpr std::uint8_t TYPE_EXTENDED = 0x8AU;
inline constexpr std::uint8_t TYPE_MASK = 0xFDU;

/// Inter-record delta of the normal recording cadence
inline constexpr std::uint64_t NORMAL_DELTA = 68U;

/// Read types produced by the scanner
inline constexpr int READ_TYPE_NORMAL = 2;
inline constexpr int READ_TYPE_IRREGULAR = 5;
inline constexpr int READ_TYPE_MAX = 9;

/// Accepted read types as a bit mask (0, 2 and 6)
inline constexpr unsigned READ_TYPE_MASK = 0x45U;

/// Divisors of the two numeric encodings
inline constexpr float FLOAT16_DIVISOR = 1000000.0F;
inline constexpr float INT16_DIVISOR = 2.0F;

/// Decoded values above this are overloads
inline constexpr std::int32_t OVERLOAD_LIMIT = 99999999;

/** @} */

} // namespace vif2csv

#endif // VIF2CSV_CONFIG_HPP
