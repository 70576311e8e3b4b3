/**
 * @file bytereader.hpp
 * @brief Fixed-offset little-endian field access into a record block.
 *
 * The byte reader provides random access to the fields of one candidate
 * record. All multi-byte fields of the VIB format are little-endian.
 */

#ifndef VIF2CSV_BYTEREADER_HPP
#define VIF2CSV_BYTEREADER_HPP

#include "config.hpp"

namespace vif2csv {

/**
 * @brief Offset-addressed reader over a record byte block.
 *
 * Reads past the end of the block return 0 instead of touching memory
 * outside it.
 */
class ByteReader {
public:
    /**
     * @brief Construct a byte reader.
     *
     * @param data Pointer to the record block
     * @param size Number of valid bytes in the block
     */
    ByteReader(const std::uint8_t* data, std::size_t size) noexcept : data_(data), size_(size) {}

    /**
     * @brief Read one byte.
     *
     * @param offset Byte offset in the block
     * @return Byte value, or 0 if out of range
     */
    [[nodiscard]] inline std::uint8_t u8(std::size_t offset) const noexcept {
        if (offset >= size_) [[unlikely]] {
            return 0;
        }
        return data_[offset];
    }

    /**
     * @brief Read an unsigned 16-bit little-endian value.
     */
    [[nodiscard]] inline std::uint16_t u16_le(std::size_t offset) const noexcept {
        if (offset + 2 > size_) [[unlikely]] {
            return 0;
        }
        return static_cast<std::uint16_t>(data_[offset] |
                                          (static_cast<unsigned>(data_[offset + 1]) << 8));
    }

    /**
     * @brief Read a signed 16-bit little-endian value (two's complement).
     */
    [[nodiscard]] inline std::int16_t i16_le(std::size_t offset) const noexcept {
        return static_cast<std::int16_t>(u16_le(offset));
    }

    /**
     * @brief Read an unsigned 24-bit little-endian value.
     */
    [[nodiscard]] std::uint32_t u24_le(std::size_t offset) const noexcept {
        if (offset + 3 > size_) [[unlikely]] {
            return 0;
        }
        return static_cast<std::uint32_t>(data_[offset]) |
               (static_cast<std::uint32_t>(data_[offset + 1]) << 8) |
               (static_cast<std::uint32_t>(data_[offset + 2]) << 16);
    }

    /**
     * @brief Extract a bit field from one byte.
     *
     * @param offset Byte offset in the block
     * @param shift Position of the field's least significant bit (0-7)
     * @param width Field width in bits (1-8)
     * @return Field value right-aligned
     */
    [[nodiscard]] std::uint8_t bits(std::size_t offset, unsigned shift,
                                    unsigned width) const noexcept {
        if (width == 0 || shift + width > 8) [[unlikely]] {
            return 0;
        }
        unsigned mask = (1U << width) - 1U;
        return static_cast<std::uint8_t>((u8(offset) >> shift) & mask);
    }

    /**
     * @brief Test a single flag bit.
     */
    [[nodiscard]] bool flag(std::size_t offset, std::uint8_t mask) const noexcept {
        return (u8(offset) & mask) != 0;
    }

    [[nodiscard]] std::size_t size() const noexcept {
        return size_;
    }

    [[nodiscard]] const std::uint8_t* data() const noexcept {
        return data_;
    }

private:
    const std::uint8_t* data_;
    std::size_t size_;
};

} // namespace vif2csv

#endif // VIF2CSV_BYTEREADER_HPP
