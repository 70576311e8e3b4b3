/**
 * @file record_decoder.hpp
 * @brief Renders accepted records into column values.
 */

#ifndef VIF2CSV_RECORD_DECODER_HPP
#define VIF2CSV_RECORD_DECODER_HPP

#include "field_codec.hpp"
#include "options.hpp"
#include "record.hpp"

namespace vif2csv {

/**
 * @brief Decodes the measurement and housekeeping fields of a record.
 *
 * Precision follows DecodeOptions::long_format. Extended (0x8A) records
 * report the KB metric in the second axis column, standard records the
 * zero-crossing frequency.
 */
class RecordDecoder {
public:
    explicit RecordDecoder(const DecodeOptions& options) noexcept : options_(options) {}

    /**
     * @brief Decode an accepted record.
     *
     * @param accepted Record returned by RecordValidator::check
     * @return Rendered columns
     */
    DecodedRecord decode(const AcceptedRecord& accepted) const;

    /**
     * @brief Decode one axis block.
     *
     * @param rec Record reader
     * @param offset Offset of the axis block
     * @param extended Record has the extended type
     * @param status Axis state from axis_status()
     */
    AxisSample decode_axis(const ByteReader& rec, std::size_t offset, bool extended,
                           ValidityStatus status) const;

private:
    DecodeOptions options_;
};

} // namespace vif2csv

#endif // VIF2CSV_RECORD_DECODER_HPP
