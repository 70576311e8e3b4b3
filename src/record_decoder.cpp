/**
 * @file record_decoder.cpp
 * @brief Renders accepted records into column values.
 */

#include <vif2csv/record_decoder.hpp>

namespace vif2csv {

AxisSample RecordDecoder::decode_axis(const ByteReader& rec, std::size_t offset, bool extended,
                                      ValidityStatus status) const {
    AxisSample axis;
    if (status != ValidityStatus::Ok) {
        axis.state = status_string(status);
        return axis;
    }

    int decimals = options_.value_decimals();
    int coarse = options_.coarse_decimals();
    std::int16_t kbzc_raw = rec.i16_le(offset + offsets::AXIS_KBZC);

    axis.v = format_float16(rec.u16_le(offset + offsets::AXIS_V), decimals);

    if (extended) {
        axis.kb_or_zc = format_fixed_odd(kb_metric(kbzc_raw), decimals);
    } else if (auto zc = zero_crossing_frequency(kbzc_raw)) {
        axis.kb_or_zc = format_fixed_odd(*zc, decimals);
    }

    axis.ft = format_int16(rec.i16_le(offset + offsets::AXIS_FT), coarse);
    axis.u = format_float16(rec.u16_le(offset + offsets::AXIS_U), decimals);
    axis.a = format_float16(rec.u16_le(offset + offsets::AXIS_A), decimals);
    axis.cv = format_float16(rec.u16_le(offset + offsets::AXIS_CV), decimals);
    axis.cf = format_int16(rec.i16_le(offset + offsets::AXIS_CF), coarse);
    return axis;
}

DecodedRecord RecordDecoder::decode(const AcceptedRecord& accepted) const {
    const RawRecordCandidate& candidate = *accepted.candidate;
    ByteReader rec = candidate.reader();
    bool extended = candidate.type() == TYPE_EXTENDED;

    DecodedRecord out;
    out.date = accepted.date_text;
    out.time = accepted.time_text;
    out.counter = std::to_string(rec.u24_le(offsets::COUNTER));

    ValidityStatus x_status = axis_status(rec, offsets::AXIS_X);
    ValidityStatus y_status = axis_status(rec, offsets::AXIS_Y);
    ValidityStatus z_status = axis_status(rec, offsets::AXIS_Z);
    ValidityStatus status = overall_status(x_status, y_status, z_status);

    out.state = status_string(status);
    if (status == ValidityStatus::Ok) {
        out.magnitude = format_float16(rec.u16_le(offsets::MAGNITUDE), options_.value_decimals());
    }

    out.x = decode_axis(rec, offsets::AXIS_X, extended, x_status);
    out.y = decode_axis(rec, offsets::AXIS_Y, extended, y_status);
    out.z = decode_axis(rec, offsets::AXIS_Z, extended, z_status);

    if (options_.long_format) {
        out.temperature = format_fixed_odd(temperature_celsius(rec.u8(offsets::TEMPERATURE)), 4);
        out.voltage = format_fixed_odd(battery_voltage(rec.u8(offsets::VOLTAGE)), 4);
    } else {
        out.temperature = format_fixed_odd(temperature_celsius(rec.u8(offsets::TEMPERATURE)), 1);
        out.voltage = format_fixed_odd(battery_voltage(rec.u8(offsets::VOLTAGE)), 2);
    }

    out.memory_use = std::to_string(rec.bits(offsets::MEMORY, 0, 7));
    out.usb_powered = std::to_string(rec.bits(offsets::MEMORY, 7, 1));

    unsigned signal = rec.bits(offsets::SIGNAL, 0, 5);
    out.signal_strength = signal_strength_dbm(signal);
    out.signal_quality = signal_quality(signal);
    out.transmitted = rec.flag(offsets::SIGNAL, 0x20) ? "1" : "0";
    out.all_transmitted = rec.flag(offsets::SIGNAL, 0x40) ? "1" : "0";

    out.peak_type = peak_type_category(rec.bits(offsets::PEAK, 0, 2));
    out.code = rec.flag(offsets::PEAK, 0x04) ? "SBR" : "DIN";
    out.clock_changed = std::to_string(rec.bits(offsets::PEAK, 6, 2));

    out.error_code = std::to_string(rec.u8(offsets::ERROR_CODE));
    out.geophone = geophone_string(rec.u16_le(offsets::GEOPHONE));
    return out;
}

} // namespace vif2csv
