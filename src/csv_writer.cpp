/**
 * @file csv_writer.cpp
 * @brief CSV rendering of decoded records.
 */

#include <vif2csv/csv_writer.hpp>

#include <initializer_list>

namespace vif2csv {

namespace {

void append_field(std::string& line, const std::string& value) {
    if (!line.empty()) {
        line += ',';
    }
    line += '"';
    line += value;
    line += '"';
}

void append_fields(std::string& line, std::initializer_list<const char*> values) {
    for (const char* value : values) {
        append_field(line, value);
    }
}

void append_axis(std::string& line, const AxisSample& axis) {
    for (const std::string* value :
         {&axis.state, &axis.v, &axis.kb_or_zc, &axis.ft, &axis.u, &axis.a, &axis.cv, &axis.cf}) {
        append_field(line, *value);
    }
}

} // namespace

std::string CsvWriter::header_names(bool kb_mode, bool print_counter) {
    std::string line;
    append_fields(line, {"date", "time"});
    if (print_counter) {
        append_field(line, "counter");
    }
    append_fields(line, {"state", "|v|"});

    for (const char* axis : {"x", "y", "z"}) {
        std::string suffix = std::string("(") + axis + ")";
        append_field(line, "state" + suffix);
        append_field(line, "v" + suffix);
        append_field(line, (kb_mode ? "kb" : "f_zc") + suffix);
        append_field(line, "f_ft" + suffix);
        append_field(line, "u" + suffix);
        append_field(line, "a" + suffix);
        append_field(line, "v_cat" + suffix);
        append_field(line, "f_cat" + suffix);
    }

    append_fields(line, {"temperature", "battery", "memory use", "usb powered", "signal strength",
                         "signal quality", "transmitted", "all transmitted", "peak type", "code",
                         "error code", "geophone", "clock changed"});
    return line;
}

std::string CsvWriter::header_units(bool print_counter) {
    std::string line;
    append_fields(line, {"YYYY-MM-DD", "hh:mm:ss"});
    if (print_counter) {
        append_field(line, "count");
    }
    append_fields(line, {"", "mm/s"});
    for (int axis = 0; axis < 3; ++axis) {
        append_fields(line, {"", "mm/s", "Hz", "Hz", "mm", "m/s2", "mm/s", "Hz"});
    }
    append_fields(line, {"\xC2\xB0" "C", "V", "%", "", "dBm", "", "", "", "", "", "", "", ""});
    return line;
}

std::string CsvWriter::to_windows1252(const std::string& utf8) {
    std::string out;
    out.reserve(utf8.size());

    for (std::size_t i = 0; i < utf8.size(); ++i) {
        auto c = static_cast<unsigned char>(utf8[i]);
        if (c < 0x80) {
            out += static_cast<char>(c);
            continue;
        }

        // Two-byte sequences C2 xx and C3 xx cover U+0080..U+00FF
        if ((c == 0xC2 || c == 0xC3) && i + 1 < utf8.size()) {
            auto next = static_cast<unsigned char>(utf8[i + 1]);
            if ((next & 0xC0) == 0x80) {
                out += static_cast<char>(((c & 0x03) << 6) | (next & 0x3F));
                ++i;
                continue;
            }
        }

        // Skip the continuation bytes of any other sequence
        while (i + 1 < utf8.size() && (static_cast<unsigned char>(utf8[i + 1]) & 0xC0) == 0x80) {
            ++i;
        }
        out += '?';
    }
    return out;
}

void CsvWriter::write_line(const std::string& line) {
    if (encoding_ == OutputEncoding::Windows1252) {
        out_ << to_windows1252(line) << '\n';
    } else {
        out_ << line << '\n';
    }
}

void CsvWriter::write_header(bool kb_mode, bool print_counter) {
    write_line(header_names(kb_mode, print_counter));
    write_line(header_units(print_counter));
}

void CsvWriter::write_record(const DecodedRecord& record, bool print_counter) {
    std::string line;
    line.reserve(512);

    append_field(line, record.date);
    append_field(line, record.time);
    if (print_counter) {
        append_field(line, record.counter);
    }
    append_field(line, record.state);
    append_field(line, record.magnitude);

    append_axis(line, record.x);
    append_axis(line, record.y);
    append_axis(line, record.z);

    for (const std::string* value :
         {&record.temperature, &record.voltage, &record.memory_use, &record.usb_powered,
          &record.signal_strength, &record.signal_quality, &record.transmitted,
          &record.all_transmitted, &record.peak_type, &record.code, &record.error_code,
          &record.geophone, &record.clock_changed}) {
        append_field(line, *value);
    }

    write_line(line);
    ++rows_;
}

} // namespace vif2csv
