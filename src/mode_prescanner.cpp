/**
 * @file mode_prescanner.cpp
 * @brief First pass detecting extended (KB) record files.
 */

#include <vif2csv/mode_prescanner.hpp>

#include <vif2csv/bytereader.hpp>
#include <vif2csv/config.hpp>
#include <vif2csv/record.hpp>


namespace vif2csv {

bool detect_kb_mode(std::istream& source) {
    std::uint8_t header[MIN_RECORD_BYTES] = {MARKER[0], MARKER[1], MARKER[2]};
    int state = 0; // number of marker bytes matched

    for (;;) {
        int c = source.get();
        if (c == std::char_traits<char>::eof()) {
            break;
        }

        if (c == MARKER[state]) {
            ++state;
        } else {
            state = (c == MARKER[0]) ? 1 : 0;
        }

        if (state < static_cast<int>(MARKER_SIZE)) {
            continue;
        }
        state = 0;

        constexpr std::size_t tail = MIN_RECORD_BYTES - MARKER_SIZE;
        source.read(reinterpret_cast<char*>(header + MARKER_SIZE), tail);
        if (static_cast<std::size_t>(source.gcount()) != tail) {
            break;
        }

        ByteReader rec(header, sizeof(header));
        if (rec.u8(offsets::TYPE) == TYPE_EXTENDED) {
            return true;
        }

        int remaining = static_cast<int>(rec.u16_le(offsets::SIZE)) - static_cast<int>(MIN_RECORD_BYTES);
        if (remaining > 0) {
            source.ignore(remaining);
        }
    }
    return false;
}

} // namespace vif2csv
