/**
 * @file field_codec.cpp
 * @brief Field codec compilation unit.
 *
 * The numeric conversions are inline in field_codec.hpp. This file holds
 * the string-building helpers.
 */

#include <vif2csv/field_codec.hpp>

#include <cstdio>

namespace vif2csv {

std::string geophone_string(std::uint16_t raw) {
    unsigned type = raw & 0xC000U;
    unsigned number = raw & 0x3FFFU;
    const char* tag;

    switch (type) {
    case 0x4000U:
        tag = "TDA";
        break;
    case 0x8000U:
        tag = "TDS";
        break;
    case 0xC000U:
        return "???00000";
    default:
        tag = "unknown";
        break;
    }

    char buf[24];
    std::snprintf(buf, sizeof(buf), "%s%05u", tag, number);
    return buf;
}

std::string signal_strength_dbm(unsigned raw) {
    if (raw == 0) {
        return {};
    }
    return std::to_string(2 * static_cast<int>(raw) - 113);
}

} // namespace vif2csv
