/**
 * @file test_field_codec.cpp
 * @brief Unit tests for raw field decoding.
 */

#include <catch2/catch_test_macros.hpp>
#include <vif2csv/field_codec.hpp>

#include "record_builder.hpp"

using namespace vif2csv;
using vif2csv::test::RecordBuilder;

TEST_CASE("sv_from_float16 exponent table", "[field_codec]") {
    SECTION("implicit leading one is added") {
        REQUIRE(sv_from_float16(0x0800) == 2048);
        REQUIRE(sv_from_float16(0x0FFF) == 4095);
    }

    SECTION("exponent shifts the mantissa") {
        REQUIRE(sv_from_float16(0x4800) == 524288);
        REQUIRE(sv_from_float16(0x5000) == 1048576);
    }

    SECTION("largest table exponent") {
        REQUIRE(sv_from_float16(static_cast<std::int16_t>(0xA7FF)) == 2146959360);
    }

    SECTION("zero exponent field passes through") {
        REQUIRE(sv_from_float16(0) == 0);
        REQUIRE(sv_from_float16(0x07FF) == 2047);
    }

    SECTION("exponents beyond the table pass through") {
        REQUIRE(sv_from_float16(static_cast<std::int16_t>(0xA800)) == -22528);
        REQUIRE(sv_from_float16(-1) == -1);
    }
}

TEST_CASE("sentinel raw patterns", "[field_codec]") {
    struct Case {
        std::uint16_t raw;
        std::int32_t decoded;
        ValidityStatus status;
        const char* text;
    };
    const Case cases[] = {
        {0xFFFF, -1, ValidityStatus::Disconnected, "DISCONNECTED"},
        {0xFFFE, -2, ValidityStatus::DataInvalid, "DATA INVALID"},
        {0xFFFD, -3, ValidityStatus::NoData, "NO DATA"},
        {0xFFFC, -4, ValidityStatus::NotResponding, "NOT RESPONDING"},
    };

    for (const Case& c : cases) {
        std::int32_t decoded = sv_from_float16(static_cast<std::int16_t>(c.raw));
        REQUIRE(decoded == c.decoded);
        REQUIRE(is_special_value(decoded));
        REQUIRE(sv_is_value_valid(c.raw) == c.status);
        REQUIRE(std::string(status_string(c.status)) == c.text);
        REQUIRE(format_float16(c.raw, 2).empty());
    }

    SECTION("-5 is an ordinary value") {
        REQUIRE(sv_is_value_valid(0xFFFB) == ValidityStatus::Ok);
        REQUIRE_FALSE(is_special_value(-5));
    }
}

TEST_CASE("sv_is_value_valid overload boundary", "[field_codec]") {
    // Exponent 15: mantissa 3051 << 15 = 99975168, 3052 << 15 = 100007936
    REQUIRE(sv_is_value_valid(0x83EB) == ValidityStatus::Ok);
    REQUIRE(sv_is_value_valid(0x83EC) == ValidityStatus::Overload);

    REQUIRE(sv_is_value_valid(0x8800) == ValidityStatus::Overload);
    REQUIRE(sv_is_value_valid(0x5000) == ValidityStatus::Ok);
    REQUIRE(sv_is_value_valid(0x0000) == ValidityStatus::Ok);
    REQUIRE(sv_is_value_valid(0xA800) == ValidityStatus::Ok);

    REQUIRE(is_overload(sv_from_float16(static_cast<std::int16_t>(0x83EC))));
    REQUIRE_FALSE(is_overload(sv_from_float16(static_cast<std::int16_t>(0x83EB))));
    REQUIRE(std::string(status_string(ValidityStatus::Overload)) == "OVERLOAD");
    REQUIRE(std::string(status_string(ValidityStatus::Ok)).empty());
}

TEST_CASE("float16 rendering", "[field_codec]") {
    REQUIRE(format_float16(0x5000, 2) == "1.05");
    REQUIRE(format_float16(0x5000, 4) == "1.0486");
    REQUIRE(format_float16(0x4800, 2) == "0.52");
    REQUIRE(format_float16(0x83EB, 2) == "99.98");
    REQUIRE(format_float16(0x0000, 2) == "0.00");

    SECTION("overload renders empty") {
        REQUIRE(format_float16(0x8800, 2).empty());
        REQUIRE_FALSE(decode_float16(0x8800).has_value());
    }
}

TEST_CASE("int16 fixed-point rendering", "[field_codec]") {
    REQUIRE(format_int16(100, 1) == "50.0");
    REQUIRE(format_int16(3, 1) == "1.5");
    REQUIRE(format_int16(-5, 1) == "-2.5");
    REQUIRE(format_int16(3, 4) == "1.5000");
    REQUIRE(format_int16(0, 1) == "0.0");

    SECTION("sentinels render empty") {
        for (std::int16_t raw = -4; raw <= -1; ++raw) {
            REQUIRE(format_int16(raw, 1).empty());
        }
    }
}

TEST_CASE("axis and overall status", "[field_codec]") {
    SECTION("all zero axis is OK") {
        RecordBuilder builder;
        auto candidate = builder.candidate();
        REQUIRE(axis_status(candidate.reader(), offsets::AXIS_X) == ValidityStatus::Ok);
    }

    SECTION("first fault in v, u, a, cv order wins") {
        RecordBuilder builder;
        builder.axis(offsets::AXIS_Y, offsets::AXIS_A, 0xFFFE)
            .axis(offsets::AXIS_Y, offsets::AXIS_U, 0xFFFC)
            .axis(offsets::AXIS_Y, offsets::AXIS_CV, 0xFFFF);
        auto candidate = builder.candidate();
        REQUIRE(axis_status(candidate.reader(), offsets::AXIS_Y) == ValidityStatus::NotResponding);
    }

    SECTION("kb/zc, ft and cf are not checked") {
        RecordBuilder builder;
        builder.axis(offsets::AXIS_Z, offsets::AXIS_KBZC, 0xFFFF)
            .axis(offsets::AXIS_Z, offsets::AXIS_FT, 0xFFFF)
            .axis(offsets::AXIS_Z, offsets::AXIS_CF, 0xFFFF);
        auto candidate = builder.candidate();
        REQUIRE(axis_status(candidate.reader(), offsets::AXIS_Z) == ValidityStatus::Ok);
    }

    SECTION("overload on any axis dominates") {
        REQUIRE(overall_status(ValidityStatus::NoData, ValidityStatus::Ok,
                               ValidityStatus::Overload) == ValidityStatus::Overload);
    }

    SECTION("first faulty axis in x, y, z order") {
        REQUIRE(overall_status(ValidityStatus::Ok, ValidityStatus::Disconnected,
                               ValidityStatus::NoData) == ValidityStatus::Disconnected);
        REQUIRE(overall_status(ValidityStatus::Ok, ValidityStatus::Ok, ValidityStatus::NoData) ==
                ValidityStatus::NoData);
        REQUIRE(overall_status(ValidityStatus::Ok, ValidityStatus::Ok, ValidityStatus::Ok) ==
                ValidityStatus::Ok);
    }
}

TEST_CASE("geophone decoding", "[field_codec]") {
    REQUIRE(geophone_string(0x4005) == "TDA00005");
    REQUIRE(geophone_string(0xBFFF) == "TDS16383");
    REQUIRE(geophone_string(0x0007) == "unknown00007");

    SECTION("reserved family is a fixed placeholder") {
        REQUIRE(geophone_string(0xC000) == "???00000");
        REQUIRE(geophone_string(0xC123) == "???00000");
        REQUIRE(geophone_string(0xC000).size() == 8);
    }
}

TEST_CASE("signal strength and quality", "[field_codec]") {
    REQUIRE(std::string(signal_quality(0)) == "Unknown");
    REQUIRE(std::string(signal_quality(1)) == "Bad");
    REQUIRE(std::string(signal_quality(7)) == "Bad");
    REQUIRE(std::string(signal_quality(8)) == "Low");
    REQUIRE(std::string(signal_quality(15)) == "Low");
    REQUIRE(std::string(signal_quality(16)) == "Good");
    REQUIRE(std::string(signal_quality(23)) == "Good");
    REQUIRE(std::string(signal_quality(24)) == "Excellent");
    REQUIRE(std::string(signal_quality(31)) == "Excellent");

    REQUIRE(signal_strength_dbm(0).empty());
    REQUIRE(signal_strength_dbm(1) == "-111");
    REQUIRE(signal_strength_dbm(31) == "-51");
}

TEST_CASE("peak type category", "[field_codec]") {
    REQUIRE(std::string(peak_type_category(0)) == "vcatnone");
    REQUIRE(std::string(peak_type_category(1)) == "vcat1");
    REQUIRE(std::string(peak_type_category(2)) == "vcat2");
    REQUIRE(std::string(peak_type_category(3)) == "vcat3");
    REQUIRE(std::string(peak_type_category(4)) == "vcat");
}

TEST_CASE("housekeeping conversions", "[field_codec]") {
    REQUIRE(format_fixed_odd(temperature_celsius(0), 1) == "-27.5");
    REQUIRE(format_fixed_odd(temperature_celsius(55), 1) == "0.0");
    REQUIRE(format_fixed_odd(temperature_celsius(100), 1) == "22.5");
    REQUIRE(format_fixed_odd(battery_voltage(0), 2) == "2.45");
    REQUIRE(format_fixed_odd(battery_voltage(100), 2) == "3.45");
    REQUIRE(format_fixed_odd(battery_voltage(255), 2) == "5.00");
}

TEST_CASE("secondary axis metric", "[field_codec]") {
    SECTION("KB metric") {
        REQUIRE(format_fixed_odd(kb_metric(0x5000), 2) == "10.24");
        REQUIRE(format_fixed_odd(kb_metric(0x0800), 2) == "0.45");
        // sqrt(100) * 0.01 == 0.1 is clamped
        REQUIRE(kb_metric(100) == 0.0);
        REQUIRE(kb_metric(0) == 0.0);
        REQUIRE(kb_metric(-1) == 0.0);
    }

    SECTION("zero-crossing frequency") {
        REQUIRE(zero_crossing_frequency(64).value() == 16.0);
        REQUIRE(format_fixed_odd(zero_crossing_frequency(3).value(), 2) == "341.33");
        REQUIRE_FALSE(zero_crossing_frequency(0).has_value());
        REQUIRE_FALSE(zero_crossing_frequency(-5).has_value());
    }
}
