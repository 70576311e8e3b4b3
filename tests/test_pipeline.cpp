/**
 * @file test_pipeline.cpp
 * @brief End-to-end tests of the decode pipeline.
 */

#include <catch2/catch_test_macros.hpp>
#include <vif2csv/vif2csv.hpp>

#include "record_builder.hpp"

#include <stdexcept>
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace vif2csv;
using vif2csv::test::RecordBuilder;
using vif2csv::test::noise;

namespace {

const std::string DEFAULT_ROW =
    "\"2024-03-15\",\"14:30:00\",\"0\",\"\",\"0.00\","
    "\"\",\"0.00\",\"\",\"0.0\",\"0.00\",\"0.00\",\"0.00\",\"0.0\","
    "\"\",\"0.00\",\"\",\"0.0\",\"0.00\",\"0.00\",\"0.00\",\"0.0\","
    "\"\",\"0.00\",\"\",\"0.0\",\"0.00\",\"0.00\",\"0.00\",\"0.0\","
    "\"-27.5\",\"2.45\",\"0\",\"0\",\"\",\"Unknown\",\"0\",\"0\",\"vcatnone\",\"DIN\",\"0\","
    "\"unknown00000\",\"0\"";

std::string run(const std::string& data, const DecodeOptions& options, PipelineStats& stats) {
    std::istringstream in(data, std::ios::binary);
    std::ostringstream out;
    REQUIRE(decode(in, out, options, stats) == Error::Ok);
    return out.str();
}

std::string run(const std::string& data, const DecodeOptions& options = DecodeOptions{}) {
    PipelineStats stats;
    return run(data, options, stats);
}

class FailingBuf : public std::streambuf {
protected:
    int_type underflow() override {
        throw std::runtime_error("device error");
    }
};

} // namespace

TEST_CASE("decode a clean log", "[pipeline]") {
    RecordBuilder record;
    PipelineStats stats;

    std::string csv = run(record.bytes() + record.bytes(), DecodeOptions{}, stats);

    REQUIRE(csv == DEFAULT_ROW + "\n" + DEFAULT_ROW + "\n");
    REQUIRE(stats.records_found == 2);
    REQUIRE(stats.records_processed == 2);
    REQUIRE(stats.records_skipped == 0);
    REQUIRE_FALSE(stats.kb_mode);
}

TEST_CASE("header rows", "[pipeline]") {
    DecodeOptions options;
    options.print_header = true;

    SECTION("standard log") {
        std::string csv = run(RecordBuilder().bytes(), options);
        std::string expected = CsvWriter::header_names(false, true) + "\n" +
                               CsvWriter::header_units(true) + "\n" + DEFAULT_ROW + "\n";
        REQUIRE(csv == expected);
    }

    SECTION("extended record anywhere switches the header") {
        RecordBuilder extended;
        extended.type(TYPE_EXTENDED);
        PipelineStats stats;
        std::string csv = run(RecordBuilder().bytes() + extended.bytes(), options, stats);

        REQUIRE(stats.kb_mode);
        REQUIRE(csv.rfind(CsvWriter::header_names(true, true) + "\n", 0) == 0);
    }

    SECTION("header is written for a log without records") {
        PipelineStats stats;
        std::string csv = run(noise(100), options, stats);
        REQUIRE(csv == CsvWriter::header_names(false, true) + "\n" +
                           CsvWriter::header_units(true) + "\n");
        REQUIRE(stats.records_found == 0);
    }
}

TEST_CASE("noise between records", "[pipeline]") {
    RecordBuilder first;
    RecordBuilder second;
    second.datetime(2024, 3, 16, 1, 2, 3);
    std::string clean = first.bytes() + second.bytes();

    SECTION("leading noise does not change the output") {
        REQUIRE(run(noise(45) + clean) == run(clean));
    }

    SECTION("gap rejects the record before it") {
        PipelineStats stats;
        std::string csv = run(first.bytes() + noise(68) + second.bytes(), DecodeOptions{}, stats);

        REQUIRE(stats.records_found == 2);
        REQUIRE(stats.records_processed == 1);
        REQUIRE(stats.records_skipped == 1);
        REQUIRE(csv == run(second.bytes()));
    }
}

TEST_CASE("invalid candidates are skipped", "[pipeline]") {
    RecordBuilder good;
    RecordBuilder bad_date;
    bad_date.datetime(2024, 2, 30, 0, 0, 0);
    RecordBuilder bad_type;
    bad_type.type(0x80);

    PipelineStats stats;
    std::string csv =
        run(good.bytes() + bad_date.bytes() + bad_type.bytes() + good.bytes(), DecodeOptions{}, stats);

    REQUIRE(csv == DEFAULT_ROW + "\n" + DEFAULT_ROW + "\n");
    REQUIRE(stats.records_found == 4);
    REQUIRE(stats.records_processed == 2);
    REQUIRE(stats.records_skipped == 2);
}

TEST_CASE("date filters", "[pipeline]") {
    RecordBuilder march15;
    RecordBuilder march16;
    march16.datetime(2024, 3, 16, 8, 0, 0);
    std::string data = march15.bytes() + march16.bytes() + march15.bytes();

    SECTION("explicit day") {
        DecodeOptions options;
        options.date_filter = "2024-03-15";
        PipelineStats stats;
        REQUIRE(run(data, options, stats) == DEFAULT_ROW + "\n" + DEFAULT_ROW + "\n");
        REQUIRE(stats.records_skipped == 1);
    }

    SECTION("today") {
        DecodeOptions options;
        options.filter_today = true;
        options.today = CalendarDate{2024, 3, 16};
        PipelineStats stats;
        std::string csv = run(data, options, stats);
        REQUIRE(csv.rfind("\"2024-03-16\",\"08:00:00\"", 0) == 0);
        REQUIRE(stats.records_processed == 1);
        REQUIRE(stats.records_skipped == 2);
    }
}

TEST_CASE("counter column can be dropped", "[pipeline]") {
    DecodeOptions options;
    options.print_counter = false;
    options.print_header = true;

    std::string csv = run(RecordBuilder().bytes(), options);

    std::istringstream lines(csv);
    std::string names;
    std::string units;
    std::string row;
    std::getline(lines, names);
    std::getline(lines, units);
    std::getline(lines, row);

    REQUIRE(names.find("counter") == std::string::npos);
    REQUIRE(units.find("count") == std::string::npos);
    REQUIRE(row.rfind("\"2024-03-15\",\"14:30:00\",\"\",\"0.00\",", 0) == 0);
}

TEST_CASE("Windows-1252 output", "[pipeline]") {
    DecodeOptions options;
    options.print_header = true;
    std::istringstream in(RecordBuilder().bytes(), std::ios::binary);
    std::ostringstream out;
    PipelineStats stats;

    REQUIRE(decode(in, out, options, stats, OutputEncoding::Windows1252) == Error::Ok);
    REQUIRE(out.str().find("\"\xB0" "C\"") != std::string::npos);
}

TEST_CASE("unreadable input", "[pipeline]") {
    FailingBuf buf;
    std::istream in(&buf);
    std::ostringstream out;
    CsvWriter writer(out);
    DecodePipeline pipeline(DecodeOptions{});

    REQUIRE(pipeline.run(in, writer) == Error::Io);
    REQUIRE(out.str().empty());
}

TEST_CASE("run_file", "[pipeline]") {
    std::ostringstream out;
    CsvWriter writer(out);
    DecodePipeline pipeline(DecodeOptions{});

    SECTION("missing file") {
        REQUIRE_THROWS_AS(pipeline.run_file("/nonexistent/vif2csv/log.vif", writer), IoException);
        REQUIRE(out.str().empty());
    }

    SECTION("file on disk") {
        std::filesystem::path path =
            std::filesystem::temp_directory_path() / "vif2csv_test_run_file.vif";
        {
            std::ofstream file(path, std::ios::binary);
            RecordBuilder record;
            file << noise(10) << record.bytes() << record.bytes();
        }

        pipeline.run_file(path.string(), writer);
        std::filesystem::remove(path);

        REQUIRE(out.str() == DEFAULT_ROW + "\n" + DEFAULT_ROW + "\n");
        REQUIRE(pipeline.stats().records_processed == 2);
        REQUIRE(writer.rows_written() == 2);
    }
}

TEST_CASE("options are kept across runs", "[pipeline]") {
    DecodeOptions options;
    options.long_format = true;
    DecodePipeline pipeline(options);

    REQUIRE(pipeline.options().long_format);

    std::ostringstream out;
    CsvWriter writer(out);
    std::istringstream first(RecordBuilder().bytes(), std::ios::binary);
    std::istringstream second(std::string(), std::ios::binary);

    REQUIRE(pipeline.run(first, writer) == Error::Ok);
    REQUIRE(pipeline.stats().records_processed == 1);
    REQUIRE(pipeline.run(second, writer) == Error::Ok);
    REQUIRE(pipeline.stats().records_processed == 0);
    REQUIRE(out.str().find("\"-27.5000\",\"2.4500\"") != std::string::npos);
}
