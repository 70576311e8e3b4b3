/**
 * @file bench.cpp
 * @brief Throughput benchmarks for VIB log decoding.
 *
 * Measures decode throughput for regression testing during development.
 * Synthetic logs are generated in memory; a real log can be added as the
 * second argument.
 *
 * Usage:
 *   ./build/vif2csv_bench              # Run with default 20 iterations
 *   ./build/vif2csv_bench 100 log.vif  # Custom iteration count and file
 */

#include <vif2csv/log.hpp>
#include <vif2csv/vif2csv.hpp>

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

using namespace vif2csv;

static constexpr int DEFAULT_ITERATIONS = 20;
static constexpr std::size_t SYNTHETIC_RECORDS = 50000;

static bool load_file(const char* path, std::string& data) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
        return false;
    }

    std::streamsize size = file.tellg();
    file.seekg(0, std::ios::beg);

    data.resize(static_cast<std::size_t>(size));
    if (!file.read(data.data(), size)) {
        return false;
    }

    return true;
}

static void put_u16(std::string& rec, std::size_t offset, std::uint16_t value) {
    rec[offset] = static_cast<char>(value & 0xFFU);
    rec[offset + 1] = static_cast<char>(value >> 8);
}

/**
 * @brief Build a log of valid records, optionally with filler between them.
 */
static std::string make_log(std::size_t count, std::uint8_t type, std::size_t filler) {
    std::string log;
    log.reserve(count * (RECORD_SIZE + filler));

    for (std::size_t i = 0; i < count; ++i) {
        std::string rec(RECORD_SIZE, '\0');
        rec[0] = 'V';
        rec[1] = 'I';
        rec[2] = 'B';
        rec[offsets::TYPE] = static_cast<char>(type);
        put_u16(rec, offsets::SIZE, static_cast<std::uint16_t>(RECORD_SIZE));
        rec[offsets::SECOND] = static_cast<char>(i % 60);
        rec[offsets::MINUTE] = static_cast<char>((i / 60) % 60);
        rec[offsets::HOUR] = static_cast<char>((i / 3600) % 24);
        rec[offsets::DAY] = 15;
        rec[offsets::MONTH] = 3;
        rec[offsets::YEAR] = 24;
        put_u16(rec, offsets::MAGNITUDE, 0x5000);
        for (std::size_t axis : {offsets::AXIS_X, offsets::AXIS_Y, offsets::AXIS_Z}) {
            put_u16(rec, axis + offsets::AXIS_V, static_cast<std::uint16_t>(0x4800 + (i & 0x7FF)));
            put_u16(rec, axis + offsets::AXIS_KBZC, 0x0040);
            put_u16(rec, axis + offsets::AXIS_FT, 0x0064);
            put_u16(rec, axis + offsets::AXIS_U, 0x3000);
            put_u16(rec, axis + offsets::AXIS_A, 0x3800);
            put_u16(rec, axis + offsets::AXIS_CV, 0x4000);
            put_u16(rec, axis + offsets::AXIS_CF, 0x0032);
        }
        rec[offsets::TEMPERATURE] = 100;
        rec[offsets::VOLTAGE] = 100;
        rec[offsets::SIGNAL] = 20;
        put_u16(rec, offsets::GEOPHONE, 0x4005);
        rec[offsets::COUNTER] = static_cast<char>(i & 0xFF);
        rec[offsets::COUNTER + 1] = static_cast<char>((i >> 8) & 0xFF);
        rec[offsets::COUNTER + 2] = static_cast<char>((i >> 16) & 0xFF);

        log += rec;
        log.append(filler, '\x55');
    }
    return log;
}

static void bench_decode(const char* name, const std::string& input, int iterations) {
    DecodeOptions options;
    PipelineStats stats;

    // Warmup run
    {
        std::istringstream in(input);
        std::ostringstream out;
        decode(in, out, options, stats);
    }

    auto start = std::chrono::high_resolution_clock::now();

    for (int i = 0; i < iterations; i++) {
        std::istringstream in(input);
        std::ostringstream out;
        decode(in, out, options, stats);
    }

    auto end = std::chrono::high_resolution_clock::now();

    double total_us = std::chrono::duration<double, std::micro>(end - start).count();
    double per_iter_us = total_us / static_cast<double>(iterations);
    double per_record_us =
        (stats.records_found > 0) ? per_iter_us / static_cast<double>(stats.records_found) : 0.0;
    double throughput_mbps = static_cast<double>(input.size()) / per_iter_us;

    std::printf("%-20s %10.1f µs/iter  %6.3f µs/rec  %8.1f MB/s  (%zu recs, %zu rows)\n", name,
                per_iter_us, per_record_us, throughput_mbps, stats.records_found,
                stats.records_processed);
}

int main(int argc, char* argv[]) {
    int iterations = DEFAULT_ITERATIONS;

    if (argc >= 2) {
        iterations = std::atoi(argv[1]);
        if (iterations <= 0) {
            iterations = DEFAULT_ITERATIONS;
        }
    }

    // Per-run summary lines would drown the results
    logger()->set_level(spdlog::level::warn);

    std::printf("VIF2CSV Benchmarks\n");
    std::printf("==================\n");
    std::printf("Iterations: %d\n", iterations);
    std::printf("Record size: %zu bytes\n\n", RECORD_SIZE);

    std::printf("%-20s %16s  %13s  %12s  %s\n", "Test", "Time", "Per-Record", "Throughput",
                "Records");
    std::printf("%-20s %16s  %13s  %12s  %s\n", "----", "----", "----------", "----------",
                "-------");

    bench_decode("standard", make_log(SYNTHETIC_RECORDS, TYPE_STANDARD, 0), iterations);
    bench_decode("extended", make_log(SYNTHETIC_RECORDS, TYPE_EXTENDED, 0), iterations);
    bench_decode("filler", make_log(SYNTHETIC_RECORDS, TYPE_STANDARD, 17), iterations);

    if (argc >= 3) {
        std::string input;
        if (load_file(argv[2], input)) {
            bench_decode(argv[2], input, iterations);
        } else {
            std::printf("%-20s SKIP (file not found)\n", argv[2]);
        }
    }

    return 0;
}
