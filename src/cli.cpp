/**
 * @file cli.cpp
 * @brief VIF2CSV command line interface.
 *
 * Converts one or more VIB telemetry logs to CSV on standard output or
 * into a file.
 */

#include <vif2csv/log.hpp>
#include <vif2csv/vif2csv.hpp>

#include <cstdio>
#include <cstring>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

using namespace vif2csv;

static void print_version() {
    std::printf("(c) Copyright 2019-2025\n");
    std::printf("Profound VIF2CSV %s\n", version());
}

static void print_help(const char* prog_name) {
    std::printf("\n");
    std::printf("Profound Tool Suite\n");
    std::printf("use: %s [OPTIONS] ... [FILES] ...\n", prog_name);
    std::printf("OPTIONS:\n");
    std::printf(" -h  --header           = set header data first\n");
    std::printf(" -V  --version          = displays the version of this software\n");
    std::printf(" -n                     = add counter column (default: on)\n");
    std::printf(" -N                     = remove counter column\n");
    std::printf(" -d  --day \"YYYY-MM-DD\" = output only from a specified day\n");
    std::printf(" -D  --today            = output only from today\n");
    std::printf(" -L  --long             = export to csv with extended precision\n");
    std::printf(" -o  --output FILE      = write csv to FILE (UTF-8) instead of stdout\n");
    std::printf("     --help             = show this help message\n");
    std::printf("FILES are one or more vif-files.\n");
}

static bool is_option(const char* arg, const char* short_name, const char* long_name) {
    return std::strcmp(arg, short_name) == 0 ||
           (long_name != nullptr && std::strcmp(arg, long_name) == 0);
}

int main(int argc, char** argv) {
    auto log = logger();

    if (argc < 2) {
        print_help(argv[0]);
        return 1;
    }

    DecodeOptions options;
    std::vector<std::string> input_files;
    const char* output_path = nullptr;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (is_option(arg, "-V", "--version")) {
            print_version();
            return 0;
        } else if (std::strcmp(arg, "--help") == 0) {
            print_help(argv[0]);
            return 0;
        } else if (is_option(arg, "-h", "--header")) {
            options.print_header = true;
            log->info("set header on.");
        } else if (is_option(arg, "-D", "--today")) {
            options.filter_today = true;
            log->info("filter: today only.");
        } else if (is_option(arg, "-L", "--long")) {
            options.long_format = true;
            log->info("long format enabled.");
        } else if (is_option(arg, "-N", nullptr)) {
            options.print_counter = false;
        } else if (is_option(arg, "-n", nullptr)) {
            options.print_counter = true;
        } else if (is_option(arg, "-d", "--day")) {
            if (i + 1 >= argc) {
                log->error("Option -d requires an argument");
                print_help(argv[0]);
                return 2;
            }
            const char* date_arg = argv[++i];
            log->info("set date filter to: \"{}\"", date_arg);
            try {
                options.date_filter = normalize_date_string(date_arg);
            } catch (const InvalidArgumentException& e) {
                log->error("ERROR: {}", e.what());
                print_help(argv[0]);
                return 2;
            }
        } else if (is_option(arg, "-o", "--output")) {
            if (i + 1 >= argc) {
                log->error("Option -o requires an argument");
                print_help(argv[0]);
                return 2;
            }
            output_path = argv[++i];
        } else if (arg[0] == '-' && arg[1] != '\0') {
            log->error("Unknown Option '{}'", arg);
            print_help(argv[0]);
            return 2;
        } else {
            input_files.emplace_back(arg);
        }
    }

    if (input_files.empty()) {
        print_help(argv[0]);
        return 1;
    }

    std::ofstream output_file;
    std::ostream* out = &std::cout;
    OutputEncoding encoding = OutputEncoding::Windows1252;
    if (output_path != nullptr) {
        output_file.open(output_path, std::ios::binary | std::ios::trunc);
        if (!output_file) {
            log->error("ERROR: can't create file: \"{}\"", output_path);
            return 1;
        }
        out = &output_file;
        encoding = OutputEncoding::Utf8;
    }

    CsvWriter writer(*out, encoding);
    bool first_file = true;
    int exit_code = 0;

    for (const std::string& path : input_files) {
        // Header rows precede the first decoded file only
        DecodeOptions file_options = options;
        file_options.print_header = options.print_header && first_file;

        DecodePipeline pipeline(file_options);
        try {
            pipeline.run_file(path, writer);
            first_file = false;
        } catch (const VifException& e) {
            log->error("ERROR: {}", e.what());
            exit_code = 1;
        }
    }

    out->flush();
    if (!out->good()) {
        log->error("ERROR: failed to write output");
        return 1;
    }
    return exit_code;
}
