/**
 * @file pipeline.cpp
 * @brief File-level decoding: pre-scan, scan, validate, decode, write.
 */

#include <vif2csv/pipeline.hpp>

#include <vif2csv/log.hpp>
#include <vif2csv/mode_prescanner.hpp>
#include <vif2csv/record_decoder.hpp>
#include <vif2csv/record_validator.hpp>
#include <vif2csv/stream_scanner.hpp>

#include <fstream>

namespace vif2csv {

Error DecodePipeline::run(std::istream& in, CsvWriter& out) {
    auto log = logger();
    stats_ = PipelineStats{};

    stats_.kb_mode = detect_kb_mode(in);
    if (in.bad()) {
        return Error::Io;
    }

    in.clear();
    in.seekg(0, std::ios::beg);
    if (!in) {
        return Error::Io;
    }

    if (options_.print_header) {
        out.write_header(stats_.kb_mode, options_.print_counter);
    }

    RecordValidator validator(options_);
    RecordDecoder decoder(options_);
    StreamScanner scanner(in);

    ScannedRecord scanned;
    AcceptedRecord accepted;
    Error status;

    while ((status = scanner.next(scanned)) == Error::Ok) {
        Rejection rejection = validator.check(scanned, accepted);
        if (rejection != Rejection::None) {
            ++stats_.records_skipped;
            log->debug("skipped record at offset {}: {}", scanned.candidate.offset,
                       rejection_string(rejection));
            continue;
        }

        ++stats_.records_processed;
        out.write_record(decoder.decode(accepted), options_.print_counter);
    }

    stats_.records_found = scanner.records_found();
    log->info("Total records: {}", stats_.records_found);
    log->info("Processed: {}, Skipped: {}", stats_.records_processed, stats_.records_skipped);

    return (status == Error::EndOfStream) ? Error::Ok : status;
}

void DecodePipeline::run_file(const std::string& path, CsvWriter& out) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw IoException("can't open file: \"" + path + "\"");
    }

    Error result = run(file, out);
    if (result != Error::Ok) {
        throw IoException(std::string(error_string(result)) + " while reading \"" + path + "\"");
    }
}

} // namespace vif2csv
