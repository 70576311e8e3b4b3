/**
 * @file pipeline.hpp
 * @brief File-level decoding: pre-scan, scan, validate, decode, write.
 */

#ifndef VIF2CSV_PIPELINE_HPP
#define VIF2CSV_PIPELINE_HPP

#include <istream>
#include <string>
#include <utility>

#include "csv_writer.hpp"
#include "error.hpp"
#include "options.hpp"

namespace vif2csv {

/**
 * @brief Counters of one decode pass.
 */
struct PipelineStats {
    std::size_t records_found = 0;     ///< Complete candidates found by the scanner
    std::size_t records_processed = 0; ///< Rows written
    std::size_t records_skipped = 0;   ///< Candidates rejected by the validator
    bool kb_mode = false;              ///< File contains extended records
};

/**
 * @brief Decodes one input at a time.
 *
 * Each run is an independent pass; nothing is carried over between
 * inputs except the options.
 */
class DecodePipeline {
public:
    explicit DecodePipeline(DecodeOptions options) : options_(std::move(options)) {}

    /**
     * @brief Decode a seekable stream.
     *
     * The stream is read twice: once by the mode pre-scan and once by the
     * record scanner.
     *
     * @param in Input positioned at the start of the log
     * @param out CSV destination
     * @return Error::Ok, or Error::Io if the input could not be rewound or read
     */
    Error run(std::istream& in, CsvWriter& out);

    /**
     * @brief Decode a file.
     *
     * @throws IoException if the file cannot be opened or read
     */
    void run_file(const std::string& path, CsvWriter& out);

    [[nodiscard]] const PipelineStats& stats() const noexcept {
        return stats_;
    }

    [[nodiscard]] const DecodeOptions& options() const noexcept {
        return options_;
    }

private:
    DecodeOptions options_;
    PipelineStats stats_;
};

} // namespace vif2csv

#endif // VIF2CSV_PIPELINE_HPP
