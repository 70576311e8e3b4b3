/**
 * @file csv_writer.hpp
 * @brief CSV rendering of decoded records.
 *
 * Every field is double quoted and fields are comma separated. Decoded
 * values never contain quotes or commas, so no escaping is applied.
 */

#ifndef VIF2CSV_CSV_WRITER_HPP
#define VIF2CSV_CSV_WRITER_HPP

#include <ostream>
#include <string>

#include "record.hpp"

namespace vif2csv {

/**
 * @brief Text encoding of the CSV output.
 */
enum class OutputEncoding {
    Utf8,
    Windows1252 ///< Vendor tools write the console output in this code page
};

/**
 * @brief Writes header and data rows to a text stream.
 */
class CsvWriter {
public:
    /**
     * @param out Destination stream, opened in binary mode for files
     * @param encoding Encoding of non-ASCII header text
     */
    explicit CsvWriter(std::ostream& out, OutputEncoding encoding = OutputEncoding::Utf8) noexcept
        : out_(out), encoding_(encoding) {}

    /**
     * @brief Write the names row and the units row.
     *
     * @param kb_mode Label the second axis column "kb" instead of "f_zc"
     * @param print_counter Include the counter column
     */
    void write_header(bool kb_mode, bool print_counter);

    /**
     * @brief Write one data row.
     */
    void write_record(const DecodedRecord& record, bool print_counter);

    /// Number of data rows written
    [[nodiscard]] std::size_t rows_written() const noexcept {
        return rows_;
    }

    [[nodiscard]] bool good() const {
        return out_.good();
    }

    /// Header names row without line terminator
    static std::string header_names(bool kb_mode, bool print_counter);

    /// Header units row without line terminator (UTF-8)
    static std::string header_units(bool print_counter);

    /**
     * @brief Convert UTF-8 text to Windows-1252.
     *
     * Code points U+0080..U+00FF map to their single byte, anything else
     * outside ASCII becomes '?'.
     */
    static std::string to_windows1252(const std::string& utf8);

private:
    void write_line(const std::string& line);

    std::ostream& out_;
    OutputEncoding encoding_;
    std::size_t rows_ = 0;
};

} // namespace vif2csv

#endif // VIF2CSV_CSV_WRITER_HPP
