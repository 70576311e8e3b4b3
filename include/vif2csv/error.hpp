/**
 * @file error.hpp
 * @brief VIF2CSV error handling.
 *
 * Error codes for the noexcept scanning and decoding paths, plus an
 * exception hierarchy for per-file and configuration failures.
 */

#ifndef VIF2CSV_ERROR_HPP
#define VIF2CSV_ERROR_HPP

#include <stdexcept>
#include <string>

namespace vif2csv {

/**
 * @brief Error codes for error-code-based error handling.
 */
enum class Error {
    Ok = 0,           ///< Success
    InvalidArg = -1,  ///< Invalid argument
    EndOfStream = -2, ///< Source exhausted, nothing more to emit
    InvalidData = -3, ///< Invalid/corrupted data
    Io = -4           ///< Source could not be opened or read
};

/**
 * @brief Get error message for error code.
 * @param error Error code
 * @return Human-readable error message
 */
inline const char* error_string(Error error) noexcept {
    switch (error) {
    case Error::Ok:
        return "Success";
    case Error::InvalidArg:
        return "Invalid argument";
    case Error::EndOfStream:
        return "End of stream";
    case Error::InvalidData:
        return "Invalid or corrupted data";
    case Error::Io:
        return "I/O error";
    default:
        return "Unknown error";
    }
}

/**
 * @brief Base exception for VIF2CSV errors.
 */
class VifException : public std::runtime_error {
public:
    explicit VifException(const std::string& message, Error code = Error::InvalidArg)
        : std::runtime_error(message), error_code_(code) {}

    Error code() const noexcept {
        return error_code_;
    }

private:
    Error error_code_;
};

/**
 * @brief Exception for invalid arguments (e.g. a malformed date filter).
 */
class InvalidArgumentException : public VifException {
public:
    explicit InvalidArgumentException(const std::string& message)
        : VifException(message, Error::InvalidArg) {}
};

/**
 * @brief Exception for a source that cannot be opened or read.
 */
class IoException : public VifException {
public:
    explicit IoException(const std::string& message) : VifException(message, Error::Io) {}
};

} // namespace vif2csv

#endif // VIF2CSV_ERROR_HPP
