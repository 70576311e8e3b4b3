/**
 * @file log.hpp
 * @brief Diagnostic logger shared by the library and the CLI.
 *
 * Diagnostics go to stderr so the CSV on stdout stays clean.
 */

#ifndef VIF2CSV_LOG_HPP
#define VIF2CSV_LOG_HPP

#include <memory>

#include <spdlog/spdlog.h>

namespace vif2csv {

/// Name of the registered logger
inline constexpr const char* LOGGER_NAME = "vif2csv";

/**
 * @brief Get the "vif2csv" logger, creating a stderr logger on first use.
 */
std::shared_ptr<spdlog::logger> logger();

} // namespace vif2csv

#endif // VIF2CSV_LOG_HPP
