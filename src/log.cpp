/**
 * @file log.cpp
 * @brief Diagnostic logger shared by the library and the CLI.
 */

#include <vif2csv/log.hpp>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace vif2csv {

std::shared_ptr<spdlog::logger> logger() {
    auto existing = spdlog::get(LOGGER_NAME);
    if (existing) {
        return existing;
    }

    auto created = spdlog::stderr_color_mt(LOGGER_NAME);
    // Plain messages, matching the vendor tool's stderr output
    created->set_pattern("%v");
    created->set_level(spdlog::level::info);
    return created;
}

} // namespace vif2csv
