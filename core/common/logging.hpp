#pragma once

#include <string>

namespace malgraph {

/// Logging settings, normally read from the tool configuration.
struct LoggingConfig {
    std::string level = "info";
    std::string log_file;       // empty = console only
};

/// Install the "malgraph" logger as the spdlog default logger.
/// Library code logs through spdlog::debug/info/warn/error.
void configureLogging(const LoggingConfig& config);

} // namespace malgraph
