#include "common/logging.hpp"
#include "common/errors.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <memory>
#include <vector>

namespace malgraph {

void configureLogging(const LoggingConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    if (!config.log_file.empty()) {
        // Truncate on start, one log per run.
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(
            config.log_file, true));
    }

    auto level = spdlog::level::from_str(config.level);
    if (level == spdlog::level::off && config.level != "off") {
        throw MalGraphError(MalGraphErrorCode::InvalidConfig,
                            "Unknown log level: " + config.level);
    }

    auto logger = std::make_shared<spdlog::logger>("malgraph", sinks.begin(), sinks.end());
    logger->set_level(level);
    logger->set_pattern("%m-%d %H:%M %-12n %-8l %v");
    spdlog::set_default_logger(logger);
}

} // namespace malgraph
