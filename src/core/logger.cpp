#include "core/logger.hpp"
#include "core/error.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>

namespace vessel::core {

void init_logger() {
    // stdout is left to the operator; all diagnostics go to stderr
    auto logger = spdlog::get("vessel");
    if (!logger) {
        logger = spdlog::stderr_color_mt("vessel");
    }
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_default_logger(logger);
    spdlog::set_level(spdlog::level::info);
}

void set_log_level(spdlog::level::level_enum level) {
    spdlog::set_level(level);
}

spdlog::level::level_enum parse_log_level(const std::string& name) {
    if (name == "trace") return spdlog::level::trace;
    if (name == "debug") return spdlog::level::debug;
    if (name == "info") return spdlog::level::info;
    if (name == "warn" || name == "warning") return spdlog::level::warn;
    if (name == "error") return spdlog::level::err;
    if (name == "off") return spdlog::level::off;
    throw ConfigError("Unknown log level: " + name);
}

} // namespace vessel::core
