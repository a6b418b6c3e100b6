#pragma once
#include <string>
#include <spdlog/spdlog.h>

namespace vessel::core {

// Initialize logging with colored stderr output
void init_logger();

// Set log level
void set_log_level(spdlog::level::level_enum level);

// Parse "trace", "debug", "info", "warn", "error" or "off".
// Throws ConfigError on anything else.
spdlog::level::level_enum parse_log_level(const std::string& name);

} // namespace vessel::core
