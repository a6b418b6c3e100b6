#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include "core/config.hpp"

namespace vessel::core::cli {

// Command line flags; unset fields leave the config file value in place
struct CliOptions {
    std::string config_path = "config.json";
    std::optional<std::string> container;
    std::optional<uint64_t> interval_seconds;
    std::optional<std::string> output;
    std::optional<std::string> log_level;
    bool help = false;
};

// Throws ConfigError on an unknown flag, a missing value or a bad interval.
CliOptions parse_args(int argc, const char* const* argv);

// Apply the flags on top of a loaded config.
void apply(const CliOptions& options, config::MonitorConfig& config);

std::string usage(const std::string& program);

} // namespace vessel::core::cli
