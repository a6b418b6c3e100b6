#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include "core/paths.hpp"

namespace vessel::core::config {

// Monitor configuration. Defaults match an unconfigured rootful Docker host.
struct MonitorConfig {
    std::vector<std::string> containers;
    uint64_t interval_seconds = 1;
    std::string output = "vessel_stats.json";
    std::string cgroup_root = paths::kCgroupRoot;
    std::string meminfo_path = paths::kMeminfo;
    std::string docker_binary = "docker";
    std::string log_level = "info";
};

// Load a JSON config file. A missing file yields the defaults; a present file
// that cannot be parsed, or holds a value of the wrong type, throws ConfigError.
MonitorConfig load_config_file(const std::filesystem::path& path);

// Apply VESSEL_CGROUP_ROOT and VESSEL_PROC_ROOT remapping, then VESSEL_DOCKER_BIN and
// VESSEL_LOG_LEVEL overrides. A cgroup_root outside /sys/fs/cgroup is replaced outright
// by VESSEL_CGROUP_ROOT.
void apply_env_overrides(MonitorConfig& config);

// Load environment variables from the first .env found on the project search paths (idempotent).
void load_dotenv(const std::vector<std::filesystem::path>& extra_search_paths = {});

// Load one .env file without overriding variables that are already set.
// Returns the number of variables set, 0 if the file is missing.
int load_dotenv_file(const std::filesystem::path& env_path);

// Get environment variable, empty string if missing.
std::string get_env(const std::string& key);

// Get environment variable with default fallback.
std::string get_env_or(const std::string& key, const std::string& fallback);

} // namespace vessel::core::config
