#include "core/config.hpp"
#include "core/error.hpp"
#include "core/paths.hpp"
#include "core/strings.hpp"
#include <cstdlib>
#include <fstream>
#include <nlohmann/json.hpp>

namespace vessel::core::config {

namespace {

std::string require_string(const nlohmann::json& j, const char* key) {
    const auto& value = j.at(key);
    if (!value.is_string()) {
        throw ConfigError(std::string("Config key '") + key + "' must be a string");
    }
    return value.get<std::string>();
}

} // namespace

MonitorConfig load_config_file(const std::filesystem::path& path) {
    MonitorConfig config;

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return config;
    }

    std::ifstream file(path);
    if (!file) {
        throw ConfigError("Failed to open config file: " + path.string());
    }

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("Failed to parse " + path.string() + ": " + e.what());
    }

    if (!j.is_object()) {
        throw ConfigError("Config file " + path.string() + " must contain a JSON object");
    }

    if (j.contains("containers")) {
        const auto& list = j["containers"];
        if (!list.is_array()) {
            throw ConfigError("Config key 'containers' must be an array of strings");
        }
        for (const auto& item : list) {
            if (!item.is_string()) {
                throw ConfigError("Config key 'containers' must be an array of strings");
            }
            config.containers.push_back(item.get<std::string>());
        }
    }

    if (j.contains("interval_seconds")) {
        const auto& interval = j["interval_seconds"];
        if (!interval.is_number_unsigned() || interval.get<uint64_t>() == 0) {
            throw ConfigError("Config key 'interval_seconds' must be a positive integer");
        }
        config.interval_seconds = interval.get<uint64_t>();
    }

    if (j.contains("output")) config.output = require_string(j, "output");
    if (j.contains("cgroup_root")) config.cgroup_root = require_string(j, "cgroup_root");
    if (j.contains("meminfo_path")) config.meminfo_path = require_string(j, "meminfo_path");
    if (j.contains("docker_binary")) config.docker_binary = require_string(j, "docker_binary");
    if (j.contains("log_level")) config.log_level = require_string(j, "log_level");

    return config;
}

void apply_env_overrides(MonitorConfig& config) {
    // A root outside /sys/fs/cgroup cannot be re-rooted; the variable replaces it
    std::string remapped = paths::map_cgroup_path(config.cgroup_root);
    config.cgroup_root = remapped != config.cgroup_root
        ? remapped
        : get_env_or("VESSEL_CGROUP_ROOT", config.cgroup_root);
    config.docker_binary = get_env_or("VESSEL_DOCKER_BIN", config.docker_binary);
    config.log_level = get_env_or("VESSEL_LOG_LEVEL", config.log_level);
    config.meminfo_path = paths::map_proc_path(config.meminfo_path);
}

int load_dotenv_file(const std::filesystem::path& env_path) {
    std::ifstream file(env_path);
    if (!file) {
        return 0;
    }

    int count = 0;
    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);

        // Skip comments
        if (line.empty() || line[0] == '#') continue;

        // Find = separator
        size_t eq_pos = line.find('=');
        if (eq_pos == std::string::npos) continue;

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        // Remove quotes
        if (value.size() >= 2) {
            if ((value.front() == '"' && value.back() == '"') ||
                (value.front() == '\'' && value.back() == '\'')) {
                value = value.substr(1, value.size() - 2);
            }
        }

        if (!key.empty() && std::getenv(key.c_str()) == nullptr) {
            setenv(key.c_str(), value.c_str(), 0);
            ++count;
        }
    }
    return count;
}

void load_dotenv(const std::vector<std::filesystem::path>& extra_search_paths) {
    static bool loaded = false;
    if (loaded) return;
    loaded = true;

    std::vector<std::filesystem::path> search_paths = paths::project_search_paths();
    for (const auto& p : extra_search_paths) {
        search_paths.push_back(p);
    }

    for (const auto& base : search_paths) {
        auto env_path = base / ".env";
        std::error_code ec;
        if (!std::filesystem::exists(env_path, ec)) {
            continue;
        }
        load_dotenv_file(env_path);
        break;
    }
}

std::string get_env(const std::string& key) {
    const char* value = std::getenv(key.c_str());
    return value ? std::string(value) : std::string();
}

std::string get_env_or(const std::string& key, const std::string& fallback) {
    auto value = get_env(key);
    return value.empty() ? fallback : value;
}

} // namespace vessel::core::config
