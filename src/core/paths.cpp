#include "core/paths.hpp"
#include <cstdlib>
#include <unistd.h>
#include <limits.h>

namespace vessel::core::paths {

namespace {

std::string env_root(const char* name) {
    const char* value = std::getenv(name);
    if (value && *value) return std::string(value);
    return std::string();
}

std::string remap(const std::string& abs, const std::string& prefix, const std::string& root) {
    if (root.empty()) return abs;
    if (abs.compare(0, prefix.size(), prefix) != 0) return abs;
    // only whole path components match: "/procfoo" is not under "/proc"
    if (abs.size() > prefix.size() && abs[prefix.size()] != '/') return abs;

    std::filesystem::path p(root);
    std::string rest = abs.substr(prefix.size());
    if (!rest.empty() && rest.front() == '/') rest.erase(0, 1);
    if (!rest.empty()) p /= rest;
    return p.string();
}

} // namespace

std::filesystem::path executable_path() {
    char buf[PATH_MAX];
    ssize_t len = readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (len <= 0) {
        return {};
    }
    buf[len] = '\0';
    return std::filesystem::path(buf);
}

std::filesystem::path executable_dir() {
    auto exe = executable_path();
    if (exe.empty()) {
        return {};
    }
    return exe.parent_path();
}

std::vector<std::filesystem::path> project_search_paths() {
    std::vector<std::filesystem::path> roots;
    std::error_code ec;
    auto cwd = std::filesystem::current_path(ec);
    if (!ec) {
        roots.push_back(cwd);
        roots.push_back(cwd.parent_path());
    }

    auto exe_dir = executable_dir();
    if (!exe_dir.empty()) {
        roots.push_back(exe_dir);
        roots.push_back(exe_dir.parent_path());
    }

    // De-duplicate while preserving order.
    std::vector<std::filesystem::path> unique;
    for (const auto& p : roots) {
        if (p.empty()) continue;
        bool seen = false;
        for (const auto& u : unique) {
            if (u == p) {
                seen = true;
                break;
            }
        }
        if (!seen) {
            unique.push_back(p);
        }
    }
    return unique;
}

std::string map_proc_path(const std::string& abs) {
    return remap(abs, "/proc", env_root("VESSEL_PROC_ROOT"));
}

std::string map_cgroup_path(const std::string& abs) {
    return remap(abs, kCgroupRoot, env_root("VESSEL_CGROUP_ROOT"));
}

} // namespace vessel::core::paths
