#pragma once
#include <filesystem>
#include <string>
#include <vector>

namespace vessel::core::paths {

// Default cgroup v2 mount point.
inline constexpr const char* kCgroupRoot = "/sys/fs/cgroup";

// Default system memory information file.
inline constexpr const char* kMeminfo = "/proc/meminfo";

// Best-effort path to current executable; empty if unavailable.
std::filesystem::path executable_path();

// Best-effort directory of the current executable; empty if unavailable.
std::filesystem::path executable_dir();

// Directories searched for a .env file: cwd, its parents, the executable's dir and parents.
std::vector<std::filesystem::path> project_search_paths();

// Re-root an absolute /proc path under VESSEL_PROC_ROOT when it is set.
std::string map_proc_path(const std::string& abs);

// Re-root an absolute /sys/fs/cgroup path under VESSEL_CGROUP_ROOT when it is set.
std::string map_cgroup_path(const std::string& abs);

} // namespace vessel::core::paths
