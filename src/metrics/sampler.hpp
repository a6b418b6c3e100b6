/**
 * Container metrics sampler
 *
 * Reads cgroup v2 accounting files for one container and turns the kernel's
 * cumulative counters into a ContainerStats record. CPU percentage needs two
 * samples, so the sampler remembers the last (usage, time) pair per container
 * name. The first sample of a name always reports 0% and only seeds that state.
 *
 * Required files: cpu.stat, memory.current, memory.max. A failure on any of
 * them aborts the sample with RequiredFileError. Everything else (io.stat,
 * malformed cpu.stat lines, the meminfo fallback) degrades to zero.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "cgroup/id_resolver.hpp"
#include "cgroup/locator.hpp"
#include "metrics/container_stats.hpp"

namespace vessel::metrics {

using Clock = std::function<std::chrono::system_clock::time_point()>;

struct CpuStat {
    uint64_t usage_usec = 0;
    uint64_t system_usec = 0;
};

struct MemoryUsage {
    uint64_t current = 0;
    uint64_t limit = 0;
    double percentage = 0.0;
};

struct BlockIo {
    uint64_t read_bytes = 0;
    uint64_t write_bytes = 0;
};

struct NetworkIo {
    uint64_t rx_bytes = 0;
    uint64_t tx_bytes = 0;
};

// Strict unsigned decimal parse of the whole string.
std::optional<uint64_t> parse_uint64(const std::string& str);

// usage_usec and system_usec from cpu.stat text; bad or absent values are 0.
CpuStat parse_cpu_stat(const std::string& content);

// rbytes / wbytes summed over every device line of io.stat text.
BlockIo parse_io_stat(const std::string& content);

// MemTotal from /proc/meminfo text, in bytes.
std::optional<uint64_t> parse_meminfo_total(const std::string& content);

// Percentage of one CPU used between two samples. 0.0 when the counter went
// backwards or no time has passed.
double cpu_percentage(uint64_t prev_usage_usec, uint64_t prev_time_ns,
                      uint64_t usage_usec, uint64_t time_ns);

class ContainerSampler {
public:
    ContainerSampler(std::unique_ptr<cgroup::IdResolver> resolver,
                     cgroup::CgroupLocator locator,
                     std::string meminfo_path = "/proc/meminfo",
                     Clock clock = std::chrono::system_clock::now);

    // Disable copy
    ContainerSampler(const ContainerSampler&) = delete;
    ContainerSampler& operator=(const ContainerSampler&) = delete;

    /**
     * Take one sample of a container.
     * @param name Container name or ID as configured; also the rate-cache key
     * @throws NotFoundError if no cgroup directory matches
     * @throws RequiredFileError if cpu.stat, memory.current or memory.max is unusable
     */
    ContainerStats sample(const std::string& name);

    MemoryUsage read_memory(const std::filesystem::path& cgroup) const;
    BlockIo read_block_io(const std::filesystem::path& cgroup) const;
    NetworkIo read_network() const { return {}; }

    // Host memory in bytes, nullopt if meminfo is unreadable
    std::optional<uint64_t> read_system_memory() const;

    // Number of container names with a stored CPU baseline
    size_t tracked_count() const;

private:
    struct CpuSample {
        uint64_t usage_usec = 0;
        uint64_t time_ns = 0;
    };

    std::unique_ptr<cgroup::IdResolver> resolver_;
    cgroup::CgroupLocator locator_;
    std::string meminfo_path_;
    Clock clock_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, CpuSample> previous_;

    double update_cpu(const std::string& name, uint64_t usage_usec, uint64_t time_ns);
};

} // namespace vessel::metrics
