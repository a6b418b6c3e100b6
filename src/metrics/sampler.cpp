#include "metrics/sampler.hpp"
#include "core/error.hpp"
#include "core/strings.hpp"
#include <charconv>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace vessel::metrics {

namespace {

std::optional<std::string> read_file(const fs::path& path) {
    std::ifstream file(path);
    if (!file) return std::nullopt;
    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) return std::nullopt;
    return buffer.str();
}

std::string read_required(const fs::path& path) {
    auto content = read_file(path);
    if (!content) {
        throw RequiredFileError(path.string(), "file is missing or unreadable");
    }
    return *content;
}

uint64_t read_required_uint64(const fs::path& path, const std::string& content) {
    std::string value = core::trim(content);
    auto parsed = parse_uint64(value);
    if (!parsed) {
        throw RequiredFileError(path.string(), "expected an integer, got '" + value + "'");
    }
    return *parsed;
}

} // namespace

std::optional<uint64_t> parse_uint64(const std::string& str) {
    if (str.empty()) return std::nullopt;
    uint64_t value = 0;
    const char* first = str.data();
    const char* last = str.data() + str.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc() || ptr != last) return std::nullopt;
    return value;
}

CpuStat parse_cpu_stat(const std::string& content) {
    CpuStat stat;
    std::istringstream lines(content);
    std::string line;
    while (std::getline(lines, line)) {
        std::istringstream iss(line);
        std::string key;
        std::string value;
        iss >> key >> value;
        if (key == "usage_usec") stat.usage_usec = parse_uint64(value).value_or(0);
        else if (key == "system_usec") stat.system_usec = parse_uint64(value).value_or(0);
    }
    return stat;
}

BlockIo parse_io_stat(const std::string& content) {
    BlockIo io;
    std::istringstream lines(content);
    std::string line;
    while (std::getline(lines, line)) {
        // Format: "8:0 rbytes=1234 wbytes=5678 rios=10 wios=20 ..."
        std::istringstream iss(line);
        std::string device;
        iss >> device;

        std::string kv;
        while (iss >> kv) {
            size_t eq = kv.find('=');
            if (eq == std::string::npos) continue;
            std::string key = kv.substr(0, eq);
            uint64_t value = parse_uint64(kv.substr(eq + 1)).value_or(0);
            if (key == "rbytes") io.read_bytes += value;
            else if (key == "wbytes") io.write_bytes += value;
        }
    }
    return io;
}

std::optional<uint64_t> parse_meminfo_total(const std::string& content) {
    std::istringstream lines(content);
    std::string line;
    while (std::getline(lines, line)) {
        std::istringstream iss(line);
        std::string key;
        std::string value;
        iss >> key >> value;
        if (key == "MemTotal:") {
            // Values are in kB, convert to bytes
            return parse_uint64(value).value_or(0) * 1024;
        }
    }
    return std::nullopt;
}

double cpu_percentage(uint64_t prev_usage_usec, uint64_t prev_time_ns,
                      uint64_t usage_usec, uint64_t time_ns) {
    uint64_t usage_diff = usage_usec > prev_usage_usec ? usage_usec - prev_usage_usec : 0;
    uint64_t time_diff_usec = time_ns > prev_time_ns ? (time_ns - prev_time_ns) / 1000 : 0;
    if (time_diff_usec == 0) {
        return 0.0;
    }
    return static_cast<double>(usage_diff) / static_cast<double>(time_diff_usec) * 100.0;
}

ContainerSampler::ContainerSampler(std::unique_ptr<cgroup::IdResolver> resolver,
                                   cgroup::CgroupLocator locator,
                                   std::string meminfo_path,
                                   Clock clock)
    : resolver_(std::move(resolver)),
      locator_(std::move(locator)),
      meminfo_path_(std::move(meminfo_path)),
      clock_(std::move(clock)) {}

ContainerStats ContainerSampler::sample(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);

    ContainerStats stats;
    stats.name = name;
    stats.id = resolver_->resolve(name);

    fs::path cgroup_path = locator_.locate(stats.id, name);

    stats.timestamp = clock_();
    auto now_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(
        stats.timestamp.time_since_epoch()).count();

    CpuStat cpu = parse_cpu_stat(read_required(cgroup_path / "cpu.stat"));
    stats.cpu_usage_usec = cpu.usage_usec;
    stats.system_usage_usec = cpu.system_usec;
    stats.cpu_percentage = update_cpu(name, cpu.usage_usec,
                                      now_ns > 0 ? static_cast<uint64_t>(now_ns) : 0);

    MemoryUsage memory = read_memory(cgroup_path);
    stats.memory_usage = memory.current;
    stats.memory_limit = memory.limit;
    stats.memory_percentage = memory.percentage;

    NetworkIo net = read_network();
    stats.network_rx = net.rx_bytes;
    stats.network_tx = net.tx_bytes;

    BlockIo io = read_block_io(cgroup_path);
    stats.block_read = io.read_bytes;
    stats.block_write = io.write_bytes;

    return stats;
}

double ContainerSampler::update_cpu(const std::string& name, uint64_t usage_usec, uint64_t time_ns) {
    double percent = 0.0;
    auto it = previous_.find(name);
    if (it != previous_.end()) {
        percent = cpu_percentage(it->second.usage_usec, it->second.time_ns, usage_usec, time_ns);
    }
    previous_[name] = CpuSample{usage_usec, time_ns};
    return percent;
}

MemoryUsage ContainerSampler::read_memory(const fs::path& cgroup) const {
    MemoryUsage memory;

    fs::path current_path = cgroup / "memory.current";
    memory.current = read_required_uint64(current_path, read_required(current_path));

    fs::path max_path = cgroup / "memory.max";
    std::string max_content = read_required(max_path);
    if (core::trim(max_content) == "max") {
        // Unlimited: the host's physical memory is the effective ceiling
        memory.limit = read_system_memory().value_or(0);
    } else {
        memory.limit = read_required_uint64(max_path, max_content);
    }

    memory.percentage = memory.limit > 0 ?
        static_cast<double>(memory.current) / static_cast<double>(memory.limit) * 100.0 : 0.0;
    return memory;
}

BlockIo ContainerSampler::read_block_io(const fs::path& cgroup) const {
    // Not every controller set exposes io.stat
    auto content = read_file(cgroup / "io.stat");
    if (!content) {
        return {};
    }
    return parse_io_stat(*content);
}

std::optional<uint64_t> ContainerSampler::read_system_memory() const {
    auto content = read_file(meminfo_path_);
    if (!content) {
        return std::nullopt;
    }
    return parse_meminfo_total(*content);
}

size_t ContainerSampler::tracked_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return previous_.size();
}

} // namespace vessel::metrics
