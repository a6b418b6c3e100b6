#include "monitor/monitor.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <thread>

namespace vessel::monitor {

namespace {

constexpr auto kSleepSlice = std::chrono::milliseconds(100);

} // namespace

Monitor::Monitor(std::vector<std::string> containers,
                 std::chrono::seconds interval,
                 metrics::ContainerSampler& sampler,
                 output::JsonArrayWriter& writer)
    : containers_(std::move(containers)),
      interval_(interval),
      sampler_(sampler),
      writer_(writer) {}

void Monitor::run() {
    running_ = true;
    spdlog::info("Monitoring {} container(s) every {}s, writing to {}",
                 containers_.size(), interval_.count(), writer_.path().string());

    while (!stop_requested_) {
        run_once();
        sleep_interval();
    }
    running_ = false;

    spdlog::info("Monitor stopped after {} cycle(s), {} record(s) written",
                 cycles_.load(), writer_.count());
}

size_t Monitor::run_once() {
    size_t written = 0;
    for (const auto& container : containers_) {
        metrics::ContainerStats stats;
        try {
            stats = sampler_.sample(container);
        } catch (const std::exception& e) {
            spdlog::error("Error monitoring {}: {}", container, e.what());
            continue;
        }

        writer_.append(stats.to_json());
        ++written;
        spdlog::info("Updated stats for {}", container);
    }
    ++cycles_;
    return written;
}

void Monitor::sleep_interval() {
    auto deadline = std::chrono::steady_clock::now() + interval_;
    while (!stop_requested_) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) break;
        std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(
            kSleepSlice, deadline - now));
    }
}

} // namespace vessel::monitor
