/**
 * Polling loop
 *
 * Samples every configured container once per interval and appends each
 * record to the output. A container that fails to sample is logged and
 * skipped for that cycle; output failures end the loop.
 */
#pragma once
#include <atomic>
#include <chrono>
#include <string>
#include <vector>
#include "metrics/sampler.hpp"
#include "output/json_array_writer.hpp"

namespace vessel::monitor {

class Monitor {
public:
    Monitor(std::vector<std::string> containers,
            std::chrono::seconds interval,
            metrics::ContainerSampler& sampler,
            output::JsonArrayWriter& writer);

    // Non-copyable
    Monitor(const Monitor&) = delete;
    Monitor& operator=(const Monitor&) = delete;

    // Run cycles until stop() is called (blocks). Returns at once if stop()
    // was already called. Throws OutputError.
    void run();

    // One pass over all containers. Returns the number of records written.
    size_t run_once();

    // Request shutdown; async-signal-safe. Sticky: a later run() returns at once.
    void stop() { stop_requested_ = true; }

    bool is_running() const { return running_; }

    uint64_t cycles() const { return cycles_; }

private:
    std::vector<std::string> containers_;
    std::chrono::seconds interval_;
    metrics::ContainerSampler& sampler_;
    output::JsonArrayWriter& writer_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
    std::atomic<uint64_t> cycles_{0};

    void sleep_interval();
};

} // namespace vessel::monitor
