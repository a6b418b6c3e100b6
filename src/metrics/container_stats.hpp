/**
 * Container resource snapshot
 *
 * One record per successful sampling pass, serialized as a flat JSON object.
 * Counters are cumulative as reported by the kernel; only the percentages
 * are derived.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

namespace vessel::metrics {

struct ContainerStats {
    std::string id;                         // Canonical container ID (or the name if unresolved)
    std::string name;                       // Name as requested by the caller

    // CPU (from cpu.stat)
    double cpu_percentage = 0.0;            // Since the previous sample of this name
    uint64_t cpu_usage_usec = 0;
    uint64_t system_usage_usec = 0;

    // Memory (in bytes)
    uint64_t memory_usage = 0;
    uint64_t memory_limit = 0;              // memory.max, or host MemTotal when unlimited
    double memory_percentage = 0.0;

    // Network (not collected)
    uint64_t network_rx = 0;
    uint64_t network_tx = 0;

    // Block I/O (from io.stat) - summed across all devices
    uint64_t block_read = 0;
    uint64_t block_write = 0;

    std::chrono::system_clock::time_point timestamp;

    // Convert to JSON, keys in declaration order
    nlohmann::ordered_json to_json() const;
};

// RFC 3339 UTC with nanosecond fraction, e.g. "2024-05-01T12:00:00.000000000Z".
std::string format_rfc3339(std::chrono::system_clock::time_point tp);

} // namespace vessel::metrics
