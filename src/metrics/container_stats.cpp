#include "metrics/container_stats.hpp"
#include <cstdio>
#include <ctime>

namespace vessel::metrics {

std::string format_rfc3339(std::chrono::system_clock::time_point tp) {
    using namespace std::chrono;

    auto since_epoch = duration_cast<nanoseconds>(tp.time_since_epoch());
    auto secs = duration_cast<seconds>(since_epoch);
    auto nanos = since_epoch - secs;
    if (nanos.count() < 0) {
        secs -= seconds(1);
        nanos += seconds(1);
    }

    std::time_t t = static_cast<std::time_t>(secs.count());
    std::tm utc{};
    gmtime_r(&t, &utc);

    char date[32];
    std::strftime(date, sizeof(date), "%Y-%m-%dT%H:%M:%S", &utc);

    char out[48];
    std::snprintf(out, sizeof(out), "%s.%09lldZ", date, static_cast<long long>(nanos.count()));
    return out;
}

nlohmann::ordered_json ContainerStats::to_json() const {
    nlohmann::ordered_json j;
    j["id"] = id;
    j["name"] = name;
    j["cpu_percentage"] = cpu_percentage;
    j["cpu_usage_usec"] = cpu_usage_usec;
    j["system_usage_usec"] = system_usage_usec;
    j["memory_usage"] = memory_usage;
    j["memory_limit"] = memory_limit;
    j["memory_percentage"] = memory_percentage;
    j["network_rx"] = network_rx;
    j["network_tx"] = network_tx;
    j["block_read"] = block_read;
    j["block_write"] = block_write;
    j["timestamp"] = format_rfc3339(timestamp);
    return j;
}

} // namespace vessel::metrics
