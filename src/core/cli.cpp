#include "core/cli.hpp"
#include "core/error.hpp"
#include <charconv>

namespace vessel::core::cli {

namespace {

uint64_t parse_interval(const std::string& value) {
    uint64_t seconds = 0;
    const char* last = value.data() + value.size();
    auto [ptr, ec] = std::from_chars(value.data(), last, seconds);
    if (value.empty() || ec != std::errc() || ptr != last || seconds == 0) {
        throw ConfigError("Interval must be a positive integer, got '" + value + "'");
    }
    return seconds;
}

} // namespace

CliOptions parse_args(int argc, const char* const* argv) {
    CliOptions options;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];

        auto next = [&]() -> std::string {
            if (i + 1 >= argc) {
                throw ConfigError("Missing value for " + a);
            }
            return argv[++i];
        };

        if (a == "-h" || a == "--help") options.help = true;
        else if (a == "-c" || a == "--config") options.config_path = next();
        else if (a == "-n" || a == "--container") options.container = next();
        else if (a == "-i" || a == "--interval") options.interval_seconds = parse_interval(next());
        else if (a == "-o" || a == "--output") options.output = next();
        else if (a == "-l" || a == "--log-level") options.log_level = next();
        else throw ConfigError("Unknown argument: " + a);
    }
    return options;
}

void apply(const CliOptions& options, config::MonitorConfig& config) {
    if (options.container) {
        config.containers = {*options.container};
    }
    if (options.interval_seconds) config.interval_seconds = *options.interval_seconds;
    if (options.output) config.output = *options.output;
    if (options.log_level) config.log_level = *options.log_level;
}

std::string usage(const std::string& program) {
    return "Usage: " + program + " [options]\n"
           "Monitor Docker container resource usage via cgroupv2\n"
           "\n"
           "  -c, --config PATH      Configuration file (default: config.json)\n"
           "  -n, --container NAME   Container name or ID to monitor\n"
           "  -i, --interval SECS    Monitoring interval in seconds (default: 1)\n"
           "  -o, --output PATH      Output JSON file (default: vessel_stats.json)\n"
           "  -l, --log-level LEVEL  trace, debug, info, warn, error or off\n"
           "  -h, --help             Show this help\n";
}

} // namespace vessel::core::cli
