/**
 * vessel - container resource monitor
 *
 * Samples cgroup v2 accounting for a set of containers at a fixed interval
 * and appends every sample to a JSON array file.
 */
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <spdlog/spdlog.h>

#include "cgroup/id_resolver.hpp"
#include "cgroup/locator.hpp"
#include "core/cli.hpp"
#include "core/config.hpp"
#include "core/error.hpp"
#include "core/logger.hpp"
#include "metrics/sampler.hpp"
#include "monitor/monitor.hpp"
#include "output/json_array_writer.hpp"

using namespace vessel;

namespace {

monitor::Monitor* g_monitor = nullptr;

void on_signal(int) {
    if (g_monitor) g_monitor->stop();
}

// Routes SIGINT/SIGTERM to a monitor for as long as it is alive
class SignalScope {
public:
    explicit SignalScope(monitor::Monitor& m) {
        g_monitor = &m;
        std::signal(SIGINT, on_signal);
        std::signal(SIGTERM, on_signal);
    }

    ~SignalScope() {
        std::signal(SIGINT, SIG_DFL);
        std::signal(SIGTERM, SIG_DFL);
        g_monitor = nullptr;
    }

    SignalScope(const SignalScope&) = delete;
    SignalScope& operator=(const SignalScope&) = delete;
};

} // namespace

int main(int argc, char** argv) {
    core::init_logger();

    core::cli::CliOptions options;
    try {
        options = core::cli::parse_args(argc, argv);
    } catch (const ConfigError& e) {
        std::cerr << e.what() << "\n\n" << core::cli::usage(argv[0]);
        return 2;
    }

    if (options.help) {
        std::cout << core::cli::usage(argv[0]);
        return 0;
    }

    try {
        core::config::load_dotenv();

        auto config = core::config::load_config_file(options.config_path);
        core::config::apply_env_overrides(config);
        core::cli::apply(options, config);

        core::set_log_level(core::parse_log_level(config.log_level));

        if (config.containers.empty()) {
            spdlog::error("No containers specified. Use --container or provide config.json file.");
            return 1;
        }

        auto locator = cgroup::CgroupLocator::open(config.cgroup_root);
        metrics::ContainerSampler sampler(
            std::make_unique<cgroup::DockerIdResolver>(config.docker_binary),
            std::move(locator),
            config.meminfo_path);

        auto writer = output::JsonArrayWriter::open(config.output);

        monitor::Monitor monitor(config.containers,
                                 std::chrono::seconds(config.interval_seconds),
                                 sampler, writer);
        {
            SignalScope signals(monitor);
            monitor.run();
        }

        writer.close();
    } catch (const std::exception& e) {
        spdlog::error("{}", e.what());
        return 1;
    }

    return 0;
}
