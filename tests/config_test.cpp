#include <gtest/gtest.h>
#include <cstdlib>

#include "core/cli.hpp"
#include "core/config.hpp"
#include "core/error.hpp"
#include "core/logger.hpp"
#include "core/paths.hpp"
#include "core/strings.hpp"
#include "test_util.hpp"

using namespace vessel;
using namespace vessel::core;
using vessel::test::TempDir;
using vessel::test::write_file;

namespace {

// Sets an environment variable for the lifetime of the guard
class EnvGuard {
public:
    EnvGuard(const char* key, const char* value) : key_(key) {
        setenv(key, value, 1);
    }
    ~EnvGuard() { unsetenv(key_); }

private:
    const char* key_;
};

} // namespace

TEST(ConfigFileTest, MissingFileGivesDefaults)
{
    TempDir dir;
    config::MonitorConfig config = config::load_config_file(dir / "config.json");
    EXPECT_TRUE(config.containers.empty());
    EXPECT_EQ(1u, config.interval_seconds);
    EXPECT_EQ("vessel_stats.json", config.output);
    EXPECT_EQ("/sys/fs/cgroup", config.cgroup_root);
    EXPECT_EQ("/proc/meminfo", config.meminfo_path);
    EXPECT_EQ("docker", config.docker_binary);
    EXPECT_EQ("info", config.log_level);
}

TEST(ConfigFileTest, DefaultsFollowPathConstants)
{
    config::MonitorConfig config;
    EXPECT_EQ(paths::kCgroupRoot, config.cgroup_root);
    EXPECT_EQ(paths::kMeminfo, config.meminfo_path);
}

TEST(ConfigFileTest, ReadsAllKeys)
{
    TempDir dir;
    write_file(dir / "config.json", R"({
        "containers": ["web", "db"],
        "interval_seconds": 5,
        "output": "/var/log/vessel.json",
        "cgroup_root": "/mnt/cgroup",
        "meminfo_path": "/mnt/proc/meminfo",
        "docker_binary": "podman",
        "log_level": "debug"
    })");

    config::MonitorConfig config = config::load_config_file(dir / "config.json");
    ASSERT_EQ(2u, config.containers.size());
    EXPECT_EQ("web", config.containers[0]);
    EXPECT_EQ("db", config.containers[1]);
    EXPECT_EQ(5u, config.interval_seconds);
    EXPECT_EQ("/var/log/vessel.json", config.output);
    EXPECT_EQ("/mnt/cgroup", config.cgroup_root);
    EXPECT_EQ("/mnt/proc/meminfo", config.meminfo_path);
    EXPECT_EQ("podman", config.docker_binary);
    EXPECT_EQ("debug", config.log_level);
}

TEST(ConfigFileTest, PartialFileKeepsDefaults)
{
    TempDir dir;
    write_file(dir / "config.json", R"({"containers": ["web"]})");

    config::MonitorConfig config = config::load_config_file(dir / "config.json");
    EXPECT_EQ(1u, config.containers.size());
    EXPECT_EQ(1u, config.interval_seconds);
}

TEST(ConfigFileTest, MalformedJsonThrows)
{
    TempDir dir;
    write_file(dir / "config.json", "{\"containers\": [\"web\"");
    EXPECT_THROW(config::load_config_file(dir / "config.json"), ConfigError);
}

TEST(ConfigFileTest, WrongTypesThrow)
{
    TempDir dir;
    write_file(dir / "a.json", R"({"containers": "web"})");
    write_file(dir / "b.json", R"({"containers": ["web", 3]})");
    write_file(dir / "c.json", R"({"interval_seconds": 0})");
    write_file(dir / "d.json", R"({"interval_seconds": "5"})");
    write_file(dir / "e.json", R"({"output": 7})");
    write_file(dir / "f.json", R"(["web"])");

    for (const char* name : {"a.json", "b.json", "c.json", "d.json", "e.json", "f.json"}) {
        EXPECT_THROW(config::load_config_file(dir / name), ConfigError) << name;
    }
}

TEST(ConfigEnvTest, OverridesApply)
{
    EnvGuard cgroup("VESSEL_CGROUP_ROOT", "/srv/fake-cgroup");
    EnvGuard proc("VESSEL_PROC_ROOT", "/srv/fake-proc");
    EnvGuard docker("VESSEL_DOCKER_BIN", "/usr/local/bin/docker");
    EnvGuard level("VESSEL_LOG_LEVEL", "warn");

    config::MonitorConfig config;
    config::apply_env_overrides(config);
    EXPECT_EQ("/srv/fake-cgroup", config.cgroup_root);
    EXPECT_EQ("/srv/fake-proc/meminfo", config.meminfo_path);
    EXPECT_EQ("/usr/local/bin/docker", config.docker_binary);
    EXPECT_EQ("warn", config.log_level);
}

TEST(ConfigEnvTest, CgroupRootReplacesCustomRoot)
{
    EnvGuard cgroup("VESSEL_CGROUP_ROOT", "/srv/fake-cgroup");

    config::MonitorConfig config;
    config.cgroup_root = "/mnt/cgroup";
    config::apply_env_overrides(config);
    EXPECT_EQ("/srv/fake-cgroup", config.cgroup_root);

    // Paths under the default mount keep their relative part
    config.cgroup_root = "/sys/fs/cgroup/unified";
    config::apply_env_overrides(config);
    EXPECT_EQ("/srv/fake-cgroup/unified", config.cgroup_root);
}

TEST(ConfigEnvTest, CustomRootKeptWithoutOverride)
{
    unsetenv("VESSEL_CGROUP_ROOT");

    config::MonitorConfig config;
    config.cgroup_root = "/mnt/cgroup";
    config::apply_env_overrides(config);
    EXPECT_EQ("/mnt/cgroup", config.cgroup_root);
}

TEST(ConfigEnvTest, NoOverridesKeepValues)
{
    unsetenv("VESSEL_CGROUP_ROOT");
    unsetenv("VESSEL_PROC_ROOT");
    unsetenv("VESSEL_DOCKER_BIN");
    unsetenv("VESSEL_LOG_LEVEL");

    config::MonitorConfig config;
    config.docker_binary = "podman";
    config::apply_env_overrides(config);
    EXPECT_EQ("/sys/fs/cgroup", config.cgroup_root);
    EXPECT_EQ("/proc/meminfo", config.meminfo_path);
    EXPECT_EQ("podman", config.docker_binary);
}

TEST(DotenvTest, LoadsWithoutOverridingExisting)
{
    TempDir dir;
    write_file(dir / ".env",
               "# comment\n"
               "VESSEL_TEST_A=plain\n"
               "  VESSEL_TEST_B = \"quoted value\"  \n"
               "VESSEL_TEST_C='single'\n"
               "not a pair\n"
               "VESSEL_TEST_D=from-file\n");
    EnvGuard existing("VESSEL_TEST_D", "from-env");

    EXPECT_EQ(3, config::load_dotenv_file(dir / ".env"));
    EXPECT_EQ("plain", config::get_env("VESSEL_TEST_A"));
    EXPECT_EQ("quoted value", config::get_env("VESSEL_TEST_B"));
    EXPECT_EQ("single", config::get_env("VESSEL_TEST_C"));
    EXPECT_EQ("from-env", config::get_env("VESSEL_TEST_D"));

    unsetenv("VESSEL_TEST_A");
    unsetenv("VESSEL_TEST_B");
    unsetenv("VESSEL_TEST_C");
}

TEST(TrimTest, StripsWhitespace)
{
    EXPECT_EQ("abc", trim("  abc\n"));
    EXPECT_EQ("a b", trim("\ta b\r\n"));
    EXPECT_EQ("", trim(" \n\t"));
    EXPECT_EQ("", trim(""));
}

TEST(DotenvTest, MissingFileLoadsNothing)
{
    TempDir dir;
    EXPECT_EQ(0, config::load_dotenv_file(dir / ".env"));
}

TEST(DotenvTest, GetEnvOrFallsBack)
{
    unsetenv("VESSEL_TEST_UNSET");
    EXPECT_EQ("", config::get_env("VESSEL_TEST_UNSET"));
    EXPECT_EQ("fallback", config::get_env_or("VESSEL_TEST_UNSET", "fallback"));
}

TEST(PathsTest, ProcRemap)
{
    EnvGuard proc("VESSEL_PROC_ROOT", "/tmp/fakeproc");
    EXPECT_EQ("/tmp/fakeproc/meminfo", paths::map_proc_path("/proc/meminfo"));
    EXPECT_EQ("/tmp/fakeproc", paths::map_proc_path("/proc"));
    EXPECT_EQ("/procfoo/meminfo", paths::map_proc_path("/procfoo/meminfo"));
    EXPECT_EQ("/etc/meminfo", paths::map_proc_path("/etc/meminfo"));
}

TEST(PathsTest, CgroupRemap)
{
    EnvGuard cgroup("VESSEL_CGROUP_ROOT", "/tmp/fakecg");
    EXPECT_EQ("/tmp/fakecg", paths::map_cgroup_path("/sys/fs/cgroup"));
    EXPECT_EQ("/tmp/fakecg/system.slice", paths::map_cgroup_path("/sys/fs/cgroup/system.slice"));
    EXPECT_EQ("/mnt/cgroup", paths::map_cgroup_path("/mnt/cgroup"));
}

TEST(PathsTest, NoRootNoRemap)
{
    unsetenv("VESSEL_PROC_ROOT");
    EXPECT_EQ("/proc/meminfo", paths::map_proc_path("/proc/meminfo"));
}

TEST(PathsTest, SearchPathsStartAtWorkingDirectory)
{
    auto roots = paths::project_search_paths();
    ASSERT_FALSE(roots.empty());
    EXPECT_EQ(std::filesystem::current_path(), roots.front());
}

TEST(CliTest, ParsesAllFlags)
{
    const char* argv[] = {"vessel", "-c", "my.json", "--container", "web",
                          "-i", "5", "--output", "out.json", "-l", "debug"};
    cli::CliOptions options = cli::parse_args(11, argv);
    EXPECT_EQ("my.json", options.config_path);
    EXPECT_EQ("web", options.container.value());
    EXPECT_EQ(5u, options.interval_seconds.value());
    EXPECT_EQ("out.json", options.output.value());
    EXPECT_EQ("debug", options.log_level.value());
    EXPECT_FALSE(options.help);
}

TEST(CliTest, DefaultsLeaveConfigUntouched)
{
    const char* argv[] = {"vessel"};
    cli::CliOptions options = cli::parse_args(1, argv);
    EXPECT_EQ("config.json", options.config_path);

    config::MonitorConfig config;
    config.containers = {"web", "db"};
    config.interval_seconds = 10;
    cli::apply(options, config);
    EXPECT_EQ(2u, config.containers.size());
    EXPECT_EQ(10u, config.interval_seconds);
}

TEST(CliTest, ContainerFlagReplacesList)
{
    const char* argv[] = {"vessel", "-n", "cache", "-i", "2"};
    cli::CliOptions options = cli::parse_args(5, argv);

    config::MonitorConfig config;
    config.containers = {"web", "db"};
    cli::apply(options, config);
    ASSERT_EQ(1u, config.containers.size());
    EXPECT_EQ("cache", config.containers[0]);
    EXPECT_EQ(2u, config.interval_seconds);
}

TEST(CliTest, RejectsBadInput)
{
    const char* unknown[] = {"vessel", "--verbose"};
    EXPECT_THROW(cli::parse_args(2, unknown), ConfigError);

    const char* missing[] = {"vessel", "-n"};
    EXPECT_THROW(cli::parse_args(2, missing), ConfigError);

    const char* zero[] = {"vessel", "-i", "0"};
    EXPECT_THROW(cli::parse_args(3, zero), ConfigError);

    const char* words[] = {"vessel", "-i", "soon"};
    EXPECT_THROW(cli::parse_args(3, words), ConfigError);
}

TEST(CliTest, Help)
{
    const char* argv[] = {"vessel", "--help"};
    EXPECT_TRUE(cli::parse_args(2, argv).help);
    EXPECT_NE(std::string::npos, cli::usage("vessel").find("--container"));
}

TEST(LoggerTest, ParsesLevels)
{
    EXPECT_EQ(spdlog::level::trace, parse_log_level("trace"));
    EXPECT_EQ(spdlog::level::debug, parse_log_level("debug"));
    EXPECT_EQ(spdlog::level::info, parse_log_level("info"));
    EXPECT_EQ(spdlog::level::warn, parse_log_level("warn"));
    EXPECT_EQ(spdlog::level::err, parse_log_level("error"));
    EXPECT_EQ(spdlog::level::off, parse_log_level("off"));
    EXPECT_THROW(parse_log_level("loud"), ConfigError);
}

TEST(LoggerTest, InitIsRepeatable)
{
    init_logger();
    init_logger();
    set_log_level(spdlog::level::warn);
    EXPECT_EQ(spdlog::level::warn, spdlog::get_level());
    set_log_level(spdlog::level::info);
}
