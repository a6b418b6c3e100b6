#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "metrics/container_stats.hpp"

using namespace vessel::metrics;
using std::chrono::system_clock;

TEST(FormatRfc3339Test, Epoch)
{
    EXPECT_EQ("1970-01-01T00:00:00.000000000Z", format_rfc3339(system_clock::time_point()));
}

TEST(FormatRfc3339Test, KeepsSubsecondPrecision)
{
    auto tp = system_clock::time_point(std::chrono::duration_cast<system_clock::duration>(
        std::chrono::seconds(1700000000) + std::chrono::nanoseconds(123456789)));
    EXPECT_EQ("2023-11-14T22:13:20.123456789Z", format_rfc3339(tp));
}

TEST(ContainerStatsTest, JsonHasExactFieldsInOrder)
{
    ContainerStats stats;
    stats.id = "3f4e5d6c7b8a";
    stats.name = "web";
    stats.cpu_percentage = 12.5;
    stats.cpu_usage_usec = 1500000;
    stats.system_usage_usec = 300;
    stats.memory_usage = 500000000;
    stats.memory_limit = 1000000000;
    stats.memory_percentage = 50.0;
    stats.block_read = 100;
    stats.block_write = 200;
    stats.timestamp = system_clock::time_point(std::chrono::seconds(1700000000));

    auto j = stats.to_json();

    std::vector<std::string> keys;
    for (auto it = j.begin(); it != j.end(); ++it) {
        keys.push_back(it.key());
    }
    std::vector<std::string> expected = {
        "id", "name", "cpu_percentage", "cpu_usage_usec", "system_usage_usec",
        "memory_usage", "memory_limit", "memory_percentage", "network_rx",
        "network_tx", "block_read", "block_write", "timestamp"};
    EXPECT_EQ(expected, keys);

    EXPECT_EQ("3f4e5d6c7b8a", j["id"].get<std::string>());
    EXPECT_EQ("web", j["name"].get<std::string>());
    EXPECT_TRUE(j["cpu_percentage"].is_number_float());
    EXPECT_DOUBLE_EQ(12.5, j["cpu_percentage"].get<double>());
    EXPECT_TRUE(j["cpu_usage_usec"].is_number_unsigned());
    EXPECT_EQ(1500000u, j["cpu_usage_usec"].get<uint64_t>());
    EXPECT_TRUE(j["memory_percentage"].is_number_float());
    EXPECT_EQ(0u, j["network_rx"].get<uint64_t>());
    EXPECT_EQ(0u, j["network_tx"].get<uint64_t>());
    EXPECT_EQ(200u, j["block_write"].get<uint64_t>());
    EXPECT_EQ("2023-11-14T22:13:20.000000000Z", j["timestamp"].get<std::string>());
}
