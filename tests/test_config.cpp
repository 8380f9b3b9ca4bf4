#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "config.h"
#include "fs.h"

using namespace netlaunch;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        delete_file(config_file_);
    }

    void TearDown() override {
        delete_file(config_file_);
    }

    const std::string config_file_ = "netlaunch_test_config.json";
};

TEST_F(ConfigTest, DefaultsTest) {
    NetlaunchConfig config;
    EXPECT_EQ(config.log_level, LogLevel::INFO);
    EXPECT_EQ(config.scan_duration_ms, 5000);
    EXPECT_EQ(config.port_probe_timeout_ms, 400);
    EXPECT_EQ(config.port_probe_concurrency, 10);
    EXPECT_EQ(config.resolve_timeout_ms, 3000);
    EXPECT_EQ(config.health_check_timeout_ms, 10000);
    EXPECT_EQ(config.route_probe_timeout_ms, 3000);
    EXPECT_EQ(config.batch_delay_ms, 100);
    EXPECT_EQ(config.dns_sd_path, "dns-sd");
    EXPECT_THAT(config.neighbor_command, ::testing::ElementsAre("arp", "-a"));
}

TEST_F(ConfigTest, ApplyOverridesOnlyPresentKeysTest) {
    NetlaunchConfig config;
    apply_config_json(nlohmann::json::parse(R"({
        "log_level": "debug",
        "scan_duration_ms": 8000,
        "batch_delay_ms": 0,
        "dns_sd_path": "/usr/local/bin/dns-sd",
        "neighbor_command": ["ip", "neigh"],
        "unknown_key": true
    })"), config);

    EXPECT_EQ(config.log_level, LogLevel::DEBUG);
    EXPECT_EQ(config.scan_duration_ms, 8000);
    EXPECT_EQ(config.batch_delay_ms, 0);
    EXPECT_EQ(config.dns_sd_path, "/usr/local/bin/dns-sd");
    EXPECT_THAT(config.neighbor_command, ::testing::ElementsAre("ip", "neigh"));
    EXPECT_EQ(config.port_probe_timeout_ms, 400);
}

// Values of the wrong type or out of range keep the previous setting
TEST_F(ConfigTest, InvalidValuesAreIgnoredTest) {
    NetlaunchConfig config;
    apply_config_json(nlohmann::json::parse(R"({
        "scan_duration_ms": -1,
        "port_probe_concurrency": 0,
        "resolve_timeout_ms": "fast",
        "batch_delay_ms": -5,
        "dns_sd_path": "",
        "neighbor_command": [],
        "log_level": 3
    })"), config);

    NetlaunchConfig defaults;
    EXPECT_EQ(config.scan_duration_ms, defaults.scan_duration_ms);
    EXPECT_EQ(config.port_probe_concurrency, defaults.port_probe_concurrency);
    EXPECT_EQ(config.resolve_timeout_ms, defaults.resolve_timeout_ms);
    EXPECT_EQ(config.batch_delay_ms, defaults.batch_delay_ms);
    EXPECT_EQ(config.dns_sd_path, defaults.dns_sd_path);
    EXPECT_EQ(config.neighbor_command, defaults.neighbor_command);
    EXPECT_EQ(config.log_level, defaults.log_level);

    // A non-object root changes nothing
    apply_config_json(nlohmann::json::array({1, 2}), config);
    EXPECT_EQ(config.scan_duration_ms, defaults.scan_duration_ms);
}

// Values outside the int range are rejected rather than wrapped
TEST_F(ConfigTest, OutOfRangeIntegersAreIgnoredTest) {
    NetlaunchConfig config;
    apply_config_json(nlohmann::json::parse(R"({
        "scan_duration_ms": 5000000000,
        "health_check_timeout_ms": 18446744073709551615,
        "batch_delay_ms": -4294967296,
        "port_probe_timeout_ms": 2147483647
    })"), config);

    NetlaunchConfig defaults;
    EXPECT_EQ(config.scan_duration_ms, defaults.scan_duration_ms);
    EXPECT_EQ(config.health_check_timeout_ms, defaults.health_check_timeout_ms);
    EXPECT_EQ(config.batch_delay_ms, defaults.batch_delay_ms);
    EXPECT_EQ(config.port_probe_timeout_ms, 2147483647);
}

TEST_F(ConfigTest, MissingFileKeepsDefaultsTest) {
    NetlaunchConfig config;
    EXPECT_TRUE(load_config(config_file_, config));
    EXPECT_EQ(config.scan_duration_ms, 5000);
}

TEST_F(ConfigTest, LoadFromFileTest) {
    ASSERT_TRUE(create_file(config_file_, R"({"route_probe_timeout_ms": 1500, "log_level": "WARNING"})"));

    NetlaunchConfig config;
    EXPECT_TRUE(load_config(config_file_, config));
    EXPECT_EQ(config.route_probe_timeout_ms, 1500);
    EXPECT_EQ(config.log_level, LogLevel::WARN);
}

TEST_F(ConfigTest, MalformedFileKeepsDefaultsTest) {
    ASSERT_TRUE(create_file(config_file_, "{ \"scan_duration_ms\": 10, "));

    NetlaunchConfig config;
    EXPECT_FALSE(load_config(config_file_, config));
    EXPECT_EQ(config.scan_duration_ms, 5000);
}

TEST_F(ConfigTest, JsonFormTest) {
    NetlaunchConfig config;
    config.log_level = LogLevel::WARN;
    nlohmann::json j = config;

    EXPECT_EQ(j["log_level"], "WARN");
    EXPECT_EQ(j["scan_duration_ms"], 5000);
    EXPECT_EQ(j["neighbor_command"], nlohmann::json::array({"arp", "-a"}));

    // The JSON form loads back to the same settings
    NetlaunchConfig reloaded;
    reloaded.log_level = LogLevel::DEBUG;
    apply_config_json(j, reloaded);
    EXPECT_EQ(reloaded.log_level, LogLevel::WARN);
}
