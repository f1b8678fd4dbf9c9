/**
 * Unit tests for controller configuration loading and validation
 */

#include "reconcile/config.h"
#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <string>

using namespace autoscale::reconcile;

class ConfigManagerTest : public ::testing::Test {
protected:
    void TearDown() override {
        if (!path_.empty()) {
            std::remove(path_.c_str());
        }
    }

    std::string write_file(const std::string &contents) {
        path_ = ::testing::TempDir() + "autoscale_config_test.json";
        std::ofstream file(path_);
        file << contents;
        return path_;
    }

    std::string path_;
};

TEST_F(ConfigManagerTest, DefaultsAreValid) {
    auto config = ConfigManager::create_default();

    EXPECT_EQ(config.poll_interval_ms, 10000u);
    EXPECT_EQ(config.group_path, "/autoscale/controllers");
    EXPECT_EQ(config.node_type, "autoscaler");
    EXPECT_EQ(ConfigManager::validate_config(config), "");
}

TEST_F(ConfigManagerTest, OverlaysKnownKeys) {
    auto json = nlohmann::json::parse(R"({
        "pollTime": 2500,
        "groupPath": "/fabric/autoscale",
        "nodeId": "edge-1",
        "logLevel": "debug",
        "jsonLogs": true,
        "nodes": 3,
        "somethingElse": "ignored"
    })");

    auto result = ConfigManager::load_from_json(json);

    ASSERT_TRUE(result.is_ok()) << result.error();
    const auto &config = result.value();
    EXPECT_EQ(config.poll_interval_ms, 2500u);
    EXPECT_EQ(config.group_path, "/fabric/autoscale");
    EXPECT_EQ(config.node_id, "edge-1");
    EXPECT_EQ(config.log_level, "debug");
    EXPECT_TRUE(config.json_logs);
    EXPECT_EQ(config.demo_nodes, 3u);
    EXPECT_EQ(config.node_type, "autoscaler");
}

TEST_F(ConfigManagerTest, PollIntervalMsAliasWins) {
    nlohmann::json json = {{"pollTime", 100}, {"pollIntervalMs", 200}};

    auto result = ConfigManager::load_from_json(json);

    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().poll_interval_ms, 200u);
}

TEST_F(ConfigManagerTest, WrongTypesAreErrors) {
    EXPECT_TRUE(ConfigManager::load_from_json(nlohmann::json::array()).is_err());
    EXPECT_TRUE(
        ConfigManager::load_from_json({{"pollTime", "fast"}}).is_err());
    EXPECT_TRUE(ConfigManager::load_from_json({{"pollTime", -5}}).is_err());
    EXPECT_TRUE(ConfigManager::load_from_json({{"jsonLogs", "yes"}}).is_err());
    EXPECT_TRUE(ConfigManager::load_from_json({{"groupPath", 7}}).is_err());
}

TEST_F(ConfigManagerTest, OutOfRangeNumbersAreErrors) {
    auto wrapped = ConfigManager::load_from_json(
        nlohmann::json::parse(R"({"pollTime": 4294967296})"));
    ASSERT_TRUE(wrapped.is_err());
    EXPECT_NE(wrapped.error().find("out of range"), std::string::npos);

    EXPECT_TRUE(ConfigManager::load_from_json(
                    nlohmann::json::parse(R"({"nodes": 18446744073709551615})"))
                    .is_err());

    auto largest = ConfigManager::load_from_json(
        nlohmann::json::parse(R"({"pollIntervalMs": 4294967295})"));
    ASSERT_TRUE(largest.is_ok()) << largest.error();
    EXPECT_EQ(largest.value().poll_interval_ms, 4294967295u);
}

TEST_F(ConfigManagerTest, ValidationRejectsBadValues) {
    AutoscaleConfig config;

    config.poll_interval_ms = 0;
    EXPECT_NE(ConfigManager::validate_config(config), "");

    config = AutoscaleConfig();
    config.group_path = "autoscale";
    EXPECT_NE(ConfigManager::validate_config(config), "");

    config = AutoscaleConfig();
    config.node_type.clear();
    EXPECT_NE(ConfigManager::validate_config(config), "");

    config = AutoscaleConfig();
    config.log_level = "loud";
    EXPECT_NE(ConfigManager::validate_config(config), "");

    config = AutoscaleConfig();
    config.demo_nodes = 0;
    EXPECT_NE(ConfigManager::validate_config(config), "");
}

TEST_F(ConfigManagerTest, LoadsFromFile) {
    auto path = write_file(R"({"pollIntervalMs": 750, "runSeconds": 5})");

    auto result = ConfigManager::load_from_file(path);

    ASSERT_TRUE(result.is_ok()) << result.error();
    EXPECT_EQ(result.value().poll_interval_ms, 750u);
    EXPECT_EQ(result.value().run_seconds, 5u);
}

TEST_F(ConfigManagerTest, FileErrorsAreReported) {
    EXPECT_TRUE(
        ConfigManager::load_from_file("/nonexistent/autoscaled.json").is_err());

    auto path = write_file("{ not json");
    auto result = ConfigManager::load_from_file(path);
    ASSERT_TRUE(result.is_err());
    EXPECT_NE(result.error().find("invalid JSON"), std::string::npos);
}

TEST_F(ConfigManagerTest, SerializedConfigLoadsBack) {
    AutoscaleConfig config;
    config.poll_interval_ms = 1234;
    config.node_id = "n7";
    config.async_logging = true;

    auto result = ConfigManager::load_from_json(ConfigManager::to_json(config));

    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().poll_interval_ms, 1234u);
    EXPECT_EQ(result.value().node_id, "n7");
    EXPECT_TRUE(result.value().async_logging);
}
