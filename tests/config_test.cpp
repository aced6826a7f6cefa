#include <gtest/gtest.h>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include "ledgerline/config.hpp"
#include "ledgerline/errors.hpp"

using namespace ledgerline;

class ConfigTest : public ::testing::Test {
protected:
    void TearDown() override {
        for (const char* name : {"LEDGERLINE_MAX_CONFLICT_RETRIES", "LEDGERLINE_LOYALTY_RATE_BP",
                                 "LEDGERLINE_ALERT_BASIS", "LEDGERLINE_LOCAL_BRANCHES",
                                 "LEDGERLINE_PEERS", "PORT", "LEDGERLINE_CONFIG"}) {
            unsetenv(name);
        }
    }
};

TEST_F(ConfigTest, Defaults_ShouldBeValid) {
    EngineConfig config;
    EXPECT_NO_THROW(config.validate());
    EXPECT_EQ(config.loyalty_rate_bp, 10);
    EXPECT_EQ(config.alert_basis, AlertBasis::OnHand);
    EXPECT_EQ(config.retry_policy().max_attempts, 5);
}

TEST_F(ConfigTest, FromEnv_ShouldOverlayValues) {
    // Given environment overrides
    setenv("LEDGERLINE_MAX_CONFLICT_RETRIES", "9", 1);
    setenv("LEDGERLINE_LOYALTY_RATE_BP", "1000", 1);
    setenv("LEDGERLINE_ALERT_BASIS", "available", 1);
    setenv("LEDGERLINE_LOCAL_BRANCHES", "north, south ,", 1);
    setenv("LEDGERLINE_PEERS", "replica-b", 1);
    setenv("PORT", "6000", 1);

    // When I load from the environment
    EngineConfig config;
    config.from_env();

    // Then every value is applied and lists are trimmed
    EXPECT_EQ(config.max_conflict_retries, 9);
    EXPECT_EQ(config.loyalty_rate_bp, 1000);
    EXPECT_EQ(config.alert_basis, AlertBasis::Available);
    ASSERT_EQ(config.local_branches.size(), 2u);
    EXPECT_EQ(config.local_branches[0], "north");
    EXPECT_EQ(config.local_branches[1], "south");
    ASSERT_EQ(config.peers.size(), 1u);
    EXPECT_EQ(config.port, 6000);
}

TEST_F(ConfigTest, FromEnv_MalformedInteger_ShouldThrowValidation) {
    setenv("LEDGERLINE_MAX_CONFLICT_RETRIES", "many", 1);
    EngineConfig config;
    EXPECT_THROW(config.from_env(), ValidationError);
}

TEST_F(ConfigTest, FromJson_ShouldReadThresholds) {
    // Given a JSON document with thresholds
    auto doc = nlohmann::json::parse(R"({
        "snapshot_interval": 10,
        "node_id": "replica-a",
        "thresholds": [{"variant_id": "v1", "branch_id": "b1", "threshold": 10}]
    })");

    // When I overlay it
    EngineConfig config;
    config.from_json(doc);

    // Then the thresholds are loaded
    EXPECT_EQ(config.snapshot_interval, 10u);
    EXPECT_EQ(config.node_id, "replica-a");
    ASSERT_EQ(config.thresholds.size(), 1u);
    EXPECT_EQ(config.thresholds[0].threshold, 10);
}

TEST_F(ConfigTest, FromJson_InvalidValues_ShouldThrowValidation) {
    EngineConfig config;
    EXPECT_THROW(config.from_json(nlohmann::json::parse(R"({"alert_basis": "reserved"})")), ValidationError);
    EXPECT_THROW(config.from_json(nlohmann::json::parse(R"({"snapshot_interval": 0})")), ValidationError);
    EXPECT_THROW(config.from_json(nlohmann::json::parse(R"({"max_conflict_retries": 5000})")), ValidationError);
    EXPECT_THROW(config.from_json(nlohmann::json::parse(R"({"port": "http"})")), ValidationError);
    EXPECT_THROW(config.from_json(nlohmann::json::parse("[1, 2]")), ValidationError);
}

TEST_F(ConfigTest, FromFile_ShouldReadJsonFile) {
    // Given a config file named by LEDGERLINE_CONFIG
    const std::string path = ::testing::TempDir() + "ledgerline_config_test.json";
    {
        std::ofstream out(path);
        out << R"({"reservation_ttl_seconds": 900})";
    }
    setenv("LEDGERLINE_CONFIG", path.c_str(), 1);

    // When I load from the environment
    EngineConfig config;
    config.from_env();

    // Then the file values are applied
    EXPECT_EQ(config.reservation_ttl_seconds, 900);
    std::remove(path.c_str());
}

TEST_F(ConfigTest, FromFile_MissingFile_ShouldThrowValidation) {
    EngineConfig config;
    EXPECT_THROW(config.from_file("/nonexistent/ledgerline.json"), ValidationError);
}
