// =============================================================================
// engine_config_test.cpp
// =============================================================================
// Unit tests for arena::parseEngineConfig / arena::loadEngineConfig.
//
// Validates:
//   - Defaults for an empty document and partial overrides
//   - Empty endpoints are kept (they disable sockets)
//   - Malformed documents, non-objects, wrong types and missing files
//     raise ConfigError
// =============================================================================

#include "arena/config/engine_config.hpp"

#include <gtest/gtest.h>

#include <fstream>
#include <string>

using arena::ConfigError;
using arena::EngineConfig;
using arena::loadEngineConfig;
using arena::parseEngineConfig;

// -----------------------------------------------------------------------------
// 1. An empty object yields the local defaults.
// -----------------------------------------------------------------------------
TEST(EngineConfigTest, EmptyObjectUsesDefaults) {
  const EngineConfig config = parseEngineConfig("{}");
  EXPECT_EQ(config.ingest_endpoint, "tcp://127.0.0.1:5555");
  EXPECT_EQ(config.command_endpoint, "tcp://127.0.0.1:5556");
  EXPECT_EQ(config.telemetry_endpoint, "tcp://127.0.0.1:5557");
  EXPECT_EQ(config.risk_seed, 0u);
  EXPECT_EQ(config.leaderboard_default_limit, 50u);
  EXPECT_FALSE(config.portfolio_snapshot_path.has_value());
}

// -----------------------------------------------------------------------------
// 2. Present keys override; absent and null keys keep defaults.
// -----------------------------------------------------------------------------
TEST(EngineConfigTest, PartialOverride) {
  const EngineConfig config = parseEngineConfig(R"({
    "command_endpoint": "",
    "risk_seed": 42,
    "leaderboard_default_limit": 10,
    "telemetry_endpoint": null,
    "portfolio_snapshot_path": "/var/lib/arena/portfolios.json"
  })");
  EXPECT_EQ(config.ingest_endpoint, "tcp://127.0.0.1:5555");
  EXPECT_EQ(config.command_endpoint, "");
  EXPECT_EQ(config.telemetry_endpoint, "tcp://127.0.0.1:5557");
  EXPECT_EQ(config.risk_seed, 42u);
  EXPECT_EQ(config.leaderboard_default_limit, 10u);
  ASSERT_TRUE(config.portfolio_snapshot_path.has_value());
  EXPECT_EQ(*config.portfolio_snapshot_path, "/var/lib/arena/portfolios.json");
}

// -----------------------------------------------------------------------------
// 3. Every malformed input surfaces as ConfigError.
// -----------------------------------------------------------------------------
TEST(EngineConfigTest, MalformedInputThrows) {
  EXPECT_THROW(parseEngineConfig("{not json"), ConfigError);
  EXPECT_THROW(parseEngineConfig("[1, 2, 3]"), ConfigError);
  EXPECT_THROW(parseEngineConfig(R"({"risk_seed": "seven"})"), ConfigError);
  EXPECT_THROW(parseEngineConfig(R"({"ingest_endpoint": 5555})"), ConfigError);
}

// -----------------------------------------------------------------------------
// 4. Loading from disk.
// -----------------------------------------------------------------------------
TEST(EngineConfigTest, LoadFromFile) {
  const std::string path = ::testing::TempDir() + "arena_engine_config.json";
  {
    std::ofstream out(path);
    out << R"({"ingest_endpoint": "tcp://10.0.0.5:7000"})";
  }

  const EngineConfig config = loadEngineConfig(path);
  EXPECT_EQ(config.ingest_endpoint, "tcp://10.0.0.5:7000");
  EXPECT_EQ(config.command_endpoint, "tcp://127.0.0.1:5556");

  EXPECT_THROW(loadEngineConfig(path + ".missing"), ConfigError);
}
