#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace arena {

// Unreadable or malformed configuration file.
class ConfigError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// -----------------------------------------------------------------------------
// EngineConfig - process-wide settings for the benchmark server
// -----------------------------------------------------------------------------
//
// @brief  Endpoints, seeds and limits handed to BenchmarkEngine at
//         construction.
//
// @details
// Every field has a default, so an empty JSON object (or no file at all)
// yields a working local setup:
//
//   {
//     "ingest_endpoint":           "tcp://127.0.0.1:5555",  // SUB, connect
//     "command_endpoint":          "tcp://127.0.0.1:5556",  // REP, bind
//     "telemetry_endpoint":        "tcp://127.0.0.1:5557",  // PUB, bind
//     "risk_seed":                 0,                       // 0 = random
//     "leaderboard_default_limit": 50,
//     "portfolio_snapshot_path":   "portfolios.json"        // optional
//   }
//
// An empty endpoint string disables that socket (tests run the engine
// without any ZeroMQ I/O this way).
//
// Thread model:
//   Plain value type. Copied into the engine; never mutated afterwards.
// -----------------------------------------------------------------------------
struct EngineConfig {
  std::string ingest_endpoint{"tcp://127.0.0.1:5555"};
  std::string command_endpoint{"tcp://127.0.0.1:5556"};
  std::string telemetry_endpoint{"tcp://127.0.0.1:5557"};

  std::uint32_t risk_seed{0};
  std::size_t leaderboard_default_limit{50};

  std::optional<std::string> portfolio_snapshot_path;
};

// -------------------------------------------------------------------------
// loadEngineConfig(path)
// -------------------------------------------------------------------------
// @brief  Reads an EngineConfig from a JSON file. Missing keys keep their
//         defaults.
//
// @throws ConfigError if the file cannot be opened, is not a JSON object,
//         or a key has the wrong type.
// -------------------------------------------------------------------------
EngineConfig loadEngineConfig(const std::string& path);

// Same as loadEngineConfig() for an in-memory document.
EngineConfig parseEngineConfig(const std::string& json_text);

}  // namespace arena
