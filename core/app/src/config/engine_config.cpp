#include "arena/config/engine_config.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>

namespace arena {

namespace {

template <typename T>
void readOptional(const nlohmann::json& doc, const char* key, T& out) {
  auto it = doc.find(key);
  if (it == doc.end() || it->is_null()) {
    return;
  }
  out = it->get<T>();
}

EngineConfig fromJson(const nlohmann::json& doc) {
  if (!doc.is_object()) {
    throw ConfigError("engine config must be a JSON object");
  }

  EngineConfig config;
  readOptional(doc, "ingest_endpoint", config.ingest_endpoint);
  readOptional(doc, "command_endpoint", config.command_endpoint);
  readOptional(doc, "telemetry_endpoint", config.telemetry_endpoint);
  readOptional(doc, "risk_seed", config.risk_seed);
  readOptional(doc, "leaderboard_default_limit",
               config.leaderboard_default_limit);

  std::string snapshot_path;
  readOptional(doc, "portfolio_snapshot_path", snapshot_path);
  if (!snapshot_path.empty()) {
    config.portfolio_snapshot_path = snapshot_path;
  }
  return config;
}

}  // namespace

EngineConfig parseEngineConfig(const std::string& json_text) {
  try {
    return fromJson(nlohmann::json::parse(json_text));
  } catch (const nlohmann::json::exception& e) {
    throw ConfigError(std::string("invalid engine config: ") + e.what());
  }
}

EngineConfig loadEngineConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigError("cannot open engine config: " + path);
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  return parseEngineConfig(buffer.str());
}

}  // namespace arena
