#pragma once

#include "arena/domain/health.hpp"
#include "arena/domain/round.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace arena {

// -----------------------------------------------------------------------------
// Ingest events (Orchestrator -> engine)
// -----------------------------------------------------------------------------
// Decoded by the IngestGateway from the wire and pushed into the engine's
// ingest loop. Each maps one-to-one onto a component write operation.
// -----------------------------------------------------------------------------

struct AgentRegisteredEvent {
  std::string agent_id;
  std::string agent_name;
  std::string model;
  std::string provider;
  bool is_external{false};
};

// A finished trading round, fed to the Round Analytics Engine.
struct RoundCompletedEvent {
  std::string round_id;
  std::int64_t timestamp_ms{0};
  std::vector<domain::RoundDecision> decisions;
  std::vector<domain::MarketQuote> market_data;
  std::int64_t round_duration_ms{0};
};

struct ScoreRecordedEvent {
  std::string agent_id;
  double composite_score{0.0};
  double coherence{0.0};
  bool hallucination_detected{false};
  bool discipline_passed{true};
  double calibration{0.0};
  double pnl{0.0};
  bool is_win{false};
};

struct HealthSnapshotEvent {
  domain::BenchmarkHealthSnapshot snapshot;
};

// Emitted at decision time so the reasoning can be turned into a forecast.
struct ForecastRegisteredEvent {
  std::string agent_id;
  std::string round_id;
  std::string symbol;
  std::string action;
  std::string reasoning;
  double confidence{0.0};
};

// Realized price move (fraction) for a symbol. With a forecast_id only that
// forecast is resolved, otherwise every pending forecast for the symbol.
struct PriceResolvedEvent {
  std::string symbol;
  double price_change{0.0};
  std::optional<std::string> forecast_id;
};

// One market-proxy daily return (percent) used for beta estimation.
struct MarketReturnEvent {
  double return_percent{0.0};
};

// -----------------------------------------------------------------------------
// Telemetry events (engine -> PUB socket)
// -----------------------------------------------------------------------------

struct RoundAnalyzedEvent {
  domain::RoundAnalytics analytics;
};

struct RegressionAlertEvent {
  domain::RegressionAlert alert;
};

}  // namespace arena
