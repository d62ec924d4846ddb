#pragma once

#include "arena/domain/forecast.hpp"
#include "arena/domain/health.hpp"
#include "arena/domain/rating.hpp"
#include "arena/domain/risk_report.hpp"
#include "arena/domain/round.hpp"
#include "arena/events/event.hpp"

#include <nlohmann/json.hpp>

#include <string>

// -----------------------------------------------------------------------------
// JSON codec - wire representation of every domain type
// -----------------------------------------------------------------------------
//
// @brief  nlohmann::json adapters (found by ADL) for the engine's outputs,
//         and decoders for the Orchestrator's ingest messages.
//
// @details
// Output conventions:
//   - snake_case keys, enums as their lower-case names (risk levels upper
//     case), timestamps as ISO-8601 UTC strings.
//   - Absent optionals are emitted as null.
//   - buy_to_sell_ratio may be +infinity, which JSON cannot carry; it is
//     emitted as the string "Infinity".
//
// Ingest messages are objects with a "type" discriminator:
//   agent_registered, round_completed, score_recorded, health_snapshot,
//   forecast_registered, price_resolved, market_return
//
// Errors: decoders throw nlohmann::json::exception for missing keys or
// wrong types and std::invalid_argument for unknown discriminators or enum
// values. Callers at the transport boundary catch both.
// -----------------------------------------------------------------------------

namespace arena {
namespace domain {

TradeAction parseTradeAction(const std::string& text);
LeaderboardWindow parseLeaderboardWindow(const std::string& text);

void from_json(const nlohmann::json& j, RoundDecision& d);
void from_json(const nlohmann::json& j, MarketQuote& q);
void from_json(const nlohmann::json& j, BenchmarkHealthSnapshot& s);

void to_json(nlohmann::json& j, const RoundDecision& d);
void to_json(nlohmann::json& j, const MarketQuote& q);
void to_json(nlohmann::json& j, const RoundAnalytics& a);
void to_json(nlohmann::json& j, const AgentPerformanceTrend& t);
void to_json(nlohmann::json& j, const AnalyticsSummary& s);
void to_json(nlohmann::json& j, const AnalyticsStatus& s);

void to_json(nlohmann::json& j, const PortfolioRiskReport& r);
void to_json(nlohmann::json& j, const RiskAnalyzerStats& s);

void to_json(nlohmann::json& j, const LeaderboardEntry& e);
void to_json(nlohmann::json& j, const LeaderboardSnapshot& s);
void to_json(nlohmann::json& j, const AgentLeaderboardDetail& d);

void to_json(nlohmann::json& j, const BenchmarkHealthSnapshot& s);
void to_json(nlohmann::json& j, const RegressionAlert& a);
void to_json(nlohmann::json& j, const BenchmarkHealthReport& r);

void to_json(nlohmann::json& j, const TradeImpactForecast& f);
void to_json(nlohmann::json& j, const AgentImpactProfile& p);
void to_json(nlohmann::json& j, const ImpactStats& s);

}  // namespace domain

// -------------------------------------------------------------------------
// decodeIngestMessage(message)
// -------------------------------------------------------------------------
// @brief  Turns one Orchestrator message into the matching ingest event.
//
// @throws nlohmann::json::exception, std::invalid_argument (see above).
// -------------------------------------------------------------------------
Event decodeIngestMessage(const nlohmann::json& message);

// Telemetry payload for the PUB socket. Ingest events are not telemetry
// and yield a null json.
nlohmann::json encodeTelemetry(const Event& event);

}  // namespace arena
