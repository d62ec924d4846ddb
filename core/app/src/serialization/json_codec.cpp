#include "arena/serialization/json_codec.hpp"

#include "arena/time/time_utils.hpp"

#include <cmath>
#include <optional>
#include <stdexcept>

namespace arena {

namespace {

using nlohmann::json;

template <typename T>
json optionalJson(const std::optional<T>& value) {
  return value ? json(*value) : json(nullptr);
}

json optionalTime(const std::optional<std::int64_t>& ms) {
  return ms ? json(format_iso8601(*ms)) : json(nullptr);
}

// +/-infinity cannot be represented in JSON numbers.
json finiteOrLabel(double value) {
  if (std::isinf(value)) {
    return value > 0 ? "Infinity" : "-Infinity";
  }
  return value;
}

}  // namespace

namespace domain {

// -----------------------------------------------------------------------------
// Ingest decoding
// -----------------------------------------------------------------------------
TradeAction parseTradeAction(const std::string& text) {
  if (text == "buy") return TradeAction::Buy;
  if (text == "sell") return TradeAction::Sell;
  if (text == "hold") return TradeAction::Hold;
  throw std::invalid_argument("unknown trade action: " + text);
}

LeaderboardWindow parseLeaderboardWindow(const std::string& text) {
  if (text == "all") return LeaderboardWindow::All;
  if (text == "7d") return LeaderboardWindow::SevenDays;
  if (text == "24h") return LeaderboardWindow::TwentyFourHours;
  throw std::invalid_argument("unknown leaderboard window: " + text);
}

void from_json(const json& j, RoundDecision& d) {
  d.agent_id = j.at("agent_id").get<std::string>();
  d.agent_name = j.value("agent_name", d.agent_id);
  d.action = parseTradeAction(j.at("action").get<std::string>());
  d.symbol = j.value("symbol", std::string{});
  d.quantity = j.value("quantity", 0.0);
  d.confidence = j.value("confidence", 0.0);
  d.reasoning = j.value("reasoning", std::string{});
  d.executed = j.value("executed", false);
  if (j.contains("execution_error") && !j["execution_error"].is_null()) {
    d.execution_error = j["execution_error"].get<std::string>();
  }
  if (j.contains("tx_signature") && !j["tx_signature"].is_null()) {
    d.tx_signature = j["tx_signature"].get<std::string>();
  }
  if (j.contains("filled_price") && !j["filled_price"].is_null()) {
    d.filled_price = j["filled_price"].get<double>();
  }
  if (j.contains("usdc_amount") && !j["usdc_amount"].is_null()) {
    d.usdc_amount = j["usdc_amount"].get<double>();
  }
  if (j.contains("duration_ms") && !j["duration_ms"].is_null()) {
    d.duration_ms = j["duration_ms"].get<std::int64_t>();
  }
}

void from_json(const json& j, MarketQuote& q) {
  q.symbol = j.at("symbol").get<std::string>();
  q.price = j.at("price").get<double>();
  if (j.contains("change_24h") && !j["change_24h"].is_null()) {
    q.change_24h = j["change_24h"].get<double>();
  }
}

void from_json(const json& j, BenchmarkHealthSnapshot& s) {
  s.timestamp_ms = j.value("timestamp_ms", std::int64_t{0});
  s.agent_scores = j.value("agent_scores", std::map<std::string, double>{});
  s.pillar_averages =
      j.value("pillar_averages", std::map<std::string, double>{});
  s.coherence_avg = j.at("coherence_avg").get<double>();
  s.hallucination_rate = j.at("hallucination_rate").get<double>();
  s.avg_reasoning_length = j.at("avg_reasoning_length").get<double>();
  s.agent_score_spread = j.at("agent_score_spread").get<double>();
  s.calibration_avg = j.at("calibration_avg").get<double>();
}

// -----------------------------------------------------------------------------
// Round analytics
// -----------------------------------------------------------------------------
void to_json(json& j, const RoundDecision& d) {
  j = json{{"agent_id", d.agent_id},
           {"agent_name", d.agent_name},
           {"action", toString(d.action)},
           {"symbol", d.symbol},
           {"quantity", d.quantity},
           {"confidence", d.confidence},
           {"reasoning", d.reasoning},
           {"executed", d.executed},
           {"execution_error", optionalJson(d.execution_error)},
           {"tx_signature", optionalJson(d.tx_signature)},
           {"filled_price", optionalJson(d.filled_price)},
           {"usdc_amount", optionalJson(d.usdc_amount)},
           {"duration_ms", optionalJson(d.duration_ms)}};
}

void to_json(json& j, const MarketQuote& q) {
  j = json{{"symbol", q.symbol},
           {"price", q.price},
           {"change_24h", optionalJson(q.change_24h)}};
}

namespace {

json moverJson(const std::optional<MarketMover>& m) {
  if (!m) {
    return nullptr;
  }
  return json{{"symbol", m->symbol}, {"change", m->change}};
}

json highlightJson(const std::optional<DecisionHighlight>& h) {
  if (!h) {
    return nullptr;
  }
  return json{{"agent_id", h->agent_id}, {"reason", h->reason}};
}

json roundHighlightJson(const std::optional<RoundHighlight>& h) {
  if (!h) {
    return nullptr;
  }
  return json{{"round_id", h->round_id}, {"score", h->score}, {"reason", h->reason}};
}

}  // namespace

void to_json(json& j, const RoundAnalytics& a) {
  json scores = json::array();
  for (const auto& s : a.quality.agent_scores) {
    scores.push_back({{"agent_id", s.agent_id},
                      {"action", toString(s.action)},
                      {"confidence", s.confidence},
                      {"quality_score", s.quality_score},
                      {"factors",
                       {{"confidence_calibration", s.factors.confidence_calibration},
                        {"execution_success", s.factors.execution_success},
                        {"position_sizing", s.factors.position_sizing},
                        {"timing_score", s.factors.timing_score}}}});
  }

  j = json{
      {"round_id", a.round_id},
      {"timestamp", format_iso8601(a.timestamp_ms)},
      {"analyzed_at", format_iso8601(a.analyzed_at_ms)},
      {"participation",
       {{"total_agents", a.participation.total_agents},
        {"active_agents", a.participation.active_agents},
        {"hold_agents", a.participation.hold_agents},
        {"participation_rate", a.participation.participation_rate},
        {"execution_rate", a.participation.execution_rate}}},
      {"consensus",
       {{"type", toString(a.consensus.type)},
        {"majority_action", optionalJson(a.consensus.majority_action)},
        {"majority_symbol", optionalJson(a.consensus.majority_symbol)},
        {"majority_confidence", a.consensus.majority_confidence},
        {"dissenter_count", a.consensus.dissenter_count},
        {"confidence_spread", a.consensus.confidence_spread}}},
      {"quality",
       {{"agent_scores", scores},
        {"best_decision", highlightJson(a.quality.best_decision)},
        {"worst_decision", highlightJson(a.quality.worst_decision)},
        {"round_quality_score", a.quality.round_quality_score}}},
      {"market_context",
       {{"top_mover", moverJson(a.market_context.top_mover)},
        {"worst_performer", moverJson(a.market_context.worst_performer)},
        {"market_breadth", a.market_context.market_breadth},
        {"avg_volatility", a.market_context.avg_volatility},
        {"sector", a.market_context.sector}}},
      {"metrics",
       {{"total_usdc_traded", a.metrics.total_usdc_traded},
        {"avg_confidence", a.metrics.avg_confidence},
        {"avg_quantity", a.metrics.avg_quantity},
        {"unique_stocks_traded", a.metrics.unique_stocks_traded},
        {"buy_to_sell_ratio", finiteOrLabel(a.metrics.buy_to_sell_ratio)},
        {"round_duration_ms", a.metrics.round_duration_ms}}}};
}

void to_json(json& j, const AgentPerformanceTrend& t) {
  json rounds = json::array();
  for (const auto& r : t.recent_rounds) {
    rounds.push_back({{"round_id", r.round_id},
                      {"action", r.action},
                      {"confidence", r.confidence},
                      {"executed", r.executed},
                      {"quality_score", r.quality_score}});
  }
  j = json{{"agent_id", t.agent_id},
           {"agent_name", t.agent_name},
           {"recent_rounds", rounds},
           {"trend", toString(t.trend)},
           {"trend_score", t.trend_score},
           {"moving_avg_confidence", t.moving_avg_confidence},
           {"moving_avg_quality", t.moving_avg_quality},
           {"current_execution_streak", t.current_execution_streak},
           {"execution_success_rate", t.execution_success_rate}};
}

void to_json(json& j, const AnalyticsSummary& s) {
  json patterns = json::array();
  for (const auto& p : s.patterns) {
    patterns.push_back({{"type", p.type},
                        {"description", p.description},
                        {"significance", toString(p.significance)}});
  }
  j = json{{"generated_at", format_iso8601(s.generated_at_ms)},
           {"total_rounds_analyzed", s.total_rounds_analyzed},
           {"period",
            {{"start", format_iso8601(s.period_start_ms)},
             {"end", format_iso8601(s.period_end_ms)}}},
           {"system",
            {{"avg_participation_rate", s.system.avg_participation_rate},
             {"avg_execution_rate", s.system.avg_execution_rate},
             {"avg_round_quality", s.system.avg_round_quality},
             {"total_usdc_traded", s.system.total_usdc_traded},
             {"unanimous_round_rate", s.system.unanimous_round_rate},
             {"split_round_rate", s.system.split_round_rate}}},
           {"agent_trends", s.agent_trends},
           {"patterns", patterns},
           {"best_round", roundHighlightJson(s.best_round)},
           {"worst_round", roundHighlightJson(s.worst_round)}};
}

void to_json(json& j, const AnalyticsStatus& s) {
  j = json{{"total_rounds_analyzed", s.total_rounds_analyzed},
           {"oldest_round", optionalJson(s.oldest_round)},
           {"newest_round", optionalJson(s.newest_round)},
           {"average_round_quality", s.average_round_quality},
           {"average_participation", s.average_participation}};
}

// -----------------------------------------------------------------------------
// Portfolio risk
// -----------------------------------------------------------------------------
void to_json(json& j, const PortfolioRiskReport& r) {
  json sectors = json::array();
  for (const auto& s : r.sector_concentration) {
    sectors.push_back({{"sector", s.sector},
                       {"symbols", s.symbols},
                       {"allocation", s.allocation},
                       {"value", s.value},
                       {"hhi_contribution", s.hhi_contribution}});
  }
  json positions = json::array();
  for (const auto& p : r.position_risk) {
    positions.push_back({{"symbol", p.symbol},
                         {"weight", p.weight},
                         {"var_contribution", p.var_contribution},
                         {"volatility", p.volatility},
                         {"unrealized_pnl", p.unrealized_pnl},
                         {"max_drawdown", p.max_drawdown},
                         {"risk_level", toString(p.risk_level)}});
  }
  json stress = json::array();
  for (const auto& s : r.stress_tests) {
    json affected = json::array();
    for (const auto& a : s.affected_positions) {
      affected.push_back({{"symbol", a.symbol}, {"impact", a.impact}});
    }
    stress.push_back({{"scenario", s.scenario},
                      {"description", s.description},
                      {"portfolio_impact", s.portfolio_impact},
                      {"portfolio_impact_percent", s.portfolio_impact_percent},
                      {"new_portfolio_value", s.new_portfolio_value},
                      {"affected_positions", affected}});
  }
  const auto& d = r.drawdown;
  j = json{{"agent_id", r.agent_id},
           {"var95", r.var95},
           {"var95_dollar", r.var95_dollar},
           {"cvar95", r.cvar95},
           {"cvar95_dollar", r.cvar95_dollar},
           {"beta", r.beta},
           {"sector_concentration", sectors},
           {"position_risk", positions},
           {"drawdown",
            {{"current_drawdown", d.current_drawdown},
             {"current_drawdown_percent", d.current_drawdown_percent},
             {"max_drawdown", d.max_drawdown},
             {"max_drawdown_percent", d.max_drawdown_percent},
             {"peak_value", d.peak_value},
             {"trough_value", d.trough_value},
             {"drawdown_duration_hours", d.drawdown_duration_hours},
             {"recovered", d.recovered}}},
           {"stress_tests", stress},
           {"risk_score", r.risk_score},
           {"risk_level", toString(r.risk_level)},
           {"warnings", r.warnings},
           {"generated_at", format_iso8601(r.generated_at_ms)},
           {"portfolio_value", r.portfolio_value}};
}

void to_json(json& j, const RiskAnalyzerStats& s) {
  j = json{{"total_analyses", s.total_analyses},
           {"analyses_by_agent", s.analyses_by_agent},
           {"average_risk_score", s.average_risk_score},
           {"last_analysis_at", optionalTime(s.last_analysis_at_ms)},
           {"critical_alerts", s.critical_alerts}};
}

// -----------------------------------------------------------------------------
// Leaderboard
// -----------------------------------------------------------------------------
void to_json(json& j, const LeaderboardEntry& e) {
  j = json{{"agent_id", e.agent_id},
           {"agent_name", e.agent_name},
           {"model", e.model},
           {"provider", e.provider},
           {"rank", e.rank},
           {"previous_rank", e.previous_rank},
           {"rank_change", e.rank_change},
           {"composite_score", e.composite_score},
           {"grade", e.grade},
           {"metrics",
            {{"pnl_percent", e.metrics.pnl_percent},
             {"sharpe_ratio", e.metrics.sharpe_ratio},
             {"coherence", e.metrics.coherence},
             {"hallucination_rate", e.metrics.hallucination_rate},
             {"discipline_rate", e.metrics.discipline_rate},
             {"calibration_score", e.metrics.calibration_score},
             {"win_rate", e.metrics.win_rate}}},
           {"ratings",
            {{"elo", e.ratings.elo},
             {"glicko_rating", e.ratings.glicko_rating},
             {"glicko_deviation", e.ratings.glicko_deviation},
             {"glicko_volatility", e.ratings.glicko_volatility}}},
           {"stats",
            {{"total_trades", e.stats.total_trades},
             {"trades_last_24h", e.stats.trades_last_24h},
             {"trades_last_7d", e.stats.trades_last_7d},
             {"current_streak", e.stats.current_streak},
             {"best_streak", e.stats.best_streak}}},
           {"trend",
            {{"direction", toString(e.trend.direction)},
             {"composite_change_7d", e.trend.composite_change_7d},
             {"elo_change_7d", e.trend.elo_change_7d}}},
           {"is_external", e.is_external}};
}

void to_json(json& j, const LeaderboardSnapshot& s) {
  j = json{{"timestamp", format_iso8601(s.timestamp_ms)},
           {"time_window", toString(s.window)},
           {"entries", s.entries},
           {"metadata",
            {{"total_agents", s.metadata.total_agents},
             {"total_trades", s.metadata.total_trades},
             {"avg_composite", s.metadata.avg_composite},
             {"top_agent", s.metadata.top_agent},
             {"methodology_version", s.metadata.methodology_version}}}};
}

void to_json(json& j, const AgentLeaderboardDetail& d) {
  const auto& st = d.state;
  json recent = json::array();
  for (const auto& s : d.recent_scores) {
    recent.push_back({{"score", s.score},
                      {"timestamp", format_iso8601(s.timestamp_ms)}});
  }
  j = json{{"agent_id", st.agent_id},
           {"agent_name", st.agent_name},
           {"model", st.model},
           {"provider", st.provider},
           {"is_external", st.is_external},
           {"current_composite", st.current_composite},
           {"total_scores", st.composite_scores.size()},
           {"elo", st.elo},
           {"glicko",
            {{"rating", st.glicko_rating},
             {"deviation", st.glicko_deviation},
             {"volatility", st.glicko_volatility}}},
           {"current_streak", st.current_streak},
           {"best_streak", st.best_streak},
           {"previous_rank", st.previous_rank},
           {"recent_scores", recent},
           {"percentile_rank", d.percentile_rank}};
}

// -----------------------------------------------------------------------------
// Benchmark health
// -----------------------------------------------------------------------------
void to_json(json& j, const BenchmarkHealthSnapshot& s) {
  j = json{{"timestamp", format_iso8601(s.timestamp_ms)},
           {"agent_scores", s.agent_scores},
           {"pillar_averages", s.pillar_averages},
           {"coherence_avg", s.coherence_avg},
           {"hallucination_rate", s.hallucination_rate},
           {"avg_reasoning_length", s.avg_reasoning_length},
           {"agent_score_spread", s.agent_score_spread},
           {"calibration_avg", s.calibration_avg}};
}

void to_json(json& j, const RegressionAlert& a) {
  j = json{{"id", a.id},
           {"type", toString(a.type)},
           {"severity", toString(a.severity)},
           {"description", a.description},
           {"metric", a.metric},
           {"expected_range", {{"min", a.expected_min}, {"max", a.expected_max}}},
           {"actual_value", a.actual_value},
           {"recommendation", a.recommendation},
           {"timestamp", format_iso8601(a.timestamp_ms)}};
}

void to_json(json& j, const BenchmarkHealthReport& r) {
  j = json{{"overall_health", r.overall_health},
           {"status", toString(r.status)},
           {"active_alerts", r.active_alerts},
           {"snapshot_count", r.snapshot_count},
           {"dimensions",
            {{"scoring_stability", r.dimensions.scoring_stability},
             {"pillar_balance", r.dimensions.pillar_balance},
             {"agent_diversity", r.dimensions.agent_diversity},
             {"data_freshness", r.dimensions.data_freshness},
             {"calibration_quality", r.dimensions.calibration_quality}}},
           {"recommendations", r.recommendations},
           {"trend", toString(r.trend)},
           {"last_updated", format_iso8601(r.last_updated_ms)}};
}

// -----------------------------------------------------------------------------
// Impact forecasts
// -----------------------------------------------------------------------------
void to_json(json& j, const TradeImpactForecast& f) {
  j = json{{"forecast_id", f.forecast_id},
           {"agent_id", f.agent_id},
           {"round_id", f.round_id},
           {"symbol", f.symbol},
           {"action", f.action},
           {"confidence", f.confidence},
           {"predicted_direction", toString(f.predicted_direction)},
           {"predicted_magnitude", optionalJson(f.predicted_magnitude)},
           {"predicted_horizon", optionalJson(f.predicted_horizon)},
           {"actual_direction",
            f.actual_direction ? json(toString(*f.actual_direction)) : json(nullptr)},
           {"actual_magnitude", optionalJson(f.actual_magnitude)},
           {"direction_correct", optionalJson(f.direction_correct)},
           {"magnitude_error", optionalJson(f.magnitude_error)},
           {"status", toString(f.status)},
           {"created_at", format_iso8601(f.created_at_ms)},
           {"resolved_at", optionalTime(f.resolved_at_ms)}};
}

void to_json(json& j, const AgentImpactProfile& p) {
  json buckets = json::array();
  for (const auto& b : p.confidence_buckets) {
    buckets.push_back({{"range", b.range},
                       {"count", b.count},
                       {"direction_accuracy", b.direction_accuracy},
                       {"avg_magnitude_error", b.avg_magnitude_error}});
  }
  j = json{{"agent_id", p.agent_id},
           {"total_forecasts", p.total_forecasts},
           {"resolved_forecasts", p.resolved_forecasts},
           {"direction_accuracy", p.direction_accuracy},
           {"avg_magnitude_error", p.avg_magnitude_error},
           {"conviction_correlation", p.conviction_correlation},
           {"horizon_usage_rate", p.horizon_usage_rate},
           {"learning_velocity", p.learning_velocity},
           {"best_symbol", p.best_symbol},
           {"worst_symbol", p.worst_symbol},
           {"streak_info",
            {{"current_streak", p.streak_info.current_streak},
             {"current_streak_type", toString(p.streak_info.current_streak_type)},
             {"longest_win_streak", p.streak_info.longest_win_streak},
             {"longest_loss_streak", p.streak_info.longest_loss_streak}}},
           {"confidence_buckets", buckets},
           {"composite_score", p.composite_score}};
}

void to_json(json& j, const ImpactStats& s) {
  j = json{{"total_forecasts", s.total_forecasts},
           {"resolved_forecasts", s.resolved_forecasts},
           {"pending_forecasts", s.pending_forecasts},
           {"overall_direction_accuracy", s.overall_direction_accuracy},
           {"avg_magnitude_error", s.avg_magnitude_error},
           {"horizon_usage_rate", s.horizon_usage_rate}};
}

}  // namespace domain

// -----------------------------------------------------------------------------
// decodeIngestMessage(): dispatch on "type"
// -----------------------------------------------------------------------------
Event decodeIngestMessage(const json& message) {
  const std::string type = message.at("type").get<std::string>();

  if (type == "agent_registered") {
    AgentRegisteredEvent e;
    e.agent_id = message.at("agent_id").get<std::string>();
    e.agent_name = message.value("agent_name", e.agent_id);
    e.model = message.value("model", std::string{});
    e.provider = message.value("provider", std::string{});
    e.is_external = message.value("is_external", false);
    return e;
  }
  if (type == "round_completed") {
    RoundCompletedEvent e;
    e.round_id = message.at("round_id").get<std::string>();
    e.timestamp_ms = message.at("timestamp_ms").get<std::int64_t>();
    e.decisions = message.at("decisions").get<std::vector<domain::RoundDecision>>();
    e.market_data = message.value("market_data", std::vector<domain::MarketQuote>{});
    e.round_duration_ms = message.value("round_duration_ms", std::int64_t{0});
    return e;
  }
  if (type == "score_recorded") {
    ScoreRecordedEvent e;
    e.agent_id = message.at("agent_id").get<std::string>();
    e.composite_score = message.at("composite_score").get<double>();
    e.coherence = message.value("coherence", 0.0);
    e.hallucination_detected = message.value("hallucination_detected", false);
    e.discipline_passed = message.value("discipline_passed", true);
    e.calibration = message.value("calibration", 0.0);
    e.pnl = message.value("pnl", 0.0);
    e.is_win = message.value("is_win", false);
    return e;
  }
  if (type == "health_snapshot") {
    HealthSnapshotEvent e;
    e.snapshot = message.at("snapshot").get<domain::BenchmarkHealthSnapshot>();
    return e;
  }
  if (type == "forecast_registered") {
    ForecastRegisteredEvent e;
    e.agent_id = message.at("agent_id").get<std::string>();
    e.round_id = message.at("round_id").get<std::string>();
    e.symbol = message.at("symbol").get<std::string>();
    e.action = message.at("action").get<std::string>();
    e.reasoning = message.value("reasoning", std::string{});
    e.confidence = message.value("confidence", 0.0);
    return e;
  }
  if (type == "price_resolved") {
    PriceResolvedEvent e;
    e.symbol = message.at("symbol").get<std::string>();
    e.price_change = message.at("price_change").get<double>();
    if (message.contains("forecast_id") && !message["forecast_id"].is_null()) {
      e.forecast_id = message["forecast_id"].get<std::string>();
    }
    return e;
  }
  if (type == "market_return") {
    MarketReturnEvent e;
    e.return_percent = message.at("return_percent").get<double>();
    return e;
  }
  throw std::invalid_argument("unknown ingest message type: " + type);
}

// -----------------------------------------------------------------------------
// encodeTelemetry()
// -----------------------------------------------------------------------------
json encodeTelemetry(const Event& event) {
  if (const auto* e = std::get_if<RoundAnalyzedEvent>(&event)) {
    const auto& a = e->analytics;
    return json{{"type", "round_analyzed"},
                {"round_id", a.round_id},
                {"timestamp", format_iso8601(a.timestamp_ms)},
                {"active_agents", a.participation.active_agents},
                {"total_agents", a.participation.total_agents},
                {"consensus", domain::toString(a.consensus.type)},
                {"round_quality_score", a.quality.round_quality_score},
                {"total_usdc_traded", a.metrics.total_usdc_traded}};
  }
  if (const auto* e = std::get_if<RegressionAlertEvent>(&event)) {
    json j = e->alert;
    j["type"] = "regression_alert";
    j["regression_type"] = domain::toString(e->alert.type);
    return j;
  }
  return nullptr;
}

}  // namespace arena
