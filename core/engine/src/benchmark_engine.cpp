#include "arena/engine/benchmark_engine.hpp"

#include "arena/serialization/json_codec.hpp"
#include "arena/time/time_utils.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>

namespace arena {

namespace {

nlohmann::json okResponse(nlohmann::json payload) {
  nlohmann::json response;
  response["status"] = "ok";
  response["response"] = std::move(payload);
  return response;
}

nlohmann::json errorResponse(const std::string& reason) {
  nlohmann::json response;
  response["status"] = "error";
  response["response"] = reason;
  return response;
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
BenchmarkEngine::BenchmarkEngine(const ITimeProvider& clock, EngineConfig config)
    : clock_(clock), config_(std::move(config)) {
  if (config_.portfolio_snapshot_path) {
    store_.loadSnapshot(*config_.portfolio_snapshot_path);
  }

  analytics_ = std::make_unique<RoundAnalyticsEngine>(clock_);
  risk_ = std::make_unique<PortfolioRiskAnalyzer>(store_, clock_,
                                                  config_.risk_seed);
  leaderboard_ = std::make_unique<LeaderboardEngine>(clock_);
  regression_ = std::make_unique<RegressionDetector>(clock_);
  forecaster_ = std::make_unique<TradeImpactForecaster>(clock_);
}

// -----------------------------------------------------------------------------
// Destructor: RAII stop
// -----------------------------------------------------------------------------
BenchmarkEngine::~BenchmarkEngine() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void BenchmarkEngine::start() {
  if (running_) {
    return;
  }

  EventBus& bus = ingest_loop_.eventBus();

  // ---  1) Route ingest events to the component writers --------------------
  subscriptions_.push_back(bus.subscribe<AgentRegisteredEvent>(
      [this](const AgentRegisteredEvent& e) {
        leaderboard_->registerAgent(e.agent_id, e.agent_name, e.model,
                                    e.provider, e.is_external);
      }));
  subscriptions_.push_back(bus.subscribe<RoundCompletedEvent>(
      [this](const RoundCompletedEvent& e) { onRoundCompleted(e); }));
  subscriptions_.push_back(bus.subscribe<ScoreRecordedEvent>(
      [this](const ScoreRecordedEvent& e) { onScoreRecorded(e); }));
  subscriptions_.push_back(bus.subscribe<HealthSnapshotEvent>(
      [this](const HealthSnapshotEvent& e) { onHealthSnapshot(e); }));
  subscriptions_.push_back(bus.subscribe<ForecastRegisteredEvent>(
      [this](const ForecastRegisteredEvent& e) {
        forecaster_->registerForecast(e.agent_id, e.round_id, e.symbol,
                                      e.action, e.reasoning, e.confidence);
      }));
  subscriptions_.push_back(bus.subscribe<PriceResolvedEvent>(
      [this](const PriceResolvedEvent& e) { onPriceResolved(e); }));
  subscriptions_.push_back(bus.subscribe<MarketReturnEvent>(
      [this](const MarketReturnEvent& e) {
        risk_->recordMarketReturn(e.return_percent);
      }));

  // ---  2) Start the ingest loop (spawns the writer thread) ----------------
  ingest_loop_.start();

  // ---  3) Start IpcServer (commands + telemetry) ---------------------------
  if (!config_.command_endpoint.empty() &&
      !config_.telemetry_endpoint.empty()) {
    ipc_server_ = std::make_unique<IpcServer>(
        [this](const std::string& cmd) { return executeCommand(cmd); },
        config_.command_endpoint, config_.telemetry_endpoint);
    ipc_server_->start();

    // Telemetry bridges: ingest loop -> IPC server queue.
    subscriptions_.push_back(bus.subscribe<RoundAnalyzedEvent>(
        [this](const RoundAnalyzedEvent& e) {
          ipc_server_->pushTelemetry(e);
        }));
    subscriptions_.push_back(bus.subscribe<RegressionAlertEvent>(
        [this](const RegressionAlertEvent& e) {
          ipc_server_->pushTelemetry(e);
        }));
  }

  running_ = true;

  std::cout << "[BenchmarkEngine] started. Threads: ingest"
            << (ipc_server_ ? ", ipc" : "") << ".\n";
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void BenchmarkEngine::stop() {
  if (!running_) {
    return;
  }

  // ---  1) Drain and join the ingest loop. Telemetry produced by the last
  //          events still reaches the IPC queue. -----------------------------
  ingest_loop_.stop();

  // ---  2) Join the IPC thread (final telemetry drain) before releasing it.
  //          That thread may be inside executeCommand() reading ipc_server_.
  if (ipc_server_) {
    ipc_server_->stop();
    ipc_server_.reset();
  }

  // ---  3) Detach handlers so a later start() does not double-subscribe ---
  for (auto id : subscriptions_) {
    ingest_loop_.eventBus().unsubscribe(id);
  }
  subscriptions_.clear();

  running_ = false;

  std::cout << "[BenchmarkEngine] stopped. All threads joined.\n";
}

void BenchmarkEngine::pushEvent(Event event) {
  ingest_loop_.push(std::move(event));
}

EventBus& BenchmarkEngine::ingestEventBus() { return ingest_loop_.eventBus(); }

// -----------------------------------------------------------------------------
// Ingest handlers (ingest loop thread)
// -----------------------------------------------------------------------------
void BenchmarkEngine::onRoundCompleted(const RoundCompletedEvent& e) {
  auto analytics = analytics_->analyzeRound(e.round_id, e.timestamp_ms,
                                            e.decisions, e.market_data,
                                            e.round_duration_ms);
  ingest_loop_.push(RoundAnalyzedEvent{std::move(analytics)});
}

void BenchmarkEngine::onScoreRecorded(const ScoreRecordedEvent& e) {
  const bool recorded = leaderboard_->recordScore(
      e.agent_id, e.composite_score, e.coherence, e.hallucination_detected,
      e.discipline_passed, e.calibration, e.pnl, e.is_win);
  if (!recorded) {
    std::cerr << "[BenchmarkEngine] score for unregistered agent "
              << e.agent_id << " ignored\n";
  }
}

void BenchmarkEngine::onHealthSnapshot(const HealthSnapshotEvent& e) {
  for (auto& alert : regression_->recordBenchmarkHealthSnapshot(e.snapshot)) {
    ingest_loop_.push(RegressionAlertEvent{std::move(alert)});
  }
}

void BenchmarkEngine::onPriceResolved(const PriceResolvedEvent& e) {
  if (e.forecast_id) {
    if (!forecaster_->resolveForecast(*e.forecast_id, e.price_change)) {
      std::cerr << "[BenchmarkEngine] forecast " << *e.forecast_id
                << " unknown or already resolved\n";
    }
    return;
  }
  forecaster_->batchResolvePending(e.symbol, e.price_change);
}

// -----------------------------------------------------------------------------
// executeCommand(): handle IPC command requests
// -----------------------------------------------------------------------------
std::string BenchmarkEngine::executeCommand(const std::string& cmd) {
  nlohmann::json response;

  try {
    std::string name = cmd;
    nlohmann::json params = nlohmann::json::object();

    if (!cmd.empty() && cmd.front() == '{') {
      params = nlohmann::json::parse(cmd);
      name = params.at("cmd").get<std::string>();
    }

    response = dispatchCommand(name, params);
  } catch (const nlohmann::json::exception& ex) {
    response = errorResponse(std::string("Malformed command - ") + ex.what());
  } catch (const StorageError& ex) {
    response = errorResponse(std::string("Storage failure - ") + ex.what());
  } catch (const std::invalid_argument& ex) {
    response = errorResponse(ex.what());
  }

  return response.dump();
}

nlohmann::json BenchmarkEngine::dispatchCommand(const std::string& name,
                                                const nlohmann::json& params) {
  // ---  Health and status ---------------------------------------------------
  if (name == "PING") {
    return okResponse("PONG");
  }
  if (name == "STATUS") {
    nlohmann::json status;
    status["running"] = running_.load();
    status["server_time"] = format_iso8601(clock_.now_ms());
    status["pending_events"] = ingest_loop_.pending();
    status["events_dispatched"] = ingest_loop_.dispatched();
    status["events_failed"] = ingest_loop_.failed();
    status["agents"] = leaderboard_->agentCount();
    status["rounds_analyzed"] =
        analytics_->getAnalyticsStatus().total_rounds_analyzed;
    status["health_snapshots"] = regression_->getHealthSnapshotHistory().size();
    status["forecasts"] = forecaster_->getImpactStats().total_forecasts;
    status["commands_served"] =
        ipc_server_ ? ipc_server_->commandsServed() : 0;
    status["telemetry_published"] =
        ipc_server_ ? ipc_server_->telemetryPublished() : 0;
    status["telemetry_dropped"] =
        ipc_server_ ? ipc_server_->telemetryDropped() : 0;
    return okResponse(std::move(status));
  }

  // ---  Round analytics -----------------------------------------------------
  if (name == "ANALYTICS_STATUS") {
    return okResponse(analytics_->getAnalyticsStatus());
  }
  if (name == "ROUND") {
    const auto round_id = params.at("round_id").get<std::string>();
    auto analytics = analytics_->getRoundAnalytics(round_id);
    if (!analytics) {
      return errorResponse("Round not found: " + round_id);
    }
    return okResponse(*analytics);
  }
  if (name == "RECENT_ROUNDS") {
    return okResponse(analytics_->getRecentRoundAnalytics(
        params.value("limit", std::size_t{20})));
  }
  if (name == "TRENDS") {
    return okResponse(analytics_->computeAgentTrends(
        params.value("window_size", std::size_t{20})));
  }
  if (name == "SUMMARY") {
    return okResponse(
        analytics_->generateAnalyticsSummary(params.value("period_days", 7)));
  }

  // ---  Leaderboard ---------------------------------------------------------
  if (name == "LEADERBOARD") {
    const auto window = domain::parseLeaderboardWindow(
        params.value("window", std::string("all")));
    return okResponse(leaderboard_->getLeaderboard(
        window, params.value("include_external", true),
        params.value("limit", config_.leaderboard_default_limit)));
  }
  if (name == "LEADERBOARD_HISTORY") {
    return okResponse(leaderboard_->getLeaderboardHistory(
        params.value("limit", std::size_t{20})));
  }
  if (name == "AGENT_DETAIL") {
    const auto agent_id = params.at("agent_id").get<std::string>();
    auto detail = leaderboard_->getAgentLeaderboardDetail(agent_id);
    if (!detail) {
      return errorResponse("Agent not found: " + agent_id);
    }
    return okResponse(*detail);
  }

  // ---  Portfolio risk ------------------------------------------------------
  if (name == "RISK") {
    return okResponse(risk_->analyzePortfolioRisk(
        params.at("agent_id").get<std::string>(),
        params.at("portfolio_value").get<double>(),
        params.at("cash_balance").get<double>()));
  }
  if (name == "RISK_STATS") {
    return okResponse(risk_->getRiskAnalyzerStats());
  }

  // ---  Benchmark health ----------------------------------------------------
  if (name == "HEALTH") {
    return okResponse(regression_->getBenchmarkHealthReport());
  }
  if (name == "ALERTS") {
    return okResponse(regression_->getActiveAlerts());
  }
  if (name == "HEALTH_HISTORY") {
    return okResponse(regression_->getHealthSnapshotHistory());
  }

  // ---  Trade impact --------------------------------------------------------
  if (name == "IMPACT") {
    return okResponse(forecaster_->getAgentImpactProfile(
        params.at("agent_id").get<std::string>()));
  }
  if (name == "IMPACT_ALL") {
    return okResponse(forecaster_->getAllImpactProfiles());
  }
  if (name == "FORECASTS") {
    std::optional<std::string> agent_id;
    if (params.contains("agent_id")) {
      agent_id = params.at("agent_id").get<std::string>();
    }
    return okResponse(forecaster_->getRecentForecasts(
        params.value("limit", TradeImpactForecaster::kDefaultRecentLimit),
        agent_id));
  }
  if (name == "PENDING_FORECASTS") {
    return okResponse(forecaster_->getPendingForecasts());
  }
  if (name == "IMPACT_STATS") {
    return okResponse(forecaster_->getImpactStats());
  }

  return errorResponse("Unknown command: " + name);
}

}  // namespace arena
