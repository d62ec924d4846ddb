#pragma once

#include "arena/analytics/round_analytics_engine.hpp"
#include "arena/concurrent/event_loop_thread.hpp"
#include "arena/config/engine_config.hpp"
#include "arena/forecast/trade_impact_forecaster.hpp"
#include "arena/health/regression_detector.hpp"
#include "arena/leaderboard/leaderboard_engine.hpp"
#include "arena/network/ipc_server.hpp"
#include "arena/risk/in_memory_portfolio_store.hpp"
#include "arena/risk/portfolio_risk_analyzer.hpp"
#include "arena/time/i_time_provider.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <memory>
#include <string>
#include <vector>

namespace arena {

// -----------------------------------------------------------------------------
// BenchmarkEngine
// -----------------------------------------------------------------------------
//
// @brief  Programmatic root of the benchmark server. Owns the five analytic
//         components, the ingest event loop and the IPC server.
//
// @details
// Write path (ingest loop thread, single writer):
//
//   AgentRegisteredEvent    -> LeaderboardEngine::registerAgent
//   RoundCompletedEvent     -> RoundAnalyticsEngine::analyzeRound
//                              (+ RoundAnalyzedEvent telemetry)
//   ScoreRecordedEvent      -> LeaderboardEngine::recordScore
//   HealthSnapshotEvent     -> RegressionDetector::recordBenchmarkHealthSnapshot
//                              (+ one RegressionAlertEvent per new alert)
//   ForecastRegisteredEvent -> TradeImpactForecaster::registerForecast
//   PriceResolvedEvent      -> resolveForecast / batchResolvePending
//   MarketReturnEvent       -> PortfolioRiskAnalyzer::recordMarketReturn
//
// Telemetry events are pushed back onto the same loop so that external
// subscribers (tests, the IPC bridge) observe them in order after the write
// that produced them.
//
// Read path (IPC thread): executeCommand() answers JSON queries using the
// components' shared-lock readers. RISK and LEADERBOARD also write (value
// history, stored ranks); both components synchronize internally.
//
// Thread layout:
//   ingest loop thread   -> every write above
//   ipc thread           -> executeCommand(), telemetry PUB
//   caller thread        -> IngestGateway::run() (see main.cpp)
//
// Ownership:
//   BenchmarkEngine
//    ├── clock_               (const ITimeProvider& - non-owning)
//    ├── config_              (EngineConfig - value)
//    ├── store_               (InMemoryPortfolioStore - value)
//    ├── analytics_, risk_, leaderboard_, regression_, forecaster_
//    │                        (unique_ptr, created in the constructor)
//    ├── ingest_loop_         (EventLoopThread - value)
//    └── ipc_server_          (unique_ptr<IpcServer>, created in start())
//
// Components outlive both threads: start() creates threads, stop() joins
// them, and components are only destroyed with the engine.
// -----------------------------------------------------------------------------
class BenchmarkEngine {
 public:
  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @param  clock   Time source shared by every component. Must outlive the
  //                 engine.
  // @param  config  Endpoints and limits. Empty command/telemetry endpoints
  //                 disable the IpcServer.
  //
  // @throws StorageError if config.portfolio_snapshot_path cannot be loaded.
  // -------------------------------------------------------------------------
  explicit BenchmarkEngine(const ITimeProvider& clock,
                           EngineConfig config = EngineConfig{});

  ~BenchmarkEngine();

  BenchmarkEngine(const BenchmarkEngine&) = delete;
  BenchmarkEngine& operator=(const BenchmarkEngine&) = delete;
  BenchmarkEngine(BenchmarkEngine&&) = delete;
  BenchmarkEngine& operator=(BenchmarkEngine&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  // Subscribes the components to the ingest bus, starts the ingest loop and
  // (if configured) binds the IpcServer. Idempotent.
  // -------------------------------------------------------------------------
  void start();

  // -------------------------------------------------------------------------
  // stop()
  // -------------------------------------------------------------------------
  // Drains and joins the ingest loop, then stops the IpcServer so the final
  // telemetry is still published. Idempotent; start() may follow.
  // -------------------------------------------------------------------------
  void stop();

  // Enqueues one event on the ingest loop. Safe from any thread.
  void pushEvent(Event event);

  // -------------------------------------------------------------------------
  // executeCommand(cmd)
  // -------------------------------------------------------------------------
  // @brief  Answers one IPC request with a JSON document.
  //
  // @param  cmd  Either a bare command word ("PING", "STATUS", "HEALTH",
  //              "ALERTS", "IMPACT_ALL", "RISK_STATS", "ANALYTICS_STATUS",
  //              ...) or a JSON object {"cmd": NAME, ...params}.
  //
  // @return {"status":"ok","response":...} or
  //         {"status":"error","response":"<reason>"}.
  //
  // Thread-safety: Safe from any thread; never throws for bad input.
  // -------------------------------------------------------------------------
  std::string executeCommand(const std::string& cmd);

  // Subscribers run on the ingest loop thread.
  EventBus& ingestEventBus();

  // Direct component access for embedding and tests.
  RoundAnalyticsEngine& analytics() { return *analytics_; }
  PortfolioRiskAnalyzer& riskAnalyzer() { return *risk_; }
  LeaderboardEngine& leaderboard() { return *leaderboard_; }
  RegressionDetector& regressionDetector() { return *regression_; }
  TradeImpactForecaster& forecaster() { return *forecaster_; }
  InMemoryPortfolioStore& portfolioStore() { return store_; }

  bool isRunning() const { return running_.load(); }

 private:
  void onRoundCompleted(const RoundCompletedEvent& e);
  void onScoreRecorded(const ScoreRecordedEvent& e);
  void onHealthSnapshot(const HealthSnapshotEvent& e);
  void onPriceResolved(const PriceResolvedEvent& e);

  nlohmann::json dispatchCommand(const std::string& name,
                                 const nlohmann::json& params);

  const ITimeProvider& clock_;
  EngineConfig config_;

  InMemoryPortfolioStore store_;

  std::unique_ptr<RoundAnalyticsEngine> analytics_;
  std::unique_ptr<PortfolioRiskAnalyzer> risk_;
  std::unique_ptr<LeaderboardEngine> leaderboard_;
  std::unique_ptr<RegressionDetector> regression_;
  std::unique_ptr<TradeImpactForecaster> forecaster_;

  EventLoopThread ingest_loop_;
  std::vector<EventBus::SubscriptionId> subscriptions_;

  std::unique_ptr<IpcServer> ipc_server_;

  std::atomic<bool> running_{false};
};

}  // namespace arena
