// =============================================================================
// benchmark_engine_test.cpp
// =============================================================================
// Unit tests for arena::BenchmarkEngine.
//
// Validates:
//   - Lifecycle: start() / stop() / destructor, idempotent start and stop,
//     restart without duplicate handlers
//   - pushEvent() drives each component through the ingest loop
//   - Derived events (RoundAnalyzedEvent, RegressionAlertEvent) reach
//     external subscribers
//   - executeCommand(): bare and JSON commands, error responses
//
// Design: Each test creates its own BenchmarkEngine with the command and
// telemetry endpoints empty, so no ZeroMQ sockets are opened. stop() drains
// the ingest queue, which makes component state deterministic afterwards.
// =============================================================================

#include "arena/engine/benchmark_engine.hpp"
#include "arena/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <zmq.hpp>

#include <atomic>
#include <chrono>
#include <future>
#include <string>
#include <thread>

using arena::BenchmarkEngine;
using arena::EngineConfig;
using nlohmann::json;

namespace {

EngineConfig offlineConfig() {
  EngineConfig config;
  config.ingest_endpoint.clear();
  config.command_endpoint.clear();
  config.telemetry_endpoint.clear();
  config.risk_seed = 7;
  return config;
}

arena::domain::RoundDecision decision(const std::string& agent,
                                      arena::domain::TradeAction action,
                                      double confidence) {
  arena::domain::RoundDecision d;
  d.agent_id = agent;
  d.agent_name = agent;
  d.action = action;
  d.symbol = "AAPLx";
  d.quantity = 100.0;
  d.confidence = confidence;
  d.reasoning = "test";
  d.executed = action != arena::domain::TradeAction::Hold;
  return d;
}

arena::RoundCompletedEvent makeRound(const std::string& round_id,
                                     std::int64_t timestamp_ms) {
  arena::RoundCompletedEvent e;
  e.round_id = round_id;
  e.timestamp_ms = timestamp_ms;
  e.decisions = {decision("a", arena::domain::TradeAction::Buy, 0.8),
                 decision("b", arena::domain::TradeAction::Buy, 0.7),
                 decision("c", arena::domain::TradeAction::Hold, 0.5)};
  e.market_data = {{"AAPLx", 190.0, 1.5}};
  e.round_duration_ms = 1200;
  return e;
}

arena::ScoreRecordedEvent makeScore(const std::string& agent, double composite) {
  arena::ScoreRecordedEvent e;
  e.agent_id = agent;
  e.composite_score = composite;
  e.coherence = 0.8;
  e.calibration = 0.7;
  return e;
}

}  // namespace

class BenchmarkEngineTestFixture : public ::testing::Test {
 protected:
  arena::SimulationTimeProvider sim_clock{1'700'000'000'000};

  static json run(BenchmarkEngine& engine, const std::string& cmd) {
    return json::parse(engine.executeCommand(cmd));
  }
};

// -----------------------------------------------------------------------------
// 1. A completed round is analyzed on the ingest loop and republished as a
//    RoundAnalyzedEvent.
// -----------------------------------------------------------------------------
TEST_F(BenchmarkEngineTestFixture, RoundPipelineEndToEnd) {
  BenchmarkEngine engine(sim_clock, offlineConfig());

  std::promise<arena::RoundAnalyzedEvent> promise;
  auto future = promise.get_future();
  engine.ingestEventBus().subscribe<arena::RoundAnalyzedEvent>(
      [&promise](const arena::RoundAnalyzedEvent& e) { promise.set_value(e); });

  engine.start();
  engine.pushEvent(makeRound("r-1", sim_clock.now_ms()));

  ASSERT_EQ(future.wait_for(std::chrono::seconds(2)),
            std::future_status::ready)
      << "Timed out - round was not analyzed";

  auto analyzed = future.get();
  EXPECT_EQ(analyzed.analytics.round_id, "r-1");
  EXPECT_EQ(analyzed.analytics.participation.total_agents, 3);
  EXPECT_EQ(analyzed.analytics.participation.active_agents, 2);

  engine.stop();
  ASSERT_TRUE(engine.analytics().getRoundAnalytics("r-1").has_value());
}

// -----------------------------------------------------------------------------
// 2. Registration and scores reach the leaderboard; scores for unknown
//    agents are dropped.
// -----------------------------------------------------------------------------
TEST_F(BenchmarkEngineTestFixture, ScoresReachLeaderboard) {
  BenchmarkEngine engine(sim_clock, offlineConfig());
  engine.start();

  engine.pushEvent(arena::AgentRegisteredEvent{"a", "Alpha", "m1", "p1", false});
  engine.pushEvent(arena::AgentRegisteredEvent{"b", "Beta", "m2", "p2", false});
  engine.pushEvent(makeScore("a", 0.9));
  engine.pushEvent(makeScore("b", 0.4));
  engine.pushEvent(makeScore("ghost", 1.0));
  engine.stop();

  EXPECT_EQ(engine.leaderboard().agentCount(), 2u);
  auto board = engine.leaderboard().getLeaderboard();
  ASSERT_EQ(board.entries.size(), 2u);
  EXPECT_EQ(board.entries[0].agent_id, "a");
  EXPECT_EQ(board.entries[1].agent_id, "b");
}

// -----------------------------------------------------------------------------
// 3. Forecasts are registered and resolved, both by id and by symbol.
// -----------------------------------------------------------------------------
TEST_F(BenchmarkEngineTestFixture, ForecastLifecycle) {
  BenchmarkEngine engine(sim_clock, offlineConfig());
  engine.start();

  engine.pushEvent(arena::ForecastRegisteredEvent{
      "a", "r-1", "AAPLx", "buy", "bullish, 3% upside this week", 0.8});
  engine.pushEvent(arena::ForecastRegisteredEvent{
      "b", "r-1", "AAPLx", "sell", "bearish", 0.6});
  engine.pushEvent(arena::ForecastRegisteredEvent{
      "a", "r-1", "MSFTx", "buy", "", 0.5});

  arena::PriceResolvedEvent by_id;
  by_id.symbol = "MSFTx";
  by_id.price_change = 0.01;
  by_id.forecast_id = "fcst_3";
  engine.pushEvent(by_id);

  arena::PriceResolvedEvent by_symbol;
  by_symbol.symbol = "AAPLx";
  by_symbol.price_change = 0.02;
  engine.pushEvent(by_symbol);
  engine.stop();

  auto stats = engine.forecaster().getImpactStats();
  EXPECT_EQ(stats.total_forecasts, 3);
  EXPECT_EQ(stats.resolved_forecasts, 3);
  EXPECT_EQ(stats.pending_forecasts, 0);
  EXPECT_NEAR(stats.overall_direction_accuracy, 0.67, 1e-9);
}

// -----------------------------------------------------------------------------
// 4. A hallucination spike in the health feed is republished as an alert.
// -----------------------------------------------------------------------------
TEST_F(BenchmarkEngineTestFixture, RegressionAlertsArePublished) {
  BenchmarkEngine engine(sim_clock, offlineConfig());

  std::promise<arena::RegressionAlertEvent> promise;
  auto future = promise.get_future();
  std::atomic<bool> delivered{false};
  engine.ingestEventBus().subscribe<arena::RegressionAlertEvent>(
      [&](const arena::RegressionAlertEvent& e) {
        if (e.alert.type == arena::domain::RegressionType::HallucinationSpike &&
            !delivered.exchange(true)) {
          promise.set_value(e);
        }
      });

  engine.start();
  for (int i = 0; i < 30; ++i) {
    arena::HealthSnapshotEvent e;
    e.snapshot.timestamp_ms = sim_clock.now_ms() + i * 60'000;
    e.snapshot.agent_scores = {{"a", 0.6}, {"b", 0.5}, {"c", 0.4}};
    e.snapshot.pillar_averages = {{"financial", 0.6}, {"reasoning", 0.55}};
    e.snapshot.coherence_avg = 0.6;
    e.snapshot.hallucination_rate = i < 20 ? 0.05 : 0.4;
    e.snapshot.avg_reasoning_length = 100.0;
    e.snapshot.agent_score_spread = 0.08;
    e.snapshot.calibration_avg = 0.7;
    engine.pushEvent(e);
  }

  ASSERT_EQ(future.wait_for(std::chrono::seconds(2)),
            std::future_status::ready)
      << "Timed out - no hallucination alert";
  EXPECT_EQ(future.get().alert.severity, arena::domain::AlertSeverity::High);

  engine.stop();
  EXPECT_FALSE(engine.regressionDetector().getActiveAlerts().empty());
}

// -----------------------------------------------------------------------------
// 5. Command surface: bare words, JSON objects and error responses.
// -----------------------------------------------------------------------------
TEST_F(BenchmarkEngineTestFixture, ExecuteCommand) {
  BenchmarkEngine engine(sim_clock, offlineConfig());
  engine.start();
  engine.pushEvent(arena::AgentRegisteredEvent{"a", "Alpha", "m", "p", false});
  engine.pushEvent(makeScore("a", 0.8));
  engine.pushEvent(makeRound("r-1", sim_clock.now_ms()));
  engine.stop();

  auto ping = run(engine, "PING");
  EXPECT_EQ(ping["status"], "ok");
  EXPECT_EQ(ping["response"], "PONG");

  auto status = run(engine, "STATUS");
  EXPECT_EQ(status["response"]["running"], false);
  EXPECT_EQ(status["response"]["agents"], 1);
  EXPECT_EQ(status["response"]["rounds_analyzed"], 1);
  EXPECT_EQ(status["response"]["commands_served"], 0);

  auto round = run(engine, R"({"cmd": "ROUND", "round_id": "r-1"})");
  EXPECT_EQ(round["status"], "ok");
  EXPECT_EQ(round["response"]["round_id"], "r-1");

  auto missing = run(engine, R"({"cmd": "ROUND", "round_id": "r-404"})");
  EXPECT_EQ(missing["status"], "error");
  EXPECT_EQ(missing["response"], "Round not found: r-404");

  auto board = run(engine, R"({"cmd": "LEADERBOARD", "window": "7d"})");
  EXPECT_EQ(board["status"], "ok");
  EXPECT_EQ(board["response"]["time_window"], "7d");
  EXPECT_EQ(board["response"]["entries"].size(), 1u);

  auto bad_window = run(engine, R"({"cmd": "LEADERBOARD", "window": "1y"})");
  EXPECT_EQ(bad_window["status"], "error");

  auto risk = run(engine, R"({"cmd": "RISK", "agent_id": "a",
                               "portfolio_value": 10000, "cash_balance": 10000})");
  EXPECT_EQ(risk["status"], "ok");
  EXPECT_EQ(risk["response"]["agent_id"], "a");

  auto stats = run(engine, "IMPACT_STATS");
  EXPECT_EQ(stats["response"]["total_forecasts"], 0);

  auto unknown = run(engine, "LAUNCH_ROCKETS");
  EXPECT_EQ(unknown["status"], "error");
  EXPECT_EQ(unknown["response"], "Unknown command: LAUNCH_ROCKETS");

  auto malformed = run(engine, "{\"cmd\": ");
  EXPECT_EQ(malformed["status"], "error");

  auto missing_param = run(engine, R"({"cmd": "AGENT_DETAIL"})");
  EXPECT_EQ(missing_param["status"], "error");
}

// -----------------------------------------------------------------------------
// 6. Idempotent start: calling start() twice must not spawn extra threads
//    or duplicate handlers.
// -----------------------------------------------------------------------------
TEST_F(BenchmarkEngineTestFixture, IdempotentStart) {
  BenchmarkEngine engine(sim_clock, offlineConfig());

  EXPECT_NO_FATAL_FAILURE(engine.start());
  EXPECT_NO_FATAL_FAILURE(engine.start());
  EXPECT_TRUE(engine.isRunning());

  engine.pushEvent(makeRound("r-1", sim_clock.now_ms()));
  engine.stop();
  EXPECT_EQ(engine.analytics().getAnalyticsStatus().total_rounds_analyzed, 1);
}

// -----------------------------------------------------------------------------
// 7. Idempotent stop: stop() without start(), and stop() twice.
// -----------------------------------------------------------------------------
TEST_F(BenchmarkEngineTestFixture, IdempotentStop) {
  BenchmarkEngine engine(sim_clock, offlineConfig());
  EXPECT_NO_FATAL_FAILURE(engine.stop());

  engine.start();
  EXPECT_NO_FATAL_FAILURE(engine.stop());
  EXPECT_NO_FATAL_FAILURE(engine.stop());
  EXPECT_FALSE(engine.isRunning());
}

// -----------------------------------------------------------------------------
// 8. Restart: handlers are re-attached exactly once.
// Why: a duplicate subscription would record every score twice.
// -----------------------------------------------------------------------------
TEST_F(BenchmarkEngineTestFixture, RestartDoesNotDuplicateHandlers) {
  BenchmarkEngine engine(sim_clock, offlineConfig());
  engine.start();
  engine.pushEvent(arena::AgentRegisteredEvent{"a", "Alpha", "m", "p", false});
  engine.stop();

  engine.start();
  engine.pushEvent(makeScore("a", 0.8));
  engine.stop();

  auto detail = engine.leaderboard().getAgentLeaderboardDetail("a");
  ASSERT_TRUE(detail.has_value());
  EXPECT_EQ(detail->recent_scores.size(), 1u);
}

// -----------------------------------------------------------------------------
// 9. RAII: the destructor stops the ingest loop without an explicit stop().
// -----------------------------------------------------------------------------
TEST_F(BenchmarkEngineTestFixture, DestructorStopsThreads) {
  {
    BenchmarkEngine engine(sim_clock, offlineConfig());
    engine.start();
    engine.pushEvent(makeRound("r-1", sim_clock.now_ms()));
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
  }
  SUCCEED();
}

// -----------------------------------------------------------------------------
// 10. stop() while a client keeps querying STATUS over the REP socket.
// Why: STATUS reads the IPC server's counters from the IPC thread, so the
//      server must be joined before it is released.
// -----------------------------------------------------------------------------
TEST_F(BenchmarkEngineTestFixture, StopWhileServingStatusQueries) {
  EngineConfig config = offlineConfig();
  config.command_endpoint = "tcp://127.0.0.1:59601";
  config.telemetry_endpoint = "tcp://127.0.0.1:59602";
  BenchmarkEngine engine(sim_clock, config);
  engine.start();

  std::promise<void> first_reply;
  auto first_reply_future = first_reply.get_future();
  std::atomic<int> replies{0};

  std::thread client([&] {
    zmq::context_t ctx{1};
    zmq::socket_t req{ctx, zmq::socket_type::req};
    req.set(zmq::sockopt::rcvtimeo, 500);
    req.set(zmq::sockopt::linger, 0);
    req.connect(config.command_endpoint);

    while (true) {
      req.send(zmq::str_buffer("STATUS"), zmq::send_flags::none);
      zmq::message_t reply;
      if (!req.recv(reply, zmq::recv_flags::none)) {
        break;  // server gone
      }
      const auto body = json::parse(reply.to_string());
      EXPECT_EQ(body["status"], "ok");
      if (replies.fetch_add(1) == 0) {
        first_reply.set_value();
      }
    }
  });

  const bool answered = first_reply_future.wait_for(std::chrono::seconds(2)) ==
                        std::future_status::ready;
  engine.stop();
  client.join();

  ASSERT_TRUE(answered) << "Timed out - no STATUS reply over IPC";
  EXPECT_GE(replies.load(), 1);
  EXPECT_FALSE(engine.isRunning());
  auto status = run(engine, "STATUS");
  EXPECT_EQ(status["response"]["commands_served"], 0);
}
