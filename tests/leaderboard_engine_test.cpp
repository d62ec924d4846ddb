// =============================================================================
// leaderboard_engine_test.cpp
// =============================================================================
// Unit tests for arena::LeaderboardEngine.
//
// Validates:
//   - ELO math (symmetric, K = 32) and the grade table
//   - recordScore(): unknown agents rejected, streaks, pairwise ELO,
//     Glicko-2 movement, concurrent writers
//   - getLeaderboard(): ranking, rank change, windows, external filter,
//     limit, rolling metrics, 7-day trend
//   - History ordering and the per-agent detail view
// =============================================================================

#include "arena/leaderboard/leaderboard_engine.hpp"
#include "arena/time/simulation_time_provider.hpp"
#include "arena/time/time_utils.hpp"

#include <gtest/gtest.h>

#include <string>
#include <thread>
#include <vector>

using arena::LeaderboardEngine;
using arena::domain::LeaderboardWindow;

class LeaderboardEngineTest : public ::testing::Test {
 protected:
  arena::SimulationTimeProvider clock{1'700'000'000'000};
  LeaderboardEngine board{clock};

  void registerAgent(const std::string& id, bool external = false) {
    board.registerAgent(id, id + " bot", "model-" + id, "provider", external);
  }

  bool score(const std::string& id, double composite, double pnl = 0.0,
             bool win = false) {
    return board.recordScore(id, composite, 0.8, false, true, 0.7, pnl, win);
  }
};

// -----------------------------------------------------------------------------
// 1. Equal ratings move by K/2 in opposite directions; a draw moves nothing.
// -----------------------------------------------------------------------------
TEST(LeaderboardMath, EloUpdate) {
  auto [win_a, win_b] = LeaderboardEngine::updateElo(1500, 1500, 1.0);
  EXPECT_DOUBLE_EQ(win_a, 1516.0);
  EXPECT_DOUBLE_EQ(win_b, 1484.0);

  auto [draw_a, draw_b] = LeaderboardEngine::updateElo(1500, 1500, 0.5);
  EXPECT_DOUBLE_EQ(draw_a, 1500.0);
  EXPECT_DOUBLE_EQ(draw_b, 1500.0);

  // An upset against a stronger player is worth more than K/2.
  auto [upset_a, upset_b] = LeaderboardEngine::updateElo(1400, 1600, 1.0);
  EXPECT_GT(upset_a - 1400.0, 16.0);
  EXPECT_DOUBLE_EQ(upset_a - 1400.0, 1600.0 - upset_b);
}

// -----------------------------------------------------------------------------
// 2. Grade boundaries are inclusive lower bounds.
// -----------------------------------------------------------------------------
TEST(LeaderboardMath, GradeTable) {
  EXPECT_EQ(LeaderboardEngine::gradeFor(0.97), "A+");
  EXPECT_EQ(LeaderboardEngine::gradeFor(0.95), "A+");
  EXPECT_EQ(LeaderboardEngine::gradeFor(0.901), "A");
  EXPECT_EQ(LeaderboardEngine::gradeFor(0.899), "A-");
  EXPECT_EQ(LeaderboardEngine::gradeFor(0.80), "B+");
  EXPECT_EQ(LeaderboardEngine::gradeFor(0.60), "C");
  EXPECT_EQ(LeaderboardEngine::gradeFor(0.40), "D-");
  EXPECT_EQ(LeaderboardEngine::gradeFor(0.39), "F");
}

// -----------------------------------------------------------------------------
// 3. Scores for unregistered agents are rejected; registration is
//    idempotent.
// -----------------------------------------------------------------------------
TEST_F(LeaderboardEngineTest, UnknownAgentRejected) {
  EXPECT_FALSE(score("ghost", 0.9));

  registerAgent("claude");
  registerAgent("claude");
  EXPECT_EQ(board.agentCount(), 1u);
  EXPECT_TRUE(score("claude", 0.9));
}

// -----------------------------------------------------------------------------
// 3b. Re-registering a scored agent leaves its ratings and history alone.
// -----------------------------------------------------------------------------
TEST_F(LeaderboardEngineTest, ReRegistrationKeepsRatingState) {
  registerAgent("a");
  registerAgent("b");
  score("a", 0.9, 2.0, true);
  score("b", 0.3);
  score("a", 0.8, 1.0, true);

  const auto before = board.getAgentLeaderboardDetail("a");
  ASSERT_TRUE(before.has_value());

  board.registerAgent("a", "Renamed", "other-model", "other", true);

  const auto after = board.getAgentLeaderboardDetail("a");
  ASSERT_TRUE(after.has_value());
  EXPECT_EQ(board.agentCount(), 2u);
  EXPECT_EQ(after->state.agent_name, "a bot");
  EXPECT_EQ(after->state.model, "model-a");
  EXPECT_FALSE(after->state.is_external);
  EXPECT_DOUBLE_EQ(after->state.elo, before->state.elo);
  EXPECT_NE(after->state.elo, 1500.0);
  EXPECT_DOUBLE_EQ(after->state.glicko_rating, before->state.glicko_rating);
  EXPECT_DOUBLE_EQ(after->state.glicko_deviation,
                   before->state.glicko_deviation);
  EXPECT_DOUBLE_EQ(after->state.glicko_volatility,
                   before->state.glicko_volatility);
  EXPECT_EQ(after->state.current_streak, before->state.current_streak);
  EXPECT_EQ(after->state.composite_scores.size(), 2u);
  EXPECT_EQ(after->state.pnl_history.size(), 2u);
  ASSERT_EQ(after->recent_scores.size(), before->recent_scores.size());
  EXPECT_DOUBLE_EQ(after->recent_scores.back().score,
                   before->recent_scores.back().score);
}

// -----------------------------------------------------------------------------
// 4. Pairwise ELO against every already-scored agent.
// -----------------------------------------------------------------------------
TEST_F(LeaderboardEngineTest, PairwiseEloOnRecord) {
  registerAgent("a");
  registerAgent("b");

  score("a", 0.8);  // no scored opponents yet
  score("b", 0.6);  // b loses to a's current 0.8

  auto snap = board.getLeaderboard();
  ASSERT_EQ(snap.entries.size(), 2u);
  EXPECT_EQ(snap.entries[0].agent_id, "a");
  EXPECT_DOUBLE_EQ(snap.entries[0].ratings.elo, 1516.0);
  EXPECT_DOUBLE_EQ(snap.entries[1].ratings.elo, 1484.0);
  EXPECT_EQ(snap.entries[0].grade, "B+");
  EXPECT_EQ(snap.metadata.top_agent, "a");
  EXPECT_EQ(snap.metadata.total_trades, 2);
  EXPECT_DOUBLE_EQ(snap.metadata.avg_composite, 0.7);
}

// -----------------------------------------------------------------------------
// 5. Glicko-2 moves toward the observed score and shrinks the deviation.
// -----------------------------------------------------------------------------
TEST_F(LeaderboardEngineTest, GlickoMovesTowardScore) {
  registerAgent("a");
  registerAgent("b");
  score("a", 1.0);
  score("b", 0.0);

  auto snap = board.getLeaderboard();
  const auto& top = snap.entries[0];
  const auto& bottom = snap.entries[1];
  EXPECT_GT(top.ratings.glicko_rating, 1500.0);
  EXPECT_LT(bottom.ratings.glicko_rating, 1500.0);
  EXPECT_LT(top.ratings.glicko_deviation, 350.0);
  EXPECT_GE(top.ratings.glicko_deviation, 30.0);
  EXPECT_GE(top.ratings.glicko_volatility, 0.01);
}

// -----------------------------------------------------------------------------
// 6. Rank change compares with the rank stored by the previous call.
// -----------------------------------------------------------------------------
TEST_F(LeaderboardEngineTest, RankChangeAcrossCalls) {
  registerAgent("a");
  registerAgent("b");
  score("a", 0.8);
  score("b", 0.6);

  auto first = board.getLeaderboard();
  EXPECT_EQ(first.entries[0].rank_change, 0);

  score("b", 1.0);
  score("b", 1.0);  // b averages 0.867

  auto second = board.getLeaderboard();
  EXPECT_EQ(second.entries[0].agent_id, "b");
  EXPECT_EQ(second.entries[0].previous_rank, 2);
  EXPECT_EQ(second.entries[0].rank_change, 1);
  EXPECT_EQ(second.entries[1].rank_change, -1);
}

// -----------------------------------------------------------------------------
// 7. Streaks count consecutive wins; rolling metrics average the window.
// -----------------------------------------------------------------------------
TEST_F(LeaderboardEngineTest, StreaksAndRollingMetrics) {
  registerAgent("a");
  score("a", 0.7, 1.0, true);
  score("a", 0.7, 2.0, true);
  score("a", 0.7, 3.0, false);
  score("a", 0.7, 2.0, true);

  auto entry = board.getLeaderboard().entries.at(0);
  EXPECT_EQ(entry.stats.current_streak, 1);
  EXPECT_EQ(entry.stats.best_streak, 2);
  EXPECT_EQ(entry.stats.total_trades, 4);
  EXPECT_DOUBLE_EQ(entry.metrics.win_rate, 0.75);
  EXPECT_DOUBLE_EQ(entry.metrics.pnl_percent, 2.0);
  // mean 2 / population sd 0.7071
  EXPECT_DOUBLE_EQ(entry.metrics.sharpe_ratio, 2.83);
  EXPECT_DOUBLE_EQ(entry.metrics.coherence, 0.8);
  EXPECT_DOUBLE_EQ(entry.metrics.discipline_rate, 1.0);
  EXPECT_DOUBLE_EQ(entry.metrics.hallucination_rate, 0.0);
}

// -----------------------------------------------------------------------------
// 8. Sharpe is zero below three samples.
// -----------------------------------------------------------------------------
TEST_F(LeaderboardEngineTest, SharpeNeedsThreeSamples) {
  registerAgent("a");
  score("a", 0.7, 5.0);
  score("a", 0.7, 1.0);

  EXPECT_DOUBLE_EQ(board.getLeaderboard().entries.at(0).metrics.sharpe_ratio,
                   0.0);
}

// -----------------------------------------------------------------------------
// 9. Time windows drop agents with no samples inside the window.
// -----------------------------------------------------------------------------
TEST_F(LeaderboardEngineTest, WindowFiltersStaleAgents) {
  registerAgent("stale");
  registerAgent("fresh");
  score("stale", 0.9);
  clock.advance_by(2 * arena::kMsPerDay);
  score("fresh", 0.5);

  auto day = board.getLeaderboard(LeaderboardWindow::TwentyFourHours);
  ASSERT_EQ(day.entries.size(), 1u);
  EXPECT_EQ(day.entries[0].agent_id, "fresh");
  EXPECT_EQ(day.window, LeaderboardWindow::TwentyFourHours);

  auto all = board.getLeaderboard(LeaderboardWindow::All);
  ASSERT_EQ(all.entries.size(), 2u);
  EXPECT_EQ(all.entries[0].agent_id, "stale");
  EXPECT_EQ(all.entries[0].stats.trades_last_24h, 0);
  EXPECT_EQ(all.entries[0].stats.trades_last_7d, 1);
}

// -----------------------------------------------------------------------------
// 10. A week-over-week rise above 0.03 is an improving trend.
// -----------------------------------------------------------------------------
TEST_F(LeaderboardEngineTest, SevenDayTrend) {
  registerAgent("a");
  score("a", 0.5);
  clock.advance_by(10 * arena::kMsPerDay);
  score("a", 0.8);

  auto entry = board.getLeaderboard().entries.at(0);
  EXPECT_EQ(entry.trend.direction, arena::domain::TrendDirection::Improving);
  EXPECT_DOUBLE_EQ(entry.trend.composite_change_7d, 0.3);
}

// -----------------------------------------------------------------------------
// 11. External agents can be excluded; limit truncates entries only.
// -----------------------------------------------------------------------------
TEST_F(LeaderboardEngineTest, ExternalFilterAndLimit) {
  registerAgent("a");
  registerAgent("b");
  registerAgent("ext", true);
  score("a", 0.9);
  score("b", 0.8);
  score("ext", 0.95);

  auto internal = board.getLeaderboard(LeaderboardWindow::All, false);
  ASSERT_EQ(internal.entries.size(), 2u);
  EXPECT_EQ(internal.entries[0].agent_id, "a");

  auto limited = board.getLeaderboard(LeaderboardWindow::All, true, 2);
  EXPECT_EQ(limited.entries.size(), 2u);
  EXPECT_EQ(limited.metadata.total_agents, 3);
  EXPECT_EQ(limited.entries[0].agent_id, "ext");
  EXPECT_TRUE(limited.entries[0].is_external);
}

// -----------------------------------------------------------------------------
// 12. History is newest first.
// -----------------------------------------------------------------------------
TEST_F(LeaderboardEngineTest, HistoryNewestFirst) {
  registerAgent("a");
  score("a", 0.5);
  board.getLeaderboard(LeaderboardWindow::All);
  clock.advance_by(1000);
  board.getLeaderboard(LeaderboardWindow::SevenDays);

  auto history = board.getLeaderboardHistory(20);
  ASSERT_EQ(history.size(), 2u);
  EXPECT_EQ(history[0].window, LeaderboardWindow::SevenDays);
  EXPECT_GT(history[0].timestamp_ms, history[1].timestamp_ms);
  EXPECT_EQ(board.getLeaderboardHistory(1).size(), 1u);
}

// -----------------------------------------------------------------------------
// 13. Detail view: percentile among scored agents; unknown -> nullopt.
// -----------------------------------------------------------------------------
TEST_F(LeaderboardEngineTest, AgentDetail) {
  registerAgent("a");
  registerAgent("b");
  registerAgent("c");
  score("a", 0.8);
  score("b", 0.6);
  score("c", 0.4);

  auto detail = board.getAgentLeaderboardDetail("a");
  ASSERT_TRUE(detail.has_value());
  EXPECT_EQ(detail->percentile_rank, 67);
  EXPECT_EQ(detail->state.agent_name, "a bot");
  ASSERT_EQ(detail->recent_scores.size(), 1u);
  EXPECT_DOUBLE_EQ(detail->recent_scores[0].score, 0.8);

  EXPECT_FALSE(board.getAgentLeaderboardDetail("nobody").has_value());
}

// -----------------------------------------------------------------------------
// 14. Concurrent recordScore() calls each land exactly once.
//     Why: pairwise ELO touches other agents' state under the same lock.
// -----------------------------------------------------------------------------
TEST_F(LeaderboardEngineTest, ConcurrentRecordScoreCountsAddUp) {
  const std::vector<std::string> agents{"a", "b", "c", "d"};
  constexpr int kPerAgent = 100;
  for (const auto& id : agents) {
    registerAgent(id);
  }

  std::vector<std::thread> writers;
  for (std::size_t t = 0; t < agents.size(); ++t) {
    writers.emplace_back([this, &agents, t] {
      for (int i = 0; i < kPerAgent; ++i) {
        ASSERT_TRUE(score(agents[t], 0.2 + 0.15 * static_cast<double>(t),
                          1.0, i % 2 == 0));
      }
    });
  }
  std::thread reader([this] {
    for (int i = 0; i < 200; ++i) {
      board.getAgentLeaderboardDetail("a");
    }
  });
  for (auto& w : writers) {
    w.join();
  }
  reader.join();

  for (const auto& id : agents) {
    auto detail = board.getAgentLeaderboardDetail(id);
    ASSERT_TRUE(detail.has_value());
    EXPECT_EQ(detail->state.composite_scores.size(),
              static_cast<std::size_t>(kPerAgent));
    EXPECT_EQ(detail->state.pnl_history.size(),
              static_cast<std::size_t>(kPerAgent));
  }
}
