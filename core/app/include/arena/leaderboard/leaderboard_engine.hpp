#pragma once

#include "arena/concurrent/bounded_history.hpp"
#include "arena/domain/rating.hpp"
#include "arena/time/i_time_provider.hpp"

#include <cstddef>
#include <optional>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

namespace arena {

// -----------------------------------------------------------------------------
// LeaderboardEngine - composite, ELO and Glicko-2 ratings per agent
// -----------------------------------------------------------------------------
//
// @brief  Ingests one benchmark score per agent per round and produces
//         ranked leaderboard snapshots over several time windows.
//
// @details
// recordScore() for a registered agent:
//   1. Appends to every bounded (cap 500) metric history.
//   2. Updates the win streak (reset on a loss).
//   3. ELO: plays one pairwise match against every other agent with at
//      least one score. The result is 1 / 0 / 0.5 depending on whose
//      current composite is higher. K = 32, divisor 400, ratings rounded.
//      This is O(agents) per call.
//   4. Simplified single-pass Glicko-2 update moving the rating toward the
//      score mapped onto the rating scale (1500 + (s - 0.5) * 600).
//
// getLeaderboard() recomputes rolling averages over the samples inside the
// requested window, grades the average composite on a 13-tier table, sorts,
// assigns ranks and rank changes, and appends the snapshot to a cap-500
// history. Because it stores the new ranks it is a writer.
//
// Thread model:
//   One std::shared_mutex. recordScore(), registerAgent() and
//   getLeaderboard() take a unique_lock (ELO touches every agent, so the
//   whole call is serialized). History and detail getters take a
//   shared_lock and return copies.
//
// Ownership:
//   Owned by BenchmarkEngine via std::unique_ptr. Borrows the clock.
// -----------------------------------------------------------------------------
class LeaderboardEngine {
 public:
  static constexpr double kEloInitial = 1500.0;
  static constexpr double kEloK = 32.0;
  static constexpr double kEloDivisor = 400.0;
  static constexpr std::size_t kMaxSnapshots = 500;
  static constexpr std::size_t kDefaultLimit = 50;
  static constexpr std::size_t kRecentScoresLimit = 50;

  explicit LeaderboardEngine(const ITimeProvider& clock);

  LeaderboardEngine(const LeaderboardEngine&) = delete;
  LeaderboardEngine& operator=(const LeaderboardEngine&) = delete;
  LeaderboardEngine(LeaderboardEngine&&) = delete;
  LeaderboardEngine& operator=(LeaderboardEngine&&) = delete;

  // Idempotent: a second registration of the same id changes nothing.
  void registerAgent(const std::string& agent_id, const std::string& agent_name,
                     const std::string& model, const std::string& provider,
                     bool is_external = false);

  // -------------------------------------------------------------------------
  // recordScore(...)
  // -------------------------------------------------------------------------
  // @brief  Records one round's benchmark result for an agent and updates
  //         streaks, ELO (pairwise) and Glicko-2.
  //
  // @return false if the agent is not registered (nothing is recorded).
  //
  // Thread-safety: Safe from any thread; fully serialized.
  // -------------------------------------------------------------------------
  bool recordScore(const std::string& agent_id, double composite_score,
                   double coherence, bool hallucination_detected,
                   bool discipline_passed, double calibration, double pnl,
                   bool is_win);

  // -------------------------------------------------------------------------
  // getLeaderboard(window, include_external, limit)
  // -------------------------------------------------------------------------
  // @brief  Ranked snapshot of every scored agent.
  //
  // @details
  // For 7d and 24h windows agents without samples inside the window are
  // left out. Rolling metric averages use the last N samples of each
  // history, N being the number of composite samples in the window.
  // Sharpe = mean(pnl) / population stddev(pnl), 0 below 3 samples.
  // Trend compares the last 7 days with the 7 days before (+/- 0.03).
  //
  // Side-effects: Stores each agent's new rank and appends the snapshot to
  //               the history.
  // -------------------------------------------------------------------------
  domain::LeaderboardSnapshot getLeaderboard(
      domain::LeaderboardWindow window = domain::LeaderboardWindow::All,
      bool include_external = true, std::size_t limit = kDefaultLimit);

  // Newest snapshot first.
  std::vector<domain::LeaderboardSnapshot> getLeaderboardHistory(
      std::size_t limit = 20) const;

  // std::nullopt for unknown agents.
  std::optional<domain::AgentLeaderboardDetail> getAgentLeaderboardDetail(
      const std::string& agent_id) const;

  std::size_t agentCount() const;

  // -------------------------------------------------------------------------
  // Rating math (exposed for unit tests)
  // -------------------------------------------------------------------------

  // Symmetric ELO update. result is A's score: 1 win, 0 loss, 0.5 draw.
  // Returns the rounded new ratings of A and B.
  static std::pair<double, double> updateElo(double rating_a, double rating_b,
                                             double result);

  // Letter grade for an unrounded average composite in [0, 1].
  static std::string gradeFor(double composite);

 private:
  static void updateGlicko2(domain::AgentRatingState& state, double score);

  const ITimeProvider& clock_;

  mutable std::shared_mutex mutex_;
  // Registration order; it is also the iteration order for ELO matches and
  // the tie order in rankings.
  std::vector<domain::AgentRatingState> agents_;
  BoundedHistory<domain::LeaderboardSnapshot> snapshots_{kMaxSnapshots};

  domain::AgentRatingState* find(const std::string& agent_id);
  const domain::AgentRatingState* find(const std::string& agent_id) const;
};

}  // namespace arena
