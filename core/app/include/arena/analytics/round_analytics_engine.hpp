#pragma once

#include "arena/concurrent/bounded_history.hpp"
#include "arena/domain/round.hpp"
#include "arena/time/i_time_provider.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace arena {

// -----------------------------------------------------------------------------
// RoundAnalyticsEngine - per-round consensus, decision quality and context
// -----------------------------------------------------------------------------
//
// @brief  Reduces one trading round (every agent's decision plus a market
//         snapshot) into an immutable RoundAnalytics record and keeps the
//         most recent records for cross-round views.
//
// @details
// analyzeRound() computes five independent sections:
//
//   participation   active (non-hold) vs. hold agents, execution rate.
//   consensus       active decisions grouped by (action, symbol); the first
//                   largest group is the majority. unanimous / majority /
//                   split / all_hold.
//   quality         per-decision composite
//                     0.35 * executionSuccess + 0.25 * confidenceCalibration
//                   + 0.20 * positionSizing   + 0.20 * timingScore
//                   and the round mean.
//   marketContext   top mover, worst performer, breadth, volatility and the
//                   dominant sector of the first active decision.
//   metrics         USDC traded, confidence / quantity averages, distinct
//                   symbols, buy-to-sell ratio (+infinity when there are
//                   buys and no sells).
//
// Storage:
//   Records are appended to a BoundedHistory (capacity 1000) and indexed by
//   roundId. When the oldest record is evicted its index entry is removed
//   as well, unless a newer record reuses the same roundId.
//
// Thread model:
//   One std::shared_mutex guards history and index. analyzeRound() computes
//   the record without the lock and takes a unique_lock only to commit.
//   Every getter takes a shared_lock and returns copies.
//
// Ownership:
//   Owned by BenchmarkEngine via std::unique_ptr. Borrows the clock.
// -----------------------------------------------------------------------------
class RoundAnalyticsEngine {
 public:
  static constexpr std::size_t kMaxRounds = 1000;

  explicit RoundAnalyticsEngine(const ITimeProvider& clock,
                                std::size_t max_rounds = kMaxRounds);

  RoundAnalyticsEngine(const RoundAnalyticsEngine&) = delete;
  RoundAnalyticsEngine& operator=(const RoundAnalyticsEngine&) = delete;
  RoundAnalyticsEngine(RoundAnalyticsEngine&&) = delete;
  RoundAnalyticsEngine& operator=(RoundAnalyticsEngine&&) = delete;

  // -------------------------------------------------------------------------
  // analyzeRound(...)
  // -------------------------------------------------------------------------
  // @brief  Computes and stores the analytics for one completed round.
  //
  // @param  round_id           Orchestrator round identifier.
  // @param  timestamp_ms       Round timestamp (epoch ms).
  // @param  decisions          All agents' decisions, holds included.
  // @param  market_data        Quotes available when the round ran.
  // @param  round_duration_ms  Wall time the round took.
  //
  // @return The stored RoundAnalytics (a copy).
  //
  // Thread-safety: Safe from any thread; commits under a unique_lock.
  // Side-effects:  Appends to history (may evict the oldest round) and
  //                logs a one-line summary to stdout.
  // -------------------------------------------------------------------------
  domain::RoundAnalytics analyzeRound(
      const std::string& round_id, std::int64_t timestamp_ms,
      const std::vector<domain::RoundDecision>& decisions,
      const std::vector<domain::MarketQuote>& market_data,
      std::int64_t round_duration_ms);

  // Returns std::nullopt for unknown or evicted rounds.
  std::optional<domain::RoundAnalytics> getRoundAnalytics(
      const std::string& round_id) const;

  // Newest `limit` rounds in chronological order.
  std::vector<domain::RoundAnalytics> getRecentRoundAnalytics(
      std::size_t limit = 20) const;

  // -------------------------------------------------------------------------
  // computeAgentTrends(window_size)
  // -------------------------------------------------------------------------
  // @brief  Per-agent quality trend over the agent's last `window_size`
  //         rounds. Agents seen in fewer than 3 rounds are omitted.
  //
  // @details
  // Trend score = least-squares slope of quality scores divided by their
  // mean; > 0.1 improving, < -0.1 declining, otherwise stable.
  // -------------------------------------------------------------------------
  std::vector<domain::AgentPerformanceTrend> computeAgentTrends(
      std::size_t window_size = 20) const;

  // -------------------------------------------------------------------------
  // generateAnalyticsSummary(period_days)
  // -------------------------------------------------------------------------
  // @brief  System-wide summary of rounds whose timestamp falls within the
  //         last `period_days` days, with detected behavioural patterns.
  //
  // @details
  // Patterns: low_participation (< 50%), execution_failures (execution
  // < 80% while participation > 30%), high_agreement (> 50% unanimous
  // rounds) and declining_agents.
  // -------------------------------------------------------------------------
  domain::AnalyticsSummary generateAnalyticsSummary(int period_days = 7) const;

  domain::AnalyticsStatus getAnalyticsStatus() const;

  // -------------------------------------------------------------------------
  // Stateless building blocks (exposed for unit tests)
  // -------------------------------------------------------------------------
  static domain::Participation analyzeParticipation(
      const std::vector<domain::RoundDecision>& decisions);
  static domain::Consensus analyzeConsensus(
      const std::vector<domain::RoundDecision>& decisions);
  static domain::DecisionQuality scoreDecisionQuality(
      const std::vector<domain::RoundDecision>& decisions);
  static domain::MarketContext analyzeMarketContext(
      const std::vector<domain::RoundDecision>& decisions,
      const std::vector<domain::MarketQuote>& market_data);
  static domain::RoundMetrics computeMetrics(
      const std::vector<domain::RoundDecision>& decisions,
      std::int64_t round_duration_ms);
  static std::string categorizeSymbol(const std::string& symbol);

 private:
  std::vector<domain::AgentPerformanceTrend> computeAgentTrendsLocked(
      std::size_t window_size) const;

  const ITimeProvider& clock_;

  mutable std::shared_mutex mutex_;
  BoundedHistory<domain::RoundAnalytics> history_;
  std::unordered_map<std::string, domain::RoundAnalytics> by_id_;
  std::unordered_map<std::string, std::string> agent_names_;
};

}  // namespace arena
