#pragma once

#include "arena/concurrent/bounded_history.hpp"
#include "arena/domain/trend_direction.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace arena {
namespace domain {

inline constexpr std::size_t kMaxHistoryPerMetric = 500;

struct ScoreSample {
  double score{0.0};
  std::int64_t timestamp_ms{0};
};

// -----------------------------------------------------------------------------
// AgentRatingState - everything the leaderboard knows about one agent
// -----------------------------------------------------------------------------
// Created by registerAgent(), updated by every recordScore(), never deleted.
// Flag histories (hallucination, discipline, outcome) store 1.0 / 0.0 so
// that their mean is a rate.
// -----------------------------------------------------------------------------
struct AgentRatingState {
  std::string agent_id;
  std::string agent_name;
  std::string model;
  std::string provider;
  bool is_external{false};

  BoundedHistory<ScoreSample> composite_scores{kMaxHistoryPerMetric};
  double current_composite{0.0};
  BoundedHistory<double> pnl_history{kMaxHistoryPerMetric};
  BoundedHistory<double> coherence_history{kMaxHistoryPerMetric};
  BoundedHistory<double> hallucination_history{kMaxHistoryPerMetric};
  BoundedHistory<double> discipline_history{kMaxHistoryPerMetric};
  BoundedHistory<double> calibration_history{kMaxHistoryPerMetric};
  BoundedHistory<double> outcome_history{kMaxHistoryPerMetric};

  double elo{1500.0};
  double glicko_rating{1500.0};
  double glicko_deviation{350.0};
  double glicko_volatility{0.06};

  int current_streak{0};
  int best_streak{0};
  int previous_rank{0};            // 0 = never ranked
};

enum class LeaderboardWindow { All, SevenDays, TwentyFourHours };

inline const char* toString(LeaderboardWindow w) {
  switch (w) {
    case LeaderboardWindow::All:             return "all";
    case LeaderboardWindow::SevenDays:       return "7d";
    case LeaderboardWindow::TwentyFourHours: return "24h";
  }
  return "all";
}

struct LeaderboardMetrics {
  double pnl_percent{0.0};
  double sharpe_ratio{0.0};
  double coherence{0.0};
  double hallucination_rate{0.0};
  double discipline_rate{0.0};
  double calibration_score{0.0};
  double win_rate{0.0};
};

struct LeaderboardRatings {
  double elo{0.0};
  double glicko_rating{0.0};
  double glicko_deviation{0.0};
  double glicko_volatility{0.0};
};

struct LeaderboardStats {
  int total_trades{0};
  int trades_last_24h{0};
  int trades_last_7d{0};
  int current_streak{0};
  int best_streak{0};
};

struct LeaderboardTrend {
  TrendDirection direction{TrendDirection::Stable};
  double composite_change_7d{0.0};
  double elo_change_7d{0.0};
};

struct LeaderboardEntry {
  std::string agent_id;
  std::string agent_name;
  std::string model;
  std::string provider;
  int rank{0};
  int previous_rank{0};
  int rank_change{0};              // positive = moved up
  double composite_score{0.0};
  std::string grade;
  LeaderboardMetrics metrics;
  LeaderboardRatings ratings;
  LeaderboardStats stats;
  LeaderboardTrend trend;
  bool is_external{false};
};

struct LeaderboardMetadata {
  int total_agents{0};
  int total_trades{0};
  double avg_composite{0.0};
  std::string top_agent{"none"};
  std::string methodology_version{"v3.0"};
};

struct LeaderboardSnapshot {
  std::int64_t timestamp_ms{0};
  LeaderboardWindow window{LeaderboardWindow::All};
  std::vector<LeaderboardEntry> entries;
  LeaderboardMetadata metadata;
};

struct AgentLeaderboardDetail {
  AgentRatingState state;
  std::vector<ScoreSample> recent_scores;
  int percentile_rank{50};
};

}  // namespace domain
}  // namespace arena
