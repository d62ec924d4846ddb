#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace arena {
namespace domain {

enum class Direction { Up, Down, Flat, Unknown };

inline const char* toString(Direction d) {
  switch (d) {
    case Direction::Up:      return "up";
    case Direction::Down:    return "down";
    case Direction::Flat:    return "flat";
    case Direction::Unknown: return "unknown";
  }
  return "unknown";
}

enum class ForecastStatus { Pending, Resolved, Expired };

inline const char* toString(ForecastStatus s) {
  switch (s) {
    case ForecastStatus::Pending:  return "pending";
    case ForecastStatus::Resolved: return "resolved";
    case ForecastStatus::Expired:  return "expired";
  }
  return "pending";
}

// -----------------------------------------------------------------------------
// TradeImpactForecast
// -----------------------------------------------------------------------------
// Created pending at decision time with the predictions extracted from the
// agent's reasoning. Resolution fills the actual_* fields, direction_correct
// and (when a magnitude was predicted) magnitude_error; the record does not
// change after that.
// Magnitudes are fractions: 0.05 == +5%.
// -----------------------------------------------------------------------------
struct TradeImpactForecast {
  std::string forecast_id;
  std::string agent_id;
  std::string round_id;
  std::string symbol;
  std::string action;
  double confidence{0.0};
  Direction predicted_direction{Direction::Unknown};
  std::optional<double> predicted_magnitude;
  std::optional<std::string> predicted_horizon;
  std::optional<Direction> actual_direction;
  std::optional<double> actual_magnitude;
  std::optional<bool> direction_correct;
  std::optional<double> magnitude_error;
  ForecastStatus status{ForecastStatus::Pending};
  std::int64_t created_at_ms{0};
  std::optional<std::int64_t> resolved_at_ms;
};

enum class StreakType { Win, Loss, None };

inline const char* toString(StreakType t) {
  switch (t) {
    case StreakType::Win:  return "win";
    case StreakType::Loss: return "loss";
    case StreakType::None: return "none";
  }
  return "none";
}

struct StreakInfo {
  int current_streak{0};
  StreakType current_streak_type{StreakType::None};
  int longest_win_streak{0};
  int longest_loss_streak{0};
};

struct ConfidenceBucket {
  std::string range;
  int count{0};
  double direction_accuracy{0.0};
  double avg_magnitude_error{0.0};
};

struct AgentImpactProfile {
  std::string agent_id;
  int total_forecasts{0};
  int resolved_forecasts{0};
  double direction_accuracy{0.0};
  double avg_magnitude_error{0.0};
  double conviction_correlation{0.0};
  double horizon_usage_rate{0.0};
  double learning_velocity{0.5};
  std::string best_symbol{"none"};
  std::string worst_symbol{"none"};
  StreakInfo streak_info;
  std::vector<ConfidenceBucket> confidence_buckets;
  double composite_score{0.0};
};

struct ImpactStats {
  int total_forecasts{0};
  int resolved_forecasts{0};
  int pending_forecasts{0};
  double overall_direction_accuracy{0.0};
  double avg_magnitude_error{0.0};
  double horizon_usage_rate{0.0};
};

}  // namespace domain
}  // namespace arena
