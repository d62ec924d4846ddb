#pragma once

namespace arena {
namespace domain {

// Shared by agent trends, leaderboard trends and benchmark health trend.
enum class TrendDirection { Improving, Stable, Declining };

inline const char* toString(TrendDirection d) {
  switch (d) {
    case TrendDirection::Improving: return "improving";
    case TrendDirection::Stable:    return "stable";
    case TrendDirection::Declining: return "declining";
  }
  return "stable";
}

}  // namespace domain
}  // namespace arena
