#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace arena {
namespace domain {

struct SectorConcentration {
  std::string sector;
  std::vector<std::string> symbols;
  double allocation{0.0};          // percent of portfolio value
  double value{0.0};               // USDC
  double hhi_contribution{0.0};    // allocation^2
};

enum class PositionRiskLevel { Low, Moderate, High };

inline const char* toString(PositionRiskLevel l) {
  switch (l) {
    case PositionRiskLevel::Low:      return "low";
    case PositionRiskLevel::Moderate: return "moderate";
    case PositionRiskLevel::High:     return "high";
  }
  return "low";
}

struct PositionRisk {
  std::string symbol;
  double weight{0.0};              // percent of portfolio value
  double var_contribution{0.0};
  double volatility{0.0};          // heuristic daily volatility, percent
  double unrealized_pnl{0.0};
  double max_drawdown{0.0};
  PositionRiskLevel risk_level{PositionRiskLevel::Low};
};

struct DrawdownAnalysis {
  double current_drawdown{0.0};
  double current_drawdown_percent{0.0};
  double max_drawdown{0.0};
  double max_drawdown_percent{0.0};
  double peak_value{0.0};
  double trough_value{0.0};
  double drawdown_duration_hours{0.0};
  bool recovered{true};
};

struct AffectedPosition {
  std::string symbol;
  double impact{0.0};
};

struct StressTestResult {
  std::string scenario;
  std::string description;
  double portfolio_impact{0.0};
  double portfolio_impact_percent{0.0};
  double new_portfolio_value{0.0};
  std::vector<AffectedPosition> affected_positions;
};

enum class RiskLevel { Low, Moderate, High, Critical };

inline const char* toString(RiskLevel l) {
  switch (l) {
    case RiskLevel::Low:      return "LOW";
    case RiskLevel::Moderate: return "MODERATE";
    case RiskLevel::High:     return "HIGH";
    case RiskLevel::Critical: return "CRITICAL";
  }
  return "LOW";
}

struct PortfolioRiskReport {
  std::string agent_id;
  double var95{0.0};               // percent
  double var95_dollar{0.0};
  double cvar95{0.0};              // percent
  double cvar95_dollar{0.0};
  double beta{1.0};
  std::vector<SectorConcentration> sector_concentration;
  std::vector<PositionRisk> position_risk;
  DrawdownAnalysis drawdown;
  std::vector<StressTestResult> stress_tests;
  int risk_score{0};               // 0-100
  RiskLevel risk_level{RiskLevel::Low};
  std::vector<std::string> warnings;
  std::int64_t generated_at_ms{0};
  double portfolio_value{0.0};
};

struct RiskAnalyzerStats {
  int total_analyses{0};
  std::map<std::string, int> analyses_by_agent;
  int average_risk_score{0};
  std::optional<std::int64_t> last_analysis_at_ms;
  int critical_alerts{0};
};

}  // namespace domain
}  // namespace arena
