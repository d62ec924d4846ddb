#pragma once

#include "arena/domain/trend_direction.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace arena {
namespace domain {

enum class TradeAction { Buy, Sell, Hold };

inline const char* toString(TradeAction a) {
  switch (a) {
    case TradeAction::Buy:  return "buy";
    case TradeAction::Sell: return "sell";
    case TradeAction::Hold: return "hold";
  }
  return "hold";
}

// One agent's decision for a trading round. Produced by the Orchestrator,
// never modified by the engine.
struct RoundDecision {
  std::string agent_id;
  std::string agent_name;
  TradeAction action{TradeAction::Hold};
  std::string symbol;
  double quantity{0.0};
  double confidence{0.0};                      // [0, 1]
  std::string reasoning;
  bool executed{false};
  std::optional<std::string> execution_error;
  std::optional<std::string> tx_signature;
  std::optional<double> filled_price;
  std::optional<double> usdc_amount;
  std::optional<std::int64_t> duration_ms;
};

struct MarketQuote {
  std::string symbol;
  double price{0.0};
  std::optional<double> change_24h;           // percent; absent if unknown
};

// -----------------------------------------------------------------------------
// RoundAnalytics and its parts
// -----------------------------------------------------------------------------

struct Participation {
  int total_agents{0};
  int active_agents{0};          // action != hold
  int hold_agents{0};
  double participation_rate{0.0};
  double execution_rate{1.0};
};

enum class ConsensusType { Unanimous, Majority, Split, AllHold };

inline const char* toString(ConsensusType t) {
  switch (t) {
    case ConsensusType::Unanimous: return "unanimous";
    case ConsensusType::Majority:  return "majority";
    case ConsensusType::Split:     return "split";
    case ConsensusType::AllHold:   return "all_hold";
  }
  return "split";
}

struct Consensus {
  ConsensusType type{ConsensusType::AllHold};
  std::optional<std::string> majority_action;
  std::optional<std::string> majority_symbol;
  double majority_confidence{0.0};
  int dissenter_count{0};
  double confidence_spread{0.0};
};

struct QualityFactors {
  double confidence_calibration{0.0};
  double execution_success{0.0};
  double position_sizing{0.0};
  double timing_score{0.0};
};

struct AgentQualityScore {
  std::string agent_id;
  TradeAction action{TradeAction::Hold};
  double confidence{0.0};
  double quality_score{0.0};
  QualityFactors factors;
};

struct DecisionHighlight {
  std::string agent_id;
  std::string reason;
};

struct DecisionQuality {
  std::vector<AgentQualityScore> agent_scores;
  std::optional<DecisionHighlight> best_decision;
  std::optional<DecisionHighlight> worst_decision;
  double round_quality_score{0.0};
};

struct MarketMover {
  std::string symbol;
  double change{0.0};
};

struct MarketContext {
  std::optional<MarketMover> top_mover;
  std::optional<MarketMover> worst_performer;
  double market_breadth{0.5};
  double avg_volatility{0.0};
  std::string sector{"mixed"};
};

struct RoundMetrics {
  double total_usdc_traded{0.0};
  double avg_confidence{0.0};
  double avg_quantity{0.0};
  int unique_stocks_traded{0};
  double buy_to_sell_ratio{0.0};   // +infinity when sells == 0 < buys
  std::int64_t round_duration_ms{0};
};

struct RoundAnalytics {
  std::string round_id;
  std::int64_t timestamp_ms{0};
  std::int64_t analyzed_at_ms{0};
  Participation participation;
  Consensus consensus;
  DecisionQuality quality;
  MarketContext market_context;
  RoundMetrics metrics;
};

// -----------------------------------------------------------------------------
// Cross-round views
// -----------------------------------------------------------------------------

struct RoundTrendPoint {
  std::string round_id;
  std::string action{"unknown"};
  double confidence{0.0};
  bool executed{false};
  double quality_score{0.0};
};

struct AgentPerformanceTrend {
  std::string agent_id;
  std::string agent_name;
  std::vector<RoundTrendPoint> recent_rounds;
  TrendDirection trend{TrendDirection::Stable};
  double trend_score{0.0};
  double moving_avg_confidence{0.0};
  double moving_avg_quality{0.0};
  int current_execution_streak{0};
  double execution_success_rate{0.0};
};

enum class PatternSignificance { Low, Medium, High };

inline const char* toString(PatternSignificance s) {
  switch (s) {
    case PatternSignificance::Low:    return "low";
    case PatternSignificance::Medium: return "medium";
    case PatternSignificance::High:   return "high";
  }
  return "low";
}

struct AnalyticsPattern {
  std::string type;
  std::string description;
  PatternSignificance significance{PatternSignificance::Low};
};

struct RoundHighlight {
  std::string round_id;
  double score{0.0};
  std::string reason;
};

struct SystemAnalytics {
  double avg_participation_rate{0.0};
  double avg_execution_rate{0.0};
  double avg_round_quality{0.0};
  double total_usdc_traded{0.0};
  double unanimous_round_rate{0.0};
  double split_round_rate{0.0};
};

struct AnalyticsSummary {
  std::int64_t generated_at_ms{0};
  int total_rounds_analyzed{0};
  std::int64_t period_start_ms{0};
  std::int64_t period_end_ms{0};
  SystemAnalytics system;
  std::vector<AgentPerformanceTrend> agent_trends;
  std::vector<AnalyticsPattern> patterns;
  std::optional<RoundHighlight> best_round;
  std::optional<RoundHighlight> worst_round;
};

struct AnalyticsStatus {
  int total_rounds_analyzed{0};
  std::optional<std::string> oldest_round;
  std::optional<std::string> newest_round;
  double average_round_quality{0.0};
  double average_participation{0.0};
};

}  // namespace domain
}  // namespace arena
