#pragma once

#include "arena/domain/trend_direction.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace arena {
namespace domain {

// Meta-metrics of one benchmark round, produced by the Orchestrator after
// scoring.
struct BenchmarkHealthSnapshot {
  std::int64_t timestamp_ms{0};
  std::map<std::string, double> agent_scores;      // agentId -> composite
  std::map<std::string, double> pillar_averages;   // pillar -> average
  double coherence_avg{0.0};
  double hallucination_rate{0.0};
  double avg_reasoning_length{0.0};                // words
  double agent_score_spread{0.0};                  // stddev of composites
  double calibration_avg{0.0};
};

enum class RegressionType {
  ScoringDrift,
  PillarImbalance,
  AgentConvergence,
  DataStaleness,
  CalibrationDecay,
  CoherenceInflation,
  HallucinationSpike,
  ReasoningLengthDrift
};

inline const char* toString(RegressionType t) {
  switch (t) {
    case RegressionType::ScoringDrift:         return "scoring_drift";
    case RegressionType::PillarImbalance:      return "pillar_imbalance";
    case RegressionType::AgentConvergence:     return "agent_convergence";
    case RegressionType::DataStaleness:        return "data_staleness";
    case RegressionType::CalibrationDecay:     return "calibration_decay";
    case RegressionType::CoherenceInflation:   return "coherence_inflation";
    case RegressionType::HallucinationSpike:   return "hallucination_spike";
    case RegressionType::ReasoningLengthDrift: return "reasoning_length_drift";
  }
  return "scoring_drift";
}

enum class AlertSeverity { Low, Medium, High, Critical };

inline const char* toString(AlertSeverity s) {
  switch (s) {
    case AlertSeverity::Low:      return "low";
    case AlertSeverity::Medium:   return "medium";
    case AlertSeverity::High:     return "high";
    case AlertSeverity::Critical: return "critical";
  }
  return "low";
}

struct RegressionAlert {
  std::string id;
  RegressionType type{RegressionType::ScoringDrift};
  AlertSeverity severity{AlertSeverity::Low};
  std::string description;
  std::string metric;
  double expected_min{0.0};
  double expected_max{0.0};
  double actual_value{0.0};
  std::string recommendation;
  std::int64_t timestamp_ms{0};
};

enum class HealthStatus { Healthy, Warning, Degraded, Critical };

inline const char* toString(HealthStatus s) {
  switch (s) {
    case HealthStatus::Healthy:  return "healthy";
    case HealthStatus::Warning:  return "warning";
    case HealthStatus::Degraded: return "degraded";
    case HealthStatus::Critical: return "critical";
  }
  return "healthy";
}

struct HealthDimensions {
  double scoring_stability{0.8};
  double pillar_balance{0.8};
  double agent_diversity{0.8};
  double data_freshness{0.8};
  double calibration_quality{0.8};
};

struct BenchmarkHealthReport {
  double overall_health{0.8};
  HealthStatus status{HealthStatus::Healthy};
  std::vector<RegressionAlert> active_alerts;
  int snapshot_count{0};
  HealthDimensions dimensions;
  std::vector<std::string> recommendations;
  TrendDirection trend{TrendDirection::Stable};
  std::int64_t last_updated_ms{0};
};

}  // namespace domain
}  // namespace arena
