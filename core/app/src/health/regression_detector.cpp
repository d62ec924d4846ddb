#include "arena/health/regression_detector.hpp"

#include "arena/math/stats.hpp"

#include <algorithm>
#include <cmath>
#include <functional>
#include <iostream>
#include <mutex>
#include <string>
#include <utility>

namespace arena {

namespace {

constexpr std::size_t kMinSnapshots = 5;
constexpr std::size_t kRecentWindow = 10;
constexpr std::size_t kOlderWindowStart = 30;   // counted from the newest
constexpr std::size_t kMinSnapshotsForReport = 3;
constexpr std::size_t kReportAlertLimit = 20;
constexpr std::size_t kActiveAlertLimit = 50;
constexpr std::size_t kSnapshotQueryLimit = 100;

using Snapshots = std::vector<domain::BenchmarkHealthSnapshot>;
using Extractor = std::function<double(const domain::BenchmarkHealthSnapshot&)>;

double averageOf(const Snapshots& snapshots, const Extractor& extract) {
  if (snapshots.empty()) {
    return 0.0;
  }
  double total = 0.0;
  for (const auto& s : snapshots) {
    total += extract(s);
  }
  return total / static_cast<double>(snapshots.size());
}

std::vector<double> valuesOf(const std::map<std::string, double>& m) {
  std::vector<double> values;
  values.reserve(m.size());
  for (const auto& [key, value] : m) {
    values.push_back(value);
  }
  return values;
}

double avgAgentScore(const domain::BenchmarkHealthSnapshot& s) {
  return math::mean(valuesOf(s.agent_scores));
}

std::string percent(double ratio, int digits) {
  return math::toFixed(ratio * 100.0, digits);
}

}  // namespace

RegressionDetector::RegressionDetector(const ITimeProvider& clock)
    : clock_(clock) {}

// -----------------------------------------------------------------------------
// recordBenchmarkHealthSnapshot()
// -----------------------------------------------------------------------------
std::vector<domain::RegressionAlert>
RegressionDetector::recordBenchmarkHealthSnapshot(
    const domain::BenchmarkHealthSnapshot& snapshot) {
  const std::int64_t now = clock_.now_ms();

  std::unique_lock lock(mutex_);
  snapshots_.push(snapshot);

  std::vector<domain::RegressionAlert> raised = detectRegressions(snapshot, now);
  for (const auto& alert : raised) {
    alerts_.push(alert);
    std::cout << "[RegressionDetector] " << domain::toString(alert.type) << " ("
              << domain::toString(alert.severity) << "): " << alert.description
              << "\n";
  }
  return raised;
}

// -----------------------------------------------------------------------------
// detectRegressions(): recent window vs. the window before it
// -----------------------------------------------------------------------------
std::vector<domain::RegressionAlert> RegressionDetector::detectRegressions(
    const domain::BenchmarkHealthSnapshot& latest, std::int64_t now) const {
  using domain::AlertSeverity;
  using domain::RegressionType;

  std::vector<domain::RegressionAlert> alerts;
  const std::size_t n = snapshots_.size();
  if (n < kMinSnapshots) {
    return alerts;
  }

  const Snapshots recent = snapshots_.tail(kRecentWindow);
  const std::size_t older_begin = n > kOlderWindowStart ? n - kOlderWindowStart : 0;
  const std::size_t older_end = n > kRecentWindow ? n - kRecentWindow : 0;
  Snapshots older;
  for (std::size_t i = older_begin; i < older_end; ++i) {
    older.push_back(snapshots_[i]);
  }
  if (older.size() < kMinSnapshots) {
    return alerts;
  }

  auto make = [&](const char* suffix, RegressionType type,
                  AlertSeverity severity, std::string description,
                  const char* metric, double lo, double hi, double actual,
                  std::string recommendation) {
    domain::RegressionAlert a;
    a.id = "reg_" + std::to_string(now) + "_" + suffix;
    a.type = type;
    a.severity = severity;
    a.description = std::move(description);
    a.metric = metric;
    a.expected_min = lo;
    a.expected_max = hi;
    a.actual_value = actual;
    a.recommendation = std::move(recommendation);
    a.timestamp_ms = now;
    alerts.push_back(std::move(a));
  };

  // 1. Scoring drift
  const double recent_scores = averageOf(recent, avgAgentScore);
  const double older_scores = averageOf(older, avgAgentScore);
  const double drift = std::fabs(recent_scores - older_scores);
  if (drift > 0.15) {
    make("drift", RegressionType::ScoringDrift,
         drift > 0.25 ? AlertSeverity::High : AlertSeverity::Medium,
         "Composite scores shifted by " + percent(drift, 1) +
             "% - may indicate scoring formula drift or data quality change",
         "avg_composite_score", older_scores - 0.1, older_scores + 0.1,
         recent_scores,
         "Review recent scoring weight changes or data pipeline for anomalies");
  }

  // 2. Agent convergence
  const double recent_spread = averageOf(
      recent, [](const auto& s) { return s.agent_score_spread; });
  if (recent_spread < 0.03) {
    make("conv", RegressionType::AgentConvergence,
         recent_spread < 0.01 ? AlertSeverity::High : AlertSeverity::Medium,
         "Agent score spread is only " + percent(recent_spread, 1) +
             "% - benchmark is not differentiating agents well",
         "agent_score_spread", 0.05, 0.30, recent_spread,
         "Increase weight of differentiating pillars (financial, battle, "
         "patterns)");
  }

  // 3. Coherence inflation
  auto coherence = [](const auto& s) { return s.coherence_avg; };
  const double recent_coh = averageOf(recent, coherence);
  const double older_coh = averageOf(older, coherence);
  if (recent_coh > older_coh + 0.15 && recent_coh > 0.85) {
    make("coh_inf", RegressionType::CoherenceInflation, AlertSeverity::Medium,
         "Coherence scores inflated from " + percent(older_coh, 0) + "% to " +
             percent(recent_coh, 0) +
             "% - agents may be gaming the coherence scorer",
         "avg_coherence", 0.5, 0.8, recent_coh,
         "Review coherence scoring methodology for gaming vectors");
  }

  // 4. Hallucination spike
  auto hallucination = [](const auto& s) { return s.hallucination_rate; };
  const double recent_hall = averageOf(recent, hallucination);
  const double older_hall = averageOf(older, hallucination);
  if (recent_hall > older_hall + 0.1) {
    make("hall", RegressionType::HallucinationSpike,
         recent_hall > 0.3 ? AlertSeverity::High : AlertSeverity::Medium,
         "Hallucination rate spiked from " + percent(older_hall, 0) + "% to " +
             percent(recent_hall, 0) + "%",
         "hallucination_rate", 0.0, 0.15, recent_hall,
         "Check if market data pipeline has issues causing agents to "
         "hallucinate");
  }

  // 5. Reasoning length drift
  auto length = [](const auto& s) { return s.avg_reasoning_length; };
  const double recent_len = averageOf(recent, length);
  const double older_len = averageOf(older, length);
  if (recent_len < older_len * 0.6) {
    make("len", RegressionType::ReasoningLengthDrift, AlertSeverity::Medium,
         "Avg reasoning length dropped from " + math::toFixed(math::roundHalfUp(older_len), 0) +
             " to " + math::toFixed(math::roundHalfUp(recent_len), 0) + " words",
         "avg_reasoning_length", older_len * 0.8, older_len * 1.5, recent_len,
         "Review agent prompts or increase minimum reasoning length "
         "requirement");
  }

  // 6. Calibration decay
  auto calibration = [](const auto& s) { return s.calibration_avg; };
  const double recent_cal = averageOf(recent, calibration);
  const double older_cal = averageOf(older, calibration);
  if (recent_cal < older_cal - 0.1 && recent_cal < 0.5) {
    make("calib", RegressionType::CalibrationDecay,
         recent_cal < 0.3 ? AlertSeverity::High : AlertSeverity::Medium,
         "Calibration quality dropped from " + percent(older_cal, 0) + "% to " +
             percent(recent_cal, 0) + "%",
         "calibration_avg", 0.5, 1.0, recent_cal,
         "Agents may need confidence recalibration prompting");
  }

  // 7. Pillar imbalance (latest snapshot only)
  const std::vector<double> pillars = valuesOf(latest.pillar_averages);
  if (pillars.size() >= 3) {
    const double sd = math::populationStdDev(pillars);
    if (sd > 0.25) {
      std::vector<std::pair<std::string, double>> sorted(
          latest.pillar_averages.begin(), latest.pillar_averages.end());
      std::stable_sort(sorted.begin(), sorted.end(),
                       [](const auto& a, const auto& b) {
                         return a.second > b.second;
                       });
      const auto& highest = sorted.front();
      const auto& lowest = sorted.back();
      make("imb", RegressionType::PillarImbalance, AlertSeverity::Low,
           "Pillar scores vary widely: " + highest.first + "=" +
               percent(highest.second, 0) + "% vs " + lowest.first + "=" +
               percent(lowest.second, 0) + "%",
           "pillar_std_dev", 0.0, 0.20, sd,
           "Consider rebalancing pillar weights - " + lowest.first +
               " may need methodology review");
    }
  }

  return alerts;
}

// -----------------------------------------------------------------------------
// getBenchmarkHealthReport()
// -----------------------------------------------------------------------------
domain::BenchmarkHealthReport RegressionDetector::getBenchmarkHealthReport()
    const {
  const std::int64_t now = clock_.now_ms();

  std::shared_lock lock(mutex_);

  domain::BenchmarkHealthReport report;
  report.snapshot_count = static_cast<int>(snapshots_.size());
  report.last_updated_ms = now;

  if (snapshots_.size() < kMinSnapshotsForReport) {
    report.recommendations.push_back(
        "Collect more data for meaningful regression detection");
    return report;
  }

  const Snapshots recent = snapshots_.tail(kRecentWindow);

  std::vector<double> drifts;
  for (std::size_t i = 1; i < recent.size(); ++i) {
    if (!recent[i - 1].agent_scores.empty() && !recent[i].agent_scores.empty()) {
      drifts.push_back(
          std::fabs(avgAgentScore(recent[i]) - avgAgentScore(recent[i - 1])));
    }
  }
  const double stability = std::max(0.0, 1.0 - math::mean(drifts) * 5.0);

  const auto& last = recent.back();
  const double balance = std::max(
      0.0, 1.0 - math::populationStdDev(valuesOf(last.pillar_averages)) * 3.0);
  const double diversity = std::min(1.0, last.agent_score_spread * 10.0);
  const double freshness = std::min(
      1.0,
      averageOf(recent, [](const auto& s) { return s.avg_reasoning_length; }) /
          80.0);
  const double calibration =
      averageOf(recent, [](const auto& s) { return s.calibration_avg; });

  auto& d = report.dimensions;
  d.scoring_stability = math::round3(stability);
  d.pillar_balance = math::round3(balance);
  d.agent_diversity = math::round3(diversity);
  d.data_freshness = math::round3(freshness);
  d.calibration_quality = math::round3(calibration);

  report.overall_health = math::round3(
      d.scoring_stability * 0.25 + d.pillar_balance * 0.20 +
      d.agent_diversity * 0.25 + d.data_freshness * 0.15 +
      d.calibration_quality * 0.15);

  int high_alerts = 0;
  for (const auto& a : alerts_) {
    if (a.severity == domain::AlertSeverity::High ||
        a.severity == domain::AlertSeverity::Critical) {
      ++high_alerts;
    }
  }
  if (high_alerts >= 3) {
    report.status = domain::HealthStatus::Critical;
  } else if (high_alerts >= 1) {
    report.status = domain::HealthStatus::Degraded;
  } else if (alerts_.size() > 3) {
    report.status = domain::HealthStatus::Warning;
  } else {
    report.status = domain::HealthStatus::Healthy;
  }

  if (d.agent_diversity < 0.3) {
    report.recommendations.push_back(
        "Agent scores are too similar - consider adding more differentiating "
        "metrics");
  }
  if (d.scoring_stability < 0.5) {
    report.recommendations.push_back(
        "Scoring is unstable - review recent methodology changes");
  }
  if (d.data_freshness < 0.5) {
    report.recommendations.push_back(
        "Reasoning quality declining - review agent prompt engineering");
  }
  if (d.calibration_quality < 0.4) {
    report.recommendations.push_back(
        "Confidence calibration is poor - agents need calibration feedback");
  }
  if (report.recommendations.empty()) {
    report.recommendations.push_back(
        "Benchmark is operating within normal parameters");
  }

  // Coherence trend over the whole history.
  const Snapshots all = snapshots_.toVector();
  const std::size_t mid = all.size() / 2;
  const Snapshots first_half(all.begin(),
                             all.begin() + static_cast<std::ptrdiff_t>(mid));
  const Snapshots second_half(all.begin() + static_cast<std::ptrdiff_t>(mid),
                              all.end());
  auto coherence = [](const auto& s) { return s.coherence_avg; };
  const double first = averageOf(first_half, coherence);
  const double second = averageOf(second_half, coherence);
  report.trend = second > first + 0.05   ? domain::TrendDirection::Improving
                 : second < first - 0.05 ? domain::TrendDirection::Declining
                                         : domain::TrendDirection::Stable;

  report.active_alerts = alerts_.tail(kReportAlertLimit);
  return report;
}

double RegressionDetector::getBenchmarkHealthPillarScore() const {
  return getBenchmarkHealthReport().overall_health;
}

std::vector<domain::RegressionAlert> RegressionDetector::getActiveAlerts() const {
  std::shared_lock lock(mutex_);
  return alerts_.tail(kActiveAlertLimit);
}

std::vector<domain::BenchmarkHealthSnapshot>
RegressionDetector::getHealthSnapshotHistory() const {
  std::shared_lock lock(mutex_);
  return snapshots_.tail(kSnapshotQueryLimit);
}

}  // namespace arena
