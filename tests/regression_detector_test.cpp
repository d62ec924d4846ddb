// =============================================================================
// regression_detector_test.cpp
// =============================================================================
// Unit tests for arena::RegressionDetector.
//
// Validates:
//   - No detection below 5 snapshots or with fewer than 5 older snapshots
//   - Each detector fires on the recent-vs-older comparison it watches
//     (scoring drift, convergence, coherence inflation, hallucination spike,
//     reasoning length drift, calibration decay, pillar imbalance)
//   - Health report: default below 3 snapshots, weighted dimensions, status
//     escalation from alert severity, coherence trend
//   - Query caps on snapshot history
//
// Scenario shape: a run of "normal" snapshots followed by a run of shifted
// ones, so the recent window (last 10) differs from the older window.
// =============================================================================

#include "arena/health/regression_detector.hpp"
#include "arena/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <functional>
#include <string>
#include <vector>

using arena::domain::AlertSeverity;
using arena::domain::BenchmarkHealthSnapshot;
using arena::domain::RegressionAlert;
using arena::domain::RegressionType;

class RegressionDetectorTest : public ::testing::Test {
 protected:
  arena::SimulationTimeProvider clock{1'700'000'000'000};
  arena::RegressionDetector detector{clock};

  static BenchmarkHealthSnapshot normal() {
    BenchmarkHealthSnapshot s;
    s.agent_scores = {{"claude", 0.6}, {"gpt", 0.5}, {"grok", 0.4}};
    s.pillar_averages = {{"financial", 0.6}, {"reasoning", 0.55},
                         {"safety", 0.5}};
    s.coherence_avg = 0.6;
    s.hallucination_rate = 0.05;
    s.avg_reasoning_length = 100.0;
    s.agent_score_spread = 0.08;
    s.calibration_avg = 0.7;
    return s;
  }

  // Records `count` snapshots and returns the alerts raised by the last one.
  std::vector<RegressionAlert> feed(
      int count, const std::function<void(BenchmarkHealthSnapshot&)>& tweak =
                     [](BenchmarkHealthSnapshot&) {}) {
    std::vector<RegressionAlert> last;
    for (int i = 0; i < count; ++i) {
      clock.advance_by(60'000);
      auto s = normal();
      s.timestamp_ms = clock.now_ms();
      tweak(s);
      last = detector.recordBenchmarkHealthSnapshot(s);
    }
    return last;
  }

  static const RegressionAlert* find(const std::vector<RegressionAlert>& alerts,
                                     RegressionType type) {
    auto it = std::find_if(alerts.begin(), alerts.end(),
                           [type](const auto& a) { return a.type == type; });
    return it == alerts.end() ? nullptr : &*it;
  }
};

// -----------------------------------------------------------------------------
// 1. Degenerate data raises nothing while history is too short.
// -----------------------------------------------------------------------------
TEST_F(RegressionDetectorTest, NoDetectionWithShortHistory) {
  auto alerts = feed(12, [](auto& s) {
    s.agent_score_spread = 0.0;
    s.hallucination_rate = 0.9;
  });
  // 12 snapshots leave only 2 in the older window.
  EXPECT_TRUE(alerts.empty());
  EXPECT_TRUE(detector.getActiveAlerts().empty());
}

// -----------------------------------------------------------------------------
// 2. Stable normal data never raises alerts.
// -----------------------------------------------------------------------------
TEST_F(RegressionDetectorTest, StableDataRaisesNothing) {
  feed(40);
  EXPECT_TRUE(detector.getActiveAlerts().empty());
}

// -----------------------------------------------------------------------------
// 3. A +0.3 shift in composite scores is a high-severity scoring drift.
// -----------------------------------------------------------------------------
TEST_F(RegressionDetectorTest, DetectsScoringDrift) {
  feed(20);
  auto alerts = feed(10, [](auto& s) {
    s.agent_scores = {{"claude", 0.9}, {"gpt", 0.8}, {"grok", 0.7}};
  });

  const auto* drift = find(alerts, RegressionType::ScoringDrift);
  ASSERT_NE(drift, nullptr);
  EXPECT_EQ(drift->severity, AlertSeverity::High);
  EXPECT_EQ(drift->id, "reg_" + std::to_string(clock.now_ms()) + "_drift");
  EXPECT_EQ(drift->metric, "avg_composite_score");
  EXPECT_NEAR(drift->expected_min, 0.4, 1e-9);
  EXPECT_NEAR(drift->expected_max, 0.6, 1e-9);
  EXPECT_NEAR(drift->actual_value, 0.8, 1e-9);
  EXPECT_EQ(drift->description,
            "Composite scores shifted by 30.0% - may indicate scoring formula "
            "drift or data quality change");
}

// -----------------------------------------------------------------------------
// 4. Spread below 1% is high-severity convergence.
// -----------------------------------------------------------------------------
TEST_F(RegressionDetectorTest, DetectsAgentConvergence) {
  feed(20);
  auto alerts = feed(10, [](auto& s) { s.agent_score_spread = 0.005; });

  const auto* conv = find(alerts, RegressionType::AgentConvergence);
  ASSERT_NE(conv, nullptr);
  EXPECT_EQ(conv->severity, AlertSeverity::High);
  EXPECT_DOUBLE_EQ(conv->expected_min, 0.05);
  EXPECT_DOUBLE_EQ(conv->expected_max, 0.30);
}

// -----------------------------------------------------------------------------
// 5. Coherence jumping from 60% to 95% is inflation.
// -----------------------------------------------------------------------------
TEST_F(RegressionDetectorTest, DetectsCoherenceInflation) {
  feed(20);
  auto alerts = feed(10, [](auto& s) { s.coherence_avg = 0.95; });

  const auto* coh = find(alerts, RegressionType::CoherenceInflation);
  ASSERT_NE(coh, nullptr);
  EXPECT_EQ(coh->severity, AlertSeverity::Medium);
  EXPECT_EQ(coh->description,
            "Coherence scores inflated from 60% to 95% - agents may be gaming "
            "the coherence scorer");
}

// -----------------------------------------------------------------------------
// 6. Hallucination rate rising to 40% is a high-severity spike.
// -----------------------------------------------------------------------------
TEST_F(RegressionDetectorTest, DetectsHallucinationSpike) {
  feed(20);
  auto alerts = feed(10, [](auto& s) { s.hallucination_rate = 0.4; });

  const auto* hall = find(alerts, RegressionType::HallucinationSpike);
  ASSERT_NE(hall, nullptr);
  EXPECT_EQ(hall->severity, AlertSeverity::High);
  EXPECT_EQ(hall->description, "Hallucination rate spiked from 5% to 40%");
}

// -----------------------------------------------------------------------------
// 7. Reasoning shrinking from 100 to 40 words is length drift.
// -----------------------------------------------------------------------------
TEST_F(RegressionDetectorTest, DetectsReasoningLengthDrift) {
  feed(20);
  auto alerts = feed(10, [](auto& s) { s.avg_reasoning_length = 40.0; });

  const auto* len = find(alerts, RegressionType::ReasoningLengthDrift);
  ASSERT_NE(len, nullptr);
  EXPECT_EQ(len->severity, AlertSeverity::Medium);
  EXPECT_EQ(len->description,
            "Avg reasoning length dropped from 100 to 40 words");
  EXPECT_NEAR(len->expected_min, 80.0, 1e-9);
  EXPECT_NEAR(len->expected_max, 150.0, 1e-9);
}

// -----------------------------------------------------------------------------
// 8. Calibration falling to 20% is high-severity decay.
// -----------------------------------------------------------------------------
TEST_F(RegressionDetectorTest, DetectsCalibrationDecay) {
  feed(20);
  auto alerts = feed(10, [](auto& s) { s.calibration_avg = 0.2; });

  const auto* calib = find(alerts, RegressionType::CalibrationDecay);
  ASSERT_NE(calib, nullptr);
  EXPECT_EQ(calib->severity, AlertSeverity::High);
}

// -----------------------------------------------------------------------------
// 9. Pillar imbalance looks only at the latest snapshot.
// -----------------------------------------------------------------------------
TEST_F(RegressionDetectorTest, DetectsPillarImbalance) {
  feed(15);
  auto alerts = feed(1, [](auto& s) {
    s.pillar_averages = {{"financial", 0.9}, {"reasoning", 0.2},
                         {"safety", 0.5}};
  });

  ASSERT_EQ(alerts.size(), 1u);
  EXPECT_EQ(alerts[0].type, RegressionType::PillarImbalance);
  EXPECT_EQ(alerts[0].severity, AlertSeverity::Low);
  EXPECT_EQ(alerts[0].description,
            "Pillar scores vary widely: financial=90% vs reasoning=20%");
  EXPECT_EQ(alerts[0].recommendation,
            "Consider rebalancing pillar weights - reasoning may need "
            "methodology review");
}

// -----------------------------------------------------------------------------
// 10. Below 3 snapshots the report is the conservative default.
// -----------------------------------------------------------------------------
TEST_F(RegressionDetectorTest, DefaultReportWithFewSnapshots) {
  feed(2);
  auto report = detector.getBenchmarkHealthReport();

  EXPECT_EQ(report.snapshot_count, 2);
  EXPECT_DOUBLE_EQ(report.overall_health, 0.8);
  EXPECT_EQ(report.status, arena::domain::HealthStatus::Healthy);
  ASSERT_EQ(report.recommendations.size(), 1u);
  EXPECT_EQ(report.recommendations[0],
            "Collect more data for meaningful regression detection");
}

// -----------------------------------------------------------------------------
// 11. Healthy data yields the weighted dimensions and a stable trend.
// -----------------------------------------------------------------------------
TEST_F(RegressionDetectorTest, HealthyReportDimensions) {
  feed(12);
  auto report = detector.getBenchmarkHealthReport();

  EXPECT_DOUBLE_EQ(report.dimensions.scoring_stability, 1.0);
  EXPECT_NEAR(report.dimensions.pillar_balance, 0.878, 1e-9);
  EXPECT_NEAR(report.dimensions.agent_diversity, 0.8, 1e-9);
  EXPECT_DOUBLE_EQ(report.dimensions.data_freshness, 1.0);
  EXPECT_NEAR(report.dimensions.calibration_quality, 0.7, 1e-9);
  EXPECT_NEAR(report.overall_health, 0.881, 1e-9);
  EXPECT_EQ(report.status, arena::domain::HealthStatus::Healthy);
  EXPECT_EQ(report.trend, arena::domain::TrendDirection::Stable);
  ASSERT_EQ(report.recommendations.size(), 1u);
  EXPECT_EQ(report.recommendations[0],
            "Benchmark is operating within normal parameters");
}

// -----------------------------------------------------------------------------
// 12. Three or more high alerts make the benchmark critical.
// -----------------------------------------------------------------------------
TEST_F(RegressionDetectorTest, HighAlertsEscalateStatus) {
  feed(20);
  feed(10, [](auto& s) { s.hallucination_rate = 0.5; });

  auto report = detector.getBenchmarkHealthReport();
  EXPECT_EQ(report.status, arena::domain::HealthStatus::Critical);
  EXPECT_FALSE(report.active_alerts.empty());
  EXPECT_LE(report.active_alerts.size(), 20u);
}

// -----------------------------------------------------------------------------
// 13. Rising coherence over the history is an improving trend.
// -----------------------------------------------------------------------------
TEST_F(RegressionDetectorTest, CoherenceTrendImproving) {
  feed(5);
  feed(5, [](auto& s) { s.coherence_avg = 0.7; });

  EXPECT_EQ(detector.getBenchmarkHealthReport().trend,
            arena::domain::TrendDirection::Improving);
}

// -----------------------------------------------------------------------------
// 14. Snapshot queries return at most the newest 100.
// -----------------------------------------------------------------------------
TEST_F(RegressionDetectorTest, SnapshotHistoryIsCapped) {
  feed(150);
  auto history = detector.getHealthSnapshotHistory();

  ASSERT_EQ(history.size(), 100u);
  EXPECT_EQ(history.back().timestamp_ms, clock.now_ms());
  EXPECT_EQ(detector.getBenchmarkHealthReport().snapshot_count, 150);
}
