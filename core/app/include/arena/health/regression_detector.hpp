#pragma once

#include "arena/concurrent/bounded_history.hpp"
#include "arena/domain/health.hpp"
#include "arena/time/i_time_provider.hpp"

#include <cstddef>
#include <cstdint>
#include <shared_mutex>
#include <vector>

namespace arena {

// -----------------------------------------------------------------------------
// RegressionDetector - is the benchmark itself still measuring well?
// -----------------------------------------------------------------------------
//
// @brief  Keeps a history of per-round benchmark health snapshots and raises
//         RegressionAlerts when the recent window departs from the window
//         before it.
//
// @details
// Windows (over the snapshot history, newest last):
//   recent = last 10 snapshots
//   older  = the up-to-20 snapshots before those
// Detection is skipped until there are 5 snapshots and 5 older ones.
//
// Checks run on every recorded snapshot, in this order:
//   scoring_drift           |avg composite shift| > 0.15 (high > 0.25)
//   agent_convergence       recent spread < 0.03 (high < 0.01)
//   coherence_inflation     +0.15 over older and above 0.85
//   hallucination_spike     +0.10 over older (high > 0.30)
//   reasoning_length_drift  recent < 60% of older
//   calibration_decay       -0.10 under older and below 0.5 (high < 0.3)
//   pillar_imbalance        >= 3 pillars with stddev > 0.25 (latest only)
//
// Storage: 200 snapshots, 100 alerts, both FIFO.
//
// Thread model:
//   One std::shared_mutex. recordBenchmarkHealthSnapshot() takes a
//   unique_lock; the report and history getters take a shared_lock and
//   return copies.
// -----------------------------------------------------------------------------
class RegressionDetector {
 public:
  static constexpr std::size_t kMaxSnapshots = 200;
  static constexpr std::size_t kMaxAlerts = 100;

  explicit RegressionDetector(const ITimeProvider& clock);

  RegressionDetector(const RegressionDetector&) = delete;
  RegressionDetector& operator=(const RegressionDetector&) = delete;
  RegressionDetector(RegressionDetector&&) = delete;
  RegressionDetector& operator=(RegressionDetector&&) = delete;

  // -------------------------------------------------------------------------
  // recordBenchmarkHealthSnapshot(snapshot)
  // -------------------------------------------------------------------------
  // @brief  Appends the snapshot and runs the detection suite.
  //
  // @return The alerts raised by this snapshot (possibly empty). They are
  //         also appended to the active alert history.
  //
  // Thread-safety: Safe from any thread; serialized.
  // -------------------------------------------------------------------------
  std::vector<domain::RegressionAlert> recordBenchmarkHealthSnapshot(
      const domain::BenchmarkHealthSnapshot& snapshot);

  // -------------------------------------------------------------------------
  // getBenchmarkHealthReport()
  // -------------------------------------------------------------------------
  // @brief  Five [0, 1] health dimensions over the last 10 snapshots, the
  //         weighted overall health, a status derived from alert severity,
  //         recommendations and the coherence trend.
  //
  // @details
  // With fewer than 3 snapshots a conservative default report (0.8
  // everywhere, healthy, stable) is returned.
  // -------------------------------------------------------------------------
  domain::BenchmarkHealthReport getBenchmarkHealthReport() const;

  // Overall health of the current report.
  double getBenchmarkHealthPillarScore() const;

  // Last 50 alerts, oldest first.
  std::vector<domain::RegressionAlert> getActiveAlerts() const;

  // Last 100 snapshots, oldest first.
  std::vector<domain::BenchmarkHealthSnapshot> getHealthSnapshotHistory() const;

 private:
  std::vector<domain::RegressionAlert> detectRegressions(
      const domain::BenchmarkHealthSnapshot& latest, std::int64_t now) const;

  const ITimeProvider& clock_;

  mutable std::shared_mutex mutex_;
  BoundedHistory<domain::BenchmarkHealthSnapshot> snapshots_{kMaxSnapshots};
  BoundedHistory<domain::RegressionAlert> alerts_{kMaxAlerts};
};

}  // namespace arena
