#pragma once

#include <cstdint>

namespace arena {

// -----------------------------------------------------------------------------
// ITimeProvider - abstract time source interface
// -----------------------------------------------------------------------------
//
// @brief  Pure virtual interface for "what time is it now", in epoch
//         milliseconds.
//
// @details
// Several benchmark metrics depend on the current time:
//   - Leaderboard windows (24h / 7d / 14d) filter score samples by age.
//   - Drawdown duration is measured from the last new portfolio peak.
//   - Analytics summaries select rounds newer than "now - periodDays".
//   - Forecasts, alerts and reports carry creation timestamps.
//
// Components receive `const ITimeProvider&` instead of calling
// std::chrono::system_clock directly, so tests can drive time explicitly:
//   - LiveTimeProvider       → wall clock (production).
//   - SimulationTimeProvider → value set with advance_time() (tests,
//                              replay of recorded rounds).
//
// Thread-safety contract:
//   Implementations MUST be safe for concurrent reads from multiple threads.
//
// Ownership:
//   Components hold a const reference; the provider must outlive them.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // -------------------------------------------------------------------------
  // now_ms()
  // -------------------------------------------------------------------------
  // @brief  Returns the current time as milliseconds since the Unix epoch.
  //
  // Thread-safety: Safe to call concurrently from any thread.
  // Side-effects:  None.
  // -------------------------------------------------------------------------
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace arena
