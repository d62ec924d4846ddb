#pragma once

#include "arena/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace arena {

// -----------------------------------------------------------------------------
// SimulationTimeProvider - externally-driven clock
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider whose "current time" is set explicitly with
//         advance_time() rather than read from the system clock.
//
// @details
// Used by unit tests and by replays of recorded benchmark rounds. A test
// that needs "a score recorded 8 days ago" records the score, then advances
// the clock by 8 days before asking for the 7d leaderboard.
//
// Starts at 0 ms. Monotonicity is not enforced; the caller feeds times in
// chronological order.
//
// Internal storage:
//   std::atomic<int64_t> current_time_ms_ - lock-free on 64-bit platforms,
//   so readers on the IPC thread never contend with the writer.
//
// Thread model:
//   advance_time() from one driver thread; now_ms() from any thread.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  SimulationTimeProvider() = default;

  explicit SimulationTimeProvider(std::int64_t start_ms)
      : current_time_ms_(start_ms) {}

  std::int64_t now_ms() const override;

  // -------------------------------------------------------------------------
  // advance_time(new_time_ms)
  // -------------------------------------------------------------------------
  // @brief  Sets the clock to the given epoch milliseconds.
  //
  // Thread-safety: Safe from any thread (intended single writer).
  // Side-effects:  Changes the value returned by now_ms() globally.
  // -------------------------------------------------------------------------
  void advance_time(std::int64_t new_time_ms);

  // Moves the clock forward by delta_ms relative to its current value.
  void advance_by(std::int64_t delta_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_{0};
};

}  // namespace arena
