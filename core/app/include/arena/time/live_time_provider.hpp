#pragma once

#include "arena/time/i_time_provider.hpp"

namespace arena {

// -----------------------------------------------------------------------------
// LiveTimeProvider - wall-clock implementation of ITimeProvider
// -----------------------------------------------------------------------------
//
// @brief  Returns std::chrono::system_clock time in epoch milliseconds.
//
// @details
// Used by the server executable. Created in main() and passed by const
// reference to BenchmarkEngine, which hands it to every component.
//
// Thread model: Stateless; safe from any thread.
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;
};

}  // namespace arena
