#include "arena/time/live_time_provider.hpp"

#include <chrono>

namespace arena {

// -----------------------------------------------------------------------------
// now_ms(): system_clock converted to epoch milliseconds
// -----------------------------------------------------------------------------
std::int64_t LiveTimeProvider::now_ms() const {
  auto duration = std::chrono::system_clock::now().time_since_epoch();
  return std::chrono::duration_cast<std::chrono::milliseconds>(duration)
      .count();
}

}  // namespace arena
