#pragma once

#include <atomic>
#include <cstdint>
#include <string>

namespace arena {

// -----------------------------------------------------------------------------
// ForecastIdGenerator - monotonically increasing forecast identifiers
// -----------------------------------------------------------------------------
//
// @brief  Produces unique "fcst_<n>" ids for TradeImpactForecast records.
//
// @details
// Ids start at fcst_1 and increase by one per call. They are unique for
// the lifetime of the generator, which is owned by the
// TradeImpactForecaster instance. A relaxed fetch_add is sufficient:
// uniqueness is all that is required, not ordering against other memory.
//
// Thread-safety: next_id() is safe to call from any thread.
// -----------------------------------------------------------------------------
class ForecastIdGenerator {
 public:
  ForecastIdGenerator() = default;

  ForecastIdGenerator(const ForecastIdGenerator&) = delete;
  ForecastIdGenerator& operator=(const ForecastIdGenerator&) = delete;
  ForecastIdGenerator(ForecastIdGenerator&&) = delete;
  ForecastIdGenerator& operator=(ForecastIdGenerator&&) = delete;

  std::string next_id() {
    return "fcst_" +
           std::to_string(next_id_.fetch_add(1, std::memory_order_relaxed));
  }

 private:
  std::atomic<std::uint64_t> next_id_{1};
};

}  // namespace arena
