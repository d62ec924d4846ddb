#pragma once

#include "arena/concurrent/forecast_id_generator.hpp"
#include "arena/domain/forecast.hpp"
#include "arena/time/i_time_provider.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace arena {

// -----------------------------------------------------------------------------
// TradeImpactForecaster - prediction accountability per agent
// -----------------------------------------------------------------------------
//
// @brief  Registers the predictions implied by each trading decision,
//         resolves them once the realized price move is known, and scores
//         each agent's forecasting quality.
//
// @details
// Lifecycle of a TradeImpactForecast:
//   registerForecast()   -> Pending, predictions extracted from reasoning
//   resolveForecast()    -> Resolved, actual_* and correctness filled in
// A resolved forecast is never modified again.
//
// Price changes are fractions (0.02 == +2%). Actual direction:
//   up   if change >  0.005
//   down if change < -0.005
//   flat otherwise
// A prediction is correct when it equals the actual direction, or when it
// is up/down and the change has the same sign, or when it is flat and
// |change| < 0.01.
//
// Storage: newest first, capped at 5000 with the oldest dropped.
//
// Thread model:
//   One std::shared_mutex. register/resolve take a unique_lock; profiles,
//   stats and listings take a shared_lock and return copies.
//
// Ownership:
//   Owned by BenchmarkEngine via std::unique_ptr. Borrows the clock.
// -----------------------------------------------------------------------------
class TradeImpactForecaster {
 public:
  static constexpr std::size_t kMaxForecasts = 5000;
  static constexpr std::size_t kDefaultRecentLimit = 30;

  explicit TradeImpactForecaster(const ITimeProvider& clock);

  TradeImpactForecaster(const TradeImpactForecaster&) = delete;
  TradeImpactForecaster& operator=(const TradeImpactForecaster&) = delete;
  TradeImpactForecaster(TradeImpactForecaster&&) = delete;
  TradeImpactForecaster& operator=(TradeImpactForecaster&&) = delete;

  // Creates a pending forecast and returns a copy of it.
  domain::TradeImpactForecast registerForecast(const std::string& agent_id,
                                               const std::string& round_id,
                                               const std::string& symbol,
                                               const std::string& action,
                                               const std::string& reasoning,
                                               double confidence);

  // -------------------------------------------------------------------------
  // resolveForecast(forecast_id, price_change)
  // -------------------------------------------------------------------------
  // @return The resolved forecast, or std::nullopt when the id is unknown
  //         or the forecast is no longer pending.
  // -------------------------------------------------------------------------
  std::optional<domain::TradeImpactForecast> resolveForecast(
      const std::string& forecast_id, double price_change);

  // Resolves every pending forecast for the symbol. Returns the count.
  std::size_t batchResolvePending(const std::string& symbol,
                                  double price_change);

  // -------------------------------------------------------------------------
  // getAgentImpactProfile(agent_id)
  // -------------------------------------------------------------------------
  // @brief  Aggregates one agent's forecasts into accuracy, calibration and
  //         learning metrics plus a weighted composite:
  //
  //   0.30 direction accuracy
  //   0.15 magnitude quality   (1 - min(1, 10 * avg magnitude error))
  //   0.20 conviction correlation
  //   0.10 horizon usage
  //   0.25 learning velocity
  //
  // Agents without forecasts get an all-zero profile (learning 0.5).
  // -------------------------------------------------------------------------
  domain::AgentImpactProfile getAgentImpactProfile(
      const std::string& agent_id) const;

  // One profile per agent with forecasts, most recently active agent first.
  std::vector<domain::AgentImpactProfile> getAllImpactProfiles() const;

  double getImpactPillarScore(const std::string& agent_id) const;

  // Newest first, optionally filtered by agent.
  std::vector<domain::TradeImpactForecast> getRecentForecasts(
      std::size_t limit = kDefaultRecentLimit,
      const std::optional<std::string>& agent_id = std::nullopt) const;

  std::vector<domain::TradeImpactForecast> getPendingForecasts() const;

  domain::ImpactStats getImpactStats() const;

 private:
  static void resolve(domain::TradeImpactForecast& forecast,
                      double price_change, std::int64_t now);

  domain::AgentImpactProfile profileLocked(const std::string& agent_id) const;

  const ITimeProvider& clock_;
  ForecastIdGenerator ids_;

  mutable std::shared_mutex mutex_;
  std::deque<domain::TradeImpactForecast> forecasts_;  // newest first
};

}  // namespace arena
