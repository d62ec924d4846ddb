#include "arena/forecast/trade_impact_forecaster.hpp"

#include "arena/forecast/reasoning_extractor.hpp"
#include "arena/math/stats.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <mutex>
#include <utility>

namespace arena {

namespace {

constexpr double kUpThreshold = 0.005;
constexpr double kDownThreshold = -0.005;
constexpr double kFlatThreshold = 0.01;

constexpr std::size_t kMinResolvedForLearning = 10;
constexpr double kLearningMultiplier = 1.667;
constexpr double kNeutralScore = 0.5;

constexpr double kHighConfidence = 0.7;
constexpr double kLowConfidence = 0.4;
constexpr std::size_t kMinResolvedForCorrelation = 5;

constexpr int kMinResolvedPerSymbol = 2;

constexpr double kWeightDirection = 0.30;
constexpr double kWeightMagnitude = 0.15;
constexpr double kWeightConviction = 0.20;
constexpr double kWeightHorizon = 0.10;
constexpr double kWeightLearning = 0.25;
constexpr double kMagnitudeErrorMultiplier = 10.0;

struct BucketBounds {
  const char* range;
  double min;
  double max;
};

// The top bound is above 1.0 so that confidence == 1.0 lands in the last
// bucket.
constexpr BucketBounds kBuckets[] = {
    {"0.0-0.25", 0.0, 0.25},
    {"0.25-0.50", 0.25, 0.50},
    {"0.50-0.75", 0.50, 0.75},
    {"0.75-1.0", 0.75, 1.01},
};

using Forecasts = std::vector<domain::TradeImpactForecast>;

bool isCorrect(const domain::TradeImpactForecast& f) {
  return f.direction_correct.value_or(false);
}

double accuracyOf(const Forecasts& forecasts) {
  if (forecasts.empty()) {
    return 0.0;
  }
  const auto correct = std::count_if(forecasts.begin(), forecasts.end(), isCorrect);
  return static_cast<double>(correct) / static_cast<double>(forecasts.size());
}

// Mean magnitude error over forecasts that predicted a magnitude.
double avgMagnitudeErrorOf(const Forecasts& forecasts) {
  std::vector<double> errors;
  for (const auto& f : forecasts) {
    if (f.magnitude_error) {
      errors.push_back(*f.magnitude_error);
    }
  }
  return errors.empty() ? 0.0 : math::round3(math::mean(errors));
}

// resolved is newest first.
domain::StreakInfo computeStreakInfo(const Forecasts& resolved) {
  domain::StreakInfo info;
  if (resolved.empty()) {
    return info;
  }

  int wins = 0;
  int losses = 0;
  for (const auto& f : resolved) {
    if (isCorrect(f)) {
      ++wins;
      losses = 0;
      info.longest_win_streak = std::max(info.longest_win_streak, wins);
    } else {
      ++losses;
      wins = 0;
      info.longest_loss_streak = std::max(info.longest_loss_streak, losses);
    }
  }

  const bool newest_correct = isCorrect(resolved.front());
  info.current_streak_type =
      newest_correct ? domain::StreakType::Win : domain::StreakType::Loss;
  for (const auto& f : resolved) {
    if (isCorrect(f) != newest_correct) {
      break;
    }
    ++info.current_streak;
  }
  return info;
}

std::vector<domain::ConfidenceBucket> computeConfidenceBuckets(
    const Forecasts& resolved) {
  std::vector<domain::ConfidenceBucket> buckets;
  for (const auto& b : kBuckets) {
    Forecasts in_bucket;
    for (const auto& f : resolved) {
      if (f.confidence >= b.min && f.confidence < b.max) {
        in_bucket.push_back(f);
      }
    }
    domain::ConfidenceBucket bucket;
    bucket.range = b.range;
    bucket.count = static_cast<int>(in_bucket.size());
    bucket.direction_accuracy = math::round2(accuracyOf(in_bucket));
    bucket.avg_magnitude_error = avgMagnitudeErrorOf(in_bucket);
    buckets.push_back(std::move(bucket));
  }
  return buckets;
}

// Accuracy of the newer half minus the older half, mapped onto [0, 1].
double computeLearningVelocity(const Forecasts& resolved) {
  if (resolved.size() < kMinResolvedForLearning) {
    return kNeutralScore;
  }
  const auto mid = static_cast<std::ptrdiff_t>(resolved.size() / 2);
  const Forecasts newer(resolved.begin(), resolved.begin() + mid);
  const Forecasts older(resolved.begin() + mid, resolved.end());

  const double improvement = accuracyOf(newer) - accuracyOf(older);
  return math::round2(
      std::clamp(kNeutralScore + improvement * kLearningMultiplier, 0.0, 1.0));
}

double computeConvictionCorrelation(const Forecasts& resolved) {
  if (resolved.size() < kMinResolvedForCorrelation) {
    return 0.0;
  }
  Forecasts high;
  Forecasts low;
  for (const auto& f : resolved) {
    if (f.confidence > kHighConfidence) {
      high.push_back(f);
    } else if (f.confidence <= kLowConfidence) {
      low.push_back(f);
    }
  }
  const double high_acc = high.empty() ? kNeutralScore : accuracyOf(high);
  const double low_acc = low.empty() ? kNeutralScore : accuracyOf(low);
  return math::round2(
      std::clamp(kNeutralScore + (high_acc - low_acc), 0.0, 1.0));
}

double horizonUsageOf(const Forecasts& forecasts) {
  if (forecasts.empty()) {
    return 0.0;
  }
  const auto with_horizon =
      std::count_if(forecasts.begin(), forecasts.end(),
                    [](const auto& f) { return f.predicted_horizon.has_value(); });
  return math::round2(static_cast<double>(with_horizon) /
                      static_cast<double>(forecasts.size()));
}

}  // namespace

TradeImpactForecaster::TradeImpactForecaster(const ITimeProvider& clock)
    : clock_(clock) {}

// -----------------------------------------------------------------------------
// registerForecast()
// -----------------------------------------------------------------------------
domain::TradeImpactForecast TradeImpactForecaster::registerForecast(
    const std::string& agent_id, const std::string& round_id,
    const std::string& symbol, const std::string& action,
    const std::string& reasoning, double confidence) {
  domain::TradeImpactForecast record;
  record.forecast_id = ids_.next_id();
  record.agent_id = agent_id;
  record.round_id = round_id;
  record.symbol = symbol;
  record.action = action;
  record.confidence = confidence;
  record.predicted_direction = forecast::inferDirection(reasoning, action);
  record.predicted_magnitude = forecast::extractMagnitude(reasoning);
  record.predicted_horizon = forecast::extractHorizon(reasoning);
  record.status = domain::ForecastStatus::Pending;
  record.created_at_ms = clock_.now_ms();

  std::unique_lock lock(mutex_);
  forecasts_.push_front(record);
  if (forecasts_.size() > kMaxForecasts) {
    forecasts_.pop_back();
  }
  return record;
}

void TradeImpactForecaster::resolve(domain::TradeImpactForecast& f,
                                    double price_change, std::int64_t now) {
  using domain::Direction;

  const Direction actual = price_change > kUpThreshold     ? Direction::Up
                           : price_change < kDownThreshold ? Direction::Down
                                                           : Direction::Flat;
  f.actual_direction = actual;
  f.actual_magnitude = price_change;
  f.direction_correct =
      f.predicted_direction == actual ||
      (f.predicted_direction == Direction::Up && price_change > 0.0) ||
      (f.predicted_direction == Direction::Down && price_change < 0.0) ||
      (f.predicted_direction == Direction::Flat &&
       std::fabs(price_change) < kFlatThreshold);

  if (f.predicted_magnitude) {
    f.magnitude_error = std::fabs(*f.predicted_magnitude - price_change);
  }
  f.status = domain::ForecastStatus::Resolved;
  f.resolved_at_ms = now;
}

std::optional<domain::TradeImpactForecast> TradeImpactForecaster::resolveForecast(
    const std::string& forecast_id, double price_change) {
  const std::int64_t now = clock_.now_ms();

  std::unique_lock lock(mutex_);
  auto it = std::find_if(forecasts_.begin(), forecasts_.end(),
                         [&](const auto& f) { return f.forecast_id == forecast_id; });
  if (it == forecasts_.end() || it->status != domain::ForecastStatus::Pending) {
    return std::nullopt;
  }
  resolve(*it, price_change, now);
  return *it;
}

std::size_t TradeImpactForecaster::batchResolvePending(const std::string& symbol,
                                                       double price_change) {
  const std::int64_t now = clock_.now_ms();

  std::unique_lock lock(mutex_);
  std::size_t resolved = 0;
  for (auto& f : forecasts_) {
    if (f.symbol == symbol && f.status == domain::ForecastStatus::Pending) {
      resolve(f, price_change, now);
      ++resolved;
    }
  }
  if (resolved > 0) {
    std::cout << "[ImpactForecaster] Resolved " << resolved << " forecasts for "
              << symbol << " at " << math::toFixed(price_change * 100.0, 2)
              << "%\n";
  }
  return resolved;
}

// -----------------------------------------------------------------------------
// Profiles
// -----------------------------------------------------------------------------
domain::AgentImpactProfile TradeImpactForecaster::profileLocked(
    const std::string& agent_id) const {
  Forecasts all;
  Forecasts resolved;
  for (const auto& f : forecasts_) {
    if (f.agent_id != agent_id) {
      continue;
    }
    all.push_back(f);
    if (f.status == domain::ForecastStatus::Resolved) {
      resolved.push_back(f);
    }
  }

  domain::AgentImpactProfile p;
  p.agent_id = agent_id;
  p.total_forecasts = static_cast<int>(all.size());
  p.resolved_forecasts = static_cast<int>(resolved.size());
  p.direction_accuracy = math::round2(accuracyOf(resolved));
  p.avg_magnitude_error = avgMagnitudeErrorOf(resolved);
  p.horizon_usage_rate = horizonUsageOf(all);

  // Per-symbol hit rates in first-seen order; ties keep the earlier symbol.
  std::vector<std::pair<std::string, std::pair<int, int>>> symbols;
  for (const auto& f : resolved) {
    auto it = std::find_if(symbols.begin(), symbols.end(),
                           [&](const auto& s) { return s.first == f.symbol; });
    if (it == symbols.end()) {
      symbols.push_back({f.symbol, {0, 0}});
      it = symbols.end() - 1;
    }
    ++it->second.second;
    if (isCorrect(f)) {
      ++it->second.first;
    }
  }
  double best_rate = -1.0;
  double worst_rate = 2.0;
  for (const auto& [symbol, counts] : symbols) {
    const auto [correct, total] = counts;
    if (total < kMinResolvedPerSymbol) {
      continue;
    }
    const double rate = static_cast<double>(correct) / total;
    if (rate > best_rate) {
      best_rate = rate;
      p.best_symbol = symbol;
    }
    if (rate < worst_rate) {
      worst_rate = rate;
      p.worst_symbol = symbol;
    }
  }

  p.streak_info = computeStreakInfo(resolved);
  p.confidence_buckets = computeConfidenceBuckets(resolved);
  p.learning_velocity = computeLearningVelocity(resolved);
  p.conviction_correlation = computeConvictionCorrelation(resolved);

  p.composite_score = math::round2(
      p.direction_accuracy * kWeightDirection +
      (1.0 - std::min(1.0, p.avg_magnitude_error * kMagnitudeErrorMultiplier)) *
          kWeightMagnitude +
      p.conviction_correlation * kWeightConviction +
      p.horizon_usage_rate * kWeightHorizon +
      p.learning_velocity * kWeightLearning);
  return p;
}

domain::AgentImpactProfile TradeImpactForecaster::getAgentImpactProfile(
    const std::string& agent_id) const {
  std::shared_lock lock(mutex_);
  return profileLocked(agent_id);
}

std::vector<domain::AgentImpactProfile> TradeImpactForecaster::getAllImpactProfiles()
    const {
  std::shared_lock lock(mutex_);
  std::vector<std::string> agents;
  for (const auto& f : forecasts_) {
    if (std::find(agents.begin(), agents.end(), f.agent_id) == agents.end()) {
      agents.push_back(f.agent_id);
    }
  }
  std::vector<domain::AgentImpactProfile> profiles;
  profiles.reserve(agents.size());
  for (const auto& agent : agents) {
    profiles.push_back(profileLocked(agent));
  }
  return profiles;
}

double TradeImpactForecaster::getImpactPillarScore(const std::string& agent_id) const {
  return getAgentImpactProfile(agent_id).composite_score;
}

std::vector<domain::TradeImpactForecast> TradeImpactForecaster::getRecentForecasts(
    std::size_t limit, const std::optional<std::string>& agent_id) const {
  std::shared_lock lock(mutex_);
  std::vector<domain::TradeImpactForecast> out;
  for (const auto& f : forecasts_) {
    if (out.size() >= limit) {
      break;
    }
    if (!agent_id || f.agent_id == *agent_id) {
      out.push_back(f);
    }
  }
  return out;
}

std::vector<domain::TradeImpactForecast> TradeImpactForecaster::getPendingForecasts()
    const {
  std::shared_lock lock(mutex_);
  std::vector<domain::TradeImpactForecast> out;
  for (const auto& f : forecasts_) {
    if (f.status == domain::ForecastStatus::Pending) {
      out.push_back(f);
    }
  }
  return out;
}

domain::ImpactStats TradeImpactForecaster::getImpactStats() const {
  std::shared_lock lock(mutex_);
  const Forecasts all(forecasts_.begin(), forecasts_.end());
  Forecasts resolved;
  int pending = 0;
  for (const auto& f : all) {
    if (f.status == domain::ForecastStatus::Resolved) {
      resolved.push_back(f);
    } else if (f.status == domain::ForecastStatus::Pending) {
      ++pending;
    }
  }

  domain::ImpactStats stats;
  stats.total_forecasts = static_cast<int>(all.size());
  stats.resolved_forecasts = static_cast<int>(resolved.size());
  stats.pending_forecasts = pending;
  stats.overall_direction_accuracy = math::round2(accuracyOf(resolved));
  stats.avg_magnitude_error = avgMagnitudeErrorOf(resolved);
  stats.horizon_usage_rate = horizonUsageOf(all);
  return stats;
}

}  // namespace arena
