#include "arena/leaderboard/leaderboard_engine.hpp"

#include "arena/math/stats.hpp"
#include "arena/time/time_utils.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <mutex>

namespace arena {

namespace {

constexpr double kGlickoScale = 173.7178;
constexpr double kGlickoScoreBase = 1500.0;
constexpr double kGlickoScoreRange = 600.0;
constexpr double kGlickoVarianceFactor = 3.0;
constexpr double kGlickoVolatilityDecay = 0.1;
constexpr double kGlickoDeviationReduction = 0.95;
constexpr double kGlickoMinDeviation = 30.0;
constexpr double kGlickoMinVolatility = 0.01;
constexpr double kPi = 3.14159265358979323846;

constexpr double kTrendThreshold = 0.03;
constexpr std::size_t kSharpeMinSamples = 3;

constexpr std::int64_t k24hMs = 24 * kMsPerHour;
constexpr std::int64_t k7dMs = 7 * kMsPerDay;
constexpr std::int64_t k14dMs = 14 * kMsPerDay;

struct GradeTier {
  double min;
  const char* grade;
};

constexpr GradeTier kGradeTable[] = {
    {0.95, "A+"}, {0.90, "A"},  {0.85, "A-"}, {0.80, "B+"}, {0.75, "B"},
    {0.70, "B-"}, {0.65, "C+"}, {0.60, "C"},  {0.55, "C-"}, {0.50, "D+"},
    {0.45, "D"},  {0.40, "D-"},
};

// Mean of the last n elements of a history.
double tailMean(const BoundedHistory<double>& history, std::size_t n) {
  return math::mean(history.tail(n));
}

double sharpeRatio(const std::vector<double>& returns) {
  if (returns.size() < kSharpeMinSamples) {
    return 0.0;
  }
  const double sd = math::populationStdDev(returns);
  if (sd == 0.0) {
    return 0.0;
  }
  return math::mean(returns) / sd;
}

}  // namespace

LeaderboardEngine::LeaderboardEngine(const ITimeProvider& clock)
    : clock_(clock) {}

domain::AgentRatingState* LeaderboardEngine::find(const std::string& agent_id) {
  auto it = std::find_if(agents_.begin(), agents_.end(),
                         [&](const domain::AgentRatingState& s) {
                           return s.agent_id == agent_id;
                         });
  return it != agents_.end() ? &*it : nullptr;
}

const domain::AgentRatingState* LeaderboardEngine::find(
    const std::string& agent_id) const {
  auto it = std::find_if(agents_.begin(), agents_.end(),
                         [&](const domain::AgentRatingState& s) {
                           return s.agent_id == agent_id;
                         });
  return it != agents_.end() ? &*it : nullptr;
}

// -----------------------------------------------------------------------------
// registerAgent()
// -----------------------------------------------------------------------------
void LeaderboardEngine::registerAgent(const std::string& agent_id,
                                      const std::string& agent_name,
                                      const std::string& model,
                                      const std::string& provider,
                                      bool is_external) {
  std::unique_lock lock(mutex_);
  if (find(agent_id) != nullptr) {
    return;
  }

  domain::AgentRatingState state;
  state.agent_id = agent_id;
  state.agent_name = agent_name;
  state.model = model;
  state.provider = provider;
  state.is_external = is_external;
  state.elo = kEloInitial;
  agents_.push_back(std::move(state));

  std::cout << "[Leaderboard] Registered " << agent_id << " (" << model
            << (is_external ? ", external" : "") << ")\n";
}

// -----------------------------------------------------------------------------
// recordScore(): histories -> streak -> pairwise ELO -> Glicko-2
// -----------------------------------------------------------------------------
bool LeaderboardEngine::recordScore(const std::string& agent_id,
                                    double composite_score, double coherence,
                                    bool hallucination_detected,
                                    bool discipline_passed, double calibration,
                                    double pnl, bool is_win) {
  std::unique_lock lock(mutex_);
  domain::AgentRatingState* state = find(agent_id);
  if (state == nullptr) {
    return false;
  }

  state->composite_scores.push(
      domain::ScoreSample{composite_score, clock_.now_ms()});
  state->current_composite = composite_score;
  state->coherence_history.push(coherence);
  state->hallucination_history.push(hallucination_detected ? 1.0 : 0.0);
  state->discipline_history.push(discipline_passed ? 1.0 : 0.0);
  state->calibration_history.push(calibration);
  state->pnl_history.push(pnl);
  state->outcome_history.push(is_win ? 1.0 : 0.0);

  if (is_win) {
    ++state->current_streak;
    state->best_streak = std::max(state->best_streak, state->current_streak);
  } else {
    state->current_streak = 0;
  }

  for (auto& other : agents_) {
    if (&other == state || other.composite_scores.empty()) {
      continue;
    }
    const double result = composite_score > other.current_composite   ? 1.0
                          : composite_score < other.current_composite ? 0.0
                                                                      : 0.5;
    auto [new_self, new_other] = updateElo(state->elo, other.elo, result);
    state->elo = new_self;
    other.elo = new_other;
  }

  updateGlicko2(*state, composite_score);
  return true;
}

// -----------------------------------------------------------------------------
// updateElo()
// -----------------------------------------------------------------------------
std::pair<double, double> LeaderboardEngine::updateElo(double rating_a,
                                                       double rating_b,
                                                       double result) {
  const double expected_a =
      1.0 / (1.0 + std::pow(10.0, (rating_b - rating_a) / kEloDivisor));
  const double expected_b = 1.0 - expected_a;

  const double new_a = math::roundHalfUp(rating_a + kEloK * (result - expected_a));
  const double new_b =
      math::roundHalfUp(rating_b + kEloK * ((1.0 - result) - expected_b));
  return {new_a, new_b};
}

// -----------------------------------------------------------------------------
// updateGlicko2(): simplified single-pass update
// -----------------------------------------------------------------------------
void LeaderboardEngine::updateGlicko2(domain::AgentRatingState& state,
                                      double score) {
  const double phi = state.glicko_deviation / kGlickoScale;
  const double sigma = state.glicko_volatility;

  const double scaled = kGlickoScoreBase + (score - 0.5) * kGlickoScoreRange;
  const double v =
      1.0 / (1.0 + kGlickoVarianceFactor * phi * phi / (kPi * kPi));
  const double delta = v * (scaled - state.glicko_rating);

  const double new_sigma =
      std::max(kGlickoMinVolatility,
               sigma * (1.0 - kGlickoVolatilityDecay) +
                   kGlickoVolatilityDecay * std::fabs(delta) / kEloDivisor);
  const double new_phi =
      std::max(kGlickoMinDeviation, std::sqrt(phi * phi + new_sigma * new_sigma) *
                                        kGlickoScale * kGlickoDeviationReduction);

  state.glicko_rating =
      math::roundHalfUp(state.glicko_rating + kEloK * delta / kEloDivisor);
  state.glicko_deviation = math::roundHalfUp(new_phi);
  state.glicko_volatility = math::roundTo(new_sigma, 4);
}

std::string LeaderboardEngine::gradeFor(double composite) {
  for (const auto& tier : kGradeTable) {
    if (composite >= tier.min) {
      return tier.grade;
    }
  }
  return "F";
}

// -----------------------------------------------------------------------------
// getLeaderboard()
// -----------------------------------------------------------------------------
domain::LeaderboardSnapshot LeaderboardEngine::getLeaderboard(
    domain::LeaderboardWindow window, bool include_external,
    std::size_t limit) {
  const std::int64_t now = clock_.now_ms();
  const std::int64_t window_ms =
      window == domain::LeaderboardWindow::TwentyFourHours ? k24hMs
      : window == domain::LeaderboardWindow::SevenDays
          ? k7dMs
          : std::numeric_limits<std::int64_t>::max();

  std::unique_lock lock(mutex_);

  struct Ranked {
    domain::LeaderboardEntry entry;
    domain::AgentRatingState* state;
  };
  std::vector<Ranked> ranked;

  for (auto& state : agents_) {
    if (!include_external && state.is_external) continue;
    if (state.composite_scores.empty()) continue;

    std::vector<double> window_scores;
    double sum_7d = 0.0;
    double sum_prev_7d = 0.0;
    int count_24h = 0;
    int count_7d = 0;
    int count_prev_7d = 0;
    for (const auto& sample : state.composite_scores) {
      const std::int64_t age = now - sample.timestamp_ms;
      if (age < window_ms) window_scores.push_back(sample.score);
      if (age < k24hMs) ++count_24h;
      if (age < k7dMs) {
        ++count_7d;
        sum_7d += sample.score;
      } else if (age < k14dMs) {
        ++count_prev_7d;
        sum_prev_7d += sample.score;
      }
    }

    if (window_scores.empty()) {
      if (window != domain::LeaderboardWindow::All) continue;
      for (const auto& sample : state.composite_scores) {
        window_scores.push_back(sample.score);
      }
    }

    const double avg_composite = math::mean(window_scores);
    const std::size_t recent_n =
        std::min(window_scores.size(), state.coherence_history.size());

    const std::vector<double> pnl_slice = state.pnl_history.tail(recent_n);

    const double avg_7d = count_7d > 0 ? sum_7d / count_7d : avg_composite;
    const double avg_prev_7d =
        count_prev_7d > 0 ? sum_prev_7d / count_prev_7d : avg_composite;
    const double change_7d = avg_7d - avg_prev_7d;

    domain::LeaderboardEntry e;
    e.agent_id = state.agent_id;
    e.agent_name = state.agent_name;
    e.model = state.model;
    e.provider = state.provider;
    e.previous_rank = state.previous_rank;
    e.composite_score = math::round3(avg_composite);
    e.grade = gradeFor(avg_composite);

    e.metrics.pnl_percent = math::round2(math::mean(pnl_slice));
    e.metrics.sharpe_ratio = math::round2(sharpeRatio(pnl_slice));
    e.metrics.coherence = math::round2(tailMean(state.coherence_history, recent_n));
    e.metrics.hallucination_rate =
        math::round2(tailMean(state.hallucination_history, recent_n));
    e.metrics.discipline_rate =
        math::round2(tailMean(state.discipline_history, recent_n));
    e.metrics.calibration_score =
        math::round2(tailMean(state.calibration_history, recent_n));
    e.metrics.win_rate = math::round2(tailMean(state.outcome_history, recent_n));

    e.ratings.elo = state.elo;
    e.ratings.glicko_rating = state.glicko_rating;
    e.ratings.glicko_deviation = state.glicko_deviation;
    e.ratings.glicko_volatility = state.glicko_volatility;

    e.stats.total_trades = static_cast<int>(state.composite_scores.size());
    e.stats.trades_last_24h = count_24h;
    e.stats.trades_last_7d = count_7d;
    e.stats.current_streak = state.current_streak;
    e.stats.best_streak = state.best_streak;

    e.trend.direction = change_7d > kTrendThreshold
                            ? domain::TrendDirection::Improving
                        : change_7d < -kTrendThreshold
                            ? domain::TrendDirection::Declining
                            : domain::TrendDirection::Stable;
    e.trend.composite_change_7d = math::round3(change_7d);
    e.trend.elo_change_7d = 0.0;  // no ELO history is kept
    e.is_external = state.is_external;

    ranked.push_back(Ranked{std::move(e), &state});
  }

  std::stable_sort(ranked.begin(), ranked.end(),
                   [](const Ranked& a, const Ranked& b) {
                     return a.entry.composite_score > b.entry.composite_score;
                   });

  domain::LeaderboardSnapshot snapshot;
  snapshot.timestamp_ms = now;
  snapshot.window = window;

  int total_trades = 0;
  double composite_total = 0.0;
  for (std::size_t i = 0; i < ranked.size(); ++i) {
    auto& e = ranked[i].entry;
    e.rank = static_cast<int>(i + 1);
    e.rank_change = e.previous_rank > 0 ? e.previous_rank - e.rank : 0;
    ranked[i].state->previous_rank = e.rank;

    total_trades += e.stats.total_trades;
    composite_total += e.composite_score;
    if (i < limit) {
      snapshot.entries.push_back(e);
    }
  }

  snapshot.metadata.total_agents = static_cast<int>(ranked.size());
  snapshot.metadata.total_trades = total_trades;
  if (!ranked.empty()) {
    snapshot.metadata.avg_composite =
        math::round3(composite_total / static_cast<double>(ranked.size()));
    snapshot.metadata.top_agent = ranked.front().entry.agent_id;
  }

  snapshots_.push(snapshot);
  return snapshot;
}

// -----------------------------------------------------------------------------
// getLeaderboardHistory()
// -----------------------------------------------------------------------------
std::vector<domain::LeaderboardSnapshot> LeaderboardEngine::getLeaderboardHistory(
    std::size_t limit) const {
  std::shared_lock lock(mutex_);
  std::vector<domain::LeaderboardSnapshot> history = snapshots_.tail(limit);
  std::reverse(history.begin(), history.end());
  return history;
}

// -----------------------------------------------------------------------------
// getAgentLeaderboardDetail()
// -----------------------------------------------------------------------------
std::optional<domain::AgentLeaderboardDetail>
LeaderboardEngine::getAgentLeaderboardDetail(const std::string& agent_id) const {
  std::shared_lock lock(mutex_);
  const domain::AgentRatingState* state = find(agent_id);
  if (state == nullptr) {
    return std::nullopt;
  }

  int scored = 0;
  int below = 0;
  for (const auto& other : agents_) {
    if (other.composite_scores.empty()) continue;
    ++scored;
    if (other.current_composite < state->current_composite) ++below;
  }

  domain::AgentLeaderboardDetail detail{*state, {}, 50};
  detail.recent_scores = state->composite_scores.tail(kRecentScoresLimit);
  if (scored > 0) {
    detail.percentile_rank = static_cast<int>(
        math::roundHalfUp(static_cast<double>(below) / scored * 100.0));
  }
  return detail;
}

std::size_t LeaderboardEngine::agentCount() const {
  std::shared_lock lock(mutex_);
  return agents_.size();
}

}  // namespace arena
