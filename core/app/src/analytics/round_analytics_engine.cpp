#include "arena/analytics/round_analytics_engine.hpp"

#include "arena/math/stats.hpp"
#include "arena/time/time_utils.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <mutex>
#include <unordered_set>
#include <utility>

namespace arena {

namespace {

using domain::TradeAction;

// Decision-quality weights; they sum to 1.0.
constexpr double kWeightExecution = 0.35;
constexpr double kWeightCalibration = 0.25;
constexpr double kWeightSizing = 0.20;
constexpr double kWeightTiming = 0.20;

constexpr double kExecutionExecuted = 100.0;
constexpr double kExecutionHold = 80.0;
constexpr double kExecutionFailed = 0.0;

constexpr double kCalibrationBaseline = 70.0;
constexpr double kCalibrationConfident = 90.0;
constexpr double kHighConfidence = 0.7;

constexpr double kSizingBaseline = 70.0;
constexpr double kTimingLong = 85.0;
constexpr double kTimingMedium = 70.0;
constexpr double kTimingShort = 50.0;

constexpr double kTrendThreshold = 0.1;
constexpr std::size_t kMinRoundsForTrend = 3;

bool isActive(const domain::RoundDecision& d) {
  return d.action != TradeAction::Hold;
}

double positionSizingScore(const domain::RoundDecision& d) {
  if (!isActive(d)) {
    return kSizingBaseline;
  }
  const double amount = d.usdc_amount.value_or(d.quantity);
  if (amount > 0.0 && amount <= 50.0) return 90.0;
  if (amount > 50.0 && amount <= 200.0) return 75.0;
  if (amount > 200.0) return 50.0;
  if (amount == 0.0) return 60.0;
  return kSizingBaseline;
}

double timingScore(const std::string& reasoning) {
  if (reasoning.size() > 100) return kTimingLong;
  if (reasoning.size() > 50) return kTimingMedium;
  return kTimingShort;
}

const domain::AgentQualityScore* findAgentScore(
    const domain::RoundAnalytics& round, const std::string& agent_id) {
  for (const auto& score : round.quality.agent_scores) {
    if (score.agent_id == agent_id) {
      return &score;
    }
  }
  return nullptr;
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
RoundAnalyticsEngine::RoundAnalyticsEngine(const ITimeProvider& clock,
                                           std::size_t max_rounds)
    : clock_(clock), history_(max_rounds) {}

// -----------------------------------------------------------------------------
// analyzeRound(): compute outside the lock, commit under unique_lock
// -----------------------------------------------------------------------------
domain::RoundAnalytics RoundAnalyticsEngine::analyzeRound(
    const std::string& round_id, std::int64_t timestamp_ms,
    const std::vector<domain::RoundDecision>& decisions,
    const std::vector<domain::MarketQuote>& market_data,
    std::int64_t round_duration_ms) {
  domain::RoundAnalytics analytics;
  analytics.round_id = round_id;
  analytics.timestamp_ms = timestamp_ms;
  analytics.analyzed_at_ms = clock_.now_ms();
  analytics.participation = analyzeParticipation(decisions);
  analytics.consensus = analyzeConsensus(decisions);
  analytics.quality = scoreDecisionQuality(decisions);
  analytics.market_context = analyzeMarketContext(decisions, market_data);
  analytics.metrics = computeMetrics(decisions, round_duration_ms);

  {
    std::unique_lock lock(mutex_);

    for (const auto& d : decisions) {
      if (!d.agent_name.empty()) {
        agent_names_[d.agent_id] = d.agent_name;
      }
    }

    by_id_[round_id] = analytics;
    if (auto evicted = history_.push(analytics)) {
      const bool reused = std::any_of(
          history_.begin(), history_.end(),
          [&](const domain::RoundAnalytics& r) {
            return r.round_id == evicted->round_id;
          });
      if (!reused) {
        by_id_.erase(evicted->round_id);
      }
    }
  }

  std::cout << "[RoundAnalytics] Round " << round_id << ": "
            << analytics.participation.active_agents << "/"
            << analytics.participation.total_agents << " active, consensus="
            << domain::toString(analytics.consensus.type) << ", quality="
            << math::toFixed(analytics.quality.round_quality_score, 0)
            << ", $" << math::toFixed(analytics.metrics.total_usdc_traded, 2)
            << " traded\n";

  return analytics;
}

// -----------------------------------------------------------------------------
// getRoundAnalytics()
// -----------------------------------------------------------------------------
std::optional<domain::RoundAnalytics> RoundAnalyticsEngine::getRoundAnalytics(
    const std::string& round_id) const {
  std::shared_lock lock(mutex_);
  auto it = by_id_.find(round_id);
  if (it == by_id_.end()) {
    return std::nullopt;
  }
  return it->second;
}

// -----------------------------------------------------------------------------
// getRecentRoundAnalytics()
// -----------------------------------------------------------------------------
std::vector<domain::RoundAnalytics> RoundAnalyticsEngine::getRecentRoundAnalytics(
    std::size_t limit) const {
  std::shared_lock lock(mutex_);
  return history_.tail(limit);
}

// -----------------------------------------------------------------------------
// analyzeParticipation()
// -----------------------------------------------------------------------------
domain::Participation RoundAnalyticsEngine::analyzeParticipation(
    const std::vector<domain::RoundDecision>& decisions) {
  domain::Participation p;
  int executed = 0;
  for (const auto& d : decisions) {
    if (isActive(d)) {
      ++p.active_agents;
      if (d.executed) {
        ++executed;
      }
    } else {
      ++p.hold_agents;
    }
  }
  p.total_agents = static_cast<int>(decisions.size());
  p.participation_rate =
      p.total_agents > 0
          ? static_cast<double>(p.active_agents) / p.total_agents
          : 0.0;
  p.execution_rate =
      p.active_agents > 0 ? static_cast<double>(executed) / p.active_agents
                          : 1.0;
  return p;
}

// -----------------------------------------------------------------------------
// analyzeConsensus(): group active decisions by (action, symbol)
// -----------------------------------------------------------------------------
domain::Consensus RoundAnalyticsEngine::analyzeConsensus(
    const std::vector<domain::RoundDecision>& decisions) {
  domain::Consensus consensus;

  struct Group {
    TradeAction action;
    std::string symbol;
    std::vector<const domain::RoundDecision*> members;
  };
  std::vector<Group> groups;
  std::size_t active_count = 0;

  for (const auto& d : decisions) {
    if (!isActive(d)) {
      continue;
    }
    ++active_count;
    auto it = std::find_if(groups.begin(), groups.end(), [&](const Group& g) {
      return g.action == d.action && g.symbol == d.symbol;
    });
    if (it == groups.end()) {
      groups.push_back(Group{d.action, d.symbol, {&d}});
    } else {
      it->members.push_back(&d);
    }
  }

  if (active_count == 0) {
    consensus.type = domain::ConsensusType::AllHold;
    return consensus;
  }

  // First group wins ties, matching insertion order.
  const Group* majority = &groups.front();
  for (const auto& g : groups) {
    if (g.members.size() > majority->members.size()) {
      majority = &g;
    }
  }

  const std::size_t majority_size = majority->members.size();
  if (majority_size == active_count && active_count >= 2) {
    consensus.type = domain::ConsensusType::Unanimous;
  } else if (majority_size > 1) {
    consensus.type = domain::ConsensusType::Majority;
  } else {
    consensus.type = domain::ConsensusType::Split;
  }

  consensus.majority_action = domain::toString(majority->action);
  consensus.majority_symbol = majority->symbol;
  consensus.dissenter_count = static_cast<int>(active_count - majority_size);

  double majority_conf = 0.0;
  for (const auto* d : majority->members) {
    majority_conf += d->confidence;
  }
  consensus.majority_confidence =
      math::round1(majority_conf / static_cast<double>(majority_size));

  // Spread covers every decision, holds included.
  auto [min_it, max_it] = std::minmax_element(
      decisions.begin(), decisions.end(),
      [](const domain::RoundDecision& a, const domain::RoundDecision& b) {
        return a.confidence < b.confidence;
      });
  consensus.confidence_spread =
      math::round1(max_it->confidence - min_it->confidence);

  return consensus;
}

// -----------------------------------------------------------------------------
// scoreDecisionQuality(): fixed factor tables, weighted composite
// -----------------------------------------------------------------------------
domain::DecisionQuality RoundAnalyticsEngine::scoreDecisionQuality(
    const std::vector<domain::RoundDecision>& decisions) {
  domain::DecisionQuality quality;
  quality.agent_scores.reserve(decisions.size());

  for (const auto& d : decisions) {
    const double execution = !isActive(d) ? kExecutionHold
                             : d.executed ? kExecutionExecuted
                                          : kExecutionFailed;

    double calibration = kCalibrationBaseline;
    if (!d.executed && isActive(d)) {
      // Confidence is on [0, 1]; the penalty table is on a 0-100 scale.
      calibration = std::max(0.0, 100.0 - d.confidence * 100.0);
    } else if (d.executed && d.confidence > kHighConfidence) {
      calibration = kCalibrationConfident;
    }

    const double sizing = positionSizingScore(d);
    const double timing = timingScore(d.reasoning);

    const double composite = execution * kWeightExecution +
                             calibration * kWeightCalibration +
                             sizing * kWeightSizing + timing * kWeightTiming;

    domain::AgentQualityScore score;
    score.agent_id = d.agent_id;
    score.action = d.action;
    score.confidence = d.confidence;
    score.quality_score = math::round1(composite);
    score.factors.confidence_calibration = math::roundHalfUp(calibration);
    score.factors.execution_success = math::roundHalfUp(execution);
    score.factors.position_sizing = math::roundHalfUp(sizing);
    score.factors.timing_score = math::roundHalfUp(timing);
    quality.agent_scores.push_back(std::move(score));
  }

  if (quality.agent_scores.empty()) {
    return quality;
  }

  std::vector<const domain::AgentQualityScore*> sorted;
  sorted.reserve(quality.agent_scores.size());
  for (const auto& s : quality.agent_scores) {
    sorted.push_back(&s);
  }
  std::stable_sort(sorted.begin(), sorted.end(),
                   [](const auto* a, const auto* b) {
                     return a->quality_score > b->quality_score;
                   });

  const auto* best = sorted.front();
  const auto* worst = sorted.back();
  quality.best_decision = domain::DecisionHighlight{
      best->agent_id,
      "Highest quality score: " + math::toFixed(best->quality_score, 0)};
  if (worst != best) {
    quality.worst_decision = domain::DecisionHighlight{
        worst->agent_id,
        "Lowest quality score: " + math::toFixed(worst->quality_score, 0)};
  }

  double total = 0.0;
  for (const auto& s : quality.agent_scores) {
    total += s.quality_score;
  }
  quality.round_quality_score = math::round1(
      total / static_cast<double>(quality.agent_scores.size()));

  return quality;
}

// -----------------------------------------------------------------------------
// analyzeMarketContext()
// -----------------------------------------------------------------------------
domain::MarketContext RoundAnalyticsEngine::analyzeMarketContext(
    const std::vector<domain::RoundDecision>& decisions,
    const std::vector<domain::MarketQuote>& market_data) {
  domain::MarketContext ctx;

  std::vector<domain::MarketMover> movers;
  for (const auto& quote : market_data) {
    if (quote.change_24h.has_value()) {
      movers.push_back(domain::MarketMover{quote.symbol, *quote.change_24h});
    }
  }

  if (!movers.empty()) {
    std::vector<domain::MarketMover> sorted = movers;
    std::stable_sort(sorted.begin(), sorted.end(),
                     [](const domain::MarketMover& a,
                        const domain::MarketMover& b) {
                       return a.change > b.change;
                     });
    ctx.top_mover = sorted.front();
    ctx.worst_performer = sorted.back();

    int positive = 0;
    double abs_total = 0.0;
    for (const auto& m : movers) {
      if (m.change > 0.0) {
        ++positive;
      }
      abs_total += std::fabs(m.change);
    }
    const double n = static_cast<double>(movers.size());
    ctx.market_breadth = math::round3(positive / n);
    ctx.avg_volatility = math::round2(abs_total / n);
  } else {
    ctx.market_breadth = 0.5;
    ctx.avg_volatility = 0.0;
  }

  auto first_active =
      std::find_if(decisions.begin(), decisions.end(), isActive);
  ctx.sector = first_active != decisions.end()
                   ? categorizeSymbol(first_active->symbol)
                   : "mixed";
  return ctx;
}

// -----------------------------------------------------------------------------
// computeMetrics(): aggregate round metrics
// -----------------------------------------------------------------------------
domain::RoundMetrics RoundAnalyticsEngine::computeMetrics(
    const std::vector<domain::RoundDecision>& decisions,
    std::int64_t round_duration_ms) {
  domain::RoundMetrics m;
  m.round_duration_ms = round_duration_ms;

  double usdc = 0.0;
  double confidence = 0.0;
  double active_quantity = 0.0;
  int active = 0;
  int buys = 0;
  int sells = 0;
  std::unordered_set<std::string> symbols;

  for (const auto& d : decisions) {
    usdc += d.usdc_amount.value_or(0.0);
    confidence += d.confidence;
    if (!isActive(d)) {
      continue;
    }
    ++active;
    active_quantity += d.quantity;
    symbols.insert(d.symbol);
    if (d.action == TradeAction::Buy) {
      ++buys;
    } else {
      ++sells;
    }
  }

  m.total_usdc_traded = math::round2(usdc);
  m.avg_confidence =
      decisions.empty()
          ? 0.0
          : math::round3(confidence / static_cast<double>(decisions.size()));
  m.avg_quantity = active > 0 ? math::round2(active_quantity / active) : 0.0;
  m.unique_stocks_traded = static_cast<int>(symbols.size());

  if (sells > 0) {
    m.buy_to_sell_ratio =
        math::round2(static_cast<double>(buys) / static_cast<double>(sells));
  } else if (buys > 0) {
    m.buy_to_sell_ratio = std::numeric_limits<double>::infinity();
  } else {
    m.buy_to_sell_ratio = 0.0;
  }
  return m;
}

// -----------------------------------------------------------------------------
// categorizeSymbol(): static symbol -> market category lookup
// -----------------------------------------------------------------------------
std::string RoundAnalyticsEngine::categorizeSymbol(const std::string& symbol) {
  static const std::vector<std::pair<std::vector<std::string>, std::string>>
      kCategories = {
          {{"AAPLx", "AMZNx", "GOOGLx", "METAx", "MSFTx", "NVDAx", "NFLXx",
            "CRMx", "PLTRx"},
           "technology"},
          {{"COINx", "MSTRx", "HOODx", "CRCLx"}, "crypto-adjacent"},
          {{"SPYx", "QQQx"}, "index-etf"},
          {{"LLYx"}, "pharma"},
          {{"GMEx"}, "meme"},
          {{"AVGOx"}, "semiconductors"},
          {{"JPMx"}, "finance"},
      };

  for (const auto& [symbols, category] : kCategories) {
    if (std::find(symbols.begin(), symbols.end(), symbol) != symbols.end()) {
      return category;
    }
  }
  return "other";
}

// -----------------------------------------------------------------------------
// computeAgentTrends()
// -----------------------------------------------------------------------------
std::vector<domain::AgentPerformanceTrend>
RoundAnalyticsEngine::computeAgentTrends(std::size_t window_size) const {
  std::shared_lock lock(mutex_);
  return computeAgentTrendsLocked(window_size);
}

std::vector<domain::AgentPerformanceTrend>
RoundAnalyticsEngine::computeAgentTrendsLocked(std::size_t window_size) const {
  // Agents in order of first appearance.
  std::vector<std::string> agent_ids;
  std::unordered_set<std::string> seen;
  for (const auto& round : history_) {
    for (const auto& score : round.quality.agent_scores) {
      if (seen.insert(score.agent_id).second) {
        agent_ids.push_back(score.agent_id);
      }
    }
  }

  std::vector<domain::AgentPerformanceTrend> trends;

  for (const auto& agent_id : agent_ids) {
    std::vector<domain::RoundTrendPoint> points;
    for (const auto& round : history_) {
      if (const auto* score = findAgentScore(round, agent_id)) {
        domain::RoundTrendPoint p;
        p.round_id = round.round_id;
        p.action = domain::toString(score->action);
        p.confidence = score->confidence;
        p.executed = score->factors.execution_success == kExecutionExecuted;
        p.quality_score = score->quality_score;
        points.push_back(std::move(p));
      }
    }
    if (points.size() > window_size) {
      points.erase(points.begin(),
                   points.end() - static_cast<std::ptrdiff_t>(window_size));
    }
    if (points.size() < kMinRoundsForTrend) {
      continue;
    }

    std::vector<double> qualities;
    std::vector<double> confidences;
    int successes = 0;
    for (const auto& p : points) {
      qualities.push_back(p.quality_score);
      confidences.push_back(p.confidence);
      if (p.executed) {
        ++successes;
      }
    }

    int streak = 0;
    for (auto it = points.rbegin(); it != points.rend() && it->executed;
         ++it) {
      ++streak;
    }

    const double trend_score = math::linearTrend(qualities);

    domain::AgentPerformanceTrend trend;
    trend.agent_id = agent_id;
    auto name_it = agent_names_.find(agent_id);
    trend.agent_name = name_it != agent_names_.end() ? name_it->second
                                                     : agent_id;
    trend.trend = trend_score > kTrendThreshold ? domain::TrendDirection::Improving
                  : trend_score < -kTrendThreshold
                      ? domain::TrendDirection::Declining
                      : domain::TrendDirection::Stable;
    trend.trend_score = math::round3(trend_score);
    trend.moving_avg_confidence = math::round3(math::mean(confidences));
    trend.moving_avg_quality = math::round1(math::mean(qualities));
    trend.current_execution_streak = streak;
    trend.execution_success_rate = math::round3(
        static_cast<double>(successes) / static_cast<double>(points.size()));
    trend.recent_rounds = std::move(points);
    trends.push_back(std::move(trend));
  }

  return trends;
}

// -----------------------------------------------------------------------------
// generateAnalyticsSummary()
// -----------------------------------------------------------------------------
domain::AnalyticsSummary RoundAnalyticsEngine::generateAnalyticsSummary(
    int period_days) const {
  const std::int64_t now = clock_.now_ms();
  const std::int64_t cutoff = now - period_days * kMsPerDay;

  std::shared_lock lock(mutex_);

  domain::AnalyticsSummary summary;
  summary.generated_at_ms = now;
  summary.period_start_ms = cutoff;
  summary.period_end_ms = now;

  std::vector<const domain::RoundAnalytics*> rounds;
  for (const auto& r : history_) {
    if (r.timestamp_ms >= cutoff) {
      rounds.push_back(&r);
    }
  }
  if (rounds.empty()) {
    return summary;
  }

  const double n = static_cast<double>(rounds.size());
  double participation = 0.0;
  double execution = 0.0;
  double quality = 0.0;
  double usdc = 0.0;
  int unanimous = 0;
  int split = 0;
  for (const auto* r : rounds) {
    participation += r->participation.participation_rate;
    execution += r->participation.execution_rate;
    quality += r->quality.round_quality_score;
    usdc += r->metrics.total_usdc_traded;
    if (r->consensus.type == domain::ConsensusType::Unanimous) ++unanimous;
    if (r->consensus.type == domain::ConsensusType::Split) ++split;
  }
  const double avg_participation = participation / n;
  const double avg_execution = execution / n;
  const double unanimous_rate = unanimous / n;

  summary.total_rounds_analyzed = static_cast<int>(rounds.size());
  summary.system.avg_participation_rate = math::round3(avg_participation);
  summary.system.avg_execution_rate = math::round3(avg_execution);
  summary.system.avg_round_quality = math::round1(quality / n);
  summary.system.total_usdc_traded = math::round2(usdc);
  summary.system.unanimous_round_rate = math::round3(unanimous_rate);
  summary.system.split_round_rate = math::round3(split / n);

  summary.agent_trends = computeAgentTrendsLocked(20);

  using domain::PatternSignificance;
  if (avg_participation < 0.5) {
    summary.patterns.push_back(
        {"low_participation",
         "Low participation rate (" + math::toFixed(avg_participation * 100, 0) +
             "%) - agents are mostly holding",
         PatternSignificance::Medium});
  }
  if (avg_execution < 0.8 && avg_participation > 0.3) {
    summary.patterns.push_back(
        {"execution_failures",
         "Execution success rate " + math::toFixed(avg_execution * 100, 0) +
             "% - investigate trade failures",
         PatternSignificance::High});
  }
  if (unanimous_rate > 0.5) {
    summary.patterns.push_back(
        {"high_agreement",
         math::toFixed(unanimous_rate * 100, 0) +
             "% of rounds are unanimous - possible herding risk",
         PatternSignificance::Medium});
  }

  std::string declining_names;
  int declining = 0;
  for (const auto& t : summary.agent_trends) {
    if (t.trend == domain::TrendDirection::Declining) {
      declining_names += (declining == 0 ? "" : ", ") + t.agent_name;
      ++declining;
    }
  }
  if (declining > 0) {
    summary.patterns.push_back(
        {"declining_agents", declining_names + " showing declining performance",
         declining >= 2 ? PatternSignificance::High : PatternSignificance::Low});
  }

  std::vector<const domain::RoundAnalytics*> by_quality = rounds;
  std::stable_sort(by_quality.begin(), by_quality.end(),
                   [](const auto* a, const auto* b) {
                     return a->quality.round_quality_score >
                            b->quality.round_quality_score;
                   });
  const auto* best = by_quality.front();
  const auto* worst = by_quality.back();

  summary.best_round = domain::RoundHighlight{
      best->round_id, best->quality.round_quality_score,
      "Quality " + math::toFixed(best->quality.round_quality_score, 0) + ", " +
          std::to_string(best->participation.active_agents) + "/" +
          std::to_string(best->participation.total_agents) + " active, $" +
          math::toFixed(best->metrics.total_usdc_traded, 2) + " traded"};
  if (worst != best) {
    summary.worst_round = domain::RoundHighlight{
        worst->round_id, worst->quality.round_quality_score,
        "Quality " + math::toFixed(worst->quality.round_quality_score, 0) +
            ", " + std::to_string(worst->participation.active_agents) + "/" +
            std::to_string(worst->participation.total_agents) + " active"};
  }

  return summary;
}

// -----------------------------------------------------------------------------
// getAnalyticsStatus()
// -----------------------------------------------------------------------------
domain::AnalyticsStatus RoundAnalyticsEngine::getAnalyticsStatus() const {
  std::shared_lock lock(mutex_);

  domain::AnalyticsStatus status;
  status.total_rounds_analyzed = static_cast<int>(history_.size());
  if (history_.empty()) {
    return status;
  }

  status.oldest_round = history_.front().round_id;
  status.newest_round = history_.back().round_id;

  double quality = 0.0;
  double participation = 0.0;
  for (const auto& r : history_) {
    quality += r.quality.round_quality_score;
    participation += r.participation.participation_rate;
  }
  const double n = static_cast<double>(history_.size());
  status.average_round_quality = math::round1(quality / n);
  status.average_participation = math::round3(participation / n);
  return status;
}

}  // namespace arena
