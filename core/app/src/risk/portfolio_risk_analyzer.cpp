#include "arena/risk/portfolio_risk_analyzer.hpp"

#include "arena/math/stats.hpp"
#include "arena/time/time_utils.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <utility>

namespace arena {

namespace {

// VaR / CVaR
constexpr std::size_t kVarMinSamples = 5;
constexpr double kVarDefault = 2.5;
constexpr double kCvarDefault = 3.5;
constexpr double kVarPercentile = 0.05;

// Beta vs. market proxy
constexpr std::size_t kBetaMinSamples = 5;
constexpr double kBetaDefault = 1.0;
constexpr double kBetaMin = -3.0;
constexpr double kBetaMax = 3.0;

// Position risk classification
constexpr double kWeightHigh = 20.0;
constexpr double kWeightModerate = 10.0;
constexpr double kVolatilityHigh = 3.0;
constexpr double kVolatilityModerate = 2.0;
constexpr double kMaxDrawdownMultiplier = 2.5;
constexpr double kDefaultStockVolatility = 2.5;

// Synthetic returns
constexpr std::size_t kSyntheticMaxTrades = 30;
constexpr double kSyntheticOffset = 0.48;
constexpr double kSyntheticFallbackValue = 10000.0;
const std::vector<double> kDefaultReturnSeries = {0.5, -0.3, 0.2, -0.1, 0.4};

// Risk level thresholds
constexpr int kLevelCritical = 75;
constexpr int kLevelHigh = 50;
constexpr int kLevelModerate = 25;

constexpr double kAffectedPositionMinImpact = 1.0;

const std::unordered_map<std::string, std::string>& sectorMap() {
  static const std::unordered_map<std::string, std::string> kMap = {
      {"AAPLx", "Technology"},
      {"AMZNx", "Consumer Cyclical"},
      {"GOOGLx", "Technology"},
      {"METAx", "Technology"},
      {"MSFTx", "Technology"},
      {"NVDAx", "Technology"},
      {"TSLAx", "Consumer Cyclical"},
      {"SPYx", "Index (Diversified)"},
      {"QQQx", "Index (Tech-Heavy)"},
      {"COINx", "Financial Services"},
      {"CRCLx", "Financial Services"},
      {"MSTRx", "Technology"},
      {"AVGOx", "Technology"},
      {"JPMx", "Financial Services"},
      {"HOODx", "Financial Services"},
      {"LLYx", "Healthcare"},
      {"CRMx", "Technology"},
      {"NFLXx", "Communication Services"},
      {"PLTRx", "Technology"},
      {"GMEx", "Consumer Cyclical"},
  };
  return kMap;
}

// Heuristic daily volatility, percent.
const std::unordered_map<std::string, double>& volatilityMap() {
  static const std::unordered_map<std::string, double> kMap = {
      {"NVDAx", 3.5}, {"TSLAx", 3.8}, {"GMEx", 4.5},  {"COINx", 4.0},
      {"MSTRx", 4.2}, {"HOODx", 3.5}, {"PLTRx", 3.2}, {"AMZNx", 2.2},
      {"METAx", 2.5}, {"GOOGLx", 2.0}, {"AAPLx", 1.8}, {"MSFTx", 1.7},
      {"JPMx", 1.9},  {"SPYx", 1.2},  {"QQQx", 1.5},  {"LLYx", 2.0},
      {"CRMx", 2.3},  {"NFLXx", 2.8}, {"AVGOx", 2.5}, {"CRCLx", 2.0},
  };
  return kMap;
}

struct StressScenario {
  const char* name;
  const char* description;
  std::unordered_map<std::string, double> shocks;  // sector -> percent
};

const std::vector<StressScenario>& stressScenarios() {
  static const std::vector<StressScenario> kScenarios = {
      {"Tech Crash (-20%)",
       "Major tech selloff: all tech stocks drop 20%, financials drop 5%",
       {{"Technology", -20},
        {"Financial Services", -5},
        {"Communication Services", -15},
        {"Consumer Cyclical", -10},
        {"Healthcare", -3},
        {"Index (Diversified)", -12},
        {"Index (Tech-Heavy)", -18}}},
      {"Market Rally (+10%)",
       "Broad market rally: all sectors gain 8-12%",
       {{"Technology", 12},
        {"Financial Services", 8},
        {"Communication Services", 10},
        {"Consumer Cyclical", 10},
        {"Healthcare", 7},
        {"Index (Diversified)", 10},
        {"Index (Tech-Heavy)", 11}}},
      {"Interest Rate Shock",
       "Unexpected rate hike: growth stocks drop, financials rally",
       {{"Technology", -12},
        {"Financial Services", 5},
        {"Communication Services", -8},
        {"Consumer Cyclical", -6},
        {"Healthcare", -3},
        {"Index (Diversified)", -5},
        {"Index (Tech-Heavy)", -10}}},
      {"Crypto Contagion",
       "Crypto market crash drags down crypto-adjacent stocks",
       {{"Technology", -5},
        {"Financial Services", -15},
        {"Communication Services", -3},
        {"Consumer Cyclical", -5},
        {"Healthcare", -1},
        {"Index (Diversified)", -4},
        {"Index (Tech-Heavy)", -6}}},
      {"Black Swan (-30%)",
       "Severe market crash: all stocks drop 25-35%",
       {{"Technology", -30},
        {"Financial Services", -25},
        {"Communication Services", -28},
        {"Consumer Cyclical", -32},
        {"Healthcare", -20},
        {"Index (Diversified)", -27},
        {"Index (Tech-Heavy)", -32}}},
  };
  return kScenarios;
}

double positionValue(const domain::PortfolioPosition& p) {
  return p.quantity * p.average_cost_basis;
}

// Percent with two decimals: round(x * 10000) / 100.
double ratioToPercent2(double ratio) {
  return math::roundHalfUp(ratio * 10000.0) / 100.0;
}

std::uint32_t resolveSeed(std::uint32_t seed) {
  if (seed != 0) {
    return seed;
  }
  std::random_device rd;
  return rd();
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
PortfolioRiskAnalyzer::PortfolioRiskAnalyzer(const IPortfolioStore& store,
                                             const ITimeProvider& clock,
                                             std::uint32_t seed)
    : store_(store), clock_(clock), rng_(resolveSeed(seed)) {}

// -----------------------------------------------------------------------------
// analyzePortfolioRisk(): read storage -> compute locals -> commit
// -----------------------------------------------------------------------------
domain::PortfolioRiskReport PortfolioRiskAnalyzer::analyzePortfolioRisk(
    const std::string& agent_id, double portfolio_value, double cash_balance) {
  // Storage first. A StorageError leaves every member untouched.
  const auto positions = store_.getPositions(agent_id);
  const auto trades = store_.getRecentTrades(agent_id, kMaxRecentTrades);

  AgentState& state = agentState(agent_id);
  std::lock_guard agent_lock(state.mutex);

  const std::int64_t now = clock_.now_ms();
  const ValuePoint current{portfolio_value, now};

  std::vector<ValuePoint> history = state.values.toVector();
  history.push_back(current);
  if (history.size() > kMaxHistoryPoints) {
    history.erase(history.begin());
  }

  std::vector<double> daily_returns;
  const bool from_history = history.size() >= 2;
  if (from_history) {
    for (std::size_t i = 1; i < history.size(); ++i) {
      const double prev = history[i - 1].value;
      if (prev > 0.0) {
        daily_returns.push_back((history[i].value - prev) / prev * 100.0);
      }
    }
  } else {
    daily_returns = syntheticReturns(trades, portfolio_value);
  }

  std::vector<double> market;
  {
    std::lock_guard lock(stats_mutex_);
    market = market_returns_.toVector();
  }

  domain::PortfolioRiskReport report;
  report.agent_id = agent_id;

  const VaRResult var = computeVaR(daily_returns);
  report.var95 = var.var95;
  report.cvar95 = var.cvar95;
  report.var95_dollar = math::roundHalfUp(var.var95 * portfolio_value / 100.0);
  report.cvar95_dollar =
      math::roundHalfUp(var.cvar95 * portfolio_value / 100.0);
  report.beta = computeBeta(daily_returns, market);
  report.sector_concentration =
      computeSectorConcentration(positions, portfolio_value);
  report.position_risk = computePositionRisk(positions, portfolio_value);
  report.drawdown = computeDrawdown(history, portfolio_value, now);
  report.stress_tests = runStressTests(positions, portfolio_value);

  // A zero-value portfolio has no buying-power risk to score.
  const double cash_percent =
      portfolio_value > 0.0 ? cash_balance / portfolio_value * 100.0 : 100.0;
  RiskScore score =
      computeRiskScore(report.var95, report.beta, report.sector_concentration,
                       report.drawdown, report.position_risk, cash_percent);
  report.risk_score = score.score;
  report.risk_level = score.level;
  report.warnings = std::move(score.warnings);
  report.generated_at_ms = now;
  report.portfolio_value = math::round2(portfolio_value);

  // Commit.
  state.values.push(current);
  {
    std::lock_guard lock(stats_mutex_);
    ++total_analyses_;
    ++analyses_by_agent_[agent_id];
    risk_scores_.push(report.risk_score);
    last_analysis_at_ms_ = now;
    if (report.risk_level == domain::RiskLevel::Critical) {
      ++critical_alerts_;
    }
  }

  if (report.risk_level == domain::RiskLevel::Critical) {
    std::cout << "[RiskAnalyzer] " << agent_id << " risk score "
              << report.risk_score << " (CRITICAL)\n";
  }

  return report;
}

// -----------------------------------------------------------------------------
// recordMarketReturn()
// -----------------------------------------------------------------------------
void PortfolioRiskAnalyzer::recordMarketReturn(double return_percent) {
  std::lock_guard lock(stats_mutex_);
  market_returns_.push(return_percent);
}

// -----------------------------------------------------------------------------
// getRiskAnalyzerStats()
// -----------------------------------------------------------------------------
domain::RiskAnalyzerStats PortfolioRiskAnalyzer::getRiskAnalyzerStats() const {
  std::lock_guard lock(stats_mutex_);
  domain::RiskAnalyzerStats stats;
  stats.total_analyses = total_analyses_;
  stats.analyses_by_agent = analyses_by_agent_;
  if (!risk_scores_.empty()) {
    double total = 0.0;
    for (int s : risk_scores_) {
      total += s;
    }
    stats.average_risk_score = static_cast<int>(
        math::roundHalfUp(total / static_cast<double>(risk_scores_.size())));
  }
  stats.last_analysis_at_ms = last_analysis_at_ms_;
  stats.critical_alerts = critical_alerts_;
  return stats;
}

// -----------------------------------------------------------------------------
// resetRiskAnalyzer(): agent entries stay allocated, their contents go
// -----------------------------------------------------------------------------
void PortfolioRiskAnalyzer::resetRiskAnalyzer() {
  {
    std::lock_guard lock(agents_mutex_);
    for (auto& [id, state] : agents_) {
      std::lock_guard agent_lock(state->mutex);
      state->values.clear();
    }
  }

  std::lock_guard lock(stats_mutex_);
  market_returns_.clear();
  risk_scores_.clear();
  total_analyses_ = 0;
  analyses_by_agent_.clear();
  last_analysis_at_ms_.reset();
  critical_alerts_ = 0;
}

std::size_t PortfolioRiskAnalyzer::valueHistorySize(
    const std::string& agent_id) const {
  std::lock_guard lock(agents_mutex_);
  auto it = agents_.find(agent_id);
  if (it == agents_.end()) {
    return 0;
  }
  std::lock_guard agent_lock(it->second->mutex);
  return it->second->values.size();
}

PortfolioRiskAnalyzer::AgentState& PortfolioRiskAnalyzer::agentState(
    const std::string& agent_id) {
  std::lock_guard lock(agents_mutex_);
  auto& slot = agents_[agent_id];
  if (!slot) {
    slot = std::make_unique<AgentState>();
  }
  return *slot;
}

// -----------------------------------------------------------------------------
// syntheticReturns(): approximation used until two value points exist
// -----------------------------------------------------------------------------
std::vector<double> PortfolioRiskAnalyzer::syntheticReturns(
    const std::vector<domain::TradeRecord>& trades, double current_value) {
  const double denominator =
      current_value != 0.0 ? current_value : kSyntheticFallbackValue;
  const std::size_t count = std::min(trades.size(), kSyntheticMaxTrades);

  std::vector<double> returns;
  returns.reserve(count);
  {
    std::lock_guard lock(rng_mutex_);
    std::uniform_real_distribution<double> unit(0.0, 1.0);
    for (std::size_t i = 0; i < count; ++i) {
      const double draw = unit(rng_);
      returns.push_back((draw - kSyntheticOffset) * trades[i].usdc_amount /
                        denominator * 100.0);
    }
  }

  if (returns.empty()) {
    return kDefaultReturnSeries;
  }
  return returns;
}

// -----------------------------------------------------------------------------
// computeVaR(): historical simulation
// -----------------------------------------------------------------------------
PortfolioRiskAnalyzer::VaRResult PortfolioRiskAnalyzer::computeVaR(
    const std::vector<double>& returns) {
  if (returns.size() < kVarMinSamples) {
    return VaRResult{kVarDefault, kCvarDefault};
  }

  std::vector<double> sorted = returns;
  std::sort(sorted.begin(), sorted.end());

  const auto index = static_cast<std::size_t>(
      std::floor(static_cast<double>(sorted.size()) * kVarPercentile));
  const double var95 = std::fabs(sorted[index]);

  double tail = 0.0;
  for (std::size_t i = 0; i <= index; ++i) {
    tail += sorted[i];
  }
  const double cvar95 = std::fabs(tail / static_cast<double>(index + 1));

  return VaRResult{math::round2(var95), math::round2(cvar95)};
}

// -----------------------------------------------------------------------------
// computeBeta(): cov(p, m) / var(m) over the common tail
// -----------------------------------------------------------------------------
double PortfolioRiskAnalyzer::computeBeta(
    const std::vector<double>& portfolio_returns,
    const std::vector<double>& market_returns) {
  if (portfolio_returns.size() < kBetaMinSamples ||
      market_returns.size() < kBetaMinSamples) {
    return kBetaDefault;
  }

  const std::size_t n =
      std::min(portfolio_returns.size(), market_returns.size());
  const std::vector<double> p(portfolio_returns.end() - static_cast<std::ptrdiff_t>(n),
                              portfolio_returns.end());
  const std::vector<double> m(
      market_returns.end() - static_cast<std::ptrdiff_t>(n), market_returns.end());

  const double p_mean = math::mean(p);
  const double m_mean = math::mean(m);

  double covariance = 0.0;
  double market_variance = 0.0;
  for (std::size_t i = 0; i < n; ++i) {
    covariance += (p[i] - p_mean) * (m[i] - m_mean);
    market_variance += (m[i] - m_mean) * (m[i] - m_mean);
  }

  if (market_variance == 0.0) {
    return kBetaDefault;
  }
  return math::round2(
      std::clamp(covariance / market_variance, kBetaMin, kBetaMax));
}

// -----------------------------------------------------------------------------
// computeSectorConcentration()
// -----------------------------------------------------------------------------
std::vector<domain::SectorConcentration>
PortfolioRiskAnalyzer::computeSectorConcentration(
    const std::vector<domain::PortfolioPosition>& positions,
    double portfolio_value) {
  // Sectors in order of first appearance.
  std::vector<domain::SectorConcentration> sectors;
  for (const auto& pos : positions) {
    const std::string sector = sectorFor(pos.symbol);
    auto it = std::find_if(sectors.begin(), sectors.end(),
                           [&](const domain::SectorConcentration& s) {
                             return s.sector == sector;
                           });
    if (it == sectors.end()) {
      sectors.push_back(domain::SectorConcentration{sector, {}, 0.0, 0.0, 0.0});
      it = sectors.end() - 1;
    }
    it->symbols.push_back(pos.symbol);
    it->value += positionValue(pos);
  }

  for (auto& s : sectors) {
    const double allocation =
        portfolio_value > 0.0 ? s.value / portfolio_value * 100.0 : 0.0;
    s.allocation = math::round1(allocation);
    s.hhi_contribution = math::roundHalfUp(allocation * allocation);
    s.value = math::round2(s.value);
  }

  std::stable_sort(sectors.begin(), sectors.end(),
                   [](const domain::SectorConcentration& a,
                      const domain::SectorConcentration& b) {
                     return a.allocation > b.allocation;
                   });
  return sectors;
}

// -----------------------------------------------------------------------------
// computePositionRisk()
// -----------------------------------------------------------------------------
std::vector<domain::PositionRisk> PortfolioRiskAnalyzer::computePositionRisk(
    const std::vector<domain::PortfolioPosition>& positions,
    double portfolio_value) {
  std::vector<domain::PositionRisk> risks;
  risks.reserve(positions.size());

  for (const auto& pos : positions) {
    const double weight = portfolio_value > 0.0
                              ? positionValue(pos) / portfolio_value * 100.0
                              : 0.0;
    const double volatility = estimateStockVolatility(pos.symbol);

    domain::PositionRisk risk;
    risk.symbol = pos.symbol;
    risk.weight = math::round1(weight);
    risk.var_contribution = math::round2(weight * volatility / 100.0);
    risk.volatility = volatility;
    risk.unrealized_pnl = 0.0;  // needs a live price
    risk.max_drawdown = volatility * kMaxDrawdownMultiplier;
    if (weight > kWeightHigh || volatility > kVolatilityHigh) {
      risk.risk_level = domain::PositionRiskLevel::High;
    } else if (weight > kWeightModerate || volatility > kVolatilityModerate) {
      risk.risk_level = domain::PositionRiskLevel::Moderate;
    } else {
      risk.risk_level = domain::PositionRiskLevel::Low;
    }
    risks.push_back(std::move(risk));
  }
  return risks;
}

// -----------------------------------------------------------------------------
// computeDrawdown(): running peak / max drawdown over the value history
// -----------------------------------------------------------------------------
domain::DrawdownAnalysis PortfolioRiskAnalyzer::computeDrawdown(
    const std::vector<ValuePoint>& history, double current_value,
    std::int64_t now_ms) {
  domain::DrawdownAnalysis dd;
  if (history.empty()) {
    dd.peak_value = current_value;
    dd.trough_value = current_value;
    return dd;
  }

  double peak = history.front().value;
  double max_drawdown = 0.0;
  double max_drawdown_peak = peak;
  double max_drawdown_trough = peak;
  std::int64_t drawdown_start_ms = history.front().timestamp_ms;

  for (const auto& point : history) {
    if (point.value > peak) {
      peak = point.value;
      drawdown_start_ms = point.timestamp_ms;
    }
    const double drawdown = peak - point.value;
    if (drawdown > max_drawdown) {
      max_drawdown = drawdown;
      max_drawdown_peak = peak;
      max_drawdown_trough = point.value;
    }
  }

  const double current_peak = std::max(peak, current_value);
  const double current_drawdown = current_peak - current_value;
  const double max_final = std::max(max_drawdown, current_drawdown);
  const double hours =
      static_cast<double>(now_ms - drawdown_start_ms) / kMsPerHour;

  dd.current_drawdown = math::round2(current_drawdown);
  dd.current_drawdown_percent =
      current_peak > 0.0 ? ratioToPercent2(current_drawdown / current_peak)
                         : 0.0;
  dd.max_drawdown = math::round2(max_final);
  dd.max_drawdown_percent =
      max_drawdown_peak > 0.0 ? ratioToPercent2(max_final / max_drawdown_peak)
                              : 0.0;
  dd.peak_value = math::round2(current_peak);
  dd.trough_value = math::round2(std::min(max_drawdown_trough, current_value));
  dd.drawdown_duration_hours = math::round1(hours);
  dd.recovered = current_value >= max_drawdown_peak;
  return dd;
}

// -----------------------------------------------------------------------------
// runStressTests(): five fixed sector-shock scenarios
// -----------------------------------------------------------------------------
std::vector<domain::StressTestResult> PortfolioRiskAnalyzer::runStressTests(
    const std::vector<domain::PortfolioPosition>& positions,
    double portfolio_value) {
  std::vector<domain::StressTestResult> results;

  for (const auto& scenario : stressScenarios()) {
    double total_impact = 0.0;
    std::vector<domain::AffectedPosition> affected;

    for (const auto& pos : positions) {
      auto shock_it = scenario.shocks.find(sectorFor(pos.symbol));
      const double shock =
          shock_it != scenario.shocks.end() ? shock_it->second : 0.0;
      const double impact = positionValue(pos) * shock / 100.0;
      total_impact += impact;
      if (std::fabs(impact) > kAffectedPositionMinImpact) {
        affected.push_back(
            domain::AffectedPosition{pos.symbol, math::round2(impact)});
      }
    }

    std::stable_sort(affected.begin(), affected.end(),
                     [](const domain::AffectedPosition& a,
                        const domain::AffectedPosition& b) {
                       return std::fabs(a.impact) > std::fabs(b.impact);
                     });

    domain::StressTestResult result;
    result.scenario = scenario.name;
    result.description = scenario.description;
    result.portfolio_impact = math::round2(total_impact);
    result.portfolio_impact_percent =
        portfolio_value > 0.0 ? ratioToPercent2(total_impact / portfolio_value)
                              : 0.0;
    result.new_portfolio_value = math::round2(portfolio_value + total_impact);
    result.affected_positions = std::move(affected);
    results.push_back(std::move(result));
  }
  return results;
}

// -----------------------------------------------------------------------------
// computeRiskScore(): tiered points per risk factor
// -----------------------------------------------------------------------------
PortfolioRiskAnalyzer::RiskScore PortfolioRiskAnalyzer::computeRiskScore(
    double var95, double beta,
    const std::vector<domain::SectorConcentration>& sectors,
    const domain::DrawdownAnalysis& drawdown,
    const std::vector<domain::PositionRisk>& position_risk,
    double cash_percent) {
  RiskScore result;
  int score = 0;
  auto points = [](double v) { return static_cast<int>(math::roundHalfUp(v)); };

  // VaR (0-25)
  if (var95 > 5.0) {
    score += 25;
    result.warnings.push_back("Extreme VaR: potential daily loss > 5%");
  } else if (var95 > 3.0) {
    score += 18;
    result.warnings.push_back("High VaR: potential daily loss > 3%");
  } else if (var95 > 2.0) {
    score += 12;
  } else {
    score += points(var95 * 5.0);
  }

  // Beta distance from market (0-15)
  const double beta_risk = std::fabs(beta - kBetaDefault);
  if (beta_risk > 1.0) {
    score += 15;
    result.warnings.push_back("Portfolio beta " + math::toFixed(beta, 2) +
                              " - highly leveraged exposure");
  } else if (beta_risk > 0.5) {
    score += 10;
  } else {
    score += points(beta_risk * 10.0);
  }

  // Top sector concentration (0-20)
  const double top = sectors.empty() ? 0.0 : sectors.front().allocation;
  if (top > 60.0) {
    score += 20;
    result.warnings.push_back(math::toFixed(top, 0) +
                              "% in one sector - extreme concentration");
  } else if (top > 40.0) {
    score += 14;
    result.warnings.push_back(math::toFixed(top, 0) +
                              "% in top sector - concentration risk");
  } else if (top > 25.0) {
    score += 8;
  } else {
    score += points(top / 5.0);
  }

  // Max drawdown (0-20)
  const double mdd = drawdown.max_drawdown_percent;
  if (mdd > 15.0) {
    score += 20;
    result.warnings.push_back("Max drawdown " + math::toFixed(mdd, 1) +
                              "% - severe");
  } else if (mdd > 8.0) {
    score += 14;
  } else if (mdd > 4.0) {
    score += 8;
  } else {
    score += points(mdd);
  }

  // Cash buffer (0-10)
  if (cash_percent < 5.0) {
    score += 10;
    result.warnings.push_back("Cash < 5% - no buying power buffer");
  } else if (cash_percent < 15.0) {
    score += 6;
  } else if (cash_percent < 30.0) {
    score += 3;
  }

  // High-risk positions (0-10)
  const auto high_risk = std::count_if(
      position_risk.begin(), position_risk.end(),
      [](const domain::PositionRisk& p) {
        return p.risk_level == domain::PositionRiskLevel::High;
      });
  if (high_risk >= 3) {
    score += 10;
    result.warnings.push_back(std::to_string(high_risk) +
                              " high-risk positions");
  } else if (high_risk >= 1) {
    score += 5;
  }

  result.score = std::clamp(score, 0, 100);
  if (result.score >= kLevelCritical) {
    result.level = domain::RiskLevel::Critical;
  } else if (result.score >= kLevelHigh) {
    result.level = domain::RiskLevel::High;
  } else if (result.score >= kLevelModerate) {
    result.level = domain::RiskLevel::Moderate;
  } else {
    result.level = domain::RiskLevel::Low;
  }
  return result;
}

std::string PortfolioRiskAnalyzer::sectorFor(const std::string& symbol) {
  const auto& map = sectorMap();
  auto it = map.find(symbol);
  return it != map.end() ? it->second : "Other";
}

double PortfolioRiskAnalyzer::estimateStockVolatility(
    const std::string& symbol) {
  const auto& map = volatilityMap();
  auto it = map.find(symbol);
  return it != map.end() ? it->second : kDefaultStockVolatility;
}

}  // namespace arena
