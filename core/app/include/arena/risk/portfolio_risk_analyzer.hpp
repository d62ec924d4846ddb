#pragma once

#include "arena/concurrent/bounded_history.hpp"
#include "arena/domain/portfolio.hpp"
#include "arena/domain/risk_report.hpp"
#include "arena/risk/i_portfolio_store.hpp"
#include "arena/time/i_time_provider.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <unordered_map>
#include <vector>

namespace arena {

// -----------------------------------------------------------------------------
// PortfolioRiskAnalyzer - on-demand risk report per agent
// -----------------------------------------------------------------------------
//
// @brief  Builds a PortfolioRiskReport (VaR/CVaR, beta, sector
//         concentration, position risk, drawdown, stress tests and a 0-100
//         composite score) from an agent's positions, recent trades and the
//         portfolio values observed on previous calls.
//
// @details
// Inputs:
//   - positions and up to 100 recent trades read from IPortfolioStore;
//   - the per-agent portfolio value history (cap 500), one point per call;
//   - the market-proxy return series fed by recordMarketReturn() (cap 500).
//
// Daily returns:
//   With at least two value points (the current one included) returns are
//   the percentage deltas of consecutive values. Otherwise they are
//   synthesized from the first 30 trades with a seeded std::mt19937, and
//   a fixed five-point series is used when there are no trades either.
//
// Composite risk score (clamped to 0-100):
//   VaR tier (0-25), beta distance from 1.0 (0-15), top-sector allocation
//   (0-20), max drawdown percent (0-20), cash buffer (0-10), high-risk
//   position count (0-10). CRITICAL >= 75, HIGH >= 50, MODERATE >= 25.
//
// Thread model:
//   Lock granularity is per agentId. Storage is read before any lock is
//   taken; the report is computed into locals under the agent's mutex and
//   only then committed to the agent history and the global counters.
//   A StorageError thrown by the store escapes before anything is mutated.
//   Analyses for different agents run in parallel.
//
// Ownership:
//   Borrows the store and the clock; both must outlive the analyzer.
// -----------------------------------------------------------------------------
class PortfolioRiskAnalyzer {
 public:
  static constexpr std::size_t kMaxHistoryPoints = 500;
  static constexpr std::size_t kMaxReturns = 500;
  static constexpr std::size_t kMaxRecentTrades = 100;

  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @param  store  Source of positions and trades (non-owning).
  // @param  clock  Time source for value history and drawdown duration.
  // @param  seed   Seed for synthetic returns; 0 seeds from
  //                std::random_device.
  // -------------------------------------------------------------------------
  PortfolioRiskAnalyzer(const IPortfolioStore& store, const ITimeProvider& clock,
                        std::uint32_t seed = 0);

  PortfolioRiskAnalyzer(const PortfolioRiskAnalyzer&) = delete;
  PortfolioRiskAnalyzer& operator=(const PortfolioRiskAnalyzer&) = delete;
  PortfolioRiskAnalyzer(PortfolioRiskAnalyzer&&) = delete;
  PortfolioRiskAnalyzer& operator=(PortfolioRiskAnalyzer&&) = delete;

  // -------------------------------------------------------------------------
  // analyzePortfolioRisk(agent_id, portfolio_value, cash_balance)
  // -------------------------------------------------------------------------
  // @brief  Computes a full risk report and records portfolio_value into
  //         the agent's value history.
  //
  // @throws StorageError from the store; no state changes in that case.
  //
  // Thread-safety: Safe from any thread. Serialized per agent.
  // Side-effects:  Appends to the agent's value history and updates the
  //                analyzer statistics.
  // -------------------------------------------------------------------------
  domain::PortfolioRiskReport analyzePortfolioRisk(const std::string& agent_id,
                                                   double portfolio_value,
                                                   double cash_balance);

  // Appends one market-proxy daily return (percent) for beta estimation.
  void recordMarketReturn(double return_percent);

  domain::RiskAnalyzerStats getRiskAnalyzerStats() const;

  // Recorded portfolio values for one agent (0 if never analyzed).
  std::size_t valueHistorySize(const std::string& agent_id) const;

  // Clears counters, market returns and every agent's history.
  void resetRiskAnalyzer();

  // -------------------------------------------------------------------------
  // Stateless building blocks (exposed for unit tests)
  // -------------------------------------------------------------------------
  struct VaRResult {
    double var95{0.0};
    double cvar95{0.0};
  };

  struct RiskScore {
    int score{0};
    domain::RiskLevel level{domain::RiskLevel::Low};
    std::vector<std::string> warnings;
  };

  struct ValuePoint {
    double value{0.0};
    std::int64_t timestamp_ms{0};
  };

  // Historical simulation at the 5th percentile. Defaults 2.5 / 3.5 below
  // five samples.
  static VaRResult computeVaR(const std::vector<double>& returns);

  static double computeBeta(const std::vector<double>& portfolio_returns,
                            const std::vector<double>& market_returns);

  static std::vector<domain::SectorConcentration> computeSectorConcentration(
      const std::vector<domain::PortfolioPosition>& positions,
      double portfolio_value);

  static std::vector<domain::PositionRisk> computePositionRisk(
      const std::vector<domain::PortfolioPosition>& positions,
      double portfolio_value);

  // `history` must already contain the current point as its last element.
  static domain::DrawdownAnalysis computeDrawdown(
      const std::vector<ValuePoint>& history, double current_value,
      std::int64_t now_ms);

  static std::vector<domain::StressTestResult> runStressTests(
      const std::vector<domain::PortfolioPosition>& positions,
      double portfolio_value);

  static RiskScore computeRiskScore(
      double var95, double beta,
      const std::vector<domain::SectorConcentration>& sectors,
      const domain::DrawdownAnalysis& drawdown,
      const std::vector<domain::PositionRisk>& position_risk,
      double cash_percent);

  static std::string sectorFor(const std::string& symbol);
  static double estimateStockVolatility(const std::string& symbol);

 private:
  struct AgentState {
    std::mutex mutex;
    BoundedHistory<ValuePoint> values{kMaxHistoryPoints};
  };

  AgentState& agentState(const std::string& agent_id);

  std::vector<double> syntheticReturns(
      const std::vector<domain::TradeRecord>& trades, double current_value);

  const IPortfolioStore& store_;
  const ITimeProvider& clock_;

  mutable std::mutex agents_mutex_;
  std::unordered_map<std::string, std::unique_ptr<AgentState>> agents_;

  std::mutex rng_mutex_;
  std::mt19937 rng_;

  mutable std::mutex stats_mutex_;
  BoundedHistory<double> market_returns_{kMaxReturns};
  BoundedHistory<int> risk_scores_{kMaxReturns};
  int total_analyses_{0};
  std::map<std::string, int> analyses_by_agent_;
  std::optional<std::int64_t> last_analysis_at_ms_;
  int critical_alerts_{0};
};

}  // namespace arena
