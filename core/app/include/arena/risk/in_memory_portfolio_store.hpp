#pragma once

#include "arena/risk/i_portfolio_store.hpp"

#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace arena {

// -----------------------------------------------------------------------------
// InMemoryPortfolioStore - mutex-guarded IPortfolioStore
// -----------------------------------------------------------------------------
//
// @brief  Holds positions and trade records per agent in memory. Used by
//         the standalone server and by tests.
//
// @details
// Trades are kept in insertion order (oldest first) and returned newest
// first. The store can be seeded from a JSON snapshot file:
//
//   {
//     "agents": {
//       "agent-1": {
//         "positions": [ {"symbol": "NVDAx", "quantity": 2,
//                         "average_cost_basis": 120.5} ],
//         "trades":    [ {"side": "buy", "usdc_amount": 241.0,
//                         "created_at_ms": 1700000000000} ]
//       }
//     }
//   }
//
// Thread model:
//   Every method takes the same std::mutex. Safe from any thread.
// -----------------------------------------------------------------------------
class InMemoryPortfolioStore : public IPortfolioStore {
 public:
  InMemoryPortfolioStore() = default;

  InMemoryPortfolioStore(const InMemoryPortfolioStore&) = delete;
  InMemoryPortfolioStore& operator=(const InMemoryPortfolioStore&) = delete;

  std::vector<domain::PortfolioPosition> getPositions(
      const std::string& agent_id) const override;

  std::vector<domain::TradeRecord> getRecentTrades(
      const std::string& agent_id, std::size_t limit) const override;

  // Replaces all positions of one agent.
  void setPositions(const std::string& agent_id,
                    std::vector<domain::PortfolioPosition> positions);

  // Appends one executed trade.
  void addTrade(const std::string& agent_id, const domain::TradeRecord& trade);

  // -------------------------------------------------------------------------
  // loadSnapshot(path)
  // -------------------------------------------------------------------------
  // @brief  Replaces the contents of the store with the agents described in
  //         a JSON snapshot file (format above).
  //
  // @throws StorageError if the file cannot be opened or is malformed. The
  //         store is left unchanged in that case.
  // -------------------------------------------------------------------------
  void loadSnapshot(const std::string& path);

 private:
  struct AgentBook {
    std::vector<domain::PortfolioPosition> positions;
    std::vector<domain::TradeRecord> trades;
  };

  mutable std::mutex mutex_;
  std::unordered_map<std::string, AgentBook> books_;
};

}  // namespace arena
