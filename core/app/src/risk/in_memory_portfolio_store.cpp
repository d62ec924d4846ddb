#include "arena/risk/in_memory_portfolio_store.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <utility>

namespace arena {

std::vector<domain::PortfolioPosition> InMemoryPortfolioStore::getPositions(
    const std::string& agent_id) const {
  std::lock_guard lock(mutex_);
  auto it = books_.find(agent_id);
  if (it == books_.end()) {
    return {};
  }
  return it->second.positions;
}

std::vector<domain::TradeRecord> InMemoryPortfolioStore::getRecentTrades(
    const std::string& agent_id, std::size_t limit) const {
  std::lock_guard lock(mutex_);
  auto it = books_.find(agent_id);
  if (it == books_.end()) {
    return {};
  }
  const auto& trades = it->second.trades;
  std::vector<domain::TradeRecord> recent;
  for (auto rit = trades.rbegin(); rit != trades.rend() && recent.size() < limit;
       ++rit) {
    recent.push_back(*rit);
  }
  return recent;
}

void InMemoryPortfolioStore::setPositions(
    const std::string& agent_id,
    std::vector<domain::PortfolioPosition> positions) {
  std::lock_guard lock(mutex_);
  books_[agent_id].positions = std::move(positions);
}

void InMemoryPortfolioStore::addTrade(const std::string& agent_id,
                                      const domain::TradeRecord& trade) {
  std::lock_guard lock(mutex_);
  books_[agent_id].trades.push_back(trade);
}

// -----------------------------------------------------------------------------
// loadSnapshot(): parse fully, then swap in under the lock
// -----------------------------------------------------------------------------
void InMemoryPortfolioStore::loadSnapshot(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw StorageError("cannot open portfolio snapshot: " + path);
  }

  std::unordered_map<std::string, AgentBook> loaded;
  try {
    const nlohmann::json doc = nlohmann::json::parse(in);
    for (const auto& [agent_id, book_json] : doc.at("agents").items()) {
      AgentBook book;
      for (const auto& p : book_json.value("positions", nlohmann::json::array())) {
        domain::PortfolioPosition pos;
        pos.symbol = p.at("symbol").get<std::string>();
        pos.quantity = p.at("quantity").get<double>();
        pos.average_cost_basis = p.at("average_cost_basis").get<double>();
        book.positions.push_back(std::move(pos));
      }
      for (const auto& t : book_json.value("trades", nlohmann::json::array())) {
        domain::TradeRecord trade;
        trade.side = t.at("side").get<std::string>() == "sell"
                         ? domain::TradeSide::Sell
                         : domain::TradeSide::Buy;
        trade.usdc_amount = t.at("usdc_amount").get<double>();
        trade.created_at_ms = t.value("created_at_ms", std::int64_t{0});
        book.trades.push_back(trade);
      }
      loaded.emplace(agent_id, std::move(book));
    }
  } catch (const nlohmann::json::exception& e) {
    throw StorageError("malformed portfolio snapshot " + path + ": " +
                       e.what());
  }

  std::lock_guard lock(mutex_);
  books_ = std::move(loaded);
}

}  // namespace arena
