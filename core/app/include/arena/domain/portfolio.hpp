#pragma once

#include <cstdint>
#include <string>

namespace arena {
namespace domain {

// Current holding as reported by portfolio storage.
struct PortfolioPosition {
  std::string symbol;               // e.g. "NVDAx"
  double quantity{0.0};
  double average_cost_basis{0.0};   // USDC per unit
};

enum class TradeSide { Buy, Sell };

inline const char* toString(TradeSide s) {
  return s == TradeSide::Buy ? "buy" : "sell";
}

// Executed trade as reported by portfolio storage.
struct TradeRecord {
  TradeSide side{TradeSide::Buy};
  double usdc_amount{0.0};
  std::int64_t created_at_ms{0};
};

}  // namespace domain
}  // namespace arena
