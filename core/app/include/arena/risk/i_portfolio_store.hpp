#pragma once

#include "arena/domain/portfolio.hpp"

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace arena {

// Raised by IPortfolioStore implementations when positions or trades cannot
// be read. Fails only the in-flight risk analysis.
class StorageError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// -----------------------------------------------------------------------------
// IPortfolioStore - read-only access to an agent's holdings and trades
// -----------------------------------------------------------------------------
//
// @brief  The contract PortfolioRiskAnalyzer uses to fetch the inputs of a
//         risk report from whatever owns the book of record.
//
// @details
// The engine never persists positions or trades itself. A production
// deployment backs this interface with a database; tests and the standalone
// server use InMemoryPortfolioStore.
//
// Calling convention:
//   Both methods are called once per analyzePortfolioRisk() call, before the
//   analyzer touches any of its own state. They may block on I/O.
//
// Error model:
//   Implementations throw StorageError on failure. The analyzer lets it
//   propagate unchanged.
//
// Thread model:
//   Called concurrently from any thread that requests a risk report.
//   Implementations must be thread-safe.
//
// Ownership:
//   PortfolioRiskAnalyzer holds a non-owning reference. The caller keeps the
//   store alive for the analyzer's lifetime.
// -----------------------------------------------------------------------------
class IPortfolioStore {
 public:
  virtual ~IPortfolioStore() = default;

  // -------------------------------------------------------------------------
  // getPositions(agent_id)
  // -------------------------------------------------------------------------
  // @brief  Current holdings of one agent. An empty vector means a flat book.
  //
  // Thread-safety: Must be safe from any thread.
  // Side-effects:  Implementation-defined (may perform I/O).
  // -------------------------------------------------------------------------
  virtual std::vector<domain::PortfolioPosition> getPositions(
      const std::string& agent_id) const = 0;

  // -------------------------------------------------------------------------
  // getRecentTrades(agent_id, limit)
  // -------------------------------------------------------------------------
  // @brief  Up to `limit` executed trades of one agent, newest first.
  //
  // Thread-safety: Must be safe from any thread.
  // Side-effects:  Implementation-defined (may perform I/O).
  // -------------------------------------------------------------------------
  virtual std::vector<domain::TradeRecord> getRecentTrades(
      const std::string& agent_id, std::size_t limit) const = 0;
};

}  // namespace arena
