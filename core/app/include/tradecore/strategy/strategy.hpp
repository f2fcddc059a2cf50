#pragma once

#include "tradecore/domain/admission.hpp"
#include "tradecore/domain/fill.hpp"
#include "tradecore/domain/intent.hpp"
#include "tradecore/domain/market_snapshot.hpp"
#include "tradecore/domain/order.hpp"
#include "tradecore/domain/position.hpp"

#include <string>
#include <vector>

namespace tradecore {

class OrderBook;
class PositionKeeper;

// Admission outcome for one intent, handed back to the strategy that
// emitted it before the runner moves on to its next intent.
struct IntentResult {
  domain::Intent intent;
  domain::AdmissionDecision decision;
};

// -----------------------------------------------------------------------------
// StrategyContext: what one strategy may look at
// -----------------------------------------------------------------------------
// Read-only and scoped: the strategy's own orders (by strategy id) and the
// positions of the symbols it was registered for. Other strategies' orders
// and out-of-scope symbols are invisible. Every call returns a fresh copy
// from the ledger; it may be stale by the time an intent is admitted.
// -----------------------------------------------------------------------------
class StrategyContext {
 public:
  StrategyContext(std::string strategy_id, std::vector<std::string> symbols,
                  const OrderBook& book, const PositionKeeper& positions);

  const std::string& strategyId() const { return strategy_id_; }
  const std::vector<std::string>& symbols() const { return symbols_; }

  // All orders this strategy registered that are still in the ledger.
  std::vector<domain::Order> orders() const;

  // Non-terminal orders of this strategy for one symbol.
  std::vector<domain::Order> workingOrders(const std::string& symbol) const;

  // Net position for an in-scope symbol; a flat position otherwise.
  domain::Position position(const std::string& symbol) const;

  bool inScope(const std::string& symbol) const;

 private:
  std::string strategy_id_;
  std::vector<std::string> symbols_;
  const OrderBook& book_;
  const PositionKeeper& positions_;
};

// -----------------------------------------------------------------------------
// IStrategy: pluggable trading logic
// -----------------------------------------------------------------------------
//
// @brief  Observes market snapshots and its own fills, emits intents.
//
// @details
// Strategies never touch the gateway or the ledger. Every returned Intent
// goes through the AdmissionController; the outcome comes back through
// on_intent_result() synchronously, on the same worker, before the next
// callback.
//
// Callbacks for one instance never overlap. They must not block or do I/O.
// An exception escaping a callback is logged and the event is skipped.
// -----------------------------------------------------------------------------
class IStrategy {
 public:
  virtual ~IStrategy() = default;

  virtual const std::string& id() const = 0;

  virtual std::vector<domain::Intent> on_market_update(
      const domain::MarketSnapshot& snapshot,
      const StrategyContext& context) = 0;

  virtual std::vector<domain::Intent> on_fill(
      const domain::Fill& fill, const StrategyContext& context) = 0;

  virtual void on_intent_result(const IntentResult& /*result*/) {}
};

}  // namespace tradecore
