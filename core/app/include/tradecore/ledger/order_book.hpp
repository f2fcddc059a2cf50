#pragma once

#include "tradecore/domain/fill.hpp"
#include "tradecore/domain/order.hpp"
#include "tradecore/domain/order_state.hpp"
#include "tradecore/domain/order_status_report.hpp"
#include "tradecore/time/i_time_provider.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace tradecore {

class ReconciliationEngine;

// Result of OrderBook::applyFill.
enum class FillOutcome {
  Applied,
  Duplicate,     // exchange_fill_id already applied; ledger unchanged
  UnknownOrder,  // no order with that client id
  Overfill,      // would push filled_quantity above quantity
  NotFillable,   // order is Cancelled or Rejected, or quantity <= 0
  Quarantined,   // order is quarantined; nothing is applied to it
};

struct FillApplication {
  FillOutcome outcome{FillOutcome::UnknownOrder};
  domain::Order order;  // state after the call (empty when UnknownOrder)
  domain::OrderState previous_state{domain::OrderState::Pending};
};

// Result of OrderBook::transition.
enum class TransitionOutcome {
  Applied,
  NoOp,          // already in the requested state
  Illegal,       // rejected by OrderStateMachine
  UnknownOrder,
  Quarantined,
};

struct TransitionResult {
  TransitionOutcome outcome{TransitionOutcome::UnknownOrder};
  domain::Order order;
  domain::OrderState previous_state{domain::OrderState::Pending};
};

const char* toString(FillOutcome outcome);
const char* toString(TransitionOutcome outcome);

// -----------------------------------------------------------------------------
// OrderBook: the local ledger of every order this process knows about
// -----------------------------------------------------------------------------
//
// @brief  Authoritative in-process record of orders, their states and the
//         fills applied to them. Lookups by client id and by exchange id are
//         both hash-map based.
//
// @details
// Single writer:
//   Every mutating method is private. ReconciliationEngine is the only
//   friend, so the only code path that changes an order is the
//   reconciliation path. Everyone else (AdmissionController, StrategyRunner,
//   IPC) uses the public read API and gets copies.
//
// Indexes:
//   orders_         client id   -> {Order, applied fill ids}
//   by_exchange_id_ exchange id -> client id (filled in on ack)
//   fill_index_     fill id     -> client id (ledger-wide fill dedup)
//
// Fill rules:
//   - a fill id is applied at most once; repeats return Duplicate and leave
//     the ledger untouched.
//   - filled_quantity only grows and never exceeds quantity; a fill that
//     would overfill is refused (Overfill) and the caller quarantines.
//   - after a fill the state is Filled when filled == quantity, else
//     PartiallyFilled.
//
// Audit window:
//   Terminal orders stay queryable until evictTerminal() removes those last
//   updated before the cutoff. Quarantined orders are never evicted.
//
// Thread model:
//   A shared_mutex guards all three maps. Readers take a shared lock and may
//   run on any thread; writers take a unique lock and run on the
//   reconciliation path.
//
// Ownership:
//   Owned by TradingEngine via std::unique_ptr. Holds a reference to the
//   engine's ITimeProvider for last_updated_at stamps.
// -----------------------------------------------------------------------------
class OrderBook {
 public:
  explicit OrderBook(const ITimeProvider& clock);

  OrderBook(const OrderBook&) = delete;
  OrderBook& operator=(const OrderBook&) = delete;
  OrderBook(OrderBook&&) = delete;
  OrderBook& operator=(OrderBook&&) = delete;

  std::optional<domain::Order> find(const domain::ClientOrderId& id) const;

  std::optional<domain::Order> findByExchangeId(
      const domain::ExchangeOrderId& exchange_id) const;

  // Orders registered by one strategy, in no particular order.
  std::vector<domain::Order> ordersForStrategy(
      const std::string& strategy_id) const;

  // Copy of every order currently held.
  std::vector<domain::Order> snapshot() const;

  // -------------------------------------------------------------------------
  // openOrderCount(symbol)
  // -------------------------------------------------------------------------
  // @brief  Number of non-terminal orders for the symbol, across all
  //         strategies. Unknown and quarantined non-terminal orders are
  //         included since they may still be live on the exchange.
  // -------------------------------------------------------------------------
  std::size_t openOrderCount(const std::string& symbol) const;

  // -------------------------------------------------------------------------
  // workingQuantity(symbol, side)
  // -------------------------------------------------------------------------
  // @brief  Sum of remaining (unfilled) quantity over non-terminal orders for
  //         the symbol and side. Used by admission to project worst-case
  //         exposure.
  // -------------------------------------------------------------------------
  double workingQuantity(const std::string& symbol, domain::Side side) const;

  std::size_t size() const;

  bool hasFill(const std::string& exchange_fill_id) const;

 private:
  friend class ReconciliationEngine;

  struct Entry {
    domain::Order order;
    std::vector<std::string> fill_ids;
  };

  // Registers a freshly admitted order. False if the client id is taken.
  bool insertPending(const domain::Order& order);

  // -------------------------------------------------------------------------
  // hydrate(report, strategy_id)
  // -------------------------------------------------------------------------
  // @brief  Loads an order that already exists on the exchange (startup
  //         sync). State, filled quantity, sequence and fill ids come from
  //         the report so later replays of those fills are recognized as
  //         duplicates. False if the client id is already present.
  // -------------------------------------------------------------------------
  bool hydrate(const domain::OrderStatusReport& report,
               const std::string& strategy_id);

  FillApplication applyFill(const domain::Fill& fill);

  TransitionResult transition(const domain::ClientOrderId& id,
                              domain::OrderState to,
                              const std::string& reason = {});

  // False when the order is missing, already carries a different exchange
  // id, or the exchange id is indexed to another order.
  bool assignExchangeId(const domain::ClientOrderId& id,
                        const domain::ExchangeOrderId& exchange_id);

  std::optional<domain::Order> quarantine(const domain::ClientOrderId& id,
                                          const std::string& reason);

  std::uint64_t lastSequence(const domain::ClientOrderId& id) const;
  void setLastSequence(const domain::ClientOrderId& id,
                       std::uint64_t sequence);

  // Removes terminal, non-quarantined orders with last_updated_at older than
  // cutoff_ms, along with their index entries. Returns how many went.
  std::size_t evictTerminal(std::int64_t cutoff_ms);

  const ITimeProvider& clock_;

  mutable std::shared_mutex mutex_;
  std::unordered_map<domain::ClientOrderId, Entry> orders_;
  std::unordered_map<domain::ExchangeOrderId, domain::ClientOrderId>
      by_exchange_id_;
  std::unordered_map<std::string, domain::ClientOrderId> fill_index_;
};

}  // namespace tradecore
