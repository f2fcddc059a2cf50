#pragma once

#include "tradecore/domain/order_state.hpp"

#include <cmath>
#include <cstdint>
#include <optional>
#include <string>

namespace tradecore {
namespace domain {

// -----------------------------------------------------------------------------
// Identifiers
// -----------------------------------------------------------------------------
// ClientOrderId is generated locally (ClientOrderIdGenerator) before the order
// leaves the process and doubles as the idempotency token sent with every
// submission. ExchangeOrderId is assigned by the exchange on acknowledgement.
// Both are strings because exchanges use UUID-like identifiers.
// -----------------------------------------------------------------------------
using ClientOrderId = std::string;
using ExchangeOrderId = std::string;

// Tolerance used for every quantity comparison (fills are doubles).
constexpr double kQuantityEpsilon = 1e-9;

enum class Side {
  Buy,
  Sell,
};

enum class OrderType {
  Limit,
  Market,
};

// -----------------------------------------------------------------------------
// Order: local representation of trading intent
// -----------------------------------------------------------------------------
//
// @brief  The ledger's record of one order: the admitted request plus what
//         the exchange has reported about it so far.
//
// @details
// Invariants (enforced by OrderBook):
//   - filled_quantity never exceeds quantity (within kQuantityEpsilon).
//   - client_order_id never changes and is unique for the process lifetime.
//   - exchange_order_id, once assigned, never changes.
//
// created_at / last_updated_at are epoch milliseconds taken from the engine's
// ITimeProvider so simulated runs stay deterministic.
//
// last_sequence is the highest per-order exchange sequence number applied to
// this order (0 = none yet). quarantined is set when the exchange reported
// something contradictory; a quarantined order ignores all further events.
//
// Ownership:
//   The authoritative copy lives in OrderBook. Every copy handed out (events,
//   lookups, strategy views) is a snapshot.
// -----------------------------------------------------------------------------
struct Order {
  ClientOrderId client_order_id;
  std::optional<ExchangeOrderId> exchange_order_id;
  std::string strategy_id;  // empty for orders loaded from the exchange
  std::string symbol;
  Side side{Side::Buy};
  OrderType type{OrderType::Limit};
  std::optional<double> price;  // absent for market orders
  double quantity{0.0};
  double filled_quantity{0.0};
  OrderState state{OrderState::Pending};
  std::int64_t created_at{0};
  std::int64_t last_updated_at{0};
  std::uint64_t last_sequence{0};
  bool quarantined{false};
  std::string reason;  // last reject or quarantine reason, if any
};

// Quantity still working on the exchange (never negative).
inline double remainingQuantity(const Order& order) {
  double remaining = order.quantity - order.filled_quantity;
  return remaining > kQuantityEpsilon ? remaining : 0.0;
}

inline bool quantitiesEqual(double a, double b) {
  return std::abs(a - b) <= kQuantityEpsilon;
}

}  // namespace domain
}  // namespace tradecore
