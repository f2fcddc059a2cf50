#pragma once

#include "tradecore/domain/order_state.hpp"

namespace tradecore {

// -----------------------------------------------------------------------------
// OrderStateMachine: legal order state transitions
// -----------------------------------------------------------------------------
//
// @brief  Stateless rules consulted by OrderBook::transition() before any
//         state change is applied.
//
// @details
// Edges:
//   Pending         -> Open, PartiallyFilled, Filled, Cancelled, Rejected,
//                      Unknown
//   Open            -> PartiallyFilled, Filled, Cancelled, Unknown
//   PartiallyFilled -> PartiallyFilled, Filled, Cancelled, Unknown
//   Unknown         -> Open, PartiallyFilled, Filled, Cancelled, Rejected
//   Filled, Cancelled, Rejected -> nothing
//
// Pending may jump straight to a fill state because a fill can arrive before
// the ack. Open -> Rejected is not an edge: an exchange never rejects an order
// it already acknowledged, so seeing it is a data-integrity problem.
// Unknown -> Unknown is not an edge either; callers treat it as a no-op.
// -----------------------------------------------------------------------------
class OrderStateMachine {
 public:
  static bool canTransition(domain::OrderState from, domain::OrderState to);

  static bool isTerminal(domain::OrderState state);

  // Non-terminal states that still count as exposure on the exchange side.
  static bool isWorking(domain::OrderState state) { return !isTerminal(state); }

  static const char* toString(domain::OrderState state);
};

}  // namespace tradecore
