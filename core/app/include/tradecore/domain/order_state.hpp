#pragma once

namespace tradecore {
namespace domain {

// -----------------------------------------------------------------------------
// OrderState: lifecycle of an order as seen by the local ledger
// -----------------------------------------------------------------------------
//
// @brief  Every state an order can occupy between admission and eviction.
//
// @details
//
//   Pending ──> Open ──> PartiallyFilled ──> Filled
//     │          │             │
//     │          ├─────────────┴──> Cancelled
//     ├──> Rejected
//     └──> Unknown ──> (Open | PartiallyFilled | Filled | Cancelled | Rejected)
//
// Pending:  admitted and handed to the gateway, no exchange ack yet.
// Open:     acknowledged by the exchange, nothing filled.
// Unknown:  the gateway gave up with an ambiguous outcome. Only a status
//           query against the exchange may move the order out of Unknown.
//
// Terminal states: Filled, Cancelled, Rejected. The legal edges are owned by
// OrderStateMachine (ledger/order_state_machine.hpp).
//
// Thread model:
//   Plain enum. Safe to copy and compare from any thread.
// -----------------------------------------------------------------------------
enum class OrderState {
  Pending,
  Open,
  PartiallyFilled,
  Filled,     // terminal
  Cancelled,  // terminal
  Rejected,   // terminal
  Unknown,
};

}  // namespace domain
}  // namespace tradecore
