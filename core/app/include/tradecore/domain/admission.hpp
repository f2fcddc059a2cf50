#pragma once

#include "tradecore/domain/order.hpp"

#include <optional>
#include <string>
#include <utility>

namespace tradecore {
namespace domain {

// -----------------------------------------------------------------------------
// DenyReason: why the AdmissionController refused an intent
// -----------------------------------------------------------------------------
// Checks for PlaceOrder run in this fixed order and the first failing check
// wins: TradingHalted, InvalidQuantity, ExceedsOrderCount, NoReferencePrice,
// NotionalTooLarge, ExceedsPositionLimit. CancelOrder can only produce
// UnknownOrder or NotCancellable. OutOfScope is decided by the
// StrategyRunner before admission: the symbol is not one the strategy was
// registered for.
// -----------------------------------------------------------------------------
enum class DenyReason {
  None,
  TradingHalted,
  InvalidQuantity,
  ExceedsOrderCount,
  NoReferencePrice,
  NotionalTooLarge,
  ExceedsPositionLimit,
  UnknownOrder,
  NotCancellable,
  OutOfScope,
};

// -----------------------------------------------------------------------------
// AdmissionDecision: synchronous outcome of AdmissionController::admit
// -----------------------------------------------------------------------------
//
// @brief  Returned to the strategy that produced the intent, on the
//         strategy's own worker, before any gateway call happens.
//
// @details
// allowed == true:
//   PlaceOrder: client_order_id is the freshly generated id and order holds
//               the Pending order that was registered in the ledger.
//   CancelOrder: client_order_id echoes the target order.
// allowed == false:
//   reason names the first failing check and detail carries a human-readable
//   explanation (limit and attempted value). Nothing was registered.
// -----------------------------------------------------------------------------
struct AdmissionDecision {
  bool allowed{false};
  DenyReason reason{DenyReason::None};
  std::string detail;
  ClientOrderId client_order_id;
  std::optional<Order> order;

  static AdmissionDecision allow() {
    AdmissionDecision decision;
    decision.allowed = true;
    return decision;
  }

  static AdmissionDecision deny(DenyReason reason, std::string detail) {
    AdmissionDecision decision;
    decision.reason = reason;
    decision.detail = std::move(detail);
    return decision;
  }
};

}  // namespace domain
}  // namespace tradecore
