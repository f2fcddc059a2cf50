#pragma once

#include "tradecore/domain/fill.hpp"
#include "tradecore/domain/order.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tradecore {
namespace domain {

// -----------------------------------------------------------------------------
// OrderStatusReport: the exchange's view of one order
// -----------------------------------------------------------------------------
//
// @brief  Returned by status queries, cancel replies and the open-orders
//         listing. Carries the full fill history so the reconciliation engine
//         can replay fills it missed.
//
// @details
// sequence is the exchange's latest per-order sequence number at the time of
// the report. After a report is applied, private feed events at or below
// that sequence are stale.
//
// state only ever holds an exchange-side state (Open, PartiallyFilled,
// Filled, Cancelled, Rejected). Pending and Unknown are local notions.
// -----------------------------------------------------------------------------
struct OrderStatusReport {
  ClientOrderId client_order_id;
  ExchangeOrderId exchange_order_id;
  std::string symbol;
  Side side{Side::Buy};
  OrderType type{OrderType::Limit};
  std::optional<double> price;
  double quantity{0.0};
  double filled_quantity{0.0};
  OrderState state{OrderState::Open};
  std::vector<Fill> fills;
  std::uint64_t sequence{0};
  std::string reason;
};

}  // namespace domain
}  // namespace tradecore
