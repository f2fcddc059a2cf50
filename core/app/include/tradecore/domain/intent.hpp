#pragma once

#include "tradecore/domain/order.hpp"

#include <optional>
#include <string>
#include <variant>

namespace tradecore {
namespace domain {

// -----------------------------------------------------------------------------
// Intent: what a strategy asks for
// -----------------------------------------------------------------------------
//
// @brief  Strategies never talk to the gateway. They return Intents; the
//         StrategyRunner passes each one through the AdmissionController and
//         only admitted intents turn into gateway requests.
//
// @details
// PlaceOrder: price is required for Limit and ignored for Market.
// CancelOrder: names one of the strategy's own orders by client id.
// -----------------------------------------------------------------------------
struct PlaceOrder {
  std::string symbol;
  Side side{Side::Buy};
  OrderType type{OrderType::Limit};
  std::optional<double> price;
  double quantity{0.0};
};

struct CancelOrder {
  ClientOrderId client_order_id;
};

using Intent = std::variant<PlaceOrder, CancelOrder>;

}  // namespace domain
}  // namespace tradecore
