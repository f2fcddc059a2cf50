#pragma once

#include "tradecore/domain/order.hpp"
#include "tradecore/gateway/gateway_results.hpp"

#include <string>

namespace tradecore {

// -----------------------------------------------------------------------------
// Requests into the OrderRouter
// -----------------------------------------------------------------------------
// SubmitRequestEvent and CancelRequestEvent come from admitted intents.
// StatusRequestEvent comes from the ReconciliationEngine (Unknown orders,
// sequence gaps, operator RESOLVE) and carries why it was raised for logs.
// -----------------------------------------------------------------------------
struct SubmitRequestEvent {
  domain::Order order;
};

struct CancelRequestEvent {
  domain::ClientOrderId client_order_id;
  std::string strategy_id;
};

struct StatusRequestEvent {
  domain::ClientOrderId client_order_id;
  std::string reason;
};

// -----------------------------------------------------------------------------
// Gateway outcomes delivered to the reconciliation loop
// -----------------------------------------------------------------------------
struct SubmitResultEvent {
  SubmitResult result;
};

struct CancelResultEvent {
  CancelResult result;
};

struct StatusResultEvent {
  StatusResult result;
};

}  // namespace tradecore
