#pragma once

#include "tradecore/domain/errors.hpp"
#include "tradecore/domain/order.hpp"
#include "tradecore/events/event_types.hpp"

#include <string>

namespace tradecore {

// -----------------------------------------------------------------------------
// AlertEvent: operator-visible problem with a single order
// -----------------------------------------------------------------------------
// kind is DataIntegrityError (order quarantined) or GatewayUnavailable
// (order left Unknown, or a status query could not complete). Logged to
// std::cerr by the ReconciliationEngine and forwarded on IPC telemetry.
// -----------------------------------------------------------------------------
struct AlertEvent {
  domain::ErrorKind kind{domain::ErrorKind::DataIntegrityError};
  domain::ClientOrderId client_order_id;
  std::string detail;
  Timestamp timestamp{};
};

}  // namespace tradecore
