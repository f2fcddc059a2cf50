#pragma once

#include "tradecore/domain/order.hpp"
#include "tradecore/domain/order_status_report.hpp"

#include <optional>
#include <string>

namespace tradecore {

// -----------------------------------------------------------------------------
// Gateway outcomes
// -----------------------------------------------------------------------------
//
// @brief  What ExchangeGateway returns after retries, rate limiting and the
//         query-before-resubmit rule have all been applied. None of these are
//         thrown; every caller gets exactly one of them per request.
//
// @details
// GatewayUnavailable means the outcome on the exchange is not known. It does
// not mean the request failed. The reconciliation engine reacts by marking
// the order Unknown and raising an alert.
//
// report is set whenever the gateway learned the exchange's full view of the
// order along the way (a status query during a retried submit, a cancel
// reply carrying the final state). attempts counts transport round trips,
// status queries included.
// -----------------------------------------------------------------------------

enum class SubmitOutcome {
  Accepted,
  Rejected,
  GatewayUnavailable,
};

struct SubmitResult {
  SubmitOutcome outcome{SubmitOutcome::GatewayUnavailable};
  domain::ClientOrderId client_order_id;
  domain::ExchangeOrderId exchange_order_id;
  std::string reason;
  std::optional<domain::OrderStatusReport> report;
  int attempts{0};
};

enum class CancelOutcome {
  Cancelled,
  NotFound,
  AlreadyTerminal,
  GatewayUnavailable,
};

struct CancelResult {
  CancelOutcome outcome{CancelOutcome::GatewayUnavailable};
  domain::ClientOrderId client_order_id;
  std::optional<domain::OrderStatusReport> report;
  std::string reason;
  int attempts{0};
};

enum class StatusOutcome {
  Found,
  NotFound,
  GatewayUnavailable,
};

struct StatusResult {
  StatusOutcome outcome{StatusOutcome::GatewayUnavailable};
  domain::ClientOrderId client_order_id;
  std::optional<domain::OrderStatusReport> report;
  std::string reason;
  int attempts{0};
};

inline const char* toString(SubmitOutcome outcome) {
  switch (outcome) {
    case SubmitOutcome::Accepted:           return "Accepted";
    case SubmitOutcome::Rejected:           return "Rejected";
    case SubmitOutcome::GatewayUnavailable: return "GatewayUnavailable";
  }
  return "Invalid";
}

inline const char* toString(CancelOutcome outcome) {
  switch (outcome) {
    case CancelOutcome::Cancelled:          return "Cancelled";
    case CancelOutcome::NotFound:           return "NotFound";
    case CancelOutcome::AlreadyTerminal:    return "AlreadyTerminal";
    case CancelOutcome::GatewayUnavailable: return "GatewayUnavailable";
  }
  return "Invalid";
}

inline const char* toString(StatusOutcome outcome) {
  switch (outcome) {
    case StatusOutcome::Found:              return "Found";
    case StatusOutcome::NotFound:           return "NotFound";
    case StatusOutcome::GatewayUnavailable: return "GatewayUnavailable";
  }
  return "Invalid";
}

}  // namespace tradecore
