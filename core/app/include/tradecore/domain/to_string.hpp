#pragma once

#include "tradecore/domain/admission.hpp"
#include "tradecore/domain/errors.hpp"
#include "tradecore/domain/intent.hpp"
#include "tradecore/domain/order.hpp"
#include "tradecore/domain/order_state.hpp"

#include <sstream>
#include <string>

namespace tradecore {
namespace domain {

// Log and telemetry names. The strings are stable and used on the IPC wire.

inline const char* toString(OrderState state) {
  switch (state) {
    case OrderState::Pending:         return "Pending";
    case OrderState::Open:            return "Open";
    case OrderState::PartiallyFilled: return "PartiallyFilled";
    case OrderState::Filled:          return "Filled";
    case OrderState::Cancelled:       return "Cancelled";
    case OrderState::Rejected:        return "Rejected";
    case OrderState::Unknown:         return "Unknown";
  }
  return "Invalid";
}

inline const char* toString(Side side) {
  return side == Side::Buy ? "BUY" : "SELL";
}

inline const char* toString(OrderType type) {
  return type == OrderType::Limit ? "LIMIT" : "MARKET";
}

inline const char* toString(DenyReason reason) {
  switch (reason) {
    case DenyReason::None:                 return "None";
    case DenyReason::TradingHalted:        return "TradingHalted";
    case DenyReason::InvalidQuantity:      return "InvalidQuantity";
    case DenyReason::ExceedsOrderCount:    return "ExceedsOrderCount";
    case DenyReason::NoReferencePrice:     return "NoReferencePrice";
    case DenyReason::NotionalTooLarge:     return "NotionalTooLarge";
    case DenyReason::ExceedsPositionLimit: return "ExceedsPositionLimit";
    case DenyReason::UnknownOrder:         return "UnknownOrder";
    case DenyReason::NotCancellable:       return "NotCancellable";
    case DenyReason::OutOfScope:           return "OutOfScope";
  }
  return "Invalid";
}

inline const char* toString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::NetworkTransient:   return "NetworkTransient";
    case ErrorKind::GatewayUnavailable: return "GatewayUnavailable";
    case ErrorKind::Rejected:           return "Rejected";
    case ErrorKind::DataIntegrityError: return "DataIntegrityError";
    case ErrorKind::RiskDenied:         return "RiskDenied";
  }
  return "Invalid";
}

// One-line summary used in decision logs, e.g. "PLACE BUY 0.5 BTC-USD @ 100".
inline std::string describe(const Intent& intent) {
  std::ostringstream out;
  if (const auto* place = std::get_if<PlaceOrder>(&intent)) {
    out << "PLACE " << toString(place->side) << " " << place->quantity << " "
        << place->symbol;
    if (place->price) {
      out << " @ " << *place->price;
    } else {
      out << " @ MARKET";
    }
  } else if (const auto* cancel = std::get_if<CancelOrder>(&intent)) {
    out << "CANCEL " << cancel->client_order_id;
  }
  return out.str();
}

}  // namespace domain
}  // namespace tradecore
