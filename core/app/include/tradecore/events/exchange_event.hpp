#pragma once

#include "tradecore/domain/fill.hpp"
#include "tradecore/domain/order.hpp"
#include "tradecore/events/event_types.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace tradecore {

// -----------------------------------------------------------------------------
// ExchangeEvent: private order event reported by the exchange
// -----------------------------------------------------------------------------
//
// @brief  Acks, fills, cancels, rejects and "done, filled" notifications for
//         orders this session owns, as delivered on the private feed (or by
//         the simulated exchange).
//
// @details
// Identification: client_order_id is used when present. Otherwise the order
// is resolved through exchange_order_id (the feed of some exchanges only
// carries their own id after the ack).
//
// sequence is per order and strictly increasing on the exchange side. The
// ReconciliationEngine drops any event whose sequence is not greater than the
// last one it applied to that order.
//
// Kind-specific payload:
//   Ack        exchange_order_id is set.
//   Fill       fill is set (exchange_fill_id, quantity, price, timestamp).
//   Cancelled  reason may explain (user request, self-trade, expiry).
//   Rejected   reason carries the exchange's message.
//   Filled     no payload. Says the order is done because it is fully
//              filled; the fills themselves arrive as Fill events.
// -----------------------------------------------------------------------------
enum class ExchangeEventKind {
  Ack,
  Fill,
  Cancelled,
  Rejected,
  Filled,
};

struct ExchangeEvent {
  ExchangeEventKind kind{ExchangeEventKind::Ack};
  domain::ClientOrderId client_order_id;
  std::optional<domain::ExchangeOrderId> exchange_order_id;
  std::uint64_t sequence{0};
  std::optional<domain::Fill> fill;
  std::string reason;
  Timestamp timestamp{};
};

inline const char* toString(ExchangeEventKind kind) {
  switch (kind) {
    case ExchangeEventKind::Ack:       return "Ack";
    case ExchangeEventKind::Fill:      return "Fill";
    case ExchangeEventKind::Cancelled: return "Cancelled";
    case ExchangeEventKind::Rejected:  return "Rejected";
    case ExchangeEventKind::Filled:    return "Filled";
  }
  return "Invalid";
}

}  // namespace tradecore
