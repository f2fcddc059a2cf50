#pragma once

#include "tradecore/events/alert_event.hpp"
#include "tradecore/events/book_events.hpp"
#include "tradecore/events/event_types.hpp"
#include "tradecore/events/exchange_event.hpp"
#include "tradecore/events/fill_applied_event.hpp"
#include "tradecore/events/gateway_events.hpp"
#include "tradecore/events/intent_decision_event.hpp"
#include "tradecore/events/order_update_event.hpp"
#include "tradecore/events/position_update_event.hpp"

#include <variant>

namespace tradecore {

// -----------------------------------------------------------------------------
// Event: everything that travels over an EventBus
// -----------------------------------------------------------------------------
// Grouped by producer:
//   feed:            MarketEvent, HeartbeatEvent, ExchangeEvent, BookEvent,
//                    BookSnapshotEvent
//   market data:     MarketSnapshotEvent, BookResyncRequestEvent
//   strategy runner: SubmitRequestEvent, CancelRequestEvent,
//                    IntentDecisionEvent
//   order router:    SubmitResultEvent, CancelResultEvent, StatusResultEvent,
//                    BookSnapshotEvent
//   reconciliation:  OrderUpdateEvent, FillAppliedEvent, PositionUpdateEvent,
//                    AlertEvent, StatusRequestEvent
// -----------------------------------------------------------------------------
using Event = std::variant<
    MarketEvent,
    HeartbeatEvent,
    MarketSnapshotEvent,
    BookEvent,
    BookSnapshotEvent,
    BookResyncRequestEvent,
    ExchangeEvent,
    SubmitRequestEvent,
    CancelRequestEvent,
    StatusRequestEvent,
    SubmitResultEvent,
    CancelResultEvent,
    StatusResultEvent,
    OrderUpdateEvent,
    FillAppliedEvent,
    PositionUpdateEvent,
    AlertEvent,
    IntentDecisionEvent>;

}  // namespace tradecore
