#pragma once

#include "tradecore/domain/order.hpp"
#include "tradecore/domain/order_state.hpp"
#include "tradecore/events/event_types.hpp"

namespace tradecore {

// -----------------------------------------------------------------------------
// OrderUpdateEvent: one applied ledger transition
// -----------------------------------------------------------------------------
// Published by the ReconciliationEngine after every state change it applies
// (including PartiallyFilled -> PartiallyFilled on an additional fill).
// order is the snapshot after the change; previous_state is what it was
// before. Quarantine is reported as an update with order.quarantined set.
// -----------------------------------------------------------------------------
struct OrderUpdateEvent {
  domain::Order order;
  domain::OrderState previous_state{domain::OrderState::Pending};
  Timestamp timestamp{};
};

}  // namespace tradecore
