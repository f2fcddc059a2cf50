#pragma once

#include "tradecore/domain/fill.hpp"
#include "tradecore/domain/order.hpp"
#include "tradecore/events/event_types.hpp"

namespace tradecore {

// A fill that passed deduplication and was applied to the ledger. Routed to
// the owning strategy's on_fill.
struct FillAppliedEvent {
  domain::Order order;
  domain::Fill fill;
  Timestamp timestamp{};
};

}  // namespace tradecore
