#pragma once

#include "tradecore/domain/position.hpp"
#include "tradecore/events/event_types.hpp"

namespace tradecore {

// Snapshot of a symbol's position right after a fill moved it.
struct PositionUpdateEvent {
  domain::Position position;
  Timestamp timestamp{};
};

}  // namespace tradecore
