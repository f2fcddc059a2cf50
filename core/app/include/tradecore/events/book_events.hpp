#pragma once

#include "tradecore/domain/book_snapshot.hpp"
#include "tradecore/domain/order.hpp"
#include "tradecore/events/event_types.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace tradecore {

enum class BookEventKind {
  Received,
  Open,
  Done,
  Match,
  Change,
};

// -----------------------------------------------------------------------------
// BookEvent: one incremental message of the public level-3 channel
// -----------------------------------------------------------------------------
// Field use by kind:
//   Received  order_id, side, price (0 for a market order), size. Accepted
//             by the matching engine but not resting yet.
//   Open      order_id, side, price, size = remaining size. Now resting.
//   Done      order_id, side, price, size = remaining size. Off the book.
//   Match     order_id = maker, taker_order_id, side = maker side, price,
//             size = traded quantity.
//   Change    order_id, side, price, size = new size.
// sequence is the channel's per-symbol sequence number.
// -----------------------------------------------------------------------------
struct BookEvent {
  BookEventKind kind{BookEventKind::Open};
  std::string symbol;
  std::uint64_t sequence{0};
  std::string order_id;
  std::string taker_order_id;
  domain::Side side{domain::Side::Buy};
  double price{0.0};
  double size{0.0};
  Timestamp timestamp{};
};

// A level-3 snapshot, or std::nullopt when the exchange stayed unreachable.
struct BookSnapshotEvent {
  std::string symbol;
  std::optional<domain::BookSnapshot> snapshot;
};

// Published by MarketDataFeed when a book has no snapshot yet or lost
// messages. TradingEngine hands it to the OrderRouter, which answers with a
// BookSnapshotEvent on the market loop.
struct BookResyncRequestEvent {
  std::string symbol;
  std::uint64_t last_sequence{0};
};

inline const char* toString(BookEventKind kind) {
  switch (kind) {
    case BookEventKind::Received: return "received";
    case BookEventKind::Open:     return "open";
    case BookEventKind::Done:     return "done";
    case BookEventKind::Match:    return "match";
    case BookEventKind::Change:   return "change";
  }
  return "invalid";
}

}  // namespace tradecore
