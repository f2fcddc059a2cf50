#pragma once

#include "tradecore/events/book_events.hpp"
#include "tradecore/events/event_types.hpp"
#include "tradecore/events/exchange_event.hpp"

#include <optional>
#include <string>
#include <variant>

namespace tradecore {

// One decoded feed message: public market data or a private order event.
using FeedMessage = std::variant<MarketEvent, HeartbeatEvent, ExchangeEvent,
                                 BookEvent, BookSnapshotEvent>;

// -----------------------------------------------------------------------------
// FeedDecoder: JSON feed message -> engine event
// -----------------------------------------------------------------------------
//
// @brief  Normalizes the exchange's streaming feed into MarketEvent,
//         HeartbeatEvent, BookEvent, BookSnapshotEvent and ExchangeEvent.
//
// @details
// Every message is a JSON object with a "type" field:
//
//   ticker     {"symbol", "bid", "ask", "last", "sequence", "timestamp_ms"}
//   heartbeat  {"source", "sequence", "timestamp_ms"}
//
// Public level-3 channel, all with "symbol" and "sequence":
//   snapshot   {"bids", "asks"} as [price, size, order_id] rows
//   received   {"order_id", "side", "price" (null for market), "size"}
//   open       {"order_id", "side", "price", "remaining_size"}
//   done       {"order_id", "side", "price", "remaining_size", "reason"}
//   match      {"maker_order_id", "taker_order_id", "side", "price", "size"}
//   change     {"order_id", "side", "price", "new_size"}
// A "done" carrying "order_id" belongs to the public channel; the private
// one identifies the order by client_order_id / exchange_order_id.
//
// Private order channel:
//   ack        {"client_order_id", "exchange_order_id", "sequence"}
//   fill       {"client_order_id" | "exchange_order_id", "sequence",
//               "fill_id", "quantity", "price", "timestamp_ms"}
//   done       {... "sequence", "reason": "filled" | "canceled"}
//   reject     {... "sequence", "reason"}
//
// bid/ask/last may be absent or null on a ticker (treated as 0, i.e. not
// provided). Private messages must carry at least one of the two order ids.
//
// Malformed JSON, missing keys, wrong types and unknown message types are
// logged to stderr and yield std::nullopt. decode() never throws.
//
// Thread model: stateless; safe from any thread.
// -----------------------------------------------------------------------------
class FeedDecoder {
 public:
  static std::optional<FeedMessage> decode(const std::string& text);
};

}  // namespace tradecore
