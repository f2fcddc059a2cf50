#pragma once

#include "tradecore/domain/book_snapshot.hpp"
#include "tradecore/domain/fill.hpp"
#include "tradecore/domain/order.hpp"
#include "tradecore/domain/order_state.hpp"
#include "tradecore/domain/order_status_report.hpp"
#include "tradecore/domain/position.hpp"

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <string>

namespace tradecore {
namespace wire {

// -----------------------------------------------------------------------------
// JSON wire codec
// -----------------------------------------------------------------------------
//
// @brief  Shared encoding of orders, fills, status reports and positions
//         used by the exchange adapter protocol (ZmqExchangeClient), the
//         private feed (FeedDecoder) and IPC replies.
//
// @details
// Enumerations travel as lower-case strings: "buy"/"sell", "limit"/"market",
// "pending", "open", "partially_filled", "filled", "cancelled" (also accepts
// "canceled"), "rejected", "unknown". Prices are numbers; a market order has
// "price": null.
//
// Decoding throws nlohmann::json::exception for missing keys or wrong types
// and WireFormatError for unknown enumeration strings. Callers catch both at
// the I/O boundary.
// -----------------------------------------------------------------------------
class WireFormatError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

const char* toWire(domain::Side side);
const char* toWire(domain::OrderType type);
const char* toWire(domain::OrderState state);

domain::Side parseSide(const std::string& text);
domain::OrderType parseOrderType(const std::string& text);
domain::OrderState parseOrderState(const std::string& text);

nlohmann::json orderToJson(const domain::Order& order);

nlohmann::json fillToJson(const domain::Fill& fill);
domain::Fill fillFromJson(const nlohmann::json& j,
                          const domain::ClientOrderId& order_id);

nlohmann::json reportToJson(const domain::OrderStatusReport& report);
domain::OrderStatusReport reportFromJson(const nlohmann::json& j);

nlohmann::json positionToJson(const domain::Position& position);
domain::Position positionFromJson(const nlohmann::json& j);

// {"symbol", "sequence", "bids": [[price, size, order_id], ...], "asks"}
nlohmann::json bookSnapshotToJson(const domain::BookSnapshot& book);
domain::BookSnapshot bookSnapshotFromJson(const nlohmann::json& j);

}  // namespace wire
}  // namespace tradecore
