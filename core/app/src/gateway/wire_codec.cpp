#include "tradecore/gateway/wire_codec.hpp"

#include <utility>
#include <vector>

namespace tradecore {
namespace wire {

const char* toWire(domain::Side side) {
  return side == domain::Side::Buy ? "buy" : "sell";
}

const char* toWire(domain::OrderType type) {
  return type == domain::OrderType::Limit ? "limit" : "market";
}

const char* toWire(domain::OrderState state) {
  using S = domain::OrderState;
  switch (state) {
    case S::Pending:         return "pending";
    case S::Open:            return "open";
    case S::PartiallyFilled: return "partially_filled";
    case S::Filled:          return "filled";
    case S::Cancelled:       return "cancelled";
    case S::Rejected:        return "rejected";
    case S::Unknown:         return "unknown";
  }
  return "unknown";
}

domain::Side parseSide(const std::string& text) {
  if (text == "buy") return domain::Side::Buy;
  if (text == "sell") return domain::Side::Sell;
  throw WireFormatError("unknown side '" + text + "'");
}

domain::OrderType parseOrderType(const std::string& text) {
  if (text == "limit") return domain::OrderType::Limit;
  if (text == "market") return domain::OrderType::Market;
  throw WireFormatError("unknown order type '" + text + "'");
}

domain::OrderState parseOrderState(const std::string& text) {
  using S = domain::OrderState;
  if (text == "pending") return S::Pending;
  if (text == "open") return S::Open;
  if (text == "partially_filled") return S::PartiallyFilled;
  if (text == "filled") return S::Filled;
  if (text == "cancelled" || text == "canceled") return S::Cancelled;
  if (text == "rejected") return S::Rejected;
  if (text == "unknown") return S::Unknown;
  throw WireFormatError("unknown order state '" + text + "'");
}

nlohmann::json orderToJson(const domain::Order& order) {
  nlohmann::json j;
  j["client_order_id"] = order.client_order_id;
  j["exchange_order_id"] = order.exchange_order_id
                               ? nlohmann::json(*order.exchange_order_id)
                               : nlohmann::json(nullptr);
  j["strategy_id"] = order.strategy_id;
  j["symbol"] = order.symbol;
  j["side"] = toWire(order.side);
  j["type"] = toWire(order.type);
  j["price"] = order.price ? nlohmann::json(*order.price)
                           : nlohmann::json(nullptr);
  j["quantity"] = order.quantity;
  j["filled_quantity"] = order.filled_quantity;
  j["state"] = toWire(order.state);
  j["created_at"] = order.created_at;
  j["last_updated_at"] = order.last_updated_at;
  j["quarantined"] = order.quarantined;
  j["reason"] = order.reason;
  return j;
}

nlohmann::json fillToJson(const domain::Fill& fill) {
  return nlohmann::json{{"fill_id", fill.exchange_fill_id},
                        {"quantity", fill.quantity},
                        {"price", fill.price},
                        {"timestamp_ms", fill.timestamp}};
}

domain::Fill fillFromJson(const nlohmann::json& j,
                          const domain::ClientOrderId& order_id) {
  domain::Fill fill;
  fill.order_id = order_id;
  fill.exchange_fill_id = j.at("fill_id").get<std::string>();
  fill.quantity = j.at("quantity").get<double>();
  fill.price = j.at("price").get<double>();
  fill.timestamp = j.value("timestamp_ms", std::int64_t{0});
  return fill;
}

nlohmann::json reportToJson(const domain::OrderStatusReport& report) {
  nlohmann::json fills = nlohmann::json::array();
  for (const domain::Fill& fill : report.fills) {
    fills.push_back(fillToJson(fill));
  }
  nlohmann::json j;
  j["client_order_id"] = report.client_order_id;
  j["exchange_order_id"] = report.exchange_order_id;
  j["symbol"] = report.symbol;
  j["side"] = toWire(report.side);
  j["type"] = toWire(report.type);
  j["price"] = report.price ? nlohmann::json(*report.price)
                            : nlohmann::json(nullptr);
  j["quantity"] = report.quantity;
  j["filled_quantity"] = report.filled_quantity;
  j["state"] = toWire(report.state);
  j["fills"] = std::move(fills);
  j["sequence"] = report.sequence;
  j["reason"] = report.reason;
  return j;
}

domain::OrderStatusReport reportFromJson(const nlohmann::json& j) {
  domain::OrderStatusReport report;
  report.client_order_id = j.at("client_order_id").get<std::string>();
  report.exchange_order_id = j.value("exchange_order_id", std::string{});
  report.symbol = j.at("symbol").get<std::string>();
  report.side = parseSide(j.at("side").get<std::string>());
  report.type = parseOrderType(j.value("type", std::string{"limit"}));
  if (j.contains("price") && !j.at("price").is_null()) {
    report.price = j.at("price").get<double>();
  }
  report.quantity = j.at("quantity").get<double>();
  report.filled_quantity = j.value("filled_quantity", 0.0);
  report.state = parseOrderState(j.at("state").get<std::string>());
  if (j.contains("fills")) {
    for (const nlohmann::json& fill : j.at("fills")) {
      report.fills.push_back(fillFromJson(fill, report.client_order_id));
    }
  }
  report.sequence = j.value("sequence", std::uint64_t{0});
  report.reason = j.value("reason", std::string{});
  return report;
}

nlohmann::json positionToJson(const domain::Position& position) {
  return nlohmann::json{{"symbol", position.symbol},
                        {"net_quantity", position.net_quantity},
                        {"average_price", position.average_price},
                        {"realized_pnl", position.realized_pnl}};
}

domain::Position positionFromJson(const nlohmann::json& j) {
  domain::Position position;
  position.symbol = j.at("symbol").get<std::string>();
  position.net_quantity = j.at("net_quantity").get<double>();
  position.average_price = j.value("average_price", 0.0);
  position.realized_pnl = j.value("realized_pnl", 0.0);
  return position;
}

namespace {

nlohmann::json bookSideToJson(const std::vector<domain::BookEntry>& entries) {
  nlohmann::json side = nlohmann::json::array();
  for (const domain::BookEntry& entry : entries) {
    side.push_back(nlohmann::json::array({entry.price, entry.size,
                                          entry.order_id}));
  }
  return side;
}

std::vector<domain::BookEntry> bookSideFromJson(const nlohmann::json& side) {
  std::vector<domain::BookEntry> entries;
  for (const nlohmann::json& row : side) {
    if (!row.is_array() || row.size() != 3) {
      throw WireFormatError("book entry must be [price, size, order_id]");
    }
    domain::BookEntry entry;
    entry.price = row.at(0).get<double>();
    entry.size = row.at(1).get<double>();
    entry.order_id = row.at(2).get<std::string>();
    entries.push_back(std::move(entry));
  }
  return entries;
}

}  // namespace

nlohmann::json bookSnapshotToJson(const domain::BookSnapshot& book) {
  return nlohmann::json{{"symbol", book.symbol},
                        {"sequence", book.sequence},
                        {"bids", bookSideToJson(book.bids)},
                        {"asks", bookSideToJson(book.asks)}};
}

domain::BookSnapshot bookSnapshotFromJson(const nlohmann::json& j) {
  domain::BookSnapshot book;
  book.symbol = j.at("symbol").get<std::string>();
  book.sequence = j.at("sequence").get<std::uint64_t>();
  book.bids = bookSideFromJson(j.at("bids"));
  book.asks = bookSideFromJson(j.at("asks"));
  return book;
}

}  // namespace wire
}  // namespace tradecore
