#include "tradecore/feed/feed_decoder.hpp"

#include "tradecore/gateway/wire_codec.hpp"
#include "tradecore/time/time_utils.hpp"

#include <nlohmann/json.hpp>

#include <iostream>

namespace tradecore {

namespace {

double optionalPrice(const nlohmann::json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return 0.0;
  }
  return it->get<double>();
}

// Fills in the identification shared by every private message.
ExchangeEvent privateEvent(const nlohmann::json& j, ExchangeEventKind kind) {
  ExchangeEvent event;
  event.kind = kind;
  event.client_order_id = j.value("client_order_id", std::string{});
  auto ex = j.find("exchange_order_id");
  if (ex != j.end() && !ex->is_null()) {
    event.exchange_order_id = ex->get<std::string>();
  }
  if (event.client_order_id.empty() && !event.exchange_order_id) {
    throw wire::WireFormatError("private message without an order id");
  }
  event.sequence = j.at("sequence").get<std::uint64_t>();
  event.timestamp = ms_to_timestamp(j.value("timestamp_ms", std::int64_t{0}));
  return event;
}

// Fills in the fields every public book message carries.
BookEvent bookEvent(const nlohmann::json& j, BookEventKind kind) {
  BookEvent event;
  event.kind = kind;
  event.symbol = j.at("symbol").get<std::string>();
  event.sequence = j.at("sequence").get<std::uint64_t>();
  event.side = wire::parseSide(j.at("side").get<std::string>());
  event.price = optionalPrice(j, "price");
  event.timestamp = ms_to_timestamp(j.value("timestamp_ms", std::int64_t{0}));
  return event;
}

}  // namespace

std::optional<FeedMessage> FeedDecoder::decode(const std::string& text) {
  try {
    auto j = nlohmann::json::parse(text);
    const std::string type = j.at("type").get<std::string>();

    if (type == "ticker") {
      MarketEvent md;
      md.symbol = j.at("symbol").get<std::string>();
      md.bid = optionalPrice(j, "bid");
      md.ask = optionalPrice(j, "ask");
      md.last = optionalPrice(j, "last");
      md.sequence = j.at("sequence").get<std::uint64_t>();
      md.timestamp = ms_to_timestamp(j.at("timestamp_ms").get<std::int64_t>());
      return FeedMessage{std::move(md)};
    }

    if (type == "heartbeat") {
      HeartbeatEvent hb;
      hb.source = j.value("source", std::string{"feed"});
      hb.sequence = j.value("sequence", std::uint64_t{0});
      hb.timestamp = ms_to_timestamp(j.at("timestamp_ms").get<std::int64_t>());
      return FeedMessage{std::move(hb)};
    }

    if (type == "snapshot") {
      BookSnapshotEvent snap;
      snap.symbol = j.at("symbol").get<std::string>();
      snap.snapshot = wire::bookSnapshotFromJson(j);
      return FeedMessage{std::move(snap)};
    }

    if (type == "received") {
      BookEvent event = bookEvent(j, BookEventKind::Received);
      event.order_id = j.at("order_id").get<std::string>();
      event.size = j.value("size", 0.0);
      return FeedMessage{std::move(event)};
    }

    if (type == "open") {
      BookEvent event = bookEvent(j, BookEventKind::Open);
      event.order_id = j.at("order_id").get<std::string>();
      event.size = j.at("remaining_size").get<double>();
      return FeedMessage{std::move(event)};
    }

    if (type == "done" && j.contains("order_id")) {
      BookEvent event = bookEvent(j, BookEventKind::Done);
      event.order_id = j.at("order_id").get<std::string>();
      event.size = j.value("remaining_size", 0.0);
      return FeedMessage{std::move(event)};
    }

    if (type == "match") {
      BookEvent event = bookEvent(j, BookEventKind::Match);
      event.order_id = j.at("maker_order_id").get<std::string>();
      event.taker_order_id = j.at("taker_order_id").get<std::string>();
      event.size = j.at("size").get<double>();
      return FeedMessage{std::move(event)};
    }

    if (type == "change") {
      BookEvent event = bookEvent(j, BookEventKind::Change);
      event.order_id = j.at("order_id").get<std::string>();
      event.size = j.at("new_size").get<double>();
      return FeedMessage{std::move(event)};
    }

    if (type == "ack") {
      return FeedMessage{privateEvent(j, ExchangeEventKind::Ack)};
    }

    if (type == "fill") {
      ExchangeEvent event = privateEvent(j, ExchangeEventKind::Fill);
      event.fill = wire::fillFromJson(j, event.client_order_id);
      return FeedMessage{std::move(event)};
    }

    if (type == "done") {
      const std::string reason = j.at("reason").get<std::string>();
      ExchangeEventKind kind;
      if (reason == "filled") {
        kind = ExchangeEventKind::Filled;
      } else if (reason == "canceled" || reason == "cancelled") {
        kind = ExchangeEventKind::Cancelled;
      } else {
        throw wire::WireFormatError("unknown done reason '" + reason + "'");
      }
      ExchangeEvent event = privateEvent(j, kind);
      event.reason = reason;
      return FeedMessage{std::move(event)};
    }

    if (type == "reject") {
      ExchangeEvent event = privateEvent(j, ExchangeEventKind::Rejected);
      event.reason = j.value("reason", std::string{"rejected"});
      return FeedMessage{std::move(event)};
    }

    std::cerr << "[FeedDecoder] unknown message type '" << type
              << "', skipping\n";
  } catch (const nlohmann::json::exception& e) {
    std::cerr << "[FeedDecoder] JSON error: " << e.what()
              << " payload: " << text << "\n";
  } catch (const wire::WireFormatError& e) {
    std::cerr << "[FeedDecoder] bad message: " << e.what()
              << " payload: " << text << "\n";
  }
  return std::nullopt;
}

}  // namespace tradecore
