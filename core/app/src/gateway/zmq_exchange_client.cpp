#include "tradecore/gateway/zmq_exchange_client.hpp"

#include "tradecore/gateway/wire_codec.hpp"

#include <iostream>
#include <utility>

namespace tradecore {

namespace {

TransportFailure malformed(const std::string& what) {
  return TransportFailure{TransportFailureKind::ServerError,
                          "malformed reply: " + what};
}

}  // namespace

ZmqExchangeClient::ZmqExchangeClient(std::string endpoint,
                                     std::chrono::milliseconds request_timeout)
    : endpoint_(std::move(endpoint)),
      timeout_ms_(static_cast<int>(request_timeout.count())) {
  std::lock_guard lock(mutex_);
  resetSocket();
}

ZmqExchangeClient::~ZmqExchangeClient() {
  std::lock_guard lock(mutex_);
  socket_.reset();
}

void ZmqExchangeClient::resetSocket() {
  socket_ = std::make_unique<zmq::socket_t>(context_, zmq::socket_type::req);
  socket_->set(zmq::sockopt::rcvtimeo, timeout_ms_);
  socket_->set(zmq::sockopt::sndtimeo, timeout_ms_);
  socket_->set(zmq::sockopt::linger, 0);
  socket_->connect(endpoint_);
}

// -----------------------------------------------------------------------------
// request: one REQ/REP round trip
// -----------------------------------------------------------------------------
ClientReply<nlohmann::json> ZmqExchangeClient::request(
    const nlohmann::json& body) {
  std::lock_guard lock(mutex_);
  std::string payload = body.dump();

  zmq::message_t reply;
  try {
    zmq::message_t msg(payload.data(), payload.size());
    auto sent = socket_->send(msg, zmq::send_flags::none);
    if (!sent.has_value()) {
      resetSocket();
      return TransportFailure{TransportFailureKind::Timeout,
                              "send timed out"};
    }
    auto received = socket_->recv(reply, zmq::recv_flags::none);
    if (!received.has_value()) {
      resetSocket();
      return TransportFailure{TransportFailureKind::Timeout,
                              "no reply within " +
                                  std::to_string(timeout_ms_) + "ms"};
    }
  } catch (const zmq::error_t& e) {
    std::cerr << "[ZmqExchangeClient] ERROR: " << e.what() << "\n";
    resetSocket();
    return TransportFailure{TransportFailureKind::ConnectionError, e.what()};
  }

  nlohmann::json json;
  try {
    json = nlohmann::json::parse(reply.to_string());
  } catch (const nlohmann::json::exception& e) {
    return malformed(e.what());
  }

  if (json.is_object() && json.contains("error")) {
    std::string error = json.value("error", std::string{});
    std::string detail = json.value("detail", error);
    if (error == "rate_limited") {
      return TransportFailure{TransportFailureKind::RateLimited, detail};
    }
    return TransportFailure{TransportFailureKind::ServerError, detail};
  }
  return json;
}

// -----------------------------------------------------------------------------
// IExchangeClient
// -----------------------------------------------------------------------------
ClientReply<SubmitAck> ZmqExchangeClient::submitOrder(
    const domain::Order& order) {
  auto reply = request({{"op", "submit"}, {"order", wire::orderToJson(order)}});
  if (const auto* failure = std::get_if<TransportFailure>(&reply)) {
    return *failure;
  }
  const nlohmann::json& json = std::get<nlohmann::json>(reply);
  try {
    SubmitAck ack;
    ack.accepted = json.at("accepted").get<bool>();
    ack.exchange_order_id = json.value("exchange_order_id", std::string{});
    ack.reject_reason = json.value("reason", std::string{});
    return ack;
  } catch (const nlohmann::json::exception& e) {
    return malformed(e.what());
  }
}

ClientReply<CancelAck> ZmqExchangeClient::cancelOrder(
    const domain::ClientOrderId& client_order_id) {
  auto reply =
      request({{"op", "cancel"}, {"client_order_id", client_order_id}});
  if (const auto* failure = std::get_if<TransportFailure>(&reply)) {
    return *failure;
  }
  const nlohmann::json& json = std::get<nlohmann::json>(reply);
  try {
    CancelAck ack;
    std::string result = json.at("result").get<std::string>();
    if (result == "cancelled") {
      ack.outcome = CancelAckOutcome::Cancelled;
    } else if (result == "not_found") {
      ack.outcome = CancelAckOutcome::NotFound;
    } else if (result == "already_terminal") {
      ack.outcome = CancelAckOutcome::AlreadyTerminal;
    } else {
      return malformed("unknown cancel result '" + result + "'");
    }
    if (json.contains("order") && !json.at("order").is_null()) {
      ack.report = wire::reportFromJson(json.at("order"));
    }
    return ack;
  } catch (const nlohmann::json::exception& e) {
    return malformed(e.what());
  } catch (const wire::WireFormatError& e) {
    return malformed(e.what());
  }
}

ClientReply<std::optional<domain::OrderStatusReport>>
ZmqExchangeClient::queryOrder(const domain::ClientOrderId& client_order_id) {
  auto reply = request({{"op", "query"}, {"client_order_id", client_order_id}});
  if (const auto* failure = std::get_if<TransportFailure>(&reply)) {
    return *failure;
  }
  const nlohmann::json& json = std::get<nlohmann::json>(reply);
  try {
    if (!json.at("found").get<bool>()) {
      return std::optional<domain::OrderStatusReport>{};
    }
    return std::optional<domain::OrderStatusReport>{
        wire::reportFromJson(json.at("order"))};
  } catch (const nlohmann::json::exception& e) {
    return malformed(e.what());
  } catch (const wire::WireFormatError& e) {
    return malformed(e.what());
  }
}

ClientReply<std::vector<domain::OrderStatusReport>>
ZmqExchangeClient::openOrders() {
  nlohmann::json body;
  body["op"] = "open_orders";
  auto reply = request(body);
  if (const auto* failure = std::get_if<TransportFailure>(&reply)) {
    return *failure;
  }
  const nlohmann::json& json = std::get<nlohmann::json>(reply);
  try {
    std::vector<domain::OrderStatusReport> orders;
    for (const nlohmann::json& item : json.at("orders")) {
      orders.push_back(wire::reportFromJson(item));
    }
    return orders;
  } catch (const nlohmann::json::exception& e) {
    return malformed(e.what());
  } catch (const wire::WireFormatError& e) {
    return malformed(e.what());
  }
}

ClientReply<std::vector<domain::Position>> ZmqExchangeClient::positions() {
  nlohmann::json body;
  body["op"] = "positions";
  auto reply = request(body);
  if (const auto* failure = std::get_if<TransportFailure>(&reply)) {
    return *failure;
  }
  const nlohmann::json& json = std::get<nlohmann::json>(reply);
  try {
    std::vector<domain::Position> result;
    for (const nlohmann::json& item : json.at("positions")) {
      result.push_back(wire::positionFromJson(item));
    }
    return result;
  } catch (const nlohmann::json::exception& e) {
    return malformed(e.what());
  }
}

ClientReply<domain::BookSnapshot> ZmqExchangeClient::bookSnapshot(
    const std::string& symbol) {
  nlohmann::json body;
  body["op"] = "book";
  body["symbol"] = symbol;
  auto reply = request(body);
  if (const auto* failure = std::get_if<TransportFailure>(&reply)) {
    return *failure;
  }
  const nlohmann::json& json = std::get<nlohmann::json>(reply);
  try {
    return wire::bookSnapshotFromJson(json.at("book"));
  } catch (const nlohmann::json::exception& e) {
    return malformed(e.what());
  } catch (const wire::WireFormatError& e) {
    return malformed(e.what());
  }
}

}  // namespace tradecore
