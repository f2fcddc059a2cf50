#pragma once

#include "tradecore/gateway/exchange_client.hpp"

#include <nlohmann/json.hpp>
#include <zmq.hpp>

#include <chrono>
#include <memory>
#include <mutex>
#include <string>

namespace tradecore {

// -----------------------------------------------------------------------------
// ZmqExchangeClient: exchange adapter protocol over a ZeroMQ REQ socket
// -----------------------------------------------------------------------------
//
// @brief  Sends one JSON request per call to an exchange adapter process
//         (which owns credentials and the exchange's REST encoding) and maps
//         the reply, or its absence, to IExchangeClient results.
//
// @details
// Requests (field "op"):
//   submit       {"op":"submit","order":{...}}
//                -> {"accepted":bool,"exchange_order_id":..,"reason":..}
//   cancel       {"op":"cancel","client_order_id":..}
//                -> {"result":"cancelled"|"not_found"|"already_terminal",
//                    "order":{report}?}
//   query        {"op":"query","client_order_id":..}
//                -> {"found":bool,"order":{report}?}
//   open_orders  {"op":"open_orders"} -> {"orders":[{report}, ...]}
//   positions    {"op":"positions"}   -> {"positions":[{...}, ...]}
//   book         {"op":"book","symbol":..} -> {"book":{snapshot}}
//
// An adapter reports exchange-side trouble as {"error":"rate_limited"} or
// {"error":"server_error","detail":..}. Reports use wire_codec.hpp.
//
// Failure mapping:
//   no reply within request_timeout  -> Timeout
//   zmq::error_t on send/recv        -> ConnectionError
//   unparsable or malformed reply    -> ServerError
//
// A REQ socket that missed its reply is stuck in the "awaiting reply"
// state, so after a Timeout or ConnectionError the socket is closed and a
// fresh one is connected for the next request.
//
// Thread model:
//   A mutex serializes requests; a REQ socket carries one exchange at a time.
// -----------------------------------------------------------------------------
class ZmqExchangeClient final : public IExchangeClient {
 public:
  ZmqExchangeClient(std::string endpoint,
                    std::chrono::milliseconds request_timeout);

  ~ZmqExchangeClient() override;

  ZmqExchangeClient(const ZmqExchangeClient&) = delete;
  ZmqExchangeClient& operator=(const ZmqExchangeClient&) = delete;
  ZmqExchangeClient(ZmqExchangeClient&&) = delete;
  ZmqExchangeClient& operator=(ZmqExchangeClient&&) = delete;

  ClientReply<SubmitAck> submitOrder(const domain::Order& order) override;
  ClientReply<CancelAck> cancelOrder(
      const domain::ClientOrderId& client_order_id) override;
  ClientReply<std::optional<domain::OrderStatusReport>> queryOrder(
      const domain::ClientOrderId& client_order_id) override;
  ClientReply<std::vector<domain::OrderStatusReport>> openOrders() override;
  ClientReply<std::vector<domain::Position>> positions() override;
  ClientReply<domain::BookSnapshot> bookSnapshot(
      const std::string& symbol) override;

 private:
  ClientReply<nlohmann::json> request(const nlohmann::json& body);

  // Caller holds mutex_.
  void resetSocket();

  std::string endpoint_;
  int timeout_ms_;

  std::mutex mutex_;
  zmq::context_t context_{1};
  std::unique_ptr<zmq::socket_t> socket_;
};

}  // namespace tradecore
