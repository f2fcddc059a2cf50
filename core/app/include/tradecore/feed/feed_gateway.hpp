#pragma once

#include "tradecore/events/event.hpp"
#include "tradecore/time/simulation_time_provider.hpp"

#include <zmq.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <string>

namespace tradecore {

// -----------------------------------------------------------------------------
// FeedGateway: ZeroMQ subscriber for the exchange's streaming feed
// -----------------------------------------------------------------------------
//
// @brief  Receives feed messages on a SUB socket, decodes them with
//         FeedDecoder and hands market data and private order events to two
//         separate sinks.
//
// @details
// The feed bridge publishes two-frame messages: [topic, json]. Topics are
// the symbol for tickers, "heartbeat" for liveness and "orders" for the
// private order stream. subscribe(symbol) adds a symbol topic; heartbeat and
// order topics are always subscribed. With no symbol subscribed the socket
// accepts every topic. A single-frame message is treated as bare JSON.
//
// Routing:
//   MarketEvent, HeartbeatEvent,
//   BookEvent, BookSnapshotEvent -> market_sink (market loop)
//   ExchangeEvent                -> order_sink  (reconciliation loop)
//
// Simulation:
//   When a SimulationTimeProvider is supplied, the clock is advanced to each
//   message's timestamp BEFORE the event is handed on, so everything that
//   processes the event sees the matching time.
//
// Thread model:
//   run() blocks; call it from one dedicated thread (MarketDataThread).
//   stop() may be called from any thread and is noticed within
//   kRecvTimeoutMs. subscribe() must be called before run().
//
// Ownership:
//   Owns the zmq context and socket. Holds copies of both sinks and a
//   non-owning pointer to the simulation clock (may be null).
// -----------------------------------------------------------------------------
class FeedGateway {
 public:
  using EventSink = std::function<void(Event)>;

  FeedGateway(const std::string& endpoint, EventSink market_sink,
              EventSink order_sink,
              SimulationTimeProvider* sim_clock = nullptr);

  ~FeedGateway() = default;

  FeedGateway(const FeedGateway&) = delete;
  FeedGateway& operator=(const FeedGateway&) = delete;
  FeedGateway(FeedGateway&&) = delete;
  FeedGateway& operator=(FeedGateway&&) = delete;

  // Adds a topic filter for one symbol's ticker stream.
  void subscribe(const std::string& symbol);

  void run();
  void stop();

  // Decodes one payload and routes it. Also used by run().
  void dispatch(const std::string& payload);

  std::uint64_t messageCount() const { return messages_.load(); }
  std::uint64_t decodeErrorCount() const { return decode_errors_.load(); }

 private:
  static constexpr int kRecvTimeoutMs = 100;

  EventSink market_sink_;
  EventSink order_sink_;
  SimulationTimeProvider* sim_clock_;

  zmq::context_t context_{1};
  zmq::socket_t socket_{context_, zmq::socket_type::sub};
  bool subscribed_all_{true};

  // Starts true so a stop() that lands before run() is not lost. A gateway
  // runs once.
  std::atomic<bool> running_{true};
  std::atomic<std::uint64_t> messages_{0};
  std::atomic<std::uint64_t> decode_errors_{0};
};

}  // namespace tradecore
