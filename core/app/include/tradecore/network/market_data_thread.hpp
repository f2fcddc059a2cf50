#pragma once

#include "tradecore/events/event.hpp"
#include "tradecore/feed/feed_gateway.hpp"
#include "tradecore/time/simulation_time_provider.hpp"

#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace tradecore {

// -----------------------------------------------------------------------------
// MarketDataThread: dedicated I/O thread for the exchange feed
// -----------------------------------------------------------------------------
//
// @brief  Owns a FeedGateway and the std::thread running its recv loop.
//
// @details
// The gateway is created in start(), not in the constructor, so the engine
// can build this object early and open the socket only after its startup
// sync is done. Symbols passed in are subscribed as topics before the loop
// starts.
//
// Thread model:
//   start()/stop() from the owning thread. The internal thread runs
//   FeedGateway::run() exclusively.
//
// Ownership:
//   Owned by TradingEngine via std::unique_ptr. Owns the FeedGateway.
// -----------------------------------------------------------------------------
class MarketDataThread {
 public:
  using EventSink = FeedGateway::EventSink;

  MarketDataThread(std::string endpoint, std::vector<std::string> symbols,
                   EventSink market_sink, EventSink order_sink,
                   SimulationTimeProvider* sim_clock = nullptr);

  ~MarketDataThread();

  MarketDataThread(const MarketDataThread&) = delete;
  MarketDataThread& operator=(const MarketDataThread&) = delete;
  MarketDataThread(MarketDataThread&&) = delete;
  MarketDataThread& operator=(MarketDataThread&&) = delete;

  void start();
  void stop();

  bool isRunning() const { return thread_.joinable(); }

 private:
  std::string endpoint_;
  std::vector<std::string> symbols_;
  EventSink market_sink_;
  EventSink order_sink_;
  SimulationTimeProvider* sim_clock_;

  std::unique_ptr<FeedGateway> gateway_;
  std::thread thread_;
};

}  // namespace tradecore
