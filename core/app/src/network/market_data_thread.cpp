#include "tradecore/network/market_data_thread.hpp"

#include <iostream>
#include <utility>

namespace tradecore {

MarketDataThread::MarketDataThread(std::string endpoint,
                                   std::vector<std::string> symbols,
                                   EventSink market_sink, EventSink order_sink,
                                   SimulationTimeProvider* sim_clock)
    : endpoint_(std::move(endpoint)),
      symbols_(std::move(symbols)),
      market_sink_(std::move(market_sink)),
      order_sink_(std::move(order_sink)),
      sim_clock_(sim_clock) {}

MarketDataThread::~MarketDataThread() { stop(); }

// -----------------------------------------------------------------------------
// start(): open the SUB socket, subscribe topics, spawn the recv thread
// -----------------------------------------------------------------------------
void MarketDataThread::start() {
  if (thread_.joinable()) {
    return;
  }

  gateway_ = std::make_unique<FeedGateway>(endpoint_, market_sink_,
                                           order_sink_, sim_clock_);
  for (const std::string& symbol : symbols_) {
    gateway_->subscribe(symbol);
  }

  thread_ = std::thread([this] {
    std::cout << "[MarketDataThread] listening on " << endpoint_ << "\n";
    gateway_->run();
    std::cout << "[MarketDataThread] recv loop exited\n";
  });
}

void MarketDataThread::stop() {
  if (gateway_) {
    gateway_->stop();
  }
  if (thread_.joinable()) {
    thread_.join();
  }
  gateway_.reset();
}

}  // namespace tradecore
