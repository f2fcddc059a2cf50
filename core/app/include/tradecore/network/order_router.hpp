#pragma once

#include "tradecore/concurrent/event_loop_thread.hpp"
#include "tradecore/domain/order.hpp"
#include "tradecore/events/event.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

namespace tradecore {

class ExchangeGateway;

// -----------------------------------------------------------------------------
// OrderRouter: pool of gateway workers
// -----------------------------------------------------------------------------
//
// @brief  Runs blocking ExchangeGateway calls off the strategy and
//         reconciliation threads and delivers each outcome as an event.
//
// @details
// route() accepts SubmitRequestEvent, CancelRequestEvent and
// StatusRequestEvent. The worker is chosen by hash(client_order_id) % N, so
// every request for one order runs on the same worker in arrival order
// (a cancel never overtakes its own submit), while requests for different
// orders proceed in parallel. Gateway retries and backoff sleep on the
// worker.
//
// Outcomes go to result_sink as SubmitResultEvent / CancelResultEvent /
// StatusResultEvent; TradingEngine binds it to the reconciliation loop.
//
// BookResyncRequestEvent is sharded by symbol. The fetched level-3 snapshot
// (or std::nullopt) goes to market_sink as a BookSnapshotEvent, which
// TradingEngine binds to the market loop. Without a market sink book
// requests are ignored.
//
// Thread model:
//   route() is safe from any thread. Each worker is an EventLoopThread.
//
// Ownership:
//   Owned by TradingEngine via std::unique_ptr. Owns its worker loops;
//   references the ExchangeGateway.
// -----------------------------------------------------------------------------
class OrderRouter {
 public:
  using ResultSink = std::function<void(Event)>;

  OrderRouter(ExchangeGateway& gateway, std::size_t workers,
              ResultSink result_sink, ResultSink market_sink = {});

  ~OrderRouter();

  OrderRouter(const OrderRouter&) = delete;
  OrderRouter& operator=(const OrderRouter&) = delete;
  OrderRouter(OrderRouter&&) = delete;
  OrderRouter& operator=(OrderRouter&&) = delete;

  void start();
  void stop();

  // Queues a request on its order's (or symbol's) worker. Other event types
  // are ignored.
  void route(Event request);

  std::size_t shardFor(const domain::ClientOrderId& client_order_id) const;
  std::size_t workerCount() const { return workers_.size(); }
  std::uint64_t routedCount() const { return routed_.load(); }

 private:
  struct Worker {
    std::unique_ptr<EventLoopThread> loop;
    EventBus::SubscriptionId submit_sub_id{0};
    EventBus::SubscriptionId cancel_sub_id{0};
    EventBus::SubscriptionId status_sub_id{0};
    EventBus::SubscriptionId book_sub_id{0};
  };

  void onSubmit(const SubmitRequestEvent& request);
  void onCancel(const CancelRequestEvent& request);
  void onStatus(const StatusRequestEvent& request);
  void onBookResync(const BookResyncRequestEvent& request);

  ExchangeGateway& gateway_;
  ResultSink result_sink_;
  ResultSink market_sink_;
  std::vector<Worker> workers_;
  std::atomic<std::uint64_t> routed_{0};
  bool running_{false};
};

}  // namespace tradecore
