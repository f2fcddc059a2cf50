#pragma once

#include "tradecore/concurrent/thread_safe_queue.hpp"
#include "tradecore/eventbus/event_bus.hpp"
#include "tradecore/events/event.hpp"

#include <atomic>
#include <string>
#include <thread>

namespace tradecore {

// -----------------------------------------------------------------------------
// EventLoopThread
// -----------------------------------------------------------------------------
//
// @brief  One worker thread, one inbox, one EventBus. Events pushed from any
//         thread are published on the worker, so every subscriber of this
//         loop's bus runs serially on that worker.
//
// @details
// The engine runs several of these:
//   - market loop:     MarketDataFeed snapshots and heartbeats.
//   - reconcile loop:  the single writer of the OrderBook.
//   - one per routing shard (OrderRouter).
//   - one per strategy (StrategyRunner).
//
// Serialization per loop is what gives the per-strategy "no overlapping
// callbacks" rule and the per-order ordering on the reconciliation path.
//
// Thread model:
//   start(), stop() and push() are safe from any thread. Subscribers of
//   eventBus() run on the worker only.
//
// Ownership:
//   Owns its thread, queue and bus. Held by value or unique_ptr by the
//   component that owns the loop.
// -----------------------------------------------------------------------------
class EventLoopThread {
 public:
  explicit EventLoopThread(std::string name = "EventLoop");

  // Stops and joins the worker if it is still running.
  ~EventLoopThread();

  EventLoopThread(const EventLoopThread&) = delete;
  EventLoopThread& operator=(const EventLoopThread&) = delete;
  EventLoopThread(EventLoopThread&&) = delete;
  EventLoopThread& operator=(EventLoopThread&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  // Spawns the worker. No-op when already running.
  // -------------------------------------------------------------------------
  void start();

  // -------------------------------------------------------------------------
  // stop()
  // -------------------------------------------------------------------------
  // Asks the worker to exit and joins it. The worker notices within one
  // idle wait. Events still queued at that point are not published. No-op
  // when not running.
  // -------------------------------------------------------------------------
  void stop();

  // Enqueue an event for publication on the worker.
  void push(Event event) { queue_.push(std::move(event)); }

  EventBus& eventBus() { return bus_; }
  const EventBus& eventBus() const { return bus_; }

  const std::string& name() const { return name_; }

  bool isRunning() const { return running_.load(); }

 private:
  void run();

  std::string name_;
  ThreadSafeQueue<Event> queue_;
  EventBus bus_;
  std::atomic<bool> running_{false};
  std::thread thread_;
};

}  // namespace tradecore
