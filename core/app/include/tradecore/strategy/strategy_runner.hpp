#pragma once

#include "tradecore/concurrent/event_loop_thread.hpp"
#include "tradecore/domain/fill.hpp"
#include "tradecore/domain/intent.hpp"
#include "tradecore/domain/market_snapshot.hpp"
#include "tradecore/domain/order.hpp"
#include "tradecore/events/event.hpp"
#include "tradecore/strategy/strategy.hpp"
#include "tradecore/strategy/strategy_config.hpp"

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace tradecore {

class AdmissionController;
class OrderBook;
class PositionKeeper;

// -----------------------------------------------------------------------------
// StrategyRunner: hosts strategy instances, one serial worker each
// -----------------------------------------------------------------------------
//
// @brief  Delivers market snapshots and fills to strategies, passes every
//         resulting intent through admission, forwards admitted intents to
//         the order router and reports each decision back to the strategy.
//
// @details
// Registration (builder style, before start()):
//   runner.add(config_a, std::move(a)).add(config_b, std::move(b));
//   Adding after start() or reusing an id throws std::logic_error.
//   A config with max_position registers that cap with admission.
//
// Scheduling:
//   Each strategy owns an EventLoopThread. All of its callbacks run on that
//   thread, so they never overlap; different strategies run concurrently
//   with no ordering between them.
//
// Fan-out:
//   onMarketSnapshot() -> every strategy whose symbol scope contains the
//                         snapshot's symbol.
//   onFillApplied()    -> only the strategy that owns the order.
//
// Intent pipeline (on the strategy's worker, per intent, in order):
//   1. A PlaceOrder outside the strategy's symbol scope is denied with
//      OutOfScope; anything else goes to
//      AdmissionController::admit(strategy_id, intent).
//   2. Allowed PlaceOrder  -> SubmitRequestEvent to the order sink.
//      Allowed CancelOrder -> CancelRequestEvent to the order sink.
//   3. IntentDecisionEvent to the decision sink (logging/telemetry).
//   4. strategy.on_intent_result({intent, decision}).
//   A denied intent never reaches the order sink.
//
// Ownership:
//   Owned by TradingEngine. Owns the strategies, their contexts and worker
//   loops. References the admission controller, ledger and positions.
// -----------------------------------------------------------------------------
class StrategyRunner {
 public:
  using EventSink = std::function<void(Event)>;

  StrategyRunner(AdmissionController& admission, const OrderBook& book,
                 const PositionKeeper& positions, EventSink order_sink,
                 EventSink decision_sink = {});

  ~StrategyRunner();

  StrategyRunner(const StrategyRunner&) = delete;
  StrategyRunner& operator=(const StrategyRunner&) = delete;
  StrategyRunner(StrategyRunner&&) = delete;
  StrategyRunner& operator=(StrategyRunner&&) = delete;

  StrategyRunner& add(StrategyConfig config,
                      std::unique_ptr<IStrategy> strategy);

  void start();
  void stop();

  void onMarketSnapshot(const domain::MarketSnapshot& snapshot);
  void onFillApplied(const domain::Order& order, const domain::Fill& fill);

  std::size_t strategyCount() const { return slots_.size(); }
  bool isRunning() const { return running_.load(); }

 private:
  struct Slot {
    StrategyConfig config;
    std::unique_ptr<IStrategy> strategy;
    std::unique_ptr<StrategyContext> context;
    std::unique_ptr<EventLoopThread> loop;
    EventBus::SubscriptionId snapshot_sub_id{0};
    EventBus::SubscriptionId fill_sub_id{0};
  };

  void handleSnapshot(Slot& slot, const domain::MarketSnapshot& snapshot);
  void handleFill(Slot& slot, const domain::Fill& fill);
  void processIntents(Slot& slot, const std::vector<domain::Intent>& intents);

  AdmissionController& admission_;
  const OrderBook& book_;
  const PositionKeeper& positions_;
  EventSink order_sink_;
  EventSink decision_sink_;

  std::vector<std::unique_ptr<Slot>> slots_;
  std::unordered_map<std::string, Slot*> by_id_;
  std::atomic<bool> running_{false};
};

}  // namespace tradecore
