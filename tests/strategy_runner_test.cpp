// =============================================================================
// strategy_runner_test.cpp
// =============================================================================
// Unit tests for tradecore::StrategyRunner.
//
// Validates:
//   - Admitted intents reach the order sink; denied ones never do
//   - Every decision is reported back to the emitting strategy
//   - Snapshots go only to strategies whose scope contains the symbol
//   - Fills go only to the strategy that owns the order
//   - Callbacks of one strategy never overlap
//   - Registration rules (duplicate id, add after start)
//   - A throwing strategy does not take the runner down
//   - Out-of-scope orders and per-strategy position caps are denied before
//     anything reaches the order sink
//
// Design: the strategy signals a future when it has seen a given number of
// callbacks; tests wait on it with a bounded wait_for.
// =============================================================================

#include "tradecore/concurrent/client_order_id_generator.hpp"
#include "tradecore/eventbus/event_bus.hpp"
#include "tradecore/events/event.hpp"
#include "tradecore/feed/market_data_feed.hpp"
#include "tradecore/ledger/order_book.hpp"
#include "tradecore/reconcile/reconciliation_engine.hpp"
#include "tradecore/risk/admission_controller.hpp"
#include "tradecore/risk/position_keeper.hpp"
#include "tradecore/strategy/strategy_runner.hpp"
#include "tradecore/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <utility>
#include <vector>

using namespace std::chrono_literals;
using tradecore::IntentResult;
using tradecore::StrategyConfig;
using tradecore::StrategyContext;
using tradecore::domain::DenyReason;
using tradecore::domain::Fill;
using tradecore::domain::Intent;
using tradecore::domain::MarketSnapshot;
using tradecore::domain::Order;
using tradecore::domain::PlaceOrder;
using tradecore::domain::Side;

namespace {

// Counts hits and hands out futures that become ready at a given total.
class HitCounter {
 public:
  std::future<void> when(int total) {
    std::lock_guard<std::mutex> lock(mutex_);
    waiters_.emplace_back(total, std::promise<void>());
    std::future<void> future = waiters_.back().second.get_future();
    release();
    return future;
  }

  void hit() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++count_;
    release();
  }

 private:
  void release() {
    for (auto it = waiters_.begin(); it != waiters_.end();) {
      if (count_ >= it->first) {
        it->second.set_value();
        it = waiters_.erase(it);
      } else {
        ++it;
      }
    }
  }

  std::mutex mutex_;
  int count_{0};
  std::vector<std::pair<int, std::promise<void>>> waiters_;
};

bool ready(std::future<void>& future,
           std::chrono::milliseconds timeout = 2000ms) {
  return future.wait_for(timeout) == std::future_status::ready;
}

MarketSnapshot snapshot(const std::string& symbol, std::uint64_t seq) {
  MarketSnapshot s;
  s.symbol = symbol;
  s.bid = 99.0;
  s.ask = 101.0;
  s.sequence = seq;
  return s;
}

PlaceOrder buy(double qty) {
  PlaceOrder p;
  p.symbol = "BTC-USD";
  p.side = Side::Buy;
  p.price = 100.0;
  p.quantity = qty;
  return p;
}

// Emits a fixed list of intents on every snapshot and records what it sees.
class ScriptedStrategy : public tradecore::IStrategy {
 public:
  explicit ScriptedStrategy(std::string id, std::vector<Intent> script = {})
      : id_(std::move(id)), script_(std::move(script)) {}

  const std::string& id() const override { return id_; }

  std::vector<Intent> on_market_update(const MarketSnapshot&,
                                       const StrategyContext&) override {
    int inside = ++in_callback;
    if (inside > max_in_callback.load()) max_in_callback.store(inside);
    std::this_thread::sleep_for(std::chrono::microseconds(200));
    ++snapshots;
    --in_callback;
    snapshot_hits.hit();
    if (throw_on_snapshot) {
      throw std::runtime_error("strategy bug");
    }
    return script_;
  }

  std::vector<Intent> on_fill(const Fill&, const StrategyContext&) override {
    ++fills;
    fill_hits.hit();
    return {};
  }

  void on_intent_result(const IntentResult& result) override {
    {
      std::lock_guard<std::mutex> lock(mutex);
      results.push_back(result);
    }
    result_hits.hit();
  }

  std::size_t resultCount() {
    std::lock_guard<std::mutex> lock(mutex);
    return results.size();
  }

  std::atomic<int> snapshots{0};
  std::atomic<int> fills{0};
  std::atomic<int> in_callback{0};
  std::atomic<int> max_in_callback{0};
  std::atomic<bool> throw_on_snapshot{false};
  HitCounter snapshot_hits;
  HitCounter fill_hits;
  HitCounter result_hits;
  std::mutex mutex;
  std::vector<IntentResult> results;

 private:
  std::string id_;
  std::vector<Intent> script_;
};

}  // namespace

// =============================================================================
// Fixture: real admission stack, recording sinks
// =============================================================================
class StrategyRunnerTest : public ::testing::Test {
 protected:
  static tradecore::domain::RiskLimits riskLimits() {
    tradecore::domain::RiskLimits r;
    r.defaults.max_open_orders = 5;
    r.defaults.max_net_position = 10.0;
    return r;
  }

  void TearDown() override { runner.stop(); }

  StrategyConfig config(const std::string& id,
                        std::vector<std::string> symbols = {"BTC-USD"}) {
    StrategyConfig c;
    c.id = id;
    c.type = "scripted";
    c.symbols = std::move(symbols);
    return c;
  }

  std::size_t orderCount() {
    std::lock_guard<std::mutex> lock(sink_mutex);
    return orders.size();
  }

  std::size_t decisionCount() {
    std::lock_guard<std::mutex> lock(sink_mutex);
    return decisions.size();
  }

  tradecore::SimulationTimeProvider clock{1000};
  tradecore::EventBus reconcile_bus;
  tradecore::EventBus market_bus;
  tradecore::OrderBook book{clock};
  tradecore::PositionKeeper positions;
  tradecore::ReconciliationEngine reconciler{reconcile_bus, book, positions,
                                             clock, 3600000};
  tradecore::MarketDataFeed feed{market_bus};
  tradecore::ClientOrderIdGenerator ids{"tc"};
  tradecore::AdmissionController admission{reconciler, book, positions, feed,
                                           riskLimits(), ids, clock};

  std::mutex sink_mutex;
  std::vector<tradecore::Event> orders;
  std::vector<tradecore::Event> decisions;

  tradecore::StrategyRunner runner{
      admission, book, positions,
      [this](tradecore::Event e) {
        std::lock_guard<std::mutex> lock(sink_mutex);
        orders.push_back(std::move(e));
      },
      [this](tradecore::Event e) {
        std::lock_guard<std::mutex> lock(sink_mutex);
        decisions.push_back(std::move(e));
      }};
};

// -----------------------------------------------------------------------------
// 1. Allowed PlaceOrder -> SubmitRequestEvent with the Pending order.
// -----------------------------------------------------------------------------
TEST_F(StrategyRunnerTest, AllowedIntentReachesOrderSink) {
  auto strategy = std::make_unique<ScriptedStrategy>(
      "a", std::vector<Intent>{buy(1.0)});
  ScriptedStrategy* a = strategy.get();
  runner.add(config("a"), std::move(strategy));
  runner.start();

  auto decided = a->result_hits.when(1);
  runner.onMarketSnapshot(snapshot("BTC-USD", 1));
  ASSERT_TRUE(ready(decided));

  ASSERT_EQ(orderCount(), 1u);
  {
    std::lock_guard<std::mutex> lock(sink_mutex);
    const auto* submit =
        std::get_if<tradecore::SubmitRequestEvent>(&orders.front());
    ASSERT_NE(submit, nullptr);
    EXPECT_EQ(submit->order.client_order_id, "tc-1");
    EXPECT_EQ(submit->order.strategy_id, "a");
  }
  EXPECT_TRUE(a->results.front().decision.allowed);
  EXPECT_EQ(decisionCount(), 1u);
  EXPECT_TRUE(book.find("tc-1").has_value());
}

// -----------------------------------------------------------------------------
// 2. Denied intent: the strategy hears about it, the order sink never does.
// -----------------------------------------------------------------------------
TEST_F(StrategyRunnerTest, DeniedIntentNeverReachesOrderSink) {
  auto strategy = std::make_unique<ScriptedStrategy>(
      "a", std::vector<Intent>{buy(0.0), buy(50.0)});
  ScriptedStrategy* a = strategy.get();
  runner.add(config("a"), std::move(strategy));
  runner.start();

  auto decided = a->result_hits.when(2);
  runner.onMarketSnapshot(snapshot("BTC-USD", 1));
  ASSERT_TRUE(ready(decided));

  EXPECT_EQ(orderCount(), 0u);
  EXPECT_EQ(decisionCount(), 2u);
  EXPECT_EQ(a->results[0].decision.reason, DenyReason::InvalidQuantity);
  EXPECT_EQ(a->results[1].decision.reason, DenyReason::ExceedsPositionLimit);
  EXPECT_EQ(book.size(), 0u);
}

// -----------------------------------------------------------------------------
// 3. Scope: a strategy only sees its own symbols.
// -----------------------------------------------------------------------------
TEST_F(StrategyRunnerTest, SnapshotsRespectSymbolScope) {
  auto btc = std::make_unique<ScriptedStrategy>("btc");
  auto eth = std::make_unique<ScriptedStrategy>("eth");
  ScriptedStrategy* b = btc.get();
  ScriptedStrategy* e = eth.get();
  runner.add(config("btc", {"BTC-USD"}), std::move(btc))
      .add(config("eth", {"ETH-USD"}), std::move(eth));
  runner.start();

  auto btc_seen = b->snapshot_hits.when(2);
  auto eth_seen = e->snapshot_hits.when(1);
  runner.onMarketSnapshot(snapshot("BTC-USD", 1));
  runner.onMarketSnapshot(snapshot("BTC-USD", 2));
  runner.onMarketSnapshot(snapshot("ETH-USD", 1));

  ASSERT_TRUE(ready(btc_seen));
  ASSERT_TRUE(ready(eth_seen));
  std::this_thread::sleep_for(20ms);
  EXPECT_EQ(b->snapshots.load(), 2);
  EXPECT_EQ(e->snapshots.load(), 1);
}

// -----------------------------------------------------------------------------
// 4. Fills are routed by the order's strategy id; unowned fills are dropped.
// -----------------------------------------------------------------------------
TEST_F(StrategyRunnerTest, FillsGoToOwningStrategyOnly) {
  auto sa = std::make_unique<ScriptedStrategy>("a");
  auto sb = std::make_unique<ScriptedStrategy>("b");
  ScriptedStrategy* a = sa.get();
  ScriptedStrategy* b = sb.get();
  runner.add(config("a"), std::move(sa)).add(config("b"), std::move(sb));
  runner.start();

  Order order;
  order.client_order_id = "tc-9";
  order.strategy_id = "b";
  Fill fill;
  fill.order_id = "tc-9";
  fill.quantity = 1.0;
  fill.price = 100.0;

  auto filled = b->fill_hits.when(1);
  runner.onFillApplied(order, fill);
  order.strategy_id.clear();  // hydrated order, no owner
  runner.onFillApplied(order, fill);

  ASSERT_TRUE(ready(filled));
  std::this_thread::sleep_for(20ms);
  EXPECT_EQ(a->fills.load(), 0);
  EXPECT_EQ(b->fills.load(), 1);
}

// -----------------------------------------------------------------------------
// 5. One worker per strategy: callbacks never overlap.
// Why: strategies keep unsynchronized state between callbacks.
// -----------------------------------------------------------------------------
TEST_F(StrategyRunnerTest, CallbacksForOneStrategyAreSerial) {
  auto strategy = std::make_unique<ScriptedStrategy>("a");
  ScriptedStrategy* a = strategy.get();
  runner.add(config("a"), std::move(strategy));
  runner.start();

  constexpr int kPerThread = 50;
  auto drained = a->snapshot_hits.when(4 * kPerThread);
  std::vector<std::thread> producers;
  for (int t = 0; t < 4; ++t) {
    producers.emplace_back([&, t] {
      for (int i = 0; i < kPerThread; ++i) {
        runner.onMarketSnapshot(
            snapshot("BTC-USD", static_cast<std::uint64_t>(t * 1000 + i + 1)));
      }
    });
  }
  for (auto& p : producers) p.join();

  ASSERT_TRUE(ready(drained, 5000ms));
  EXPECT_EQ(a->max_in_callback.load(), 1);
}

// -----------------------------------------------------------------------------
// 6. Registration rules.
// -----------------------------------------------------------------------------
TEST_F(StrategyRunnerTest, DuplicateIdAndLateAddThrow) {
  runner.add(config("a"), std::make_unique<ScriptedStrategy>("a"));
  EXPECT_THROW(runner.add(config("a"), std::make_unique<ScriptedStrategy>("a")),
               std::logic_error);
  EXPECT_EQ(runner.strategyCount(), 1u);

  runner.start();
  EXPECT_THROW(runner.add(config("b"), std::make_unique<ScriptedStrategy>("b")),
               std::logic_error);
}

// -----------------------------------------------------------------------------
// 7. A throwing callback skips that event; the worker keeps going.
// -----------------------------------------------------------------------------
TEST_F(StrategyRunnerTest, ThrowingStrategyKeepsRunning) {
  auto strategy = std::make_unique<ScriptedStrategy>(
      "a", std::vector<Intent>{buy(1.0)});
  ScriptedStrategy* a = strategy.get();
  a->throw_on_snapshot = true;
  runner.add(config("a"), std::move(strategy));
  runner.start();

  auto threw = a->snapshot_hits.when(1);
  runner.onMarketSnapshot(snapshot("BTC-USD", 1));
  ASSERT_TRUE(ready(threw));
  EXPECT_EQ(a->resultCount(), 0u);

  a->throw_on_snapshot = false;
  auto decided = a->result_hits.when(1);
  runner.onMarketSnapshot(snapshot("BTC-USD", 2));
  ASSERT_TRUE(ready(decided));
  EXPECT_EQ(orderCount(), 1u);
}

// -----------------------------------------------------------------------------
// 8. A PlaceOrder for a symbol outside the strategy's scope is denied and
//    never registered or routed.
// -----------------------------------------------------------------------------
TEST_F(StrategyRunnerTest, OutOfScopeOrderIsDenied) {
  PlaceOrder eth = buy(1.0);
  eth.symbol = "ETH-USD";
  auto strategy = std::make_unique<ScriptedStrategy>(
      "a", std::vector<Intent>{eth});
  ScriptedStrategy* a = strategy.get();
  runner.add(config("a", {"BTC-USD"}), std::move(strategy));
  runner.start();

  auto decided = a->result_hits.when(1);
  runner.onMarketSnapshot(snapshot("BTC-USD", 1));
  ASSERT_TRUE(ready(decided));

  EXPECT_EQ(orderCount(), 0u);
  EXPECT_EQ(decisionCount(), 1u);
  EXPECT_FALSE(a->results.front().decision.allowed);
  EXPECT_EQ(a->results.front().decision.reason, DenyReason::OutOfScope);
  EXPECT_EQ(book.size(), 0u);
}

// -----------------------------------------------------------------------------
// 9. The strategy's own max_position is tighter than the symbol limit (10):
//    a 2-lot buy is denied, a 1-lot buy passes.
// -----------------------------------------------------------------------------
TEST_F(StrategyRunnerTest, StrategyPositionCapIsEnforced) {
  auto strategy = std::make_unique<ScriptedStrategy>(
      "a", std::vector<Intent>{buy(2.0), buy(1.0)});
  ScriptedStrategy* a = strategy.get();
  StrategyConfig capped = config("a");
  capped.max_position = 1.0;
  runner.add(capped, std::move(strategy));
  runner.start();

  auto decided = a->result_hits.when(2);
  runner.onMarketSnapshot(snapshot("BTC-USD", 1));
  ASSERT_TRUE(ready(decided));

  EXPECT_EQ(a->results[0].decision.reason, DenyReason::ExceedsPositionLimit);
  EXPECT_TRUE(a->results[1].decision.allowed);
  EXPECT_EQ(orderCount(), 1u);
  EXPECT_DOUBLE_EQ(admission.limitsFor("a", "BTC-USD").max_net_position, 1.0);
  EXPECT_DOUBLE_EQ(admission.limitsFor("b", "BTC-USD").max_net_position, 10.0);
}
