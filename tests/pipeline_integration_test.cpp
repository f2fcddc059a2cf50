// =============================================================================
// pipeline_integration_test.cpp
// =============================================================================
// Integration tests for the full order pipeline:
//   MarketEvent -> MarketDataFeed -> StrategyRunner -> AdmissionController
//     -> OrderRouter -> ExchangeGateway -> SimulatedExchangeClient
//     -> private ExchangeEvents / gateway results -> ReconciliationEngine
//     -> OrderBook + PositionKeeper -> fill back to the strategy
//
// Validates:
//   - Quotes are submitted, acknowledged, filled and booked into a position
//   - A drifted quote is cancelled through the router
//   - A submit whose reply timed out is resolved by a status query, not a
//     second submit
//   - A lost private event is recovered by the gap-triggered status query
//   - A denied intent never reaches the exchange, including one that only
//     breaches the strategy's own max_position
//   - An exchange-initiated cancel lands in the ledger
//
// Design:
//   Each test owns a TradingEngine with every endpoint empty and a
//   SimulatedExchangeClient whose private events are pushed back into the
//   engine, as main() does in simulation mode. Asynchronous outcomes are
//   awaited on futures: when() re-checks its condition on every order and
//   position update the reconciler publishes.
// =============================================================================

#include "tradecore/engine/trading_engine.hpp"
#include "tradecore/events/event.hpp"
#include "tradecore/gateway/simulated_exchange_client.hpp"
#include "tradecore/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
using tradecore::SimulatedExchangeClient;
using tradecore::TradingEngine;
using tradecore::domain::Intent;
using tradecore::domain::Order;
using tradecore::domain::OrderState;
using tradecore::domain::Side;

namespace {

constexpr auto kWait = 3s;

tradecore::EngineConfig testConfig() {
  tradecore::EngineConfig config;
  config.endpoints.market_data.clear();
  config.endpoints.exchange.clear();
  config.endpoints.ipc_command.clear();
  config.endpoints.ipc_telemetry.clear();
  config.gateway.max_attempts = 3;
  config.gateway.initial_backoff = 1ms;
  config.gateway.max_backoff = 4ms;
  config.rate_limit.tokens = 1000;
  config.routing_workers = 2;
  return config;
}

tradecore::StrategyConfig quotingStrategy() {
  tradecore::StrategyConfig sc;
  sc.id = "quote-btc";
  sc.type = "quoting";
  sc.symbols = {"BTC-USD"};
  sc.options = {{"order_size", 0.5}, {"max_position", 1.0}, {"spread", 2.0}};
  return sc;
}

// Places one limit buy on the first snapshot and reports what happened.
class OneShotBuyer : public tradecore::IStrategy {
 public:
  explicit OneShotBuyer(double quantity) : quantity_(quantity) {}

  const std::string& id() const override { return id_; }

  std::vector<Intent> on_market_update(
      const tradecore::domain::MarketSnapshot& snapshot,
      const tradecore::StrategyContext&) override {
    if (placed_) return {};
    placed_ = true;
    tradecore::domain::PlaceOrder place;
    place.symbol = snapshot.symbol;
    place.side = Side::Buy;
    place.price = 100.0;
    place.quantity = quantity_;
    return {place};
  }

  std::vector<Intent> on_fill(const tradecore::domain::Fill&,
                              const tradecore::StrategyContext&) override {
    if (++fills == 1) first_fill.set_value();
    return {};
  }

  void on_intent_result(const tradecore::IntentResult& result) override {
    decision.set_value(result.decision);
  }

  std::promise<tradecore::domain::AdmissionDecision> decision;
  std::promise<void> first_fill;
  std::atomic<int> fills{0};

 private:
  std::string id_{"buyer"};
  double quantity_;
  bool placed_{false};
};

tradecore::StrategyConfig buyerConfig() {
  tradecore::StrategyConfig sc;
  sc.id = "buyer";
  sc.type = "one-shot";
  sc.symbols = {"BTC-USD"};
  return sc;
}

}  // namespace

// =============================================================================
// Fixture
// =============================================================================
class PipelineIntegrationTest : public ::testing::Test {
 protected:
  void TearDown() override {
    if (engine) {
      for (auto id : subscriptions) {
        engine->reconcileEventBus().unsubscribe(id);
      }
      engine->stop();
    }
    exchange.setPrivateEventSink({});
  }

  // Ready once done() holds. Checked now and after every order or position
  // update published by the reconciler.
  std::future<void> when(std::function<bool()> done) {
    auto promise = std::make_shared<std::promise<void>>();
    auto fired = std::make_shared<std::atomic<bool>>(false);
    std::future<void> future = promise->get_future();
    auto check = [promise, fired, done] {
      if (!fired->load() && done() && !fired->exchange(true)) {
        promise->set_value();
      }
    };
    tradecore::EventBus& bus = engine->reconcileEventBus();
    subscriptions.push_back(bus.subscribe<tradecore::OrderUpdateEvent>(
        [check](const tradecore::OrderUpdateEvent&) { check(); }));
    subscriptions.push_back(bus.subscribe<tradecore::PositionUpdateEvent>(
        [check](const tradecore::PositionUpdateEvent&) { check(); }));
    check();
    return future;
  }

  std::future<void> whenOrdersIn(OrderState state, std::size_t count) {
    return when([this, state, count] { return ordersIn(state).size() == count; });
  }

  void build(tradecore::EngineConfig config) {
    engine = std::make_unique<TradingEngine>(std::move(config), sim_clock,
                                             exchange, &sim_clock);
  }

  void connectPrivateFeed() {
    exchange.setPrivateEventSink([this](const tradecore::ExchangeEvent& e) {
      if (e.kind == tradecore::ExchangeEventKind::Fill &&
          drop_next_fill.exchange(false)) {
        return;
      }
      engine->pushExchangeEvent(e);
    });
  }

  void tick(double bid, double ask) {
    tradecore::MarketEvent event;
    event.symbol = "BTC-USD";
    event.bid = bid;
    event.ask = ask;
    event.sequence = ++market_sequence;
    engine->pushMarketEvent(event);
  }

  std::vector<Order> ordersIn(OrderState state) const {
    std::vector<Order> matching;
    for (const Order& order : engine->orderBook().snapshot()) {
      if (order.state == state) matching.push_back(order);
    }
    return matching;
  }

  double position() const {
    auto pos = engine->positions().position("BTC-USD");
    return pos ? pos->net_quantity : 0.0;
  }

  tradecore::SimulationTimeProvider sim_clock{1000};
  SimulatedExchangeClient exchange{sim_clock};
  std::unique_ptr<TradingEngine> engine;
  std::vector<tradecore::EventBus::SubscriptionId> subscriptions;
  std::atomic<bool> drop_next_fill{false};
  std::uint64_t market_sequence{0};
};

// -----------------------------------------------------------------------------
// 1. Quote, acknowledge, cross, fill, position.
// -----------------------------------------------------------------------------
TEST_F(PipelineIntegrationTest, QuoteIsFilledIntoPosition) {
  tradecore::EngineConfig config = testConfig();
  config.strategies.push_back(quotingStrategy());
  build(config);
  connectPrivateFeed();
  engine->start();

  auto quoted = whenOrdersIn(OrderState::Open, 2);
  tick(99.0, 101.0);
  ASSERT_EQ(quoted.wait_for(kWait), std::future_status::ready)
      << "quotes were not acknowledged";
  EXPECT_EQ(exchange.submitCalls(), 2);

  // Ask drops to our bid: the resting buy at 99 executes.
  auto filled = whenOrdersIn(OrderState::Filled, 1);
  auto booked = when([this] { return position() > 0.49; });
  EXPECT_EQ(exchange.crossResting("BTC-USD", 98.0, 99.0), 1);
  ASSERT_EQ(filled.wait_for(kWait), std::future_status::ready);
  ASSERT_EQ(booked.wait_for(kWait), std::future_status::ready);
  EXPECT_DOUBLE_EQ(position(), 0.5);

  Order filled = ordersIn(OrderState::Filled).front();
  EXPECT_EQ(filled.side, Side::Buy);
  EXPECT_DOUBLE_EQ(filled.filled_quantity, 0.5);
  EXPECT_EQ(filled.strategy_id, "quote-btc");
}

// -----------------------------------------------------------------------------
// 2. Mid moves well away: both quotes are cancelled through the router.
// -----------------------------------------------------------------------------
TEST_F(PipelineIntegrationTest, DriftedQuotesAreCancelled) {
  tradecore::EngineConfig config = testConfig();
  config.strategies.push_back(quotingStrategy());
  build(config);
  connectPrivateFeed();
  engine->start();

  auto quoted = whenOrdersIn(OrderState::Open, 2);
  tick(99.0, 101.0);
  ASSERT_EQ(quoted.wait_for(kWait), std::future_status::ready);

  auto cancelled = whenOrdersIn(OrderState::Cancelled, 2);
  tick(119.0, 121.0);
  ASSERT_EQ(cancelled.wait_for(kWait), std::future_status::ready)
      << "drifted quotes were not cancelled";
  EXPECT_EQ(exchange.callCount(SimulatedExchangeClient::Operation::Cancel), 2);
}

// -----------------------------------------------------------------------------
// 3. Submit reply lost after the exchange applied it. The gateway asks the
//    exchange instead of resubmitting, and the order goes live once.
// -----------------------------------------------------------------------------
TEST_F(PipelineIntegrationTest, TimedOutSubmitResolvedByStatusQuery) {
  build(testConfig());
  auto buyer = std::make_unique<OneShotBuyer>(1.0);
  OneShotBuyer* strategy = buyer.get();
  auto decision = strategy->decision.get_future();
  auto filled_back = strategy->first_fill.get_future();
  engine->addStrategy(buyerConfig(), std::move(buyer));

  // Private feed off: only the gateway's own query can reveal the order.
  exchange.failNext(SimulatedExchangeClient::Operation::Submit,
                    tradecore::TransportFailureKind::Timeout, 1,
                    /*applied=*/true);
  engine->start();

  auto open = whenOrdersIn(OrderState::Open, 1);
  tick(99.0, 101.0);
  ASSERT_EQ(decision.wait_for(2s), std::future_status::ready);
  ASSERT_TRUE(decision.get().allowed);

  ASSERT_EQ(open.wait_for(kWait), std::future_status::ready)
      << "status query did not resolve the submit";
  EXPECT_EQ(exchange.submitCalls(), 1);
  EXPECT_GE(exchange.callCount(SimulatedExchangeClient::Operation::Query), 1);

  const std::string id = ordersIn(OrderState::Open).front().client_order_id;
  connectPrivateFeed();
  auto filled = whenOrdersIn(OrderState::Filled, 1);
  auto booked = when([this] { return position() > 0.99; });
  ASSERT_TRUE(exchange.fill(id, 1.0, 100.0).has_value());

  ASSERT_EQ(filled.wait_for(kWait), std::future_status::ready);
  ASSERT_EQ(booked.wait_for(kWait), std::future_status::ready);
  ASSERT_EQ(filled_back.wait_for(kWait), std::future_status::ready);
  EXPECT_EQ(strategy->fills.load(), 1);
  EXPECT_DOUBLE_EQ(position(), 1.0);
}

// -----------------------------------------------------------------------------
// 4. The first fill is lost on the private feed. The second one arrives with
//    a sequence gap; the status report fills in what was missed.
// -----------------------------------------------------------------------------
TEST_F(PipelineIntegrationTest, LostFillRecoveredThroughGapQuery) {
  build(testConfig());
  auto buyer = std::make_unique<OneShotBuyer>(1.0);
  engine->addStrategy(buyerConfig(), std::move(buyer));
  connectPrivateFeed();
  engine->start();

  auto open = whenOrdersIn(OrderState::Open, 1);
  tick(99.0, 101.0);
  ASSERT_EQ(open.wait_for(kWait), std::future_status::ready);
  const std::string id = ordersIn(OrderState::Open).front().client_order_id;

  auto filled = whenOrdersIn(OrderState::Filled, 1);
  auto booked = when([this] { return position() > 0.99; });
  drop_next_fill = true;
  ASSERT_TRUE(exchange.fill(id, 0.4, 100.0).has_value());
  ASSERT_TRUE(exchange.fill(id, 0.6, 101.0).has_value());

  ASSERT_EQ(filled.wait_for(kWait), std::future_status::ready)
      << "gap was not reconciled";
  ASSERT_EQ(booked.wait_for(kWait), std::future_status::ready);
  EXPECT_DOUBLE_EQ(position(), 1.0);
  EXPECT_DOUBLE_EQ(engine->orderBook().find(id)->filled_quantity, 1.0);
}

// -----------------------------------------------------------------------------
// 5. Denied by risk: the exchange never sees it.
// -----------------------------------------------------------------------------
TEST_F(PipelineIntegrationTest, DeniedIntentNeverReachesExchange) {
  tradecore::EngineConfig config = testConfig();
  config.risk.defaults.max_net_position = 0.1;
  build(config);
  auto buyer = std::make_unique<OneShotBuyer>(1.0);
  auto decision = buyer->decision.get_future();
  engine->addStrategy(buyerConfig(), std::move(buyer));
  connectPrivateFeed();
  engine->start();

  tick(99.0, 101.0);
  ASSERT_EQ(decision.wait_for(2s), std::future_status::ready);
  tradecore::domain::AdmissionDecision d = decision.get();
  EXPECT_FALSE(d.allowed);
  EXPECT_EQ(d.reason, tradecore::domain::DenyReason::ExceedsPositionLimit);

  std::this_thread::sleep_for(20ms);
  EXPECT_EQ(exchange.submitCalls(), 0);
  EXPECT_EQ(engine->orderBook().size(), 0u);
}

// -----------------------------------------------------------------------------
// 6. The symbol limit (10) would allow a 2-lot buy, the strategy's own
//    max_position (1) does not.
// -----------------------------------------------------------------------------
TEST_F(PipelineIntegrationTest, StrategyMaxPositionDeniesBeforeExchange) {
  tradecore::EngineConfig config = testConfig();
  config.risk.defaults.max_net_position = 10.0;
  build(config);
  auto buyer = std::make_unique<OneShotBuyer>(2.0);
  auto decision = buyer->decision.get_future();
  tradecore::StrategyConfig capped = buyerConfig();
  capped.options = {{"max_position", 1.0}};
  engine->addStrategy(capped, std::move(buyer));
  connectPrivateFeed();
  engine->start();

  tick(99.0, 101.0);
  ASSERT_EQ(decision.wait_for(2s), std::future_status::ready);
  tradecore::domain::AdmissionDecision d = decision.get();
  EXPECT_FALSE(d.allowed);
  EXPECT_EQ(d.reason, tradecore::domain::DenyReason::ExceedsPositionLimit);

  std::this_thread::sleep_for(20ms);
  EXPECT_EQ(exchange.submitCalls(), 0);
  EXPECT_EQ(engine->orderBook().size(), 0u);
}

// -----------------------------------------------------------------------------
// 7. Exchange-initiated cancel (expiry) reaches the ledger.
// -----------------------------------------------------------------------------
TEST_F(PipelineIntegrationTest, ExchangeCancelLandsInLedger) {
  build(testConfig());
  engine->addStrategy(buyerConfig(), std::make_unique<OneShotBuyer>(1.0));
  connectPrivateFeed();
  engine->start();

  auto open = whenOrdersIn(OrderState::Open, 1);
  tick(99.0, 101.0);
  ASSERT_EQ(open.wait_for(kWait), std::future_status::ready);
  const std::string id = ordersIn(OrderState::Open).front().client_order_id;

  auto cancelled = whenOrdersIn(OrderState::Cancelled, 1);
  ASSERT_TRUE(exchange.cancelByExchange(id, "expired"));
  ASSERT_EQ(cancelled.wait_for(kWait), std::future_status::ready);
  EXPECT_EQ(engine->orderBook().find(id)->reason, "expired");
}
