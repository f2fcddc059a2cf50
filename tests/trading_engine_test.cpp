// =============================================================================
// trading_engine_test.cpp
// =============================================================================
// Unit tests for tradecore::TradingEngine.
//
// Validates:
//   - Lifecycle: start() / stop() / destructor, both idempotent
//   - Startup sync: exchange positions and open orders are hydrated before
//     strategies run; an unreachable exchange starts the engine halted
//   - A configured strategy that cannot be built fails start()
//   - IPC command handler: PING, STATUS, HALT, ORDERS, RESOLVE, unknown
//   - A level-3 book message leads to a snapshot fetch through the router
//
// Design: every endpoint is empty, so no sockets are opened. The exchange is
// a SimulatedExchangeClient on a simulation clock. Each test owns its
// engine.
// =============================================================================

#include "tradecore/engine/trading_engine.hpp"
#include "tradecore/gateway/simulated_exchange_client.hpp"
#include "tradecore/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <chrono>
#include <future>
#include <thread>

using namespace std::chrono_literals;
using tradecore::SimulatedExchangeClient;
using tradecore::TradingEngine;
using tradecore::domain::Order;
using tradecore::domain::OrderState;
using tradecore::domain::Side;

namespace {

tradecore::EngineConfig testConfig() {
  tradecore::EngineConfig config;
  config.endpoints.market_data.clear();
  config.endpoints.exchange.clear();
  config.endpoints.ipc_command.clear();
  config.endpoints.ipc_telemetry.clear();
  config.gateway.max_attempts = 2;
  config.gateway.initial_backoff = 1ms;
  config.gateway.max_backoff = 2ms;
  config.rate_limit.tokens = 1000;
  config.routing_workers = 2;
  return config;
}

Order restingOrder(const std::string& id, Side side, double qty) {
  Order order;
  order.client_order_id = id;
  order.symbol = "BTC-USD";
  order.side = side;
  order.price = 100.0;
  order.quantity = qty;
  return order;
}

nlohmann::json run(TradingEngine& engine, const std::string& cmd) {
  return nlohmann::json::parse(engine.executeCommand(cmd));
}

}  // namespace

class TradingEngineTest : public ::testing::Test {
 protected:
  tradecore::SimulationTimeProvider sim_clock{1000};
  SimulatedExchangeClient exchange{sim_clock};
};

// -----------------------------------------------------------------------------
// 1. Lifecycle: start/stop twice, stop without start.
// -----------------------------------------------------------------------------
TEST_F(TradingEngineTest, StartAndStopAreIdempotent) {
  TradingEngine engine(testConfig(), sim_clock, exchange, &sim_clock);
  EXPECT_NO_FATAL_FAILURE(engine.stop());

  engine.start();
  EXPECT_TRUE(engine.isRunning());
  EXPECT_NO_FATAL_FAILURE(engine.start());

  engine.stop();
  EXPECT_FALSE(engine.isRunning());
  EXPECT_NO_FATAL_FAILURE(engine.stop());
}

// -----------------------------------------------------------------------------
// 2. RAII: the destructor joins every thread without an explicit stop().
// -----------------------------------------------------------------------------
TEST_F(TradingEngineTest, DestructorStopsThreads) {
  {
    TradingEngine engine(testConfig(), sim_clock, exchange, &sim_clock);
    engine.start();
    tradecore::MarketEvent tick;
    tick.symbol = "BTC-USD";
    tick.bid = 99.0;
    tick.ask = 101.0;
    tick.sequence = 1;
    engine.pushMarketEvent(tick);
    std::this_thread::sleep_for(20ms);
  }
  SUCCEED();
}

// -----------------------------------------------------------------------------
// 3. Startup sync: what the exchange holds is in the ledger before start()
//    returns.
// -----------------------------------------------------------------------------
TEST_F(TradingEngineTest, StartupSyncHydratesLedgerAndPositions) {
  tradecore::domain::Position seeded;
  seeded.symbol = "BTC-USD";
  seeded.net_quantity = 0.25;
  seeded.average_price = 98.0;
  exchange.seedPosition(seeded);
  ASSERT_TRUE(std::holds_alternative<tradecore::SubmitAck>(
      exchange.submitOrder(restingOrder("old-1", Side::Buy, 1.0))));
  ASSERT_TRUE(std::holds_alternative<tradecore::SubmitAck>(
      exchange.submitOrder(restingOrder("old-2", Side::Sell, 2.0))));

  TradingEngine engine(testConfig(), sim_clock, exchange, &sim_clock);
  engine.start();

  EXPECT_EQ(engine.orderBook().size(), 2u);
  std::optional<Order> hydrated = engine.orderBook().find("old-1");
  ASSERT_TRUE(hydrated.has_value());
  EXPECT_EQ(hydrated->state, OrderState::Open);
  EXPECT_TRUE(hydrated->strategy_id.empty());
  EXPECT_TRUE(hydrated->exchange_order_id.has_value());

  auto position = engine.positions().position("BTC-USD");
  ASSERT_TRUE(position.has_value());
  EXPECT_DOUBLE_EQ(position->net_quantity, 0.25);
  EXPECT_FALSE(engine.admission()->isHalted());

  engine.stop();
}

// -----------------------------------------------------------------------------
// 4. Exchange unreachable at startup: running, but with the kill switch on.
// -----------------------------------------------------------------------------
TEST_F(TradingEngineTest, SyncFailureStartsHalted) {
  exchange.failNext(SimulatedExchangeClient::Operation::Positions,
                    tradecore::TransportFailureKind::ConnectionError,
                    /*count=*/2);

  TradingEngine engine(testConfig(), sim_clock, exchange, &sim_clock);
  engine.start();

  EXPECT_TRUE(engine.isRunning());
  ASSERT_NE(engine.admission(), nullptr);
  EXPECT_TRUE(engine.admission()->isHalted());
  EXPECT_TRUE(run(engine, "STATUS").at("halted").get<bool>());

  engine.stop();
}

// -----------------------------------------------------------------------------
// 5. A bad strategy record fails start() and leaves nothing running.
// -----------------------------------------------------------------------------
TEST_F(TradingEngineTest, UnknownStrategyTypeFailsStart) {
  tradecore::EngineConfig config = testConfig();
  tradecore::StrategyConfig bad;
  bad.id = "x";
  bad.type = "does-not-exist";
  bad.symbols = {"BTC-USD"};
  config.strategies.push_back(bad);

  TradingEngine engine(config, sim_clock, exchange, &sim_clock);
  EXPECT_THROW(engine.start(), tradecore::ConfigError);
  EXPECT_FALSE(engine.isRunning());
}

// -----------------------------------------------------------------------------
// 6. IPC command handler.
// -----------------------------------------------------------------------------
TEST_F(TradingEngineTest, PingAndUnknownCommand) {
  TradingEngine engine(testConfig(), sim_clock, exchange, &sim_clock);
  engine.start();

  nlohmann::json ping = run(engine, "PING");
  EXPECT_EQ(ping.at("status"), "ok");
  EXPECT_EQ(ping.at("response"), "PONG");

  nlohmann::json unknown = run(engine, "FLATTEN");
  EXPECT_EQ(unknown.at("status"), "error");

  engine.stop();
}

TEST_F(TradingEngineTest, StatusReportsCounters) {
  TradingEngine engine(testConfig(), sim_clock, exchange, &sim_clock);
  engine.start();

  nlohmann::json status = run(engine, "STATUS");
  EXPECT_EQ(status.at("status"), "ok");
  EXPECT_FALSE(status.at("halted").get<bool>());
  EXPECT_EQ(status.at("order_count").get<int>(), 0);
  EXPECT_TRUE(status.at("positions").is_array());
  EXPECT_TRUE(status.contains("feed"));
  EXPECT_TRUE(status.contains("reconciliation"));

  engine.stop();
}

TEST_F(TradingEngineTest, HaltEngagesKillSwitch) {
  TradingEngine engine(testConfig(), sim_clock, exchange, &sim_clock);
  engine.start();

  EXPECT_EQ(run(engine, "HALT").at("status"), "ok");
  EXPECT_TRUE(engine.admission()->isHalted());
  EXPECT_TRUE(run(engine, "STATUS").at("halted").get<bool>());

  engine.stop();
}

TEST_F(TradingEngineTest, OrdersAndResolve) {
  ASSERT_TRUE(std::holds_alternative<tradecore::SubmitAck>(
      exchange.submitOrder(restingOrder("old-1", Side::Buy, 1.0))));

  TradingEngine engine(testConfig(), sim_clock, exchange, &sim_clock);

  std::promise<void> queried;
  auto done = queried.get_future();
  engine.reconcileEventBus().subscribe<tradecore::StatusResultEvent>(
      [&queried, fired = false](const tradecore::StatusResultEvent&) mutable {
        if (!fired) {
          fired = true;
          queried.set_value();
        }
      });

  engine.start();

  nlohmann::json orders = run(engine, "ORDERS");
  ASSERT_EQ(orders.at("orders").size(), 1u);
  EXPECT_EQ(orders.at("orders")[0].at("client_order_id"), "old-1");

  EXPECT_EQ(run(engine, "RESOLVE old-1").at("status"), "ok");
  ASSERT_EQ(done.wait_for(2s), std::future_status::ready)
      << "RESOLVE did not produce a status query";

  EXPECT_EQ(run(engine, "RESOLVE nope").at("status"), "error");

  engine.stop();
}

// -----------------------------------------------------------------------------
// 7. The first level-3 message makes the engine fetch a book snapshot; the
//    strategies then see the book's top.
// -----------------------------------------------------------------------------
TEST_F(TradingEngineTest, BookMessageFetchesSnapshotFromExchange) {
  tradecore::domain::BookSnapshot book;
  book.symbol = "BTC-USD";
  book.sequence = 20;
  book.bids = {{"b1", 99.5, 1.0}};
  book.asks = {{"a1", 100.5, 2.0}};
  exchange.seedBook(book);

  TradingEngine engine(testConfig(), sim_clock, exchange, &sim_clock);

  std::promise<tradecore::domain::MarketSnapshot> top;
  auto seen = top.get_future();
  engine.marketEventBus().subscribe<tradecore::MarketSnapshotEvent>(
      [&top, fired = false](const tradecore::MarketSnapshotEvent& e) mutable {
        if (!fired) {
          fired = true;
          top.set_value(e.snapshot);
        }
      });

  engine.start();

  tradecore::BookEvent open;
  open.kind = tradecore::BookEventKind::Open;
  open.symbol = "BTC-USD";
  open.sequence = 21;
  open.order_id = "b2";
  open.side = Side::Buy;
  open.price = 99.8;
  open.size = 0.5;
  engine.pushMarketEvent(open);

  ASSERT_EQ(seen.wait_for(2s), std::future_status::ready)
      << "no snapshot was derived from the book";
  tradecore::domain::MarketSnapshot snapshot = seen.get();
  EXPECT_DOUBLE_EQ(snapshot.bid, 99.8);
  EXPECT_DOUBLE_EQ(snapshot.ask, 100.5);
  EXPECT_EQ(snapshot.sequence, 21u);
  EXPECT_EQ(exchange.callCount(SimulatedExchangeClient::Operation::Book), 1);
  EXPECT_EQ(run(engine, "STATUS").at("feed").at("book_resyncs").get<int>(),
            1);

  engine.stop();
}
