// =============================================================================
// order_book_test.cpp
// =============================================================================
// Unit tests for tradecore::OrderStateMachine and tradecore::OrderBook.
//
// Validates:
//   - The transition table: legal moves, terminal states are final
//   - Registration refuses a duplicate client id
//   - Fill accounting: partial -> filled, duplicate fill ids are no-ops
//   - Read API: lookup by exchange id, per-strategy view, open order count
//     and working quantity per side
//   - Startup hydration keeps the exchange's fill ids for dedup
//   - Terminal orders are evicted after the audit window; quarantined and
//     live ones are kept
//
// OrderBook mutators are reachable only through ReconciliationEngine, so the
// ledger is driven by publishing events on a plain EventBus (synchronous,
// no threads).
// =============================================================================

#include "tradecore/eventbus/event_bus.hpp"
#include "tradecore/events/event.hpp"
#include "tradecore/ledger/order_book.hpp"
#include "tradecore/ledger/order_state_machine.hpp"
#include "tradecore/reconcile/reconciliation_engine.hpp"
#include "tradecore/risk/position_keeper.hpp"
#include "tradecore/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>

#include <optional>
#include <string>

using tradecore::ExchangeEvent;
using tradecore::ExchangeEventKind;
using tradecore::OrderStateMachine;
using tradecore::domain::Order;
using tradecore::domain::OrderState;
using tradecore::domain::Side;

// =============================================================================
// OrderStateMachine
// =============================================================================

TEST(OrderStateMachineTest, PendingCanReachEveryOutcome) {
  EXPECT_TRUE(OrderStateMachine::canTransition(OrderState::Pending,
                                               OrderState::Open));
  EXPECT_TRUE(OrderStateMachine::canTransition(OrderState::Pending,
                                               OrderState::Rejected));
  EXPECT_TRUE(OrderStateMachine::canTransition(OrderState::Pending,
                                               OrderState::Unknown));
  EXPECT_TRUE(OrderStateMachine::canTransition(OrderState::Pending,
                                               OrderState::Filled));
}

TEST(OrderStateMachineTest, OpenCannotBeRejected) {
  EXPECT_FALSE(OrderStateMachine::canTransition(OrderState::Open,
                                                OrderState::Rejected));
  EXPECT_FALSE(OrderStateMachine::canTransition(OrderState::Open,
                                                OrderState::Pending));
}

TEST(OrderStateMachineTest, UnknownResolvesToAnyExchangeState) {
  EXPECT_TRUE(OrderStateMachine::canTransition(OrderState::Unknown,
                                               OrderState::Open));
  EXPECT_TRUE(OrderStateMachine::canTransition(OrderState::Unknown,
                                               OrderState::Rejected));
  EXPECT_TRUE(OrderStateMachine::canTransition(OrderState::Unknown,
                                               OrderState::Filled));
  EXPECT_FALSE(OrderStateMachine::canTransition(OrderState::Unknown,
                                                OrderState::Pending));
}

TEST(OrderStateMachineTest, TerminalStatesAreFinal) {
  for (OrderState terminal :
       {OrderState::Filled, OrderState::Cancelled, OrderState::Rejected}) {
    EXPECT_TRUE(OrderStateMachine::isTerminal(terminal));
    EXPECT_FALSE(OrderStateMachine::isWorking(terminal));
    for (OrderState to :
         {OrderState::Pending, OrderState::Open, OrderState::PartiallyFilled,
          OrderState::Filled, OrderState::Cancelled, OrderState::Rejected,
          OrderState::Unknown}) {
      EXPECT_FALSE(OrderStateMachine::canTransition(terminal, to))
          << OrderStateMachine::toString(terminal) << " -> "
          << OrderStateMachine::toString(to);
    }
  }
  EXPECT_TRUE(OrderStateMachine::isWorking(OrderState::Unknown));
}

// =============================================================================
// OrderBook fixture: book + reconciler on a synchronous bus.
// =============================================================================
class OrderBookTest : public ::testing::Test {
 protected:
  static constexpr std::int64_t kRetentionMs = 60000;

  tradecore::SimulationTimeProvider clock{1000};
  tradecore::EventBus bus;
  tradecore::OrderBook book{clock};
  tradecore::PositionKeeper positions;
  tradecore::ReconciliationEngine reconciler{bus, book, positions, clock,
                                             kRetentionMs};

  static Order makeOrder(const std::string& id, Side side, double qty,
                         const std::string& strategy = "s1",
                         const std::string& symbol = "BTC-USD") {
    Order order;
    order.client_order_id = id;
    order.strategy_id = strategy;
    order.symbol = symbol;
    order.side = side;
    order.price = 100.0;
    order.quantity = qty;
    return order;
  }

  bool add(const Order& order) {
    return reconciler.runExclusive(
        [&order](tradecore::SubmissionRegistrar& registrar) {
          return registrar.registerSubmission(order);
        });
  }

  void ack(const std::string& id, const std::string& exchange_id,
           std::uint64_t seq) {
    ExchangeEvent e;
    e.kind = ExchangeEventKind::Ack;
    e.client_order_id = id;
    e.exchange_order_id = exchange_id;
    e.sequence = seq;
    bus.publish(e);
  }

  void fill(const std::string& id, const std::string& fill_id, double qty,
            std::uint64_t seq) {
    ExchangeEvent e;
    e.kind = ExchangeEventKind::Fill;
    e.client_order_id = id;
    e.sequence = seq;
    tradecore::domain::Fill f;
    f.order_id = id;
    f.exchange_fill_id = fill_id;
    f.quantity = qty;
    f.price = 100.0;
    e.fill = f;
    bus.publish(e);
  }

  void cancel(const std::string& id, std::uint64_t seq) {
    ExchangeEvent e;
    e.kind = ExchangeEventKind::Cancelled;
    e.client_order_id = id;
    e.sequence = seq;
    bus.publish(e);
  }
};

// -----------------------------------------------------------------------------
// 1. A registered order starts Pending; the same client id cannot be reused.
// -----------------------------------------------------------------------------
TEST_F(OrderBookTest, RegisterRefusesDuplicateClientId) {
  ASSERT_TRUE(add(makeOrder("tc-1", Side::Buy, 1.0)));
  EXPECT_FALSE(add(makeOrder("tc-1", Side::Sell, 2.0)));

  std::optional<Order> order = book.find("tc-1");
  ASSERT_TRUE(order.has_value());
  EXPECT_EQ(order->state, OrderState::Pending);
  EXPECT_EQ(order->side, Side::Buy);
  EXPECT_EQ(book.size(), 1u);
}

// -----------------------------------------------------------------------------
// 2. Partial then final fill; filled quantity never exceeds quantity.
// -----------------------------------------------------------------------------
TEST_F(OrderBookTest, FillsAdvanceToFilled) {
  add(makeOrder("tc-1", Side::Buy, 2.0));
  ack("tc-1", "EX-1", 1);

  fill("tc-1", "F-1", 0.5, 2);
  EXPECT_EQ(book.find("tc-1")->state, OrderState::PartiallyFilled);
  EXPECT_DOUBLE_EQ(book.find("tc-1")->filled_quantity, 0.5);

  fill("tc-1", "F-2", 1.5, 3);
  std::optional<Order> order = book.find("tc-1");
  EXPECT_EQ(order->state, OrderState::Filled);
  EXPECT_DOUBLE_EQ(order->filled_quantity, 2.0);
  EXPECT_TRUE(book.hasFill("F-1"));
  EXPECT_TRUE(book.hasFill("F-2"));
}

// -----------------------------------------------------------------------------
// 3. The same fill id delivered twice (unsequenced) is applied once.
// Why: the private feed and a status report can both carry the same fill.
// -----------------------------------------------------------------------------
TEST_F(OrderBookTest, DuplicateFillIdIsIgnored) {
  add(makeOrder("tc-1", Side::Buy, 2.0));
  ack("tc-1", "EX-1", 0);

  fill("tc-1", "F-1", 0.5, 0);
  fill("tc-1", "F-1", 0.5, 0);

  EXPECT_DOUBLE_EQ(book.find("tc-1")->filled_quantity, 0.5);
  EXPECT_DOUBLE_EQ(positions.netQuantity("BTC-USD"), 0.5);
}

// -----------------------------------------------------------------------------
// 4. Lookup by exchange id once the ack assigned it.
// -----------------------------------------------------------------------------
TEST_F(OrderBookTest, FindByExchangeId) {
  add(makeOrder("tc-1", Side::Buy, 1.0));
  EXPECT_FALSE(book.findByExchangeId("EX-9").has_value());

  ack("tc-1", "EX-9", 1);

  std::optional<Order> order = book.findByExchangeId("EX-9");
  ASSERT_TRUE(order.has_value());
  EXPECT_EQ(order->client_order_id, "tc-1");
  EXPECT_EQ(order->state, OrderState::Open);
}

// -----------------------------------------------------------------------------
// 5. Exposure views: open count per symbol, remaining quantity per side.
// -----------------------------------------------------------------------------
TEST_F(OrderBookTest, OpenOrderCountAndWorkingQuantity) {
  add(makeOrder("tc-1", Side::Buy, 2.0));
  add(makeOrder("tc-2", Side::Buy, 3.0, "s2"));
  add(makeOrder("tc-3", Side::Sell, 1.0));
  add(makeOrder("tc-4", Side::Buy, 7.0, "s1", "ETH-USD"));

  ack("tc-1", "EX-1", 1);
  fill("tc-1", "F-1", 0.5, 2);
  ack("tc-3", "EX-3", 1);
  cancel("tc-3", 2);

  EXPECT_EQ(book.openOrderCount("BTC-USD"), 2u);
  EXPECT_EQ(book.openOrderCount("ETH-USD"), 1u);
  EXPECT_DOUBLE_EQ(book.workingQuantity("BTC-USD", Side::Buy), 4.5);
  EXPECT_DOUBLE_EQ(book.workingQuantity("BTC-USD", Side::Sell), 0.0);
  EXPECT_EQ(book.ordersForStrategy("s1").size(), 3u);
  EXPECT_EQ(book.ordersForStrategy("s2").size(), 1u);
  EXPECT_EQ(book.snapshot().size(), 4u);
}

// -----------------------------------------------------------------------------
// 6. Hydrated orders keep their fills, so a replay of one is a duplicate.
// -----------------------------------------------------------------------------
TEST_F(OrderBookTest, HydrateRecordsReportedFills) {
  tradecore::domain::OrderStatusReport report;
  report.client_order_id = "old-1";
  report.exchange_order_id = "EX-OLD";
  report.symbol = "BTC-USD";
  report.side = Side::Sell;
  report.price = 105.0;
  report.quantity = 2.0;
  report.filled_quantity = 1.0;
  report.state = OrderState::PartiallyFilled;
  report.sequence = 4;
  tradecore::domain::Fill prior;
  prior.order_id = "old-1";
  prior.exchange_fill_id = "F-OLD";
  prior.quantity = 1.0;
  prior.price = 105.0;
  report.fills.push_back(prior);

  EXPECT_EQ(reconciler.hydrate({report}), 1u);
  EXPECT_EQ(reconciler.hydrate({report}), 0u);

  std::optional<Order> order = book.findByExchangeId("EX-OLD");
  ASSERT_TRUE(order.has_value());
  EXPECT_TRUE(order->strategy_id.empty());
  EXPECT_EQ(order->last_sequence, 4u);
  EXPECT_TRUE(book.hasFill("F-OLD"));

  fill("old-1", "F-OLD", 1.0, 0);
  EXPECT_DOUBLE_EQ(book.find("old-1")->filled_quantity, 1.0);
}

// -----------------------------------------------------------------------------
// 7. Eviction drops terminal orders past the window and their fill ids.
//    Working orders stay whatever their age.
// -----------------------------------------------------------------------------
TEST_F(OrderBookTest, EvictsTerminalOrdersAfterRetention) {
  add(makeOrder("tc-1", Side::Buy, 1.0));
  add(makeOrder("tc-2", Side::Buy, 1.0));
  ack("tc-1", "EX-1", 1);
  fill("tc-1", "F-1", 1.0, 2);
  ack("tc-2", "EX-2", 1);

  clock.advance_by(kRetentionMs - 1);
  EXPECT_EQ(reconciler.evictExpired(), 0u);

  clock.advance_by(2);
  EXPECT_EQ(reconciler.evictExpired(), 1u);

  EXPECT_FALSE(book.find("tc-1").has_value());
  EXPECT_FALSE(book.findByExchangeId("EX-1").has_value());
  EXPECT_FALSE(book.hasFill("F-1"));
  EXPECT_TRUE(book.find("tc-2").has_value());
}

// -----------------------------------------------------------------------------
// 8. A quarantined order is never evicted.
// -----------------------------------------------------------------------------
TEST_F(OrderBookTest, QuarantinedOrdersAreKept) {
  add(makeOrder("tc-1", Side::Buy, 1.0));
  ack("tc-1", "EX-1", 1);
  cancel("tc-1", 2);
  fill("tc-1", "F-LATE", 1.0, 3);  // fill after Cancelled -> quarantine

  ASSERT_TRUE(book.find("tc-1")->quarantined);

  clock.advance_by(kRetentionMs * 2);
  EXPECT_EQ(reconciler.evictExpired(), 0u);
  EXPECT_TRUE(book.find("tc-1").has_value());
}
