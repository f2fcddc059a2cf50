#pragma once

#include "tradecore/concurrent/client_order_id_generator.hpp"
#include "tradecore/concurrent/event_loop_thread.hpp"
#include "tradecore/config/engine_config.hpp"
#include "tradecore/feed/market_data_feed.hpp"
#include "tradecore/gateway/exchange_client.hpp"
#include "tradecore/gateway/exchange_gateway.hpp"
#include "tradecore/gateway/rate_limiter.hpp"
#include "tradecore/ledger/order_book.hpp"
#include "tradecore/network/ipc_server.hpp"
#include "tradecore/network/market_data_thread.hpp"
#include "tradecore/network/order_router.hpp"
#include "tradecore/reconcile/reconciliation_engine.hpp"
#include "tradecore/risk/admission_controller.hpp"
#include "tradecore/risk/position_keeper.hpp"
#include "tradecore/strategy/strategy.hpp"
#include "tradecore/strategy/strategy_factory.hpp"
#include "tradecore/strategy/strategy_runner.hpp"
#include "tradecore/time/i_time_provider.hpp"
#include "tradecore/time/simulation_time_provider.hpp"

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace tradecore {

// -----------------------------------------------------------------------------
// TradingEngine: owns and wires every component
// -----------------------------------------------------------------------------
//
// @brief  Builds the order management core from an EngineConfig, runs the
//         startup sync gate, and starts and stops all threads in a fixed
//         order.
//
// @details
// Threads:
//   market loop     MarketDataFeed (snapshots, level-3 books, sequence check)
//   reconcile loop  ReconciliationEngine (single writer of the ledger)
//   router workers  blocking ExchangeGateway calls (OrderRouter)
//   strategy loops  one per strategy (StrategyRunner)
//   feed thread     FeedGateway recv loop (MarketDataThread)
//   IPC thread      commands and telemetry (IpcServer)
//
// Bridges (subscriber on one bus pushes into another thread):
//   market bus     MarketSnapshotEvent -> StrategyRunner
//   market bus     BookResyncRequestEvent -> OrderRouter
//   reconcile bus  FillAppliedEvent    -> StrategyRunner (owning strategy)
//   reconcile bus  StatusRequestEvent  -> OrderRouter
//   reconcile bus  OrderUpdate / PositionUpdate / Alert -> IPC telemetry
//   router         *ResultEvent        -> reconcile loop
//   router         BookSnapshotEvent   -> market loop
//   runner         Submit/CancelRequestEvent -> OrderRouter
//
// start():
//   1. Create the feed, reconciler and admission controller.
//   2. Sync gate: positions and open orders from the exchange are loaded
//      before any strategy can act. If the exchange cannot be reached the
//      engine still starts, but with the kill switch engaged.
//   3. Start the market and reconcile loops.
//   4. Start the order router.
//   5. Build the strategy runner (configured strategies, then those given
//      to addStrategy()) and wire the bridges.
//   6. Start IPC, then the strategy workers.
//   7. Start market data LAST so no tick arrives before a consumer exists.
// stop() runs the same steps in reverse.
//
// Endpoints left empty in the config are not opened, which is how unit tests
// run the engine: they inject events through pushMarketEvent() and
// pushExchangeEvent().
//
// Ownership:
//   Owns every component. References the clock and the exchange client,
//   which must outlive the engine.
// -----------------------------------------------------------------------------
class TradingEngine {
 public:
  TradingEngine(EngineConfig config, ITimeProvider& clock,
                IExchangeClient& client,
                SimulationTimeProvider* sim_clock = nullptr);

  ~TradingEngine();

  TradingEngine(const TradingEngine&) = delete;
  TradingEngine& operator=(const TradingEngine&) = delete;
  TradingEngine(TradingEngine&&) = delete;
  TradingEngine& operator=(TradingEngine&&) = delete;

  // Registers a strategy built outside the factory. Startup only.
  TradingEngine& addStrategy(StrategyConfig config,
                             std::unique_ptr<IStrategy> strategy);

  // Throws ConfigError if a configured strategy cannot be built.
  void start();
  void stop();

  // MarketEvent / HeartbeatEvent into the market loop.
  void pushMarketEvent(Event event);

  // ExchangeEvent (private feed) into the reconcile loop.
  void pushExchangeEvent(Event event);

  // IPC command handler: PING, STATUS, HALT, ORDERS, RESOLVE <id>.
  std::string executeCommand(const std::string& cmd);

  EventBus& marketEventBus() { return market_loop_.eventBus(); }
  EventBus& reconcileEventBus() { return reconcile_loop_.eventBus(); }

  const OrderBook& orderBook() const { return *book_; }
  const PositionKeeper& positions() const { return *positions_; }
  ExchangeGateway& gateway() { return *gateway_; }
  AdmissionController* admission() { return admission_.get(); }
  ReconciliationEngine* reconciler() { return reconciler_.get(); }
  MarketDataFeed* marketData() { return market_data_.get(); }

  bool isRunning() const { return running_; }

  const EngineConfig& config() const { return config_; }

 private:
  void syncWithExchange();
  void wireBridges();
  void unwireBridges();

  const EngineConfig config_;
  ITimeProvider& clock_;
  SimulationTimeProvider* sim_clock_;

  ClientOrderIdGenerator ids_;
  RateLimiter rate_limiter_;
  std::unique_ptr<ExchangeGateway> gateway_;
  std::unique_ptr<OrderBook> book_;
  std::unique_ptr<PositionKeeper> positions_;
  StrategyFactory factory_;

  EventLoopThread market_loop_{"MarketLoop"};
  EventLoopThread reconcile_loop_{"ReconcileLoop"};

  std::unique_ptr<MarketDataFeed> market_data_;
  std::unique_ptr<ReconciliationEngine> reconciler_;
  std::unique_ptr<AdmissionController> admission_;
  std::unique_ptr<OrderRouter> router_;
  std::unique_ptr<StrategyRunner> runner_;
  std::unique_ptr<IpcServer> ipc_server_;
  std::unique_ptr<MarketDataThread> market_data_thread_;

  std::vector<std::pair<StrategyConfig, std::unique_ptr<IStrategy>>>
      extra_strategies_;

  std::vector<EventBus::SubscriptionId> market_bridges_;
  std::vector<EventBus::SubscriptionId> reconcile_bridges_;

  bool running_{false};
};

}  // namespace tradecore
