#include "tradecore/engine/trading_engine.hpp"

#include "tradecore/gateway/wire_codec.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <stdexcept>
#include <utility>

namespace tradecore {

// -----------------------------------------------------------------------------
// Constructor: stateless plumbing only; threads start in start()
// -----------------------------------------------------------------------------
TradingEngine::TradingEngine(EngineConfig config, ITimeProvider& clock,
                             IExchangeClient& client,
                             SimulationTimeProvider* sim_clock)
    : config_(std::move(config)),
      clock_(clock),
      sim_clock_(sim_clock),
      ids_(config_.session_prefix),
      rate_limiter_(config_.rate_limit.tokens, config_.rate_limit.interval) {
  gateway_ = std::make_unique<ExchangeGateway>(client, rate_limiter_,
                                               config_.gateway);
  book_ = std::make_unique<OrderBook>(clock_);
  positions_ = std::make_unique<PositionKeeper>();
}

TradingEngine::~TradingEngine() { stop(); }

TradingEngine& TradingEngine::addStrategy(StrategyConfig config,
                                          std::unique_ptr<IStrategy> strategy) {
  if (running_) {
    throw std::logic_error("TradingEngine: addStrategy() after start()");
  }
  extra_strategies_.emplace_back(std::move(config), std::move(strategy));
  return *this;
}

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void TradingEngine::start() {
  if (running_) {
    return;
  }

  // ---  0) Build configured strategies; a ConfigError leaves nothing running
  std::vector<std::pair<StrategyConfig, std::unique_ptr<IStrategy>>> built;
  for (const StrategyConfig& sc : config_.strategies) {
    built.emplace_back(sc, factory_.create(sc));
  }
  std::vector<std::string> feed_symbols;
  for (const StrategyConfig& sc : config_.strategies) {
    feed_symbols.insert(feed_symbols.end(), sc.symbols.begin(),
                        sc.symbols.end());
  }
  for (const auto& extra : extra_strategies_) {
    feed_symbols.insert(feed_symbols.end(), extra.first.symbols.begin(),
                        extra.first.symbols.end());
  }

  // ---  1) Stateful components, before any loop runs -----------------------
  market_data_ = std::make_unique<MarketDataFeed>(market_loop_.eventBus());
  reconciler_ = std::make_unique<ReconciliationEngine>(
      reconcile_loop_.eventBus(), *book_, *positions_, clock_,
      config_.audit_retention_ms);
  admission_ = std::make_unique<AdmissionController>(
      *reconciler_, *book_, *positions_, *market_data_, config_.risk, ids_,
      clock_);

  // ---  2) Synchronization gate --------------------------------------------
  syncWithExchange();

  // ---  3) Core loops -------------------------------------------------------
  market_loop_.start();
  reconcile_loop_.start();

  // ---  4) Order router: results land on the reconcile loop, book
  //          snapshots on the market loop -----------------------------------
  router_ = std::make_unique<OrderRouter>(
      *gateway_, config_.routing_workers,
      [this](Event event) { reconcile_loop_.push(std::move(event)); },
      [this](Event event) { market_loop_.push(std::move(event)); });
  router_->start();

  // ---  5) Strategies and bridges ------------------------------------------
  runner_ = std::make_unique<StrategyRunner>(
      *admission_, *book_, *positions_,
      [this](Event event) { router_->route(std::move(event)); },
      [this](Event event) {
        if (ipc_server_) {
          ipc_server_->pushTelemetry(std::move(event));
        }
      });
  for (auto& [sc, strategy] : built) {
    runner_->add(sc, std::move(strategy));
  }
  for (auto& [sc, strategy] : extra_strategies_) {
    runner_->add(sc, std::move(strategy));
  }
  extra_strategies_.clear();

  // ---  6) IPC, then strategy workers ---------------------------------------
  if (!config_.endpoints.ipc_command.empty() &&
      !config_.endpoints.ipc_telemetry.empty()) {
    ipc_server_ = std::make_unique<IpcServer>(
        [this](const std::string& cmd) { return executeCommand(cmd); },
        config_.endpoints.ipc_command, config_.endpoints.ipc_telemetry);
    ipc_server_->start();
  }
  wireBridges();
  runner_->start();

  // ---  7) Market data LAST ------------------------------------------------
  if (!config_.endpoints.market_data.empty()) {
    market_data_thread_ = std::make_unique<MarketDataThread>(
        config_.endpoints.market_data, std::move(feed_symbols),
        [this](Event event) { pushMarketEvent(std::move(event)); },
        [this](Event event) { pushExchangeEvent(std::move(event)); },
        sim_clock_);
    market_data_thread_->start();
  }

  running_ = true;

  std::cout << "[TradingEngine] started (" << toString(config_.mode)
            << "). Strategies: " << runner_->strategyCount()
            << ", routing workers: " << router_->workerCount()
            << (market_data_thread_ ? ", market data on" : "")
            << (ipc_server_ ? ", IPC on" : "") << ".\n";
}

// -----------------------------------------------------------------------------
// syncWithExchange(): load what the exchange already holds
// -----------------------------------------------------------------------------
void TradingEngine::syncWithExchange() {
  auto positions = gateway_->positions();
  auto orders = gateway_->openOrders();
  if (!positions || !orders) {
    std::cerr << "[TradingEngine] ERROR: startup sync with the exchange "
                 "failed. Starting halted.\n";
    admission_->haltTrading();
    return;
  }

  for (const domain::Position& position : *positions) {
    positions_->hydrate(position);
  }
  std::size_t added = reconciler_->hydrate(*orders);

  std::cout << "[TradingEngine] sync complete: " << positions->size()
            << " position(s), " << added << " open order(s) hydrated.\n";
}

// -----------------------------------------------------------------------------
// wireBridges(): cross-thread subscriptions
// -----------------------------------------------------------------------------
void TradingEngine::wireBridges() {
  EventBus& market = market_loop_.eventBus();
  EventBus& reconcile = reconcile_loop_.eventBus();

  market_bridges_.push_back(market.subscribe<MarketSnapshotEvent>(
      [this](const MarketSnapshotEvent& e) {
        runner_->onMarketSnapshot(e.snapshot);
      }));
  market_bridges_.push_back(market.subscribe<BookResyncRequestEvent>(
      [this](const BookResyncRequestEvent& e) { router_->route(e); }));

  reconcile_bridges_.push_back(reconcile.subscribe<FillAppliedEvent>(
      [this](const FillAppliedEvent& e) {
        runner_->onFillApplied(e.order, e.fill);
      }));
  reconcile_bridges_.push_back(reconcile.subscribe<StatusRequestEvent>(
      [this](const StatusRequestEvent& e) { router_->route(e); }));

  if (ipc_server_) {
    reconcile_bridges_.push_back(reconcile.subscribe<OrderUpdateEvent>(
        [this](const OrderUpdateEvent& e) { ipc_server_->pushTelemetry(e); }));
    reconcile_bridges_.push_back(reconcile.subscribe<PositionUpdateEvent>(
        [this](const PositionUpdateEvent& e) {
          ipc_server_->pushTelemetry(e);
        }));
    reconcile_bridges_.push_back(reconcile.subscribe<AlertEvent>(
        [this](const AlertEvent& e) { ipc_server_->pushTelemetry(e); }));
  }
}

void TradingEngine::unwireBridges() {
  for (EventBus::SubscriptionId id : market_bridges_) {
    market_loop_.eventBus().unsubscribe(id);
  }
  for (EventBus::SubscriptionId id : reconcile_bridges_) {
    reconcile_loop_.eventBus().unsubscribe(id);
  }
  market_bridges_.clear();
  reconcile_bridges_.clear();
}

// -----------------------------------------------------------------------------
// stop(): reverse of start()
// -----------------------------------------------------------------------------
void TradingEngine::stop() {
  if (!running_) {
    return;
  }

  // ---  1) Stop inflow first ------------------------------------------------
  market_data_thread_.reset();

  // ---  2) Strategies stop emitting intents ---------------------------------
  runner_->stop();

  // ---  3) Bridges off, then IPC (its handler reads the components) --------
  unwireBridges();
  ipc_server_.reset();

  // ---  4) Router workers finish their current request and join ------------
  router_.reset();

  // ---  5) Core loops -------------------------------------------------------
  market_loop_.stop();
  reconcile_loop_.stop();

  // ---  6) Components (unsubscribe from their buses) -----------------------
  runner_.reset();
  admission_.reset();
  reconciler_.reset();
  market_data_.reset();

  running_ = false;

  std::cout << "[TradingEngine] stopped. All threads joined.\n";
}

void TradingEngine::pushMarketEvent(Event event) {
  market_loop_.push(std::move(event));
}

void TradingEngine::pushExchangeEvent(Event event) {
  reconcile_loop_.push(std::move(event));
}

// -----------------------------------------------------------------------------
// executeCommand(): IPC command handler
// -----------------------------------------------------------------------------
std::string TradingEngine::executeCommand(const std::string& cmd) {
  nlohmann::json response;

  if (cmd == "PING") {
    response["status"] = "ok";
    response["response"] = "PONG";
  } else if (cmd == "STATUS") {
    response["status"] = "ok";
    response["halted"] = admission_ ? admission_->isHalted() : false;
    response["order_count"] = book_->size();

    nlohmann::json positions_json = nlohmann::json::array();
    for (const domain::Position& pos : positions_->snapshots()) {
      positions_json.push_back(wire::positionToJson(pos));
    }
    response["positions"] = std::move(positions_json);

    if (market_data_) {
      response["feed"] = {{"stale_drops", market_data_->staleDropCount()},
                          {"gaps", market_data_->gapCount()},
                          {"book_resyncs",
                           market_data_->resyncRequestCount()},
                          {"last_heartbeat_ms",
                           market_data_->lastHeartbeatMs()}};
    }
    if (reconciler_) {
      response["reconciliation"] = {
          {"stale_drops", reconciler_->staleDropCount()},
          {"quarantines", reconciler_->quarantineCount()},
          {"alerts", reconciler_->alertCount()}};
    }
    response["gateway_retries"] = gateway_->retryCount();
  } else if (cmd == "HALT") {
    if (admission_) {
      admission_->haltTrading();
    }
    response["status"] = "ok";
    response["response"] = "Trading halted";
  } else if (cmd == "ORDERS") {
    nlohmann::json orders = nlohmann::json::array();
    for (const domain::Order& order : book_->snapshot()) {
      orders.push_back(wire::orderToJson(order));
    }
    response["status"] = "ok";
    response["orders"] = std::move(orders);
  } else if (cmd.rfind("RESOLVE ", 0) == 0) {
    const std::string id = cmd.substr(8);
    if (reconciler_ && reconciler_->requestResolution(id)) {
      response["status"] = "ok";
      response["response"] = "status query requested for " + id;
    } else {
      response["status"] = "error";
      response["response"] = "Unknown order: " + id;
    }
  } else {
    response["status"] = "error";
    response["response"] = "Unknown command: " + cmd;
  }

  return response.dump();
}

}  // namespace tradecore
