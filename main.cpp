// -----------------------------------------------------------------------------
// tradecore_engine: single executable entry point.
//
// Usage: tradecore_engine [config.json]   (default: config/engine.json)
//
//   1) Load the EngineConfig. A bad file exits with status 1 before any
//      thread is started.
//   2) Pick the clock and exchange client for the configured mode:
//        simulation  SimulationTimeProvider + SimulatedExchangeClient. The
//                    feed advances the clock; resting orders fill when a
//                    snapshot crosses them.
//        live        LiveTimeProvider + ZmqExchangeClient.
//   3) Start the TradingEngine and wait for SIGINT / SIGTERM.
//   4) Stop the engine (joins every thread).
//
// Thread layout: see TradingEngine. The main thread only waits.
// -----------------------------------------------------------------------------

#include "tradecore/config/config_error.hpp"
#include "tradecore/config/engine_config.hpp"
#include "tradecore/engine/trading_engine.hpp"
#include "tradecore/events/event_types.hpp"
#include "tradecore/events/exchange_event.hpp"
#include "tradecore/gateway/exchange_client.hpp"
#include "tradecore/gateway/simulated_exchange_client.hpp"
#include "tradecore/gateway/zmq_exchange_client.hpp"
#include "tradecore/time/i_time_provider.hpp"
#include "tradecore/time/live_time_provider.hpp"
#include "tradecore/time/simulation_time_provider.hpp"

#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

namespace {

// Set from the signal handler; polled by main().
volatile std::sig_atomic_t g_stop_requested = 0;

void on_signal(int /*signum*/) { g_stop_requested = 1; }

}  // namespace

int main(int argc, char** argv) {
  const std::string config_path =
      argc > 1 ? argv[1] : std::string("config/engine.json");

  tradecore::EngineConfig config;
  try {
    config = tradecore::loadEngineConfig(config_path);
  } catch (const tradecore::ConfigError& e) {
    std::cerr << "[main] " << e.what() << "\n";
    return 1;
  }

  // -------------------------------------------------------------------------
  // Clock and exchange client for the selected mode.
  // -------------------------------------------------------------------------
  tradecore::SimulationTimeProvider sim_clock;
  tradecore::LiveTimeProvider live_clock;
  const bool simulation = config.mode == tradecore::EngineMode::Simulation;
  tradecore::ITimeProvider& clock =
      simulation ? static_cast<tradecore::ITimeProvider&>(sim_clock)
                 : static_cast<tradecore::ITimeProvider&>(live_clock);

  std::unique_ptr<tradecore::SimulatedExchangeClient> sim_exchange;
  std::unique_ptr<tradecore::ZmqExchangeClient> zmq_exchange;
  tradecore::IExchangeClient* client = nullptr;
  if (simulation) {
    sim_exchange = std::make_unique<tradecore::SimulatedExchangeClient>(clock);
    client = sim_exchange.get();
  } else {
    zmq_exchange = std::make_unique<tradecore::ZmqExchangeClient>(
        config.endpoints.exchange, config.request_timeout);
    client = zmq_exchange.get();
  }

  tradecore::TradingEngine engine(config, clock, *client,
                                  simulation ? &sim_clock : nullptr);

  if (sim_exchange) {
    // Private events from the simulated venue go where the live private feed
    // would deliver them.
    sim_exchange->setPrivateEventSink(
        [&engine](const tradecore::ExchangeEvent& event) {
          engine.pushExchangeEvent(event);
        });

    // Runs on the market loop, after MarketDataFeed accepted the snapshot.
    engine.marketEventBus().subscribe<tradecore::MarketSnapshotEvent>(
        [&sim_exchange](const tradecore::MarketSnapshotEvent& e) {
          sim_exchange->crossResting(e.snapshot.symbol, e.snapshot.bid,
                                     e.snapshot.ask);
        });
  }

  try {
    engine.start();
  } catch (const tradecore::ConfigError& e) {
    std::cerr << "[main] " << e.what() << "\n";
    return 1;
  }

  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);

  std::cout << "[main] Running in " << tradecore::toString(config.mode)
            << " mode. Press Ctrl-C to shut down.\n";

  while (g_stop_requested == 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  std::cout << "\n[main] Shutdown requested. Stopping engine...\n";
  engine.stop();

  return 0;
}
