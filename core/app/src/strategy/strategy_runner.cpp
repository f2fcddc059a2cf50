#include "tradecore/strategy/strategy_runner.hpp"

#include "tradecore/domain/to_string.hpp"
#include "tradecore/risk/admission_controller.hpp"

#include <chrono>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace tradecore {

StrategyRunner::StrategyRunner(AdmissionController& admission,
                               const OrderBook& book,
                               const PositionKeeper& positions,
                               EventSink order_sink, EventSink decision_sink)
    : admission_(admission),
      book_(book),
      positions_(positions),
      order_sink_(std::move(order_sink)),
      decision_sink_(std::move(decision_sink)) {}

StrategyRunner::~StrategyRunner() {
  stop();
  for (auto& slot : slots_) {
    EventBus& bus = slot->loop->eventBus();
    bus.unsubscribe(slot->fill_sub_id);
    bus.unsubscribe(slot->snapshot_sub_id);
  }
}

// -----------------------------------------------------------------------------
// add(): builder-style registration, startup only
// -----------------------------------------------------------------------------
StrategyRunner& StrategyRunner::add(StrategyConfig config,
                                    std::unique_ptr<IStrategy> strategy) {
  if (running_.load()) {
    throw std::logic_error("StrategyRunner: cannot add strategy '" +
                           config.id + "' after start()");
  }
  if (!strategy) {
    throw std::invalid_argument("StrategyRunner: null strategy for '" +
                                config.id + "'");
  }
  if (config.id.empty()) {
    config.id = strategy->id();
  }
  if (by_id_.count(config.id) > 0) {
    throw std::logic_error("StrategyRunner: duplicate strategy id '" +
                           config.id + "'");
  }

  if (!config.max_position && config.options.is_object()) {
    auto it = config.options.find("max_position");
    if (it != config.options.end() && it->is_number()) {
      config.max_position = it->get<double>();
    }
  }
  if (config.max_position) {
    admission_.setStrategyPositionLimit(config.id, *config.max_position);
  }

  auto slot = std::make_unique<Slot>();
  slot->context = std::make_unique<StrategyContext>(config.id, config.symbols,
                                                    book_, positions_);
  slot->loop = std::make_unique<EventLoopThread>("Strategy:" + config.id);
  slot->config = std::move(config);
  slot->strategy = std::move(strategy);

  Slot* raw = slot.get();
  EventBus& bus = raw->loop->eventBus();
  raw->snapshot_sub_id = bus.subscribe<MarketSnapshotEvent>(
      [this, raw](const MarketSnapshotEvent& e) {
        handleSnapshot(*raw, e.snapshot);
      });
  raw->fill_sub_id = bus.subscribe<FillAppliedEvent>(
      [this, raw](const FillAppliedEvent& e) { handleFill(*raw, e.fill); });

  std::cout << "[StrategyRunner] registered " << raw->config.id << " ("
            << raw->config.type << ") on " << raw->config.symbols.size()
            << " symbol(s)\n";

  by_id_.emplace(raw->config.id, raw);
  slots_.push_back(std::move(slot));
  return *this;
}

void StrategyRunner::start() {
  if (running_.exchange(true)) {
    return;
  }
  for (auto& slot : slots_) {
    slot->loop->start();
  }
  std::cout << "[StrategyRunner] started " << slots_.size()
            << " strategy worker(s)\n";
}

void StrategyRunner::stop() {
  if (!running_.exchange(false)) {
    return;
  }
  for (auto& slot : slots_) {
    slot->loop->stop();
  }
  std::cout << "[StrategyRunner] stopped\n";
}

// -----------------------------------------------------------------------------
// Fan-out: any thread -> strategy worker queues
// -----------------------------------------------------------------------------
void StrategyRunner::onMarketSnapshot(const domain::MarketSnapshot& snapshot) {
  for (auto& slot : slots_) {
    if (slot->context->inScope(snapshot.symbol)) {
      slot->loop->push(MarketSnapshotEvent{snapshot});
    }
  }
}

void StrategyRunner::onFillApplied(const domain::Order& order,
                                   const domain::Fill& fill) {
  auto it = by_id_.find(order.strategy_id);
  if (it == by_id_.end()) {
    return;  // hydrated or foreign order: nobody to notify
  }
  FillAppliedEvent event;
  event.order = order;
  event.fill = fill;
  event.timestamp = std::chrono::system_clock::now();
  it->second->loop->push(std::move(event));
}

// -----------------------------------------------------------------------------
// Strategy callbacks (strategy worker thread)
// -----------------------------------------------------------------------------
void StrategyRunner::handleSnapshot(Slot& slot,
                                    const domain::MarketSnapshot& snapshot) {
  std::vector<domain::Intent> intents;
  try {
    intents = slot.strategy->on_market_update(snapshot, *slot.context);
  } catch (const std::exception& e) {
    std::cerr << "[StrategyRunner] " << slot.config.id
              << " on_market_update threw: " << e.what() << "\n";
    return;
  }
  processIntents(slot, intents);
}

void StrategyRunner::handleFill(Slot& slot, const domain::Fill& fill) {
  std::vector<domain::Intent> intents;
  try {
    intents = slot.strategy->on_fill(fill, *slot.context);
  } catch (const std::exception& e) {
    std::cerr << "[StrategyRunner] " << slot.config.id
              << " on_fill threw: " << e.what() << "\n";
    return;
  }
  processIntents(slot, intents);
}

void StrategyRunner::processIntents(
    Slot& slot, const std::vector<domain::Intent>& intents) {
  for (const domain::Intent& intent : intents) {
    domain::AdmissionDecision decision;
    const auto* place = std::get_if<domain::PlaceOrder>(&intent);
    if (place && !slot.context->inScope(place->symbol)) {
      decision = domain::AdmissionDecision::deny(
          domain::DenyReason::OutOfScope,
          place->symbol + " is not in the scope of " + slot.config.id);
      std::cerr << "[StrategyRunner] DENY " << slot.config.id << " "
                << domain::describe(intent) << ": "
                << domain::toString(decision.reason) << "\n";
    } else {
      decision = admission_.admit(slot.config.id, intent);
    }

    if (decision.allowed) {
      if (std::holds_alternative<domain::PlaceOrder>(intent)) {
        order_sink_(SubmitRequestEvent{*decision.order});
      } else {
        order_sink_(CancelRequestEvent{decision.client_order_id,
                                       slot.config.id});
      }
    }

    if (decision_sink_) {
      decision_sink_(IntentDecisionEvent{slot.config.id, intent, decision,
                                         std::chrono::system_clock::now()});
    }

    try {
      slot.strategy->on_intent_result(IntentResult{intent, decision});
    } catch (const std::exception& e) {
      std::cerr << "[StrategyRunner] " << slot.config.id
                << " on_intent_result threw: " << e.what() << "\n";
    }
  }
}

}  // namespace tradecore
