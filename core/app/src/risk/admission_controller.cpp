#include "tradecore/risk/admission_controller.hpp"

#include "tradecore/domain/market_snapshot.hpp"
#include "tradecore/domain/to_string.hpp"
#include "tradecore/feed/market_data_feed.hpp"
#include "tradecore/ledger/order_book.hpp"
#include "tradecore/ledger/order_state_machine.hpp"
#include "tradecore/reconcile/reconciliation_engine.hpp"
#include "tradecore/risk/position_keeper.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace tradecore {

AdmissionController::AdmissionController(
    ReconciliationEngine& reconciler, const OrderBook& book,
    const PositionKeeper& positions, const MarketDataFeed& market_data,
    domain::RiskLimits limits, ClientOrderIdGenerator& ids,
    const ITimeProvider& clock)
    : reconciler_(reconciler),
      book_(book),
      positions_(positions),
      market_data_(market_data),
      limits_(std::move(limits)),
      ids_(ids),
      clock_(clock) {}

// -----------------------------------------------------------------------------
// evaluatePlace: pure PlaceOrder checks in their fixed order
// -----------------------------------------------------------------------------
domain::AdmissionDecision AdmissionController::evaluatePlace(
    const domain::PlaceOrder& place, const ExposureView& exposure,
    const domain::SymbolLimits& limits, bool halted) {
  using domain::AdmissionDecision;
  using domain::DenyReason;

  if (halted) {
    return AdmissionDecision::deny(DenyReason::TradingHalted,
                                   "trading is halted");
  }

  if (!std::isfinite(place.quantity) ||
      place.quantity <= domain::kQuantityEpsilon) {
    return AdmissionDecision::deny(DenyReason::InvalidQuantity,
                                   "quantity must be positive");
  }
  if (place.type == domain::OrderType::Limit &&
      (!place.price || !std::isfinite(*place.price) || *place.price <= 0.0)) {
    return AdmissionDecision::deny(DenyReason::InvalidQuantity,
                                   "limit order needs a positive price");
  }

  if (exposure.open_orders >= limits.max_open_orders) {
    std::ostringstream detail;
    detail << exposure.open_orders << " open orders on " << place.symbol
           << ", limit " << limits.max_open_orders;
    return AdmissionDecision::deny(DenyReason::ExceedsOrderCount,
                                   detail.str());
  }

  double price = 0.0;
  if (place.type == domain::OrderType::Limit) {
    price = *place.price;
  } else if (exposure.reference_price) {
    price = *exposure.reference_price;
  } else {
    return AdmissionDecision::deny(DenyReason::NoReferencePrice,
                                   "no market data for " + place.symbol);
  }

  double notional = place.quantity * price;
  if (notional > limits.max_order_notional) {
    std::ostringstream detail;
    detail << "notional " << notional << " above limit "
           << limits.max_order_notional;
    return AdmissionDecision::deny(DenyReason::NotionalTooLarge,
                                   detail.str());
  }

  double sign = place.side == domain::Side::Buy ? 1.0 : -1.0;
  double projected = exposure.net_position +
                     sign * (exposure.working_same_side + place.quantity);
  if (std::abs(projected) > limits.max_net_position + domain::kQuantityEpsilon) {
    std::ostringstream detail;
    detail << "projected position " << projected << " on " << place.symbol
           << " beyond limit " << limits.max_net_position;
    return AdmissionDecision::deny(DenyReason::ExceedsPositionLimit,
                                   detail.str());
  }

  return AdmissionDecision::allow();
}

// -----------------------------------------------------------------------------
// evaluateCancel: ownership and cancellability
// -----------------------------------------------------------------------------
domain::AdmissionDecision AdmissionController::evaluateCancel(
    const domain::CancelOrder& cancel,
    const std::optional<domain::Order>& target,
    const std::string& strategy_id) {
  using domain::AdmissionDecision;
  using domain::DenyReason;

  if (!target || target->strategy_id != strategy_id) {
    return AdmissionDecision::deny(
        DenyReason::UnknownOrder,
        "no order " + cancel.client_order_id + " for strategy " + strategy_id);
  }
  if (target->quarantined) {
    return AdmissionDecision::deny(DenyReason::NotCancellable,
                                   cancel.client_order_id + " is quarantined");
  }
  if (OrderStateMachine::isTerminal(target->state) ||
      target->state == domain::OrderState::Unknown) {
    return AdmissionDecision::deny(
        DenyReason::NotCancellable,
        cancel.client_order_id + " is " + domain::toString(target->state));
  }

  AdmissionDecision decision = AdmissionDecision::allow();
  decision.client_order_id = target->client_order_id;
  decision.order = target;
  return decision;
}

// -----------------------------------------------------------------------------
// exposureFor: ledger, position and market data for one symbol and side
// -----------------------------------------------------------------------------
ExposureView AdmissionController::exposureFor(
    const domain::PlaceOrder& place) const {
  ExposureView view;
  view.net_position = positions_.netQuantity(place.symbol);
  view.open_orders = book_.openOrderCount(place.symbol);
  view.working_same_side = book_.workingQuantity(place.symbol, place.side);
  if (auto snap = market_data_.snapshot(place.symbol)) {
    view.reference_price = domain::referencePrice(*snap);
  }
  return view;
}

void AdmissionController::setStrategyPositionLimit(
    const std::string& strategy_id, double max_position) {
  if (!std::isfinite(max_position) || max_position <= 0.0) {
    throw std::invalid_argument("AdmissionController: max_position for '" +
                                strategy_id + "' must be positive");
  }
  std::lock_guard<std::mutex> lock(strategy_limits_mutex_);
  strategy_position_limits_[strategy_id] = max_position;
  std::cout << "[AdmissionController] " << strategy_id
            << " position cap " << max_position << "\n";
}

domain::SymbolLimits AdmissionController::limitsFor(
    const std::string& strategy_id, const std::string& symbol) const {
  domain::SymbolLimits limits = limits_.forSymbol(symbol);
  std::lock_guard<std::mutex> lock(strategy_limits_mutex_);
  auto it = strategy_position_limits_.find(strategy_id);
  if (it != strategy_position_limits_.end()) {
    limits.max_net_position = std::min(limits.max_net_position, it->second);
  }
  return limits;
}

domain::AdmissionDecision AdmissionController::decide(
    const std::string& strategy_id, const domain::Intent& intent) const {
  if (const auto* place = std::get_if<domain::PlaceOrder>(&intent)) {
    return evaluatePlace(*place, exposureFor(*place),
                         limitsFor(strategy_id, place->symbol), isHalted());
  }
  const auto& cancel = std::get<domain::CancelOrder>(intent);
  return evaluateCancel(cancel, book_.find(cancel.client_order_id),
                        strategy_id);
}

domain::AdmissionDecision AdmissionController::evaluate(
    const std::string& strategy_id, const domain::Intent& intent) const {
  return decide(strategy_id, intent);
}

// -----------------------------------------------------------------------------
// admit: decide and register under the reconciliation lock
// -----------------------------------------------------------------------------
domain::AdmissionDecision AdmissionController::admit(
    const std::string& strategy_id, const domain::Intent& intent) {
  domain::AdmissionDecision decision =
      reconciler_.runExclusive([&](SubmissionRegistrar& registrar) {
        domain::AdmissionDecision d = decide(strategy_id, intent);
        const auto* place = std::get_if<domain::PlaceOrder>(&intent);
        if (!d.allowed || !place) {
          return d;
        }

        std::int64_t now = clock_.now_ms();
        domain::Order order;
        order.client_order_id = ids_.next();
        order.strategy_id = strategy_id;
        order.symbol = place->symbol;
        order.side = place->side;
        order.type = place->type;
        if (place->type == domain::OrderType::Limit) {
          order.price = place->price;
        }
        order.quantity = place->quantity;
        order.state = domain::OrderState::Pending;
        order.created_at = now;
        order.last_updated_at = now;

        if (!registrar.registerSubmission(order)) {
          // Generated ids are unique, so this only happens if a hydrated
          // order already uses the same session prefix.
          return domain::AdmissionDecision::deny(
              domain::DenyReason::UnknownOrder,
              "client order id " + order.client_order_id + " already in use");
        }
        d.client_order_id = order.client_order_id;
        d.order = std::move(order);
        return d;
      });

  log(strategy_id, intent, decision);
  return decision;
}

void AdmissionController::log(const std::string& strategy_id,
                              const domain::Intent& intent,
                              const domain::AdmissionDecision& decision) {
  if (decision.allowed) {
    allowed_.fetch_add(1);
    std::cout << "[AdmissionController] ALLOW " << strategy_id << " "
              << domain::describe(intent);
    if (!decision.client_order_id.empty()) {
      std::cout << " -> " << decision.client_order_id;
    }
    std::cout << "\n";
  } else {
    denied_.fetch_add(1);
    std::cerr << "[AdmissionController] DENY " << strategy_id << " "
              << domain::describe(intent) << ": "
              << domain::toString(decision.reason) << " (" << decision.detail
              << ")\n";
  }
}

void AdmissionController::haltTrading() {
  if (!halt_trading_.exchange(true)) {
    std::cerr << "[AdmissionController] CRITICAL: kill switch engaged. "
                 "New orders are denied.\n";
  }
}

bool AdmissionController::isHalted() const { return halt_trading_.load(); }

}  // namespace tradecore
