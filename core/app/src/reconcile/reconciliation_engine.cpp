#include "tradecore/reconcile/reconciliation_engine.hpp"

#include "tradecore/domain/to_string.hpp"
#include "tradecore/ledger/order_state_machine.hpp"

#include <iostream>

namespace tradecore {

namespace {

constexpr std::int64_t kSweepIntervalMs = 1000;

}  // namespace

bool SubmissionRegistrar::registerSubmission(const domain::Order& order) {
  return engine_.registerLocked(order, outbox_);
}

// -----------------------------------------------------------------------------
// Constructor / destructor: subscribe to every exchange-side input
// -----------------------------------------------------------------------------
ReconciliationEngine::ReconciliationEngine(EventBus& bus, OrderBook& book,
                                           PositionKeeper& positions,
                                           const ITimeProvider& clock,
                                           std::int64_t audit_retention_ms)
    : bus_(bus),
      book_(book),
      positions_(positions),
      clock_(clock),
      audit_retention_ms_(audit_retention_ms),
      last_sweep_ms_(clock.now_ms()) {
  exchange_sub_id_ = bus_.subscribe<ExchangeEvent>(
      [this](const ExchangeEvent& e) { onExchangeEvent(e); });
  submit_sub_id_ = bus_.subscribe<SubmitResultEvent>(
      [this](const SubmitResultEvent& e) { onSubmitResult(e); });
  cancel_sub_id_ = bus_.subscribe<CancelResultEvent>(
      [this](const CancelResultEvent& e) { onCancelResult(e); });
  status_sub_id_ = bus_.subscribe<StatusResultEvent>(
      [this](const StatusResultEvent& e) { onStatusResult(e); });
}

ReconciliationEngine::~ReconciliationEngine() {
  bus_.unsubscribe(status_sub_id_);
  bus_.unsubscribe(cancel_sub_id_);
  bus_.unsubscribe(submit_sub_id_);
  bus_.unsubscribe(exchange_sub_id_);
}

Timestamp ReconciliationEngine::now() const {
  return clock_.now();
}

void ReconciliationEngine::publishAll(const std::vector<Event>& outbox) {
  for (const Event& event : outbox) {
    bus_.publish(event);
  }
}

// -----------------------------------------------------------------------------
// Bus entry points: lock, handle, unlock, publish
// -----------------------------------------------------------------------------
void ReconciliationEngine::onExchangeEvent(const ExchangeEvent& event) {
  std::vector<Event> outbox;
  {
    std::lock_guard lock(state_mutex_);
    handleExchangeEvent(event, outbox);
    maybeSweep();
  }
  publishAll(outbox);
}

void ReconciliationEngine::onSubmitResult(const SubmitResultEvent& event) {
  std::vector<Event> outbox;
  {
    std::lock_guard lock(state_mutex_);
    handleSubmitResult(event.result, outbox);
    maybeSweep();
  }
  publishAll(outbox);
}

void ReconciliationEngine::onCancelResult(const CancelResultEvent& event) {
  std::vector<Event> outbox;
  {
    std::lock_guard lock(state_mutex_);
    handleCancelResult(event.result, outbox);
    maybeSweep();
  }
  publishAll(outbox);
}

void ReconciliationEngine::onStatusResult(const StatusResultEvent& event) {
  std::vector<Event> outbox;
  {
    std::lock_guard lock(state_mutex_);
    handleStatusResult(event.result, outbox);
    maybeSweep();
  }
  publishAll(outbox);
}

// -----------------------------------------------------------------------------
// registerLocked: admission path
// -----------------------------------------------------------------------------
bool ReconciliationEngine::registerLocked(const domain::Order& order,
                                          std::vector<Event>& outbox) {
  if (!book_.insertPending(order)) {
    std::cerr << "[ReconciliationEngine] WARNING: duplicate client order id "
              << order.client_order_id << " refused\n";
    return false;
  }
  std::cout << "[ReconciliationEngine] " << order.client_order_id
            << " registered Pending (" << domain::toString(order.side) << " "
            << order.quantity << " " << order.symbol << ", strategy "
            << order.strategy_id << ")\n";

  OrderUpdateEvent update;
  update.order = *book_.find(order.client_order_id);
  update.previous_state = domain::OrderState::Pending;
  update.timestamp = now();
  outbox.emplace_back(std::move(update));
  return true;
}

std::size_t ReconciliationEngine::hydrate(
    const std::vector<domain::OrderStatusReport>& reports) {
  std::lock_guard lock(state_mutex_);
  std::size_t added = 0;
  for (const domain::OrderStatusReport& report : reports) {
    if (book_.hydrate(report, "")) {
      ++added;
    } else {
      std::cerr << "[ReconciliationEngine] WARNING: open order "
                << report.client_order_id << " already in ledger\n";
    }
  }
  std::cout << "[ReconciliationEngine] hydrated " << added
            << " open order(s) from exchange\n";
  return added;
}

bool ReconciliationEngine::requestResolution(
    const domain::ClientOrderId& client_order_id, const std::string& reason) {
  std::vector<Event> outbox;
  {
    std::lock_guard lock(state_mutex_);
    if (!book_.find(client_order_id)) {
      return false;
    }
    // An explicit request always goes out, even if one is in flight.
    status_in_flight_.erase(client_order_id);
    requestStatusLocked(client_order_id, reason, outbox);
  }
  publishAll(outbox);
  return true;
}

std::size_t ReconciliationEngine::evictExpired() {
  std::lock_guard lock(state_mutex_);
  last_sweep_ms_ = clock_.now_ms();
  std::size_t evicted =
      book_.evictTerminal(last_sweep_ms_ - audit_retention_ms_);
  if (evicted > 0) {
    std::cout << "[ReconciliationEngine] evicted " << evicted
              << " terminal order(s) past the audit window\n";
  }
  return evicted;
}

void ReconciliationEngine::maybeSweep() {
  std::int64_t now_ms = clock_.now_ms();
  if (now_ms - last_sweep_ms_ < kSweepIntervalMs) {
    return;
  }
  last_sweep_ms_ = now_ms;
  std::size_t evicted = book_.evictTerminal(now_ms - audit_retention_ms_);
  if (evicted > 0) {
    std::cout << "[ReconciliationEngine] evicted " << evicted
              << " terminal order(s) past the audit window\n";
  }
}

// -----------------------------------------------------------------------------
// handleExchangeEvent: private feed, per-order sequence rule
// -----------------------------------------------------------------------------
void ReconciliationEngine::handleExchangeEvent(const ExchangeEvent& event,
                                               std::vector<Event>& outbox) {
  std::optional<domain::Order> order;
  if (!event.client_order_id.empty()) {
    order = book_.find(event.client_order_id);
  }
  if (!order && event.exchange_order_id) {
    order = book_.findByExchangeId(*event.exchange_order_id);
  }
  if (!order) {
    std::cerr << "[ReconciliationEngine] WARNING: " << toString(event.kind)
              << " for unknown order client_id='" << event.client_order_id
              << "' exchange_id='" << event.exchange_order_id.value_or("")
              << "'. Skipping.\n";
    return;
  }

  const domain::ClientOrderId id = order->client_order_id;
  if (order->quarantined) {
    std::cerr << "[ReconciliationEngine] " << id << " is quarantined, "
              << toString(event.kind) << " ignored\n";
    return;
  }

  bool gap = false;
  if (event.sequence != 0) {
    std::uint64_t last = order->last_sequence;
    if (event.sequence <= last) {
      stale_drops_.fetch_add(1);
      std::cout << "[ReconciliationEngine] " << id << " dropped stale "
                << toString(event.kind) << " seq=" << event.sequence
                << " (last applied " << last << ")\n";
      return;
    }
    gap = event.sequence > last + 1;
    book_.setLastSequence(id, event.sequence);
  }

  if (event.exchange_order_id &&
      !assignExchangeId(id, *event.exchange_order_id, outbox)) {
    return;
  }

  switch (event.kind) {
    case ExchangeEventKind::Ack:
      if (order->state == domain::OrderState::Pending) {
        transitionLocked(id, domain::OrderState::Open, "", outbox);
      } else if (order->state == domain::OrderState::Unknown) {
        requestStatusLocked(id, "ack for Unknown order", outbox);
      }
      // Any later state already implies the ack.
      break;

    case ExchangeEventKind::Fill: {
      if (!event.fill) {
        std::cerr << "[ReconciliationEngine] WARNING: fill event without "
                     "payload for " << id << "\n";
        break;
      }
      domain::Fill fill = *event.fill;
      fill.order_id = id;
      applyFillLocked(fill, outbox);
      if (order->state == domain::OrderState::Unknown) {
        requestStatusLocked(id, "fill for Unknown order", outbox);
      }
      break;
    }

    case ExchangeEventKind::Cancelled:
      applyTerminal(id, domain::OrderState::Cancelled, event.reason, outbox);
      break;

    case ExchangeEventKind::Rejected:
      applyTerminal(id, domain::OrderState::Rejected, event.reason, outbox);
      break;

    case ExchangeEventKind::Filled: {
      std::optional<domain::Order> current = book_.find(id);
      if (!current || current->quarantined ||
          current->state == domain::OrderState::Filled) {
        break;
      }
      if (OrderStateMachine::isTerminal(current->state)) {
        quarantineLocked(id,
                         std::string("exchange reported Filled after ") +
                             domain::toString(current->state),
                         outbox);
        break;
      }
      requestStatusLocked(id, "done/filled before all fills were seen",
                          outbox);
      break;
    }
  }

  if (gap) {
    requestStatusLocked(id, "sequence gap", outbox);
  }
}

// -----------------------------------------------------------------------------
// handleSubmitResult
// -----------------------------------------------------------------------------
void ReconciliationEngine::handleSubmitResult(const SubmitResult& result,
                                              std::vector<Event>& outbox) {
  const domain::ClientOrderId& id = result.client_order_id;
  std::optional<domain::Order> order = book_.find(id);
  if (!order) {
    std::cerr << "[ReconciliationEngine] WARNING: submit result for unknown "
                 "order " << id << "\n";
    return;
  }
  if (order->quarantined) {
    return;
  }

  std::cout << "[ReconciliationEngine] " << id << " submit "
            << toString(result.outcome) << " after " << result.attempts
            << " round trip(s)\n";

  switch (result.outcome) {
    case SubmitOutcome::Accepted:
      if (!result.exchange_order_id.empty() &&
          !assignExchangeId(id, result.exchange_order_id, outbox)) {
        return;
      }
      if (result.report) {
        applyReport(id, *result.report, outbox);
      } else if (order->state == domain::OrderState::Pending) {
        transitionLocked(id, domain::OrderState::Open, "", outbox);
      } else if (order->state == domain::OrderState::Unknown) {
        requestStatusLocked(id, "accepted while Unknown", outbox);
      }
      break;

    case SubmitOutcome::Rejected:
      if (result.report) {
        applyReport(id, *result.report, outbox);
      } else {
        applyTerminal(id, domain::OrderState::Rejected, result.reason, outbox);
      }
      break;

    case SubmitOutcome::GatewayUnavailable:
      if (order->state == domain::OrderState::Pending) {
        transitionLocked(id, domain::OrderState::Unknown, result.reason,
                         outbox);
        raiseAlert(domain::ErrorKind::GatewayUnavailable, id,
                   "submit outcome unknown: " + result.reason, outbox);
      } else {
        // The private feed already told us what happened.
        std::cout << "[ReconciliationEngine] " << id
                  << " gateway gave up but order is already "
                  << domain::toString(order->state) << "\n";
      }
      break;
  }
}

// -----------------------------------------------------------------------------
// handleCancelResult
// -----------------------------------------------------------------------------
void ReconciliationEngine::handleCancelResult(const CancelResult& result,
                                              std::vector<Event>& outbox) {
  const domain::ClientOrderId& id = result.client_order_id;
  std::optional<domain::Order> order = book_.find(id);
  if (!order || order->quarantined) {
    return;
  }

  std::cout << "[ReconciliationEngine] " << id << " cancel "
            << toString(result.outcome) << "\n";

  switch (result.outcome) {
    case CancelOutcome::Cancelled:
      if (result.report) {
        applyReport(id, *result.report, outbox);
      } else {
        applyTerminal(id, domain::OrderState::Cancelled, "cancelled", outbox);
      }
      break;

    case CancelOutcome::AlreadyTerminal:
      if (result.report) {
        applyReport(id, *result.report, outbox);
      } else {
        requestStatusLocked(id, "cancel found order already terminal",
                            outbox);
      }
      break;

    case CancelOutcome::NotFound:
      if (!OrderStateMachine::isTerminal(order->state)) {
        requestStatusLocked(id, "cancel target not found on exchange",
                            outbox);
      }
      break;

    case CancelOutcome::GatewayUnavailable:
      raiseAlert(domain::ErrorKind::GatewayUnavailable, id,
                 "cancel outcome unknown: " + result.reason, outbox);
      break;
  }
}

// -----------------------------------------------------------------------------
// handleStatusResult: the authoritative answer for Unknown orders and gaps
// -----------------------------------------------------------------------------
void ReconciliationEngine::handleStatusResult(const StatusResult& result,
                                              std::vector<Event>& outbox) {
  const domain::ClientOrderId& id = result.client_order_id;
  status_in_flight_.erase(id);

  std::optional<domain::Order> order = book_.find(id);
  if (!order || order->quarantined) {
    return;
  }

  switch (result.outcome) {
    case StatusOutcome::Found:
      if (result.report) {
        applyReport(id, *result.report, outbox);
      }
      break;

    case StatusOutcome::NotFound:
      if (order->state == domain::OrderState::Unknown) {
        transitionLocked(id, domain::OrderState::Rejected,
                         "not found on exchange", outbox);
      } else {
        std::cerr << "[ReconciliationEngine] WARNING: exchange does not know "
                  << id << " (local state "
                  << domain::toString(order->state) << ")\n";
      }
      break;

    case StatusOutcome::GatewayUnavailable:
      raiseAlert(domain::ErrorKind::GatewayUnavailable, id,
                 "status query failed: " + result.reason, outbox);
      break;
  }
}

// -----------------------------------------------------------------------------
// applyFillLocked: ledger first, then position, then notifications
// -----------------------------------------------------------------------------
FillOutcome ReconciliationEngine::applyFillLocked(const domain::Fill& fill,
                                                  std::vector<Event>& outbox) {
  FillApplication applied = book_.applyFill(fill);
  const domain::ClientOrderId& id = fill.order_id;

  switch (applied.outcome) {
    case FillOutcome::Applied: {
      const domain::Order& order = applied.order;
      domain::Position position = positions_.applyFill(
          order.symbol, order.side, fill.quantity, fill.price);

      std::cout << "[ReconciliationEngine] " << id << " fill "
                << fill.exchange_fill_id << " " << fill.quantity << " @ "
                << fill.price << " -> " << domain::toString(order.state)
                << " (" << order.filled_quantity << "/" << order.quantity
                << ")\n";

      Timestamp ts = now();
      outbox.emplace_back(OrderUpdateEvent{order, applied.previous_state, ts});
      outbox.emplace_back(FillAppliedEvent{order, fill, ts});
      outbox.emplace_back(PositionUpdateEvent{position, ts});
      break;
    }

    case FillOutcome::Duplicate:
      std::cout << "[ReconciliationEngine] " << id << " duplicate fill "
                << fill.exchange_fill_id << " ignored\n";
      break;

    case FillOutcome::UnknownOrder:
      std::cerr << "[ReconciliationEngine] WARNING: fill "
                << fill.exchange_fill_id << " for unknown order " << id
                << "\n";
      break;

    case FillOutcome::Overfill:
      quarantineLocked(id,
                       "fill " + fill.exchange_fill_id + " of " +
                           std::to_string(fill.quantity) +
                           " would exceed order quantity",
                       outbox);
      break;

    case FillOutcome::NotFillable:
      quarantineLocked(id,
                       "fill " + fill.exchange_fill_id + " on " +
                           domain::toString(applied.order.state) + " order",
                       outbox);
      break;

    case FillOutcome::Quarantined:
      break;
  }
  return applied.outcome;
}

// -----------------------------------------------------------------------------
// applyTerminal: Cancelled / Rejected reports, conflict detection
// -----------------------------------------------------------------------------
void ReconciliationEngine::applyTerminal(const domain::ClientOrderId& id,
                                         domain::OrderState target,
                                         const std::string& reason,
                                         std::vector<Event>& outbox) {
  std::optional<domain::Order> order = book_.find(id);
  if (!order || order->quarantined || order->state == target) {
    return;
  }
  if (OrderStateMachine::isTerminal(order->state)) {
    quarantineLocked(id,
                     std::string("conflicting terminal states: ") +
                         domain::toString(order->state) + " then " +
                         domain::toString(target),
                     outbox);
    return;
  }
  transitionLocked(id, target, reason, outbox);
}

// -----------------------------------------------------------------------------
// applyReport: replay fills, advance sequence, then adopt the state
// -----------------------------------------------------------------------------
void ReconciliationEngine::applyReport(const domain::ClientOrderId& id,
                                       const domain::OrderStatusReport& report,
                                       std::vector<Event>& outbox) {
  if (!report.exchange_order_id.empty() &&
      !assignExchangeId(id, report.exchange_order_id, outbox)) {
    return;
  }

  for (const domain::Fill& reported : report.fills) {
    domain::Fill fill = reported;
    fill.order_id = id;
    FillOutcome outcome = applyFillLocked(fill, outbox);
    if (outcome == FillOutcome::Overfill ||
        outcome == FillOutcome::NotFillable ||
        outcome == FillOutcome::Quarantined) {
      return;
    }
  }
  book_.setLastSequence(id, report.sequence);

  std::optional<domain::Order> order = book_.find(id);
  if (!order || order->quarantined) {
    return;
  }

  using S = domain::OrderState;
  S target = report.state == S::Pending ? S::Open : report.state;
  S local = order->state;

  if (target == S::Unknown || local == target) {
    return;
  }

  if (target == S::Filled &&
      !domain::quantitiesEqual(order->filled_quantity, order->quantity)) {
    quarantineLocked(id,
                     "exchange reports Filled but fills cover " +
                         std::to_string(order->filled_quantity) + " of " +
                         std::to_string(order->quantity),
                     outbox);
    return;
  }

  if (OrderStateMachine::isTerminal(local)) {
    if (OrderStateMachine::isTerminal(target)) {
      quarantineLocked(id,
                       std::string("conflicting terminal states: ") +
                           domain::toString(local) + " then " +
                           domain::toString(target),
                       outbox);
    }
    // A non-terminal report is older than what we already applied.
    return;
  }

  // Local fills already moved past a report taken before them.
  if (target == S::Open && local == S::PartiallyFilled) {
    return;
  }

  transitionLocked(id, target, report.reason, outbox);
}

// -----------------------------------------------------------------------------
// transitionLocked: validated state change, logged and published
// -----------------------------------------------------------------------------
void ReconciliationEngine::transitionLocked(const domain::ClientOrderId& id,
                                            domain::OrderState target,
                                            const std::string& reason,
                                            std::vector<Event>& outbox) {
  TransitionResult result = book_.transition(id, target, reason);
  switch (result.outcome) {
    case TransitionOutcome::Applied:
      std::cout << "[ReconciliationEngine] " << id << " "
                << domain::toString(result.previous_state) << " -> "
                << domain::toString(target)
                << (reason.empty() ? "" : " (" + reason + ")") << "\n";
      outbox.emplace_back(
          OrderUpdateEvent{result.order, result.previous_state, now()});
      break;

    case TransitionOutcome::Illegal:
      quarantineLocked(id,
                       std::string("illegal transition ") +
                           domain::toString(result.previous_state) + " -> " +
                           domain::toString(target),
                       outbox);
      break;

    case TransitionOutcome::NoOp:
    case TransitionOutcome::UnknownOrder:
    case TransitionOutcome::Quarantined:
      break;
  }
}

bool ReconciliationEngine::assignExchangeId(
    const domain::ClientOrderId& id, const domain::ExchangeOrderId& exchange_id,
    std::vector<Event>& outbox) {
  if (book_.assignExchangeId(id, exchange_id)) {
    return true;
  }
  quarantineLocked(id, "exchange order id " + exchange_id +
                           " conflicts with the ledger",
                   outbox);
  return false;
}

void ReconciliationEngine::quarantineLocked(const domain::ClientOrderId& id,
                                            const std::string& detail,
                                            std::vector<Event>& outbox) {
  std::optional<domain::Order> before = book_.find(id);
  if (!before || before->quarantined) {
    return;
  }
  std::optional<domain::Order> after = book_.quarantine(id, detail);
  if (!after) {
    return;
  }
  quarantines_.fetch_add(1);
  status_in_flight_.erase(id);
  outbox.emplace_back(OrderUpdateEvent{*after, before->state, now()});
  raiseAlert(domain::ErrorKind::DataIntegrityError, id, detail, outbox);
}

void ReconciliationEngine::raiseAlert(domain::ErrorKind kind,
                                      const domain::ClientOrderId& id,
                                      const std::string& detail,
                                      std::vector<Event>& outbox) {
  alerts_.fetch_add(1);
  std::cerr << "[ReconciliationEngine] ALERT " << domain::toString(kind)
            << " order=" << id << ": " << detail << "\n";
  outbox.emplace_back(AlertEvent{kind, id, detail, now()});
}

void ReconciliationEngine::requestStatusLocked(const domain::ClientOrderId& id,
                                               const std::string& reason,
                                               std::vector<Event>& outbox) {
  if (!status_in_flight_.insert(id).second) {
    return;
  }
  std::cout << "[ReconciliationEngine] " << id << " status query requested ("
            << reason << ")\n";
  outbox.emplace_back(StatusRequestEvent{id, reason});
}

}  // namespace tradecore
