#include "tradecore/gateway/simulated_exchange_client.hpp"

#include "tradecore/ledger/order_state_machine.hpp"

#include <algorithm>
#include <limits>
#include <utility>

namespace tradecore {

namespace {

TransportFailure makeFailure(TransportFailureKind kind) {
  return TransportFailure{kind, "simulated " + std::string(toString(kind))};
}

}  // namespace

SimulatedExchangeClient::SimulatedExchangeClient(const ITimeProvider& clock)
    : clock_(clock) {}

std::optional<SimulatedExchangeClient::Fault>
SimulatedExchangeClient::takeFault(Operation operation) {
  ++calls_[operation];
  auto it = faults_.find(operation);
  if (it == faults_.end() || it->second.empty()) {
    return std::nullopt;
  }
  Fault fault = it->second.front();
  it->second.pop_front();
  return fault;
}

ExchangeEvent SimulatedExchangeClient::makeEvent(
    ExchangeEventKind kind, domain::OrderStatusReport& report) {
  ExchangeEvent event;
  event.kind = kind;
  event.client_order_id = report.client_order_id;
  event.exchange_order_id = report.exchange_order_id;
  event.sequence = ++report.sequence;
  event.timestamp = clock_.now();
  return event;
}

void SimulatedExchangeClient::deliver(const std::vector<ExchangeEvent>& events) {
  EventSink sink;
  {
    std::lock_guard lock(mutex_);
    sink = sink_;
  }
  if (!sink) {
    return;
  }
  for (const ExchangeEvent& event : events) {
    sink(event);
  }
}

// -----------------------------------------------------------------------------
// processSubmit: idempotent on client id
// -----------------------------------------------------------------------------
SubmitAck SimulatedExchangeClient::processSubmit(
    const domain::Order& order, std::vector<ExchangeEvent>& events) {
  SubmitAck ack;
  auto existing = orders_.find(order.client_order_id);
  if (existing != orders_.end()) {
    const domain::OrderStatusReport& report = existing->second;
    ack.accepted = report.state != domain::OrderState::Rejected;
    ack.exchange_order_id = report.exchange_order_id;
    ack.reject_reason = report.reason;
    return ack;
  }

  domain::OrderStatusReport report;
  report.client_order_id = order.client_order_id;
  report.exchange_order_id = "SIM-" + std::to_string(next_order_number_++);
  report.symbol = order.symbol;
  report.side = order.side;
  report.type = order.type;
  report.price = order.price;
  report.quantity = order.quantity;

  auto reject = reject_reasons_.find(order.symbol);
  if (reject != reject_reasons_.end()) {
    report.state = domain::OrderState::Rejected;
    report.reason = reject->second;
    ExchangeEvent event = makeEvent(ExchangeEventKind::Rejected, report);
    event.reason = report.reason;
    events.push_back(event);
    ack.accepted = false;
    ack.reject_reason = report.reason;
  } else {
    report.state = domain::OrderState::Open;
    events.push_back(makeEvent(ExchangeEventKind::Ack, report));
    ack.accepted = true;
  }
  ack.exchange_order_id = report.exchange_order_id;
  orders_.emplace(order.client_order_id, std::move(report));
  return ack;
}

CancelAck SimulatedExchangeClient::processCancel(
    const domain::ClientOrderId& client_order_id, const std::string& reason,
    std::vector<ExchangeEvent>& events) {
  CancelAck ack;
  auto it = orders_.find(client_order_id);
  if (it == orders_.end()) {
    ack.outcome = CancelAckOutcome::NotFound;
    return ack;
  }

  domain::OrderStatusReport& report = it->second;
  if (OrderStateMachine::isTerminal(report.state)) {
    ack.outcome = CancelAckOutcome::AlreadyTerminal;
    ack.report = report;
    return ack;
  }

  report.state = domain::OrderState::Cancelled;
  report.reason = reason;
  ExchangeEvent event = makeEvent(ExchangeEventKind::Cancelled, report);
  event.reason = reason;
  events.push_back(event);

  ack.outcome = CancelAckOutcome::Cancelled;
  ack.report = report;
  return ack;
}

// -----------------------------------------------------------------------------
// IExchangeClient
// -----------------------------------------------------------------------------
ClientReply<SubmitAck> SimulatedExchangeClient::submitOrder(
    const domain::Order& order) {
  std::vector<ExchangeEvent> events;
  ClientReply<SubmitAck> reply = SubmitAck{};
  {
    std::lock_guard lock(mutex_);
    std::optional<Fault> fault = takeFault(Operation::Submit);
    if (fault && !fault->applied) {
      return makeFailure(fault->kind);
    }
    SubmitAck ack = processSubmit(order, events);
    if (fault) {
      reply = makeFailure(fault->kind);
    } else {
      reply = ack;
    }
  }
  deliver(events);
  return reply;
}

ClientReply<CancelAck> SimulatedExchangeClient::cancelOrder(
    const domain::ClientOrderId& client_order_id) {
  std::vector<ExchangeEvent> events;
  ClientReply<CancelAck> reply = CancelAck{};
  {
    std::lock_guard lock(mutex_);
    std::optional<Fault> fault = takeFault(Operation::Cancel);
    if (fault && !fault->applied) {
      return makeFailure(fault->kind);
    }
    CancelAck ack = processCancel(client_order_id, "canceled by user", events);
    if (fault) {
      reply = makeFailure(fault->kind);
    } else {
      reply = ack;
    }
  }
  deliver(events);
  return reply;
}

ClientReply<std::optional<domain::OrderStatusReport>>
SimulatedExchangeClient::queryOrder(
    const domain::ClientOrderId& client_order_id) {
  std::lock_guard lock(mutex_);
  if (std::optional<Fault> fault = takeFault(Operation::Query)) {
    return makeFailure(fault->kind);
  }
  auto it = orders_.find(client_order_id);
  if (it == orders_.end()) {
    return std::optional<domain::OrderStatusReport>{};
  }
  return std::optional<domain::OrderStatusReport>{it->second};
}

ClientReply<std::vector<domain::OrderStatusReport>>
SimulatedExchangeClient::openOrders() {
  std::lock_guard lock(mutex_);
  if (std::optional<Fault> fault = takeFault(Operation::OpenOrders)) {
    return makeFailure(fault->kind);
  }
  std::vector<domain::OrderStatusReport> result;
  for (const auto& [id, report] : orders_) {
    if (!OrderStateMachine::isTerminal(report.state)) {
      result.push_back(report);
    }
  }
  return result;
}

ClientReply<std::vector<domain::Position>>
SimulatedExchangeClient::positions() {
  std::lock_guard lock(mutex_);
  if (std::optional<Fault> fault = takeFault(Operation::Positions)) {
    return makeFailure(fault->kind);
  }
  std::vector<domain::Position> result;
  for (const auto& [symbol, position] : positions_) {
    result.push_back(position);
  }
  return result;
}

ClientReply<domain::BookSnapshot> SimulatedExchangeClient::bookSnapshot(
    const std::string& symbol) {
  std::lock_guard lock(mutex_);
  if (std::optional<Fault> fault = takeFault(Operation::Book)) {
    return makeFailure(fault->kind);
  }
  auto it = books_.find(symbol);
  if (it == books_.end()) {
    domain::BookSnapshot empty;
    empty.symbol = symbol;
    return empty;
  }
  return it->second;
}

// -----------------------------------------------------------------------------
// Scripting controls
// -----------------------------------------------------------------------------
void SimulatedExchangeClient::failNext(Operation operation,
                                       TransportFailureKind kind, int count,
                                       bool applied) {
  std::lock_guard lock(mutex_);
  for (int i = 0; i < count; ++i) {
    faults_[operation].push_back(Fault{kind, applied});
  }
}

void SimulatedExchangeClient::setPrivateEventSink(EventSink sink) {
  std::lock_guard lock(mutex_);
  sink_ = std::move(sink);
}

void SimulatedExchangeClient::setRejectReason(const std::string& symbol,
                                              std::string reason) {
  std::lock_guard lock(mutex_);
  reject_reasons_[symbol] = std::move(reason);
}

std::optional<domain::Fill> SimulatedExchangeClient::fill(
    const domain::ClientOrderId& client_order_id, double quantity,
    double price) {
  std::vector<ExchangeEvent> events;
  domain::Fill execution;
  {
    std::lock_guard lock(mutex_);
    auto it = orders_.find(client_order_id);
    if (it == orders_.end() ||
        OrderStateMachine::isTerminal(it->second.state)) {
      return std::nullopt;
    }
    domain::OrderStatusReport& report = it->second;
    double remaining = report.quantity - report.filled_quantity;
    double executed = std::min(quantity, remaining);
    if (executed <= domain::kQuantityEpsilon) {
      return std::nullopt;
    }

    execution.order_id = client_order_id;
    execution.exchange_fill_id =
        "SIM-F-" + std::to_string(next_fill_number_++);
    execution.quantity = executed;
    execution.price = price;
    execution.timestamp = clock_.now_ms();

    report.filled_quantity += executed;
    report.fills.push_back(execution);
    bool complete =
        domain::quantitiesEqual(report.filled_quantity, report.quantity);
    report.state = complete ? domain::OrderState::Filled
                            : domain::OrderState::PartiallyFilled;

    ExchangeEvent fill_event = makeEvent(ExchangeEventKind::Fill, report);
    fill_event.fill = execution;
    events.push_back(fill_event);
    if (complete) {
      events.push_back(makeEvent(ExchangeEventKind::Filled, report));
    }
  }
  deliver(events);
  return execution;
}

int SimulatedExchangeClient::crossResting(const std::string& symbol,
                                          double bid, double ask) {
  std::vector<std::pair<domain::ClientOrderId, double>> crossing;
  {
    std::lock_guard lock(mutex_);
    for (const auto& [id, report] : orders_) {
      if (report.symbol != symbol ||
          OrderStateMachine::isTerminal(report.state)) {
        continue;
      }
      if (report.side == domain::Side::Buy && ask > 0.0 &&
          (!report.price || *report.price >= ask)) {
        crossing.emplace_back(id, ask);
      } else if (report.side == domain::Side::Sell && bid > 0.0 &&
                 (!report.price || *report.price <= bid)) {
        crossing.emplace_back(id, bid);
      }
    }
  }
  int fills = 0;
  for (const auto& [id, price] : crossing) {
    if (fill(id, std::numeric_limits<double>::max(), price)) {
      ++fills;
    }
  }
  return fills;
}

bool SimulatedExchangeClient::cancelByExchange(
    const domain::ClientOrderId& client_order_id, const std::string& reason) {
  std::vector<ExchangeEvent> events;
  bool cancelled = false;
  {
    std::lock_guard lock(mutex_);
    CancelAck ack = processCancel(client_order_id, reason, events);
    cancelled = ack.outcome == CancelAckOutcome::Cancelled;
  }
  deliver(events);
  return cancelled;
}

void SimulatedExchangeClient::seedPosition(const domain::Position& position) {
  std::lock_guard lock(mutex_);
  positions_[position.symbol] = position;
}

void SimulatedExchangeClient::seedBook(const domain::BookSnapshot& book) {
  std::lock_guard lock(mutex_);
  books_[book.symbol] = book;
}

std::optional<domain::OrderStatusReport> SimulatedExchangeClient::order(
    const domain::ClientOrderId& client_order_id) const {
  std::lock_guard lock(mutex_);
  auto it = orders_.find(client_order_id);
  if (it == orders_.end()) {
    return std::nullopt;
  }
  return it->second;
}

int SimulatedExchangeClient::callCount(Operation operation) const {
  std::lock_guard lock(mutex_);
  auto it = calls_.find(operation);
  return it != calls_.end() ? it->second : 0;
}

}  // namespace tradecore
