#include "tradecore/network/order_router.hpp"

#include "tradecore/gateway/exchange_gateway.hpp"

#include <functional>
#include <iostream>
#include <optional>
#include <string>
#include <utility>

namespace tradecore {

// -----------------------------------------------------------------------------
// Constructor: one loop per worker, each subscribed to every request type
// -----------------------------------------------------------------------------
OrderRouter::OrderRouter(ExchangeGateway& gateway, std::size_t workers,
                         ResultSink result_sink, ResultSink market_sink)
    : gateway_(gateway),
      result_sink_(std::move(result_sink)),
      market_sink_(std::move(market_sink)) {
  if (workers == 0) {
    workers = 1;
  }
  workers_.resize(workers);
  for (std::size_t i = 0; i < workers; ++i) {
    Worker& w = workers_[i];
    w.loop = std::make_unique<EventLoopThread>("OrderRouter-" +
                                               std::to_string(i));
    EventBus& bus = w.loop->eventBus();
    w.submit_sub_id = bus.subscribe<SubmitRequestEvent>(
        [this](const SubmitRequestEvent& e) { onSubmit(e); });
    w.cancel_sub_id = bus.subscribe<CancelRequestEvent>(
        [this](const CancelRequestEvent& e) { onCancel(e); });
    w.status_sub_id = bus.subscribe<StatusRequestEvent>(
        [this](const StatusRequestEvent& e) { onStatus(e); });
    w.book_sub_id = bus.subscribe<BookResyncRequestEvent>(
        [this](const BookResyncRequestEvent& e) { onBookResync(e); });
  }
}

OrderRouter::~OrderRouter() {
  stop();
  for (Worker& w : workers_) {
    EventBus& bus = w.loop->eventBus();
    bus.unsubscribe(w.book_sub_id);
    bus.unsubscribe(w.status_sub_id);
    bus.unsubscribe(w.cancel_sub_id);
    bus.unsubscribe(w.submit_sub_id);
  }
}

void OrderRouter::start() {
  if (running_) {
    return;
  }
  for (Worker& w : workers_) {
    w.loop->start();
  }
  running_ = true;
  std::cout << "[OrderRouter] started with " << workers_.size()
            << " worker(s)\n";
}

void OrderRouter::stop() {
  if (!running_) {
    return;
  }
  for (Worker& w : workers_) {
    w.loop->stop();
  }
  running_ = false;
  std::cout << "[OrderRouter] stopped\n";
}

std::size_t OrderRouter::shardFor(
    const domain::ClientOrderId& client_order_id) const {
  return std::hash<domain::ClientOrderId>{}(client_order_id) %
         workers_.size();
}

// -----------------------------------------------------------------------------
// route(): pick the order's worker
// -----------------------------------------------------------------------------
void OrderRouter::route(Event request) {
  const domain::ClientOrderId* id = nullptr;
  if (auto* submit = std::get_if<SubmitRequestEvent>(&request)) {
    id = &submit->order.client_order_id;
  } else if (auto* cancel = std::get_if<CancelRequestEvent>(&request)) {
    id = &cancel->client_order_id;
  } else if (auto* status = std::get_if<StatusRequestEvent>(&request)) {
    id = &status->client_order_id;
  } else if (auto* book = std::get_if<BookResyncRequestEvent>(&request)) {
    if (!market_sink_) {
      return;
    }
    id = &book->symbol;
  }
  if (id == nullptr) {
    return;
  }
  std::size_t shard = shardFor(*id);
  routed_.fetch_add(1);
  workers_[shard].loop->push(std::move(request));
}

// -----------------------------------------------------------------------------
// Worker handlers: blocking gateway call, then hand the outcome on
// -----------------------------------------------------------------------------
void OrderRouter::onSubmit(const SubmitRequestEvent& request) {
  SubmitResult result = gateway_.submit(request.order);
  result_sink_(SubmitResultEvent{std::move(result)});
}

void OrderRouter::onCancel(const CancelRequestEvent& request) {
  CancelResult result = gateway_.cancel(request.client_order_id);
  result_sink_(CancelResultEvent{std::move(result)});
}

void OrderRouter::onStatus(const StatusRequestEvent& request) {
  StatusResult result = gateway_.queryStatus(request.client_order_id);
  result_sink_(StatusResultEvent{std::move(result)});
}

void OrderRouter::onBookResync(const BookResyncRequestEvent& request) {
  std::optional<domain::BookSnapshot> book =
      gateway_.bookSnapshot(request.symbol);
  if (!book) {
    std::cerr << "[OrderRouter] book snapshot for " << request.symbol
              << " failed, exchange unreachable\n";
  }
  market_sink_(BookSnapshotEvent{request.symbol, std::move(book)});
}

}  // namespace tradecore
