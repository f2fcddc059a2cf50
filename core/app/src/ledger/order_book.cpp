#include "tradecore/ledger/order_book.hpp"

#include "tradecore/ledger/order_state_machine.hpp"

#include <algorithm>
#include <mutex>

namespace tradecore {

const char* toString(FillOutcome outcome) {
  switch (outcome) {
    case FillOutcome::Applied:      return "Applied";
    case FillOutcome::Duplicate:    return "Duplicate";
    case FillOutcome::UnknownOrder: return "UnknownOrder";
    case FillOutcome::Overfill:     return "Overfill";
    case FillOutcome::NotFillable:  return "NotFillable";
    case FillOutcome::Quarantined:  return "Quarantined";
  }
  return "Invalid";
}

const char* toString(TransitionOutcome outcome) {
  switch (outcome) {
    case TransitionOutcome::Applied:      return "Applied";
    case TransitionOutcome::NoOp:         return "NoOp";
    case TransitionOutcome::Illegal:      return "Illegal";
    case TransitionOutcome::UnknownOrder: return "UnknownOrder";
    case TransitionOutcome::Quarantined:  return "Quarantined";
  }
  return "Invalid";
}

OrderBook::OrderBook(const ITimeProvider& clock) : clock_(clock) {}

// -----------------------------------------------------------------------------
// Read API (shared lock)
// -----------------------------------------------------------------------------
std::optional<domain::Order> OrderBook::find(
    const domain::ClientOrderId& id) const {
  std::shared_lock lock(mutex_);
  auto it = orders_.find(id);
  if (it == orders_.end()) {
    return std::nullopt;
  }
  return it->second.order;
}

std::optional<domain::Order> OrderBook::findByExchangeId(
    const domain::ExchangeOrderId& exchange_id) const {
  std::shared_lock lock(mutex_);
  auto idx = by_exchange_id_.find(exchange_id);
  if (idx == by_exchange_id_.end()) {
    return std::nullopt;
  }
  auto it = orders_.find(idx->second);
  if (it == orders_.end()) {
    return std::nullopt;
  }
  return it->second.order;
}

std::vector<domain::Order> OrderBook::ordersForStrategy(
    const std::string& strategy_id) const {
  std::shared_lock lock(mutex_);
  std::vector<domain::Order> result;
  for (const auto& [id, entry] : orders_) {
    if (entry.order.strategy_id == strategy_id) {
      result.push_back(entry.order);
    }
  }
  return result;
}

std::vector<domain::Order> OrderBook::snapshot() const {
  std::shared_lock lock(mutex_);
  std::vector<domain::Order> result;
  result.reserve(orders_.size());
  for (const auto& [id, entry] : orders_) {
    result.push_back(entry.order);
  }
  return result;
}

std::size_t OrderBook::openOrderCount(const std::string& symbol) const {
  std::shared_lock lock(mutex_);
  return static_cast<std::size_t>(std::count_if(
      orders_.begin(), orders_.end(), [&symbol](const auto& item) {
        const domain::Order& order = item.second.order;
        return order.symbol == symbol &&
               OrderStateMachine::isWorking(order.state);
      }));
}

double OrderBook::workingQuantity(const std::string& symbol,
                                  domain::Side side) const {
  std::shared_lock lock(mutex_);
  double total = 0.0;
  for (const auto& [id, entry] : orders_) {
    const domain::Order& order = entry.order;
    if (order.symbol == symbol && order.side == side &&
        OrderStateMachine::isWorking(order.state)) {
      total += domain::remainingQuantity(order);
    }
  }
  return total;
}

std::size_t OrderBook::size() const {
  std::shared_lock lock(mutex_);
  return orders_.size();
}

bool OrderBook::hasFill(const std::string& exchange_fill_id) const {
  std::shared_lock lock(mutex_);
  return fill_index_.count(exchange_fill_id) > 0;
}

// -----------------------------------------------------------------------------
// insertPending: admission path, called under the reconciler's lock
// -----------------------------------------------------------------------------
bool OrderBook::insertPending(const domain::Order& order) {
  std::unique_lock lock(mutex_);
  if (orders_.count(order.client_order_id) > 0) {
    return false;
  }
  Entry entry;
  entry.order = order;
  entry.order.state = domain::OrderState::Pending;
  entry.order.filled_quantity = 0.0;
  orders_.emplace(order.client_order_id, std::move(entry));
  return true;
}

// -----------------------------------------------------------------------------
// hydrate: load an order the exchange already knows about
// -----------------------------------------------------------------------------
bool OrderBook::hydrate(const domain::OrderStatusReport& report,
                        const std::string& strategy_id) {
  std::unique_lock lock(mutex_);
  if (orders_.count(report.client_order_id) > 0) {
    return false;
  }

  std::int64_t now = clock_.now_ms();

  Entry entry;
  domain::Order& order = entry.order;
  order.client_order_id = report.client_order_id;
  if (!report.exchange_order_id.empty()) {
    order.exchange_order_id = report.exchange_order_id;
  }
  order.strategy_id = strategy_id;
  order.symbol = report.symbol;
  order.side = report.side;
  order.type = report.type;
  order.price = report.price;
  order.quantity = report.quantity;
  order.filled_quantity = std::min(report.filled_quantity, report.quantity);
  order.state = report.state;
  order.created_at = now;
  order.last_updated_at = now;
  order.last_sequence = report.sequence;
  order.reason = report.reason;

  for (const domain::Fill& fill : report.fills) {
    if (fill_index_.emplace(fill.exchange_fill_id, report.client_order_id)
            .second) {
      entry.fill_ids.push_back(fill.exchange_fill_id);
    }
  }

  if (order.exchange_order_id) {
    by_exchange_id_[*order.exchange_order_id] = report.client_order_id;
  }
  orders_.emplace(report.client_order_id, std::move(entry));
  return true;
}

// -----------------------------------------------------------------------------
// applyFill: dedup by fill id, bound by quantity, advance state
// -----------------------------------------------------------------------------
FillApplication OrderBook::applyFill(const domain::Fill& fill) {
  std::unique_lock lock(mutex_);

  FillApplication result;
  auto it = orders_.find(fill.order_id);
  if (it == orders_.end()) {
    result.outcome = FillOutcome::UnknownOrder;
    return result;
  }

  Entry& entry = it->second;
  domain::Order& order = entry.order;
  result.previous_state = order.state;

  if (order.quarantined) {
    result.outcome = FillOutcome::Quarantined;
  } else if (fill_index_.count(fill.exchange_fill_id) > 0) {
    result.outcome = FillOutcome::Duplicate;
  } else if (order.state == domain::OrderState::Cancelled ||
             order.state == domain::OrderState::Rejected ||
             fill.quantity <= domain::kQuantityEpsilon) {
    result.outcome = FillOutcome::NotFillable;
  } else if (order.filled_quantity + fill.quantity >
             order.quantity + domain::kQuantityEpsilon) {
    result.outcome = FillOutcome::Overfill;
  } else {
    order.filled_quantity += fill.quantity;
    if (domain::quantitiesEqual(order.filled_quantity, order.quantity)) {
      order.filled_quantity = order.quantity;
      order.state = domain::OrderState::Filled;
    } else {
      order.state = domain::OrderState::PartiallyFilled;
    }
    order.last_updated_at = clock_.now_ms();
    fill_index_.emplace(fill.exchange_fill_id, order.client_order_id);
    entry.fill_ids.push_back(fill.exchange_fill_id);
    result.outcome = FillOutcome::Applied;
  }

  result.order = order;
  return result;
}

// -----------------------------------------------------------------------------
// transition: state change validated by OrderStateMachine
// -----------------------------------------------------------------------------
TransitionResult OrderBook::transition(const domain::ClientOrderId& id,
                                       domain::OrderState to,
                                       const std::string& reason) {
  std::unique_lock lock(mutex_);

  TransitionResult result;
  auto it = orders_.find(id);
  if (it == orders_.end()) {
    result.outcome = TransitionOutcome::UnknownOrder;
    return result;
  }

  domain::Order& order = it->second.order;
  result.previous_state = order.state;

  if (order.quarantined) {
    result.outcome = TransitionOutcome::Quarantined;
  } else if (order.state == to) {
    result.outcome = TransitionOutcome::NoOp;
  } else if (!OrderStateMachine::canTransition(order.state, to)) {
    result.outcome = TransitionOutcome::Illegal;
  } else {
    order.state = to;
    if (!reason.empty()) {
      order.reason = reason;
    }
    order.last_updated_at = clock_.now_ms();
    result.outcome = TransitionOutcome::Applied;
  }

  result.order = order;
  return result;
}

bool OrderBook::assignExchangeId(const domain::ClientOrderId& id,
                                 const domain::ExchangeOrderId& exchange_id) {
  std::unique_lock lock(mutex_);
  auto it = orders_.find(id);
  if (it == orders_.end() || exchange_id.empty()) {
    return false;
  }

  domain::Order& order = it->second.order;
  if (order.exchange_order_id) {
    return *order.exchange_order_id == exchange_id;
  }

  auto idx = by_exchange_id_.find(exchange_id);
  if (idx != by_exchange_id_.end() && idx->second != id) {
    return false;
  }

  order.exchange_order_id = exchange_id;
  by_exchange_id_[exchange_id] = id;
  return true;
}

std::optional<domain::Order> OrderBook::quarantine(
    const domain::ClientOrderId& id, const std::string& reason) {
  std::unique_lock lock(mutex_);
  auto it = orders_.find(id);
  if (it == orders_.end()) {
    return std::nullopt;
  }
  domain::Order& order = it->second.order;
  order.quarantined = true;
  order.reason = reason;
  order.last_updated_at = clock_.now_ms();
  return order;
}

std::uint64_t OrderBook::lastSequence(const domain::ClientOrderId& id) const {
  std::shared_lock lock(mutex_);
  auto it = orders_.find(id);
  return it != orders_.end() ? it->second.order.last_sequence : 0;
}

void OrderBook::setLastSequence(const domain::ClientOrderId& id,
                                std::uint64_t sequence) {
  std::unique_lock lock(mutex_);
  auto it = orders_.find(id);
  if (it != orders_.end() && sequence > it->second.order.last_sequence) {
    it->second.order.last_sequence = sequence;
  }
}

// -----------------------------------------------------------------------------
// evictTerminal: drop orders past the audit window
// -----------------------------------------------------------------------------
std::size_t OrderBook::evictTerminal(std::int64_t cutoff_ms) {
  std::unique_lock lock(mutex_);
  std::size_t evicted = 0;

  for (auto it = orders_.begin(); it != orders_.end();) {
    const domain::Order& order = it->second.order;
    if (!OrderStateMachine::isTerminal(order.state) || order.quarantined ||
        order.last_updated_at >= cutoff_ms) {
      ++it;
      continue;
    }
    if (order.exchange_order_id) {
      by_exchange_id_.erase(*order.exchange_order_id);
    }
    for (const std::string& fill_id : it->second.fill_ids) {
      fill_index_.erase(fill_id);
    }
    it = orders_.erase(it);
    ++evicted;
  }
  return evicted;
}

}  // namespace tradecore
