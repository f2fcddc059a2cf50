#include "tradecore/feed/market_order_book.hpp"

#include <algorithm>
#include <iostream>
#include <utility>

namespace tradecore {

namespace {

// Adds delta to the level at price; a level at or below zero is removed.
template <typename Levels>
void adjust(Levels& levels, double price, double delta) {
  auto it = levels.find(price);
  if (it == levels.end()) {
    if (delta > domain::kQuantityEpsilon) {
      levels.emplace(price, delta);
    }
    return;
  }
  it->second += delta;
  if (it->second <= domain::kQuantityEpsilon) {
    levels.erase(it);
  }
}

}  // namespace

MarketOrderBook::MarketOrderBook(std::string symbol)
    : symbol_(std::move(symbol)) {}

// -----------------------------------------------------------------------------
// applySnapshot: replace the book, then replay what arrived meanwhile
// -----------------------------------------------------------------------------
MarketOrderBook::ApplyResult MarketOrderBook::applySnapshot(
    const domain::BookSnapshot& snapshot) {
  bids_.clear();
  asks_.clear();
  resting_.clear();
  received_.clear();

  for (const domain::BookEntry& entry : snapshot.bids) {
    addResting(entry.order_id,
               RestingOrder{domain::Side::Buy, entry.price, entry.size});
  }
  for (const domain::BookEntry& entry : snapshot.asks) {
    addResting(entry.order_id,
               RestingOrder{domain::Side::Sell, entry.price, entry.size});
  }

  sequence_ = snapshot.sequence;
  synced_ = true;
  resync_pending_ = false;

  std::deque<BookEvent> pending;
  pending.swap(buffered_);
  while (!pending.empty()) {
    const BookEvent& event = pending.front();
    if (event.sequence <= sequence_) {
      pending.pop_front();
      continue;
    }
    if (event.sequence > sequence_ + 1) {
      std::cerr << "[MarketOrderBook] " << symbol_
                << ": hole after snapshot, expected seq " << sequence_ + 1
                << " got " << event.sequence << "\n";
      synced_ = false;
      buffered_.swap(pending);
      return ApplyResult::Gap;
    }
    applyMessage(event);
    sequence_ = event.sequence;
    pending.pop_front();
  }

  std::cout << "[MarketOrderBook] " << symbol_ << " synced at seq "
            << sequence_ << " (" << resting_.size() << " orders)\n";
  return ApplyResult::Applied;
}

// -----------------------------------------------------------------------------
// apply: one incremental message
// -----------------------------------------------------------------------------
MarketOrderBook::ApplyResult MarketOrderBook::apply(const BookEvent& event) {
  if (!synced_) {
    buffer(event);
    return ApplyResult::Buffered;
  }
  if (event.sequence <= sequence_) {
    return ApplyResult::Stale;
  }
  if (event.sequence > sequence_ + 1) {
    std::cerr << "[MarketOrderBook] WARNING: gap on " << symbol_
              << ", expected seq " << sequence_ + 1 << " got "
              << event.sequence << "\n";
    synced_ = false;
    buffer(event);
    return ApplyResult::Gap;
  }
  applyMessage(event);
  sequence_ = event.sequence;
  return ApplyResult::Applied;
}

std::optional<double> MarketOrderBook::bestBid() const {
  if (!synced_ || bids_.empty()) {
    return std::nullopt;
  }
  return bids_.begin()->first;
}

std::optional<double> MarketOrderBook::bestAsk() const {
  if (!synced_ || asks_.empty()) {
    return std::nullopt;
  }
  return asks_.begin()->first;
}

double MarketOrderBook::sizeAt(domain::Side side, double price) const {
  if (side == domain::Side::Buy) {
    auto it = bids_.find(price);
    return it == bids_.end() ? 0.0 : it->second;
  }
  auto it = asks_.find(price);
  return it == asks_.end() ? 0.0 : it->second;
}

std::size_t MarketOrderBook::levelCount(domain::Side side) const {
  return side == domain::Side::Buy ? bids_.size() : asks_.size();
}

void MarketOrderBook::buffer(const BookEvent& event) {
  buffered_.push_back(event);
  if (buffered_.size() > kMaxBuffered) {
    buffered_.pop_front();
  }
}

void MarketOrderBook::applyMessage(const BookEvent& event) {
  switch (event.kind) {
    case BookEventKind::Received: onReceived(event); break;
    case BookEventKind::Open:     onOpen(event); break;
    case BookEventKind::Done:     onDone(event); break;
    case BookEventKind::Match:    onMatch(event); break;
    case BookEventKind::Change:   onChange(event); break;
  }
}

void MarketOrderBook::addResting(const std::string& order_id,
                                 const RestingOrder& order) {
  auto [it, inserted] = resting_.emplace(order_id, order);
  if (!inserted) {
    adjustLevel(it->second.side, it->second.price, -it->second.size);
    it->second = order;
  }
  adjustLevel(order.side, order.price, order.size);
}

void MarketOrderBook::removeResting(const std::string& order_id) {
  auto it = resting_.find(order_id);
  if (it == resting_.end()) {
    return;
  }
  adjustLevel(it->second.side, it->second.price, -it->second.size);
  resting_.erase(it);
}

void MarketOrderBook::adjustLevel(domain::Side side, double price,
                                  double delta) {
  if (side == domain::Side::Buy) {
    adjust(bids_, price, delta);
  } else {
    adjust(asks_, price, delta);
  }
}

void MarketOrderBook::onReceived(const BookEvent& event) {
  received_[event.order_id] =
      RestingOrder{event.side, event.price, event.size};
}

void MarketOrderBook::onOpen(const BookEvent& event) {
  received_.erase(event.order_id);
  addResting(event.order_id,
             RestingOrder{event.side, event.price, event.size});
}

void MarketOrderBook::onDone(const BookEvent& event) {
  if (resting_.count(event.order_id) != 0) {
    removeResting(event.order_id);
    return;
  }
  // Filled or cancelled before resting: nothing on the book to remove.
  if (received_.erase(event.order_id) == 0) {
    inconsistent(event, "done for an unknown order");
  }
}

void MarketOrderBook::onMatch(const BookEvent& event) {
  last_trade_price_ = event.price;
  last_trade_size_ = event.size;

  auto maker = resting_.find(event.order_id);
  if (maker == resting_.end()) {
    inconsistent(event, "match against an unknown maker");
  } else {
    double traded = std::min(event.size, maker->second.size);
    maker->second.size -= traded;
    adjustLevel(maker->second.side, maker->second.price, -traded);
  }

  // The taker is forgotten on its done, filled or not.
  auto taker = received_.find(event.taker_order_id);
  if (taker != received_.end()) {
    taker->second.size = std::max(0.0, taker->second.size - event.size);
  }
}

void MarketOrderBook::onChange(const BookEvent& event) {
  auto it = resting_.find(event.order_id);
  if (it == resting_.end()) {
    auto pending = received_.find(event.order_id);
    if (pending != received_.end()) {
      pending->second.size = event.size;
    } else {
      inconsistent(event, "change for an unknown order");
    }
    return;
  }
  adjustLevel(it->second.side, it->second.price,
              event.size - it->second.size);
  it->second.size = event.size;
}

void MarketOrderBook::inconsistent(const BookEvent& event, const char* what) {
  ++inconsistencies_;
  std::cerr << "[MarketOrderBook] " << symbol_ << " seq=" << event.sequence
            << ": " << what << " (" << event.order_id << ")\n";
}

}  // namespace tradecore
