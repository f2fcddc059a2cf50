#include "tradecore/feed/market_data_feed.hpp"

#include "tradecore/time/time_utils.hpp"

#include <iostream>
#include <mutex>

namespace tradecore {

MarketDataFeed::MarketDataFeed(EventBus& bus) : bus_(bus) {
  market_sub_id_ = bus_.subscribe<MarketEvent>(
      [this](const MarketEvent& e) { onMarketEvent(e); });
  heartbeat_sub_id_ = bus_.subscribe<HeartbeatEvent>(
      [this](const HeartbeatEvent& e) { onHeartbeat(e); });
  book_sub_id_ = bus_.subscribe<BookEvent>(
      [this](const BookEvent& e) { onBookEvent(e); });
  book_snapshot_sub_id_ = bus_.subscribe<BookSnapshotEvent>(
      [this](const BookSnapshotEvent& e) { onBookSnapshot(e); });
}

MarketDataFeed::~MarketDataFeed() {
  bus_.unsubscribe(book_snapshot_sub_id_);
  bus_.unsubscribe(book_sub_id_);
  bus_.unsubscribe(heartbeat_sub_id_);
  bus_.unsubscribe(market_sub_id_);
}

std::optional<domain::MarketSnapshot> MarketDataFeed::snapshot(
    const std::string& symbol) const {
  std::shared_lock lock(mutex_);
  auto it = snapshots_.find(symbol);
  if (it == snapshots_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<domain::MarketSnapshot> MarketDataFeed::snapshots() const {
  std::shared_lock lock(mutex_);
  std::vector<domain::MarketSnapshot> result;
  result.reserve(snapshots_.size());
  for (const auto& [symbol, snap] : snapshots_) {
    result.push_back(snap);
  }
  return result;
}

// -----------------------------------------------------------------------------
// onMarketEvent: sequence check, wholesale replace, republish
// -----------------------------------------------------------------------------
void MarketDataFeed::onMarketEvent(const MarketEvent& event) {
  if (books_.count(event.symbol) != 0) {
    return;  // the book is authoritative for this symbol
  }

  domain::MarketSnapshot next;
  next.symbol = event.symbol;
  next.bid = event.bid;
  next.ask = event.ask;
  next.last = event.last;
  next.sequence = event.sequence;
  next.timestamp = timestamp_to_ms(event.timestamp);

  {
    std::unique_lock lock(mutex_);
    auto it = snapshots_.find(event.symbol);
    if (it != snapshots_.end()) {
      std::uint64_t current = it->second.sequence;
      if (event.sequence <= current) {
        stale_drops_.fetch_add(1);
        std::cerr << "[MarketDataFeed] stale update for " << event.symbol
                  << " seq=" << event.sequence << " (have " << current
                  << "), dropped\n";
        return;
      }
      if (event.sequence > current + 1) {
        gaps_.fetch_add(1);
        std::cerr << "[MarketDataFeed] WARNING: gap on " << event.symbol
                  << ", expected seq " << current + 1 << " got "
                  << event.sequence << "\n";
      }
      it->second = next;
    } else {
      snapshots_.emplace(event.symbol, next);
    }
  }

  bus_.publish(MarketSnapshotEvent{next});
}

void MarketDataFeed::onHeartbeat(const HeartbeatEvent& event) {
  last_heartbeat_ms_.store(timestamp_to_ms(event.timestamp));
}

// -----------------------------------------------------------------------------
// Level-3 book maintenance
// -----------------------------------------------------------------------------
void MarketDataFeed::onBookEvent(const BookEvent& event) {
  MarketOrderBook& book = bookFor(event.symbol);
  MarketOrderBook::ApplyResult result = book.apply(event);

  switch (result) {
    case MarketOrderBook::ApplyResult::Applied:
      publishTop(book, timestamp_to_ms(event.timestamp));
      return;
    case MarketOrderBook::ApplyResult::Stale:
      stale_drops_.fetch_add(1);
      return;
    case MarketOrderBook::ApplyResult::Gap:
      gaps_.fetch_add(1);
      break;
    case MarketOrderBook::ApplyResult::Buffered:
      break;
  }
  if (book.needsSnapshot()) {
    requestSnapshot(book);
  }
}

void MarketDataFeed::onBookSnapshot(const BookSnapshotEvent& event) {
  MarketOrderBook& book = bookFor(event.symbol);
  if (!event.snapshot) {
    book.abandonResync();
    std::cerr << "[MarketDataFeed] ERROR: no book snapshot for "
              << event.symbol << ", will retry on the next message\n";
    return;
  }

  if (book.applySnapshot(*event.snapshot) ==
      MarketOrderBook::ApplyResult::Gap) {
    gaps_.fetch_add(1);
    requestSnapshot(book);
    return;
  }

  std::int64_t timestamp_ms = 0;
  if (auto current = snapshot(event.symbol)) {
    timestamp_ms = current->timestamp;
  }
  publishTop(book, timestamp_ms);
}

MarketOrderBook& MarketDataFeed::bookFor(const std::string& symbol) {
  auto it = books_.find(symbol);
  if (it == books_.end()) {
    it = books_.emplace(symbol, std::make_unique<MarketOrderBook>(symbol))
             .first;
  }
  return *it->second;
}

void MarketDataFeed::requestSnapshot(MarketOrderBook& book) {
  book.beginResync();
  resyncs_.fetch_add(1);
  std::cout << "[MarketDataFeed] requesting book snapshot for "
            << book.symbol() << " (at seq " << book.sequence() << ")\n";
  bus_.publish(BookResyncRequestEvent{book.symbol(), book.sequence()});
}

void MarketDataFeed::publishTop(const MarketOrderBook& book,
                                std::int64_t timestamp_ms) {
  domain::MarketSnapshot next;
  next.symbol = book.symbol();
  next.bid = book.bestBid().value_or(0.0);
  next.ask = book.bestAsk().value_or(0.0);
  next.last = book.lastTradePrice();
  next.sequence = book.sequence();
  next.timestamp = timestamp_ms;

  {
    std::unique_lock lock(mutex_);
    auto it = snapshots_.find(next.symbol);
    if (it == snapshots_.end()) {
      snapshots_.emplace(next.symbol, next);
    } else {
      const bool unchanged = it->second.bid == next.bid &&
                             it->second.ask == next.ask &&
                             it->second.last == next.last;
      it->second = next;
      if (unchanged) {
        return;
      }
    }
  }

  bus_.publish(MarketSnapshotEvent{next});
}

}  // namespace tradecore
