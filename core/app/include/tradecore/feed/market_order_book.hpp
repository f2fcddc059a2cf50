#pragma once

#include "tradecore/domain/book_snapshot.hpp"
#include "tradecore/domain/order.hpp"
#include "tradecore/events/book_events.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>

namespace tradecore {

// -----------------------------------------------------------------------------
// MarketOrderBook: local mirror of one symbol's public level-3 book
// -----------------------------------------------------------------------------
//
// @brief  Rebuilt from a BookSnapshot and kept current by applying the
//         channel's received/open/done/match/change messages in sequence
//         order. Supplies best bid, best ask and the last trade.
//
// @details
// Sequencing (per symbol):
//   - sequence <= current: already reflected (in the snapshot or applied
//     before). Stale, ignored.
//   - sequence == current + 1: applied.
//   - sequence  > current + 1: messages were lost. The book is no longer
//     trusted (synced() turns false), the message is buffered and the
//     caller must fetch a new snapshot.
//
// Until a snapshot arrives every message is buffered. applySnapshot()
// replaces the whole book and replays the buffer: whatever is at or below
// the snapshot's sequence is dropped as stale, the rest is applied. A hole
// in the replay is reported as Gap again.
//
// Orders:
//   Received orders are tracked apart from the book until they Open (a
//   market order never does; its Done just forgets it). A Match reduces the
//   maker's resting size and records the last trade; the maker leaves the
//   book on its Done. Price levels hold the aggregate resting size.
//
// Thread model: not synchronized. MarketDataFeed owns one per symbol and
// touches it only on the market loop.
// -----------------------------------------------------------------------------
class MarketOrderBook {
 public:
  enum class ApplyResult {
    Applied,
    Stale,
    Gap,
    Buffered,
  };

  // Messages kept while waiting for a snapshot. Older ones are dropped
  // beyond this; the replay then reports a Gap and a new snapshot is taken.
  static constexpr std::size_t kMaxBuffered = 10000;

  explicit MarketOrderBook(std::string symbol);

  ApplyResult applySnapshot(const domain::BookSnapshot& snapshot);
  ApplyResult apply(const BookEvent& event);

  // A snapshot request is in flight.
  void beginResync() { resync_pending_ = true; }
  // The request failed; the next message asks again.
  void abandonResync() { resync_pending_ = false; }

  // No trusted state and no request in flight.
  bool needsSnapshot() const { return !synced_ && !resync_pending_; }

  bool synced() const { return synced_; }
  bool resyncPending() const { return resync_pending_; }

  std::optional<double> bestBid() const;
  std::optional<double> bestAsk() const;
  double lastTradePrice() const { return last_trade_price_; }
  double lastTradeSize() const { return last_trade_size_; }

  // Aggregate resting size at one price; 0 for an empty level.
  double sizeAt(domain::Side side, double price) const;
  std::size_t levelCount(domain::Side side) const;
  std::size_t orderCount() const { return resting_.size(); }
  std::size_t bufferedCount() const { return buffered_.size(); }

  std::uint64_t sequence() const { return sequence_; }
  const std::string& symbol() const { return symbol_; }
  std::uint64_t inconsistencyCount() const { return inconsistencies_; }

 private:
  struct RestingOrder {
    domain::Side side{domain::Side::Buy};
    double price{0.0};
    double size{0.0};
  };

  void buffer(const BookEvent& event);
  void applyMessage(const BookEvent& event);

  void addResting(const std::string& order_id, const RestingOrder& order);
  void removeResting(const std::string& order_id);
  void adjustLevel(domain::Side side, double price, double delta);

  void onReceived(const BookEvent& event);
  void onOpen(const BookEvent& event);
  void onDone(const BookEvent& event);
  void onMatch(const BookEvent& event);
  void onChange(const BookEvent& event);

  void inconsistent(const BookEvent& event, const char* what);

  std::string symbol_;
  std::uint64_t sequence_{0};
  bool synced_{false};
  bool resync_pending_{false};

  std::map<double, double, std::greater<double>> bids_;
  std::map<double, double> asks_;
  std::unordered_map<std::string, RestingOrder> resting_;
  std::unordered_map<std::string, RestingOrder> received_;
  std::deque<BookEvent> buffered_;

  double last_trade_price_{0.0};
  double last_trade_size_{0.0};
  std::uint64_t inconsistencies_{0};
};

}  // namespace tradecore
