#pragma once

#include "tradecore/domain/market_snapshot.hpp"
#include "tradecore/eventbus/event_bus.hpp"
#include "tradecore/events/event.hpp"
#include "tradecore/feed/market_order_book.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace tradecore {

// -----------------------------------------------------------------------------
// MarketDataFeed: latest MarketSnapshot per symbol
// -----------------------------------------------------------------------------
//
// @brief  Keeps the latest top of book per symbol and republishes accepted
//         updates as MarketSnapshotEvent.
//
// @details
// On MarketEvent:
//   - sequence <= current sequence for the symbol: stale, dropped and
//     counted; nothing is published.
//   - sequence  > current + 1: accepted, and the gap is counted and logged
//     (the feed skipped messages; the snapshot is still the newest).
//   - the snapshot is replaced as a whole, never merged field by field.
// On HeartbeatEvent the heartbeat time is recorded.
//
// Level-3 books:
//   The first BookEvent for a symbol creates its MarketOrderBook. From then
//   on the symbol's snapshot is derived from the book (best bid, best ask,
//   last trade, book sequence) and tickers for it are ignored.
//   Whenever a book needs a snapshot (none yet, or a sequence gap) a
//   BookResyncRequestEvent is published once; messages are buffered until
//   the matching BookSnapshotEvent arrives. A snapshot event without a
//   snapshot (exchange unreachable) clears the request so the next message
//   asks again. A derived snapshot is published only when bid, ask or last
//   changed.
//
// Thread model:
//   Handlers run on the market loop, which alone touches the books.
//   snapshot(), snapshots() and the
//   counters are safe from any thread (shared_mutex / atomics). The
//   AdmissionController reads reference prices from here.
//
// Ownership:
//   Owned by TradingEngine via std::unique_ptr; references the market loop's
//   EventBus.
// -----------------------------------------------------------------------------
class MarketDataFeed {
 public:
  explicit MarketDataFeed(EventBus& bus);
  ~MarketDataFeed();

  MarketDataFeed(const MarketDataFeed&) = delete;
  MarketDataFeed& operator=(const MarketDataFeed&) = delete;
  MarketDataFeed(MarketDataFeed&&) = delete;
  MarketDataFeed& operator=(MarketDataFeed&&) = delete;

  std::optional<domain::MarketSnapshot> snapshot(
      const std::string& symbol) const;
  std::vector<domain::MarketSnapshot> snapshots() const;

  std::uint64_t staleDropCount() const { return stale_drops_.load(); }
  std::uint64_t gapCount() const { return gaps_.load(); }
  std::uint64_t resyncRequestCount() const { return resyncs_.load(); }
  std::int64_t lastHeartbeatMs() const { return last_heartbeat_ms_.load(); }

 private:
  void onMarketEvent(const MarketEvent& event);
  void onHeartbeat(const HeartbeatEvent& event);
  void onBookEvent(const BookEvent& event);
  void onBookSnapshot(const BookSnapshotEvent& event);

  MarketOrderBook& bookFor(const std::string& symbol);
  void requestSnapshot(MarketOrderBook& book);
  void publishTop(const MarketOrderBook& book, std::int64_t timestamp_ms);

  EventBus& bus_;

  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, domain::MarketSnapshot> snapshots_;

  // Market loop only.
  std::unordered_map<std::string, std::unique_ptr<MarketOrderBook>> books_;

  std::atomic<std::uint64_t> stale_drops_{0};
  std::atomic<std::uint64_t> gaps_{0};
  std::atomic<std::uint64_t> resyncs_{0};
  std::atomic<std::int64_t> last_heartbeat_ms_{0};

  EventBus::SubscriptionId market_sub_id_{0};
  EventBus::SubscriptionId heartbeat_sub_id_{0};
  EventBus::SubscriptionId book_sub_id_{0};
  EventBus::SubscriptionId book_snapshot_sub_id_{0};
};

}  // namespace tradecore
