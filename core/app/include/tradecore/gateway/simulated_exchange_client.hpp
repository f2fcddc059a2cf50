#pragma once

#include "tradecore/domain/fill.hpp"
#include "tradecore/domain/order.hpp"
#include "tradecore/domain/order_status_report.hpp"
#include "tradecore/domain/position.hpp"
#include "tradecore/events/exchange_event.hpp"
#include "tradecore/gateway/exchange_client.hpp"
#include "tradecore/time/i_time_provider.hpp"

#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace tradecore {

// -----------------------------------------------------------------------------
// SimulatedExchangeClient: in-memory exchange
// -----------------------------------------------------------------------------
//
// @brief  Implements IExchangeClient against an in-process order table and
//         publishes private order events (ack, fill, done) the way a real
//         exchange's private feed would.
//
// @details
// Exchange behaviour:
//   - submitOrder is idempotent on client_order_id: a repeat returns the
//     original acceptance and changes nothing.
//   - a submission for a symbol configured with setRejectReason() is
//     rejected (recorded, Rejected event emitted).
//   - an accepted order rests as Open until the test or simulation calls
//     fill() or cancelByExchange(), or the client cancels it.
//   - every private event bumps the order's sequence number; status reports
//     carry the current sequence and the full fill history.
//
// Fault script:
//   failNext(op, kind, count, applied) makes the next `count` calls of `op`
//   fail with `kind`. With applied = true the request is processed first and
//   only the reply is lost, which is the ambiguous case the gateway must
//   handle by querying.
//
// Thread model:
//   All state behind one mutex. Private events are delivered to the sink
//   after the mutex is released, on the calling thread.
// -----------------------------------------------------------------------------
class SimulatedExchangeClient final : public IExchangeClient {
 public:
  enum class Operation {
    Submit,
    Cancel,
    Query,
    OpenOrders,
    Positions,
    Book,
  };

  using EventSink = std::function<void(const ExchangeEvent&)>;

  explicit SimulatedExchangeClient(const ITimeProvider& clock);

  SimulatedExchangeClient(const SimulatedExchangeClient&) = delete;
  SimulatedExchangeClient& operator=(const SimulatedExchangeClient&) = delete;

  ClientReply<SubmitAck> submitOrder(const domain::Order& order) override;
  ClientReply<CancelAck> cancelOrder(
      const domain::ClientOrderId& client_order_id) override;
  ClientReply<std::optional<domain::OrderStatusReport>> queryOrder(
      const domain::ClientOrderId& client_order_id) override;
  ClientReply<std::vector<domain::OrderStatusReport>> openOrders() override;
  ClientReply<std::vector<domain::Position>> positions() override;
  ClientReply<domain::BookSnapshot> bookSnapshot(
      const std::string& symbol) override;

  void failNext(Operation operation, TransportFailureKind kind, int count = 1,
                bool applied = false);

  // Receives private events. Without a sink they are dropped, which is how
  // tests simulate a lossy private feed.
  void setPrivateEventSink(EventSink sink);

  void setRejectReason(const std::string& symbol, std::string reason);

  // Executes quantity (clipped to what remains) at price against a resting
  // order. Returns the fill, or std::nullopt if the order is unknown or done.
  std::optional<domain::Fill> fill(const domain::ClientOrderId& client_order_id,
                                   double quantity, double price);

  // Fills every resting order on symbol that the quote crosses: buys at or
  // above ask fill at ask, sells at or below bid fill at bid. Market orders
  // always cross. Returns the number of fills produced.
  int crossResting(const std::string& symbol, double bid, double ask);

  // Exchange-initiated cancel (expiry, self-trade prevention).
  bool cancelByExchange(const domain::ClientOrderId& client_order_id,
                        const std::string& reason);

  void seedPosition(const domain::Position& position);

  // Public book returned by bookSnapshot(). An unseeded symbol has an empty
  // book at sequence 0.
  void seedBook(const domain::BookSnapshot& book);

  std::optional<domain::OrderStatusReport> order(
      const domain::ClientOrderId& client_order_id) const;

  int callCount(Operation operation) const;
  int submitCalls() const { return callCount(Operation::Submit); }

 private:
  struct Fault {
    TransportFailureKind kind;
    bool applied;
  };

  // Helpers below expect mutex_ held.
  std::optional<Fault> takeFault(Operation operation);
  SubmitAck processSubmit(const domain::Order& order,
                          std::vector<ExchangeEvent>& events);
  CancelAck processCancel(const domain::ClientOrderId& client_order_id,
                          const std::string& reason,
                          std::vector<ExchangeEvent>& events);
  ExchangeEvent makeEvent(ExchangeEventKind kind,
                          domain::OrderStatusReport& report);

  void deliver(const std::vector<ExchangeEvent>& events);

  const ITimeProvider& clock_;

  mutable std::mutex mutex_;
  std::unordered_map<domain::ClientOrderId, domain::OrderStatusReport> orders_;
  std::map<Operation, std::deque<Fault>> faults_;
  std::map<Operation, int> calls_;
  std::unordered_map<std::string, std::string> reject_reasons_;
  std::unordered_map<std::string, domain::Position> positions_;
  std::unordered_map<std::string, domain::BookSnapshot> books_;
  EventSink sink_;
  std::uint64_t next_order_number_{1};
  std::uint64_t next_fill_number_{1};
};

}  // namespace tradecore
