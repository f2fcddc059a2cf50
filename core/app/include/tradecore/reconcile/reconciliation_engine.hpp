#pragma once

#include "tradecore/domain/errors.hpp"
#include "tradecore/domain/fill.hpp"
#include "tradecore/domain/order.hpp"
#include "tradecore/domain/order_status_report.hpp"
#include "tradecore/eventbus/event_bus.hpp"
#include "tradecore/events/event.hpp"
#include "tradecore/ledger/order_book.hpp"
#include "tradecore/risk/position_keeper.hpp"
#include "tradecore/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>

namespace tradecore {

class ReconciliationEngine;

// -----------------------------------------------------------------------------
// SubmissionRegistrar
// -----------------------------------------------------------------------------
// Handed to the callable given to ReconciliationEngine::runExclusive(). It is
// the only way to add a new order to the ledger, and it only exists while
// the reconciliation lock is held.
// -----------------------------------------------------------------------------
class SubmissionRegistrar {
 public:
  // Inserts order as Pending. False if the client id is already known.
  bool registerSubmission(const domain::Order& order);

 private:
  friend class ReconciliationEngine;

  SubmissionRegistrar(ReconciliationEngine& engine, std::vector<Event>& outbox)
      : engine_(engine), outbox_(outbox) {}

  ReconciliationEngine& engine_;
  std::vector<Event>& outbox_;
};

// -----------------------------------------------------------------------------
// ReconciliationEngine: single writer of the OrderBook
// -----------------------------------------------------------------------------
//
// @brief  Merges everything the exchange says (private feed events, gateway
//         outcomes, status reports) into the ledger and the positions, and
//         publishes what changed.
//
// @details
// Subscribes on the reconcile loop's bus to ExchangeEvent, SubmitResultEvent,
// CancelResultEvent and StatusResultEvent. Publishes OrderUpdateEvent,
// FillAppliedEvent, PositionUpdateEvent, AlertEvent and StatusRequestEvent.
//
// Sequencing (private feed events):
//   - sequence <= last applied for the order: dropped, counted.
//   - sequence  > last + 1: applied, then a status query fills the gap.
//   - sequence == 0: unsequenced, applied idempotently.
//
// Unknown orders:
//   A submit that ends in GatewayUnavailable moves Pending -> Unknown and
//   raises an alert. An ack for an Unknown order triggers a status query;
//   the report replays every fill (duplicates are no-ops) and then sets the
//   reported state. A "not found" status for an Unknown order resolves it to
//   Rejected: the submission never reached the exchange.
//
// Data integrity:
//   Conflicting terminal states, a fill after Cancelled/Rejected, an
//   overfill, or an exchange id claimed by two orders quarantine that one
//   order and raise a DataIntegrityError alert. A quarantined order ignores
//   every later event; the rest of the ledger carries on.
//
// Atomic admission:
//   runExclusive() runs a callable under the same lock that every ledger
//   and position mutation takes, so an admission decision sees a state no
//   fill or transition can change underneath it.
//
// Thread model:
//   Handlers run on the reconcile loop. runExclusive() runs on strategy
//   workers. Both take state_mutex_; events are published after it is
//   released, on the thread that produced them.
//
// Ownership:
//   Owned by TradingEngine via std::unique_ptr. References the reconcile
//   loop's EventBus, the OrderBook, the PositionKeeper and the clock.
// -----------------------------------------------------------------------------
class ReconciliationEngine {
 public:
  ReconciliationEngine(EventBus& bus, OrderBook& book,
                       PositionKeeper& positions, const ITimeProvider& clock,
                       std::int64_t audit_retention_ms);

  ~ReconciliationEngine();

  ReconciliationEngine(const ReconciliationEngine&) = delete;
  ReconciliationEngine& operator=(const ReconciliationEngine&) = delete;
  ReconciliationEngine(ReconciliationEngine&&) = delete;
  ReconciliationEngine& operator=(ReconciliationEngine&&) = delete;

  // -------------------------------------------------------------------------
  // runExclusive(fn)
  // -------------------------------------------------------------------------
  // @brief  Calls fn(SubmissionRegistrar&) with the reconciliation lock held
  //         and returns its result. Events produced by registrations are
  //         published after the lock is released.
  // -------------------------------------------------------------------------
  template <typename Fn>
  auto runExclusive(Fn&& fn) {
    std::vector<Event> outbox;
    auto result = [&] {
      std::lock_guard lock(state_mutex_);
      SubmissionRegistrar registrar(*this, outbox);
      return fn(registrar);
    }();
    publishAll(outbox);
    return result;
  }

  // -------------------------------------------------------------------------
  // hydrate(reports)
  // -------------------------------------------------------------------------
  // @brief  Startup sync: loads orders the exchange reports as open. They
  //         belong to no strategy. Returns how many were added.
  // -------------------------------------------------------------------------
  std::size_t hydrate(const std::vector<domain::OrderStatusReport>& reports);

  // Operator-triggered status query. False if the order is not in the ledger.
  bool requestResolution(const domain::ClientOrderId& client_order_id,
                         const std::string& reason = "operator request");

  // Evicts terminal orders older than the audit window. Also runs on its
  // own about once per second of clock time while events flow.
  std::size_t evictExpired();

  std::uint64_t staleDropCount() const { return stale_drops_.load(); }
  std::uint64_t quarantineCount() const { return quarantines_.load(); }
  std::uint64_t alertCount() const { return alerts_.load(); }

 private:
  friend class SubmissionRegistrar;

  void onExchangeEvent(const ExchangeEvent& event);
  void onSubmitResult(const SubmitResultEvent& event);
  void onCancelResult(const CancelResultEvent& event);
  void onStatusResult(const StatusResultEvent& event);

  // Everything below expects state_mutex_ held and appends what must be
  // published to outbox.
  bool registerLocked(const domain::Order& order, std::vector<Event>& outbox);
  void handleExchangeEvent(const ExchangeEvent& event,
                           std::vector<Event>& outbox);
  void handleSubmitResult(const SubmitResult& result,
                          std::vector<Event>& outbox);
  void handleCancelResult(const CancelResult& result,
                          std::vector<Event>& outbox);
  void handleStatusResult(const StatusResult& result,
                          std::vector<Event>& outbox);

  FillOutcome applyFillLocked(const domain::Fill& fill,
                              std::vector<Event>& outbox);
  void applyTerminal(const domain::ClientOrderId& id, domain::OrderState target,
                     const std::string& reason, std::vector<Event>& outbox);
  void applyReport(const domain::ClientOrderId& id,
                   const domain::OrderStatusReport& report,
                   std::vector<Event>& outbox);
  void transitionLocked(const domain::ClientOrderId& id,
                        domain::OrderState target, const std::string& reason,
                        std::vector<Event>& outbox);
  bool assignExchangeId(const domain::ClientOrderId& id,
                        const domain::ExchangeOrderId& exchange_id,
                        std::vector<Event>& outbox);
  void quarantineLocked(const domain::ClientOrderId& id,
                        const std::string& detail, std::vector<Event>& outbox);
  void raiseAlert(domain::ErrorKind kind, const domain::ClientOrderId& id,
                  const std::string& detail, std::vector<Event>& outbox);
  void requestStatusLocked(const domain::ClientOrderId& id,
                           const std::string& reason,
                           std::vector<Event>& outbox);
  void maybeSweep();

  void publishAll(const std::vector<Event>& outbox);

  Timestamp now() const;

  EventBus& bus_;
  OrderBook& book_;
  PositionKeeper& positions_;
  const ITimeProvider& clock_;
  const std::int64_t audit_retention_ms_;

  std::mutex state_mutex_;
  std::unordered_set<domain::ClientOrderId> status_in_flight_;
  std::int64_t last_sweep_ms_{0};

  std::atomic<std::uint64_t> stale_drops_{0};
  std::atomic<std::uint64_t> quarantines_{0};
  std::atomic<std::uint64_t> alerts_{0};

  EventBus::SubscriptionId exchange_sub_id_{0};
  EventBus::SubscriptionId submit_sub_id_{0};
  EventBus::SubscriptionId cancel_sub_id_{0};
  EventBus::SubscriptionId status_sub_id_{0};
};

}  // namespace tradecore
