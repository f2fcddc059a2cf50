#pragma once

#include "tradecore/concurrent/client_order_id_generator.hpp"
#include "tradecore/domain/admission.hpp"
#include "tradecore/domain/intent.hpp"
#include "tradecore/domain/order.hpp"
#include "tradecore/domain/risk_limits.hpp"
#include "tradecore/time/i_time_provider.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace tradecore {

class MarketDataFeed;
class OrderBook;
class PositionKeeper;
class ReconciliationEngine;

// What admission needs to know about one symbol and side at decision time.
struct ExposureView {
  double net_position{0.0};
  std::size_t open_orders{0};
  double working_same_side{0.0};  // unfilled quantity already resting
  std::optional<double> reference_price;
};

// -----------------------------------------------------------------------------
// AdmissionController: pre-trade risk gate for every strategy intent
// -----------------------------------------------------------------------------
//
// @brief  Decides Allow or Deny(reason) for each Intent and, on Allow,
//         registers the new order in the ledger in the same critical
//         section.
//
// @details
// PlaceOrder checks, in this fixed order (first failure wins):
//   1. TradingHalted         kill switch is active.
//   2. InvalidQuantity       quantity <= 0, or a limit order without a
//                            positive price.
//   3. ExceedsOrderCount     non-terminal orders for the symbol already at
//                            max_open_orders.
//   4. NoReferencePrice      market order and no usable snapshot.
//   5. NotionalTooLarge      quantity * price > max_order_notional (limit
//                            price, else the snapshot reference price).
//   6. ExceedsPositionLimit  |net + signed(working same side + quantity)|
//                            > max_net_position. Resting orders count as if
//                            they will fill. A strategy registered with its
//                            own max_position is held to the tighter of the
//                            two limits.
//
// CancelOrder checks:
//   UnknownOrder    no such order, or it belongs to another strategy.
//   NotCancellable  terminal, Unknown or quarantined.
// Cancels are still admitted while halted so exposure can be reduced.
//
// The evaluate functions are pure: same inputs, same decision.
//
// Atomicity:
//   admit() reads exposure and registers the order inside
//   ReconciliationEngine::runExclusive(). Fills and transitions take the
//   same lock, and so do other admissions, so two intents can never both
//   pass against the same stale exposure.
//
// Thread model:
//   admit() is called concurrently from strategy workers. haltTrading() and
//   isHalted() are safe from any thread.
//
// Ownership:
//   Owned by TradingEngine. References the reconciler, ledger, positions,
//   market data, id generator and clock; all outlive it.
// -----------------------------------------------------------------------------
class AdmissionController {
 public:
  AdmissionController(ReconciliationEngine& reconciler, const OrderBook& book,
                      const PositionKeeper& positions,
                      const MarketDataFeed& market_data,
                      domain::RiskLimits limits, ClientOrderIdGenerator& ids,
                      const ITimeProvider& clock);

  AdmissionController(const AdmissionController&) = delete;
  AdmissionController& operator=(const AdmissionController&) = delete;
  AdmissionController(AdmissionController&&) = delete;
  AdmissionController& operator=(AdmissionController&&) = delete;

  // -------------------------------------------------------------------------
  // admit(strategy_id, intent)
  // -------------------------------------------------------------------------
  // @brief  Authoritative decision. An allowed PlaceOrder comes back with
  //         its new client_order_id and the Pending order already in the
  //         ledger; an allowed CancelOrder comes back with the target order.
  // -------------------------------------------------------------------------
  domain::AdmissionDecision admit(const std::string& strategy_id,
                                  const domain::Intent& intent);

  // Same checks against the current state, without registering anything.
  // Advisory only: the state may change before a later admit().
  domain::AdmissionDecision evaluate(const std::string& strategy_id,
                                     const domain::Intent& intent) const;

  static domain::AdmissionDecision evaluatePlace(
      const domain::PlaceOrder& place, const ExposureView& exposure,
      const domain::SymbolLimits& limits, bool halted);

  static domain::AdmissionDecision evaluateCancel(
      const domain::CancelOrder& cancel,
      const std::optional<domain::Order>& target,
      const std::string& strategy_id);

  // Per-strategy cap on |net position|, applied on top of the symbol
  // limits. Set at startup, before the strategy emits intents.
  void setStrategyPositionLimit(const std::string& strategy_id,
                                double max_position);

  // Symbol limits with the strategy's own cap folded in.
  domain::SymbolLimits limitsFor(const std::string& strategy_id,
                                 const std::string& symbol) const;

  void haltTrading();
  bool isHalted() const;

  const domain::RiskLimits& limits() const { return limits_; }

  std::uint64_t allowedCount() const { return allowed_.load(); }
  std::uint64_t deniedCount() const { return denied_.load(); }

 private:
  ExposureView exposureFor(const domain::PlaceOrder& place) const;

  domain::AdmissionDecision decide(const std::string& strategy_id,
                                   const domain::Intent& intent) const;

  void log(const std::string& strategy_id, const domain::Intent& intent,
           const domain::AdmissionDecision& decision);

  ReconciliationEngine& reconciler_;
  const OrderBook& book_;
  const PositionKeeper& positions_;
  const MarketDataFeed& market_data_;
  const domain::RiskLimits limits_;
  ClientOrderIdGenerator& ids_;
  const ITimeProvider& clock_;

  mutable std::mutex strategy_limits_mutex_;
  std::unordered_map<std::string, double> strategy_position_limits_;

  std::atomic<bool> halt_trading_{false};
  std::atomic<std::uint64_t> allowed_{0};
  std::atomic<std::uint64_t> denied_{0};
};

}  // namespace tradecore
