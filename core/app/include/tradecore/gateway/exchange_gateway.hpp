#pragma once

#include "tradecore/domain/order.hpp"
#include "tradecore/domain/order_status_report.hpp"
#include "tradecore/domain/position.hpp"
#include "tradecore/gateway/exchange_client.hpp"
#include "tradecore/gateway/gateway_results.hpp"
#include "tradecore/gateway/rate_limiter.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace tradecore {

class ExponentialBackoff;

// Retry policy for ExchangeGateway.
struct GatewaySettings {
  int max_attempts{5};
  std::chrono::milliseconds initial_backoff{100};
  std::chrono::milliseconds max_backoff{5000};
  double backoff_multiplier{2.0};
};

// -----------------------------------------------------------------------------
// ExchangeGateway: reliable request layer over IExchangeClient
// -----------------------------------------------------------------------------
//
// @brief  Turns single-shot client calls into final outcomes: rate limited,
//         retried with capped exponential backoff, and never double-submitting.
//
// @details
// Rate limiting:
//   Every round trip (submissions, cancels, queries, and the status queries
//   issued inside a retried submit or cancel, book snapshots) first takes a
//   RateLimiter token. The caller waits; nothing is dropped.
//
// Submission and ambiguity:
//   A Timeout, ConnectionError or ServerError leaves the outcome unknown.
//   The next attempt does NOT resubmit. It first queries the exchange by
//   client_order_id:
//     - found      the submission did land. Done: Accepted with the report
//                  (or Rejected if the exchange rejected it).
//     - not found  it never landed. Resubmit (same client id, so even a
//                  late arrival of the first request is deduplicated).
//     - failure    still unknown; back off and query again next attempt.
//   RateLimited is unambiguous (refused before processing) and is simply
//   retried.
//
// Exhaustion:
//   After max_attempts the call returns GatewayUnavailable. For submissions
//   this means "unknown", which the reconciliation engine records as the
//   Unknown order state.
//
// Cancel after ambiguity:
//   Same rule as submissions: the next attempt queries first.
//     - Cancelled   the earlier cancel landed. Done: Cancelled.
//     - Filled or Rejected   AlreadyTerminal with the report.
//     - not found   NotFound.
//     - working     the cancel never landed. Send it again.
//   If a re-sent cancel reports AlreadyTerminal with a Cancelled report, an
//   earlier cancel landed late: the result is Cancelled.
//
// Thread model:
//   Stateless apart from counters; safe to call from several routing workers
//   at once. Blocks the calling thread for rate limiting and backoff.
//
// Ownership:
//   Holds references to the client and limiter; both must outlive it.
// -----------------------------------------------------------------------------
class ExchangeGateway {
 public:
  // Injected so tests can record backoff delays instead of sleeping.
  using Sleeper = std::function<void(std::chrono::milliseconds)>;

  ExchangeGateway(IExchangeClient& client, RateLimiter& limiter,
                  GatewaySettings settings, Sleeper sleeper = {});

  ExchangeGateway(const ExchangeGateway&) = delete;
  ExchangeGateway& operator=(const ExchangeGateway&) = delete;

  SubmitResult submit(const domain::Order& order);

  CancelResult cancel(const domain::ClientOrderId& client_order_id);

  StatusResult queryStatus(const domain::ClientOrderId& client_order_id);

  // std::nullopt when the exchange stayed unreachable.
  std::optional<std::vector<domain::OrderStatusReport>> openOrders();

  std::optional<std::vector<domain::Position>> positions();

  std::optional<domain::BookSnapshot> bookSnapshot(const std::string& symbol);

  // Total number of failed round trips that were retried.
  std::uint64_t retryCount() const { return retries_.load(); }

  const GatewaySettings& settings() const { return settings_; }

 private:
  template <typename T, typename Call>
  std::optional<T> callWithRetries(const char* operation,
                                   const std::string& subject, Call call,
                                   int& attempts);

  // Logs the failure and, unless it was the last attempt, sleeps.
  void onFailure(const char* operation, const std::string& subject,
                 int attempt, const TransportFailure& failure,
                 ExponentialBackoff& backoff);

  IExchangeClient& client_;
  RateLimiter& limiter_;
  const GatewaySettings settings_;
  Sleeper sleeper_;
  std::atomic<std::uint64_t> retries_{0};
};

}  // namespace tradecore
