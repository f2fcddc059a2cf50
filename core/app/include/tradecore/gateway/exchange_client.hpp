#pragma once

#include "tradecore/domain/book_snapshot.hpp"
#include "tradecore/domain/order.hpp"
#include "tradecore/domain/order_status_report.hpp"
#include "tradecore/domain/position.hpp"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace tradecore {

// -----------------------------------------------------------------------------
// Transport failures
// -----------------------------------------------------------------------------
//
// Timeout:         no reply in time. The request may or may not have been
//                  processed by the exchange (ambiguous).
// ConnectionError: the request could not be delivered or the reply was lost
//                  mid-flight (ambiguous).
// ServerError:     the exchange answered with a 5xx-class error. Treated as
//                  ambiguous too: some exchanges process the order and still
//                  fail the response.
// RateLimited:     the exchange refused the request before processing it.
//                  Safe to resend as is.
// -----------------------------------------------------------------------------
enum class TransportFailureKind {
  Timeout,
  ConnectionError,
  ServerError,
  RateLimited,
};

struct TransportFailure {
  TransportFailureKind kind{TransportFailureKind::Timeout};
  std::string detail;
};

inline bool isAmbiguous(const TransportFailure& failure) {
  return failure.kind != TransportFailureKind::RateLimited;
}

inline const char* toString(TransportFailureKind kind) {
  switch (kind) {
    case TransportFailureKind::Timeout:         return "Timeout";
    case TransportFailureKind::ConnectionError: return "ConnectionError";
    case TransportFailureKind::ServerError:     return "ServerError";
    case TransportFailureKind::RateLimited:     return "RateLimited";
  }
  return "Invalid";
}

// Either the exchange's answer or the reason there is none.
template <typename T>
using ClientReply = std::variant<T, TransportFailure>;

// Exchange answer to a submission. A resubmission of a client id the
// exchange already knows returns the original acceptance.
struct SubmitAck {
  bool accepted{false};
  domain::ExchangeOrderId exchange_order_id;
  std::string reject_reason;
};

enum class CancelAckOutcome {
  Cancelled,
  NotFound,
  AlreadyTerminal,
};

struct CancelAck {
  CancelAckOutcome outcome{CancelAckOutcome::NotFound};
  std::optional<domain::OrderStatusReport> report;
};

// -----------------------------------------------------------------------------
// IExchangeClient: capability interface to the exchange's REST API
// -----------------------------------------------------------------------------
//
// @brief  One call, one round trip. No retries, no rate limiting: that is the
//         ExchangeGateway's job. Implementations only translate between the
//         domain types and the wire.
//
// @details
// submitOrder   sends client_order_id as the idempotency key.
// queryOrder    looks an order up by client id; std::nullopt means the
//               exchange has no such order.
// openOrders    every non-terminal order of this account.
// positions     account positions, read once at startup.
// bookSnapshot  full level-3 book of a symbol, used to (re)build the local
//               MarketOrderBook.
//
// Implementations:
//   SimulatedExchangeClient  in-memory exchange for simulation and tests.
//   ZmqExchangeClient        JSON over a ZeroMQ REQ socket to an exchange
//                            adapter process.
//
// Thread model:
//   Implementations must tolerate concurrent calls from several routing
//   workers.
// -----------------------------------------------------------------------------
class IExchangeClient {
 public:
  virtual ~IExchangeClient() = default;

  virtual ClientReply<SubmitAck> submitOrder(const domain::Order& order) = 0;

  virtual ClientReply<CancelAck> cancelOrder(
      const domain::ClientOrderId& client_order_id) = 0;

  virtual ClientReply<std::optional<domain::OrderStatusReport>> queryOrder(
      const domain::ClientOrderId& client_order_id) = 0;

  virtual ClientReply<std::vector<domain::OrderStatusReport>> openOrders() = 0;

  virtual ClientReply<std::vector<domain::Position>> positions() = 0;

  virtual ClientReply<domain::BookSnapshot> bookSnapshot(
      const std::string& symbol) = 0;
};

}  // namespace tradecore
