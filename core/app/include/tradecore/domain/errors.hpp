#pragma once

namespace tradecore {
namespace domain {

// -----------------------------------------------------------------------------
// ErrorKind: operational error taxonomy
// -----------------------------------------------------------------------------
//
// NetworkTransient:    a single request failed at transport level; the
//                      gateway retries it with backoff.
// GatewayUnavailable:  retries exhausted. The order becomes Unknown and an
//                      alert is raised.
// Rejected:            the exchange refused the order. Terminal, reported to
//                      the strategy through the order update stream.
// DataIntegrityError:  the exchange reported something impossible for one
//                      order (conflicting terminal states, overfill). The
//                      order is quarantined and an alert is raised.
// RiskDenied:          admission refused an intent. Normal control flow.
//
// Only DataIntegrityError and GatewayUnavailable ever reach AlertEvent.
// -----------------------------------------------------------------------------
enum class ErrorKind {
  NetworkTransient,
  GatewayUnavailable,
  Rejected,
  DataIntegrityError,
  RiskDenied,
};

}  // namespace domain
}  // namespace tradecore
