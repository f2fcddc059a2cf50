#pragma once

#include "tradecore/domain/order.hpp"

#include <atomic>
#include <cstdint>
#include <string>

namespace tradecore {

// -----------------------------------------------------------------------------
// ClientOrderIdGenerator
// -----------------------------------------------------------------------------
//
// @brief  Produces "<session_prefix>-<n>" client order ids, n starting at 1.
//
// @details
// The id is the idempotency key the exchange uses to recognize a retried
// submission, so it must be unique across restarts as well. The prefix is
// expected to carry a per-session component (the engine builds it from the
// configured session_prefix and the start time).
//
// Thread model:
//   next() is lock-free and safe from any thread. Only the AdmissionController
//   calls it, under its admission lock.
// -----------------------------------------------------------------------------
class ClientOrderIdGenerator {
 public:
  explicit ClientOrderIdGenerator(std::string session_prefix)
      : prefix_(std::move(session_prefix)) {}

  ClientOrderIdGenerator(const ClientOrderIdGenerator&) = delete;
  ClientOrderIdGenerator& operator=(const ClientOrderIdGenerator&) = delete;
  ClientOrderIdGenerator(ClientOrderIdGenerator&&) = delete;
  ClientOrderIdGenerator& operator=(ClientOrderIdGenerator&&) = delete;

  domain::ClientOrderId next() {
    std::uint64_t n = counter_.fetch_add(1, std::memory_order_relaxed);
    return prefix_ + "-" + std::to_string(n);
  }

  const std::string& prefix() const { return prefix_; }

 private:
  const std::string prefix_;
  std::atomic<std::uint64_t> counter_{1};
};

}  // namespace tradecore
