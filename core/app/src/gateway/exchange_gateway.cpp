#include "tradecore/gateway/exchange_gateway.hpp"

#include "tradecore/domain/to_string.hpp"
#include "tradecore/gateway/backoff.hpp"
#include "tradecore/ledger/order_state_machine.hpp"

#include <iostream>
#include <thread>
#include <utility>

namespace tradecore {

ExchangeGateway::ExchangeGateway(IExchangeClient& client, RateLimiter& limiter,
                                 GatewaySettings settings, Sleeper sleeper)
    : client_(client),
      limiter_(limiter),
      settings_(settings),
      sleeper_(std::move(sleeper)) {
  if (!sleeper_) {
    sleeper_ = [](std::chrono::milliseconds delay) {
      std::this_thread::sleep_for(delay);
    };
  }
}

// -----------------------------------------------------------------------------
// onFailure: log, count, back off
// -----------------------------------------------------------------------------
void ExchangeGateway::onFailure(const char* operation,
                                const std::string& subject, int attempt,
                                const TransportFailure& failure,
                                ExponentialBackoff& backoff) {
  if (attempt >= settings_.max_attempts) {
    std::cerr << "[ExchangeGateway] ERROR: " << operation << " " << subject
              << " failed on final attempt " << attempt << "/"
              << settings_.max_attempts << " (" << toString(failure.kind)
              << ": " << failure.detail << ")\n";
    return;
  }
  retries_.fetch_add(1);
  std::chrono::milliseconds delay = backoff.next();
  std::cerr << "[ExchangeGateway] WARNING: " << operation << " " << subject
            << " attempt " << attempt << "/" << settings_.max_attempts
            << " failed (" << toString(failure.kind) << ": "
            << failure.detail << "), retrying in " << delay.count()
            << "ms\n";
  sleeper_(delay);
}

// -----------------------------------------------------------------------------
// submit: query before resubmit after any ambiguous failure
// -----------------------------------------------------------------------------
SubmitResult ExchangeGateway::submit(const domain::Order& order) {
  const domain::ClientOrderId& id = order.client_order_id;
  ExponentialBackoff backoff(settings_.initial_backoff, settings_.max_backoff,
                             settings_.backoff_multiplier);

  SubmitResult result;
  result.client_order_id = id;
  bool ambiguous = false;

  for (int attempt = 1; attempt <= settings_.max_attempts; ++attempt) {
    if (ambiguous) {
      limiter_.acquire();
      ++result.attempts;
      auto reply = client_.queryOrder(id);
      if (const auto* failure = std::get_if<TransportFailure>(&reply)) {
        onFailure("submit-query", id, attempt, *failure, backoff);
        continue;
      }
      const auto& found =
          std::get<std::optional<domain::OrderStatusReport>>(reply);
      if (found) {
        std::cout << "[ExchangeGateway] submit " << id
                  << " resolved by status query: exchange has it as "
                  << domain::toString(found->state) << "\n";
        result.report = *found;
        result.exchange_order_id = found->exchange_order_id;
        if (found->state == domain::OrderState::Rejected) {
          result.outcome = SubmitOutcome::Rejected;
          result.reason = found->reason;
        } else {
          result.outcome = SubmitOutcome::Accepted;
        }
        return result;
      }
      // The earlier request never reached the exchange.
      ambiguous = false;
    }

    limiter_.acquire();
    ++result.attempts;
    auto reply = client_.submitOrder(order);
    if (const auto* failure = std::get_if<TransportFailure>(&reply)) {
      ambiguous = ambiguous || isAmbiguous(*failure);
      onFailure("submit", id, attempt, *failure, backoff);
      continue;
    }

    const SubmitAck& ack = std::get<SubmitAck>(reply);
    if (ack.accepted) {
      result.outcome = SubmitOutcome::Accepted;
      result.exchange_order_id = ack.exchange_order_id;
    } else {
      result.outcome = SubmitOutcome::Rejected;
      result.reason = ack.reject_reason;
    }
    return result;
  }

  result.outcome = SubmitOutcome::GatewayUnavailable;
  result.reason = "retries exhausted after " +
                  std::to_string(result.attempts) + " round trips";
  return result;
}

// -----------------------------------------------------------------------------
// cancel: query before re-cancelling after any ambiguous failure
// -----------------------------------------------------------------------------
CancelResult ExchangeGateway::cancel(
    const domain::ClientOrderId& client_order_id) {
  ExponentialBackoff backoff(settings_.initial_backoff, settings_.max_backoff,
                             settings_.backoff_multiplier);

  CancelResult result;
  result.client_order_id = client_order_id;
  bool query_first = false;
  bool ambiguous = false;

  for (int attempt = 1; attempt <= settings_.max_attempts; ++attempt) {
    if (query_first) {
      limiter_.acquire();
      ++result.attempts;
      auto reply = client_.queryOrder(client_order_id);
      if (const auto* failure = std::get_if<TransportFailure>(&reply)) {
        onFailure("cancel-query", client_order_id, attempt, *failure, backoff);
        continue;
      }
      const auto& found =
          std::get<std::optional<domain::OrderStatusReport>>(reply);
      if (!found) {
        result.outcome = CancelOutcome::NotFound;
        return result;
      }
      if (OrderStateMachine::isTerminal(found->state)) {
        std::cout << "[ExchangeGateway] cancel " << client_order_id
                  << " resolved by status query: exchange has it as "
                  << domain::toString(found->state) << "\n";
        result.report = *found;
        result.outcome = found->state == domain::OrderState::Cancelled
                             ? CancelOutcome::Cancelled
                             : CancelOutcome::AlreadyTerminal;
        return result;
      }
      // Still working: the earlier cancel did not land.
      query_first = false;
    }

    limiter_.acquire();
    ++result.attempts;
    auto reply = client_.cancelOrder(client_order_id);
    if (const auto* failure = std::get_if<TransportFailure>(&reply)) {
      if (isAmbiguous(*failure)) {
        query_first = true;
        ambiguous = true;
      }
      onFailure("cancel", client_order_id, attempt, *failure, backoff);
      continue;
    }

    const CancelAck& ack = std::get<CancelAck>(reply);
    result.report = ack.report;
    switch (ack.outcome) {
      case CancelAckOutcome::Cancelled:
        result.outcome = CancelOutcome::Cancelled;
        break;
      case CancelAckOutcome::NotFound:
        result.outcome = CancelOutcome::NotFound;
        break;
      case CancelAckOutcome::AlreadyTerminal:
        if (ambiguous && ack.report &&
            ack.report->state == domain::OrderState::Cancelled) {
          // An earlier, timed-out cancel landed after our status query.
          result.outcome = CancelOutcome::Cancelled;
        } else {
          result.outcome = CancelOutcome::AlreadyTerminal;
        }
        break;
    }
    return result;
  }

  result.outcome = CancelOutcome::GatewayUnavailable;
  result.reason = "retries exhausted";
  return result;
}

// -----------------------------------------------------------------------------
// callWithRetries: shared loop for read-only requests
// -----------------------------------------------------------------------------
template <typename T, typename Call>
std::optional<T> ExchangeGateway::callWithRetries(const char* operation,
                                                  const std::string& subject,
                                                  Call call, int& attempts) {
  ExponentialBackoff backoff(settings_.initial_backoff, settings_.max_backoff,
                             settings_.backoff_multiplier);
  for (int attempt = 1; attempt <= settings_.max_attempts; ++attempt) {
    limiter_.acquire();
    ++attempts;
    ClientReply<T> reply = call();
    if (const auto* failure = std::get_if<TransportFailure>(&reply)) {
      onFailure(operation, subject, attempt, *failure, backoff);
      continue;
    }
    return std::get<T>(std::move(reply));
  }
  return std::nullopt;
}

StatusResult ExchangeGateway::queryStatus(
    const domain::ClientOrderId& client_order_id) {
  StatusResult result;
  result.client_order_id = client_order_id;

  auto reply = callWithRetries<std::optional<domain::OrderStatusReport>>(
      "query", client_order_id,
      [this, &client_order_id] { return client_.queryOrder(client_order_id); },
      result.attempts);

  if (!reply) {
    result.outcome = StatusOutcome::GatewayUnavailable;
    result.reason = "retries exhausted";
  } else if (!*reply) {
    result.outcome = StatusOutcome::NotFound;
  } else {
    result.outcome = StatusOutcome::Found;
    result.report = std::move(**reply);
  }
  return result;
}

std::optional<std::vector<domain::OrderStatusReport>>
ExchangeGateway::openOrders() {
  int attempts = 0;
  return callWithRetries<std::vector<domain::OrderStatusReport>>(
      "open-orders", "*", [this] { return client_.openOrders(); }, attempts);
}

std::optional<std::vector<domain::Position>> ExchangeGateway::positions() {
  int attempts = 0;
  return callWithRetries<std::vector<domain::Position>>(
      "positions", "*", [this] { return client_.positions(); }, attempts);
}

std::optional<domain::BookSnapshot> ExchangeGateway::bookSnapshot(
    const std::string& symbol) {
  int attempts = 0;
  return callWithRetries<domain::BookSnapshot>(
      "book", symbol, [this, &symbol] { return client_.bookSnapshot(symbol); },
      attempts);
}

}  // namespace tradecore
