#include "tradecore/feed/feed_gateway.hpp"

#include "tradecore/feed/feed_decoder.hpp"
#include "tradecore/time/time_utils.hpp"

#include <iostream>
#include <utility>

namespace tradecore {

// -----------------------------------------------------------------------------
// Constructor: SUB socket with receive timeout, accept-all until narrowed
// -----------------------------------------------------------------------------
FeedGateway::FeedGateway(const std::string& endpoint, EventSink market_sink,
                         EventSink order_sink,
                         SimulationTimeProvider* sim_clock)
    : market_sink_(std::move(market_sink)),
      order_sink_(std::move(order_sink)),
      sim_clock_(sim_clock) {
  socket_.set(zmq::sockopt::subscribe, "");
  socket_.set(zmq::sockopt::rcvtimeo, kRecvTimeoutMs);
  socket_.set(zmq::sockopt::linger, 0);
  socket_.connect(endpoint);
}

// -----------------------------------------------------------------------------
// subscribe(): replace the catch-all filter with explicit topics
// -----------------------------------------------------------------------------
void FeedGateway::subscribe(const std::string& symbol) {
  if (subscribed_all_) {
    socket_.set(zmq::sockopt::unsubscribe, "");
    socket_.set(zmq::sockopt::subscribe, "heartbeat");
    socket_.set(zmq::sockopt::subscribe, "orders");
    subscribed_all_ = false;
  }
  socket_.set(zmq::sockopt::subscribe, symbol);
  std::cout << "[FeedGateway] subscribed to " << symbol << "\n";
}

// -----------------------------------------------------------------------------
// run(): blocking recv loop
// -----------------------------------------------------------------------------
void FeedGateway::run() {
  while (running_.load()) {
    zmq::message_t frame;
    zmq::recv_result_t result;
    try {
      result = socket_.recv(frame, zmq::recv_flags::none);
    } catch (const zmq::error_t& e) {
      if (e.num() == EINTR) {
        continue;
      }
      std::cerr << "[FeedGateway] recv error: " << e.what() << "\n";
      break;
    }
    if (!result.has_value()) {
      continue;  // timeout: re-check running_
    }

    // Drain the multipart message; the payload is the last frame.
    std::string payload = frame.to_string();
    while (frame.more()) {
      if (!socket_.recv(frame, zmq::recv_flags::none).has_value()) {
        break;
      }
      payload = frame.to_string();
    }

    dispatch(payload);
  }
}

void FeedGateway::stop() { running_.store(false); }

// -----------------------------------------------------------------------------
// dispatch(): decode, advance the simulated clock, route to a sink
// -----------------------------------------------------------------------------
void FeedGateway::dispatch(const std::string& payload) {
  std::optional<FeedMessage> message = FeedDecoder::decode(payload);
  if (!message) {
    decode_errors_.fetch_add(1);
    return;
  }
  messages_.fetch_add(1);

  if (auto* md = std::get_if<MarketEvent>(&*message)) {
    if (sim_clock_) {
      sim_clock_->advance_time(timestamp_to_ms(md->timestamp));
    }
    market_sink_(std::move(*md));
  } else if (auto* hb = std::get_if<HeartbeatEvent>(&*message)) {
    if (sim_clock_) {
      sim_clock_->advance_time(timestamp_to_ms(hb->timestamp));
    }
    market_sink_(std::move(*hb));
  } else if (auto* ex = std::get_if<ExchangeEvent>(&*message)) {
    if (sim_clock_ && ex->timestamp != Timestamp{}) {
      sim_clock_->advance_time(timestamp_to_ms(ex->timestamp));
    }
    order_sink_(std::move(*ex));
  } else if (auto* book = std::get_if<BookEvent>(&*message)) {
    if (sim_clock_ && book->timestamp != Timestamp{}) {
      sim_clock_->advance_time(timestamp_to_ms(book->timestamp));
    }
    market_sink_(std::move(*book));
  } else if (auto* snap = std::get_if<BookSnapshotEvent>(&*message)) {
    market_sink_(std::move(*snap));
  }
}

}  // namespace tradecore
