#pragma once

#include "tradecore/concurrent/thread_safe_queue.hpp"
#include "tradecore/events/event.hpp"

#include <zmq.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace tradecore {

// -----------------------------------------------------------------------------
// IpcServer: operator command channel and telemetry stream
// -----------------------------------------------------------------------------
//
// @brief  Serves text commands on a ZeroMQ REP socket and publishes JSON
//         telemetry on a PUB socket, from one background thread.
//
// @details
// Commands:
//   Each request is one text frame (e.g. "STATUS", "RESOLVE s1-42"). It is
//   passed to the CommandHandler and its return value is sent back as the
//   reply. TradingEngine::executeCommand() is the handler in production.
//
// Telemetry:
//   pushTelemetry() enqueues an event from any thread. The worker drains the
//   queue between command polls and publishes one JSON object per event:
//     {"type":"order_update", "order":{...}, "previous_state":"open"}
//     {"type":"position_update", "symbol", "net_quantity", ...}
//     {"type":"alert", "kind", "client_order_id", "detail"}
//     {"type":"intent_decision", "strategy_id", "intent", "allowed",
//      "reason", "detail", "client_order_id"}
//   Other event types are not published.
//
// Thread model:
//   Sockets are created in start() and used only by the worker thread.
//   stop() joins the worker after a final telemetry drain.
//
// Ownership:
//   Owned by TradingEngine via std::unique_ptr. Owns its zmq context,
//   sockets and telemetry queue.
// -----------------------------------------------------------------------------
class IpcServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  IpcServer(CommandHandler command_handler, std::string cmd_endpoint,
            std::string pub_endpoint);

  ~IpcServer();

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;
  IpcServer(IpcServer&&) = delete;
  IpcServer& operator=(IpcServer&&) = delete;

  void start();
  void stop();

  void pushTelemetry(Event event);

  // JSON text published for an event, or nullopt if it is not telemetry.
  static std::optional<std::string> formatTelemetry(const Event& event);

  std::uint64_t publishedCount() const { return published_.load(); }

 private:
  static constexpr int kPollTimeoutMs = 50;

  void run();
  void processTelemetry();
  void processCommands();

  CommandHandler command_handler_;
  std::string cmd_endpoint_;
  std::string pub_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> cmd_socket_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  ThreadSafeQueue<Event> telemetry_queue_;
  std::thread thread_;
  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> published_{0};
};

}  // namespace tradecore
