#include "tradecore/network/ipc_server.hpp"

#include "tradecore/domain/to_string.hpp"
#include "tradecore/gateway/wire_codec.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <utility>

namespace tradecore {

IpcServer::IpcServer(CommandHandler command_handler, std::string cmd_endpoint,
                     std::string pub_endpoint)
    : command_handler_(std::move(command_handler)),
      cmd_endpoint_(std::move(cmd_endpoint)),
      pub_endpoint_(std::move(pub_endpoint)) {}

IpcServer::~IpcServer() { stop(); }

// -----------------------------------------------------------------------------
// start(): bind REP and PUB, spawn the worker
// -----------------------------------------------------------------------------
void IpcServer::start() {
  if (running_.load()) {
    return;
  }

  context_ = std::make_unique<zmq::context_t>(1);
  cmd_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::rep);
  pub_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::pub);

  cmd_socket_->set(zmq::sockopt::rcvtimeo, kPollTimeoutMs);
  cmd_socket_->set(zmq::sockopt::linger, 0);
  pub_socket_->set(zmq::sockopt::linger, 0);
  cmd_socket_->bind(cmd_endpoint_);
  pub_socket_->bind(pub_endpoint_);

  running_.store(true);
  thread_ = std::thread([this] { run(); });

  std::cout << "[IpcServer] started. CMD=" << cmd_endpoint_
            << " PUB=" << pub_endpoint_ << "\n";
}

void IpcServer::stop() {
  if (!running_.exchange(false)) {
    return;
  }
  if (thread_.joinable()) {
    thread_.join();
  }
  cmd_socket_.reset();
  pub_socket_.reset();
  context_.reset();
  std::cout << "[IpcServer] stopped\n";
}

void IpcServer::pushTelemetry(Event event) {
  telemetry_queue_.push(std::move(event));
}

void IpcServer::run() {
  while (running_.load()) {
    processTelemetry();
    processCommands();
  }
  processTelemetry();
}

void IpcServer::processTelemetry() {
  while (auto event = telemetry_queue_.try_pop()) {
    std::optional<std::string> text = formatTelemetry(*event);
    if (!text) {
      continue;
    }
    zmq::message_t msg(text->data(), text->size());
    if (pub_socket_->send(msg, zmq::send_flags::dontwait)) {
      published_.fetch_add(1);
    }
  }
}

// -----------------------------------------------------------------------------
// processCommands(): one REP round trip, or a timeout
// -----------------------------------------------------------------------------
void IpcServer::processCommands() {
  zmq::message_t request;
  zmq::recv_result_t result;
  try {
    result = cmd_socket_->recv(request, zmq::recv_flags::none);
  } catch (const zmq::error_t& e) {
    if (e.num() == EINTR) {
      return;
    }
    std::cerr << "[IpcServer] ERROR: command recv failed: " << e.what()
              << "\n";
    running_.store(false);
    return;
  }
  if (!result.has_value()) {
    return;
  }

  std::string response = command_handler_(request.to_string());
  zmq::message_t reply(response.data(), response.size());
  cmd_socket_->send(reply, zmq::send_flags::none);
}

// -----------------------------------------------------------------------------
// formatTelemetry(): event -> JSON line
// -----------------------------------------------------------------------------
std::optional<std::string> IpcServer::formatTelemetry(const Event& event) {
  nlohmann::json j;

  if (const auto* e = std::get_if<OrderUpdateEvent>(&event)) {
    j["type"] = "order_update";
    j["order"] = wire::orderToJson(e->order);
    j["previous_state"] = wire::toWire(e->previous_state);
  } else if (const auto* e = std::get_if<PositionUpdateEvent>(&event)) {
    j = wire::positionToJson(e->position);
    j["type"] = "position_update";
  } else if (const auto* e = std::get_if<AlertEvent>(&event)) {
    j["type"] = "alert";
    j["kind"] = domain::toString(e->kind);
    j["client_order_id"] = e->client_order_id;
    j["detail"] = e->detail;
  } else if (const auto* e = std::get_if<IntentDecisionEvent>(&event)) {
    j["type"] = "intent_decision";
    j["strategy_id"] = e->strategy_id;
    j["intent"] = domain::describe(e->intent);
    j["allowed"] = e->decision.allowed;
    j["reason"] = domain::toString(e->decision.reason);
    j["detail"] = e->decision.detail;
    j["client_order_id"] = e->decision.client_order_id;
  } else {
    return std::nullopt;
  }

  return j.dump();
}

}  // namespace tradecore
