#include "escrow/network/ipc_server.hpp"
#include "escrow/network/json_codec.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <type_traits>
#include <utility>

namespace escrow {

// -----------------------------------------------------------------------------
// Constructor / destructor
// -----------------------------------------------------------------------------
IpcServer::IpcServer(CommandHandler command_handler, std::string cmd_endpoint,
                     std::string pub_endpoint)
    : command_handler_(std::move(command_handler)),
      cmd_endpoint_(std::move(cmd_endpoint)),
      pub_endpoint_(std::move(pub_endpoint)) {}

IpcServer::~IpcServer() { stop(); }

// -----------------------------------------------------------------------------
// start(): create sockets and spawn worker thread
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

// -----------------------------------------------------------------------------
// stop(): signal and join
// -----------------------------------------------------------------------------
void IpcServer::stop() {
  if (!running_.exchange(false)) {
    if (thread_.joinable()) {
      thread_.join();
    }
    return;
  }

  if (thread_.joinable()) {
    thread_.join();
  }

  cmd_socket_.reset();
  pub_socket_.reset();
  context_.reset();

  std::cout << "[IpcServer] stopped.\n";
}

void IpcServer::pushTelemetry(Event event) {
  telemetry_queue_.push(std::move(event));
}

// -----------------------------------------------------------------------------
// run(): combined poll/drain loop
// -----------------------------------------------------------------------------
void IpcServer::run() {
  while (running_.load()) {
    processTelemetry();
    processCommands();
  }

  // Final drain before the sockets close.
  processTelemetry();
}

void IpcServer::processTelemetry() {
  while (auto maybe_event = telemetry_queue_.try_pop()) {
    const std::string line = formatTelemetry(*maybe_event);
    zmq::message_t msg(line.data(), line.size());
    if (!pub_socket_->send(msg, zmq::send_flags::dontwait)) {
      std::cerr << "[IpcServer] WARNING: telemetry dropped (PUB would "
                   "block)\n";
    }
  }
}

void IpcServer::processCommands() {
  zmq::message_t request;
  zmq::recv_result_t result;

  try {
    result = cmd_socket_->recv(request, zmq::recv_flags::none);
  } catch (const zmq::error_t& e) {
    if (e.num() == EINTR) {
      return;
    }
    throw;
  }

  if (!result.has_value()) {
    return;
  }

  std::string cmd(static_cast<const char*>(request.data()), request.size());
  std::string response = command_handler_(cmd);

  zmq::message_t reply(response.data(), response.size());
  cmd_socket_->send(reply, zmq::send_flags::none);
}

// -----------------------------------------------------------------------------
// formatTelemetry(): one JSON object per event type
// -----------------------------------------------------------------------------
std::string IpcServer::formatTelemetry(const Event& event) {
  return std::visit(
      [](const auto& e) -> std::string {
        using T = std::decay_t<decltype(e)>;
        nlohmann::json j;

        if constexpr (std::is_same_v<T, EscrowUpdateEvent>) {
          j["type"] = "escrow_update";
          j["escrow"] = toJson(e.escrow);
          j["previous_status"] = domain::toString(e.previous_status);
          j["timestamp_ms"] = e.timestamp_ms;
        } else if constexpr (std::is_same_v<T, SettlementEvent>) {
          j["type"] = "settlement";
          j["plan"] = toJson(e.plan);
          j["timestamp_ms"] = e.timestamp_ms;
        } else if constexpr (std::is_same_v<T, GovernanceUpdateEvent>) {
          j["type"] = "governance_update";
          j["change"] = e.change;
          j["governance"] = toJson(e.config);
        } else if constexpr (std::is_same_v<T, DisbursementPendingEvent>) {
          j["type"] = "disbursement_pending";
          j["plan"] = toJson(e.plan);
          j["failed_leg"] = domain::toString(e.failed_leg);
          j["reason"] = e.reason;
          j["timestamp_ms"] = e.timestamp_ms;
        }

        j["sequence_id"] = e.sequence_id;
        return j.dump();
      },
      event);
}

}  // namespace escrow
