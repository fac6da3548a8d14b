#pragma once

#include "escrow/concurrent/thread_safe_queue.hpp"
#include "escrow/events/event.hpp"

#include <zmq.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace escrow {

// -----------------------------------------------------------------------------
// IpcServer — ZeroMQ command and telemetry gateway
// -----------------------------------------------------------------------------
//
// @brief  Runs one worker thread that answers JSON commands on a REP socket
//         and broadcasts JSON telemetry on a PUB socket.
//
// @details
//   1. REP socket (cmd_endpoint): each request is handed to the command
//      handler (bound to EscrowEngine::executeCommand()) and its JSON
//      reply is sent back. ZMQ_RCVTIMEO keeps the loop from blocking so the
//      same thread can drain telemetry between requests.
//
//   2. PUB socket (pub_endpoint): EscrowUpdateEvent, SettlementEvent,
//      GovernanceUpdateEvent and DisbursementPendingEvent are queued by
//      pushTelemetry() from whatever thread ran the escrow operation, then
//      serialized and published here.
//
// Thread model:
//   start()/stop() from the owning thread (EscrowEngine). pushTelemetry()
//   from any thread. Commands run on the IPC thread; EscrowEngine and the
//   registry are thread-safe, so that is the only requirement.
//
// Ownership:
//   Owned by EscrowEngine via std::unique_ptr. Owns the ZMQ context, both
//   sockets, the telemetry queue and the worker thread.
// -----------------------------------------------------------------------------
class IpcServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  // No sockets are opened until start().
  explicit IpcServer(CommandHandler command_handler,
                     std::string cmd_endpoint = "tcp://127.0.0.1:5556",
                     std::string pub_endpoint = "tcp://127.0.0.1:5557");

  ~IpcServer();

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;
  IpcServer(IpcServer&&) = delete;
  IpcServer& operator=(IpcServer&&) = delete;

  // Binds both sockets and spawns the worker. No-op when already running.
  // @throws zmq::error_t if an endpoint cannot be bound.
  void start();

  // Stops the worker within kPollTimeoutMs, publishes what is still queued
  // and closes the sockets. Idempotent.
  void stop();

  bool isRunning() const { return running_.load(); }

  void pushTelemetry(Event event);

  // -------------------------------------------------------------------------
  // formatTelemetry(event)
  // -------------------------------------------------------------------------
  // @return One JSON line with a "type" of escrow_update, settlement,
  //         governance_update or disbursement_pending.
  // -------------------------------------------------------------------------
  static std::string formatTelemetry(const Event& event);

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
};

}  // namespace escrow
