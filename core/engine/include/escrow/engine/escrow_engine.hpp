#pragma once

#include "escrow/config/engine_config.hpp"
#include "escrow/eventbus/event_bus.hpp"
#include "escrow/governance/governance.hpp"
#include "escrow/network/ipc_server.hpp"
#include "escrow/persistence/i_escrow_store.hpp"
#include "escrow/registry/escrow_registry.hpp"
#include "escrow/time/i_time_provider.hpp"
#include "escrow/vault/i_collateral_vault.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <memory>
#include <string>
#include <vector>

namespace escrow {

// -----------------------------------------------------------------------------
// EscrowEngine — top-level orchestrator
// -----------------------------------------------------------------------------
//
// @brief  Wires Governance, EscrowRegistry, the vault, the optional store
//         and the IPC server together, and turns JSON commands into
//         registry and governance calls.
//
// @details
// Construction bootstraps Governance from the EngineConfig (this is
// initialize_governance). start() then runs the synchronization gate:
//
//   1. Hydrate governance, escrows and pending disbursements from the
//      IEscrowStore (if given), and move the registry's event sequence
//      past the store's last revision. Done on the first start only.
//   2. Reconcile custody: every escrow must agree with the vault's
//      lockedBalance() (EscrowRegistry::custodyMismatches()). A vault that
//      lost custody of a funded escrow stops the start-up here instead of
//      failing later at settlement.
//   3. Subscribe store write-through for escrow updates, pending
//      disbursements and governance updates, keyed by sequence_id.
//   4. Start the IpcServer (if enabled) and bridge telemetry events to it.
//
// Commands:
//   executeCommand() accepts one JSON object {"op": ..., "caller": ...}
//   and always returns one JSON object. EscrowError becomes
//   {"status":"error","error":<code>,"message":...,"retryable":...};
//   malformed JSON or a missing or mistyped field is InvalidParameters.
//   A command without "now" is stamped from the injected ITimeProvider.
//
// Thread model:
//   executeCommand() is safe from any thread (the IPC thread and tests
//   call it concurrently); all state lives behind the registry's and
//   governance's own locks. start()/stop() from the owning thread only.
//
// Ownership:
//   Owns the EventBus, Governance, EscrowRegistry and IpcServer. The
//   vault, clock and store are borrowed and must outlive the engine.
// -----------------------------------------------------------------------------
class EscrowEngine {
 public:
  // @throws EscrowError if the governance bootstrap values are invalid.
  EscrowEngine(EngineConfig config, ICollateralVault& vault,
               ITimeProvider& clock);

  ~EscrowEngine();

  EscrowEngine(const EscrowEngine&) = delete;
  EscrowEngine& operator=(const EscrowEngine&) = delete;
  EscrowEngine(EscrowEngine&&) = delete;
  EscrowEngine& operator=(EscrowEngine&&) = delete;

  // -------------------------------------------------------------------------
  // start(store)
  // -------------------------------------------------------------------------
  // @param  store  Optional persisted state. nullptr runs purely in memory.
  //
  // @throws EscrowError(InvalidParameters) if a persisted record is
  //         rejected during hydration.
  // @throws EscrowError(InvalidState) if escrow and vault custody
  //         disagree. The store is not attached and the engine does not
  //         run; discard it.
  // @throws zmq::error_t if the IPC endpoints cannot be bound.
  // -------------------------------------------------------------------------
  void start(IEscrowStore* store = nullptr);

  // Stops IPC and detaches the store. Idempotent.
  void stop();

  bool isRunning() const { return running_.load(); }

  std::string executeCommand(const std::string& cmd);

  EventBus& eventBus() { return bus_; }
  Governance& governance() { return governance_; }
  EscrowRegistry& registry() { return registry_; }
  const EngineConfig& config() const { return config_; }

 private:
  nlohmann::json dispatch(const nlohmann::json& request);

  domain::TimestampMs nowFrom(const nlohmann::json& request) const;

  EngineConfig config_;
  ICollateralVault& vault_;
  ITimeProvider& clock_;

  EventBus bus_;
  Governance governance_;
  EscrowRegistry registry_;

  IEscrowStore* store_{nullptr};
  bool hydrated_{false};
  std::vector<EventBus::SubscriptionId> subscriptions_;
  std::unique_ptr<IpcServer> ipc_server_;
  std::atomic<bool> running_{false};
};

}  // namespace escrow
