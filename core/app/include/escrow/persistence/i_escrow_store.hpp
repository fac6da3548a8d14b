#pragma once

#include "escrow/domain/disbursement.hpp"
#include "escrow/domain/escrow.hpp"
#include "escrow/domain/governance_config.hpp"
#include "escrow/persistence/escrow_record_book.hpp"

#include <cstdint>
#include <mutex>
#include <optional>
#include <vector>

namespace escrow {

// -----------------------------------------------------------------------------
// IEscrowStore — persisted escrow and governance records
// -----------------------------------------------------------------------------
//
// @brief  Abstracts where escrow state lives between runs.
//
// @details
// Used by EscrowEngine::start() during its synchronization gate:
//   1. loadGovernance() → Governance::hydrate() (if a record exists)
//   2. lastRevision()   → EscrowRegistry::advanceSequencePast()
//   3. loadEscrows()    → EscrowRegistry::hydrateEscrow() for each
//   4. loadPending()    → EscrowRegistry::hydratePending() for each
// After the gate, the engine writes every EscrowUpdateEvent,
// DisbursementPendingEvent and GovernanceUpdateEvent through.
//
// Ordering:
//   saveEscrow() and savePending() carry the event's sequence_id as a
//   revision and are ignored when an equal or newer revision of the same
//   record is already stored (see EscrowRecordBook). They return whether
//   the write was applied. saveGovernance() never moves the version
//   backwards. Revisions survive restarts, and the registry's sequence is
//   advanced past lastRevision() before any new event is produced.
//
// Implementations must be safe to call from any thread, since updates
// are written from whichever thread ran the operation.
// -----------------------------------------------------------------------------
class IEscrowStore {
 public:
  virtual ~IEscrowStore() = default;

  virtual bool saveEscrow(const domain::Escrow& escrow,
                          std::uint64_t revision) = 0;

  // All escrows, in id order.
  virtual std::vector<domain::Escrow> loadEscrows() = 0;

  virtual bool savePending(const domain::DisbursementPlan& plan,
                           std::uint64_t revision) = 0;

  // Pending disbursements of escrows not yet settled, in escrow id order.
  virtual std::vector<domain::DisbursementPlan> loadPending() = 0;

  virtual void saveGovernance(const domain::GovernanceConfig& config) = 0;

  // nullopt when nothing was ever saved.
  virtual std::optional<domain::GovernanceConfig> loadGovernance() = 0;

  // Highest revision ever accepted. 0 for an empty store.
  virtual std::uint64_t lastRevision() = 0;
};

// -----------------------------------------------------------------------------
// InMemoryEscrowStore — process-local store for simulations and tests
// -----------------------------------------------------------------------------
class InMemoryEscrowStore : public IEscrowStore {
 public:
  bool saveEscrow(const domain::Escrow& escrow,
                  std::uint64_t revision) override {
    std::lock_guard lock(mutex_);
    return book_.applyEscrow(escrow, revision);
  }

  std::vector<domain::Escrow> loadEscrows() override {
    std::lock_guard lock(mutex_);
    return book_.escrows();
  }

  bool savePending(const domain::DisbursementPlan& plan,
                   std::uint64_t revision) override {
    std::lock_guard lock(mutex_);
    return book_.applyPending(plan, revision);
  }

  std::vector<domain::DisbursementPlan> loadPending() override {
    std::lock_guard lock(mutex_);
    return book_.pending();
  }

  void saveGovernance(const domain::GovernanceConfig& config) override {
    std::lock_guard lock(mutex_);
    book_.applyGovernance(config);
  }

  std::optional<domain::GovernanceConfig> loadGovernance() override {
    std::lock_guard lock(mutex_);
    return book_.governance();
  }

  std::uint64_t lastRevision() override {
    std::lock_guard lock(mutex_);
    return book_.lastRevision();
  }

 private:
  std::mutex mutex_;
  EscrowRecordBook book_;
};

}  // namespace escrow
