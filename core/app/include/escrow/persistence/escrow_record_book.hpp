#pragma once

#include "escrow/domain/disbursement.hpp"
#include "escrow/domain/escrow.hpp"
#include "escrow/domain/governance_config.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <vector>

namespace escrow {

// -----------------------------------------------------------------------------
// EscrowRecordBook — revision-ordered escrow records
// -----------------------------------------------------------------------------
//
// @brief  The record-keeping rules shared by every IEscrowStore: which
//         write wins when saves for one escrow arrive out of order.
//
// @details
// What:
//   One Record per escrow id: the latest escrow snapshot, the pending
//   disbursement (if any), and the revision each was written at. Plus the
//   single governance record and the highest revision ever accepted.
//
// Why:
//   The registry publishes events after it drops the escrow lock, so two
//   threads that touched the same escrow one after the other can deliver
//   their events to the store in the opposite order. Every event carries
//   the registry's sequence number, taken under the escrow lock; a save
//   whose revision is not above the stored one is stale and dropped.
//
// Rules:
//   applyEscrow    accepted iff revision > escrow_revision. A Settled or
//                  Cancelled snapshot also drops an older pending plan.
//   applyPending   accepted iff revision > pending_revision and the
//                  escrow was not closed by a later revision.
//   applyGovernance accepted unless its version is below the stored one.
//
// Thread-safety:
//   None. The owning store serializes access with its own mutex.
// -----------------------------------------------------------------------------
class EscrowRecordBook {
 public:
  struct Record {
    std::optional<domain::Escrow> escrow;
    std::uint64_t escrow_revision{0};
    std::optional<domain::DisbursementPlan> pending;
    std::uint64_t pending_revision{0};
  };

  bool applyEscrow(const domain::Escrow& escrow, std::uint64_t revision);
  bool applyPending(const domain::DisbursementPlan& plan,
                    std::uint64_t revision);
  bool applyGovernance(const domain::GovernanceConfig& config);

  // Loader entry points: take records as they were written.
  void restore(domain::EscrowId id, Record record);
  void restoreRevision(std::uint64_t revision);

  // Escrow snapshots and pending plans, each in id order.
  std::vector<domain::Escrow> escrows() const;
  std::vector<domain::DisbursementPlan> pending() const;

  const std::optional<domain::GovernanceConfig>& governance() const {
    return governance_;
  }
  const std::map<domain::EscrowId, Record>& records() const {
    return records_;
  }
  std::uint64_t lastRevision() const { return last_revision_; }

 private:
  void noteRevision(std::uint64_t revision);

  std::map<domain::EscrowId, Record> records_;
  std::optional<domain::GovernanceConfig> governance_;
  std::uint64_t last_revision_{0};
};

}  // namespace escrow
