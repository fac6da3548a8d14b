#include "escrow/persistence/escrow_record_book.hpp"

#include <utility>

namespace escrow {

// -----------------------------------------------------------------------------
// applyEscrow
// -----------------------------------------------------------------------------
bool EscrowRecordBook::applyEscrow(const domain::Escrow& escrow,
                                   std::uint64_t revision) {
  Record& record = records_[escrow.id];
  if (revision <= record.escrow_revision) {
    return false;
  }

  record.escrow = escrow;
  record.escrow_revision = revision;
  if (domain::isTerminal(escrow.status) && record.pending_revision < revision) {
    record.pending.reset();
  }
  noteRevision(revision);
  return true;
}

// -----------------------------------------------------------------------------
// applyPending
// -----------------------------------------------------------------------------
bool EscrowRecordBook::applyPending(const domain::DisbursementPlan& plan,
                                    std::uint64_t revision) {
  Record& record = records_[plan.escrow_id];
  if (revision <= record.pending_revision) {
    return false;
  }
  if (record.escrow && domain::isTerminal(record.escrow->status) &&
      record.escrow_revision > revision) {
    return false;  // already settled by a later write
  }

  record.pending = plan;
  record.pending_revision = revision;
  noteRevision(revision);
  return true;
}

bool EscrowRecordBook::applyGovernance(const domain::GovernanceConfig& config) {
  if (governance_ && config.version < governance_->version) {
    return false;
  }
  governance_ = config;
  return true;
}

// -----------------------------------------------------------------------------
// Loading
// -----------------------------------------------------------------------------
void EscrowRecordBook::restore(domain::EscrowId id, Record record) {
  noteRevision(record.escrow_revision);
  noteRevision(record.pending_revision);
  records_[id] = std::move(record);
}

void EscrowRecordBook::restoreRevision(std::uint64_t revision) {
  noteRevision(revision);
}

std::vector<domain::Escrow> EscrowRecordBook::escrows() const {
  std::vector<domain::Escrow> out;
  out.reserve(records_.size());
  for (const auto& [id, record] : records_) {
    if (record.escrow) {
      out.push_back(*record.escrow);
    }
  }
  return out;
}

std::vector<domain::DisbursementPlan> EscrowRecordBook::pending() const {
  std::vector<domain::DisbursementPlan> out;
  for (const auto& [id, record] : records_) {
    if (record.pending) {
      out.push_back(*record.pending);
    }
  }
  return out;
}

void EscrowRecordBook::noteRevision(std::uint64_t revision) {
  if (revision > last_revision_) {
    last_revision_ = revision;
  }
}

}  // namespace escrow
