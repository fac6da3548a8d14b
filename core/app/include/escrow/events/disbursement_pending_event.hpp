#pragma once

#include "escrow/domain/disbursement.hpp"

#include <cstdint>
#include <string>

namespace escrow {

// -----------------------------------------------------------------------------
// DisbursementPendingEvent
// -----------------------------------------------------------------------------
//
// @brief  Published when the vault refused one of a settlement's releases.
//
// @details
// The escrow stays Collateralized and keeps `plan` as its pending
// disbursement. Legs before `failed_leg` have already been paid; they are
// idempotent in the vault and will not be paid twice when the plan is
// replayed by the next settle/exercise request or by
// EscrowRegistry::reconcilePending().
// -----------------------------------------------------------------------------
struct DisbursementPendingEvent {
  domain::DisbursementPlan plan;
  domain::Leg failed_leg{domain::Leg::Payoff};
  std::string reason;
  domain::TimestampMs timestamp_ms{0};
  std::uint64_t sequence_id{0};
};

}  // namespace escrow
