#pragma once

#include "escrow/domain/disbursement.hpp"

#include <cstdint>

namespace escrow {

// -----------------------------------------------------------------------------
// SettlementEvent
// -----------------------------------------------------------------------------
//
// @brief  Published once per escrow when its collateral has been fully
//         disbursed, by settle_escrow(), exercise_early() or a
//         reconciliation pass.
//
// @details
// Carries the executed plan, including the governance version and fee
// collector that were used, so auditors can verify that every fee was
// charged at the rate in force for that version.
// -----------------------------------------------------------------------------
struct SettlementEvent {
  domain::DisbursementPlan plan;
  domain::TimestampMs timestamp_ms{0};
  std::uint64_t sequence_id{0};
};

}  // namespace escrow
