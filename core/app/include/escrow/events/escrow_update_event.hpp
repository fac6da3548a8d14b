#pragma once

#include "escrow/domain/escrow.hpp"
#include "escrow/domain/escrow_status.hpp"

#include <cstdint>

namespace escrow {

// -----------------------------------------------------------------------------
// EscrowUpdateEvent
// -----------------------------------------------------------------------------
//
// @brief  Published by the EscrowRegistry after every committed change to an
//         escrow: creation, deposit, holder assignment, settlement,
//         cancellation.
//
// @details
// `escrow` is a full snapshot taken after the change was applied.
// `previous_status` is the status before the change (equal to the current
// status for changes that do not move the state machine, e.g. holder
// assignment; Created for a newly created escrow).
//
// The EscrowEngine writes these snapshots through to the IEscrowStore and
// forwards them to the IPC telemetry socket.
//
// Thread model:
//   Published on the thread that ran the registry operation, after the
//   escrow lock was released. Plain data, safe to copy across threads.
// -----------------------------------------------------------------------------
struct EscrowUpdateEvent {
  domain::Escrow escrow;
  domain::EscrowStatus previous_status{domain::EscrowStatus::Created};
  domain::TimestampMs timestamp_ms{0};
  std::uint64_t sequence_id{0};
};

}  // namespace escrow
