#pragma once

namespace escrow {
namespace domain {

// -----------------------------------------------------------------------------
// EscrowStatus — escrow lifecycle state machine
// -----------------------------------------------------------------------------
//
// @brief  Enumerates every state an escrow can occupy between creation and
//         final disbursement.
//
// @details
// The EscrowRegistry enforces the transition graph:
//
//   Created ───> Collateralized ───> Exercised ───> Settled
//      │                │                             ▲
//      │                └─────────────────────────────┘
//      └──> Cancelled
//
// Terminal states: Settled, Cancelled. Once an escrow reaches a terminal
// state no operation may move it again; repeated settlement requests fail
// with AlreadySettled.
//
// Exercised is never a resting state. exercise_early() sets it while the
// escrow lock is held and the payout is in flight, then moves on to
// Settled (or back to Collateralized if the vault refused a release).
// No reader outside the registry can observe it.
//
// There is no Collateralized → Cancelled edge: once funds are locked the
// escrow must be settled.
//
// Thread model:
//   Plain enum, value type. Safe to copy and compare from any thread.
// -----------------------------------------------------------------------------
enum class EscrowStatus {
  Created,         // Parameters recorded, no funds locked
  Collateralized,  // Collateral locked in the vault
  Exercised,       // Early exercise in flight (registry-internal)
  Settled,         // Collateral fully disbursed — terminal state
  Cancelled,       // Closed before collateralization — terminal state
};

inline bool isTerminal(EscrowStatus status) {
  return status == EscrowStatus::Settled || status == EscrowStatus::Cancelled;
}

inline const char* toString(EscrowStatus status) {
  switch (status) {
    case EscrowStatus::Created:        return "Created";
    case EscrowStatus::Collateralized: return "Collateralized";
    case EscrowStatus::Exercised:      return "Exercised";
    case EscrowStatus::Settled:        return "Settled";
    case EscrowStatus::Cancelled:      return "Cancelled";
  }
  return "Unknown";
}

}  // namespace domain
}  // namespace escrow
