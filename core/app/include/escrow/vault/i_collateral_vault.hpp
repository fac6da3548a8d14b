#pragma once

#include "escrow/domain/disbursement.hpp"
#include "escrow/domain/escrow.hpp"

#include <string>

namespace escrow {

// -----------------------------------------------------------------------------
// VaultReceipt — proof that collateral was taken into custody
// -----------------------------------------------------------------------------
struct VaultReceipt {
  std::string receipt_id;
  domain::EscrowId escrow_id{0};
  std::string asset;
  domain::Amount amount{0};
};

// -----------------------------------------------------------------------------
// ICollateralVault — custody collaborator interface
// -----------------------------------------------------------------------------
//
// @brief  The ledger that actually holds tokens. The engine decides who gets
//         what; the vault moves the funds.
//
// @details
// The EscrowRegistry treats every call as the commit point of an
// operation: the escrow status only changes after the vault call it
// depends on has returned successfully.
//
// Contract for implementations:
//   - Each call is all-or-nothing. On failure it throws
//     EscrowError(ErrorCode::VaultError) and no funds have moved.
//   - lock() moves `amount` of `asset` from `from` into custody for
//     `escrow_id`. Repeating a lock that already succeeded for the same
//     escrow, asset and amount returns the original receipt.
//   - release() pays `amount` out of the escrow's custody to `recipient`.
//     It is idempotent per (escrow_id, leg): a second release of a leg that
//     already succeeded is a no-op. This is what lets the registry replay
//     an interrupted settlement without double-paying.
//   - lockedBalance() is what is still in custody for an escrow. The
//     engine compares it with the escrow book at start-up before it
//     accepts commands, so a vault that lost custody is caught there
//     rather than at settlement.
//   - Calls for different escrows may run concurrently. The registry never
//     issues two concurrent calls for the same escrow.
//
// Ownership:
//   Not owned by the engine. The process (main() or a test fixture) owns
//   the concrete vault and passes it by reference.
// -----------------------------------------------------------------------------
class ICollateralVault {
 public:
  virtual ~ICollateralVault() = default;

  virtual VaultReceipt lock(domain::EscrowId escrow_id,
                            const domain::Identity& from,
                            const std::string& asset,
                            domain::Amount amount) = 0;

  virtual void release(domain::EscrowId escrow_id, domain::Leg leg,
                       const domain::Identity& recipient,
                       const std::string& asset, domain::Amount amount) = 0;

  // 0 when nothing is (or was ever) locked for the escrow.
  virtual domain::Amount lockedBalance(domain::EscrowId escrow_id) const = 0;
};

}  // namespace escrow
