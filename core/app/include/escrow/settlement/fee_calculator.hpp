#pragma once

#include "escrow/domain/escrow.hpp"
#include "escrow/domain/governance_config.hpp"

#include <cstdint>

namespace escrow {

// -----------------------------------------------------------------------------
// FeeCalculator — protocol fee on a disbursement
// -----------------------------------------------------------------------------
//
// @brief  fee = floor(amount * fee_rate_bps / 10000)
//
// @details
// Always rounds down: the protocol never collects more than the exact
// fraction, the payee keeps the remainder.
//
// The product amount * fee_rate_bps is never formed. With
// amount = q * 10000 + r the fee is q * rate + floor(r * rate / 10000),
// which is exact and fits in 64 bits for any amount because rate is at
// most 10000. So the fee is defined for every representable amount.
//
// Which disbursements are charged is decided by domain::FeePolicy; see
// SettlementEngine::planDisbursement().
//
// Thread-safety: Stateless, pure functions.
// -----------------------------------------------------------------------------
class FeeCalculator {
 public:
  // -------------------------------------------------------------------------
  // computeFee(amount, fee_rate_bps)
  // -------------------------------------------------------------------------
  // @throws EscrowError(FeeRateOutOfBounds) if fee_rate_bps > 10000.
  // -------------------------------------------------------------------------
  static domain::Amount computeFee(domain::Amount amount,
                                   std::uint32_t fee_rate_bps);

  // Fee at the snapshot's rate.
  static domain::Amount computeFee(domain::Amount amount,
                                   const domain::GovernanceConfig& config);

  // Whether the policy charges a fee on the amount returned to the
  // initializer.
  static bool chargesReturn(domain::FeePolicy policy);
};

}  // namespace escrow
