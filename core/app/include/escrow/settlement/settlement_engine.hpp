#pragma once

#include "escrow/domain/disbursement.hpp"
#include "escrow/domain/escrow.hpp"
#include "escrow/domain/governance_config.hpp"

#include <optional>

namespace escrow {

// -----------------------------------------------------------------------------
// SettlementEngine — ITM classification, payoff and disbursement planning
// -----------------------------------------------------------------------------
//
// @brief  Pure functions that decide how an escrow's collateral is split
//         between holder, writer and fee collector for a given spot price.
//
// @details
// Nothing here touches the vault or mutates an escrow. The EscrowRegistry
// calls planDisbursement() under the escrow lock, then executes the plan.
//
// Moneyness:
//   Call ITM  iff spot > strike
//   Put  ITM  iff spot < strike
//   spot == strike is OTM for both.
//
// Payoff (ITM):
//   raw    = |spot - strike| * notional
//   payoff = min(raw, collateral)
// The collateral is a hard ceiling: the vault never releases more than was
// locked. When raw does not fit in 64 bits it is larger than any
// collateral, so the clamp resolves it exactly to collateral; a wrapped
// product is never used.
//
// Collateral requirement (deposit validation):
//   Put   strike * notional (worst case: spot falls to 0), or max_collateral
//         if the writer supplied a larger cap.
//   Call  max_collateral, which the writer must supply explicitly.
//
// Thread-safety: Stateless, pure functions.
// -----------------------------------------------------------------------------
class SettlementEngine {
 public:
  static bool isInTheMoney(domain::OptionType type, domain::Price strike,
                           domain::Price spot);

  static domain::Outcome classify(domain::OptionType type,
                                  domain::Price strike, domain::Price spot);

  // -------------------------------------------------------------------------
  // computePayoff(type, strike, notional, spot, collateral)
  // -------------------------------------------------------------------------
  // @return Clamped gross payoff; 0 when OTM. Always <= collateral.
  // -------------------------------------------------------------------------
  static domain::Amount computePayoff(domain::OptionType type,
                                      domain::Price strike,
                                      domain::Amount notional,
                                      domain::Price spot,
                                      domain::Amount collateral);

  // -------------------------------------------------------------------------
  // requiredCollateral(type, strike, notional, max_collateral)
  // -------------------------------------------------------------------------
  // @throws InvalidParameters for a Call without max_collateral, or a zero
  //         max_collateral.
  // @throws ArithmeticOverflow if strike * notional does not fit.
  // -------------------------------------------------------------------------
  static domain::Amount requiredCollateral(
      domain::OptionType type, domain::Price strike, domain::Amount notional,
      const std::optional<domain::Amount>& max_collateral);

  static domain::Amount requiredCollateral(const domain::Escrow& escrow);

  // -------------------------------------------------------------------------
  // planDisbursement(escrow, spot, holder, governance, policy, early)
  // -------------------------------------------------------------------------
  //
  // @brief  Builds the ordered release legs for settling `escrow` at `spot`.
  //
  // @param  escrow      Collateralized escrow (collateral_amount > 0).
  // @param  spot        Reference price supplied by the caller.
  // @param  holder      Payee for an ITM payoff. When unset there is nobody
  //                     to pay and the escrow is planned as OTM.
  // @param  governance  One snapshot: rate and collector both come from it.
  // @param  policy      Which disbursements carry a fee.
  // @param  early       Recorded in the plan for telemetry.
  //
  // @details
  // Legs, in execution order, zero amounts omitted:
  //   Payoff     holder       payoff - payoff_fee
  //   PayoffFee  collector    payoff_fee
  //   Return     initializer  returned - return_fee
  //   ReturnFee  collector    return_fee   (AllDisbursements only)
  //
  // @throws ArithmeticOverflow if the legs would not sum to the collateral.
  // -------------------------------------------------------------------------
  static domain::DisbursementPlan planDisbursement(
      const domain::Escrow& escrow, domain::Price spot,
      const std::optional<domain::Identity>& holder,
      const domain::GovernanceConfig& governance, domain::FeePolicy policy,
      bool early);
};

}  // namespace escrow
