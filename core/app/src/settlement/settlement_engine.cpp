#include "escrow/settlement/settlement_engine.hpp"
#include "escrow/arith/checked_math.hpp"
#include "escrow/error/escrow_error.hpp"
#include "escrow/settlement/fee_calculator.hpp"

#include <algorithm>

namespace escrow {

// -----------------------------------------------------------------------------
// isInTheMoney / classify
// -----------------------------------------------------------------------------
bool SettlementEngine::isInTheMoney(domain::OptionType type,
                                    domain::Price strike,
                                    domain::Price spot) {
  switch (type) {
    case domain::OptionType::Call:
      return spot > strike;
    case domain::OptionType::Put:
      return spot < strike;
  }
  return false;
}

domain::Outcome SettlementEngine::classify(domain::OptionType type,
                                           domain::Price strike,
                                           domain::Price spot) {
  return isInTheMoney(type, strike, spot) ? domain::Outcome::InTheMoney
                                          : domain::Outcome::OutOfTheMoney;
}

// -----------------------------------------------------------------------------
// computePayoff: min(|spot - strike| * notional, collateral)
// -----------------------------------------------------------------------------
domain::Amount SettlementEngine::computePayoff(domain::OptionType type,
                                               domain::Price strike,
                                               domain::Amount notional,
                                               domain::Price spot,
                                               domain::Amount collateral) {
  if (!isInTheMoney(type, strike, spot)) {
    return 0;
  }

  // ITM guarantees the subtraction is positive in the chosen direction.
  const domain::Price intrinsic = (type == domain::OptionType::Call)
                                      ? checkedSub(spot, strike, "intrinsic")
                                      : checkedSub(strike, spot, "intrinsic");

  auto raw = tryMul(intrinsic, notional);
  if (!raw) {
    // True product exceeds 2^64 - 1 >= collateral.
    return collateral;
  }
  return std::min(*raw, collateral);
}

// -----------------------------------------------------------------------------
// requiredCollateral
// -----------------------------------------------------------------------------
domain::Amount SettlementEngine::requiredCollateral(
    domain::OptionType type, domain::Price strike, domain::Amount notional,
    const std::optional<domain::Amount>& max_collateral) {
  if (max_collateral && *max_collateral == 0) {
    throw EscrowError(ErrorCode::InvalidParameters,
                      "max_collateral must be positive");
  }

  if (type == domain::OptionType::Call) {
    if (!max_collateral) {
      throw EscrowError(ErrorCode::InvalidParameters,
                        "a Call requires an explicit max_collateral");
    }
    return *max_collateral;
  }

  const domain::Amount worst_case =
      checkedMul(strike, notional, "put collateral (strike * notional)");
  if (max_collateral) {
    return std::max(worst_case, *max_collateral);
  }
  return worst_case;
}

domain::Amount SettlementEngine::requiredCollateral(
    const domain::Escrow& escrow) {
  return requiredCollateral(escrow.option_type, escrow.strike_price,
                            escrow.notional, escrow.max_collateral);
}

// -----------------------------------------------------------------------------
// planDisbursement
// -----------------------------------------------------------------------------
domain::DisbursementPlan SettlementEngine::planDisbursement(
    const domain::Escrow& escrow, domain::Price spot,
    const std::optional<domain::Identity>& holder,
    const domain::GovernanceConfig& governance, domain::FeePolicy policy,
    bool early) {
  domain::DisbursementPlan plan;
  plan.escrow_id = escrow.id;
  plan.early_exercise = early;
  plan.spot_price = spot;
  plan.collateral = escrow.collateral_amount;
  plan.holder = holder;
  plan.fee_collector = governance.fee_collector;
  plan.fee_rate_bps = governance.fee_rate_bps;
  plan.governance_version = governance.version;

  plan.outcome = holder ? classify(escrow.option_type, escrow.strike_price, spot)
                        : domain::Outcome::OutOfTheMoney;

  if (plan.outcome == domain::Outcome::InTheMoney) {
    plan.payoff = computePayoff(escrow.option_type, escrow.strike_price,
                                escrow.notional, spot, plan.collateral);
    plan.payoff_fee = FeeCalculator::computeFee(plan.payoff, governance);
  }

  plan.returned = checkedSub(plan.collateral, plan.payoff, "residual");
  if (FeeCalculator::chargesReturn(policy)) {
    plan.return_fee = FeeCalculator::computeFee(plan.returned, governance);
  }

  auto add_leg = [&plan](domain::Leg leg, const domain::Identity& to,
                         domain::Amount amount) {
    if (amount > 0) {
      plan.releases.push_back(domain::Release{leg, to, amount});
    }
  };

  if (plan.payoff > 0) {
    add_leg(domain::Leg::Payoff, *holder,
            checkedSub(plan.payoff, plan.payoff_fee, "holder net"));
    add_leg(domain::Leg::PayoffFee, governance.fee_collector, plan.payoff_fee);
  }
  add_leg(domain::Leg::Return, escrow.initializer,
          checkedSub(plan.returned, plan.return_fee, "initializer net"));
  add_leg(domain::Leg::ReturnFee, governance.fee_collector, plan.return_fee);

  domain::Amount total = 0;
  for (const auto& release : plan.releases) {
    total = checkedAdd(total, release.amount, "disbursement total");
  }
  if (total != plan.collateral) {
    throw EscrowError(ErrorCode::ArithmeticOverflow,
                      "disbursement legs do not sum to the collateral");
  }

  return plan;
}

}  // namespace escrow
