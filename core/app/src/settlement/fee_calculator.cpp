#include "escrow/settlement/fee_calculator.hpp"
#include "escrow/arith/checked_math.hpp"
#include "escrow/error/escrow_error.hpp"

#include <string>

namespace escrow {

domain::Amount FeeCalculator::computeFee(domain::Amount amount,
                                         std::uint32_t fee_rate_bps) {
  if (fee_rate_bps > domain::kBpsDenominator) {
    throw EscrowError(ErrorCode::FeeRateOutOfBounds,
                      "fee rate " + std::to_string(fee_rate_bps) +
                          " bps exceeds 100%");
  }

  const domain::Amount whole = amount / domain::kBpsDenominator;
  const domain::Amount rest = amount % domain::kBpsDenominator;

  // whole * rate <= amount and rest * rate < 10^8, so neither can overflow;
  // the checked forms document the bound.
  domain::Amount fee = checkedMul(whole, fee_rate_bps, "fee");
  fee = checkedAdd(fee, (rest * fee_rate_bps) / domain::kBpsDenominator,
                   "fee");
  return fee;
}

domain::Amount FeeCalculator::computeFee(
    domain::Amount amount, const domain::GovernanceConfig& config) {
  return computeFee(amount, config.fee_rate_bps);
}

bool FeeCalculator::chargesReturn(domain::FeePolicy policy) {
  return policy == domain::FeePolicy::AllDisbursements;
}

}  // namespace escrow
