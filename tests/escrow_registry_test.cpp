// =============================================================================
// escrow_registry_test.cpp
// =============================================================================
// Unit tests for escrow::EscrowRegistry.
//
// Validates:
//   - The four reference scenarios (ITM call, OTM put, European early
//     exercise, settlement before expiry)
//   - Parameter validation and check ordering for every operation
//   - Caller rules for deposit, exercise, settle, cancel, assignment
//   - Terminal states are final and resubmission has no side effect
//   - Vault failures: deposit is all-or-nothing, a failed release leaves
//     a pending disbursement that is replayed verbatim
//   - Lifecycle graph and published events
//   - Origination fee: fixed at creation, paid out of the deposit,
//     recoverable after a failed fee leg
//   - Hydration: duplicate ids, pending plans, custody audit
//
// All tests are single-threaded. Races are covered in
// escrow_concurrency_test.cpp.
// =============================================================================

#include "escrow/domain/disbursement.hpp"
#include "escrow/domain/escrow.hpp"
#include "escrow/error/escrow_error.hpp"
#include "escrow/eventbus/event_bus.hpp"
#include "escrow/events/event.hpp"
#include "escrow/governance/governance.hpp"
#include "escrow/registry/escrow_registry.hpp"
#include "escrow/settlement/fee_calculator.hpp"
#include "escrow/vault/in_memory_collateral_vault.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <vector>

using escrow::ErrorCode;
using escrow::EscrowError;
using escrow::EscrowRegistry;
using escrow::InitializeEscrowParams;
namespace domain = escrow::domain;
using domain::EscrowStatus;

namespace {

constexpr domain::TimestampMs kNow = 1'000;
constexpr domain::TimestampMs kExpiry = 5'000;

template <typename Fn>
ErrorCode codeOf(Fn&& fn) {
  try {
    fn();
  } catch (const EscrowError& e) {
    return e.code();
  }
  ADD_FAILURE() << "expected an EscrowError";
  return ErrorCode::InvalidParameters;
}

// Vault that refuses one specific leg a given number of times and passes
// everything else through to an in-memory vault.
class LegFailingVault final : public escrow::ICollateralVault {
 public:
  explicit LegFailingVault(escrow::InMemoryCollateralVault& inner)
      : inner_(inner) {}

  void failLeg(domain::Leg leg, int times) {
    leg_ = leg;
    remaining_ = times;
  }

  escrow::VaultReceipt lock(domain::EscrowId id, const domain::Identity& from,
                            const std::string& asset,
                            domain::Amount amount) override {
    return inner_.lock(id, from, asset, amount);
  }

  void release(domain::EscrowId id, domain::Leg leg,
               const domain::Identity& recipient, const std::string& asset,
               domain::Amount amount) override {
    ++attempts_;
    if (leg == leg_ && remaining_ > 0) {
      --remaining_;
      throw EscrowError(ErrorCode::VaultError, "custody offline");
    }
    inner_.release(id, leg, recipient, asset, amount);
  }

  domain::Amount lockedBalance(domain::EscrowId id) const override {
    return inner_.lockedBalance(id);
  }

  int attempts() const { return attempts_; }

 private:
  escrow::InMemoryCollateralVault& inner_;
  domain::Leg leg_{domain::Leg::Payoff};
  int remaining_{0};
  int attempts_{0};
};

}  // namespace

// =============================================================================
// Test fixture: 100 bps governance, alice (writer) funded with 10000 USDC,
// every published event recorded.
// =============================================================================
class EscrowRegistryTest : public ::testing::Test {
 protected:
  void SetUp() override {
    vault.credit("alice", "USDC", 10'000);
    bus.subscribe([this](const escrow::Event& e) { events.push_back(e); });
  }

  static InitializeEscrowParams callParams(
      domain::ExerciseStyle style = domain::ExerciseStyle::European,
      std::optional<domain::Identity> counterparty = std::string("bob")) {
    InitializeEscrowParams p;
    p.option_type = domain::OptionType::Call;
    p.style = style;
    p.strike_price = 100;
    p.notional = 10;
    p.expiration_time = kExpiry;
    p.collateral_asset = "USDC";
    p.counterparty = std::move(counterparty);
    p.max_collateral = 1000;
    p.now = kNow;
    return p;
  }

  static InitializeEscrowParams putParams() {
    InitializeEscrowParams p = callParams();
    p.option_type = domain::OptionType::Put;
    p.max_collateral = std::nullopt;
    return p;
  }

  // Created + Collateralized with 1000 USDC.
  domain::EscrowId funded(const InitializeEscrowParams& params) {
    const auto id = registry.initializeEscrow("alice", params);
    registry.depositCollateral("alice", id, "USDC", 1000, kNow);
    return id;
  }

  template <typename T>
  std::vector<T> eventsOf() const {
    std::vector<T> out;
    for (const auto& e : events) {
      if (const auto* p = std::get_if<T>(&e)) {
        out.push_back(*p);
      }
    }
    return out;
  }

  escrow::EventBus bus;
  escrow::Governance governance{bus, "gov", 100, "treasury"};
  escrow::InMemoryCollateralVault vault;
  EscrowRegistry registry{bus, governance, vault};
  std::vector<escrow::Event> events;
};

// -----------------------------------------------------------------------------
// 1. ITM call: payoff 200, fee 2, holder 198, residual 800.
// -----------------------------------------------------------------------------
TEST_F(EscrowRegistryTest, ItmCallSettlementAtExpiry) {
  const auto id = funded(callParams());

  const auto plan = registry.settleEscrow("bob", id, 120, kExpiry);

  EXPECT_EQ(plan.outcome, domain::Outcome::InTheMoney);
  EXPECT_EQ(plan.payoff, 200u);
  EXPECT_EQ(plan.payoff_fee, 2u);
  EXPECT_EQ(plan.holderNet(), 198u);
  EXPECT_EQ(plan.initializerNet(), 800u);

  EXPECT_EQ(vault.balance("bob", "USDC"), 198u);
  EXPECT_EQ(vault.balance("treasury", "USDC"), 2u);
  EXPECT_EQ(vault.balance("alice", "USDC"), 9'800u);
  EXPECT_EQ(vault.lockedBalance(id), 0u);

  const auto escrow = registry.getEscrow(id);
  EXPECT_EQ(escrow.status, EscrowStatus::Settled);
  EXPECT_EQ(escrow.collateral_amount, 0u);
  ASSERT_TRUE(escrow.settled_at.has_value());
  EXPECT_EQ(*escrow.settled_at, kExpiry);

  EXPECT_EQ(codeOf([&] { registry.settleEscrow("bob", id, 120, kExpiry); }),
            ErrorCode::AlreadySettled);
  EXPECT_EQ(registry.getEscrow(id).collateral_amount, 0u);
}

// -----------------------------------------------------------------------------
// 2. OTM put: the full 1000 returns to the writer, no fee by default.
// -----------------------------------------------------------------------------
TEST_F(EscrowRegistryTest, OtmPutReturnsEverything) {
  const auto id = funded(putParams());

  const auto plan = registry.settleEscrow("alice", id, 150, kExpiry + 1);

  EXPECT_EQ(plan.outcome, domain::Outcome::OutOfTheMoney);
  EXPECT_EQ(plan.payoff, 0u);
  EXPECT_EQ(plan.totalFee(), 0u);
  EXPECT_EQ(vault.balance("alice", "USDC"), 10'000u);
  EXPECT_EQ(vault.balance("bob", "USDC"), 0u);
  EXPECT_EQ(registry.getEscrow(id).status, EscrowStatus::Settled);
}

// -----------------------------------------------------------------------------
// 3. European early exercise fails NotAmerican even deep ITM.
// -----------------------------------------------------------------------------
TEST_F(EscrowRegistryTest, EuropeanEarlyExerciseRejected) {
  const auto id = funded(callParams(domain::ExerciseStyle::European));

  EXPECT_EQ(codeOf([&] { registry.exerciseEarly("bob", id, 10'000, kNow); }),
            ErrorCode::NotAmerican);
  EXPECT_EQ(registry.getEscrow(id).status, EscrowStatus::Collateralized);
  EXPECT_EQ(vault.lockedBalance(id), 1000u);
}

// -----------------------------------------------------------------------------
// 4. Settlement before expiration fails NotExpired with no state change.
// -----------------------------------------------------------------------------
TEST_F(EscrowRegistryTest, SettleBeforeExpiryRejected) {
  const auto id = funded(callParams());
  const auto before = events.size();

  EXPECT_EQ(codeOf([&] { registry.settleEscrow("bob", id, 120, kExpiry - 1); }),
            ErrorCode::NotExpired);
  EXPECT_EQ(registry.getEscrow(id).status, EscrowStatus::Collateralized);
  EXPECT_EQ(vault.lockedBalance(id), 1000u);
  EXPECT_EQ(vault.releaseCount(), 0u);
  EXPECT_EQ(events.size(), before);
}

// -----------------------------------------------------------------------------
// 5. initializeEscrow parameter validation.
// -----------------------------------------------------------------------------
TEST_F(EscrowRegistryTest, InitializeValidatesParameters) {
  auto expectInvalid = [&](InitializeEscrowParams p,
                           const domain::Identity& caller = "alice") {
    EXPECT_EQ(codeOf([&] { registry.initializeEscrow(caller, p); }),
              ErrorCode::InvalidParameters);
  };

  auto p = callParams();
  p.strike_price = 0;
  expectInvalid(p);

  p = callParams();
  p.notional = 0;
  expectInvalid(p);

  p = callParams();
  p.expiration_time = kNow;
  expectInvalid(p);

  p = callParams();
  p.collateral_asset.clear();
  expectInvalid(p);

  p = callParams();
  p.counterparty = std::string("alice");
  expectInvalid(p);

  p = callParams();
  p.max_collateral = std::nullopt;
  expectInvalid(p);

  p = callParams();
  p.max_collateral = 0;
  expectInvalid(p);

  expectInvalid(callParams(), "");

  p = putParams();
  p.strike_price = std::numeric_limits<std::uint64_t>::max();
  EXPECT_EQ(codeOf([&] { registry.initializeEscrow("alice", p); }),
            ErrorCode::ArithmeticOverflow);

  EXPECT_EQ(registry.size(), 0u);
}

// -----------------------------------------------------------------------------
// 6. Ids are unique and start in Created with the initializer recorded.
// -----------------------------------------------------------------------------
TEST_F(EscrowRegistryTest, InitializeCreatesEscrow) {
  const auto a = registry.initializeEscrow("alice", callParams());
  const auto b = registry.initializeEscrow("alice", putParams());
  EXPECT_NE(a, b);
  EXPECT_EQ(registry.size(), 2u);

  const auto escrow = registry.getEscrow(a);
  EXPECT_EQ(escrow.status, EscrowStatus::Created);
  EXPECT_EQ(escrow.initializer, "alice");
  ASSERT_TRUE(escrow.counterparty.has_value());
  EXPECT_EQ(*escrow.counterparty, "bob");
  EXPECT_EQ(escrow.created_at, kNow);
  EXPECT_EQ(escrow.collateral_amount, 0u);
}

// -----------------------------------------------------------------------------
// 7. depositCollateral checks caller, state, asset and amount, in order.
// -----------------------------------------------------------------------------
TEST_F(EscrowRegistryTest, DepositChecks) {
  const auto id = registry.initializeEscrow("alice", putParams());

  EXPECT_EQ(codeOf([&] { registry.depositCollateral("bob", id, "USDC", 1000); }),
            ErrorCode::Unauthorized);
  EXPECT_EQ(codeOf([&] { registry.depositCollateral("alice", id, "ETH", 1000); }),
            ErrorCode::IncorrectCollateralAsset);
  EXPECT_EQ(codeOf([&] { registry.depositCollateral("alice", id, "USDC", 999); }),
            ErrorCode::InsufficientCollateral);
  EXPECT_EQ(codeOf([&] { registry.depositCollateral("alice", 999, "USDC", 1000); }),
            ErrorCode::EscrowNotFound);
  EXPECT_EQ(vault.balance("alice", "USDC"), 10'000u);

  registry.depositCollateral("alice", id, "USDC", 1200);
  const auto escrow = registry.getEscrow(id);
  EXPECT_EQ(escrow.status, EscrowStatus::Collateralized);
  EXPECT_EQ(escrow.collateral_amount, 1200u);
  EXPECT_TRUE(escrow.lock_receipt.has_value());

  EXPECT_EQ(codeOf([&] { registry.depositCollateral("alice", id, "USDC", 1200); }),
            ErrorCode::InvalidState);
  EXPECT_EQ(vault.balance("alice", "USDC"), 8'800u);
}

// -----------------------------------------------------------------------------
// 8. A vault lock failure leaves the escrow in Created; retry succeeds.
// -----------------------------------------------------------------------------
TEST_F(EscrowRegistryTest, DepositVaultFailureIsAtomic) {
  const auto id = registry.initializeEscrow("alice", callParams());

  vault.failNextLocks(1);
  EXPECT_EQ(codeOf([&] { registry.depositCollateral("alice", id, "USDC", 1000); }),
            ErrorCode::VaultError);
  EXPECT_EQ(registry.getEscrow(id).status, EscrowStatus::Created);
  EXPECT_FALSE(registry.getEscrow(id).lock_receipt.has_value());
  EXPECT_EQ(vault.balance("alice", "USDC"), 10'000u);

  registry.depositCollateral("alice", id, "USDC", 1000);
  EXPECT_EQ(registry.getEscrow(id).status, EscrowStatus::Collateralized);
}

// -----------------------------------------------------------------------------
// 9. American early exercise by the holder settles immediately.
// -----------------------------------------------------------------------------
TEST_F(EscrowRegistryTest, AmericanEarlyExercise) {
  const auto id = funded(callParams(domain::ExerciseStyle::American));

  const auto plan = registry.exerciseEarly("bob", id, 130, kNow + 10);
  EXPECT_TRUE(plan.early_exercise);
  EXPECT_EQ(plan.payoff, 300u);
  EXPECT_EQ(plan.payoff_fee, 3u);
  EXPECT_EQ(vault.balance("bob", "USDC"), 297u);
  EXPECT_EQ(vault.balance("alice", "USDC"), 9'700u);

  const auto escrow = registry.getEscrow(id);
  EXPECT_EQ(escrow.status, EscrowStatus::Settled);
  EXPECT_EQ(escrow.collateral_amount, 0u);
  EXPECT_EQ(*escrow.settled_at, kNow + 10);

  EXPECT_EQ(codeOf([&] { registry.exerciseEarly("bob", id, 130, kNow + 20); }),
            ErrorCode::AlreadySettled);
  EXPECT_EQ(registry.getEscrow(id).collateral_amount, 0u);
}

// -----------------------------------------------------------------------------
// 10. exerciseEarly rejections, each with no side effect.
// -----------------------------------------------------------------------------
TEST_F(EscrowRegistryTest, EarlyExerciseRejections) {
  const auto id = funded(callParams(domain::ExerciseStyle::American));

  EXPECT_EQ(codeOf([&] { registry.exerciseEarly("alice", id, 130, kNow); }),
            ErrorCode::Unauthorized);
  EXPECT_EQ(codeOf([&] { registry.exerciseEarly("carol", id, 130, kNow); }),
            ErrorCode::Unauthorized);
  EXPECT_EQ(codeOf([&] { registry.exerciseEarly("bob", id, 100, kNow); }),
            ErrorCode::NotITM);
  EXPECT_EQ(codeOf([&] { registry.exerciseEarly("bob", id, 130, kExpiry); }),
            ErrorCode::Expired);

  const auto unfunded = registry.initializeEscrow(
      "alice", callParams(domain::ExerciseStyle::American));
  EXPECT_EQ(codeOf([&] { registry.exerciseEarly("bob", unfunded, 130, kNow); }),
            ErrorCode::InvalidState);

  EXPECT_EQ(registry.getEscrow(id).status, EscrowStatus::Collateralized);
  EXPECT_EQ(vault.releaseCount(), 0u);
}

// -----------------------------------------------------------------------------
// 11. Without a named holder, the exerciser becomes the counterparty.
// -----------------------------------------------------------------------------
TEST_F(EscrowRegistryTest, EarlyExerciseClaimsOpenHolderSlot) {
  const auto id =
      funded(callParams(domain::ExerciseStyle::American, std::nullopt));

  registry.exerciseEarly("carol", id, 120, kNow);
  const auto escrow = registry.getEscrow(id);
  ASSERT_TRUE(escrow.counterparty.has_value());
  EXPECT_EQ(*escrow.counterparty, "carol");
  EXPECT_EQ(vault.balance("carol", "USDC"), 198u);
}

// -----------------------------------------------------------------------------
// 12. Settle caller rules.
// -----------------------------------------------------------------------------
TEST_F(EscrowRegistryTest, SettleCallerRules) {
  const auto named = funded(callParams());
  EXPECT_EQ(codeOf([&] { registry.settleEscrow("carol", named, 120, kExpiry); }),
            ErrorCode::Unauthorized);
  registry.settleEscrow("alice", named, 120, kExpiry);
  EXPECT_EQ(vault.balance("bob", "USDC"), 198u);

  // Initializer settling with nobody to pay: full return even though ITM.
  vault.credit("alice", "USDC", 1000);
  const auto open = funded(callParams(domain::ExerciseStyle::European,
                                      std::nullopt));
  const auto plan = registry.settleEscrow("alice", open, 500, kExpiry);
  EXPECT_EQ(plan.outcome, domain::Outcome::OutOfTheMoney);
  EXPECT_EQ(plan.initializerNet(), 1000u);
  EXPECT_FALSE(registry.getEscrow(open).counterparty.has_value());
}

TEST_F(EscrowRegistryTest, SettleByThirdPartyClaimsOpenHolderSlot) {
  const auto id = funded(callParams(domain::ExerciseStyle::European,
                                    std::nullopt));
  const auto plan = registry.settleEscrow("dave", id, 120, kExpiry);
  ASSERT_TRUE(plan.holder.has_value());
  EXPECT_EQ(*plan.holder, "dave");
  EXPECT_EQ(vault.balance("dave", "USDC"), 198u);
  EXPECT_EQ(*registry.getEscrow(id).counterparty, "dave");
}

// -----------------------------------------------------------------------------
// 13. Settled is final: every later attempt fails AlreadySettled, no effect.
// -----------------------------------------------------------------------------
TEST_F(EscrowRegistryTest, SettledIsTerminal) {
  const auto id = funded(callParams(domain::ExerciseStyle::American));
  registry.settleEscrow("bob", id, 120, kExpiry);
  EXPECT_EQ(registry.getEscrow(id).collateral_amount, 0u);

  const auto releases = vault.releaseCount();
  const auto published = events.size();

  EXPECT_EQ(codeOf([&] { registry.settleEscrow("bob", id, 999, kExpiry); }),
            ErrorCode::AlreadySettled);
  EXPECT_EQ(codeOf([&] { registry.exerciseEarly("bob", id, 999, kNow); }),
            ErrorCode::AlreadySettled);
  EXPECT_EQ(codeOf([&] { registry.cancelEscrow("alice", id); }),
            ErrorCode::AlreadySettled);

  EXPECT_EQ(vault.releaseCount(), releases);
  EXPECT_EQ(events.size(), published);
  EXPECT_EQ(vault.balance("bob", "USDC"), 198u);
  EXPECT_EQ(registry.getEscrow(id).collateral_amount, 0u);
}

// -----------------------------------------------------------------------------
// 14. cancelEscrow: initializer only, Created only.
// -----------------------------------------------------------------------------
TEST_F(EscrowRegistryTest, CancelRules) {
  const auto id = registry.initializeEscrow("alice", callParams());
  EXPECT_EQ(codeOf([&] { registry.cancelEscrow("bob", id); }),
            ErrorCode::Unauthorized);

  registry.cancelEscrow("alice", id);
  EXPECT_EQ(registry.getEscrow(id).status, EscrowStatus::Cancelled);
  EXPECT_EQ(codeOf([&] { registry.cancelEscrow("alice", id); }),
            ErrorCode::AlreadySettled);
  EXPECT_EQ(codeOf([&] { registry.depositCollateral("alice", id, "USDC", 1000); }),
            ErrorCode::InvalidState);

  const auto collateralized = funded(callParams());
  EXPECT_EQ(codeOf([&] { registry.cancelEscrow("alice", collateralized); }),
            ErrorCode::InvalidState);
  EXPECT_EQ(registry.getEscrow(collateralized).status,
            EscrowStatus::Collateralized);
}

// -----------------------------------------------------------------------------
// 15. assignCounterparty names the holder once.
// -----------------------------------------------------------------------------
TEST_F(EscrowRegistryTest, AssignCounterparty) {
  const auto id = registry.initializeEscrow(
      "alice", callParams(domain::ExerciseStyle::European, std::nullopt));

  EXPECT_EQ(codeOf([&] { registry.assignCounterparty("bob", id, "bob"); }),
            ErrorCode::Unauthorized);
  EXPECT_EQ(codeOf([&] { registry.assignCounterparty("alice", id, "alice"); }),
            ErrorCode::InvalidParameters);
  EXPECT_EQ(codeOf([&] { registry.assignCounterparty("alice", id, ""); }),
            ErrorCode::InvalidParameters);

  registry.assignCounterparty("alice", id, "erin");
  EXPECT_EQ(*registry.getEscrow(id).counterparty, "erin");
  EXPECT_EQ(codeOf([&] { registry.assignCounterparty("alice", id, "frank"); }),
            ErrorCode::InvalidState);
}

// -----------------------------------------------------------------------------
// 16. A failed release keeps the escrow Collateralized with the plan
//     pending; the next settle replays that plan verbatim.
// -----------------------------------------------------------------------------
TEST_F(EscrowRegistryTest, FailedReleaseIsReplayedVerbatim) {
  const auto id = funded(callParams());

  vault.failNextReleases(1);
  EXPECT_EQ(codeOf([&] { registry.settleEscrow("bob", id, 120, kExpiry); }),
            ErrorCode::VaultError);

  EXPECT_EQ(registry.getEscrow(id).status, EscrowStatus::Collateralized);
  ASSERT_TRUE(registry.pendingDisbursement(id).has_value());
  EXPECT_EQ(registry.pendingCount(), 1u);
  EXPECT_EQ(vault.lockedBalance(id), 1000u);

  const auto pending = eventsOf<escrow::DisbursementPendingEvent>();
  ASSERT_EQ(pending.size(), 1u);
  EXPECT_EQ(pending[0].failed_leg, domain::Leg::Payoff);

  // Neither a new spot price nor a new fee rate changes the outcome.
  governance.updateFeeRate("gov", 500);
  const auto plan = registry.settleEscrow("bob", id, 900, kExpiry + 100);
  EXPECT_EQ(plan.payoff, 200u);
  EXPECT_EQ(plan.payoff_fee, 2u);
  EXPECT_EQ(plan.spot_price, 120u);

  EXPECT_EQ(registry.getEscrow(id).status, EscrowStatus::Settled);
  EXPECT_FALSE(registry.pendingDisbursement(id).has_value());
  EXPECT_EQ(vault.balance("bob", "USDC"), 198u);
  EXPECT_EQ(vault.balance("alice", "USDC"), 9'800u);
}

// -----------------------------------------------------------------------------
// 17. A failure after the first leg never pays that leg twice;
//     reconcilePending finishes the job.
// -----------------------------------------------------------------------------
TEST(EscrowRegistryRecoveryTest, PartialReleaseRecoveredByReconcile) {
  escrow::EventBus bus;
  escrow::Governance governance(bus, "gov", 100, "treasury");
  escrow::InMemoryCollateralVault inner;
  LegFailingVault vault(inner);
  EscrowRegistry registry(bus, governance, vault);
  inner.credit("alice", "USDC", 1000);

  InitializeEscrowParams p;
  p.option_type = domain::OptionType::Call;
  p.style = domain::ExerciseStyle::American;
  p.strike_price = 100;
  p.notional = 10;
  p.expiration_time = kExpiry;
  p.collateral_asset = "USDC";
  p.counterparty = std::string("bob");
  p.max_collateral = 1000;
  p.now = kNow;
  const auto id = registry.initializeEscrow("alice", p);
  registry.depositCollateral("alice", id, "USDC", 1000);

  vault.failLeg(domain::Leg::PayoffFee, 2);
  EXPECT_THROW(registry.exerciseEarly("bob", id, 120, kNow), EscrowError);
  EXPECT_EQ(inner.balance("bob", "USDC"), 198u);
  EXPECT_EQ(registry.getEscrow(id).status, EscrowStatus::Collateralized);

  // Still failing: stays pending.
  EXPECT_EQ(registry.reconcilePending(kNow + 1), 0u);
  EXPECT_EQ(registry.pendingCount(), 1u);

  EXPECT_EQ(registry.reconcilePending(kNow + 2), 1u);
  EXPECT_EQ(registry.pendingCount(), 0u);
  EXPECT_EQ(registry.getEscrow(id).status, EscrowStatus::Settled);
  EXPECT_EQ(inner.balance("bob", "USDC"), 198u);
  EXPECT_EQ(inner.balance("treasury", "USDC"), 2u);
  EXPECT_EQ(inner.balance("alice", "USDC"), 800u);
  EXPECT_EQ(inner.lockedBalance(id), 0u);
}

// -----------------------------------------------------------------------------
// 18. Only the parties of a pending plan may push it along.
// -----------------------------------------------------------------------------
TEST_F(EscrowRegistryTest, PendingReplayRequiresParty) {
  const auto id = funded(callParams());
  vault.failNextReleases(1);
  EXPECT_THROW(registry.settleEscrow("bob", id, 120, kExpiry), EscrowError);

  EXPECT_EQ(codeOf([&] { registry.settleEscrow("mallory", id, 120, kExpiry); }),
            ErrorCode::Unauthorized);
  registry.settleEscrow("alice", id, 1, kExpiry);
  EXPECT_EQ(vault.balance("bob", "USDC"), 198u);
}

// -----------------------------------------------------------------------------
// 19. Fees on returns when the registry runs AllDisbursements.
// -----------------------------------------------------------------------------
TEST_F(EscrowRegistryTest, AllDisbursementsPolicyChargesReturns) {
  EscrowRegistry charging(bus, governance, vault,
                          domain::FeePolicy::AllDisbursements);
  const auto id = charging.initializeEscrow("alice", callParams());
  charging.depositCollateral("alice", id, "USDC", 1000);

  const auto plan = charging.settleEscrow("bob", id, 120, kExpiry);
  EXPECT_EQ(plan.payoff_fee, 2u);
  EXPECT_EQ(plan.return_fee, 8u);
  EXPECT_EQ(vault.balance("treasury", "USDC"), 10u);
  EXPECT_EQ(vault.balance("alice", "USDC"), 9'792u);
}

// -----------------------------------------------------------------------------
// 20. A payoff product past 64 bits clamps to collateral through the
//     whole settlement path.
// -----------------------------------------------------------------------------
TEST_F(EscrowRegistryTest, OverflowingPayoffPaysWholeCollateral) {
  auto p = callParams();
  p.notional = std::numeric_limits<std::uint64_t>::max();
  const auto id = funded(p);

  const auto plan = registry.settleEscrow(
      "bob", id, std::numeric_limits<std::uint64_t>::max(), kExpiry);
  EXPECT_EQ(plan.payoff, 1000u);
  EXPECT_EQ(plan.payoff_fee, 10u);
  EXPECT_EQ(vault.balance("bob", "USDC"), 990u);
  EXPECT_EQ(vault.balance("alice", "USDC"), 9'000u);
}

// -----------------------------------------------------------------------------
// 21. Lifecycle graph.
// -----------------------------------------------------------------------------
TEST(EscrowRegistryGraphTest, LegalTransitions) {
  using S = EscrowStatus;
  EXPECT_TRUE(EscrowRegistry::isLegalTransition(S::Created, S::Collateralized));
  EXPECT_TRUE(EscrowRegistry::isLegalTransition(S::Created, S::Cancelled));
  EXPECT_TRUE(EscrowRegistry::isLegalTransition(S::Collateralized, S::Settled));
  EXPECT_TRUE(
      EscrowRegistry::isLegalTransition(S::Collateralized, S::Exercised));
  EXPECT_TRUE(EscrowRegistry::isLegalTransition(S::Exercised, S::Settled));

  EXPECT_FALSE(EscrowRegistry::isLegalTransition(S::Created, S::Settled));
  EXPECT_FALSE(
      EscrowRegistry::isLegalTransition(S::Collateralized, S::Cancelled));
  for (S to : {S::Created, S::Collateralized, S::Exercised, S::Settled,
               S::Cancelled}) {
    EXPECT_FALSE(EscrowRegistry::isLegalTransition(S::Settled, to));
    EXPECT_FALSE(EscrowRegistry::isLegalTransition(S::Cancelled, to));
  }
}

// -----------------------------------------------------------------------------
// 22. Events: one update per transition, settlement after the update,
//     Exercised never published.
// -----------------------------------------------------------------------------
TEST_F(EscrowRegistryTest, PublishesLifecycleEvents) {
  const auto id = funded(callParams(domain::ExerciseStyle::American));
  registry.exerciseEarly("bob", id, 120, kNow);

  const auto updates = eventsOf<escrow::EscrowUpdateEvent>();
  ASSERT_EQ(updates.size(), 3u);
  EXPECT_EQ(updates[0].escrow.status, EscrowStatus::Created);
  EXPECT_EQ(updates[1].escrow.status, EscrowStatus::Collateralized);
  EXPECT_EQ(updates[1].previous_status, EscrowStatus::Created);
  EXPECT_EQ(updates[2].escrow.status, EscrowStatus::Settled);
  EXPECT_EQ(updates[2].previous_status, EscrowStatus::Collateralized);
  EXPECT_EQ(updates[1].escrow.collateral_amount, 1000u);
  EXPECT_EQ(updates[2].escrow.collateral_amount, 0u);

  const auto settlements = eventsOf<escrow::SettlementEvent>();
  ASSERT_EQ(settlements.size(), 1u);
  EXPECT_TRUE(settlements[0].plan.early_exercise);
  EXPECT_GT(settlements[0].sequence_id, updates[2].sequence_id);

  for (const auto& u : updates) {
    EXPECT_NE(u.escrow.status, EscrowStatus::Exercised);
  }
}

// -----------------------------------------------------------------------------
// 23. Unknown ids and hydration.
// -----------------------------------------------------------------------------
TEST_F(EscrowRegistryTest, UnknownEscrow) {
  EXPECT_EQ(codeOf([&] { registry.getEscrow(42); }), ErrorCode::EscrowNotFound);
  EXPECT_EQ(codeOf([&] { registry.settleEscrow("bob", 42, 1, kExpiry); }),
            ErrorCode::EscrowNotFound);
}

TEST_F(EscrowRegistryTest, HydrateAdvancesIds) {
  domain::Escrow persisted;
  persisted.id = 41;
  persisted.initializer = "alice";
  persisted.option_type = domain::OptionType::Put;
  persisted.strike_price = 100;
  persisted.notional = 10;
  persisted.expiration_time = kExpiry;
  persisted.collateral_asset = "USDC";
  persisted.status = EscrowStatus::Created;
  registry.hydrateEscrow(persisted);

  EXPECT_EQ(registry.getEscrow(41).initializer, "alice");
  EXPECT_GT(registry.initializeEscrow("alice", callParams()), 41u);
  EXPECT_EQ(events.size(), 1u);  // only the new escrow's update

  persisted.id = 50;
  persisted.status = EscrowStatus::Exercised;
  EXPECT_EQ(codeOf([&] { registry.hydrateEscrow(persisted); }),
            ErrorCode::InvalidParameters);
}

TEST_F(EscrowRegistryTest, HydrateRejectsDuplicateId) {
  domain::Escrow persisted;
  persisted.id = 41;
  persisted.initializer = "alice";
  persisted.option_type = domain::OptionType::Put;
  persisted.strike_price = 100;
  persisted.notional = 10;
  persisted.expiration_time = kExpiry;
  persisted.collateral_asset = "USDC";
  persisted.status = EscrowStatus::Created;
  registry.hydrateEscrow(persisted);

  domain::Escrow again = persisted;
  again.initializer = "mallory";
  EXPECT_EQ(codeOf([&] { registry.hydrateEscrow(again); }),
            ErrorCode::InvalidParameters);
  EXPECT_EQ(registry.getEscrow(41).initializer, "alice");

  // A live, funded escrow is not replaced either.
  const auto live = funded(callParams());
  again.id = live;
  EXPECT_EQ(codeOf([&] { registry.hydrateEscrow(again); }),
            ErrorCode::InvalidParameters);
  EXPECT_EQ(registry.getEscrow(live).status, EscrowStatus::Collateralized);
  EXPECT_EQ(registry.getEscrow(live).initializer, "alice");
  EXPECT_EQ(registry.size(), 2u);
}

// -----------------------------------------------------------------------------
// 24. A hydrated pending plan is what the next settle pays, even after a
//     fee change and with a different spot price.
// -----------------------------------------------------------------------------
TEST_F(EscrowRegistryTest, HydratedPendingPlanIsReplayed) {
  // Plan and escrow as a previous run left them: payoff leg refused.
  const auto original = funded(callParams());
  vault.failNextReleases(1);
  EXPECT_EQ(codeOf([&] { registry.settleEscrow("bob", original, 120, kExpiry); }),
            ErrorCode::VaultError);
  const domain::Escrow persisted = registry.getEscrow(original);
  const domain::DisbursementPlan plan = *registry.pendingDisbursement(original);

  escrow::EventBus next_bus;
  escrow::Governance next_governance(next_bus, "gov", 100, "treasury");
  EscrowRegistry restarted(next_bus, next_governance, vault);
  restarted.hydrateEscrow(persisted);
  restarted.hydratePending(plan);
  EXPECT_TRUE(restarted.custodyMismatches().empty());
  EXPECT_EQ(restarted.pendingCount(), 1u);

  next_governance.updateFeeRate("gov", 900);
  const auto replayed = restarted.settleEscrow("alice", original, 1, kExpiry + 50);
  EXPECT_EQ(replayed.spot_price, 120u);
  EXPECT_EQ(replayed.payoff_fee, 2u);
  EXPECT_EQ(vault.balance("bob", "USDC"), 198u);
  EXPECT_EQ(vault.balance("treasury", "USDC"), 2u);
  EXPECT_EQ(restarted.getEscrow(original).status, EscrowStatus::Settled);
  EXPECT_EQ(restarted.getEscrow(original).collateral_amount, 0u);
}

TEST_F(EscrowRegistryTest, HydratePendingRejections) {
  domain::DisbursementPlan plan;
  plan.escrow_id = 99;
  plan.collateral = 1000;
  EXPECT_EQ(codeOf([&] { registry.hydratePending(plan); }),
            ErrorCode::InvalidParameters);

  const auto created = registry.initializeEscrow("alice", callParams());
  plan.escrow_id = created;
  EXPECT_EQ(codeOf([&] { registry.hydratePending(plan); }),
            ErrorCode::InvalidParameters);

  const auto collateralized = funded(callParams());
  plan.escrow_id = collateralized;
  plan.collateral = 999;
  EXPECT_EQ(codeOf([&] { registry.hydratePending(plan); }),
            ErrorCode::InvalidParameters);
  EXPECT_EQ(registry.pendingCount(), 0u);
}

// -----------------------------------------------------------------------------
// 25. custodyMismatches() flags a funded escrow the vault does not hold.
// -----------------------------------------------------------------------------
TEST_F(EscrowRegistryTest, CustodyAuditAgainstVault) {
  funded(callParams());
  registry.settleEscrow("bob", funded(callParams()), 120, kExpiry);
  registry.initializeEscrow("alice", callParams());
  EXPECT_TRUE(registry.custodyMismatches().empty());

  domain::Escrow orphan;
  orphan.id = 77;
  orphan.initializer = "alice";
  orphan.option_type = domain::OptionType::Call;
  orphan.strike_price = 100;
  orphan.notional = 10;
  orphan.max_collateral = 1000;
  orphan.expiration_time = kExpiry;
  orphan.collateral_asset = "USDC";
  orphan.collateral_amount = 1000;
  orphan.status = EscrowStatus::Collateralized;
  registry.hydrateEscrow(orphan);

  const auto mismatches = registry.custodyMismatches();
  ASSERT_EQ(mismatches.size(), 1u);
  EXPECT_NE(mismatches[0].find("escrow 77"), std::string::npos);
}

// -----------------------------------------------------------------------------
// 26. Origination fee: fixed at creation from the governance snapshot, paid
//     to the collector out of the deposit, collateral untouched.
// -----------------------------------------------------------------------------
TEST_F(EscrowRegistryTest, OriginationFeeChargedOnDeposit) {
  EscrowRegistry charging(bus, governance, vault,
                          domain::FeePolicy::PayoffOnly, true);
  EXPECT_TRUE(charging.chargesOriginationFee());
  EXPECT_FALSE(registry.chargesOriginationFee());

  const auto id = charging.initializeEscrow("alice", callParams());
  auto escrow = charging.getEscrow(id);
  EXPECT_EQ(escrow.origination_fee,
            escrow::FeeCalculator::computeFee(1000, 100));
  EXPECT_EQ(escrow.origination_fee, 10u);
  EXPECT_EQ(escrow.origination_fee_collector.value_or(""), "treasury");

  // A later fee change does not touch an escrow that already exists.
  governance.updateFeeRate("gov", 500);
  charging.depositCollateral("alice", id, "USDC", 1000, kNow);

  escrow = charging.getEscrow(id);
  EXPECT_EQ(escrow.status, EscrowStatus::Collateralized);
  EXPECT_EQ(escrow.collateral_amount, 1000u);
  EXPECT_EQ(vault.lockedBalance(id), 1000u);
  EXPECT_EQ(vault.balance("alice", "USDC"), 8'990u);
  EXPECT_EQ(vault.balance("treasury", "USDC"), 10u);
  EXPECT_TRUE(vault.isReleased(id, domain::Leg::OriginationFee));

  // Settlement is charged at the rate then in force (500 bps on 200).
  charging.settleEscrow("bob", id, 120, kExpiry);
  EXPECT_EQ(vault.balance("bob", "USDC"), 190u);
  EXPECT_EQ(vault.balance("treasury", "USDC"), 20u);
  EXPECT_EQ(vault.balance("alice", "USDC"), 9'790u);
}

TEST_F(EscrowRegistryTest, NoOriginationFeeByDefault) {
  const auto id = funded(callParams());
  const auto escrow = registry.getEscrow(id);
  EXPECT_EQ(escrow.origination_fee, 0u);
  EXPECT_FALSE(escrow.origination_fee_collector.has_value());
  EXPECT_EQ(vault.balance("alice", "USDC"), 9'000u);
  EXPECT_FALSE(vault.isReleased(id, domain::Leg::OriginationFee));
}

// -----------------------------------------------------------------------------
// 27. A refused fee leg leaves the escrow Created; the same deposit retried
//     completes it, and cancel returns whatever an unfinished deposit left.
// -----------------------------------------------------------------------------
TEST_F(EscrowRegistryTest, OriginationFeeLegFailure) {
  EscrowRegistry charging(bus, governance, vault,
                          domain::FeePolicy::PayoffOnly, true);

  const auto retried = charging.initializeEscrow("alice", callParams());
  vault.failNextReleases(1);
  EXPECT_EQ(codeOf([&] {
              charging.depositCollateral("alice", retried, "USDC", 1000);
            }),
            ErrorCode::VaultError);
  EXPECT_EQ(charging.getEscrow(retried).status, EscrowStatus::Created);
  EXPECT_EQ(vault.lockedBalance(retried), 1010u);

  charging.depositCollateral("alice", retried, "USDC", 1000);
  EXPECT_EQ(charging.getEscrow(retried).status, EscrowStatus::Collateralized);
  EXPECT_EQ(vault.lockedBalance(retried), 1000u);
  EXPECT_EQ(vault.balance("treasury", "USDC"), 10u);
  EXPECT_EQ(vault.balance("alice", "USDC"), 8'990u);

  const auto abandoned = charging.initializeEscrow("alice", callParams());
  vault.failNextReleases(1);
  EXPECT_THROW(charging.depositCollateral("alice", abandoned, "USDC", 1000),
               EscrowError);
  EXPECT_EQ(vault.balance("alice", "USDC"), 7'980u);

  charging.cancelEscrow("alice", abandoned);
  EXPECT_EQ(charging.getEscrow(abandoned).status, EscrowStatus::Cancelled);
  EXPECT_EQ(vault.lockedBalance(abandoned), 0u);
  EXPECT_EQ(vault.balance("alice", "USDC"), 8'990u);
  EXPECT_EQ(vault.balance("treasury", "USDC"), 10u);
}

// -----------------------------------------------------------------------------
// 28. snapshots() lists every escrow in id order.
// -----------------------------------------------------------------------------
TEST_F(EscrowRegistryTest, SnapshotsAreOrdered) {
  const auto a = registry.initializeEscrow("alice", callParams());
  const auto b = registry.initializeEscrow("alice", putParams());
  const auto all = registry.snapshots();
  ASSERT_EQ(all.size(), 2u);
  EXPECT_EQ(all[0].id, a);
  EXPECT_EQ(all[1].id, b);
}
