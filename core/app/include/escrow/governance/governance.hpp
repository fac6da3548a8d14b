#pragma once

#include "escrow/domain/governance_config.hpp"
#include "escrow/eventbus/event_bus.hpp"

#include <atomic>
#include <cstdint>
#include <shared_mutex>

namespace escrow {

// -----------------------------------------------------------------------------
// Governance — the fee-configuration singleton
// -----------------------------------------------------------------------------
//
// @brief  Holds the protocol fee rate, the fee collector and the authority
//         allowed to change them. Every successful mutation bumps the
//         version counter and publishes a GovernanceUpdateEvent.
//
// @details
// There is exactly one Governance per engine, owned by EscrowEngine and
// passed by reference to the EscrowRegistry. It is not static or global,
// so tests construct their own with whatever rate and collector they need.
//
// Authorization:
//   Every mutator takes the caller's verified identity and compares it to
//   the current authority before touching any field. A rejected call
//   (Unauthorized, FeeRateOutOfBounds, InvalidParameters) leaves every
//   field, including version, unchanged.
//
// Versioning:
//   A settlement reads one snapshot() and uses its rate and collector
//   together. Just before moving funds it calls ensureCurrent() (or
//   compares versions itself) to detect that a mutation slipped in; the
//   registry then recomputes the fee from a fresh snapshot.
//
// transfer_governance is single-step and immediate: there is no
// acceptance by the new authority, so a mistyped identity locks everyone
// out permanently. The transfer is logged as a warning.
//
// Thread model:
//   Read-mostly. snapshot(), version() and ensureCurrent() take a
//   shared_lock; mutators take a unique_lock, so at most one writer runs
//   at a time. Events are published after the lock is released.
// -----------------------------------------------------------------------------
class Governance {
 public:
  // -------------------------------------------------------------------------
  // Constructor (initialize_governance)
  // -------------------------------------------------------------------------
  //
  // @brief  Bootstraps the singleton with its first authority, fee rate and
  //         fee collector. version starts at 1.
  //
  // @param  bus            Bus for GovernanceUpdateEvent. Must outlive this.
  // @param  authority      Identity allowed to mutate the configuration.
  // @param  fee_rate_bps   Initial fee rate, in [0, kMaxFeeBps].
  // @param  fee_collector  Identity that receives fees.
  //
  // @throws EscrowError(FeeRateOutOfBounds) if fee_rate_bps > kMaxFeeBps.
  // @throws EscrowError(InvalidParameters) if an identity is empty.
  // -------------------------------------------------------------------------
  Governance(EventBus& bus, domain::Identity authority,
             std::uint32_t fee_rate_bps, domain::Identity fee_collector);

  Governance(const Governance&) = delete;
  Governance& operator=(const Governance&) = delete;
  Governance(Governance&&) = delete;
  Governance& operator=(Governance&&) = delete;

  // -------------------------------------------------------------------------
  // updateFeeRate(caller, new_rate)
  // -------------------------------------------------------------------------
  // @throws Unauthorized if caller is not the authority.
  // @throws FeeRateOutOfBounds if new_rate > kMaxFeeBps.
  // @return The new version.
  // -------------------------------------------------------------------------
  std::uint64_t updateFeeRate(const domain::Identity& caller,
                              std::uint32_t new_rate);

  // -------------------------------------------------------------------------
  // updateFeeCollector(caller, new_collector)
  // -------------------------------------------------------------------------
  // @throws Unauthorized if caller is not the authority.
  // @throws InvalidParameters if new_collector is empty.
  // @return The new version.
  // -------------------------------------------------------------------------
  std::uint64_t updateFeeCollector(const domain::Identity& caller,
                                   const domain::Identity& new_collector);

  // -------------------------------------------------------------------------
  // updateGovernance(caller, new_rate, new_collector)
  // -------------------------------------------------------------------------
  // Replaces rate and collector in one mutation with a single version bump,
  // so no reader can see the new rate paired with the old collector.
  // Same failure modes as the two single-field updates; both are checked
  // before either field changes.
  // -------------------------------------------------------------------------
  std::uint64_t updateGovernance(const domain::Identity& caller,
                                 std::uint32_t new_rate,
                                 const domain::Identity& new_collector);

  // -------------------------------------------------------------------------
  // transferGovernance(caller, new_authority)
  // -------------------------------------------------------------------------
  // Replaces the authority immediately. Bumps version.
  // @throws Unauthorized if caller is not the authority.
  // @throws InvalidParameters if new_authority is empty.
  // -------------------------------------------------------------------------
  std::uint64_t transferGovernance(const domain::Identity& caller,
                                   const domain::Identity& new_authority);

  // Consistent copy of all four fields.
  domain::GovernanceConfig snapshot() const;

  std::uint64_t version() const;

  // -------------------------------------------------------------------------
  // ensureCurrent(version)
  // -------------------------------------------------------------------------
  // @throws StaleGovernanceConfig if the configuration has been mutated
  //         since the snapshot carrying `version` was taken.
  // -------------------------------------------------------------------------
  void ensureCurrent(std::uint64_t version) const;

  // -------------------------------------------------------------------------
  // hydrate(config)
  // -------------------------------------------------------------------------
  // Warm-up only: replaces the configuration with a persisted record before
  // any operation runs. Does not publish. Bounds are still enforced.
  // -------------------------------------------------------------------------
  void hydrate(const domain::GovernanceConfig& config);

 private:
  // Caller must hold mutex_ (any mode).
  void requireAuthority(const domain::Identity& caller,
                        const char* operation) const;

  void publish(const domain::GovernanceConfig& config, const char* change);

  EventBus& bus_;

  mutable std::shared_mutex mutex_;
  domain::GovernanceConfig config_;

  std::atomic<std::uint64_t> sequence_{0};
};

}  // namespace escrow
