#pragma once

#include "escrow/vault/i_collateral_vault.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <utility>

namespace escrow {

// -----------------------------------------------------------------------------
// InMemoryCollateralVault — process-local custody for simulation and tests
// -----------------------------------------------------------------------------
//
// @brief  ICollateralVault over in-memory account balances, with fault
//         injection so tests can exercise vault failures deterministically,
//         and an optional state file so the daemon keeps custody across
//         restarts.
//
// @details
// State (the Ledger):
//   accounts      (identity, asset) → spendable balance
//   custody       escrow_id → {asset, locked amount, receipt}
//   released      set of (escrow_id, leg) already paid out
//
// State file:
//   With a non-empty state_path the constructor loads the ledger from
//   that file (if it exists) and every mutation rewrites it through
//   writeStateFile() before returning. A failed write rolls the ledger
//   back and throws VaultError, so memory and disk never disagree about
//   a call that reported success. Fault-injection counters are not
//   persisted.
//
// Fault model:
//   failNextLocks(n) / failNextReleases(n) make the next n calls of that
//   kind throw VaultError before any balance changes, mimicking a custody
//   system that is temporarily unavailable.
//
// Thread model:
//   One mutex guards all state, including the file write. Every public
//   method is safe from any thread.
// -----------------------------------------------------------------------------
class InMemoryCollateralVault final : public ICollateralVault {
 public:
  // @throws EscrowError(InvalidParameters) if state_path names a file that
  //         exists but cannot be parsed.
  explicit InMemoryCollateralVault(std::string state_path = {});

  InMemoryCollateralVault(const InMemoryCollateralVault&) = delete;
  InMemoryCollateralVault& operator=(const InMemoryCollateralVault&) = delete;

  VaultReceipt lock(domain::EscrowId escrow_id, const domain::Identity& from,
                    const std::string& asset, domain::Amount amount) override;

  void release(domain::EscrowId escrow_id, domain::Leg leg,
               const domain::Identity& recipient, const std::string& asset,
               domain::Amount amount) override;

  domain::Amount lockedBalance(domain::EscrowId escrow_id) const override;

  // Adds funds to an account (faucet for simulations and tests).
  void credit(const domain::Identity& account, const std::string& asset,
              domain::Amount amount);

  domain::Amount balance(const domain::Identity& account,
                         const std::string& asset) const;

  bool isReleased(domain::EscrowId escrow_id, domain::Leg leg) const;

  // Number of releases that actually moved funds.
  std::size_t releaseCount() const;

  // True when the ledger was loaded from an existing state file.
  bool restored() const { return restored_; }

  void failNextLocks(std::size_t count);
  void failNextReleases(std::size_t count);

 private:
  struct Custody {
    std::string asset;
    domain::Amount amount{0};
    VaultReceipt receipt;
  };

  using AccountKey = std::pair<domain::Identity, std::string>;
  using ReleaseKey = std::pair<domain::EscrowId, std::uint32_t>;

  struct Ledger {
    std::map<AccountKey, domain::Amount> accounts;
    std::map<domain::EscrowId, Custody> custody;
    std::set<ReleaseKey> released;
    std::size_t release_count{0};
    std::uint64_t next_receipt{1};
  };

  // Runs `change` on the ledger and persists it when it reports a change.
  // Caller holds mutex_.
  template <typename Change>
  void mutate(Change&& change);

  void load();
  void persist() const;  // Caller holds mutex_.

  const std::string state_path_;
  bool restored_{false};

  mutable std::mutex mutex_;
  Ledger ledger_;
  std::size_t lock_failures_{0};
  std::size_t release_failures_{0};
};

}  // namespace escrow
