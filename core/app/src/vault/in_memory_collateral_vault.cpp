#include "escrow/vault/in_memory_collateral_vault.hpp"
#include "escrow/arith/checked_math.hpp"
#include "escrow/error/escrow_error.hpp"
#include "escrow/persistence/state_file.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <optional>
#include <string>

namespace escrow {

namespace {

EscrowError vaultError(const std::string& message) {
  return EscrowError(ErrorCode::VaultError, message);
}

}  // namespace

InMemoryCollateralVault::InMemoryCollateralVault(std::string state_path)
    : state_path_(std::move(state_path)) {
  if (!state_path_.empty()) {
    load();
  }
}

// -----------------------------------------------------------------------------
// mutate: apply, persist, roll back on a failed write
// -----------------------------------------------------------------------------
template <typename Change>
void InMemoryCollateralVault::mutate(Change&& change) {
  if (state_path_.empty()) {
    change(ledger_);
    return;
  }

  Ledger before = ledger_;
  if (!change(ledger_)) {
    return;
  }
  try {
    persist();
  } catch (const EscrowError&) {
    ledger_ = std::move(before);
    throw;
  }
}

// -----------------------------------------------------------------------------
// lock: move funds from the depositor into custody for one escrow
// -----------------------------------------------------------------------------
VaultReceipt InMemoryCollateralVault::lock(domain::EscrowId escrow_id,
                                           const domain::Identity& from,
                                           const std::string& asset,
                                           domain::Amount amount) {
  std::lock_guard lock(mutex_);

  if (lock_failures_ > 0) {
    --lock_failures_;
    throw vaultError("custody unavailable (injected lock failure)");
  }

  VaultReceipt receipt;
  mutate([&](Ledger& ledger) {
    auto existing = ledger.custody.find(escrow_id);
    if (existing != ledger.custody.end()) {
      const VaultReceipt& original = existing->second.receipt;
      if (original.asset == asset && original.amount == amount) {
        receipt = original;  // retry of a lock that already went through
        return false;
      }
      throw vaultError("escrow " + std::to_string(escrow_id) +
                       " already holds collateral");
    }

    if (amount == 0) {
      throw vaultError("cannot lock a zero amount");
    }

    auto account = ledger.accounts.find(AccountKey{from, asset});
    domain::Amount available =
        (account != ledger.accounts.end()) ? account->second : 0;
    if (available < amount) {
      throw vaultError("insufficient " + asset + " balance for " + from +
                       ": have " + std::to_string(available) + ", need " +
                       std::to_string(amount));
    }

    account->second -= amount;

    Custody custody;
    custody.asset = asset;
    custody.amount = amount;
    custody.receipt.receipt_id =
        "rcpt-" + std::to_string(ledger.next_receipt++);
    custody.receipt.escrow_id = escrow_id;
    custody.receipt.asset = asset;
    custody.receipt.amount = amount;

    receipt = custody.receipt;
    ledger.custody.emplace(escrow_id, std::move(custody));
    return true;
  });
  return receipt;
}

// -----------------------------------------------------------------------------
// release: pay one leg out of an escrow's custody (idempotent per leg)
// -----------------------------------------------------------------------------
void InMemoryCollateralVault::release(domain::EscrowId escrow_id,
                                      domain::Leg leg,
                                      const domain::Identity& recipient,
                                      const std::string& asset,
                                      domain::Amount amount) {
  std::lock_guard lock(mutex_);

  const ReleaseKey key{escrow_id, static_cast<std::uint32_t>(leg)};
  if (ledger_.released.count(key) != 0) {
    return;
  }

  if (release_failures_ > 0) {
    --release_failures_;
    throw vaultError("custody unavailable (injected release failure)");
  }

  mutate([&](Ledger& ledger) {
    auto it = ledger.custody.find(escrow_id);
    if (it == ledger.custody.end()) {
      throw vaultError("no custody for escrow " + std::to_string(escrow_id));
    }

    Custody& custody = it->second;
    if (custody.asset != asset) {
      throw vaultError("escrow " + std::to_string(escrow_id) + " holds " +
                       custody.asset + ", not " + asset);
    }
    if (custody.amount < amount) {
      throw vaultError("release of " + std::to_string(amount) +
                       " exceeds locked balance " +
                       std::to_string(custody.amount));
    }

    domain::Amount& target = ledger.accounts[AccountKey{recipient, asset}];
    auto credited = tryAdd(target, amount);
    if (!credited) {
      throw vaultError("recipient balance would overflow");
    }

    custody.amount -= amount;
    target = *credited;
    ledger.released.insert(key);
    ++ledger.release_count;
    return true;
  });
}

// -----------------------------------------------------------------------------
// Accounts and inspection
// -----------------------------------------------------------------------------
void InMemoryCollateralVault::credit(const domain::Identity& account,
                                     const std::string& asset,
                                     domain::Amount amount) {
  std::lock_guard lock(mutex_);
  mutate([&](Ledger& ledger) {
    domain::Amount& balance = ledger.accounts[AccountKey{account, asset}];
    balance = checkedAdd(balance, amount, "account credit");
    return true;
  });
}

domain::Amount InMemoryCollateralVault::balance(const domain::Identity& account,
                                                const std::string& asset) const {
  std::lock_guard lock(mutex_);
  auto it = ledger_.accounts.find(AccountKey{account, asset});
  return (it != ledger_.accounts.end()) ? it->second : 0;
}

domain::Amount InMemoryCollateralVault::lockedBalance(
    domain::EscrowId escrow_id) const {
  std::lock_guard lock(mutex_);
  auto it = ledger_.custody.find(escrow_id);
  return (it != ledger_.custody.end()) ? it->second.amount : 0;
}

bool InMemoryCollateralVault::isReleased(domain::EscrowId escrow_id,
                                         domain::Leg leg) const {
  std::lock_guard lock(mutex_);
  return ledger_.released.count(
             ReleaseKey{escrow_id, static_cast<std::uint32_t>(leg)}) != 0;
}

std::size_t InMemoryCollateralVault::releaseCount() const {
  std::lock_guard lock(mutex_);
  return ledger_.release_count;
}

void InMemoryCollateralVault::failNextLocks(std::size_t count) {
  std::lock_guard lock(mutex_);
  lock_failures_ = count;
}

void InMemoryCollateralVault::failNextReleases(std::size_t count) {
  std::lock_guard lock(mutex_);
  release_failures_ = count;
}

// -----------------------------------------------------------------------------
// State file
// -----------------------------------------------------------------------------
//   {"next_receipt": n, "release_count": n,
//    "accounts": [{"identity", "asset", "amount"}],
//    "custody":  [{"escrow_id", "asset", "amount", "receipt_id", "locked"}],
//    "released": [{"escrow_id", "leg"}]}
// "locked" is the amount of the original lock; "amount" what is left.
// -----------------------------------------------------------------------------
void InMemoryCollateralVault::load() {
  const std::optional<std::string> text = readStateFile(state_path_);
  if (!text) {
    std::cout << "[InMemoryCollateralVault] no state at " << state_path_
              << ", starting empty\n";
    return;
  }

  try {
    const nlohmann::json root = nlohmann::json::parse(*text);
    ledger_.next_receipt = root.at("next_receipt").get<std::uint64_t>();
    ledger_.release_count = root.at("release_count").get<std::size_t>();

    for (const nlohmann::json& a : root.at("accounts")) {
      ledger_.accounts[AccountKey{a.at("identity").get<std::string>(),
                                  a.at("asset").get<std::string>()}] =
          a.at("amount").get<domain::Amount>();
    }
    for (const nlohmann::json& c : root.at("custody")) {
      Custody custody;
      custody.asset = c.at("asset").get<std::string>();
      custody.amount = c.at("amount").get<domain::Amount>();
      custody.receipt.receipt_id = c.at("receipt_id").get<std::string>();
      custody.receipt.escrow_id = c.at("escrow_id").get<domain::EscrowId>();
      custody.receipt.asset = custody.asset;
      custody.receipt.amount = c.at("locked").get<domain::Amount>();
      ledger_.custody[custody.receipt.escrow_id] = std::move(custody);
    }
    for (const nlohmann::json& r : root.at("released")) {
      ledger_.released.insert(ReleaseKey{r.at("escrow_id").get<domain::EscrowId>(),
                                         r.at("leg").get<std::uint32_t>()});
    }
  } catch (const nlohmann::json::exception& e) {
    throw EscrowError(ErrorCode::InvalidParameters,
                      "corrupt vault state file " + state_path_ + ": " +
                          e.what());
  }

  restored_ = true;
  std::cout << "[InMemoryCollateralVault] restored " << ledger_.accounts.size()
            << " account(s) and " << ledger_.custody.size()
            << " custody record(s) from " << state_path_ << "\n";
}

void InMemoryCollateralVault::persist() const {
  nlohmann::json root;
  root["next_receipt"] = ledger_.next_receipt;
  root["release_count"] = ledger_.release_count;

  root["accounts"] = nlohmann::json::array();
  for (const auto& [key, amount] : ledger_.accounts) {
    root["accounts"].push_back(
        {{"identity", key.first}, {"asset", key.second}, {"amount", amount}});
  }
  root["custody"] = nlohmann::json::array();
  for (const auto& [id, custody] : ledger_.custody) {
    root["custody"].push_back({{"escrow_id", id},
                               {"asset", custody.asset},
                               {"amount", custody.amount},
                               {"receipt_id", custody.receipt.receipt_id},
                               {"locked", custody.receipt.amount}});
  }
  root["released"] = nlohmann::json::array();
  for (const ReleaseKey& key : ledger_.released) {
    root["released"].push_back({{"escrow_id", key.first}, {"leg", key.second}});
  }

  writeStateFile(state_path_, root.dump(2) + "\n", ErrorCode::VaultError);
}

}  // namespace escrow
