#pragma once

#include "escrow/domain/escrow.hpp"
#include "escrow/domain/governance_config.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace escrow {

// Opening balance credited to the in-memory vault at startup.
struct AccountSeed {
  domain::Identity identity;
  std::string asset;
  domain::Amount amount{0};
};

// -----------------------------------------------------------------------------
// EngineConfig — daemon configuration
// -----------------------------------------------------------------------------
//
// @brief  Everything EscrowEngine needs before it can accept commands.
//
// @details
// Defaults run a local simulation: a "governance" authority charging
// 10 bps to a "treasury" collector, fees on payoffs only, no origination
// fee, IPC on localhost 5556/5557, nothing persisted.
//
// JSON layout (every key optional):
//
//   {
//     "governance": {
//       "authority": "gov", "fee_rate_bps": 10, "fee_collector": "treasury"
//     },
//     "fee_policy": "payoff_only" | "all_disbursements",
//     "origination_fee": false,
//     "store_path": "/var/lib/escrow/escrows.json",
//     "vault_state_path": "/var/lib/escrow/vault.json",
//     "ipc": { "enabled": true,
//              "cmd_endpoint": "tcp://127.0.0.1:5556",
//              "pub_endpoint": "tcp://127.0.0.1:5557" },
//     "accounts": [ { "identity": "alice", "asset": "USDC",
//                     "amount": 1000000 } ]
//   }
// -----------------------------------------------------------------------------
struct EngineConfig {
  domain::Identity governance_authority{"governance"};
  std::uint32_t fee_rate_bps{10};
  domain::Identity fee_collector{"treasury"};
  domain::FeePolicy fee_policy{domain::FeePolicy::PayoffOnly};
  bool origination_fee{false};

  bool ipc_enabled{true};
  std::string cmd_endpoint{"tcp://127.0.0.1:5556"};
  std::string pub_endpoint{"tcp://127.0.0.1:5557"};

  // Empty keeps state in memory only.
  std::string store_path;

  // Empty keeps vault custody in memory only. Accounts are seeded only
  // when the vault did not restore a ledger from this file.
  std::string vault_state_path;

  std::vector<AccountSeed> accounts;

  // Parses a JSON document. Missing keys keep their defaults.
  // @throws EscrowError(InvalidParameters) on malformed JSON, wrong value
  //         types or an unknown fee_policy.
  static EngineConfig fromJson(const std::string& text);

  // Reads and parses a file.
  // @throws EscrowError(InvalidParameters) if it cannot be read or parsed.
  static EngineConfig fromFile(const std::string& path);
};

}  // namespace escrow
