#include "escrow/config/engine_config.hpp"
#include "escrow/error/escrow_error.hpp"
#include "escrow/network/json_codec.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>

namespace escrow {

// -----------------------------------------------------------------------------
// fromJson
// -----------------------------------------------------------------------------
EngineConfig EngineConfig::fromJson(const std::string& text) {
  EngineConfig config;

  try {
    const nlohmann::json root = nlohmann::json::parse(text);
    if (!root.is_object()) {
      throw EscrowError(ErrorCode::InvalidParameters,
                        "configuration must be a JSON object");
    }

    if (root.contains("governance")) {
      const nlohmann::json& gov = root.at("governance");
      config.governance_authority =
          gov.value("authority", config.governance_authority);
      config.fee_rate_bps = gov.value("fee_rate_bps", config.fee_rate_bps);
      config.fee_collector = gov.value("fee_collector", config.fee_collector);
    }

    if (root.contains("fee_policy")) {
      config.fee_policy =
          feePolicyFromString(root.at("fee_policy").get<std::string>());
    }

    config.origination_fee =
        root.value("origination_fee", config.origination_fee);

    if (root.contains("ipc")) {
      const nlohmann::json& ipc = root.at("ipc");
      config.ipc_enabled = ipc.value("enabled", config.ipc_enabled);
      config.cmd_endpoint = ipc.value("cmd_endpoint", config.cmd_endpoint);
      config.pub_endpoint = ipc.value("pub_endpoint", config.pub_endpoint);
    }

    config.store_path = root.value("store_path", config.store_path);
    config.vault_state_path =
        root.value("vault_state_path", config.vault_state_path);

    if (root.contains("accounts")) {
      for (const nlohmann::json& account : root.at("accounts")) {
        AccountSeed seed;
        seed.identity = account.at("identity").get<std::string>();
        seed.asset = account.at("asset").get<std::string>();
        seed.amount = account.at("amount").get<domain::Amount>();
        config.accounts.push_back(std::move(seed));
      }
    }
  } catch (const nlohmann::json::exception& e) {
    throw EscrowError(ErrorCode::InvalidParameters,
                      std::string("invalid configuration: ") + e.what());
  }

  return config;
}

// -----------------------------------------------------------------------------
// fromFile
// -----------------------------------------------------------------------------
EngineConfig EngineConfig::fromFile(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw EscrowError(ErrorCode::InvalidParameters,
                      "cannot open configuration file " + path);
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return fromJson(buffer.str());
}

}  // namespace escrow
