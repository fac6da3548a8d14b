// -----------------------------------------------------------------------------
// escrow_engine — daemon entry point
// -----------------------------------------------------------------------------
//
//   escrow_engine [config.json]
//
//   1) Load EngineConfig (defaults when no path is given).
//   2) Build the in-memory vault (restored from vault_state_path when set)
//      and, on a fresh ledger, credit the configured opening balances so a
//      local client can deposit collateral right away.
//   3) Start the EscrowEngine with the configured store (a JSON state file
//      when store_path is set, memory otherwise). Commands arrive on the
//      REP endpoint, telemetry leaves on the PUB endpoint.
//   4) Idle on the main thread until SIGINT/SIGTERM, then stop cleanly.
//
// Thread layout:
//   main thread  → waits for a signal
//   IPC thread   → IpcServer (commands and telemetry)
// -----------------------------------------------------------------------------

#include "escrow/config/engine_config.hpp"
#include "escrow/engine/escrow_engine.hpp"
#include "escrow/error/escrow_error.hpp"
#include "escrow/persistence/i_escrow_store.hpp"
#include "escrow/persistence/json_file_escrow_store.hpp"
#include "escrow/time/live_time_provider.hpp"
#include "escrow/vault/in_memory_collateral_vault.hpp"

#include <zmq.hpp>

#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <thread>

// Set by the signal handler, polled by main(). The only global in the
// program.
static volatile std::sig_atomic_t g_stop_requested = 0;

static void stop_handler(int /*signum*/) { g_stop_requested = 1; }

int main(int argc, char** argv) {
  escrow::EngineConfig config;
  try {
    if (argc > 1) {
      config = escrow::EngineConfig::fromFile(argv[1]);
      std::cout << "[main] configuration loaded from " << argv[1] << "\n";
    }
  } catch (const escrow::EscrowError& e) {
    std::cerr << "[main] ERROR: " << e.what() << "\n";
    return 1;
  }

  escrow::LiveTimeProvider clock;

  try {
    escrow::InMemoryCollateralVault vault(config.vault_state_path);
    if (!vault.restored()) {
      for (const escrow::AccountSeed& seed : config.accounts) {
        vault.credit(seed.identity, seed.asset, seed.amount);
        std::cout << "[main] credited " << seed.amount << ' ' << seed.asset
                  << " to " << seed.identity << "\n";
      }
    }

    std::unique_ptr<escrow::IEscrowStore> store;
    if (config.store_path.empty()) {
      store = std::make_unique<escrow::InMemoryEscrowStore>();
    } else {
      store = std::make_unique<escrow::JsonFileEscrowStore>(config.store_path);
    }

    escrow::EscrowEngine engine(config, vault, clock);
    engine.start(store.get());

    std::signal(SIGINT, stop_handler);
    std::signal(SIGTERM, stop_handler);

    std::cout << "[main] accepting commands on " << config.cmd_endpoint
              << ", telemetry on " << config.pub_endpoint << "\n"
              << "[main] Press Ctrl-C to shut down.\n";

    while (g_stop_requested == 0) {
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    std::cout << "\n[main] shutdown requested. Stopping engine...\n";
    engine.stop();
  } catch (const escrow::EscrowError& e) {
    std::cerr << "[main] ERROR: " << e.what() << "\n";
    return 1;
  } catch (const zmq::error_t& e) {
    std::cerr << "[main] ERROR: IPC: " << e.what() << "\n";
    return 1;
  }

  return 0;
}
