// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/chainparams.hpp"
#include "chain/chainstate_manager.hpp"
#include "chain/miner.hpp"
#include "network/network_manager.hpp"
#include "network/protocol.hpp"
#include "util/files.hpp"
#include <atomic>
#include <filesystem>
#include <memory>
#include <ostream>
#include <string>
#include <thread>

namespace floodchain {
namespace app {

// Application configuration
struct AppConfig {
  // Data directory (ledger.json, debug.log)
  std::filesystem::path datadir;

  // Network configuration
  network::NetworkManager::Config network_config;

  // Read operator commands from stdin
  bool interactive = true;

  // Logging
  bool verbose = false;

  AppConfig() : datadir(util::get_default_datadir()) {}
};

// Application - Main application coordinator
// Initializes components, manages lifecycle, handles signals and operator
// commands, coordinates shutdown
class Application {
public:
  explicit Application(const AppConfig &config = AppConfig{});
  ~Application();

  // Lifecycle
  bool initialize();
  bool start();
  void stop();
  void wait_for_shutdown();

  // Run one operator command line, writing its output to out.
  // Commands: ls p | ls c | create b <data> | req [peer_id] | help | quit
  // Returns false if the command was not understood.
  bool execute_command(const std::string &line, std::ostream &out);

  // Component access
  network::NetworkManager &network_manager() { return *network_manager_; }
  validation::ChainstateManager &chainstate_manager() {
    return *chainstate_manager_;
  }
  mining::CPUMiner &miner() { return *miner_; }
  const chain::ChainParams &chain_params() const { return *chain_params_; }
  const network::GossipConfig &gossip_config() const { return gossip_config_; }

  std::filesystem::path ledger_path() const { return config_.datadir / "ledger.json"; }

  // Status
  bool is_running() const { return running_; }

  void request_shutdown() { shutdown_requested_ = true; }
  bool shutdown_requested() const { return shutdown_requested_; }

  // Signal handling
  static void signal_handler(int signal);
  static Application *instance();

private:
  AppConfig config_;
  network::GossipConfig gossip_config_;
  std::atomic<bool> running_{false};
  std::atomic<bool> shutdown_requested_{false};

  // Components (initialized in order)
  std::unique_ptr<chain::ChainParams> chain_params_;
  std::unique_ptr<validation::ChainstateManager> chainstate_manager_;
  std::unique_ptr<network::NetworkManager> network_manager_;
  std::unique_ptr<mining::CPUMiner> miner_;

  // Operator console and periodic save threads
  std::unique_ptr<std::thread> console_thread_;
  std::unique_ptr<std::thread> save_thread_;

  // Initialization steps
  bool init_datadir();
  bool init_chain();
  bool init_network();

  // Operator console
  void start_console();
  void stop_console();
  void console_loop();

  // Periodic saves
  void start_periodic_saves();
  void stop_periodic_saves();
  void periodic_save_loop();
  void save_ledger();

  // Shutdown
  void shutdown();

  // Signal handling
  static Application *instance_;
  void setup_signal_handlers();
};

} // namespace app
} // namespace floodchain
