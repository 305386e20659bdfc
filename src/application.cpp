// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "application.hpp"
#include "util/logging.hpp"
#include "version.hpp"
#include <chrono>
#include <csignal>
#include <iostream>
#include <nlohmann/json.hpp>
#include <poll.h>
#include <sstream>
#include <unistd.h> // For write(), read(), STDIN_FILENO

namespace floodchain {
namespace app {

// Static instance for signal handling
Application *Application::instance_ = nullptr;

Application::Application(const AppConfig &config) : config_(config) {
  instance_ = this;
  gossip_config_.local_id = network::GeneratePeerId();
}

Application::~Application() {
  stop();
  instance_ = nullptr;
}

Application *Application::instance() { return instance_; }

bool Application::initialize() {
  // Print startup banner (use std::cout for immediate visibility)
  std::cout << GetStartupBanner(gossip_config_.local_id) << std::flush;

  LOG_INFO("Initializing Floodchain...");

  if (!init_datadir()) {
    LOG_ERROR("Failed to initialize data directory");
    return false;
  }

  if (!init_chain()) {
    LOG_ERROR("Failed to initialize ledger");
    return false;
  }

  LOG_INFO("Initializing miner...");
  miner_ = std::make_unique<mining::CPUMiner>(*chain_params_, *chainstate_manager_);

  if (!init_network()) {
    LOG_ERROR("Failed to initialize network manager");
    return false;
  }

  LOG_INFO("Initialization complete");
  return true;
}

bool Application::start() {
  if (running_) {
    LOG_ERROR("Application already running");
    return false;
  }

  LOG_INFO("Starting Floodchain...");

  setup_signal_handlers();

  if (!network_manager_->start()) {
    LOG_ERROR("Failed to start network manager");
    return false;
  }

  running_ = true;

  start_periodic_saves();
  if (config_.interactive) {
    start_console();
  }

  LOG_INFO("Floodchain started (peer id {})", gossip_config_.local_id);
  LOG_INFO("Data directory: {}", config_.datadir.string());
  LOG_INFO("Commands: ls p | ls c | create b <data> | req [peer_id] | quit");

  return true;
}

void Application::stop() {
  if (!running_) {
    return;
  }

  shutdown();
}

void Application::wait_for_shutdown() {
  while (running_ && !shutdown_requested_) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  if (shutdown_requested_) {
    shutdown();
  }
}

void Application::shutdown() {
  if (!running_) {
    return;
  }

  LOG_INFO("Shutting down Floodchain...");

  running_ = false;

  stop_console();
  stop_periodic_saves();

  // Stop miner before the network so a late hand-off finds nothing to post to
  if (miner_) {
    if (miner_->IsMining()) {
      LOG_INFO("Stopping miner...");
    }
    miner_->Stop();
  }

  if (network_manager_) {
    LOG_INFO("Stopping network manager...");
    network_manager_->stop();
  }

  if (chainstate_manager_) {
    LOG_INFO("Saving ledger to disk...");
    save_ledger();
  }

  LOG_INFO("Shutdown complete");
}

bool Application::init_datadir() {
  LOG_INFO("Data directory: {}", config_.datadir.string());

  if (!util::ensure_directory(config_.datadir)) {
    LOG_ERROR("Failed to create data directory: {}", config_.datadir.string());
    return false;
  }
  return true;
}

bool Application::init_chain() {
  LOG_INFO("Initializing ledger...");

  chain_params_ = chain::ChainParams::Create();
  chainstate_manager_ = std::make_unique<validation::ChainstateManager>(*chain_params_);

  const std::string ledger_file = ledger_path().string();
  if (chainstate_manager_->Load(ledger_file)) {
    LOG_INFO("Loaded ledger from disk");
  } else {
    LOG_INFO("No usable ledger found, initializing with genesis block");
    if (!chainstate_manager_->Initialize()) {
      LOG_ERROR("Failed to seed ledger with genesis");
      return false;
    }
  }

  LOG_INFO("Ledger initialized with {} blocks", chainstate_manager_->GetBlockCount());
  return true;
}

bool Application::init_network() {
  LOG_INFO("Initializing network manager...");

  network_manager_ = std::make_unique<network::NetworkManager>(
      *chainstate_manager_, gossip_config_, config_.network_config);
  return true;
}

bool Application::execute_command(const std::string &line, std::ostream &out) {
  std::istringstream in(line);
  std::string verb;
  std::string object;
  in >> verb >> object;

  if (verb.empty()) {
    return true;
  }

  if (verb == "ls" && object == "p") {
    auto peers = network_manager_->get_peers();
    out << "Discovered peers: " << peers.size() << "\n";
    for (const auto &peer : peers) {
      out << "  " << peer << "\n";
    }
    return true;
  }

  if (verb == "ls" && object == "c") {
    auto chain = chainstate_manager_->GetChain();
    out << ChainToJson(chain).dump(2, ' ', false,
                                   nlohmann::json::error_handler_t::replace)
        << "\n";
    return true;
  }

  if (verb == "create" && object == "b") {
    std::string data;
    std::getline(in, data);
    const auto first = data.find_first_not_of(' ');
    data = first == std::string::npos ? std::string() : data.substr(first);
    if (data.empty()) {
      out << "usage: create b <data>\n";
      return false;
    }

    bool started = miner_->Start(data, [this](const CBlock &block) {
      network_manager_->submit_mined_block(block);
    });
    out << (started ? "mining block with data: " + data
                    : std::string("miner busy, try again later"))
        << "\n";
    return started;
  }

  if (verb == "req") {
    if (!network_manager_->request_chain(object)) {
      out << "no peers to request a chain from\n";
      return false;
    }
    out << "chain requested" << (object.empty() ? "" : " from " + object) << "\n";
    return true;
  }

  if (verb == "help") {
    out << "ls p             list peers in the gossip group\n"
        << "ls c             print the local ledger\n"
        << "create b <data>  mine a block carrying data and broadcast it\n"
        << "req [peer_id]    ask a peer (default: last known) for its chain\n"
        << "quit             shut down\n";
    return true;
  }

  if (verb == "quit" || verb == "exit") {
    out << "shutting down\n";
    request_shutdown();
    return true;
  }

  out << "unknown command: " << line << "\n";
  return false;
}

void Application::start_console() {
  console_thread_ = std::make_unique<std::thread>(&Application::console_loop, this);
}

void Application::stop_console() {
  if (console_thread_ && console_thread_->joinable()) {
    console_thread_->join();
    console_thread_.reset();
  }
}

void Application::console_loop() {
  std::string pending;
  char buf[1024];

  // poll() with a timeout so the loop notices shutdown without a line of input
  while (running_) {
    pollfd pfd{STDIN_FILENO, POLLIN, 0};
    int ready = ::poll(&pfd, 1, 200);
    if (ready <= 0) {
      continue;
    }

    ssize_t n = ::read(STDIN_FILENO, buf, sizeof(buf));
    if (n <= 0) {
      LOG_DEBUG("stdin closed, console input disabled");
      return;
    }
    pending.append(buf, static_cast<size_t>(n));

    size_t newline;
    while ((newline = pending.find('\n')) != std::string::npos) {
      std::string line = pending.substr(0, newline);
      pending.erase(0, newline + 1);
      if (!line.empty() && line.back() == '\r') {
        line.pop_back();
      }
      execute_command(line, std::cout);
      std::cout << std::flush;
    }
  }
}

void Application::setup_signal_handlers() {
  std::signal(SIGINT, Application::signal_handler);
  std::signal(SIGTERM, Application::signal_handler);
}

void Application::signal_handler(int signal) {
  (void)signal;
  if (instance_) {
    // Use write() for async-signal-safety (std::cout, snprintf are NOT safe)
    const char *msg = "\nReceived signal\n";
    ssize_t ignored = write(STDOUT_FILENO, msg, 17);
    (void)ignored;

    instance_->shutdown_requested_ = true;
  }
}

void Application::start_periodic_saves() {
  LOG_INFO("Starting periodic ledger saves (every 10 minutes)");
  save_thread_ = std::make_unique<std::thread>(&Application::periodic_save_loop, this);
}

void Application::stop_periodic_saves() {
  if (save_thread_ && save_thread_->joinable()) {
    LOG_DEBUG("Stopping periodic save thread");
    save_thread_->join();
    save_thread_.reset();
  }
}

void Application::periodic_save_loop() {
  using namespace std::chrono;

  const auto save_interval = minutes(10);
  auto last_save = steady_clock::now();

  while (running_) {
    std::this_thread::sleep_for(seconds(1));

    if (!running_)
      break;

    auto now = steady_clock::now();
    if (now - last_save >= save_interval) {
      save_ledger();
      last_save = now;
    }
  }
}

void Application::save_ledger() {
  const std::string ledger_file = ledger_path().string();
  if (!chainstate_manager_->Save(ledger_file)) {
    LOG_ERROR("Failed to save ledger to {}", ledger_file);
  } else {
    LOG_DEBUG("Saved ledger ({} blocks) to {}", chainstate_manager_->GetBlockCount(),
              ledger_file);
  }
}

} // namespace app
} // namespace floodchain
