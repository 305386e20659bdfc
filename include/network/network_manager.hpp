// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/block.hpp"
#include "network/protocol.hpp"
#include "network/transport.hpp"
#include "network/lan_transport.hpp"
#include <atomic>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace floodchain {

namespace validation {
class ChainstateManager;
}

namespace network {

class GossipHandler;
class PeerMembership;

// NetworkManager - Top-level coordinator for gossip networking
// Owns the io_context, the transport, the peer membership and the gossip
// handler, and routes transport events into the handler.
//
// CRITICAL ARCHITECTURE CONSTRAINT: Single-threaded networking reactor
// - Every inbound message, discovery event and mined-block hand-off runs on
//   the one io thread, which is what serializes ledger mutation
// - Config::io_threads MUST be 1 in production (0 = external io_context for tests)
// - Public send methods may be called from any thread; they post onto the
//   io thread
class NetworkManager {
public:
  struct Config {
    LanGossipTransport::Config transport; // listen/discovery sockets and timing
    size_t io_threads;                    // MUST be 1 in production (0 = external io_context)
    bool initial_sync;                    // request a chain once after startup
    std::chrono::milliseconds initial_sync_delay;

    Config()
        : io_threads(1), initial_sync(true),
          initial_sync_delay(protocol::INITIAL_SYNC_DELAY) {}
  };

  /**
   * Construct NetworkManager
   *
   * @param chainstate_manager  Ledger owner (must be initialized before start())
   * @param gossip              This node's identity and topic names
   * @param config              Network configuration
   * @param transport           Optional transport (nullptr = LanGossipTransport)
   * @param external_io_context Optional external io_context (nullptr = owned)
   *
   * LIFETIME: chainstate_manager and gossip must outlive the NetworkManager.
   */
  NetworkManager(validation::ChainstateManager &chainstate_manager,
                 const GossipConfig &gossip, const Config &config = Config{},
                 std::shared_ptr<GossipTransport> transport = nullptr,
                 std::shared_ptr<boost::asio::io_context> external_io_context = nullptr);
  ~NetworkManager();

  NetworkManager(const NetworkManager &) = delete;
  NetworkManager &operator=(const NetworkManager &) = delete;

  // Lifecycle. A stopped manager can be started again.
  bool start();

  // Stops the transport and joins the io thread. Idempotent; blocks until an
  // in-flight handler finishes.
  void stop();

  bool is_running() const { return running_; }

  // Ask peer_id for its chain. Empty peer_id picks the last known peer.
  // Returns false if there is no peer to ask.
  bool request_chain(const std::string &peer_id = "");

  // Announce a block on the block topic
  void broadcast_block(const CBlock &block);

  // Miner hand-off: append on the io thread, then announce on success
  void submit_mined_block(const CBlock &block);

  // Sorted ids of the current gossip group
  std::vector<std::string> get_peers() const;

  // Component access
  PeerMembership &membership() { return *membership_; }
  GossipHandler &handler() { return *handler_; }
  const GossipConfig &gossip_config() const { return gossip_; }
  boost::asio::io_context &io_context() { return *io_context_; }

private:
  void schedule_initial_sync();

  validation::ChainstateManager &chainstate_manager_;
  const GossipConfig &gossip_;
  Config config_;

  // Shared ownership of io_context ensures it outlives all async operations
  std::shared_ptr<boost::asio::io_context> io_context_;
  bool external_io_context_;
  std::shared_ptr<GossipTransport> transport_;
  std::unique_ptr<PeerMembership> membership_;
  std::unique_ptr<GossipHandler> handler_;

  std::unique_ptr<
      boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
      work_guard_;
  std::unique_ptr<boost::asio::steady_timer> initial_sync_timer_;
  std::vector<std::thread> io_threads_;

  std::atomic<bool> running_{false};
  std::mutex start_stop_mutex_;
};

} // namespace network
} // namespace floodchain
