// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/network_manager.hpp"
#include "chain/chainstate_manager.hpp"
#include "network/gossip_handler.hpp"
#include "network/peer_membership.hpp"
#include "util/logging.hpp"
#include <boost/asio/post.hpp>

namespace floodchain {
namespace network {

NetworkManager::NetworkManager(
    validation::ChainstateManager &chainstate_manager,
    const GossipConfig &gossip, const Config &config,
    std::shared_ptr<GossipTransport> transport,
    std::shared_ptr<boost::asio::io_context> external_io_context)
    : chainstate_manager_(chainstate_manager), gossip_(gossip), config_(config),
      io_context_(external_io_context ? external_io_context
                                      : std::make_shared<boost::asio::io_context>()),
      external_io_context_(external_io_context != nullptr),
      transport_(transport ? transport
                           : std::make_shared<LanGossipTransport>(
                                 *io_context_, gossip, config.transport)),
      membership_(std::make_unique<PeerMembership>()) {
  handler_ = std::make_unique<GossipHandler>(gossip_, chainstate_manager_,
                                             *transport_, *membership_);

  transport_->set_message_callback(
      [this](const std::string &topic, const std::string &source,
             const std::vector<uint8_t> &data) {
        if (!running_) {
          return;
        }
        handler_->HandleMessage(topic, source, data);
      });
  transport_->set_peer_event_callback([this](const PeerEvent &event) {
    if (!running_) {
      return;
    }
    handler_->HandlePeerEvent(event);
  });

  LOG_NET_TRACE("NetworkManager initialized (peer id: {}, external_io_context: {})",
                gossip_.local_id, external_io_context_ ? "yes" : "no");
}

NetworkManager::~NetworkManager() { stop(); }

bool NetworkManager::start() {
  std::lock_guard<std::mutex> lock(start_stop_mutex_);
  if (running_) {
    return false;
  }

  transport_->subscribe(gossip_.chain_topic);
  transport_->subscribe(gossip_.block_topic);

  // stop() leaves an owned io_context stopped
  if (!external_io_context_) {
    io_context_->restart();
  }

  if (!transport_->start()) {
    LOG_NET_ERROR("Failed to start gossip transport");
    return false;
  }

  running_ = true;

  // Threads are spawned only for an owned io_context; tests drive an
  // external one themselves
  if (config_.io_threads > 0 && !external_io_context_) {
    work_guard_ = std::make_unique<
        boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>(
        boost::asio::make_work_guard(*io_context_));
    for (size_t i = 0; i < config_.io_threads; ++i) {
      io_threads_.emplace_back([this]() { io_context_->run(); });
    }
  }

  if (config_.initial_sync) {
    schedule_initial_sync();
  }

  LOG_NET_INFO("Network started (peer id {}, topics '{}' and '{}')", gossip_.local_id,
               gossip_.chain_topic, gossip_.block_topic);
  return true;
}

void NetworkManager::stop() {
  std::lock_guard<std::mutex> lock(start_stop_mutex_);
  if (!running_) {
    return;
  }

  // Set running_ = false FIRST so late callbacks are ignored
  running_ = false;

  if (initial_sync_timer_) {
    initial_sync_timer_->cancel();
  }

  if (!external_io_context_) {
    if (work_guard_) {
      work_guard_.reset();
    }
    io_context_->stop();
    for (auto &thread : io_threads_) {
      if (thread.joinable()) {
        thread.join();
      }
    }
    io_threads_.clear();
  }

  // io thread is gone; safe to close sockets from here
  transport_->stop();
  initial_sync_timer_.reset();

  LOG_NET_TRACE("Network stopped");
}

void NetworkManager::schedule_initial_sync() {
  initial_sync_timer_ = std::make_unique<boost::asio::steady_timer>(*io_context_);
  initial_sync_timer_->expires_after(config_.initial_sync_delay);
  initial_sync_timer_->async_wait([this](const boost::system::error_code &ec) {
    if (ec || !running_) {
      return;
    }
    auto peers = membership_->GetMembers();
    if (peers.empty()) {
      LOG_NET_INFO("no peers known yet, skipping initial chain request");
      return;
    }
    LOG_NET_DEBUG("initial sync: asking {} for its chain", peers.back());
    handler_->RequestChain(peers.back());
  });
}

bool NetworkManager::request_chain(const std::string &peer_id) {
  std::string target = peer_id;
  if (target.empty()) {
    auto peers = membership_->GetMembers();
    if (peers.empty()) {
      LOG_NET_WARN("no peers to request a chain from");
      return false;
    }
    target = peers.back();
  }

  boost::asio::post(*io_context_, [this, target]() {
    if (running_) {
      handler_->RequestChain(target);
    }
  });
  return true;
}

void NetworkManager::broadcast_block(const CBlock &block) {
  boost::asio::post(*io_context_, [this, block]() {
    if (running_) {
      handler_->BroadcastBlock(block);
    }
  });
}

void NetworkManager::submit_mined_block(const CBlock &block) {
  boost::asio::post(*io_context_, [this, block]() {
    if (running_) {
      handler_->HandleMinedBlock(block);
    }
  });
}

std::vector<std::string> NetworkManager::get_peers() const {
  return membership_->GetMembers();
}

} // namespace network
} // namespace floodchain
