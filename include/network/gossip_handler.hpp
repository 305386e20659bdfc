// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/block.hpp"
#include "network/message.hpp"
#include "network/protocol.hpp"
#include "network/transport.hpp"
#include <atomic>
#include <cstdint>
#include <string>
#include <vector>

namespace floodchain {

namespace validation {
class ChainstateManager;
}

namespace network {

class PeerMembership;

/**
 * GossipHandler - per-message protocol state machine
 *
 * Inbound payloads are decoded with message::DecodeMessage() and dispatched:
 *   ChainResponse  receiver == local id -> fork selection against the ledger
 *   ChainRequest   from_peer_id == local id -> ChainResponse to the source
 *   Block          append attempt on the current tip
 *   Unrecognized   dropped
 * Rejections are logged only; nothing negative goes back on the wire.
 *
 * THREADING: the ledger is mutated only from here. All entry points must be
 * called from a single thread (NetworkManager's io thread).
 */
class GossipHandler {
public:
  // Counters for diagnostics and tests
  struct Stats {
    std::atomic<uint64_t> messages_received{0};
    std::atomic<uint64_t> chains_adopted{0};
    std::atomic<uint64_t> chains_kept{0};
    std::atomic<uint64_t> chains_rejected{0};  // NoValidChain
    std::atomic<uint64_t> requests_served{0};
    std::atomic<uint64_t> blocks_accepted{0};
    std::atomic<uint64_t> blocks_rejected{0};
    std::atomic<uint64_t> ignored{0};  // addressed elsewhere or unrecognized
  };

  // LIFETIME: all references must outlive this handler
  GossipHandler(const GossipConfig &config,
                validation::ChainstateManager &chainstate,
                GossipTransport &transport, PeerMembership &membership);

  // Entry point for every delivered gossip payload
  void HandleMessage(const std::string &topic, const std::string &source,
                     const std::vector<uint8_t> &payload);

  // Discovery signal from the transport; updates group scope
  void HandlePeerEvent(const PeerEvent &event);

  // Hand-off from the local miner: append, then announce on success
  bool HandleMinedBlock(const CBlock &block);

  // Outbound fire-and-forget sends
  bool RequestChain(const std::string &peer_id);
  bool BroadcastBlock(const CBlock &block);

  const Stats &GetStats() const { return stats_; }

private:
  void HandleChainResponse(const std::string &source,
                           const message::ChainResponse &response);
  void HandleChainRequest(const std::string &source,
                          const message::ChainRequest &request);
  void HandleBlock(const std::string &source, const CBlock &block);

  const GossipConfig &config_;
  validation::ChainstateManager &chainstate_;
  GossipTransport &transport_;
  PeerMembership &membership_;

  Stats stats_;
};

} // namespace network
} // namespace floodchain
