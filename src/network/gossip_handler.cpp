// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/gossip_handler.hpp"
#include "chain/chainstate_manager.hpp"
#include "chain/validation.hpp"
#include "network/peer_membership.hpp"
#include "util/logging.hpp"
#include <type_traits>
#include <variant>

namespace floodchain {
namespace network {

GossipHandler::GossipHandler(const GossipConfig &config,
                             validation::ChainstateManager &chainstate,
                             GossipTransport &transport,
                             PeerMembership &membership)
    : config_(config), chainstate_(chainstate), transport_(transport),
      membership_(membership) {}

void GossipHandler::HandleMessage(const std::string &topic,
                                  const std::string &source,
                                  const std::vector<uint8_t> &payload) {
  stats_.messages_received.fetch_add(1);

  message::GossipMessage msg = message::DecodeMessage(payload);
  LOG_NET_TRACE("received {} ({} bytes) on '{}' from {}",
                message::MessageKindToString(msg), payload.size(), topic, source);

  std::visit(
      [&](const auto &m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, message::ChainResponse>) {
          HandleChainResponse(source, m);
        } else if constexpr (std::is_same_v<T, message::ChainRequest>) {
          HandleChainRequest(source, m);
        } else if constexpr (std::is_same_v<T, CBlock>) {
          HandleBlock(source, m);
        } else {
          stats_.ignored.fetch_add(1);
          LOG_NET_DEBUG("dropping unrecognized payload from {} ({})", source,
                        m.reason);
        }
      },
      msg);
}

void GossipHandler::HandleChainResponse(const std::string &source,
                                        const message::ChainResponse &response) {
  if (response.receiver != config_.local_id) {
    stats_.ignored.fetch_add(1);
    LOG_NET_TRACE("chain response from {} addressed to {}, ignoring", source,
                  response.receiver);
    return;
  }

  LOG_NET_INFO("chain response from {}: {} blocks", source, response.blocks.size());
  for (const auto &block : response.blocks) {
    LOG_NET_DEBUG("  {}", block.ToShortString());
  }

  validation::ValidationState state;
  switch (chainstate_.ProcessRemoteChain(response.blocks, state)) {
  case validation::ChainChoice::REMOTE:
    stats_.chains_adopted.fetch_add(1);
    break;
  case validation::ChainChoice::LOCAL:
    stats_.chains_kept.fetch_add(1);
    break;
  case validation::ChainChoice::NONE:
    stats_.chains_rejected.fetch_add(1);
    break;
  }
}

void GossipHandler::HandleChainRequest(const std::string &source,
                                       const message::ChainRequest &request) {
  if (request.from_peer_id != config_.local_id) {
    stats_.ignored.fetch_add(1);
    LOG_NET_TRACE("chain request from {} addressed to {}, ignoring", source,
                  request.from_peer_id);
    return;
  }

  message::ChainResponse response{source, chainstate_.GetChain()};
  LOG_NET_INFO("sending local chain ({} blocks) to {}", response.blocks.size(), source);
  if (transport_.publish(config_.chain_topic, message::EncodeChainResponse(response))) {
    stats_.requests_served.fetch_add(1);
  } else {
    LOG_NET_ERROR("could not send chain response to {}", source);
  }
}

void GossipHandler::HandleBlock(const std::string &source, const CBlock &block) {
  LOG_NET_INFO("received new block {} from {}", block.ToShortString(), source);

  validation::ValidationState state;
  if (chainstate_.AcceptBlock(block, state)) {
    stats_.blocks_accepted.fetch_add(1);
  } else {
    stats_.blocks_rejected.fetch_add(1);
  }
}

void GossipHandler::HandlePeerEvent(const PeerEvent &event) {
  switch (event.kind) {
  case PeerEvent::Kind::DISCOVERED:
    if (membership_.OnDiscovered(event.peer_id, event.endpoint)) {
      transport_.add_group_member(event.peer_id);
    }
    break;
  case PeerEvent::Kind::EXPIRED:
    if (membership_.OnExpired(event.peer_id, event.endpoint)) {
      transport_.remove_group_member(event.peer_id);
    }
    break;
  }
}

bool GossipHandler::HandleMinedBlock(const CBlock &block) {
  validation::ValidationState state;
  if (!chainstate_.AcceptBlock(block, state)) {
    LOG_NET_WARN("mined block {} not appended ({}), not broadcasting",
                 block.ToShortString(), state.ToString());
    return false;
  }
  stats_.blocks_accepted.fetch_add(1);
  return BroadcastBlock(block);
}

bool GossipHandler::RequestChain(const std::string &peer_id) {
  LOG_NET_INFO("requesting chain from {}", peer_id);
  return transport_.publish(config_.chain_topic,
                            message::EncodeChainRequest(message::ChainRequest{peer_id}));
}

bool GossipHandler::BroadcastBlock(const CBlock &block) {
  LOG_NET_INFO("broadcasting block {}", block.ToShortString());
  return transport_.publish(config_.block_topic, message::EncodeBlock(block));
}

} // namespace network
} // namespace floodchain
