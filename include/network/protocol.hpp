// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "version.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace floodchain {
namespace protocol {

// Protocol version - increment when the gossip envelope or beacon changes
constexpr uint32_t PROTOCOL_VERSION = 1;

// Gossip topic names
namespace topics {
constexpr const char *CHAINS = "chains"; // ChainRequest, ChainResponse
constexpr const char *BLOCKS = "blocks"; // single-block announcements
} // namespace topics

namespace ports {
constexpr uint16_t GOSSIP = 9650;           // TCP envelope streams
constexpr uint16_t DISCOVERY = 9651;        // UDP discovery beacons
} // namespace ports

// LAN multicast group for peer discovery beacons
constexpr const char *DISCOVERY_MULTICAST_GROUP = "239.255.42.99";

// ============================================================================
// LIMITS
// ============================================================================

// Envelope stream framing: 4-byte magic, then 4-byte big-endian body length
constexpr uint32_t ENVELOPE_MAGIC = 0x464C4348; // "FLCH"
constexpr size_t FRAME_HEADER_SIZE = 8;

// Largest envelope body accepted on a stream (same bound as a single P2P
// protocol message). A full ledger must fit in one ChainResponse.
constexpr size_t MAX_ENVELOPE_SIZE = 4 * 1000 * 1000;

// Bytes queued per stream before the connection is dropped as too slow
constexpr size_t MAX_SEND_QUEUE_SIZE = 10 * 1000 * 1000;

// Largest beacon accepted on the discovery socket
constexpr size_t MAX_BEACON_SIZE = 512;

// Peer ids are hex strings of this many random bytes
constexpr size_t PEER_ID_BYTES = 16;

// Discovery timing
constexpr std::chrono::seconds BEACON_INTERVAL{2};
constexpr std::chrono::seconds PEER_TTL{10};          // beacon not refreshed -> expired
constexpr std::chrono::seconds INITIAL_SYNC_DELAY{1}; // first chain request after startup
constexpr std::chrono::seconds CONNECT_TIMEOUT{5};    // outbound envelope stream

// User agent sent in beacons
inline std::string GetUserAgent() { return floodchain::GetUserAgent(); }

} // namespace protocol

namespace network {

// GossipConfig - this node's identity and topic names
// Created once at startup and passed by reference to every component that
// needs it.
struct GossipConfig {
  std::string local_id;
  std::string chain_topic{protocol::topics::CHAINS};
  std::string block_topic{protocol::topics::BLOCKS};
};

// Random hex peer id (PEER_ID_BYTES bytes of entropy)
std::string GeneratePeerId();

} // namespace network
} // namespace floodchain
