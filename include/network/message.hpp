// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/block.hpp"
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace floodchain {
namespace message {

// Gossip payloads are JSON documents. The three message kinds carry no
// explicit tag; they are told apart by their field sets:
//   ChainResponse  {receiver, blocks[]}
//   ChainRequest   {from_peer_id}
//   Block          {id, hash, previous_hash, timestamp, data, nonce}

// A full ledger copy sent to the peer that asked for it
struct ChainResponse {
  std::string receiver; // peer id of the requester
  std::vector<CBlock> blocks;

  bool operator==(const ChainResponse &other) const = default;
};

// Ask the peer whose id is from_peer_id for its ledger
struct ChainRequest {
  std::string from_peer_id;

  bool operator==(const ChainRequest &other) const = default;
};

// Payload that matched none of the known shapes
struct Unrecognized {
  std::string reason;
};

using GossipMessage = std::variant<ChainResponse, ChainRequest, CBlock, Unrecognized>;

std::vector<uint8_t> EncodeChainResponse(const ChainResponse &response);
std::vector<uint8_t> EncodeChainRequest(const ChainRequest &request);
std::vector<uint8_t> EncodeBlock(const CBlock &block);

// Trial-parses payload as ChainResponse, then ChainRequest, then Block, and
// returns the first shape that fits. Never throws.
GossipMessage DecodeMessage(const std::vector<uint8_t> &payload);

// Name of the alternative held by msg, for log lines
const char *MessageKindToString(const GossipMessage &msg);

} // namespace message
} // namespace floodchain
