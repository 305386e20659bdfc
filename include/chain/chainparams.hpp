// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/block.hpp"
#include <cstdint>
#include <memory>
#include <string>

namespace floodchain {
namespace chain {

/**
 * Consensus parameters
 */
struct ConsensusParams {
  // Leading zero bits every non-genesis block hash must carry
  unsigned int nDifficultyPrefixBits;

  // Hash of genesis block (trust anchor, never validated)
  std::string hashGenesisBlock;
};

/**
 * ChainParams - Network-wide constants
 * Simplified version of Bitcoin's CChainParams with a single network
 */
class ChainParams {
public:
  ChainParams();

  const ConsensusParams &GetConsensus() const { return consensus; }
  const CBlock &GenesisBlock() const { return genesis; }

  static std::unique_ptr<ChainParams> Create();

private:
  ConsensusParams consensus;
  CBlock genesis;
};

// Helper to create the hardcoded genesis block
CBlock CreateGenesisBlock();

} // namespace chain
} // namespace floodchain
