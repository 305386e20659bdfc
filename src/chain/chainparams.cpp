// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "chain/chainparams.hpp"
#include "chain/pow.hpp"

namespace floodchain {
namespace chain {

CBlock CreateGenesisBlock() {
  // Fixed constants shared by every node. The genesis block is exempt from
  // validation, so its hash is taken as given rather than recomputed.
  CBlock genesis;
  genesis.nId = 0;
  genesis.hash = "0000f816a87f806bb0073dcf026a64fb40c946b5abee2573702828694d5b4c43";
  genesis.hashPrevBlock = CBlock::GENESIS_PREV_HASH;
  genesis.nTime = 1634567890;
  genesis.data = "genesis!";
  genesis.nNonce = 2836;
  return genesis;
}

ChainParams::ChainParams() : genesis(CreateGenesisBlock()) {
  consensus.nDifficultyPrefixBits = ::floodchain::consensus::DIFFICULTY_PREFIX_BITS;
  consensus.hashGenesisBlock = genesis.hash;
}

std::unique_ptr<ChainParams> ChainParams::Create() {
  return std::make_unique<ChainParams>();
}

} // namespace chain
} // namespace floodchain
