// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/block.hpp"
#include "chain/chain_selector.hpp"
#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

namespace floodchain {

namespace chain {
class ChainParams;
} // namespace chain

namespace validation {

class ValidationState;

// ChainstateManager - Owner of this node's ledger
// Index 0 is always the genesis block. The sequence only grows by
// AcceptBlock() or is swapped wholesale by ReplaceChain(); blocks are never
// edited in place.
//
// THREAD SAFETY: mutations are expected from the gossip handler thread only;
// the internal mutex lets other threads (miner, console) take snapshots.
class ChainstateManager {
public:
  // LIFETIME: ChainParams reference must outlive this ChainstateManager
  explicit ChainstateManager(const chain::ChainParams &params);

  // Seed the ledger with the genesis block. Returns false if the ledger is
  // already populated.
  bool Initialize();

  // Validate block against the current tip and append it on success.
  // Rejections are logged and described in state; the ledger is unchanged.
  // Throws std::logic_error if the ledger is empty (Initialize() not called).
  bool AcceptBlock(const CBlock &block, ValidationState &state);

  // Overwrite the ledger. Performs no validation: callers run fork
  // selection first.
  void ReplaceChain(std::vector<CBlock> chain);

  // Run SelectChain(local, remote) and adopt remote when it wins.
  // NONE (both invalid) leaves the ledger untouched and sets NO_VALID_CHAIN.
  ChainChoice ProcessRemoteChain(const std::vector<CBlock> &remote,
                                 ValidationState &state);

  // Copy of the current ledger
  std::vector<CBlock> GetChain() const;

  // Throws std::logic_error if the ledger is empty
  CBlock GetTip() const;

  size_t GetBlockCount() const;

  const chain::ChainParams &GetParams() const { return params_; }

  // Persist as {version, block_count, blocks[]} via atomic rename
  bool Save(const std::string &filepath) const;

  // Load a saved ledger. Rejected unless the format version matches, block 0
  // equals the genesis constant and the chain validates.
  bool Load(const std::string &filepath);

private:
  const chain::ChainParams &params_;

  mutable std::mutex validation_mutex_;
  std::vector<CBlock> chain_;
};

} // namespace validation
} // namespace floodchain
