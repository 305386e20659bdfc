// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/block.hpp"
#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace floodchain {

namespace chain {
class ChainParams;
} // namespace chain

namespace validation {
class ChainstateManager;
}

namespace mining {

// Block template - candidate on top of the tip, nonce not yet searched
struct BlockTemplate {
  CBlock block;
  std::string hashPrevBlock; // tip hash the template was built on
};

// CPU Miner - single worker thread searching nonces for one block
// The found block is handed to the callback; the miner never touches the
// ledger itself. Whoever receives the block submits it like a peer
// announcement.
class CPUMiner {
public:
  using BlockFoundCallback = std::function<void(const CBlock &block)>;

  CPUMiner(const chain::ChainParams &params,
           const validation::ChainstateManager &chainstate);
  ~CPUMiner();

  CPUMiner(const CPUMiner &) = delete;
  CPUMiner &operator=(const CPUMiner &) = delete;

  // Mine one block carrying data on the current tip. on_found runs on the
  // worker thread. Returns false if a search is already running.
  bool Start(const std::string &data, BlockFoundCallback on_found);
  void Stop();

  bool IsMining() const { return mining_.load(); }
  uint64_t GetTotalHashes() const { return total_hashes_.load(); }
  int GetBlocksFound() const { return blocks_found_.load(); }

  // Synchronous search from nonce 0 upward. Returns std::nullopt only when
  // keep_running is supplied and becomes false.
  static std::optional<CBlock>
  MineBlock(const CBlock &prev, const std::string &data, int64_t timestamp,
            const std::atomic<bool> *keep_running = nullptr);

  // === Test/Diagnostic Methods ===
  BlockTemplate DebugCreateBlockTemplate(const std::string &data) {
    return CreateBlockTemplate(data);
  }

private:
  void MiningWorker(std::string data, BlockFoundCallback on_found);
  BlockTemplate CreateBlockTemplate(const std::string &data) const;
  bool ShouldRegenerateTemplate(const std::string &prev_hash) const;

  // Tries nonces [block.nNonce, block.nNonce + count). On success block.hash
  // holds the satisfying digest. hashes is incremented per attempt.
  static bool SearchNonces(CBlock &block, uint64_t count, uint64_t &hashes);

  const chain::ChainParams &params_;
  const validation::ChainstateManager &chainstate_;

  std::atomic<bool> mining_{false};
  std::atomic<uint64_t> total_hashes_{0};
  std::atomic<int> blocks_found_{0};

  std::thread worker_;
  mutable std::mutex stop_mutex_; // Protects Stop() from concurrent calls
};

} // namespace mining
} // namespace floodchain
