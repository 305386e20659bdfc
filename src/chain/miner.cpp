// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
//
// Simple single-threaded CPU miner. Finds a nonce whose block hash meets the
// fixed difficulty prefix and hands the block to its caller.

#include "chain/miner.hpp"
#include "chain/chainparams.hpp"
#include "chain/chainstate_manager.hpp"
#include "chain/pow.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include "util/time.hpp"

namespace floodchain {
namespace mining {

// Nonces tried between checks of the stop flag and the chain tip
static constexpr uint64_t NONCE_BATCH = 4096;

CPUMiner::CPUMiner(const chain::ChainParams &params,
                   const validation::ChainstateManager &chainstate)
    : params_(params), chainstate_(chainstate) {}

CPUMiner::~CPUMiner() { Stop(); }

bool CPUMiner::Start(const std::string &data, BlockFoundCallback on_found) {
  bool expected = false;
  if (!mining_.compare_exchange_strong(expected, true)) {
    LOG_MINING_WARN("Miner: Already mining");
    return false;
  }

  // Join any previous thread if it finished
  std::lock_guard<std::mutex> lock(stop_mutex_);
  if (worker_.joinable()) {
    worker_.join();
  }

  worker_ = std::thread([this, data, on_found = std::move(on_found)]() mutable {
    MiningWorker(std::move(data), std::move(on_found));
  });
  return true;
}

void CPUMiner::Stop() {
  mining_.store(false);

  std::lock_guard<std::mutex> lock(stop_mutex_);
  if (worker_.joinable()) {
    worker_.join();
    LOG_MINING_TRACE("Miner: Stopped (total hashes: {}, blocks found: {})",
                     total_hashes_.load(), blocks_found_.load());
  }
}

std::optional<CBlock> CPUMiner::MineBlock(const CBlock &prev, const std::string &data,
                                          int64_t timestamp,
                                          const std::atomic<bool> *keep_running) {
  CBlock block;
  block.nId = prev.nId + 1;
  block.hashPrevBlock = prev.hash;
  block.nTime = timestamp;
  block.data = data;
  block.nNonce = 0;

  uint64_t hashes = 0;
  while (!keep_running || keep_running->load()) {
    if (SearchNonces(block, NONCE_BATCH, hashes)) {
      return block;
    }
  }
  return std::nullopt;
}

bool CPUMiner::SearchNonces(CBlock &block, uint64_t count, uint64_t &hashes) {
  for (uint64_t i = 0; i < count; ++i) {
    const Digest digest = consensus::ComputeBlockHash(
        block.nId, block.nTime, block.hashPrevBlock, block.data, block.nNonce);
    ++hashes;
    if (consensus::SatisfiesDifficulty(digest)) {
      block.hash = util::HexStr(digest);
      return true;
    }
    ++block.nNonce;
  }
  return false;
}

void CPUMiner::MiningWorker(std::string data, BlockFoundCallback on_found) {
  BlockTemplate local_template = CreateBlockTemplate(data);

  LOG_MINING_INFO("Miner: mining block {} on top of {} (difficulty {} bits)",
                  local_template.block.nId, local_template.hashPrevBlock.substr(0, 16),
                  params_.GetConsensus().nDifficultyPrefixBits);

  while (mining_.load()) {
    if (ShouldRegenerateTemplate(local_template.hashPrevBlock)) {
      LOG_MINING_TRACE("Miner: Chain tip changed, regenerating template");
      local_template = CreateBlockTemplate(data);
    }

    uint64_t hashes = 0;
    bool found = SearchNonces(local_template.block, NONCE_BATCH, hashes);
    total_hashes_.fetch_add(hashes);

    if (found) {
      blocks_found_.fetch_add(1);
      mining_.store(false);
      LOG_MINING_INFO("Miner: *** BLOCK FOUND *** {} nonce {}",
                      local_template.block.ToShortString(),
                      local_template.block.nNonce);
      if (on_found) {
        on_found(local_template.block);
      }
      break;
    }
  }

  LOG_MINING_TRACE("Miner: Worker thread exiting");
}

BlockTemplate CPUMiner::CreateBlockTemplate(const std::string &data) const {
  const CBlock tip = chainstate_.GetTip();

  BlockTemplate tmpl;
  tmpl.hashPrevBlock = tip.hash;
  tmpl.block.nId = tip.nId + 1;
  tmpl.block.hashPrevBlock = tip.hash;
  tmpl.block.nTime = util::GetTime();
  tmpl.block.data = data;
  tmpl.block.nNonce = 0;
  return tmpl;
}

bool CPUMiner::ShouldRegenerateTemplate(const std::string &prev_hash) const {
  return chainstate_.GetTip().hash != prev_hash;
}

} // namespace mining
} // namespace floodchain
