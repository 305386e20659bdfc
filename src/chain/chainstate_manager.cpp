// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "chain/chainstate_manager.hpp"
#include "chain/chainparams.hpp"
#include "chain/validation.hpp"
#include "util/files.hpp"
#include "util/logging.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace floodchain {
namespace validation {

static constexpr int LEDGER_FILE_VERSION = 1;

ChainstateManager::ChainstateManager(const chain::ChainParams &params)
    : params_(params) {}

bool ChainstateManager::Initialize() {
  std::lock_guard<std::mutex> lock(validation_mutex_);

  if (!chain_.empty()) {
    LOG_CHAIN_ERROR("Initialize called on a populated ledger ({} blocks)", chain_.size());
    return false;
  }

  chain_.push_back(params_.GenesisBlock());
  LOG_CHAIN_INFO("Ledger initialized with genesis {}", chain_.front().ToShortString());
  return true;
}

bool ChainstateManager::AcceptBlock(const CBlock &block, ValidationState &state) {
  std::lock_guard<std::mutex> lock(validation_mutex_);

  if (chain_.empty()) {
    throw std::logic_error("AcceptBlock called before Initialize: ledger has no genesis");
  }

  if (!CheckBlock(block, chain_.back(), state)) {
    LOG_CHAIN_WARN("could not add block {} - invalid: {}", block.nId, state.ToString());
    return false;
  }

  chain_.push_back(block);
  LOG_CHAIN_INFO("Accepted block {} (ledger now {} blocks)", block.ToShortString(),
                 chain_.size());
  return true;
}

void ChainstateManager::ReplaceChain(std::vector<CBlock> chain) {
  std::lock_guard<std::mutex> lock(validation_mutex_);
  LOG_CHAIN_INFO("Replacing ledger: {} blocks -> {} blocks", chain_.size(), chain.size());
  chain_ = std::move(chain);
}

ChainChoice ChainstateManager::ProcessRemoteChain(const std::vector<CBlock> &remote,
                                                  ValidationState &state) {
  std::lock_guard<std::mutex> lock(validation_mutex_);

  ChainChoice choice = SelectChain(chain_, remote, state);
  switch (choice) {
  case ChainChoice::REMOTE:
    LOG_CHAIN_INFO("Adopting remote chain: {} blocks -> {} blocks", chain_.size(),
                   remote.size());
    chain_ = remote;
    break;
  case ChainChoice::LOCAL:
    if (state.IsInvalid()) {
      LOG_CHAIN_WARN("Rejected remote chain of {} blocks: {}", remote.size(),
                     state.ToString());
    } else {
      LOG_CHAIN_DEBUG("Keeping local chain ({} blocks, remote {})", chain_.size(),
                      remote.size());
    }
    break;
  case ChainChoice::NONE:
    LOG_CHAIN_ERROR("Local and remote chains are both invalid, refusing adoption: {}",
                    state.ToString());
    break;
  }
  return choice;
}

std::vector<CBlock> ChainstateManager::GetChain() const {
  std::lock_guard<std::mutex> lock(validation_mutex_);
  return chain_;
}

CBlock ChainstateManager::GetTip() const {
  std::lock_guard<std::mutex> lock(validation_mutex_);
  if (chain_.empty()) {
    throw std::logic_error("GetTip called before Initialize: ledger has no genesis");
  }
  return chain_.back();
}

size_t ChainstateManager::GetBlockCount() const {
  std::lock_guard<std::mutex> lock(validation_mutex_);
  return chain_.size();
}

bool ChainstateManager::Save(const std::string &filepath) const {
  using json = nlohmann::json;

  json root;
  {
    std::lock_guard<std::mutex> lock(validation_mutex_);
    root["version"] = LEDGER_FILE_VERSION;
    root["block_count"] = chain_.size();
    root["blocks"] = ChainToJson(chain_);
  }

  std::string text;
  try {
    text = root.dump(2, ' ', false, json::error_handler_t::replace);
  } catch (const json::exception &e) {
    LOG_CHAIN_ERROR("Failed to serialize ledger: {}", e.what());
    return false;
  }

  if (!util::atomic_write_file(filepath, text)) {
    LOG_CHAIN_ERROR("Failed to write ledger file: {}", filepath);
    return false;
  }

  LOG_CHAIN_DEBUG("Saved {} blocks to {}", root["block_count"].get<size_t>(), filepath);
  return true;
}

bool ChainstateManager::Load(const std::string &filepath) {
  using json = nlohmann::json;

  auto text = util::read_file_string(filepath);
  if (!text) {
    LOG_CHAIN_DEBUG("Ledger file not found: {} (starting fresh)", filepath);
    return false;
  }

  json root;
  try {
    root = json::parse(*text);
  } catch (const json::exception &e) {
    LOG_CHAIN_ERROR("Failed to parse ledger file {}: {}", filepath, e.what());
    return false;
  }

  if (!root.is_object()) {
    LOG_CHAIN_ERROR("Ledger file {} is not a JSON object", filepath);
    return false;
  }

  auto version = root.find("version");
  if (version == root.end() || !version->is_number_integer() ||
      version->get<int>() != LEDGER_FILE_VERSION) {
    LOG_CHAIN_ERROR("Unsupported ledger file version in {}", filepath);
    return false;
  }

  auto blocks = root.find("blocks");
  if (blocks == root.end()) {
    LOG_CHAIN_ERROR("Ledger file {} has no blocks", filepath);
    return false;
  }

  auto chain = ChainFromJson(*blocks);
  if (!chain || chain->empty()) {
    LOG_CHAIN_ERROR("Ledger file {} has malformed blocks", filepath);
    return false;
  }

  if (chain->front() != params_.GenesisBlock()) {
    LOG_CHAIN_ERROR("GENESIS MISMATCH: ledger file {} starts with {}, expected {}",
                    filepath, chain->front().ToShortString(),
                    params_.GenesisBlock().ToShortString());
    return false;
  }

  ValidationState state;
  if (!CheckChain(*chain, state)) {
    LOG_CHAIN_ERROR("Ledger file {} failed validation: {}", filepath, state.ToString());
    return false;
  }

  std::lock_guard<std::mutex> lock(validation_mutex_);
  chain_ = std::move(*chain);
  LOG_CHAIN_INFO("Loaded {} blocks from {}", chain_.size(), filepath);
  return true;
}

} // namespace validation
} // namespace floodchain
