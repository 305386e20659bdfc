// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "chain/validation.hpp"
#include "chain/block.hpp"
#include "chain/pow.hpp"
#include "util/logging.hpp"

namespace floodchain {
namespace validation {

const char *BlockValidationResultToString(BlockValidationResult result) {
  switch (result) {
  case BlockValidationResult::VALID:
    return "valid";
  case BlockValidationResult::BROKEN_LINK:
    return "broken-link";
  case BlockValidationResult::INSUFFICIENT_WORK:
    return "insufficient-work";
  case BlockValidationResult::OUT_OF_SEQUENCE:
    return "out-of-sequence";
  case BlockValidationResult::HASH_MISMATCH:
    return "hash-mismatch";
  case BlockValidationResult::INVALID_ENCODING:
    return "invalid-encoding";
  case BlockValidationResult::NO_VALID_CHAIN:
    return "no-valid-chain";
  }
  return "unknown";
}

std::string ValidationState::ToString() const {
  if (IsValid()) {
    return "valid";
  }
  if (debug_message_.empty()) {
    return reject_reason_;
  }
  return reject_reason_ + ": " + debug_message_;
}

bool CheckBlock(const CBlock &block, const CBlock &prev, ValidationState &state) {
  if (block.hashPrevBlock != prev.hash) {
    LOG_CHAIN_TRACE("block {} has wrong previous hash", block.nId);
    return state.Invalid(BlockValidationResult::BROKEN_LINK, "bad-prevblk",
                         "block " + std::to_string(block.nId) +
                             " does not link to " + prev.ToShortString());
  }

  if (!consensus::CheckProofOfWork(block, state)) {
    LOG_CHAIN_TRACE("block {} failed proof of work: {}", block.nId, state.ToString());
    return false;
  }

  if (block.nId != prev.nId + 1) {
    LOG_CHAIN_TRACE("block {} is not the next block after {}", block.nId, prev.nId);
    return state.Invalid(BlockValidationResult::OUT_OF_SEQUENCE, "bad-sequence",
                         "block " + std::to_string(block.nId) +
                             " is not the next block after " +
                             std::to_string(prev.nId));
  }

  if (block.ComputeHash() != block.hash) {
    LOG_CHAIN_TRACE("block {} has invalid hash", block.nId);
    return state.Invalid(BlockValidationResult::HASH_MISMATCH, "bad-hash",
                         "block " + std::to_string(block.nId) +
                             " hash does not match its contents");
  }

  return true;
}

bool CheckChain(const std::vector<CBlock> &chain, ValidationState &state) {
  for (size_t i = 1; i < chain.size(); ++i) {
    if (!CheckBlock(chain[i], chain[i - 1], state)) {
      LOG_CHAIN_TRACE("chain invalid at index {}: {}", i, state.ToString());
      const std::string reason = state.GetRejectReason();
      return state.Invalid(state.GetResult(), reason,
                           "index " + std::to_string(i) + ": " +
                               state.GetDebugMessage());
    }
  }
  return true;
}

} // namespace validation
} // namespace floodchain
