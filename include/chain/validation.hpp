// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <string>
#include <vector>

class CBlock;

namespace floodchain {
namespace validation {

/**
 * ============================================================================
 * BLOCK VALIDATION
 * ============================================================================
 *
 * CheckBlock()  : one candidate against its claimed predecessor
 *                 1. linkage      (hashPrevBlock == prev.hash)
 *                 2. proof of work (hash decodes and has the zero-bit prefix)
 *                 3. sequence     (nId == prev.nId + 1)
 *                 4. integrity    (hash == ComputeHash())
 *                 First failing check wins; later checks are not run.
 *
 * CheckChain()  : CheckBlock() over every adjacent pair. Index 0 (genesis)
 *                 is the trust anchor and is never checked itself.
 *
 * Neither function has side effects beyond trace logging.
 * ============================================================================
 */

// Why a block or chain was rejected
enum class BlockValidationResult {
  VALID,
  BROKEN_LINK,       // previous hash does not match predecessor
  INSUFFICIENT_WORK, // hash misses the difficulty prefix
  OUT_OF_SEQUENCE,   // id is not predecessor id + 1
  HASH_MISMATCH,     // hash is not the digest of the block contents
  INVALID_ENCODING,  // hash is not valid hex
  NO_VALID_CHAIN,    // fork selection: neither chain validates
};

const char *BlockValidationResultToString(BlockValidationResult result);

/**
 * Validation state - tracks why validation failed
 * Simplified from Bitcoin Core's BlockValidationState
 */
class ValidationState {
public:
  ValidationState() = default;

  bool IsValid() const { return result_ == BlockValidationResult::VALID; }
  bool IsInvalid() const { return result_ != BlockValidationResult::VALID; }

  bool Invalid(BlockValidationResult result, const std::string &reject_reason,
               const std::string &debug_message = "") {
    result_ = result;
    reject_reason_ = reject_reason;
    debug_message_ = debug_message;
    return false;
  }

  BlockValidationResult GetResult() const { return result_; }
  const std::string &GetRejectReason() const { return reject_reason_; }
  const std::string &GetDebugMessage() const { return debug_message_; }

  // "<reject reason>: <debug message>" for log lines
  std::string ToString() const;

private:
  BlockValidationResult result_{BlockValidationResult::VALID};
  std::string reject_reason_;
  std::string debug_message_;
};

// CONSENSUS-CRITICAL: validates block against its immediate predecessor
bool CheckBlock(const CBlock &block, const CBlock &prev, ValidationState &state);

// CONSENSUS-CRITICAL: validates every adjacent pair of chain (skipping the
// genesis anchor). Empty and single-element chains are valid.
bool CheckChain(const std::vector<CBlock> &chain, ValidationState &state);

} // namespace validation
} // namespace floodchain
