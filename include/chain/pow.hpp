// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/block.hpp"
#include "util/sha256.hpp"
#include <cstdint>
#include <span>
#include <string>

namespace floodchain {

namespace validation {
class ValidationState;
}

namespace consensus {

// Proof-of-work admission rule: the binary rendering of a block hash must
// start with this many zero bits. Fixed for the whole network.
static constexpr unsigned int DIFFICULTY_PREFIX_BITS = 16;

// Canonical hash preimage: compact JSON with lexicographically ordered keys
//   {"data":..,"id":..,"nonce":..,"previous_hash":..,"timestamp":..}
std::string SerializeHashPreimage(uint64_t id, int64_t timestamp,
                                  const std::string &previous_hash,
                                  const std::string &data, uint64_t nonce);

// SHA-256 of SerializeHashPreimage(). Pure and deterministic.
Digest ComputeBlockHash(uint64_t id, int64_t timestamp,
                        const std::string &previous_hash,
                        const std::string &data, uint64_t nonce);

// Each byte rendered as 8 binary digits, most significant bit first
std::string HashToBinary(std::span<const uint8_t> hash);

// True if the first prefix_bits bits of hash are zero.
// A hash shorter than prefix_bits bits never satisfies the rule.
bool SatisfiesDifficulty(std::span<const uint8_t> hash,
                         unsigned int prefix_bits = DIFFICULTY_PREFIX_BITS);

// CONSENSUS-CRITICAL: decodes block.hash from hex and applies
// SatisfiesDifficulty(). Malformed hex sets INVALID_ENCODING, an
// unsatisfied prefix sets INSUFFICIENT_WORK.
bool CheckProofOfWork(const CBlock &block, validation::ValidationState &state);

} // namespace consensus
} // namespace floodchain
