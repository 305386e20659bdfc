// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "chain/pow.hpp"
#include "chain/validation.hpp"
#include "util/string_parsing.hpp"
#include <nlohmann/json.hpp>

namespace floodchain {
namespace consensus {

std::string SerializeHashPreimage(uint64_t id, int64_t timestamp,
                                  const std::string &previous_hash,
                                  const std::string &data, uint64_t nonce) {
  // nlohmann::json objects are std::map backed, so dump() emits keys in
  // lexicographic order
  nlohmann::json j;
  j["id"] = id;
  j["previous_hash"] = previous_hash;
  j["data"] = data;
  j["timestamp"] = timestamp;
  j["nonce"] = nonce;
  return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

Digest ComputeBlockHash(uint64_t id, int64_t timestamp,
                        const std::string &previous_hash,
                        const std::string &data, uint64_t nonce) {
  return Sha256(SerializeHashPreimage(id, timestamp, previous_hash, data, nonce));
}

std::string HashToBinary(std::span<const uint8_t> hash) {
  std::string bits;
  bits.reserve(hash.size() * 8);
  for (uint8_t byte : hash) {
    for (int i = 7; i >= 0; --i) {
      bits.push_back(((byte >> i) & 1) ? '1' : '0');
    }
  }
  return bits;
}

bool SatisfiesDifficulty(std::span<const uint8_t> hash, unsigned int prefix_bits) {
  const std::string bits = HashToBinary(hash);
  if (bits.size() < prefix_bits) {
    return false;
  }
  return bits.compare(0, prefix_bits, std::string(prefix_bits, '0')) == 0;
}

bool CheckProofOfWork(const CBlock &block, validation::ValidationState &state) {
  auto decoded = util::ParseHex(block.hash);
  if (!decoded) {
    return state.Invalid(validation::BlockValidationResult::INVALID_ENCODING,
                         "bad-hash-encoding",
                         "block " + std::to_string(block.nId) +
                             " hash is not valid hex");
  }

  if (!SatisfiesDifficulty(*decoded)) {
    return state.Invalid(validation::BlockValidationResult::INSUFFICIENT_WORK,
                         "high-hash",
                         "block " + std::to_string(block.nId) +
                             " hash does not start with " +
                             std::to_string(DIFFICULTY_PREFIX_BITS) + " zero bits");
  }

  return true;
}

} // namespace consensus
} // namespace floodchain
