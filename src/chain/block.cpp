// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "chain/block.hpp"
#include "chain/pow.hpp"
#include "util/string_parsing.hpp"
#include "util/time.hpp"
#include <nlohmann/json.hpp>
#include <sstream>

std::string CBlock::ComputeHash() const {
  const floodchain::Digest digest = floodchain::consensus::ComputeBlockHash(
      nId, nTime, hashPrevBlock, data, nNonce);
  return floodchain::util::HexStr(digest);
}

std::string CBlock::ToShortString() const {
  return "#" + std::to_string(nId) + " " + hash.substr(0, 16);
}

std::string CBlock::ToString() const {
  std::stringstream s;
  s << "CBlock(\n";
  s << "  id=" << nId << "\n";
  s << "  hash=" << hash << "\n";
  s << "  previous_hash=" << hashPrevBlock << "\n";
  s << "  timestamp=" << nTime << " (" << floodchain::util::FormatTime(nTime) << ")\n";
  s << "  data=" << data << "\n";
  s << "  nonce=" << nNonce << "\n";
  s << ")\n";
  return s.str();
}

nlohmann::json BlockToJson(const CBlock& block) {
  nlohmann::json j;
  j["id"] = block.nId;
  j["hash"] = block.hash;
  j["previous_hash"] = block.hashPrevBlock;
  j["timestamp"] = block.nTime;
  j["data"] = block.data;
  j["nonce"] = block.nNonce;
  return j;
}

std::optional<CBlock> BlockFromJson(const nlohmann::json& j) {
  if (!j.is_object()) {
    return std::nullopt;
  }

  auto id = j.find("id");
  auto hash = j.find("hash");
  auto prev = j.find("previous_hash");
  auto time = j.find("timestamp");
  auto data = j.find("data");
  auto nonce = j.find("nonce");
  if (id == j.end() || hash == j.end() || prev == j.end() ||
      time == j.end() || data == j.end() || nonce == j.end()) {
    return std::nullopt;
  }

  // nlohmann stores non-negative integer literals as unsigned
  if (!id->is_number_unsigned() || !nonce->is_number_unsigned() ||
      !time->is_number_integer() || !hash->is_string() ||
      !prev->is_string() || !data->is_string()) {
    return std::nullopt;
  }

  // A timestamp above INT64_MAX parses as unsigned and would wrap
  if (time->is_number_unsigned() &&
      time->get<uint64_t>() > static_cast<uint64_t>(INT64_MAX)) {
    return std::nullopt;
  }

  CBlock block;
  block.nId = id->get<uint64_t>();
  block.hash = hash->get<std::string>();
  block.hashPrevBlock = prev->get<std::string>();
  block.nTime = time->get<int64_t>();
  block.data = data->get<std::string>();
  block.nNonce = nonce->get<uint64_t>();
  return block;
}

nlohmann::json ChainToJson(const std::vector<CBlock>& chain) {
  nlohmann::json blocks = nlohmann::json::array();
  for (const auto& block : chain) {
    blocks.push_back(BlockToJson(block));
  }
  return blocks;
}

std::optional<std::vector<CBlock>> ChainFromJson(const nlohmann::json& j) {
  if (!j.is_array()) {
    return std::nullopt;
  }

  std::vector<CBlock> chain;
  chain.reserve(j.size());
  for (const auto& element : j) {
    auto block = BlockFromJson(element);
    if (!block) {
      return std::nullopt;
    }
    chain.push_back(std::move(*block));
  }
  return chain;
}
