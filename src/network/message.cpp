// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/message.hpp"
#include "util/logging.hpp"
#include <nlohmann/json.hpp>
#include <optional>

namespace floodchain {
namespace message {

namespace {

std::vector<uint8_t> ToBytes(const nlohmann::json &j) {
  // Block data is opaque; invalid UTF-8 is replaced rather than thrown on
  const std::string s = j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  return std::vector<uint8_t>(s.begin(), s.end());
}

std::optional<ChainResponse> ParseChainResponse(const nlohmann::json &j) {
  auto receiver = j.find("receiver");
  auto blocks = j.find("blocks");
  if (receiver == j.end() || blocks == j.end() || !receiver->is_string()) {
    return std::nullopt;
  }
  auto chain = ChainFromJson(*blocks);
  if (!chain) {
    return std::nullopt;
  }
  return ChainResponse{receiver->get<std::string>(), std::move(*chain)};
}

std::optional<ChainRequest> ParseChainRequest(const nlohmann::json &j) {
  auto from = j.find("from_peer_id");
  if (from == j.end() || !from->is_string()) {
    return std::nullopt;
  }
  return ChainRequest{from->get<std::string>()};
}

} // namespace

std::vector<uint8_t> EncodeChainResponse(const ChainResponse &response) {
  nlohmann::json j;
  j["receiver"] = response.receiver;
  j["blocks"] = ChainToJson(response.blocks);
  return ToBytes(j);
}

std::vector<uint8_t> EncodeChainRequest(const ChainRequest &request) {
  nlohmann::json j;
  j["from_peer_id"] = request.from_peer_id;
  return ToBytes(j);
}

std::vector<uint8_t> EncodeBlock(const CBlock &block) {
  return ToBytes(BlockToJson(block));
}

GossipMessage DecodeMessage(const std::vector<uint8_t> &payload) {
  nlohmann::json j;
  try {
    j = nlohmann::json::parse(payload.begin(), payload.end());
  } catch (const nlohmann::json::exception &e) {
    LOG_NET_TRACE("payload is not JSON: {}", e.what());
    return Unrecognized{"not-json"};
  }

  if (!j.is_object()) {
    return Unrecognized{"not-an-object"};
  }

  if (auto response = ParseChainResponse(j)) {
    return std::move(*response);
  }
  if (auto request = ParseChainRequest(j)) {
    return std::move(*request);
  }
  if (auto block = BlockFromJson(j)) {
    return std::move(*block);
  }
  return Unrecognized{"unknown-shape"};
}

const char *MessageKindToString(const GossipMessage &msg) {
  switch (msg.index()) {
  case 0:
    return "chain-response";
  case 1:
    return "chain-request";
  case 2:
    return "block";
  default:
    return "unrecognized";
  }
}

} // namespace message
} // namespace floodchain
