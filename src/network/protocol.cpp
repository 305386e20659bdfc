// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/protocol.hpp"
#include "util/string_parsing.hpp"
#include <random>
#include <vector>

namespace floodchain {
namespace network {

std::string GeneratePeerId() {
  // static random_device prevents fd-exhaustion on OSes where random_device
  // opens /dev/urandom each call
  static std::random_device rd;
  std::mt19937_64 gen(rd());
  std::uniform_int_distribution<unsigned int> dis(0, 255);

  std::vector<uint8_t> bytes(protocol::PEER_ID_BYTES);
  for (auto &b : bytes) {
    b = static_cast<uint8_t>(dis(gen));
  }
  return util::HexStr(bytes);
}

} // namespace network
} // namespace floodchain
