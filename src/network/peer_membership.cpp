// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/peer_membership.hpp"
#include "util/logging.hpp"
#include <algorithm>

namespace floodchain {
namespace network {

bool PeerMembership::OnDiscovered(const std::string &peer_id,
                                  const std::string &endpoint) {
  size_t vouches = 0;
  bool joined = peers_.Upsert(peer_id, PeerRecord{}, [&](PeerRecord &record) {
    record.endpoints.insert(endpoint);
    vouches = record.endpoints.size();
  });

  if (joined) {
    LOG_NET_INFO("peer {} joined gossip group via {}", peer_id, endpoint);
  } else {
    LOG_NET_TRACE("peer {} vouched by {} ({} signals)", peer_id, endpoint, vouches);
  }
  return joined;
}

bool PeerMembership::OnExpired(const std::string &peer_id,
                               const std::string &endpoint) {
  size_t remaining = 0;
  bool known = peers_.Modify(peer_id, [&](PeerRecord &record) {
    record.endpoints.erase(endpoint);
    remaining = record.endpoints.size();
  });
  if (!known) {
    LOG_NET_TRACE("expiry for unknown peer {} ignored", peer_id);
    return false;
  }

  // A concurrent discovery may have re-vouched between the two calls;
  // the predicate is evaluated under the map lock.
  bool left = peers_.EraseIf(peer_id, [](const PeerRecord &record) {
    return record.endpoints.empty();
  });

  if (left) {
    LOG_NET_INFO("peer {} left gossip group", peer_id);
  } else {
    LOG_NET_DEBUG("peer {} expired via {} but still vouched by {} signal(s)",
                  peer_id, endpoint, remaining);
  }
  return left;
}

bool PeerMembership::IsMember(const std::string &peer_id) const {
  return peers_.Contains(peer_id);
}

std::vector<std::string> PeerMembership::GetMembers() const {
  std::vector<std::string> members = peers_.GetKeys();
  std::sort(members.begin(), members.end());
  return members;
}

} // namespace network
} // namespace floodchain
