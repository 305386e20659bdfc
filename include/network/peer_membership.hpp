// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "util/threadsafe_containers.hpp"
#include <set>
#include <string>
#include <vector>

namespace floodchain {
namespace network {

// PeerMembership - which peers belong to the active gossip group
//
// A peer can be reachable through several discovery signals at once (one per
// endpoint it beacons from). Each signal is a vouch. A peer joins the group
// on its first vouch and leaves only when its last vouch expires; an expiry
// from one endpoint while another still vouches changes nothing.
//
// Thread-safe: discovery events arrive independently of gossip traffic.
class PeerMembership {
public:
  PeerMembership() = default;

  // Record that endpoint vouches for peer_id.
  // Returns true if the peer just joined the group.
  bool OnDiscovered(const std::string &peer_id, const std::string &endpoint);

  // Withdraw endpoint's vouch for peer_id.
  // Returns true if the peer just left the group (no vouch remains).
  bool OnExpired(const std::string &peer_id, const std::string &endpoint);

  bool IsMember(const std::string &peer_id) const;

  // Sorted peer ids
  std::vector<std::string> GetMembers() const;

private:
  struct PeerRecord {
    std::set<std::string> endpoints;
  };

  util::ThreadSafeMap<std::string, PeerRecord> peers_;
};

} // namespace network
} // namespace floodchain
