#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace floodchain {
namespace network {

// Abstract gossip transport
// Allows dependency injection of different implementations:
// - LanGossipTransport: UDP discovery beacons + TCP envelope streams via boost::asio
// - MockGossipTransport / in-memory bus: message passing for testing (in test/)

// Discovery signal for one (peer, endpoint) pair
struct PeerEvent {
  enum class Kind { DISCOVERED, EXPIRED };

  Kind kind;
  std::string peer_id;
  std::string endpoint; // "address:port" the signal came from
};

// Callback types for transport events
using GossipMessageCallback =
    std::function<void(const std::string &topic, const std::string &source,
                       const std::vector<uint8_t> &data)>;
using PeerEventCallback = std::function<void(const PeerEvent &event)>;

// GossipTransport - topic-scoped broadcast to the current gossip group
// Callbacks are invoked on the transport's event thread.
class GossipTransport {
public:
  virtual ~GossipTransport() = default;

  // Start discovery and delivery (returns false if sockets could not be set up)
  virtual bool start() = 0;
  virtual void stop() = 0;
  virtual bool is_running() const = 0;

  // Deliver inbound messages on topic to the message callback
  virtual void subscribe(const std::string &topic) = 0;

  // Send data on topic to every group member. Fire-and-forget: returns false
  // only if the payload was refused outright (not running, too large).
  virtual bool publish(const std::string &topic,
                       const std::vector<uint8_t> &data) = 0;

  // Gossip group scope, driven by PeerMembership
  virtual void add_group_member(const std::string &peer_id) = 0;
  virtual void remove_group_member(const std::string &peer_id) = 0;

  virtual void set_message_callback(GossipMessageCallback callback) = 0;
  virtual void set_peer_event_callback(PeerEventCallback callback) = 0;
};

} // namespace network
} // namespace floodchain
