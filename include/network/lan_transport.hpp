#pragma once

#include "network/protocol.hpp"
#include "network/transport.hpp"
#include <atomic>
#include <utility>
#include <boost/asio.hpp>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace floodchain {
namespace network {

class GossipStream;

/**
 * LanGossipTransport - boost::asio implementation of GossipTransport
 *
 * Discovery (UDP): every beacon_interval a beacon {peer_id, port, agent,
 * version} goes to the multicast group (unless multicast_discovery is off)
 * and to every unicast beacon target. `port` is this node's TCP listen port.
 * Each distinct (peer_id, sender address:port) seen in a beacon is one
 * discovery signal; a signal not refreshed within peer_ttl expires.
 *
 * Delivery (TCP): publish() wraps the payload in an envelope
 * {source, topic, data} and writes it as one length-prefixed frame to every
 * group member, over one persistent outbound stream per signal endpoint.
 * Frames on a stream arrive in publish order. Inbound envelopes for
 * unsubscribed topics are dropped.
 *
 * Runs on a caller-owned io_context. All socket, stream and discovery state
 * is touched only from that io_context's thread; publish() posts onto it.
 * stop() must be called from that thread or once it has stopped running.
 */
class LanGossipTransport : public GossipTransport {
public:
  struct Config {
    std::string bind_address{"0.0.0.0"};
    uint16_t listen_port{protocol::ports::GOSSIP}; // TCP, 0 = ephemeral
    bool multicast_discovery{true};
    std::string discovery_group{protocol::DISCOVERY_MULTICAST_GROUP};
    uint16_t discovery_port{protocol::ports::DISCOVERY}; // 0 = ephemeral
    // Extra "address:port" discovery sockets beaconed by unicast, for hosts
    // the multicast group does not reach
    std::vector<std::string> beacon_targets;
    std::chrono::milliseconds beacon_interval{protocol::BEACON_INTERVAL};
    std::chrono::milliseconds peer_ttl{protocol::PEER_TTL};
    std::chrono::milliseconds connect_timeout{protocol::CONNECT_TIMEOUT};
  };

  LanGossipTransport(boost::asio::io_context &io_context,
                     const GossipConfig &gossip, const Config &config);
  ~LanGossipTransport() override;

  LanGossipTransport(const LanGossipTransport &) = delete;
  LanGossipTransport &operator=(const LanGossipTransport &) = delete;

  // GossipTransport interface
  bool start() override;
  void stop() override;
  bool is_running() const override { return running_; }
  void subscribe(const std::string &topic) override;
  bool publish(const std::string &topic, const std::vector<uint8_t> &data) override;
  void add_group_member(const std::string &peer_id) override;
  void remove_group_member(const std::string &peer_id) override;
  void set_message_callback(GossipMessageCallback callback) override;
  void set_peer_event_callback(PeerEventCallback callback) override;

  // Beacon to address:port by unicast from now on. Returns false for an
  // unparseable address.
  bool add_beacon_target(const std::string &address, uint16_t port);

  // Test/diagnostic: bound ports (0 if not started)
  uint16_t listening_port() const { return bound_port_; }
  uint16_t discovery_port() const { return bound_discovery_port_; }

private:
  using udp = boost::asio::ip::udp;
  using tcp = boost::asio::ip::tcp;

  // One discovery signal
  struct SignalRecord {
    tcp::endpoint stream_endpoint;
    std::chrono::steady_clock::time_point last_seen;
  };
  using SignalKey = std::pair<std::string, std::string>; // (peer_id, endpoint)

  bool open_sockets();
  void close_sockets();

  void start_accept();
  void start_discovery_receive();
  void schedule_tick();
  void handle_tick();

  void send_beacon();
  void handle_beacon(const std::vector<uint8_t> &data, const udp::endpoint &sender);
  void handle_envelope(const std::vector<uint8_t> &data, const std::string &remote);
  void expire_stale_signals();
  void do_publish(const std::string &topic,
                  const std::shared_ptr<const std::vector<uint8_t>> &frame);

  std::shared_ptr<GossipStream> make_stream(tcp::socket socket,
                                            const std::string &remote,
                                            bool outbound);
  std::shared_ptr<GossipStream> get_outbound(const tcp::endpoint &endpoint);
  void forget_stream(const std::shared_ptr<GossipStream> &stream);

  void emit_peer_event(PeerEvent::Kind kind, const std::string &peer_id,
                       const std::string &endpoint);

  boost::asio::io_context &io_context_;
  const GossipConfig &gossip_;
  Config config_;

  tcp::acceptor acceptor_;
  udp::socket discovery_socket_;
  boost::asio::steady_timer tick_timer_;

  std::vector<uint8_t> discovery_buffer_;
  udp::endpoint discovery_sender_;

  // io_context thread only
  std::vector<udp::endpoint> beacon_targets_;       // rebuilt from config_ on start()
  std::vector<udp::endpoint> added_beacon_targets_; // add_beacon_target()
  std::map<SignalKey, SignalRecord> signals_;
  std::map<std::string, std::shared_ptr<GossipStream>> outbound_; // by "address:port"
  std::set<std::shared_ptr<GossipStream>> inbound_;

  // Guarded by state_mutex_ (subscribe/group changes may come from any thread)
  mutable std::mutex state_mutex_;
  std::set<std::string> subscriptions_;
  std::set<std::string> group_;
  GossipMessageCallback message_callback_;
  PeerEventCallback peer_event_callback_;

  std::atomic<bool> running_{false};
  std::atomic<uint16_t> bound_port_{0};
  std::atomic<uint16_t> bound_discovery_port_{0};
};

} // namespace network
} // namespace floodchain
