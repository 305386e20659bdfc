// Copyright (c) 2025 The Unicity Foundation
// LAN gossip transport using boost::asio (UDP discovery beacons + TCP envelope streams)

#include "network/lan_transport.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include <algorithm>
#include <array>
#include <deque>
#include <functional>
#include <nlohmann/json.hpp>
#include <optional>

namespace floodchain {
namespace network {

namespace {

std::string EndpointToString(const boost::asio::ip::address &address, uint16_t port) {
  return address.to_string() + ":" + std::to_string(port);
}

// "address:port" -> endpoint (IPv4 or IPv6 literal, no name resolution)
std::optional<boost::asio::ip::udp::endpoint> ParseUdpEndpoint(const std::string &text) {
  const size_t colon = text.rfind(':');
  if (colon == std::string::npos) {
    return std::nullopt;
  }
  std::string host = text.substr(0, colon);
  if (host.size() >= 2 && host.front() == '[' && host.back() == ']') {
    host = host.substr(1, host.size() - 2);
  }
  auto port = util::SafeParsePort(text.substr(colon + 1));
  boost::system::error_code ec;
  auto address = boost::asio::ip::make_address(host, ec);
  if (ec || !port) {
    return std::nullopt;
  }
  return boost::asio::ip::udp::endpoint(address, *port);
}

void WriteBE32(uint8_t *out, uint32_t value) {
  out[0] = static_cast<uint8_t>(value >> 24);
  out[1] = static_cast<uint8_t>(value >> 16);
  out[2] = static_cast<uint8_t>(value >> 8);
  out[3] = static_cast<uint8_t>(value);
}

uint32_t ReadBE32(const uint8_t *in) {
  return (static_cast<uint32_t>(in[0]) << 24) | (static_cast<uint32_t>(in[1]) << 16) |
         (static_cast<uint32_t>(in[2]) << 8) | static_cast<uint32_t>(in[3]);
}

// magic | body length | body
std::shared_ptr<const std::vector<uint8_t>> MakeFrame(const std::string &body) {
  auto frame = std::make_shared<std::vector<uint8_t>>(protocol::FRAME_HEADER_SIZE +
                                                      body.size());
  WriteBE32(frame->data(), protocol::ENVELOPE_MAGIC);
  WriteBE32(frame->data() + 4, static_cast<uint32_t>(body.size()));
  std::copy(body.begin(), body.end(), frame->begin() + protocol::FRAME_HEADER_SIZE);
  return frame;
}

} // namespace

// ============================================================================
// GossipStream
// ============================================================================

/**
 * GossipStream - one TCP connection carrying envelope frames
 *
 * Outbound streams queue frames while connecting. Either side may write;
 * every complete frame read is handed to the frame callback. Any socket
 * error, a bad magic or an out-of-bounds length closes the stream, and the
 * closed callback fires exactly once.
 *
 * io_context thread only.
 */
class GossipStream : public std::enable_shared_from_this<GossipStream> {
public:
  using tcp = boost::asio::ip::tcp;
  using FrameCallback =
      std::function<void(const std::vector<uint8_t> &body, const std::string &remote)>;
  using ClosedCallback = std::function<void(const std::shared_ptr<GossipStream> &stream)>;

  GossipStream(tcp::socket socket, std::string remote, bool outbound,
               FrameCallback on_frame, ClosedCallback on_closed)
      : socket_(std::move(socket)), connect_timer_(socket_.get_executor()),
        remote_(std::move(remote)), outbound_(outbound),
        on_frame_(std::move(on_frame)), on_closed_(std::move(on_closed)) {}

  GossipStream(const GossipStream &) = delete;
  GossipStream &operator=(const GossipStream &) = delete;

  const std::string &remote() const { return remote_; }
  bool is_outbound() const { return outbound_; }

  // Inbound: the socket is already connected
  void start() {
    set_socket_options();
    read_header();
  }

  // Outbound: frames sent before the connection completes are queued
  void connect(const tcp::endpoint &endpoint, std::chrono::milliseconds timeout) {
    connecting_ = true;
    auto self = shared_from_this();

    connect_timer_.expires_after(timeout);
    connect_timer_.async_wait([this, self](const boost::system::error_code &ec) {
      if (ec || closed_ || !connecting_) {
        return;
      }
      LOG_NET_DEBUG("connect to {} timed out", remote_);
      close();
    });

    socket_.async_connect(endpoint, [this, self](const boost::system::error_code &ec) {
      if (closed_) {
        return;
      }
      connecting_ = false;
      connect_timer_.cancel();
      if (ec) {
        LOG_NET_DEBUG("connect to {} failed: {}", remote_, ec.message());
        close();
        return;
      }
      LOG_NET_TRACE("envelope stream to {} connected", remote_);
      set_socket_options();
      read_header();
      write_next();
    });
  }

  // Returns false if the stream is closed or the frame overflowed the queue
  bool send(const std::shared_ptr<const std::vector<uint8_t>> &frame) {
    if (closed_) {
      return false;
    }
    if (queued_bytes_ + frame->size() > protocol::MAX_SEND_QUEUE_SIZE) {
      LOG_NET_WARN("send queue to {} overflowed ({} bytes queued), dropping stream",
                   remote_, queued_bytes_);
      close();
      return false;
    }
    queue_.push_back(frame);
    queued_bytes_ += frame->size();
    if (!connecting_ && !writing_) {
      write_next();
    }
    return true;
  }

  void close() {
    if (closed_) {
      return;
    }
    closed_ = true;
    connecting_ = false;
    writing_ = false;

    boost::system::error_code ignored;
    connect_timer_.cancel();
    socket_.close(ignored);
    queue_.clear();
    queued_bytes_ = 0;

    on_frame_ = nullptr;
    ClosedCallback on_closed = std::move(on_closed_);
    on_closed_ = nullptr;
    if (on_closed) {
      on_closed(shared_from_this());
    }
  }

private:
  void set_socket_options() {
    boost::system::error_code ignored;
    socket_.set_option(tcp::no_delay(true), ignored);
    socket_.set_option(boost::asio::socket_base::keep_alive(true), ignored);
  }

  void write_next() {
    if (closed_ || queue_.empty()) {
      writing_ = false;
      return;
    }
    writing_ = true;
    auto frame = queue_.front();
    boost::asio::async_write(
        socket_, boost::asio::buffer(*frame),
        [this, self = shared_from_this(), frame](const boost::system::error_code &ec,
                                                 std::size_t) {
          if (closed_) {
            return;
          }
          if (ec) {
            LOG_NET_DEBUG("write to {} failed: {}", remote_, ec.message());
            close();
            return;
          }
          queued_bytes_ -= frame->size();
          queue_.pop_front();
          write_next();
        });
  }

  void read_header() {
    boost::asio::async_read(
        socket_, boost::asio::buffer(header_),
        [this, self = shared_from_this()](const boost::system::error_code &ec,
                                          std::size_t) {
          if (closed_) {
            return;
          }
          if (ec) {
            if (ec != boost::asio::error::eof) {
              LOG_NET_TRACE("read from {} failed: {}", remote_, ec.message());
            }
            close();
            return;
          }

          const uint32_t magic = ReadBE32(header_.data());
          const uint32_t length = ReadBE32(header_.data() + 4);
          if (magic != protocol::ENVELOPE_MAGIC) {
            LOG_NET_DEBUG("bad frame magic {:08x} from {}, dropping stream", magic,
                          remote_);
            close();
            return;
          }
          if (length == 0 || length > protocol::MAX_ENVELOPE_SIZE) {
            LOG_NET_DEBUG("frame of {} bytes from {} out of bounds, dropping stream",
                          length, remote_);
            close();
            return;
          }
          body_.resize(length);
          read_body();
        });
  }

  void read_body() {
    boost::asio::async_read(
        socket_, boost::asio::buffer(body_),
        [this, self = shared_from_this()](const boost::system::error_code &ec,
                                          std::size_t) {
          if (closed_) {
            return;
          }
          if (ec) {
            LOG_NET_TRACE("read from {} failed mid-frame: {}", remote_, ec.message());
            close();
            return;
          }
          if (on_frame_) {
            on_frame_(body_, remote_);
          }
          if (!closed_) {
            read_header();
          }
        });
  }

  tcp::socket socket_;
  boost::asio::steady_timer connect_timer_;
  const std::string remote_;
  const bool outbound_;
  FrameCallback on_frame_;
  ClosedCallback on_closed_;

  std::array<uint8_t, protocol::FRAME_HEADER_SIZE> header_{};
  std::vector<uint8_t> body_;

  std::deque<std::shared_ptr<const std::vector<uint8_t>>> queue_;
  size_t queued_bytes_{0};
  bool connecting_{false};
  bool writing_{false};
  bool closed_{false};
};

// ============================================================================
// LanGossipTransport
// ============================================================================

LanGossipTransport::LanGossipTransport(boost::asio::io_context &io_context,
                                       const GossipConfig &gossip,
                                       const Config &config)
    : io_context_(io_context), gossip_(gossip), config_(config),
      acceptor_(io_context), discovery_socket_(io_context), tick_timer_(io_context),
      discovery_buffer_(protocol::MAX_BEACON_SIZE) {}

LanGossipTransport::~LanGossipTransport() { stop(); }

bool LanGossipTransport::start() {
  if (running_) {
    LOG_NET_TRACE("transport already running");
    return false;
  }
  if (!open_sockets()) {
    close_sockets();
    return false;
  }

  running_ = true;
  start_accept();
  start_discovery_receive();

  // First beacon immediately so peers learn about us without waiting a full
  // interval
  boost::asio::post(io_context_, [this]() {
    if (running_) {
      send_beacon();
    }
  });
  schedule_tick();

  LOG_NET_INFO("gossip transport listening on {}:{}, discovery port {} ({})",
               config_.bind_address, bound_port_.load(), bound_discovery_port_.load(),
               config_.multicast_discovery ? config_.discovery_group : "unicast only");
  return true;
}

void LanGossipTransport::stop() {
  if (!running_.exchange(false)) {
    return;
  }
  tick_timer_.cancel();

  // Closed callbacks see running_ == false and leave the maps alone
  auto outbound = std::move(outbound_);
  auto inbound = std::move(inbound_);
  outbound_.clear();
  inbound_.clear();
  for (auto &[endpoint, stream] : outbound) {
    stream->close();
  }
  for (const auto &stream : inbound) {
    stream->close();
  }

  close_sockets();
  LOG_NET_TRACE("gossip transport stopped");
}

bool LanGossipTransport::open_sockets() {
  try {
    auto bind_addr = boost::asio::ip::make_address(config_.bind_address);

    tcp::endpoint listen_endpoint(bind_addr, config_.listen_port);
    acceptor_.open(listen_endpoint.protocol());
    acceptor_.set_option(tcp::acceptor::reuse_address(true));
    acceptor_.bind(listen_endpoint);
    acceptor_.listen(boost::asio::socket_base::max_listen_connections);
    bound_port_ = acceptor_.local_endpoint().port();

    beacon_targets_.clear();
    discovery_socket_.open(udp::v4());
    if (config_.multicast_discovery) {
      auto group_addr = boost::asio::ip::make_address(config_.discovery_group);
      // Several nodes on one host share the discovery port
      discovery_socket_.set_option(udp::socket::reuse_address(true));
      discovery_socket_.bind(udp::endpoint(udp::v4(), config_.discovery_port));
      discovery_socket_.set_option(boost::asio::ip::multicast::join_group(group_addr));
      discovery_socket_.set_option(boost::asio::ip::multicast::hops(1));
      discovery_socket_.set_option(boost::asio::ip::multicast::enable_loopback(true));
      bound_discovery_port_ = discovery_socket_.local_endpoint().port();
      beacon_targets_.emplace_back(group_addr, bound_discovery_port_.load());
    } else {
      discovery_socket_.bind(udp::endpoint(bind_addr, config_.discovery_port));
      bound_discovery_port_ = discovery_socket_.local_endpoint().port();
    }

    for (const auto &target : config_.beacon_targets) {
      auto endpoint = ParseUdpEndpoint(target);
      if (!endpoint) {
        LOG_NET_ERROR("invalid beacon target '{}' (expected address:port)", target);
        return false;
      }
      beacon_targets_.push_back(*endpoint);
    }
    return true;
  } catch (const boost::system::system_error &e) {
    LOG_NET_ERROR("failed to open gossip sockets (port {}, discovery port {}): {}",
                  config_.listen_port, config_.discovery_port, e.what());
    return false;
  }
}

void LanGossipTransport::close_sockets() {
  boost::system::error_code ec;
  if (acceptor_.is_open()) {
    acceptor_.close(ec);
  }
  if (discovery_socket_.is_open()) {
    discovery_socket_.close(ec);
  }
  bound_port_ = 0;
  bound_discovery_port_ = 0;
}

void LanGossipTransport::subscribe(const std::string &topic) {
  std::lock_guard<std::mutex> lock(state_mutex_);
  subscriptions_.insert(topic);
  LOG_NET_DEBUG("subscribed to topic '{}'", topic);
}

void LanGossipTransport::add_group_member(const std::string &peer_id) {
  std::lock_guard<std::mutex> lock(state_mutex_);
  group_.insert(peer_id);
}

void LanGossipTransport::remove_group_member(const std::string &peer_id) {
  std::lock_guard<std::mutex> lock(state_mutex_);
  group_.erase(peer_id);
}

void LanGossipTransport::set_message_callback(GossipMessageCallback callback) {
  std::lock_guard<std::mutex> lock(state_mutex_);
  message_callback_ = std::move(callback);
}

void LanGossipTransport::set_peer_event_callback(PeerEventCallback callback) {
  std::lock_guard<std::mutex> lock(state_mutex_);
  peer_event_callback_ = std::move(callback);
}

bool LanGossipTransport::add_beacon_target(const std::string &address, uint16_t port) {
  boost::system::error_code ec;
  auto addr = boost::asio::ip::make_address(address, ec);
  if (ec || port == 0) {
    LOG_NET_WARN("invalid beacon target {}:{}", address, port);
    return false;
  }

  boost::asio::post(io_context_, [this, target = udp::endpoint(addr, port)]() {
    if (std::find(added_beacon_targets_.begin(), added_beacon_targets_.end(), target) ==
        added_beacon_targets_.end()) {
      added_beacon_targets_.push_back(target);
    }
    if (running_) {
      send_beacon();
    }
  });
  return true;
}

bool LanGossipTransport::publish(const std::string &topic,
                                 const std::vector<uint8_t> &data) {
  if (!running_) {
    LOG_NET_TRACE("publish on '{}' dropped: transport not running", topic);
    return false;
  }

  nlohmann::json envelope;
  envelope["source"] = gossip_.local_id;
  envelope["topic"] = topic;
  envelope["data"] = std::string(data.begin(), data.end());
  const std::string body =
      envelope.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);

  if (body.size() > protocol::MAX_ENVELOPE_SIZE) {
    LOG_NET_WARN("refusing to publish {} byte envelope on '{}' (limit {})",
                 body.size(), topic, protocol::MAX_ENVELOPE_SIZE);
    return false;
  }

  boost::asio::post(io_context_, [this, topic, frame = MakeFrame(body)]() {
    do_publish(topic, frame);
  });
  return true;
}

void LanGossipTransport::do_publish(
    const std::string &topic, const std::shared_ptr<const std::vector<uint8_t>> &frame) {
  if (!running_) {
    return;
  }

  std::set<std::string> group;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    group = group_;
  }

  // Freshest signal per member decides which stream carries its frame
  std::map<std::string, const SignalRecord *> targets;
  for (const auto &[key, record] : signals_) {
    if (!group.count(key.first)) {
      continue;
    }
    auto it = targets.find(key.first);
    if (it == targets.end() || it->second->last_seen < record.last_seen) {
      targets[key.first] = &record;
    }
  }

  for (const auto &[peer_id, record] : targets) {
    if (!get_outbound(record->stream_endpoint)->send(frame)) {
      LOG_NET_DEBUG("could not queue '{}' frame for peer {}", topic, peer_id);
    }
  }

  LOG_NET_TRACE("published {} bytes on '{}' to {} peer(s)", frame->size(), topic,
                targets.size());
}

std::shared_ptr<GossipStream> LanGossipTransport::make_stream(tcp::socket socket,
                                                              const std::string &remote,
                                                              bool outbound) {
  return std::make_shared<GossipStream>(
      std::move(socket), remote, outbound,
      [this](const std::vector<uint8_t> &body, const std::string &from) {
        if (running_) {
          handle_envelope(body, from);
        }
      },
      [this](const std::shared_ptr<GossipStream> &stream) { forget_stream(stream); });
}

std::shared_ptr<GossipStream> LanGossipTransport::get_outbound(const tcp::endpoint &endpoint) {
  const std::string key = EndpointToString(endpoint.address(), endpoint.port());
  auto it = outbound_.find(key);
  if (it != outbound_.end()) {
    return it->second;
  }

  auto stream = make_stream(tcp::socket(io_context_), key, true);
  outbound_.emplace(key, stream);
  stream->connect(endpoint, config_.connect_timeout);
  return stream;
}

void LanGossipTransport::forget_stream(const std::shared_ptr<GossipStream> &stream) {
  if (!running_) {
    return;
  }
  if (stream->is_outbound()) {
    auto it = outbound_.find(stream->remote());
    if (it != outbound_.end() && it->second == stream) {
      outbound_.erase(it);
    }
  } else {
    inbound_.erase(stream);
  }
}

void LanGossipTransport::start_accept() {
  acceptor_.async_accept([this](const boost::system::error_code &ec, tcp::socket socket) {
    if (ec == boost::asio::error::operation_aborted || !running_) {
      return;
    }
    if (ec) {
      LOG_NET_TRACE("accept error: {}", ec.message());
    } else {
      boost::system::error_code ep_ec;
      auto remote = socket.remote_endpoint(ep_ec);
      const std::string from =
          ep_ec ? std::string("unknown") : EndpointToString(remote.address(), remote.port());
      LOG_NET_DEBUG("envelope stream from {} accepted", from);

      auto stream = make_stream(std::move(socket), from, false);
      inbound_.insert(stream);
      stream->start();
    }
    start_accept();
  });
}

void LanGossipTransport::start_discovery_receive() {
  discovery_socket_.async_receive_from(
      boost::asio::buffer(discovery_buffer_), discovery_sender_,
      [this](const boost::system::error_code &ec, std::size_t bytes) {
        if (ec == boost::asio::error::operation_aborted || !running_) {
          return;
        }
        if (ec) {
          LOG_NET_DEBUG("discovery receive error: {}", ec.message());
        } else {
          std::vector<uint8_t> data(discovery_buffer_.begin(),
                                    discovery_buffer_.begin() + bytes);
          handle_beacon(data, discovery_sender_);
        }
        start_discovery_receive();
      });
}

void LanGossipTransport::schedule_tick() {
  tick_timer_.expires_after(config_.beacon_interval);
  tick_timer_.async_wait([this](const boost::system::error_code &ec) {
    if (ec == boost::asio::error::operation_aborted || !running_) {
      return;
    }
    handle_tick();
    schedule_tick();
  });
}

void LanGossipTransport::handle_tick() {
  send_beacon();
  expire_stale_signals();
}

void LanGossipTransport::send_beacon() {
  nlohmann::json beacon;
  beacon["peer_id"] = gossip_.local_id;
  beacon["port"] = bound_port_.load();
  beacon["agent"] = protocol::GetUserAgent();
  beacon["version"] = protocol::PROTOCOL_VERSION;
  auto buffer = std::make_shared<std::string>(beacon.dump());

  auto send_to = [this, &buffer](const udp::endpoint &target) {
    discovery_socket_.async_send_to(
        boost::asio::buffer(*buffer), target,
        [buffer, target](const boost::system::error_code &ec, std::size_t) {
          if (ec && ec != boost::asio::error::operation_aborted) {
            LOG_NET_DEBUG("beacon to {} failed: {}",
                          EndpointToString(target.address(), target.port()),
                          ec.message());
          }
        });
  };
  for (const auto &target : beacon_targets_) {
    send_to(target);
  }
  for (const auto &target : added_beacon_targets_) {
    send_to(target);
  }
}

void LanGossipTransport::handle_beacon(const std::vector<uint8_t> &data,
                                       const udp::endpoint &sender) {
  std::string peer_id;
  uint16_t port = 0;
  try {
    auto beacon = nlohmann::json::parse(data.begin(), data.end());
    const auto &id = beacon.at("peer_id");
    const auto &p = beacon.at("port");
    if (!id.is_string() || !p.is_number_unsigned() || p.get<uint64_t>() == 0 ||
        p.get<uint64_t>() > 65535) {
      LOG_NET_TRACE("malformed beacon from {}", sender.address().to_string());
      return;
    }
    peer_id = id.get<std::string>();
    port = static_cast<uint16_t>(p.get<uint64_t>());
  } catch (const nlohmann::json::exception &e) {
    LOG_NET_TRACE("unparseable beacon from {}: {}", sender.address().to_string(),
                  e.what());
    return;
  }

  if (peer_id.empty() || peer_id == gossip_.local_id) {
    return;
  }

  const std::string endpoint = EndpointToString(sender.address(), port);
  const SignalKey key{peer_id, endpoint};
  const auto now = std::chrono::steady_clock::now();

  auto it = signals_.find(key);
  if (it != signals_.end()) {
    it->second.last_seen = now;
    return;
  }

  signals_.emplace(key, SignalRecord{tcp::endpoint(sender.address(), port), now});
  LOG_NET_DEBUG("discovered peer {} at {}", peer_id, endpoint);
  emit_peer_event(PeerEvent::Kind::DISCOVERED, peer_id, endpoint);
}

void LanGossipTransport::expire_stale_signals() {
  const auto cutoff = std::chrono::steady_clock::now() - config_.peer_ttl;

  std::vector<SignalKey> expired;
  for (auto it = signals_.begin(); it != signals_.end();) {
    if (it->second.last_seen < cutoff) {
      expired.push_back(it->first);
      it = signals_.erase(it);
    } else {
      ++it;
    }
  }

  for (const auto &[peer_id, endpoint] : expired) {
    LOG_NET_DEBUG("peer {} at {} expired", peer_id, endpoint);

    // Drop the stream once no live signal points at its endpoint
    const bool still_used =
        std::any_of(signals_.begin(), signals_.end(),
                    [&endpoint = endpoint](const auto &entry) {
                      return entry.first.second == endpoint;
                    });
    auto stream = outbound_.find(endpoint);
    if (!still_used && stream != outbound_.end()) {
      auto closing = stream->second;
      closing->close();
    }

    emit_peer_event(PeerEvent::Kind::EXPIRED, peer_id, endpoint);
  }
}

void LanGossipTransport::handle_envelope(const std::vector<uint8_t> &data,
                                         const std::string &remote) {
  std::string source;
  std::string topic;
  std::string payload;
  try {
    auto envelope = nlohmann::json::parse(data.begin(), data.end());
    const auto &s = envelope.at("source");
    const auto &t = envelope.at("topic");
    const auto &d = envelope.at("data");
    if (!s.is_string() || !t.is_string() || !d.is_string()) {
      LOG_NET_TRACE("malformed envelope from {}", remote);
      return;
    }
    source = s.get<std::string>();
    topic = t.get<std::string>();
    payload = d.get<std::string>();
  } catch (const nlohmann::json::exception &e) {
    LOG_NET_TRACE("unparseable envelope from {}: {}", remote, e.what());
    return;
  }

  if (source == gossip_.local_id) {
    return;
  }

  GossipMessageCallback callback;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (!subscriptions_.count(topic)) {
      LOG_NET_TRACE("dropping envelope on unsubscribed topic '{}'", topic);
      return;
    }
    callback = message_callback_;
  }

  if (callback) {
    callback(topic, source, std::vector<uint8_t>(payload.begin(), payload.end()));
  }
}

void LanGossipTransport::emit_peer_event(PeerEvent::Kind kind,
                                         const std::string &peer_id,
                                         const std::string &endpoint) {
  PeerEventCallback callback;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    callback = peer_event_callback_;
  }
  if (callback) {
    callback(PeerEvent{kind, peer_id, endpoint});
  }
}

} // namespace network
} // namespace floodchain
