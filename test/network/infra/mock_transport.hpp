#pragma once

#include "network/transport.hpp"
#include <atomic>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace floodchain {
namespace network {

// Simple gossip transport mock for unit tests
// Records everything published and lets tests inject inbound traffic.
class MockGossipTransport : public GossipTransport {
public:
    struct Published {
        std::string topic;
        std::vector<uint8_t> data;
    };

    bool start() override { running_ = true; return start_result_; }
    void stop() override { running_ = false; }
    bool is_running() const override { return running_; }

    void subscribe(const std::string& topic) override {
        std::lock_guard<std::mutex> lock(mutex_);
        subscriptions_.insert(topic);
    }

    bool publish(const std::string& topic, const std::vector<uint8_t>& data) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!accept_publish_) return false;
        published_.push_back(Published{topic, data});
        return true;
    }

    void add_group_member(const std::string& peer_id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        group_.insert(peer_id);
    }

    void remove_group_member(const std::string& peer_id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        group_.erase(peer_id);
    }

    void set_message_callback(GossipMessageCallback callback) override { message_callback_ = callback; }
    void set_peer_event_callback(PeerEventCallback callback) override { peer_event_callback_ = callback; }

    // Test controls
    void set_start_result(bool result) { start_result_ = result; }
    void set_accept_publish(bool accept) { accept_publish_ = accept; }

    void simulate_message(const std::string& topic, const std::string& source,
                          const std::vector<uint8_t>& data) {
        if (message_callback_) {
            message_callback_(topic, source, data);
        }
    }

    void simulate_peer_event(PeerEvent::Kind kind, const std::string& peer_id,
                             const std::string& endpoint) {
        if (peer_event_callback_) {
            peer_event_callback_(PeerEvent{kind, peer_id, endpoint});
        }
    }

    std::vector<Published> get_published() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return published_;
    }

    void clear_published() {
        std::lock_guard<std::mutex> lock(mutex_);
        published_.clear();
    }

    size_t published_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return published_.size();
    }

    std::set<std::string> get_group() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return group_;
    }

    std::set<std::string> get_subscriptions() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return subscriptions_;
    }

private:
    std::atomic<bool> running_{false};
    bool start_result_ = true;
    bool accept_publish_ = true;
    GossipMessageCallback message_callback_;
    PeerEventCallback peer_event_callback_;
    mutable std::mutex mutex_;
    std::vector<Published> published_;
    std::set<std::string> group_;
    std::set<std::string> subscriptions_;
};

} // namespace network
} // namespace floodchain
