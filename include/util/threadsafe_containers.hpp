#pragma once

#include <map>
#include <mutex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace floodchain {
namespace util {

/**
 * ThreadSafeMap - Thread-safe wrapper around std::map or std::unordered_map
 *
 * Usage:
 *   ThreadSafeMap<std::string, PeerRecord> peers_;
 *   peers_.Upsert(id, PeerRecord{}, [](PeerRecord& r) { r.endpoints.insert(ep); });
 *
 *   peers_.EraseIf(id, [](const PeerRecord& r) { return r.endpoints.empty(); });
 *
 * Design decisions:
 * - All operations are atomic (single lock per operation)
 * - Modify() and Upsert() use callbacks to avoid copies and keep
 *   read-modify-write sequences under one lock
 * - No iterator-based API to avoid lock lifetime issues
 */
template <typename Key, typename Value,
          template<typename...> class MapType = std::unordered_map>
class ThreadSafeMap {
public:
    ThreadSafeMap() = default;

    // Non-copyable and non-movable (mutex cannot be moved)
    ThreadSafeMap(const ThreadSafeMap&) = delete;
    ThreadSafeMap& operator=(const ThreadSafeMap&) = delete;
    ThreadSafeMap(ThreadSafeMap&&) = delete;
    ThreadSafeMap& operator=(ThreadSafeMap&&) = delete;

    bool Contains(const Key& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return map_.count(key) > 0;
    }

    /**
     * Remove entry only if predicate(const Value&) holds
     * Returns true if removed
     */
    template <typename Pred>
    bool EraseIf(const Key& key, Pred&& predicate) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = map_.find(key);
        if (it != map_.end() && predicate(it->second)) {
            map_.erase(it);
            return true;
        }
        return false;
    }

    // Snapshot of all keys (safe to iterate without lock)
    std::vector<Key> GetKeys() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<Key> keys;
        keys.reserve(map_.size());
        for (const auto& [key, _] : map_) {
            keys.push_back(key);
        }
        return keys;
    }

    /**
     * In-place modification
     * Calls modifier(value) under lock
     * Returns true if key exists and was modified, false otherwise
     */
    template <typename Func>
    bool Modify(const Key& key, Func&& modifier) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = map_.find(key);
        if (it != map_.end()) {
            modifier(it->second);
            return true;
        }
        return false;
    }

    /**
     * Insert default_value if key is absent, then call modifier(value) under
     * the same lock
     * Returns true if the key was newly inserted
     */
    template <typename Func>
    bool Upsert(const Key& key, const Value& default_value, Func&& modifier) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto [it, inserted] = map_.try_emplace(key, default_value);
        modifier(it->second);
        return inserted;
    }

private:
    mutable std::mutex mutex_;
    MapType<Key, Value> map_;
};

} // namespace util
} // namespace floodchain
