#pragma once

#include <list>
#include <unordered_map>
#include <optional>
#include <mutex>
#include <chrono>
#include <functional>
#include <utility>
#include "clock.hpp"

namespace veil {

// Bounded, thread-safe least-recently-used map. A single mutex serializes
// lookups (which reorder the recency list), insertions and evictions.
// Entries may carry a TTL; expired entries behave as misses and are dropped lazily.
template <typename K, typename V>
class LruCache {
public:
    explicit LruCache(size_t capacity, Clock clock = system_clock())
        : capacity_(capacity == 0 ? 1 : capacity), clock_(std::move(clock)) {}

    LruCache(const LruCache&) = delete;
    LruCache& operator=(const LruCache&) = delete;

    std::optional<V> get(const K& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = index_.find(key);
        if (it == index_.end()) return std::nullopt;

        auto node = it->second;
        if (node->expires_at && clock_() >= *node->expires_at) {
            order_.erase(node);
            index_.erase(it);
            return std::nullopt;
        }
        order_.splice(order_.begin(), order_, node);
        return node->value;
    }

    // Inserts or replaces. A zero ttl keeps the entry until evicted.
    void put(const K& key, V value, std::chrono::seconds ttl = std::chrono::seconds(0)) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::optional<TimePoint> expires_at;
        if (ttl.count() > 0) expires_at = clock_() + ttl;

        auto it = index_.find(key);
        if (it != index_.end()) {
            it->second->value = std::move(value);
            it->second->expires_at = expires_at;
            order_.splice(order_.begin(), order_, it->second);
            return;
        }

        order_.push_front(Node{key, std::move(value), expires_at});
        index_[key] = order_.begin();

        while (index_.size() > capacity_) {
            index_.erase(order_.back().key);
            order_.pop_back();
        }
    }

    bool erase(const K& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = index_.find(key);
        if (it == index_.end()) return false;
        order_.erase(it->second);
        index_.erase(it);
        return true;
    }

    // Removes every entry whose value satisfies pred. Returns the count removed.
    size_t erase_if(const std::function<bool(const K&, const V&)>& pred) {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t removed = 0;
        for (auto node = order_.begin(); node != order_.end();) {
            if (pred(node->key, node->value)) {
                index_.erase(node->key);
                node = order_.erase(node);
                ++removed;
            } else {
                ++node;
            }
        }
        return removed;
    }

    size_t purge_expired() {
        std::lock_guard<std::mutex> lock(mutex_);
        TimePoint now = clock_();
        size_t removed = 0;
        for (auto node = order_.begin(); node != order_.end();) {
            if (node->expires_at && now >= *node->expires_at) {
                index_.erase(node->key);
                node = order_.erase(node);
                ++removed;
            } else {
                ++node;
            }
        }
        return removed;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return index_.size();
    }

    size_t capacity() const { return capacity_; }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        order_.clear();
        index_.clear();
    }

private:
    struct Node {
        K key;
        V value;
        std::optional<TimePoint> expires_at;
    };

    const size_t capacity_;
    Clock clock_;
    mutable std::mutex mutex_;
    std::list<Node> order_;  // front = most recently used
    std::unordered_map<K, typename std::list<Node>::iterator> index_;
};

}
