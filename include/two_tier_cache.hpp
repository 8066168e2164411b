#pragma once

#include <string>
#include <optional>
#include <chrono>
#include "lru_cache.hpp"
#include "key_value_store.hpp"
#include "circuit_breaker.hpp"

namespace veil {

enum class CacheTier {
    LOCAL,
    REMOTE
};

struct CacheLookup {
    std::string value;
    CacheTier tier;
};

// Local bounded LRU in front of the shared store. The store is authoritative;
// the local tier is an accelerator only. Remote reads and writes go through the
// circuit breaker and are best-effort: a remote failure degrades to a miss (on
// read) or to an advisory failure counter (on write), never to an exception.
class TwoTierCache {
public:
    /**
     * @param name Metric prefix, e.g. "region" gives region_cache_size.
     * @param capacity Maximum number of local entries.
     */
    TwoTierCache(std::string name, size_t capacity, KeyValueStore& store,
                 CircuitBreaker& breaker, Clock clock = system_clock());

    // Same key in both tiers.
    std::optional<CacheLookup> get(const std::string& key) { return get(key, key); }

    // Local lookup by local_key; on miss, shared store lookup by remote_key,
    // which then populates the local tier.
    std::optional<CacheLookup> get(const std::string& local_key, const std::string& remote_key,
                                   std::chrono::seconds local_ttl = std::chrono::seconds(0));

    // Writes both tiers. Returns false when the remote write failed.
    bool put(const std::string& local_key, const std::string& remote_key, const std::string& value,
             std::chrono::seconds remote_ttl,
             std::chrono::seconds local_ttl = std::chrono::seconds(0));

    void put_local(const std::string& key, const std::string& value,
                   std::chrono::seconds ttl = std::chrono::seconds(0));

    // Drops the local entry and deletes the remote key (best-effort).
    void invalidate(const std::string& local_key, const std::string& remote_key);

    size_t local_size() const { return local_.size(); }
    void clear_local();

private:
    void publish_size();

    std::string name_;
    LruCache<std::string, std::string> local_;
    KeyValueStore& store_;
    CircuitBreaker& breaker_;
};

}
