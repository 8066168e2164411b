#pragma once

#include <string>
#include <unordered_map>
#include <unordered_set>
#include <optional>
#include <mutex>
#include "clock.hpp"
#include "key_value_store.hpp"

namespace veil {

// Single-process KeyValueStore with Redis-like semantics: typed keys, lazy TTL
// expiry against the injected clock, WRONGTYPE errors on type mismatch.
class MemoryStore : public KeyValueStore {
public:
    explicit MemoryStore(Clock clock = system_clock());

    std::optional<std::string> get(const std::string& key) override;
    void set(const std::string& key, const std::string& value, std::chrono::seconds ttl) override;
    bool del(const std::string& key) override;
    bool expire(const std::string& key, std::chrono::seconds ttl) override;

    void hset(const std::string& key, const FieldMap& fields) override;
    FieldMap hgetall(const std::string& key) override;

    long long sadd(const std::string& key, const std::string& member) override;
    long long srem(const std::string& key, const std::string& member) override;
    long long scard(const std::string& key) override;

    // Remaining lifetime; std::nullopt for missing keys or keys without expiry.
    std::optional<std::chrono::seconds> ttl(const std::string& key);

    // Drops every expired key. Returns the number removed.
    size_t purge_expired();

    size_t size();

private:
    enum class Kind { STRING, HASH, SET };

    struct Entry {
        Kind kind = Kind::STRING;
        std::string value;
        FieldMap fields;
        std::unordered_set<std::string> members;
        std::optional<TimePoint> expires_at;
    };

    // Returns the live entry or nullptr, erasing it if expired. mutex_ held.
    Entry* find_live(const std::string& key);
    Entry& upsert(const std::string& key, Kind kind);

    Clock clock_;
    std::mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
};

}
