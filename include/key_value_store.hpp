#pragma once

#include <string>
#include <optional>
#include <chrono>
#include <stdexcept>
#include <unordered_map>

namespace veil {

// Raised by store adapters when the backend cannot serve a command.
class StoreError : public std::runtime_error {
public:
    explicit StoreError(const std::string& what) : std::runtime_error(what) {}
};

// Abstract interface for the shared key-value store that holds cross-process
// anonymization state (device records, fingerprint indexes, region hashes).
// Primary implementation uses Redis; MemoryStore serves single-process use.
// Commands are at-least-once with no cross-key transactional guarantee.
class KeyValueStore {
public:
    using FieldMap = std::unordered_map<std::string, std::string>;

    virtual ~KeyValueStore() = default;

    /**
     * Reads a string value.
     * @return The value, or std::nullopt when the key is absent or expired.
     */
    virtual std::optional<std::string> get(const std::string& key) = 0;

    /**
     * Writes a string value. A zero ttl stores the key without expiry.
     */
    virtual void set(const std::string& key, const std::string& value, std::chrono::seconds ttl) = 0;

    virtual bool del(const std::string& key) = 0;
    virtual bool expire(const std::string& key, std::chrono::seconds ttl) = 0;

    // --- Hash fields ---
    virtual void hset(const std::string& key, const FieldMap& fields) = 0;
    virtual FieldMap hgetall(const std::string& key) = 0;

    // --- Set membership ---
    virtual long long sadd(const std::string& key, const std::string& member) = 0;
    virtual long long srem(const std::string& key, const std::string& member) = 0;
    virtual long long scard(const std::string& key) = 0;

    // Writes hash fields and refreshes the key TTL. Backends that support
    // batching send both commands together.
    virtual void hset_with_ttl(const std::string& key, const FieldMap& fields, std::chrono::seconds ttl) {
        hset(key, fields);
        expire(key, ttl);
    }
};

}
