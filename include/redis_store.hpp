#pragma once

#include <string>
#include <memory>
#include <atomic>
#include <sw/redis++/redis++.h>
#include "key_value_store.hpp"

namespace veil {

// Redis-backed shared store. Every redis++ failure is surfaced as StoreError
// so the circuit breaker above can count it; nothing is swallowed here.
class RedisStore : public KeyValueStore {
public:
    explicit RedisStore(const std::string& redis_url);
    ~RedisStore() override = default;

    RedisStore(const RedisStore&) = delete;
    RedisStore& operator=(const RedisStore&) = delete;

    // Connection health as observed by the initial PING.
    bool is_connected() const { return connected_; }

    std::optional<std::string> get(const std::string& key) override;
    void set(const std::string& key, const std::string& value, std::chrono::seconds ttl) override;
    bool del(const std::string& key) override;
    bool expire(const std::string& key, std::chrono::seconds ttl) override;

    void hset(const std::string& key, const FieldMap& fields) override;
    FieldMap hgetall(const std::string& key) override;

    long long sadd(const std::string& key, const std::string& member) override;
    long long srem(const std::string& key, const std::string& member) override;
    long long scard(const std::string& key) override;

    // HSET + EXPIRE in one pipeline round trip.
    void hset_with_ttl(const std::string& key, const FieldMap& fields, std::chrono::seconds ttl) override;

private:
    template <typename Fn>
    auto guarded(const char* op, Fn&& fn) -> decltype(fn());

    std::unique_ptr<sw::redis::Redis> redis_;
    std::atomic<bool> connected_{false};
};

}
