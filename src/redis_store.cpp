#include "redis_store.hpp"
#include "security_logger.hpp"
#include <iterator>

namespace veil {

RedisStore::RedisStore(const std::string& redis_url) {
    try {
        // Initialize the Redis client using the provided connection string.
        redis_ = std::make_unique<sw::redis::Redis>(redis_url);
        redis_->ping();
        connected_ = true;
        SecurityLogger::log(SecurityLogger::Level::INFO, SecurityLogger::EventType::STORE_CONNECTED,
                            "internal", "Redis connected");
    } catch (const sw::redis::Error& e) {
        // The client stays usable: redis++ reconnects lazily on the next command.
        SecurityLogger::log(SecurityLogger::Level::ERROR, SecurityLogger::EventType::STORE_UNAVAILABLE,
                            "internal", std::string("Redis connection failed: ") + e.what());
        connected_ = false;
    }
}

template <typename Fn>
auto RedisStore::guarded(const char* op, Fn&& fn) -> decltype(fn()) {
    if (!redis_) {
        throw StoreError(std::string("redis ") + op + ": client not initialised");
    }
    try {
        return fn();
    } catch (const sw::redis::Error& e) {
        connected_ = false;
        throw StoreError(std::string("redis ") + op + ": " + e.what());
    }
}

std::optional<std::string> RedisStore::get(const std::string& key) {
    return guarded("GET", [&]() -> std::optional<std::string> {
        auto val = redis_->get(key);
        if (val) return std::string(*val);
        return std::nullopt;
    });
}

void RedisStore::set(const std::string& key, const std::string& value, std::chrono::seconds ttl) {
    guarded("SET", [&] {
        redis_->set(key, value, std::chrono::milliseconds(ttl));
    });
}

bool RedisStore::del(const std::string& key) {
    return guarded("DEL", [&] { return redis_->del(key) > 0; });
}

bool RedisStore::expire(const std::string& key, std::chrono::seconds ttl) {
    return guarded("EXPIRE", [&] { return redis_->expire(key, ttl); });
}

void RedisStore::hset(const std::string& key, const FieldMap& fields) {
    if (fields.empty()) return;
    guarded("HSET", [&] {
        redis_->hset(key, fields.begin(), fields.end());
    });
}

KeyValueStore::FieldMap RedisStore::hgetall(const std::string& key) {
    return guarded("HGETALL", [&] {
        FieldMap fields;
        redis_->hgetall(key, std::inserter(fields, fields.end()));
        return fields;
    });
}

long long RedisStore::sadd(const std::string& key, const std::string& member) {
    return guarded("SADD", [&] { return redis_->sadd(key, member); });
}

long long RedisStore::srem(const std::string& key, const std::string& member) {
    return guarded("SREM", [&] { return redis_->srem(key, member); });
}

long long RedisStore::scard(const std::string& key) {
    return guarded("SCARD", [&] { return redis_->scard(key); });
}

void RedisStore::hset_with_ttl(const std::string& key, const FieldMap& fields, std::chrono::seconds ttl) {
    if (fields.empty()) return;
    guarded("HSET+EXPIRE", [&] {
        auto pipe = redis_->pipeline(false);
        pipe.hset(key, fields.begin(), fields.end()).expire(key, ttl);
        pipe.exec();
    });
}

}
