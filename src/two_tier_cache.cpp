#include "two_tier_cache.hpp"
#include "metrics.hpp"
#include "security_logger.hpp"

namespace veil {

TwoTierCache::TwoTierCache(std::string name, size_t capacity, KeyValueStore& store,
                           CircuitBreaker& breaker, Clock clock)
    : name_(std::move(name)),
      local_(capacity, std::move(clock)),
      store_(store),
      breaker_(breaker) {}

std::optional<CacheLookup> TwoTierCache::get(const std::string& local_key, const std::string& remote_key,
                                             std::chrono::seconds local_ttl) {
    if (auto hit = local_.get(local_key)) {
        return CacheLookup{*hit, CacheTier::LOCAL};
    }

    std::optional<std::string> remote;
    try {
        remote = breaker_.execute([&] { return store_.get(remote_key); });
    } catch (const std::exception&) {
        MetricsRegistry::instance().increment_counter(name_ + "_cache_remote_read_failures");
        return std::nullopt;
    }

    if (!remote) return std::nullopt;

    local_.put(local_key, *remote, local_ttl);
    publish_size();
    return CacheLookup{*remote, CacheTier::REMOTE};
}

bool TwoTierCache::put(const std::string& local_key, const std::string& remote_key, const std::string& value,
                       std::chrono::seconds remote_ttl, std::chrono::seconds local_ttl) {
    local_.put(local_key, value, local_ttl);
    publish_size();

    try {
        breaker_.execute([&] { store_.set(remote_key, value, remote_ttl); });
        return true;
    } catch (const std::exception&) {
        MetricsRegistry::instance().increment_counter(name_ + "_advisory_write_failures");
        return false;
    }
}

void TwoTierCache::put_local(const std::string& key, const std::string& value, std::chrono::seconds ttl) {
    local_.put(key, value, ttl);
    publish_size();
}

void TwoTierCache::invalidate(const std::string& local_key, const std::string& remote_key) {
    local_.erase(local_key);
    publish_size();

    try {
        breaker_.execute([&] { store_.del(remote_key); });
    } catch (const std::exception& e) {
        MetricsRegistry::instance().increment_counter(name_ + "_advisory_write_failures");
        SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::STORE_UNAVAILABLE,
                            "internal", name_ + " cache invalidation not propagated: " + e.what());
    }
}

void TwoTierCache::clear_local() {
    local_.clear();
    publish_size();
}

void TwoTierCache::publish_size() {
    MetricsRegistry::instance().set_gauge(name_ + "_cache_size", static_cast<double>(local_.size()));
}

}
