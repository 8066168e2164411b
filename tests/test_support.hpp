#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include "anonymizer_config.hpp"
#include "circuit_breaker.hpp"
#include "clock.hpp"
#include "key_value_store.hpp"

namespace veil::testing {

// Manually advanced wall clock shared by everything built from it.
class ManualClock {
public:
    explicit ManualClock(TimePoint start = from_epoch_seconds(1700000000))
        : now_(std::make_shared<std::atomic<long long>>(
              std::chrono::duration_cast<std::chrono::milliseconds>(start.time_since_epoch()).count())) {}

    Clock clock() const {
        auto now = now_;
        return [now] { return TimePoint(std::chrono::milliseconds(now->load())); };
    }

    TimePoint now() const { return TimePoint(std::chrono::milliseconds(now_->load())); }

    template <typename Duration>
    void advance(Duration d) {
        now_->fetch_add(std::chrono::duration_cast<std::chrono::milliseconds>(d).count());
    }

private:
    std::shared_ptr<std::atomic<long long>> now_;
};

// Store double for a total outage: every command throws StoreError.
class FailingStore : public KeyValueStore {
public:
    std::optional<std::string> get(const std::string&) override { fail(); return std::nullopt; }
    void set(const std::string&, const std::string&, std::chrono::seconds) override { fail(); }
    bool del(const std::string&) override { fail(); return false; }
    bool expire(const std::string&, std::chrono::seconds) override { fail(); return false; }
    void hset(const std::string&, const FieldMap&) override { fail(); }
    FieldMap hgetall(const std::string&) override { fail(); return {}; }
    long long sadd(const std::string&, const std::string&) override { fail(); return 0; }
    long long srem(const std::string&, const std::string&) override { fail(); return 0; }
    long long scard(const std::string&) override { fail(); return 0; }

    long long calls() const { return calls_.load(); }

private:
    void fail() {
        ++calls_;
        throw StoreError("simulated outage");
    }

    std::atomic<long long> calls_{0};
};

// Fast, deterministic settings for unit tests.
inline AnonymizerConfig test_config() {
    AnonymizerConfig config;
    config.current_salt = "unit-test-salt";
    config.region_salt = "unit-test-region-salt";
    config.scrypt_n = 1024;
    config.scrypt_r = 8;
    config.scrypt_p = 1;
    config.breaker_retry_delay = std::chrono::milliseconds(1);
    config.breaker_max_retry_delay = std::chrono::milliseconds(2);
    return config;
}

}
