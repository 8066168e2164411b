#include <gtest/gtest.h>
#include "lru_cache.hpp"
#include "memory_store.hpp"
#include "metrics.hpp"
#include "test_support.hpp"
#include "two_tier_cache.hpp"
#include <thread>
#include <vector>

using namespace veil;
using veil::testing::FailingStore;
using veil::testing::ManualClock;

TEST(LruCacheTest, EvictsLeastRecentlyUsed) {
    LruCache<std::string, int> cache(2);
    cache.put("a", 1);
    cache.put("b", 2);
    ASSERT_TRUE(cache.get("a").has_value());  // a is now most recent
    cache.put("c", 3);

    EXPECT_TRUE(cache.get("a").has_value());
    EXPECT_FALSE(cache.get("b").has_value());
    EXPECT_EQ(*cache.get("c"), 3);
    EXPECT_EQ(cache.size(), 2u);
}

TEST(LruCacheTest, PutReplacesAndRefreshes) {
    LruCache<std::string, int> cache(2);
    cache.put("a", 1);
    cache.put("b", 2);
    cache.put("a", 10);
    cache.put("c", 3);
    EXPECT_EQ(*cache.get("a"), 10);
    EXPECT_FALSE(cache.get("b").has_value());
}

TEST(LruCacheTest, EntryTtl) {
    ManualClock clock;
    LruCache<std::string, int> cache(10, clock.clock());
    cache.put("short", 1, std::chrono::seconds(5));
    cache.put("forever", 2);

    clock.advance(std::chrono::seconds(4));
    EXPECT_TRUE(cache.get("short").has_value());
    clock.advance(std::chrono::seconds(2));
    EXPECT_FALSE(cache.get("short").has_value());
    EXPECT_TRUE(cache.get("forever").has_value());
}

TEST(LruCacheTest, PurgeExpiredAndEraseIf) {
    ManualClock clock;
    LruCache<std::string, int> cache(10, clock.clock());
    cache.put("a", 1, std::chrono::seconds(1));
    cache.put("b", 2, std::chrono::seconds(1));
    cache.put("c", 3);
    cache.put("d", 4);
    clock.advance(std::chrono::seconds(2));

    EXPECT_EQ(cache.purge_expired(), 2u);
    EXPECT_EQ(cache.erase_if([](const std::string&, const int& v) { return v % 2 == 0; }), 1u);
    EXPECT_EQ(cache.size(), 1u);
    EXPECT_TRUE(cache.erase("c"));
    EXPECT_FALSE(cache.erase("c"));
}

TEST(LruCacheTest, ConcurrentAccessKeepsBound) {
    LruCache<int, int> cache(64);
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&cache, t] {
            for (int i = 0; i < 2000; ++i) {
                cache.put(t * 10000 + i, i);
                cache.get(t * 10000 + i / 2);
            }
        });
    }
    for (auto& th : threads) th.join();
    EXPECT_LE(cache.size(), 64u);
}

class TwoTierCacheTest : public ::testing::Test {
protected:
    TwoTierCacheTest()
        : store(clock.clock()),
          breaker(options(), clock.clock()),
          cache("tt", 4, store, breaker, clock.clock()) {}

    static CircuitBreakerOptions options() {
        CircuitBreakerOptions opts;
        opts.name = "tt";
        opts.max_retries = 0;
        return opts;
    }

    ManualClock clock;
    MemoryStore store;
    CircuitBreaker breaker;
    TwoTierCache cache;
};

TEST_F(TwoTierCacheTest, PutWritesBothTiers) {
    EXPECT_TRUE(cache.put("k", "remote:k", "v", std::chrono::seconds(60)));
    auto hit = cache.get("k", "remote:k");
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(hit->value, "v");
    EXPECT_EQ(hit->tier, CacheTier::LOCAL);
    EXPECT_EQ(*store.get("remote:k"), "v");
}

TEST_F(TwoTierCacheTest, RemoteHitPopulatesLocal) {
    store.set("remote:k", "from-store", std::chrono::seconds(60));
    auto first = cache.get("k", "remote:k");
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->tier, CacheTier::REMOTE);

    auto second = cache.get("k", "remote:k");
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->tier, CacheTier::LOCAL);
    EXPECT_EQ(cache.local_size(), 1u);
}

TEST_F(TwoTierCacheTest, LocalEvictionFallsBackToStore) {
    for (int i = 0; i < 6; ++i) {
        cache.put("k" + std::to_string(i), "r" + std::to_string(i), "v" + std::to_string(i),
                  std::chrono::seconds(60));
    }
    EXPECT_EQ(cache.local_size(), 4u);

    auto evicted = cache.get("k0", "r0");
    ASSERT_TRUE(evicted.has_value());
    EXPECT_EQ(evicted->value, "v0");
    EXPECT_EQ(evicted->tier, CacheTier::REMOTE);
}

TEST_F(TwoTierCacheTest, RemoteExpiryIsAMiss) {
    cache.put("k", "remote:k", "v", std::chrono::seconds(10));
    cache.clear_local();
    clock.advance(std::chrono::seconds(11));
    EXPECT_FALSE(cache.get("k", "remote:k").has_value());
}

TEST_F(TwoTierCacheTest, InvalidateRemovesBothTiers) {
    cache.put("k", "remote:k", "v", std::chrono::seconds(60));
    cache.invalidate("k", "remote:k");
    EXPECT_FALSE(cache.get("k", "remote:k").has_value());
    EXPECT_FALSE(store.get("remote:k").has_value());
}

TEST(TwoTierCacheOutageTest, StoreFailuresDegradeToLocal) {
    ManualClock clock;
    FailingStore store;
    CircuitBreakerOptions opts;
    opts.name = "tt_outage";
    opts.max_retries = 0;
    CircuitBreaker breaker(opts, clock.clock());
    TwoTierCache cache("tt_outage", 4, store, breaker, clock.clock());

    auto& reg = MetricsRegistry::instance();
    double before = reg.get_counter("tt_outage_advisory_write_failures");

    EXPECT_FALSE(cache.put("k", "remote:k", "v", std::chrono::seconds(60)));
    EXPECT_EQ(reg.get_counter("tt_outage_advisory_write_failures"), before + 1);

    auto hit = cache.get("k", "remote:k");
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(hit->tier, CacheTier::LOCAL);
    EXPECT_FALSE(cache.get("missing", "remote:missing").has_value());
}
