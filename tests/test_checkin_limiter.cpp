#include <gtest/gtest.h>
#include "checkin_limiter.hpp"
#include "crypto_primitives.hpp"
#include "memory_store.hpp"
#include "metrics.hpp"
#include "test_support.hpp"

using namespace veil;
using veil::testing::FailingStore;
using veil::testing::ManualClock;

class CheckInLimiterTest : public ::testing::Test {
protected:
    CheckInLimiterTest()
        : config(veil::testing::test_config()),
          store(clock.clock()),
          breaker(config.circuit_breaker_options("checkin_test"), clock.clock()),
          limiter(store, breaker, "limiter-salt", std::chrono::hours(24), clock.clock()) {}

    ManualClock clock;
    AnonymizerConfig config;
    MemoryStore store;
    CircuitBreaker breaker;
    CheckInLimiter limiter;
};

TEST_F(CheckInLimiterTest, FirstCheckInAllowed) {
    EXPECT_TRUE(limiter.can_check_in("device-a"));
    EXPECT_EQ(limiter.seconds_until_next_check_in("device-a").count(), 0);
}

TEST_F(CheckInLimiterTest, SecondCheckInWaitsForWindow) {
    ASSERT_TRUE(limiter.record_check_in("device-a"));
    EXPECT_FALSE(limiter.can_check_in("device-a"));
    EXPECT_EQ(limiter.seconds_until_next_check_in("device-a").count(), 24 * 3600);

    clock.advance(std::chrono::hours(20));
    EXPECT_EQ(limiter.seconds_until_next_check_in("device-a").count(), 4 * 3600);

    clock.advance(std::chrono::hours(4));
    EXPECT_TRUE(limiter.can_check_in("device-a"));
}

TEST_F(CheckInLimiterTest, DevicesAreIndependent) {
    limiter.record_check_in("device-a");
    EXPECT_TRUE(limiter.can_check_in("device-b"));
}

TEST_F(CheckInLimiterTest, KeysAreBlinded) {
    limiter.record_check_in("device-a");
    EXPECT_FALSE(store.get("checkin:device-a").has_value());
    EXPECT_TRUE(store.get("checkin:" + CryptoPrimitives::blind("device-a", "limiter-salt")).has_value());
}

TEST_F(CheckInLimiterTest, EmptyIdentifier) {
    EXPECT_TRUE(limiter.can_check_in(""));
    EXPECT_FALSE(limiter.record_check_in(""));
}

TEST(CheckInLimiterOutageTest, FailsOpen) {
    ManualClock clock;
    auto config = veil::testing::test_config();
    FailingStore store;
    CircuitBreaker breaker(config.circuit_breaker_options("checkin_outage"), clock.clock());
    CheckInLimiter limiter(store, breaker, "salt", std::chrono::hours(1), clock.clock());

    auto& reg = MetricsRegistry::instance();
    double fail_open = reg.get_counter("checkin_limiter_fail_open");
    double write_failures = reg.get_counter("checkin_limiter_write_failures");

    EXPECT_TRUE(limiter.can_check_in("device-a"));
    EXPECT_FALSE(limiter.record_check_in("device-a"));
    EXPECT_EQ(reg.get_counter("checkin_limiter_fail_open"), fail_open + 1);
    EXPECT_EQ(reg.get_counter("checkin_limiter_write_failures"), write_failures + 1);
}
