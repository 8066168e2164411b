#include <gtest/gtest.h>
#include "checkin_anonymizer.hpp"
#include "input_validator.hpp"
#include "memory_store.hpp"
#include "test_support.hpp"
#include <boost/json.hpp>

using namespace veil;
using veil::testing::FailingStore;
using veil::testing::ManualClock;
namespace json = boost::json;

namespace {

ClientSignals phone_signals() {
    ClientSignals s;
    s.user_agent = "Mozilla/5.0 (iPhone; CPU iPhone OS 17_0 like Mac OS X)";
    s.language = "en-US";
    s.platform = "iPhone";
    s.timezone = "America/New_York";
    s.screen_width = 390;
    s.screen_height = 844;
    s.color_depth = 32;
    s.hardware_concurrency = 6;
    return s;
}

}

class CheckInAnonymizerTest : public ::testing::Test {
protected:
    CheckInAnonymizerTest()
        : config(veil::testing::test_config()),
          store(clock.clock()),
          breaker(config.circuit_breaker_options("checkin_pipeline"), clock.clock()),
          devices(config, store, breaker, clock.clock()),
          regions(config, store, breaker, clock.clock()),
          limiter(store, breaker, config.current_salt, config.check_in_window, clock.clock()),
          pipeline(devices, regions, sanitizer, &limiter) {}

    ManualClock clock;
    AnonymizerConfig config;
    MemoryStore store;
    CircuitBreaker breaker;
    DeviceIdentityManager devices;
    RegionAnonymizer regions;
    ContentSanitizer sanitizer;
    CheckInLimiter limiter;
    CheckInAnonymizer pipeline;
};

TEST_F(CheckInAnonymizerTest, AnonymizesEveryPart) {
    CheckInRequest req;
    req.signals = phone_signals();
    req.lat = 40.7128;
    req.lng = -74.0060;
    req.note = "Text me at jane@example.com";

    auto result = pipeline.process(req);

    EXPECT_TRUE(result.accepted);
    EXPECT_TRUE(result.is_new);
    EXPECT_FALSE(result.is_ephemeral);
    EXPECT_TRUE(InputValidator::is_valid_device_token(result.device_id));
    EXPECT_EQ(result.region_hash, regions.anonymize_coordinates(40.7128, -74.0060));
    EXPECT_EQ(result.note, "Text me at [EMAIL]");
    EXPECT_TRUE(result.note_redacted);

    auto record = devices.validate_token(result.device_id);
    ASSERT_TRUE(record.has_value());
    ASSERT_TRUE(record->region.has_value());
    EXPECT_EQ(*record->region, result.region_hash);
}

TEST_F(CheckInAnonymizerTest, SecondCheckInInsideWindowRejected) {
    CheckInRequest req;
    req.signals = phone_signals();
    auto first = pipeline.process(req);
    ASSERT_TRUE(first.accepted);

    req.tokens = first.tokens;
    clock.advance(std::chrono::hours(1));
    auto second = pipeline.process(req);
    EXPECT_FALSE(second.accepted);
    EXPECT_EQ(second.device_id, first.device_id);
    EXPECT_EQ(second.retry_after, config.check_in_window - std::chrono::hours(1));
    EXPECT_TRUE(second.region_hash.empty());

    auto out = CheckInAnonymizer::to_json(second);
    EXPECT_FALSE(out.at("accepted").as_bool());
    EXPECT_EQ(out.at("retryAfter").as_int64(), second.retry_after.count());
    EXPECT_EQ(out.if_contains("region"), nullptr);

    clock.advance(config.check_in_window);
    EXPECT_TRUE(pipeline.process(req).accepted);
}

TEST(CheckInWindowTest, WindowSurvivesTokenRotation) {
    ManualClock clock;
    auto config = veil::testing::test_config();
    config.rotation_interval = std::chrono::seconds(24 * 3600);
    config.check_in_window = std::chrono::seconds(72 * 3600);
    MemoryStore store(clock.clock());
    CircuitBreaker breaker(config.circuit_breaker_options("checkin_rotation"), clock.clock());
    DeviceIdentityManager devices(config, store, breaker, clock.clock());
    RegionAnonymizer regions(config, store, breaker, clock.clock());
    ContentSanitizer sanitizer;
    CheckInLimiter limiter(store, breaker, config.current_salt, config.check_in_window, clock.clock());
    CheckInAnonymizer pipeline(devices, regions, sanitizer, &limiter);

    CheckInRequest req;
    req.signals = phone_signals();
    auto first = pipeline.process(req);
    ASSERT_TRUE(first.accepted);

    clock.advance(std::chrono::hours(25));
    req.tokens = first.tokens;
    auto second = pipeline.process(req);
    EXPECT_TRUE(second.is_rotated);
    EXPECT_NE(second.device_id, first.device_id);
    EXPECT_FALSE(second.accepted);
    EXPECT_EQ(second.retry_after, std::chrono::seconds(47 * 3600));

    clock.advance(std::chrono::hours(48));
    req.tokens = second.tokens;
    auto third = pipeline.process(req);
    EXPECT_TRUE(third.accepted);
}

TEST_F(CheckInAnonymizerTest, RegionSourcePriority) {
    CheckInRequest req;
    req.signals = phone_signals();
    req.lat = 51.5074;
    req.lng = -0.1278;
    req.region_label = "gb-lnd";
    req.polygon = {{40.0, -74.0}, {40.0, -73.0}, {41.0, -73.0}, {41.0, -74.0}};
    EXPECT_EQ(pipeline.process(req).region_hash, regions.hash_polygon(req.polygon));

    CheckInAnonymizer unlimited(devices, regions, sanitizer);
    req.polygon.clear();
    EXPECT_EQ(unlimited.process(req).region_hash, regions.anonymize_coordinates(51.5074, -0.1278));

    req.lat.reset();
    req.lng.reset();
    req.population = 9'000'000;
    EXPECT_EQ(unlimited.process(req).region_hash, regions.hash_with_k_anonymity("gb-lnd", 9'000'000));

    req.population.reset();
    EXPECT_EQ(unlimited.process(req).region_hash, regions.hash_region("gb"));

    req.region_label.reset();
    EXPECT_EQ(unlimited.process(req).region_hash, kGlobalRegion);
}

TEST_F(CheckInAnonymizerTest, CleanNoteNotFlagged) {
    CheckInRequest req;
    req.signals = phone_signals();
    req.note = "Feeling great today!";
    auto result = pipeline.process(req);
    EXPECT_EQ(result.note, "Feeling great today!");
    EXPECT_FALSE(result.note_redacted);
}

TEST(CheckInAnonymizerOutageTest, StillAnonymizesDuringOutage) {
    ManualClock clock;
    auto config = veil::testing::test_config();
    FailingStore store;
    CircuitBreaker breaker(config.circuit_breaker_options("checkin_pipeline_outage"), clock.clock());
    DeviceIdentityManager devices(config, store, breaker, clock.clock());
    RegionAnonymizer regions(config, store, breaker, clock.clock());
    ContentSanitizer sanitizer;
    CheckInLimiter limiter(store, breaker, config.current_salt, config.check_in_window, clock.clock());
    CheckInAnonymizer pipeline(devices, regions, sanitizer, &limiter);

    MemoryStore healthy_store(clock.clock());
    CircuitBreaker healthy_breaker(config.circuit_breaker_options("checkin_pipeline_healthy"), clock.clock());
    RegionAnonymizer healthy_regions(config, healthy_store, healthy_breaker, clock.clock());

    CheckInRequest req;
    req.signals = phone_signals();
    req.lat = 40.7128;
    req.lng = -74.0060;
    req.note = "call 555-123-4567";

    auto result = pipeline.process(req);
    EXPECT_TRUE(result.accepted);
    EXPECT_TRUE(result.is_ephemeral);
    EXPECT_TRUE(InputValidator::is_ephemeral_identifier(result.device_id));
    EXPECT_EQ(result.region_hash, healthy_regions.anonymize_coordinates(40.7128, -74.0060));
    EXPECT_EQ(result.note, "call [PHONE]");
}

TEST(CheckInRequestTest, ParsesFullPayload) {
    auto payload = json::parse(R"({
        "signals": {"userAgent": "UA", "language": "fr-FR", "platform": "Linux",
                    "timezone": "Europe/Paris", "screenWidth": 1280, "screenHeight": 800,
                    "colorDepth": 24, "hardwareConcurrency": 4, "canvas": "abc", "touch": true},
        "tokens": {"current": "aa", "previous": "bb"},
        "lat": 48.8566, "lng": 2,
        "polygon": [[1, 2], [3.5, 4.5]],
        "region": "fr-idf",
        "population": 12000000,
        "note": "bonjour"
    })");

    auto req = CheckInAnonymizer::parse_request(payload);
    EXPECT_EQ(req.signals.user_agent, "UA");
    EXPECT_EQ(req.signals.language, "fr-FR");
    EXPECT_EQ(req.signals.timezone, "Europe/Paris");
    EXPECT_EQ(req.signals.screen_width, 1280);
    EXPECT_EQ(req.signals.hardware_concurrency, 4);
    EXPECT_EQ(req.signals.extra["canvas"], "abc");
    EXPECT_EQ(req.signals.extra["touch"], "true");
    EXPECT_EQ(*req.tokens.current, "aa");
    EXPECT_EQ(*req.tokens.previous, "bb");
    EXPECT_DOUBLE_EQ(*req.lat, 48.8566);
    EXPECT_DOUBLE_EQ(*req.lng, 2.0);
    ASSERT_EQ(req.polygon.size(), 2u);
    EXPECT_DOUBLE_EQ(req.polygon[1].lng, 4.5);
    EXPECT_EQ(*req.region_label, "fr-idf");
    EXPECT_EQ(*req.population, 12000000);
    EXPECT_EQ(req.note, "bonjour");
}

TEST(CheckInRequestTest, LegacyTokenString) {
    auto req = CheckInAnonymizer::parse_request(json::parse(R"({"tokens": "abc123"})"));
    EXPECT_EQ(*req.tokens.current, "abc123");
    EXPECT_FALSE(req.tokens.previous.has_value());
    EXPECT_FALSE(req.lat.has_value());
    EXPECT_TRUE(req.note.empty());
}

TEST(CheckInRequestTest, RejectsMalformedPayloads) {
    EXPECT_THROW(CheckInAnonymizer::parse_request(json::parse("[1,2]")), std::invalid_argument);
    EXPECT_THROW(CheckInAnonymizer::parse_request(json::parse(R"({"signals": "x"})")), std::invalid_argument);
    EXPECT_THROW(CheckInAnonymizer::parse_request(json::parse(R"({"lat": "40"})")), std::invalid_argument);
    EXPECT_THROW(CheckInAnonymizer::parse_request(json::parse(R"({"polygon": [[1]]})")), std::invalid_argument);
    EXPECT_THROW(CheckInAnonymizer::parse_request(json::parse(R"({"tokens": 5})")), std::invalid_argument);
    EXPECT_THROW(CheckInAnonymizer::parse_request(json::parse(R"({"note": 5})")), std::invalid_argument);
}

TEST(CheckInRequestTest, RejectsOutOfRangeIntegers) {
    EXPECT_THROW(CheckInAnonymizer::parse_request(json::parse(R"({"signals": {"screenWidth": 1e300}})")),
                 std::invalid_argument);
    EXPECT_THROW(CheckInAnonymizer::parse_request(json::parse(R"({"signals": {"colorDepth": 2147483648}})")),
                 std::invalid_argument);
    EXPECT_THROW(CheckInAnonymizer::parse_request(json::parse(R"({"population": 1e300})")),
                 std::invalid_argument);
    EXPECT_THROW(CheckInAnonymizer::parse_request(json::parse(R"({"population": 18446744073709551615})")),
                 std::invalid_argument);

    auto req = CheckInAnonymizer::parse_request(
        json::parse(R"({"signals": {"screenWidth": 2147483647}, "population": -1})"));
    EXPECT_EQ(req.signals.screen_width, 2147483647);
    EXPECT_EQ(*req.population, -1);
}

TEST(CheckInResultTest, AcceptedJsonShape) {
    AnonymizedCheckIn result;
    result.device_id = "dev";
    result.tokens.current = "dev";
    result.tokens.previous = "old";
    result.is_rotated = true;
    result.region_hash = "rgn:0123456789abcdef";
    result.note = "[EMAIL]";
    result.note_redacted = true;

    auto out = CheckInAnonymizer::to_json(result);
    EXPECT_EQ(out.at("deviceId").as_string(), "dev");
    EXPECT_EQ(out.at("tokens").as_object().at("previous").as_string(), "old");
    EXPECT_TRUE(out.at("isRotated").as_bool());
    EXPECT_FALSE(out.at("isNew").as_bool());
    EXPECT_TRUE(out.at("accepted").as_bool());
    EXPECT_EQ(out.at("region").as_string(), "rgn:0123456789abcdef");
    EXPECT_TRUE(out.at("noteRedacted").as_bool());
    EXPECT_EQ(out.if_contains("retryAfter"), nullptr);
}
