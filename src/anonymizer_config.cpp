#include "anonymizer_config.hpp"
#include "circuit_breaker.hpp"
#include <cstdlib>
#include <stdexcept>

namespace veil {

namespace {

long long env_integer(const char* name, const char* raw) {
    try {
        size_t consumed = 0;
        long long value = std::stoll(raw, &consumed);
        if (consumed != std::string(raw).size()) {
            throw std::invalid_argument("trailing characters");
        }
        return value;
    } catch (const std::exception&) {
        throw std::invalid_argument(std::string("Malformed integer in ") + name + ": '" + raw + "'");
    }
}

}

CircuitBreakerOptions AnonymizerConfig::circuit_breaker_options(const std::string& name) const {
    CircuitBreakerOptions opts;
    opts.name = name;
    opts.failure_threshold = breaker_failure_threshold;
    opts.success_threshold = breaker_success_threshold;
    opts.reset_timeout = breaker_reset_timeout;
    opts.max_retries = breaker_max_retries;
    opts.retry_delay = breaker_retry_delay;
    opts.max_retry_delay = breaker_max_retry_delay;
    return opts;
}

void load_config_from_env(AnonymizerConfig& config) {
    constexpr long long kDay = 24 * 3600;

    if (const char* e = std::getenv("VEIL_REDIS_URL")) config.redis_url = e;
    if (const char* e = std::getenv("VEIL_SALT")) config.current_salt = e;
    if (const char* e = std::getenv("VEIL_PREVIOUS_SALT")) {
        if (*e != '\0') config.previous_salt = std::string(e);
    }
    if (const char* e = std::getenv("VEIL_REGION_SALT")) config.region_salt = e;

    // Token lifecycle (days)
    if (const char* e = std::getenv("VEIL_ROTATION_DAYS"))
        config.rotation_interval = std::chrono::seconds(env_integer("VEIL_ROTATION_DAYS", e) * kDay);
    if (const char* e = std::getenv("VEIL_TOKEN_TTL_DAYS"))
        config.token_ttl = std::chrono::seconds(env_integer("VEIL_TOKEN_TTL_DAYS", e) * kDay);
    if (const char* e = std::getenv("VEIL_GRACE_DAYS"))
        config.rotation_grace_period = std::chrono::seconds(env_integer("VEIL_GRACE_DAYS", e) * kDay);
    if (const char* e = std::getenv("VEIL_MAX_DEVICES_PER_FINGERPRINT"))
        config.max_devices_per_fingerprint = env_integer("VEIL_MAX_DEVICES_PER_FINGERPRINT", e);

    // Geographic generalization
    if (const char* e = std::getenv("VEIL_MIN_POPULATION"))
        config.min_population = env_integer("VEIL_MIN_POPULATION", e);
    if (const char* e = std::getenv("VEIL_COORD_PRECISION"))
        config.coordinate_precision = static_cast<int>(env_integer("VEIL_COORD_PRECISION", e));
    if (const char* e = std::getenv("VEIL_POLYGON_PRECISION"))
        config.polygon_precision = static_cast<int>(env_integer("VEIL_POLYGON_PRECISION", e));
    if (const char* e = std::getenv("VEIL_REGION_TTL"))
        config.region_cache_ttl = std::chrono::seconds(env_integer("VEIL_REGION_TTL", e));

    // Circuit breaker
    if (const char* e = std::getenv("VEIL_BREAKER_THRESHOLD"))
        config.breaker_failure_threshold = static_cast<int>(env_integer("VEIL_BREAKER_THRESHOLD", e));
    if (const char* e = std::getenv("VEIL_BREAKER_RESET_MS"))
        config.breaker_reset_timeout = std::chrono::milliseconds(env_integer("VEIL_BREAKER_RESET_MS", e));

    if (const char* e = std::getenv("VEIL_CHECKIN_WINDOW_SEC"))
        config.check_in_window = std::chrono::seconds(env_integer("VEIL_CHECKIN_WINDOW_SEC", e));
}

void validate_config(const AnonymizerConfig& config) {
    if (config.current_salt.empty()) {
        throw std::invalid_argument("current_salt is required (set VEIL_SALT)");
    }
    if (config.current_salt == kPlaceholderSalt) {
        throw std::invalid_argument("current_salt still holds the placeholder value");
    }
    if (config.previous_salt && *config.previous_salt == config.current_salt) {
        throw std::invalid_argument("previous_salt must differ from current_salt");
    }
    if (config.coordinate_precision < 0 || config.coordinate_precision > 6) {
        throw std::invalid_argument("coordinate_precision must be within [0, 6]");
    }
    if (config.polygon_precision < 0 || config.polygon_precision > 6) {
        throw std::invalid_argument("polygon_precision must be within [0, 6]");
    }
    if (config.rotation_interval.count() <= 0 || config.token_ttl.count() <= 0 ||
        config.rotation_grace_period.count() <= 0) {
        throw std::invalid_argument("token lifecycle intervals must be positive");
    }
    if (config.rotation_grace_period > config.token_ttl) {
        throw std::invalid_argument("rotation_grace_period must not exceed token_ttl");
    }
    if (config.max_devices_per_fingerprint < 1) {
        throw std::invalid_argument("max_devices_per_fingerprint must be at least 1");
    }
    if (config.min_population < 0) {
        throw std::invalid_argument("min_population must not be negative");
    }
    if (config.region_hash_length < 8 || config.region_hash_length > 64) {
        throw std::invalid_argument("region_hash_length must be within [8, 64]");
    }
    if (config.breaker_failure_threshold < 1 || config.breaker_success_threshold < 1 ||
        config.breaker_max_retries < 0) {
        throw std::invalid_argument("circuit breaker thresholds must be positive");
    }
}

}
