#pragma once

#include <string>
#include <optional>
#include <chrono>
#include <cstddef>

namespace veil {

struct CircuitBreakerOptions;

// Externally supplied policy and secrets for the anonymization subsystem.
// Nothing here is generated at runtime; salt rotation is owned by the deployer.
struct AnonymizerConfig {
    // --- Shared Store ---
    std::string redis_url = "tcp://127.0.0.1:6379";

    // --- Secrets ---
    std::string current_salt = "";
    std::optional<std::string> previous_salt;
    std::string region_salt = "";  // empty falls back to current_salt

    // --- Device Token Lifecycle ---
    std::chrono::seconds rotation_interval{30 * 24 * 3600};
    std::chrono::seconds token_ttl{365 * 24 * 3600};
    std::chrono::seconds rotation_grace_period{7 * 24 * 3600};
    long long max_devices_per_fingerprint = 10;

    // --- Token KDF (scrypt) ---
    unsigned long long scrypt_n = 16384;
    unsigned long long scrypt_r = 8;
    unsigned long long scrypt_p = 1;

    // --- Geographic Generalization ---
    long long min_population = 5000;
    int coordinate_precision = 2;
    int polygon_precision = 2;
    size_t region_hash_length = 16;
    std::chrono::seconds region_cache_ttl{86400};
    std::chrono::seconds polygon_cache_ttl{3600};

    // --- In-Process Caches ---
    size_t device_cache_size = 1000;
    size_t region_cache_size = 1000;
    size_t polygon_cache_size = 1000;
    std::chrono::seconds device_cache_ttl{300};

    // --- Shared Store Circuit Breaker ---
    int breaker_failure_threshold = 3;
    int breaker_success_threshold = 2;
    std::chrono::milliseconds breaker_reset_timeout{30000};
    int breaker_max_retries = 2;
    std::chrono::milliseconds breaker_retry_delay{50};
    std::chrono::milliseconds breaker_max_retry_delay{500};

    // --- Content Sanitizer ---
    size_t max_sanitize_length = 2000;

    // --- Check-in Frequency ---
    std::chrono::seconds check_in_window{24 * 3600};

    const std::string& effective_region_salt() const {
        return region_salt.empty() ? current_salt : region_salt;
    }

    CircuitBreakerOptions circuit_breaker_options(const std::string& name) const;
};

// Placeholder shipped in sample deployment files. Refused by validate_config.
inline constexpr const char* kPlaceholderSalt = "CHANGE_ME_IN_PRODUCTION";

/**
 * Applies VEIL_* environment overrides on top of the given configuration.
 * Throws std::invalid_argument naming the variable when a numeric value is malformed.
 */
void load_config_from_env(AnonymizerConfig& config);

/**
 * Rejects configurations that would silently weaken anonymity guarantees.
 * Throws std::invalid_argument describing the first violation.
 */
void validate_config(const AnonymizerConfig& config);

}
