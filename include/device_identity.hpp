#pragma once

#include <string>
#include <optional>
#include <functional>
#include <map>
#include <mutex>
#include "anonymizer_config.hpp"
#include "circuit_breaker.hpp"
#include "clock.hpp"
#include "crypto_primitives.hpp"
#include "key_value_store.hpp"
#include "lru_cache.hpp"
#include "token_pair.hpp"

namespace veil {

inline constexpr const char* kTokenVersion = "v2";

// Raw client attributes offered for fingerprinting. Only the coarse named
// fields contribute; anything in `extra` (canvas, WebGL, audio, font lists)
// is accepted for interface compatibility and ignored.
struct ClientSignals {
    std::string user_agent;
    std::string language;
    std::string platform;
    std::string timezone;
    int screen_width = 0;
    int screen_height = 0;
    int color_depth = 0;
    int hardware_concurrency = 0;
    std::map<std::string, std::string> extra;

    bool empty() const;
    // Stable "|"-joined form of the coarse attributes.
    std::string canonical() const;
};

// Server-side state of one device token, stored at device:v2:<token>.
struct DeviceRecord {
    std::string fingerprint;
    long long created_at = 0;
    long long last_seen = 0;
    std::optional<long long> rotated_at;
    std::optional<std::string> rotated_to;
    std::optional<std::string> region;
    std::string token_version = kTokenVersion;

    KeyValueStore::FieldMap to_fields() const;
    // std::nullopt when the hash is empty or lacks a usable fingerprint/createdAt.
    static std::optional<DeviceRecord> from_fields(const KeyValueStore::FieldMap& fields);

    bool operator==(const DeviceRecord& other) const;
    bool operator!=(const DeviceRecord& other) const { return !(*this == other); }
};

struct DeviceInfo {
    std::string device_id;
    bool is_new = false;
    bool is_rotated = false;
    // Session-only identifier; nothing was persisted.
    bool is_ephemeral = false;
    std::optional<std::string> region;
    // Pair the caller should hold after this call.
    TokenPair tokens;
};

// Invoked when a fingerprint's live device count crosses the cap.
using AbuseSignalHandler = std::function<void(const std::string& fingerprint, long long device_count)>;

// Issues, validates, rotates and erases anonymous device tokens.
// Availability over consistency: resolve_or_create always returns an
// identity, degrading to an ephemeral one when the shared store is unusable.
class DeviceIdentityManager {
public:
    DeviceIdentityManager(const AnonymizerConfig& config, KeyValueStore& store,
                          CircuitBreaker& breaker, Clock clock = system_clock());

    DeviceIdentityManager(const DeviceIdentityManager&) = delete;
    DeviceIdentityManager& operator=(const DeviceIdentityManager&) = delete;

    /**
     * Resolves the caller's token pair, rotating when due, or registers a new
     * device from the signals when neither token is valid.
     */
    DeviceInfo resolve_or_create(const ClientSignals& signals, const TokenPair& stored);

    // Records the last known region hash on an existing device. False on any failure.
    bool update_device_region(const std::string& device_id, const std::string& region_hash);

    // Erases the token record, its fingerprint-index membership and cache entries.
    bool anonymize_device(const std::string& device_id);

    // Authoritative record for a token, or std::nullopt when invalid or unreachable.
    std::optional<DeviceRecord> validate_token(const std::string& token);

    std::string generate_fingerprint(const ClientSignals& signals, const std::string& salt) const;

    void set_abuse_handler(AbuseSignalHandler handler);

    // Demotes the current salt to previous.
    void rotate_salt(const std::string& next_salt) { salts_.rotate(next_salt); }

    size_t cache_size() const { return cache_.size(); }

    static std::string device_key(const std::string& token) { return "device:v2:" + token; }
    static std::string fingerprint_key(const std::string& fingerprint) { return "fp:" + fingerprint; }

private:
    // Local hit reconciled with the store; throws StoreError on a local miss
    // when the store is unreachable.
    std::optional<DeviceRecord> lookup(const std::string& token);

    // std::nullopt when the token is deprecated and its successor no longer exists.
    std::optional<DeviceInfo> on_hit(const std::string& token, const DeviceRecord& record,
                                     const TokenPair& stored, bool via_previous);
    // Deletes a deprecated token whose successor is gone (best-effort).
    void retire(const std::string& token);
    std::optional<std::string> rotate(const std::string& old_token, const DeviceRecord& record);
    void touch(const std::string& token, DeviceRecord record);
    DeviceInfo register_new(const ClientSignals& signals);
    DeviceInfo ephemeral(const TokenPair& stored);

    std::string fingerprint_or_fallback(const ClientSignals& signals, const std::string& salt);
    std::string derive_token(const std::string& fingerprint);
    long long count_devices(const std::string& fingerprint, const std::optional<std::string>& previous_fingerprint);
    void signal_abuse(const std::string& fingerprint, long long count);
    bool rotation_due(const DeviceRecord& record, long long now) const;

    AnonymizerConfig config_;
    KeyValueStore& store_;
    CircuitBreaker& breaker_;
    Clock clock_;
    SaltSource salts_;
    LruCache<std::string, DeviceRecord> cache_;

    std::mutex handler_mutex_;
    AbuseSignalHandler abuse_handler_;
};

}
