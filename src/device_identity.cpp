#include "device_identity.hpp"
#include "input_validator.hpp"
#include "metrics.hpp"
#include "security_logger.hpp"
#include <algorithm>
#include <atomic>
#include <sstream>

namespace veil {

namespace {

std::optional<long long> parse_epoch(const KeyValueStore::FieldMap& fields, const char* name) {
    auto it = fields.find(name);
    if (it == fields.end() || it->second.empty()) return std::nullopt;
    try {
        size_t pos = 0;
        long long value = std::stoll(it->second, &pos);
        if (pos != it->second.size()) return std::nullopt;
        return value;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<std::string> optional_field(const KeyValueStore::FieldMap& fields, const char* name) {
    auto it = fields.find(name);
    if (it == fields.end() || it->second.empty()) return std::nullopt;
    return it->second;
}

}

// --- ClientSignals ---

bool ClientSignals::empty() const {
    return user_agent.empty() && language.empty() && platform.empty() && timezone.empty() &&
           screen_width == 0 && screen_height == 0 && color_depth == 0 && hardware_concurrency == 0;
}

std::string ClientSignals::canonical() const {
    std::ostringstream ss;
    ss << user_agent << "|" << language << "|" << platform << "|" << timezone << "|"
       << screen_width << "x" << screen_height << "x" << color_depth << "|"
       << hardware_concurrency;
    return ss.str();
}

// --- DeviceRecord ---

KeyValueStore::FieldMap DeviceRecord::to_fields() const {
    KeyValueStore::FieldMap fields{
        {"fingerprint", fingerprint},
        {"createdAt", std::to_string(created_at)},
        {"lastSeen", std::to_string(last_seen)},
        {"tokenVersion", token_version},
    };
    if (rotated_at) fields["rotatedAt"] = std::to_string(*rotated_at);
    if (rotated_to) fields["rotatedTo"] = *rotated_to;
    if (region) fields["region"] = *region;
    return fields;
}

std::optional<DeviceRecord> DeviceRecord::from_fields(const KeyValueStore::FieldMap& fields) {
    auto fingerprint = optional_field(fields, "fingerprint");
    auto created = parse_epoch(fields, "createdAt");
    if (!fingerprint || !created) return std::nullopt;

    DeviceRecord record;
    record.fingerprint = *fingerprint;
    record.created_at = *created;
    record.last_seen = parse_epoch(fields, "lastSeen").value_or(*created);
    record.rotated_at = parse_epoch(fields, "rotatedAt");
    record.rotated_to = optional_field(fields, "rotatedTo");
    record.region = optional_field(fields, "region");
    record.token_version = optional_field(fields, "tokenVersion").value_or(kTokenVersion);
    return record;
}

bool DeviceRecord::operator==(const DeviceRecord& other) const {
    return fingerprint == other.fingerprint && created_at == other.created_at &&
           last_seen == other.last_seen && rotated_at == other.rotated_at &&
           rotated_to == other.rotated_to && region == other.region &&
           token_version == other.token_version;
}

// --- DeviceIdentityManager ---

DeviceIdentityManager::DeviceIdentityManager(const AnonymizerConfig& config, KeyValueStore& store,
                                             CircuitBreaker& breaker, Clock clock)
    : config_(config),
      store_(store),
      breaker_(breaker),
      clock_(clock),
      salts_(config.current_salt, config.previous_salt),
      cache_(config.device_cache_size, clock) {}

void DeviceIdentityManager::set_abuse_handler(AbuseSignalHandler handler) {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    abuse_handler_ = std::move(handler);
}

std::string DeviceIdentityManager::generate_fingerprint(const ClientSignals& signals, const std::string& salt) const {
    return CryptoPrimitives::hmac_sha256_hex(salt, signals.canonical() + "|" + kTokenVersion);
}

std::string DeviceIdentityManager::fingerprint_or_fallback(const ClientSignals& signals, const std::string& salt) {
    if (!signals.empty()) {
        try {
            return generate_fingerprint(signals, salt);
        } catch (const CryptoError& e) {
            SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::DEGRADED_CRYPTO,
                                "internal", std::string("Fingerprint generation failed: ") + e.what());
        }
    }
    // No continuity, no linkage: a random grouping key of the same shape.
    MetricsRegistry::instance().increment_counter("device_fingerprint_fallback");
    return CryptoPrimitives::random_uuid_hex();
}

std::string DeviceIdentityManager::derive_token(const std::string& fingerprint) {
    std::string material = fingerprint + "|" + CryptoPrimitives::random_uuid_hex() + "|" +
                           std::to_string(to_epoch_millis(clock_())) + "|" + kTokenVersion + "|" +
                           CryptoPrimitives::random_hex(16);
    std::string salt = salts_.current();

    ScryptParams params;
    params.n = config_.scrypt_n;
    params.r = config_.scrypt_r;
    params.p = config_.scrypt_p;

    try {
        return CryptoPrimitives::scrypt_hex(material, salt, params);
    } catch (const CryptoError& e) {
        MetricsRegistry::instance().increment_counter("crypto_degraded");
        SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::DEGRADED_CRYPTO,
                            "internal", std::string("scrypt unavailable, using salted SHA-256: ") + e.what());
        return CryptoPrimitives::sha256_hex(material + salt);
    }
}

bool DeviceIdentityManager::rotation_due(const DeviceRecord& record, long long now) const {
    long long anchor = std::max(record.rotated_at.value_or(0), record.created_at);
    return now - anchor >= config_.rotation_interval.count();
}

std::optional<DeviceRecord> DeviceIdentityManager::lookup(const std::string& token) {
    if (!InputValidator::is_valid_device_token(token)) return std::nullopt;

    auto local = cache_.get(token);

    KeyValueStore::FieldMap fields;
    try {
        fields = breaker_.execute([&] { return store_.hgetall(device_key(token)); });
    } catch (const StoreError&) {
        if (local) return local;
        throw;
    }

    auto record = DeviceRecord::from_fields(fields);
    if (!record) {
        // Gone from the store (expired, erased, or never written here).
        if (local) cache_.erase(token);
        return std::nullopt;
    }

    if (!local || *local != *record) {
        cache_.put(token, *record, config_.device_cache_ttl);
        MetricsRegistry::instance().set_gauge("device_cache_size", static_cast<double>(cache_.size()));
    }
    return record;
}

std::optional<DeviceRecord> DeviceIdentityManager::validate_token(const std::string& token) {
    try {
        return lookup(token);
    } catch (const std::exception& e) {
        SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::STORE_UNAVAILABLE,
                            token, std::string("Token validation unavailable: ") + e.what());
        return std::nullopt;
    }
}

void DeviceIdentityManager::touch(const std::string& token, DeviceRecord record) {
    // Deprecated tokens keep their shortened grace TTL.
    if (record.rotated_to) return;

    long long now = to_epoch_seconds(clock_());
    try {
        breaker_.execute([&] {
            store_.hset_with_ttl(device_key(token), {{"lastSeen", std::to_string(now)}}, config_.token_ttl);
        });
    } catch (const std::exception&) {
        MetricsRegistry::instance().increment_counter("device_advisory_write_failures");
    }

    record.last_seen = now;
    cache_.put(token, record, config_.device_cache_ttl);
}

std::optional<std::string> DeviceIdentityManager::rotate(const std::string& old_token, const DeviceRecord& record) {
    const long long now = to_epoch_seconds(clock_());
    const std::string new_token = derive_token(record.fingerprint);

    DeviceRecord next = record;
    next.rotated_at = now;
    next.rotated_to.reset();
    next.last_seen = now;
    next.token_version = kTokenVersion;

    try {
        breaker_.execute([&] {
            store_.hset_with_ttl(device_key(new_token), next.to_fields(), config_.token_ttl);
        });
    } catch (const std::exception& e) {
        MetricsRegistry::instance().increment_counter("device_rotation_errors");
        SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::STORE_UNAVAILABLE,
                            old_token, std::string("Rotation deferred: ") + e.what());
        return std::nullopt;
    }

    const std::string fp_key = fingerprint_key(record.fingerprint);
    try {
        breaker_.execute([&] {
            store_.sadd(fp_key, new_token);
            store_.srem(fp_key, old_token);
            store_.expire(fp_key, config_.token_ttl);
        });
    } catch (const std::exception&) {
        MetricsRegistry::instance().increment_counter("device_advisory_write_failures");
    }

    DeviceRecord deprecated = record;
    deprecated.rotated_to = new_token;
    try {
        breaker_.execute([&] {
            store_.hset_with_ttl(device_key(old_token), {{"rotatedTo", new_token}},
                                 config_.rotation_grace_period);
        });
    } catch (const std::exception& e) {
        // The old token stays valid for its full TTL instead of the grace window.
        MetricsRegistry::instance().increment_counter("device_rotation_errors");
        SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::STORE_UNAVAILABLE,
                            old_token, std::string("Old token not deprecated: ") + e.what());
    }

    cache_.put(new_token, next, config_.device_cache_ttl);
    cache_.put(old_token, deprecated, std::min(config_.device_cache_ttl, config_.rotation_grace_period));
    MetricsRegistry::instance().set_gauge("device_cache_size", static_cast<double>(cache_.size()));

    MetricsRegistry::instance().increment_counter("device_token_rotated");
    SecurityLogger::log(SecurityLogger::Level::INFO, SecurityLogger::EventType::TOKEN_ROTATED,
                        old_token, "Token rotated");
    return new_token;
}

void DeviceIdentityManager::retire(const std::string& token) {
    cache_.erase(token);
    try {
        breaker_.execute([&] { store_.del(device_key(token)); });
    } catch (const std::exception&) {
        MetricsRegistry::instance().increment_counter("device_advisory_write_failures");
    }
    MetricsRegistry::instance().increment_counter("device_token_orphaned");
}

std::optional<DeviceInfo> DeviceIdentityManager::on_hit(const std::string& token, const DeviceRecord& record,
                                                        const TokenPair& stored, bool via_previous) {
    auto& metrics = MetricsRegistry::instance();

    if (record.rotated_to) {
        // Straggler on a deprecated token: redirect while the successor lives.
        std::optional<DeviceRecord> successor;
        bool successor_unreachable = false;
        try {
            successor = lookup(*record.rotated_to);
        } catch (const StoreError&) {
            successor_unreachable = true;
        }
        if (!successor && !successor_unreachable) {
            // The successor was erased; a deprecated token never outlives it.
            retire(token);
            return std::nullopt;
        }
        if (successor) {
            metrics.increment_counter("device_token_redirected");
            touch(*record.rotated_to, *successor);

            DeviceInfo info;
            info.device_id = *record.rotated_to;
            info.is_rotated = true;
            info.region = successor->region;
            info.tokens.current = *record.rotated_to;
            info.tokens.previous = token;
            return info;
        }
    }

    const long long now = to_epoch_seconds(clock_());
    if (!record.rotated_to && rotation_due(record, now)) {
        if (auto new_token = rotate(token, record)) {
            DeviceInfo info;
            info.device_id = *new_token;
            info.is_rotated = true;
            info.region = record.region;
            info.tokens.current = *new_token;
            info.tokens.previous = token;
            return info;
        }
    }

    touch(token, record);
    metrics.increment_counter("device_token_reused");

    DeviceInfo info;
    info.device_id = token;
    info.region = record.region;
    if (via_previous) {
        info.tokens.current = token;
    } else {
        info.tokens = stored;
    }
    return info;
}

long long DeviceIdentityManager::count_devices(const std::string& fingerprint,
                                               const std::optional<std::string>& previous_fingerprint) {
    long long count = breaker_.execute([&] { return store_.scard(fingerprint_key(fingerprint)); });
    if (previous_fingerprint && *previous_fingerprint != fingerprint) {
        count += breaker_.execute([&] { return store_.scard(fingerprint_key(*previous_fingerprint)); });
    }
    return count;
}

void DeviceIdentityManager::signal_abuse(const std::string& fingerprint, long long count) {
    MetricsRegistry::instance().increment_counter("device_fingerprint_limit_exceeded");
    SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::DEVICE_CAP_EXCEEDED,
                        fingerprint, "Fingerprint has " + std::to_string(count) + " live devices");

    AbuseSignalHandler handler;
    {
        std::lock_guard<std::mutex> lock(handler_mutex_);
        handler = abuse_handler_;
    }
    if (!handler) return;

    try {
        handler(fingerprint, count);
    } catch (const std::exception& e) {
        SecurityLogger::log(SecurityLogger::Level::ERROR, SecurityLogger::EventType::DEVICE_CAP_EXCEEDED,
                            fingerprint, std::string("Abuse handler failed: ") + e.what());
    }
}

DeviceInfo DeviceIdentityManager::register_new(const ClientSignals& signals) {
    const std::string fingerprint = fingerprint_or_fallback(signals, salts_.current());

    std::optional<std::string> previous_fingerprint;
    if (auto previous_salt = salts_.previous(); previous_salt && !signals.empty()) {
        try {
            previous_fingerprint = generate_fingerprint(signals, *previous_salt);
        } catch (const CryptoError&) {
            previous_fingerprint.reset();
        }
    }

    const std::string token = derive_token(fingerprint);
    const long long now = to_epoch_seconds(clock_());

    DeviceRecord record;
    record.fingerprint = fingerprint;
    record.created_at = now;
    record.last_seen = now;

    try {
        breaker_.execute([&] {
            store_.hset_with_ttl(device_key(token), record.to_fields(), config_.token_ttl);
        });
    } catch (const std::exception& e) {
        SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::STORE_UNAVAILABLE,
                            "internal", std::string("Device registration failed: ") + e.what());
        return ephemeral(TokenPair{});
    }

    // Device-cap accounting is monitoring only; issuance never depends on it.
    try {
        long long before = count_devices(fingerprint, previous_fingerprint);
        long long added = breaker_.execute([&] {
            long long n = store_.sadd(fingerprint_key(fingerprint), token);
            store_.expire(fingerprint_key(fingerprint), config_.token_ttl);
            return n;
        });
        long long after = before + added;
        if (before <= config_.max_devices_per_fingerprint && after > config_.max_devices_per_fingerprint) {
            signal_abuse(fingerprint, after);
        }
    } catch (const std::exception&) {
        MetricsRegistry::instance().increment_counter("device_advisory_write_failures");
    }

    cache_.put(token, record, config_.device_cache_ttl);
    MetricsRegistry::instance().set_gauge("device_cache_size", static_cast<double>(cache_.size()));
    MetricsRegistry::instance().increment_counter("device_token_created");
    SecurityLogger::log(SecurityLogger::Level::INFO, SecurityLogger::EventType::TOKEN_ISSUED,
                        token, "New device registered");

    DeviceInfo info;
    info.device_id = token;
    info.is_new = true;
    info.tokens.current = token;
    return info;
}

DeviceInfo DeviceIdentityManager::ephemeral(const TokenPair& stored) {
    static std::atomic<unsigned long long> sequence{0};

    const long long millis = to_epoch_millis(clock_());
    std::string suffix;
    try {
        suffix = CryptoPrimitives::random_hex(8);
    } catch (const CryptoError& e) {
        SecurityLogger::log(SecurityLogger::Level::CRITICAL, SecurityLogger::EventType::DEGRADED_CRYPTO,
                            "internal", std::string("CSPRNG unavailable for session id: ") + e.what());
        suffix = CryptoPrimitives::sha256_hex(std::to_string(millis) + ":" + std::to_string(++sequence))
                     .substr(0, 16);
    }

    MetricsRegistry::instance().increment_counter("device_token_ephemeral");

    DeviceInfo info;
    info.device_id = "temp-" + std::to_string(millis) + "-" + suffix;
    info.is_new = true;
    info.is_ephemeral = true;
    info.tokens = stored;
    return info;
}

DeviceInfo DeviceIdentityManager::resolve_or_create(const ClientSignals& signals, const TokenPair& stored) {
    auto start = std::chrono::steady_clock::now();
    auto& metrics = MetricsRegistry::instance();

    auto finish = [&](DeviceInfo info) {
        auto elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start);
        metrics.observe_ms("device_identification", elapsed.count());
        return info;
    };

    try {
        bool store_failed = false;

        if (stored.current) {
            try {
                if (auto record = lookup(*stored.current)) {
                    if (auto info = on_hit(*stored.current, *record, stored, false)) {
                        metrics.increment_counter("device_token_current_valid");
                        return finish(*info);
                    }
                }
            } catch (const StoreError&) {
                store_failed = true;
            }
        }

        if (stored.previous && stored.previous != stored.current) {
            try {
                if (auto record = lookup(*stored.previous)) {
                    if (auto info = on_hit(*stored.previous, *record, stored, true)) {
                        metrics.increment_counter("device_token_previous_valid");
                        SecurityLogger::log(SecurityLogger::Level::INFO, SecurityLogger::EventType::ROTATION_LAG,
                                            *stored.previous, "Client presented its previous token");
                        return finish(*info);
                    }
                }
            } catch (const StoreError&) {
                store_failed = true;
            }
        }

        if (store_failed || breaker_.is_open()) {
            return finish(ephemeral(stored));
        }
        return finish(register_new(signals));
    } catch (const std::exception& e) {
        SecurityLogger::log(SecurityLogger::Level::ERROR, SecurityLogger::EventType::STORE_UNAVAILABLE,
                            "internal", std::string("Identity resolution degraded: ") + e.what());
        return finish(ephemeral(stored));
    }
}

bool DeviceIdentityManager::update_device_region(const std::string& device_id, const std::string& region_hash) {
    if (!InputValidator::is_valid_device_token(device_id) || region_hash.empty()) return false;

    try {
        auto fields = breaker_.execute([&] { return store_.hgetall(device_key(device_id)); });
        auto record = DeviceRecord::from_fields(fields);
        if (!record) return false;

        breaker_.execute([&] { store_.hset(device_key(device_id), {{"region", region_hash}}); });

        record->region = region_hash;
        cache_.put(device_id, *record, config_.device_cache_ttl);
        return true;
    } catch (const std::exception& e) {
        SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::STORE_UNAVAILABLE,
                            device_id, std::string("Region update failed: ") + e.what());
        return false;
    }
}

bool DeviceIdentityManager::anonymize_device(const std::string& device_id) {
    // Session-only identifiers were never persisted.
    if (InputValidator::is_ephemeral_identifier(device_id)) return true;
    if (!InputValidator::is_valid_device_token(device_id)) return false;

    try {
        auto fields = breaker_.execute([&] { return store_.hgetall(device_key(device_id)); });
        auto record = DeviceRecord::from_fields(fields);

        if (record) {
            breaker_.execute([&] { store_.srem(fingerprint_key(record->fingerprint), device_id); });
        }
        breaker_.execute([&] { store_.del(device_key(device_id)); });

        cache_.erase(device_id);
        cache_.erase_if([&](const std::string&, const DeviceRecord& cached) {
            return cached.rotated_to && *cached.rotated_to == device_id;
        });
        MetricsRegistry::instance().set_gauge("device_cache_size", static_cast<double>(cache_.size()));

        MetricsRegistry::instance().increment_counter("device_erasures");
        SecurityLogger::log(SecurityLogger::Level::INFO, SecurityLogger::EventType::ERASURE,
                            device_id, "Device anonymized");
        return true;
    } catch (const std::exception& e) {
        SecurityLogger::log(SecurityLogger::Level::ERROR, SecurityLogger::EventType::ERASURE,
                            device_id, std::string("Erasure failed: ") + e.what());
        return false;
    }
}

}
