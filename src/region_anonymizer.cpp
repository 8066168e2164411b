#include "region_anonymizer.hpp"
#include "crypto_primitives.hpp"
#include "geo_lookup.hpp"
#include "metrics.hpp"
#include "security_logger.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <sstream>

namespace veil {

PopulationBracket population_bracket(long long population) {
    if (population < 0) return PopulationBracket::UNKNOWN;
    if (population < 10000) return PopulationBracket::UNDER_10K;
    if (population < 100000) return PopulationBracket::FROM_10K_TO_100K;
    if (population < 1000000) return PopulationBracket::FROM_100K_TO_1M;
    if (population < 10000000) return PopulationBracket::FROM_1M_TO_10M;
    return PopulationBracket::OVER_10M;
}

const char* population_bracket_label(PopulationBracket bracket) {
    switch (bracket) {
        case PopulationBracket::UNDER_10K: return "<10k";
        case PopulationBracket::FROM_10K_TO_100K: return "10k-100k";
        case PopulationBracket::FROM_100K_TO_1M: return "100k-1M";
        case PopulationBracket::FROM_1M_TO_10M: return "1M-10M";
        case PopulationBracket::OVER_10M: return ">10M";
        default: return "unknown";
    }
}

namespace {

std::string normalize_label(const std::string& label) {
    auto begin = std::find_if_not(label.begin(), label.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(label.rbegin(), label.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();
    if (begin >= end) return "";

    std::string out(begin, end);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

double round_to(double value, int precision) {
    double factor = std::pow(10.0, precision);
    double rounded = std::round(value * factor) / factor;
    return rounded == 0.0 ? 0.0 : rounded;
}

}

RegionAnonymizer::RegionAnonymizer(const AnonymizerConfig& config, KeyValueStore& store,
                                   CircuitBreaker& breaker, Clock clock)
    : config_(config),
      clock_(clock),
      regions_("region", config.region_cache_size, store, breaker, clock),
      polygons_(config.polygon_cache_size, clock) {}

std::string RegionAnonymizer::truncate_coordinate(double value, int precision) {
    precision = std::clamp(precision, 0, 6);
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.*f", precision, round_to(value, precision));
    return buf;
}

std::string RegionAnonymizer::generalize_label(const std::string& label) {
    std::string normalized = normalize_label(label);
    auto cut = normalized.find_first_of("-/:");
    if (cut == std::string::npos) return normalized;
    std::string head = normalized.substr(0, cut);
    return head.empty() ? normalized : head;
}

int RegionAnonymizer::clamp_precision(std::optional<int> requested, int fallback) const {
    return std::clamp(requested.value_or(fallback), 0, 6);
}

bool RegionAnonymizer::is_valid_region_hash(const std::string& hash) const {
    if (hash == kGlobalRegion) return true;

    const std::string prefix = kRegionHashPrefix;
    if (hash.size() != prefix.size() + config_.region_hash_length) return false;
    if (hash.compare(0, prefix.size(), prefix) != 0) return false;
    return std::all_of(hash.begin() + prefix.size(), hash.end(), [](char c) {
        return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
    });
}

std::string RegionAnonymizer::describe_coordinates(double lat, double lng, int precision,
                                                   std::optional<long long> population,
                                                   std::optional<long long> min_population) const {
    std::string t_lat = truncate_coordinate(lat, precision);
    std::string t_lng = truncate_coordinate(lng, precision);

    // Lookups run on the truncated values so the description is a pure
    // function of the generalized cell.
    double g_lat = round_to(lat, std::clamp(precision, 0, 6));
    double g_lng = round_to(lng, std::clamp(precision, 0, 6));
    std::string cell = "r:" + GeoLookup::continent(g_lat, g_lng) + ":" + GeoLookup::country(g_lat, g_lng);

    long long floor = min_population.value_or(config_.min_population);
    if (population && *population < floor) {
        MetricsRegistry::instance().increment_counter("region_k_anonymity_generalized");
        return cell;
    }
    return cell + ":" + t_lat + "," + t_lng;
}

std::string RegionAnonymizer::hash_description(const std::string& description, const std::string& salt) const {
    std::string digest;
    try {
        digest = CryptoPrimitives::hmac_sha256_hex(salt, description);
    } catch (const CryptoError& e) {
        MetricsRegistry::instance().increment_counter("crypto_degraded");
        SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::DEGRADED_CRYPTO,
                            "internal", std::string("HMAC unavailable, using salted digest: ") + e.what());
        digest = CryptoPrimitives::sha256_hex(description + ":" + salt);
    }
    return kRegionHashPrefix + digest.substr(0, config_.region_hash_length);
}

std::string RegionAnonymizer::resolve(const std::string& local_key, const std::string& description,
                                      const RegionOptions& opts) {
    if (opts.salt) {
        return hash_description(description, *opts.salt);
    }

    auto& metrics = MetricsRegistry::instance();
    const std::string remote_key = "region:" + description;

    auto hit = regions_.get(local_key, remote_key);
    if (hit && hit->value != kGlobalRegion && is_valid_region_hash(hit->value)) {
        metrics.increment_counter(hit->tier == CacheTier::LOCAL ? "region_hash_memory_hit"
                                                                : "region_hash_store_hit");
        return hit->value;
    }

    std::string hash = hash_description(description, config_.effective_region_salt());
    metrics.increment_counter("region_hash_generated");
    regions_.put(local_key, remote_key, hash, config_.region_cache_ttl);
    return hash;
}

std::string RegionAnonymizer::anonymize_coordinates(double lat, double lng, const RegionOptions& opts) {
    if (!GeoLookup::is_valid_coordinate(lat, lng)) {
        MetricsRegistry::instance().increment_counter("region_hash_fallback");
        SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::INVALID_INPUT,
                            "internal", "Coordinates out of range");
        return kGlobalRegion;
    }

    try {
        int precision = clamp_precision(opts.precision, config_.coordinate_precision);
        long long floor = opts.min_population.value_or(config_.min_population);
        bool collapsed = opts.population && *opts.population < floor;

        char local_key[128];
        std::snprintf(local_key, sizeof(local_key), "coord:%.6f,%.6f:p%d:%c",
                      lat, lng, precision, collapsed ? 'k' : 'f');

        std::string description = describe_coordinates(lat, lng, precision, opts.population, floor);
        return resolve(local_key, description, opts);
    } catch (const std::exception& e) {
        MetricsRegistry::instance().increment_counter("region_hash_fallback");
        SecurityLogger::log(SecurityLogger::Level::ERROR, SecurityLogger::EventType::DEGRADED_CRYPTO,
                            "internal", std::string("Region hashing failed: ") + e.what());
        return kGlobalRegion;
    }
}

std::string RegionAnonymizer::hash_polygon(const std::vector<GeoPoint>& points, const RegionOptions& opts) {
    bool valid = !points.empty() && std::all_of(points.begin(), points.end(), [](const GeoPoint& p) {
        return GeoLookup::is_valid_coordinate(p.lat, p.lng);
    });
    if (!valid) {
        MetricsRegistry::instance().increment_counter("region_hash_fallback");
        SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::INVALID_INPUT,
                            "internal", "Polygon empty or out of range");
        return kGlobalRegion;
    }

    try {
        int precision = clamp_precision(opts.precision, config_.polygon_precision);

        std::vector<GeoPoint> sorted(points);
        std::sort(sorted.begin(), sorted.end(), [](const GeoPoint& a, const GeoPoint& b) {
            return a.lat < b.lat || (a.lat == b.lat && a.lng < b.lng);
        });

        std::ostringstream key;
        char buf[64];
        for (const auto& p : sorted) {
            std::snprintf(buf, sizeof(buf), "%.4f,%.4f;", p.lat, p.lng);
            key << buf;
        }
        key << "p" << precision;
        const std::string cache_key = key.str();

        if (!opts.salt) {
            if (auto cached = polygons_.get(cache_key)) {
                MetricsRegistry::instance().increment_counter("region_hash_polygon_cache_hit");
                return *cached;
            }
        }

        double sum_lat = 0.0;
        double sum_lng = 0.0;
        for (const auto& p : sorted) {
            sum_lat += round_to(p.lat, precision);
            sum_lng += round_to(p.lng, precision);
        }
        double n = static_cast<double>(sorted.size());
        std::string description = "poly:" + truncate_coordinate(sum_lat / n, precision) + "," +
                                  truncate_coordinate(sum_lng / n, precision) + ":" +
                                  std::to_string(sorted.size());

        std::string hash = resolve("desc:" + description, description, opts);
        if (!opts.salt) {
            polygons_.put(cache_key, hash, config_.polygon_cache_ttl);
            MetricsRegistry::instance().set_gauge("polygon_cache_size", static_cast<double>(polygons_.size()));
        }
        return hash;
    } catch (const std::exception& e) {
        MetricsRegistry::instance().increment_counter("region_hash_fallback");
        SecurityLogger::log(SecurityLogger::Level::ERROR, SecurityLogger::EventType::DEGRADED_CRYPTO,
                            "internal", std::string("Polygon hashing failed: ") + e.what());
        return kGlobalRegion;
    }
}

std::string RegionAnonymizer::hash_region(const std::string& label, const RegionOptions& opts) {
    std::string normalized = normalize_label(label);
    if (normalized.empty()) {
        MetricsRegistry::instance().increment_counter("region_hash_fallback");
        return kGlobalRegion;
    }

    try {
        return resolve("label:" + normalized, normalized, opts);
    } catch (const std::exception& e) {
        MetricsRegistry::instance().increment_counter("region_hash_fallback");
        SecurityLogger::log(SecurityLogger::Level::ERROR, SecurityLogger::EventType::DEGRADED_CRYPTO,
                            "internal", std::string("Label hashing failed: ") + e.what());
        return kGlobalRegion;
    }
}

std::string RegionAnonymizer::hash_with_k_anonymity(const std::string& label, long long population,
                                                    const RegionOptions& opts) {
    long long floor = opts.min_population.value_or(config_.min_population);

    if (population < 0 || population < floor) {
        MetricsRegistry::instance().increment_counter("region_k_anonymity_generalized");
        return hash_region(generalize_label(label), opts);
    }

    std::string normalized = normalize_label(label);
    if (normalized.empty()) {
        MetricsRegistry::instance().increment_counter("region_hash_fallback");
        return kGlobalRegion;
    }
    return hash_region(normalized + ":" + population_bracket_label(population_bracket(population)), opts);
}

}
