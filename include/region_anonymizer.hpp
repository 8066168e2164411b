#pragma once

#include <string>
#include <vector>
#include <optional>
#include "anonymizer_config.hpp"
#include "circuit_breaker.hpp"
#include "clock.hpp"
#include "key_value_store.hpp"
#include "lru_cache.hpp"
#include "two_tier_cache.hpp"

namespace veil {

inline constexpr const char* kGlobalRegion = "global";
inline constexpr const char* kRegionHashPrefix = "rgn:";

enum class PopulationBracket {
    UNDER_10K,
    FROM_10K_TO_100K,
    FROM_100K_TO_1M,
    FROM_1M_TO_10M,
    OVER_10M,
    UNKNOWN
};

// Negative populations are treated as unknown.
PopulationBracket population_bracket(long long population);
const char* population_bracket_label(PopulationBracket bracket);

struct GeoPoint {
    double lat;
    double lng;
};

// Per-call overrides. Unset fields fall back to AnonymizerConfig.
struct RegionOptions {
    std::optional<int> precision;
    std::optional<long long> min_population;
    // Known population of the coordinate's cell; below the floor the cell is
    // collapsed to continent:country.
    std::optional<long long> population;
    // Alternate salt. Results computed with it bypass every cache.
    std::optional<std::string> salt;
};

// Converts locations into salted, prefixed, k-anonymous region hashes.
// Never throws: any internal failure yields kGlobalRegion.
class RegionAnonymizer {
public:
    RegionAnonymizer(const AnonymizerConfig& config, KeyValueStore& store,
                     CircuitBreaker& breaker, Clock clock = system_clock());

    RegionAnonymizer(const RegionAnonymizer&) = delete;
    RegionAnonymizer& operator=(const RegionAnonymizer&) = delete;

    /**
     * Truncates (lat, lng), resolves continent/country and hashes
     * "r:<continent>:<country>:<lat>,<lng>".
     * @return Region hash, or kGlobalRegion for out-of-range input.
     */
    std::string anonymize_coordinates(double lat, double lng, const RegionOptions& opts = {});

    // Hashes "poly:<centroid>:<point count>" over the order-independent point set.
    std::string hash_polygon(const std::vector<GeoPoint>& points, const RegionOptions& opts = {});

    /**
     * Hashes "<label>:<population bracket>", or the generalized label alone
     * when population is below the k-anonymity floor (or unknown).
     */
    std::string hash_with_k_anonymity(const std::string& label, long long population,
                                      const RegionOptions& opts = {});

    // Salted hash of a free-form region label. Labels are trimmed and lowercased.
    std::string hash_region(const std::string& label, const RegionOptions& opts = {});

    bool is_valid_region_hash(const std::string& hash) const;

    // Canonical description hashed by anonymize_coordinates. Exposed for diagnostics.
    std::string describe_coordinates(double lat, double lng, int precision,
                                     std::optional<long long> population = std::nullopt,
                                     std::optional<long long> min_population = std::nullopt) const;

    // Rounds to `precision` decimals and formats with exactly that many digits.
    // Negative zero is normalized to zero.
    static std::string truncate_coordinate(double value, int precision);

    // Broadest unit of a hierarchical label: "us-ny-albany" -> "us".
    static std::string generalize_label(const std::string& label);

    size_t region_cache_size() const { return regions_.local_size(); }
    size_t polygon_cache_size() const { return polygons_.size(); }

private:
    std::string resolve(const std::string& local_key, const std::string& description,
                        const RegionOptions& opts);
    std::string hash_description(const std::string& description, const std::string& salt) const;
    int clamp_precision(std::optional<int> requested, int fallback) const;

    AnonymizerConfig config_;
    Clock clock_;
    TwoTierCache regions_;
    LruCache<std::string, std::string> polygons_;
};

}
