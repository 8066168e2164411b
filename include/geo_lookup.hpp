#pragma once

#include <string>

namespace veil {

// Coarse bounding-box resolution of continent and country codes.
// Intentionally approximate: boxes overlap and are checked in a fixed order,
// so the result is stable for a given coordinate but not geographically exact.
class GeoLookup {
public:
    // Two-letter continent code (af, an, as, eu, na, oc, sa) or "unk".
    static std::string continent(double lat, double lng);

    // ISO-3166 alpha-2 (lowercase) for a small set of large countries, or "xx".
    static std::string country(double lat, double lng);

    static bool is_valid_coordinate(double lat, double lng);
};

}
