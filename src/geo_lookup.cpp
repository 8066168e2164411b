#include "geo_lookup.hpp"
#include <cmath>

namespace veil {

namespace {

struct Box {
    const char* code;
    double min_lat, max_lat, min_lng, max_lng;
};

bool inside(const Box& b, double lat, double lng) {
    return lat >= b.min_lat && lat <= b.max_lat && lng >= b.min_lng && lng <= b.max_lng;
}

// Order matters where boxes overlap.
const Box kContinents[] = {
    {"oc", -50.0, 0.0, 110.0, 180.0},
    {"af", -35.0, 37.0, -20.0, 52.0},
    {"eu", 35.0, 71.0, -25.0, 45.0},
    {"as", -10.0, 77.0, 45.0, 180.0},
    {"na", 7.0, 84.0, -170.0, -50.0},
    {"sa", -56.0, 13.0, -82.0, -34.0},
    {"an", -90.0, -60.0, -180.0, 180.0},
};

const Box kCountries[] = {
    {"us", 24.5, 49.5, -125.0, -66.9},
    {"ca", 49.5, 83.0, -141.0, -52.6},
    {"mx", 14.5, 32.7, -118.4, -86.7},
    {"br", -33.8, 5.3, -74.0, -34.8},
    {"gb", 49.9, 58.7, -8.2, 1.8},
    {"fr", 42.3, 51.1, -4.8, 8.2},
    {"de", 47.3, 55.1, 5.9, 15.0},
    {"es", 36.0, 43.8, -9.3, 3.3},
    {"it", 36.6, 47.1, 6.6, 18.5},
    {"jp", 24.0, 45.5, 122.9, 145.8},
    {"in", 6.7, 35.5, 68.1, 97.4},
    {"au", -43.6, -10.7, 113.3, 153.6},
    {"za", -34.8, -22.1, 16.5, 32.9},
    {"cn", 18.2, 53.6, 73.5, 134.8},
};

}

bool GeoLookup::is_valid_coordinate(double lat, double lng) {
    if (!std::isfinite(lat) || !std::isfinite(lng)) return false;
    return lat >= -90.0 && lat <= 90.0 && lng >= -180.0 && lng <= 180.0;
}

std::string GeoLookup::continent(double lat, double lng) {
    for (const auto& box : kContinents) {
        if (inside(box, lat, lng)) return box.code;
    }
    return "unk";
}

std::string GeoLookup::country(double lat, double lng) {
    for (const auto& box : kCountries) {
        if (inside(box, lat, lng)) return box.code;
    }
    return "xx";
}

}
