#include "checkin_anonymizer.hpp"
#include "metrics.hpp"
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <stdexcept>

namespace veil {

namespace json = boost::json;

namespace {

double number_of(const json::value& v, const char* field) {
    if (v.is_double()) return v.get_double();
    if (v.is_int64()) return static_cast<double>(v.get_int64());
    if (v.is_uint64()) return static_cast<double>(v.get_uint64());
    throw std::invalid_argument(std::string("field '") + field + "' must be a number");
}

std::string string_of(const json::value& v, const char* field) {
    if (!v.is_string()) {
        throw std::invalid_argument(std::string("field '") + field + "' must be a string");
    }
    return std::string(v.get_string().c_str());
}

// Fractions truncate; values outside T's range (or non-finite) are rejected.
template <typename T>
T integer_of(const json::value& v, const char* field) {
    double value = number_of(v, field);
    const double lower = static_cast<double>(std::numeric_limits<T>::min());
    // -min is a power of two, so it is exact as a double where max may not be.
    if (!std::isfinite(value) || value < lower || value >= -lower) {
        throw std::invalid_argument(std::string("field '") + field + "' is out of range");
    }
    return static_cast<T>(value);
}

int int_of(const json::value& v, const char* field) {
    return integer_of<int>(v, field);
}

ClientSignals parse_signals(const json::object& obj) {
    ClientSignals s;
    for (const auto& kv : obj) {
        const std::string key(kv.key().data(), kv.key().size());
        const json::value& v = kv.value();
        if (key == "userAgent") s.user_agent = string_of(v, "userAgent");
        else if (key == "language") s.language = string_of(v, "language");
        else if (key == "platform") s.platform = string_of(v, "platform");
        else if (key == "timezone") s.timezone = string_of(v, "timezone");
        else if (key == "screenWidth") s.screen_width = int_of(v, "screenWidth");
        else if (key == "screenHeight") s.screen_height = int_of(v, "screenHeight");
        else if (key == "colorDepth") s.color_depth = int_of(v, "colorDepth");
        else if (key == "hardwareConcurrency") s.hardware_concurrency = int_of(v, "hardwareConcurrency");
        else s.extra[key] = v.is_string() ? std::string(v.get_string().c_str()) : json::serialize(v);
    }
    return s;
}

}

CheckInAnonymizer::CheckInAnonymizer(DeviceIdentityManager& devices, RegionAnonymizer& regions,
                                     const ContentSanitizer& sanitizer, CheckInLimiter* limiter)
    : devices_(devices), regions_(regions), sanitizer_(sanitizer), limiter_(limiter) {}

std::string CheckInAnonymizer::resolve_region(const CheckInRequest& request) {
    if (!request.polygon.empty()) {
        return regions_.hash_polygon(request.polygon);
    }
    if (request.lat && request.lng) {
        RegionOptions opts;
        opts.population = request.population;
        return regions_.anonymize_coordinates(*request.lat, *request.lng, opts);
    }
    if (request.region_label) {
        return regions_.hash_with_k_anonymity(*request.region_label, request.population.value_or(-1));
    }
    return kGlobalRegion;
}

AnonymizedCheckIn CheckInAnonymizer::process(const CheckInRequest& request) {
    AnonymizedCheckIn result;

    DeviceInfo device = devices_.resolve_or_create(request.signals, request.tokens);
    result.device_id = device.device_id;
    result.tokens = device.tokens;
    result.is_new = device.is_new;
    result.is_rotated = device.is_rotated;
    result.is_ephemeral = device.is_ephemeral;

    if (limiter_ && !device.is_ephemeral) {
        auto wait = limiter_->seconds_until_next_check_in(device.device_id);
        // A rotation hands out a fresh token; the window stays with the lineage.
        if (device.tokens.previous && *device.tokens.previous != device.device_id) {
            wait = std::max(wait, limiter_->seconds_until_next_check_in(*device.tokens.previous));
        }
        if (wait.count() > 0) {
            result.accepted = false;
            result.retry_after = wait;
            MetricsRegistry::instance().increment_counter("checkin_rejected_frequency");
            return result;
        }
    }

    result.region_hash = resolve_region(request);

    auto report = sanitizer_.sanitize_with_report(request.note);
    result.note = std::move(report.text);
    result.note_redacted = report.total() > 0 || report.degraded;

    if (!device.is_ephemeral) {
        // Bookkeeping only; the check-in itself never depends on it.
        if (!devices_.update_device_region(device.device_id, result.region_hash)) {
            MetricsRegistry::instance().increment_counter("device_advisory_write_failures");
        }
        if (limiter_) limiter_->record_check_in(device.device_id);
    }

    MetricsRegistry::instance().increment_counter("checkins_anonymized");
    return result;
}

CheckInRequest CheckInAnonymizer::parse_request(const json::value& payload) {
    if (!payload.is_object()) {
        throw std::invalid_argument("check-in payload must be a JSON object");
    }
    const json::object& obj = payload.get_object();
    CheckInRequest req;

    if (auto* v = obj.if_contains("signals")) {
        if (!v->is_object()) throw std::invalid_argument("field 'signals' must be an object");
        req.signals = parse_signals(v->get_object());
    }

    if (auto* v = obj.if_contains("tokens")) {
        if (v->is_string()) {
            req.tokens = TokenPair::parse(std::string(v->get_string().c_str()));
        } else if (v->is_object()) {
            req.tokens = TokenPair::parse(json::serialize(*v));
        } else if (!v->is_null()) {
            throw std::invalid_argument("field 'tokens' must be an object or string");
        }
    }

    if (auto* v = obj.if_contains("lat")) req.lat = number_of(*v, "lat");
    if (auto* v = obj.if_contains("lng")) req.lng = number_of(*v, "lng");

    if (auto* v = obj.if_contains("polygon")) {
        if (!v->is_array()) throw std::invalid_argument("field 'polygon' must be an array");
        for (const auto& point : v->get_array()) {
            if (!point.is_array() || point.get_array().size() != 2) {
                throw std::invalid_argument("polygon points must be [lat, lng] pairs");
            }
            const auto& pair = point.get_array();
            req.polygon.push_back(GeoPoint{number_of(pair[0], "polygon"), number_of(pair[1], "polygon")});
        }
    }

    if (auto* v = obj.if_contains("region")) req.region_label = string_of(*v, "region");
    if (auto* v = obj.if_contains("population")) {
        req.population = integer_of<long long>(*v, "population");
    }
    if (auto* v = obj.if_contains("note")) req.note = string_of(*v, "note");

    return req;
}

json::object CheckInAnonymizer::to_json(const AnonymizedCheckIn& result) {
    json::object out;
    out["deviceId"] = result.device_id;

    json::object tokens;
    if (result.tokens.current) tokens["current"] = *result.tokens.current;
    if (result.tokens.previous) tokens["previous"] = *result.tokens.previous;
    out["tokens"] = std::move(tokens);

    out["isNew"] = result.is_new;
    out["isRotated"] = result.is_rotated;
    out["isEphemeral"] = result.is_ephemeral;
    out["accepted"] = result.accepted;
    if (result.accepted) {
        out["region"] = result.region_hash;
        out["note"] = result.note;
        out["noteRedacted"] = result.note_redacted;
    } else {
        out["retryAfter"] = static_cast<std::int64_t>(result.retry_after.count());
    }
    return out;
}

}
