#pragma once

#include <string>
#include <vector>
#include <optional>
#include <chrono>
#include <boost/json.hpp>
#include "checkin_limiter.hpp"
#include "content_sanitizer.hpp"
#include "device_identity.hpp"
#include "region_anonymizer.hpp"
#include "token_pair.hpp"

namespace veil {

// Raw inbound check-in, as handed over by the intake layer.
struct CheckInRequest {
    ClientSignals signals;
    TokenPair tokens;
    std::optional<double> lat;
    std::optional<double> lng;
    std::vector<GeoPoint> polygon;
    std::optional<std::string> region_label;
    std::optional<long long> population;
    std::string note;
};

// Only what may be persisted: token pair, region hash and redacted note.
struct AnonymizedCheckIn {
    std::string device_id;
    TokenPair tokens;
    bool is_new = false;
    bool is_rotated = false;
    bool is_ephemeral = false;
    std::string region_hash;
    std::string note;
    bool note_redacted = false;
    bool accepted = true;
    std::chrono::seconds retry_after{0};
};

// Runs the anonymization pipeline for one check-in:
// identity -> region -> note -> region bookkeeping on the device record.
class CheckInAnonymizer {
public:
    CheckInAnonymizer(DeviceIdentityManager& devices, RegionAnonymizer& regions,
                      const ContentSanitizer& sanitizer, CheckInLimiter* limiter = nullptr);

    AnonymizedCheckIn process(const CheckInRequest& request);

    /**
     * Decodes a JSON check-in request.
     * @throws std::invalid_argument when the payload is not an object or a field has the wrong type.
     */
    static CheckInRequest parse_request(const boost::json::value& payload);

    static boost::json::object to_json(const AnonymizedCheckIn& result);

private:
    std::string resolve_region(const CheckInRequest& request);

    DeviceIdentityManager& devices_;
    RegionAnonymizer& regions_;
    const ContentSanitizer& sanitizer_;
    CheckInLimiter* limiter_;
};

}
