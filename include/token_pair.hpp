#pragma once

#include <string>
#include <optional>

namespace veil {

// Caller-held {current, previous?} token pair. The caller persists it between
// requests and overwrites it whenever a resolution reports a rotation.
struct TokenPair {
    std::optional<std::string> current;
    std::optional<std::string> previous;

    bool empty() const { return !current && !previous; }

    // {"current":"...","previous":"..."}; absent members are omitted.
    std::string to_json() const;

    /**
     * Accepts the JSON object form, or a bare non-JSON string as a legacy
     * single current token. Empty or unusable input yields an empty pair.
     */
    static TokenPair parse(const std::string& raw);
};

}
