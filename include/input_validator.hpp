#pragma once

#include <string>
#include <cctype>
#include <algorithm>
#include <boost/json.hpp>

namespace veil {

// Shape checks for identifiers crossing the library boundary.
class InputValidator {
public:
    // Validates that a string is a correctly formatted hexadecimal sequence.
    static bool is_valid_hex(const std::string& str, size_t expected_length = 0) {
        if (str.empty()) return false;
        if (expected_length > 0 && str.length() != expected_length) return false;

        return std::all_of(str.begin(), str.end(), [](char c) {
            return std::isxdigit(static_cast<unsigned char>(c));
        });
    }

    // Device tokens are 32-byte scrypt outputs, 64 hex characters.
    static bool is_valid_device_token(const std::string& token) {
        return is_valid_hex(token, 64);
    }

    // temp-<epoch ms>-<16 hex>
    static bool is_ephemeral_identifier(const std::string& id) {
        const std::string prefix = "temp-";
        if (id.size() <= prefix.size() || id.compare(0, prefix.size(), prefix) != 0) return false;

        auto dash = id.find('-', prefix.size());
        if (dash == std::string::npos || dash == prefix.size()) return false;

        std::string millis = id.substr(prefix.size(), dash - prefix.size());
        if (!std::all_of(millis.begin(), millis.end(), [](char c) {
                return std::isdigit(static_cast<unsigned char>(c));
            })) {
            return false;
        }
        return is_valid_hex(id.substr(dash + 1), 16);
    }

    static bool is_within_size_limit(size_t size, size_t max_size) {
        return size <= max_size;
    }

    /**
     * JSON parsing with a recursion depth limit so that hostile payloads cannot
     * exhaust the stack. Throws boost::system::system_error on malformed input.
     */
    static boost::json::value safe_parse_json(const std::string& input) {
        boost::json::parse_options opt;
        opt.max_depth = 16;
        return boost::json::parse(input, {}, opt);
    }
};

}
