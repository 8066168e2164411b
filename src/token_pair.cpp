#include "token_pair.hpp"
#include "input_validator.hpp"
#include <boost/json.hpp>

namespace veil {

namespace {

std::optional<std::string> string_member(const boost::json::object& obj, const char* name) {
    auto it = obj.find(name);
    if (it == obj.end() || !it->value().is_string()) return std::nullopt;
    std::string value(it->value().as_string().c_str());
    if (value.empty()) return std::nullopt;
    return value;
}

}

std::string TokenPair::to_json() const {
    boost::json::object obj;
    if (current) obj["current"] = *current;
    if (previous) obj["previous"] = *previous;
    return boost::json::serialize(obj);
}

TokenPair TokenPair::parse(const std::string& raw) {
    TokenPair pair;
    if (raw.empty() || !InputValidator::is_within_size_limit(raw.size(), 4096)) return pair;

    if (raw.front() == '{') {
        try {
            auto val = InputValidator::safe_parse_json(raw);
            if (val.is_object()) {
                const auto& obj = val.as_object();
                pair.current = string_member(obj, "current");
                pair.previous = string_member(obj, "previous");
            }
        } catch (const std::exception&) {
            // Unparseable object form: no usable tokens.
        }
        return pair;
    }

    // Legacy clients stored the bare token string.
    pair.current = raw;
    return pair;
}

}
