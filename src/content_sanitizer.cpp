#include "content_sanitizer.hpp"
#include "metrics.hpp"
#include "security_logger.hpp"

namespace veil {

namespace {

// Upper bound on replace passes; one pass suffices for the built-in rules.
constexpr int kMaxPasses = 4;

}

const char* pii_category_name(PiiCategory category) {
    switch (category) {
        case PiiCategory::EMAIL: return "EMAIL";
        case PiiCategory::URL: return "URL";
        case PiiCategory::IP: return "IP";
        case PiiCategory::CARD: return "CARD";
        case PiiCategory::PHONE: return "PHONE";
        case PiiCategory::NATIONAL_ID: return "NATIONAL_ID";
        case PiiCategory::ADDRESS: return "ADDRESS";
        case PiiCategory::NAME: return "NAME";
        default: return "UNKNOWN";
    }
}

std::vector<PiiRule> ContentSanitizer::default_rules() {
    return {
        {PiiCategory::EMAIL, R"([A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+\.[A-Za-z]{2,})", "[EMAIL]"},
        {PiiCategory::URL, R"(\b(?:https?://|www\.)[^\s<>"']+)", "[URL]", false},
        {PiiCategory::IP, R"(\b(?:\d{1,3}\.){3}\d{1,3}\b)", "[IP]"},
        {PiiCategory::CARD, R"(\b(?:\d{4}[\s.-]?){3}\d{4}\b)", "[CARD]"},
        {PiiCategory::PHONE, R"((?:\+\d{1,3}[\s.-]?)?(?:\(\d{3}\)|\b\d{3})[\s.-]?\d{3}[\s.-]?\d{4}\b)", "[PHONE]"},
        {PiiCategory::NATIONAL_ID, R"(\b\d{3}[-.]?\d{2}[-.]?\d{4}\b)", "[ID]"},
        {PiiCategory::ADDRESS,
         R"(\b\d{1,6}\s+(?:[A-Za-z]+\s+){1,4}(?:st|street|ave|avenue|rd|road|blvd|boulevard|dr|drive|lane|ln|way|ct|court)\b)",
         "[ADDRESS]", false},
        {PiiCategory::NAME, R"(\b(?:Mr|Mrs|Ms|Dr|Prof)\.?\s+[A-Z][a-z]+\b)", "[NAME]"},
    };
}

ContentSanitizer::ContentSanitizer(size_t max_length)
    : ContentSanitizer(default_rules(), max_length) {}

ContentSanitizer::ContentSanitizer(const std::vector<PiiRule>& rules, size_t max_length)
    : max_length_(max_length) {
    for (const auto& rule : rules) {
        re2::RE2::Options options;
        options.set_log_errors(false);
        options.set_case_sensitive(rule.case_sensitive);
        auto re = std::make_unique<re2::RE2>(rule.pattern, options);
        if (!re->ok()) {
            healthy_ = false;
            SecurityLogger::log(SecurityLogger::Level::ERROR, SecurityLogger::EventType::PII_REDACTED,
                                "internal", std::string("PII rule ") + pii_category_name(rule.category) +
                                " failed to compile: " + re->error());
        }
        rules_.push_back(CompiledRule{rule.category, rule.placeholder, std::move(re)});
    }
}

std::string ContentSanitizer::truncate_utf8(const std::string& text) const {
    if (text.size() <= max_length_) return text;
    size_t cut = max_length_;
    // Back off continuation bytes so a multi-byte sequence is never split.
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return text.substr(0, cut);
}

bool ContentSanitizer::contains_pii(const std::string& text) const {
    if (text.empty()) return false;
    if (!healthy_) return true;

    for (const auto& rule : rules_) {
        if (re2::RE2::PartialMatch(text, *rule.re)) return true;
    }
    return false;
}

std::string ContentSanitizer::sanitize(const std::string& text) const {
    return sanitize_with_report(text).text;
}

SanitizeReport ContentSanitizer::sanitize_with_report(const std::string& text) const {
    SanitizeReport report;
    if (text.empty()) {
        return report;
    }

    if (!healthy_) {
        MetricsRegistry::instance().increment_counter("pii_sanitize_failures");
        report.text = truncate_utf8(text);
        report.degraded = true;
        return report;
    }

    try {
        std::string out = text;
        for (int pass = 0; pass < kMaxPasses; ++pass) {
            int replaced = 0;
            for (const auto& rule : rules_) {
                int n = re2::RE2::GlobalReplace(&out, *rule.re, rule.placeholder);
                if (n > 0) {
                    report.redactions[rule.category] += n;
                    replaced += n;
                }
            }
            if (replaced == 0) break;
        }
        report.text = std::move(out);
    } catch (const std::exception& e) {
        MetricsRegistry::instance().increment_counter("pii_sanitize_failures");
        SecurityLogger::log(SecurityLogger::Level::ERROR, SecurityLogger::EventType::PII_REDACTED,
                            "internal", std::string("Sanitization failed: ") + e.what());
        report.text = truncate_utf8(text);
        report.redactions.clear();
        report.degraded = true;
        return report;
    }

    int total = report.total();
    if (total > 0) {
        MetricsRegistry::instance().increment_counter("pii_redactions", total);
        SecurityLogger::log(SecurityLogger::Level::INFO, SecurityLogger::EventType::PII_REDACTED,
                            "internal", std::to_string(total) + " span(s) redacted");
    }
    return report;
}

}
