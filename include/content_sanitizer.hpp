#pragma once

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <re2/re2.h>

namespace veil {

enum class PiiCategory {
    EMAIL,
    URL,
    IP,
    CARD,
    PHONE,
    NATIONAL_ID,
    ADDRESS,
    NAME
};

const char* pii_category_name(PiiCategory category);

struct PiiRule {
    PiiCategory category;
    std::string pattern;
    std::string placeholder;
    bool case_sensitive = true;
};

struct SanitizeReport {
    std::string text;
    std::map<PiiCategory, int> redactions;
    // Set when the pattern engine was unusable and text was only truncated.
    bool degraded = false;

    int total() const {
        int sum = 0;
        for (const auto& [category, count] : redactions) sum += count;
        return sum;
    }
};

// Pattern-based PII detector and redactor for free text.
// sanitize() is pure and idempotent; matches are replaced with fixed
// placeholders ([EMAIL], [PHONE], ...) that no rule matches again.
class ContentSanitizer {
public:
    // Built-in rules, applied in this order.
    static std::vector<PiiRule> default_rules();

    explicit ContentSanitizer(size_t max_length = 2000);
    ContentSanitizer(const std::vector<PiiRule>& rules, size_t max_length);

    ContentSanitizer(const ContentSanitizer&) = delete;
    ContentSanitizer& operator=(const ContentSanitizer&) = delete;

    // True when any rule matches. Conservatively true if the engine is unusable.
    bool contains_pii(const std::string& text) const;

    /**
     * Replaces every PII match with its placeholder. Never throws; on engine
     * failure returns the input truncated to max_length on a UTF-8 boundary.
     */
    std::string sanitize(const std::string& text) const;

    SanitizeReport sanitize_with_report(const std::string& text) const;

    bool healthy() const { return healthy_; }
    size_t max_length() const { return max_length_; }

private:
    struct CompiledRule {
        PiiCategory category;
        std::string placeholder;
        std::unique_ptr<re2::RE2> re;
    };

    std::string truncate_utf8(const std::string& text) const;

    std::vector<CompiledRule> rules_;
    size_t max_length_;
    bool healthy_ = true;
};

}
