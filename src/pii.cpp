#include "pii.hpp"

namespace memora {

namespace {

struct RuleDef {
    const char* type;
    const char* pattern;
    const char* replacement;
};

constexpr RuleDef kBasicRules[] = {
    {"EMAIL",
     R"(\b[A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+\.[A-Z|a-z]{2,}\b)",
     "[EMAIL]"},
    {"PHONE",
     R"(\b\+?1?[-.\s]?\(?(\d{3})\)?[-.\s]?(\d{3})[-.\s]?(\d{4})\b)",
     "[PHONE]"},
    {"CREDIT_CARD",
     R"(\b\d{4}[-\s]?(\d{4}[-\s]?){2}\d{4}\b)",
     "[CREDIT_CARD]"},
    {"SSN",
     R"(\b\d{3}-\d{2}-\d{4}\b)",
     "[SSN]"},
    {"IP_ADDRESS",
     R"(\b\d{1,3}\.\d{1,3}\.\d{1,3}\.\d{1,3}\b)",
     "[IP_ADDRESS]"},
    {"NAME",
     R"(\b(Name|name)\s*[:\-]\s*([A-Z][a-z]+ [A-Z][a-z]+))",
     "$1: [NAME]"},
};

constexpr RuleDef kExtendedRules[] = {
    {"DOB",
     R"(\b(\d{1,2}[\/\-]\d{1,2}[\/\-]\d{4}|\d{4}[\/\-]\d{1,2}[\/\-]\d{1,2})\b)",
     "[DOB]"},
    {"BANK_ACCOUNT",
     R"(\b\d{8,12}\b)",
     "[BANK_ACCOUNT]"},
    {"LICENSE_PLATE",
     R"(\b[A-Z]{1,3}\d{3,4}[A-Z]{0,3}\b)",
     "[LICENSE_PLATE]"},
};

constexpr const char* kSensitivePatterns[] = {
    R"(password[:\s]+[^\s]+)",
    R"(api[-_\s]?key[:\s]+[^\s]+)",
    R"(token[:\s]+[^\s]+)",
    R"(secret[:\s]+[^\s]+)",
};

constexpr auto kFlags = std::regex::ECMAScript | std::regex::icase;

PiiRule make_rule(const RuleDef& def) {
    return PiiRule{def.type, def.pattern, def.replacement,
                   std::regex(def.pattern, kFlags)};
}

} // namespace

PiiRedactor::PiiRedactor(bool extended) : extended_(extended) {
    for (const auto& def : kBasicRules) rules_.push_back(make_rule(def));
    if (extended_) {
        for (const auto& def : kExtendedRules) rules_.push_back(make_rule(def));
    }
    for (const char* p : kSensitivePatterns) sensitive_.emplace_back(p, kFlags);
}

std::string PiiRedactor::redact(const std::string& text) const {
    std::string result = text;
    for (const auto& rule : rules_) {
        result = std::regex_replace(result, rule.regex, rule.replacement);
    }
    return result;
}

std::vector<PiiMatch> PiiRedactor::detect(const std::string& text) const {
    std::vector<PiiMatch> found;
    for (const auto& rule : rules_) {
        auto begin = std::sregex_iterator(text.begin(), text.end(), rule.regex);
        for (auto it = begin; it != std::sregex_iterator(); ++it) {
            const std::smatch& m = *it;
            PiiMatch match;
            match.type = rule.type;
            match.value = m.str();
            match.start = static_cast<size_t>(m.position());
            match.end = match.start + static_cast<size_t>(m.length());
            match.replacement = m.format(rule.replacement);
            found.push_back(std::move(match));
        }
    }
    return found;
}

bool PiiRedactor::validate_sensitive_context(const std::string& text) const {
    for (const auto& re : sensitive_) {
        if (std::regex_search(text, re)) return true;
    }
    return false;
}

} // namespace memora
