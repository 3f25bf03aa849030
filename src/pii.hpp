#pragma once
#include <regex>
#include <string>
#include <vector>

namespace memora {

struct PiiMatch {
    std::string type;         // EMAIL, PHONE, ...
    std::string value;        // matched text
    size_t start = 0;         // byte offset into the scanned text
    size_t end = 0;           // one past the last byte
    std::string replacement;  // what redact() substitutes for this match
};

struct PiiRule {
    std::string type;
    std::string pattern;
    std::string replacement;  // ECMAScript format string ($1 = first group)
    std::regex regex;
};

// Ordered, pattern-based PII redaction.
//
// Rules run in table order and are not mutually exclusive: a later rule
// sees the output of the earlier ones and may redact inside a token an
// earlier rule produced. Order and patterns are part of the stored data
// format; changing either changes what ends up persisted.
//
//   1 EMAIL  2 PHONE  3 CREDIT_CARD  4 SSN  5 IP_ADDRESS  6 NAME
//   7 DOB    8 BANK_ACCOUNT  9 LICENSE_PLATE      (7-9: extended table only)
//
// All matching is case-insensitive. Instances are immutable after
// construction and safe to share between threads.
class PiiRedactor {
public:
    explicit PiiRedactor(bool extended = true);

    std::string redact(const std::string& text) const;

    // Matches per rule against the original text, in rule order then position.
    std::vector<PiiMatch> detect(const std::string& text) const;

    // True when the text carries a secret-like key/value pair
    // (password, api key, token, secret). Callers use this to refuse
    // storage outright instead of redacting.
    bool validate_sensitive_context(const std::string& text) const;

    const std::vector<PiiRule>& rules() const { return rules_; }
    bool extended() const { return extended_; }

private:
    bool extended_;
    std::vector<PiiRule> rules_;
    std::vector<std::regex> sensitive_;
};

} // namespace memora
