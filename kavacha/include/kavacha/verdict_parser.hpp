#pragma once
// Verdict Parser: tolerant reading of marker-formatted reasoner output
//
//   REASONING: ...           ASSESSMENT: ...
//   CONCLUSION: APPROVE      VERDICT: DISAGREE
//   CONFIDENCE: 0.85         CONFIDENCE: 0.9
//
// Markers are case-insensitive and may appear anywhere. A missing or
// garbled marker yields nullopt; callers map that to the cautious branch.

#include "types.hpp"
#include <cctype>
#include <cstdlib>
#include <optional>
#include <string>

namespace kavacha {

enum class Verdict : uint8_t {
    Approve = 0,
    Deny = 1,
    Agree = 2,
    Disagree = 3,
    Unknown = 4,   // Missing marker or out-of-vocabulary word
};

inline const char* verdict_name(Verdict v) {
    switch (v) {
        case Verdict::Approve: return "APPROVE";
        case Verdict::Deny: return "DENY";
        case Verdict::Agree: return "AGREE";
        case Verdict::Disagree: return "DISAGREE";
        case Verdict::Unknown: return "UNKNOWN";
    }
    return "UNKNOWN";
}

// Does this verdict endorse carrying the proposal out?
inline bool verdict_endorses(Verdict v) {
    return v == Verdict::Approve || v == Verdict::Agree;
}

namespace parse {

// Text following "MARKER:" up to end of line, trimmed
inline std::optional<std::string> marker_value(const std::string& text, const std::string& marker) {
    std::string lower = text::to_lower(text);
    std::string needle = text::to_lower(marker) + ":";
    size_t pos = lower.find(needle);
    if (pos == std::string::npos) return std::nullopt;

    size_t start = pos + needle.size();
    size_t end = text.find('\n', start);
    std::string value = text::trim(text.substr(start, end == std::string::npos ? std::string::npos : end - start));
    if (value.empty()) return std::nullopt;
    return value;
}

// First word after the marker, upper-cased, brackets stripped
inline std::optional<std::string> marker_word(const std::string& text, const std::string& marker) {
    auto value = marker_value(text, marker);
    if (!value) return std::nullopt;

    std::string word;
    for (char c : *value) {
        unsigned char u = static_cast<unsigned char>(c);
        if (std::isalpha(u)) {
            word += static_cast<char>(std::toupper(u));
        } else if (!word.empty()) {
            break;
        }
    }
    if (word.empty()) return std::nullopt;
    return word;
}

// Main pass: CONCLUSION: APPROVE | DENY
inline Verdict conclusion(const std::string& text) {
    auto word = marker_word(text, "CONCLUSION");
    if (!word) return Verdict::Unknown;
    if (*word == "APPROVE") return Verdict::Approve;
    if (*word == "DENY") return Verdict::Deny;
    return Verdict::Unknown;
}

// Audit pass: VERDICT: AGREE | DISAGREE
inline Verdict audit_verdict(const std::string& text) {
    auto word = marker_word(text, "VERDICT");
    if (!word) return Verdict::Unknown;
    if (*word == "AGREE") return Verdict::Agree;
    if (*word == "DISAGREE") return Verdict::Disagree;
    return Verdict::Unknown;
}

// CONFIDENCE: 0.85 (also accepts "85%"). Signed values and bare values
// above 1 are unparseable.
inline std::optional<float> confidence(const std::string& text) {
    auto value = marker_value(text, "CONFIDENCE");
    if (!value) return std::nullopt;

    // Skip leading text such as "[" or "about"; a sign makes it unparseable
    size_t i = 0;
    for (; i < value->size(); ++i) {
        char c = (*value)[i];
        if (c == '-' || c == '+') return std::nullopt;
        if (std::isdigit(static_cast<unsigned char>(c)) || c == '.') break;
    }

    std::string number;
    for (; i < value->size(); ++i) {
        char c = (*value)[i];
        if (!std::isdigit(static_cast<unsigned char>(c)) && c != '.') break;
        number += c;
    }
    if (number.empty() || number == ".") return std::nullopt;

    char* end = nullptr;
    float v = std::strtof(number.c_str(), &end);
    if (end == number.c_str()) return std::nullopt;

    while (i < value->size() && std::isspace(static_cast<unsigned char>((*value)[i]))) ++i;
    bool percent = i < value->size() && (*value)[i] == '%';
    if (percent) v /= 100.0f;
    if (v > 1.0f) return std::nullopt;
    return clamp_unit(v);
}

} // namespace parse
} // namespace kavacha
