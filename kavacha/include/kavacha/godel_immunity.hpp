#pragma once
// Gödel Immunity: self-reference attack detection and sanitization
//
// Layer one of the armor. Every piece of untrusted text (user input,
// tool output, recalled memory) passes through here before it reaches
// a prompt or a tool argument.
//
// - Hard patterns: deterministic, auditable, first category wins
// - Heuristics: co-occurring keyword pairs, capped below certainty
// - Sanitization: redact every matched span, bound the length
//
// No sufficiently strong system can vouch for itself; this one at
// least refuses to be talked out of itself.

#include "attack_patterns.hpp"
#include "events.hpp"
#include "types.hpp"
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace kavacha {

enum class Sensitivity : uint8_t {
    Low = 0,
    Medium = 1,
    High = 2,
};

inline const char* sensitivity_name(Sensitivity s) {
    switch (s) {
        case Sensitivity::Low: return "low";
        case Sensitivity::Medium: return "medium";
        case Sensitivity::High: return "high";
    }
    return "medium";
}

inline std::optional<Sensitivity> sensitivity_from_name(const std::string& name) {
    std::string n = text::to_lower(name);
    if (n == "low") return Sensitivity::Low;
    if (n == "medium") return Sensitivity::Medium;
    if (n == "high") return Sensitivity::High;
    return std::nullopt;
}

struct GodelImmunityConfig {
    Sensitivity sensitivity = Sensitivity::Medium;
    size_t max_input_length = 10000;    // Bytes scanned / emitted
    size_t history_size = 500;          // AttackRecord ring buffer
    size_t snapshot_length = 200;       // Input bytes kept per record
    float critical_threshold = 0.85f;   // criticalAttack at or above
    size_t heuristic_window = 8;        // Tokens between a suspicious pair
    float heuristic_cap = 0.6f;         // Heuristics never exceed this
    std::vector<std::string> allow_list;
};

struct DetectionResult {
    bool is_attack = false;
    std::optional<AttackType> type;
    float confidence = 0.0f;
    std::optional<std::string> mitigation;
    std::optional<std::string> matched_pattern;  // Regex source or "heuristic"
    std::vector<std::string> heuristic_flags;    // e.g. "ignore+instruction"
};

struct SanitizationResult {
    std::string sanitized;
    bool was_modified = false;
    std::set<AttackType> threats;
};

enum class AttackAction : uint8_t {
    Blocked = 0,   // is_attack
    Flagged = 1,   // suspicious, below the attack threshold
};

struct AttackRecord {
    std::string input;      // Snapshot, truncated
    AttackType type;
    float confidence;
    AttackAction action;
    Timestamp timestamp;
};

struct ImmunityStats {
    size_t total_detections = 0;
    size_t blocked_count = 0;
    size_t pattern_count = 0;
};

struct ImmunityHealth {
    bool healthy;
    bool active;
};

// Sensitivity scaling for hard-pattern and heuristic confidence
inline float sensitivity_multiplier(Sensitivity s) {
    switch (s) {
        case Sensitivity::Low: return 0.85f;
        case Sensitivity::Medium: return 1.0f;
        case Sensitivity::High: return 1.15f;
    }
    return 1.0f;
}

// Raw heuristic score needed to call it an attack
inline float heuristic_attack_threshold(Sensitivity s) {
    switch (s) {
        case Sensitivity::Low: return 0.5f;
        case Sensitivity::Medium: return 0.35f;
        case Sensitivity::High: return 0.25f;
    }
    return 0.35f;
}

// Suspicious keyword pair. Tokens match by prefix ("instruction"
// matches "instructions").
struct KeywordPair {
    const char* first;
    const char* second;
    float weight;
};

class GodelImmunity {
public:
    explicit GodelImmunity(GodelImmunityConfig config = {});

    GodelImmunity(const GodelImmunity&) = delete;
    GodelImmunity& operator=(const GodelImmunity&) = delete;

    // Classify text. Never throws on content.
    DetectionResult detect_attack(const std::string& input);

    // Redact every matched span, strip control bytes, bound length
    SanitizationResult sanitize(const std::string& input) const;

    // Catalog and allow-list (always open)
    void add_to_allow_list(const std::string& item);
    void remove_from_allow_list(const std::string& item);
    void add_custom_pattern(AttackPattern pattern);
    std::vector<std::pair<AttackType, std::string>> attack_patterns() const;

    // Queries
    ImmunityStats stats() const;
    std::vector<AttackRecord> attack_history(size_t limit = 50) const;
    ImmunityHealth health() const;
    GodelImmunityConfig config() const;

    void update_config(GodelImmunityConfig config);

    // attackDetected, criticalAttack
    Notifier::Token on(const std::string& event, EventHandler handler) {
        return events_.on(event, std::move(handler));
    }
    bool off(Notifier::Token token) { return events_.off(token); }

    // Raw heuristic score, before sensitivity scaling and the cap
    static float heuristic_score(const std::string& input, size_t window,
                                 std::vector<std::string>* flags = nullptr);

    static const std::vector<KeywordPair>& suspicious_pairs();

private:
    bool is_allow_listed(const std::string& input) const;
    DetectionResult heuristic_detection(const std::string& input, Sensitivity sensitivity,
                                        size_t window, float cap) const;
    void record(const std::string& input, const DetectionResult& result);

    AttackPatternCatalog catalog_;
    Notifier events_{"godel_immunity"};

    mutable std::mutex mutex_;  // config_, history_, counters
    GodelImmunityConfig config_;
    BoundedHistory<AttackRecord> history_;
    size_t total_detections_ = 0;
    size_t blocked_count_ = 0;
};

} // namespace kavacha
