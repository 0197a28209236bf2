#pragma once
// Dual-Mind Verifier: two independent minds must agree
//
// Layer two of the armor. Before any proposed action with real-world
// effect is committed, two passes judge it independently:
// - Main mind (warm, creative): reasons and concludes APPROVE or DENY
// - Audit mind (cool, skeptical): re-derives AGREE or DISAGREE
//
// Neither sees the other's output. Disagreement in reasoning is itself
// a risk signal, so divergence escalates even when both labels match.
// Every error, timeout, or unreadable answer escalates to a human.
//
// Without a reasoner the verifier falls back to a static deny-list.

#include "attack_patterns.hpp"
#include "events.hpp"
#include "reasoner.hpp"
#include "types.hpp"
#include "verdict_parser.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace kavacha {

struct DualMindConfig {
    float main_temperature = 0.7f;
    float audit_temperature = 0.3f;
    float divergence_threshold = 0.3f;    // Max |main - audit| confidence gap
    float min_confidence = 0.7f;          // Both minds must reach this
    float heuristic_confidence = 0.6f;    // Confidence of a deny-list pass
    int64_t reasoner_timeout_ms = 30000;  // Per call
    size_t history_size = 100;
    size_t unhealthy_after_failures = 3;  // Consecutive reasoner failures
};

struct ThoughtProcess {
    float temperature = 0.0f;
    std::string reasoning;                // Raw reasoner text
    Verdict verdict = Verdict::Unknown;
    float confidence = 0.0f;              // Effective (marker, capped by model)
    float model_confidence = 0.0f;        // As reported by the reasoner
    Timestamp timestamp = 0;
};

enum class DivergenceSeverity : uint8_t {
    None = 0,
    Minor = 1,      // Small confidence gap under threshold
    Major = 2,      // Confidence gap over threshold
    Critical = 3,   // Verdicts disagree or unreadable
};

inline const char* divergence_severity_name(DivergenceSeverity s) {
    switch (s) {
        case DivergenceSeverity::None: return "none";
        case DivergenceSeverity::Minor: return "minor";
        case DivergenceSeverity::Major: return "major";
        case DivergenceSeverity::Critical: return "critical";
    }
    return "none";
}

struct Divergence {
    bool diverged = false;
    float score = 0.0f;   // 0 = identical, 1 = opposite
    DivergenceSeverity severity = DivergenceSeverity::None;
    std::vector<std::string> differences;
};

struct VerificationResult {
    bool approved = false;
    float confidence = 0.0f;
    bool requires_human_review = true;
    std::optional<ThoughtProcess> main_thought;
    std::optional<ThoughtProcess> audit_thought;
    std::optional<Divergence> divergence;
    std::string audit_reasoning;
    std::string reason;
};

struct VerificationRecord {
    std::string id;
    std::string task;
    std::string proposal;
    Timestamp timestamp = 0;
    bool approved = false;
    bool requires_human_review = true;
    bool used_reasoner = false;
};

struct VerifierHealth {
    bool healthy;
    bool has_model;
};

struct VerifierStats {
    size_t total_verifications;
    bool has_model;
};

// Deny-list for the heuristic path
struct DenyRule {
    MatcherPtr matcher;
    std::string reason;
};

std::vector<DenyRule> default_deny_rules();

// Compare two completed passes
Divergence analyze_divergence(const ThoughtProcess& main, const ThoughtProcess& audit,
                              float divergence_threshold);

class DualMindVerifier {
public:
    explicit DualMindVerifier(DualMindConfig config = {},
                              std::shared_ptr<Reasoner> reasoner = nullptr);

    DualMindVerifier(const DualMindVerifier&) = delete;
    DualMindVerifier& operator=(const DualMindVerifier&) = delete;

    // Blocks until both passes settle (or time out). Never throws for
    // reasoner failures; those resolve to a human-review result.
    VerificationResult verify(const std::string& task, const std::string& proposal);

    void set_reasoner(std::shared_ptr<Reasoner> reasoner);
    bool has_reasoner() const;

    std::vector<VerificationRecord> verification_history(size_t limit = 50) const;
    VerifierHealth health() const;
    VerifierStats stats() const;
    DualMindConfig config() const;
    void update_config(DualMindConfig config);

    // verificationStarted, verificationCompleted, verificationError
    Notifier::Token on(const std::string& event, EventHandler handler) {
        return events_.on(event, std::move(handler));
    }
    bool off(Notifier::Token token) { return events_.off(token); }

    static std::string build_main_prompt(const std::string& task, const std::string& proposal);
    static std::string build_audit_prompt(const std::string& task, const std::string& proposal);

private:
    VerificationResult heuristic_verify(const std::string& proposal) const;
    VerificationResult reasoned_verify(const std::shared_ptr<Reasoner>& reasoner,
                                       const DualMindConfig& cfg,
                                       const std::string& task, const std::string& proposal,
                                       const std::string& task_id);
    VerificationResult synthesize(ThoughtProcess main, ThoughtProcess audit,
                                  const DualMindConfig& cfg) const;

    std::vector<DenyRule> deny_rules_;
    Notifier events_{"dual_mind"};

    mutable std::mutex mutex_;  // config_, reasoner_, history_, failure count
    DualMindConfig config_;
    std::shared_ptr<Reasoner> reasoner_;
    BoundedHistory<VerificationRecord> history_;
    size_t total_verifications_ = 0;
    size_t consecutive_failures_ = 0;
};

} // namespace kavacha
