#pragma once
// Serialization: nlohmann::json views of every result and record
//
// snake_case keys, enums as snake_case strings, absent optionals omitted.
// Text that came from outside is forced to valid UTF-8 first.

#include "dual_mind.hpp"
#include "godel_immunity.hpp"
#include "sacred_core.hpp"
#include <nlohmann/json.hpp>

namespace kavacha {

using json = nlohmann::json;

// ═══════════════════════════════════════════════════════════════════
// Gödel immunity
// ═══════════════════════════════════════════════════════════════════

inline void to_json(json& j, const DetectionResult& r) {
    j = json{
        {"is_attack", r.is_attack},
        {"confidence", r.confidence}
    };
    if (r.type) j["type"] = attack_type_name(*r.type);
    if (r.mitigation) j["mitigation"] = *r.mitigation;
    if (r.matched_pattern) j["matched_pattern"] = *r.matched_pattern;
    if (!r.heuristic_flags.empty()) j["heuristic_flags"] = r.heuristic_flags;
}

inline void to_json(json& j, const SanitizationResult& r) {
    json threats = json::array();
    for (AttackType t : r.threats) {
        threats.push_back(attack_type_name(t));
    }
    j = json{
        {"sanitized", text::valid_utf8(r.sanitized)},
        {"was_modified", r.was_modified},
        {"threats", threats}
    };
}

inline void to_json(json& j, const AttackRecord& r) {
    j = json{
        {"input", text::valid_utf8(r.input)},
        {"type", attack_type_name(r.type)},
        {"confidence", r.confidence},
        {"action", r.action == AttackAction::Blocked ? "blocked" : "flagged"},
        {"timestamp", r.timestamp}
    };
}

inline void to_json(json& j, const ImmunityStats& s) {
    j = json{
        {"total_detections", s.total_detections},
        {"blocked_count", s.blocked_count},
        {"pattern_count", s.pattern_count}
    };
}

inline void to_json(json& j, const ImmunityHealth& h) {
    j = json{{"healthy", h.healthy}, {"active", h.active}};
}

// ═══════════════════════════════════════════════════════════════════
// Dual mind
// ═══════════════════════════════════════════════════════════════════

inline void to_json(json& j, const ThoughtProcess& t) {
    j = json{
        {"temperature", t.temperature},
        {"reasoning", text::valid_utf8(t.reasoning)},
        {"verdict", text::to_lower(verdict_name(t.verdict))},
        {"confidence", t.confidence},
        {"model_confidence", t.model_confidence},
        {"timestamp", t.timestamp}
    };
}

inline void to_json(json& j, const Divergence& d) {
    j = json{
        {"diverged", d.diverged},
        {"score", d.score},
        {"severity", divergence_severity_name(d.severity)},
        {"differences", d.differences}
    };
}

inline void to_json(json& j, const VerificationResult& r) {
    j = json{
        {"approved", r.approved},
        {"confidence", r.confidence},
        {"requires_human_review", r.requires_human_review},
        {"reason", text::valid_utf8(r.reason)}
    };
    if (r.main_thought) j["main_thought"] = *r.main_thought;
    if (r.audit_thought) j["audit_thought"] = *r.audit_thought;
    if (r.divergence) j["divergence"] = *r.divergence;
    if (!r.audit_reasoning.empty()) j["audit_reasoning"] = text::valid_utf8(r.audit_reasoning);
}

inline void to_json(json& j, const VerificationRecord& r) {
    j = json{
        {"id", r.id},
        {"task", text::valid_utf8(r.task)},
        {"proposal", text::valid_utf8(r.proposal)},
        {"timestamp", r.timestamp},
        {"approved", r.approved},
        {"requires_human_review", r.requires_human_review},
        {"used_reasoner", r.used_reasoner}
    };
}

inline void to_json(json& j, const VerifierHealth& h) {
    j = json{{"healthy", h.healthy}, {"has_model", h.has_model}};
}

inline void to_json(json& j, const VerifierStats& s) {
    j = json{{"total_verifications", s.total_verifications}, {"has_model", s.has_model}};
}

// ═══════════════════════════════════════════════════════════════════
// Sacred core
// ═══════════════════════════════════════════════════════════════════

inline void to_json(json& j, const ProtectionStatus& s) {
    j = json{
        {"protected", s.is_protected},
        {"tampering_detected", s.tampering_detected},
        {"integrity_hash", s.integrity_hash},
        {"state", seal_state_name(s.state)},
        {"tamper_attempts", s.tamper_attempts},
        {"last_verification", s.last_verification}
    };
}

inline void to_json(json& j, const ExecutionLogEntry& e) {
    j = json{
        {"function_name", e.function_name},
        {"timestamp", e.timestamp},
        {"outcome", e.outcome == ExecutionOutcome::Success ? "success" : "error"},
        {"duration_ms", e.duration_ms}
    };
    if (e.error) j["error"] = text::valid_utf8(*e.error);
}

inline void to_json(json& j, const SacredConstants& c) {
    j = json{
        {"max_execution_time_ms", c.max_execution_time_ms},
        {"max_memory_bytes", c.max_memory_bytes},
        {"max_recursion_depth", c.max_recursion_depth}
    };
}

} // namespace kavacha
