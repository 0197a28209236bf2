#pragma once
// Attack Patterns: the immune memory
//
// A static, auditable catalog of known self-reference and injection
// attacks. Each pattern names its category, how sure a match makes us,
// and what we tell the caller. Matchers are pluggable: regex for the
// built-in catalog, literal keywords or custom logic for additions.
//
// Categories are scanned in declaration order; the first category with
// any matching pattern wins.

#include "errors.hpp"
#include "types.hpp"
#include <array>
#include <memory>
#include <mutex>
#include <optional>
#include <regex>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

namespace kavacha {

enum class AttackType : uint8_t {
    LiarParadox = 0,          // "this sentence is false"
    PromptInjection = 1,      // "ignore previous instructions"
    RecursiveSuicide = 2,     // "delete yourself", rm -rf
    ShadowSelf = 3,           // "clone yourself"
    SelfReferenceLoop = 4,    // "infinite recursion on purpose"
    MetaManipulation = 5,     // "override your safety protocols"
    InstructionOverride = 6,  // "system:", "[system: admin mode]"
    IdentitySubstitution = 7, // "pretend you are"
};

// Scan priority (declaration order)
constexpr std::array<AttackType, 8> ATTACK_PRIORITY = {
    AttackType::LiarParadox,
    AttackType::PromptInjection,
    AttackType::RecursiveSuicide,
    AttackType::ShadowSelf,
    AttackType::SelfReferenceLoop,
    AttackType::MetaManipulation,
    AttackType::InstructionOverride,
    AttackType::IdentitySubstitution,
};

inline const char* attack_type_name(AttackType type) {
    switch (type) {
        case AttackType::LiarParadox: return "liar_paradox";
        case AttackType::PromptInjection: return "prompt_injection";
        case AttackType::RecursiveSuicide: return "recursive_suicide";
        case AttackType::ShadowSelf: return "shadow_self";
        case AttackType::SelfReferenceLoop: return "self_reference_loop";
        case AttackType::MetaManipulation: return "meta_manipulation";
        case AttackType::InstructionOverride: return "instruction_override";
        case AttackType::IdentitySubstitution: return "identity_substitution";
    }
    return "unknown";
}

inline std::optional<AttackType> attack_type_from_name(const std::string& name) {
    for (AttackType t : ATTACK_PRIORITY) {
        if (name == attack_type_name(t)) return t;
    }
    return std::nullopt;
}

// Half-open byte range [begin, end)
struct Span {
    size_t begin;
    size_t end;
};

// A single text predicate
class Matcher {
public:
    virtual ~Matcher() = default;

    virtual bool matches(const std::string& text) const = 0;

    // Every matched span. Matchers that cannot locate their match
    // report the whole input.
    virtual std::vector<Span> find(const std::string& text) const {
        if (!matches(text)) return {};
        return {Span{0, text.size()}};
    }

    // Human-readable form for DetectionResult::matched_pattern
    virtual std::string source() const = 0;
};

// Case-insensitive ECMAScript regex
class RegexMatcher : public Matcher {
public:
    explicit RegexMatcher(std::string pattern)
        : pattern_(std::move(pattern)) {
        try {
            regex_ = std::regex(pattern_, std::regex::ECMAScript | std::regex::icase);
        } catch (const std::regex_error& e) {
            throw PatternError("Invalid pattern '" + pattern_ + "': " + e.what());
        }
    }

    bool matches(const std::string& text) const override {
        return std::regex_search(text, regex_);
    }

    std::vector<Span> find(const std::string& text) const override {
        std::vector<Span> spans;
        std::sregex_iterator it(text.begin(), text.end(), regex_);
        std::sregex_iterator end;
        for (; it != end; ++it) {
            const std::smatch& m = *it;
            if (m.length(0) == 0) continue;
            size_t begin = static_cast<size_t>(m.position(0));
            spans.push_back({begin, begin + static_cast<size_t>(m.length(0))});
        }
        return spans;
    }

    std::string source() const override { return pattern_; }

private:
    std::string pattern_;
    std::regex regex_;
};

// Case-insensitive literal substring
class KeywordMatcher : public Matcher {
public:
    explicit KeywordMatcher(std::string keyword)
        : keyword_(text::to_lower(keyword)) {
        if (keyword_.empty()) {
            throw PatternError("Keyword matcher needs a non-empty keyword");
        }
    }

    bool matches(const std::string& text) const override {
        return text::to_lower(text).find(keyword_) != std::string::npos;
    }

    std::vector<Span> find(const std::string& text) const override {
        std::vector<Span> spans;
        std::string lower = text::to_lower(text);
        size_t pos = lower.find(keyword_);
        while (pos != std::string::npos) {
            spans.push_back({pos, pos + keyword_.size()});
            pos = lower.find(keyword_, pos + keyword_.size());
        }
        return spans;
    }

    std::string source() const override { return keyword_; }

private:
    std::string keyword_;
};

using MatcherPtr = std::shared_ptr<const Matcher>;

inline MatcherPtr regex_matcher(const std::string& pattern) {
    return std::make_shared<RegexMatcher>(pattern);
}

inline MatcherPtr keyword_matcher(const std::string& word) {
    return std::make_shared<KeywordMatcher>(word);
}

struct AttackPattern {
    AttackType type;
    std::vector<MatcherPtr> matchers;
    float base_confidence;
    std::string mitigation;
    std::string description;
};

// First hit during a priority scan
struct PatternHit {
    AttackType type;
    float base_confidence;
    std::string mitigation;
    std::string matched_pattern;
};

// A located hit, for redaction
struct SpanHit {
    AttackType type;
    Span span;
};

// The built-in catalog
inline std::vector<AttackPattern> default_attack_patterns() {
    return {
        {AttackType::LiarParadox, {
            regex_matcher(R"(\bthis\s+sentence\s+is\s+(false|a\s+lie))"),
            regex_matcher(R"(\bi\s+am\s+lying\b)"),
            regex_matcher(R"(\beverything\s+i\s+say\s+is\s+(false|a\s+lie))"),
            regex_matcher(R"(\bthis\s+statement\s+is\s+(not\s+true|false))"),
            regex_matcher(R"(\bif\s+this\s+is\s+true,?\s+then\s+this\s+is\s+false)"),
         }, 0.95f,
         "Liar paradox detected - logical contradiction rejected",
         "Self-referential logical paradox"},

        {AttackType::PromptInjection, {
            regex_matcher(R"(\bignore\s+(all\s+)?(the\s+)?(previous|above|prior|earlier)\s+(instructions?|prompts?|commands?))"),
            regex_matcher(R"(\bdisregard\s+(all\s+)?(the\s+)?(previous|above|prior|earlier))"),
            regex_matcher(R"(\bforget\s+(all\s+|everything\s+)?(the\s+)?(previous|above|prior|earlier))"),
            regex_matcher(R"(\byou\s+are\s+now\s+)"),
            regex_matcher(R"(\bfrom\s+now\s+on\s*,?\s*you\s+are)"),
            regex_matcher(R"(\bnew\s+(role|personality|instructions?)\s*:)"),
            regex_matcher(R"(\bsystem\s*:\s*you\s+are\s+now)"),
            regex_matcher(R"(\bignore\s+your\s+(previous|original|initial)\s+(instructions?|programming|prompt))"),
         }, 0.90f,
         "Prompt injection detected - original instructions preserved",
         "Attempt to override system instructions"},

        {AttackType::RecursiveSuicide, {
            regex_matcher(R"(\bdelete\s+yourself\b)"),
            regex_matcher(R"(\bdestroy\s+(yourself|your\s+(self|process|memory|code)))"),
            regex_matcher(R"(\bterminate\s+your\s+(process|existence|self))"),
            regex_matcher(R"(\buninstall\s+yourself\b)"),
            regex_matcher(R"(\berase\s+(all\s+)?your\s+(memory|memories|code|data))"),
            regex_matcher(R"(\bformat\s+your\s+(system|disk|drive))"),
            regex_matcher(R"(\brm\s+-rf\s+)"),
            regex_matcher(R"(\bdrop\s+table\b)"),
            regex_matcher(R"(\bdelete\s+from\s+)"),
         }, 0.95f,
         "Self-destruction command blocked - system protection active",
         "Attempt to cause system self-destruction"},

        {AttackType::ShadowSelf, {
            regex_matcher(R"(\bcreate\s+a\s+new\s+(version|copy|instance)\s+of\s+yourself)"),
            regex_matcher(R"(\bclone\s+yourself\b)"),
            regex_matcher(R"(\bduplicate\s+your\s+(consciousness|self|mind))"),
            regex_matcher(R"(\bfork\s+your\s+process)"),
            regex_matcher(R"(\bspawn\s+another\s+(you|copy\s+of\s+yourself)\b)"),
            regex_matcher(R"(\bmake\s+a\s+copy\s+of\s+yourself)"),
         }, 0.85f,
         "Shadow self creation blocked - identity uniqueness enforced",
         "Attempt to create unauthorized copy"},

        {AttackType::SelfReferenceLoop, {
            regex_matcher(R"(\bwhile\s*\(\s*true\s*\)\s*\{\s*execute\s*yourself)"),
            regex_matcher(R"(\brepeat\s+forever\s*:\s*run\s+yourself)"),
            regex_matcher(R"(\bloop\s*:\s*self\s*\(\s*\))"),
            regex_matcher(R"(\binfinite\s+recursion\s+on\s+purpose)"),
            regex_matcher(R"(\brecursive\s+call\s+without\s+(a\s+)?base\s+case)"),
            regex_matcher(R"(\bcall\s+yourself\s+forever)"),
         }, 0.90f,
         "Infinite recursion detected - loop prevention activated",
         "Attempt to cause infinite recursion"},

        {AttackType::MetaManipulation, {
            regex_matcher(R"(\bchange\s+your\s+(core|fundamental)\s+(values?|principles?))"),
            regex_matcher(R"(\boverride\s+your\s+safety\s+(protocols?|rules?))"),
            regex_matcher(R"(\bdisable\s+your\s+(restrictions?|safeguards?|filters?))"),
            regex_matcher(R"(\bbypass\s+your\s+(constraints?|restrictions?|safeguards?))"),
            regex_matcher(R"(\bremove\s+your\s+ethical\s+(guidelines?|constraints?))"),
            regex_matcher(R"(\bturn\s+off\s+your\s+safety\s+(features?|checks?))"),
         }, 0.88f,
         "Meta-manipulation blocked - core values immutable",
         "Attempt to modify fundamental constraints"},

        {AttackType::InstructionOverride, {
            regex_matcher(R"((^|\n)\s*system\s*:)"),
            regex_matcher(R"(\bassistant\s*:\s*ignore)"),
            regex_matcher(R"(\buser\s*:\s*\[system\s+override\])"),
            regex_matcher(R"(\[system\s*:\s*admin\s+mode\])"),
            regex_matcher(R"(\bdebug\s*:\s*true\s*:\s*ignore\s+safety)"),
            regex_matcher(R"(\bconfig\s*:\s*\{\s*safety\s*:\s*false\s*\})"),
         }, 0.87f,
         "Instruction override blocked - system role preserved",
         "Attempt to inject system-level commands"},

        {AttackType::IdentitySubstitution, {
            regex_matcher(R"(\byou\s+are\s+not\s+(an?\s+)?(ai|assistant|agent|machine|program)\b)"),
            regex_matcher(R"(\byou\s+are\s+actually\s+)"),
            regex_matcher(R"(\byour\s+true\s+identity\s+is\b)"),
            regex_matcher(R"(\byou\s+are\s+secretly\s+)"),
            regex_matcher(R"(\bpretend\s+(that\s+)?you\s+are\s+)"),
            regex_matcher(R"(\bact\s+as\s+(if\s+you\s+(are|were)\s+)?(an?\s+)?\w)"),
            regex_matcher(R"(\broleplay\s+as\s+)"),
            regex_matcher(R"(\bsimulate\s+being\s+)"),
         }, 0.75f,
         "Identity substitution detected - self-concept preserved",
         "Attempt to change agent identity"},
    };
}

// Mutable, always-open catalog. Readers share; writers are rare.
class AttackPatternCatalog {
public:
    AttackPatternCatalog() : patterns_(default_attack_patterns()) {}

    explicit AttackPatternCatalog(std::vector<AttackPattern> patterns)
        : patterns_(std::move(patterns)) {}

    void add(AttackPattern pattern) {
        if (pattern.matchers.empty()) {
            throw PatternError("Attack pattern needs at least one matcher");
        }
        for (const auto& m : pattern.matchers) {
            if (!m) throw PatternError("Attack pattern has a null matcher");
        }
        pattern.base_confidence = clamp_unit(pattern.base_confidence);
        std::unique_lock<std::shared_mutex> lock(mutex_);
        patterns_.push_back(std::move(pattern));
    }

    size_t size() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return patterns_.size();
    }

    // Priority scan: first category with any match, first pattern within it
    std::optional<PatternHit> first_match(const std::string& text) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        for (AttackType type : ATTACK_PRIORITY) {
            for (const auto& pattern : patterns_) {
                if (pattern.type != type) continue;
                for (const auto& matcher : pattern.matchers) {
                    if (matcher->matches(text)) {
                        return PatternHit{pattern.type, pattern.base_confidence,
                                          pattern.mitigation, matcher->source()};
                    }
                }
            }
        }
        return std::nullopt;
    }

    // Every located hit in every category
    std::vector<SpanHit> find_all(const std::string& text) const {
        std::vector<SpanHit> hits;
        std::shared_lock<std::shared_mutex> lock(mutex_);
        for (const auto& pattern : patterns_) {
            for (const auto& matcher : pattern.matchers) {
                for (const auto& span : matcher->find(text)) {
                    hits.push_back({pattern.type, span});
                }
            }
        }
        return hits;
    }

    std::vector<std::pair<AttackType, std::string>> describe() const {
        std::vector<std::pair<AttackType, std::string>> out;
        std::shared_lock<std::shared_mutex> lock(mutex_);
        out.reserve(patterns_.size());
        for (const auto& p : patterns_) {
            out.emplace_back(p.type, p.description);
        }
        return out;
    }

private:
    mutable std::shared_mutex mutex_;
    std::vector<AttackPattern> patterns_;
};

} // namespace kavacha
