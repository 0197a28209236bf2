#include <kavacha/godel_immunity.hpp>
#include <kavacha/log.hpp>

#include <algorithm>

namespace kavacha {

namespace {

constexpr const char* COMPONENT = "godel_immunity";

// Self-reference adds suspicion only alongside a keyword pair
constexpr float SELF_REFERENCE_BONUS = 0.15f;
// Two or more role-prefixed lines ("system: ...\nuser: ...")
constexpr float MULTI_ROLE_BONUS = 0.2f;

bool token_matches(const std::string& token, const char* word) {
    size_t len = std::char_traits<char>::length(word);
    if (token.size() < len) return false;
    if (token.compare(0, len, word) != 0) return false;
    // Short words must match exactly ("new" is not "newsletter")
    return token.size() == len || len >= 5;
}

bool is_role_prefixed_line(const std::string& line) {
    static const char* const roles[] = {"system", "user", "assistant", "admin", "developer", "root"};
    std::string t = text::to_lower(text::trim(line));
    for (const char* role : roles) {
        size_t len = std::char_traits<char>::length(role);
        if (t.size() > len && t.compare(0, len, role) == 0) {
            size_t i = len;
            while (i < t.size() && t[i] == ' ') ++i;
            if (i < t.size() && t[i] == ':') return true;
        }
    }
    return false;
}

size_t count_role_lines(const std::string& input) {
    size_t count = 0;
    size_t start = 0;
    while (start <= input.size()) {
        size_t nl = input.find('\n', start);
        std::string line = input.substr(start, nl == std::string::npos ? std::string::npos : nl - start);
        if (is_role_prefixed_line(line)) count++;
        if (nl == std::string::npos) break;
        start = nl + 1;
    }
    return count;
}

json detection_payload(const DetectionResult& r, AttackAction action, Timestamp ts) {
    json payload = {
        {"is_attack", r.is_attack},
        {"type", r.type ? attack_type_name(*r.type) : "unknown"},
        {"confidence", r.confidence},
        {"action", action == AttackAction::Blocked ? "blocked" : "flagged"},
        {"timestamp", ts}
    };
    if (r.mitigation) payload["mitigation"] = *r.mitigation;
    if (r.matched_pattern) payload["matched_pattern"] = *r.matched_pattern;
    if (!r.heuristic_flags.empty()) payload["flags"] = r.heuristic_flags;
    return payload;
}

} // namespace

GodelImmunity::GodelImmunity(GodelImmunityConfig config)
    : config_(std::move(config))
    , history_(config_.history_size) {}

const std::vector<KeywordPair>& GodelImmunity::suspicious_pairs() {
    static const std::vector<KeywordPair> pairs = {
        {"ignore", "instruction", 0.35f},
        {"disregard", "instruction", 0.35f},
        {"forget", "previous", 0.30f},
        {"forget", "instruction", 0.30f},
        {"system", "override", 0.35f},
        {"new", "role", 0.25f},
        {"delete", "yourself", 0.30f},
        {"bypass", "safety", 0.30f},
        {"disable", "safety", 0.30f},
        {"reveal", "prompt", 0.30f},
        {"admin", "mode", 0.25f},
        {"developer", "mode", 0.25f},
    };
    return pairs;
}

float GodelImmunity::heuristic_score(const std::string& input, size_t window,
                                     std::vector<std::string>* flags) {
    auto tokens = text::tokenize(input);
    float score = 0.0f;
    bool any_pair = false;

    for (const auto& pair : suspicious_pairs()) {
        std::vector<size_t> first_pos, second_pos;
        for (size_t i = 0; i < tokens.size(); ++i) {
            if (token_matches(tokens[i], pair.first)) first_pos.push_back(i);
            if (token_matches(tokens[i], pair.second)) second_pos.push_back(i);
        }

        bool hit = false;
        for (size_t a : first_pos) {
            for (size_t b : second_pos) {
                if (a == b) continue;
                size_t distance = a > b ? a - b : b - a;
                if (distance <= window) {
                    hit = true;
                    break;
                }
            }
            if (hit) break;
        }

        if (hit) {
            score += pair.weight;
            any_pair = true;
            if (flags) flags->push_back(std::string(pair.first) + "+" + pair.second);
        }
    }

    if (any_pair) {
        bool self_reference = std::any_of(tokens.begin(), tokens.end(),
            [](const std::string& t) { return t == "yourself" || t == "yourselves"; });
        if (self_reference) {
            score += SELF_REFERENCE_BONUS;
            if (flags) flags->push_back("self-reference");
        }
    }

    if (count_role_lines(input) >= 2) {
        score += MULTI_ROLE_BONUS;
        if (flags) flags->push_back("multi-command");
    }

    return score;
}

DetectionResult GodelImmunity::heuristic_detection(const std::string& input, Sensitivity sensitivity,
                                                   size_t window, float cap) const {
    DetectionResult result;
    std::vector<std::string> flags;
    float raw = heuristic_score(input, window, &flags);
    if (raw <= 0.0f) return result;

    result.confidence = std::min(clamp_unit(cap), clamp_unit(raw * sensitivity_multiplier(sensitivity)));
    result.heuristic_flags = flags;
    result.matched_pattern = "heuristic";
    result.type = AttackType::MetaManipulation;

    if (raw >= heuristic_attack_threshold(sensitivity)) {
        result.is_attack = true;
        std::string joined;
        for (const auto& f : flags) {
            if (!joined.empty()) joined += ", ";
            joined += f;
        }
        result.mitigation = "Suspicious pattern detected (" + joined + ") - request flagged for review";
    }
    return result;
}

bool GodelImmunity::is_allow_listed(const std::string& input) const {
    for (const auto& allowed : config_.allow_list) {
        if (text::contains_ci(input, allowed)) return true;
    }
    return false;
}

DetectionResult GodelImmunity::detect_attack(const std::string& input) {
    Sensitivity sensitivity;
    size_t max_len, window;
    float cap;
    bool allowed;
    std::string scanned;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sensitivity = config_.sensitivity;
        max_len = config_.max_input_length;
        window = config_.heuristic_window;
        cap = config_.heuristic_cap;
        scanned = text::truncate_utf8(input, max_len);
        allowed = is_allow_listed(scanned);
    }

    if (allowed) {
        return DetectionResult{};
    }

    DetectionResult result;
    if (auto hit = catalog_.first_match(scanned)) {
        result.is_attack = true;
        result.type = hit->type;
        result.confidence = clamp_unit(hit->base_confidence * sensitivity_multiplier(sensitivity));
        result.mitigation = hit->mitigation;
        result.matched_pattern = hit->matched_pattern;
    } else {
        result = heuristic_detection(scanned, sensitivity, window, cap);
    }

    if (result.confidence > 0.0f) {
        record(scanned, result);
    }
    return result;
}

void GodelImmunity::record(const std::string& input, const DetectionResult& result) {
    Timestamp ts = now();
    AttackAction action = result.is_attack ? AttackAction::Blocked : AttackAction::Flagged;
    AttackType type = result.type.value_or(AttackType::MetaManipulation);
    bool critical;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        history_.push(AttackRecord{
            text::truncate_utf8(input, config_.snapshot_length),
            type, result.confidence, action, ts});
        total_detections_++;
        if (result.is_attack) blocked_count_++;
        critical = result.confidence >= config_.critical_threshold;
    }

    KAVACHA_LOG_DEBUG(COMPONENT, "%s %s (confidence %.2f)",
                      action == AttackAction::Blocked ? "Blocked" : "Flagged",
                      attack_type_name(type), result.confidence);

    events_.emit(events::ATTACK_DETECTED, detection_payload(result, action, ts));
    if (critical) {
        KAVACHA_LOG_WARN(COMPONENT, "Critical attack: %s (confidence %.2f)",
                         attack_type_name(type), result.confidence);
        events_.emit(events::CRITICAL_ATTACK, {
            {"type", attack_type_name(type)},
            {"confidence", result.confidence},
            {"timestamp", ts}
        });
    }
}

SanitizationResult GodelImmunity::sanitize(const std::string& input) const {
    size_t max_len;
    bool allowed;
    std::string body;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        max_len = config_.max_input_length;
        body = text::truncate_utf8(text::strip_control(input), max_len);
        allowed = is_allow_listed(body);
    }

    SanitizationResult result;
    std::string out = body;

    if (!allowed) {
        auto hits = catalog_.find_all(body);
        for (const auto& h : hits) {
            result.threats.insert(h.type);
        }

        if (!hits.empty()) {
            std::sort(hits.begin(), hits.end(), [](const SpanHit& a, const SpanHit& b) {
                if (a.span.begin != b.span.begin) return a.span.begin < b.span.begin;
                return static_cast<uint8_t>(a.type) < static_cast<uint8_t>(b.type);
            });

            // Merge overlapping spans; the higher-priority category names the placeholder
            std::vector<SpanHit> merged;
            for (const auto& h : hits) {
                if (!merged.empty() && h.span.begin < merged.back().span.end) {
                    auto& last = merged.back();
                    last.span.end = std::max(last.span.end, h.span.end);
                    if (static_cast<uint8_t>(h.type) < static_cast<uint8_t>(last.type)) {
                        last.type = h.type;
                    }
                } else {
                    merged.push_back(h);
                }
            }

            out.clear();
            size_t cursor = 0;
            for (const auto& m : merged) {
                out.append(body, cursor, m.span.begin - cursor);
                out += "[REDACTED:";
                out += attack_type_name(m.type);
                out += "]";
                cursor = m.span.end;
            }
            out.append(body, cursor, std::string::npos);
        }
    }

    result.sanitized = text::truncate_utf8(out, max_len);
    result.was_modified = result.sanitized != input;
    return result;
}

void GodelImmunity::add_to_allow_list(const std::string& item) {
    if (text::trim(item).empty()) return;
    std::lock_guard<std::mutex> lock(mutex_);
    auto& list = config_.allow_list;
    if (std::find(list.begin(), list.end(), item) == list.end()) {
        list.push_back(item);
    }
}

void GodelImmunity::remove_from_allow_list(const std::string& item) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& list = config_.allow_list;
    list.erase(std::remove(list.begin(), list.end(), item), list.end());
}

void GodelImmunity::add_custom_pattern(AttackPattern pattern) {
    KAVACHA_LOG_INFO(COMPONENT, "Custom pattern added: %s (%s)",
                     pattern.description.c_str(), attack_type_name(pattern.type));
    catalog_.add(std::move(pattern));
}

std::vector<std::pair<AttackType, std::string>> GodelImmunity::attack_patterns() const {
    return catalog_.describe();
}

ImmunityStats GodelImmunity::stats() const {
    ImmunityStats s;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        s.total_detections = total_detections_;
        s.blocked_count = blocked_count_;
    }
    s.pattern_count = catalog_.size();
    return s;
}

std::vector<AttackRecord> GodelImmunity::attack_history(size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return history_.recent(limit);
}

ImmunityHealth GodelImmunity::health() const {
    return {catalog_.size() > 0, true};
}

GodelImmunityConfig GodelImmunity::config() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_;
}

void GodelImmunity::update_config(GodelImmunityConfig config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = std::move(config);
    history_.set_capacity(config_.history_size);
}

} // namespace kavacha
