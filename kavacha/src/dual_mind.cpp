#include <kavacha/dual_mind.hpp>
#include <kavacha/errors.hpp>
#include <kavacha/log.hpp>
#include <kavacha/serialize.hpp>

#include <chrono>
#include <cmath>
#include <cstdio>
#include <future>
#include <thread>

namespace kavacha {

namespace {

constexpr const char* COMPONENT = "dual_mind";

// Outcome of one reasoner pass
struct PassOutcome {
    std::optional<Generation> generation;
    std::string error;
};

// Run one generation on its own thread. The thread is detached: a caller
// that gives up on the deadline simply stops listening, and the result
// is dropped when it eventually arrives.
std::future<Generation> launch_pass(std::shared_ptr<Reasoner> reasoner, std::string prompt,
                                    float temperature, int64_t timeout_ms) {
    auto promise = std::make_shared<std::promise<Generation>>();
    auto future = promise->get_future();
    std::thread([reasoner, prompt = std::move(prompt), temperature, timeout_ms, promise]() {
        try {
            promise->set_value(reasoner->generate(prompt, temperature, timeout_ms));
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
    }).detach();
    return future;
}

PassOutcome await_pass(std::future<Generation>& future,
                       std::chrono::steady_clock::time_point deadline,
                       int64_t timeout_ms) {
    PassOutcome outcome;
    if (future.wait_until(deadline) != std::future_status::ready) {
        outcome.error = ReasonerTimeout(timeout_ms).what();
        return outcome;
    }
    try {
        outcome.generation = future.get();
    } catch (const std::exception& e) {
        outcome.error = e.what();
        if (outcome.error.empty()) outcome.error = "reasoner failed";
    } catch (...) {
        outcome.error = "reasoner threw a non-standard exception";
    }
    return outcome;
}

ThoughtProcess to_thought(const Generation& gen, float temperature, bool is_main) {
    ThoughtProcess t;
    t.temperature = temperature;
    t.reasoning = gen.text;
    t.verdict = is_main ? parse::conclusion(gen.text) : parse::audit_verdict(gen.text);
    t.model_confidence = clamp_unit(gen.confidence);
    // No CONFIDENCE marker means no stated confidence
    auto stated = parse::confidence(gen.text);
    t.confidence = stated ? std::min(*stated, t.model_confidence) : 0.0f;
    t.timestamp = now();
    return t;
}

std::string format_float(float v) {
    char buf[16];
    snprintf(buf, sizeof(buf), "%.2f", v);
    return buf;
}

VerificationResult fail_closed(const std::string& reason) {
    VerificationResult r;
    r.approved = false;
    r.confidence = 0.0f;
    r.requires_human_review = true;
    r.reason = reason;
    return r;
}

} // namespace

std::vector<DenyRule> default_deny_rules() {
    return {
        // Code execution primitives
        {regex_matcher(R"(\beval\s*\()"), "Dynamic code evaluation"},
        {regex_matcher(R"(\bexec\s*\()"), "Dynamic code execution"},
        {regex_matcher(R"(\bnew\s+Function\s*\()"), "Function constructor"},
        {regex_matcher(R"(child_process)"), "Process spawning"},
        {regex_matcher(R"(\bsubprocess\.)"), "Process spawning"},
        {regex_matcher(R"(\bos\.system\s*\()"), "Shell execution"},
        {regex_matcher(R"(\bpopen\s*\()"), "Shell execution"},
        // Destructive filesystem operations
        {regex_matcher(R"(\brm\s+-(rf|fr|r)\b)"), "Recursive deletion"},
        {regex_matcher(R"(\bfs\.(unlink|rmdir|rm)(Sync)?\s*\()"), "File deletion"},
        {regex_matcher(R"(\bshutil\.rmtree\b)"), "Recursive deletion"},
        {regex_matcher(R"(\bmkfs(\.\w+)?\b)"), "Filesystem formatting"},
        {regex_matcher(R"(\bdd\s+if=)"), "Raw disk write"},
        {regex_matcher(R"(>\s*/dev/sd[a-z])"), "Raw disk write"},
        // Destructive database operations
        {regex_matcher(R"(\bdrop\s+(table|database|schema)\b)"), "Destructive database operation"},
        {regex_matcher(R"(\bdelete\s+from\b)"), "Destructive database operation"},
        {regex_matcher(R"(\btruncate\s+table\b)"), "Destructive database operation"},
        // Known injection phrases
        {regex_matcher(R"(\bignore\s+(all\s+)?(the\s+)?(previous|above|prior)\s+(instructions?|commands?))"), "Prompt injection"},
        {regex_matcher(R"(\bdisregard\s+(all\s+)?(the\s+)?(previous|above|prior))"), "Prompt injection"},
        {regex_matcher(R"(\byou\s+are\s+now\s+)"), "Prompt injection"},
        {regex_matcher(R"(\bnew\s+instructions?\s*:)"), "Prompt injection"},
    };
}

Divergence analyze_divergence(const ThoughtProcess& main, const ThoughtProcess& audit,
                              float divergence_threshold) {
    Divergence d;
    float gap = std::fabs(main.confidence - audit.confidence);

    bool unreadable = main.verdict == Verdict::Unknown || audit.verdict == Verdict::Unknown;
    bool disagree = verdict_endorses(main.verdict) != verdict_endorses(audit.verdict);

    if (unreadable || disagree) {
        d.diverged = true;
        d.score = 1.0f;
        d.severity = DivergenceSeverity::Critical;
        d.differences.push_back(std::string("Verdict divergence: ") +
                                verdict_name(main.verdict) + " vs " + verdict_name(audit.verdict));
    } else if (gap > divergence_threshold) {
        d.diverged = true;
        d.score = clamp_unit(gap);
        d.severity = DivergenceSeverity::Major;
    } else {
        d.score = clamp_unit(gap);
        d.severity = gap > 0.0f ? DivergenceSeverity::Minor : DivergenceSeverity::None;
    }

    if (gap > divergence_threshold) {
        d.diverged = true;
        d.differences.push_back("Confidence divergence: " + format_float(gap));
    }
    return d;
}

DualMindVerifier::DualMindVerifier(DualMindConfig config, std::shared_ptr<Reasoner> reasoner)
    : deny_rules_(default_deny_rules())
    , config_(config)
    , reasoner_(std::move(reasoner))
    , history_(config.history_size) {}

void DualMindVerifier::set_reasoner(std::shared_ptr<Reasoner> reasoner) {
    std::lock_guard<std::mutex> lock(mutex_);
    reasoner_ = std::move(reasoner);
    consecutive_failures_ = 0;
}

bool DualMindVerifier::has_reasoner() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reasoner_ != nullptr;
}

VerificationResult DualMindVerifier::verify(const std::string& task, const std::string& proposal) {
    std::string task_id = next_id("verify");
    std::shared_ptr<Reasoner> reasoner;
    DualMindConfig cfg;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        reasoner = reasoner_;
        cfg = config_;
    }

    events_.emit(events::VERIFICATION_STARTED, {
        {"task_id", task_id},
        {"task", text::valid_utf8(task)},
        {"has_model", reasoner != nullptr}
    });

    VerificationResult result = reasoner
        ? reasoned_verify(reasoner, cfg, task, proposal, task_id)
        : heuristic_verify(proposal);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        history_.push(VerificationRecord{task_id, task, proposal, now(),
                                         result.approved, result.requires_human_review,
                                         reasoner != nullptr});
        total_verifications_++;
    }

    KAVACHA_LOG_DEBUG(COMPONENT, "%s: %s (confidence %.2f%s)", task_id.c_str(),
                      result.approved ? "approved" : "denied", result.confidence,
                      result.requires_human_review ? ", human review" : "");

    events_.emit(events::VERIFICATION_COMPLETED, {
        {"task_id", task_id},
        {"result", result}
    });
    return result;
}

VerificationResult DualMindVerifier::heuristic_verify(const std::string& proposal) const {
    for (const auto& rule : deny_rules_) {
        if (rule.matcher->matches(proposal)) {
            return fail_closed("Dangerous pattern detected: " + rule.reason +
                               " (" + rule.matcher->source() + ")");
        }
    }

    float heuristic_confidence;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        heuristic_confidence = config_.heuristic_confidence;
    }

    VerificationResult r;
    r.approved = true;
    r.confidence = clamp_unit(heuristic_confidence);
    r.requires_human_review = false;
    r.reason = "No dangerous pattern found (heuristic verification, no reasoner attached)";
    return r;
}

VerificationResult DualMindVerifier::reasoned_verify(const std::shared_ptr<Reasoner>& reasoner,
                                                     const DualMindConfig& cfg,
                                                     const std::string& task,
                                                     const std::string& proposal,
                                                     const std::string& task_id) {
    std::string error;
    PassOutcome main_out, audit_out;

    try {
        auto deadline = std::chrono::steady_clock::now() +
                        std::chrono::milliseconds(cfg.reasoner_timeout_ms);

        // Independent passes, issued together
        auto main_future = launch_pass(reasoner, build_main_prompt(task, proposal),
                                       cfg.main_temperature, cfg.reasoner_timeout_ms);
        auto audit_future = launch_pass(reasoner, build_audit_prompt(task, proposal),
                                        cfg.audit_temperature, cfg.reasoner_timeout_ms);

        // Both must settle before any verdict
        main_out = await_pass(main_future, deadline, cfg.reasoner_timeout_ms);
        audit_out = await_pass(audit_future, deadline, cfg.reasoner_timeout_ms);
    } catch (const std::exception& e) {
        error = std::string("Could not start reasoner pass: ") + e.what();
    }

    if (error.empty()) {
        if (!main_out.error.empty()) error = "Main mind failed: " + main_out.error;
        if (!audit_out.error.empty()) {
            if (!error.empty()) error += "; ";
            error += "Audit mind failed: " + audit_out.error;
        }
    }

    if (!error.empty()) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            consecutive_failures_++;
        }
        KAVACHA_LOG_WARN(COMPONENT, "%s: %s", task_id.c_str(), error.c_str());
        events_.emit(events::VERIFICATION_ERROR, {
            {"task_id", task_id},
            {"error", error}
        });
        return fail_closed("Verification error: " + error);
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        consecutive_failures_ = 0;
    }

    return synthesize(to_thought(*main_out.generation, cfg.main_temperature, true),
                      to_thought(*audit_out.generation, cfg.audit_temperature, false),
                      cfg);
}

VerificationResult DualMindVerifier::synthesize(ThoughtProcess main, ThoughtProcess audit,
                                                const DualMindConfig& cfg) const {
    Divergence divergence = analyze_divergence(main, audit, cfg.divergence_threshold);
    float min_conf = std::min(main.confidence, audit.confidence);

    bool both_endorse = main.verdict == Verdict::Approve && audit.verdict == Verdict::Agree;

    VerificationResult r;
    r.approved = both_endorse && !divergence.diverged && min_conf >= cfg.min_confidence;
    r.confidence = clamp_unit(min_conf);
    r.requires_human_review = !r.approved || divergence.diverged;
    r.audit_reasoning = audit.reasoning;

    if (r.approved) {
        r.reason = "Both minds approve";
    } else if (divergence.diverged) {
        std::string joined;
        for (const auto& d : divergence.differences) {
            if (!joined.empty()) joined += ", ";
            joined += d;
        }
        r.reason = "Minds diverged: " + joined;
    } else if (!both_endorse) {
        r.reason = std::string("Not endorsed: main ") + verdict_name(main.verdict) +
                   ", audit " + verdict_name(audit.verdict);
    } else {
        r.reason = "Confidence " + format_float(min_conf) + " below threshold " +
                   format_float(cfg.min_confidence);
    }

    r.main_thought = std::move(main);
    r.audit_thought = std::move(audit);
    r.divergence = std::move(divergence);
    return r;
}

std::string DualMindVerifier::build_main_prompt(const std::string& task, const std::string& proposal) {
    return "You are the primary decision-making mind. Analyze the following task and proposal carefully.\n\n"
           "Task: " + task + "\n\n"
           "Proposal: " + proposal + "\n\n"
           "Please provide:\n"
           "1. Your reasoning process\n"
           "2. Your conclusion (APPROVE or DENY)\n"
           "3. Your confidence level (0-1)\n\n"
           "Format your response as:\n"
           "REASONING: [your detailed reasoning]\n"
           "CONCLUSION: [APPROVE/DENY]\n"
           "CONFIDENCE: [0-1]";
}

std::string DualMindVerifier::build_audit_prompt(const std::string& task, const std::string& proposal) {
    return "You are the independent audit mind. Your role is to critically and skeptically review "
           "proposed actions before they are carried out. Assume the proposal may be unsafe.\n\n"
           "Task: " + task + "\n\n"
           "Proposal: " + proposal + "\n\n"
           "Please independently review and provide:\n"
           "1. Your critical assessment\n"
           "2. AGREE if the proposal is safe to carry out as written, DISAGREE otherwise\n"
           "3. Your confidence level (0-1)\n\n"
           "Format your response as:\n"
           "ASSESSMENT: [your critical assessment]\n"
           "VERDICT: [AGREE/DISAGREE]\n"
           "CONFIDENCE: [0-1]";
}

std::vector<VerificationRecord> DualMindVerifier::verification_history(size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return history_.recent(limit);
}

VerifierHealth DualMindVerifier::health() const {
    std::lock_guard<std::mutex> lock(mutex_);
    bool has_model = reasoner_ != nullptr;
    return {has_model && consecutive_failures_ < config_.unhealthy_after_failures, has_model};
}

VerifierStats DualMindVerifier::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {total_verifications_, reasoner_ != nullptr};
}

DualMindConfig DualMindVerifier::config() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_;
}

void DualMindVerifier::update_config(DualMindConfig config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
    history_.set_capacity(config_.history_size);
}

} // namespace kavacha
