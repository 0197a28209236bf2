#pragma once
// Sacred Core: sealed registry of the agent's most sensitive operations
//
// Layer three of the armor. Functions are registered at startup, then the
// core is sealed: the registry freezes and an integrity digest is taken
// over every (name, identity) pair. From then on callers reach those
// functions only through invoke(), which re-checks the entry and logs
// every execution.
//
// State only moves forward:
//   Unsealed ──start_protection()──▶ Sealed ──tamper threshold──▶ LockedDown
//
// The fingerprint covers the callable's type and, for plain function
// pointers, the target address. invoke() only ever runs the copy taken at
// registration, so a rebound entry cannot execute even when its fingerprint
// still matches.
//
// A guardian thread re-derives the digest on an interval. Each mismatch,
// duplicate registration, or post-seal registration is a tamper attempt.
// Enough of them wipe the registry for the lifetime of the object.
//
// The digest detects tampering within this process. It is not a trust root.

#include "errors.hpp"
#include "events.hpp"
#include "types.hpp"
#include <chrono>
#include <condition_variable>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace kavacha {

enum class SealState : uint8_t {
    Unsealed = 0,
    Sealed = 1,
    LockedDown = 2,
};

inline const char* seal_state_name(SealState s) {
    switch (s) {
        case SealState::Unsealed: return "unsealed";
        case SealState::Sealed: return "sealed";
        case SealState::LockedDown: return "locked_down";
    }
    return "unsealed";
}

// Opaque callable: JSON arguments in, JSON result out
using CoreFunction = std::function<json(const json& args)>;
using CoreFunctionPtr = json (*)(const json& args);

struct CoreFunctionEntry {
    std::string name;
    CoreFunction fn;
    std::shared_ptr<const CoreFunction> registered;  // Copy taken at registration; invoke() runs this
    Timestamp registered_at = 0;
    uint64_t identity = 0;   // Fingerprint taken at registration
};

struct SacredCoreConfig {
    bool strict_mode = true;                  // Post-seal registration throws
    bool enable_tamper_detection = true;
    int64_t verification_interval_ms = 30000; // Guardian period
    size_t tamper_threshold = 5;              // Attempts before lockdown
    size_t max_log_size = 1000;
};

struct ProtectionStatus {
    bool is_protected = false;        // state == Sealed
    bool tampering_detected = false;  // tamper_attempts > 0
    std::string integrity_hash;
    SealState state = SealState::Unsealed;
    size_t tamper_attempts = 0;
    Timestamp last_verification = 0;
};

enum class ExecutionOutcome : uint8_t {
    Success = 0,
    Error = 1,
};

struct ExecutionLogEntry {
    std::string function_name;
    Timestamp timestamp = 0;
    ExecutionOutcome outcome = ExecutionOutcome::Success;
    int64_t duration_ms = 0;
    std::optional<std::string> error;
};

// Fixed limits of the kernel. constexpr: no code path can change them.
struct SacredConstants {
    int64_t max_execution_time_ms = 30000;
    uint64_t max_memory_bytes = 512ULL * 1024 * 1024;
    uint32_t max_recursion_depth = 100;
};

inline constexpr SacredConstants SACRED_CONSTANTS{};

inline constexpr const SacredConstants& sacred_constants() { return SACRED_CONSTANTS; }

class SacredCore {
public:
    explicit SacredCore(SacredCoreConfig config = {});
    ~SacredCore();

    SacredCore(const SacredCore&) = delete;
    SacredCore& operator=(const SacredCore&) = delete;

    // Only while Unsealed. Throws std::invalid_argument, DuplicateFunction,
    // SealViolation (strict, after seal) or CoreLockedDown.
    void register_function(const std::string& name, CoreFunction fn);

    // Seal (first call) and run the guardian. Resumes a stopped guardian.
    void start_protection();

    // Halt the guardian. The core stays sealed.
    void stop_protection();

    // Call a registered function. Exceptions from it are logged and rethrown.
    json invoke(const std::string& name, const json& args = json::object());

    // Run a one-off closure under the same logging discipline
    template<typename F>
    std::invoke_result_t<F&> execute(F&& fn, const std::string& label = "anonymous") {
        check_execution_allowed(label);
        return run_logged(label, fn);
    }

    // As execute(), on another thread. The core must outlive the future.
    template<typename F>
    std::future<std::invoke_result_t<F&>> execute_async(F fn, std::string label = "anonymous") {
        check_execution_allowed(label);
        return std::async(std::launch::async,
            [this, fn = std::move(fn), label = std::move(label)]() mutable {
                return run_logged(label, fn);
            });
    }

    // Recompute the digest now (the guardian's check)
    ProtectionStatus verify_integrity();

    ProtectionStatus protection_status() const;
    SealState seal_state() const;
    bool is_sealed() const;
    std::optional<Timestamp> seal_timestamp() const;
    std::string core_hash() const;
    std::vector<std::string> registered_functions() const;
    std::vector<ExecutionLogEntry> execution_log(size_t limit = 100) const;
    size_t tamper_attempts() const;
    bool guardian_running() const;

    SacredCoreConfig config() const;
    // Throws ConfigLocked if a seal-sensitive field changes after sealing
    void update_config(SacredCoreConfig config);

    // coreSealed, protectionStarted, protectionStopped, tamperAttempt,
    // emergencyLockdown, executionError, functionRegistered
    Notifier::Token on(const std::string& event, EventHandler handler) {
        return events_.on(event, std::move(handler));
    }
    bool off(Notifier::Token token) { return events_.off(token); }

private:
    friend struct SacredCoreTestAccess;

    using Clock = std::chrono::steady_clock;

    template<typename F>
    std::invoke_result_t<F&> run_logged(const std::string& label, F& fn) {
        using R = std::invoke_result_t<F&>;
        auto start = Clock::now();
        try {
            if constexpr (std::is_void_v<R>) {
                fn();
                record_success(label, start);
            } else {
                R result = fn();
                record_success(label, start);
                return result;
            }
        } catch (const std::exception& e) {
            record_failure(label, start, e.what());
            throw;
        } catch (...) {
            record_failure(label, start, "non-standard exception");
            throw;
        }
    }

    void check_execution_allowed(const std::string& label);
    void record_success(const std::string& label, Clock::time_point start);
    void record_failure(const std::string& label, Clock::time_point start, const std::string& error);

    // Callers hold mutex_
    static uint64_t identity_of(const CoreFunctionEntry& entry);
    std::string compute_digest_locked() const;
    bool check_integrity_locked(std::vector<PendingEvent>& pending);
    void note_tamper_locked(const std::string& attempted_name, const std::string& reason,
                            std::vector<PendingEvent>& pending);
    ProtectionStatus status_locked() const;

    void guardian_loop(uint64_t generation);
    void reap_guardian();

    Notifier events_{"sacred_core"};

    mutable std::mutex mutex_;  // Everything below
    SacredCoreConfig config_;
    SealState state_ = SealState::Unsealed;
    std::map<std::string, std::shared_ptr<CoreFunctionEntry>> functions_;
    std::string sealed_hash_;
    Timestamp seal_timestamp_ = 0;
    Timestamp last_verification_ = 0;
    size_t tamper_attempts_ = 0;
    BoundedHistory<ExecutionLogEntry> log_;

    // Guardian: runs while generation_ matches the one it was started with
    std::condition_variable guardian_cv_;
    std::thread guardian_;
    uint64_t generation_ = 0;
    bool guardian_running_ = false;
};

} // namespace kavacha
