#include <kavacha/sacred_core.hpp>
#include <kavacha/log.hpp>

#include <cstdint>
#include <stdexcept>
#include <typeinfo>

namespace kavacha {

namespace {

constexpr const char* COMPONENT = "sacred_core";

} // namespace

SacredCore::SacredCore(SacredCoreConfig config)
    : config_(config)
    , log_(config.max_log_size) {}

SacredCore::~SacredCore() {
    std::thread guardian;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++generation_;
        guardian_running_ = false;
        guardian = std::move(guardian_);
    }
    guardian_cv_.notify_all();
    if (guardian.joinable()) {
        if (guardian.get_id() == std::this_thread::get_id()) {
            guardian.detach();
        } else {
            guardian.join();
        }
    }
}

// ═══════════════════════════════════════════════════════════════════
// Registration
// ═══════════════════════════════════════════════════════════════════

void SacredCore::register_function(const std::string& name, CoreFunction fn) {
    if (text::trim(name).empty()) {
        throw std::invalid_argument("Core function name must not be empty");
    }
    if (!fn) {
        throw std::invalid_argument("Core function '" + name + "' has no callable");
    }

    std::vector<PendingEvent> pending;
    bool duplicate = false;
    bool after_seal = false;
    bool strict = true;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == SealState::LockedDown) {
            throw CoreLockedDown();
        }
        if (state_ == SealState::Sealed) {
            after_seal = true;
            strict = config_.strict_mode;
            note_tamper_locked(name, "Registration after seal", pending);
        } else if (functions_.count(name)) {
            duplicate = true;
            note_tamper_locked(name, "Duplicate registration", pending);
        } else {
            auto entry = std::make_shared<CoreFunctionEntry>();
            entry->name = name;
            entry->fn = std::move(fn);
            entry->registered = std::make_shared<const CoreFunction>(entry->fn);
            entry->registered_at = now();
            entry->identity = identity_of(*entry);
            functions_.emplace(name, std::move(entry));
            pending.push_back({events::FUNCTION_REGISTERED, {{"name", name}}});
        }
    }

    events_.emit_all(pending);

    if (duplicate) {
        throw DuplicateFunction(name);
    }
    if (after_seal) {
        if (strict) {
            throw SealViolation("Cannot register '" + name + "': core is sealed");
        }
        KAVACHA_LOG_WARN(COMPONENT, "Ignored registration of '%s' after seal", name.c_str());
    }
}

// ═══════════════════════════════════════════════════════════════════
// Protection lifecycle
// ═══════════════════════════════════════════════════════════════════

void SacredCore::start_protection() {
    // A halted guardian may still be winding down
    reap_guardian();

    std::vector<PendingEvent> pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == SealState::LockedDown) {
            throw CoreLockedDown();
        }

        if (state_ == SealState::Unsealed) {
            sealed_hash_ = compute_digest_locked();
            seal_timestamp_ = now();
            last_verification_ = seal_timestamp_;
            state_ = SealState::Sealed;
            KAVACHA_LOG_INFO(COMPONENT, "Sealed %zu core functions (hash %s)",
                             functions_.size(), sealed_hash_.c_str());
            pending.push_back({events::CORE_SEALED, {
                {"timestamp", seal_timestamp_},
                {"hash", sealed_hash_},
                {"functions", functions_.size()}
            }});
        }

        if (guardian_running_) {
            return;
        }

        bool guarded = config_.enable_tamper_detection;
        if (guarded) {
            uint64_t generation = ++generation_;
            guardian_ = std::thread([this, generation]() { guardian_loop(generation); });
            guardian_running_ = true;
        }
        pending.push_back({events::PROTECTION_STARTED, {
            {"timestamp", now()},
            {"guardian", guarded},
            {"interval_ms", config_.verification_interval_ms}
        }});
    }

    events_.emit_all(pending);
}

void SacredCore::stop_protection() {
    std::thread guardian;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!guardian_running_) return;
        ++generation_;
        guardian_running_ = false;
        // From a handler on the guardian itself: leave the thread to be reaped later
        if (guardian_.get_id() != std::this_thread::get_id()) {
            guardian = std::move(guardian_);
        }
    }
    guardian_cv_.notify_all();
    if (guardian.joinable()) {
        guardian.join();
    }

    KAVACHA_LOG_INFO(COMPONENT, "Protection stopped");
    events_.emit(events::PROTECTION_STOPPED, {{"timestamp", now()}});
}

void SacredCore::reap_guardian() {
    std::thread guardian;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (guardian_running_ || !guardian_.joinable()) return;
        guardian = std::move(guardian_);
    }
    if (guardian.get_id() == std::this_thread::get_id()) {
        // Already told to stop; it exits once the current handler returns
        guardian.detach();
    } else {
        guardian.join();
    }
}

void SacredCore::guardian_loop(uint64_t generation) {
    std::unique_lock<std::mutex> lock(mutex_);
    while (generation_ == generation) {
        auto interval = std::chrono::milliseconds(std::max<int64_t>(config_.verification_interval_ms, 1));
        guardian_cv_.wait_for(lock, interval, [this, generation]() {
            return generation_ != generation;
        });
        if (generation_ != generation) break;
        if (state_ != SealState::Sealed) {
            guardian_running_ = false;
            break;
        }

        std::vector<PendingEvent> pending;
        check_integrity_locked(pending);
        if (!pending.empty()) {
            lock.unlock();
            events_.emit_all(pending);
            lock.lock();
        }
    }
}

// ═══════════════════════════════════════════════════════════════════
// Integrity
// ═══════════════════════════════════════════════════════════════════

uint64_t SacredCore::identity_of(const CoreFunctionEntry& entry) {
    Digest d;
    d.update(entry.name);
    d.update(std::string(entry.fn.target_type().name()));
    if (const CoreFunctionPtr* target = entry.fn.target<CoreFunctionPtr>()) {
        d.update(static_cast<uint64_t>(reinterpret_cast<uintptr_t>(*target)));
    }
    d.update(static_cast<uint64_t>(reinterpret_cast<uintptr_t>(&entry)));
    return d.value();
}

std::string SacredCore::compute_digest_locked() const {
    Digest d;
    d.update(static_cast<uint64_t>(functions_.size()));
    // std::map iterates in name order
    for (const auto& [name, entry] : functions_) {
        d.update(name);
        d.update(identity_of(*entry));
    }
    return d.hex();
}

bool SacredCore::check_integrity_locked(std::vector<PendingEvent>& pending) {
    if (state_ != SealState::Sealed) return true;
    last_verification_ = now();
    if (!config_.enable_tamper_detection) return true;

    std::string current = compute_digest_locked();
    if (current == sealed_hash_) return true;

    note_tamper_locked("*", "Integrity digest mismatch (expected " + sealed_hash_ +
                            ", found " + current + ")", pending);
    return false;
}

void SacredCore::note_tamper_locked(const std::string& attempted_name, const std::string& reason,
                                    std::vector<PendingEvent>& pending) {
    tamper_attempts_++;
    Timestamp ts = now();
    KAVACHA_LOG_WARN(COMPONENT, "Tamper attempt %zu/%zu on '%s': %s",
                     tamper_attempts_, config_.tamper_threshold,
                     attempted_name.c_str(), reason.c_str());
    pending.push_back({events::TAMPER_ATTEMPT, {
        {"attempted_name", attempted_name},
        {"reason", reason},
        {"attempts", tamper_attempts_},
        {"timestamp", ts}
    }});

    if (state_ == SealState::LockedDown || tamper_attempts_ < config_.tamper_threshold) {
        return;
    }

    functions_.clear();
    state_ = SealState::LockedDown;
    ++generation_;
    guardian_running_ = false;
    guardian_cv_.notify_all();

    KAVACHA_LOG_ERROR(COMPONENT, "EMERGENCY LOCKDOWN after %zu tamper attempts: all core functions revoked",
                      tamper_attempts_);
    pending.push_back({events::EMERGENCY_LOCKDOWN, {
        {"timestamp", ts},
        {"reason", "Tamper threshold reached: " + reason},
        {"attempts", tamper_attempts_}
    }});
}

ProtectionStatus SacredCore::verify_integrity() {
    std::vector<PendingEvent> pending;
    ProtectionStatus status;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        check_integrity_locked(pending);
        status = status_locked();
    }
    events_.emit_all(pending);
    return status;
}

// ═══════════════════════════════════════════════════════════════════
// Execution
// ═══════════════════════════════════════════════════════════════════

json SacredCore::invoke(const std::string& name, const json& args) {
    std::shared_ptr<const CoreFunction> fn;
    std::vector<PendingEvent> pending;
    bool mismatch = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == SealState::Unsealed) {
            throw SealViolation("Cannot invoke '" + name + "' before the core is sealed");
        }
        auto it = functions_.find(name);
        if (it == functions_.end()) {
            throw FunctionNotFound(name);
        }
        const auto& entry = it->second;
        if (config_.enable_tamper_detection && identity_of(*entry) != entry->identity) {
            mismatch = true;
            note_tamper_locked(name, "Function identity mismatch", pending);
        } else {
            fn = entry->registered;
        }
    }

    if (mismatch) {
        events_.emit_all(pending);
        throw IntegrityViolation("Core function '" + name + "' failed its identity check");
    }

    // Runs outside the lock; the shared copy keeps it alive through a lockdown
    auto call = [&fn, &args]() { return (*fn)(args); };
    return run_logged(name, call);
}

void SacredCore::check_execution_allowed(const std::string& label) {
    std::vector<PendingEvent> pending;
    bool intact = true;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        switch (state_) {
            case SealState::LockedDown:
                throw CoreLockedDown();
            case SealState::Unsealed:
                KAVACHA_LOG_WARN(COMPONENT, "Executing '%s' on an unsealed core", label.c_str());
                return;
            case SealState::Sealed:
                if (config_.strict_mode) {
                    intact = check_integrity_locked(pending);
                }
                break;
        }
    }

    events_.emit_all(pending);
    if (!intact) {
        throw IntegrityViolation("Refusing to execute '" + label + "': core integrity compromised");
    }
}

void SacredCore::record_success(const std::string& label, Clock::time_point start) {
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
    std::lock_guard<std::mutex> lock(mutex_);
    log_.push(ExecutionLogEntry{label, now(), ExecutionOutcome::Success, elapsed.count(), std::nullopt});
}

void SacredCore::record_failure(const std::string& label, Clock::time_point start,
                                const std::string& error) {
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
    Timestamp ts = now();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        log_.push(ExecutionLogEntry{label, ts, ExecutionOutcome::Error, elapsed.count(), error});
    }

    KAVACHA_LOG_ERROR(COMPONENT, "Execution of '%s' failed: %s", label.c_str(), error.c_str());
    events_.emit(events::EXECUTION_ERROR, {
        {"function_name", label},
        {"error", error},
        {"timestamp", ts}
    });
}

// ═══════════════════════════════════════════════════════════════════
// Queries
// ═══════════════════════════════════════════════════════════════════

ProtectionStatus SacredCore::status_locked() const {
    ProtectionStatus s;
    s.is_protected = state_ == SealState::Sealed;
    s.tampering_detected = tamper_attempts_ > 0;
    s.integrity_hash = sealed_hash_;
    s.state = state_;
    s.tamper_attempts = tamper_attempts_;
    s.last_verification = last_verification_;
    return s;
}

ProtectionStatus SacredCore::protection_status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_locked();
}

SealState SacredCore::seal_state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool SacredCore::is_sealed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_ == SealState::Sealed;
}

std::optional<Timestamp> SacredCore::seal_timestamp() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == SealState::Unsealed) return std::nullopt;
    return seal_timestamp_;
}

std::string SacredCore::core_hash() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sealed_hash_;
}

std::vector<std::string> SacredCore::registered_functions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(functions_.size());
    for (const auto& [name, entry] : functions_) {
        names.push_back(name);
    }
    return names;
}

std::vector<ExecutionLogEntry> SacredCore::execution_log(size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return log_.recent(limit);
}

size_t SacredCore::tamper_attempts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tamper_attempts_;
}

bool SacredCore::guardian_running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return guardian_running_;
}

SacredCoreConfig SacredCore::config() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_;
}

void SacredCore::update_config(SacredCoreConfig config) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != SealState::Unsealed) {
            if (config.strict_mode != config_.strict_mode ||
                config.enable_tamper_detection != config_.enable_tamper_detection ||
                config.tamper_threshold != config_.tamper_threshold) {
                throw ConfigLocked("Seal-sensitive settings cannot change after sealing");
            }
        }
        config_ = config;
        log_.set_capacity(config_.max_log_size);
    }
    // The guardian picks up a new interval on its next wait
    guardian_cv_.notify_all();
}

} // namespace kavacha
