#pragma once
// Events: per-component observer registry
//
// Each engine owns its own Notifier; there is no global bus.
// Handlers run synchronously on the emitting thread, after the engine
// has released its own locks, so a handler may call back into it.

#include "log.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace kavacha {

using json = nlohmann::json;

namespace events {
    constexpr const char* ATTACK_DETECTED = "attackDetected";
    constexpr const char* CRITICAL_ATTACK = "criticalAttack";
    constexpr const char* VERIFICATION_STARTED = "verificationStarted";
    constexpr const char* VERIFICATION_COMPLETED = "verificationCompleted";
    constexpr const char* VERIFICATION_ERROR = "verificationError";
    constexpr const char* CORE_SEALED = "coreSealed";
    constexpr const char* PROTECTION_STARTED = "protectionStarted";
    constexpr const char* PROTECTION_STOPPED = "protectionStopped";
    constexpr const char* TAMPER_ATTEMPT = "tamperAttempt";
    constexpr const char* EMERGENCY_LOCKDOWN = "emergencyLockdown";
    constexpr const char* EXECUTION_ERROR = "executionError";
    constexpr const char* FUNCTION_REGISTERED = "functionRegistered";
    constexpr const char* ANY = "*";
}

using EventHandler = std::function<void(const std::string& event, const json& payload)>;

// An event waiting to be delivered once locks are released
struct PendingEvent {
    std::string name;
    json payload;
};

class Notifier {
public:
    using Token = uint64_t;

    explicit Notifier(std::string component = "events")
        : component_(std::move(component)) {}

    Notifier(const Notifier&) = delete;
    Notifier& operator=(const Notifier&) = delete;

    // Subscribe to one event name, or events::ANY for all
    Token on(const std::string& event, EventHandler handler) {
        std::lock_guard<std::mutex> lock(mutex_);
        Token token = ++next_token_;
        subscriptions_.push_back({token, event, std::move(handler)});
        return token;
    }

    // Returns false if the token was unknown
    bool off(Token token) {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = subscriptions_.begin(); it != subscriptions_.end(); ++it) {
            if (it->token == token) {
                subscriptions_.erase(it);
                return true;
            }
        }
        return false;
    }

    size_t subscriber_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return subscriptions_.size();
    }

    void emit(const std::string& event, const json& payload) const {
        std::vector<EventHandler> targets;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (const auto& sub : subscriptions_) {
                if (sub.event == event || sub.event == events::ANY) {
                    targets.push_back(sub.handler);
                }
            }
        }

        for (const auto& handler : targets) {
            try {
                handler(event, payload);
            } catch (const std::exception& e) {
                KAVACHA_LOG_WARN(component_.c_str(), "Handler for '%s' threw: %s",
                                 event.c_str(), e.what());
            } catch (...) {
                KAVACHA_LOG_WARN(component_.c_str(), "Handler for '%s' threw a non-standard exception",
                                 event.c_str());
            }
        }
    }

    void emit_all(const std::vector<PendingEvent>& pending) const {
        for (const auto& ev : pending) {
            emit(ev.name, ev.payload);
        }
    }

private:
    struct Subscription {
        Token token;
        std::string event;
        EventHandler handler;
    };

    std::string component_;
    mutable std::mutex mutex_;
    std::vector<Subscription> subscriptions_;
    Token next_token_ = 0;
};

} // namespace kavacha
