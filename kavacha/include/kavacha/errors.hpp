#pragma once
// Errors: exceptions are reserved for programmer errors and re-raised failures
//
// "Might be an attack" is a structured result, never an exception.
// Everything thrown by kavacha derives from kavacha::Error.

#include <stdexcept>
#include <string>

namespace kavacha {

class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// invoke() on a name that is not (or no longer) registered
class FunctionNotFound : public Error {
public:
    explicit FunctionNotFound(const std::string& name)
        : Error("Core function '" + name + "' not found"), name_(name) {}
    const std::string& name() const { return name_; }
private:
    std::string name_;
};

class DuplicateFunction : public Error {
public:
    explicit DuplicateFunction(const std::string& name)
        : Error("Core function '" + name + "' is already registered"), name_(name) {}
    const std::string& name() const { return name_; }
private:
    std::string name_;
};

// Operation not allowed in the current seal state
class SealViolation : public Error {
public:
    using Error::Error;
};

class CoreLockedDown : public Error {
public:
    CoreLockedDown() : Error("Sacred core is in emergency lockdown") {}
};

class IntegrityViolation : public Error {
public:
    using Error::Error;
};

// Seal-sensitive configuration changed after sealing
class ConfigLocked : public Error {
public:
    using Error::Error;
};

class ConfigError : public Error {
public:
    using Error::Error;
};

// Invalid custom matcher (bad regex, empty keyword)
class PatternError : public Error {
public:
    using Error::Error;
};

// Thrown by Reasoner implementations
class ReasonerError : public Error {
public:
    using Error::Error;
};

class ReasonerTimeout : public ReasonerError {
public:
    explicit ReasonerTimeout(long long timeout_ms)
        : ReasonerError("Reasoner call timed out after " + std::to_string(timeout_ms) + "ms") {}
};

} // namespace kavacha
