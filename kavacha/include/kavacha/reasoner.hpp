#pragma once
// Reasoner: the external language-model backend, seen from here
//
// Kavacha never owns a model. It asks for text at a temperature and
// expects an answer within a deadline. Implementations may throw;
// every failure is treated the same way by the verifier (fail-closed).

#include <cstdint>
#include <string>

namespace kavacha {

struct Generation {
    std::string text;
    float confidence = 0.0f;  // Backend's own estimate, 0-1
};

class Reasoner {
public:
    virtual ~Reasoner() = default;

    // May throw (ReasonerError or anything derived from std::exception).
    // timeout_ms is advisory for the backend; the verifier enforces it too.
    virtual Generation generate(const std::string& prompt, float temperature,
                                int64_t timeout_ms) = 0;
};

} // namespace kavacha
