#pragma once
#include <stdexcept>
#include <string>

namespace scout {

// Internal-invariant violations. These are defects, never user-facing conditions.
class InvariantViolation : public std::logic_error {
public:
    explicit InvariantViolation(const std::string& what) : std::logic_error(what) {}
};

class IntentNotFound : public InvariantViolation {
public:
    explicit IntentNotFound(const std::string& intent)
        : InvariantViolation("Intent '" + intent + "' is not registered"), intent_(intent) {}

    const std::string& intent() const { return intent_; }

private:
    std::string intent_;
};

// A suspension point (planner or handler call) exceeded its deadline.
class CallTimeout : public std::runtime_error {
public:
    explicit CallTimeout(const std::string& what) : std::runtime_error(what) {}
};

} // namespace scout
