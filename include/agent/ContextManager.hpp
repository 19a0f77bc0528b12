#pragma once
#include <string>
#include "agent/AgentTypes.hpp"

namespace scout {

// Accumulated context of one orchestration call. Only the orchestrator appends;
// handlers receive snapshots.
class ContextManager {
public:
    // "\nStep <i> (<intent>): <answer>\n"
    static std::string render(const StepResult& result) {
        return "\nStep " + std::to_string(result.step_index) + " (" + result.step.intent() + "): " +
               result.answer + "\n";
    }

    void append(const StepResult& result) {
        payload_ += render(result);
    }

    std::string snapshot() const { return payload_; }
    bool empty() const { return payload_.empty(); }

private:
    std::string payload_;
};

} // namespace scout
