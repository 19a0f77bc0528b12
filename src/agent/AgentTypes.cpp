#include "agent/AgentTypes.hpp"

namespace scout {

const char* to_string(RunStatus status) {
    switch (status) {
        case RunStatus::Completed: return "completed";
        case RunStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

void to_json(nlohmann::json& j, const PlanStep& step) {
    j = nlohmann::json{
        {"subquery", step.subquery()},
        {"intent", step.intent()}
    };
}

void to_json(nlohmann::json& j, const StepResult& result) {
    j = nlohmann::json{
        {"step_id", result.step_index},
        {"step", result.step},
        {"answer", result.answer},
        {"degraded", result.degraded},
        {"duration_ms", result.duration_ms}
    };
}

void to_json(nlohmann::json& j, const OrchestrationResult& result) {
    j = nlohmann::json{
        {"answer", result.answer},
        {"plan", result.plan},
        {"step_results", result.results},
        {"status", to_string(result.status)},
        {"planner_degraded", result.planner_degraded},
        {"duration_ms", result.duration_ms}
    };
}

} // namespace scout
