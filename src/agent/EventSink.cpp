#include "agent/EventSink.hpp"
#include <spdlog/spdlog.h>

namespace scout {

const char* to_string(EventKind kind) {
    switch (kind) {
        case EventKind::PlanReceived:      return "plan_received";
        case EventKind::IntentSubstituted: return "intent_substituted";
        case EventKind::SubqueryFilled:    return "subquery_filled";
        case EventKind::EmptyPlanFallback: return "empty_plan_fallback";
        case EventKind::PlannerFailed:     return "planner_failed";
        case EventKind::StepStarted:       return "step_started";
        case EventKind::StepCompleted:     return "step_completed";
        case EventKind::StepDegraded:      return "step_degraded";
        case EventKind::Cancelled:         return "cancelled";
        case EventKind::Synthesized:       return "synthesized";
    }
    return "unknown";
}

void SpdlogEventSink::emit(const OrchestrationEvent& event) {
    std::string where = event.step_index
        ? " (step " + std::to_string(*event.step_index) + (event.intent.empty() ? "" : ", " + event.intent) + ")"
        : "";

    switch (event.kind) {
        case EventKind::IntentSubstituted:
        case EventKind::SubqueryFilled:
        case EventKind::EmptyPlanFallback:
        case EventKind::PlannerFailed:
        case EventKind::StepDegraded:
        case EventKind::Cancelled:
            spdlog::warn("⚠️  [{}]{} {}", to_string(event.kind), where, event.message);
            break;
        case EventKind::StepStarted:
            spdlog::debug("[{}]{} {}", to_string(event.kind), where, event.message);
            break;
        default:
            spdlog::info("🛰️ [{}]{} {}", to_string(event.kind), where, event.message);
            break;
    }
}

} // namespace scout
