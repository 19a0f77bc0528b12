#pragma once
#include <string>
#include <optional>

namespace scout {

enum class EventKind {
    PlanReceived,
    IntentSubstituted,
    SubqueryFilled,
    EmptyPlanFallback,
    PlannerFailed,
    StepStarted,
    StepCompleted,
    StepDegraded,
    Cancelled,
    Synthesized
};

const char* to_string(EventKind kind);

struct OrchestrationEvent {
    EventKind kind;
    std::string message;
    std::optional<size_t> step_index;
    std::string intent;
};

// Structured observability channel for the orchestration kernel.
class IEventSink {
public:
    virtual ~IEventSink() = default;
    virtual void emit(const OrchestrationEvent& event) = 0;
};

// Repairs and degraded steps go out at warn, progress at info/debug.
class SpdlogEventSink : public IEventSink {
public:
    void emit(const OrchestrationEvent& event) override;
};

} // namespace scout
