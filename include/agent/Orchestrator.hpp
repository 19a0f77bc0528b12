#pragma once
#include <chrono>
#include <memory>
#include <string>
#include "agent/AgentTypes.hpp"
#include "agent/CallGuard.hpp"
#include "agent/CapabilityRegistry.hpp"
#include "agent/EventSink.hpp"
#include "agent/Planner.hpp"

namespace scout {

struct OrchestratorOptions {
    std::chrono::milliseconds planner_timeout{30000};
    std::chrono::milliseconds handler_timeout{60000};
    // Passed verbatim to the planner.
    std::string capability_descriptions;
};

class Orchestrator {
public:
    Orchestrator(std::shared_ptr<IPlanner> planner,
                 std::shared_ptr<const CapabilityRegistry> registry,
                 OrchestratorOptions options,
                 std::shared_ptr<IEventSink> sink = nullptr);

    /**
     * Plans, validates, executes every step in order and synthesizes the answer.
     * Failed or timed-out steps are recorded as degraded results; a failed
     * planner falls back to the single default step. Only internal-invariant
     * violations propagate. Safe to call concurrently: all per-call state is local.
     */
    OrchestrationResult run(const std::string& question,
                            const CancellationToken& cancel = CancellationToken()) const;

    const CapabilityRegistry& registry() const { return *registry_; }

private:
    std::shared_ptr<IPlanner> planner_;
    std::shared_ptr<const CapabilityRegistry> registry_;
    OrchestratorOptions options_;
    std::shared_ptr<IEventSink> sink_;

    RawPlan request_plan(const std::string& question, bool& degraded) const;
    StepResult execute_step(size_t index, const PlanStep& step, const std::string& context) const;
    StepResult degraded_step(size_t index, const PlanStep& step, const std::string& reason,
                             std::chrono::steady_clock::time_point start) const;
    void notify(EventKind kind, std::string message, std::optional<size_t> index = std::nullopt,
                std::string intent = "") const;
};

} // namespace scout
