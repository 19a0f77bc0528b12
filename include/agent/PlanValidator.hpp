#pragma once
#include <string>
#include "agent/AgentTypes.hpp"
#include "agent/CapabilityRegistry.hpp"
#include "agent/EventSink.hpp"

namespace scout {

class PlanValidator {
public:
    /**
     * Repairs an untrusted planner output into an executable plan.
     * Unknown or missing intents become `default_intent`; blank subqueries
     * become `question`; an empty plan becomes one fallback step.
     * The result is never empty and every intent resolves in `registry`.
     * Repairs are reported to `sink` (may be null), never thrown.
     */
    static ExecutionPlan validate(const RawPlan& raw_plan,
                                  const CapabilityRegistry& registry,
                                  const std::string& default_intent,
                                  const std::string& question,
                                  IEventSink* sink = nullptr);
};

} // namespace scout
