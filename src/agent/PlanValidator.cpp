#include "agent/PlanValidator.hpp"
#include "TextUtils.hpp"
#include <stdexcept>

namespace scout {

namespace {

void report(IEventSink* sink, EventKind kind, std::string message, std::optional<size_t> index = std::nullopt,
            std::string intent = "") {
    if (sink) sink->emit({kind, std::move(message), index, std::move(intent)});
}

} // namespace

ExecutionPlan PlanValidator::validate(const RawPlan& raw_plan,
                                      const CapabilityRegistry& registry,
                                      const std::string& default_intent,
                                      const std::string& question,
                                      IEventSink* sink) {
    if (!registry.has(default_intent)) {
        throw std::invalid_argument("PlanValidator: default intent '" + default_intent + "' is not registered");
    }

    ExecutionPlan plan;
    plan.reserve(raw_plan.size());

    for (size_t i = 0; i < raw_plan.size(); ++i) {
        const auto& raw = raw_plan[i];

        std::string intent = raw.intent ? to_lower(trim(*raw.intent)) : "";
        if (!registry.has(intent)) {
            report(sink, EventKind::IntentSubstituted,
                   "Unknown intent '" + (raw.intent ? *raw.intent : std::string("<missing>")) +
                   "', defaulting to '" + default_intent + "'",
                   i, default_intent);
            intent = default_intent;
        }

        std::string subquery;
        if (raw.subquery && !trim(*raw.subquery).empty()) {
            subquery = *raw.subquery;
        } else {
            report(sink, EventKind::SubqueryFilled, "Blank subquery, using the full question", i, intent);
            subquery = question;
        }

        plan.emplace_back(std::move(subquery), std::move(intent));
    }

    if (plan.empty()) {
        report(sink, EventKind::EmptyPlanFallback, "Empty plan returned, using fallback", std::nullopt, default_intent);
        plan.emplace_back(question, default_intent);
    }

    return plan;
}

} // namespace scout
