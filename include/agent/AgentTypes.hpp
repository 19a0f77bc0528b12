#pragma once
#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>

namespace scout {

// Untrusted planner output. Either field may be missing.
struct RawPlanStep {
    std::optional<std::string> subquery;
    std::optional<std::string> intent;
};

using RawPlan = std::vector<RawPlanStep>;

class PlanStep {
public:
    PlanStep(std::string subquery, std::string intent)
        : subquery_(std::move(subquery)), intent_(std::move(intent)) {}

    const std::string& subquery() const { return subquery_; }
    const std::string& intent() const { return intent_; }

    // "[intent] subquery"
    std::string describe() const { return "[" + intent_ + "] " + subquery_; }

    bool operator==(const PlanStep& other) const {
        return subquery_ == other.subquery_ && intent_ == other.intent_;
    }

private:
    std::string subquery_;
    std::string intent_;
};

using ExecutionPlan = std::vector<PlanStep>;

struct StepResult {
    size_t step_index;
    PlanStep step;
    std::string answer;
    bool degraded = false;
    double duration_ms = 0.0;
};

enum class RunStatus { Completed, Cancelled };

struct OrchestrationResult {
    std::string answer;
    ExecutionPlan plan;
    std::vector<StepResult> results;
    RunStatus status = RunStatus::Completed;
    bool planner_degraded = false;
    double duration_ms = 0.0;
};

const char* to_string(RunStatus status);

void to_json(nlohmann::json& j, const PlanStep& step);
void to_json(nlohmann::json& j, const StepResult& result);
void to_json(nlohmann::json& j, const OrchestrationResult& result);

} // namespace scout
