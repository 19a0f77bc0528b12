#pragma once
#include <memory>
#include <string>
#include "agent/AgentTypes.hpp"

namespace scout {

class ITextGenerator;

// Decomposes a question into (subquery, intent) pairs. No quality contract:
// the output may be empty or malformed and is repaired by PlanValidator.
class IPlanner {
public:
    virtual ~IPlanner() = default;
    virtual RawPlan plan(const std::string& question, const std::string& capability_descriptions) = 0;
};

class LlmPlanner : public IPlanner {
public:
    explicit LlmPlanner(std::shared_ptr<ITextGenerator> llm);

    RawPlan plan(const std::string& question, const std::string& capability_descriptions) override;

    // Accepts a bare JSON array, a ```json fenced block, or {"plan": [...]}.
    // Unparseable text yields an empty plan.
    static RawPlan parse_plan(const std::string& raw);

private:
    std::shared_ptr<ITextGenerator> llm_;
};

} // namespace scout
