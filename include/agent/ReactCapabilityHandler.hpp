#pragma once
#include <memory>
#include <string>
#include "agent/CapabilityHandler.hpp"
#include "tools/ToolRegistry.hpp"

namespace scout {

class ITextGenerator;

struct CapabilityProfile {
    std::string intent;
    std::string instructions;
    int max_iters = 4;
};

/**
 * Reason/act loop over a private tool registry. Each iteration asks the
 * generator for either a JSON tool call or FINAL_ANSWER. When `max_iters`
 * is exhausted, one extraction call produces a best-effort answer from the
 * trajectory. Generator failures propagate to the caller. Once `stop` is
 * cancelled the loop quits before the next generator call.
 */
class ReactCapabilityHandler : public ICapabilityHandler {
public:
    ReactCapabilityHandler(CapabilityProfile profile,
                           std::shared_ptr<ITextGenerator> llm,
                           std::shared_ptr<const ToolRegistry> tools);

    std::string answer(const std::string& subquery, const std::string& context,
                       const CancellationToken& stop) override;

    const CapabilityProfile& profile() const { return profile_; }

private:
    CapabilityProfile profile_;
    std::shared_ptr<ITextGenerator> llm_;
    std::shared_ptr<const ToolRegistry> tools_;

    void check_stop(const CancellationToken& stop, int step) const;
    std::string build_prompt(const std::string& subquery, const std::string& context,
                             const std::string& trajectory) const;
    std::string extract_best_effort(const std::string& subquery, const std::string& context,
                                    const std::string& trajectory, const std::string& last_observation) const;
};

} // namespace scout
