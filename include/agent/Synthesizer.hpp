#pragma once
#include <string>
#include <vector>
#include "agent/AgentTypes.hpp"

namespace scout {

class Synthesizer {
public:
    // One result: its answer verbatim. Several: "<INTENT>: <answer>" blocks in
    // plan order, separated by a blank line. Zero results is an InvariantViolation.
    static std::string synthesize(const std::vector<StepResult>& results);

    static std::string render_label(const std::string& intent);
};

} // namespace scout
