#include "agent/Synthesizer.hpp"
#include "agent/Errors.hpp"
#include "TextUtils.hpp"

namespace scout {

std::string Synthesizer::render_label(const std::string& intent) {
    return to_upper(intent);
}

std::string Synthesizer::synthesize(const std::vector<StepResult>& results) {
    if (results.empty()) {
        throw InvariantViolation("Synthesizer: no step results to synthesize");
    }
    if (results.size() == 1) {
        return results.front().answer;
    }

    std::string out;
    for (size_t i = 0; i < results.size(); ++i) {
        if (i > 0) out += "\n\n";
        out += render_label(results[i].step.intent()) + ": " + results[i].answer;
    }
    return out;
}

} // namespace scout
