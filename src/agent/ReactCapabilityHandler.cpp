#include "agent/ReactCapabilityHandler.hpp"
#include "LlmService.hpp"
#include "TextUtils.hpp"
#include <regex>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace scout {

namespace {

constexpr size_t kObservationCap = 5000;
const std::string kFinalMarker = "FINAL_ANSWER:";

nlohmann::json extract_tool_call(const std::string& raw) {
    std::smatch match;
    std::regex md_regex(R"(```(?:json)?\s*(\{[\s\S]*?\})\s*```)");
    std::string candidate;
    if (std::regex_search(raw, match, md_regex)) {
        candidate = match.str(1);
    } else {
        auto start = raw.find('{');
        auto end = raw.rfind('}');
        if (start == std::string::npos || end == std::string::npos || end < start) return nlohmann::json::object();
        candidate = raw.substr(start, end - start + 1);
    }
    try {
        auto j = nlohmann::json::parse(candidate);
        if (j.is_object()) return j;
    } catch (const nlohmann::json::parse_error& e) {
        spdlog::debug("Tool call candidate is not JSON: {}", e.what());
    }
    return nlohmann::json::object();
}

} // namespace

ReactCapabilityHandler::ReactCapabilityHandler(CapabilityProfile profile,
                                               std::shared_ptr<ITextGenerator> llm,
                                               std::shared_ptr<const ToolRegistry> tools)
    : profile_(std::move(profile)), llm_(std::move(llm)), tools_(std::move(tools)) {
    if (!llm_) throw std::invalid_argument("ReactCapabilityHandler: null text generator");
    if (!tools_) throw std::invalid_argument("ReactCapabilityHandler: null tool registry");
    if (profile_.max_iters < 1) throw std::invalid_argument("ReactCapabilityHandler: max_iters must be positive");
}

void ReactCapabilityHandler::check_stop(const CancellationToken& stop, int step) const {
    if (!stop.is_cancelled()) return;
    spdlog::debug("[{}] Caller gave up, stopping before step {}", profile_.intent, step);
    throw std::runtime_error("Handler '" + profile_.intent + "' stopped: caller gave up");
}

std::string ReactCapabilityHandler::build_prompt(const std::string& subquery, const std::string& context,
                                                 const std::string& trajectory) const {
    return
        "### ROLE\n" + profile_.instructions + "\n"
        "You communicate ONLY via JSON tool calls or FINAL_ANSWER.\n\n"

        "### TOOLS\n" + tools_->get_manifest() + "\n\n"

        "### TOOL SCHEMA (STRICT)\n"
        "To use a tool, output exactly:\n"
        "```json\n"
        "{\"tool\": \"tool_name\", \"parameters\": {\"key\": \"value\"}}\n"
        "```\n"
        "When you can answer, output: FINAL_ANSWER: <answer>\n\n"

        "### ERROR HANDLING RULES\n"
        "- If a tool returns \"ERROR:\" or \"not found\", do not repeat the same call.\n"
        "- If you cannot proceed, output FINAL_ANSWER with what you know.\n\n"

        "### QUESTION\n" + subquery + "\n\n"

        "### CONTEXT FROM PREVIOUS STEPS\n" + (context.empty() ? std::string("No previous context") : context) + "\n\n"

        "### TRAJECTORY\n" + (trajectory.empty() ? std::string("(none yet)") : trajectory) + "\n\n"

        "### YOUR NEXT STEP\n";
}

std::string ReactCapabilityHandler::extract_best_effort(const std::string& subquery, const std::string& context,
                                                        const std::string& trajectory,
                                                        const std::string& last_observation) const {
    std::string prompt =
        "### ROLE\n" + profile_.instructions + "\n\n"
        "### QUESTION\n" + subquery + "\n\n"
        "### CONTEXT FROM PREVIOUS STEPS\n" + (context.empty() ? std::string("No previous context") : context) + "\n\n"
        "### TRAJECTORY\n" + trajectory + "\n\n"
        "### TASK\nNo more tool calls are allowed. Answer the question as well as possible from the trajectory.\n";

    std::string answer = trim(llm_->generate_text(prompt));
    auto marker = answer.find(kFinalMarker);
    if (marker != std::string::npos) answer = trim(answer.substr(marker + kFinalMarker.size()));
    if (!answer.empty()) return answer;
    if (!last_observation.empty()) return last_observation;
    return "Could not answer '" + subquery + "' within " + std::to_string(profile_.max_iters) + " reasoning steps.";
}

std::string ReactCapabilityHandler::answer(const std::string& subquery, const std::string& context,
                                           const CancellationToken& stop) {
    std::string trajectory;
    std::string last_observation;

    for (int step = 0; step < profile_.max_iters; ++step) {
        check_stop(stop, step);
        std::string thought = llm_->generate_text(build_prompt(subquery, context, trajectory));
        spdlog::debug("[{}] Thought (step {}): [{}]", profile_.intent, step, thought);

        auto marker = thought.find(kFinalMarker);
        if (marker != std::string::npos) {
            return trim(thought.substr(marker + kFinalMarker.size()));
        }

        nlohmann::json action = extract_tool_call(thought);
        if (!action.contains("tool") || !action["tool"].is_string()) {
            spdlog::warn("⚠️  [{}] Malformed action at step {}. Sending corrective feedback.", profile_.intent, step);
            trajectory += "\nSYSTEM ERROR: Your previous response was NOT a valid JSON tool call. "
                          "Use {\"tool\": \"...\", \"parameters\": {...}} or FINAL_ANSWER: <answer>.";
            continue;
        }

        std::string tool_name = action["tool"].get<std::string>();
        nlohmann::json params = action.value("parameters", nlohmann::json::object());

        if (tool_name == "FINAL_ANSWER") {
            if (params.is_object() && params.contains("answer") && params["answer"].is_string()) {
                return params["answer"].get<std::string>();
            }
            return last_observation.empty() ? "No descriptive answer was produced." : last_observation;
        }

        std::string observation = tools_->dispatch(tool_name, params);
        last_observation = observation;

        trajectory += "\n[STEP " + std::to_string(step) + " RESULT]\n";
        trajectory += "TOOL USED: " + tool_name + " " + params.dump() + "\n";
        trajectory += "OUTPUT:\n" + utf8_safe_substr(observation, kObservationCap);
        trajectory += "\n[END OF RESULT]";

        if (observation.rfind("ERROR:", 0) == 0) {
            trajectory += "\nSYSTEM: The tool returned an ERROR. Adapt your plan; do not repeat the same failing call.";
        }
    }

    check_stop(stop, profile_.max_iters);
    spdlog::warn("⚠️  [{}] Iteration cap ({}) reached, extracting best-effort answer", profile_.intent,
                 profile_.max_iters);
    return extract_best_effort(subquery, context, trajectory, last_observation);
}

} // namespace scout
