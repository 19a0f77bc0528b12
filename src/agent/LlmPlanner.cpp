#include "agent/Planner.hpp"
#include "LlmService.hpp"
#include <regex>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace scout {

using json = nlohmann::json;

namespace {

std::string extract_json_payload(const std::string& raw) {
    std::regex md_regex(R"(```(?:json)?\s*([\[\{][\s\S]*?[\]\}])\s*```)");
    std::smatch match;
    if (std::regex_search(raw, match, md_regex)) return match.str(1);

    auto arr_start = raw.find('[');
    auto obj_start = raw.find('{');
    if (arr_start != std::string::npos && (obj_start == std::string::npos || arr_start < obj_start)) {
        auto arr_end = raw.rfind(']');
        if (arr_end != std::string::npos && arr_end > arr_start) return raw.substr(arr_start, arr_end - arr_start + 1);
    }
    if (obj_start != std::string::npos) {
        auto obj_end = raw.rfind('}');
        if (obj_end != std::string::npos && obj_end > obj_start) return raw.substr(obj_start, obj_end - obj_start + 1);
    }
    return "";
}

std::optional<std::string> string_field(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

} // namespace

LlmPlanner::LlmPlanner(std::shared_ptr<ITextGenerator> llm) : llm_(std::move(llm)) {
    if (!llm_) throw std::invalid_argument("LlmPlanner: null text generator");
}

RawPlan LlmPlanner::plan(const std::string& question, const std::string& capability_descriptions) {
    std::string prompt =
        "### ROLE\n"
        "Decompose the user question into an ordered execution plan.\n\n"
        "### AVAILABLE INTENTS\n" + capability_descriptions + "\n\n"
        "### OUTPUT FORMAT (STRICT)\n"
        "Return ONLY a JSON array. Each element is an object with keys:\n"
        "  \"subquery\": string, the self-contained sub-question for this step\n"
        "  \"intent\": string, one of the intents listed above\n"
        "Order matters: later steps receive the answers of earlier steps.\n"
        "Use a single step when one intent answers the question.\n\n"
        "### QUESTION\n" + question + "\n";

    std::string raw = llm_->generate_text(prompt);
    spdlog::debug("Planner output: [{}]", raw);
    return parse_plan(raw);
}

RawPlan LlmPlanner::parse_plan(const std::string& raw) {
    RawPlan plan;
    std::string payload = extract_json_payload(raw);
    if (payload.empty()) {
        spdlog::warn("⚠️  Planner output contained no JSON plan");
        return plan;
    }

    json doc;
    try {
        doc = json::parse(payload);
    } catch (const json::parse_error& e) {
        spdlog::warn("⚠️  Planner output is not valid JSON: {}", e.what());
        return plan;
    }

    if (doc.is_object() && doc.contains("plan")) doc = doc["plan"];
    if (!doc.is_array()) {
        spdlog::warn("⚠️  Planner output is not a list of steps");
        return plan;
    }

    for (const auto& entry : doc) {
        if (!entry.is_object()) {
            spdlog::warn("⚠️  Skipping non-object plan entry: {}", entry.dump());
            continue;
        }
        plan.push_back({string_field(entry, "subquery"), string_field(entry, "intent")});
    }
    return plan;
}

} // namespace scout
