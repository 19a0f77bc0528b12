#pragma once
#include <chrono>
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace scout {

struct ScoutConfig {
    std::vector<std::string> api_keys;
    std::string model = "gemini-1.5-flash";
    std::string api_base = "https://generativelanguage.googleapis.com/v1beta/models/";

    std::string default_intent = "search";
    std::chrono::milliseconds planner_timeout{30000};
    std::chrono::milliseconds handler_timeout{60000};
    std::chrono::milliseconds request_timeout{30000};
    std::map<std::string, int> max_iters{{"search", 4}, {"retrieve", 3}, {"analyze", 4}};

    // Empty: built-in mock dataset.
    std::string dataset_path;

    int http_port = 5002;
    std::string grpc_address = "127.0.0.1:50051";
    std::string log_level = "info";

    // Per-request HTTP timeout for the LLM backend, never longer than a
    // positive planner or handler timeout.
    std::chrono::milliseconds llm_request_timeout() const;

    int max_iters_for(const std::string& intent, int fallback = 4) const;

    // Missing keys keep their defaults. Throws nlohmann::json::exception on wrong types.
    static ScoutConfig from_json(const nlohmann::json& j);

    /**
     * Loads `explicit_path` when given, else the first of scout.json,
     * ../scout.json, build/scout.json, ../../scout.json. A missing file
     * yields defaults; an unreadable or malformed one throws std::runtime_error.
     */
    static ScoutConfig load(const std::string& explicit_path = "");
};

} // namespace scout
