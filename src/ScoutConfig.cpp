#include "ScoutConfig.hpp"
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace scout {

using json = nlohmann::json;

int ScoutConfig::max_iters_for(const std::string& intent, int fallback) const {
    auto it = max_iters.find(intent);
    return it == max_iters.end() ? fallback : it->second;
}

std::chrono::milliseconds ScoutConfig::llm_request_timeout() const {
    auto bound = request_timeout;
    for (auto guard : {planner_timeout, handler_timeout}) {
        if (guard.count() > 0 && (bound.count() <= 0 || guard < bound)) bound = guard;
    }
    return bound;
}

ScoutConfig ScoutConfig::from_json(const json& j) {
    ScoutConfig c;
    c.api_keys = j.value("keys", std::vector<std::string>{});
    c.model = j.value("model", c.model);
    c.api_base = j.value("api_base", c.api_base);
    c.default_intent = j.value("default_intent", c.default_intent);
    c.planner_timeout = std::chrono::milliseconds(j.value("planner_timeout_ms", static_cast<long long>(c.planner_timeout.count())));
    c.handler_timeout = std::chrono::milliseconds(j.value("handler_timeout_ms", static_cast<long long>(c.handler_timeout.count())));
    c.request_timeout = std::chrono::milliseconds(j.value("request_timeout_ms", static_cast<long long>(c.request_timeout.count())));
    if (j.contains("max_iters")) {
        for (const auto& [intent, iters] : j.at("max_iters").items()) {
            c.max_iters[intent] = iters.get<int>();
        }
    }
    c.dataset_path = j.value("dataset_path", c.dataset_path);
    c.http_port = j.value("http_port", c.http_port);
    c.grpc_address = j.value("grpc_address", c.grpc_address);
    c.log_level = j.value("log_level", c.log_level);
    return c;
}

ScoutConfig ScoutConfig::load(const std::string& explicit_path) {
    std::vector<std::string> search_paths;
    if (!explicit_path.empty()) {
        search_paths.push_back(explicit_path);
    } else {
        search_paths = {"scout.json", "../scout.json", "build/scout.json", "../../scout.json"};
    }

    std::ifstream f;
    std::string found_path;
    for (const auto& path : search_paths) {
        f.open(path);
        if (f.is_open()) {
            found_path = path;
            break;
        }
        f.clear();
    }

    ScoutConfig config;
    if (found_path.empty()) {
        if (!explicit_path.empty()) {
            throw std::runtime_error("Config file not readable: " + explicit_path);
        }
        spdlog::warn("⚠️ scout.json not found in any standard path, using defaults");
    } else {
        try {
            config = from_json(json::parse(f));
            spdlog::info("⚙️  Config Synced from {}: {} key(s), default intent '{}'",
                         found_path, config.api_keys.size(), config.default_intent);
        } catch (const json::exception& e) {
            throw std::runtime_error("Config corrupted at " + found_path + ": " + e.what());
        }
    }

    if (config.api_keys.empty()) {
        if (const char* env_key = std::getenv("GEMINI_API_KEY")) {
            config.api_keys.emplace_back(env_key);
        }
    }
    return config;
}

} // namespace scout
