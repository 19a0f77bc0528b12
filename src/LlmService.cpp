#include "LlmService.hpp"
#include <cpr/cpr.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <thread>
#include <chrono>

namespace scout {

using json = nlohmann::json;

LlmService::LlmService(std::shared_ptr<KeyManager> key_manager, std::string api_base,
                       std::chrono::milliseconds request_timeout)
    : key_manager_(std::move(key_manager)), base_url_(std::move(api_base)), request_timeout_(request_timeout) {}

std::string LlmService::get_endpoint_url(const std::string& action) const {
    return base_url_ + key_manager_->get_current_model() + ":" + action + "?key=" + key_manager_->get_current_key();
}

std::string LlmService::generate_text(const std::string& prompt) {
    if (key_manager_->get_active_key_count() == 0) {
        throw std::runtime_error("LLM backend unavailable: no active API keys");
    }

    cpr::Response r;
    const int max_retries = 4;

    for (int i = 0; i < max_retries; ++i) {
        // URL is rebuilt per attempt so a rotated key takes effect.
        std::string current_url = get_endpoint_url("generateContent");

        json payload = {
            {"contents", {{ {"parts", {{{"text", prompt}}}} }}}
        };

        auto start = std::chrono::steady_clock::now();
        r = cpr::Post(cpr::Url{current_url},
                      cpr::Body{payload.dump(-1, ' ', false, json::error_handler_t::replace)},
                      cpr::Header{{"Content-Type", "application/json"}},
                      cpr::Timeout{request_timeout_});
        double duration = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
        spdlog::debug("LLM round trip: {:.1f} ms (status {})", duration, r.status_code);

        if (r.status_code == 200) break;

        if (r.status_code == 429 || r.status_code == 503) {
            spdlog::warn("⚠️ API {} ({}). Rotating key and cooling down (Attempt {}/{})...",
                         r.status_code, (r.status_code == 429 ? "Quota" : "Overload"), i + 1, max_retries);
            key_manager_->report_rate_limit();
            std::this_thread::sleep_for(std::chrono::milliseconds(2000 + (i * 1000)));
            continue;
        }

        spdlog::error("❌ Fatal API Error [{}]: {}", r.status_code, r.error.message.empty() ? r.text : r.error.message);
        throw std::runtime_error("LLM backend error: HTTP " + std::to_string(r.status_code));
    }

    if (r.status_code != 200) {
        throw std::runtime_error("LLM backend throttled after " + std::to_string(max_retries) + " attempts");
    }

    try {
        auto response_json = json::parse(r.text);
        return response_json.at("candidates").at(0).at("content").at("parts").at(0).at("text").get<std::string>();
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("LLM backend returned an unexpected payload: ") + e.what());
    }
}

} // namespace scout
