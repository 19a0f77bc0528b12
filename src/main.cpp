#include <httplib.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <memory>

#include "ScoutConfig.hpp"
#include "KeyManager.hpp"
#include "LlmService.hpp"
#include "LogManager.hpp"
#include "TextUtils.hpp"
#include "agent/CapabilityCatalog.hpp"
#include "agent/Orchestrator.hpp"

using json = nlohmann::json;

class ScoutServer {
public:
    ScoutServer(const scout::ScoutConfig& config, std::shared_ptr<scout::Orchestrator> orchestrator)
        : port_(config.http_port), orchestrator_(std::move(orchestrator)) {
        setup_routes();
    }

    void run() {
        spdlog::info("🚀 Starting Scout orchestration backend on port {}", port_);
        if (!server_.listen("127.0.0.1", port_)) {
            spdlog::error("❌ Could not bind 127.0.0.1:{}", port_);
        }
    }

private:
    int port_;
    httplib::Server server_;
    std::shared_ptr<scout::Orchestrator> orchestrator_;

    void setup_routes() {
        server_.Options("/(.*)", [](const httplib::Request&, httplib::Response& res) {
            res.set_header("Access-Control-Allow-Origin", "*");
            res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
            res.set_header("Access-Control-Allow-Headers", "Content-Type");
            res.status = 204;
        });

        server_.set_pre_routing_handler([](const httplib::Request&, httplib::Response& res) {
            res.set_header("Access-Control-Allow-Origin", "*");
            return httplib::Server::HandlerResponse::Unhandled;
        });

        server_.Get("/api/hello", [](const httplib::Request&, httplib::Response& res) {
            res.set_content(R"({"message": "Hello from Scout!"})", "application/json");
        });

        server_.Get("/api/capabilities", [this](const httplib::Request&, httplib::Response& res) {
            const auto& registry = orchestrator_->registry();
            json response = {
                {"intents", registry.intents()},
                {"default_intent", registry.default_intent()},
                {"descriptions", scout::default_capability_descriptions()}
            };
            res.set_content(response.dump(), "application/json");
        });

        server_.Get("/api/admin/telemetry", [](const httplib::Request&, httplib::Response& res) {
            json response = {{"logs", scout::LogManager::instance().get_logs_json()}};
            res.set_content(response.dump(), "application/json");
        });

        server_.Post("/api/ask", [this](const httplib::Request& req, httplib::Response& res) {
            this->handle_ask(req, res);
        });
    }

    void handle_ask(const httplib::Request& req, httplib::Response& res) {
        std::string question;
        try {
            auto body = json::parse(req.body);
            question = body.value("question", "");
        } catch (const json::exception& e) {
            res.status = 400;
            res.set_content(json{{"error", std::string("Invalid JSON body: ") + e.what()}}.dump(), "application/json");
            return;
        }

        if (scout::trim(question).empty()) {
            res.status = 400;
            res.set_content(json{{"error", "Missing question"}}.dump(), "application/json");
            return;
        }

        try {
            spdlog::info("🔎 Question: {}", question);
            auto result = orchestrator_->run(question);
            scout::LogManager::instance().add_orchestration(question, result);
            res.set_content(json(result).dump(), "application/json");
        } catch (const scout::InvariantViolation& e) {
            spdlog::critical("💥 Orchestration aborted: {}", e.what());
            res.status = 500;
            res.set_content(json{{"error", e.what()}}.dump(), "application/json");
        }
    }
};

int main(int argc, char* argv[]) {
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    try {
        auto config = scout::ScoutConfig::load(argc > 1 ? argv[1] : "");
        spdlog::set_level(spdlog::level::from_str(config.log_level));

        auto keys = std::make_shared<scout::KeyManager>(config.api_keys, config.model);
        auto llm = std::make_shared<scout::LlmService>(keys, config.api_base, config.llm_request_timeout());
        auto orchestrator = scout::build_orchestrator(config, llm);

        ScoutServer server(config, orchestrator);
        server.run();
    } catch (const std::exception& e) {
        spdlog::critical("💥 Startup failed: {}", e.what());
        return 1;
    }
    return 0;
}
