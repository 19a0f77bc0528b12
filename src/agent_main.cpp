#include <grpcpp/grpcpp.h>
#include <spdlog/spdlog.h>
#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

#include "scout.pb.h"
#include "scout.grpc.pb.h"
#include "ScoutConfig.hpp"
#include "KeyManager.hpp"
#include "LlmService.hpp"
#include "LogManager.hpp"
#include "TextUtils.hpp"
#include "agent/CapabilityCatalog.hpp"
#include "agent/Orchestrator.hpp"

using grpc::Server;
using grpc::ServerBuilder;

namespace {

void fill_step(const scout::PlanStep& step, ::scout::proto::PlanStep* out) {
    out->set_subquery(step.subquery());
    out->set_intent(step.intent());
}

struct WatcherGuard {
    std::atomic<bool>& done;
    std::thread& thread;
    ~WatcherGuard() {
        done.store(true);
        if (thread.joinable()) thread.join();
    }
};

} // namespace

class ScoutServiceImpl final : public ::scout::proto::ScoutService::Service {
    std::shared_ptr<scout::Orchestrator> orchestrator_;
public:
    explicit ScoutServiceImpl(std::shared_ptr<scout::Orchestrator> orchestrator)
        : orchestrator_(std::move(orchestrator)) {}

    grpc::Status Ask(grpc::ServerContext* context,
                     const ::scout::proto::Question* request,
                     ::scout::proto::Answer* reply) override {
        if (scout::trim(request->question()).empty()) {
            return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "Missing question");
        }

        // Client disconnects and deadlines stop the plan between steps.
        scout::CancellationToken cancel;
        std::atomic<bool> done{false};
        std::thread watcher([context, cancel, &done]() mutable {
            while (!done.load()) {
                if (context->IsCancelled()) {
                    cancel.cancel();
                    return;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
            }
        });
        WatcherGuard guard{done, watcher};

        try {
            auto result = orchestrator_->run(request->question(), cancel);
            scout::LogManager::instance().add_orchestration(request->question(), result);

            reply->set_answer(result.answer);
            for (const auto& step : result.plan) fill_step(step, reply->add_plan());
            for (const auto& r : result.results) {
                auto* out = reply->add_step_results();
                out->set_step_id(static_cast<uint32_t>(r.step_index));
                fill_step(r.step, out->mutable_step());
                out->set_answer(r.answer);
                out->set_degraded(r.degraded);
                out->set_duration_ms(r.duration_ms);
            }
            reply->set_status(scout::to_string(result.status));
            reply->set_planner_degraded(result.planner_degraded);
            reply->set_duration_ms(result.duration_ms);
            return grpc::Status::OK;
        } catch (const scout::InvariantViolation& e) {
            spdlog::critical("💥 Orchestration aborted: {}", e.what());
            return grpc::Status(grpc::StatusCode::INTERNAL, e.what());
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
        ScoutServiceImpl service(scout::build_orchestrator(config, llm));

        ServerBuilder builder;
        builder.AddListeningPort(config.grpc_address, grpc::InsecureServerCredentials());
        builder.RegisterService(&service);
        std::unique_ptr<Server> server(builder.BuildAndStart());
        if (!server) {
            spdlog::critical("💥 Could not start gRPC service on {}", config.grpc_address);
            return 1;
        }

        spdlog::info("🚀 Scout gRPC Service ignited on {}", config.grpc_address);
        server->Wait();
    } catch (const std::exception& e) {
        spdlog::critical("💥 Startup failed: {}", e.what());
        return 1;
    }
    return 0;
}
