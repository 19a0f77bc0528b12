#pragma once
#include <chrono>
#include <deque>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>
#include "agent/AgentTypes.hpp"

using json = nlohmann::json;

namespace scout {

struct InteractionLog {
    long long timestamp;
    std::string question;
    std::string plan_summary;   // "[intent] subquery" per line
    std::string answer;
    size_t step_count;
    size_t degraded_steps;
    std::string status;
    double duration_ms;
};

// Recent orchestration traces for the telemetry endpoints.
class LogManager {
public:
    static constexpr size_t kCapacity = 50;

    static LogManager& instance() {
        static LogManager instance;
        return instance;
    }

    void add_log(const InteractionLog& log) {
        std::lock_guard<std::mutex> lock(mtx_);
        logs_.push_back(log);
        if (logs_.size() > kCapacity) {
            logs_.pop_front();
        }
    }

    void add_orchestration(const std::string& question, const OrchestrationResult& result) {
        InteractionLog log;
        log.timestamp = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
        log.question = question;
        for (const auto& step : result.plan) log.plan_summary += step.describe() + "\n";
        log.answer = result.answer;
        log.step_count = result.results.size();
        log.degraded_steps = 0;
        for (const auto& r : result.results) {
            if (r.degraded) log.degraded_steps++;
        }
        log.status = to_string(result.status);
        log.duration_ms = result.duration_ms;
        add_log(log);
    }

    size_t size() {
        std::lock_guard<std::mutex> lock(mtx_);
        return logs_.size();
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mtx_);
        logs_.clear();
    }

    // Newest first.
    json get_logs_json() {
        std::lock_guard<std::mutex> lock(mtx_);
        json j_list = json::array();
        for (auto it = logs_.rbegin(); it != logs_.rend(); ++it) {
            j_list.push_back({
                {"timestamp", it->timestamp},
                {"question", it->question},
                {"plan", it->plan_summary},
                {"answer", it->answer},
                {"step_count", it->step_count},
                {"degraded_steps", it->degraded_steps},
                {"status", it->status},
                {"duration_ms", it->duration_ms}
            });
        }
        return j_list;
    }

private:
    LogManager() {}
    std::deque<InteractionLog> logs_;
    std::mutex mtx_;
};

} // namespace scout
