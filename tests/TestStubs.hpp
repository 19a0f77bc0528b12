#pragma once
#include <atomic>
#include <chrono>
#include <deque>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "LlmService.hpp"
#include "agent/CapabilityHandler.hpp"
#include "agent/EventSink.hpp"
#include "agent/Planner.hpp"

namespace scout::test {

class StubPlanner : public IPlanner {
public:
    explicit StubPlanner(RawPlan plan) : plan_(std::move(plan)) {}

    RawPlan plan(const std::string& question, const std::string& descriptions) override {
        std::lock_guard<std::mutex> lock(mtx_);
        questions.push_back(question);
        last_descriptions = descriptions;
        return plan_;
    }

    std::vector<std::string> questions;
    std::string last_descriptions;

private:
    RawPlan plan_;
    std::mutex mtx_;
};

class ThrowingPlanner : public IPlanner {
public:
    RawPlan plan(const std::string&, const std::string&) override {
        throw std::runtime_error("planner backend unreachable");
    }
};

class SlowPlanner : public IPlanner {
public:
    explicit SlowPlanner(std::chrono::milliseconds delay) : delay_(delay) {}
    RawPlan plan(const std::string&, const std::string&) override {
        std::this_thread::sleep_for(delay_);
        return {{std::string("late"), std::string("retrieve")}};
    }
private:
    std::chrono::milliseconds delay_;
};

// Returns a fixed answer and records every (subquery, context) it receives.
class StubHandler : public ICapabilityHandler {
public:
    explicit StubHandler(std::string reply) : reply_(std::move(reply)) {}

    std::string answer(const std::string& subquery, const std::string& context, const CancellationToken&) override {
        std::lock_guard<std::mutex> lock(mtx_);
        subqueries_.push_back(subquery);
        contexts_.push_back(context);
        return reply_;
    }

    std::vector<std::string> subqueries() {
        std::lock_guard<std::mutex> lock(mtx_);
        return subqueries_;
    }

    std::vector<std::string> contexts() {
        std::lock_guard<std::mutex> lock(mtx_);
        return contexts_;
    }

    size_t calls() {
        std::lock_guard<std::mutex> lock(mtx_);
        return contexts_.size();
    }

private:
    std::string reply_;
    std::mutex mtx_;
    std::vector<std::string> subqueries_;
    std::vector<std::string> contexts_;
};

class FailingHandler : public ICapabilityHandler {
public:
    std::string answer(const std::string&, const std::string&, const CancellationToken&) override {
        throw std::runtime_error("data source unreachable");
    }
};

// Throws something that is not a std::exception.
class IntThrowingHandler : public ICapabilityHandler {
public:
    std::string answer(const std::string&, const std::string&, const CancellationToken&) override {
        throw 42;
    }
};

class IntThrowingPlanner : public IPlanner {
public:
    RawPlan plan(const std::string&, const std::string&) override {
        throw 42;
    }
};

// Sleeps past the deadline, then reports whether it was told to stop.
class StopObservingHandler : public ICapabilityHandler {
public:
    explicit StopObservingHandler(std::chrono::milliseconds delay) : delay_(delay) {}

    std::string answer(const std::string&, const std::string&, const CancellationToken& stop) override {
        std::this_thread::sleep_for(delay_);
        observed_stop_.store(stop.is_cancelled());
        finished_.store(true);
        return "too late";
    }

    bool finished() const { return finished_.load(); }
    bool observed_stop() const { return observed_stop_.load(); }

private:
    std::chrono::milliseconds delay_;
    std::atomic<bool> finished_{false};
    std::atomic<bool> observed_stop_{false};
};

class SlowHandler : public ICapabilityHandler {
public:
    explicit SlowHandler(std::chrono::milliseconds delay) : delay_(delay) {}
    std::string answer(const std::string&, const std::string&, const CancellationToken&) override {
        std::this_thread::sleep_for(delay_);
        return "too late";
    }
private:
    std::chrono::milliseconds delay_;
};

// Cancels the given token while answering, so later steps must not run.
template <typename Token>
class CancellingHandler : public ICapabilityHandler {
public:
    CancellingHandler(Token token, std::string reply) : token_(token), reply_(std::move(reply)) {}
    std::string answer(const std::string&, const std::string&, const CancellationToken&) override {
        token_.cancel();
        return reply_;
    }
private:
    Token token_;
    std::string reply_;
};

class RecordingEventSink : public IEventSink {
public:
    void emit(const OrchestrationEvent& event) override {
        std::lock_guard<std::mutex> lock(mtx_);
        events_.push_back(event);
    }

    size_t count(EventKind kind) {
        std::lock_guard<std::mutex> lock(mtx_);
        size_t n = 0;
        for (const auto& e : events_) {
            if (e.kind == kind) n++;
        }
        return n;
    }

    std::vector<OrchestrationEvent> events() {
        std::lock_guard<std::mutex> lock(mtx_);
        return events_;
    }

private:
    std::mutex mtx_;
    std::vector<OrchestrationEvent> events_;
};

// Replays canned replies in order and records every prompt.
class ScriptedGenerator : public ITextGenerator {
public:
    explicit ScriptedGenerator(std::vector<std::string> replies) : replies_(replies.begin(), replies.end()) {}

    std::string generate_text(const std::string& prompt) override {
        prompts.push_back(prompt);
        if (replies_.empty()) return "";
        std::string next = replies_.front();
        replies_.pop_front();
        return next;
    }

    std::vector<std::string> prompts;

private:
    std::deque<std::string> replies_;
};

class UnreachableGenerator : public ITextGenerator {
public:
    std::string generate_text(const std::string&) override {
        throw std::runtime_error("LLM backend unavailable");
    }
};

} // namespace scout::test
