#include "agent/Orchestrator.hpp"
#include "agent/ContextManager.hpp"
#include "agent/PlanValidator.hpp"
#include "agent/Synthesizer.hpp"
#include "TextUtils.hpp"
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace scout {

namespace {

double elapsed_ms(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
}

} // namespace

// --- 1. CONSTRUCTOR ---

Orchestrator::Orchestrator(std::shared_ptr<IPlanner> planner,
                           std::shared_ptr<const CapabilityRegistry> registry,
                           OrchestratorOptions options,
                           std::shared_ptr<IEventSink> sink)
    : planner_(std::move(planner)), registry_(std::move(registry)), options_(std::move(options)), sink_(std::move(sink)) {
    if (!planner_) throw std::invalid_argument("Orchestrator: null planner");
    if (!registry_ || registry_->empty()) throw std::invalid_argument("Orchestrator: registry has no capabilities");
    if (!registry_->has(registry_->default_intent())) {
        throw std::invalid_argument("Orchestrator: default intent '" + registry_->default_intent() + "' is not registered");
    }
    if (options_.capability_descriptions.empty()) {
        options_.capability_descriptions = "Available intents:\n" + registry_->describe();
    }
}

// --- 2. HELPERS ---

void Orchestrator::notify(EventKind kind, std::string message, std::optional<size_t> index, std::string intent) const {
    if (sink_) sink_->emit({kind, std::move(message), index, std::move(intent)});
}

RawPlan Orchestrator::request_plan(const std::string& question, bool& degraded) const {
    auto planner = planner_;
    auto descriptions = options_.capability_descriptions;
    try {
        RawPlan raw = call_with_timeout(
            [planner, question, descriptions]() { return planner->plan(question, descriptions); },
            options_.planner_timeout, "Planner");
        notify(EventKind::PlanReceived, "Planner returned " + std::to_string(raw.size()) + " step(s)");
        return raw;
    } catch (const InvariantViolation&) {
        throw;
    } catch (const std::exception& e) {
        degraded = true;
        notify(EventKind::PlannerFailed, std::string("Planner failed: ") + e.what());
        return {};
    } catch (...) {
        degraded = true;
        notify(EventKind::PlannerFailed, "Planner failed: unknown error");
        return {};
    }
}

StepResult Orchestrator::degraded_step(size_t index, const PlanStep& step, const std::string& reason,
                                       std::chrono::steady_clock::time_point start) const {
    std::string notice = "Step " + std::to_string(index) + " (" + step.intent() + ") could not be completed: " + reason;
    notify(EventKind::StepDegraded, notice, index, step.intent());
    return StepResult{index, step, notice, true, elapsed_ms(start)};
}

StepResult Orchestrator::execute_step(size_t index, const PlanStep& step, const std::string& context) const {
    // Registry miss here means validation is broken; let it propagate.
    auto handler = registry_->resolve(step.intent());

    notify(EventKind::StepStarted, step.describe(), index, step.intent());
    auto start = std::chrono::steady_clock::now();

    std::string subquery = step.subquery();
    CancellationToken abandoned;
    try {
        std::string answer = call_with_timeout(
            [handler, subquery, context, abandoned]() { return handler->answer(subquery, context, abandoned); },
            options_.handler_timeout, "Handler '" + step.intent() + "'", abandoned);
        StepResult result{index, step, std::move(answer), false, elapsed_ms(start)};
        notify(EventKind::StepCompleted, step.describe() + " (" + std::to_string(result.answer.size()) + " bytes)",
               index, step.intent());
        return result;
    } catch (const InvariantViolation&) {
        throw;
    } catch (const std::exception& e) {
        return degraded_step(index, step, e.what(), start);
    } catch (...) {
        return degraded_step(index, step, "unknown error", start);
    }
}

// --- 3. THE KERNEL LOOP ---

OrchestrationResult Orchestrator::run(const std::string& question, const CancellationToken& cancel) const {
    if (trim(question).empty()) {
        throw std::invalid_argument("Orchestrator: question must not be blank");
    }

    auto start = std::chrono::steady_clock::now();
    OrchestrationResult out;

    if (cancel.is_cancelled()) {
        notify(EventKind::Cancelled, "Cancelled before planning");
        out.status = RunStatus::Cancelled;
        out.answer = "Orchestration cancelled before any step completed.";
        out.duration_ms = elapsed_ms(start);
        return out;
    }

    RawPlan raw = request_plan(question, out.planner_degraded);
    out.plan = PlanValidator::validate(raw, *registry_, registry_->default_intent(), question, sink_.get());

    try {
        ContextManager context;
        for (size_t i = 0; i < out.plan.size(); ++i) {
            if (cancel.is_cancelled()) {
                notify(EventKind::Cancelled, "Stopped after " + std::to_string(out.results.size()) + " of " +
                                             std::to_string(out.plan.size()) + " step(s)", i);
                out.status = RunStatus::Cancelled;
                break;
            }

            StepResult result = execute_step(i, out.plan[i], context.snapshot());
            context.append(result);
            out.results.push_back(std::move(result));
        }

        if (out.status == RunStatus::Cancelled && out.results.empty()) {
            out.answer = "Orchestration cancelled before any step completed.";
        } else {
            out.answer = Synthesizer::synthesize(out.results);
            notify(EventKind::Synthesized, "Synthesized " + std::to_string(out.results.size()) + " step result(s)");
        }
    } catch (const InvariantViolation& e) {
        spdlog::critical("💥 Orchestration invariant violated: {}", e.what());
        throw;
    }

    out.duration_ms = elapsed_ms(start);
    return out;
}

} // namespace scout
