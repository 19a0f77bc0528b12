#pragma once
#include <memory>
#include <string>
#include "ScoutConfig.hpp"
#include "agent/CapabilityRegistry.hpp"
#include "agent/Orchestrator.hpp"
#include "tools/WorkspaceData.hpp"

namespace scout {

class ITextGenerator;

// Intent guide with example phrasings, handed verbatim to the planner.
const std::string& default_capability_descriptions();

// search / retrieve / analyze, each a ReAct handler over its own tools.
std::shared_ptr<CapabilityRegistry> build_workspace_registry(const ScoutConfig& config,
                                                             std::shared_ptr<ITextGenerator> llm,
                                                             std::shared_ptr<const WorkspaceData> data);

// Full wiring used by the front ends: dataset, registry, LLM planner, spdlog sink.
std::shared_ptr<Orchestrator> build_orchestrator(const ScoutConfig& config, std::shared_ptr<ITextGenerator> llm);

} // namespace scout
