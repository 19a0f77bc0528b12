#include "agent/CapabilityCatalog.hpp"
#include "agent/ReactCapabilityHandler.hpp"
#include "tools/WorkspaceTools.hpp"
#include <spdlog/spdlog.h>

namespace scout {

const std::string& default_capability_descriptions() {
    static const std::string descriptions =
        "Available intents:\n"
        "- search: Use when you need to FIND tickets or docs using keywords (e.g., \"find Safari issues\", "
        "\"search for checkout docs\")\n"
        "- retrieve: Use when you have specific IDs and need DETAILS (e.g., \"get ticket SHOP-2847\", "
        "\"get doc checkout-rewrite\")\n"
        "- analyze: Use when you need to examine METRICS or TRENDS (e.g., \"how are conversions trending?\", "
        "\"compare mobile vs desktop\")\n"
        "\n"
        "Examples:\n"
        "- \"What tickets are about Safari?\" -> search\n"
        "- \"Get details for SHOP-2847\" -> retrieve\n"
        "- \"Are mobile conversions down?\" -> analyze\n"
        "- \"Find checkout issues and check if conversions dropped\" -> search (find issues), analyze (check metrics)";
    return descriptions;
}

std::shared_ptr<CapabilityRegistry> build_workspace_registry(const ScoutConfig& config,
                                                             std::shared_ptr<ITextGenerator> llm,
                                                             std::shared_ptr<const WorkspaceData> data) {
    WorkspaceTools tools(std::move(data));

    auto search_tools = std::make_shared<ToolRegistry>();
    tools.register_search_tools(*search_tools);
    auto retrieve_tools = std::make_shared<ToolRegistry>();
    tools.register_retrieve_tools(*retrieve_tools);
    auto analyze_tools = std::make_shared<ToolRegistry>();
    tools.register_analyze_tools(*analyze_tools);

    auto registry = std::make_shared<CapabilityRegistry>(config.default_intent);

    registry->register_handler("search",
        std::make_shared<ReactCapabilityHandler>(
            CapabilityProfile{"search",
                              "Search for relevant information in Jira tickets and Confluence docs. "
                              "Answer with a summary of the search results.",
                              config.max_iters_for("search", 4)},
            llm, search_tools),
        "Find tickets or docs using keywords");

    registry->register_handler("retrieve",
        std::make_shared<ReactCapabilityHandler>(
            CapabilityProfile{"retrieve",
                              "Retrieve detailed information for specific tickets or documents by id. "
                              "Answer with the details of the retrieved items.",
                              config.max_iters_for("retrieve", 3)},
            llm, retrieve_tools),
        "Get specific items by ID (ticket numbers, doc keys)");

    registry->register_handler("analyze",
        std::make_shared<ReactCapabilityHandler>(
            CapabilityProfile{"analyze",
                              "Analyze metrics, trends, and data patterns. "
                              "Answer with an analysis of trends and insights.",
                              config.max_iters_for("analyze", 4)},
            llm, analyze_tools),
        "Analyze metrics, trends, or compare data");

    return registry;
}

std::shared_ptr<Orchestrator> build_orchestrator(const ScoutConfig& config, std::shared_ptr<ITextGenerator> llm) {
    auto data = config.dataset_path.empty() ? WorkspaceData::mock() : WorkspaceData::load(config.dataset_path);
    auto registry = build_workspace_registry(config, llm, data);

    OrchestratorOptions options;
    options.planner_timeout = config.planner_timeout;
    options.handler_timeout = config.handler_timeout;
    options.capability_descriptions = default_capability_descriptions();

    spdlog::info("✓ Orchestrator initialized: {} capabilities, default '{}'", registry->size(), registry->default_intent());
    return std::make_shared<Orchestrator>(std::make_shared<LlmPlanner>(llm), registry, options,
                                          std::make_shared<SpdlogEventSink>());
}

} // namespace scout
