#pragma once
#include <memory>
#include <string>
#include "tools/ToolRegistry.hpp"
#include "tools/WorkspaceData.hpp"

namespace scout {

/**
 * Lookup tools over the workspace datasets. Absence is always reported as
 * a descriptive string, never thrown.
 */
class WorkspaceTools {
public:
    explicit WorkspaceTools(std::shared_ptr<const WorkspaceData> data);

    // --- search ---
    std::string search_jira(const std::string& query) const;
    std::string search_confluence(const std::string& query) const;

    // --- retrieve ---
    std::string get_ticket_details(const std::string& ticket_id) const;
    std::string get_confluence_doc(const std::string& doc_key) const;

    // --- analyze ---
    std::string get_metric(const std::string& metric_name) const;
    std::string compare_metrics(const std::string& metric_a, const std::string& metric_b) const;
    std::string list_available_metrics() const;

    // JSON-argument wrappers for the reasoning loop of each capability.
    void register_search_tools(ToolRegistry& registry) const;
    void register_retrieve_tools(ToolRegistry& registry) const;
    void register_analyze_tools(ToolRegistry& registry) const;

private:
    std::shared_ptr<const WorkspaceData> data_;
};

} // namespace scout
