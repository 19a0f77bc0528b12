#include "tools/WorkspaceTools.hpp"
#include "TextUtils.hpp"
#include <functional>
#include <stdexcept>
#include <vector>
#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>

namespace scout {

using json = nlohmann::json;

namespace {

bool contains_ci(const std::string& haystack, const std::string& needle_lower) {
    return to_lower(haystack).find(needle_lower) != std::string::npos;
}

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += sep;
        out += parts[i];
    }
    return out;
}

std::string join_lines(const std::vector<std::string>& lines) {
    return join(lines, "\n");
}

std::string trend_of(const MetricSnapshot& m) {
    return fmt::format("{} ({:+.1f}%)", m.trend, m.change_pct);
}

// Wraps a string-argument tool so bad JSON becomes an "ERROR:" observation.
std::function<std::string(const std::string&)> with_args(std::vector<std::string> keys,
                                                         std::function<std::string(const std::vector<std::string>&)> fn) {
    return [keys = std::move(keys), fn = std::move(fn)](const std::string& args_json) -> std::string {
        json j;
        try {
            j = json::parse(args_json);
        } catch (const json::parse_error&) {
            return "ERROR: Invalid JSON arguments.";
        }
        if (!j.is_object()) return "ERROR: Arguments must be a JSON object.";

        std::vector<std::string> values;
        for (const auto& key : keys) {
            auto it = j.find(key);
            if (it == j.end() || !it->is_string()) return "ERROR: Missing string parameter '" + key + "'.";
            values.push_back(it->get<std::string>());
        }
        return fn(values);
    };
}

} // namespace

WorkspaceTools::WorkspaceTools(std::shared_ptr<const WorkspaceData> data) : data_(std::move(data)) {
    if (!data_) throw std::invalid_argument("WorkspaceTools: null dataset");
}

std::string WorkspaceTools::search_jira(const std::string& query) const {
    std::string q = to_lower(query);
    std::vector<std::string> results;

    for (const auto& t : data_->tickets()) {
        if (contains_ci(t.title, q) || contains_ci(t.description, q) || contains_ci(t.priority, q) ||
            contains_ci(t.status, q) || contains_ci(t.assignee, q)) {
            results.push_back(fmt::format("{}: {} (Status: {}, Priority: {}, Assignee: {})",
                                          t.id, t.title, t.status, t.priority, t.assignee));
        }
    }

    if (results.empty()) return "No Jira tickets found matching '" + query + "'";
    return fmt::format("Found {} ticket(s):\n", results.size()) + join_lines(results);
}

std::string WorkspaceTools::search_confluence(const std::string& query) const {
    std::string q = to_lower(query);
    std::vector<std::string> results;

    for (const auto& d : data_->docs()) {
        if (contains_ci(d.title, q) || contains_ci(d.content, q)) {
            results.push_back(fmt::format("• {} (Key: {}, Updated: {})", d.title, d.key, d.updated));
        }
    }

    if (results.empty()) return "No Confluence docs found matching '" + query + "'";
    return fmt::format("Found {} document(s):\n", results.size()) + join_lines(results);
}

std::string WorkspaceTools::get_ticket_details(const std::string& ticket_id) const {
    const JiraTicket* t = data_->find_ticket(to_upper(ticket_id));
    if (!t) return "Ticket " + ticket_id + " not found";

    return fmt::format("Ticket {}: {}\nStatus: {}\nAssignee: {}\nPriority: {}\nCreated: {}\nUpdated: {}\n\n"
                       "Description:\n{}",
                       ticket_id, t->title, t->status, t->assignee, t->priority, t->created, t->updated,
                       t->description);
}

std::string WorkspaceTools::get_confluence_doc(const std::string& doc_key) const {
    const ConfluenceDoc* d = data_->find_doc(doc_key);
    if (!d) {
        std::vector<std::string> keys;
        for (const auto& doc : data_->docs()) keys.push_back(doc.key);
        return "Document '" + doc_key + "' not found. Available keys: " + join(keys, ", ");
    }
    return fmt::format("{}\nLast updated: {}\n\nContent:\n{}", d->title, d->updated, d->content);
}

std::string WorkspaceTools::get_metric(const std::string& metric_name) const {
    const MetricSnapshot* m = data_->find_metric(metric_name);
    if (!m) {
        std::vector<std::string> names;
        for (const auto& metric : data_->metrics()) names.push_back(metric.name);
        return "Metric '" + metric_name + "' not found. Available: " + join(names, ", ");
    }
    return fmt::format("{}:\nCurrent: {}\nPrevious: {}\nTrend: {}\nPeriod: {}",
                       m->name, m->current, m->previous, trend_of(*m), m->period);
}

std::string WorkspaceTools::compare_metrics(const std::string& metric_a, const std::string& metric_b) const {
    const MetricSnapshot* a = data_->find_metric(metric_a);
    const MetricSnapshot* b = data_->find_metric(metric_b);
    if (!a || !b) return "One or both metrics not found: " + metric_a + ", " + metric_b;

    return fmt::format("Comparison:\n{}: {} ({} {:+.1f}%)\n{}: {} ({} {:+.1f}%)",
                       metric_a, a->current, a->trend, a->change_pct,
                       metric_b, b->current, b->trend, b->change_pct);
}

std::string WorkspaceTools::list_available_metrics() const {
    std::vector<std::string> lines;
    for (const auto& m : data_->metrics()) {
        lines.push_back(fmt::format("• {}: {} ({} {:+.1f}%)", m.name, m.current, m.trend, m.change_pct));
    }
    return "Available metrics:\n" + join_lines(lines);
}

// --- REGISTRATION ---

void WorkspaceTools::register_search_tools(ToolRegistry& registry) const {
    auto self = *this;
    registry.register_tool(std::make_unique<GenericTool>(
        "search_jira", "Search Jira tickets by keyword (title, description, priority, status, assignee).",
        R"({"type":"object","properties":{"query":{"type":"string"}},"required":["query"]})",
        with_args({"query"}, [self](const std::vector<std::string>& a) { return self.search_jira(a[0]); })));
    registry.register_tool(std::make_unique<GenericTool>(
        "search_confluence", "Search Confluence documentation by keyword.",
        R"({"type":"object","properties":{"query":{"type":"string"}},"required":["query"]})",
        with_args({"query"}, [self](const std::vector<std::string>& a) { return self.search_confluence(a[0]); })));
}

void WorkspaceTools::register_retrieve_tools(ToolRegistry& registry) const {
    auto self = *this;
    registry.register_tool(std::make_unique<GenericTool>(
        "get_ticket_details", "Get full details for a specific Jira ticket by id (e.g. SHOP-2847).",
        R"({"type":"object","properties":{"ticket_id":{"type":"string"}},"required":["ticket_id"]})",
        with_args({"ticket_id"}, [self](const std::vector<std::string>& a) { return self.get_ticket_details(a[0]); })));
    registry.register_tool(std::make_unique<GenericTool>(
        "get_confluence_doc", "Get the full content of a Confluence document by key (e.g. checkout-rewrite).",
        R"({"type":"object","properties":{"doc_key":{"type":"string"}},"required":["doc_key"]})",
        with_args({"doc_key"}, [self](const std::vector<std::string>& a) { return self.get_confluence_doc(a[0]); })));
}

void WorkspaceTools::register_analyze_tools(ToolRegistry& registry) const {
    auto self = *this;
    registry.register_tool(std::make_unique<GenericTool>(
        "get_metric", "Get current value and trend for a specific metric.",
        R"({"type":"object","properties":{"metric_name":{"type":"string"}},"required":["metric_name"]})",
        with_args({"metric_name"}, [self](const std::vector<std::string>& a) { return self.get_metric(a[0]); })));
    registry.register_tool(std::make_unique<GenericTool>(
        "compare_metrics", "Compare two metrics side by side.",
        R"({"type":"object","properties":{"metric_a":{"type":"string"},"metric_b":{"type":"string"}},"required":["metric_a","metric_b"]})",
        with_args({"metric_a", "metric_b"},
                  [self](const std::vector<std::string>& a) { return self.compare_metrics(a[0], a[1]); })));
    registry.register_tool(std::make_unique<GenericTool>(
        "list_available_metrics", "List all available metrics with their current value and trend.",
        R"({"type":"object","properties":{}})",
        with_args({}, [self](const std::vector<std::string>&) { return self.list_available_metrics(); })));
}

} // namespace scout
