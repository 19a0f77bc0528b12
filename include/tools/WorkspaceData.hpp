#pragma once
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace scout {

struct JiraTicket {
    std::string id;
    std::string title;
    std::string status;
    std::string assignee;
    std::string priority;
    std::string description;
    std::string created;
    std::string updated;
};

struct ConfluenceDoc {
    std::string key;
    std::string title;
    std::string content;
    std::string updated;
};

struct MetricSnapshot {
    std::string name;
    double current = 0.0;
    double previous = 0.0;
    std::string trend;
    double change_pct = 0.0;
    std::string period;
};

// Static datasets behind the lookup tools. Record order is insertion order.
class WorkspaceData {
public:
    WorkspaceData(std::vector<JiraTicket> tickets, std::vector<ConfluenceDoc> docs, std::vector<MetricSnapshot> metrics);

    // Built-in Jira/Confluence/analytics sample data.
    static std::shared_ptr<const WorkspaceData> mock();
    // Throws std::runtime_error when the file cannot be read or parsed.
    static std::shared_ptr<const WorkspaceData> load(const std::string& path);
    static std::shared_ptr<const WorkspaceData> from_json(const nlohmann::json& j);

    const std::vector<JiraTicket>& tickets() const { return tickets_; }
    const std::vector<ConfluenceDoc>& docs() const { return docs_; }
    const std::vector<MetricSnapshot>& metrics() const { return metrics_; }

    const JiraTicket* find_ticket(const std::string& id) const;
    const ConfluenceDoc* find_doc(const std::string& key) const;
    const MetricSnapshot* find_metric(const std::string& name) const;

private:
    std::vector<JiraTicket> tickets_;
    std::vector<ConfluenceDoc> docs_;
    std::vector<MetricSnapshot> metrics_;
};

} // namespace scout
