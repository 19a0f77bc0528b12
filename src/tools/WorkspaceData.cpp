#include "tools/WorkspaceData.hpp"
#include <fstream>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace scout {

using json = nlohmann::json;

void from_json(const json& j, JiraTicket& t) {
    j.at("id").get_to(t.id);
    j.at("title").get_to(t.title);
    t.status = j.value("status", "");
    t.assignee = j.value("assignee", "");
    t.priority = j.value("priority", "");
    t.description = j.value("description", "");
    t.created = j.value("created", "");
    t.updated = j.value("updated", "");
}

void from_json(const json& j, ConfluenceDoc& d) {
    j.at("key").get_to(d.key);
    j.at("title").get_to(d.title);
    d.content = j.value("content", "");
    d.updated = j.value("updated", "");
}

void from_json(const json& j, MetricSnapshot& m) {
    j.at("name").get_to(m.name);
    j.at("current").get_to(m.current);
    j.at("previous").get_to(m.previous);
    m.trend = j.value("trend", "");
    m.change_pct = j.value("change_pct", 0.0);
    m.period = j.value("period", "");
}

WorkspaceData::WorkspaceData(std::vector<JiraTicket> tickets, std::vector<ConfluenceDoc> docs,
                             std::vector<MetricSnapshot> metrics)
    : tickets_(std::move(tickets)), docs_(std::move(docs)), metrics_(std::move(metrics)) {}

std::shared_ptr<const WorkspaceData> WorkspaceData::mock() {
    static const auto data = std::make_shared<const WorkspaceData>(
        std::vector<JiraTicket>{
            {"SHOP-2847", "Safari checkout crashes on iOS 17", "In Review", "Alice Chen", "P0",
             "Users on Safari 17/iOS report checkout crashes at payment step. Hotfix deployed yesterday, monitoring for recovery.",
             "2025-01-15", "2025-01-18"},
            {"SHOP-2901", "Payment gateway timeout", "Open", "Bob Smith", "P1",
             "Stripe webhook timeouts causing order confirmation delays.",
             "2025-01-16", "2025-01-17"},
            {"SHOP-3001", "Mobile web performance degradation", "In Progress", "Carol Wang", "P1",
             "Mobile page load times increased 20% after new analytics integration.",
             "2025-01-14", "2025-01-18"},
            {"SHOP-2955", "Address validation API errors", "Open", "David Lee", "P2",
             "Third-party address validation service returning 500 errors for Canadian addresses.",
             "2025-01-17", "2025-01-17"},
        },
        std::vector<ConfluenceDoc>{
            {"checkout-rewrite", "Checkout Rewrite Q2 2025",
             "Project is 75% complete and on track for Q2 delivery. Main focus areas: Safari compatibility, payment flow optimization, mobile UX improvements.",
             "2025-01-15"},
            {"mobile-strategy", "Mobile Optimization Strategy 2025",
             "Mobile conversion funnel analysis shows Safari-specific issues affecting iOS users. Target: improve mobile conversion rate by 15% through performance and UX enhancements.",
             "2025-01-10"},
            {"payment-architecture", "Payment Flow Architecture",
             "Current payment architecture uses Stripe webhooks for order confirmation. Known issues: webhook timeouts during peak traffic, retry logic needs improvement.",
             "2025-01-12"},
        },
        std::vector<MetricSnapshot>{
            {"mobile_conversions", 3.2, 3.5, "down", -8.6, "week-over-week"},
            {"checkout_completion", 78.5, 82.1, "down", -4.4, "week-over-week"},
            {"safari_users", 24.3, 25.1, "down", -3.2, "week-over-week"},
            {"payment_success_rate", 96.2, 97.8, "down", -1.6, "week-over-week"},
        });
    return data;
}

std::shared_ptr<const WorkspaceData> WorkspaceData::from_json(const json& j) {
    return std::make_shared<const WorkspaceData>(
        j.value("tickets", json::array()).get<std::vector<JiraTicket>>(),
        j.value("docs", json::array()).get<std::vector<ConfluenceDoc>>(),
        j.value("metrics", json::array()).get<std::vector<MetricSnapshot>>());
}

std::shared_ptr<const WorkspaceData> WorkspaceData::load(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        throw std::runtime_error("Workspace dataset not readable: " + path);
    }
    try {
        auto data = from_json(json::parse(f));
        spdlog::info("📂 Workspace dataset loaded from {}: {} tickets, {} docs, {} metrics",
                     path, data->tickets().size(), data->docs().size(), data->metrics().size());
        return data;
    } catch (const json::exception& e) {
        throw std::runtime_error("Workspace dataset corrupted at " + path + ": " + e.what());
    }
}

const JiraTicket* WorkspaceData::find_ticket(const std::string& id) const {
    for (const auto& t : tickets_) {
        if (t.id == id) return &t;
    }
    return nullptr;
}

const ConfluenceDoc* WorkspaceData::find_doc(const std::string& key) const {
    for (const auto& d : docs_) {
        if (d.key == key) return &d;
    }
    return nullptr;
}

const MetricSnapshot* WorkspaceData::find_metric(const std::string& name) const {
    for (const auto& m : metrics_) {
        if (m.name == name) return &m;
    }
    return nullptr;
}

} // namespace scout
