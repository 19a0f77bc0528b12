#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "tools/WorkspaceTools.hpp"

namespace scout {
namespace {

class WorkspaceToolsTest : public ::testing::Test {
protected:
    WorkspaceTools tools_{WorkspaceData::mock()};
};

TEST_F(WorkspaceToolsTest, SearchJiraMatchesPriorityCaseInsensitively) {
    EXPECT_EQ(tools_.search_jira("p0"),
              "Found 1 ticket(s):\n"
              "SHOP-2847: Safari checkout crashes on iOS 17 (Status: In Review, Priority: P0, Assignee: Alice Chen)");
}

TEST_F(WorkspaceToolsTest, SearchJiraKeepsDatasetOrder) {
    auto out = tools_.search_jira("P1");
    EXPECT_EQ(out.rfind("Found 2 ticket(s):\n", 0), 0u);
    EXPECT_LT(out.find("SHOP-2901"), out.find("SHOP-3001"));
}

TEST_F(WorkspaceToolsTest, SearchWithoutMatchesIsADescriptiveAnswer) {
    EXPECT_EQ(tools_.search_jira("kubernetes"), "No Jira tickets found matching 'kubernetes'");
    EXPECT_EQ(tools_.search_confluence("kubernetes"), "No Confluence docs found matching 'kubernetes'");
}

TEST_F(WorkspaceToolsTest, SearchConfluenceMatchesTitleAndContent) {
    EXPECT_EQ(tools_.search_confluence("safari"),
              "Found 2 document(s):\n"
              "• Checkout Rewrite Q2 2025 (Key: checkout-rewrite, Updated: 2025-01-15)\n"
              "• Mobile Optimization Strategy 2025 (Key: mobile-strategy, Updated: 2025-01-10)");
}

TEST_F(WorkspaceToolsTest, TicketDetailsLookupIsCaseInsensitive) {
    EXPECT_EQ(tools_.get_ticket_details("shop-3001"),
              "Ticket shop-3001: Mobile web performance degradation\n"
              "Status: In Progress\n"
              "Assignee: Carol Wang\n"
              "Priority: P1\n"
              "Created: 2025-01-14\n"
              "Updated: 2025-01-18\n"
              "\n"
              "Description:\n"
              "Mobile page load times increased 20% after new analytics integration.");
    EXPECT_EQ(tools_.get_ticket_details("SHOP-9999"), "Ticket SHOP-9999 not found");
}

TEST_F(WorkspaceToolsTest, UnknownDocListsAvailableKeys) {
    EXPECT_EQ(tools_.get_confluence_doc("roadmap"),
              "Document 'roadmap' not found. Available keys: checkout-rewrite, mobile-strategy, payment-architecture");
    EXPECT_EQ(tools_.get_confluence_doc("payment-architecture").rfind("Payment Flow Architecture\nLast updated: 2025-01-12", 0),
              0u);
}

TEST_F(WorkspaceToolsTest, MetricsRenderTrendWithSignedChange) {
    EXPECT_EQ(tools_.get_metric("mobile_conversions"),
              "mobile_conversions:\n"
              "Current: 3.2\n"
              "Previous: 3.5\n"
              "Trend: down (-8.6%)\n"
              "Period: week-over-week");
    EXPECT_EQ(tools_.get_metric("desktop_conversions"),
              "Metric 'desktop_conversions' not found. Available: mobile_conversions, checkout_completion, "
              "safari_users, payment_success_rate");
}

TEST_F(WorkspaceToolsTest, CompareAndListMetrics) {
    EXPECT_EQ(tools_.compare_metrics("mobile_conversions", "safari_users"),
              "Comparison:\n"
              "mobile_conversions: 3.2 (down -8.6%)\n"
              "safari_users: 24.3 (down -3.2%)");
    EXPECT_EQ(tools_.compare_metrics("mobile_conversions", "nope"),
              "One or both metrics not found: mobile_conversions, nope");

    auto listing = tools_.list_available_metrics();
    EXPECT_EQ(listing.rfind("Available metrics:\n• mobile_conversions: 3.2 (down -8.6%)", 0), 0u);
    EXPECT_NE(listing.find("• payment_success_rate: 96.2 (down -1.6%)"), std::string::npos);
}

TEST_F(WorkspaceToolsTest, RegistriesExposeDisjointToolSets) {
    ToolRegistry search, retrieve, analyze;
    tools_.register_search_tools(search);
    tools_.register_retrieve_tools(retrieve);
    tools_.register_analyze_tools(analyze);

    EXPECT_EQ(search.size(), 2u);
    EXPECT_EQ(retrieve.size(), 2u);
    EXPECT_EQ(analyze.size(), 3u);
    EXPECT_TRUE(search.has("search_jira"));
    EXPECT_FALSE(search.has("get_metric"));
    EXPECT_TRUE(analyze.has("list_available_metrics"));

    EXPECT_EQ(retrieve.dispatch("get_ticket_details", {{"ticket_id", "SHOP-2901"}}).rfind("Ticket SHOP-2901: Payment gateway timeout", 0),
              0u);
    EXPECT_EQ(retrieve.dispatch("get_metric", {{"metric_name", "safari_users"}}), "ERROR: Tool 'get_metric' not found.");
    EXPECT_EQ(retrieve.dispatch("get_ticket_details", nlohmann::json::object()),
              "ERROR: Missing string parameter 'ticket_id'.");
    EXPECT_EQ(analyze.dispatch("list_available_metrics", nlohmann::json::object()), tools_.list_available_metrics());
}

TEST(WorkspaceDataTest, LoadsDatasetFromJson) {
    auto data = WorkspaceData::from_json(nlohmann::json::parse(R"({
        "tickets": [{"id": "OPS-1", "title": "Disk full", "priority": "P0", "status": "Open", "assignee": "Eve"}],
        "metrics": [{"name": "error_rate", "current": 1.5, "previous": 0.5, "trend": "up", "change_pct": 200.0,
                     "period": "day-over-day"}]
    })"));

    EXPECT_EQ(data->tickets().size(), 1u);
    EXPECT_TRUE(data->docs().empty());
    WorkspaceTools tools(data);
    EXPECT_EQ(tools.search_jira("disk"), "Found 1 ticket(s):\nOPS-1: Disk full (Status: Open, Priority: P0, Assignee: Eve)");
    EXPECT_EQ(tools.get_metric("error_rate"),
              "error_rate:\nCurrent: 1.5\nPrevious: 0.5\nTrend: up (+200.0%)\nPeriod: day-over-day");
}

TEST(WorkspaceDataTest, UnreadableDatasetIsAStartupError) {
    EXPECT_THROW(WorkspaceData::load("/nonexistent/scout-dataset.json"), std::runtime_error);
}

} // namespace
} // namespace scout
