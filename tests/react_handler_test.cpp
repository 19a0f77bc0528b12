#include <gtest/gtest.h>
#include <memory>

#include "TestStubs.hpp"
#include "agent/ReactCapabilityHandler.hpp"
#include "tools/WorkspaceTools.hpp"

namespace scout {
namespace {

std::shared_ptr<ToolRegistry> retrieve_tools() {
    auto registry = std::make_shared<ToolRegistry>();
    WorkspaceTools(WorkspaceData::mock()).register_retrieve_tools(*registry);
    return registry;
}

ReactCapabilityHandler make_handler(std::shared_ptr<test::ScriptedGenerator> llm, int max_iters = 3) {
    return ReactCapabilityHandler(CapabilityProfile{"retrieve", "Retrieve details by id.", max_iters}, llm,
                                  retrieve_tools());
}

TEST(ReactCapabilityHandlerTest, ToolCallThenFinalAnswer) {
    auto llm = std::make_shared<test::ScriptedGenerator>(std::vector<std::string>{
        "```json\n{\"tool\": \"get_ticket_details\", \"parameters\": {\"ticket_id\": \"SHOP-2847\"}}\n```",
        "Thought: I have it.\nFINAL_ANSWER: SHOP-2847 is In Review, assigned to Alice Chen."});
    auto handler = make_handler(llm);

    auto answer = handler.answer("Get details for ticket SHOP-2847", "", CancellationToken());

    EXPECT_EQ(answer, "SHOP-2847 is In Review, assigned to Alice Chen.");
    ASSERT_EQ(llm->prompts.size(), 2u);
    EXPECT_NE(llm->prompts[0].find("No previous context"), std::string::npos);
    EXPECT_NE(llm->prompts[0].find("get_confluence_doc"), std::string::npos);
    EXPECT_NE(llm->prompts[1].find("Safari checkout crashes on iOS 17"), std::string::npos);
}

TEST(ReactCapabilityHandlerTest, ContextFromPreviousStepsReachesThePrompt) {
    auto llm = std::make_shared<test::ScriptedGenerator>(std::vector<std::string>{"FINAL_ANSWER: done"});
    auto handler = make_handler(llm);

    handler.answer("Get the most critical ticket", "\nStep 0 (search): SHOP-2847 is P0\n", CancellationToken());

    ASSERT_EQ(llm->prompts.size(), 1u);
    EXPECT_NE(llm->prompts[0].find("Step 0 (search): SHOP-2847 is P0"), std::string::npos);
    EXPECT_EQ(llm->prompts[0].find("No previous context"), std::string::npos);
}

TEST(ReactCapabilityHandlerTest, FinalAnswerToolCallIsAccepted) {
    auto llm = std::make_shared<test::ScriptedGenerator>(std::vector<std::string>{
        R"({"tool": "FINAL_ANSWER", "parameters": {"answer": "Ticket SHOP-9999 not found"}})"});
    auto handler = make_handler(llm);

    EXPECT_EQ(handler.answer("Get SHOP-9999", "", CancellationToken()), "Ticket SHOP-9999 not found");
}

TEST(ReactCapabilityHandlerTest, MalformedActionGetsCorrectiveFeedback) {
    auto llm = std::make_shared<test::ScriptedGenerator>(std::vector<std::string>{
        "print(get_ticket_details('SHOP-2847'))",
        "FINAL_ANSWER: ok"});
    auto handler = make_handler(llm);

    EXPECT_EQ(handler.answer("Get SHOP-2847", "", CancellationToken()), "ok");
    ASSERT_EQ(llm->prompts.size(), 2u);
    EXPECT_NE(llm->prompts[1].find("SYSTEM ERROR"), std::string::npos);
}

TEST(ReactCapabilityHandlerTest, IterationCapYieldsBestEffortAnswer) {
    std::string call = R"({"tool": "get_ticket_details", "parameters": {"ticket_id": "SHOP-2901"}})";
    auto llm = std::make_shared<test::ScriptedGenerator>(std::vector<std::string>{
        call, call, "Best effort: SHOP-2901 is an open P1 payment timeout."});
    auto handler = make_handler(llm, 2);

    auto answer = handler.answer("Get SHOP-2901", "", CancellationToken());

    EXPECT_EQ(answer, "Best effort: SHOP-2901 is an open P1 payment timeout.");
    ASSERT_EQ(llm->prompts.size(), 3u);
    EXPECT_NE(llm->prompts[2].find("No more tool calls are allowed"), std::string::npos);
}

TEST(ReactCapabilityHandlerTest, IterationCapWithSilentExtractionFallsBackToLastObservation) {
    std::string call = R"({"tool": "get_confluence_doc", "parameters": {"doc_key": "nope"}})";
    auto llm = std::make_shared<test::ScriptedGenerator>(std::vector<std::string>{call, ""});
    auto handler = make_handler(llm, 1);

    EXPECT_EQ(handler.answer("Get doc nope", "", CancellationToken()),
              "Document 'nope' not found. Available keys: checkout-rewrite, mobile-strategy, payment-architecture");
}

TEST(ReactCapabilityHandlerTest, IterationCapWithNothingLearnedIsDescriptive) {
    auto llm = std::make_shared<test::ScriptedGenerator>(std::vector<std::string>{"hmm", "", ""});
    auto handler = make_handler(llm, 1);

    EXPECT_EQ(handler.answer("Get SHOP-2847", "", CancellationToken()), "Could not answer 'Get SHOP-2847' within 1 reasoning steps.");
}

TEST(ReactCapabilityHandlerTest, ToolErrorIsFedBackNotThrown) {
    auto llm = std::make_shared<test::ScriptedGenerator>(std::vector<std::string>{
        R"({"tool": "get_metric", "parameters": {"metric_name": "x"}})",
        "FINAL_ANSWER: no such tool here"});
    auto handler = make_handler(llm);

    EXPECT_EQ(handler.answer("metric x", "", CancellationToken()), "no such tool here");
    EXPECT_NE(llm->prompts[1].find("ERROR: Tool 'get_metric' not found."), std::string::npos);
    EXPECT_NE(llm->prompts[1].find("do not repeat the same failing call"), std::string::npos);
}

TEST(ReactCapabilityHandlerTest, BackendFailurePropagates) {
    ReactCapabilityHandler handler(CapabilityProfile{"retrieve", "Retrieve.", 3},
                                   std::make_shared<test::UnreachableGenerator>(), retrieve_tools());
    EXPECT_THROW(handler.answer("Get SHOP-2847", "", CancellationToken()), std::runtime_error);
}

TEST(ReactCapabilityHandlerTest, StoppedTokenSkipsTheBackend) {
    auto llm = std::make_shared<test::ScriptedGenerator>(std::vector<std::string>{"FINAL_ANSWER: unused"});
    auto handler = make_handler(llm);
    CancellationToken stop;
    stop.cancel();

    EXPECT_THROW(handler.answer("Get SHOP-2847", "", stop), std::runtime_error);
    EXPECT_TRUE(llm->prompts.empty());
}

// Replies with a tool call and flips the stop token, as a timed-out caller would.
class GivingUpGenerator : public ITextGenerator {
public:
    explicit GivingUpGenerator(CancellationToken stop) : stop_(stop) {}

    std::string generate_text(const std::string&) override {
        calls++;
        stop_.cancel();
        return R"({"tool": "get_ticket_details", "parameters": {"ticket_id": "SHOP-2847"}})";
    }

    int calls = 0;

private:
    CancellationToken stop_;
};

TEST(ReactCapabilityHandlerTest, StopsBetweenIterationsOnceAbandoned) {
    CancellationToken stop;
    auto llm = std::make_shared<GivingUpGenerator>(stop);
    ReactCapabilityHandler handler(CapabilityProfile{"retrieve", "Retrieve.", 4}, llm, retrieve_tools());

    EXPECT_THROW(handler.answer("Get SHOP-2847", "", stop), std::runtime_error);
    EXPECT_EQ(llm->calls, 1);
}

TEST(ReactCapabilityHandlerTest, RejectsNonPositiveIterationCap) {
    auto llm = std::make_shared<test::ScriptedGenerator>(std::vector<std::string>{});
    EXPECT_THROW(ReactCapabilityHandler(CapabilityProfile{"retrieve", "Retrieve.", 0}, llm, retrieve_tools()),
                 std::invalid_argument);
}

} // namespace
} // namespace scout
