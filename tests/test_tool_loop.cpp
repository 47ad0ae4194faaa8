#include <gtest/gtest.h>
#include "intent_router.hpp"
#include "support/test_support.hpp"
#include "tool_loop.hpp"

#include <memory>
#include <string>
#include <vector>

using namespace homefin;
using namespace homefin::test_support;

class ToolLoopTest : public ::testing::Test {
 protected:
  void SetUp() override {
    defs = FakeToolServerTable();
    BuildToolRegistry(defs, &registry);
    shared = std::make_shared<StubToolInvoker::Shared>();
    shared->payloads["add_numbers"] = {{"sum", 5}};
    shared->payloads["get_unreimbursed_balance"] = {{"total_unreimbursed", 42.5}, {"count", 3}};
    ctx.enabled_tool_server_ids = {"hsa_ledger", "charitable_ledger", "test_addition"};
    messages = {{"system", "You are a household finance assistant.", {}, {}}, {"user", "add 2 and 3", {}, {}}};
  }

  ToolLoopResult Run(int max_rounds = 4) {
    ToolLoop loop(&registry, &model, StubFactory(shared), max_rounds);
    return loop.Run("sess-test", messages, &ctx, Clock::now());
  }

  ToolServerTable defs;
  ToolRegistry registry;
  std::shared_ptr<StubToolInvoker::Shared> shared;
  ScriptedChatModel model;
  ConversationContext ctx;
  std::vector<ChatMessage> messages;
};

TEST_F(ToolLoopTest, PlainAnswerNeedsOneRound) {
  model.ReplyText("Hello there.");
  auto r = Run();
  EXPECT_TRUE(r.ok);
  EXPECT_EQ(r.final_text, "Hello there.");
  EXPECT_EQ(r.rounds, 1);
  EXPECT_FALSE(r.hit_round_limit);
  EXPECT_TRUE(r.executed_calls.empty());
  ASSERT_EQ(model.tool_lists.size(), 1u);
  EXPECT_EQ(model.tool_lists[0].size(), 5u);
  EXPECT_EQ(shared->closed, 1);
}

TEST_F(ToolLoopTest, ToolCallThenAnswer) {
  model.ReplyToolCall("call-1", "add_numbers", R"({"x": "2", "y": 3})");
  model.ReplyText("2 + 3 = 5");
  auto r = Run();
  ASSERT_TRUE(r.ok) << r.error;
  EXPECT_EQ(r.final_text, "2 + 3 = 5");
  EXPECT_EQ(r.rounds, 2);
  ASSERT_EQ(shared->calls.size(), 1u);
  EXPECT_EQ(shared->calls[0].server_id, "test_addition");
  EXPECT_EQ(shared->calls[0].arguments, (nlohmann::json{{"a", 2}, {"b", 3}}));

  ASSERT_EQ(r.results.size(), 1u);
  EXPECT_TRUE(r.results[0].ok);
  EXPECT_EQ(r.results[0].tool_call_id, "call-1");

  // The second model request carries the assistant tool call and the tool result.
  ASSERT_EQ(model.requests.size(), 2u);
  const auto& second = model.requests[1];
  ASSERT_EQ(second.size(), 4u);
  EXPECT_EQ(second[2].role, "assistant");
  ASSERT_EQ(second[2].tool_calls.size(), 1u);
  EXPECT_EQ(second[3].role, "tool");
  EXPECT_EQ(second[3].tool_call_id, "call-1");
  EXPECT_EQ(nlohmann::json::parse(second[3].content)["sum"], 5);

  EXPECT_EQ(ctx.last_intent, intents::kArithmetic);
  EXPECT_EQ(shared->closed, 1);
}

TEST_F(ToolLoopTest, RoundLimitReturnsFixedMessage) {
  for (int i = 0; i < 4; i++) model.ReplyToolCall("call-" + std::to_string(i), "get_unreimbursed_balance", "{}");
  model.ReplyText("never reached");
  auto r = Run(4);
  EXPECT_TRUE(r.ok);
  EXPECT_TRUE(r.hit_round_limit);
  EXPECT_EQ(r.rounds, 4);
  EXPECT_EQ(r.final_text, kRoundLimitMessage);
  EXPECT_EQ(model.requests.size(), 4u);
  EXPECT_EQ(shared->calls.size(), 4u);
  EXPECT_EQ(shared->closed, 1);
}

TEST_F(ToolLoopTest, UnknownToolBecomesErrorResult) {
  model.ReplyToolCall("call-1", "delete_ledger", "{}");
  model.ReplyText("Sorry, I can't do that.");
  auto r = Run();
  ASSERT_TRUE(r.ok);
  ASSERT_EQ(r.results.size(), 1u);
  EXPECT_FALSE(r.results[0].ok);
  EXPECT_EQ(r.results[0].result["ok"], false);
  EXPECT_NE(r.results[0].result["error"].get<std::string>().find("unknown tool"), std::string::npos);
  EXPECT_TRUE(shared->calls.empty());
}

TEST_F(ToolLoopTest, DisabledServerToolIsRefused) {
  ctx.enabled_tool_server_ids = {"hsa_ledger"};
  model.ReplyToolCall("call-1", "add_numbers", R"({"a":1,"b":1})");
  model.ReplyText("ok");
  auto r = Run();
  ASSERT_TRUE(r.ok);
  ASSERT_EQ(r.results.size(), 1u);
  EXPECT_FALSE(r.results[0].ok);
  EXPECT_NE(r.results[0].error.find("disabled"), std::string::npos);
  EXPECT_TRUE(shared->calls.empty());
  // Only tools of enabled servers are offered.
  EXPECT_EQ(model.tool_lists[0].size(), 2u);
}

TEST_F(ToolLoopTest, ToolFailureIsReportedToModel) {
  shared->failures["get_unreimbursed_balance"] =
      ToolError{ToolErrorKind::kProtocol, "tools/call: sheet missing", {{"code", -32000}, {"message", "sheet missing"}}};
  model.ReplyToolCall("call-1", "get_unreimbursed_balance", "{}");
  model.ReplyText("The ledger is not available.");
  auto r = Run();
  ASSERT_TRUE(r.ok);
  EXPECT_EQ(r.final_text, "The ledger is not available.");
  ASSERT_EQ(r.results.size(), 1u);
  EXPECT_EQ(r.results[0].error_kind, ToolErrorKind::kProtocol);
  EXPECT_EQ(r.results[0].result["kind"], "protocol");
  EXPECT_EQ(r.results[0].result["details"]["code"], -32000);
  EXPECT_TRUE(ctx.last_intent.empty());
}

TEST_F(ToolLoopTest, StartupFailureAbortsRun) {
  shared->failures["get_unreimbursed_balance"] = ToolError{ToolErrorKind::kHandshake, "initialize failed", nullptr};
  model.ReplyToolCall("call-1", "get_unreimbursed_balance", "{}");
  model.ReplyText("unused");
  auto r = Run();
  EXPECT_FALSE(r.ok);
  EXPECT_EQ(r.error_kind, ToolErrorKind::kHandshake);
  EXPECT_EQ(model.requests.size(), 1u);
  EXPECT_EQ(shared->closed, 1);
}

TEST_F(ToolLoopTest, ModelFailureIsReported) {
  model.ReplyFailure();
  auto r = Run();
  EXPECT_FALSE(r.ok);
  EXPECT_EQ(r.error, "scripted failure");
  EXPECT_EQ(shared->closed, 1);
}

TEST_F(ToolLoopTest, SeveralCallsInOneRound) {
  ModelReply reply;
  reply.tool_calls.push_back({"call-a", "get_unreimbursed_balance", "{}"});
  reply.tool_calls.push_back({"call-b", "add_numbers", R"({"a":1,"b":4})"});
  model.replies.push_back(reply);
  model.ReplyText("done");
  auto r = Run();
  ASSERT_TRUE(r.ok);
  EXPECT_EQ(r.rounds, 2);
  EXPECT_EQ(r.executed_calls.size(), 2u);
  EXPECT_EQ(shared->calls.size(), 2u);
  // Both tool messages follow the single assistant message.
  ASSERT_EQ(model.requests[1].size(), 5u);
  EXPECT_EQ(model.requests[1][3].tool_call_id, "call-a");
  EXPECT_EQ(model.requests[1][4].tool_call_id, "call-b");
}

TEST(ToolLoopMappingTest, IntentForTool) {
  EXPECT_EQ(IntentForTool("get_unreimbursed_balance"), intents::kBalanceQuery);
  EXPECT_EQ(IntentForTool("get_charitable_summary"), intents::kCharitableSummary);
  EXPECT_EQ(IntentForTool("add_numbers"), intents::kArithmetic);
  EXPECT_TRUE(IntentForTool("read_ledger_entries").empty());
}
