#include "tool_loop.hpp"

#include "intent_router.hpp"
#include "log_util.hpp"

#include <algorithm>
#include <iostream>
#include <string>
#include <utility>

namespace homefin {

const char* const kRoundLimitMessage =
    "I reached the tool-calling limit for this request. Please try again with a more specific question.";

namespace {

static nlohmann::json FailurePayload(const std::string& error, ToolErrorKind kind, const nlohmann::json& details = nullptr) {
  nlohmann::json j = {{"ok", false}, {"error", error}, {"kind", ToolErrorKindName(kind)}};
  if (!details.is_null()) j["details"] = details;
  return j;
}

static bool PayloadSucceeded(const nlohmann::json& payload) {
  if (!payload.is_object()) return false;
  if (payload.contains("success") && payload["success"].is_boolean()) return payload["success"].get<bool>();
  return !(payload.contains("error") && payload["error"].is_string());
}

static std::string ToolMessageContent(const ToolResult& r) {
  return r.result.is_string() ? r.result.get<std::string>() : r.result.dump();
}

}  // namespace

std::string IntentForTool(const std::string& tool_name) {
  if (tool_name == "get_unreimbursed_balance") return intents::kBalanceQuery;
  if (tool_name == "get_charitable_summary") return intents::kCharitableSummary;
  if (tool_name == "add_numbers") return intents::kArithmetic;
  return {};
}

ToolLoop::ToolLoop(const ToolRegistry* registry, IChatModel* model, ToolInvokerFactory invoker_factory, int max_rounds)
    : registry_(registry), model_(model), invoker_factory_(std::move(invoker_factory)), max_rounds_(max_rounds) {
  if (max_rounds_ <= 0) max_rounds_ = 1;
}

ToolResult ToolLoop::Execute(const std::string& session_id, const ToolCall& call, ToolInvoker* invoker,
                             const ConversationContext& ctx) const {
  ToolResult r;
  r.tool_call_id = call.id;
  r.name = call.name;

  std::cout << "[tool-call] session_id=" << session_id << " id=" << call.id << " name=" << call.name
            << " arguments=" << TruncateForLog(call.arguments_json, 2000) << "\n";

  auto spec = registry_ ? registry_->Resolve(call.name) : std::nullopt;
  if (!spec) {
    r.ok = false;
    r.error = "unknown tool: " + call.name;
    r.error_kind = ToolErrorKind::kInvalidState;
    r.result = FailurePayload(r.error, r.error_kind);
    return r;
  }
  r.server_id = spec->server_id;
  const auto& enabled = ctx.enabled_tool_server_ids;
  if (std::find(enabled.begin(), enabled.end(), spec->server_id) == enabled.end()) {
    r.ok = false;
    r.error = "tool server " + spec->server_id + " is disabled for this chat";
    r.error_kind = ToolErrorKind::kInvalidState;
    r.result = FailurePayload(r.error, r.error_kind);
    return r;
  }

  const auto raw = ParseJsonLoose(call.arguments_json).value_or(nlohmann::json(call.arguments_json));
  const auto args = ToJson(registry_->NormalizeArguments(call.name, raw));

  ToolError err;
  auto result = invoker->Invoke(spec->server_id, call.name, args, &err);
  if (!result) {
    r.ok = false;
    r.error = err.message;
    r.error_kind = err.kind;
    r.result = FailurePayload(err.message, err.kind, err.payload);
    return r;
  }
  r.ok = true;
  if (result->structured_payload) {
    r.result = *result->structured_payload;
  } else {
    r.result = result->raw_text;
  }
  return r;
}

ToolLoopResult ToolLoop::Run(const std::string& session_id,
                             const std::vector<ChatMessage>& messages,
                             ConversationContext* ctx,
                             Clock::time_point now) const {
  ToolLoopResult out;
  if (!model_) {
    out.error = "no language model configured";
    return out;
  }
  ConversationContext empty_ctx;
  ConversationContext* context = ctx ? ctx : &empty_ctx;

  auto invoker = invoker_factory_ ? invoker_factory_() : nullptr;
  struct CloseGuard {
    ToolInvoker* invoker;
    ~CloseGuard() {
      if (invoker) invoker->Close();
    }
  } guard{invoker.get()};

  const auto tools = registry_ ? registry_->SchemasFor(context->enabled_tool_server_ids) : nlohmann::json::array();
  std::vector<ChatMessage> msgs = messages;

  for (int round = 0; round < max_rounds_; round++) {
    out.rounds = round + 1;
    std::string model_err;
    auto reply = model_->Complete(msgs, tools, &model_err);
    if (!reply) {
      out.error = model_err.empty() ? "model call failed" : model_err;
      std::cout << "[tool-loop] session_id=" << session_id << " round=" << out.rounds << " model_error=" << out.error << "\n";
      return out;
    }
    if (reply->tool_calls.empty()) {
      out.ok = true;
      out.final_text = reply->content.value_or("");
      out.transcript.push_back({"assistant", out.final_text, {}, {}});
      std::cout << "[tool-loop] session_id=" << session_id << " rounds=" << out.rounds << " done=1\n";
      return out;
    }

    ChatMessage assistant;
    assistant.role = "assistant";
    assistant.content = reply->content.value_or("");
    assistant.tool_calls = reply->tool_calls;
    msgs.push_back(assistant);
    out.transcript.push_back(std::move(assistant));

    for (const auto& call : reply->tool_calls) {
      out.executed_calls.push_back(call);
      if (!invoker) {
        out.error = "no tool invoker configured";
        out.error_kind = ToolErrorKind::kInvalidState;
        return out;
      }
      auto r = Execute(session_id, call, invoker.get(), *context);
      std::cout << "[tool-result] session_id=" << session_id << " id=" << r.tool_call_id << " name=" << r.name
                << " ok=" << (r.ok ? 1 : 0) << " error=" << (r.error.empty() ? "-" : r.error)
                << " result=" << TruncateForLog(r.result.dump(), 2000) << "\n";
      if (!r.ok && IsStartupFailure(r.error_kind)) {
        out.error = r.error;
        out.error_kind = r.error_kind;
        out.results.push_back(std::move(r));
        return out;
      }
      if (r.ok && PayloadSucceeded(r.result)) {
        auto intent = IntentForTool(r.name);
        if (!intent.empty()) context->Record(intent, r.result, now);
      }
      ChatMessage tool_msg;
      tool_msg.role = "tool";
      tool_msg.content = ToolMessageContent(r);
      tool_msg.tool_call_id = r.tool_call_id;
      msgs.push_back(tool_msg);
      out.transcript.push_back(std::move(tool_msg));
      out.results.push_back(std::move(r));
    }
  }

  out.ok = true;
  out.hit_round_limit = true;
  out.final_text = kRoundLimitMessage;
  out.transcript.push_back({"assistant", out.final_text, {}, {}});
  std::cout << "[tool-loop] session_id=" << session_id << " rounds=" << out.rounds << " hit_round_limit=1\n";
  return out;
}

}  // namespace homefin
