#pragma once

#include "providers/provider.hpp"
#include "session_manager.hpp"
#include "tool_errors.hpp"
#include "tool_session.hpp"
#include "tooling.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace homefin {

extern const char* const kRoundLimitMessage;

struct ToolResult {
  std::string tool_call_id;
  std::string name;
  std::string server_id;
  nlohmann::json result;
  bool ok = true;
  std::string error;
  ToolErrorKind error_kind = ToolErrorKind::kNone;
};

struct ToolLoopResult {
  // False only for model failures and tool servers that could not start.
  bool ok = false;
  std::string final_text;
  std::vector<ToolCall> executed_calls;
  std::vector<ToolResult> results;
  // Assistant and tool messages produced during the run, in order.
  std::vector<ChatMessage> transcript;
  int rounds = 0;
  bool hit_round_limit = false;
  std::string error;
  ToolErrorKind error_kind = ToolErrorKind::kNone;
};

class ToolLoop {
 public:
  ToolLoop(const ToolRegistry* registry, IChatModel* model, ToolInvokerFactory invoker_factory, int max_rounds = 4);

  // Every tool server started during the run is stopped before returning.
  ToolLoopResult Run(const std::string& session_id,
                     const std::vector<ChatMessage>& messages,
                     ConversationContext* ctx,
                     Clock::time_point now) const;

  int max_rounds() const { return max_rounds_; }

 private:
  ToolResult Execute(const std::string& session_id, const ToolCall& call, ToolInvoker* invoker,
                     const ConversationContext& ctx) const;

  const ToolRegistry* registry_;
  IChatModel* model_;
  ToolInvokerFactory invoker_factory_;
  int max_rounds_;
};

// Intent recorded in ConversationContext for a successful call, or empty.
std::string IntentForTool(const std::string& tool_name);

}  // namespace homefin
