#pragma once

#include "config.hpp"
#include "intent_router.hpp"
#include "providers/provider.hpp"
#include "session_manager.hpp"
#include "tool_loop.hpp"
#include "tool_servers.hpp"
#include "tool_session.hpp"
#include "tooling.hpp"

#include <httplib.h>

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace homefin {

struct ChatRequest {
  std::string session_id;
  std::string message;
  // nullopt means "use the configured defaults".
  std::optional<std::vector<std::string>> enabled_servers;
};

struct ChatReply {
  bool ok = false;
  std::string session_id;
  std::string response;
  // "router" or "model".
  std::string resolved_by;
  std::string intent;
  std::vector<RouterToolCall> tool_calls;
  int rounds = 0;
  bool hit_round_limit = false;
  std::string error;
  ToolErrorKind error_kind = ToolErrorKind::kNone;
};

// Receives each finished turn for persistence outside the core.
using TurnSink = std::function<void(const std::string& session_id, const TurnRecord& turn)>;

class ChatService {
 public:
  ChatService(const AssistantConfig* cfg,
              const ToolServerTable* defs,
              const ToolRegistry* registry,
              SessionManager* sessions,
              IChatModel* model,
              ToolInvokerFactory invoker_factory);

  ChatReply HandleMessage(const ChatRequest& req);
  ChatReply HandleMessage(const ChatRequest& req, Clock::time_point now);

  void ResetSession(const std::string& session_id);
  nlohmann::json ListToolServers() const;
  void SetTurnSink(TurnSink sink) { turn_sink_ = std::move(sink); }

  void Register(httplib::Server* server);

 private:
  std::vector<ChatMessage> BuildModelMessages(const Session& session, const std::string& message) const;

  const AssistantConfig* cfg_;
  const ToolServerTable* defs_;
  SessionManager* sessions_;
  DeterministicRouter router_;
  ToolLoop loop_;
  TurnSink turn_sink_;
};

nlohmann::json ChatReplyToJson(const ChatReply& reply);

}  // namespace homefin
