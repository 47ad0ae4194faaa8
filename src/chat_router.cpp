#include "chat_router.hpp"

#include "log_util.hpp"

#include <iostream>
#include <string>
#include <utility>

namespace homefin {
namespace {

constexpr size_t kMaxHistoryForModel = 20;

constexpr const char* kSystemPrompt =
    "You are a household finance assistant. Use the available tools to look up HSA expenses, "
    "reimbursements and charitable donations. Report amounts exactly as the tools return them.";

static nlohmann::json MakeError(const std::string& message, const std::string& type) {
  nlohmann::json j;
  j["error"] = {{"message", message}, {"type", type}};
  return j;
}

static void SendJson(httplib::Response* res, int status, const nlohmann::json& body) {
  res->status = status;
  res->set_content(body.dump(), "application/json");
}

static std::optional<std::vector<std::string>> ParseServerList(const nlohmann::json& j) {
  if (!j.is_array()) return std::nullopt;
  std::vector<std::string> out;
  for (const auto& v : j) {
    if (v.is_string()) out.push_back(v.get<std::string>());
  }
  return out;
}

}  // namespace

nlohmann::json ChatReplyToJson(const ChatReply& reply) {
  nlohmann::json j;
  j["session_id"] = reply.session_id;
  j["response"] = reply.response;
  j["resolved_by"] = reply.resolved_by;
  j["intent"] = reply.intent.empty() ? nlohmann::json() : nlohmann::json(reply.intent);
  j["tool_calls"] = nlohmann::json::array();
  for (const auto& c : reply.tool_calls) {
    j["tool_calls"].push_back(
        {{"server_id", c.server_id}, {"tool_name", c.tool_name}, {"input", c.input}, {"output", c.output}});
  }
  j["rounds"] = reply.rounds;
  j["hit_round_limit"] = reply.hit_round_limit;
  return j;
}

ChatService::ChatService(const AssistantConfig* cfg,
                         const ToolServerTable* defs,
                         const ToolRegistry* registry,
                         SessionManager* sessions,
                         IChatModel* model,
                         ToolInvokerFactory invoker_factory)
    : cfg_(cfg),
      defs_(defs),
      sessions_(sessions),
      router_(defs, invoker_factory),
      loop_(registry, model, invoker_factory, cfg ? cfg->max_tool_rounds : 4) {}

std::vector<ChatMessage> ChatService::BuildModelMessages(const Session& session, const std::string& message) const {
  std::vector<ChatMessage> msgs;
  msgs.push_back({"system", kSystemPrompt, {}, {}});
  const auto& history = session.history;
  const size_t start = history.size() > kMaxHistoryForModel ? history.size() - kMaxHistoryForModel : 0;
  for (size_t i = start; i < history.size(); i++) {
    if (history[i].role == "user" || history[i].role == "assistant") {
      msgs.push_back({history[i].role, history[i].content, {}, {}});
    }
  }
  msgs.push_back({"user", message, {}, {}});
  return msgs;
}

ChatReply ChatService::HandleMessage(const ChatRequest& req) {
  return HandleMessage(req, Clock::now());
}

ChatReply ChatService::HandleMessage(const ChatRequest& req, Clock::time_point now) {
  ChatReply reply;
  reply.session_id = sessions_->EnsureSessionId(req.session_id);
  const std::string message = Trim(req.message);
  if (message.empty()) {
    reply.error = "message is empty";
    reply.error_kind = ToolErrorKind::kInvalidState;
    return reply;
  }

  auto lease = sessions_->Acquire(reply.session_id);
  Session& session = lease.session();
  AssistantConfig defaults;
  session.context.enabled_tool_server_ids =
      NormalizeEnabledServerIds(req.enabled_servers, cfg_ ? *cfg_ : defaults, *defs_);

  TurnRecord turn;
  turn.turn_id = NewId("turn");
  turn.user_message = message;

  if (auto routed = router_.Route(message, &session.context, now)) {
    reply.ok = true;
    reply.resolved_by = "router";
    reply.intent = routed->intent;
    reply.response = routed->response;
    reply.tool_calls = routed->tools_called;
  } else {
    const auto msgs = BuildModelMessages(session, message);
    auto loop = loop_.Run(reply.session_id, msgs, &session.context, now);
    reply.resolved_by = "model";
    reply.rounds = loop.rounds;
    reply.hit_round_limit = loop.hit_round_limit;
    for (const auto& r : loop.results) {
      reply.tool_calls.push_back({r.server_id, r.name, "", r.ok ? TruncateForLog(r.result.dump(), 500) : "error: " + r.error});
    }
    if (loop.ok) {
      reply.ok = true;
      reply.response = loop.final_text;
    } else {
      reply.error = loop.error;
      reply.error_kind = loop.error_kind;
    }
  }

  session.history.push_back({"user", message, {}, {}});
  if (reply.ok) session.history.push_back({"assistant", reply.response, {}, {}});
  turn.resolved_by = reply.resolved_by;
  turn.rounds = reply.rounds;
  for (const auto& c : reply.tool_calls) turn.tools_called.push_back(c.tool_name);
  if (reply.ok) turn.output_text = reply.response;
  session.turns.push_back(turn);
  sessions_->Commit(lease);
  if (turn_sink_) turn_sink_(reply.session_id, turn);

  std::cout << "[chat] session_id=" << reply.session_id << " resolved_by=" << reply.resolved_by
            << " ok=" << (reply.ok ? 1 : 0) << " tools=" << reply.tool_calls.size() << "\n";
  return reply;
}

void ChatService::ResetSession(const std::string& session_id) {
  sessions_->Reset(session_id);
  std::cout << "[chat] session_id=" << session_id << " reset=1\n";
}

nlohmann::json ChatService::ListToolServers() const {
  AssistantConfig defaults;
  const auto enabled = NormalizeEnabledServerIds(std::nullopt, cfg_ ? *cfg_ : defaults, *defs_);
  nlohmann::json out = nlohmann::json::array();
  for (const auto& kv : *defs_) {
    bool on = false;
    for (const auto& id : enabled) {
      if (id == kv.first) on = true;
    }
    out.push_back(ToolServerDefinitionToJson(kv.second, on));
  }
  return out;
}

void ChatService::Register(httplib::Server* server) {
  server->Post("/chat/message", [this](const httplib::Request& req, httplib::Response& res) {
    std::cout << "[http] " << req.method << " " << req.path << "\n";
    auto j = nlohmann::json::parse(req.body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
      SendJson(&res, 400, MakeError("invalid json body", "invalid_request_error"));
      return;
    }
    ChatRequest chat;
    if (j.contains("session_id") && j["session_id"].is_string()) chat.session_id = j["session_id"].get<std::string>();
    if (j.contains("message") && j["message"].is_string()) chat.message = j["message"].get<std::string>();
    if (j.contains("enabled_servers")) chat.enabled_servers = ParseServerList(j["enabled_servers"]);
    if (Trim(chat.message).empty()) {
      SendJson(&res, 400, MakeError("message is required", "invalid_request_error"));
      return;
    }
    auto reply = HandleMessage(chat);
    if (!reply.ok) {
      const bool tool_start = IsStartupFailure(reply.error_kind);
      auto body = MakeError(reply.error, tool_start ? "tool_server_error" : "upstream_error");
      body["session_id"] = reply.session_id;
      if (tool_start) body["error"]["kind"] = ToolErrorKindName(reply.error_kind);
      SendJson(&res, tool_start ? 503 : 502, body);
      return;
    }
    SendJson(&res, 200, ChatReplyToJson(reply));
  });

  server->Post(R"(/chat/sessions/([^/]+)/reset)", [this](const httplib::Request& req, httplib::Response& res) {
    std::cout << "[http] " << req.method << " " << req.path << "\n";
    const std::string session_id = req.matches.size() > 1 ? req.matches[1].str() : std::string();
    if (session_id.empty()) {
      SendJson(&res, 400, MakeError("session id is required", "invalid_request_error"));
      return;
    }
    ResetSession(session_id);
    SendJson(&res, 200, {{"ok", true}, {"session_id", session_id}});
  });

  server->Get("/chat/tool-servers", [this](const httplib::Request& req, httplib::Response& res) {
    std::cout << "[http] " << req.method << " " << req.path << "\n";
    SendJson(&res, 200, {{"servers", ListToolServers()}});
  });
}

}  // namespace homefin
