#include "openai_compatible_http_provider.hpp"

#include "log_util.hpp"
#include "session_manager.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <iostream>
#include <memory>
#include <string>
#include <utility>

namespace homefin {
namespace {

static std::unique_ptr<httplib::Client> MakeClient(const HttpEndpoint& ep, const std::string& api_key) {
  auto cli = std::make_unique<httplib::Client>(ep.scheme + "://" + ep.host + ":" + std::to_string(ep.port));
  cli->set_connection_timeout(5);
  cli->set_read_timeout(300);
  cli->set_write_timeout(30);
  if (!api_key.empty()) cli->set_bearer_token_auth(api_key);
  return cli;
}

static std::string JoinPath(const std::string& base, const std::string& path) {
  if (base.empty()) return path;
  if (base.back() == '/' && !path.empty() && path.front() == '/') return base + path.substr(1);
  if (base.back() != '/' && !path.empty() && path.front() != '/') return base + "/" + path;
  return base + path;
}

static std::string ArgumentsToString(const nlohmann::json& a) {
  if (a.is_string()) return a.get<std::string>();
  if (a.is_null()) return "{}";
  return a.dump();
}

}  // namespace

nlohmann::json BuildChatCompletionRequest(const std::string& model,
                                          const std::vector<ChatMessage>& messages,
                                          const nlohmann::json& tools) {
  nlohmann::json j;
  j["model"] = model;
  j["stream"] = false;
  j["messages"] = nlohmann::json::array();
  for (const auto& m : messages) {
    nlohmann::json mj = {{"role", m.role}, {"content", m.content}};
    if (!m.tool_call_id.empty()) mj["tool_call_id"] = m.tool_call_id;
    if (!m.tool_calls.empty()) {
      mj["tool_calls"] = nlohmann::json::array();
      for (const auto& c : m.tool_calls) {
        mj["tool_calls"].push_back(
            {{"id", c.id}, {"type", "function"}, {"function", {{"name", c.name}, {"arguments", c.arguments_json}}}});
      }
    }
    j["messages"].push_back(std::move(mj));
  }
  if (tools.is_array() && !tools.empty()) {
    j["tools"] = tools;
    j["tool_choice"] = "auto";
  }
  return j;
}

std::optional<ModelReply> ParseChatCompletionResponse(const std::string& body, std::string* err) {
  auto jr = nlohmann::json::parse(body, nullptr, false);
  if (jr.is_discarded() || !jr.contains("choices") || !jr["choices"].is_array() || jr["choices"].empty() ||
      !jr["choices"][0].is_object() || !jr["choices"][0].contains("message") || !jr["choices"][0]["message"].is_object()) {
    if (err) *err = "invalid json from /v1/chat/completions";
    return std::nullopt;
  }
  const auto& choice = jr["choices"][0];
  const auto& msg = choice["message"];
  ModelReply out;
  if (msg.contains("content") && msg["content"].is_string()) out.content = msg["content"].get<std::string>();
  if (choice.contains("finish_reason") && choice["finish_reason"].is_string()) {
    out.finish_reason = choice["finish_reason"].get<std::string>();
  }
  if (msg.contains("tool_calls") && msg["tool_calls"].is_array()) {
    for (const auto& tc : msg["tool_calls"]) {
      if (!tc.is_object()) continue;
      ToolCall c;
      if (tc.contains("id") && tc["id"].is_string()) c.id = tc["id"].get<std::string>();
      if (c.id.empty()) c.id = NewId("call");
      if (tc.contains("function") && tc["function"].is_object()) {
        const auto& fn = tc["function"];
        if (fn.contains("name") && fn["name"].is_string()) c.name = fn["name"].get<std::string>();
        c.arguments_json = fn.contains("arguments") ? ArgumentsToString(fn["arguments"]) : "{}";
      }
      if (!c.name.empty()) out.tool_calls.push_back(std::move(c));
    }
  }
  if (!out.content && out.tool_calls.empty()) {
    if (err) *err = "model returned neither content nor tool calls";
    return std::nullopt;
  }
  return out;
}

OpenAiCompatibleHttpProvider::OpenAiCompatibleHttpProvider(std::string name, HttpEndpoint endpoint, std::string model,
                                                           std::string api_key)
    : name_(std::move(name)), endpoint_(std::move(endpoint)), model_(std::move(model)), api_key_(std::move(api_key)) {}

std::string OpenAiCompatibleHttpProvider::Name() const {
  return name_;
}

std::optional<ModelReply> OpenAiCompatibleHttpProvider::Complete(const std::vector<ChatMessage>& messages,
                                                                 const nlohmann::json& tools,
                                                                 std::string* err) {
  auto cli = MakeClient(endpoint_, api_key_);
  const auto body = BuildChatCompletionRequest(model_, messages, tools);
  std::cout << "[model] provider=" << name_ << " model=" << model_ << " messages=" << messages.size()
            << " tools=" << (tools.is_array() ? tools.size() : 0) << "\n";
  auto res = cli->Post(JoinPath(endpoint_.base_path, "/v1/chat/completions"), body.dump(), "application/json");
  if (!res) {
    if (err) *err = name_ + ": failed to connect (" + httplib::to_string(res.error()) + ")";
    return std::nullopt;
  }
  if (res->status < 200 || res->status >= 300) {
    if (err) *err = name_ + ": /v1/chat/completions http " + std::to_string(res->status);
    std::cout << "[model] provider=" << name_ << " status=" << res->status << " body=" << TruncateForLog(res->body, 500)
              << "\n";
    return std::nullopt;
  }
  std::string parse_err;
  auto reply = ParseChatCompletionResponse(res->body, &parse_err);
  if (!reply) {
    if (err) *err = name_ + ": " + parse_err;
    return std::nullopt;
  }
  return reply;
}

}  // namespace homefin
