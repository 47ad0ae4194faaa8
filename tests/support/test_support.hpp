#pragma once

#include "providers/provider.hpp"
#include "tool_servers.hpp"
#include "tool_session.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <cstdlib>
#include <deque>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace homefin::test_support {

// HOMEFIN_FAKE_TOOL_SERVER overrides the path baked in by the build.
inline std::string FakeServerPath() {
  const char* v = std::getenv("HOMEFIN_FAKE_TOOL_SERVER");
  if (v && *v) return std::string(v);
#ifdef HOMEFIN_FAKE_TOOL_SERVER_PATH
  return HOMEFIN_FAKE_TOOL_SERVER_PATH;
#else
  return std::string();
#endif
}

#define HOMEFIN_REQUIRE_FAKE_SERVER()                              \
  do {                                                             \
    if (::homefin::test_support::FakeServerPath().empty()) {       \
      GTEST_SKIP() << "HOMEFIN_FAKE_TOOL_SERVER is not set";       \
    }                                                              \
  } while (0)

inline LaunchSpec FakeLaunch(std::vector<std::string> flags = {}) {
  LaunchSpec spec;
  spec.command.push_back(FakeServerPath());
  for (auto& f : flags) spec.command.push_back(std::move(f));
  return spec;
}

inline ToolServerDefinition FakeDefinition(const std::string& id, std::vector<std::string> flags = {}) {
  ToolServerDefinition def;
  def.id = id;
  def.display_name = id;
  def.command = FakeLaunch(std::move(flags)).command;
  def.default_enabled = true;
  def.source = "test";
  return def;
}

// Three builtin-named servers backed by the fake binary.
inline ToolServerTable FakeToolServerTable() {
  ToolServerTable defs;
  for (const char* id : {"hsa_ledger", "charitable_ledger", "test_addition"}) defs[id] = FakeDefinition(id);
  defs["hsa_ledger"].display_name = "HSA Ledger";
  defs["hsa_ledger"].tool_names = {"get_unreimbursed_balance", "read_ledger_entries"};
  defs["charitable_ledger"].display_name = "Charitable Ledger";
  defs["charitable_ledger"].tool_names = {"get_charitable_summary", "read_charitable_ledger_entries"};
  defs["test_addition"].display_name = "Test Addition";
  defs["test_addition"].tool_names = {"add_numbers"};
  return defs;
}

// Replays canned replies and records what it was asked.
class ScriptedChatModel : public IChatModel {
 public:
  std::string Name() const override { return "scripted"; }

  std::optional<ModelReply> Complete(const std::vector<ChatMessage>& messages,
                                     const nlohmann::json& tools,
                                     std::string* err) override {
    requests.push_back(messages);
    tool_lists.push_back(tools);
    if (replies.empty()) {
      if (err) *err = "scripted model has no more replies";
      return std::nullopt;
    }
    auto r = replies.front();
    replies.pop_front();
    if (!r) {
      if (err) *err = "scripted failure";
    }
    return r;
  }

  void ReplyText(const std::string& text) {
    ModelReply r;
    r.content = text;
    replies.push_back(r);
  }

  void ReplyToolCall(const std::string& id, const std::string& name, const std::string& arguments_json) {
    ModelReply r;
    r.finish_reason = "tool_calls";
    r.tool_calls.push_back({id, name, arguments_json});
    replies.push_back(r);
  }

  void ReplyFailure() { replies.push_back(std::nullopt); }

  std::deque<std::optional<ModelReply>> replies;
  std::vector<std::vector<ChatMessage>> requests;
  std::vector<nlohmann::json> tool_lists;
};

struct RecordedInvocation {
  std::string server_id;
  std::string tool_name;
  nlohmann::json arguments;
};

// In-process ToolInvoker. Payloads are keyed by tool name.
class StubToolInvoker : public ToolInvoker {
 public:
  struct Shared {
    std::map<std::string, nlohmann::json> payloads;
    std::map<std::string, ToolError> failures;
    std::vector<RecordedInvocation> calls;
    int created = 0;
    int closed = 0;
  };

  explicit StubToolInvoker(std::shared_ptr<Shared> shared) : shared_(std::move(shared)) {}

  std::optional<ToolCallResult> Invoke(const std::string& server_id,
                                       const std::string& tool_name,
                                       const nlohmann::json& arguments,
                                       ToolError* err) override {
    shared_->calls.push_back({server_id, tool_name, arguments});
    auto f = shared_->failures.find(tool_name);
    if (f != shared_->failures.end()) {
      if (err) *err = f->second;
      return std::nullopt;
    }
    nlohmann::json payload = {{"ok", true}};
    auto p = shared_->payloads.find(tool_name);
    if (p != shared_->payloads.end()) payload = p->second;
    ToolCallResult r;
    r.raw_text = payload.dump();
    if (payload.is_object()) r.structured_payload = payload;
    r.display_summary = r.raw_text;
    return r;
  }

  void Close() override {
    if (!closed_) {
      closed_ = true;
      shared_->closed++;
    }
  }

 private:
  std::shared_ptr<Shared> shared_;
  bool closed_ = false;
};

inline ToolInvokerFactory StubFactory(std::shared_ptr<StubToolInvoker::Shared> shared) {
  return [shared]() -> std::unique_ptr<ToolInvoker> {
    shared->created++;
    return std::make_unique<StubToolInvoker>(shared);
  };
}

}  // namespace homefin::test_support
