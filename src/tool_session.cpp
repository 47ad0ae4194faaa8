#include "tool_session.hpp"

#include <iostream>
#include <string>
#include <utility>

namespace homefin {

ToolSessionArena::ToolSessionArena(const ToolServerTable* defs, ToolSessionOptions options)
    : defs_(defs), options_(options) {}

ToolSessionArena::~ToolSessionArena() {
  Close();
}

McpClient* ToolSessionArena::ClientFor(const std::string& server_id, ToolError* err) {
  auto it = clients_.find(server_id);
  if (it != clients_.end()) return it->second.get();

  if (!defs_) {
    SetToolError(err, ToolErrorKind::kInvalidState, "no tool server definitions");
    return nullptr;
  }
  auto def = defs_->find(server_id);
  if (def == defs_->end()) {
    SetToolError(err, ToolErrorKind::kPathResolution, "unknown tool server: " + server_id);
    return nullptr;
  }

  McpClientOptions opts;
  opts.name = server_id;
  opts.read_timeout = options_.read_timeout;
  opts.stop_grace = options_.stop_grace;
  opts.cancel_token = options_.cancel_token;
  auto client = std::make_unique<McpClient>(MakeLaunchSpec(def->second), opts);
  const bool started = client->Start(err);
  if (client->pid() > 0) started_pids_.push_back(client->pid());
  auto* raw = client.get();
  // Failed clients stay cached so a broken server is not respawned within one run.
  clients_[server_id] = std::move(client);
  return started ? raw : nullptr;
}

std::optional<ToolCallResult> ToolSessionArena::Invoke(const std::string& server_id,
                                                       const std::string& tool_name,
                                                       const nlohmann::json& arguments,
                                                       ToolError* err) {
  McpClient* client = nullptr;
  {
    std::lock_guard<std::mutex> lock(mu_);
    const bool cached = clients_.find(server_id) != clients_.end();
    client = ClientFor(server_id, err);
    if (!client) return std::nullopt;
    if (cached && client->state() != McpClientState::kReady) {
      if (auto startup = client->startup_error()) {
        SetToolError(err, ToolErrorKind::kHandshake, "tool server " + server_id + " did not start: " + *startup);
      } else {
        SetToolError(err, ToolErrorKind::kInvalidState,
                     std::string("tool server ") + server_id + " is " + McpClientStateName(client->state()));
      }
      return std::nullopt;
    }
  }
  return client->CallTool(tool_name, arguments, err);
}

void ToolSessionArena::Close() {
  std::map<std::string, std::unique_ptr<McpClient>> clients;
  {
    std::lock_guard<std::mutex> lock(mu_);
    clients.swap(clients_);
  }
  for (auto& kv : clients) kv.second->Stop();
}

std::vector<pid_t> ToolSessionArena::StartedPids() const {
  std::lock_guard<std::mutex> lock(mu_);
  return started_pids_;
}

ToolInvokerFactory MakeArenaFactory(const ToolServerTable* defs, ToolSessionOptions options) {
  return [defs, options]() -> std::unique_ptr<ToolInvoker> {
    return std::make_unique<ToolSessionArena>(defs, options);
  };
}

}  // namespace homefin
