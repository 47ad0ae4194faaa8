#pragma once

#include "mcp_client.hpp"
#include "tool_errors.hpp"
#include "tool_servers.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace homefin {

// Executes tool calls against tool servers for one unit of work.
class ToolInvoker {
 public:
  virtual ~ToolInvoker() = default;

  virtual std::optional<ToolCallResult> Invoke(const std::string& server_id,
                                               const std::string& tool_name,
                                               const nlohmann::json& arguments,
                                               ToolError* err) = 0;
  // Stops every server started through this invoker. Safe to call twice.
  virtual void Close() = 0;
};

using ToolInvokerFactory = std::function<std::unique_ptr<ToolInvoker>()>;

struct ToolSessionOptions {
  std::chrono::milliseconds read_timeout{60000};
  std::chrono::milliseconds stop_grace{2000};
  // Shared by every client the arena starts; main sets it on shutdown.
  std::shared_ptr<std::atomic_bool> cancel_token;
};

// Starts one McpClient per server id on first use and owns it until Close().
class ToolSessionArena : public ToolInvoker {
 public:
  ToolSessionArena(const ToolServerTable* defs, ToolSessionOptions options);
  ~ToolSessionArena() override;

  std::optional<ToolCallResult> Invoke(const std::string& server_id,
                                       const std::string& tool_name,
                                       const nlohmann::json& arguments,
                                       ToolError* err) override;
  void Close() override;

  // Pids of servers started so far, including ones already stopped.
  std::vector<pid_t> StartedPids() const;

 private:
  McpClient* ClientFor(const std::string& server_id, ToolError* err);

  const ToolServerTable* defs_;
  ToolSessionOptions options_;

  mutable std::mutex mu_;
  std::map<std::string, std::unique_ptr<McpClient>> clients_;
  std::vector<pid_t> started_pids_;
};

ToolInvokerFactory MakeArenaFactory(const ToolServerTable* defs, ToolSessionOptions options);

}  // namespace homefin
