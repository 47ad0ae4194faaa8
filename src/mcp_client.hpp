#pragma once

#include "process_transport.hpp"
#include "tool_errors.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace homefin {

struct McpToolInfo {
  std::string name;
  std::string title;
  std::string description;
  nlohmann::json input_schema;
};

struct ToolCallResult {
  std::string raw_text;
  std::optional<nlohmann::json> structured_payload;
  std::string display_summary;
};

enum class McpClientState { kUninitialized, kInitializing, kReady, kStopped, kFailed };

const char* McpClientStateName(McpClientState state);

// Newest first. initialize is retried down this list.
const std::vector<std::string>& SupportedProtocolVersions();

struct McpClientOptions {
  // Used as server= in log lines.
  std::string name;
  std::chrono::milliseconds read_timeout{60000};
  std::chrono::milliseconds stop_grace{2000};
  std::vector<std::string> protocol_versions = SupportedProtocolVersions();
  // When set to true, pending reads fail with kCancelled.
  std::shared_ptr<std::atomic_bool> cancel_token;
};

// JSON-RPC client for one stdio tool server. One request in flight at a time.
class McpClient {
 public:
  explicit McpClient(LaunchSpec launch, McpClientOptions options = {});
  ~McpClient();
  McpClient(const McpClient&) = delete;
  McpClient& operator=(const McpClient&) = delete;

  bool Start(ToolError* err);
  std::vector<McpToolInfo> ListTools(ToolError* err);
  std::optional<ToolCallResult> CallTool(const std::string& name, const nlohmann::json& arguments, ToolError* err);
  void Stop();

  McpClientState state() const;
  std::string negotiated_version() const;
  std::optional<std::string> startup_error() const;
  pid_t pid() const;

 private:
  std::optional<nlohmann::json> Rpc(const std::string& method, const nlohmann::json& params, ToolError* err);
  bool Notify(const std::string& method, const nlohmann::json& params, ToolError* err);
  void FailLocked(const std::string& reason);

  LaunchSpec launch_;
  McpClientOptions options_;

  mutable std::mutex mu_;
  ProcessTransport transport_;
  McpClientState state_ = McpClientState::kUninitialized;
  int64_t next_id_ = 1;
  std::string negotiated_version_;
  std::optional<std::string> startup_error_;
};

// First text content item, or "{}" when the result carries none.
std::string ExtractToolResultText(const nlohmann::json& result);

// structuredContent (object or JSON-object string), else the text parsed as JSON.
std::optional<nlohmann::json> ExtractToolResultPayload(const nlohmann::json& result);

ToolCallResult MakeToolCallResult(const nlohmann::json& result);

}  // namespace homefin
