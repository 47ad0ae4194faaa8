#include "mcp_client.hpp"

#include "log_util.hpp"

#include <iostream>
#include <string>
#include <utility>

namespace homefin {
namespace {

static std::string ExtractJsonRpcErrorMessage(const nlohmann::json& error) {
  if (error.is_object() && error.contains("message") && error["message"].is_string()) {
    auto msg = error["message"].get<std::string>();
    if (!msg.empty()) return msg;
  }
  return "json-rpc error";
}

// Server-initiated requests reuse the id space, so anything carrying a method is not a response.
static bool IsResponseFor(const nlohmann::json& msg, int64_t id) {
  if (!msg.is_object() || !msg.contains("id") || msg.contains("method")) return false;
  const auto& v = msg["id"];
  if (v.is_number_integer()) return v.get<int64_t>() == id;
  if (v.is_string()) return v.get<std::string>() == std::to_string(id);
  return false;
}

static std::optional<nlohmann::json> ParseJsonObject(const std::string& s) {
  auto j = nlohmann::json::parse(s, nullptr, false);
  if (j.is_discarded() || !j.is_object()) return std::nullopt;
  return j;
}

}  // namespace

const char* McpClientStateName(McpClientState state) {
  switch (state) {
    case McpClientState::kUninitialized:
      return "uninitialized";
    case McpClientState::kInitializing:
      return "initializing";
    case McpClientState::kReady:
      return "ready";
    case McpClientState::kStopped:
      return "stopped";
    case McpClientState::kFailed:
      return "failed";
  }
  return "unknown";
}

const std::vector<std::string>& SupportedProtocolVersions() {
  static const std::vector<std::string> versions = {"2025-06-18", "2025-03-26", "2024-11-05"};
  return versions;
}

McpClient::McpClient(LaunchSpec launch, McpClientOptions options)
    : launch_(std::move(launch)), options_(std::move(options)) {
  if (options_.name.empty() && !launch_.command.empty()) options_.name = launch_.command.front();
  transport_.SetCancelToken(options_.cancel_token);
}

McpClient::~McpClient() {
  Stop();
}

bool McpClient::Start(ToolError* err) {
  std::lock_guard<std::mutex> lock(mu_);
  if (state_ == McpClientState::kReady || state_ == McpClientState::kInitializing) {
    SetToolError(err, ToolErrorKind::kInvalidState, "client already started");
    return false;
  }
  if (state_ == McpClientState::kFailed) {
    SetToolError(err, ToolErrorKind::kInvalidState, "client failed; stop it before starting again");
    return false;
  }

  startup_error_.reset();
  negotiated_version_.clear();
  next_id_ = 1;

  ToolError spawn_err;
  if (!transport_.Start(launch_, &spawn_err)) {
    state_ = McpClientState::kFailed;
    startup_error_ = spawn_err.message;
    std::cout << "[tool-server] server=" << options_.name << " start=failed kind=" << ToolErrorKindName(spawn_err.kind)
              << " error=" << spawn_err.message << "\n";
    if (err) *err = std::move(spawn_err);
    return false;
  }
  state_ = McpClientState::kInitializing;
  std::cout << "[tool-server] server=" << options_.name << " pid=" << transport_.pid() << " started\n";

  std::string last_rejection;
  for (const auto& version : options_.protocol_versions) {
    nlohmann::json params;
    params["protocolVersion"] = version;
    params["capabilities"] = nlohmann::json::object();
    params["clientInfo"] = {{"name", "homefin"}, {"version", "0.1.0"}};
    ToolError rpc_err;
    auto r = Rpc("initialize", params, &rpc_err);
    if (r) {
      negotiated_version_ = version;
      break;
    }
    if (rpc_err.kind != ToolErrorKind::kProtocol) {
      // The process is gone or silent; no point trying older versions.
      last_rejection = rpc_err.message;
      break;
    }
    last_rejection = "protocolVersion " + version + " rejected: " + rpc_err.message;
    std::cout << "[tool-server] server=" << options_.name << " " << last_rejection << "\n";
  }

  if (negotiated_version_.empty()) {
    const std::string msg = "initialize failed: " + (last_rejection.empty() ? "no protocol versions" : last_rejection);
    FailLocked(msg);
    startup_error_ = msg;
    SetToolError(err, ToolErrorKind::kHandshake, msg);
    return false;
  }

  ToolError notify_err;
  if (!Notify("notifications/initialized", nlohmann::json::object(), &notify_err)) {
    const std::string msg = "initialized notification failed: " + notify_err.message;
    FailLocked(msg);
    startup_error_ = msg;
    SetToolError(err, ToolErrorKind::kHandshake, msg);
    return false;
  }

  state_ = McpClientState::kReady;
  std::cout << "[tool-server] server=" << options_.name << " ready protocol=" << negotiated_version_ << "\n";
  return true;
}

std::vector<McpToolInfo> McpClient::ListTools(ToolError* err) {
  std::lock_guard<std::mutex> lock(mu_);
  std::vector<McpToolInfo> out;
  if (state_ != McpClientState::kReady) {
    SetToolError(err, ToolErrorKind::kInvalidState,
                 std::string("tools/list requires a ready client, state=") + McpClientStateName(state_));
    return out;
  }
  std::string cursor;
  for (int page = 0; page < 64; page++) {
    nlohmann::json params = nlohmann::json::object();
    if (!cursor.empty()) params["cursor"] = cursor;
    auto r = Rpc("tools/list", params, err);
    if (!r) return {};
    if (!r->contains("tools") || !(*r)["tools"].is_array()) return out;
    for (const auto& t : (*r)["tools"]) {
      if (!t.is_object()) continue;
      McpToolInfo info;
      if (t.contains("name") && t["name"].is_string()) info.name = t["name"].get<std::string>();
      if (t.contains("title") && t["title"].is_string()) info.title = t["title"].get<std::string>();
      if (t.contains("description") && t["description"].is_string()) info.description = t["description"].get<std::string>();
      if (t.contains("inputSchema") && t["inputSchema"].is_object()) info.input_schema = t["inputSchema"];
      if (!info.name.empty()) out.push_back(std::move(info));
    }
    if (r->contains("nextCursor") && (*r)["nextCursor"].is_string()) {
      cursor = (*r)["nextCursor"].get<std::string>();
      if (cursor.empty()) break;
    } else {
      break;
    }
  }
  return out;
}

std::optional<ToolCallResult> McpClient::CallTool(const std::string& name,
                                                  const nlohmann::json& arguments,
                                                  ToolError* err) {
  std::lock_guard<std::mutex> lock(mu_);
  if (state_ != McpClientState::kReady) {
    SetToolError(err, ToolErrorKind::kInvalidState,
                 std::string("tools/call requires a ready client, state=") + McpClientStateName(state_));
    return std::nullopt;
  }
  nlohmann::json params;
  params["name"] = name;
  params["arguments"] = arguments.is_object() ? arguments : nlohmann::json::object();
  std::cout << "[mcp-call] server=" << options_.name << " tool=" << name
            << " args=" << TruncateForLog(SanitizeJsonForLog(params["arguments"]), 2000) << "\n";

  auto r = Rpc("tools/call", params, err);
  if (!r) {
    if (err) {
      std::cout << "[mcp-result] server=" << options_.name << " tool=" << name << " ok=0 kind=" << ToolErrorKindName(err->kind)
                << " error=" << TruncateForLog(err->message, 2000) << "\n";
    }
    return std::nullopt;
  }
  auto result = MakeToolCallResult(*r);
  std::cout << "[mcp-result] server=" << options_.name << " tool=" << name << " ok=1 text=" << TruncateForLog(result.raw_text, 2000)
            << "\n";
  return result;
}

void McpClient::Stop() {
  std::lock_guard<std::mutex> lock(mu_);
  const bool had_process = transport_.pid() > 0;
  const pid_t pid = transport_.pid();
  transport_.Terminate(options_.stop_grace);
  next_id_ = 1;
  negotiated_version_.clear();
  state_ = McpClientState::kStopped;
  if (had_process) std::cout << "[tool-server] server=" << options_.name << " pid=" << pid << " stopped\n";
}

McpClientState McpClient::state() const {
  std::lock_guard<std::mutex> lock(mu_);
  return state_;
}

std::string McpClient::negotiated_version() const {
  std::lock_guard<std::mutex> lock(mu_);
  return negotiated_version_;
}

std::optional<std::string> McpClient::startup_error() const {
  std::lock_guard<std::mutex> lock(mu_);
  return startup_error_;
}

pid_t McpClient::pid() const {
  std::lock_guard<std::mutex> lock(mu_);
  return transport_.pid();
}

// Caller holds mu_.
std::optional<nlohmann::json> McpClient::Rpc(const std::string& method,
                                             const nlohmann::json& params,
                                             ToolError* err) {
  const int64_t id = next_id_++;
  nlohmann::json req;
  req["jsonrpc"] = "2.0";
  req["id"] = id;
  req["method"] = method;
  req["params"] = params;

  using Clock = std::chrono::steady_clock;
  const auto deadline = Clock::now() + options_.read_timeout;

  ToolError io_err;
  if (!transport_.WriteLine(req.dump(), &io_err, options_.read_timeout)) {
    FailLocked(io_err.message);
    if (err) *err = std::move(io_err);
    return std::nullopt;
  }
  size_t discarded = 0;
  while (true) {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
    if (remaining.count() <= 0) {
      const std::string msg = method + " timed out after " + std::to_string(options_.read_timeout.count()) + "ms";
      FailLocked(msg);
      SetToolError(err, ToolErrorKind::kTimeout, msg);
      return std::nullopt;
    }
    auto line = transport_.ReadLine(remaining, &io_err);
    if (!line) {
      FailLocked(io_err.message);
      if (err) *err = std::move(io_err);
      return std::nullopt;
    }
    auto msg = ParseJsonObject(*line);
    if (!msg || !IsResponseFor(*msg, id)) {
      discarded++;
      continue;
    }
    if (discarded > 0) {
      std::cout << "[tool-server] server=" << options_.name << " method=" << method << " discarded=" << discarded << "\n";
    }
    if (msg->contains("error") && !(*msg)["error"].is_null()) {
      const auto& e = (*msg)["error"];
      SetToolError(err, ToolErrorKind::kProtocol, method + ": " + ExtractJsonRpcErrorMessage(e), e);
      return std::nullopt;
    }
    if (msg->contains("result")) return (*msg)["result"];
    SetToolError(err, ToolErrorKind::kProtocol, method + ": response has neither result nor error", *msg);
    return std::nullopt;
  }
}

// Caller holds mu_.
bool McpClient::Notify(const std::string& method, const nlohmann::json& params, ToolError* err) {
  nlohmann::json note;
  note["jsonrpc"] = "2.0";
  note["method"] = method;
  note["params"] = params;
  return transport_.WriteLine(note.dump(), err, options_.read_timeout);
}

// Caller holds mu_.
void McpClient::FailLocked(const std::string& reason) {
  std::cout << "[tool-server] server=" << options_.name << " failed state=" << McpClientStateName(state_)
            << " reason=" << TruncateForLog(reason, 1000) << "\n";
  state_ = McpClientState::kFailed;
  transport_.Terminate(options_.stop_grace);
}

std::string ExtractToolResultText(const nlohmann::json& result) {
  if (!result.is_object() || !result.contains("content") || !result["content"].is_array()) return "{}";
  const auto& content = result["content"];
  if (content.empty()) return "{}";
  const auto& first = content.front();
  if (first.is_object() && first.contains("text") && first["text"].is_string()) return first["text"].get<std::string>();
  return "{}";
}

std::optional<nlohmann::json> ExtractToolResultPayload(const nlohmann::json& result) {
  if (result.is_object()) {
    for (const char* key : {"structuredContent", "structured_content"}) {
      if (!result.contains(key)) continue;
      const auto& sc = result[key];
      if (sc.is_object()) return sc;
      if (sc.is_string()) {
        if (auto parsed = ParseJsonObject(sc.get<std::string>())) return parsed;
      }
    }
  }
  auto text = Trim(ExtractToolResultText(result));
  if (text.empty()) return std::nullopt;
  return ParseJsonObject(text);
}

ToolCallResult MakeToolCallResult(const nlohmann::json& result) {
  ToolCallResult out;
  out.raw_text = ExtractToolResultText(result);
  out.structured_payload = ExtractToolResultPayload(result);
  if (out.structured_payload) {
    const auto& p = *out.structured_payload;
    if (p.contains("error") && p["error"].is_string()) {
      out.display_summary = "error: " + p["error"].get<std::string>();
    } else {
      out.display_summary = TruncateForLog(p.dump(), 200);
    }
  } else {
    out.display_summary = TruncateForLog(Trim(out.raw_text), 200);
  }
  return out;
}

}  // namespace homefin
