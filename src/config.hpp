#pragma once

#include <string>
#include <vector>

namespace homefin {

struct HttpListenConfig {
  std::string host = "0.0.0.0";
  int port = 8080;
};

struct HttpEndpoint {
  std::string scheme = "http";
  std::string host = "127.0.0.1";
  int port = 11434;
  std::string base_path;
};

struct AssistantConfig {
  HttpListenConfig listen;
  HttpEndpoint model_endpoint;
  std::string model = "llama3.1";
  std::string model_api_key;

  // Builtin tool servers live in <tool_server_root>/<server dir>.
  std::string tool_server_root = "/opt/homefin/tool-servers";
  std::string tool_server_python = "python3";
  std::vector<std::string> default_enabled_servers;
  std::string custom_servers_json;
  // {"<server id>": {"<setting or VAR>": "value"}}
  std::string tool_server_env_json;

  int max_tool_rounds = 4;
  int tool_read_timeout_ms = 60000;
  int tool_stop_grace_ms = 2000;

  // "memory" or "file".
  std::string session_store = "memory";
  std::string session_file = "homefin_sessions.json";
  int session_idle_minutes = 240;
};

AssistantConfig LoadConfigFromEnv();

HttpEndpoint ParseHttpEndpoint(const std::string& url, int default_port);
std::vector<std::string> SplitCsv(const std::string& s);
bool TryParseBool(const std::string& s, bool* out);

}  // namespace homefin
