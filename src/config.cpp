#include "config.hpp"

#include "log_util.hpp"

#include <cstdlib>
#include <string>
#include <vector>

namespace homefin {
namespace {

static std::string GetEnvStr(const char* name) {
  const char* v = std::getenv(name);
  return v ? std::string(v) : std::string();
}

static void ReadPositiveInt(const char* name, int* out) {
  auto v = GetEnvStr(name);
  if (v.empty()) return;
  char* end = nullptr;
  long n = std::strtol(v.c_str(), &end, 10);
  if (end == v.c_str() || n <= 0 || n > 86400000) return;
  *out = static_cast<int>(n);
}

}  // namespace

HttpEndpoint ParseHttpEndpoint(const std::string& url, int default_port) {
  HttpEndpoint ep;
  ep.port = 0;
  std::string s = url;
  if (StartsWith(s, "http://")) {
    ep.scheme = "http";
    s = s.substr(7);
  } else if (StartsWith(s, "https://")) {
    ep.scheme = "https";
    s = s.substr(8);
  }

  auto slash_pos = s.find('/');
  if (slash_pos != std::string::npos) {
    ep.base_path = s.substr(slash_pos);
    s = s.substr(0, slash_pos);
  }
  while (!ep.base_path.empty() && ep.base_path.back() == '/') ep.base_path.pop_back();

  auto colon_pos = s.rfind(':');
  if (colon_pos != std::string::npos) {
    ep.host = s.substr(0, colon_pos);
    ep.port = std::atoi(s.substr(colon_pos + 1).c_str());
  } else if (!s.empty()) {
    ep.host = s;
  }
  if (ep.port == 0) ep.port = ep.scheme == "https" ? 443 : default_port;
  if (ep.host.empty()) ep.host = "127.0.0.1";
  return ep;
}

std::vector<std::string> SplitCsv(const std::string& s) {
  std::vector<std::string> out;
  std::string cur;
  for (char c : s) {
    if (c == ',') {
      out.push_back(Trim(cur));
      cur.clear();
      continue;
    }
    cur.push_back(c);
  }
  out.push_back(Trim(cur));
  std::vector<std::string> filtered;
  for (auto& v : out) {
    if (!v.empty()) filtered.push_back(std::move(v));
  }
  return filtered;
}

bool TryParseBool(const std::string& s, bool* out) {
  if (!out) return false;
  const std::string v = ToLower(Trim(s));
  if (v == "1" || v == "true" || v == "yes" || v == "y" || v == "on") {
    *out = true;
    return true;
  }
  if (v == "0" || v == "false" || v == "no" || v == "n" || v == "off") {
    *out = false;
    return true;
  }
  return false;
}

AssistantConfig LoadConfigFromEnv() {
  AssistantConfig cfg;

  if (auto host = GetEnvStr("HOMEFIN_LISTEN_HOST"); !host.empty()) cfg.listen.host = host;
  ReadPositiveInt("HOMEFIN_LISTEN_PORT", &cfg.listen.port);

  if (auto ep = GetEnvStr("HOMEFIN_MODEL_ENDPOINT"); !ep.empty()) cfg.model_endpoint = ParseHttpEndpoint(ep, 11434);
  if (auto model = GetEnvStr("HOMEFIN_MODEL"); !model.empty()) cfg.model = model;
  cfg.model_api_key = GetEnvStr("HOMEFIN_MODEL_API_KEY");

  if (auto root = GetEnvStr("HOMEFIN_TOOL_SERVER_ROOT"); !root.empty()) cfg.tool_server_root = root;
  if (auto py = GetEnvStr("HOMEFIN_TOOL_SERVER_PYTHON"); !py.empty()) cfg.tool_server_python = py;
  cfg.default_enabled_servers = SplitCsv(GetEnvStr("HOMEFIN_DEFAULT_ENABLED_SERVERS"));
  cfg.custom_servers_json = GetEnvStr("HOMEFIN_CUSTOM_SERVERS_JSON");
  cfg.tool_server_env_json = GetEnvStr("HOMEFIN_TOOL_SERVER_ENV_JSON");

  ReadPositiveInt("HOMEFIN_MAX_TOOL_ROUNDS", &cfg.max_tool_rounds);
  ReadPositiveInt("HOMEFIN_TOOL_READ_TIMEOUT_MS", &cfg.tool_read_timeout_ms);
  ReadPositiveInt("HOMEFIN_TOOL_STOP_GRACE_MS", &cfg.tool_stop_grace_ms);

  if (auto store = ToLower(Trim(GetEnvStr("HOMEFIN_SESSION_STORE"))); store == "memory" || store == "file") {
    cfg.session_store = store;
  }
  if (auto file = GetEnvStr("HOMEFIN_SESSION_FILE"); !file.empty()) cfg.session_file = file;
  ReadPositiveInt("HOMEFIN_SESSION_IDLE_MINUTES", &cfg.session_idle_minutes);
  return cfg;
}

}  // namespace homefin
