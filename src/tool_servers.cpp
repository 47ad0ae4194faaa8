#include "tool_servers.hpp"

#include "log_util.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>
#include <set>
#include <string>
#include <utility>

namespace homefin {
namespace {

static std::string JoinRoot(const std::string& root, const std::string& dir) {
  if (root.empty()) return dir;
  return (std::filesystem::path(root) / dir).string();
}

static std::string JsonScalarToString(const nlohmann::json& v) {
  if (v.is_string()) return v.get<std::string>();
  if (v.is_null()) return {};
  return v.dump();
}

static std::vector<std::string> NonBlankStrings(const nlohmann::json& arr) {
  std::vector<std::string> out;
  if (!arr.is_array()) return out;
  for (const auto& v : arr) {
    auto s = JsonScalarToString(v);
    if (!Trim(s).empty()) out.push_back(std::move(s));
  }
  return out;
}

static void ReadEnvObject(const nlohmann::json& obj, std::map<std::string, std::string>* out) {
  if (!obj.is_object()) return;
  for (auto it = obj.begin(); it != obj.end(); ++it) {
    const auto key = Trim(it.key());
    if (key.empty() || it.value().is_null() || it.value().is_structured()) continue;
    (*out)[key] = JsonScalarToString(it.value());
  }
}

static bool IsSettingKey(const ToolServerDefinition& def, const std::string& key) {
  if (!def.settings_schema.is_array()) return false;
  for (const auto& field : def.settings_schema) {
    if (field.is_object() && field.value("key", "") == key) return true;
  }
  return false;
}

static nlohmann::json SettingsField(const char* key, const char* label, bool required,
                                    const char* default_value = nullptr) {
  nlohmann::json f = {{"key", key}, {"label", label}, {"type", "string"}, {"required", required}};
  if (default_value) f["default"] = default_value;
  return f;
}

}  // namespace

ToolServerTable BuiltinToolServerDefinitions(const AssistantConfig& cfg) {
  ToolServerTable defs;

  ToolServerDefinition hsa;
  hsa.id = "hsa_ledger";
  hsa.display_name = "HSA Ledger";
  hsa.description = "Ledger tools for HSA receipts and reimbursements.";
  hsa.command = {cfg.tool_server_python, "-m", "homefin_hsa.server"};
  hsa.working_directory = JoinRoot(cfg.tool_server_root, "hsa-server");
  hsa.default_enabled = true;
  hsa.tool_names = {"get_unreimbursed_balance", "read_ledger_entries", "update_expense_status", "check_for_duplicates"};
  hsa.requires_connection = "google";
  hsa.settings_schema = nlohmann::json::array({
      SettingsField("google_spreadsheet_id", "Google Spreadsheet ID", true),
      SettingsField("google_worksheet_name", "Worksheet Name", true, "HSA_Ledger"),
      SettingsField("drive_root_folder_id", "Drive Root Folder ID", true),
  });
  defs[hsa.id] = std::move(hsa);

  ToolServerDefinition charitable;
  charitable.id = "charitable_ledger";
  charitable.display_name = "Charitable Ledger";
  charitable.description = "Ledger tools for charitable donations and tax-deductible totals.";
  charitable.command = {cfg.tool_server_python, "-m", "homefin_charitable.server"};
  charitable.working_directory = JoinRoot(cfg.tool_server_root, "charitable-server");
  charitable.default_enabled = true;
  charitable.tool_names = {"get_charitable_summary", "read_charitable_ledger_entries", "check_charitable_duplicates"};
  charitable.requires_connection = "google";
  charitable.settings_schema = nlohmann::json::array({
      SettingsField("google_spreadsheet_id", "Google Spreadsheet ID", true),
      SettingsField("google_worksheet_name", "Worksheet Name", true, "Charitable_Ledger"),
  });
  defs[charitable.id] = std::move(charitable);

  ToolServerDefinition addition;
  addition.id = "test_addition";
  addition.display_name = "Test Addition";
  addition.description = "Minimal tool server with add_numbers(a, b).";
  addition.command = {cfg.tool_server_python, "-m", "homefin_test_addition.server"};
  addition.working_directory = JoinRoot(cfg.tool_server_root, "test-addition-server");
  addition.default_enabled = false;
  addition.tool_names = {"add_numbers"};
  defs[addition.id] = std::move(addition);

  return defs;
}

ToolServerTable LoadCustomServerDefinitions(const std::string& json_text) {
  ToolServerTable defs;
  if (Trim(json_text).empty()) return defs;
  auto parsed = nlohmann::json::parse(json_text, nullptr, false);
  if (parsed.is_discarded() || !parsed.is_array()) {
    std::cout << "[tool-server] custom definitions ignored: expected a JSON array\n";
    return defs;
  }
  for (const auto& item : parsed) {
    if (!item.is_object()) continue;
    const std::string id = Trim(JsonScalarToString(item.value("id", nlohmann::json())));
    if (id.empty()) continue;
    auto command = NonBlankStrings(item.value("command", nlohmann::json()));
    if (command.empty()) continue;

    ToolServerDefinition def;
    def.id = id;
    auto name = JsonScalarToString(item.value("name", nlohmann::json()));
    def.display_name = name.empty() ? id : name;
    auto description = JsonScalarToString(item.value("description", nlohmann::json()));
    def.description = description.empty() ? "Custom tool server" : description;
    def.command = std::move(command);
    def.working_directory = JsonScalarToString(item.value("server_path", nlohmann::json()));
    const auto& enabled = item.value("default_enabled", nlohmann::json(false));
    def.default_enabled = enabled.is_boolean() ? enabled.get<bool>() : false;
    def.tool_names = NonBlankStrings(item.value("tools", nlohmann::json()));
    if (item.contains("requires_connection") && item["requires_connection"].is_string()) {
      def.requires_connection = item["requires_connection"].get<std::string>();
    }
    if (item.contains("settings_schema") && item["settings_schema"].is_array()) {
      def.settings_schema = item["settings_schema"];
    }
    if (item.contains("env")) ReadEnvObject(item["env"], &def.env);
    def.source = "custom";
    defs[def.id] = std::move(def);
  }
  return defs;
}

ToolServerTable LoadToolServerDefinitions(const AssistantConfig& cfg) {
  auto defs = BuiltinToolServerDefinitions(cfg);
  for (auto& kv : LoadCustomServerDefinitions(cfg.custom_servers_json)) {
    defs[kv.first] = std::move(kv.second);
  }
  ApplyToolServerEnv(cfg.tool_server_env_json, &defs);
  return defs;
}

std::string SettingEnvName(const std::string& key) {
  std::string out = "HOMEFIN_MCP_";
  for (char c : key) {
    const auto uc = static_cast<unsigned char>(c);
    out.push_back(std::isalnum(uc) ? static_cast<char>(std::toupper(uc)) : '_');
  }
  return out;
}

void ApplyToolServerEnv(const std::string& json_text, ToolServerTable* defs) {
  if (!defs) return;
  nlohmann::json parsed = nlohmann::json::object();
  if (!Trim(json_text).empty()) {
    parsed = nlohmann::json::parse(json_text, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
      std::cout << "[tool-server] server env ignored: expected a JSON object keyed by server id\n";
      parsed = nlohmann::json::object();
    }
  }
  for (auto& kv : *defs) {
    auto& def = kv.second;
    std::map<std::string, std::string> values;
    if (parsed.contains(def.id)) ReadEnvObject(parsed[def.id], &values);
    if (def.settings_schema.is_array()) {
      for (const auto& field : def.settings_schema) {
        if (!field.is_object() || !field.contains("default") || !field["default"].is_string()) continue;
        const std::string key = field.value("key", "");
        if (!key.empty() && values.find(key) == values.end()) values[key] = field["default"].get<std::string>();
      }
    }
    for (const auto& v : values) {
      def.env[IsSettingKey(def, v.first) ? SettingEnvName(v.first) : v.first] = v.second;
    }
  }
}

std::vector<std::string> NormalizeEnabledServerIds(const std::optional<std::vector<std::string>>& requested,
                                                   const AssistantConfig& cfg,
                                                   const ToolServerTable& defs) {
  std::vector<std::string> candidates;
  if (requested) {
    candidates = *requested;
  } else if (!cfg.default_enabled_servers.empty()) {
    candidates = cfg.default_enabled_servers;
  } else {
    for (const auto& kv : defs) {
      if (kv.second.default_enabled) candidates.push_back(kv.first);
    }
  }

  std::vector<std::string> out;
  std::set<std::string> seen;
  for (const auto& raw : candidates) {
    auto id = Trim(raw);
    if (defs.find(id) == defs.end()) continue;
    if (!seen.insert(id).second) continue;
    out.push_back(std::move(id));
  }
  return out;
}

LaunchSpec MakeLaunchSpec(const ToolServerDefinition& def) {
  LaunchSpec spec;
  spec.command = def.command;
  spec.working_directory = def.working_directory;
  spec.env.emplace_back("PYTHONUNBUFFERED", "1");
  for (const auto& kv : def.env) {
    if (kv.first != "PYTHONUNBUFFERED") spec.env.emplace_back(kv.first, kv.second);
  }
  spec.drop_env_prefixes.push_back("HOMEFIN_");
  return spec;
}

nlohmann::json ToolServerDefinitionToJson(const ToolServerDefinition& def, bool enabled) {
  nlohmann::json j;
  j["id"] = def.id;
  j["name"] = def.display_name;
  j["description"] = def.description;
  j["tools"] = def.tool_names;
  j["default_enabled"] = def.default_enabled;
  j["enabled"] = enabled;
  j["source"] = def.source;
  j["requires_connection"] = def.requires_connection ? nlohmann::json(*def.requires_connection) : nlohmann::json();
  j["settings_schema"] = def.settings_schema.is_array() ? def.settings_schema : nlohmann::json::array();
  return j;
}

}  // namespace homefin
