#pragma once

#include "config.hpp"
#include "process_transport.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace homefin {

struct ToolServerDefinition {
  std::string id;
  std::string display_name;
  std::string description;
  std::vector<std::string> command;
  std::string working_directory;
  bool default_enabled = false;
  std::vector<std::string> tool_names;
  std::optional<std::string> requires_connection;
  nlohmann::json settings_schema;
  // Extra environment for the server process, including exported settings.
  std::map<std::string, std::string> env;
  std::string source = "builtin";
};

// Keyed and ordered by server id.
using ToolServerTable = std::map<std::string, ToolServerDefinition>;

ToolServerTable BuiltinToolServerDefinitions(const AssistantConfig& cfg);

// Malformed input yields an empty table; malformed entries are skipped.
ToolServerTable LoadCustomServerDefinitions(const std::string& json_text);

// Builtins plus custom definitions. A custom id replaces a builtin one.
ToolServerTable LoadToolServerDefinitions(const AssistantConfig& cfg);

// Keeps known ids in first-seen order without duplicates. With no request the
// configured defaults apply, then each definition's default_enabled flag.
std::vector<std::string> NormalizeEnabledServerIds(const std::optional<std::vector<std::string>>& requested,
                                                   const AssistantConfig& cfg,
                                                   const ToolServerTable& defs);

// Per-server values from a JSON object keyed by server id. A key declared in
// the server's settings_schema is exported as HOMEFIN_MCP_<KEY>; any other key
// is used as the variable name. Schema defaults fill settings left unset.
void ApplyToolServerEnv(const std::string& json_text, ToolServerTable* defs);

std::string SettingEnvName(const std::string& key);

// The child inherits the environment minus the assistant's own HOMEFIN_*
// variables, so model keys and other servers' settings stay private.
LaunchSpec MakeLaunchSpec(const ToolServerDefinition& def);

nlohmann::json ToolServerDefinitionToJson(const ToolServerDefinition& def, bool enabled);

}  // namespace homefin
