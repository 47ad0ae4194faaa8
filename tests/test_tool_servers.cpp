#include <gtest/gtest.h>
#include "tool_servers.hpp"

#include <stdlib.h>

#include <chrono>
#include <string>
#include <vector>

using namespace homefin;
using namespace std::chrono_literals;

namespace {

std::string EnvValue(const LaunchSpec& spec, const std::string& key) {
  for (const auto& kv : spec.env) {
    if (kv.first == key) return kv.second;
  }
  return "<unset>";
}

}  // namespace

class ToolServersTest : public ::testing::Test {
 protected:
  void SetUp() override {
    cfg.tool_server_root = "/srv/tools";
    cfg.tool_server_python = "/usr/bin/python3";
  }

  AssistantConfig cfg;
};

TEST_F(ToolServersTest, BuiltinDefinitions) {
  auto defs = BuiltinToolServerDefinitions(cfg);
  ASSERT_EQ(defs.size(), 3u);

  const auto& hsa = defs.at("hsa_ledger");
  EXPECT_EQ(hsa.display_name, "HSA Ledger");
  EXPECT_TRUE(hsa.default_enabled);
  EXPECT_EQ(hsa.working_directory, "/srv/tools/hsa-server");
  ASSERT_FALSE(hsa.command.empty());
  EXPECT_EQ(hsa.command.front(), "/usr/bin/python3");
  EXPECT_EQ(hsa.source, "builtin");
  ASSERT_TRUE(hsa.requires_connection.has_value());
  EXPECT_EQ(*hsa.requires_connection, "google");

  EXPECT_TRUE(defs.at("charitable_ledger").default_enabled);
  EXPECT_FALSE(defs.at("test_addition").default_enabled);
  EXPECT_EQ(defs.at("test_addition").tool_names, std::vector<std::string>{"add_numbers"});
}

TEST_F(ToolServersTest, CustomDefinitionsParseAndSkipMalformed) {
  const std::string text = R"([
    {"id": "budget", "name": "Budget", "command": ["node", "server.js"], "server_path": "/opt/budget",
     "default_enabled": true, "tools": ["get_budget", ""]},
    {"id": "", "command": ["x"]},
    {"id": "no_command"},
    {"id": "blank_command", "command": ["  "]},
    42
  ])";
  auto defs = LoadCustomServerDefinitions(text);
  ASSERT_EQ(defs.size(), 1u);
  const auto& budget = defs.at("budget");
  EXPECT_EQ(budget.display_name, "Budget");
  EXPECT_EQ(budget.working_directory, "/opt/budget");
  EXPECT_TRUE(budget.default_enabled);
  EXPECT_EQ(budget.tool_names, std::vector<std::string>{"get_budget"});
  EXPECT_EQ(budget.source, "custom");
  EXPECT_EQ(budget.description, "Custom tool server");
}

TEST_F(ToolServersTest, CustomDefinitionsRejectNonArray) {
  EXPECT_TRUE(LoadCustomServerDefinitions("").empty());
  EXPECT_TRUE(LoadCustomServerDefinitions("{not json").empty());
  EXPECT_TRUE(LoadCustomServerDefinitions(R"({"id":"x"})").empty());
}

TEST_F(ToolServersTest, CustomDefinitionReplacesBuiltin) {
  cfg.custom_servers_json = R"([{"id": "test_addition", "command": ["/opt/add"], "default_enabled": true}])";
  auto defs = LoadToolServerDefinitions(cfg);
  ASSERT_EQ(defs.size(), 3u);
  EXPECT_EQ(defs.at("test_addition").source, "custom");
  EXPECT_EQ(defs.at("test_addition").command, std::vector<std::string>{"/opt/add"});
}

TEST_F(ToolServersTest, EnabledIdsFromDefinitionDefaults) {
  auto defs = BuiltinToolServerDefinitions(cfg);
  auto ids = NormalizeEnabledServerIds(std::nullopt, cfg, defs);
  EXPECT_EQ(ids, (std::vector<std::string>{"charitable_ledger", "hsa_ledger"}));
}

TEST_F(ToolServersTest, EnabledIdsFromConfiguredDefaults) {
  auto defs = BuiltinToolServerDefinitions(cfg);
  cfg.default_enabled_servers = {"test_addition", "unknown", "hsa_ledger"};
  auto ids = NormalizeEnabledServerIds(std::nullopt, cfg, defs);
  EXPECT_EQ(ids, (std::vector<std::string>{"test_addition", "hsa_ledger"}));
}

TEST_F(ToolServersTest, ExplicitRequestWinsAndIsDeduplicated) {
  auto defs = BuiltinToolServerDefinitions(cfg);
  cfg.default_enabled_servers = {"hsa_ledger"};
  std::vector<std::string> requested = {" test_addition ", "bogus", "test_addition", "charitable_ledger"};
  auto ids = NormalizeEnabledServerIds(requested, cfg, defs);
  EXPECT_EQ(ids, (std::vector<std::string>{"test_addition", "charitable_ledger"}));
}

TEST_F(ToolServersTest, ExplicitEmptyRequestDisablesEverything) {
  auto defs = BuiltinToolServerDefinitions(cfg);
  auto ids = NormalizeEnabledServerIds(std::vector<std::string>{}, cfg, defs);
  EXPECT_TRUE(ids.empty());
}

TEST_F(ToolServersTest, LaunchSpecCarriesCommandAndUnbufferedPython) {
  auto defs = BuiltinToolServerDefinitions(cfg);
  auto spec = MakeLaunchSpec(defs.at("charitable_ledger"));
  EXPECT_EQ(spec.command, defs.at("charitable_ledger").command);
  EXPECT_EQ(spec.working_directory, "/srv/tools/charitable-server");
  bool unbuffered = false;
  for (const auto& kv : spec.env) {
    if (kv.first == "PYTHONUNBUFFERED" && kv.second == "1") unbuffered = true;
  }
  EXPECT_TRUE(unbuffered);
}

TEST_F(ToolServersTest, SettingsAndEnvironmentReachLaunchSpec) {
  cfg.custom_servers_json = R"([{"id": "budget", "command": ["/opt/budget"], "env": {"BUDGET_MODE": "strict", "NESTED": {}}}])";
  cfg.tool_server_env_json = R"({
    "hsa_ledger": {"google_spreadsheet_id": "sheet-1", "drive_root_folder_id": 42, "EXTRA_FLAG": "on"},
    "budget": {"BUDGET_REGION": "eu"},
    "unknown": {"X": "y"}
  })";
  auto defs = LoadToolServerDefinitions(cfg);

  auto hsa = MakeLaunchSpec(defs.at("hsa_ledger"));
  EXPECT_EQ(EnvValue(hsa, "HOMEFIN_MCP_GOOGLE_SPREADSHEET_ID"), "sheet-1");
  EXPECT_EQ(EnvValue(hsa, "HOMEFIN_MCP_DRIVE_ROOT_FOLDER_ID"), "42");
  EXPECT_EQ(EnvValue(hsa, "HOMEFIN_MCP_GOOGLE_WORKSHEET_NAME"), "HSA_Ledger");
  EXPECT_EQ(EnvValue(hsa, "EXTRA_FLAG"), "on");
  EXPECT_EQ(hsa.drop_env_prefixes, std::vector<std::string>{"HOMEFIN_"});

  // One server's settings never reach another.
  auto charitable = MakeLaunchSpec(defs.at("charitable_ledger"));
  EXPECT_EQ(EnvValue(charitable, "HOMEFIN_MCP_GOOGLE_SPREADSHEET_ID"), "<unset>");
  EXPECT_EQ(EnvValue(charitable, "HOMEFIN_MCP_GOOGLE_WORKSHEET_NAME"), "Charitable_Ledger");

  auto budget = MakeLaunchSpec(defs.at("budget"));
  EXPECT_EQ(EnvValue(budget, "BUDGET_MODE"), "strict");
  EXPECT_EQ(EnvValue(budget, "BUDGET_REGION"), "eu");
  EXPECT_EQ(EnvValue(budget, "NESTED"), "<unset>");
}

TEST_F(ToolServersTest, MalformedServerEnvKeepsDefaults) {
  cfg.tool_server_env_json = "[1, 2]";
  auto defs = LoadToolServerDefinitions(cfg);
  auto hsa = MakeLaunchSpec(defs.at("hsa_ledger"));
  EXPECT_EQ(EnvValue(hsa, "HOMEFIN_MCP_GOOGLE_WORKSHEET_NAME"), "HSA_Ledger");
  EXPECT_EQ(EnvValue(hsa, "HOMEFIN_MCP_GOOGLE_SPREADSHEET_ID"), "<unset>");
  EXPECT_EQ(SettingEnvName("google-sheet id"), "HOMEFIN_MCP_GOOGLE_SHEET_ID");
}

TEST_F(ToolServersTest, ChildSeesOwnSettingsButNotAssistantSecrets) {
  setenv("HOMEFIN_MODEL_API_KEY", "sk-secret", 1);
  ToolServerDefinition def;
  def.id = "shell";
  def.command = {"/bin/sh", "-c", "echo \"${HOMEFIN_MODEL_API_KEY:-none}|$HOMEFIN_MCP_SHEET|$SHELL_FLAG|${PATH:+path}\""};
  def.working_directory = "/";
  def.settings_schema = nlohmann::json::array({{{"key", "sheet"}, {"type", "string"}}});
  ToolServerTable defs;
  defs[def.id] = def;
  ApplyToolServerEnv(R"({"shell": {"sheet": "s-9", "SHELL_FLAG": "yes"}})", &defs);

  ProcessTransport t;
  ToolError err;
  const bool started = t.Start(MakeLaunchSpec(defs.at("shell")), &err);
  unsetenv("HOMEFIN_MODEL_API_KEY");
  ASSERT_TRUE(started) << err.message;
  auto line = t.ReadLine(5000ms, &err);
  ASSERT_TRUE(line.has_value()) << err.message;
  EXPECT_EQ(*line, "none|s-9|yes|path");
}

TEST_F(ToolServersTest, DefinitionJson) {
  auto defs = BuiltinToolServerDefinitions(cfg);
  auto j = ToolServerDefinitionToJson(defs.at("test_addition"), true);
  EXPECT_EQ(j["id"], "test_addition");
  EXPECT_EQ(j["enabled"], true);
  EXPECT_EQ(j["default_enabled"], false);
  EXPECT_TRUE(j["requires_connection"].is_null());
  EXPECT_TRUE(j["settings_schema"].is_array());
}
