#include <gtest/gtest.h>
#include "config.hpp"
#include "log_util.hpp"

#include <cstdlib>
#include <string>
#include <vector>

using namespace homefin;

TEST(ConfigTest, ParseHttpEndpoint) {
  auto ep = ParseHttpEndpoint("http://models.local:8000/openai/", 11434);
  EXPECT_EQ(ep.scheme, "http");
  EXPECT_EQ(ep.host, "models.local");
  EXPECT_EQ(ep.port, 8000);
  EXPECT_EQ(ep.base_path, "/openai");

  auto tls = ParseHttpEndpoint("https://api.example.com", 11434);
  EXPECT_EQ(tls.scheme, "https");
  EXPECT_EQ(tls.port, 443);
  EXPECT_TRUE(tls.base_path.empty());

  auto bare = ParseHttpEndpoint("localhost", 11434);
  EXPECT_EQ(bare.host, "localhost");
  EXPECT_EQ(bare.port, 11434);
}

TEST(ConfigTest, SplitCsvTrimsAndDropsBlanks) {
  EXPECT_EQ(SplitCsv(" hsa_ledger, ,charitable_ledger ,"),
            (std::vector<std::string>{"hsa_ledger", "charitable_ledger"}));
  EXPECT_TRUE(SplitCsv("").empty());
}

TEST(ConfigTest, TryParseBool) {
  bool v = false;
  EXPECT_TRUE(TryParseBool(" Yes ", &v));
  EXPECT_TRUE(v);
  EXPECT_TRUE(TryParseBool("off", &v));
  EXPECT_FALSE(v);
  EXPECT_FALSE(TryParseBool("maybe", &v));
  EXPECT_FALSE(TryParseBool("1", nullptr));
}

TEST(ConfigTest, LoadFromEnvironment) {
  setenv("HOMEFIN_LISTEN_PORT", "9090", 1);
  setenv("HOMEFIN_MODEL_ENDPOINT", "http://127.0.0.1:8081", 1);
  setenv("HOMEFIN_DEFAULT_ENABLED_SERVERS", "hsa_ledger,test_addition", 1);
  setenv("HOMEFIN_MAX_TOOL_ROUNDS", "-3", 1);
  setenv("HOMEFIN_SESSION_STORE", "FILE", 1);
  setenv("HOMEFIN_TOOL_SERVER_ENV_JSON", R"({"hsa_ledger":{"google_spreadsheet_id":"sheet-1"}})", 1);
  auto cfg = LoadConfigFromEnv();
  unsetenv("HOMEFIN_TOOL_SERVER_ENV_JSON");
  unsetenv("HOMEFIN_LISTEN_PORT");
  unsetenv("HOMEFIN_MODEL_ENDPOINT");
  unsetenv("HOMEFIN_DEFAULT_ENABLED_SERVERS");
  unsetenv("HOMEFIN_MAX_TOOL_ROUNDS");
  unsetenv("HOMEFIN_SESSION_STORE");

  EXPECT_EQ(cfg.listen.port, 9090);
  EXPECT_EQ(cfg.model_endpoint.port, 8081);
  EXPECT_EQ(cfg.default_enabled_servers, (std::vector<std::string>{"hsa_ledger", "test_addition"}));
  // Invalid values keep the default.
  EXPECT_EQ(cfg.max_tool_rounds, 4);
  EXPECT_EQ(cfg.session_store, "file");
  EXPECT_EQ(cfg.tool_server_env_json, R"({"hsa_ledger":{"google_spreadsheet_id":"sheet-1"}})");
}

TEST(LogUtilTest, TruncateForLog) {
  EXPECT_EQ(TruncateForLog("short", 10), "short");
  auto t = TruncateForLog(std::string(100, 'x'), 20);
  EXPECT_EQ(t.size(), 20u);
  EXPECT_NE(t.find("(truncated)"), std::string::npos);
  EXPECT_TRUE(TruncateForLog("abc", 0).empty());
}

TEST(LogUtilTest, SanitizeJsonForLogDropsSecrets) {
  nlohmann::json body = {{"api_key", "hunter2"}, {"env", {{"GOOGLE_API_TOKEN", "tok-123"}, {"PATH", "/bin"}}}, {"a", 1}};
  auto s = SanitizeJsonForLog(body);
  EXPECT_EQ(s.find("hunter2"), std::string::npos);
  EXPECT_EQ(s.find("tok-123"), std::string::npos);
  EXPECT_NE(s.find("/bin"), std::string::npos);
  EXPECT_NE(s.find("\"a\":1"), std::string::npos);
}
