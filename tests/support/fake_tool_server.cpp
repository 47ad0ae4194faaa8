// Line-delimited JSON-RPC tool server used by the process and client tests.
//
//   --accept-version V   only accept this protocolVersion in initialize
//   --noise              emit a non-JSON line and a stray response before each reply
//   --interleave         emit a same-id server request and a stale earlier-id response before each reply
//   --exit-on-call       exit with status 3 on tools/call
//   --hang-on-call       never answer tools/call
//   --exit-on-start      exit with status 2 before reading anything
//   --ignore-sigterm     keep running after SIGTERM
//   --paginate           split tools/list into two pages

#include <nlohmann/json.hpp>

#include <signal.h>
#include <unistd.h>

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>

namespace {

struct Options {
  std::string accept_version;
  bool noise = false;
  bool interleave = false;
  bool exit_on_call = false;
  bool hang_on_call = false;
  bool exit_on_start = false;
  bool ignore_sigterm = false;
  bool paginate = false;
};

static void Send(const nlohmann::json& msg) {
  std::cout << msg.dump() << "\n";
  std::cout.flush();
}

static void SendResult(const nlohmann::json& id, const nlohmann::json& result) {
  Send({{"jsonrpc", "2.0"}, {"id", id}, {"result", result}});
}

static void SendError(const nlohmann::json& id, int code, const std::string& message) {
  Send({{"jsonrpc", "2.0"}, {"id", id}, {"error", {{"code", code}, {"message", message}}}});
}

static nlohmann::json StructuredResult(const nlohmann::json& payload) {
  return {{"content", nlohmann::json::array({{{"type", "text"}, {"text", payload.dump()}}})},
          {"structuredContent", payload},
          {"isError", false}};
}

static nlohmann::json ToolList() {
  auto tool = [](const char* name, const char* description) {
    return nlohmann::json{{"name", name}, {"description", description}, {"inputSchema", {{"type", "object"}}}};
  };
  return nlohmann::json::array({tool("add_numbers", "Add two numbers."),
                                tool("get_unreimbursed_balance", "Total unreimbursed HSA expenses."),
                                tool("get_charitable_summary", "Charitable donation totals."),
                                tool("read_ledger_entries", "HSA ledger entries."),
                                tool("read_charitable_ledger_entries", "Donation entries."),
                                tool("fail_tool", "Always fails."),
                                tool("echo", "Returns its arguments."),
                                tool("plain_text", "Returns plain text.")});
}

static double Number(const nlohmann::json& args, const char* key) {
  if (!args.is_object() || !args.contains(key)) return 0.0;
  if (args[key].is_number()) return args[key].get<double>();
  return 0.0;
}

static void HandleToolCall(const nlohmann::json& id, const nlohmann::json& params) {
  const std::string name = params.value("name", "");
  const nlohmann::json args = params.contains("arguments") ? params["arguments"] : nlohmann::json::object();

  if (name == "add_numbers") {
    const double sum = Number(args, "a") + Number(args, "b");
    SendResult(id, StructuredResult({{"sum", sum}}));
  } else if (name == "get_unreimbursed_balance") {
    SendResult(id, StructuredResult({{"total_unreimbursed", 42.5}, {"count", 3}}));
  } else if (name == "get_charitable_summary") {
    nlohmann::json payload = {{"total", 1250.0},
                              {"tax_deductible_total", 1000.0},
                              {"by_organization", {{"Food Bank", 750.0}, {"Library", 500.0}}}};
    if (args.is_object() && args.contains("tax_year")) payload["requested_tax_year"] = args["tax_year"];
    SendResult(id, StructuredResult(payload));
  } else if (name == "read_ledger_entries") {
    nlohmann::json entries = nlohmann::json::array(
        {{{"service_date", "2024-02-01"}, {"provider", "Dental Care"}, {"amount", 30.0}},
         {{"service_date", "2024-03-10"}, {"provider", "Pharmacy"}, {"amount", 12.5}}});
    SendResult(id, StructuredResult({{"entries", entries}, {"count", 2}}));
  } else if (name == "read_charitable_ledger_entries") {
    nlohmann::json entries = nlohmann::json::array(
        {{{"donation_date", "2024-05-01"}, {"organization_name", "Food Bank"}, {"amount", 750.0}}});
    nlohmann::json payload = {{"entries", entries}, {"count", 1}};
    if (args.is_object() && args.contains("tax_year")) payload["requested_tax_year"] = args["tax_year"];
    SendResult(id, StructuredResult(payload));
  } else if (name == "fail_tool") {
    SendError(id, -32000, "tool exploded");
  } else if (name == "echo") {
    SendResult(id, StructuredResult({{"arguments", args}}));
  } else if (name == "plain_text") {
    SendResult(id, {{"content", nlohmann::json::array({{{"type", "text"}, {"text", "hello from plain_text"}}})}});
  } else {
    SendError(id, -32601, "unknown tool: " + name);
  }
}

}  // namespace

int main(int argc, char** argv) {
  Options opt;
  for (int i = 1; i < argc; i++) {
    const std::string a = argv[i];
    if (a == "--accept-version" && i + 1 < argc) {
      opt.accept_version = argv[++i];
    } else if (a == "--noise") {
      opt.noise = true;
    } else if (a == "--interleave") {
      opt.interleave = true;
    } else if (a == "--exit-on-call") {
      opt.exit_on_call = true;
    } else if (a == "--hang-on-call") {
      opt.hang_on_call = true;
    } else if (a == "--exit-on-start") {
      opt.exit_on_start = true;
    } else if (a == "--ignore-sigterm") {
      opt.ignore_sigterm = true;
    } else if (a == "--paginate") {
      opt.paginate = true;
    }
  }

  if (opt.ignore_sigterm) ::signal(SIGTERM, SIG_IGN);
  if (opt.exit_on_start) {
    std::cerr << "fake_tool_server: refusing to start" << std::endl;
    return 2;
  }
  std::cerr << "fake_tool_server: ready" << std::endl;

  std::string line;
  while (std::getline(std::cin, line)) {
    auto msg = nlohmann::json::parse(line, nullptr, false);
    if (msg.is_discarded() || !msg.is_object()) continue;
    if (!msg.contains("id")) continue;  // notification
    const auto id = msg["id"];
    const std::string method = msg.value("method", "");
    const nlohmann::json params = msg.contains("params") ? msg["params"] : nlohmann::json::object();

    if (opt.noise) {
      std::cout << "log: handling " << method << "\n";
      Send({{"jsonrpc", "2.0"}, {"id", 987654}, {"result", {{"stray", true}}}});
    }

    if (opt.interleave) {
      Send({{"jsonrpc", "2.0"}, {"id", id}, {"method", "ping"}});
      if (id.is_number_integer()) {
        Send({{"jsonrpc", "2.0"}, {"id", id.get<int64_t>() - 1}, {"result", {{"stale", true}}}});
      }
    }

    if (method == "initialize") {
      const std::string requested = params.value("protocolVersion", "");
      if (!opt.accept_version.empty() && requested != opt.accept_version) {
        SendError(id, -32602, "Unsupported protocol version: " + requested);
        continue;
      }
      SendResult(id, {{"protocolVersion", requested},
                      {"capabilities", {{"tools", nlohmann::json::object()}}},
                      {"serverInfo", {{"name", "fake_tool_server"}, {"version", "1.0"}}}});
    } else if (method == "tools/list") {
      auto tools = ToolList();
      if (!opt.paginate) {
        SendResult(id, {{"tools", tools}});
      } else if (!params.contains("cursor")) {
        nlohmann::json first = nlohmann::json::array();
        for (size_t i = 0; i < 3; i++) first.push_back(tools[i]);
        SendResult(id, {{"tools", first}, {"nextCursor", "page2"}});
      } else {
        nlohmann::json rest = nlohmann::json::array();
        for (size_t i = 3; i < tools.size(); i++) rest.push_back(tools[i]);
        SendResult(id, {{"tools", rest}});
      }
    } else if (method == "tools/call") {
      if (opt.exit_on_call) {
        std::cerr << "fake_tool_server: crashing on tools/call" << std::endl;
        std::_Exit(3);
      }
      if (opt.hang_on_call) {
        while (true) std::this_thread::sleep_for(std::chrono::seconds(1));
      }
      HandleToolCall(id, params);
    } else {
      SendError(id, -32601, "method not found: " + method);
    }
  }
  return 0;
}
