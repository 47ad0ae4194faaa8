#include "chat_router.hpp"
#include "config.hpp"
#include "openai_compatible_http_provider.hpp"
#include "session_manager.hpp"
#include "tool_servers.hpp"
#include "tool_session.hpp"
#include "tooling.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

namespace {

std::atomic<bool> g_running{true};

void SignalHandler(int) {
  g_running = false;
}

}  // namespace

int main() {
  const auto cfg = homefin::LoadConfigFromEnv();

  const auto defs = homefin::LoadToolServerDefinitions(cfg);
  homefin::ToolRegistry registry;
  homefin::BuildToolRegistry(defs, &registry);
  for (const auto& kv : defs) {
    std::cout << "[tool-server] id=" << kv.first << " source=" << kv.second.source
              << " tools=" << kv.second.tool_names.size()
              << " default_enabled=" << (kv.second.default_enabled ? 1 : 0) << "\n";
  }

  homefin::SessionStoreConfig store_cfg;
  store_cfg.type = cfg.session_store;
  store_cfg.file_path = cfg.session_file;
  homefin::SessionManager sessions(store_cfg);

  homefin::OpenAiCompatibleHttpProvider model("openai_compatible", cfg.model_endpoint, cfg.model, cfg.model_api_key);
  std::cout << "[model] endpoint=" << cfg.model_endpoint.scheme << "://" << cfg.model_endpoint.host << ":"
            << cfg.model_endpoint.port << cfg.model_endpoint.base_path << " model=" << cfg.model << "\n";

  homefin::ToolSessionOptions tool_opts;
  tool_opts.read_timeout = std::chrono::milliseconds(cfg.tool_read_timeout_ms);
  tool_opts.stop_grace = std::chrono::milliseconds(cfg.tool_stop_grace_ms);
  // Set on shutdown so tool calls in flight stop waiting on their servers.
  auto shutdown = std::make_shared<std::atomic_bool>(false);
  tool_opts.cancel_token = shutdown;

  homefin::ChatService chat(&cfg, &defs, &registry, &sessions, &model, homefin::MakeArenaFactory(&defs, tool_opts));

  httplib::Server server;
  chat.Register(&server);

  server.set_exception_handler([](const httplib::Request&, httplib::Response& res, std::exception_ptr ep) {
    std::string message = "unknown exception";
    if (ep) {
      try {
        std::rethrow_exception(ep);
      } catch (const std::exception& e) {
        message = e.what();
      } catch (...) {
      }
    }
    std::cout << "[http] exception=" << message << "\n";
    nlohmann::json j;
    j["error"] = {{"message", message}, {"type", "server_error"}};
    res.status = 500;
    res.set_content(j.dump(), "application/json");
  });

  server.set_error_handler([](const httplib::Request&, httplib::Response& res) {
    if (!res.body.empty()) return;
    std::string message;
    std::string type = "invalid_request_error";
    if (res.status == 404) {
      message = "not found";
    } else if (res.status >= 500) {
      message = "upstream error";
      type = "api_error";
    } else {
      message = "bad request";
    }
    nlohmann::json j;
    j["error"] = {{"message", message}, {"type", type}};
    res.set_content(j.dump(), "application/json");
  });

  server.set_keep_alive_timeout(5);
  server.set_read_timeout(60);
  // Tool servers may take tool_read_timeout_ms per call across several rounds.
  server.set_write_timeout(300);

  server.Get("/health", [&](const httplib::Request&, httplib::Response& res) {
    const auto pruned = sessions.PruneIdle(std::chrono::system_clock::now(),
                                           std::chrono::minutes(cfg.session_idle_minutes));
    nlohmann::json j;
    j["ok"] = true;
    j["pruned_sessions"] = pruned;
    j["unix_seconds"] =
        std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch()).count();
    res.status = 200;
    res.set_content(j.dump(), "application/json");
  });

  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);

  std::cout << "[http] listen host=" << cfg.listen.host << " port=" << cfg.listen.port << "\n";
  std::atomic<bool> ok{false};
  std::atomic<bool> listening_done{false};
  std::thread listener([&]() {
    ok = server.listen(cfg.listen.host, cfg.listen.port);
    listening_done = true;
  });
  while (g_running && !listening_done) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }
  std::cout << "[http] shutting down\n";
  shutdown->store(true);
  // stop() is a no-op until listen() is running, so repeat it.
  while (!listening_done) {
    server.stop();
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
  }
  listener.join();
  std::cout << "[http] listen returned ok=" << (ok ? 1 : 0) << "\n";
  return ok ? 0 : 1;
}
