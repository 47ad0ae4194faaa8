#pragma once

#include "tooling.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace homefin {

using Clock = std::chrono::system_clock;

// A follow-up like "show details" only resolves against results this recent.
constexpr std::chrono::minutes kFollowUpWindow{30};

struct ChatMessage {
  std::string role;
  std::string content;
  std::string tool_call_id;
  std::vector<ToolCall> tool_calls;
};

struct IntentRecord {
  Clock::time_point timestamp;
  nlohmann::json payload;
};

struct ConversationContext {
  std::string last_intent;
  std::map<std::string, IntentRecord> last_result_by_intent;
  std::vector<std::string> enabled_tool_server_ids;

  void Record(const std::string& intent, nlohmann::json payload, Clock::time_point now);
  const IntentRecord* Find(const std::string& intent) const;
  // Ages up to and including the window count as recent.
  bool IsRecent(const std::string& intent, Clock::time_point now,
                std::chrono::seconds window = kFollowUpWindow) const;
  void Clear();
};

struct TurnRecord {
  std::string turn_id;
  std::string user_message;
  std::optional<std::string> output_text;
  std::string resolved_by;
  std::vector<std::string> tools_called;
  int rounds = 0;
};

struct Session {
  std::string session_id;
  std::vector<ChatMessage> history;
  std::vector<TurnRecord> turns;
  ConversationContext context;
  Clock::time_point last_activity;
};

struct SessionStoreConfig {
  std::string type = "memory";
  std::string file_path;
};

class SessionStore;

// Exclusive access to one session for the duration of a request.
class SessionLease {
 public:
  SessionLease(SessionLease&&) = default;
  SessionLease& operator=(SessionLease&&) = default;

  Session& session() { return *session_; }
  const Session& session() const { return *session_; }
  Session* operator->() { return session_; }

 private:
  friend class SessionManager;
  SessionLease(std::shared_ptr<void> owner, std::unique_lock<std::mutex> lock, Session* session)
      : owner_(std::move(owner)), lock_(std::move(lock)), session_(session) {}

  std::shared_ptr<void> owner_;
  std::unique_lock<std::mutex> lock_;
  Session* session_ = nullptr;
};

class SessionManager {
 public:
  explicit SessionManager(SessionStoreConfig cfg = {});
  ~SessionManager();

  std::string EnsureSessionId(const std::string& preferred);

  // Blocks while another request holds the same session.
  SessionLease Acquire(const std::string& session_id);

  // Writes history and turns to the configured store, if any.
  void Commit(const SessionLease& lease);

  // Drops history and conversation context.
  void Reset(const std::string& session_id);

  bool Exists(const std::string& session_id);
  size_t PruneIdle(Clock::time_point now, std::chrono::seconds max_idle);

 private:
  struct Slot {
    std::mutex mu;
    Session session;
  };

  std::shared_ptr<Slot> GetOrCreateSlot(const std::string& session_id);

  std::mutex mu_;
  std::unique_ptr<SessionStore> store_;
  std::unordered_map<std::string, std::shared_ptr<Slot>> sessions_;
};

std::string NewId(const std::string& prefix);

nlohmann::json ChatMessageToJson(const ChatMessage& m);

}  // namespace homefin
