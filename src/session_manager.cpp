#include "session_manager.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <sstream>
#include <string>
#include <vector>

namespace homefin {
namespace {

static std::string Hex(uint64_t v) {
  std::ostringstream oss;
  oss << std::hex << v;
  return oss.str();
}

static uint64_t Rand64() {
  static thread_local std::mt19937_64 rng(std::random_device{}());
  return rng();
}

static std::optional<ChatMessage> ChatMessageFromJson(const nlohmann::json& m) {
  if (!m.is_object() || !m.contains("role") || !m["role"].is_string()) return std::nullopt;
  ChatMessage cm;
  cm.role = m["role"].get<std::string>();
  if (m.contains("content") && m["content"].is_string()) cm.content = m["content"].get<std::string>();
  if (m.contains("tool_call_id") && m["tool_call_id"].is_string()) cm.tool_call_id = m["tool_call_id"].get<std::string>();
  if (m.contains("tool_calls") && m["tool_calls"].is_array()) {
    for (const auto& tc : m["tool_calls"]) {
      if (!tc.is_object()) continue;
      ToolCall c;
      if (tc.contains("id") && tc["id"].is_string()) c.id = tc["id"].get<std::string>();
      if (tc.contains("name") && tc["name"].is_string()) c.name = tc["name"].get<std::string>();
      if (tc.contains("arguments") && tc["arguments"].is_string()) c.arguments_json = tc["arguments"].get<std::string>();
      cm.tool_calls.push_back(std::move(c));
    }
  }
  return cm;
}

static nlohmann::json TurnToJson(const TurnRecord& t) {
  nlohmann::json tj;
  tj["turn_id"] = t.turn_id;
  tj["user_message"] = t.user_message;
  if (t.output_text.has_value()) tj["output_text"] = *t.output_text; else tj["output_text"] = nullptr;
  tj["resolved_by"] = t.resolved_by;
  tj["tools_called"] = t.tools_called;
  tj["rounds"] = t.rounds;
  return tj;
}

static TurnRecord TurnFromJson(const nlohmann::json& t) {
  TurnRecord tr;
  if (t.contains("turn_id") && t["turn_id"].is_string()) tr.turn_id = t["turn_id"].get<std::string>();
  if (t.contains("user_message") && t["user_message"].is_string()) tr.user_message = t["user_message"].get<std::string>();
  if (t.contains("output_text") && t["output_text"].is_string()) tr.output_text = t["output_text"].get<std::string>();
  if (t.contains("resolved_by") && t["resolved_by"].is_string()) tr.resolved_by = t["resolved_by"].get<std::string>();
  if (t.contains("tools_called") && t["tools_called"].is_array()) {
    for (const auto& n : t["tools_called"]) {
      if (n.is_string()) tr.tools_called.push_back(n.get<std::string>());
    }
  }
  if (t.contains("rounds") && t["rounds"].is_number_integer()) tr.rounds = t["rounds"].get<int>();
  return tr;
}

}  // namespace

nlohmann::json ChatMessageToJson(const ChatMessage& m) {
  nlohmann::json j = {{"role", m.role}, {"content", m.content}};
  if (!m.tool_call_id.empty()) j["tool_call_id"] = m.tool_call_id;
  if (!m.tool_calls.empty()) {
    j["tool_calls"] = nlohmann::json::array();
    for (const auto& c : m.tool_calls) {
      j["tool_calls"].push_back({{"id", c.id}, {"name", c.name}, {"arguments", c.arguments_json}});
    }
  }
  return j;
}

void ConversationContext::Record(const std::string& intent, nlohmann::json payload, Clock::time_point now) {
  last_intent = intent;
  last_result_by_intent[intent] = IntentRecord{now, std::move(payload)};
}

const IntentRecord* ConversationContext::Find(const std::string& intent) const {
  auto it = last_result_by_intent.find(intent);
  if (it == last_result_by_intent.end()) return nullptr;
  return &it->second;
}

bool ConversationContext::IsRecent(const std::string& intent, Clock::time_point now, std::chrono::seconds window) const {
  const auto* rec = Find(intent);
  if (!rec) return false;
  const auto age = now - rec->timestamp;
  if (age < Clock::duration::zero()) return true;
  return age <= window;
}

void ConversationContext::Clear() {
  last_intent.clear();
  last_result_by_intent.clear();
}

class SessionStore {
 public:
  virtual ~SessionStore() = default;
  virtual std::optional<Session> Load(const std::string& session_id) = 0;
  virtual void Save(const Session& s) = 0;
};

namespace {

// Conversation context is per-process state and is not persisted.
class FileSessionStore : public SessionStore {
 public:
  explicit FileSessionStore(std::string path) : path_(std::move(path)) { LoadAll(); }

  std::optional<Session> Load(const std::string& session_id) override {
    auto it = map_.find(session_id);
    if (it == map_.end()) return std::nullopt;
    return it->second;
  }

  void Save(const Session& s) override {
    Session copy;
    copy.session_id = s.session_id;
    copy.history = s.history;
    copy.turns = s.turns;
    map_[s.session_id] = std::move(copy);
    PersistAll();
  }

 private:
  std::string path_;
  std::unordered_map<std::string, Session> map_;

  void LoadAll() {
    std::filesystem::path p(path_);
    std::error_code ec;
    if (!std::filesystem::exists(p, ec)) return;
    std::ifstream in(p, std::ios::binary);
    if (!in) return;
    std::stringstream buf;
    buf << in.rdbuf();
    auto j = nlohmann::json::parse(buf.str(), nullptr, false);
    if (j.is_discarded() || !j.is_object() || !j.contains("sessions") || !j["sessions"].is_object()) {
      std::cout << "[session] ignoring unreadable store path=" << path_ << "\n";
      return;
    }
    for (auto it = j["sessions"].begin(); it != j["sessions"].end(); ++it) {
      if (it.key().empty() || !it.value().is_object()) continue;
      Session s;
      s.session_id = it.key();
      const auto& sj = it.value();
      if (sj.contains("history") && sj["history"].is_array()) {
        for (const auto& m : sj["history"]) {
          if (auto cm = ChatMessageFromJson(m)) s.history.push_back(std::move(*cm));
        }
      }
      if (sj.contains("turns") && sj["turns"].is_array()) {
        for (const auto& t : sj["turns"]) {
          if (t.is_object()) s.turns.push_back(TurnFromJson(t));
        }
      }
      map_.emplace(it.key(), std::move(s));
    }
  }

  nlohmann::json Snapshot() const {
    nlohmann::json out;
    out["sessions"] = nlohmann::json::object();
    for (const auto& it : map_) {
      const auto& s = it.second;
      nlohmann::json sj;
      sj["history"] = nlohmann::json::array();
      for (const auto& m : s.history) sj["history"].push_back(ChatMessageToJson(m));
      sj["turns"] = nlohmann::json::array();
      for (const auto& t : s.turns) sj["turns"].push_back(TurnToJson(t));
      out["sessions"][it.first] = std::move(sj);
    }
    return out;
  }

  void PersistAll() {
    std::filesystem::path path(path_);
    std::error_code ec;
    auto dir = path.parent_path();
    if (!dir.empty()) std::filesystem::create_directories(dir, ec);
    auto tmp = path;
    tmp += ".tmp";
    {
      std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
      if (!out) {
        std::cout << "[session] cannot write store path=" << tmp.string() << "\n";
        return;
      }
      out << Snapshot().dump();
    }
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
      std::cout << "[session] rename failed path=" << path_ << " error=" << ec.message() << "\n";
      std::filesystem::remove(tmp, ec);
    }
  }
};

}  // namespace

SessionManager::SessionManager(SessionStoreConfig cfg) {
  if (cfg.type == "file" && !cfg.file_path.empty()) {
    store_ = std::make_unique<FileSessionStore>(cfg.file_path);
  }
}

SessionManager::~SessionManager() {}

std::string NewId(const std::string& prefix) {
  auto now = static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch())
          .count());
  return prefix + "-" + Hex(now) + "-" + Hex(Rand64());
}

std::string SessionManager::EnsureSessionId(const std::string& preferred) {
  if (!preferred.empty()) return preferred;
  return NewId("sess");
}

std::shared_ptr<SessionManager::Slot> SessionManager::GetOrCreateSlot(const std::string& session_id) {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = sessions_.find(session_id);
  if (it != sessions_.end()) return it->second;
  auto slot = std::make_shared<Slot>();
  slot->session.session_id = session_id;
  if (store_) {
    if (auto loaded = store_->Load(session_id)) {
      slot->session.history = std::move(loaded->history);
      slot->session.turns = std::move(loaded->turns);
    }
  }
  slot->session.last_activity = Clock::now();
  sessions_[session_id] = slot;
  return slot;
}

SessionLease SessionManager::Acquire(const std::string& session_id) {
  auto slot = GetOrCreateSlot(session_id);
  std::unique_lock<std::mutex> lock(slot->mu);
  slot->session.last_activity = Clock::now();
  Session* session = &slot->session;
  return SessionLease(std::move(slot), std::move(lock), session);
}

void SessionManager::Commit(const SessionLease& lease) {
  if (!store_) return;
  std::lock_guard<std::mutex> lock(mu_);
  store_->Save(lease.session());
}

void SessionManager::Reset(const std::string& session_id) {
  auto lease = Acquire(session_id);
  lease->history.clear();
  lease->turns.clear();
  lease->context.Clear();
  Commit(lease);
}

bool SessionManager::Exists(const std::string& session_id) {
  std::lock_guard<std::mutex> lock(mu_);
  return sessions_.find(session_id) != sessions_.end();
}

size_t SessionManager::PruneIdle(Clock::time_point now, std::chrono::seconds max_idle) {
  std::lock_guard<std::mutex> lock(mu_);
  size_t removed = 0;
  for (auto it = sessions_.begin(); it != sessions_.end();) {
    auto& slot = it->second;
    std::unique_lock<std::mutex> slot_lock(slot->mu, std::try_to_lock);
    if (slot_lock.owns_lock() && now - slot->session.last_activity > max_idle) {
      slot_lock.unlock();
      it = sessions_.erase(it);
      removed++;
      continue;
    }
    ++it;
  }
  return removed;
}

}  // namespace homefin
