#pragma once

#include "session_manager.hpp"
#include "tool_servers.hpp"
#include "tool_session.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace homefin {

namespace intents {
constexpr const char* kDualSummary = "dual_summary";
constexpr const char* kDualDetails = "dual_details";
constexpr const char* kBalanceQuery = "balance_query";
constexpr const char* kBalanceDetails = "balance_details";
constexpr const char* kCharitableSummary = "charitable_summary";
constexpr const char* kCharitableDetails = "charitable_details";
constexpr const char* kArithmetic = "arithmetic";
}  // namespace intents

struct RouterToolCall {
  std::string server_id;
  std::string tool_name;
  std::string input;
  std::string output;
};

struct RouterResult {
  std::string intent;
  std::string response;
  std::vector<RouterToolCall> tools_called;
};

class IntentDetector {
 public:
  virtual ~IntentDetector() = default;
  virtual const char* Intent() const = 0;
  virtual bool Matches(const std::string& message, const ConversationContext& ctx, Clock::time_point now) const = 0;
};

// Detectors in priority order.
std::vector<std::unique_ptr<IntentDetector>> MakeDefaultDetectors();

class DeterministicRouter {
 public:
  DeterministicRouter(const ToolServerTable* defs, ToolInvokerFactory invoker_factory);

  // First matching detector wins. Returns nullopt when nothing matches.
  std::optional<std::string> Detect(const std::string& message, const ConversationContext& ctx, Clock::time_point now) const;

  // Resolves a match with a fixed sequence of tool calls and records the
  // result in ctx on success.
  std::optional<RouterResult> Route(const std::string& message, ConversationContext* ctx, Clock::time_point now) const;

 private:
  RouterResult Resolve(const std::string& intent, const std::string& message, ConversationContext* ctx,
                       Clock::time_point now) const;

  const ToolServerTable* defs_;
  ToolInvokerFactory invoker_factory_;
  std::vector<std::unique_ptr<IntentDetector>> detectors_;
};

bool IsFollowUpRequest(const std::string& message);
std::optional<std::pair<double, double>> ExtractAdditionOperands(const std::string& message);
std::optional<int64_t> ExtractTaxYear(const std::string& message);

// "$1,234.50"
std::string FormatMoney(double amount);

}  // namespace homefin
