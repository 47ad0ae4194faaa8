#include "intent_router.hpp"

#include "log_util.hpp"
#include "tooling.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <regex>
#include <string>
#include <utility>

namespace homefin {
namespace {

constexpr const char* kHsaServer = "hsa_ledger";
constexpr const char* kCharitableServer = "charitable_ledger";
constexpr const char* kAdditionServer = "test_addition";
constexpr size_t kMaxDetailLines = 10;

static std::regex Icase(const char* pattern) {
  return std::regex(pattern, std::regex::ECMAScript | std::regex::icase);
}

static bool AnyMatch(const std::vector<std::regex>& patterns, const std::string& text) {
  for (const auto& re : patterns) {
    if (std::regex_search(text, re)) return true;
  }
  return false;
}

static const std::vector<std::regex>& BalancePatterns() {
  static const std::vector<std::regex> patterns = {
      Icase(R"(\b(what'?s|what is|show|tell me|check|get)\b.{0,20}\bbalance\b)"),
      Icase(R"(\bhow much\b.{0,40}\b(unreimbursed|reimburse\w*|hsa)\b)"),
      Icase(R"(\b(unreimbursed|hsa)\b.{0,20}\b(balance|total|amount)\b)"),
      Icase(R"(\bwaiting\b.{0,20}\breimburs)"),
      Icase(R"(^\s*(my\s+)?(hsa\s+)?balance\s*\??\s*$)"),
  };
  return patterns;
}

static const std::vector<std::regex>& CharitablePatterns() {
  static const std::vector<std::regex> patterns = {
      Icase(R"(\b(charitable|charity|charities|donations?|donated|giving)\b.{0,40}\b(summary|total|totals|how much|breakdown|so far|deductible)\b)"),
      Icase(R"(\b(summary|summarize|total|totals|how much|breakdown)\b.{0,40}\b(charitable|charity|charities|donations?|donated|giving)\b)"),
  };
  return patterns;
}

static bool MentionsBalanceTopic(const std::string& message) {
  static const std::regex re = Icase(R"(\b(hsa|unreimbursed|balance)\b)");
  return std::regex_search(message, re);
}

static bool MentionsCharitableTopic(const std::string& message) {
  static const std::regex re = Icase(R"(\b(charitable|charity|charities|donations?|donated|giving)\b)");
  return std::regex_search(message, re);
}

static bool IsEnabled(const ConversationContext& ctx, const std::string& server_id) {
  const auto& ids = ctx.enabled_tool_server_ids;
  return std::find(ids.begin(), ids.end(), server_id) != ids.end();
}

static bool IsExplicitAdditionRequest(const std::string& message) {
  const auto lower = ToLower(message);
  return lower.find("addition tool") != std::string::npos || lower.find("mcp server") != std::string::npos ||
         lower.find("mcp-server") != std::string::npos || lower.find("add_numbers") != std::string::npos;
}

class DualSummaryDetector : public IntentDetector {
 public:
  const char* Intent() const override { return intents::kDualSummary; }
  bool Matches(const std::string& message, const ConversationContext&, Clock::time_point) const override {
    if (!MentionsBalanceTopic(message) || !MentionsCharitableTopic(message)) return false;
    // Both topics must come with a lookup shape; "can I pay for donations from my HSA" is not one.
    static const std::regex both = Icase(R"(\bboth\b.{0,60}\b(balances?|totals?|summar\w*|amounts?)\b)");
    return AnyMatch(BalancePatterns(), message) || AnyMatch(CharitablePatterns(), message) ||
           std::regex_search(message, both);
  }
};

class FollowUpDetector : public IntentDetector {
 public:
  FollowUpDetector(const char* intent, std::initializer_list<const char*> after) : intent_(intent), after_(after) {}

  const char* Intent() const override { return intent_; }
  bool Matches(const std::string& message, const ConversationContext& ctx, Clock::time_point now) const override {
    if (!IsFollowUpRequest(message)) return false;
    bool follows = false;
    for (const auto* prior : after_) {
      if (ctx.last_intent == prior) follows = true;
    }
    return follows && ctx.IsRecent(ctx.last_intent, now);
  }

 private:
  const char* intent_;
  std::vector<const char*> after_;
};

class BalanceDetector : public IntentDetector {
 public:
  const char* Intent() const override { return intents::kBalanceQuery; }
  bool Matches(const std::string& message, const ConversationContext&, Clock::time_point) const override {
    return AnyMatch(BalancePatterns(), message);
  }
};

class CharitableSummaryDetector : public IntentDetector {
 public:
  const char* Intent() const override { return intents::kCharitableSummary; }
  bool Matches(const std::string& message, const ConversationContext&, Clock::time_point) const override {
    return AnyMatch(CharitablePatterns(), message);
  }
};

class ArithmeticDetector : public IntentDetector {
 public:
  const char* Intent() const override { return intents::kArithmetic; }
  bool Matches(const std::string& message, const ConversationContext& ctx, Clock::time_point) const override {
    if (!IsEnabled(ctx, kAdditionServer) && !IsExplicitAdditionRequest(message)) return false;
    return ExtractAdditionOperands(message).has_value();
  }
};

struct ToolOutcome {
  bool ok = false;
  nlohmann::json payload;
  std::string error;
};

static std::optional<double> JsonNumber(const nlohmann::json& obj, const char* key) {
  if (!obj.is_object() || !obj.contains(key)) return std::nullopt;
  const auto& v = obj[key];
  if (v.is_number()) return v.get<double>();
  if (v.is_string()) {
    const auto s = Trim(v.get<std::string>());
    char* end = nullptr;
    const double d = std::strtod(s.c_str(), &end);
    if (!s.empty() && end && *end == '\0') return d;
  }
  return std::nullopt;
}

static std::string JsonText(const nlohmann::json& obj, std::initializer_list<const char*> keys) {
  if (!obj.is_object()) return {};
  for (const auto* key : keys) {
    if (obj.contains(key) && obj[key].is_string()) return obj[key].get<std::string>();
  }
  return {};
}

static std::optional<std::string> PayloadFailure(const nlohmann::json& payload) {
  if (!payload.is_object()) return std::string("the tool returned an unreadable result");
  if (payload.contains("success") && payload["success"].is_boolean() && !payload["success"].get<bool>()) {
    auto msg = JsonText(payload, {"error", "message"});
    return msg.empty() ? std::string("unknown error") : msg;
  }
  if (payload.contains("error") && payload["error"].is_string() && !payload["error"].get<std::string>().empty()) {
    return payload["error"].get<std::string>();
  }
  return std::nullopt;
}

static ToolOutcome CallTool(ToolInvoker* invoker, const char* server_id, const char* tool_name, const ToolArguments& args,
                            const std::string& input_label, std::vector<RouterToolCall>* calls) {
  ToolOutcome out;
  ToolError err;
  auto result = invoker->Invoke(server_id, tool_name, ToJson(args), &err);
  RouterToolCall record{server_id, tool_name, input_label, {}};
  if (!result) {
    out.error = err.message.empty() ? ToolErrorKindName(err.kind) : err.message;
  } else if (!result->structured_payload) {
    out.error = "the tool returned an unreadable result";
  } else if (auto failure = PayloadFailure(*result->structured_payload)) {
    out.error = *failure;
  } else {
    out.ok = true;
    out.payload = *result->structured_payload;
  }
  record.output = out.ok ? TruncateForLog(out.payload.dump(), 500) : "error: " + out.error;
  if (calls) calls->push_back(std::move(record));
  return out;
}

static std::string Plural(int64_t n, const char* singular, const char* plural) {
  return std::to_string(n) + " " + (n == 1 ? singular : plural);
}

static std::string BalanceSentence(const nlohmann::json& payload) {
  const double total = JsonNumber(payload, "total_unreimbursed").value_or(0.0);
  const auto count = static_cast<int64_t>(JsonNumber(payload, "count").value_or(0.0));
  if (count == 0 && total == 0.0) return "You have no unreimbursed HSA expenses right now.";
  return "Your unreimbursed HSA balance is " + FormatMoney(total) + " across " + Plural(count, "expense", "expenses") + ".";
}

static std::vector<std::pair<std::string, double>> OrganizationTotals(const nlohmann::json& payload) {
  std::vector<std::pair<std::string, double>> out;
  if (!payload.is_object() || !payload.contains("by_organization")) return out;
  const auto& by_org = payload["by_organization"];
  if (by_org.is_object()) {
    for (auto it = by_org.begin(); it != by_org.end(); ++it) {
      if (it.value().is_number()) {
        out.emplace_back(it.key(), it.value().get<double>());
      } else if (auto total = JsonNumber(it.value(), "total")) {
        out.emplace_back(it.key(), *total);
      }
    }
  } else if (by_org.is_array()) {
    for (const auto& item : by_org) {
      auto name = JsonText(item, {"organization", "organization_name", "name"});
      auto total = JsonNumber(item, "total");
      if (!name.empty() && total) out.emplace_back(name, *total);
    }
  }
  std::stable_sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.second > b.second; });
  return out;
}

static std::string CharitableSentence(const nlohmann::json& payload, std::optional<int64_t> tax_year) {
  const double total = JsonNumber(payload, "total").value_or(0.0);
  const double deductible = JsonNumber(payload, "tax_deductible_total").value_or(0.0);
  std::string scope = tax_year ? " for " + std::to_string(*tax_year) : std::string();
  if (total == 0.0) return "I don't see any charitable donations" + scope + " yet.";
  std::string text = "Your charitable donations" + scope + " total " + FormatMoney(total) + ", of which " +
                     FormatMoney(deductible) + " is tax-deductible.";
  auto orgs = OrganizationTotals(payload);
  if (!orgs.empty()) {
    text += " Top organizations: ";
    for (size_t i = 0; i < orgs.size() && i < 3; i++) {
      if (i > 0) text += ", ";
      text += orgs[i].first + " (" + FormatMoney(orgs[i].second) + ")";
    }
    text += ".";
  }
  return text;
}

static std::string EntryLines(const nlohmann::json& payload, std::initializer_list<const char*> date_keys,
                              std::initializer_list<const char*> name_keys, const char* empty_text) {
  if (!payload.is_object() || !payload.contains("entries") || !payload["entries"].is_array() ||
      payload["entries"].empty()) {
    return empty_text;
  }
  const auto& entries = payload["entries"];
  std::string text;
  size_t shown = 0;
  for (const auto& e : entries) {
    if (!e.is_object()) continue;
    if (shown == kMaxDetailLines) break;
    auto date = JsonText(e, date_keys);
    auto name = JsonText(e, name_keys);
    text += "\n- ";
    if (!date.empty()) text += date + " ";
    text += name.empty() ? std::string("(unnamed)") : name;
    if (auto amount = JsonNumber(e, "amount")) text += ": " + FormatMoney(*amount);
    shown++;
  }
  if (entries.size() > shown) text += "\n...and " + std::to_string(entries.size() - shown) + " more.";
  return text;
}

static std::string BalanceDetailsText(const nlohmann::json& payload) {
  return "Here are your unreimbursed HSA expenses:" +
         EntryLines(payload, {"service_date", "date"}, {"provider", "description"}, "\nNo unreimbursed expenses found.");
}

static std::string CharitableDetailsText(const nlohmann::json& payload) {
  return "Here are your charitable donations:" +
         EntryLines(payload, {"donation_date", "date"}, {"organization_name", "organization"}, "\nNo donations found.");
}

static std::optional<int64_t> RecordedTaxYear(const ConversationContext& ctx) {
  const auto* rec = ctx.Find(intents::kCharitableSummary);
  if (!rec || !rec->payload.is_object() || !rec->payload.contains("tax_year")) return std::nullopt;
  const auto& y = rec->payload["tax_year"];
  if (y.is_number_integer()) return y.get<int64_t>();
  return std::nullopt;
}

}  // namespace

bool IsFollowUpRequest(const std::string& message) {
  static const std::vector<std::regex> patterns = {
      Icase(R"(^(please\s+)?(show|give|see|view|expand|list)(\s+me)?(\s+the)?(\s+more)?\s+(details?|breakdown|info|information|entries)(\s+please)?$)"),
      Icase(R"(^(more\s+)?(details?|breakdown|info)(\s+please)?$)"),
      Icase(R"(^(can you\s+)?(break\s+(it|that|this)\s+down|tell\s+me\s+more)(\s+please)?$)"),
  };
  auto text = Trim(message);
  while (!text.empty() && (text.back() == '.' || text.back() == '!' || text.back() == '?')) text.pop_back();
  text = Trim(text);
  if (text.empty()) return false;
  return AnyMatch(patterns, text);
}

std::optional<std::pair<double, double>> ExtractAdditionOperands(const std::string& message) {
  static const std::regex plus_re(R"((-?\d+(?:\.\d+)?)\s*\+\s*(-?\d+(?:\.\d+)?))");
  static const std::regex add_re = Icase(R"(\badd\s+(-?\d+(?:\.\d+)?)\s+(?:and|to)\s+(-?\d+(?:\.\d+)?)\b)");
  std::smatch m;
  if (std::regex_search(message, m, plus_re) || std::regex_search(message, m, add_re)) {
    return std::make_pair(std::strtod(m[1].str().c_str(), nullptr), std::strtod(m[2].str().c_str(), nullptr));
  }
  return std::nullopt;
}

std::optional<int64_t> ExtractTaxYear(const std::string& message) {
  static const std::regex year_re(R"(\b((?:19|20)\d{2})\b)");
  std::smatch m;
  if (!std::regex_search(message, m, year_re)) return std::nullopt;
  return std::stoll(m[1].str());
}

std::string FormatMoney(double amount) {
  const bool negative = amount < 0;
  const auto cents = static_cast<long long>(std::llround(std::fabs(amount) * 100.0));
  std::string whole = std::to_string(cents / 100);
  for (int i = static_cast<int>(whole.size()) - 3; i > 0; i -= 3) whole.insert(static_cast<size_t>(i), ",");
  char frac[8];
  std::snprintf(frac, sizeof(frac), "%02lld", cents % 100);
  return std::string(negative ? "-$" : "$") + whole + "." + frac;
}

std::vector<std::unique_ptr<IntentDetector>> MakeDefaultDetectors() {
  std::vector<std::unique_ptr<IntentDetector>> out;
  out.push_back(std::make_unique<DualSummaryDetector>());
  out.push_back(std::make_unique<FollowUpDetector>(intents::kDualDetails,
                                                   std::initializer_list<const char*>{intents::kDualSummary, intents::kDualDetails}));
  out.push_back(std::make_unique<FollowUpDetector>(
      intents::kBalanceDetails, std::initializer_list<const char*>{intents::kBalanceQuery, intents::kBalanceDetails}));
  out.push_back(std::make_unique<FollowUpDetector>(
      intents::kCharitableDetails,
      std::initializer_list<const char*>{intents::kCharitableSummary, intents::kCharitableDetails}));
  out.push_back(std::make_unique<BalanceDetector>());
  out.push_back(std::make_unique<CharitableSummaryDetector>());
  out.push_back(std::make_unique<ArithmeticDetector>());
  return out;
}

DeterministicRouter::DeterministicRouter(const ToolServerTable* defs, ToolInvokerFactory invoker_factory)
    : defs_(defs), invoker_factory_(std::move(invoker_factory)), detectors_(MakeDefaultDetectors()) {}

std::optional<std::string> DeterministicRouter::Detect(const std::string& message, const ConversationContext& ctx,
                                                       Clock::time_point now) const {
  for (const auto& d : detectors_) {
    if (d->Matches(message, ctx, now)) return std::string(d->Intent());
  }
  return std::nullopt;
}

std::optional<RouterResult> DeterministicRouter::Route(const std::string& message, ConversationContext* ctx,
                                                       Clock::time_point now) const {
  if (!ctx) return std::nullopt;
  auto intent = Detect(message, *ctx, now);
  if (!intent) return std::nullopt;
  std::cout << "[router] intent=" << *intent << " message=" << TruncateForLog(message, 200) << "\n";
  auto result = Resolve(*intent, message, ctx, now);
  std::cout << "[router] intent=" << *intent << " tools=" << result.tools_called.size()
            << " last_intent=" << (ctx->last_intent.empty() ? "-" : ctx->last_intent) << "\n";
  return result;
}

RouterResult DeterministicRouter::Resolve(const std::string& intent, const std::string& message, ConversationContext* ctx,
                                          Clock::time_point now) const {
  RouterResult out;
  out.intent = intent;

  auto display_name = [&](const char* server_id) {
    if (defs_) {
      auto it = defs_->find(server_id);
      if (it != defs_->end()) return it->second.display_name;
    }
    return std::string(server_id);
  };
  // Explanation for the first required server that is disabled, if any.
  auto disabled = [&](std::initializer_list<const char*> servers, const char* purpose) -> std::optional<std::string> {
    for (const auto* id : servers) {
      if (!IsEnabled(*ctx, id)) {
        return "The " + display_name(id) + " tool server is turned off for this chat, so I can't " + purpose +
               ". Enable it in your tool settings and ask again.";
      }
    }
    return std::nullopt;
  };

  std::optional<std::string> refusal;
  if (intent == intents::kDualSummary || intent == intents::kDualDetails) {
    refusal = disabled({kHsaServer, kCharitableServer}, "look up both summaries");
  } else if (intent == intents::kBalanceQuery || intent == intents::kBalanceDetails) {
    refusal = disabled({kHsaServer}, "check your HSA balance");
  } else if (intent == intents::kCharitableSummary || intent == intents::kCharitableDetails) {
    refusal = disabled({kCharitableServer}, "summarize your charitable donations");
  } else if (intent == intents::kArithmetic) {
    refusal = disabled({kAdditionServer}, "use the addition tool");
  }
  if (refusal) {
    out.response = *refusal;
    return out;
  }

  auto invoker = invoker_factory_ ? invoker_factory_() : nullptr;
  if (!invoker) {
    out.response = "I couldn't reach your tools right now. Please try again.";
    return out;
  }
  struct CloseGuard {
    ToolInvoker* invoker;
    ~CloseGuard() { invoker->Close(); }
  } guard{invoker.get()};

  auto failure_text = [](const char* what, const ToolOutcome& o) {
    return std::string("I couldn't ") + what + ": " + o.error;
  };

  if (intent == intents::kBalanceQuery) {
    auto bal = CallTool(invoker.get(), kHsaServer, "get_unreimbursed_balance", NoArgs{}, "", &out.tools_called);
    if (!bal.ok) {
      out.response = failure_text("get your HSA balance", bal);
      return out;
    }
    out.response = BalanceSentence(bal.payload);
    ctx->Record(intents::kBalanceQuery, bal.payload, now);
    return out;
  }

  if (intent == intents::kCharitableSummary || intent == intents::kDualSummary) {
    const auto tax_year = ExtractTaxYear(message);
    CharitableSummaryArgs args;
    args.tax_year = tax_year;
    const std::string label = tax_year ? "tax_year=" + std::to_string(*tax_year) : "";

    std::optional<ToolOutcome> bal;
    if (intent == intents::kDualSummary) {
      bal = CallTool(invoker.get(), kHsaServer, "get_unreimbursed_balance", NoArgs{}, "", &out.tools_called);
    }
    auto charity = CallTool(invoker.get(), kCharitableServer, "get_charitable_summary", args, label, &out.tools_called);

    if (bal && !bal->ok) {
      out.response = failure_text("get your HSA balance", *bal);
      if (charity.ok) out.response += "\n\n" + CharitableSentence(charity.payload, tax_year);
      return out;
    }
    if (!charity.ok) {
      out.response = failure_text("get your charitable summary", charity);
      if (bal) out.response = BalanceSentence(bal->payload) + "\n\n" + out.response;
      return out;
    }

    auto recorded = charity.payload;
    if (tax_year) recorded["tax_year"] = *tax_year;
    if (bal) {
      out.response = BalanceSentence(bal->payload) + "\n\n" + CharitableSentence(charity.payload, tax_year);
      ctx->Record(intents::kBalanceQuery, bal->payload, now);
      ctx->Record(intents::kCharitableSummary, recorded, now);
      ctx->Record(intents::kDualSummary, {{"balance", bal->payload}, {"charitable", recorded}}, now);
    } else {
      out.response = CharitableSentence(charity.payload, tax_year);
      ctx->Record(intents::kCharitableSummary, recorded, now);
    }
    return out;
  }

  if (intent == intents::kBalanceDetails || intent == intents::kCharitableDetails || intent == intents::kDualDetails) {
    std::optional<ToolOutcome> ledger;
    std::optional<ToolOutcome> donations;
    if (intent != intents::kCharitableDetails) {
      LedgerQueryArgs args;
      args.status_filter = "unreimbursed";
      ledger = CallTool(invoker.get(), kHsaServer, "read_ledger_entries", args, "status_filter=unreimbursed",
                        &out.tools_called);
    }
    if (intent != intents::kBalanceDetails) {
      CharitableQueryArgs args;
      args.tax_year = RecordedTaxYear(*ctx);
      donations = CallTool(invoker.get(), kCharitableServer, "read_charitable_ledger_entries", args,
                           args.tax_year ? "tax_year=" + std::to_string(*args.tax_year) : "", &out.tools_called);
    }
    if (ledger && !ledger->ok) {
      out.response = failure_text("load your HSA expenses", *ledger);
      return out;
    }
    if (donations && !donations->ok) {
      out.response = failure_text("load your donations", *donations);
      return out;
    }
    std::vector<std::string> parts;
    if (ledger) parts.push_back(BalanceDetailsText(ledger->payload));
    if (donations) parts.push_back(CharitableDetailsText(donations->payload));
    for (size_t i = 0; i < parts.size(); i++) {
      if (i > 0) out.response += "\n\n";
      out.response += parts[i];
    }
    nlohmann::json recorded;
    if (ledger && donations) {
      recorded = {{"ledger", ledger->payload}, {"donations", donations->payload}};
    } else {
      recorded = ledger ? ledger->payload : donations->payload;
    }
    ctx->Record(intent, std::move(recorded), now);
    return out;
  }

  if (intent == intents::kArithmetic) {
    auto operands = ExtractAdditionOperands(message);
    if (!operands) {
      out.response = "I couldn't find two numbers to add.";
      return out;
    }
    AddNumbersArgs args;
    args.a = operands->first;
    args.b = operands->second;
    const std::string label = FormatNumber(operands->first) + " + " + FormatNumber(operands->second);
    auto sum = CallTool(invoker.get(), kAdditionServer, "add_numbers", args, label, &out.tools_called);
    if (!sum.ok) {
      out.response = "I tried the addition tool, but it failed: " + sum.error;
      return out;
    }
    const double total = JsonNumber(sum.payload, "sum").value_or(operands->first + operands->second);
    if (!out.tools_called.empty()) out.tools_called.back().output = FormatNumber(total);
    out.response = "Using your addition tool: " + label + " = " + FormatNumber(total);
    ctx->Record(intents::kArithmetic, sum.payload, now);
    return out;
  }

  out.response = "I'm not sure how to answer that directly.";
  return out;
}

}  // namespace homefin
