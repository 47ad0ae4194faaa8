#pragma once

#include "tool_servers.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace homefin {

struct ToolSpec {
  std::string name;
  std::string server_id;
  std::string description;
  nlohmann::json parameters;
};

struct ToolCall {
  std::string id;
  std::string name;
  std::string arguments_json;
};

// Typed tool arguments. Unset optionals are omitted on the wire.
struct NoArgs {};

struct LedgerQueryArgs {
  std::optional<int64_t> year;
  std::optional<std::string> status_filter;
  std::optional<int64_t> limit;
  std::optional<nlohmann::json> column_filters;
};

struct ExpenseStatusArgs {
  std::optional<std::string> expense_id;
  std::optional<std::string> new_status;
  std::optional<std::string> reimbursement_date;
};

struct DuplicateCheckArgs {
  // "expense_json" or "donation_json".
  std::string record_key;
  std::optional<nlohmann::json> record;
  std::optional<int64_t> fuzzy_days;
};

struct CharitableSummaryArgs {
  std::optional<int64_t> tax_year;
  std::optional<nlohmann::json> column_filters;
};

struct CharitableQueryArgs {
  std::optional<int64_t> tax_year;
  std::optional<std::string> organization;
  std::optional<bool> tax_deductible;
  std::optional<int64_t> limit;
  std::optional<nlohmann::json> column_filters;
};

struct AddNumbersArgs {
  std::optional<double> a;
  std::optional<double> b;
};

// Tools without a typed shape (custom servers). Blank strings are dropped.
struct PassthroughArgs {
  nlohmann::json fields = nlohmann::json::object();
};

using ToolArguments = std::variant<NoArgs,
                                   LedgerQueryArgs,
                                   ExpenseStatusArgs,
                                   DuplicateCheckArgs,
                                   CharitableSummaryArgs,
                                   CharitableQueryArgs,
                                   AddNumbersArgs,
                                   PassthroughArgs>;

nlohmann::json ToJson(const ToolArguments& args);

class ToolRegistry {
 public:
  ToolRegistry() = default;
  ToolRegistry(const ToolRegistry&) = delete;
  ToolRegistry& operator=(const ToolRegistry&) = delete;

  void RegisterTool(ToolSpec spec);
  bool HasTool(const std::string& name) const;
  std::optional<ToolSpec> Resolve(const std::string& name) const;
  std::vector<ToolSpec> ListSpecs() const;

  // OpenAI function-calling tool list for the tools of the given servers.
  nlohmann::json SchemasFor(const std::vector<std::string>& enabled_server_ids) const;

  // Total: never throws, drops what it cannot use.
  ToolArguments NormalizeArguments(const std::string& tool_name, const nlohmann::json& raw) const;

 private:
  mutable std::shared_mutex mu_;
  std::unordered_map<std::string, ToolSpec> specs_;
  std::vector<std::string> order_;
};

// Builtin tools get their known schemas; other listed tools get an open one.
void BuildToolRegistry(const ToolServerTable& defs, ToolRegistry* registry);

std::optional<nlohmann::json> ParseJsonLoose(const std::string& text);

// Whole values in int64 range become integers, everything else stays a double.
nlohmann::json NumberToJson(double v);

// "4", "4.0" and "-3.5" style numbers without a trailing ".0".
std::string FormatNumber(double v);

}  // namespace homefin
