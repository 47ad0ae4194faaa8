#include "tooling.hpp"

#include "config.hpp"
#include "log_util.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <initializer_list>
#include <mutex>
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>

namespace homefin {
namespace {

enum class ArgShape {
  kNone,
  kLedgerQuery,
  kExpenseStatus,
  kExpenseDuplicates,
  kDonationDuplicates,
  kCharitableSummary,
  kCharitableQuery,
  kAddNumbers,
  kPassthrough,
};

static ArgShape ShapeForTool(const std::string& name) {
  if (name == "get_unreimbursed_balance") return ArgShape::kNone;
  if (name == "read_ledger_entries") return ArgShape::kLedgerQuery;
  if (name == "update_expense_status") return ArgShape::kExpenseStatus;
  if (name == "check_for_duplicates") return ArgShape::kExpenseDuplicates;
  if (name == "check_charitable_duplicates") return ArgShape::kDonationDuplicates;
  if (name == "get_charitable_summary") return ArgShape::kCharitableSummary;
  if (name == "read_charitable_ledger_entries") return ArgShape::kCharitableQuery;
  if (name == "add_numbers") return ArgShape::kAddNumbers;
  return ArgShape::kPassthrough;
}

static nlohmann::json ObjectSchema(nlohmann::json properties, nlohmann::json required = nlohmann::json::array()) {
  nlohmann::json j;
  j["type"] = "object";
  j["properties"] = std::move(properties);
  if (!required.empty()) j["required"] = std::move(required);
  return j;
}

static nlohmann::json Prop(const char* type, const char* description) {
  return {{"type", type}, {"description", description}};
}

static nlohmann::json StatusProp(const char* description) {
  auto p = Prop("string", description);
  p["enum"] = {"reimbursed", "unreimbursed", "not_hsa_eligible"};
  return p;
}

static nlohmann::json ColumnFiltersProp() {
  nlohmann::json item = ObjectSchema({{"column", Prop("string", "Ledger column name")},
                                      {"operator", Prop("string", "equals, contains, gt, gte, lt or lte")},
                                      {"value", Prop("string", "Value to compare against")}});
  return {{"type", "array"}, {"description", "Optional column filters"}, {"items", item}};
}

static std::optional<ToolSpec> BuiltinToolSpec(const std::string& name) {
  ToolSpec spec;
  spec.name = name;
  switch (ShapeForTool(name)) {
    case ArgShape::kNone:
      spec.description = "Return the total of unreimbursed HSA expenses and how many there are.";
      spec.parameters = ObjectSchema(nlohmann::json::object());
      return spec;
    case ArgShape::kLedgerQuery:
      spec.description = "Read HSA ledger entries, optionally filtered by year and reimbursement status.";
      spec.parameters = ObjectSchema({{"year", Prop("integer", "Calendar year of service")},
                                      {"status_filter", StatusProp("Reimbursement status to match")},
                                      {"limit", Prop("integer", "Maximum number of entries")},
                                      {"column_filters", ColumnFiltersProp()}});
      return spec;
    case ArgShape::kExpenseStatus:
      spec.description = "Change the reimbursement status of one HSA expense.";
      spec.parameters = ObjectSchema({{"expense_id", Prop("string", "Ledger id of the expense")},
                                      {"new_status", StatusProp("New reimbursement status")},
                                      {"reimbursement_date", Prop("string", "Reimbursement date, YYYY-MM-DD")}},
                                     nlohmann::json::array({"expense_id", "new_status"}));
      return spec;
    case ArgShape::kExpenseDuplicates:
      spec.description = "Check whether an expense is already in the HSA ledger.";
      spec.parameters = ObjectSchema({{"expense_json", Prop("object", "Expense with provider, service_date and amount")},
                                      {"fuzzy_days", Prop("integer", "Date tolerance in days")}},
                                     nlohmann::json::array({"expense_json"}));
      return spec;
    case ArgShape::kDonationDuplicates:
      spec.description = "Check whether a donation is already in the charitable ledger.";
      spec.parameters = ObjectSchema({{"donation_json", Prop("object", "Donation with organization_name, donation_date and amount")},
                                      {"fuzzy_days", Prop("integer", "Date tolerance in days")}},
                                     nlohmann::json::array({"donation_json"}));
      return spec;
    case ArgShape::kCharitableSummary:
      spec.description = "Summarize charitable donations with totals by organization and year.";
      spec.parameters = ObjectSchema({{"tax_year", Prop("integer", "Tax year to summarize")},
                                      {"column_filters", ColumnFiltersProp()}});
      return spec;
    case ArgShape::kCharitableQuery:
      spec.description = "Read charitable ledger entries with optional filters.";
      spec.parameters = ObjectSchema({{"tax_year", Prop("integer", "Tax year")},
                                      {"organization", Prop("string", "Organization name")},
                                      {"tax_deductible", Prop("boolean", "Only deductible (true) or non-deductible (false)")},
                                      {"limit", Prop("integer", "Maximum number of entries")},
                                      {"column_filters", ColumnFiltersProp()}});
      return spec;
    case ArgShape::kAddNumbers:
      spec.description = "Add two numbers and return their sum.";
      spec.parameters = ObjectSchema({{"a", Prop("number", "First addend")}, {"b", Prop("number", "Second addend")}}, nlohmann::json::array({"a", "b"}));
      return spec;
    case ArgShape::kPassthrough:
      break;
  }
  return std::nullopt;
}

static std::optional<std::string> ExtractFirstJsonObject(const std::string& text) {
  auto pos = text.find('{');
  if (pos == std::string::npos) return std::nullopt;
  int depth = 0;
  bool in_string = false;
  bool escape = false;
  for (size_t i = pos; i < text.size(); i++) {
    char c = text[i];
    if (in_string) {
      if (escape) {
        escape = false;
      } else if (c == '\\') {
        escape = true;
      } else if (c == '"') {
        in_string = false;
      }
      continue;
    }
    if (c == '"') {
      in_string = true;
      continue;
    }
    if (c == '{') depth++;
    if (c == '}') {
      depth--;
      if (depth == 0) return text.substr(pos, i - pos + 1);
    }
  }
  return std::nullopt;
}

static std::optional<std::string> GuessSingleKeyFromParams(const nlohmann::json& params) {
  if (!params.is_object()) return std::nullopt;
  if (!params.contains("properties") || !params["properties"].is_object()) return std::nullopt;
  const auto& props = params["properties"];
  if (params.contains("required") && params["required"].is_array() && params["required"].size() == 1 &&
      params["required"][0].is_string()) {
    return params["required"][0].get<std::string>();
  }
  if (props.size() == 1) return props.begin().key();
  return std::nullopt;
}

static std::optional<double> ParseNumberText(std::string s) {
  s = Trim(s);
  if (!s.empty() && s.front() == '$') s.erase(0, 1);
  std::string digits;
  digits.reserve(s.size());
  for (char c : s) {
    if (c != ',') digits.push_back(c);
  }
  if (digits.empty()) return std::nullopt;
  errno = 0;
  char* end = nullptr;
  const double v = std::strtod(digits.c_str(), &end);
  if (end == digits.c_str() || *end != '\0' || errno == ERANGE || !std::isfinite(v)) return std::nullopt;
  return v;
}

static std::optional<double> CoerceNumber(const nlohmann::json& v) {
  if (v.is_number()) {
    const double d = v.get<double>();
    if (!std::isfinite(d)) return std::nullopt;
    return d;
  }
  if (v.is_string()) return ParseNumberText(v.get<std::string>());
  return std::nullopt;
}

static std::optional<int64_t> CoerceInt(const nlohmann::json& v) {
  if (v.is_number_integer()) return v.get<int64_t>();
  auto d = CoerceNumber(v);
  if (!d) return std::nullopt;
  if (std::trunc(*d) != *d || std::fabs(*d) > 9.0e15) return std::nullopt;
  return static_cast<int64_t>(*d);
}

static std::optional<bool> CoerceBool(const nlohmann::json& v) {
  if (v.is_boolean()) return v.get<bool>();
  if (v.is_number_integer()) {
    const auto n = v.get<int64_t>();
    if (n == 0 || n == 1) return n == 1;
    return std::nullopt;
  }
  if (v.is_string()) {
    bool b = false;
    if (TryParseBool(v.get<std::string>(), &b)) return b;
  }
  return std::nullopt;
}

static std::optional<std::string> CoerceString(const nlohmann::json& v) {
  if (v.is_string()) {
    auto s = Trim(v.get<std::string>());
    if (s.empty()) return std::nullopt;
    return s;
  }
  if (v.is_number_integer()) return std::to_string(v.get<int64_t>());
  if (v.is_number()) return FormatNumber(v.get<double>());
  return std::nullopt;
}

static std::optional<std::string> CoerceStatus(const nlohmann::json& v) {
  auto s = CoerceString(v);
  if (!s) return std::nullopt;
  std::string out = ToLower(*s);
  for (auto& c : out) {
    if (c == ' ' || c == '-') c = '_';
  }
  return out;
}

static std::optional<nlohmann::json> CoerceObject(const nlohmann::json& v) {
  if (v.is_object()) return v;
  if (v.is_string()) {
    auto parsed = ParseJsonLoose(v.get<std::string>());
    if (parsed && parsed->is_object()) return parsed;
  }
  return std::nullopt;
}

static std::optional<nlohmann::json> CoerceArray(const nlohmann::json& v) {
  if (v.is_array()) return v.empty() ? std::nullopt : std::optional<nlohmann::json>(v);
  if (v.is_object()) return nlohmann::json::array({v});
  if (v.is_string()) {
    auto trimmed = Trim(v.get<std::string>());
    if (trimmed.empty() || trimmed.front() != '[') return std::nullopt;
    auto parsed = nlohmann::json::parse(trimmed, nullptr, false);
    if (!parsed.is_discarded() && parsed.is_array() && !parsed.empty()) return parsed;
  }
  return std::nullopt;
}

static void MoveKey(nlohmann::json* args, const char* dst, std::initializer_list<const char*> srcs) {
  if (args->contains(dst)) return;
  for (const auto* src : srcs) {
    if (src && args->contains(src)) {
      (*args)[dst] = std::move((*args)[src]);
      args->erase(src);
      return;
    }
  }
}

template <typename T, typename Fn>
static std::optional<T> Field(const nlohmann::json& args, const char* key, Fn coerce) {
  if (!args.contains(key)) return std::nullopt;
  return coerce(args[key]);
}

static nlohmann::json DropBlankStrings(const nlohmann::json& obj) {
  nlohmann::json out = nlohmann::json::object();
  for (auto it = obj.begin(); it != obj.end(); ++it) {
    if (it.value().is_null()) continue;
    if (it.value().is_string() && Trim(it.value().get<std::string>()).empty()) continue;
    out[it.key()] = it.value();
  }
  return out;
}

template <typename T>
static void PutIf(nlohmann::json* out, const char* key, const std::optional<T>& v) {
  if (v) (*out)[key] = *v;
}

}  // namespace

nlohmann::json NumberToJson(double v) {
  if (std::isfinite(v) && std::trunc(v) == v && std::fabs(v) < 9.0e15) return static_cast<int64_t>(v);
  return v;
}

std::string FormatNumber(double v) {
  if (std::isfinite(v) && std::trunc(v) == v && std::fabs(v) < 9.0e15) return std::to_string(static_cast<int64_t>(v));
  std::ostringstream oss;
  oss << std::setprecision(15) << v;
  return oss.str();
}

nlohmann::json ToJson(const ToolArguments& args) {
  return std::visit(
      [](const auto& a) -> nlohmann::json {
        using T = std::decay_t<decltype(a)>;
        nlohmann::json out = nlohmann::json::object();
        if constexpr (std::is_same_v<T, LedgerQueryArgs>) {
          PutIf(&out, "year", a.year);
          PutIf(&out, "status_filter", a.status_filter);
          PutIf(&out, "limit", a.limit);
          PutIf(&out, "column_filters", a.column_filters);
        } else if constexpr (std::is_same_v<T, ExpenseStatusArgs>) {
          PutIf(&out, "expense_id", a.expense_id);
          PutIf(&out, "new_status", a.new_status);
          PutIf(&out, "reimbursement_date", a.reimbursement_date);
        } else if constexpr (std::is_same_v<T, DuplicateCheckArgs>) {
          if (a.record) out[a.record_key] = *a.record;
          PutIf(&out, "fuzzy_days", a.fuzzy_days);
        } else if constexpr (std::is_same_v<T, CharitableSummaryArgs>) {
          PutIf(&out, "tax_year", a.tax_year);
          PutIf(&out, "column_filters", a.column_filters);
        } else if constexpr (std::is_same_v<T, CharitableQueryArgs>) {
          PutIf(&out, "tax_year", a.tax_year);
          PutIf(&out, "organization", a.organization);
          PutIf(&out, "tax_deductible", a.tax_deductible);
          PutIf(&out, "limit", a.limit);
          PutIf(&out, "column_filters", a.column_filters);
        } else if constexpr (std::is_same_v<T, AddNumbersArgs>) {
          if (a.a) out["a"] = NumberToJson(*a.a);
          if (a.b) out["b"] = NumberToJson(*a.b);
        } else if constexpr (std::is_same_v<T, PassthroughArgs>) {
          out = a.fields.is_object() ? a.fields : nlohmann::json::object();
        }
        return out;
      },
      args);
}

void ToolRegistry::RegisterTool(ToolSpec spec) {
  std::unique_lock<std::shared_mutex> lock(mu_);
  if (specs_.find(spec.name) == specs_.end()) order_.push_back(spec.name);
  specs_[spec.name] = std::move(spec);
}

bool ToolRegistry::HasTool(const std::string& name) const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  return specs_.find(name) != specs_.end();
}

std::optional<ToolSpec> ToolRegistry::Resolve(const std::string& name) const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  auto it = specs_.find(name);
  if (it == specs_.end()) return std::nullopt;
  return it->second;
}

std::vector<ToolSpec> ToolRegistry::ListSpecs() const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  std::vector<ToolSpec> out;
  out.reserve(order_.size());
  for (const auto& name : order_) out.push_back(specs_.at(name));
  return out;
}

nlohmann::json ToolRegistry::SchemasFor(const std::vector<std::string>& enabled_server_ids) const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  nlohmann::json tools = nlohmann::json::array();
  for (const auto& name : order_) {
    const auto& spec = specs_.at(name);
    bool enabled = false;
    for (const auto& id : enabled_server_ids) {
      if (id == spec.server_id) {
        enabled = true;
        break;
      }
    }
    if (!enabled) continue;
    nlohmann::json fn;
    fn["name"] = spec.name;
    fn["description"] = spec.description;
    fn["parameters"] = spec.parameters;
    tools.push_back({{"type", "function"}, {"function", fn}});
  }
  return tools;
}

ToolArguments ToolRegistry::NormalizeArguments(const std::string& tool_name, const nlohmann::json& raw) const {
  nlohmann::json params;
  if (auto spec = Resolve(tool_name)) params = spec->parameters;

  nlohmann::json args = nlohmann::json::object();
  if (raw.is_object()) {
    args = raw;
  } else if (raw.is_string()) {
    const auto text = raw.get<std::string>();
    auto parsed = ParseJsonLoose(text);
    if (parsed && parsed->is_object()) {
      args = *parsed;
    } else if (!Trim(text).empty()) {
      if (auto key = GuessSingleKeyFromParams(params)) args[*key] = Trim(text);
    }
  }

  switch (ShapeForTool(tool_name)) {
    case ArgShape::kNone:
      return NoArgs{};
    case ArgShape::kLedgerQuery: {
      MoveKey(&args, "year", {"tax_year", "yr"});
      MoveKey(&args, "status_filter", {"status", "reimbursement_status", "filter"});
      MoveKey(&args, "limit", {"max", "max_results", "count"});
      MoveKey(&args, "column_filters", {"filters"});
      LedgerQueryArgs out;
      out.year = Field<int64_t>(args, "year", CoerceInt);
      out.status_filter = Field<std::string>(args, "status_filter", CoerceStatus);
      out.limit = Field<int64_t>(args, "limit", CoerceInt);
      out.column_filters = Field<nlohmann::json>(args, "column_filters", CoerceArray);
      return out;
    }
    case ArgShape::kExpenseStatus: {
      MoveKey(&args, "expense_id", {"id", "expenseId", "expense"});
      MoveKey(&args, "new_status", {"status", "newStatus", "reimbursement_status"});
      MoveKey(&args, "reimbursement_date", {"date", "reimbursed_on", "reimbursementDate"});
      ExpenseStatusArgs out;
      out.expense_id = Field<std::string>(args, "expense_id", CoerceString);
      out.new_status = Field<std::string>(args, "new_status", CoerceStatus);
      out.reimbursement_date = Field<std::string>(args, "reimbursement_date", CoerceString);
      return out;
    }
    case ArgShape::kExpenseDuplicates:
    case ArgShape::kDonationDuplicates: {
      const bool expense = ShapeForTool(tool_name) == ArgShape::kExpenseDuplicates;
      DuplicateCheckArgs out;
      out.record_key = expense ? "expense_json" : "donation_json";
      if (expense) {
        MoveKey(&args, "expense_json", {"expense", "record", "json"});
      } else {
        MoveKey(&args, "donation_json", {"donation", "record", "json"});
      }
      MoveKey(&args, "fuzzy_days", {"days", "window_days", "fuzzyDays"});
      out.record = Field<nlohmann::json>(args, out.record_key.c_str(), CoerceObject);
      out.fuzzy_days = Field<int64_t>(args, "fuzzy_days", CoerceInt);
      return out;
    }
    case ArgShape::kCharitableSummary: {
      MoveKey(&args, "tax_year", {"year", "taxYear"});
      MoveKey(&args, "column_filters", {"filters"});
      CharitableSummaryArgs out;
      out.tax_year = Field<int64_t>(args, "tax_year", CoerceInt);
      out.column_filters = Field<nlohmann::json>(args, "column_filters", CoerceArray);
      return out;
    }
    case ArgShape::kCharitableQuery: {
      MoveKey(&args, "tax_year", {"year", "taxYear"});
      MoveKey(&args, "organization", {"org", "organization_name", "charity"});
      MoveKey(&args, "tax_deductible", {"deductible", "taxDeductible"});
      MoveKey(&args, "limit", {"max", "max_results", "count"});
      MoveKey(&args, "column_filters", {"filters"});
      CharitableQueryArgs out;
      out.tax_year = Field<int64_t>(args, "tax_year", CoerceInt);
      out.organization = Field<std::string>(args, "organization", CoerceString);
      out.tax_deductible = Field<bool>(args, "tax_deductible", CoerceBool);
      out.limit = Field<int64_t>(args, "limit", CoerceInt);
      out.column_filters = Field<nlohmann::json>(args, "column_filters", CoerceArray);
      return out;
    }
    case ArgShape::kAddNumbers: {
      MoveKey(&args, "a", {"x", "first", "num1", "left"});
      MoveKey(&args, "b", {"y", "second", "num2", "right"});
      AddNumbersArgs out;
      out.a = Field<double>(args, "a", CoerceNumber);
      out.b = Field<double>(args, "b", CoerceNumber);
      return out;
    }
    case ArgShape::kPassthrough:
      break;
  }
  PassthroughArgs out;
  out.fields = DropBlankStrings(args);
  return out;
}

void BuildToolRegistry(const ToolServerTable& defs, ToolRegistry* registry) {
  if (!registry) return;
  for (const auto& kv : defs) {
    const auto& def = kv.second;
    for (const auto& tool : def.tool_names) {
      ToolSpec spec;
      if (auto builtin = BuiltinToolSpec(tool)) {
        spec = std::move(*builtin);
      } else {
        spec.name = tool;
        spec.description = def.description;
        spec.parameters = {{"type", "object"}, {"properties", nlohmann::json::object()}, {"additionalProperties", true}};
      }
      spec.server_id = def.id;
      registry->RegisterTool(std::move(spec));
    }
  }
}

std::optional<nlohmann::json> ParseJsonLoose(const std::string& text) {
  auto trimmed = Trim(text);
  if (trimmed.empty()) return std::nullopt;
  if (auto j = nlohmann::json::parse(trimmed, nullptr, false); !j.is_discarded()) return j;
  if (auto obj = ExtractFirstJsonObject(trimmed)) {
    auto j = nlohmann::json::parse(*obj, nullptr, false);
    if (!j.is_discarded()) return j;
  }
  return std::nullopt;
}

}  // namespace homefin
