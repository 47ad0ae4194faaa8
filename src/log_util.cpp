#include "log_util.hpp"

#include <cctype>
#include <cstring>
#include <string>

namespace homefin {

std::string TruncateForLog(std::string s, size_t max_chars) {
  if (max_chars == 0) return {};
  if (s.size() <= max_chars) return s;
  constexpr const char* kSuffix = "...(truncated)";
  if (max_chars <= std::strlen(kSuffix)) return std::string(kSuffix).substr(0, max_chars);
  s.resize(max_chars - std::strlen(kSuffix));
  s += kSuffix;
  return s;
}

std::string SanitizeJsonForLog(const nlohmann::json& body) {
  if (body.is_null()) return "null";
  if (!body.is_object()) return body.dump();
  auto j = body;
  for (const auto& key : {"api_key", "api-key", "authorization", "apiKey", "access_token", "refresh_token"}) {
    if (j.contains(key)) j[key] = "<redacted>";
  }
  if (j.contains("env") && j["env"].is_object()) {
    for (auto& [key, value] : j["env"].items()) {
      const auto lower = ToLower(key);
      if (lower.find("token") != std::string::npos || lower.find("secret") != std::string::npos ||
          lower.find("key") != std::string::npos) {
        value = "<redacted>";
      }
    }
  }
  return j.dump();
}

std::string Trim(const std::string& s) {
  size_t start = 0;
  while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) start++;
  size_t end = s.size();
  while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) end--;
  return s.substr(start, end - start);
}

std::string ToLower(std::string s) {
  for (auto& ch : s) ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  return s;
}

bool StartsWith(const std::string& s, const std::string& prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

}  // namespace homefin
