#pragma once

#include <nlohmann/json.hpp>

#include <string>

namespace homefin {

std::string TruncateForLog(std::string s, size_t max_chars);
std::string SanitizeJsonForLog(const nlohmann::json& body);

std::string Trim(const std::string& s);
std::string ToLower(std::string s);
bool StartsWith(const std::string& s, const std::string& prefix);

}  // namespace homefin
