#pragma once

#include <nlohmann/json.hpp>

#include <string>

namespace homefin {

enum class ToolErrorKind {
  kNone,
  kPathResolution,
  kSpawn,
  kHandshake,
  kProtocol,
  kWrite,
  kUnexpectedExit,
  kTimeout,
  kCancelled,
  kInvalidState,
};

struct ToolError {
  ToolErrorKind kind = ToolErrorKind::kNone;
  std::string message;
  // Server-supplied JSON-RPC error object for kProtocol, otherwise null.
  nlohmann::json payload;
};

inline const char* ToolErrorKindName(ToolErrorKind kind) {
  switch (kind) {
    case ToolErrorKind::kNone:
      return "none";
    case ToolErrorKind::kPathResolution:
      return "path_resolution";
    case ToolErrorKind::kSpawn:
      return "spawn";
    case ToolErrorKind::kHandshake:
      return "handshake";
    case ToolErrorKind::kProtocol:
      return "protocol";
    case ToolErrorKind::kWrite:
      return "write";
    case ToolErrorKind::kUnexpectedExit:
      return "unexpected_exit";
    case ToolErrorKind::kTimeout:
      return "timeout";
    case ToolErrorKind::kCancelled:
      return "cancelled";
    case ToolErrorKind::kInvalidState:
      return "invalid_state";
  }
  return "unknown";
}

// Start-time failures: no tool call is possible on that server at all.
inline bool IsStartupFailure(ToolErrorKind kind) {
  return kind == ToolErrorKind::kPathResolution || kind == ToolErrorKind::kSpawn ||
         kind == ToolErrorKind::kHandshake;
}

inline void SetToolError(ToolError* err, ToolErrorKind kind, std::string message,
                         nlohmann::json payload = nullptr) {
  if (!err) return;
  err->kind = kind;
  err->message = std::move(message);
  err->payload = std::move(payload);
}

}  // namespace homefin
