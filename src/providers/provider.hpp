#pragma once

#include "session_manager.hpp"
#include "tooling.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace homefin {

struct ModelReply {
  std::optional<std::string> content;
  std::vector<ToolCall> tool_calls;
  std::string finish_reason = "stop";
};

// Language model caller: messages plus tool schema in, text or tool calls out.
class IChatModel {
 public:
  virtual ~IChatModel() = default;

  virtual std::string Name() const = 0;
  virtual std::optional<ModelReply> Complete(const std::vector<ChatMessage>& messages,
                                             const nlohmann::json& tools,
                                             std::string* err) = 0;
};

}  // namespace homefin
