#pragma once

#include "config.hpp"
#include "providers/provider.hpp"

#include <string>

namespace homefin {

class OpenAiCompatibleHttpProvider : public IChatModel {
 public:
  OpenAiCompatibleHttpProvider(std::string name, HttpEndpoint endpoint, std::string model, std::string api_key = {});

  std::string Name() const override;
  std::optional<ModelReply> Complete(const std::vector<ChatMessage>& messages,
                                     const nlohmann::json& tools,
                                     std::string* err) override;

 private:
  std::string name_;
  HttpEndpoint endpoint_;
  std::string model_;
  std::string api_key_;
};

// Exposed for tests: request body and response parsing without the network.
nlohmann::json BuildChatCompletionRequest(const std::string& model,
                                          const std::vector<ChatMessage>& messages,
                                          const nlohmann::json& tools);
std::optional<ModelReply> ParseChatCompletionResponse(const std::string& body, std::string* err);

}  // namespace homefin
