#pragma once

#include "config.hpp"
#include "providers/provider.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace toolrt {

nlohmann::json BuildChatCompletionBody(const ChatRequest& req);
// Reads choices[0].message; content may be a string or an array of typed parts.
std::optional<ChatResponse> ParseChatCompletionBody(const std::string& body, std::string* err);
// "[API Error: <status>] <first 500 chars of body>"
std::string FormatApiError(int status, const std::string& body);

class OpenAiCompatibleHttpProvider : public IProvider {
 public:
  OpenAiCompatibleHttpProvider(std::string name, HttpEndpoint endpoint, std::string api_key = {});

  std::string Name() const override;
  std::optional<ChatResponse> ChatOnce(const ChatRequest& req, std::string* err) override;
  bool ChatStream(const ChatRequest& req,
                  const std::function<void(const std::string&)>& on_delta,
                  const std::function<void(const std::string& finish_reason)>& on_done,
                  std::string* err) override;

 private:
  std::string name_;
  HttpEndpoint endpoint_;
  std::string api_key_;
};

}  // namespace toolrt
