#pragma once

#include <nlohmann/json.hpp>

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace toolrt {

struct ChatToolCall {
  std::string id;
  std::string name;
  std::string arguments;
};

struct ChatMessage {
  std::string role;
  std::string content;
  // assistant turns that requested tools
  std::vector<ChatToolCall> tool_calls;
  // tool-role turns
  std::string tool_call_id;
};

struct ChatRequest {
  std::string model;
  std::vector<ChatMessage> messages;
  bool stream = false;
  std::optional<int> max_tokens;
  std::optional<float> temperature;
  std::optional<float> top_p;
  // OpenAI function definitions; empty means no tools are attached.
  std::vector<nlohmann::json> tools;
  std::optional<std::string> tool_choice;
};

struct ChatResponse {
  std::string model;
  std::string content;
  std::vector<ChatToolCall> tool_calls;
  bool done = true;
  std::string finish_reason = "stop";
};

nlohmann::json ChatMessageToJson(const ChatMessage& m);

// Completion back-end. ChatOnce is what the tool loop drives; ChatStream serves the final pass.
class IProvider {
 public:
  virtual ~IProvider() = default;

  virtual std::string Name() const = 0;

  virtual std::optional<ChatResponse> ChatOnce(const ChatRequest& req, std::string* err) = 0;
  virtual bool ChatStream(const ChatRequest& req,
                          const std::function<void(const std::string&)>& on_delta,
                          const std::function<void(const std::string& finish_reason)>& on_done,
                          std::string* err) = 0;
};

}  // namespace toolrt
