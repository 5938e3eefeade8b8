#include "openai_compatible_http_provider.hpp"

#include <httplib.h>

#include <algorithm>
#include <cctype>
#include <iostream>
#include <memory>
#include <string>
#include <utility>

namespace toolrt {
namespace {

constexpr size_t kApiErrorBodyChars = 500;

// Null when httplib cannot serve the scheme (https without TLS support compiled in).
static std::unique_ptr<httplib::Client> MakeClient(const HttpEndpoint& ep) {
  auto cli = std::make_unique<httplib::Client>(ep.scheme + "://" + ep.host + ":" + std::to_string(ep.port));
  if (!cli->is_valid()) return nullptr;
  cli->set_connection_timeout(5);
  cli->set_read_timeout(300);
  cli->set_write_timeout(30);
  return cli;
}

static std::string JoinPath(const std::string& base, const std::string& path) {
  if (base.empty()) return path;
  if (base.back() == '/' && !path.empty() && path.front() == '/') return base + path.substr(1);
  if (base.back() != '/' && !path.empty() && path.front() != '/') return base + "/" + path;
  return base + path;
}

static std::string Trim(const std::string& s) {
  size_t start = 0;
  while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) start++;
  size_t end = s.size();
  while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) end--;
  return s.substr(start, end - start);
}

static std::string NormalizeAssistantContent(const nlohmann::json& content) {
  if (content.is_string()) return content.get<std::string>();
  if (content.is_array()) {
    std::string out;
    for (const auto& item : content) {
      if (!item.is_object() || !item.contains("type") || item["type"] != "text") continue;
      if (!item.contains("text") || !item["text"].is_string()) continue;
      const std::string text = item["text"].get<std::string>();
      if (text.empty()) continue;
      if (!out.empty()) out += "\n";
      out += text;
    }
    return Trim(out);
  }
  if (content.is_null()) return {};
  return content.dump();
}

static std::vector<ChatToolCall> ParseToolCalls(const nlohmann::json& message) {
  std::vector<ChatToolCall> out;
  if (!message.contains("tool_calls") || !message["tool_calls"].is_array()) return out;
  for (const auto& tc : message["tool_calls"]) {
    if (!tc.is_object()) continue;
    ChatToolCall call;
    if (tc.contains("id") && tc["id"].is_string()) call.id = tc["id"].get<std::string>();
    if (tc.contains("function") && tc["function"].is_object()) {
      const auto& fn = tc["function"];
      if (fn.contains("name") && fn["name"].is_string()) call.name = fn["name"].get<std::string>();
      if (fn.contains("arguments")) {
        if (fn["arguments"].is_string()) {
          call.arguments = fn["arguments"].get<std::string>();
        } else if (!fn["arguments"].is_null()) {
          call.arguments = fn["arguments"].dump();
        }
      }
    }
    out.push_back(std::move(call));
  }
  return out;
}

}  // namespace

nlohmann::json ChatMessageToJson(const ChatMessage& m) {
  nlohmann::json j;
  j["role"] = m.role;
  j["content"] = m.content;
  if (!m.tool_calls.empty()) {
    j["tool_calls"] = nlohmann::json::array();
    for (const auto& c : m.tool_calls) {
      nlohmann::json tc;
      if (!c.id.empty()) tc["id"] = c.id;
      tc["type"] = "function";
      tc["function"] = {{"name", c.name}, {"arguments", c.arguments}};
      j["tool_calls"].push_back(std::move(tc));
    }
  }
  if (!m.tool_call_id.empty()) j["tool_call_id"] = m.tool_call_id;
  return j;
}

nlohmann::json BuildChatCompletionBody(const ChatRequest& req) {
  nlohmann::json j;
  j["model"] = req.model;
  j["stream"] = false;
  if (req.max_tokens.has_value() && req.max_tokens.value() > 0) j["max_tokens"] = req.max_tokens.value();
  if (req.temperature.has_value()) j["temperature"] = req.temperature.value();
  if (req.top_p.has_value()) j["top_p"] = req.top_p.value();
  j["messages"] = nlohmann::json::array();
  for (const auto& m : req.messages) j["messages"].push_back(ChatMessageToJson(m));
  if (!req.tools.empty()) {
    j["tools"] = req.tools;
    if (req.tool_choice.has_value()) j["tool_choice"] = req.tool_choice.value();
  }
  return j;
}

std::optional<ChatResponse> ParseChatCompletionBody(const std::string& body, std::string* err) {
  auto jr = nlohmann::json::parse(body, nullptr, false);
  if (jr.is_discarded() || !jr.is_object() || !jr.contains("choices") || !jr["choices"].is_array() || jr["choices"].empty() ||
      !jr["choices"][0].is_object() || !jr["choices"][0].contains("message") || !jr["choices"][0]["message"].is_object()) {
    if (err) *err = "invalid json from chat/completions";
    return std::nullopt;
  }
  const auto& choice = jr["choices"][0];
  const auto& message = choice["message"];
  ChatResponse out;
  if (jr.contains("model") && jr["model"].is_string()) out.model = jr["model"].get<std::string>();
  if (message.contains("content")) out.content = NormalizeAssistantContent(message["content"]);
  out.tool_calls = ParseToolCalls(message);
  if (choice.contains("finish_reason") && choice["finish_reason"].is_string()) {
    out.finish_reason = choice["finish_reason"].get<std::string>();
  }
  out.done = true;
  return out;
}

std::string FormatApiError(int status, const std::string& body) {
  return "[API Error: " + std::to_string(status) + "] " + body.substr(0, kApiErrorBodyChars);
}

OpenAiCompatibleHttpProvider::OpenAiCompatibleHttpProvider(std::string name, HttpEndpoint endpoint, std::string api_key)
    : name_(std::move(name)), endpoint_(std::move(endpoint)), api_key_(std::move(api_key)) {}

std::string OpenAiCompatibleHttpProvider::Name() const {
  return name_;
}

std::optional<ChatResponse> OpenAiCompatibleHttpProvider::ChatOnce(const ChatRequest& req, std::string* err) {
  auto cli = MakeClient(endpoint_);
  if (!cli) {
    if (err) *err = name_ + ": unsupported endpoint scheme: " + endpoint_.scheme;
    std::cout << "[provider] name=" << name_ << " unsupported scheme=" << endpoint_.scheme << "\n";
    return std::nullopt;
  }
  httplib::Headers headers;
  if (!api_key_.empty()) headers.emplace("Authorization", "Bearer " + api_key_);
  const std::string path = JoinPath(endpoint_.base_path, "/chat/completions");
  const nlohmann::json body = BuildChatCompletionBody(req);
  std::cout << "[provider] name=" << name_ << " POST " << path << " model=" << req.model << " messages=" << req.messages.size()
            << " tools=" << req.tools.size() << "\n";
  auto res = cli->Post(path, headers, body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace), "application/json");
  if (!res) {
    if (err) *err = name_ + ": failed to connect (" + httplib::to_string(res.error()) + ")";
    return std::nullopt;
  }
  if (res->status < 200 || res->status >= 300) {
    if (err) *err = FormatApiError(res->status, res->body);
    std::cout << "[provider] name=" << name_ << " status=" << res->status << "\n";
    return std::nullopt;
  }
  std::string parse_err;
  auto out = ParseChatCompletionBody(res->body, &parse_err);
  if (!out) {
    if (err) *err = name_ + ": " + parse_err;
    return std::nullopt;
  }
  if (out->model.empty()) out->model = req.model;
  return out;
}

bool OpenAiCompatibleHttpProvider::ChatStream(const ChatRequest& req,
                                              const std::function<void(const std::string&)>& on_delta,
                                              const std::function<void(const std::string& finish_reason)>& on_done,
                                              std::string* err) {
  auto once = ChatOnce(req, err);
  if (!once) return false;
  constexpr size_t kChunkSize = 64;
  const std::string& text = once->content;
  size_t i = 0;
  while (i < text.size()) {
    size_t end = std::min(text.size(), i + kChunkSize);
    // Back off continuation bytes so no delta splits a UTF-8 sequence.
    while (end < text.size() && end > i + 1 && (static_cast<unsigned char>(text[end]) & 0xC0) == 0x80) end--;
    on_delta(text.substr(i, end - i));
    i = end;
  }
  on_done(once->finish_reason);
  return true;
}

}  // namespace toolrt
