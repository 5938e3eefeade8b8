#include "tool_executor.hpp"

#include <cctype>
#include <cstring>
#include <iostream>
#include <string>
#include <vector>

namespace toolrt {
namespace {

static std::string Trim(const std::string& s) {
  size_t start = 0;
  while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) start++;
  size_t end = s.size();
  while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) end--;
  return s.substr(start, end - start);
}

static std::string TruncateForLog(std::string s, size_t max_chars) {
  if (max_chars == 0) return {};
  if (s.size() <= max_chars) return s;
  constexpr const char* kSuffix = "...(truncated)";
  if (max_chars <= std::strlen(kSuffix)) return std::string(kSuffix).substr(0, max_chars);
  s.resize(max_chars - std::strlen(kSuffix));
  s += kSuffix;
  return s;
}

static std::string SanitizeArgsForLog(const nlohmann::json& args) {
  if (!args.is_object()) return args.dump();
  nlohmann::json copy = args;
  for (const auto& key : {"api_key", "api-key", "apiKey", "authorization", "token"}) {
    if (copy.contains(key)) copy.erase(key);
  }
  return copy.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

static std::string Dump(const nlohmann::json& j) {
  return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace

std::string FlattenToolResult(const nlohmann::json& result) {
  if (result.is_null()) return {};
  if (result.is_string()) return result.get<std::string>();
  if (!result.is_object()) return Dump(result);

  const bool is_error = result.contains("isError") && result["isError"].is_boolean() && result["isError"].get<bool>();
  std::vector<std::string> parts;
  if (result.contains("content") && result["content"].is_array()) {
    for (const auto& item : result["content"]) {
      if (!item.is_object() || !item.contains("type") || !item["type"].is_string()) continue;
      const std::string type = item["type"].get<std::string>();
      if (type == "text") {
        if (item.contains("text") && item["text"].is_string()) {
          parts.push_back(item["text"].get<std::string>());
        } else if (item.contains("text") && !item["text"].is_null()) {
          parts.push_back(Dump(item["text"]));
        } else {
          parts.push_back("");
        }
      } else {
        parts.push_back("[" + type + " result]");
      }
    }
  }
  std::string joined;
  for (size_t i = 0; i < parts.size(); i++) {
    if (i > 0) joined += "\n";
    joined += parts[i];
  }
  std::string text = Trim(joined);
  if (text.empty()) text = Dump(result);
  if (is_error) return "Tool error:\n" + text;
  return text;
}

std::string ToolExecutor::Execute(const std::string& call_name,
                                  const std::string& raw_arguments,
                                  const CancellationToken& cancel) const {
  auto entry = registry_ ? registry_->Find(call_name) : std::nullopt;
  if (!entry || !entry->client) return "Tool not found: " + call_name;

  nlohmann::json args = nlohmann::json::object();
  if (!Trim(raw_arguments).empty()) {
    auto parsed = nlohmann::json::parse(raw_arguments, nullptr, false);
    if (parsed.is_discarded()) return "Tool argument parsing error for " + call_name;
    if (parsed.is_object()) args = std::move(parsed);
  }

  std::cout << "[mcp-call] server=" << entry->server_id << " tool=" << entry->tool_name << " call=" << call_name
            << " timeout_ms=" << entry->timeout_ms << " arguments=" << TruncateForLog(SanitizeArgsForLog(args), 2000) << "\n";

  McpCallError err;
  auto result = entry->client->CallTool(entry->tool_name, args, entry->timeout_ms, cancel, &err);
  if (!result) {
    std::cout << "[mcp-result] call=" << call_name << " ok=0 kind=" << McpErrorKindName(err.kind)
              << " error=" << TruncateForLog(err.message, 2000) << "\n";
    const std::string message = err.message.empty() ? "Unknown error" : err.message;
    return "Tool execution failed (" + call_name + "): " + message;
  }

  std::string text = TruncateUtf8(FlattenToolResult(*result), kMaxToolResultBytes);
  std::cout << "[mcp-result] call=" << call_name << " ok=1 bytes=" << text.size() << " result=" << TruncateForLog(text, 2000)
            << "\n";
  return text;
}

}  // namespace toolrt
