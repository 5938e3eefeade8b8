#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace toolrt {

struct HttpEndpoint {
  std::string scheme = "http";
  std::string host = "127.0.0.1";
  int port = 8080;
  std::string base_path;
};

// One tool provider subprocess. Immutable once a client has been built from it.
struct McpServerConfig {
  std::string id;
  std::string name;
  std::string command;
  std::string args;
  std::string env;
  bool enabled = true;
  int timeout_ms = 15000;
};

enum class WireFormat {
  kContentLength,
  kLineDelimited,
};

enum class ToolCallingPolicy {
  kConservative,
  kBalanced,
  kAggressive,
};

struct ToolCallingSettings {
  bool tool_calling_enabled = true;
  bool auto_attach_tools = true;
  ToolCallingPolicy policy = ToolCallingPolicy::kBalanced;
  int max_tool_calls_per_turn = 4;
  std::vector<std::string> allowlist;
  std::vector<std::string> denylist;
  std::unordered_map<std::string, bool> tool_states;
  std::vector<McpServerConfig> servers;
};

struct RuntimeConfig {
  HttpEndpoint llm;
  std::string model;
  std::string api_key;
  std::string mcp_servers_file;
  ToolCallingSettings tools;
};

RuntimeConfig LoadConfigFromEnv();

constexpr int kDefaultToolTimeoutMs = 15000;
constexpr int kRemoteBridgeTimeoutMs = 45000;
constexpr int kMinToolTimeoutMs = 1000;
constexpr int kMaxToolTimeoutMs = 120000;

std::vector<std::string> ParseArgs(const std::string& raw);
std::vector<std::pair<std::string, std::string>> ParseEnv(const std::string& raw);

bool IsRemoteBridge(const McpServerConfig& cfg);
WireFormat DetectWireFormat(const McpServerConfig& cfg);
int ResolveTimeoutMs(const McpServerConfig& cfg);

// Accepts the import shapes used by common MCP client configs (array, {mcpServers}, {servers},
// {server}, dictionary keyed by id, single object, or a bare http(s) URL).
std::vector<McpServerConfig> ParseMcpServersPayload(const nlohmann::json& payload);
bool LoadMcpServersFile(const std::string& path, std::vector<McpServerConfig>* out, std::string* err);

ToolCallingPolicy ParseToolCallingPolicy(const std::string& raw);
const char* ToolCallingPolicyName(ToolCallingPolicy policy);
int ClampToolIterationLimit(double raw);

HttpEndpoint ParseHttpEndpoint(const std::string& url, int default_port);

}  // namespace toolrt
