#pragma once

#include "cancellation.hpp"
#include "config.hpp"
#include "mcp_client.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace toolrt {

constexpr size_t kMaxCallNameLength = 64;
constexpr size_t kMaxToolDescriptionLength = 512;

// One callable tool as exposed to the model, plus what is needed to route a call back to its provider.
struct ToolEntry {
  std::string call_name;
  std::string tool_name;
  std::string server_id;
  std::string server_name;
  std::string description;
  nlohmann::json parameters;
  int timeout_ms = kDefaultToolTimeoutMs;
  std::shared_ptr<McpClient> client;
};

// Lower-cases, folds runs outside [a-z0-9_-] into '_', collapses and trims underscores. Never empty.
std::string SanitizeNamePart(const std::string& input);

// mcp_<server>__<tool>, capped at kMaxCallNameLength and suffixed _2, _3, ... until not in `used`.
// The chosen name is inserted into `used`.
std::string BuildCallName(const std::string& server_id, const std::string& tool_name, std::unordered_set<std::string>* used);

// Cuts `s` to at most `max_bytes` without splitting a UTF-8 sequence.
std::string TruncateUtf8(const std::string& s, size_t max_bytes);

// Object schemas pass through; anything else becomes an open object schema.
nlohmann::json NormalizeInputSchema(const nlohmann::json& schema);

nlohmann::json ToOpenAiToolDefinition(const ToolEntry& entry);

class ToolRegistry {
 public:
  ToolRegistry() = default;
  ToolRegistry(const ToolRegistry&) = delete;
  ToolRegistry& operator=(const ToolRegistry&) = delete;
  ToolRegistry(ToolRegistry&& other) noexcept;
  ToolRegistry& operator=(ToolRegistry&& other) noexcept;

  // Assigns a unique call name to `entry` and returns it.
  std::string Register(ToolEntry entry);
  bool HasTool(const std::string& call_name) const;
  std::optional<ToolEntry> Find(const std::string& call_name) const;
  // Registration order.
  std::vector<ToolEntry> List() const;
  size_t Size() const;

 private:
  mutable std::shared_mutex mu_;
  std::vector<ToolEntry> entries_;
  std::unordered_map<std::string, size_t> index_;
  std::unordered_set<std::string> used_names_;
};

struct PrepareOptions {
  CancellationToken cancel;
  ChannelFactory channel_factory;
};

// Per-turn tool state: live clients, the registry routing call names to them, and the matching
// OpenAI function definitions. Closing it shuts every client down.
class PreparedTools {
 public:
  PreparedTools() = default;
  ~PreparedTools();
  PreparedTools(const PreparedTools&) = delete;
  PreparedTools& operator=(const PreparedTools&) = delete;
  PreparedTools(PreparedTools&&) noexcept = default;
  // Closes the clients held before taking over `other`'s.
  PreparedTools& operator=(PreparedTools&& other) noexcept;

  const ToolRegistry& registry() const { return registry_; }
  const std::vector<nlohmann::json>& tools() const { return tools_; }
  size_t ClientCount() const { return clients_.size(); }

  void Close();

 private:
  friend PreparedTools PrepareMcpTools(const std::vector<McpServerConfig>& servers, const PrepareOptions& options);

  std::vector<std::shared_ptr<McpClient>> clients_;
  ToolRegistry registry_;
  std::vector<nlohmann::json> tools_;
};

// Best effort across servers: a server that fails to launch, initialize or list is skipped and its
// client closed.
PreparedTools PrepareMcpTools(const std::vector<McpServerConfig>& servers, const PrepareOptions& options);

struct DiscoveredTool {
  std::string server_id;
  std::string server_name;
  std::string tool_name;
  std::string call_name;
  std::string description;
};

std::vector<DiscoveredTool> DiscoverToolCatalog(const std::vector<McpServerConfig>& servers, const PrepareOptions& options);
nlohmann::json DiscoveredToolToJson(const DiscoveredTool& tool);

struct ServerTestResult {
  bool ok = false;
  std::vector<McpToolInfo> tools;
  std::string error;
};

ServerTestResult TestServerConnection(const McpServerConfig& server,
                                      const CancellationToken& cancel,
                                      const ChannelFactory& channel_factory = {});
nlohmann::json ServerTestResultToJson(const ServerTestResult& result);

bool MatchToolPattern(const std::string& tool_name, const std::string& pattern);

// `tools` are OpenAI function definitions. A false entry in `states` hides a tool, an empty
// allowlist admits everything, and the denylist always wins.
std::vector<nlohmann::json> FilterToolsForModel(const std::vector<nlohmann::json>& tools,
                                                const std::vector<std::string>& allowlist,
                                                const std::vector<std::string>& denylist,
                                                const std::unordered_map<std::string, bool>& states);

}  // namespace toolrt
