#include "tooling.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <regex>
#include <string>
#include <string_view>
#include <utility>

namespace toolrt {
namespace {

static std::string Trim(const std::string& s) {
  size_t start = 0;
  while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) start++;
  size_t end = s.size();
  while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) end--;
  return s.substr(start, end - start);
}

static std::string ToLower(std::string s) {
  for (auto& ch : s) ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  return s;
}

static bool IsNameChar(char c) {
  return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_' || c == '-';
}

static std::string GlobToRegex(const std::string& glob) {
  std::string out;
  out.reserve(glob.size() * 2);
  out += '^';
  for (const char c : glob) {
    if (c == '*') {
      out += ".*";
      continue;
    }
    if (std::string_view(".+?^${}()|[]\\").find(c) != std::string_view::npos) {
      out += '\\';
      out += c;
      continue;
    }
    out += c;
  }
  out += '$';
  return out;
}

static std::string ServerLabel(const McpServerConfig& server) {
  const std::string id = Trim(server.id);
  if (!id.empty()) return id;
  const std::string name = Trim(server.name);
  if (!name.empty()) return name;
  return "server";
}

static std::string DefaultDescription(const McpServerConfig& server, const std::string& tool_name) {
  const std::string label = server.name.empty() ? server.id : server.name;
  return label + ": " + tool_name;
}

static bool ShouldConnect(const McpServerConfig& server) {
  return server.enabled && !Trim(server.command).empty();
}

// Launches, initializes and lists one server. On failure the client (if any) is closed and
// nullptr is returned with `err` set.
static std::shared_ptr<McpClient> ConnectAndList(const McpServerConfig& server,
                                                 const CancellationToken& cancel,
                                                 const ChannelFactory& factory,
                                                 std::vector<McpToolInfo>* tools,
                                                 std::string* err) {
  std::string launch_err;
  std::shared_ptr<McpClient> client = McpClient::Launch(server, &launch_err, factory);
  if (!client) {
    if (err) *err = launch_err;
    return nullptr;
  }
  McpCallError call_err;
  if (!client->Initialize(cancel, &call_err)) {
    client->Close();
    if (err) *err = call_err.message;
    return nullptr;
  }
  auto listed = client->ListTools(cancel, &call_err);
  if (!listed) {
    client->Close();
    if (err) *err = call_err.message;
    return nullptr;
  }
  if (tools) *tools = std::move(*listed);
  return client;
}

}  // namespace

std::string SanitizeNamePart(const std::string& input) {
  const std::string lower = ToLower(input);
  std::string out;
  out.reserve(lower.size());
  for (const char c : lower) {
    const char mapped = IsNameChar(c) ? c : '_';
    if (mapped == '_' && !out.empty() && out.back() == '_') continue;
    out.push_back(mapped);
  }
  size_t start = 0;
  while (start < out.size() && out[start] == '_') start++;
  size_t end = out.size();
  while (end > start && out[end - 1] == '_') end--;
  out = out.substr(start, end - start);
  return out.empty() ? "tool" : out;
}

std::string BuildCallName(const std::string& server_id, const std::string& tool_name, std::unordered_set<std::string>* used) {
  const std::string base = "mcp_" + SanitizeNamePart(server_id) + "__" + SanitizeNamePart(tool_name);
  std::string candidate = base.substr(0, kMaxCallNameLength);
  int suffix = 2;
  while (used && used->count(candidate) > 0) {
    const std::string tail = "_" + std::to_string(suffix);
    const size_t keep = tail.size() < kMaxCallNameLength ? kMaxCallNameLength - tail.size() : 1;
    candidate = base.substr(0, std::max<size_t>(1, keep)) + tail;
    suffix++;
  }
  if (used) used->insert(candidate);
  return candidate;
}

std::string TruncateUtf8(const std::string& s, size_t max_bytes) {
  if (s.size() <= max_bytes) return s;
  size_t cut = max_bytes;
  // Step back over continuation bytes so the cut lands on a sequence start.
  while (cut > 0 && (static_cast<unsigned char>(s[cut]) & 0xC0) == 0x80) cut--;
  return s.substr(0, cut);
}

nlohmann::json NormalizeInputSchema(const nlohmann::json& schema) {
  if (schema.is_object()) return schema;
  return {{"type", "object"}, {"properties", nlohmann::json::object()}, {"additionalProperties", true}};
}

nlohmann::json ToOpenAiToolDefinition(const ToolEntry& entry) {
  nlohmann::json fn;
  fn["name"] = entry.call_name;
  fn["description"] = entry.description;
  fn["parameters"] = entry.parameters;
  return {{"type", "function"}, {"function", std::move(fn)}};
}

ToolRegistry::ToolRegistry(ToolRegistry&& other) noexcept {
  std::unique_lock<std::shared_mutex> lock(other.mu_);
  entries_ = std::move(other.entries_);
  index_ = std::move(other.index_);
  used_names_ = std::move(other.used_names_);
}

ToolRegistry& ToolRegistry::operator=(ToolRegistry&& other) noexcept {
  if (this == &other) return *this;
  std::unique_lock<std::shared_mutex> lock_other(other.mu_);
  std::unique_lock<std::shared_mutex> lock_this(mu_);
  entries_ = std::move(other.entries_);
  index_ = std::move(other.index_);
  used_names_ = std::move(other.used_names_);
  return *this;
}

std::string ToolRegistry::Register(ToolEntry entry) {
  std::unique_lock<std::shared_mutex> lock(mu_);
  entry.call_name = BuildCallName(entry.server_id.empty() ? entry.server_name : entry.server_id, entry.tool_name, &used_names_);
  const std::string name = entry.call_name;
  index_[name] = entries_.size();
  entries_.push_back(std::move(entry));
  return name;
}

bool ToolRegistry::HasTool(const std::string& call_name) const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  return index_.find(call_name) != index_.end();
}

std::optional<ToolEntry> ToolRegistry::Find(const std::string& call_name) const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  auto it = index_.find(call_name);
  if (it == index_.end()) return std::nullopt;
  return entries_[it->second];
}

std::vector<ToolEntry> ToolRegistry::List() const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  return entries_;
}

size_t ToolRegistry::Size() const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  return entries_.size();
}

PreparedTools::~PreparedTools() {
  Close();
}

PreparedTools& PreparedTools::operator=(PreparedTools&& other) noexcept {
  if (this != &other) {
    Close();
    clients_ = std::move(other.clients_);
    registry_ = std::move(other.registry_);
    tools_ = std::move(other.tools_);
  }
  return *this;
}

void PreparedTools::Close() {
  for (auto& client : clients_) {
    if (client) client->Close();
  }
  clients_.clear();
}

PreparedTools PrepareMcpTools(const std::vector<McpServerConfig>& servers, const PrepareOptions& options) {
  PreparedTools out;
  for (const auto& server : servers) {
    if (!ShouldConnect(server)) continue;
    if (options.cancel.IsCancelled()) break;

    std::vector<McpToolInfo> listed;
    std::string err;
    auto client = ConnectAndList(server, options.cancel, options.channel_factory, &listed, &err);
    if (!client) {
      std::cout << "[mcp] skip server=" << server.id << " error=" << err << "\n";
      continue;
    }
    out.clients_.push_back(client);

    for (const auto& item : listed) {
      const std::string tool_name = Trim(item.name);
      if (tool_name.empty()) continue;
      ToolEntry entry;
      entry.tool_name = tool_name;
      entry.server_id = ServerLabel(server);
      entry.server_name = server.name;
      entry.description = TruncateUtf8(item.description.empty() ? DefaultDescription(server, tool_name) : item.description,
                                       kMaxToolDescriptionLength);
      entry.parameters = NormalizeInputSchema(item.input_schema);
      entry.timeout_ms = client->default_timeout_ms();
      entry.client = client;
      const std::string call_name = out.registry_.Register(entry);
      entry.call_name = call_name;
      out.tools_.push_back(ToOpenAiToolDefinition(entry));
    }
    std::cout << "[mcp] prepared server=" << server.id << " tools=" << listed.size() << "\n";
  }
  return out;
}

std::vector<DiscoveredTool> DiscoverToolCatalog(const std::vector<McpServerConfig>& servers, const PrepareOptions& options) {
  std::unordered_set<std::string> used;
  std::vector<DiscoveredTool> out;
  for (const auto& server : servers) {
    if (!ShouldConnect(server)) continue;
    if (options.cancel.IsCancelled()) break;

    std::vector<McpToolInfo> listed;
    std::string err;
    auto client = ConnectAndList(server, options.cancel, options.channel_factory, &listed, &err);
    if (!client) {
      std::cout << "[mcp] discovery skipped server=" << server.id << " error=" << err << "\n";
      continue;
    }
    for (const auto& item : listed) {
      const std::string tool_name = Trim(item.name);
      if (tool_name.empty()) continue;
      DiscoveredTool row;
      row.server_id = Trim(server.id);
      row.server_name = Trim(server.name.empty() ? server.id : server.name);
      row.tool_name = tool_name;
      row.call_name = BuildCallName(ServerLabel(server), tool_name, &used);
      row.description = TruncateUtf8(item.description.empty() ? DefaultDescription(server, tool_name) : item.description,
                                     kMaxToolDescriptionLength);
      out.push_back(std::move(row));
    }
    client->Close();
  }
  return out;
}

nlohmann::json DiscoveredToolToJson(const DiscoveredTool& tool) {
  return {{"serverId", tool.server_id},
          {"serverName", tool.server_name},
          {"toolName", tool.tool_name},
          {"callName", tool.call_name},
          {"description", tool.description}};
}

ServerTestResult TestServerConnection(const McpServerConfig& server,
                                      const CancellationToken& cancel,
                                      const ChannelFactory& channel_factory) {
  ServerTestResult out;
  if (Trim(server.command).empty()) {
    out.error = "Command is required";
    return out;
  }
  std::vector<McpToolInfo> listed;
  std::string err;
  auto client = ConnectAndList(server, cancel, channel_factory, &listed, &err);
  if (!client) {
    out.error = err.empty() ? "Unknown MCP error" : err;
    return out;
  }
  client->Close();
  out.ok = true;
  for (auto& item : listed) {
    McpToolInfo info;
    info.name = Trim(item.name);
    info.description = Trim(item.description);
    if (!info.name.empty()) out.tools.push_back(std::move(info));
  }
  return out;
}

nlohmann::json ServerTestResultToJson(const ServerTestResult& result) {
  nlohmann::json j;
  j["ok"] = result.ok;
  j["tools"] = nlohmann::json::array();
  for (const auto& t : result.tools) j["tools"].push_back({{"name", t.name}, {"description", t.description}});
  if (!result.ok) j["error"] = result.error;
  return j;
}

bool MatchToolPattern(const std::string& tool_name, const std::string& pattern) {
  const std::string t = ToLower(tool_name);
  const std::string p = ToLower(pattern);
  if (p.empty()) return false;
  if (p.find('*') == std::string::npos) return t == p;
  try {
    const std::regex re(GlobToRegex(p), std::regex::ECMAScript | std::regex::icase);
    return std::regex_match(t, re);
  } catch (const std::regex_error&) {
    return t == p;
  }
}

std::vector<nlohmann::json> FilterToolsForModel(const std::vector<nlohmann::json>& tools,
                                                const std::vector<std::string>& allowlist,
                                                const std::vector<std::string>& denylist,
                                                const std::unordered_map<std::string, bool>& states) {
  std::vector<nlohmann::json> out;
  for (const auto& tool : tools) {
    std::string name;
    if (tool.is_object() && tool.contains("function") && tool["function"].is_object() &&
        tool["function"].contains("name") && tool["function"]["name"].is_string()) {
      name = Trim(tool["function"]["name"].get<std::string>());
    }
    if (name.empty()) continue;
    auto state = states.find(name);
    if (state != states.end() && !state->second) continue;
    const bool allowed = allowlist.empty() ||
                         std::any_of(allowlist.begin(), allowlist.end(), [&](const std::string& p) { return MatchToolPattern(name, p); });
    if (!allowed) continue;
    const bool denied =
        std::any_of(denylist.begin(), denylist.end(), [&](const std::string& p) { return MatchToolPattern(name, p); });
    if (denied) continue;
    out.push_back(tool);
  }
  return out;
}

}  // namespace toolrt
