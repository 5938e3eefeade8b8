#include "config.hpp"

#include "command_allowlist.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <optional>
#include <regex>
#include <sstream>
#include <string>
#include <vector>

namespace toolrt {
namespace {

static bool StartsWith(const std::string& s, const std::string& prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

static std::string Trim(const std::string& s) {
  size_t start = 0;
  while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) start++;
  size_t end = s.size();
  while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) end--;
  return s.substr(start, end - start);
}

static std::string ToLower(std::string s) {
  for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

static std::string GetEnvStr(const char* name) {
  const char* v = std::getenv(name);
  return v ? std::string(v) : std::string();
}

static std::vector<std::string> SplitCsv(const std::string& s) {
  std::vector<std::string> out;
  std::string cur;
  for (char c : s) {
    if (c == ',') {
      cur = Trim(cur);
      if (!cur.empty()) out.push_back(cur);
      cur.clear();
      continue;
    }
    cur.push_back(c);
  }
  cur = Trim(cur);
  if (!cur.empty()) out.push_back(cur);
  return out;
}

static bool TryParseBool(const std::string& s, bool* out) {
  if (!out) return false;
  const std::string v = ToLower(Trim(s));
  if (v == "1" || v == "true" || v == "yes" || v == "y" || v == "on") {
    *out = true;
    return true;
  }
  if (v == "0" || v == "false" || v == "no" || v == "n" || v == "off") {
    *out = false;
    return true;
  }
  return false;
}

static std::string JsonString(const nlohmann::json& obj, const char* key) {
  if (!obj.contains(key)) return {};
  const auto& v = obj[key];
  if (v.is_string()) return v.get<std::string>();
  if (v.is_number_integer()) return std::to_string(v.get<long long>());
  return {};
}

static std::string QuoteArg(const std::string& arg) {
  bool needs_quotes = arg.empty();
  for (char c : arg) {
    if (std::isspace(static_cast<unsigned char>(c))) needs_quotes = true;
  }
  if (!needs_quotes) return arg;
  if (arg.find('"') == std::string::npos) return "\"" + arg + "\"";
  return "'" + arg + "'";
}

static std::string ArgsFromJson(const nlohmann::json& v) {
  if (v.is_string()) return v.get<std::string>();
  if (!v.is_array()) return {};
  std::string out;
  for (const auto& a : v) {
    if (!a.is_string()) continue;
    if (!out.empty()) out += ' ';
    out += QuoteArg(a.get<std::string>());
  }
  return out;
}

static std::string EnvFromJson(const nlohmann::json& v) {
  if (v.is_string()) return v.get<std::string>();
  if (!v.is_object()) return {};
  std::string out;
  for (const auto& [k, val] : v.items()) {
    if (!out.empty()) out += '\n';
    out += k + "=" + (val.is_string() ? val.get<std::string>() : val.dump());
  }
  return out;
}

static int64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch())
      .count();
}

static std::optional<McpServerConfig> NormalizeMcpServer(const nlohmann::json& row, size_t fallback_index) {
  if (!row.is_object()) return std::nullopt;
  McpServerConfig cfg;
  cfg.id = Trim(JsonString(row, "id"));
  if (cfg.id.empty()) cfg.id = Trim(JsonString(row, "serverId"));
  if (cfg.id.empty()) cfg.id = "mcp-" + std::to_string(NowMs()) + "-" + std::to_string(fallback_index);

  cfg.name = Trim(JsonString(row, "name"));
  if (cfg.name.empty()) cfg.name = Trim(JsonString(row, "displayName"));
  if (cfg.name.empty()) cfg.name = cfg.id;

  const std::string url = Trim(JsonString(row, "url"));
  cfg.command = Trim(JsonString(row, "command"));
  if (cfg.command.empty()) cfg.command = Trim(JsonString(row, "cmd"));
  if (cfg.command.empty() && !url.empty()) cfg.command = "npx";
  if (cfg.command.empty()) return std::nullopt;
  if (!IsAllowedCommand(cfg.command)) return std::nullopt;

  if (row.contains("args")) cfg.args = Trim(ArgsFromJson(row["args"]));
  if (cfg.args.empty() && row.contains("arguments")) cfg.args = Trim(ArgsFromJson(row["arguments"]));
  if (cfg.args.empty() && !url.empty()) cfg.args = "-y mcp-remote " + url;

  if (row.contains("env")) cfg.env = Trim(EnvFromJson(row["env"]));
  if (row.contains("enabled") && row["enabled"].is_boolean()) cfg.enabled = row["enabled"].get<bool>();

  const int default_timeout = url.empty() ? kDefaultToolTimeoutMs : kRemoteBridgeTimeoutMs;
  cfg.timeout_ms = default_timeout;
  if (row.contains("timeoutMs") && row["timeoutMs"].is_number()) {
    const double raw = row["timeoutMs"].get<double>();
    if (std::isfinite(raw)) {
      cfg.timeout_ms = static_cast<int>(
          std::clamp(std::floor(raw), static_cast<double>(kMinToolTimeoutMs), static_cast<double>(kMaxToolTimeoutMs)));
    }
  }
  return cfg;
}

static std::vector<McpServerConfig> NormalizeList(const nlohmann::json& arr) {
  std::vector<McpServerConfig> out;
  for (size_t i = 0; i < arr.size(); i++) {
    if (auto cfg = NormalizeMcpServer(arr[i], i + 1)) out.push_back(std::move(*cfg));
  }
  return out;
}

static std::string HostFromUrl(const std::string& url) {
  auto ep = ParseHttpEndpoint(url, 0);
  return ep.host;
}

}  // namespace

HttpEndpoint ParseHttpEndpoint(const std::string& url, int default_port) {
  HttpEndpoint ep;
  ep.port = 0;
  std::string s = url;
  if (StartsWith(s, "http://")) {
    ep.scheme = "http";
    s = s.substr(7);
  } else if (StartsWith(s, "https://")) {
    ep.scheme = "https";
    s = s.substr(8);
  }

  auto slash_pos = s.find('/');
  if (slash_pos != std::string::npos) {
    ep.base_path = s.substr(slash_pos);
    s = s.substr(0, slash_pos);
  }
  while (!ep.base_path.empty() && ep.base_path.back() == '/') ep.base_path.pop_back();

  auto colon_pos = s.rfind(':');
  if (colon_pos != std::string::npos) {
    ep.host = s.substr(0, colon_pos);
    ep.port = std::atoi(s.substr(colon_pos + 1).c_str());
  } else if (!s.empty()) {
    ep.host = s;
  }
  if (ep.port == 0) ep.port = default_port != 0 ? default_port : (ep.scheme == "https" ? 443 : 80);
  if (ep.host.empty()) ep.host = "127.0.0.1";
  return ep;
}

std::vector<std::string> ParseArgs(const std::string& raw) {
  std::vector<std::string> out;
  const std::string text = Trim(raw);
  size_t i = 0;
  while (i < text.size()) {
    if (std::isspace(static_cast<unsigned char>(text[i]))) {
      i++;
      continue;
    }
    const char c = text[i];
    if (c == '"' || c == '\'') {
      auto close = text.find(c, i + 1);
      if (close != std::string::npos) {
        out.push_back(text.substr(i + 1, close - i - 1));
        i = close + 1;
        continue;
      }
    }
    size_t end = i;
    while (end < text.size() && !std::isspace(static_cast<unsigned char>(text[end]))) end++;
    out.push_back(text.substr(i, end - i));
    i = end;
  }
  return out;
}

std::vector<std::pair<std::string, std::string>> ParseEnv(const std::string& raw) {
  std::vector<std::pair<std::string, std::string>> out;
  std::istringstream iss(raw);
  std::string line;
  while (std::getline(iss, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    const std::string trimmed = Trim(line);
    if (trimmed.empty() || trimmed[0] == '#') continue;
    const auto idx = trimmed.find('=');
    if (idx == std::string::npos || idx == 0) continue;
    std::string key = Trim(trimmed.substr(0, idx));
    if (key.empty()) continue;
    std::string value = trimmed.substr(idx + 1);
    auto it = std::find_if(out.begin(), out.end(), [&](const auto& kv) { return kv.first == key; });
    if (it != out.end()) {
      it->second = std::move(value);
    } else {
      out.emplace_back(std::move(key), std::move(value));
    }
  }
  return out;
}

bool IsRemoteBridge(const McpServerConfig& cfg) {
  static const std::regex kBridge(R"(\bmcp-remote\b)", std::regex::icase);
  return std::regex_search(cfg.command + " " + cfg.args, kBridge);
}

WireFormat DetectWireFormat(const McpServerConfig& cfg) {
  return IsRemoteBridge(cfg) ? WireFormat::kLineDelimited : WireFormat::kContentLength;
}

int ResolveTimeoutMs(const McpServerConfig& cfg) {
  const bool bridge = IsRemoteBridge(cfg);
  const int fallback = bridge ? kRemoteBridgeTimeoutMs : kDefaultToolTimeoutMs;
  if (cfg.timeout_ms <= 0) return fallback;
  const int normalized = std::clamp(cfg.timeout_ms, kMinToolTimeoutMs, kMaxToolTimeoutMs);
  return bridge ? std::max(kRemoteBridgeTimeoutMs, normalized) : normalized;
}

std::vector<McpServerConfig> ParseMcpServersPayload(const nlohmann::json& payload) {
  if (payload.is_array()) return NormalizeList(payload);
  if (payload.is_string()) {
    const std::string trimmed = Trim(payload.get<std::string>());
    const std::string lower = ToLower(trimmed);
    if (!StartsWith(lower, "http://") && !StartsWith(lower, "https://")) return {};
    std::string host = HostFromUrl(trimmed);
    nlohmann::json row = {{"id", host.empty() ? "mcp-http" : host},
                          {"name", host.empty() ? "MCP HTTP" : host},
                          {"url", trimmed}};
    if (auto one = NormalizeMcpServer(row, 1)) return {std::move(*one)};
    return {};
  }
  if (!payload.is_object()) return {};
  if (payload.contains("mcpServers")) return ParseMcpServersPayload(payload["mcpServers"]);
  if (payload.contains("servers")) return ParseMcpServersPayload(payload["servers"]);
  if (payload.contains("server")) return ParseMcpServersPayload(nlohmann::json::array({payload["server"]}));

  bool all_objects = !payload.empty();
  for (const auto& [_, v] : payload.items()) {
    if (!v.is_object()) all_objects = false;
  }
  if (all_objects) {
    std::vector<McpServerConfig> out;
    size_t index = 0;
    for (const auto& [key, v] : payload.items()) {
      index++;
      nlohmann::json row = v;
      row["id"] = key;
      row["name"] = key;
      if (auto cfg = NormalizeMcpServer(row, index)) out.push_back(std::move(*cfg));
    }
    return out;
  }

  if (auto one = NormalizeMcpServer(payload, 1)) return {std::move(*one)};
  return {};
}

bool LoadMcpServersFile(const std::string& path, std::vector<McpServerConfig>* out, std::string* err) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    if (err) *err = "cannot open mcp servers file: " + path;
    return false;
  }
  std::stringstream ss;
  ss << in.rdbuf();
  auto j = nlohmann::json::parse(ss.str(), nullptr, false);
  if (j.is_discarded()) {
    if (err) *err = "invalid json in mcp servers file: " + path;
    return false;
  }
  if (out) *out = ParseMcpServersPayload(j);
  return true;
}

ToolCallingPolicy ParseToolCallingPolicy(const std::string& raw) {
  const std::string v = ToLower(Trim(raw));
  if (v == "conservative") return ToolCallingPolicy::kConservative;
  if (v == "aggressive") return ToolCallingPolicy::kAggressive;
  return ToolCallingPolicy::kBalanced;
}

const char* ToolCallingPolicyName(ToolCallingPolicy policy) {
  switch (policy) {
    case ToolCallingPolicy::kConservative:
      return "conservative";
    case ToolCallingPolicy::kAggressive:
      return "aggressive";
    case ToolCallingPolicy::kBalanced:
      break;
  }
  return "balanced";
}

int ClampToolIterationLimit(double raw) {
  if (!std::isfinite(raw)) return 4;
  return static_cast<int>(std::clamp(std::floor(raw), 1.0, 12.0));
}

RuntimeConfig LoadConfigFromEnv() {
  RuntimeConfig cfg;
  cfg.llm = ParseHttpEndpoint("http://127.0.0.1:8080/v1", 8080);

  if (auto ep = GetEnvStr("TOOL_RUNTIME_LLM_ENDPOINT"); !ep.empty()) cfg.llm = ParseHttpEndpoint(ep, 0);
  if (auto model = GetEnvStr("TOOL_RUNTIME_MODEL"); !model.empty()) cfg.model = model;
  if (auto key = GetEnvStr("TOOL_RUNTIME_API_KEY"); !key.empty()) cfg.api_key = key;
  if (auto file = GetEnvStr("TOOL_RUNTIME_MCP_SERVERS_FILE"); !file.empty()) cfg.mcp_servers_file = file;

  if (auto v = GetEnvStr("TOOL_RUNTIME_TOOL_CALLING"); !v.empty()) {
    bool b = true;
    if (TryParseBool(v, &b)) cfg.tools.tool_calling_enabled = b;
  }
  if (auto v = GetEnvStr("TOOL_RUNTIME_AUTO_ATTACH_TOOLS"); !v.empty()) {
    bool b = true;
    if (TryParseBool(v, &b)) cfg.tools.auto_attach_tools = b;
  }
  if (auto v = GetEnvStr("TOOL_RUNTIME_TOOL_POLICY"); !v.empty()) cfg.tools.policy = ParseToolCallingPolicy(v);
  if (auto v = GetEnvStr("TOOL_RUNTIME_MAX_TOOL_CALLS"); !v.empty()) {
    char* end = nullptr;
    const double d = std::strtod(v.c_str(), &end);
    cfg.tools.max_tool_calls_per_turn = ClampToolIterationLimit(end == v.c_str() ? NAN : d);
  }
  if (auto v = GetEnvStr("TOOL_RUNTIME_TOOL_ALLOWLIST"); !v.empty()) {
    for (auto& p : SplitCsv(v)) cfg.tools.allowlist.push_back(ToLower(p));
  }
  if (auto v = GetEnvStr("TOOL_RUNTIME_TOOL_DENYLIST"); !v.empty()) {
    for (auto& p : SplitCsv(v)) cfg.tools.denylist.push_back(ToLower(p));
  }
  if (auto v = GetEnvStr("TOOL_RUNTIME_TOOL_STATES"); !v.empty()) {
    auto j = nlohmann::json::parse(v, nullptr, false);
    if (!j.is_discarded() && j.is_object()) {
      for (const auto& [name, state] : j.items()) {
        const std::string key = Trim(name);
        if (!key.empty() && state.is_boolean()) cfg.tools.tool_states[key] = state.get<bool>();
      }
    }
  }

  return cfg;
}

}  // namespace toolrt
