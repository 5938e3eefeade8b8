#include <gtest/gtest.h>
#include "config.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <limits>

using namespace toolrt;

static McpServerConfig Server(const std::string& command, const std::string& args, int timeout_ms = 0) {
  McpServerConfig cfg;
  cfg.id = "s";
  cfg.command = command;
  cfg.args = args;
  cfg.timeout_ms = timeout_ms;
  return cfg;
}

TEST(ConfigTest, ParseArgsHandlesQuotes) {
  auto args = ParseArgs(R"(  -y "@scope/pkg name" --flag='a b' plain  )");
  ASSERT_EQ(args.size(), 5u);
  EXPECT_EQ(args[0], "-y");
  EXPECT_EQ(args[1], "@scope/pkg name");
  EXPECT_EQ(args[2], "--flag='a");
  EXPECT_EQ(args[3], "b'");
  EXPECT_EQ(args[4], "plain");
  EXPECT_TRUE(ParseArgs("").empty());
}

TEST(ConfigTest, ParseArgsKeepsQuotedToken) {
  auto args = ParseArgs(R"(run 'single quoted' "double")");
  ASSERT_EQ(args.size(), 3u);
  EXPECT_EQ(args[1], "single quoted");
  EXPECT_EQ(args[2], "double");
}

TEST(ConfigTest, ParseEnvSkipsCommentsAndBadLines) {
  auto env = ParseEnv("# comment\nAPI_KEY=abc=def\n\n=novalue\nNOEQUALS\r\n SPACED = keep \nAPI_KEY=override\n");
  ASSERT_EQ(env.size(), 2u);
  EXPECT_EQ(env[0].first, "API_KEY");
  EXPECT_EQ(env[0].second, "override");
  EXPECT_EQ(env[1].first, "SPACED");
  EXPECT_EQ(env[1].second, " keep");
}

TEST(ConfigTest, DetectsRemoteBridgeWireFormat) {
  EXPECT_EQ(DetectWireFormat(Server("npx", "-y mcp-remote https://example.com/sse")), WireFormat::kLineDelimited);
  EXPECT_EQ(DetectWireFormat(Server("npx", "-y MCP-Remote@latest https://x")), WireFormat::kLineDelimited);
  EXPECT_EQ(DetectWireFormat(Server("npx", "-y @modelcontextprotocol/server-filesystem /tmp")), WireFormat::kContentLength);
  EXPECT_EQ(DetectWireFormat(Server("npx", "-y mcp-remoteish")), WireFormat::kContentLength);
}

TEST(ConfigTest, ResolvesTimeouts) {
  EXPECT_EQ(ResolveTimeoutMs(Server("node", "server.js")), 15000);
  EXPECT_EQ(ResolveTimeoutMs(Server("npx", "mcp-remote https://x")), 45000);
  EXPECT_EQ(ResolveTimeoutMs(Server("node", "server.js", 10)), 1000);
  EXPECT_EQ(ResolveTimeoutMs(Server("node", "server.js", 500000)), 120000);
  EXPECT_EQ(ResolveTimeoutMs(Server("node", "server.js", 30000)), 30000);
  EXPECT_EQ(ResolveTimeoutMs(Server("npx", "mcp-remote https://x", 20000)), 45000);
  EXPECT_EQ(ResolveTimeoutMs(Server("npx", "mcp-remote https://x", 90000)), 90000);
}

TEST(ConfigTest, ParsesMcpServersObjectShape) {
  auto payload = nlohmann::json::parse(R"({
    "mcpServers": {
      "files": {"command": "npx", "args": ["-y", "@mcp/files", "/tmp/my dir"], "env": {"TOKEN": "t"}},
      "shell": {"command": "bash", "args": "-c ls"},
      "remote": {"url": "https://tools.example.com/sse"}
    }
  })");
  auto servers = ParseMcpServersPayload(payload);
  ASSERT_EQ(servers.size(), 2u);

  const auto& files = servers[0].id == "files" ? servers[0] : servers[1];
  const auto& remote = servers[0].id == "files" ? servers[1] : servers[0];
  EXPECT_EQ(files.command, "npx");
  EXPECT_EQ(files.args, "-y @mcp/files \"/tmp/my dir\"");
  EXPECT_EQ(files.env, "TOKEN=t");
  EXPECT_EQ(files.timeout_ms, 15000);
  EXPECT_TRUE(files.enabled);

  EXPECT_EQ(remote.command, "npx");
  EXPECT_EQ(remote.args, "-y mcp-remote https://tools.example.com/sse");
  EXPECT_EQ(remote.timeout_ms, 45000);
  EXPECT_EQ(DetectWireFormat(remote), WireFormat::kLineDelimited);
}

TEST(ConfigTest, ParsesArrayAndAliases) {
  auto payload = nlohmann::json::parse(R"([
    {"serverId": "a", "displayName": "Alpha", "cmd": "uvx", "arguments": "alpha-mcp", "enabled": false, "timeoutMs": 999999},
    {"id": "b", "command": "python3", "args": "-m beta", "timeoutMs": 5},
    "not an object"
  ])");
  auto servers = ParseMcpServersPayload(payload);
  ASSERT_EQ(servers.size(), 2u);
  EXPECT_EQ(servers[0].id, "a");
  EXPECT_EQ(servers[0].name, "Alpha");
  EXPECT_EQ(servers[0].command, "uvx");
  EXPECT_EQ(servers[0].args, "alpha-mcp");
  EXPECT_FALSE(servers[0].enabled);
  EXPECT_EQ(servers[0].timeout_ms, 120000);
  EXPECT_EQ(servers[1].name, "b");
  EXPECT_EQ(servers[1].timeout_ms, 1000);
}

TEST(ConfigTest, ParsesBareUrlAndSingleServer) {
  auto from_url = ParseMcpServersPayload(nlohmann::json("https://mcp.example.org:8443/sse"));
  ASSERT_EQ(from_url.size(), 1u);
  EXPECT_EQ(from_url[0].id, "mcp.example.org");
  EXPECT_TRUE(IsRemoteBridge(from_url[0]));

  EXPECT_TRUE(ParseMcpServersPayload(nlohmann::json("ftp://nope")).empty());

  auto single = ParseMcpServersPayload(nlohmann::json::parse(R"({"server": {"id": "one", "command": "deno", "args": "run tool.ts"}})"));
  ASSERT_EQ(single.size(), 1u);
  EXPECT_EQ(single[0].id, "one");
}

TEST(ConfigTest, LoadsServersFile) {
  const std::string path = ::testing::TempDir() + "tool_runtime_servers.json";
  {
    std::ofstream out(path);
    out << R"({"servers": [{"id": "x", "command": "node", "args": "x.js"}]})";
  }
  std::vector<McpServerConfig> servers;
  std::string err;
  ASSERT_TRUE(LoadMcpServersFile(path, &servers, &err)) << err;
  ASSERT_EQ(servers.size(), 1u);
  EXPECT_EQ(servers[0].command, "node");
  std::remove(path.c_str());

  EXPECT_FALSE(LoadMcpServersFile(path + ".missing", &servers, &err));
  EXPECT_FALSE(err.empty());
}

TEST(ConfigTest, PolicyAndIterationLimit) {
  EXPECT_EQ(ParseToolCallingPolicy("conservative"), ToolCallingPolicy::kConservative);
  EXPECT_EQ(ParseToolCallingPolicy(" Aggressive "), ToolCallingPolicy::kAggressive);
  EXPECT_EQ(ParseToolCallingPolicy("whatever"), ToolCallingPolicy::kBalanced);
  EXPECT_STREQ(ToolCallingPolicyName(ToolCallingPolicy::kAggressive), "aggressive");

  EXPECT_EQ(ClampToolIterationLimit(std::numeric_limits<double>::quiet_NaN()), 4);
  EXPECT_EQ(ClampToolIterationLimit(std::numeric_limits<double>::infinity()), 4);
  EXPECT_EQ(ClampToolIterationLimit(0), 1);
  EXPECT_EQ(ClampToolIterationLimit(7.9), 7);
  EXPECT_EQ(ClampToolIterationLimit(40), 12);
}

TEST(ConfigTest, ParsesHttpEndpoint) {
  auto ep = ParseHttpEndpoint("http://localhost:1234/v1/", 0);
  EXPECT_EQ(ep.scheme, "http");
  EXPECT_EQ(ep.host, "localhost");
  EXPECT_EQ(ep.port, 1234);
  EXPECT_EQ(ep.base_path, "/v1");

  auto tls = ParseHttpEndpoint("https://api.example.com", 0);
  EXPECT_EQ(tls.port, 443);
  EXPECT_EQ(tls.base_path, "");
}

TEST(ConfigTest, LoadsFromEnvironment) {
  setenv("TOOL_RUNTIME_TOOL_POLICY", "conservative", 1);
  setenv("TOOL_RUNTIME_MAX_TOOL_CALLS", "99", 1);
  setenv("TOOL_RUNTIME_TOOL_ALLOWLIST", "MCP_Files__*, mcp_web__search", 1);
  setenv("TOOL_RUNTIME_TOOL_STATES", R"({"mcp_files__delete": false, "bad": 3})", 1);
  setenv("TOOL_RUNTIME_AUTO_ATTACH_TOOLS", "off", 1);
  auto cfg = LoadConfigFromEnv();
  EXPECT_EQ(cfg.tools.policy, ToolCallingPolicy::kConservative);
  EXPECT_EQ(cfg.tools.max_tool_calls_per_turn, 12);
  ASSERT_EQ(cfg.tools.allowlist.size(), 2u);
  EXPECT_EQ(cfg.tools.allowlist[0], "mcp_files__*");
  ASSERT_EQ(cfg.tools.tool_states.size(), 1u);
  EXPECT_FALSE(cfg.tools.tool_states.at("mcp_files__delete"));
  EXPECT_FALSE(cfg.tools.auto_attach_tools);
  EXPECT_EQ(cfg.llm.port, 8080);
  EXPECT_EQ(cfg.llm.base_path, "/v1");
  for (const char* name : {"TOOL_RUNTIME_TOOL_POLICY", "TOOL_RUNTIME_MAX_TOOL_CALLS", "TOOL_RUNTIME_TOOL_ALLOWLIST",
                           "TOOL_RUNTIME_TOOL_STATES", "TOOL_RUNTIME_AUTO_ATTACH_TOOLS"}) {
    unsetenv(name);
  }
}

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
