#include "cancellation.hpp"
#include "config.hpp"
#include "openai_compatible_http_provider.hpp"
#include "tool_loop.hpp"
#include "tooling.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

namespace {

std::atomic<bool> g_interrupted{false};

static void HandleSigint(int) {
  g_interrupted.store(true);
}

// Forwards Ctrl-C to a cancellation source from a normal thread, outside the signal handler.
class InterruptWatcher {
 public:
  explicit InterruptWatcher(toolrt::CancellationSource* source) : source_(source) {
    std::signal(SIGINT, HandleSigint);
    thread_ = std::thread([this]() {
      while (!done_.load()) {
        if (g_interrupted.exchange(false)) {
          std::cout << "[runtime] interrupted, cancelling turn\n";
          source_->Cancel();
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
      }
    });
  }
  ~InterruptWatcher() {
    done_.store(true);
    if (thread_.joinable()) thread_.join();
    std::signal(SIGINT, SIG_DFL);
  }

 private:
  toolrt::CancellationSource* source_;
  std::atomic<bool> done_{false};
  std::thread thread_;
};

static void PrintUsage() {
  std::cerr << "usage:\n"
            << "  tool-runtime list-tools\n"
            << "  tool-runtime test <server-id>\n"
            << "  tool-runtime chat <prompt>\n"
            << "environment: TOOL_RUNTIME_MCP_SERVERS_FILE, TOOL_RUNTIME_LLM_ENDPOINT, TOOL_RUNTIME_MODEL, ...\n";
}

static int ListTools(const toolrt::RuntimeConfig& cfg, const toolrt::CancellationToken& cancel) {
  toolrt::PrepareOptions options;
  options.cancel = cancel;
  auto rows = toolrt::DiscoverToolCatalog(cfg.tools.servers, options);
  nlohmann::json out = nlohmann::json::array();
  for (const auto& row : rows) out.push_back(toolrt::DiscoveredToolToJson(row));
  std::cout << out.dump(2) << "\n";
  return 0;
}

static int TestServer(const toolrt::RuntimeConfig& cfg, const std::string& server_id, const toolrt::CancellationToken& cancel) {
  for (const auto& server : cfg.tools.servers) {
    if (server.id != server_id) continue;
    auto result = toolrt::TestServerConnection(server, cancel);
    std::cout << toolrt::ServerTestResultToJson(result).dump(2) << "\n";
    return result.ok ? 0 : 1;
  }
  std::cerr << "unknown server: " << server_id << "\n";
  return 2;
}

static bool StreamCompletion(toolrt::IProvider* provider,
                             const toolrt::RuntimeConfig& cfg,
                             const std::vector<toolrt::ChatMessage>& messages,
                             std::string* err) {
  toolrt::ChatRequest req;
  req.model = cfg.model;
  req.stream = true;
  req.messages = messages;
  return provider->ChatStream(
      req, [](const std::string& delta) { std::cout << delta; },
      [](const std::string& finish_reason) { std::cout << "\n[runtime] finish_reason=" << finish_reason << "\n"; }, err);
}

static int Chat(const toolrt::RuntimeConfig& cfg, const std::string& prompt, const toolrt::CancellationToken& cancel) {
  toolrt::OpenAiCompatibleHttpProvider provider("openai_compatible", cfg.llm, cfg.api_key);
  std::vector<toolrt::ChatMessage> messages;
  messages.push_back({"user", prompt, {}, {}});

  toolrt::ToolLoopOptions options;
  options.model = cfg.model;
  options.cancel = cancel;
  options.on_tool_event = [](const toolrt::ToolEvent& ev) {
    if (ev.phase == toolrt::ToolEventPhase::kStart) {
      std::cout << "[tool-call] phase=start id=" << ev.call_id << " name=" << ev.name << "\n";
    } else {
      std::cout << "[tool-result] phase=done id=" << ev.call_id << " name=" << ev.name << " bytes=" << ev.result.size() << "\n";
    }
  };

  toolrt::ToolLoopOutcome outcome;
  std::string err;
  if (!toolrt::RunToolCallingTurn(cfg.tools, messages, &provider, options, &outcome, &err)) {
    std::cerr << "error: " << err << "\n";
    return 1;
  }

  bool ok = true;
  switch (outcome.kind) {
    case toolrt::ToolLoopOutcomeKind::kNoOrchestration:
      ok = StreamCompletion(&provider, cfg, messages, &err);
      break;
    case toolrt::ToolLoopOutcomeKind::kFinalText:
      std::cout << outcome.content << "\n";
      break;
    case toolrt::ToolLoopOutcomeKind::kNeedsFinalPass:
      ok = StreamCompletion(&provider, cfg, outcome.messages, &err);
      break;
  }
  if (!ok) {
    std::cerr << "error: " << err << "\n";
    return 1;
  }
  for (const auto& trace : outcome.traces) std::cout << toolrt::SerializeToolTrace(trace) << "\n";
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  std::cout.setf(std::ios::unitbuf);
  if (argc < 2) {
    PrintUsage();
    return 2;
  }
  const std::string command = argv[1];

  auto cfg = toolrt::LoadConfigFromEnv();
  if (!cfg.mcp_servers_file.empty()) {
    std::string err;
    if (!toolrt::LoadMcpServersFile(cfg.mcp_servers_file, &cfg.tools.servers, &err)) {
      std::cerr << "failed to load " << cfg.mcp_servers_file << ": " << err << "\n";
      return 1;
    }
  }
  std::cout << "[runtime] servers=" << cfg.tools.servers.size() << " policy=" << toolrt::ToolCallingPolicyName(cfg.tools.policy)
            << " max_tool_calls=" << cfg.tools.max_tool_calls_per_turn << "\n";
  std::cout << "[provider] openai_compatible endpoint=" << cfg.llm.scheme << "://" << cfg.llm.host << ":" << cfg.llm.port
            << cfg.llm.base_path << " model=" << (cfg.model.empty() ? "<empty>" : cfg.model) << "\n";

  toolrt::CancellationSource source;
  InterruptWatcher watcher(&source);

  if (command == "list-tools") return ListTools(cfg, source.Token());
  if (command == "test" && argc >= 3) return TestServer(cfg, argv[2], source.Token());
  if (command == "chat" && argc >= 3) {
    std::string prompt;
    for (int i = 2; i < argc; i++) {
      if (!prompt.empty()) prompt += " ";
      prompt += argv[i];
    }
    return Chat(cfg, prompt, source.Token());
  }
  PrintUsage();
  return 2;
}
