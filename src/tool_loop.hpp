#pragma once

#include "cancellation.hpp"
#include "config.hpp"
#include "providers/provider.hpp"
#include "tool_executor.hpp"
#include "tooling.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <string>
#include <vector>

namespace toolrt {

constexpr int kConservativeToolCallCap = 2;
constexpr size_t kTraceArgsMaxChars = 5000;
constexpr size_t kTraceResultMaxChars = 12000;

struct ToolTrace {
  std::string call_id;
  std::string name;
  std::string args;
  std::string result;
};

enum class ToolEventPhase {
  kStart,
  kDone,
};

struct ToolEvent {
  ToolEventPhase phase = ToolEventPhase::kStart;
  std::string call_id;
  std::string name;
  std::string args;
  // set for kDone only
  std::string result;
};

using ToolEventObserver = std::function<void(const ToolEvent&)>;

enum class ToolLoopOutcomeKind {
  // Caller runs its plain completion path untouched.
  kNoOrchestration,
  // The model answered after using tools; `content` is that answer.
  kFinalText,
  // Tool budget ran out; caller does one more completion over `messages`.
  kNeedsFinalPass,
};

struct ToolLoopOutcome {
  ToolLoopOutcomeKind kind = ToolLoopOutcomeKind::kNoOrchestration;
  std::string content;
  std::vector<ToolTrace> traces;
  std::vector<ChatMessage> messages;
};

struct ToolLoopOptions {
  std::string model;
  std::optional<int> max_tokens;
  std::optional<float> temperature;
  std::optional<float> top_p;
  CancellationToken cancel;
  ToolEventObserver on_tool_event;
  ChannelFactory channel_factory;
};

const char* PolicyInstruction(ToolCallingPolicy policy);
int EffectiveToolCallLimit(ToolCallingPolicy policy, int max_tool_calls_per_turn);
bool IsToolingUnsupportedError(const std::string& message);

// Drives ask-model / run-tools rounds over an already prepared tool set. Returns false only for
// back-end failures that do not look like missing tool support; `err` then holds the message.
bool RunToolLoop(const std::vector<ChatMessage>& messages,
                 const std::vector<nlohmann::json>& tools,
                 const ToolExecutor& executor,
                 IProvider* provider,
                 ToolCallingPolicy policy,
                 int max_tool_calls,
                 const ToolLoopOptions& options,
                 ToolLoopOutcome* out,
                 std::string* err);

// Prepares the configured servers, filters their tools, runs the loop and closes every client.
bool RunToolCallingTurn(const ToolCallingSettings& settings,
                        const std::vector<ChatMessage>& messages,
                        IProvider* provider,
                        const ToolLoopOptions& options,
                        ToolLoopOutcome* out,
                        std::string* err);

std::string SerializeToolTrace(const ToolTrace& trace);

}  // namespace toolrt
