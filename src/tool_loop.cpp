#include "tool_loop.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <iostream>
#include <regex>
#include <string>
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

static std::string TruncateForLog(std::string s, size_t max_chars) {
  if (max_chars == 0) return {};
  if (s.size() <= max_chars) return s;
  constexpr const char* kSuffix = "...(truncated)";
  if (max_chars <= std::strlen(kSuffix)) return std::string(kSuffix).substr(0, max_chars);
  s.resize(max_chars - std::strlen(kSuffix));
  s += kSuffix;
  return s;
}

static std::string SanitizeBodyForLog(const std::string& body) {
  if (body.empty()) return {};
  auto j = nlohmann::json::parse(body, nullptr, false);
  if (j.is_discarded()) return body;
  if (j.is_object()) {
    for (const auto& key : {"api_key", "api-key", "authorization", "apiKey"}) {
      if (j.contains(key)) j.erase(key);
    }
  }
  return j.dump();
}

static void Emit(const ToolEventObserver& observer, ToolEvent event) {
  if (observer) observer(event);
}

}  // namespace

const char* PolicyInstruction(ToolCallingPolicy policy) {
  switch (policy) {
    case ToolCallingPolicy::kConservative:
      return "Use tools only when strictly necessary. If a direct answer is sufficient, do not call tools.";
    case ToolCallingPolicy::kAggressive:
      return "Prefer using tools when they can improve accuracy, freshness, or completeness of the answer.";
    case ToolCallingPolicy::kBalanced:
      break;
  }
  return "Use tools only when they clearly help produce a better answer.";
}

int EffectiveToolCallLimit(ToolCallingPolicy policy, int max_tool_calls_per_turn) {
  const int limit = ClampToolIterationLimit(static_cast<double>(max_tool_calls_per_turn));
  if (policy == ToolCallingPolicy::kConservative) return std::min(kConservativeToolCallCap, limit);
  return limit;
}

bool IsToolingUnsupportedError(const std::string& message) {
  static const std::regex re("tool|function.?call|tool_choice|unsupported", std::regex::ECMAScript | std::regex::icase);
  return std::regex_search(message, re);
}

bool RunToolLoop(const std::vector<ChatMessage>& messages,
                 const std::vector<nlohmann::json>& tools,
                 const ToolExecutor& executor,
                 IProvider* provider,
                 ToolCallingPolicy policy,
                 int max_tool_calls,
                 const ToolLoopOptions& options,
                 ToolLoopOutcome* out,
                 std::string* err) {
  ToolLoopOutcome result;
  if (tools.empty()) {
    if (out) *out = std::move(result);
    return true;
  }
  if (!provider) {
    if (err) *err = "no completion provider";
    return false;
  }
  if (max_tool_calls < 1) max_tool_calls = 1;

  std::vector<ChatMessage> working;
  working.reserve(messages.size() + 8);
  for (const auto& m : messages) working.push_back(m);
  working.push_back({"system", PolicyInstruction(policy), {}, {}});

  int executed = 0;
  int round = 0;
  while (executed < max_tool_calls) {
    round++;
    if (options.cancel.IsCancelled()) {
      if (err) *err = "Aborted";
      return false;
    }

    ChatRequest req;
    req.model = options.model;
    req.stream = false;
    req.max_tokens = options.max_tokens;
    req.temperature = options.temperature;
    req.top_p = options.top_p;
    req.messages = working;
    req.tools = tools;
    if (policy == ToolCallingPolicy::kAggressive) req.tool_choice = "auto";

    std::string call_err;
    auto resp = provider->ChatOnce(req, &call_err);
    if (!resp) {
      if (IsToolingUnsupportedError(call_err)) {
        std::cout << "[tool-loop] fallback reason=unsupported error=" << TruncateForLog(call_err, 2000) << "\n";
        if (out) *out = ToolLoopOutcome();
        return true;
      }
      if (err) *err = call_err;
      return false;
    }

    std::cout << "[tool-loop] round=" << round << " tool_calls=" << resp->tool_calls.size() << " executed=" << executed
              << " limit=" << max_tool_calls << "\n";

    if (resp->tool_calls.empty()) {
      if (executed == 0) {
        if (out) *out = ToolLoopOutcome();
        return true;
      }
      result.kind = ToolLoopOutcomeKind::kFinalText;
      result.content = resp->content;
      result.messages = std::move(working);
      if (out) *out = std::move(result);
      return true;
    }

    ChatMessage assistant;
    assistant.role = "assistant";
    assistant.content = resp->content;
    assistant.tool_calls = resp->tool_calls;
    for (size_t i = 0; i < assistant.tool_calls.size(); i++) {
      auto& c = assistant.tool_calls[i];
      if (c.id.empty()) c.id = (c.name.empty() ? std::string("tool") : c.name) + "_" + std::to_string(executed + static_cast<int>(i) + 1);
    }
    working.push_back(assistant);

    for (const auto& c : assistant.tool_calls) {
      if (executed >= max_tool_calls) break;
      Emit(options.on_tool_event, {ToolEventPhase::kStart, c.id, c.name, c.arguments, {}});
      std::cout << "[tool-call] id=" << c.id << " name=" << c.name
                << " arguments=" << TruncateForLog(SanitizeBodyForLog(c.arguments), 2000) << "\n";

      std::string text = executor.Execute(c.name, c.arguments, options.cancel);

      std::cout << "[tool-result] id=" << c.id << " name=" << c.name << " result=" << TruncateForLog(text, 2000) << "\n";
      Emit(options.on_tool_event, {ToolEventPhase::kDone, c.id, c.name, c.arguments, text});

      result.traces.push_back({c.id, c.name, c.arguments, text});
      ChatMessage tool_msg;
      tool_msg.role = "tool";
      tool_msg.content = std::move(text);
      tool_msg.tool_call_id = c.id;
      working.push_back(std::move(tool_msg));
      executed++;
    }
  }

  std::cout << "[tool-loop] budget exhausted executed=" << executed << "\n";
  result.kind = ToolLoopOutcomeKind::kNeedsFinalPass;
  result.messages = std::move(working);
  if (out) *out = std::move(result);
  return true;
}

bool RunToolCallingTurn(const ToolCallingSettings& settings,
                        const std::vector<ChatMessage>& messages,
                        IProvider* provider,
                        const ToolLoopOptions& options,
                        ToolLoopOutcome* out,
                        std::string* err) {
  if (out) *out = ToolLoopOutcome();
  if (!settings.tool_calling_enabled || !settings.auto_attach_tools) return true;
  if (settings.servers.empty()) return true;

  PrepareOptions prepare;
  prepare.cancel = options.cancel;
  prepare.channel_factory = options.channel_factory;
  PreparedTools prepared = PrepareMcpTools(settings.servers, prepare);

  const auto exposed = FilterToolsForModel(prepared.tools(), settings.allowlist, settings.denylist, settings.tool_states);
  std::cout << "[tool-loop] prepared tools=" << prepared.tools().size() << " exposed=" << exposed.size()
            << " policy=" << ToolCallingPolicyName(settings.policy) << "\n";
  if (exposed.empty()) {
    prepared.Close();
    return true;
  }

  ToolExecutor executor(&prepared.registry());
  const int limit = EffectiveToolCallLimit(settings.policy, settings.max_tool_calls_per_turn);
  const bool ok = RunToolLoop(messages, exposed, executor, provider, settings.policy, limit, options, out, err);
  prepared.Close();
  return ok;
}

std::string SerializeToolTrace(const ToolTrace& trace) {
  std::string name = Trim(trace.name);
  if (name.empty()) name = "unknown_tool";
  const std::string args = Trim(trace.args);
  const std::string result = Trim(trace.result);

  nlohmann::ordered_json j;
  j["kind"] = "tool_call";
  j["callId"] = Trim(trace.call_id);
  j["name"] = name;
  j["args"] = args.empty() ? "{}" : TruncateUtf8(args, kTraceArgsMaxChars);
  j["result"] = result.empty() ? "(empty)" : TruncateUtf8(result, kTraceResultMaxChars);
  return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace toolrt
