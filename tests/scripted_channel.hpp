#pragma once

#include "config.hpp"
#include "frame_codec.hpp"
#include "mcp_client.hpp"
#include "stdio_channel.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace toolrt::testing {

// In-process stand-in for a provider subprocess. Everything the client writes is decoded and
// recorded; an optional responder may answer inline. State outlives the channel so tests can
// inspect it after the client has been destroyed.
class ScriptedChannel : public IStdioChannel {
 public:
  struct State {
    std::mutex mu;
    WireFormat format = WireFormat::kContentLength;
    StdioChannelHandlers handlers;
    std::vector<nlohmann::json> written;
    std::vector<std::string> raw_writes;
    bool fail_writes = false;
    int shutdown_calls = 0;
    std::function<void(ScriptedChannel*, const nlohmann::json&)> responder;
  };

  explicit ScriptedChannel(std::shared_ptr<State> state) : state_(std::move(state)), decoder_(state_->format) {}

  void Start(StdioChannelHandlers handlers) override {
    std::lock_guard<std::mutex> lock(state_->mu);
    state_->handlers = std::move(handlers);
  }

  bool Write(const std::string& bytes, const WriteOptions&, std::string* err) override {
    std::vector<nlohmann::json> frames;
    std::function<void(ScriptedChannel*, const nlohmann::json&)> responder;
    {
      std::lock_guard<std::mutex> lock(state_->mu);
      if (state_->fail_writes) {
        if (err) *err = "broken pipe";
        return false;
      }
      state_->raw_writes.push_back(bytes);
      decoder_.Append(bytes);
      while (auto frame = decoder_.NextFrame()) {
        auto j = nlohmann::json::parse(*frame, nullptr, false);
        if (j.is_discarded()) continue;
        state_->written.push_back(j);
        frames.push_back(std::move(j));
      }
      responder = state_->responder;
    }
    if (responder) {
      for (const auto& j : frames) responder(this, j);
    }
    return true;
  }

  void Shutdown(std::chrono::milliseconds) override {
    std::lock_guard<std::mutex> lock(state_->mu);
    state_->shutdown_calls++;
  }

  void Deliver(const nlohmann::json& msg) { DeliverRaw(EncodeFrame(state_->format, msg)); }

  void DeliverRaw(const std::string& bytes) {
    std::function<void(std::string_view)> sink;
    {
      std::lock_guard<std::mutex> lock(state_->mu);
      sink = state_->handlers.on_stdout;
    }
    if (sink) sink(bytes);
  }

  void EmitStderr(const std::string& text) {
    std::function<void(std::string_view)> sink;
    {
      std::lock_guard<std::mutex> lock(state_->mu);
      sink = state_->handlers.on_stderr;
    }
    if (sink) sink(text);
  }

  void Exit(const std::string& reason) {
    std::function<void(const std::string&)> sink;
    {
      std::lock_guard<std::mutex> lock(state_->mu);
      sink = state_->handlers.on_closed;
    }
    if (sink) sink(reason);
  }

  static nlohmann::json Result(const nlohmann::json& request, const nlohmann::json& result) {
    return {{"jsonrpc", "2.0"}, {"id", request["id"]}, {"result", result}};
  }

  static nlohmann::json Error(const nlohmann::json& request, int code, const std::string& message) {
    return {{"jsonrpc", "2.0"}, {"id", request["id"]}, {"error", {{"code", code}, {"message", message}}}};
  }

 private:
  std::shared_ptr<State> state_;
  FrameDecoder decoder_;
};

// Minimal MCP server behaviour: answers initialize, tools/list and tools/call.
struct FakeMcpServer {
  std::vector<nlohmann::json> tools;
  std::function<nlohmann::json(const std::string& name, const nlohmann::json& args)> on_call;
  bool fail_initialize = false;
  std::vector<std::string> calls;

  std::function<void(ScriptedChannel*, const nlohmann::json&)> Responder() {
    return [this](ScriptedChannel* ch, const nlohmann::json& msg) {
      if (!msg.contains("method") || !msg.contains("id")) return;
      const std::string method = msg["method"].get<std::string>();
      if (method == "initialize") {
        if (fail_initialize) {
          ch->Deliver(ScriptedChannel::Error(msg, -32000, "initialize refused"));
          return;
        }
        ch->Deliver(ScriptedChannel::Result(
            msg, {{"protocolVersion", McpClient::kProtocolVersion}, {"capabilities", nlohmann::json::object()}, {"serverInfo", {{"name", "fake"}}}}));
      } else if (method == "tools/list") {
        ch->Deliver(ScriptedChannel::Result(msg, {{"tools", tools}}));
      } else if (method == "tools/call") {
        const std::string name = msg["params"]["name"].get<std::string>();
        calls.push_back(name);
        nlohmann::json result = on_call ? on_call(name, msg["params"]["arguments"])
                                        : nlohmann::json{{"content", {{{"type", "text"}, {"text", "ok"}}}}};
        ch->Deliver(ScriptedChannel::Result(msg, result));
      } else {
        ch->Deliver(ScriptedChannel::Error(msg, -32601, "Method not found"));
      }
    };
  }
};

// Routes each server id to its own fake; ids without a fake fail to launch.
class FakeServerFarm {
 public:
  FakeMcpServer* Add(const std::string& server_id) { return &servers_[server_id]; }

  ChannelFactory Factory() {
    return [this](const McpServerConfig& cfg, std::string* err) -> std::unique_ptr<IStdioChannel> {
      launched_.push_back(cfg.id);
      auto it = servers_.find(cfg.id);
      if (it == servers_.end()) {
        if (err) *err = "spawn failed: " + cfg.id;
        return nullptr;
      }
      auto state = std::make_shared<ScriptedChannel::State>();
      state->format = DetectWireFormat(cfg);
      state->responder = it->second.Responder();
      states_[cfg.id] = state;
      return std::make_unique<ScriptedChannel>(state);
    };
  }

  const std::vector<std::string>& launched() const { return launched_; }
  std::shared_ptr<ScriptedChannel::State> StateFor(const std::string& id) const {
    auto it = states_.find(id);
    return it == states_.end() ? nullptr : it->second;
  }

 private:
  std::unordered_map<std::string, FakeMcpServer> servers_;
  std::unordered_map<std::string, std::shared_ptr<ScriptedChannel::State>> states_;
  std::vector<std::string> launched_;
};

inline McpServerConfig MakeServer(const std::string& id, const std::string& name = {}) {
  McpServerConfig cfg;
  cfg.id = id;
  cfg.name = name;
  cfg.command = "npx";
  cfg.args = "-y @example/" + id;
  return cfg;
}

inline nlohmann::json ToolDescriptor(const std::string& name, const std::string& description = {}) {
  nlohmann::json t;
  t["name"] = name;
  if (!description.empty()) t["description"] = description;
  t["inputSchema"] = {{"type", "object"}, {"properties", {{"query", {{"type", "string"}}}}}};
  return t;
}

}  // namespace toolrt::testing
