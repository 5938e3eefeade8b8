#include "mcp_client.hpp"

#include "command_allowlist.hpp"

#include <cctype>
#include <iostream>
#include <string>
#include <utility>
#include <variant>

namespace toolrt {
namespace {

constexpr int kMaxListPages = 64;

static std::string Trim(const std::string& s) {
  size_t start = 0;
  while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) start++;
  size_t end = s.size();
  while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) end--;
  return s.substr(start, end - start);
}

static std::future<McpOutcome> ReadyFuture(McpOutcome outcome) {
  std::promise<McpOutcome> p;
  p.set_value(std::move(outcome));
  return p.get_future();
}

static McpOutcome Failure(McpErrorKind kind, std::string message) {
  McpOutcome out;
  out.error.kind = kind;
  out.error.message = std::move(message);
  return out;
}

static std::unique_ptr<IStdioChannel> SpawnProcessChannel(const McpServerConfig& cfg, std::string* err) {
  return ProcessChannel::Spawn(cfg.command, ParseArgs(cfg.args), ParseEnv(cfg.env), err);
}

}  // namespace

const char* McpErrorKindName(McpErrorKind kind) {
  switch (kind) {
    case McpErrorKind::kNone:
      return "none";
    case McpErrorKind::kClosed:
      return "closed";
    case McpErrorKind::kTransport:
      return "transport";
    case McpErrorKind::kProtocol:
      return "protocol";
    case McpErrorKind::kTimeout:
      return "timeout";
    case McpErrorKind::kCancelled:
      return "cancelled";
  }
  return "unknown";
}

int64_t PendingRequestTable::Add(const std::string& method, std::future<McpOutcome>* future) {
  std::lock_guard<std::mutex> lock(mu_);
  if (closed_) return 0;
  const int64_t id = next_id_++;
  Entry entry;
  entry.method = method;
  if (future) *future = entry.promise.get_future();
  entries_.emplace(id, std::move(entry));
  return id;
}

bool PendingRequestTable::Settle(int64_t id, McpOutcome outcome) {
  Entry entry;
  {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = entries_.find(id);
    if (it == entries_.end()) return false;
    entry = std::move(it->second);
    entries_.erase(it);
  }
  entry.promise.set_value(std::move(outcome));
  return true;
}

size_t PendingRequestTable::CloseAndFailAll(const McpCallError& error) {
  std::unordered_map<int64_t, Entry> drained;
  {
    std::lock_guard<std::mutex> lock(mu_);
    closed_ = true;
    drained.swap(entries_);
  }
  for (auto& [_, entry] : drained) {
    McpOutcome outcome;
    outcome.error = error;
    entry.promise.set_value(std::move(outcome));
  }
  return drained.size();
}

bool PendingRequestTable::Contains(int64_t id) const {
  std::lock_guard<std::mutex> lock(mu_);
  return entries_.count(id) > 0;
}

size_t PendingRequestTable::Size() const {
  std::lock_guard<std::mutex> lock(mu_);
  return entries_.size();
}

bool PendingRequestTable::IsClosed() const {
  std::lock_guard<std::mutex> lock(mu_);
  return closed_;
}

std::unique_ptr<McpClient> McpClient::Launch(const McpServerConfig& cfg, std::string* err, ChannelFactory factory) {
  if (!IsAllowedCommand(cfg.command)) {
    if (err) *err = "MCP command is not allowed: " + cfg.command;
    std::cout << "[mcp] rejected server=" << cfg.id << " command=" << cfg.command << "\n";
    return nullptr;
  }
  if (!factory) factory = SpawnProcessChannel;
  std::string spawn_err;
  auto channel = factory(cfg, &spawn_err);
  if (!channel) {
    if (err) *err = spawn_err.empty() ? "failed to start MCP server: " + cfg.command : spawn_err;
    std::cout << "[mcp] spawn failed server=" << cfg.id << " error=" << (err ? *err : spawn_err) << "\n";
    return nullptr;
  }
  return std::make_unique<McpClient>(cfg, std::move(channel));
}

McpClient::McpClient(McpServerConfig cfg, std::unique_ptr<IStdioChannel> channel)
    : config_(std::move(cfg)),
      wire_format_(DetectWireFormat(config_)),
      default_timeout_ms_(ResolveTimeoutMs(config_)),
      channel_(std::move(channel)),
      pending_(std::make_shared<PendingRequestTable>()),
      decoder_(wire_format_) {
  if (!channel_) {
    state_.store(McpClientState::kClosed);
    close_started_.store(true);
    pending_->CloseAndFailAll({McpErrorKind::kTransport, "MCP server has no channel: " + DisplayName()});
    return;
  }
  StdioChannelHandlers handlers;
  handlers.on_stdout = [this](std::string_view chunk) { OnStdout(chunk); };
  handlers.on_stderr = [this](std::string_view chunk) { OnStderr(chunk); };
  handlers.on_closed = [this](const std::string& reason) { OnClosed(reason); };
  channel_->Start(std::move(handlers));
}

McpClient::~McpClient() {
  Close();
}

std::string McpClient::DisplayName() const {
  return config_.name.empty() ? config_.id : config_.name;
}

std::string McpClient::StderrTail() const {
  std::lock_guard<std::mutex> lock(stderr_mu_);
  return stderr_tail_;
}

std::string McpClient::StderrSuffix() const {
  const std::string tail = Trim(StderrTail());
  if (tail.empty()) return {};
  return " | stderr: " + tail;
}

bool McpClient::Initialize(const CancellationToken& cancel, McpCallError* err) {
  auto expected = McpClientState::kConstructed;
  if (!state_.compare_exchange_strong(expected, McpClientState::kInitializing) &&
      expected == McpClientState::kClosed) {
    if (err) *err = {McpErrorKind::kClosed, "MCP client already closed"};
    return false;
  }

  nlohmann::json params;
  params["protocolVersion"] = kProtocolVersion;
  params["capabilities"] = nlohmann::json::object();
  params["clientInfo"] = {{"name", "tool-runtime"}, {"version", "0.1.0"}};
  auto r = Request("initialize", params, default_timeout_ms_, cancel, err);
  if (!r) return false;

  std::string notify_err;
  if (!Notify("notifications/initialized", nlohmann::json::object(), &notify_err)) {
    if (err) *err = {McpErrorKind::kTransport, notify_err};
    return false;
  }
  expected = McpClientState::kInitializing;
  state_.compare_exchange_strong(expected, McpClientState::kReady);

  std::string server_name;
  if (r->is_object() && r->contains("serverInfo") && (*r)["serverInfo"].is_object() &&
      (*r)["serverInfo"].contains("name") && (*r)["serverInfo"]["name"].is_string()) {
    server_name = (*r)["serverInfo"]["name"].get<std::string>();
  }
  std::cout << "[mcp] initialized server=" << config_.id << " remote=" << (server_name.empty() ? "-" : server_name)
            << " wire=" << (wire_format_ == WireFormat::kLineDelimited ? "jsonl" : "content-length") << "\n";
  return true;
}

std::optional<std::vector<McpToolInfo>> McpClient::ListTools(const CancellationToken& cancel, McpCallError* err) {
  std::vector<McpToolInfo> out;
  std::string cursor;
  for (int page = 0; page < kMaxListPages; page++) {
    nlohmann::json params = nlohmann::json::object();
    if (!cursor.empty()) params["cursor"] = cursor;
    auto r = Request("tools/list", params, default_timeout_ms_, cancel, err);
    if (!r) return std::nullopt;
    if (!r->is_object() || !r->contains("tools") || !(*r)["tools"].is_array()) return out;
    for (const auto& t : (*r)["tools"]) {
      if (!t.is_object()) continue;
      McpToolInfo info;
      if (t.contains("name") && t["name"].is_string()) info.name = Trim(t["name"].get<std::string>());
      if (t.contains("title") && t["title"].is_string()) info.title = t["title"].get<std::string>();
      if (t.contains("description") && t["description"].is_string()) info.description = t["description"].get<std::string>();
      if (t.contains("inputSchema")) info.input_schema = t["inputSchema"];
      if (!info.name.empty()) out.push_back(std::move(info));
    }
    if (r->contains("nextCursor") && (*r)["nextCursor"].is_string()) {
      cursor = (*r)["nextCursor"].get<std::string>();
      if (cursor.empty()) break;
    } else {
      break;
    }
  }
  return out;
}

std::optional<nlohmann::json> McpClient::CallTool(const std::string& name,
                                                  const nlohmann::json& arguments,
                                                  int timeout_ms,
                                                  const CancellationToken& cancel,
                                                  McpCallError* err) {
  nlohmann::json params;
  params["name"] = name;
  params["arguments"] = arguments.is_object() ? arguments : nlohmann::json::object();
  return Request("tools/call", params, timeout_ms, cancel, err);
}

PendingCall McpClient::Send(const std::string& method,
                            const nlohmann::json& params,
                            int timeout_ms,
                            const CancellationToken& cancel) {
  PendingCall call;
  call.method = method;
  call.timeout_ms = timeout_ms > 0 ? timeout_ms : default_timeout_ms_;
  call.deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(call.timeout_ms);
  call.cancel = cancel;

  if (cancel.IsCancelled()) {
    call.future = ReadyFuture(Failure(McpErrorKind::kCancelled, "Aborted"));
    return call;
  }
  if (state_.load() == McpClientState::kClosed) {
    call.future = ReadyFuture(Failure(McpErrorKind::kClosed, "MCP client already closed"));
    return call;
  }
  call.id = pending_->Add(method, &call.future);
  if (call.id == 0) {
    call.future = ReadyFuture(Failure(McpErrorKind::kClosed, "MCP client already closed"));
    return call;
  }

  std::weak_ptr<PendingRequestTable> weak = pending_;
  const int64_t id = call.id;
  call.cancel_registration = cancel.Register([weak, id]() {
    if (auto table = weak.lock()) table->Settle(id, Failure(McpErrorKind::kCancelled, "Aborted"));
  });
  if (call.future.wait_for(std::chrono::seconds(0)) == std::future_status::ready) return call;

  // A provider that stops reading must not hold the caller past its deadline, cancellation or Close().
  WriteOptions options;
  options.deadline = call.deadline;
  std::shared_ptr<PendingRequestTable> table = pending_;
  options.abandon = [table, cancel, id]() { return cancel.IsCancelled() || !table->Contains(id); };
  std::string write_err;
  if (!WriteMessage(JsonRpcRequest{id, method, params}, options, &write_err)) {
    if (std::chrono::steady_clock::now() >= call.deadline) {
      pending_->Settle(id, Failure(McpErrorKind::kTimeout, "MCP timeout on " + method + StderrSuffix()));
    } else {
      pending_->Settle(id, Failure(McpErrorKind::kTransport,
                                   "MCP write failed on " + method + ": " + write_err + StderrSuffix()));
    }
  }
  return call;
}

std::optional<nlohmann::json> McpClient::Await(PendingCall* call, McpCallError* err) {
  if (!call || !call->future.valid()) {
    if (err) *err = {McpErrorKind::kClosed, "MCP request was already awaited"};
    return std::nullopt;
  }
  if (call->future.wait_until(call->deadline) != std::future_status::ready) {
    pending_->Settle(call->id, Failure(McpErrorKind::kTimeout, "MCP timeout on " + call->method + StderrSuffix()));
  }
  McpOutcome outcome = call->future.get();
  call->cancel.Unregister(call->cancel_registration);
  call->cancel_registration = 0;

  if (outcome.error.kind != McpErrorKind::kNone) {
    if (err) *err = std::move(outcome.error);
    return std::nullopt;
  }
  if (!outcome.result) {
    if (err) *err = {McpErrorKind::kProtocol, "MCP response missing result"};
    return std::nullopt;
  }
  return std::move(outcome.result);
}

std::optional<nlohmann::json> McpClient::Request(const std::string& method,
                                                 const nlohmann::json& params,
                                                 int timeout_ms,
                                                 const CancellationToken& cancel,
                                                 McpCallError* err) {
  PendingCall call = Send(method, params, timeout_ms, cancel);
  return Await(&call, err);
}

bool McpClient::Notify(const std::string& method, const nlohmann::json& params, std::string* err) {
  if (state_.load() == McpClientState::kClosed) {
    if (err) *err = "MCP client already closed";
    return false;
  }
  WriteOptions options;
  options.deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(default_timeout_ms_);
  return WriteMessage(JsonRpcNotification{method, params}, options, err);
}

bool McpClient::WriteMessage(const JsonRpcMessage& msg, const WriteOptions& options, std::string* err) {
  if (!channel_) {
    if (err) *err = "no channel";
    return false;
  }
  return channel_->Write(EncodeFrame(wire_format_, msg), options, err);
}

void McpClient::Close() {
  if (close_started_.exchange(true)) return;
  state_.store(McpClientState::kClosed);
  const size_t failed =
      pending_->CloseAndFailAll({McpErrorKind::kClosed, "MCP client closed: " + DisplayName() + StderrSuffix()});
  if (channel_) channel_->Shutdown(kCloseGrace);
  std::cout << "[mcp] closed server=" << config_.id << " failed_pending=" << failed << "\n";
}

void McpClient::OnStdout(std::string_view chunk) {
  std::vector<JsonRpcMessage> messages;
  {
    std::lock_guard<std::mutex> lock(read_mu_);
    decoder_.Append(chunk);
    while (auto msg = decoder_.Next()) messages.push_back(std::move(*msg));
  }
  for (const auto& msg : messages) Dispatch(msg);
}

void McpClient::OnStderr(std::string_view chunk) {
  std::lock_guard<std::mutex> lock(stderr_mu_);
  stderr_tail_.append(chunk.data(), chunk.size());
  if (stderr_tail_.size() > kStderrTailBytes) stderr_tail_.erase(0, stderr_tail_.size() - kStderrTailBytes);
}

void McpClient::OnClosed(const std::string& reason) {
  state_.store(McpClientState::kClosed);
  const std::string message = "MCP server exited: " + DisplayName() + " (" + reason + ")" + StderrSuffix();
  const size_t failed = pending_->CloseAndFailAll({McpErrorKind::kTransport, message});
  std::cout << "[mcp] exited server=" << config_.id << " reason=" << reason << " failed_pending=" << failed << "\n";
}

void McpClient::Dispatch(const JsonRpcMessage& msg) {
  if (const auto* resp = std::get_if<JsonRpcResponse>(&msg)) {
    McpOutcome outcome;
    outcome.result = resp->result;
    pending_->Settle(resp->id, std::move(outcome));
    return;
  }
  if (const auto* rpc_err = std::get_if<JsonRpcErrorResponse>(&msg)) {
    if (!rpc_err->id) {
      std::cout << "[mcp] error without id server=" << config_.id << " message=" << rpc_err->message << "\n";
      return;
    }
    pending_->Settle(*rpc_err->id,
                     Failure(McpErrorKind::kProtocol, rpc_err->message.empty() ? "MCP error" : rpc_err->message));
    return;
  }
  if (const auto* req = std::get_if<JsonRpcRequest>(&msg)) {
    // Runs on the channel's I/O thread, which must not wait on a peer that is not reading.
    WriteOptions options;
    options.deadline = std::chrono::steady_clock::now() + kReplyWriteTimeout;
    std::string write_err;
    bool ok = false;
    if (req->method == "ping") {
      ok = WriteMessage(JsonRpcResponse{req->id, nlohmann::json::object()}, options, &write_err);
    } else {
      JsonRpcErrorResponse reply;
      reply.id = req->id;
      reply.code = -32601;
      reply.message = "Method not found: " + req->method;
      ok = WriteMessage(reply, options, &write_err);
    }
    if (!ok) std::cout << "[mcp] reply failed server=" << config_.id << " method=" << req->method << " error=" << write_err << "\n";
    return;
  }
  if (const auto* note = std::get_if<JsonRpcNotification>(&msg)) {
    std::cout << "[mcp] notification server=" << config_.id << " method=" << note->method << "\n";
  }
}

}  // namespace toolrt
