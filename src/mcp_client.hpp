#pragma once

#include "cancellation.hpp"
#include "config.hpp"
#include "frame_codec.hpp"
#include "stdio_channel.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace toolrt {

struct McpToolInfo {
  std::string name;
  std::string title;
  std::string description;
  nlohmann::json input_schema;
};

enum class McpErrorKind {
  kNone,
  kClosed,     // client closed locally
  kTransport,  // spawn/write failure or provider exit
  kProtocol,   // JSON-RPC error object
  kTimeout,
  kCancelled,
};

struct McpCallError {
  McpErrorKind kind = McpErrorKind::kNone;
  std::string message;
};

const char* McpErrorKindName(McpErrorKind kind);

struct McpOutcome {
  std::optional<nlohmann::json> result;
  McpCallError error;
};

// Outstanding requests keyed by id. Settle() removes the entry, so whichever of response,
// timeout, cancellation or closure gets there first resolves the request and the rest are no-ops.
class PendingRequestTable {
 public:
  // Returns the new id, or 0 when the table has been closed.
  int64_t Add(const std::string& method, std::future<McpOutcome>* future);
  bool Settle(int64_t id, McpOutcome outcome);
  // Resolves every entry with `error` and refuses further Add() calls.
  size_t CloseAndFailAll(const McpCallError& error);
  bool Contains(int64_t id) const;
  size_t Size() const;
  bool IsClosed() const;

 private:
  struct Entry {
    std::string method;
    std::promise<McpOutcome> promise;
  };

  mutable std::mutex mu_;
  int64_t next_id_ = 1;
  bool closed_ = false;
  std::unordered_map<int64_t, Entry> entries_;
};

struct PendingCall {
  int64_t id = 0;
  std::string method;
  int timeout_ms = 0;
  std::chrono::steady_clock::time_point deadline;
  CancellationToken cancel;
  int cancel_registration = 0;
  std::future<McpOutcome> future;
};

enum class McpClientState {
  kConstructed,
  kInitializing,
  kReady,
  kClosed,
};

using ChannelFactory = std::function<std::unique_ptr<IStdioChannel>(const McpServerConfig& cfg, std::string* err)>;

// JSON-RPC client for one tool provider subprocess. Never shared across conversation turns.
class McpClient {
 public:
  static constexpr const char* kProtocolVersion = "2024-11-05";
  static constexpr size_t kStderrTailBytes = 1200;
  static constexpr std::chrono::milliseconds kCloseGrace{600};
  static constexpr std::chrono::milliseconds kReplyWriteTimeout{2000};

  // Rejects commands outside the allowlist before anything is spawned. Without a factory the
  // provider is started as a subprocess.
  static std::unique_ptr<McpClient> Launch(const McpServerConfig& cfg, std::string* err, ChannelFactory factory = {});

  McpClient(McpServerConfig cfg, std::unique_ptr<IStdioChannel> channel);
  ~McpClient();
  McpClient(const McpClient&) = delete;
  McpClient& operator=(const McpClient&) = delete;

  bool Initialize(const CancellationToken& cancel, McpCallError* err);
  std::optional<std::vector<McpToolInfo>> ListTools(const CancellationToken& cancel, McpCallError* err);
  std::optional<nlohmann::json> CallTool(const std::string& name,
                                         const nlohmann::json& arguments,
                                         int timeout_ms,
                                         const CancellationToken& cancel,
                                         McpCallError* err);

  PendingCall Send(const std::string& method, const nlohmann::json& params, int timeout_ms, const CancellationToken& cancel);
  std::optional<nlohmann::json> Await(PendingCall* call, McpCallError* err);
  std::optional<nlohmann::json> Request(const std::string& method,
                                        const nlohmann::json& params,
                                        int timeout_ms,
                                        const CancellationToken& cancel,
                                        McpCallError* err);
  bool Notify(const std::string& method, const nlohmann::json& params, std::string* err);

  void Close();

  McpClientState state() const { return state_.load(); }
  WireFormat wire_format() const { return wire_format_; }
  const McpServerConfig& config() const { return config_; }
  int default_timeout_ms() const { return default_timeout_ms_; }
  size_t PendingCount() const { return pending_->Size(); }
  std::string StderrTail() const;

 private:
  void OnStdout(std::string_view chunk);
  void OnStderr(std::string_view chunk);
  void OnClosed(const std::string& reason);
  void Dispatch(const JsonRpcMessage& msg);
  bool WriteMessage(const JsonRpcMessage& msg, const WriteOptions& options, std::string* err);
  std::string StderrSuffix() const;
  std::string DisplayName() const;

  McpServerConfig config_;
  WireFormat wire_format_;
  int default_timeout_ms_;
  std::unique_ptr<IStdioChannel> channel_;
  std::shared_ptr<PendingRequestTable> pending_;
  std::atomic<McpClientState> state_{McpClientState::kConstructed};
  std::atomic<bool> close_started_{false};

  std::mutex read_mu_;
  FrameDecoder decoder_;

  mutable std::mutex stderr_mu_;
  std::string stderr_tail_;
};

}  // namespace toolrt
