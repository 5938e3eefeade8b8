#pragma once

#include <sys/types.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

namespace toolrt {

struct StdioChannelHandlers {
  std::function<void(std::string_view)> on_stdout;
  std::function<void(std::string_view)> on_stderr;
  // Fired at most once, when the peer stops producing output (exit, crash, closed stdout).
  std::function<void(const std::string& reason)> on_closed;
};

struct WriteOptions {
  // Write gives up once this passes.
  std::chrono::steady_clock::time_point deadline = std::chrono::steady_clock::time_point::max();
  // Polled while the peer is not reading; returning true abandons the write.
  std::function<bool()> abandon;
};

// Byte pipe to a tool provider. Handlers are invoked from the channel's own I/O thread.
class IStdioChannel {
 public:
  virtual ~IStdioChannel() = default;

  virtual void Start(StdioChannelHandlers handlers) = 0;
  // Blocks until `bytes` are written, the peer fails, or `options` gives up. A stop after a partial
  // write leaves the stream unusable.
  virtual bool Write(const std::string& bytes, const WriteOptions& options, std::string* err) = 0;
  // Stops delivery of events and releases the peer; returns once no handler can run anymore.
  virtual void Shutdown(std::chrono::milliseconds grace) = 0;
};

class ProcessChannel : public IStdioChannel {
  struct ConstructionKey {
    explicit ConstructionKey() = default;
  };

 public:
  // Forks and execs `command` (looked up on PATH) with stdio pipes. An exec failure is reported
  // here through `err` rather than as a later exit.
  static std::unique_ptr<ProcessChannel> Spawn(const std::string& command,
                                               const std::vector<std::string>& args,
                                               const std::vector<std::pair<std::string, std::string>>& env_overrides,
                                               std::string* err);

  ProcessChannel(ConstructionKey, pid_t pid, int stdin_fd, int stdout_fd, int stderr_fd);
  ~ProcessChannel() override;
  ProcessChannel(const ProcessChannel&) = delete;
  ProcessChannel& operator=(const ProcessChannel&) = delete;

  void Start(StdioChannelHandlers handlers) override;
  bool Write(const std::string& bytes, const WriteOptions& options, std::string* err) override;
  void Shutdown(std::chrono::milliseconds grace) override;

  pid_t pid() const { return pid_; }

 private:
  void IoLoop();
  void ReportClosed(std::string reason);
  const char* WriteStopReason(const WriteOptions& options) const;
  bool TryReap(std::string* reason);
  void JoinIoThread();

  pid_t pid_;
  int stdin_fd_;
  int stdout_fd_;
  int stderr_fd_;

  StdioChannelHandlers handlers_;
  std::thread io_thread_;
  std::atomic<bool> stopping_{false};

  // Timed so that a writer queued behind a stalled one still honours its own deadline.
  std::timed_mutex write_mu_;
  std::mutex reap_mu_;
  bool reaped_ = false;
  bool shut_down_ = false;
};

}  // namespace toolrt
