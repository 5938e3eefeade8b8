#include "stdio_channel.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

#include <iostream>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

extern char** environ;

namespace toolrt {
namespace {

constexpr int kPollIntervalMs = 50;
constexpr int kReapPollMs = 10;
constexpr int kReapAttempts = 20;
constexpr int kWriteSliceMs = 10;

static void IgnoreSigpipeOnce() {
  static std::once_flag once;
  std::call_once(once, []() { std::signal(SIGPIPE, SIG_IGN); });
}

static void CloseFd(int* fd) {
  if (fd && *fd >= 0) {
    static_cast<void>(close(*fd));
    *fd = -1;
  }
}

static void SetNonblocking(int fd) {
  const int flags = fcntl(fd, F_GETFL, 0);
  if (flags == -1) return;
  static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

// Reads whatever is available. Clears `open` on EOF or a hard error.
static void DrainFd(int fd, bool* open, const std::function<void(std::string_view)>& sink) {
  if (!*open) return;
  char buffer[4096];
  while (true) {
    const ssize_t n = read(fd, buffer, sizeof(buffer));
    if (n > 0) {
      if (sink) sink(std::string_view(buffer, static_cast<size_t>(n)));
      continue;
    }
    if (n == 0) {
      *open = false;
      return;
    }
    if (errno == EINTR) continue;
    if (errno == EAGAIN || errno == EWOULDBLOCK) return;
    *open = false;
    return;
  }
}

static std::string DescribeStatus(int status) {
  if (WIFEXITED(status)) return "exited with code " + std::to_string(WEXITSTATUS(status));
  if (WIFSIGNALED(status)) return "killed by signal " + std::to_string(WTERMSIG(status));
  return "exited";
}

static std::vector<std::string> BuildEnvironment(const std::vector<std::pair<std::string, std::string>>& overrides) {
  std::vector<std::string> out;
  std::unordered_map<std::string, size_t> index;
  for (char** e = environ; e && *e; e++) {
    std::string entry(*e);
    auto eq = entry.find('=');
    if (eq == std::string::npos) continue;
    index[entry.substr(0, eq)] = out.size();
    out.push_back(std::move(entry));
  }
  for (const auto& [key, value] : overrides) {
    auto it = index.find(key);
    if (it != index.end()) {
      out[it->second] = key + "=" + value;
    } else {
      index[key] = out.size();
      out.push_back(key + "=" + value);
    }
  }
  return out;
}

}  // namespace

std::unique_ptr<ProcessChannel> ProcessChannel::Spawn(const std::string& command,
                                                      const std::vector<std::string>& args,
                                                      const std::vector<std::pair<std::string, std::string>>& env_overrides,
                                                      std::string* err) {
  IgnoreSigpipeOnce();

  // Everything the child needs is built before fork().
  std::vector<std::string> argv_storage;
  argv_storage.reserve(args.size() + 1);
  argv_storage.push_back(command);
  for (const auto& a : args) argv_storage.push_back(a);
  std::vector<char*> argv;
  for (auto& a : argv_storage) argv.push_back(a.data());
  argv.push_back(nullptr);

  std::vector<std::string> env_storage = BuildEnvironment(env_overrides);
  std::vector<char*> envp;
  for (auto& e : env_storage) envp.push_back(e.data());
  envp.push_back(nullptr);

  int in_pipe[2] = {-1, -1};
  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};
  int exec_pipe[2] = {-1, -1};
  auto close_all = [&]() {
    for (int* p : {in_pipe, out_pipe, err_pipe, exec_pipe}) {
      CloseFd(&p[0]);
      CloseFd(&p[1]);
    }
  };
  if (pipe2(in_pipe, O_CLOEXEC) != 0 || pipe2(out_pipe, O_CLOEXEC) != 0 || pipe2(err_pipe, O_CLOEXEC) != 0 ||
      pipe2(exec_pipe, O_CLOEXEC) != 0) {
    if (err) *err = std::string("failed to create process pipes: ") + std::strerror(errno);
    close_all();
    return nullptr;
  }

  const pid_t pid = fork();
  if (pid < 0) {
    if (err) *err = std::string("failed to fork process: ") + std::strerror(errno);
    close_all();
    return nullptr;
  }

  if (pid == 0) {
    static_cast<void>(dup2(in_pipe[0], STDIN_FILENO));
    static_cast<void>(dup2(out_pipe[1], STDOUT_FILENO));
    static_cast<void>(dup2(err_pipe[1], STDERR_FILENO));
    execvpe(argv[0], argv.data(), envp.data());
    const int code = errno;
    static_cast<void>(write(exec_pipe[1], &code, sizeof(code)));
    _exit(127);
  }

  CloseFd(&in_pipe[0]);
  CloseFd(&out_pipe[1]);
  CloseFd(&err_pipe[1]);
  CloseFd(&exec_pipe[1]);

  int exec_errno = 0;
  ssize_t n = 0;
  do {
    n = read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
  } while (n < 0 && errno == EINTR);
  CloseFd(&exec_pipe[0]);
  if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
    int status = 0;
    static_cast<void>(waitpid(pid, &status, 0));
    if (err) *err = "failed to start " + command + ": " + std::strerror(exec_errno);
    close_all();
    return nullptr;
  }

  SetNonblocking(in_pipe[1]);
  SetNonblocking(out_pipe[0]);
  SetNonblocking(err_pipe[0]);
  std::cout << "[mcp] spawned pid=" << pid << " command=" << command << " args=" << args.size() << "\n";
  return std::make_unique<ProcessChannel>(ConstructionKey{}, pid, in_pipe[1], out_pipe[0], err_pipe[0]);
}

ProcessChannel::ProcessChannel(ConstructionKey, pid_t pid, int stdin_fd, int stdout_fd, int stderr_fd)
    : pid_(pid), stdin_fd_(stdin_fd), stdout_fd_(stdout_fd), stderr_fd_(stderr_fd) {}

ProcessChannel::~ProcessChannel() {
  Shutdown(std::chrono::milliseconds(0));
}

void ProcessChannel::Start(StdioChannelHandlers handlers) {
  if (io_thread_.joinable()) return;
  handlers_ = std::move(handlers);
  io_thread_ = std::thread([this]() { IoLoop(); });
}

const char* ProcessChannel::WriteStopReason(const WriteOptions& options) const {
  if (stopping_.load()) return "channel is shutting down";
  if (options.abandon && options.abandon()) return "write abandoned";
  if (std::chrono::steady_clock::now() >= options.deadline) return "write timed out";
  return nullptr;
}

bool ProcessChannel::Write(const std::string& bytes, const WriteOptions& options, std::string* err) {
  std::unique_lock<std::timed_mutex> lock(write_mu_, std::defer_lock);
  while (!lock.try_lock_for(std::chrono::milliseconds(kWriteSliceMs))) {
    if (const char* stop = WriteStopReason(options)) {
      if (err) *err = stop;
      return false;
    }
  }
  if (stdin_fd_ < 0) {
    if (err) *err = "stdin is closed";
    return false;
  }
  size_t off = 0;
  while (off < bytes.size()) {
    const ssize_t n = write(stdin_fd_, bytes.data() + off, bytes.size() - off);
    if (n > 0) {
      off += static_cast<size_t>(n);
      continue;
    }
    if (n < 0 && errno == EINTR) continue;
    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      if (const char* stop = WriteStopReason(options)) {
        // The peer would see a truncated frame followed by the next one.
        if (off > 0) {
          CloseFd(&stdin_fd_);
          std::cout << "[mcp] stdin closed after partial write pid=" << pid_ << " reason=" << stop << "\n";
        }
        if (err) *err = stop;
        return false;
      }
      pollfd pfd;
      pfd.fd = stdin_fd_;
      pfd.events = POLLOUT;
      pfd.revents = 0;
      static_cast<void>(poll(&pfd, 1, kWriteSliceMs));
      continue;
    }
    if (err) *err = std::string("write to stdin failed: ") + std::strerror(errno);
    return false;
  }
  return true;
}

void ProcessChannel::IoLoop() {
  bool stdout_open = true;
  bool stderr_open = true;
  while (!stopping_.load()) {
    pollfd fds[2];
    nfds_t nfds = 0;
    if (stdout_open) {
      fds[nfds].fd = stdout_fd_;
      fds[nfds].events = POLLIN;
      fds[nfds].revents = 0;
      ++nfds;
    }
    if (stderr_open) {
      fds[nfds].fd = stderr_fd_;
      fds[nfds].events = POLLIN;
      fds[nfds].revents = 0;
      ++nfds;
    }
    const int rc = poll(fds, nfds, kPollIntervalMs);
    if (stopping_.load()) break;
    if (rc < 0 && errno != EINTR) {
      ReportClosed(std::string("poll failed: ") + std::strerror(errno));
      return;
    }

    DrainFd(stderr_fd_, &stderr_open, handlers_.on_stderr);
    DrainFd(stdout_fd_, &stdout_open, handlers_.on_stdout);
    if (!stdout_open) {
      DrainFd(stderr_fd_, &stderr_open, handlers_.on_stderr);
      ReportClosed("closed its stdout");
      return;
    }
  }
}

// Runs once on the I/O thread when output ends. An exit status found shortly after replaces `reason`.
void ProcessChannel::ReportClosed(std::string reason) {
  for (int i = 0; i < kReapAttempts; i++) {
    if (TryReap(&reason)) break;
    std::this_thread::sleep_for(std::chrono::milliseconds(kReapPollMs));
  }
  if (!stopping_.load() && handlers_.on_closed) handlers_.on_closed(reason);
}

bool ProcessChannel::TryReap(std::string* reason) {
  std::lock_guard<std::mutex> lock(reap_mu_);
  if (reaped_) return true;
  int status = 0;
  const pid_t r = waitpid(pid_, &status, WNOHANG);
  if (r == pid_) {
    reaped_ = true;
    if (reason) *reason = DescribeStatus(status);
    return true;
  }
  if (r < 0 && errno == ECHILD) {
    reaped_ = true;
    return true;
  }
  return false;
}

void ProcessChannel::JoinIoThread() {
  if (!io_thread_.joinable()) return;
  if (io_thread_.get_id() == std::this_thread::get_id()) {
    io_thread_.detach();
    return;
  }
  io_thread_.join();
}

void ProcessChannel::Shutdown(std::chrono::milliseconds grace) {
  if (shut_down_) return;
  shut_down_ = true;
  stopping_.store(true);

  // stopping_ makes any writer give up within one slice.
  {
    std::lock_guard<std::timed_mutex> lock(write_mu_);
    CloseFd(&stdin_fd_);
  }

  if (!TryReap(nullptr)) {
    static_cast<void>(kill(pid_, SIGTERM));
    const auto deadline = std::chrono::steady_clock::now() + grace;
    bool exited = false;
    while (std::chrono::steady_clock::now() < deadline) {
      if (TryReap(nullptr)) {
        exited = true;
        break;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(kReapPollMs));
    }
    if (!exited && !TryReap(nullptr)) {
      static_cast<void>(kill(pid_, SIGKILL));
      std::lock_guard<std::mutex> lock(reap_mu_);
      if (!reaped_) {
        int status = 0;
        static_cast<void>(waitpid(pid_, &status, 0));
        reaped_ = true;
      }
      std::cout << "[mcp] force-killed pid=" << pid_ << "\n";
    }
  }

  JoinIoThread();
  CloseFd(&stdout_fd_);
  CloseFd(&stderr_fd_);
}

}  // namespace toolrt
