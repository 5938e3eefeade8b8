#include <gtest/gtest.h>
#include "stdio_channel.hpp"

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>

using namespace toolrt;

namespace {

// Collects channel events and lets the test block until a predicate holds.
struct Recorder {
  std::mutex mu;
  std::condition_variable cv;
  std::string out;
  std::string err;
  std::string closed_reason;
  int closed_count = 0;

  StdioChannelHandlers Handlers() {
    StdioChannelHandlers h;
    h.on_stdout = [this](std::string_view s) {
      std::lock_guard<std::mutex> lock(mu);
      out.append(s.data(), s.size());
      cv.notify_all();
    };
    h.on_stderr = [this](std::string_view s) {
      std::lock_guard<std::mutex> lock(mu);
      err.append(s.data(), s.size());
      cv.notify_all();
    };
    h.on_closed = [this](const std::string& reason) {
      std::lock_guard<std::mutex> lock(mu);
      closed_reason = reason;
      closed_count++;
      cv.notify_all();
    };
    return h;
  }

  template <typename Pred>
  bool WaitFor(Pred pred, std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
    std::unique_lock<std::mutex> lock(mu);
    return cv.wait_for(lock, timeout, pred);
  }
};

}  // namespace

TEST(ProcessChannelTest, EchoesThroughCat) {
  std::string err;
  auto ch = ProcessChannel::Spawn("/bin/cat", {}, {}, &err);
  ASSERT_NE(ch, nullptr) << err;
  Recorder rec;
  ch->Start(rec.Handlers());
  ASSERT_TRUE(ch->Write("Content-Length: 2\r\n\r\n{}", WriteOptions{}, &err)) << err;
  EXPECT_TRUE(rec.WaitFor([&]() { return rec.out == "Content-Length: 2\r\n\r\n{}"; }));
  ch->Shutdown(std::chrono::milliseconds(600));
  EXPECT_EQ(rec.closed_count, 0);
}

TEST(ProcessChannelTest, ReportsExecFailureSynchronously) {
  std::string err;
  auto ch = ProcessChannel::Spawn("/nonexistent/tool-runtime-missing-binary", {}, {}, &err);
  EXPECT_EQ(ch, nullptr);
  EXPECT_NE(err.find("failed to start"), std::string::npos) << err;
}

TEST(ProcessChannelTest, ReportsExitCodeAndStderr) {
  std::string err;
  auto ch = ProcessChannel::Spawn("/bin/sh", {"-c", "echo boom >&2; exit 3"}, {}, &err);
  ASSERT_NE(ch, nullptr) << err;
  Recorder rec;
  ch->Start(rec.Handlers());
  ASSERT_TRUE(rec.WaitFor([&]() { return rec.closed_count == 1; }));
  EXPECT_EQ(rec.closed_reason, "exited with code 3");
  EXPECT_NE(rec.err.find("boom"), std::string::npos);
  ch->Shutdown(std::chrono::milliseconds(600));
  EXPECT_EQ(rec.closed_count, 1);
}

TEST(ProcessChannelTest, PassesEnvironmentOverrides) {
  std::string err;
  auto ch = ProcessChannel::Spawn("/bin/sh", {"-c", "printf '%s' \"$TOOL_RUNTIME_TEST_VALUE\""},
                                  {{"TOOL_RUNTIME_TEST_VALUE", "from-env"}}, &err);
  ASSERT_NE(ch, nullptr) << err;
  Recorder rec;
  ch->Start(rec.Handlers());
  ASSERT_TRUE(rec.WaitFor([&]() { return rec.closed_count == 1; }));
  EXPECT_EQ(rec.out, "from-env");
  ch->Shutdown(std::chrono::milliseconds(600));
}

TEST(ProcessChannelTest, ForceKillsStubbornChild) {
  std::string err;
  auto ch = ProcessChannel::Spawn("/bin/sh", {"-c", "trap '' TERM; while :; do sleep 1; done"}, {}, &err);
  ASSERT_NE(ch, nullptr) << err;
  Recorder rec;
  ch->Start(rec.Handlers());
  const auto start = std::chrono::steady_clock::now();
  ch->Shutdown(std::chrono::milliseconds(200));
  const auto elapsed = std::chrono::steady_clock::now() - start;
  EXPECT_LT(elapsed, std::chrono::seconds(3));
  EXPECT_EQ(rec.closed_count, 0);
}

TEST(ProcessChannelTest, WriteAfterShutdownFails) {
  std::string err;
  auto ch = ProcessChannel::Spawn("/bin/cat", {}, {}, &err);
  ASSERT_NE(ch, nullptr) << err;
  Recorder rec;
  ch->Start(rec.Handlers());
  ch->Shutdown(std::chrono::milliseconds(600));
  EXPECT_FALSE(ch->Write("x", WriteOptions{}, &err));
  EXPECT_EQ(err, "stdin is closed");
}

TEST(ProcessChannelTest, ClosedStdoutIsReportedWhileChildRuns) {
  std::string err;
  auto ch = ProcessChannel::Spawn("/bin/sh", {"-c", "exec 1>&-; sleep 5"}, {}, &err);
  ASSERT_NE(ch, nullptr) << err;
  Recorder rec;
  ch->Start(rec.Handlers());
  ASSERT_TRUE(rec.WaitFor([&]() { return rec.closed_count == 1; }, std::chrono::seconds(2)));
  EXPECT_EQ(rec.closed_reason, "closed its stdout");
  ch->Shutdown(std::chrono::milliseconds(200));
  EXPECT_EQ(rec.closed_count, 1);
}

TEST(ProcessChannelTest, WriteToNonReadingChildStopsAtDeadline) {
  std::string err;
  auto ch = ProcessChannel::Spawn("/bin/sh", {"-c", "sleep 30"}, {}, &err);
  ASSERT_NE(ch, nullptr) << err;
  Recorder rec;
  ch->Start(rec.Handlers());

  WriteOptions options;
  options.deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(150);
  const auto start = std::chrono::steady_clock::now();
  EXPECT_FALSE(ch->Write(std::string(256 * 1024, 'x'), options, &err));
  EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(1));
  EXPECT_EQ(err, "write timed out");

  // The truncated frame closed stdin.
  EXPECT_FALSE(ch->Write("x", WriteOptions{}, &err));
  EXPECT_EQ(err, "stdin is closed");
  ch->Shutdown(std::chrono::milliseconds(200));
}

TEST(ProcessChannelTest, AbandonStopsAStalledWrite) {
  std::string err;
  auto ch = ProcessChannel::Spawn("/bin/sh", {"-c", "sleep 30"}, {}, &err);
  ASSERT_NE(ch, nullptr) << err;
  Recorder rec;
  ch->Start(rec.Handlers());

  const auto start = std::chrono::steady_clock::now();
  WriteOptions options;
  options.abandon = [start]() { return std::chrono::steady_clock::now() - start > std::chrono::milliseconds(100); };
  EXPECT_FALSE(ch->Write(std::string(256 * 1024, 'x'), options, &err));
  EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(1));
  EXPECT_EQ(err, "write abandoned");
  ch->Shutdown(std::chrono::milliseconds(200));
}

TEST(ProcessChannelTest, ShutdownInterruptsAStalledWriter) {
  std::string err;
  auto ch = ProcessChannel::Spawn("/bin/sh", {"-c", "sleep 30"}, {}, &err);
  ASSERT_NE(ch, nullptr) << err;
  Recorder rec;
  ch->Start(rec.Handlers());

  bool written = true;
  std::string write_err;
  std::thread writer([&]() { written = ch->Write(std::string(256 * 1024, 'x'), WriteOptions{}, &write_err); });
  std::this_thread::sleep_for(std::chrono::milliseconds(100));

  const auto start = std::chrono::steady_clock::now();
  ch->Shutdown(std::chrono::milliseconds(200));
  EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(2));
  writer.join();
  EXPECT_FALSE(written);
  EXPECT_EQ(write_err, "channel is shutting down");
  EXPECT_EQ(rec.closed_count, 0);
}

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
