#include <gtest/gtest.h>

#include "TestSupport.h"
#include "core/process_runner.hpp"

using namespace test_support;
using namespace std::chrono_literals;

TEST(ProcessRunner, CapturesOutputAndExitCode) {
  TempDir dir;
  auto result = ProcessRunner::run("echo hello; echo oops 1>&2; exit 3",
                                   dir.path(), 5000ms, 4096);

  EXPECT_EQ(result.exit_code, 3);
  EXPECT_FALSE(result.timed_out);
  EXPECT_FALSE(result.spawn_failed);
  EXPECT_NE(result.output.find("hello"), std::string::npos);
  EXPECT_NE(result.output.find("oops"), std::string::npos);
}

TEST(ProcessRunner, RunsInWorkingDirectory) {
  TempDir dir;
  write_file(dir / "marker.txt", "here");

  auto result = ProcessRunner::run("cat marker.txt", dir.path(), 5000ms, 4096);

  EXPECT_EQ(result.exit_code, 0);
  EXPECT_EQ(result.output, "here");
}

TEST(ProcessRunner, TimeoutKillsTheProcessGroup) {
  TempDir dir;
  auto start = std::chrono::steady_clock::now();
  auto result = ProcessRunner::run("sleep 5; echo finished > done.txt",
                                   dir.path(), 200ms, 4096);
  auto elapsed = std::chrono::steady_clock::now() - start;

  EXPECT_TRUE(result.timed_out);
  EXPECT_LT(elapsed, 2s);
  std::this_thread::sleep_for(300ms);
  EXPECT_FALSE(fs::exists(dir / "done.txt"));
}

TEST(ProcessRunner, OutputKeepsTheTail) {
  TempDir dir;
  auto result = ProcessRunner::run(
      "i=0; while [ $i -lt 200 ]; do echo line$i; i=$((i+1)); done",
      dir.path(), 5000ms, 64);

  EXPECT_EQ(result.exit_code, 0);
  EXPECT_TRUE(result.truncated);
  EXPECT_LE(result.output.size(), 64u);
  EXPECT_NE(result.output.find("line199"), std::string::npos);
  EXPECT_EQ(result.output.find("line0\n"), std::string::npos);
}

TEST(ProcessRunner, CancelFlagStopsTheCommand) {
  TempDir dir;
  std::atomic<bool> cancel{false};

  std::thread canceller([&]() {
    std::this_thread::sleep_for(100ms);
    cancel = true;
  });

  auto start = std::chrono::steady_clock::now();
  auto result = ProcessRunner::run("sleep 5", dir.path(), 10000ms, 4096, &cancel);
  auto elapsed = std::chrono::steady_clock::now() - start;
  canceller.join();

  EXPECT_TRUE(result.cancelled);
  EXPECT_LT(elapsed, 2s);
}

TEST(ProcessRunner, MissingWorkingDirectoryFails) {
  TempDir dir;
  auto result =
      ProcessRunner::run("true", dir / "missing", 5000ms, 4096);

  EXPECT_NE(result.exit_code, 0);
}
