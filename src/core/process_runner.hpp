#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>

struct ProcessResult {
  int exit_code = -1;
  // Combined stdout and stderr, only the last max_output bytes are kept.
  std::string output;
  bool truncated = false;
  bool timed_out = false;
  bool cancelled = false;
  bool spawn_failed = false;
};

class ProcessRunner {
public:
  // Runs `/bin/sh -c command` in its own process group. The group is killed
  // on timeout or once *cancel becomes true.
  static ProcessResult run(const std::string &command,
                           const std::filesystem::path &working_dir,
                           std::chrono::milliseconds timeout,
                           std::size_t max_output,
                           const std::atomic<bool> *cancel = nullptr);

private:
  static void append_capped(ProcessResult &result, const char *data,
                            std::size_t size, std::size_t max_output);
  static int kill_group(int pid);
};
