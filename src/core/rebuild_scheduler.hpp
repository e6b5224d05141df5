#pragma once

#include "core/project.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

enum class SchedulerState { Idle, Queued, Running };

const char *to_string(SchedulerState state);

// Serializes rebuilds per project: Idle -> Queued -> Running -> Idle.
// A trigger that arrives while a job runs is merged into the one queued job.
class RebuildScheduler {
public:
  using StartedCallback = std::function<void(const RebuildJob &)>;
  using OutcomeCallback = std::function<void(const RebuildOutcome &)>;

  struct Options {
    std::chrono::milliseconds default_timeout{30000};
    std::size_t max_error_bytes = 4096;
  };

  RebuildScheduler(Options options, StartedCallback on_started,
                   OutcomeCallback on_finished);
  ~RebuildScheduler();

  RebuildScheduler(const RebuildScheduler &) = delete;
  RebuildScheduler &operator=(const RebuildScheduler &) = delete;

  void add_project(const std::string &project_id,
                   std::optional<CompileStep> compile_step);
  void set_compile_step(const std::string &project_id,
                        std::optional<CompileStep> compile_step);

  // Cancels queued and running work without reporting it.
  void remove_project(const std::string &project_id);

  // False for an unknown project or a file-change trigger without events.
  bool trigger(const std::string &project_id, std::vector<ChangeEvent> batch,
               RebuildCause cause);

  SchedulerState state(const std::string &project_id) const;
  bool has_project(const std::string &project_id) const;

private:
  class Lane;

  Options options_;
  StartedCallback on_started_;
  OutcomeCallback on_finished_;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<Lane>> lanes_;
};
