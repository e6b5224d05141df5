#include <gtest/gtest.h>

#include "TestSupport.h"
#include "core/rebuild_scheduler.hpp"

#include <algorithm>

using namespace test_support;
using namespace std::chrono_literals;

namespace {

struct Recorder {
  std::mutex mutex;
  std::vector<RebuildJob> started;
  std::vector<RebuildOutcome> finished;
  std::atomic<int> running{0};
  std::atomic<int> max_running{0};

  RebuildScheduler::StartedCallback on_started() {
    return [this](const RebuildJob &job) {
      std::lock_guard<std::mutex> lock(mutex);
      started.push_back(job);
    };
  }

  RebuildScheduler::OutcomeCallback on_finished() {
    return [this](const RebuildOutcome &outcome) {
      std::lock_guard<std::mutex> lock(mutex);
      finished.push_back(outcome);
    };
  }

  std::size_t finished_count() {
    std::lock_guard<std::mutex> lock(mutex);
    return finished.size();
  }

  std::size_t started_count() {
    std::lock_guard<std::mutex> lock(mutex);
    return started.size();
  }
};

std::vector<ChangeEvent> batch(const std::string &project_id,
                               std::initializer_list<std::string> paths) {
  std::vector<ChangeEvent> events;
  for (const auto &path : paths) {
    events.push_back({project_id, path, ChangeKind::Modified, Clock::now()});
  }
  return events;
}

CompileStep step(const std::string &command, const fs::path &dir,
                 std::chrono::milliseconds timeout = 0ms) {
  CompileStep compile;
  compile.command = command;
  compile.working_dir = dir;
  compile.timeout = timeout;
  return compile;
}

} // namespace

TEST(RebuildScheduler, JobWithoutCompileStepSucceeds) {
  Recorder recorder;
  RebuildScheduler scheduler({}, recorder.on_started(), recorder.on_finished());
  scheduler.add_project("p1", std::nullopt);

  ASSERT_TRUE(scheduler.trigger("p1", batch("p1", {"a.txt"}),
                                RebuildCause::FileChange));
  ASSERT_TRUE(wait_until([&]() { return recorder.finished_count() == 1; }));

  std::lock_guard<std::mutex> lock(recorder.mutex);
  const auto &outcome = recorder.finished[0];
  EXPECT_EQ(outcome.project_id, "p1");
  EXPECT_EQ(outcome.job.status, JobStatus::Succeeded);
  EXPECT_EQ(outcome.job.cause, RebuildCause::FileChange);
  EXPECT_EQ(outcome.job.affected_paths(), std::vector<std::string>{"a.txt"});
  EXPECT_EQ(recorder.started.size(), 1u);
}

TEST(RebuildScheduler, RefusesUnknownProjectsAndEmptyFileChanges) {
  Recorder recorder;
  RebuildScheduler scheduler({}, recorder.on_started(), recorder.on_finished());
  scheduler.add_project("p1", std::nullopt);

  EXPECT_FALSE(scheduler.trigger("nobody", batch("nobody", {"a.txt"}),
                                 RebuildCause::FileChange));
  EXPECT_FALSE(scheduler.trigger("p1", {}, RebuildCause::FileChange));
  EXPECT_TRUE(scheduler.trigger("p1", {}, RebuildCause::Manual));

  ASSERT_TRUE(wait_until([&]() { return recorder.finished_count() == 1; }));
  std::lock_guard<std::mutex> lock(recorder.mutex);
  EXPECT_EQ(recorder.finished[0].job.cause, RebuildCause::Manual);
}

TEST(RebuildScheduler, TriggersWhileRunningMergeIntoOneQueuedJob) {
  TempDir dir;
  Recorder recorder;
  RebuildScheduler scheduler({}, recorder.on_started(), recorder.on_finished());
  scheduler.add_project("p1", step("sleep 0.3", dir.path()));

  scheduler.trigger("p1", batch("p1", {"a.txt"}), RebuildCause::FileChange);
  ASSERT_TRUE(wait_until(
      [&]() { return scheduler.state("p1") == SchedulerState::Running; }));

  scheduler.trigger("p1", batch("p1", {"b.txt"}), RebuildCause::FileChange);
  scheduler.trigger("p1", batch("p1", {"c.txt", "b.txt"}),
                    RebuildCause::FileChange);
  EXPECT_EQ(scheduler.state("p1"), SchedulerState::Running);

  ASSERT_TRUE(wait_until([&]() { return recorder.finished_count() == 2; }, 5s));
  std::this_thread::sleep_for(400ms);
  EXPECT_EQ(recorder.finished_count(), 2u);

  std::lock_guard<std::mutex> lock(recorder.mutex);
  auto second = recorder.finished[1].job.affected_paths();
  EXPECT_EQ(second, (std::vector<std::string>{"b.txt", "c.txt"}));
  EXPECT_EQ(recorder.finished[1].job.events.size(), 3u);
}

TEST(RebuildScheduler, AtMostOneJobRunsPerProject) {
  TempDir dir;
  fs::path marker = dir / "running";
  // Fails when another instance already holds the marker.
  std::string command = "if [ -e running ]; then exit 9; fi; touch running; "
                        "sleep 0.1; rm running";

  Recorder recorder;
  RebuildScheduler scheduler({}, recorder.on_started(), recorder.on_finished());
  scheduler.add_project("p1", step(command, dir.path()));

  for (int i = 0; i < 10; ++i) {
    scheduler.trigger("p1", batch("p1", {"f" + std::to_string(i)}),
                      RebuildCause::FileChange);
    std::this_thread::sleep_for(30ms);
  }

  ASSERT_TRUE(wait_until(
      [&]() { return scheduler.state("p1") == SchedulerState::Idle; }, 10s));
  std::this_thread::sleep_for(100ms);

  std::lock_guard<std::mutex> lock(recorder.mutex);
  EXPECT_GE(recorder.finished.size(), 2u);
  EXPECT_LT(recorder.finished.size(), 10u);
  for (const auto &outcome : recorder.finished) {
    EXPECT_EQ(outcome.job.status, JobStatus::Succeeded)
        << outcome.job.error.value_or("");
  }
  EXPECT_FALSE(fs::exists(marker));
}

TEST(RebuildScheduler, FailedStepReportsTruncatedOutput) {
  TempDir dir;
  Recorder recorder;
  RebuildScheduler::Options options;
  options.max_error_bytes = 32;
  RebuildScheduler scheduler(options, recorder.on_started(),
                             recorder.on_finished());
  scheduler.add_project(
      "p1", step("i=0; while [ $i -lt 50 ]; do echo noise$i; i=$((i+1)); done; "
                 "echo last-words; exit 2",
                 dir.path()));

  scheduler.trigger("p1", {}, RebuildCause::Manual);
  ASSERT_TRUE(wait_until([&]() { return recorder.finished_count() == 1; }));

  std::lock_guard<std::mutex> lock(recorder.mutex);
  const auto &job = recorder.finished[0].job;
  EXPECT_EQ(job.status, JobStatus::Failed);
  ASSERT_TRUE(job.error.has_value());
  EXPECT_NE(job.error->find("exited with code 2"), std::string::npos);
  EXPECT_NE(job.error->find("last-words"), std::string::npos);
  EXPECT_EQ(job.error->find("noise0\n"), std::string::npos);
  EXPECT_FALSE(job.timed_out);
}

TEST(RebuildScheduler, TimeoutFailsTheJobAndLeavesTheLaneUsable) {
  TempDir dir;
  Recorder recorder;
  RebuildScheduler scheduler({}, recorder.on_started(), recorder.on_finished());
  scheduler.add_project("p1", step("sleep 5", dir.path(), 200ms));

  auto start = std::chrono::steady_clock::now();
  scheduler.trigger("p1", {}, RebuildCause::Manual);
  ASSERT_TRUE(wait_until([&]() { return recorder.finished_count() == 1; }));
  auto elapsed = std::chrono::steady_clock::now() - start;
  EXPECT_LT(elapsed, 2s);

  {
    std::lock_guard<std::mutex> lock(recorder.mutex);
    const auto &job = recorder.finished[0].job;
    EXPECT_EQ(job.status, JobStatus::Failed);
    EXPECT_TRUE(job.timed_out);
    EXPECT_NE(job.error->find("timed out"), std::string::npos);
  }

  scheduler.set_compile_step("p1", step("true", dir.path()));
  scheduler.trigger("p1", {}, RebuildCause::Manual);
  ASSERT_TRUE(wait_until([&]() { return recorder.finished_count() == 2; }));
  std::lock_guard<std::mutex> lock(recorder.mutex);
  EXPECT_EQ(recorder.finished[1].job.status, JobStatus::Succeeded);
}

TEST(RebuildScheduler, RemovingAProjectCancelsWithoutReporting) {
  TempDir dir;
  Recorder recorder;
  RebuildScheduler scheduler({}, recorder.on_started(), recorder.on_finished());
  scheduler.add_project("p1", step("sleep 5; touch finished", dir.path()));

  scheduler.trigger("p1", {}, RebuildCause::Manual);
  ASSERT_TRUE(wait_until([&]() { return recorder.started_count() == 1; }));

  auto start = std::chrono::steady_clock::now();
  scheduler.remove_project("p1");
  EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);

  std::this_thread::sleep_for(200ms);
  EXPECT_EQ(recorder.finished_count(), 0u);
  EXPECT_FALSE(scheduler.has_project("p1"));
  EXPECT_FALSE(fs::exists(dir / "finished"));
  EXPECT_FALSE(scheduler.trigger("p1", {}, RebuildCause::Manual));
}

TEST(RebuildScheduler, ProjectsRunIndependently) {
  TempDir dir;
  Recorder recorder;
  RebuildScheduler scheduler({}, recorder.on_started(), recorder.on_finished());
  scheduler.add_project("slow", step("sleep 1", dir.path()));
  scheduler.add_project("fast", std::nullopt);

  scheduler.trigger("slow", {}, RebuildCause::Manual);
  scheduler.trigger("fast", {}, RebuildCause::Manual);

  ASSERT_TRUE(wait_until([&]() { return recorder.finished_count() >= 1; }));
  std::lock_guard<std::mutex> lock(recorder.mutex);
  EXPECT_EQ(recorder.finished[0].project_id, "fast");
}

TEST(RebuildScheduler, StateNames) {
  EXPECT_STREQ(to_string(SchedulerState::Idle), "idle");
  EXPECT_STREQ(to_string(SchedulerState::Queued), "queued");
  EXPECT_STREQ(to_string(SchedulerState::Running), "running");
}
