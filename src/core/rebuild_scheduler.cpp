#include "rebuild_scheduler.hpp"
#include "core/errors.hpp"
#include "core/process_runner.hpp"
#include "utils/log.hpp"

const char *to_string(SchedulerState state) {
  switch (state) {
  case SchedulerState::Idle:
    return "idle";
  case SchedulerState::Queued:
    return "queued";
  case SchedulerState::Running:
    return "running";
  }
  return "idle";
}

// One worker thread per project.
class RebuildScheduler::Lane {
public:
  Lane(std::string project_id, std::optional<CompileStep> compile_step,
       const RebuildScheduler &owner)
      : project_id_(std::move(project_id)),
        compile_step_(std::move(compile_step)), owner_(owner) {
    worker_ = std::thread([this]() { run(); });
  }

  ~Lane() { cancel(); }

  bool enqueue(std::vector<ChangeEvent> batch, RebuildCause cause) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (stopping_) {
        return false;
      }

      if (pending_) {
        pending_->events.insert(pending_->events.end(),
                                std::make_move_iterator(batch.begin()),
                                std::make_move_iterator(batch.end()));
        if (cause == RebuildCause::FileChange) {
          pending_->cause = RebuildCause::FileChange;
        }
      } else {
        RebuildJob job;
        job.project_id = project_id_;
        job.cause = cause;
        job.events = std::move(batch);
        job.status = JobStatus::Queued;
        pending_ = std::move(job);
      }
    }
    cv_.notify_one();
    return true;
  }

  void set_compile_step(std::optional<CompileStep> step) {
    std::lock_guard<std::mutex> lock(mutex_);
    compile_step_ = std::move(step);
  }

  SchedulerState state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) {
      return SchedulerState::Running;
    }
    return pending_ ? SchedulerState::Queued : SchedulerState::Idle;
  }

  void cancel() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      stopping_ = true;
      pending_.reset();
    }
    cancelled_ = true;
    cv_.notify_all();

    if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
      worker_.join();
    }
  }

private:
  void run() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
      cv_.wait(lock, [this]() { return stopping_ || pending_.has_value(); });
      if (stopping_) {
        return;
      }

      RebuildJob job = std::move(*pending_);
      pending_.reset();
      job.status = JobStatus::Running;
      job.started_at = Clock::now();
      running_ = true;
      auto step = compile_step_;
      lock.unlock();

      auto started = std::chrono::steady_clock::now();
      report_started(job);
      execute(job, step);
      auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - started);

      lock.lock();
      running_ = false;
      if (stopping_) {
        return;
      }
      lock.unlock();

      report_finished({project_id_, std::move(job), duration});

      lock.lock();
    }
  }

  void execute(RebuildJob &job, const std::optional<CompileStep> &step) {
    try {
      if (cancelled_) {
        throw BuildError("cancelled");
      }

      if (step) {
        run_compile_step(job, *step);
      }

      if (cancelled_) {
        throw BuildError("cancelled");
      }

      job.status = JobStatus::Succeeded;
    } catch (const BuildError &e) {
      job.status = JobStatus::Failed;
      job.error = e.what();
    }
    job.finished_at = Clock::now();
  }

  void run_compile_step(RebuildJob &job, const CompileStep &step) {
    auto timeout = step.timeout.count() > 0 ? step.timeout
                                            : owner_.options_.default_timeout;

    ProcessResult result =
        ProcessRunner::run(step.command, step.working_dir, timeout,
                           owner_.options_.max_error_bytes, &cancelled_);

    if (result.cancelled) {
      throw BuildError("cancelled");
    }

    if (result.spawn_failed) {
      throw BuildError("Compile step could not start: " + result.output);
    }

    if (result.timed_out) {
      job.timed_out = true;
      throw BuildError("Compile step timed out after " +
                       std::to_string(timeout.count()) + "ms" +
                       (result.output.empty() ? "" : "\n" + result.output));
    }

    if (result.exit_code != 0) {
      throw BuildError("Compile step exited with code " +
                       std::to_string(result.exit_code) +
                       (result.output.empty() ? "" : "\n" + result.output));
    }
  }

  void report_started(const RebuildJob &job) {
    if (!owner_.on_started_) {
      return;
    }
    try {
      owner_.on_started_(job);
    } catch (const std::exception &e) {
      log_error("Rebuild start handler failed for " + project_id_ + ": " +
                e.what());
    }
  }

  void report_finished(const RebuildOutcome &outcome) {
    if (!owner_.on_finished_) {
      return;
    }
    try {
      owner_.on_finished_(outcome);
    } catch (const std::exception &e) {
      log_error("Rebuild outcome handler failed for " + project_id_ + ": " +
                e.what());
    }
  }

  std::string project_id_;
  std::optional<CompileStep> compile_step_;
  const RebuildScheduler &owner_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::optional<RebuildJob> pending_;
  bool running_ = false;
  bool stopping_ = false;
  std::atomic<bool> cancelled_{false};
  std::thread worker_;
};

RebuildScheduler::RebuildScheduler(Options options, StartedCallback on_started,
                                   OutcomeCallback on_finished)
    : options_(options), on_started_(std::move(on_started)),
      on_finished_(std::move(on_finished)) {}

RebuildScheduler::~RebuildScheduler() {
  std::unordered_map<std::string, std::shared_ptr<Lane>> lanes;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    lanes.swap(lanes_);
  }
  for (auto &[id, lane] : lanes) {
    lane->cancel();
  }
}

void RebuildScheduler::add_project(const std::string &project_id,
                                   std::optional<CompileStep> compile_step) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (lanes_.count(project_id)) {
    lanes_[project_id]->set_compile_step(std::move(compile_step));
    return;
  }
  lanes_[project_id] =
      std::make_shared<Lane>(project_id, std::move(compile_step), *this);
}

void RebuildScheduler::set_compile_step(const std::string &project_id,
                                        std::optional<CompileStep> compile_step) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = lanes_.find(project_id);
  if (it != lanes_.end()) {
    it->second->set_compile_step(std::move(compile_step));
  }
}

void RebuildScheduler::remove_project(const std::string &project_id) {
  std::shared_ptr<Lane> lane;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = lanes_.find(project_id);
    if (it == lanes_.end()) {
      return;
    }
    lane = std::move(it->second);
    lanes_.erase(it);
  }
  lane->cancel();
}

bool RebuildScheduler::trigger(const std::string &project_id,
                               std::vector<ChangeEvent> batch,
                               RebuildCause cause) {
  if (cause == RebuildCause::FileChange && batch.empty()) {
    return false;
  }

  std::shared_ptr<Lane> lane;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = lanes_.find(project_id);
    if (it == lanes_.end()) {
      return false;
    }
    lane = it->second;
  }
  return lane->enqueue(std::move(batch), cause);
}

SchedulerState RebuildScheduler::state(const std::string &project_id) const {
  std::shared_ptr<Lane> lane;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = lanes_.find(project_id);
    if (it == lanes_.end()) {
      return SchedulerState::Idle;
    }
    lane = it->second;
  }
  return lane->state();
}

bool RebuildScheduler::has_project(const std::string &project_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return lanes_.count(project_id) > 0;
}
