#ifndef PROJECT_HPP
#define PROJECT_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

using Clock = std::chrono::system_clock;

struct ProxyRule {
  std::string prefix;
  std::string target;
};

struct CompileStep {
  std::string command;
  fs::path working_dir;
  // Zero means the scheduler default.
  std::chrono::milliseconds timeout{0};
};

struct Project {
  std::string id;
  std::string name;
  fs::path root;
  std::vector<ProxyRule> proxy_rules;
  std::optional<CompileStep> compile_step;
  std::string entry_document = "index.html";
  Clock::time_point registered_at;

  // Descriptor as sent to the registration API.
  static Project from_json(const nlohmann::json &descriptor);
};

enum class ChangeKind { Added, Modified, Removed };

struct ChangeEvent {
  std::string project_id;
  std::string relative_path;
  ChangeKind kind = ChangeKind::Modified;
  Clock::time_point observed_at;
};

enum class RebuildCause { FileChange, Manual };

enum class JobStatus { Queued, Running, Succeeded, Failed };

struct RebuildJob {
  std::string project_id;
  RebuildCause cause = RebuildCause::FileChange;
  std::vector<ChangeEvent> events;
  Clock::time_point started_at;
  Clock::time_point finished_at;
  JobStatus status = JobStatus::Queued;
  std::optional<std::string> error;
  bool timed_out = false;

  // Distinct relative paths of the triggering events, in first-seen order.
  std::vector<std::string> affected_paths() const;
};

struct RebuildOutcome {
  std::string project_id;
  RebuildJob job;
  std::chrono::milliseconds duration{0};
};

enum class SessionStatus { Starting, Ready, Error, Stopped };

struct PreviewSession {
  std::string project_id;
  std::string project_name;
  int port = 0;
  std::string base_url;
  SessionStatus status = SessionStatus::Starting;
  Clock::time_point started_at;
  std::optional<std::string> last_error;
  std::uint64_t rebuild_count = 0;
  std::optional<JobStatus> last_rebuild;
};

const char *to_string(ChangeKind kind);
const char *to_string(RebuildCause cause);
const char *to_string(JobStatus status);
const char *to_string(SessionStatus status);

std::int64_t to_millis(Clock::time_point time);

#endif
