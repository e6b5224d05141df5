#ifndef MESSAGES_HPP
#define MESSAGES_HPP

#include "core/project.hpp"
#include <chrono>
#include <cstddef>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

struct ProjectSummary {
  std::string id;
  std::string name;
  std::string preview_url;
  std::string status;
  int port = 0;

  static ProjectSummary from_session(const PreviewSession &session);
};

struct ProjectAdded {
  ProjectSummary project;
};

struct ProjectRemoved {
  std::string project_id;
};

struct FileChanged {
  std::string project_id;
  std::string relative_path;
  ChangeKind kind = ChangeKind::Modified;
};

struct RebuildStarted {
  std::string project_id;
  RebuildCause cause = RebuildCause::FileChange;
  std::size_t file_count = 0;
};

struct RebuildComplete {
  std::string project_id;
  RebuildCause cause = RebuildCause::FileChange;
  std::chrono::milliseconds duration{0};
  std::vector<std::string> files;
};

struct RebuildFailed {
  std::string project_id;
  std::string message;
  bool timed_out = false;
  std::chrono::milliseconds duration{0};
};

struct WatcherFailed {
  std::string project_id;
  std::string message;
};

// First message on a project channel.
struct ProjectState {
  ProjectSummary project;
};

// First message on a catalogue channel.
struct ProjectsList {
  std::vector<ProjectSummary> projects;
};

using Message =
    std::variant<ProjectAdded, ProjectRemoved, FileChanged, RebuildStarted,
                 RebuildComplete, RebuildFailed, WatcherFailed, ProjectState,
                 ProjectsList>;

// "project-added", "rebuild-complete", ...
const char *message_type(const Message &message);

// Catalogue messages are the only ones global channels may receive.
bool is_catalogue_message(const Message &message);

nlohmann::json to_json(const ProjectSummary &summary);
nlohmann::json to_json(const Message &message);
std::string serialize(const Message &message);

#endif
