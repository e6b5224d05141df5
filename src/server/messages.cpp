#include "messages.hpp"

namespace {

template <class... Ts> struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

} // namespace

ProjectSummary ProjectSummary::from_session(const PreviewSession &session) {
  return {session.project_id, session.project_name, session.base_url,
          to_string(session.status), session.port};
}

const char *message_type(const Message &message) {
  return std::visit(
      overloaded{
          [](const ProjectAdded &) { return "project-added"; },
          [](const ProjectRemoved &) { return "project-removed"; },
          [](const FileChanged &) { return "file-change"; },
          [](const RebuildStarted &) { return "rebuild-started"; },
          [](const RebuildComplete &) { return "rebuild-complete"; },
          [](const RebuildFailed &) { return "rebuild-error"; },
          [](const WatcherFailed &) { return "watcher-error"; },
          [](const ProjectState &) { return "project-state"; },
          [](const ProjectsList &) { return "projects-list"; },
      },
      message);
}

bool is_catalogue_message(const Message &message) {
  return std::holds_alternative<ProjectAdded>(message) ||
         std::holds_alternative<ProjectRemoved>(message) ||
         std::holds_alternative<ProjectsList>(message);
}

nlohmann::json to_json(const ProjectSummary &summary) {
  return {{"id", summary.id},
          {"name", summary.name},
          {"previewUrl", summary.preview_url},
          {"status", summary.status},
          {"port", summary.port}};
}

nlohmann::json to_json(const Message &message) {
  nlohmann::json j;
  j["type"] = message_type(message);
  j["timestamp"] = to_millis(Clock::now());

  std::visit(
      overloaded{
          [&](const ProjectAdded &m) {
            j["projectId"] = m.project.id;
            j["project"] = to_json(m.project);
          },
          [&](const ProjectRemoved &m) { j["projectId"] = m.project_id; },
          [&](const FileChanged &m) {
            j["projectId"] = m.project_id;
            j["change"] = {{"relativePath", m.relative_path},
                           {"kind", to_string(m.kind)}};
          },
          [&](const RebuildStarted &m) {
            j["projectId"] = m.project_id;
            j["trigger"] = to_string(m.cause);
            j["fileCount"] = m.file_count;
          },
          [&](const RebuildComplete &m) {
            j["projectId"] = m.project_id;
            j["trigger"] = to_string(m.cause);
            j["duration"] = m.duration.count();
            j["fileCount"] = m.files.size();
            j["files"] = m.files;
          },
          [&](const RebuildFailed &m) {
            j["projectId"] = m.project_id;
            j["error"] = m.message;
            j["timedOut"] = m.timed_out;
            j["duration"] = m.duration.count();
          },
          [&](const WatcherFailed &m) {
            j["projectId"] = m.project_id;
            j["error"] = m.message;
          },
          [&](const ProjectState &m) {
            j["projectId"] = m.project.id;
            j["project"] = to_json(m.project);
          },
          [&](const ProjectsList &m) {
            j["projects"] = nlohmann::json::array();
            for (const auto &project : m.projects) {
              j["projects"].push_back(to_json(project));
            }
          },
      },
      message);

  return j;
}

std::string serialize(const Message &message) { return to_json(message).dump(); }
