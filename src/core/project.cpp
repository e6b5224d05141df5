#include "project.hpp"
#include "errors.hpp"
#include <unordered_set>

namespace {

std::string string_field(const nlohmann::json &object, const char *key) {
  auto it = object.find(key);
  if (it == object.end() || it->is_null()) {
    return "";
  }
  if (!it->is_string()) {
    throw ConfigurationError(std::string("Field '") + key +
                             "' must be a string");
  }
  return it->get<std::string>();
}

} // namespace

Project Project::from_json(const nlohmann::json &descriptor) {
  if (!descriptor.is_object()) {
    throw ConfigurationError("Project descriptor must be a JSON object");
  }

  Project project;
  project.id = string_field(descriptor, "id");
  project.name = string_field(descriptor, "name");
  project.root = string_field(descriptor, "rootPath");

  std::string entry = string_field(descriptor, "entryDocument");
  if (!entry.empty()) {
    project.entry_document = entry;
  }

  if (descriptor.contains("proxyRules")) {
    const auto &rules = descriptor["proxyRules"];
    if (rules.is_array()) {
      for (const auto &rule : rules) {
        project.proxy_rules.push_back(
            {string_field(rule, "matchPrefix"), string_field(rule, "targetUrl")});
      }
    } else if (rules.is_object()) {
      // {"/api": "http://localhost:5173"} form. Rules follow key order.
      for (auto it = rules.begin(); it != rules.end(); ++it) {
        if (!it.value().is_string()) {
          throw ConfigurationError("Proxy target for '" + it.key() +
                                   "' must be a string");
        }
        project.proxy_rules.push_back({it.key(), it.value().get<std::string>()});
      }
    } else if (!rules.is_null()) {
      throw ConfigurationError("'proxyRules' must be an array or an object");
    }
  }

  if (descriptor.contains("compileStep") && !descriptor["compileStep"].is_null()) {
    const auto &step = descriptor["compileStep"];
    CompileStep compile;
    compile.command = string_field(step, "command");
    compile.working_dir = string_field(step, "workingDir");
    if (step.contains("timeoutMs")) {
      if (!step["timeoutMs"].is_number_integer()) {
        throw ConfigurationError("'timeoutMs' must be an integer");
      }
      compile.timeout = std::chrono::milliseconds(step["timeoutMs"].get<long>());
    }
    if (compile.command.empty()) {
      throw ConfigurationError("Compile step needs a command");
    }
    project.compile_step = compile;
  }

  return project;
}

std::vector<std::string> RebuildJob::affected_paths() const {
  std::vector<std::string> paths;
  std::unordered_set<std::string> seen;
  for (const auto &event : events) {
    if (seen.insert(event.relative_path).second) {
      paths.push_back(event.relative_path);
    }
  }
  return paths;
}

const char *to_string(ChangeKind kind) {
  switch (kind) {
  case ChangeKind::Added:
    return "added";
  case ChangeKind::Modified:
    return "modified";
  case ChangeKind::Removed:
    return "removed";
  }
  return "modified";
}

const char *to_string(RebuildCause cause) {
  switch (cause) {
  case RebuildCause::FileChange:
    return "file-change";
  case RebuildCause::Manual:
    return "manual";
  }
  return "manual";
}

const char *to_string(JobStatus status) {
  switch (status) {
  case JobStatus::Queued:
    return "queued";
  case JobStatus::Running:
    return "running";
  case JobStatus::Succeeded:
    return "succeeded";
  case JobStatus::Failed:
    return "failed";
  }
  return "queued";
}

const char *to_string(SessionStatus status) {
  switch (status) {
  case SessionStatus::Starting:
    return "starting";
  case SessionStatus::Ready:
    return "ready";
  case SessionStatus::Error:
    return "error";
  case SessionStatus::Stopped:
    return "stopped";
  }
  return "stopped";
}

std::int64_t to_millis(Clock::time_point time) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             time.time_since_epoch())
      .count();
}
