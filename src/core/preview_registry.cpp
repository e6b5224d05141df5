#include "preview_registry.hpp"
#include "core/errors.hpp"
#include "server/proxy_client.hpp"
#include "utils/log.hpp"
#include <algorithm>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

PreviewRegistry::PreviewRegistry(const PreviewConfig &config,
                                 const AccessPolicy &policy)
    : config_(config), policy_(policy), exclude_rules_(config.exclude),
      hub_({config.mailbox_capacity, config.max_channels}),
      scheduler_(
          {config.compile_timeout, config.max_error_bytes},
          [this](const RebuildJob &job) { on_rebuild_started(job); },
          [this](const RebuildOutcome &outcome) {
            on_rebuild_finished(outcome);
          }),
      debouncer_(config.debounce_window,
                 [this](const std::string &project_id,
                        std::vector<ChangeEvent> batch) {
                   scheduler_.trigger(project_id, std::move(batch),
                                      RebuildCause::FileChange);
                 }) {}

PreviewRegistry::~PreviewRegistry() { shutdown(); }

void PreviewRegistry::set_livereload_endpoint(const std::string &url) {
  std::lock_guard<std::mutex> lock(mutex_);
  livereload_url_ = url;
}

Project PreviewRegistry::validate(Project project, const AccessPolicy &policy) {
  if (project.id.empty()) {
    project.id = boost::uuids::to_string(boost::uuids::random_generator()());
  }

  if (project.root.empty()) {
    throw ConfigurationError("Project " + project.id + " has no root path");
  }
  if (project.root.is_relative()) {
    throw ConfigurationError("Project root must be absolute: " +
                             project.root.string());
  }

  std::error_code ec;
  if (!fs::is_directory(project.root, ec)) {
    throw ConfigurationError("Project root not found: " +
                             project.root.string());
  }
  fs::path root = fs::canonical(project.root, ec);
  if (ec) {
    throw ConfigurationError("Project root not accessible: " +
                             project.root.string() + " (" + ec.message() + ")");
  }
  project.root = root;

  if (!policy.can_access(project.root, AccessOperation::Watch)) {
    throw ConfigurationError("Access denied to " + project.root.string());
  }

  if (project.name.empty()) {
    project.name = project.root.filename().string();
  }
  if (project.entry_document.empty()) {
    project.entry_document = "index.html";
  }

  for (const auto &rule : project.proxy_rules) {
    if (rule.prefix.empty() || rule.prefix.front() != '/') {
      throw ConfigurationError("Proxy prefix must start with '/': " +
                               rule.prefix);
    }
    if (!ProxyTarget::parse(rule.target)) {
      throw ConfigurationError("Unsupported proxy target: " + rule.target);
    }
  }

  if (project.compile_step) {
    if (project.compile_step->command.empty()) {
      throw ConfigurationError("Compile step of " + project.id +
                               " has no command");
    }
    if (project.compile_step->working_dir.empty()) {
      project.compile_step->working_dir = project.root;
    }
  }

  project.registered_at = Clock::now();
  return project;
}

PreviewSession PreviewRegistry::register_project(Project project) {
  project = validate(std::move(project), policy_);

  while (true) {
    std::shared_ptr<Entry> entry;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      auto &slot = entries_[project.id];
      if (!slot) {
        slot = std::make_shared<Entry>();
      }
      entry = slot;
    }

    std::lock_guard<std::mutex> lifecycle(entry->lifecycle);
    if (entry->removed) {
      // Lost against an unregister that already dropped it from the map.
      continue;
    }

    if (entry->live) {
      refresh_entry(*entry, project);
      return snapshot(*entry);
    }

    entry->project = project;
    try {
      start_entry(*entry);
    } catch (...) {
      entry->removed = true;
      erase_entry(project.id, entry);
      throw;
    }

    PreviewSession session = snapshot(*entry);
    hub_.publish_global(ProjectAdded{ProjectSummary::from_session(session)});
    log_ok("Registered " + project.name + " (" + project.id + ") at " +
           session.base_url);
    return session;
  }
}

std::unique_ptr<FileWatcher>
PreviewRegistry::make_watcher(const std::string &project_id) {
  FileWatcher::Options options;
  options.settle_window = config_.settle_window;

  return std::make_unique<FileWatcher>(
      project_id, policy_, options,
      [this](const ChangeEvent &event) { on_change(event); },
      [this, project_id](const std::string &message) {
        on_watch_error(project_id, message);
      });
}

void PreviewRegistry::start_entry(Entry &entry) {
  const Project &project = entry.project;

  {
    std::lock_guard<std::mutex> lock(entry.state_mutex);
    entry.session = PreviewSession{};
    entry.session.project_id = project.id;
    entry.session.project_name = project.name;
    entry.session.status = SessionStatus::Starting;
    entry.session.started_at = Clock::now();
  }

  ProjectServer::Options options;
  options.host = config_.host;
  options.proxy_timeout = config_.proxy_timeout;
  options.inject_livereload = config_.inject_livereload;
  options.quiet = config_.quiet;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    options.livereload_url = livereload_url_;
  }

  entry.server = std::make_unique<ProjectServer>(policy_, options);
  ProjectServer::Binding binding;
  try {
    binding = entry.server->start(project);
    scheduler_.add_project(project.id, project.compile_step);
    hub_.open_project(project.id);
  } catch (...) {
    scheduler_.remove_project(project.id);
    entry.server->stop();
    entry.server.reset();
    hub_.close_project(project.id);
    throw;
  }

  {
    std::lock_guard<std::mutex> lock(entry.state_mutex);
    entry.session.port = binding.port;
    entry.session.base_url = binding.base_url;
  }

  // A failed watch leaves the session serving in error status; registering
  // the same id again retries it.
  entry.watcher = make_watcher(project.id);
  try {
    entry.watcher->watch(project.root, exclude_rules_);
  } catch (const WatchError &e) {
    entry.watcher.reset();
    std::lock_guard<std::mutex> lock(entry.state_mutex);
    entry.session.status = SessionStatus::Error;
    entry.session.last_error = e.what();
    entry.live = true;
    log_warn("Watching " + project.root.string() + " failed: " + e.what());
    return;
  }

  std::lock_guard<std::mutex> lock(entry.state_mutex);
  entry.session.status = SessionStatus::Ready;
  entry.live = true;
}

void PreviewRegistry::refresh_entry(Entry &entry, const Project &update) {
  entry.project.proxy_rules = update.proxy_rules;
  entry.project.compile_step = update.compile_step;
  entry.server->update_proxy_rules(update.proxy_rules);
  scheduler_.set_compile_step(entry.project.id, update.compile_step);

  SessionStatus status;
  {
    std::lock_guard<std::mutex> lock(entry.state_mutex);
    status = entry.session.status;
  }
  if (status != SessionStatus::Error) {
    return;
  }

  if (entry.watcher) {
    entry.watcher->unwatch();
    entry.watcher.reset();
  }
  debouncer_.discard(entry.project.id);

  auto watcher = make_watcher(entry.project.id);
  try {
    watcher->watch(entry.project.root, exclude_rules_);
  } catch (const WatchError &e) {
    std::lock_guard<std::mutex> lock(entry.state_mutex);
    entry.session.last_error = e.what();
    log_warn("Watcher of " + entry.project.id + " still failing: " + e.what());
    return;
  }
  entry.watcher = std::move(watcher);

  std::lock_guard<std::mutex> lock(entry.state_mutex);
  entry.session.status = SessionStatus::Ready;
  entry.session.last_error.reset();
  log_ok("Watcher of " + entry.project.id + " restarted");
}

bool PreviewRegistry::unregister_project(const std::string &project_id) {
  std::shared_ptr<Entry> entry;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(project_id);
    if (it == entries_.end()) {
      return false;
    }
    entry = it->second;
  }

  {
    std::lock_guard<std::mutex> lifecycle(entry->lifecycle);
    if (entry->removed || !entry->live) {
      return false;
    }
    teardown_entry(*entry);
    entry->removed = true;
    erase_entry(project_id, entry);
  }

  hub_.publish_global(ProjectRemoved{project_id});
  log_event(termcolor::bright_yellow, "🗑  Removed", project_id);
  return true;
}

void PreviewRegistry::teardown_entry(Entry &entry) {
  const std::string &id = entry.project.id;

  if (entry.watcher) {
    entry.watcher->unwatch();
    entry.watcher.reset();
  }
  debouncer_.discard(id);
  scheduler_.remove_project(id);
  if (entry.server) {
    entry.server->stop();
    entry.server.reset();
  }
  hub_.close_project(id);

  std::lock_guard<std::mutex> lock(entry.state_mutex);
  entry.session.status = SessionStatus::Stopped;
  entry.live = false;
}

void PreviewRegistry::erase_entry(const std::string &project_id,
                                  const std::shared_ptr<Entry> &entry) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(project_id);
  if (it != entries_.end() && it->second == entry) {
    entries_.erase(it);
  }
}

void PreviewRegistry::shutdown() {
  std::vector<std::string> ids;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto &[id, entry] : entries_) {
      ids.push_back(id);
    }
  }
  for (const auto &id : ids) {
    unregister_project(id);
  }
}

std::shared_ptr<PreviewRegistry::Entry>
PreviewRegistry::find_live(const std::string &project_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(project_id);
  if (it == entries_.end()) {
    return nullptr;
  }
  std::lock_guard<std::mutex> state(it->second->state_mutex);
  if (!it->second->live) {
    return nullptr;
  }
  return it->second;
}

PreviewSession PreviewRegistry::snapshot(const Entry &entry) {
  std::lock_guard<std::mutex> lock(entry.state_mutex);
  return entry.session;
}

std::optional<PreviewSession>
PreviewRegistry::get(const std::string &project_id) const {
  auto entry = find_live(project_id);
  if (!entry) {
    return std::nullopt;
  }
  return snapshot(*entry);
}

std::vector<PreviewSession> PreviewRegistry::list() const {
  std::vector<std::shared_ptr<Entry>> entries;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto &[id, entry] : entries_) {
      entries.push_back(entry);
    }
  }

  std::vector<PreviewSession> sessions;
  for (const auto &entry : entries) {
    std::lock_guard<std::mutex> lock(entry->state_mutex);
    if (entry->live) {
      sessions.push_back(entry->session);
    }
  }
  std::sort(sessions.begin(), sessions.end(),
            [](const PreviewSession &a, const PreviewSession &b) {
              return a.started_at < b.started_at;
            });
  return sessions;
}

std::optional<Project>
PreviewRegistry::project(const std::string &project_id) const {
  auto entry = find_live(project_id);
  if (!entry) {
    return std::nullopt;
  }
  std::lock_guard<std::mutex> lifecycle(entry->lifecycle);
  return entry->project;
}

void PreviewRegistry::rebuild(const std::string &project_id) {
  if (!find_live(project_id) ||
      !scheduler_.trigger(project_id, {}, RebuildCause::Manual)) {
    throw NotFoundError("Unknown project: " + project_id);
  }
  log_event(termcolor::bright_cyan, "🔨 Rebuild", project_id + " (manual)");
}

void PreviewRegistry::on_change(const ChangeEvent &event) {
  hub_.publish(event.project_id,
               FileChanged{event.project_id, event.relative_path, event.kind});
  debouncer_.on_event(event);

  if (!config_.quiet) {
    log_event(termcolor::bright_magenta, "📝 Changed",
              "[" + event.project_id + "] " + event.relative_path + " (" +
                  to_string(event.kind) + ")");
  }
}

void PreviewRegistry::on_watch_error(const std::string &project_id,
                                     const std::string &message) {
  auto entry = find_live(project_id);
  if (entry) {
    std::lock_guard<std::mutex> lock(entry->state_mutex);
    entry->session.status = SessionStatus::Error;
    entry->session.last_error = message;
  }

  log_error("Watcher of " + project_id + " failed: " + message);
  hub_.publish(project_id, WatcherFailed{project_id, message});
}

void PreviewRegistry::on_rebuild_started(const RebuildJob &job) {
  hub_.publish(job.project_id,
               RebuildStarted{job.project_id, job.cause, job.events.size()});
}

void PreviewRegistry::on_rebuild_finished(const RebuildOutcome &outcome) {
  const RebuildJob &job = outcome.job;

  auto entry = find_live(outcome.project_id);
  if (entry) {
    std::lock_guard<std::mutex> lock(entry->state_mutex);
    entry->session.rebuild_count++;
    entry->session.last_rebuild = job.status;
  }

  if (job.status == JobStatus::Succeeded) {
    std::vector<std::string> files = job.affected_paths();
    std::size_t sent = hub_.publish(
        outcome.project_id,
        RebuildComplete{outcome.project_id, job.cause, outcome.duration, files});
    log_event(termcolor::bright_magenta, "📡 Rebuilt",
              outcome.project_id + " in " +
                  std::to_string(outcome.duration.count()) + "ms, " +
                  std::to_string(sent) + (sent == 1 ? " client" : " clients"));
    return;
  }

  std::string message = job.error.value_or("Rebuild failed");
  hub_.publish(outcome.project_id,
               RebuildFailed{outcome.project_id, message, job.timed_out,
                             outcome.duration});
  log_error("Rebuild of " + outcome.project_id + " failed: " + message);
}
