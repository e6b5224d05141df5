#pragma once

#include "core/access_policy.hpp"
#include "core/change_debouncer.hpp"
#include "core/exclude_rules.hpp"
#include "core/file_watcher.hpp"
#include "core/project.hpp"
#include "core/rebuild_scheduler.hpp"
#include "server/broadcast_hub.hpp"
#include "server/project_server.hpp"
#include "utils/config.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

// Owns every registered project together with its watcher, server,
// debouncer lane, scheduler lane and channels. Components are only ever
// created and destroyed here.
class PreviewRegistry {
public:
  PreviewRegistry(const PreviewConfig &config, const AccessPolicy &policy);
  ~PreviewRegistry();

  PreviewRegistry(const PreviewRegistry &) = delete;
  PreviewRegistry &operator=(const PreviewRegistry &) = delete;

  // Registering an id twice returns the live session and applies the new
  // proxy rules and compile step. Throws ConfigurationError or
  // ResourceExhaustion, leaving nothing behind.
  PreviewSession register_project(Project project);

  // False when the id is unknown or already being removed.
  bool unregister_project(const std::string &project_id);

  std::optional<PreviewSession> get(const std::string &project_id) const;
  std::vector<PreviewSession> list() const;
  std::optional<Project> project(const std::string &project_id) const;

  // Manual rebuild. Throws NotFoundError for an unknown id.
  void rebuild(const std::string &project_id);

  void shutdown();

  // Fills in defaults (id, name, entry document, working directory) and
  // canonicalizes the root. Throws ConfigurationError. Opens nothing.
  static Project validate(Project project, const AccessPolicy &policy);

  BroadcastHub &hub() { return hub_; }

  // ws:// URL the live-reload script of servers started from now on
  // connects to.
  void set_livereload_endpoint(const std::string &url);

private:
  struct Entry {
    // Held for the whole of start and teardown.
    std::mutex lifecycle;
    bool live = false;
    bool removed = false;

    Project project;
    std::unique_ptr<ProjectServer> server;
    std::unique_ptr<FileWatcher> watcher;

    mutable std::mutex state_mutex;
    PreviewSession session;
  };

  void start_entry(Entry &entry);
  void teardown_entry(Entry &entry);
  void refresh_entry(Entry &entry, const Project &update);
  std::unique_ptr<FileWatcher> make_watcher(const std::string &project_id);

  std::shared_ptr<Entry> find_live(const std::string &project_id) const;
  void erase_entry(const std::string &project_id,
                   const std::shared_ptr<Entry> &entry);
  static PreviewSession snapshot(const Entry &entry);

  void on_change(const ChangeEvent &event);
  void on_watch_error(const std::string &project_id, const std::string &message);
  void on_rebuild_started(const RebuildJob &job);
  void on_rebuild_finished(const RebuildOutcome &outcome);

  const PreviewConfig &config_;
  const AccessPolicy &policy_;
  ExcludeRules exclude_rules_;

  BroadcastHub hub_;
  RebuildScheduler scheduler_;
  ChangeDebouncer debouncer_;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<Entry>> entries_;
  std::string livereload_url_;
};
