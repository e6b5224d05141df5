#pragma once

#include "core/access_policy.hpp"
#include "core/exclude_rules.hpp"
#include "core/project.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <efsw/efsw.hpp>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

// Recursive watch over one project root. Raw notifications are held for a
// settle window so a burst of writes to one file yields a single event.
class FileWatcher : public efsw::FileWatchListener {
public:
  using ChangeCallback = std::function<void(const ChangeEvent &)>;
  using ErrorCallback = std::function<void(const std::string &)>;

  struct Options {
    std::chrono::milliseconds settle_window{100};
    std::chrono::milliseconds health_interval{250};
  };

  FileWatcher(std::string project_id, const AccessPolicy &policy,
              Options options, ChangeCallback on_change,
              ErrorCallback on_error);
  ~FileWatcher() override;

  FileWatcher(const FileWatcher &) = delete;
  FileWatcher &operator=(const FileWatcher &) = delete;

  // Throws WatchError when the root is denied or the OS watch fails.
  void watch(const std::filesystem::path &root, ExcludeRules rules);
  void unwatch();

  bool watching() const { return running_.load(); }
  bool failed() const { return failed_.load(); }

  // Feeds one notification, relative to the root, into the settle window.
  void record(const std::string &relative_path, ChangeKind kind);

  void handleFileAction(efsw::WatchID watchid, const std::string &dir,
                        const std::string &filename, efsw::Action action,
                        std::string oldFilename = "") override;

private:
  struct Pending {
    std::string path;
    ChangeKind kind;
    bool dropped;
    std::chrono::steady_clock::time_point last_seen;
    Clock::time_point observed_at;
  };

  static void merge(Pending &pending, ChangeKind next);

  void settle_loop();
  bool root_accessible() const;
  std::string relative_to_root(const std::filesystem::path &absolute) const;

  std::string project_id_;
  const AccessPolicy &policy_;
  Options options_;
  ChangeCallback on_change_;
  ErrorCallback on_error_;

  std::filesystem::path root_;
  ExcludeRules rules_;

  std::mutex mutex_;
  std::condition_variable cv_;
  std::vector<Pending> pending_;
  std::atomic<bool> running_{false};
  std::atomic<bool> failed_{false};
  std::thread settle_thread_;

  std::unique_ptr<efsw::FileWatcher> efsw_;
  efsw::WatchID watch_id_ = 0;
};
