#include "file_watcher.hpp"
#include "core/errors.hpp"
#include "utils/log.hpp"
#include <algorithm>
#include <unistd.h>

namespace fs = std::filesystem;

FileWatcher::FileWatcher(std::string project_id, const AccessPolicy &policy,
                         Options options, ChangeCallback on_change,
                         ErrorCallback on_error)
    : project_id_(std::move(project_id)), policy_(policy), options_(options),
      on_change_(std::move(on_change)), on_error_(std::move(on_error)) {}

FileWatcher::~FileWatcher() { unwatch(); }

void FileWatcher::watch(const fs::path &root, ExcludeRules rules) {
  if (running_.load()) {
    return;
  }
  // A watcher that failed earlier still holds its exited thread.
  unwatch();

  std::error_code ec;
  fs::path canonical = fs::canonical(root, ec);
  if (ec || !fs::is_directory(canonical, ec)) {
    throw WatchError("Cannot watch " + root.string() + ": not a directory");
  }

  if (!policy_.can_access(canonical, AccessOperation::Watch)) {
    throw WatchError("Watching " + canonical.string() + " is not permitted");
  }

  root_ = canonical;
  rules_ = std::move(rules);
  failed_ = false;

  efsw_ = std::make_unique<efsw::FileWatcher>();
  watch_id_ = efsw_->addWatch(root_.string(), this, true);
  if (watch_id_ < 0) {
    std::string reason = efsw::Errors::Log::getLastErrorLog();
    efsw_.reset();
    throw WatchError("Cannot watch " + root_.string() + ": " + reason);
  }

  running_ = true;
  settle_thread_ = std::thread([this]() { settle_loop(); });
  efsw_->watch();
}

void FileWatcher::unwatch() {
  // Raw events arriving from here on are dropped by record().
  {
    std::lock_guard<std::mutex> lock(mutex_);
    running_ = false;
    pending_.clear();
  }
  cv_.notify_all();

  // The settle thread may remove the OS watch itself, so efsw_ outlives it.
  if (settle_thread_.joinable()) {
    settle_thread_.join();
  }

  if (efsw_) {
    efsw_->removeWatch(watch_id_);
    efsw_.reset();
  }
}

void FileWatcher::handleFileAction(efsw::WatchID watchid,
                                   const std::string &dir,
                                   const std::string &filename,
                                   efsw::Action action,
                                   std::string oldFilename) {
  (void)watchid;

  if (filename.empty()) {
    return;
  }

  std::string relative = relative_to_root(fs::path(dir) / filename);
  if (relative.empty()) {
    return;
  }

  switch (action) {
  case efsw::Actions::Add:
    record(relative, ChangeKind::Added);
    break;
  case efsw::Actions::Delete:
    record(relative, ChangeKind::Removed);
    break;
  case efsw::Actions::Modified:
    record(relative, ChangeKind::Modified);
    break;
  case efsw::Actions::Moved:
    if (!oldFilename.empty()) {
      std::string old_relative = relative_to_root(fs::path(dir) / oldFilename);
      if (!old_relative.empty()) {
        record(old_relative, ChangeKind::Removed);
      }
    }
    record(relative, ChangeKind::Added);
    break;
  }
}

void FileWatcher::record(const std::string &relative_path, ChangeKind kind) {
  if (rules_.excluded(relative_path)) {
    return;
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_.load() || failed_.load()) {
      return;
    }

    auto now = std::chrono::steady_clock::now();
    auto it = std::find_if(pending_.begin(), pending_.end(),
                           [&](const Pending &p) { return p.path == relative_path; });
    if (it != pending_.end()) {
      merge(*it, kind);
      it->last_seen = now;
    } else {
      pending_.push_back({relative_path, kind, false, now, Clock::now()});
    }
  }
  cv_.notify_all();
}

void FileWatcher::merge(Pending &pending, ChangeKind next) {
  if (pending.dropped) {
    // Created and deleted inside the window, then seen again.
    pending.dropped = next == ChangeKind::Removed;
    pending.kind = next == ChangeKind::Removed ? ChangeKind::Removed
                                               : ChangeKind::Added;
    return;
  }

  switch (pending.kind) {
  case ChangeKind::Added:
    if (next == ChangeKind::Removed) {
      pending.dropped = true;
      pending.kind = ChangeKind::Removed;
    }
    break;
  case ChangeKind::Removed:
    if (next != ChangeKind::Removed) {
      pending.kind = ChangeKind::Modified;
    }
    break;
  case ChangeKind::Modified:
    if (next == ChangeKind::Removed) {
      pending.kind = ChangeKind::Removed;
    }
    break;
  }
}

void FileWatcher::settle_loop() {
  auto next_health = std::chrono::steady_clock::now() + options_.health_interval;

  std::unique_lock<std::mutex> lock(mutex_);
  while (running_.load()) {
    auto now = std::chrono::steady_clock::now();

    std::vector<ChangeEvent> ready;
    for (auto it = pending_.begin(); it != pending_.end();) {
      if (now - it->last_seen >= options_.settle_window) {
        if (!it->dropped) {
          ready.push_back({project_id_, it->path, it->kind, it->observed_at});
        }
        it = pending_.erase(it);
      } else {
        ++it;
      }
    }

    bool check_health = now >= next_health;

    if (!ready.empty() || check_health) {
      lock.unlock();

      for (const auto &event : ready) {
        try {
          on_change_(event);
        } catch (const std::exception &e) {
          log_error("Change handler failed for " + event.relative_path + ": " +
                    e.what());
        }
      }

      bool healthy = !check_health || root_accessible();

      lock.lock();
      if (check_health) {
        next_health = std::chrono::steady_clock::now() + options_.health_interval;
      }

      if (!healthy && running_.load()) {
        failed_ = true;
        running_ = false;
        pending_.clear();
        lock.unlock();

        // Not under mutex_: efsw may be delivering into record() right now.
        efsw_->removeWatch(watch_id_);
        on_error_("Project root " + root_.string() + " is no longer accessible");
        return;
      }
      continue;
    }

    auto deadline = next_health;
    for (const auto &pending : pending_) {
      deadline = std::min(deadline, pending.last_seen + options_.settle_window);
    }
    cv_.wait_until(lock, deadline);
  }
}

bool FileWatcher::root_accessible() const {
  std::error_code ec;
  if (!fs::is_directory(root_, ec) || ec) {
    return false;
  }
  return ::access(root_.c_str(), R_OK | X_OK) == 0;
}

std::string FileWatcher::relative_to_root(const fs::path &absolute) const {
  fs::path relative = absolute.lexically_normal().lexically_relative(root_);
  if (relative.empty() || relative == "." || *relative.begin() == "..") {
    return "";
  }
  return relative.generic_string();
}
