#pragma once

#include "core/project.hpp"
#include "server/messages.hpp"
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

// A live push connection scoped to one project, or to the catalogue when
// project_id is unset. The mailbox is bounded and drops its oldest message
// when full, so a stalled client never blocks a publisher.
class Channel {
public:
  using Notifier = std::function<void()>;

  Channel(std::string id, std::optional<std::string> project_id,
          std::size_t capacity);

  const std::string &id() const { return id_; }
  const std::optional<std::string> &project_id() const { return project_id_; }
  Clock::time_point opened_at() const { return opened_at_; }

  // False when the channel is closed or an older message had to go.
  bool push(std::string message);
  std::optional<std::string> pop();
  std::vector<std::string> drain();

  void close();
  bool closed() const;

  std::size_t size() const;
  std::size_t dropped() const { return dropped_.load(); }

  // Called after every push and on close, never under the mailbox lock.
  void set_notifier(Notifier notifier);

private:
  void notify();

  std::string id_;
  std::optional<std::string> project_id_;
  Clock::time_point opened_at_;
  std::size_t capacity_;

  mutable std::mutex mutex_;
  std::deque<std::string> mailbox_;
  bool closed_ = false;
  Notifier notifier_;
  std::atomic<std::size_t> dropped_{0};
};

class BroadcastHub {
public:
  struct Options {
    std::size_t mailbox_capacity = 64;
    std::size_t max_channels = 50;
  };

  explicit BroadcastHub(Options options);

  // Throws NotFoundError for a project that is not open and
  // ResourceExhaustion when the channel limit is reached.
  std::shared_ptr<Channel> subscribe(const std::string &channel_id,
                                     const std::optional<std::string> &project_id);
  void unsubscribe(const std::shared_ptr<Channel> &channel);

  // Returns the number of channels the message was queued on.
  std::size_t publish(const std::string &project_id, const Message &message);
  std::size_t publish_global(const Message &message);

  void open_project(const std::string &project_id);
  // Sends project-removed to the project's channels, then closes them.
  void close_project(const std::string &project_id);
  bool project_open(const std::string &project_id) const;

  std::size_t channel_count() const;
  std::size_t channel_count(const std::string &project_id) const;

  std::string next_channel_id();

private:
  Options options_;
  std::atomic<std::uint64_t> next_id_{1};

  mutable std::mutex mutex_;
  std::unordered_set<std::string> projects_;
  std::unordered_map<std::string, std::shared_ptr<Channel>> channels_;
};
