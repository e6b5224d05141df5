#include "broadcast_hub.hpp"
#include "core/errors.hpp"
#include "utils/log.hpp"

Channel::Channel(std::string id, std::optional<std::string> project_id,
                 std::size_t capacity)
    : id_(std::move(id)), project_id_(std::move(project_id)),
      opened_at_(Clock::now()), capacity_(capacity == 0 ? 1 : capacity) {}

bool Channel::push(std::string message) {
  bool kept_all = true;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
      return false;
    }
    if (mailbox_.size() >= capacity_) {
      mailbox_.pop_front();
      ++dropped_;
      kept_all = false;
    }
    mailbox_.push_back(std::move(message));
  }
  notify();
  return kept_all;
}

std::optional<std::string> Channel::pop() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (mailbox_.empty()) {
    return std::nullopt;
  }
  std::string message = std::move(mailbox_.front());
  mailbox_.pop_front();
  return message;
}

std::vector<std::string> Channel::drain() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> messages(std::make_move_iterator(mailbox_.begin()),
                                    std::make_move_iterator(mailbox_.end()));
  mailbox_.clear();
  return messages;
}

void Channel::close() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
      return;
    }
    closed_ = true;
  }
  notify();
}

bool Channel::closed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

std::size_t Channel::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return mailbox_.size();
}

void Channel::set_notifier(Notifier notifier) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    notifier_ = std::move(notifier);
  }
  notify();
}

void Channel::notify() {
  Notifier notifier;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    notifier = notifier_;
  }
  if (notifier) {
    notifier();
  }
}

BroadcastHub::BroadcastHub(Options options) : options_(options) {}

std::string BroadcastHub::next_channel_id() {
  return "ch-" + std::to_string(next_id_++);
}

std::shared_ptr<Channel>
BroadcastHub::subscribe(const std::string &channel_id,
                        const std::optional<std::string> &project_id) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (project_id && !projects_.count(*project_id)) {
    throw NotFoundError("Unknown project: " + *project_id);
  }
  if (channels_.size() >= options_.max_channels) {
    throw ResourceExhaustion("Channel limit of " +
                             std::to_string(options_.max_channels) + " reached");
  }
  if (channels_.count(channel_id)) {
    throw ConfigurationError("Channel id already in use: " + channel_id);
  }

  auto channel = std::make_shared<Channel>(channel_id, project_id,
                                           options_.mailbox_capacity);
  channels_[channel_id] = channel;
  return channel;
}

void BroadcastHub::unsubscribe(const std::shared_ptr<Channel> &channel) {
  if (!channel) {
    return;
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = channels_.find(channel->id());
    if (it != channels_.end() && it->second == channel) {
      channels_.erase(it);
    }
  }
  channel->close();
}

std::size_t BroadcastHub::publish(const std::string &project_id,
                                  const Message &message) {
  std::vector<std::shared_ptr<Channel>> targets;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto &[id, channel] : channels_) {
      if (channel->project_id() && *channel->project_id() == project_id) {
        targets.push_back(channel);
      }
    }
  }

  if (targets.empty()) {
    return 0;
  }

  std::string payload = serialize(message);
  std::size_t queued = 0;
  for (const auto &channel : targets) {
    if (!channel->closed()) {
      channel->push(payload);
      queued++;
    }
  }
  return queued;
}

std::size_t BroadcastHub::publish_global(const Message &message) {
  if (!is_catalogue_message(message)) {
    log_warn(std::string("Refusing to send ") + message_type(message) +
             " to catalogue channels");
    return 0;
  }

  std::vector<std::shared_ptr<Channel>> targets;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto &[id, channel] : channels_) {
      if (!channel->project_id()) {
        targets.push_back(channel);
      }
    }
  }

  std::string payload = serialize(message);
  std::size_t queued = 0;
  for (const auto &channel : targets) {
    if (!channel->closed()) {
      channel->push(payload);
      queued++;
    }
  }
  return queued;
}

void BroadcastHub::open_project(const std::string &project_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  projects_.insert(project_id);
}

void BroadcastHub::close_project(const std::string &project_id) {
  std::vector<std::shared_ptr<Channel>> bound;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    projects_.erase(project_id);
    for (auto it = channels_.begin(); it != channels_.end();) {
      if (it->second->project_id() && *it->second->project_id() == project_id) {
        bound.push_back(it->second);
        it = channels_.erase(it);
      } else {
        ++it;
      }
    }
  }

  if (bound.empty()) {
    return;
  }

  std::string farewell = serialize(ProjectRemoved{project_id});
  for (const auto &channel : bound) {
    channel->push(farewell);
    channel->close();
  }

  log_event(termcolor::bright_blue, "🔌 Channels",
            "Closed " + std::to_string(bound.size()) + " for " + project_id);
}

bool BroadcastHub::project_open(const std::string &project_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return projects_.count(project_id) > 0;
}

std::size_t BroadcastHub::channel_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return channels_.size();
}

std::size_t BroadcastHub::channel_count(const std::string &project_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::size_t count = 0;
  for (const auto &[id, channel] : channels_) {
    if (channel->project_id() && *channel->project_id() == project_id) {
      count++;
    }
  }
  return count;
}
