#pragma once

#include "core/project.hpp"
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace net = boost::asio;

// Sliding debounce per project: every event pushes the project's deadline
// back by the window. All timers run on one io_context thread.
class ChangeDebouncer {
public:
  using TriggerCallback = std::function<void(const std::string &project_id,
                                             std::vector<ChangeEvent> batch)>;

  ChangeDebouncer(std::chrono::milliseconds window, TriggerCallback on_trigger);
  ~ChangeDebouncer();

  ChangeDebouncer(const ChangeDebouncer &) = delete;
  ChangeDebouncer &operator=(const ChangeDebouncer &) = delete;

  void on_event(const ChangeEvent &event);

  // Drops the pending batch of a project without firing. No trigger for the
  // project is running once this returns.
  void discard(const std::string &project_id);

  std::chrono::milliseconds window() const { return window_; }

private:
  struct Lane {
    explicit Lane(net::io_context &ioc) : timer(ioc) {}

    net::steady_timer timer;
    std::vector<ChangeEvent> batch;
    std::uint64_t generation = 0;
  };

  void fire(const std::string &project_id, std::uint64_t generation);

  std::chrono::milliseconds window_;
  TriggerCallback on_trigger_;

  net::io_context ioc_;
  net::executor_work_guard<net::io_context::executor_type> work_;
  // Only touched on the io thread.
  std::unordered_map<std::string, std::unique_ptr<Lane>> lanes_;
  std::thread thread_;
};
