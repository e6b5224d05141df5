#include "change_debouncer.hpp"
#include "utils/log.hpp"
#include <boost/asio/post.hpp>
#include <future>

ChangeDebouncer::ChangeDebouncer(std::chrono::milliseconds window,
                                 TriggerCallback on_trigger)
    : window_(window), on_trigger_(std::move(on_trigger)),
      work_(net::make_work_guard(ioc_)) {
  thread_ = std::thread([this]() {
    try {
      ioc_.run();
    } catch (const std::exception &e) {
      log_error(std::string("Debouncer stopped: ") + e.what());
    }
  });
}

ChangeDebouncer::~ChangeDebouncer() {
  work_.reset();
  ioc_.stop();
  if (thread_.joinable()) {
    thread_.join();
  }
}

void ChangeDebouncer::on_event(const ChangeEvent &event) {
  net::post(ioc_, [this, event]() {
    auto &lane = lanes_[event.project_id];
    if (!lane) {
      lane = std::make_unique<Lane>(ioc_);
    }

    lane->batch.push_back(event);

    // Re-arming cancels the previous wait, the generation catches a wait
    // that had already completed before the cancel.
    auto generation = ++lane->generation;
    lane->timer.expires_after(window_);
    lane->timer.async_wait(
        [this, project_id = event.project_id,
         generation](const boost::system::error_code &ec) {
          if (ec == net::error::operation_aborted) {
            return;
          }
          fire(project_id, generation);
        });
  });
}

void ChangeDebouncer::fire(const std::string &project_id,
                           std::uint64_t generation) {
  auto it = lanes_.find(project_id);
  if (it == lanes_.end() || it->second->generation != generation ||
      it->second->batch.empty()) {
    return;
  }

  std::vector<ChangeEvent> batch = std::move(it->second->batch);
  it->second->batch.clear();

  try {
    on_trigger_(project_id, std::move(batch));
  } catch (const std::exception &e) {
    log_error("Rebuild trigger failed for " + project_id + ": " + e.what());
  }
}

void ChangeDebouncer::discard(const std::string &project_id) {
  auto drop = [this, project_id]() {
    auto it = lanes_.find(project_id);
    if (it != lanes_.end()) {
      it->second->timer.cancel();
      lanes_.erase(it);
    }
  };

  if (ioc_.get_executor().running_in_this_thread()) {
    drop();
    return;
  }

  auto done = std::make_shared<std::promise<void>>();
  auto finished = done->get_future();
  net::post(ioc_, [drop, done]() {
    drop();
    done->set_value();
  });
  finished.wait();
}
