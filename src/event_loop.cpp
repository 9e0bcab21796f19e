#include "mcpws/event_loop.hpp"

#include "mcpws/log.hpp"
#include "mcpws/vocabulary.hpp"

#include <cerrno>
#include <cstring>

#include <algorithm>
#include <stdexcept>
#include <string>

#include <sys/eventfd.h>
#include <unistd.h>

namespace mcpws {

EventLoop::EventLoop() {
  wakeup_fd_ = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
  if (wakeup_fd_ < 0) {
    MCPWS_THROW(std::runtime_error(std::string("eventfd failed: ") + std::strerror(errno)));
  }
}

EventLoop::~EventLoop() {
  if (wakeup_fd_ >= 0) {
    ::close(wakeup_fd_);
  }
}

// ============================================================================
// Timers
// ============================================================================

EventLoop::TimerId EventLoop::schedule(TimePoint when, std::chrono::milliseconds interval, Task task) {
  TimerId id = next_timer_id_++;
  auto it = timers_.emplace(when, Timer{id, interval, std::move(task)});
  timer_index_[id] = it;
  return id;
}

EventLoop::TimerId EventLoop::call_later(std::chrono::milliseconds delay, Task task) {
  if (delay.count() < 0) delay = std::chrono::milliseconds(0);
  return schedule(Clock::now() + delay, std::chrono::milliseconds(0), std::move(task));
}

EventLoop::TimerId EventLoop::call_every(std::chrono::milliseconds interval, Task task) {
  if (interval.count() <= 0) interval = std::chrono::milliseconds(1);
  return schedule(Clock::now() + interval, interval, std::move(task));
}

bool EventLoop::cancel(TimerId id) {
  auto it = timer_index_.find(id);
  if (it == timer_index_.end()) {
    return false;
  }
  timers_.erase(it->second);
  timer_index_.erase(it);
  return true;
}

size_t EventLoop::run_expired_timers() {
  size_t ran = 0;
  TimePoint now = Clock::now();
  while (!timers_.empty() && timers_.begin()->first <= now) {
    auto it = timers_.begin();
    Timer timer = std::move(it->second);
    timers_.erase(it);
    timer_index_.erase(timer.id);

    Task task;
    if (timer.interval.count() > 0) {
      task = timer.task;
      auto again = timers_.emplace(now + timer.interval, std::move(timer));
      timer_index_[again->second.id] = again;
    } else {
      task = std::move(timer.task);
    }
    task();
    ++ran;
  }
  return ran;
}

// ============================================================================
// Posted tasks
// ============================================================================

void EventLoop::post(Task task) {
  {
    std::lock_guard<std::mutex> lock(posted_mutex_);
    posted_.push_back(std::move(task));
  }
  wake();
}

void EventLoop::wake() {
  uint64_t one = 1;
  if (::write(wakeup_fd_, &one, sizeof(one)) < 0 && errno != EAGAIN) {
    MCPWS_LOG_ERROR("Loop", "wakeup write failed: " << std::strerror(errno));
  }
}

void EventLoop::drain_wakeup() {
  uint64_t value = 0;
  while (::read(wakeup_fd_, &value, sizeof(value)) > 0) {
  }
}

size_t EventLoop::run_posted() {
  std::vector<Task> batch;
  {
    std::lock_guard<std::mutex> lock(posted_mutex_);
    batch.swap(posted_);
  }
  for (auto& task : batch) {
    task();
  }
  return batch.size();
}

// ============================================================================
// File descriptors
// ============================================================================

void EventLoop::watch(int fd, InterestFn interest, ReadyFn on_ready) {
  watches_[fd] = Watch{std::move(interest), std::move(on_ready)};
}

void EventLoop::unwatch(int fd) { watches_.erase(fd); }

// ============================================================================
// Running
// ============================================================================

size_t EventLoop::run_once(std::chrono::milliseconds max_wait) {
  using std::chrono::milliseconds;

  milliseconds wait = max_wait;
  if (!timers_.empty()) {
    auto until = std::chrono::ceil<milliseconds>(timers_.begin()->first - Clock::now());
    if (until < wait) wait = until;
  }
  {
    std::lock_guard<std::mutex> lock(posted_mutex_);
    if (!posted_.empty()) wait = milliseconds(0);
  }
  if (wait.count() < 0) wait = milliseconds(0);

  poll_fds_.clear();
  poll_fds_.push_back({wakeup_fd_, POLLIN, 0});
  for (auto& entry : watches_) {
    short events = entry.second.interest ? entry.second.interest() : static_cast<short>(POLLIN);
    if (events != 0) {
      poll_fds_.push_back({entry.first, events, 0});
    }
  }

  int ret = ::poll(poll_fds_.data(), static_cast<nfds_t>(poll_fds_.size()), static_cast<int>(wait.count()));
  if (ret < 0 && errno != EINTR) {
    MCPWS_LOG_ERROR("Loop", "poll failed: " << std::strerror(errno));
  }

  size_t ran = 0;
  if (ret > 0) {
    if (poll_fds_[0].revents != 0) {
      drain_wakeup();
    }
    for (size_t i = 1; i < poll_fds_.size(); ++i) {
      if (poll_fds_[i].revents == 0) continue;
      auto it = watches_.find(poll_fds_[i].fd);
      if (it == watches_.end()) continue;
      // The handler may unwatch its own fd.
      ReadyFn on_ready = it->second.on_ready;
      on_ready(poll_fds_[i].revents);
      ++ran;
    }
  }

  ran += run_expired_timers();
  ran += run_posted();
  return ran;
}

void EventLoop::run() {
  running_ = true;
  while (!stop_requested_.load()) {
    run_once(max_poll_wait_);
  }
  running_ = false;
  stop_requested_ = false;
}

bool EventLoop::run_until(const std::function<bool()>& pred, std::chrono::milliseconds timeout) {
  TimePoint deadline = Clock::now() + timeout;
  while (!pred()) {
    TimePoint now = Clock::now();
    if (now >= deadline) break;
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    run_once(std::min(left + std::chrono::milliseconds(1), std::chrono::milliseconds(10)));
  }
  return pred();
}

void EventLoop::run_for(std::chrono::milliseconds duration) {
  run_until([] { return false; }, duration);
}

void EventLoop::stop() {
  stop_requested_ = true;
  wake();
}

}  // namespace mcpws
