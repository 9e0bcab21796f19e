#ifndef MCPWS_EVENT_LOOP_HPP_
#define MCPWS_EVENT_LOOP_HPP_

#include <poll.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace mcpws {

/**
 * @brief Single-threaded poll() reactor with timers.
 *
 * Socket I/O, timers and every callback run on the thread that calls run().
 * post() is the only member that may be called from other threads; it is
 * how work finished elsewhere gets marshaled back onto the loop.
 */
class EventLoop {
 public:
  using Clock = std::chrono::steady_clock;
  using TimePoint = Clock::time_point;
  using TimerId = uint64_t;
  using Task = std::function<void()>;
  using InterestFn = std::function<short()>;
  using ReadyFn = std::function<void(short revents)>;

  static constexpr TimerId kInvalidTimer = 0;

  EventLoop();
  ~EventLoop();

  EventLoop(const EventLoop&) = delete;
  EventLoop& operator=(const EventLoop&) = delete;

  // --- Timers ---

  TimerId call_later(std::chrono::milliseconds delay, Task task);
  TimerId call_every(std::chrono::milliseconds interval, Task task);

  // Returns false if the timer already fired or was cancelled.
  bool cancel(TimerId id);
  size_t pending_timers() const { return timers_.size(); }

  // --- Cross-thread hand-off ---

  void post(Task task);

  // --- File descriptors ---

  // interest is evaluated before every poll; returning 0 skips the fd.
  void watch(int fd, InterestFn interest, ReadyFn on_ready);
  void unwatch(int fd);

  // --- Running ---

  void run();

  // One poll iteration waiting at most max_wait. Returns callbacks run.
  size_t run_once(std::chrono::milliseconds max_wait);

  // Runs until pred() holds or timeout elapses. Returns pred().
  bool run_until(const std::function<bool()>& pred, std::chrono::milliseconds timeout);
  void run_for(std::chrono::milliseconds duration);

  // Thread-safe.
  void stop();
  bool is_running() const { return running_.load(); }

  TimePoint now() const { return Clock::now(); }

  void set_max_poll_wait(std::chrono::milliseconds wait) { max_poll_wait_ = wait; }

 private:
  struct Timer {
    TimerId id;
    std::chrono::milliseconds interval;  // zero for one-shot
    Task task;
  };

  struct Watch {
    InterestFn interest;
    ReadyFn on_ready;
  };

  TimerId schedule(TimePoint when, std::chrono::milliseconds interval, Task task);
  size_t run_expired_timers();
  size_t run_posted();
  void drain_wakeup();
  void wake();

  int wakeup_fd_ = -1;
  std::atomic<bool> running_{false};
  std::atomic<bool> stop_requested_{false};
  std::chrono::milliseconds max_poll_wait_{1000};

  // Ordered by deadline; equal deadlines keep scheduling order.
  std::multimap<TimePoint, Timer> timers_;
  std::unordered_map<TimerId, std::multimap<TimePoint, Timer>::iterator> timer_index_;
  TimerId next_timer_id_ = 1;

  std::map<int, Watch> watches_;
  std::vector<pollfd> poll_fds_;

  std::mutex posted_mutex_;
  std::vector<Task> posted_;
};

}  // namespace mcpws

#endif  // MCPWS_EVENT_LOOP_HPP_
