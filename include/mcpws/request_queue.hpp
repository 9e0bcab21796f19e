#ifndef MCPWS_REQUEST_QUEUE_HPP_
#define MCPWS_REQUEST_QUEUE_HPP_

#include "errors.hpp"
#include "event_loop.hpp"
#include "job.hpp"
#include "rate_limiter.hpp"
#include "vocabulary.hpp"

#include <json/json.h>

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>

namespace mcpws {

// ============================================================================
// Configuration
// ============================================================================

struct QueueConfig {
  uint32_t max_concurrent = 3;
  uint32_t max_queue_size = 100;
  std::chrono::milliseconds timeout{30000};
  uint32_t max_retries = 3;
  std::chrono::milliseconds retry_base_delay{1000};
  std::chrono::milliseconds max_retry_delay{30000};
  RateLimitConfig rate_limit;
};

namespace priority {
constexpr int kLow = 1;
constexpr int kNormal = 2;
constexpr int kHigh = 3;
}  // namespace priority

enum class EntryStatus : uint8_t { kQueued, kProcessing, kRetrying, kCompleted, kFailed, kCancelled };

const char* entry_status_name(EntryStatus status);

using ProgressFn = std::function<void(double progress, const std::string& message)>;

// The handler settles job, now or later. Throwing counts as a failure.
using QueueHandler = std::function<void(const Json::Value& params, const JobPtr& job, const ProgressFn& progress)>;

using QueueOutcome = expected<Json::Value, RpcError>;
using QueueCompletion = std::function<void(const QueueOutcome& outcome)>;

struct QueueRequest {
  std::string method;
  Json::Value params;
  QueueHandler handler;
  QueueCompletion on_complete;
  ProgressFn on_progress;
  int priority = priority::kNormal;
  std::optional<uint32_t> max_retries;
  std::optional<std::chrono::milliseconds> timeout;
  uint64_t owner = 0;  // connection id, 0 when not tied to one
};

struct QueueStats {
  uint64_t queued = 0;
  uint64_t processed = 0;
  uint64_t failed = 0;
  uint64_t cancelled = 0;
  uint64_t retried = 0;
  uint64_t timed_out = 0;
  uint64_t rate_limited = 0;
  uint64_t rejected = 0;
  uint32_t peak_processing = 0;
};

struct QueueStatus {
  size_t queued = 0;
  size_t processing = 0;
  size_t retrying = 0;
  bool rate_limited = false;
  QueueStats stats;
};

enum class QueueEventType : uint8_t { kQueued, kStarted, kProgress, kCompleted, kRetrying, kFailed, kCancelled, kCleared };

struct QueueEvent {
  QueueEventType type;
  uint64_t id = 0;  // 0 for kCleared
  std::string method;
  double progress = 0.0;
  std::string message;
};

// ============================================================================
// RequestQueue
// ============================================================================

/**
 * @brief Priority queue of handler invocations with bounded concurrency.
 *
 * Entries start in priority order (FIFO within a priority) while fewer
 * than max_concurrent are processing and the rate limiter admits them.
 * Each attempt gets a deadline; failures are retried with exponential
 * backoff at raised priority until max_retries is spent. Every accepted
 * entry's completion runs exactly once.
 */
class RequestQueue {
 public:
  RequestQueue(EventLoop& loop, const QueueConfig& config = QueueConfig());
  ~RequestQueue();

  RequestQueue(const RequestQueue&) = delete;
  RequestQueue& operator=(const RequestQueue&) = delete;

  // Returns nullopt when the queue is full or shut down.
  std::optional<uint64_t> enqueue(QueueRequest request);

  // Queued or retrying: removed now. Processing: result discarded.
  // Either way the completion receives a cancellation error.
  bool cancel(uint64_t id);

  // Cancels every live entry of owner. Returns how many.
  size_t cancel_owner(uint64_t owner);

  // Cancels every entry that is not processing.
  size_t clear();

  // Fails all work, stops timers, refuses further enqueues.
  void shutdown();

  std::optional<EntryStatus> status_of(uint64_t id) const;
  QueueStatus status() const;
  const QueueStats& stats() const { return stats_; }
  const QueueConfig& config() const { return config_; }
  size_t size() const { return ready_.size(); }
  size_t processing() const { return processing_; }

  std::function<void(const QueueEvent&)> on_event;

 private:
  struct Entry {
    uint64_t id = 0;
    uint64_t seq = 0;
    int priority = priority::kNormal;
    std::string method;
    Json::Value params;
    QueueHandler handler;
    QueueCompletion on_complete;
    ProgressFn on_progress;
    EntryStatus status = EntryStatus::kQueued;
    EventLoop::TimePoint enqueued_at;
    std::optional<EventLoop::TimePoint> started_at;
    uint32_t retries = 0;
    uint32_t max_retries = 0;
    std::chrono::milliseconds timeout{0};
    uint64_t owner = 0;
    uint32_t attempt = 0;
    JobPtr job;
    EventLoop::TimerId deadline_timer = EventLoop::kInvalidTimer;
    EventLoop::TimerId backoff_timer = EventLoop::kInvalidTimer;
  };

  struct ReadyKey {
    int priority;
    uint64_t seq;
    uint64_t id;
    bool operator<(const ReadyKey& o) const {
      if (priority != o.priority) return priority > o.priority;
      return seq < o.seq;
    }
  };

  void schedule();
  void start(Entry& entry);
  void on_settled(uint64_t id, uint32_t attempt, const Job& job);
  void on_deadline(uint64_t id, uint32_t attempt);
  void fail_or_retry(Entry& entry, const RpcError& error);
  void requeue(uint64_t id);
  void finish(uint64_t id, const QueueOutcome& outcome, QueueEventType type);
  void emit(QueueEventType type, const Entry& entry, double progress = 0.0, const std::string& message = {});
  void emit_progress(uint64_t id, double progress, const std::string& message);

  EventLoop& loop_;
  QueueConfig config_;
  RateLimiter limiter_;

  std::map<uint64_t, Entry> entries_;
  std::set<ReadyKey> ready_;
  size_t processing_ = 0;
  uint64_t next_id_ = 1;
  uint64_t next_seq_ = 1;

  EventLoop::TimerId rate_timer_ = EventLoop::kInvalidTimer;
  bool scheduling_ = false;
  bool reschedule_ = false;
  bool shut_down_ = false;

  // Progress callbacks handed to handlers may outlive the queue.
  std::shared_ptr<RequestQueue*> self_;

  QueueStats stats_;
};

}  // namespace mcpws

#endif  // MCPWS_REQUEST_QUEUE_HPP_
