#include "mcpws/request_queue.hpp"

#include "mcpws/log.hpp"

#include <algorithm>
#include <exception>
#include <vector>

namespace mcpws {

const char* entry_status_name(EntryStatus status) {
  switch (status) {
    case EntryStatus::kQueued: return "queued";
    case EntryStatus::kProcessing: return "processing";
    case EntryStatus::kRetrying: return "retrying";
    case EntryStatus::kCompleted: return "completed";
    case EntryStatus::kFailed: return "failed";
    case EntryStatus::kCancelled: return "cancelled";
  }
  return "unknown";
}

RequestQueue::RequestQueue(EventLoop& loop, const QueueConfig& config)
    : loop_(loop), config_(config), limiter_(config.rate_limit), self_(std::make_shared<RequestQueue*>(this)) {
  if (config_.max_concurrent == 0) config_.max_concurrent = 1;
}

RequestQueue::~RequestQueue() {
  shutdown();
  *self_ = nullptr;
}

// ============================================================================
// Admission
// ============================================================================

std::optional<uint64_t> RequestQueue::enqueue(QueueRequest request) {
  if (shut_down_) {
    return std::nullopt;
  }
  if (ready_.size() >= config_.max_queue_size) {
    ++stats_.rejected;
    MCPWS_LOG_WARN("Queue", "queue full (" << ready_.size() << "), rejecting " << request.method);
    return std::nullopt;
  }

  uint64_t id = next_id_++;
  Entry& e = entries_[id];
  e.id = id;
  e.seq = next_seq_++;
  e.priority = request.priority;
  e.method = std::move(request.method);
  e.params = std::move(request.params);
  e.handler = std::move(request.handler);
  e.on_complete = std::move(request.on_complete);
  e.on_progress = std::move(request.on_progress);
  e.enqueued_at = loop_.now();
  e.max_retries = request.max_retries.value_or(config_.max_retries);
  e.timeout = request.timeout.value_or(config_.timeout);
  e.owner = request.owner;

  ready_.insert(ReadyKey{e.priority, e.seq, id});
  ++stats_.queued;
  MCPWS_LOG_DEBUG("Queue", "queued #" << id << " " << e.method << " priority " << e.priority);
  emit(QueueEventType::kQueued, e);

  schedule();
  return id;
}

// ============================================================================
// Scheduling
// ============================================================================

void RequestQueue::schedule() {
  if (scheduling_) {
    reschedule_ = true;
    return;
  }
  scheduling_ = true;
  do {
    reschedule_ = false;
    while (!shut_down_ && processing_ < config_.max_concurrent && !ready_.empty()) {
      auto now = loop_.now();
      if (!limiter_.try_acquire(now)) {
        if (rate_timer_ == EventLoop::kInvalidTimer) {
          ++stats_.rate_limited;
          auto wait = std::chrono::ceil<std::chrono::milliseconds>(*limiter_.blocked_until() - now);
          MCPWS_LOG_DEBUG("Queue", "rate limited, retrying in " << wait.count() << "ms");
          rate_timer_ = loop_.call_later(wait, [this] {
            rate_timer_ = EventLoop::kInvalidTimer;
            schedule();
          });
        }
        break;
      }
      uint64_t id = ready_.begin()->id;
      ready_.erase(ready_.begin());
      start(entries_.at(id));
    }
  } while (reschedule_ && !shut_down_);
  scheduling_ = false;
}

void RequestQueue::start(Entry& entry) {
  entry.status = EntryStatus::kProcessing;
  entry.started_at = loop_.now();
  ++entry.attempt;
  ++processing_;
  stats_.peak_processing = std::max<uint32_t>(stats_.peak_processing, static_cast<uint32_t>(processing_));

  const uint64_t id = entry.id;
  const uint32_t attempt = entry.attempt;
  JobPtr job = make_job();
  entry.job = job;
  entry.deadline_timer = loop_.call_later(entry.timeout, [this, id, attempt] { on_deadline(id, attempt); });

  MCPWS_LOG_DEBUG("Queue", "start #" << id << " " << entry.method << " attempt " << attempt);
  emit(QueueEventType::kStarted, entry);

  // Copies: the handler may settle synchronously and erase the entry.
  QueueHandler handler = entry.handler;
  Json::Value params = entry.params;
  std::weak_ptr<RequestQueue*> weak = self_;
  ProgressFn progress = [weak, id](double value, const std::string& message) {
    auto self = weak.lock();
    if (self && *self) (*self)->emit_progress(id, value, message);
  };

  job->then([this, id, attempt](const Job& settled) { on_settled(id, attempt, settled); });

  if (!handler) {
    job->reject(RpcError(rpc_code::kInternalError, "no handler for " + entry.method));
    return;
  }
  try {
    handler(params, job, progress);
  } catch (const std::exception& ex) {
    job->reject(RpcError(rpc_code::kInternalError, ex.what()));
  }
}

void RequestQueue::on_deadline(uint64_t id, uint32_t attempt) {
  auto it = entries_.find(id);
  if (it == entries_.end() || it->second.attempt != attempt) {
    return;
  }
  it->second.deadline_timer = EventLoop::kInvalidTimer;
  ++stats_.timed_out;
  MCPWS_LOG_WARN("Queue", "#" << id << " " << it->second.method << " timed out after "
                              << it->second.timeout.count() << "ms");
  JobPtr job = it->second.job;
  job->reject(RpcError(rpc_code::kRequestTimeout, "Request timed out"));
}

void RequestQueue::on_settled(uint64_t id, uint32_t attempt, const Job& job) {
  auto it = entries_.find(id);
  if (it == entries_.end() || it->second.attempt != attempt) {
    return;
  }
  Entry& e = it->second;
  if (e.status != EntryStatus::kProcessing && e.status != EntryStatus::kCancelled) {
    return;
  }
  if (e.deadline_timer != EventLoop::kInvalidTimer) {
    loop_.cancel(e.deadline_timer);
    e.deadline_timer = EventLoop::kInvalidTimer;
  }
  --processing_;

  if (e.status == EntryStatus::kCancelled) {
    // Completion already ran when it was cancelled.
    entries_.erase(it);
  } else if (job.is_resolved()) {
    ++stats_.processed;
    e.status = EntryStatus::kCompleted;
    finish(id, QueueOutcome::success(*job.result()), QueueEventType::kCompleted);
  } else {
    fail_or_retry(e, *job.error());
  }
  schedule();
}

void RequestQueue::fail_or_retry(Entry& e, const RpcError& error) {
  e.job.reset();
  if (e.retries < e.max_retries) {
    auto delay = config_.retry_base_delay * (int64_t{1} << std::min<uint32_t>(e.retries, 20));
    delay = std::min(delay, config_.max_retry_delay);
    ++e.retries;
    ++e.priority;
    ++stats_.retried;
    e.status = EntryStatus::kRetrying;
    MCPWS_LOG_INFO("Queue", "#" << e.id << " " << e.method << " failed (" << error.message << "), retry "
                                << e.retries << "/" << e.max_retries << " in " << delay.count() << "ms");
    emit(QueueEventType::kRetrying, e, 0.0, error.message);
    uint64_t id = e.id;
    e.backoff_timer = loop_.call_later(delay, [this, id] { requeue(id); });
    return;
  }
  ++stats_.failed;
  e.status = EntryStatus::kFailed;
  MCPWS_LOG_WARN("Queue", "#" << e.id << " " << e.method << " failed: " << error.message);
  finish(e.id, QueueOutcome::error(error), QueueEventType::kFailed);
}

void RequestQueue::requeue(uint64_t id) {
  auto it = entries_.find(id);
  if (it == entries_.end() || it->second.status != EntryStatus::kRetrying) {
    return;
  }
  Entry& e = it->second;
  e.backoff_timer = EventLoop::kInvalidTimer;
  e.status = EntryStatus::kQueued;
  ready_.insert(ReadyKey{e.priority, e.seq, id});
  schedule();
}

void RequestQueue::finish(uint64_t id, const QueueOutcome& outcome, QueueEventType type) {
  auto it = entries_.find(id);
  if (it == entries_.end()) {
    return;
  }
  Entry done = std::move(it->second);
  entries_.erase(it);
  emit(type, done, 0.0, outcome ? std::string() : outcome.get_error().message);
  if (done.on_complete) {
    done.on_complete(outcome);
  }
}

// ============================================================================
// Cancellation
// ============================================================================

bool RequestQueue::cancel(uint64_t id) {
  auto it = entries_.find(id);
  if (it == entries_.end()) {
    return false;
  }
  Entry& e = it->second;
  RpcError error(rpc_code::kRequestCancelled, "Request cancelled");

  switch (e.status) {
    case EntryStatus::kQueued:
      ready_.erase(ReadyKey{e.priority, e.seq, id});
      break;
    case EntryStatus::kRetrying:
      loop_.cancel(e.backoff_timer);
      e.backoff_timer = EventLoop::kInvalidTimer;
      break;
    case EntryStatus::kProcessing: {
      // Keeps its concurrency slot until the handler or deadline settles it.
      e.status = EntryStatus::kCancelled;
      ++stats_.cancelled;
      QueueCompletion done = std::move(e.on_complete);
      e.on_complete = nullptr;
      emit(QueueEventType::kCancelled, e);
      MCPWS_LOG_DEBUG("Queue", "cancelled in-flight #" << id);
      if (done) done(QueueOutcome::error(error));
      return true;
    }
    default:
      return false;
  }

  ++stats_.cancelled;
  e.status = EntryStatus::kCancelled;
  MCPWS_LOG_DEBUG("Queue", "cancelled #" << id);
  finish(id, QueueOutcome::error(error), QueueEventType::kCancelled);
  return true;
}

size_t RequestQueue::cancel_owner(uint64_t owner) {
  std::vector<uint64_t> ids;
  for (const auto& kv : entries_) {
    if (kv.second.owner == owner && kv.second.status != EntryStatus::kCancelled) ids.push_back(kv.first);
  }
  size_t count = 0;
  for (uint64_t id : ids) {
    if (cancel(id)) ++count;
  }
  return count;
}

size_t RequestQueue::clear() {
  std::vector<uint64_t> ids;
  for (const auto& kv : entries_) {
    if (kv.second.status == EntryStatus::kQueued || kv.second.status == EntryStatus::kRetrying) {
      ids.push_back(kv.first);
    }
  }
  RpcError error(rpc_code::kRequestCancelled, "Queue cleared");
  for (uint64_t id : ids) {
    auto it = entries_.find(id);
    if (it == entries_.end()) continue;
    Entry& e = it->second;
    if (e.status == EntryStatus::kQueued) {
      ready_.erase(ReadyKey{e.priority, e.seq, id});
    } else {
      loop_.cancel(e.backoff_timer);
    }
    e.status = EntryStatus::kCancelled;
    ++stats_.cancelled;
    finish(id, QueueOutcome::error(error), QueueEventType::kCancelled);
  }
  if (on_event) {
    on_event(QueueEvent{QueueEventType::kCleared, 0, std::string(), 0.0, std::to_string(ids.size())});
  }
  MCPWS_LOG_INFO("Queue", "cleared " << ids.size() << " entries");
  return ids.size();
}

void RequestQueue::shutdown() {
  if (shut_down_) {
    return;
  }
  shut_down_ = true;
  if (rate_timer_ != EventLoop::kInvalidTimer) {
    loop_.cancel(rate_timer_);
    rate_timer_ = EventLoop::kInvalidTimer;
  }

  std::map<uint64_t, Entry> remaining;
  remaining.swap(entries_);
  ready_.clear();
  processing_ = 0;

  RpcError error(rpc_code::kInternalError, "Server shutting down");
  for (auto& kv : remaining) {
    Entry& e = kv.second;
    if (e.deadline_timer != EventLoop::kInvalidTimer) loop_.cancel(e.deadline_timer);
    if (e.backoff_timer != EventLoop::kInvalidTimer) loop_.cancel(e.backoff_timer);
    if (e.status != EntryStatus::kCancelled && e.on_complete) {
      e.on_complete(QueueOutcome::error(error));
    }
    if (e.job) e.job->reject(error);
  }
  if (!remaining.empty()) {
    MCPWS_LOG_INFO("Queue", "shutdown dropped " << remaining.size() << " entries");
  }
}

// ============================================================================
// Introspection
// ============================================================================

std::optional<EntryStatus> RequestQueue::status_of(uint64_t id) const {
  auto it = entries_.find(id);
  if (it == entries_.end()) return std::nullopt;
  return it->second.status;
}

QueueStatus RequestQueue::status() const {
  QueueStatus s;
  s.queued = ready_.size();
  s.processing = processing_;
  for (const auto& kv : entries_) {
    if (kv.second.status == EntryStatus::kRetrying) ++s.retrying;
  }
  s.rate_limited = limiter_.is_blocked(loop_.now());
  s.stats = stats_;
  return s;
}

void RequestQueue::emit(QueueEventType type, const Entry& entry, double progress, const std::string& message) {
  if (on_event) {
    on_event(QueueEvent{type, entry.id, entry.method, progress, message});
  }
}

void RequestQueue::emit_progress(uint64_t id, double progress, const std::string& message) {
  auto it = entries_.find(id);
  if (it == entries_.end() || it->second.status != EntryStatus::kProcessing) {
    return;
  }
  ProgressFn cb = it->second.on_progress;
  emit(QueueEventType::kProgress, it->second, progress, message);
  if (cb) cb(progress, message);
}

}  // namespace mcpws
