#include "mcpws.hpp"

#include <algorithm>
#include <stdexcept>

#include <catch2/catch_test_macros.hpp>

using namespace mcpws;
using std::chrono::milliseconds;

namespace {

QueueConfig test_config() {
  QueueConfig cfg;
  cfg.max_concurrent = 3;
  cfg.max_retries = 0;
  cfg.retry_base_delay = milliseconds(10);
  cfg.timeout = milliseconds(1000);
  cfg.rate_limit.enabled = false;
  return cfg;
}

// Handler that parks its job so the test decides when it settles.
QueueHandler parked(std::vector<JobPtr>& jobs) {
  return [&jobs](const Json::Value&, const JobPtr& job, const ProgressFn&) { jobs.push_back(job); };
}

QueueHandler immediate(Json::Value result = Json::Value("ok")) {
  return [result](const Json::Value&, const JobPtr& job, const ProgressFn&) { job->resolve(result); };
}

struct Outcomes {
  std::vector<QueueOutcome> items;
  QueueCompletion collector() {
    return [this](const QueueOutcome& o) { items.push_back(o); };
  }
};

}  // namespace

// ============================================================================
// Concurrency and ordering
// ============================================================================

TEST_CASE("RequestQueue - never exceeds max_concurrent", "[queue]") {
  EventLoop loop;
  QueueConfig cfg = test_config();
  cfg.max_concurrent = 2;
  RequestQueue queue(loop, cfg);

  int running = 0;
  int peak = 0;
  int done = 0;
  auto start = loop.now();
  for (int i = 0; i < 4; ++i) {
    QueueRequest req;
    req.method = "work";
    req.handler = [&](const Json::Value&, const JobPtr& job, const ProgressFn&) {
      ++running;
      peak = std::max(peak, running);
      loop.call_later(milliseconds(30), [&running, job] {
        --running;
        job->resolve(Json::Value());
      });
    };
    req.on_complete = [&done](const QueueOutcome& o) {
      REQUIRE(o.has_value());
      ++done;
    };
    REQUIRE(queue.enqueue(std::move(req)).has_value());
  }
  REQUIRE(queue.processing() == 2);
  REQUIRE(queue.size() == 2);

  REQUIRE(loop.run_until([&done] { return done == 4; }, milliseconds(1000)));
  auto elapsed = loop.now() - start;
  REQUIRE(peak == 2);
  REQUIRE(elapsed >= milliseconds(60));
  REQUIRE(elapsed < milliseconds(200));
  REQUIRE(queue.stats().peak_processing == 2);
}

TEST_CASE("RequestQueue - higher priority first, FIFO within a priority", "[queue]") {
  EventLoop loop;
  QueueConfig cfg = test_config();
  cfg.max_concurrent = 1;
  RequestQueue queue(loop, cfg);

  std::vector<JobPtr> blockers;
  QueueRequest blocker;
  blocker.method = "blocker";
  blocker.handler = parked(blockers);
  REQUIRE(queue.enqueue(std::move(blocker)));

  std::vector<std::string> order;
  auto add = [&](const std::string& name, int prio) {
    QueueRequest req;
    req.method = name;
    req.priority = prio;
    req.handler = [&order, name](const Json::Value&, const JobPtr& job, const ProgressFn&) {
      order.push_back(name);
      job->resolve(Json::Value());
    };
    REQUIRE(queue.enqueue(std::move(req)));
  };
  add("low", priority::kLow);
  add("normal-1", priority::kNormal);
  add("high", priority::kHigh);
  add("normal-2", priority::kNormal);
  REQUIRE(order.empty());

  blockers.front()->resolve(Json::Value());
  REQUIRE(order == std::vector<std::string>{"high", "normal-1", "normal-2", "low"});
}

// ============================================================================
// Rate limiting
// ============================================================================

TEST_CASE("RateLimiter - sliding window with block", "[queue]") {
  RateLimitConfig cfg;
  cfg.max_requests = 2;
  cfg.window = milliseconds(100);
  cfg.retry_after = milliseconds(30);
  RateLimiter limiter(cfg);

  auto t0 = RateLimiter::Clock::now();
  REQUIRE(limiter.try_acquire(t0));
  REQUIRE(limiter.try_acquire(t0 + milliseconds(10)));
  REQUIRE_FALSE(limiter.try_acquire(t0 + milliseconds(20)));
  REQUIRE(limiter.is_blocked(t0 + milliseconds(40)));
  // Block over, but both starts are still inside the window.
  REQUIRE_FALSE(limiter.try_acquire(t0 + milliseconds(60)));
  // First start has left the window and the new block has passed.
  REQUIRE(limiter.try_acquire(t0 + milliseconds(101)));
  REQUIRE(limiter.in_window(t0 + milliseconds(101)) == 2);
}

TEST_CASE("RequestQueue - rate limit defers starts past the window", "[queue]") {
  EventLoop loop;
  QueueConfig cfg = test_config();
  cfg.max_concurrent = 10;
  cfg.rate_limit.enabled = true;
  cfg.rate_limit.max_requests = 5;
  cfg.rate_limit.window = milliseconds(1000);
  cfg.rate_limit.retry_after = milliseconds(200);
  RequestQueue queue(loop, cfg);

  int done = 0;
  auto start = loop.now();
  for (int i = 0; i < 7; ++i) {
    QueueRequest req;
    req.method = "limited";
    req.handler = immediate();
    req.on_complete = [&done](const QueueOutcome&) { ++done; };
    REQUIRE(queue.enqueue(std::move(req)));
  }
  REQUIRE(done == 5);
  REQUIRE(queue.status().rate_limited);

  loop.run_for(milliseconds(500));
  REQUIRE(done == 5);

  REQUIRE(loop.run_until([&done] { return done == 7; }, milliseconds(2000)));
  REQUIRE(loop.now() - start >= milliseconds(1000));
  REQUIRE(queue.stats().rate_limited >= 1);
}

// ============================================================================
// Retry and timeout
// ============================================================================

TEST_CASE("RequestQueue - retries with backoff until success", "[queue]") {
  EventLoop loop;
  QueueConfig cfg = test_config();
  cfg.max_retries = 3;
  RequestQueue queue(loop, cfg);

  int attempts = 0;
  Outcomes outcomes;
  QueueRequest req;
  req.method = "flaky";
  req.handler = [&attempts](const Json::Value&, const JobPtr& job, const ProgressFn&) {
    if (++attempts < 3) {
      job->reject(RpcError(rpc_code::kInternalError, "transient"));
    } else {
      job->resolve(Json::Value(attempts));
    }
  };
  req.on_complete = outcomes.collector();
  auto id = queue.enqueue(std::move(req));
  REQUIRE(id);
  REQUIRE(queue.status_of(*id) == EntryStatus::kRetrying);

  REQUIRE(loop.run_until([&outcomes] { return !outcomes.items.empty(); }, milliseconds(1000)));
  REQUIRE(outcomes.items.size() == 1);
  REQUIRE(outcomes.items[0].value().asInt() == 3);
  REQUIRE(queue.stats().retried == 2);
  REQUIRE_FALSE(queue.status_of(*id).has_value());
}

TEST_CASE("RequestQueue - final failure after retries are spent", "[queue]") {
  EventLoop loop;
  QueueConfig cfg = test_config();
  RequestQueue queue(loop, cfg);

  int attempts = 0;
  Outcomes outcomes;
  QueueRequest req;
  req.method = "broken";
  req.max_retries = 1;
  req.handler = [&attempts](const Json::Value&, const JobPtr&, const ProgressFn&) {
    ++attempts;
    throw std::runtime_error("disk on fire");
  };
  req.on_complete = outcomes.collector();
  REQUIRE(queue.enqueue(std::move(req)));

  REQUIRE(loop.run_until([&outcomes] { return !outcomes.items.empty(); }, milliseconds(1000)));
  REQUIRE(attempts == 2);
  REQUIRE_FALSE(outcomes.items[0].has_value());
  REQUIRE(outcomes.items[0].get_error().message == "disk on fire");
  REQUIRE(queue.stats().failed == 1);
}

TEST_CASE("RequestQueue - deadline rejects a stuck handler", "[queue]") {
  EventLoop loop;
  RequestQueue queue(loop, test_config());

  std::vector<JobPtr> jobs;
  Outcomes outcomes;
  QueueRequest req;
  req.method = "stuck";
  req.timeout = milliseconds(30);
  req.handler = parked(jobs);
  req.on_complete = outcomes.collector();
  REQUIRE(queue.enqueue(std::move(req)));

  REQUIRE(loop.run_until([&outcomes] { return !outcomes.items.empty(); }, milliseconds(1000)));
  REQUIRE(outcomes.items[0].get_error().code == rpc_code::kRequestTimeout);
  REQUIRE(outcomes.items[0].get_error().message == "Request timed out");
  REQUIRE(queue.processing() == 0);

  // A late resolution changes nothing.
  REQUIRE_FALSE(jobs[0]->resolve(Json::Value()));
  REQUIRE(outcomes.items.size() == 1);
}

// ============================================================================
// Cancel / clear / shutdown
// ============================================================================

TEST_CASE("RequestQueue - cancel a queued entry", "[queue]") {
  EventLoop loop;
  QueueConfig cfg = test_config();
  cfg.max_concurrent = 1;
  RequestQueue queue(loop, cfg);

  std::vector<JobPtr> jobs;
  QueueRequest first;
  first.method = "first";
  first.handler = parked(jobs);
  REQUIRE(queue.enqueue(std::move(first)));

  bool second_ran = false;
  Outcomes outcomes;
  QueueRequest second;
  second.method = "second";
  second.handler = [&second_ran](const Json::Value&, const JobPtr& job, const ProgressFn&) {
    second_ran = true;
    job->resolve(Json::Value());
  };
  second.on_complete = outcomes.collector();
  auto id = queue.enqueue(std::move(second));
  REQUIRE(queue.status_of(*id) == EntryStatus::kQueued);

  REQUIRE(queue.cancel(*id));
  REQUIRE_FALSE(queue.cancel(*id));
  REQUIRE(outcomes.items.size() == 1);
  REQUIRE(outcomes.items[0].get_error().code == rpc_code::kRequestCancelled);
  REQUIRE(outcomes.items[0].get_error().message == "Request cancelled");

  jobs[0]->resolve(Json::Value());
  REQUIRE_FALSE(second_ran);
}

TEST_CASE("RequestQueue - cancel in flight keeps the slot until settled", "[queue]") {
  EventLoop loop;
  QueueConfig cfg = test_config();
  cfg.max_concurrent = 1;
  RequestQueue queue(loop, cfg);

  std::vector<JobPtr> jobs;
  Outcomes outcomes;
  QueueRequest first;
  first.method = "first";
  first.handler = parked(jobs);
  first.on_complete = outcomes.collector();
  auto id = queue.enqueue(std::move(first));

  QueueRequest second;
  second.method = "second";
  second.handler = immediate();
  Outcomes second_outcomes;
  second.on_complete = second_outcomes.collector();
  REQUIRE(queue.enqueue(std::move(second)));

  REQUIRE(queue.cancel(*id));
  REQUIRE(outcomes.items.size() == 1);
  REQUIRE(outcomes.items[0].get_error().code == rpc_code::kRequestCancelled);
  REQUIRE(queue.processing() == 1);
  REQUIRE(second_outcomes.items.empty());

  jobs[0]->resolve(Json::Value("ignored"));
  REQUIRE(outcomes.items.size() == 1);
  REQUIRE(queue.processing() == 0);
  REQUIRE(second_outcomes.items.size() == 1);
}

TEST_CASE("RequestQueue - cancel_owner", "[queue]") {
  EventLoop loop;
  QueueConfig cfg = test_config();
  cfg.max_concurrent = 1;
  RequestQueue queue(loop, cfg);

  std::vector<JobPtr> jobs;
  Outcomes mine;
  Outcomes theirs;
  for (uint64_t owner : {7u, 7u, 8u}) {
    QueueRequest req;
    req.method = "owned";
    req.owner = owner;
    req.handler = parked(jobs);
    req.on_complete = owner == 7 ? mine.collector() : theirs.collector();
    REQUIRE(queue.enqueue(std::move(req)));
  }
  REQUIRE(queue.cancel_owner(7) == 2);
  REQUIRE(mine.items.size() == 2);
  REQUIRE(theirs.items.empty());
}

TEST_CASE("RequestQueue - clear cancels waiting entries only", "[queue]") {
  EventLoop loop;
  QueueConfig cfg = test_config();
  cfg.max_concurrent = 1;
  RequestQueue queue(loop, cfg);

  std::vector<JobPtr> jobs;
  Outcomes outcomes;
  for (int i = 0; i < 4; ++i) {
    QueueRequest req;
    req.method = "job" + std::to_string(i);
    req.handler = parked(jobs);
    req.on_complete = outcomes.collector();
    REQUIRE(queue.enqueue(std::move(req)));
  }
  bool cleared_event = false;
  queue.on_event = [&cleared_event](const QueueEvent& ev) {
    if (ev.type == QueueEventType::kCleared) cleared_event = true;
  };

  REQUIRE(queue.clear() == 3);
  REQUIRE(cleared_event);
  REQUIRE(outcomes.items.size() == 3);
  for (const auto& o : outcomes.items) {
    REQUIRE(o.get_error().message == "Queue cleared");
  }
  REQUIRE(queue.size() == 0);
  REQUIRE(queue.processing() == 1);

  jobs[0]->resolve(Json::Value());
  REQUIRE(outcomes.items.size() == 4);
  REQUIRE(outcomes.items[3].has_value());
}

TEST_CASE("RequestQueue - full queue refuses new work", "[queue]") {
  EventLoop loop;
  QueueConfig cfg = test_config();
  cfg.max_concurrent = 1;
  cfg.max_queue_size = 2;
  RequestQueue queue(loop, cfg);

  std::vector<JobPtr> jobs;
  for (int i = 0; i < 3; ++i) {
    QueueRequest req;
    req.method = "fill";
    req.handler = parked(jobs);
    REQUIRE(queue.enqueue(std::move(req)));
  }
  QueueRequest extra;
  extra.method = "extra";
  extra.handler = parked(jobs);
  REQUIRE_FALSE(queue.enqueue(std::move(extra)));
  REQUIRE(queue.stats().rejected == 1);
}

TEST_CASE("RequestQueue - progress reaches the requester", "[queue]") {
  EventLoop loop;
  RequestQueue queue(loop, test_config());

  std::vector<std::pair<double, std::string>> seen;
  QueueRequest req;
  req.method = "long";
  req.handler = [](const Json::Value&, const JobPtr& job, const ProgressFn& progress) {
    progress(50, "half");
    progress(100, "done");
    job->resolve(Json::Value());
  };
  req.on_progress = [&seen](double p, const std::string& m) { seen.emplace_back(p, m); };
  REQUIRE(queue.enqueue(std::move(req)));
  REQUIRE(seen.size() == 2);
  REQUIRE(seen[0].first == 50);
  REQUIRE(seen[1].second == "done");
}

TEST_CASE("RequestQueue - shutdown fails outstanding work", "[queue]") {
  EventLoop loop;
  QueueConfig cfg = test_config();
  cfg.max_concurrent = 1;
  RequestQueue queue(loop, cfg);

  std::vector<JobPtr> jobs;
  Outcomes outcomes;
  for (int i = 0; i < 2; ++i) {
    QueueRequest req;
    req.method = "pending";
    req.handler = parked(jobs);
    req.on_complete = outcomes.collector();
    REQUIRE(queue.enqueue(std::move(req)));
  }
  queue.shutdown();
  REQUIRE(outcomes.items.size() == 2);
  for (const auto& o : outcomes.items) {
    REQUIRE(o.get_error().code == rpc_code::kInternalError);
    REQUIRE(o.get_error().message == "Server shutting down");
  }
  REQUIRE(jobs[0]->is_rejected());

  QueueRequest late;
  late.method = "late";
  late.handler = immediate();
  REQUIRE_FALSE(queue.enqueue(std::move(late)));
}
