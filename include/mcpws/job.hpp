#ifndef MCPWS_JOB_HPP_
#define MCPWS_JOB_HPP_

#include "errors.hpp"

#include <json/json.h>

#include <cstdint>

#include <functional>
#include <memory>
#include <optional>
#include <vector>

namespace mcpws {

/**
 * @brief Completion slot for one asynchronous request.
 *
 * Settles exactly once: the first resolve() or reject() wins and later
 * calls return false without touching the stored outcome. A Job belongs to
 * the loop thread; code running elsewhere must EventLoop::post() the
 * resolution.
 */
class Job {
 public:
  enum class State : uint8_t { kPending, kResolved, kRejected };
  using Continuation = std::function<void(const Job&)>;

  explicit Job(uint64_t id) : id_(id) {}

  Job(const Job&) = delete;
  Job& operator=(const Job&) = delete;

  bool resolve(Json::Value result);
  bool reject(RpcError error);

  // Runs cont once the job settles, immediately if it already has.
  void then(Continuation cont);

  uint64_t id() const { return id_; }
  State state() const { return state_; }
  bool is_pending() const { return state_ == State::kPending; }
  bool is_resolved() const { return state_ == State::kResolved; }
  bool is_rejected() const { return state_ == State::kRejected; }

  const std::optional<Json::Value>& result() const { return result_; }
  const std::optional<RpcError>& error() const { return error_; }

 private:
  void settle();

  uint64_t id_;
  State state_ = State::kPending;
  std::optional<Json::Value> result_;
  std::optional<RpcError> error_;
  std::vector<Continuation> continuations_;
};

using JobPtr = std::shared_ptr<Job>;

// Allocates a job with a process-unique id.
JobPtr make_job();

}  // namespace mcpws

#endif  // MCPWS_JOB_HPP_
