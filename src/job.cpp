#include "mcpws/job.hpp"

#include <atomic>

namespace mcpws {

bool Job::resolve(Json::Value result) {
  if (state_ != State::kPending) {
    return false;
  }
  state_ = State::kResolved;
  result_ = std::move(result);
  settle();
  return true;
}

bool Job::reject(RpcError error) {
  if (state_ != State::kPending) {
    return false;
  }
  state_ = State::kRejected;
  error_ = std::move(error);
  settle();
  return true;
}

void Job::then(Continuation cont) {
  if (state_ != State::kPending) {
    cont(*this);
    return;
  }
  continuations_.push_back(std::move(cont));
}

void Job::settle() {
  std::vector<Continuation> pending;
  pending.swap(continuations_);
  for (auto& cont : pending) {
    cont(*this);
  }
}

JobPtr make_job() {
  static std::atomic<uint64_t> next_id{1};
  return std::make_shared<Job>(next_id.fetch_add(1, std::memory_order_relaxed));
}

}  // namespace mcpws
