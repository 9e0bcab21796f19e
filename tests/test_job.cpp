#include "mcpws.hpp"

#include <catch2/catch_test_macros.hpp>

using namespace mcpws;

TEST_CASE("Job - first resolution wins", "[job]") {
  auto job = make_job();
  REQUIRE(job->is_pending());
  REQUIRE(job->resolve(Json::Value("first")));
  REQUIRE_FALSE(job->resolve(Json::Value("second")));
  REQUIRE_FALSE(job->reject(RpcError(rpc_code::kInternalError, "late")));
  REQUIRE(job->is_resolved());
  REQUIRE(job->result()->asString() == "first");
  REQUIRE_FALSE(job->error().has_value());
}

TEST_CASE("Job - rejection is final", "[job]") {
  auto job = make_job();
  REQUIRE(job->reject(RpcError(rpc_code::kRequestTimeout, "Request timed out")));
  REQUIRE_FALSE(job->resolve(Json::Value(1)));
  REQUIRE(job->state() == Job::State::kRejected);
  REQUIRE(job->error()->code == rpc_code::kRequestTimeout);
  REQUIRE_FALSE(job->result().has_value());
}

TEST_CASE("Job - continuations run once, in order", "[job]") {
  auto job = make_job();
  std::vector<int> order;
  job->then([&order](const Job&) { order.push_back(1); });
  job->then([&order](const Job&) { order.push_back(2); });
  REQUIRE(order.empty());

  job->resolve(Json::Value());
  job->resolve(Json::Value());
  REQUIRE(order == std::vector<int>{1, 2});
}

TEST_CASE("Job - then on a settled job runs immediately", "[job]") {
  auto job = make_job();
  job->reject(RpcError(rpc_code::kRequestCancelled, "Request cancelled"));
  int code = 0;
  job->then([&code](const Job& j) { code = j.error()->code; });
  REQUIRE(code == rpc_code::kRequestCancelled);
}

TEST_CASE("Job - ids are unique", "[job]") {
  auto a = make_job();
  auto b = make_job();
  REQUIRE(a->id() != b->id());
}
