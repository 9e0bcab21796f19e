#include "mcpws/session.hpp"

#include "mcpws/log.hpp"

#include <utility>

namespace mcpws {

const char* session_state_name(SessionState state) {
  switch (state) {
    case SessionState::kUninitialized: return "uninitialized";
    case SessionState::kInitializing: return "initializing";
    case SessionState::kReady: return "ready";
    case SessionState::kClosed: return "closed";
  }
  return "?";
}

Session::Session(uint64_t id, EventLoop& loop, SendFn send, const SessionOptions& options)
    : id_(id), loop_(loop), send_(std::move(send)), options_(options) {}

Session::~Session() { close(); }

std::string Session::begin_initialize(const Json::Value& params, const std::string& default_version) {
  client_ = ClientInfo();
  if (params.isObject()) {
    const Json::Value& info = params["clientInfo"];
    if (info.isObject()) {
      client_.name = info.get("name", "").asString();
      client_.version = info.get("version", "").asString();
    }
    if (params["protocolVersion"].isString()) {
      client_.protocol_version = params["protocolVersion"].asString();
    }
    client_.capabilities = params["capabilities"];
  }
  if (client_.protocol_version.empty()) {
    client_.protocol_version = default_version;
  }
  if (state_ != SessionState::kClosed) {
    state_ = SessionState::kInitializing;
  }
  MCPWS_LOG_INFO("Session", "session " << id_ << " initialize from '" << client_.name << "' protocol "
                                       << client_.protocol_version);
  return client_.protocol_version;
}

bool Session::complete_initialize() {
  if (state_ == SessionState::kReady) {
    return true;
  }
  if (state_ != SessionState::kInitializing) {
    MCPWS_LOG_WARN("Session", "session " << id_ << " got initialized in state " << session_state_name(state_));
    return false;
  }
  state_ = SessionState::kReady;
  MCPWS_LOG_INFO("Session", "session " << id_ << " ready");
  return true;
}

bool Session::send(const Message& msg) {
  if (state_ == SessionState::kClosed || !send_) {
    return false;
  }
  return send_(serialize(msg));
}

bool Session::notify(const std::string& method, Json::Value params) {
  return send(make_notification(method, std::move(params)));
}

JobPtr Session::request(const std::string& method, Json::Value params,
                        std::optional<std::chrono::milliseconds> timeout) {
  JobPtr job = make_job();
  if (state_ == SessionState::kClosed) {
    job->reject(RpcError(rpc_code::kInternalError, "Connection closed"));
    return job;
  }
  if (pending_.size() >= options_.max_pending_requests) {
    job->reject(RpcError(rpc_code::kInternalError, "Too many pending requests"));
    return job;
  }

  int64_t id = next_request_id_++;
  if (!send(make_request(RequestId(id), method, std::move(params)))) {
    job->reject(RpcError(rpc_code::kInternalError, "Send failed: " + method));
    return job;
  }

  Pending p;
  p.job = job;
  p.method = method;
  p.timer = loop_.call_later(timeout.value_or(options_.request_timeout), [this, id]() {
    auto it = pending_.find(id);
    if (it == pending_.end()) return;
    it->second.timer = EventLoop::kInvalidTimer;
    MCPWS_LOG_WARN("Session", "request " << id << " (" << it->second.method << ") timed out");
    settle_pending(id, std::nullopt, RpcError(rpc_code::kInternalError, "Request timeout"));
  });
  pending_.emplace(id, std::move(p));
  MCPWS_LOG_DEBUG("Session", "session " << id_ << " -> request " << id << " " << method);
  return job;
}

bool Session::handle_response(const Message& msg) {
  std::optional<RequestId> id;
  std::optional<Json::Value> result;
  std::optional<RpcError> error;
  if (const auto* r = std::get_if<Response>(&msg)) {
    id = r->id;
    result = r->result;
  } else if (const auto* e = std::get_if<ErrorResponse>(&msg)) {
    id = e->id;
    error = e->error;
  } else {
    return false;
  }
  if (!id || !id->is_number() || pending_.count(id->number()) == 0) {
    MCPWS_LOG_DEBUG("Session", "response for unknown request " << (id ? id->to_string() : "null"));
    return false;
  }
  settle_pending(id->number(), result, error);
  return true;
}

void Session::settle_pending(int64_t id, const std::optional<Json::Value>& result,
                             const std::optional<RpcError>& error) {
  auto it = pending_.find(id);
  if (it == pending_.end()) return;
  Pending p = std::move(it->second);
  pending_.erase(it);
  if (p.timer != EventLoop::kInvalidTimer) {
    loop_.cancel(p.timer);
  }
  if (error) {
    p.job->reject(*error);
  } else {
    p.job->resolve(result.value_or(Json::Value()));
  }
}

std::optional<uint64_t> Session::find_call(const RequestId& id) const {
  auto it = calls_.find(id);
  if (it == calls_.end()) return std::nullopt;
  return it->second;
}

void Session::close() {
  if (state_ == SessionState::kClosed && pending_.empty()) {
    return;
  }
  state_ = SessionState::kClosed;
  calls_.clear();

  std::map<int64_t, Pending> pending;
  pending.swap(pending_);
  if (!pending.empty()) {
    MCPWS_LOG_DEBUG("Session", "session " << id_ << " closing with " << pending.size() << " pending requests");
  }
  for (auto& kv : pending) {
    if (kv.second.timer != EventLoop::kInvalidTimer) {
      loop_.cancel(kv.second.timer);
    }
    kv.second.job->reject(RpcError(rpc_code::kInternalError, "Connection closed"));
  }
}

}  // namespace mcpws
