#ifndef MCPWS_SESSION_HPP_
#define MCPWS_SESSION_HPP_

#include "errors.hpp"
#include "event_loop.hpp"
#include "job.hpp"
#include "json_rpc.hpp"

#include <json/json.h>

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace mcpws {

constexpr const char* kDefaultProtocolVersion = "2025-06-18";

enum class SessionState : uint8_t { kUninitialized, kInitializing, kReady, kClosed };

const char* session_state_name(SessionState state);

struct ClientInfo {
  std::string name;
  std::string version;
  std::string protocol_version;
  Json::Value capabilities;
};

struct SessionOptions {
  std::chrono::milliseconds request_timeout{30000};
  size_t max_pending_requests = 100;
};

/**
 * @brief JSON-RPC endpoint state for one WebSocket connection.
 *
 * Tracks the initialize handshake, the requests the server has sent to the
 * client and is waiting on, and the client requests that were handed to
 * the queue (so notifications/cancelled can find them). Lives on the loop
 * thread.
 */
class Session : public std::enable_shared_from_this<Session> {
 public:
  using SendFn = std::function<bool(const std::string& text)>;

  Session(uint64_t id, EventLoop& loop, SendFn send, const SessionOptions& options = SessionOptions());
  ~Session();

  Session(const Session&) = delete;
  Session& operator=(const Session&) = delete;

  uint64_t id() const { return id_; }
  SessionState state() const { return state_; }
  bool is_ready() const { return state_ == SessionState::kReady; }
  bool is_closed() const { return state_ == SessionState::kClosed; }
  const ClientInfo& client() const { return client_; }

  // --- Handshake ---

  // Records the client's initialize params and returns the protocol
  // version to answer with: the client's when given, else default_version.
  std::string begin_initialize(const Json::Value& params, const std::string& default_version);

  // initialized notification. False unless initialize was seen first.
  bool complete_initialize();

  // --- Outbound ---

  bool send(const Message& msg);
  bool notify(const std::string& method, Json::Value params = Json::Value());

  // Server-initiated request. The job resolves with the client's result,
  // or rejects with its error, a timeout, or "Connection closed".
  JobPtr request(const std::string& method, Json::Value params = Json::Value(),
                 std::optional<std::chrono::milliseconds> timeout = std::nullopt);

  // Routes a Response/ErrorResponse to its pending request. False when
  // no request with that id is outstanding.
  bool handle_response(const Message& msg);

  size_t pending_requests() const { return pending_.size(); }

  // --- Client calls in the queue ---

  void track_call(const RequestId& id, uint64_t queue_id) { calls_[id] = queue_id; }
  void untrack_call(const RequestId& id) { calls_.erase(id); }
  std::optional<uint64_t> find_call(const RequestId& id) const;
  size_t active_calls() const { return calls_.size(); }

  // Rejects every pending request; further sends fail.
  void close();

 private:
  struct Pending {
    JobPtr job;
    std::string method;
    EventLoop::TimerId timer = EventLoop::kInvalidTimer;
  };

  void settle_pending(int64_t id, const std::optional<Json::Value>& result, const std::optional<RpcError>& error);

  uint64_t id_;
  EventLoop& loop_;
  SendFn send_;
  SessionOptions options_;
  SessionState state_ = SessionState::kUninitialized;
  ClientInfo client_;

  int64_t next_request_id_ = 1;
  std::map<int64_t, Pending> pending_;
  std::map<RequestId, uint64_t> calls_;
};

using SessionPtr = std::shared_ptr<Session>;

}  // namespace mcpws

#endif  // MCPWS_SESSION_HPP_
