#ifndef MCPWS_SERVER_HPP_
#define MCPWS_SERVER_HPP_

#include "config.hpp"
#include "connection.hpp"
#include "discovery.hpp"
#include "dispatcher.hpp"
#include "event_loop.hpp"
#include "handshake.hpp"
#include "request_queue.hpp"
#include "response_cache.hpp"
#include "session.hpp"
#include "tool_registry.hpp"
#include "vocabulary.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace mcpws {

// ============================================================================
// TCP Tuning Configuration
// ============================================================================

struct TcpTuning {
  bool tcp_nodelay = true;    // Disable Nagle algorithm
  bool so_keepalive = false;  // Enable TCP keepalive

  // Keepalive parameters (Linux-specific, effective when so_keepalive=true)
  int keepalive_idle_s = 60;
  int keepalive_interval_s = 10;
  int keepalive_count = 5;
};

// ============================================================================
// ServerStats - Atomic counters, readable from any thread
// ============================================================================

struct ServerStats {
  std::atomic<uint64_t> total_connections{0};
  std::atomic<uint64_t> active_connections{0};
  std::atomic<uint64_t> rejected_connections{0};
  std::atomic<uint64_t> auth_failures{0};
  std::atomic<uint64_t> handshake_errors{0};
  std::atomic<uint64_t> protocol_errors{0};
  std::atomic<uint64_t> socket_errors{0};
  std::atomic<uint64_t> slow_readers{0};
  std::atomic<uint64_t> messages_in{0};
  std::atomic<uint64_t> messages_out{0};

  void reset() {
    total_connections = 0; active_connections = 0; rejected_connections = 0;
    auth_failures = 0; handshake_errors = 0; protocol_errors = 0; socket_errors = 0;
    slow_readers = 0; messages_in = 0; messages_out = 0;
  }
};

// ============================================================================
// Server - loopback MCP endpoint over WebSocket
// ============================================================================

/**
 * @brief Owns the listening socket, the loop and every per-process registry.
 *
 * Construction validates the configuration and binds; start() writes the
 * discovery record and arms the housekeeping timers; run() blocks on the
 * loop until stop(). Everything except stop() and stats() belongs to the
 * loop thread.
 */
class Server {
 public:
  using ConnPtr = std::shared_ptr<Connection>;

  static constexpr size_t kMaxConnections = 64;

  // Throws std::runtime_error on an invalid config or a failed bind.
  explicit Server(const ServerConfig& config = ServerConfig());
  ~Server();

  Server(const Server&) = delete;
  Server& operator=(const Server&) = delete;

  // Discovery record, auth token, environment, timers. Idempotent.
  expected<void, ErrorCode> start();

  // Start the server (blocking); shuts down on return.
  void run();

  // Thread-safe.
  void stop() { loop_.stop(); }

  // Fails outstanding work, closes every socket and removes the lock
  // file. Call from the loop thread or after run() returned.
  void shutdown();

  // Configuration
  Server& set_poll_timeout_ms(int timeout) {
    loop_.set_max_poll_wait(std::chrono::milliseconds(timeout));
    return *this;
  }

  Server& set_tcp_tuning(const TcpTuning& tuning) {
    tcp_tuning_ = tuning;
    return *this;
  }

  // Components
  EventLoop& loop() { return loop_; }
  ToolRegistry& tools() { return tools_; }
  Dispatcher& dispatcher() { return dispatcher_; }
  RequestQueue& queue() { return queue_; }
  CacheRegistry& caches() { return caches_; }
  const Discovery& discovery() const { return discovery_; }
  const ServerConfig& config() const { return config_; }

  uint16_t port() const { return port_; }
  const std::string& auth_token() const { return token_; }
  bool is_started() const { return started_; }

  size_t get_connection_count() const { return clients_.size(); }
  SessionPtr find_session(uint64_t id) const;
  std::vector<SessionPtr> sessions() const;

  // Notification to every ready session. Returns how many were sent.
  size_t broadcast(const std::string& method, const Json::Value& params = Json::Value());

  // Callbacks
  std::function<void(const ConnPtr&)> on_connect;
  std::function<void(const SessionPtr&)> on_ready;
  std::function<void(const ConnPtr&, bool clean)> on_disconnect;

  // Performance monitoring
  const ServerStats& stats() const { return stats_; }

 private:
  struct Client {
    ConnPtr conn;
    int fd = -1;
  };

  void open_listener();
  void accept_connections();
  void handle_connection_io(const ConnPtr& conn, short revents);
  void open_session(const ConnPtr& conn);
  void close_session(const ConnPtr& conn, bool clean);
  void housekeeping();
  void heartbeat();
  void remove_closed_connections();
  void apply_tcp_tuning(int fd);
  ConnPtr find_connection(uint64_t id) const;

  ServerConfig config_;
  EventLoop loop_;
  CacheRegistry caches_;
  ToolRegistry tools_;
  RequestQueue queue_;
  Dispatcher dispatcher_;
  Discovery discovery_;
  Authenticator authenticator_;

  int listen_fd_ = -1;
  uint16_t port_ = 0;
  std::string token_;
  TcpTuning tcp_tuning_;
  bool started_ = false;
  bool shut_down_ = false;
  bool env_exported_ = false;

  FixedVector<Client, kMaxConnections> clients_;
  std::unordered_map<uint64_t, SessionPtr> sessions_;

  EventLoop::TimerId housekeeping_timer_ = EventLoop::kInvalidTimer;
  EventLoop::TimerId heartbeat_timer_ = EventLoop::kInvalidTimer;

  ServerStats stats_;
};

}  // namespace mcpws

#endif  // MCPWS_SERVER_HPP_
