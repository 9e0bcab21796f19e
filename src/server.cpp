#include "mcpws/server.hpp"

#include "mcpws/log.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <stdexcept>
#include <sys/socket.h>
#include <unistd.h>

namespace mcpws {

namespace {

DispatcherOptions dispatcher_options(const ServerConfig& config) {
  DispatcherOptions opts;
  opts.server_name = config.server_name;
  opts.server_version = config.server_version;
  opts.instructions = config.instructions;
  opts.protocol_version = config.protocol_version;
  return opts;
}

std::string lock_dir_of(const ServerConfig& config) {
  return config.lock_dir.empty() ? default_lock_dir() : config.lock_dir;
}

}  // namespace

Server::Server(const ServerConfig& config)
    : config_(config),
      queue_(loop_, config.queue),
      dispatcher_(tools_, queue_, caches_, dispatcher_options(config)),
      discovery_(lock_dir_of(config)) {
  auto valid = validate_config(config_);
  if (!valid) {
    MCPWS_THROW(std::runtime_error("Invalid configuration: " + valid.get_error().reason));
  }
  if (config_.max_connections > kMaxConnections) {
    config_.max_connections = kMaxConnections;
  }

  Logger::Level level;
  if (Logger::parse_level(config_.log_level, level)) {
    Logger::set_level(level);
  }
  if (!config_.log_file.empty() && !Logger::set_file(config_.log_file)) {
    MCPWS_LOG_WARN("Server", "cannot open log file " << config_.log_file);
  }

  open_listener();

  dispatcher_.on_ready = [this](const SessionPtr& session) {
    if (ConnPtr conn = find_connection(session->id())) {
      conn->set_initialized(true);
    }
    if (on_ready) on_ready(session);
  };
  tools_.on_changed = [this]() {
    if (started_) broadcast("notifications/tools/list_changed");
  };
}

Server::~Server() { shutdown(); }

void Server::open_listener() {
  bool v6 = config_.host == "::1";
  listen_fd_ = ::socket(v6 ? AF_INET6 : AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
  if (listen_fd_ < 0) {
    MCPWS_THROW(std::runtime_error("Failed to create socket"));
  }

  int reuse = 1;
  if (::setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) < 0) {
    MCPWS_LOG_WARN("Server", "SO_REUSEADDR failed: " << std::strerror(errno));
  }

  int rc;
  if (v6) {
    struct sockaddr_in6 addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin6_family = AF_INET6;
    addr.sin6_port = htons(config_.port);
    addr.sin6_addr = in6addr_loopback;
    rc = ::bind(listen_fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr));
  } else {
    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(config_.port);
    const char* host = config_.host == "localhost" ? "127.0.0.1" : config_.host.c_str();
    if (::inet_pton(AF_INET, host, &addr.sin_addr) != 1) {
      ::close(listen_fd_);
      listen_fd_ = -1;
      MCPWS_THROW(std::runtime_error("Invalid bind address " + config_.host));
    }
    rc = ::bind(listen_fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr));
  }
  if (rc < 0) {
    int err = errno;
    ::close(listen_fd_);
    listen_fd_ = -1;
    MCPWS_THROW(std::runtime_error("Failed to bind port " + std::to_string(config_.port) + ": " + std::strerror(err)));
  }

  if (::listen(listen_fd_, 128) < 0) {
    ::close(listen_fd_);
    listen_fd_ = -1;
    MCPWS_THROW(std::runtime_error("Failed to listen"));
  }

  struct sockaddr_storage bound;
  socklen_t len = sizeof(bound);
  if (::getsockname(listen_fd_, reinterpret_cast<struct sockaddr*>(&bound), &len) == 0) {
    port_ = bound.ss_family == AF_INET6 ? ntohs(reinterpret_cast<struct sockaddr_in6*>(&bound)->sin6_port)
                                        : ntohs(reinterpret_cast<struct sockaddr_in*>(&bound)->sin_port);
  } else {
    port_ = config_.port;
  }

  int flags = ::fcntl(listen_fd_, F_GETFL, 0);
  ::fcntl(listen_fd_, F_SETFL, flags | O_NONBLOCK);

  MCPWS_LOG_INFO("Server", "listening on " << config_.host << ":" << port_);
}

expected<void, ErrorCode> Server::start() {
  if (started_) {
    return expected<void, ErrorCode>::success();
  }
  if (shut_down_) {
    return expected<void, ErrorCode>::error(ErrorCode::kInvalidState);
  }

  if (config_.enable_discovery) {
    auto r = discovery_.start(port_, config_.workspace_folders, config_.ide_name, config_.host);
    if (!r) {
      MCPWS_LOG_ERROR("Server", "discovery failed: " << error_code_name(r.get_error()));
      return r;
    }
    token_ = discovery_.token();
  } else if (config_.require_auth) {
    auto token = generate_auth_token();
    if (!token) {
      return expected<void, ErrorCode>::error(token.get_error());
    }
    token_ = token.value();
  }
  authenticator_ = config_.require_auth ? Authenticator(token_, config_.auth_header) : Authenticator();

  if (config_.export_env) {
    ::setenv("ENABLE_IDE_INTEGRATION", "true", 1);
    ::setenv("CLAUDE_CODE_SSE_PORT", std::to_string(port_).c_str(), 1);
    env_exported_ = true;
  }

  caches_.create_defaults(config_.cache);
  caches_.start_cleanup(loop_, config_.cache.cleanup_interval);

  loop_.watch(
      listen_fd_, []() -> short { return POLLIN; }, [this](short) { accept_connections(); });

  housekeeping_timer_ = loop_.call_every(config_.housekeeping_interval, [this]() { housekeeping(); });
  if (config_.heartbeat_interval.count() > 0) {
    heartbeat_timer_ = loop_.call_every(config_.heartbeat_interval, [this]() { heartbeat(); });
  }

  started_ = true;
  MCPWS_LOG_INFO("Server", "started on port " << port_ << (config_.require_auth ? " (auth required)" : ""));
  return expected<void, ErrorCode>::success();
}

void Server::run() {
  auto r = start();
  if (!r) {
    MCPWS_THROW(std::runtime_error(std::string("Server start failed: ") + error_code_name(r.get_error())));
  }
  MCPWS_LOG_INFO("Server", "running");
  loop_.run();
  shutdown();
  MCPWS_LOG_INFO("Server", "stopped");
}

void Server::shutdown() {
  if (shut_down_) {
    return;
  }
  shut_down_ = true;

  if (housekeeping_timer_ != EventLoop::kInvalidTimer) loop_.cancel(housekeeping_timer_);
  if (heartbeat_timer_ != EventLoop::kInvalidTimer) loop_.cancel(heartbeat_timer_);
  housekeeping_timer_ = heartbeat_timer_ = EventLoop::kInvalidTimer;
  caches_.stop_cleanup();

  queue_.shutdown();

  for (auto& kv : sessions_) {
    dispatcher_.session_closed(kv.second);
  }
  sessions_.clear();

  for (auto& client : clients_) {
    loop_.unwatch(client.fd);
    client.conn->on_close = nullptr;
    client.conn->abort();
  }
  stats_.active_connections.store(0, std::memory_order_relaxed);
  clients_.clear();

  if (listen_fd_ >= 0) {
    loop_.unwatch(listen_fd_);
    ::close(listen_fd_);
    listen_fd_ = -1;
  }

  discovery_.stop();
  if (env_exported_) {
    ::unsetenv("ENABLE_IDE_INTEGRATION");
    ::unsetenv("CLAUDE_CODE_SSE_PORT");
    env_exported_ = false;
  }
  if (started_) {
    MCPWS_LOG_INFO("Server", "shut down");
  }
}

// ============================================================================
// Connections
// ============================================================================

void Server::accept_connections() {
  while (true) {
    int fd = ::accept4(listen_fd_, nullptr, nullptr, SOCK_NONBLOCK | SOCK_CLOEXEC);
    if (fd < 0) {
      int err = errno;
      if (err != EAGAIN && err != EWOULDBLOCK && err != EINTR) {
        MCPWS_LOG_ERROR("Server", "accept error: " << std::strerror(err));
        stats_.socket_errors.fetch_add(1, std::memory_order_relaxed);
      }
      return;
    }

    if (clients_.size() >= config_.max_connections || clients_.full()) {
      MCPWS_LOG_WARN("Server", "max connections reached, rejecting");
      stats_.rejected_connections.fetch_add(1, std::memory_order_relaxed);
      ::close(fd);
      continue;
    }

    apply_tcp_tuning(fd);

    ConnectionOptions opts;
    opts.max_message_size = config_.max_message_size;
    opts.max_send_buffer = config_.max_send_buffer;
    opts.handshake_timeout = config_.handshake_timeout;
    opts.close_timeout = config_.close_timeout;
    opts.authenticator = authenticator_;
    auto conn = std::make_shared<Connection>(sockpp::tcp_socket(fd), opts);

    conn->on_open = [this](const ConnPtr& c) { open_session(c); };
    conn->on_message = [this](const ConnPtr& c, std::string_view text) {
      stats_.messages_in.fetch_add(1, std::memory_order_relaxed);
      auto it = sessions_.find(c->get_id());
      if (it != sessions_.end()) {
        dispatcher_.handle_text(it->second, text);
      }
    };
    conn->on_close = [this](const ConnPtr& c, bool clean) { close_session(c, clean); };
    conn->on_error = [this](const ConnPtr&, ErrorCode code) {
      if (code == ErrorCode::kBufferFull) {
        stats_.slow_readers.fetch_add(1, std::memory_order_relaxed);
        return;
      }
      stats_.protocol_errors.fetch_add(1, std::memory_order_relaxed);
    };
    conn->on_rejected = [this](const ConnPtr&, const HttpRejection& rejection) {
      if (rejection.status == 401) {
        stats_.auth_failures.fetch_add(1, std::memory_order_relaxed);
      } else {
        stats_.handshake_errors.fetch_add(1, std::memory_order_relaxed);
      }
    };

    std::weak_ptr<Connection> weak = conn;
    loop_.watch(
        fd,
        [weak]() -> short {
          auto c = weak.lock();
          if (!c || c->is_closed()) return 0;
          short events = POLLIN;
          if (c->has_data_to_send()) events |= POLLOUT;
          return events;
        },
        [this, weak](short revents) {
          auto c = weak.lock();
          if (!c) return;
          handle_connection_io(c, revents);
          if (c->is_closed()) remove_closed_connections();
        });

    clients_.push_back(Client{conn, fd});
    stats_.total_connections.fetch_add(1, std::memory_order_relaxed);
    stats_.active_connections.fetch_add(1, std::memory_order_relaxed);
    MCPWS_LOG_DEBUG("Server", "accepted conn " << conn->get_id());
    if (on_connect) on_connect(conn);
  }
}

void Server::handle_connection_io(const ConnPtr& conn, short revents) {
  if (revents & POLLIN) {
    auto read_result = conn->handle_read();
    if (!read_result.has_value()) {
      if (read_result.get_error() == ErrorCode::kSocketError) {
        stats_.socket_errors.fetch_add(1, std::memory_order_relaxed);
      }
      conn->abort();
      return;
    }
  }

  if ((revents & POLLOUT) || conn->has_data_to_send()) {
    auto write_result = conn->handle_write();
    if (!write_result.has_value()) {
      stats_.socket_errors.fetch_add(1, std::memory_order_relaxed);
      conn->abort();
      return;
    }
  }

  if ((revents & (POLLERR | POLLHUP | POLLNVAL)) && !(revents & POLLIN)) {
    conn->abort();
  }
}

void Server::open_session(const ConnPtr& conn) {
  std::weak_ptr<Connection> weak = conn;
  auto send = [this, weak](const std::string& text) -> bool {
    auto c = weak.lock();
    if (!c || !c->send(text)) return false;
    stats_.messages_out.fetch_add(1, std::memory_order_relaxed);
    return true;
  };
  auto session = std::make_shared<Session>(conn->get_id(), loop_, send, config_.session);
  sessions_[conn->get_id()] = session;
  MCPWS_LOG_INFO("Server", "session " << session->id() << " opened");
}

void Server::close_session(const ConnPtr& conn, bool clean) {
  for (auto& client : clients_) {
    if (client.conn == conn) {
      loop_.unwatch(client.fd);
      break;
    }
  }
  auto it = sessions_.find(conn->get_id());
  if (it != sessions_.end()) {
    SessionPtr session = it->second;
    sessions_.erase(it);
    dispatcher_.session_closed(session);
    MCPWS_LOG_INFO("Server", "session " << session->id() << " closed" << (clean ? "" : " (unclean)"));
  }
  if (on_disconnect) on_disconnect(conn, clean);
}

void Server::housekeeping() {
  for (uint32_t i = 0; i < clients_.size(); ++i) {
    const ConnPtr& conn = clients_[i].conn;
    if (conn->is_handshake_timed_out()) {
      MCPWS_LOG_WARN("Server", "conn " << conn->get_id() << " handshake timed out");
      stats_.handshake_errors.fetch_add(1, std::memory_order_relaxed);
      conn->abort();
    } else if (conn->is_close_timed_out()) {
      conn->abort();
    }
  }
  remove_closed_connections();
}

void Server::heartbeat() {
  for (auto& client : clients_) {
    if (client.conn->get_state() == ConnectionState::kOpen) {
      client.conn->ping("heartbeat");
    }
  }
}

void Server::remove_closed_connections() {
  uint32_t removed = 0;
  uint32_t i = 0;
  while (i < clients_.size()) {
    if (clients_[i].conn->is_closed()) {
      loop_.unwatch(clients_[i].fd);
      clients_.swap_remove(i);
      ++removed;
    } else {
      ++i;
    }
  }
  if (removed > 0) {
    stats_.active_connections.fetch_sub(removed, std::memory_order_relaxed);
  }
}

Server::ConnPtr Server::find_connection(uint64_t id) const {
  for (const auto& client : clients_) {
    if (client.conn->get_id() == id) return client.conn;
  }
  return nullptr;
}

SessionPtr Server::find_session(uint64_t id) const {
  auto it = sessions_.find(id);
  return it == sessions_.end() ? nullptr : it->second;
}

std::vector<SessionPtr> Server::sessions() const {
  std::vector<SessionPtr> out;
  out.reserve(sessions_.size());
  for (const auto& kv : sessions_) out.push_back(kv.second);
  return out;
}

size_t Server::broadcast(const std::string& method, const Json::Value& params) {
  size_t sent = 0;
  for (const auto& session : sessions()) {
    if (session->is_ready() && session->notify(method, params)) {
      ++sent;
    }
  }
  return sent;
}

void Server::apply_tcp_tuning(int fd) {
  int opt = 1;

  if (tcp_tuning_.tcp_nodelay) {
    ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &opt, sizeof(opt));
  }

  if (tcp_tuning_.so_keepalive) {
    ::setsockopt(fd, SOL_SOCKET, SO_KEEPALIVE, &opt, sizeof(opt));

#ifdef TCP_KEEPIDLE
    ::setsockopt(fd, IPPROTO_TCP, TCP_KEEPIDLE, &tcp_tuning_.keepalive_idle_s, sizeof(tcp_tuning_.keepalive_idle_s));
#endif
#ifdef TCP_KEEPINTVL
    ::setsockopt(fd, IPPROTO_TCP, TCP_KEEPINTVL, &tcp_tuning_.keepalive_interval_s,
                 sizeof(tcp_tuning_.keepalive_interval_s));
#endif
#ifdef TCP_KEEPCNT
    ::setsockopt(fd, IPPROTO_TCP, TCP_KEEPCNT, &tcp_tuning_.keepalive_count, sizeof(tcp_tuning_.keepalive_count));
#endif
  }
}

}  // namespace mcpws
