#ifndef MCPWS_CONNECTION_HPP_
#define MCPWS_CONNECTION_HPP_

#include "frame_codec.hpp"
#include "handshake.hpp"
#include "vocabulary.hpp"

#include <cstdint>

#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <sockpp/tcp_socket.h>
#include <string>
#include <string_view>
#include <vector>

namespace mcpws {

// ============================================================================
// Connection state (function-pointer state machine, no virtual)
// ============================================================================

enum class ConnectionState : uint8_t {
  kHandshaking,  // Waiting for HTTP upgrade request
  kOpen,         // WebSocket connection established
  kClosing,      // Close frame or HTTP rejection sent, draining
  kClosed        // Socket released
};

const char* connection_state_name(ConnectionState state);

class Connection;

using StateDataHandler = expected<void, ErrorCode> (*)(Connection& conn, std::string_view data);
using StateSendHandler = expected<void, ErrorCode> (*)(Connection& conn, std::string_view payload, ws::OpCode opcode);
using StateCloseHandler = expected<void, ErrorCode> (*)(Connection& conn, uint16_t code, std::string_view reason);

struct StateOps {
  ConnectionState state;
  StateDataHandler on_data;
  StateSendHandler on_send;
  StateCloseHandler on_close;
};

struct ConnectionOptions {
  size_t max_message_size = 1024 * 1024;
  size_t max_send_buffer = 8 * 1024 * 1024;  // queued bytes before the peer is closed with 1008
  std::chrono::milliseconds handshake_timeout{5000};
  std::chrono::milliseconds close_timeout{5000};
  Authenticator authenticator;
};

// ============================================================================
// Connection - one client socket: upgrade, framing, ordered writes
// ============================================================================

class Connection : public std::enable_shared_from_this<Connection> {
 public:
  static constexpr size_t kTempReadSize = 16384;
  static constexpr size_t kMaxIov = 64;

  using ConnPtr = std::shared_ptr<Connection>;

  explicit Connection(sockpp::tcp_socket&& sock, const ConnectionOptions& options = ConnectionOptions());
  explicit Connection(int fd, const ConnectionOptions& options = ConnectionOptions());
  ~Connection();

  Connection(const Connection&) = delete;
  Connection& operator=(const Connection&) = delete;

  // Reactor I/O
  // error(kConnectionClosed) on peer EOF, error(kSocketError) on failure.
  expected<void, ErrorCode> handle_read();
  expected<void, ErrorCode> handle_write();

  // User API. Frames are queued whole; false once the connection is not open.
  bool send(std::string_view text) { return ops_->on_send(*this, text, ws::OpCode::kText).has_value(); }
  bool send_binary(std::string_view data) { return ops_->on_send(*this, data, ws::OpCode::kBinary).has_value(); }
  bool ping(std::string_view payload = {}) { return ops_->on_send(*this, payload, ws::OpCode::kPing).has_value(); }

  // Starts the close handshake; a connection still handshaking is dropped.
  void close(uint16_t code = ws::kCloseNormal, std::string_view reason = {});

  // Releases the socket now, without a close handshake.
  void abort();

  bool is_closed() const { return get_state() == ConnectionState::kClosed || !socket_.is_open(); }
  bool has_data_to_send() const { return !tx_queue_.empty(); }
  size_t tx_bytes() const { return tx_bytes_; }
  int get_fd() const { return socket_.handle(); }
  uint64_t get_id() const { return id_; }

  bool authenticated() const { return authenticated_; }
  bool initialized() const { return initialized_; }
  void set_initialized(bool value) { initialized_ = value; }

  // Valid once the upgrade was accepted.
  const UpgradeRequest& upgrade_request() const { return upgrade_request_; }

  // Timeout checks
  bool is_handshake_timed_out() const {
    return get_state() == ConnectionState::kHandshaking && SteadyClock::now() - created_at_ > options_.handshake_timeout;
  }

  bool is_close_timed_out() const {
    return get_state() == ConnectionState::kClosing && SteadyClock::now() - closing_at_ > options_.close_timeout;
  }

  void touch_activity() { last_activity_ = SteadyClock::now(); }
  uint64_t idle_ms() const {
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(SteadyClock::now() - last_activity_).count());
  }

  // Callbacks
  std::function<void(const ConnPtr&)> on_open;
  std::function<void(const ConnPtr&, std::string_view)> on_message;
  std::function<void(const ConnPtr&, bool clean)> on_close;
  std::function<void(const ConnPtr&, ErrorCode)> on_error;
  std::function<void(const ConnPtr&, const HttpRejection&)> on_rejected;

  // State query
  ConnectionState get_state() const { return ops_->state; }
  ErrorCode get_last_error() const { return last_error_code_; }

  // Internal API (public to avoid friend, used by state handlers)
  void transition_to_state(ConnectionState state);
  expected<void, ErrorCode> process_handshake(std::string_view data);
  expected<void, ErrorCode> process_frames(std::string_view data);
  void write_frame(std::string_view payload, ws::OpCode opcode);
  void write_close_frame(uint16_t code, std::string_view reason);
  void reject(const HttpRejection& rejection);
  void fail(const FrameError& error);
  // True when queueing n more bytes would pass max_send_buffer.
  bool send_buffer_full(size_t n) const { return tx_bytes_ + n > options_.max_send_buffer; }
  void fail_slow_reader();
  void close_after_flush() { close_after_flush_ = true; }
  void note_peer_close() { peer_closed_ = true; }
  bool close_sent() const { return close_sent_; }

 private:
  using SteadyClock = std::chrono::steady_clock;
  using TimePoint = SteadyClock::time_point;

  void dispatch_frame(Frame& frame);
  void enqueue(std::string bytes);
  void maybe_finish();
  void finish();

  uint64_t id_;
  sockpp::tcp_socket socket_;
  ConnectionOptions options_;
  const StateOps* ops_ = nullptr;

  std::string handshake_buf_;
  UpgradeRequest upgrade_request_;
  FrameParser parser_;
  std::vector<Frame> frames_;

  std::deque<std::string> tx_queue_;
  size_t tx_offset_ = 0;  // bytes of tx_queue_.front() already written
  size_t tx_bytes_ = 0;

  bool authenticated_ = false;
  bool initialized_ = false;
  bool close_sent_ = false;
  bool peer_closed_ = false;
  bool close_after_flush_ = false;
  ErrorCode last_error_code_ = ErrorCode::kOk;

  TimePoint created_at_ = SteadyClock::now();
  TimePoint closing_at_{};
  TimePoint last_activity_ = SteadyClock::now();
};

}  // namespace mcpws

#endif  // MCPWS_CONNECTION_HPP_
