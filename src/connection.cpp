#include "mcpws/connection.hpp"

#include "mcpws/log.hpp"

#include <cerrno>
#include <cstring>

#include <atomic>
#include <sys/socket.h>
#include <sys/uio.h>

namespace mcpws {

namespace detail {

expected<void, ErrorCode> handshake_on_data(Connection& conn, std::string_view data) {
  return conn.process_handshake(data);
}

expected<void, ErrorCode> handshake_on_send(Connection&, std::string_view, ws::OpCode) {
  return expected<void, ErrorCode>::error(ErrorCode::kInvalidState);
}

expected<void, ErrorCode> handshake_on_close(Connection& conn, uint16_t, std::string_view) {
  conn.abort();
  return expected<void, ErrorCode>::success();
}

expected<void, ErrorCode> open_on_data(Connection& conn, std::string_view data) {
  return conn.process_frames(data);
}

expected<void, ErrorCode> open_on_send(Connection& conn, std::string_view payload, ws::OpCode opcode) {
  if (ws::is_control(opcode) && payload.size() > ws::kMaxControlPayload) {
    return expected<void, ErrorCode>::error(ErrorCode::kProtocolError);
  }
  if (conn.send_buffer_full(payload.size())) {
    conn.fail_slow_reader();
    return expected<void, ErrorCode>::error(ErrorCode::kBufferFull);
  }
  conn.write_frame(payload, opcode);
  return expected<void, ErrorCode>::success();
}

expected<void, ErrorCode> open_on_close(Connection& conn, uint16_t code, std::string_view reason) {
  conn.write_close_frame(code, reason);
  conn.transition_to_state(ConnectionState::kClosing);
  return expected<void, ErrorCode>::success();
}

// Still reads after our close frame, to see the peer's reply.
expected<void, ErrorCode> closing_on_data(Connection& conn, std::string_view data) {
  if (!conn.close_sent()) {
    return expected<void, ErrorCode>::success();
  }
  return conn.process_frames(data);
}

expected<void, ErrorCode> closing_on_send(Connection&, std::string_view, ws::OpCode) {
  return expected<void, ErrorCode>::error(ErrorCode::kInvalidState);
}

expected<void, ErrorCode> closing_on_close(Connection&, uint16_t, std::string_view) {
  return expected<void, ErrorCode>::success();
}

expected<void, ErrorCode> closed_on_data(Connection&, std::string_view) {
  return expected<void, ErrorCode>::error(ErrorCode::kConnectionClosed);
}

expected<void, ErrorCode> closed_on_send(Connection&, std::string_view, ws::OpCode) {
  return expected<void, ErrorCode>::error(ErrorCode::kConnectionClosed);
}

expected<void, ErrorCode> closed_on_close(Connection&, uint16_t, std::string_view) {
  return expected<void, ErrorCode>::error(ErrorCode::kConnectionClosed);
}

}  // namespace detail

namespace {

const StateOps kHandshakeOps = {ConnectionState::kHandshaking, detail::handshake_on_data, detail::handshake_on_send,
                                detail::handshake_on_close};
const StateOps kOpenOps = {ConnectionState::kOpen, detail::open_on_data, detail::open_on_send, detail::open_on_close};
const StateOps kClosingOps = {ConnectionState::kClosing, detail::closing_on_data, detail::closing_on_send,
                              detail::closing_on_close};
const StateOps kClosedOps = {ConnectionState::kClosed, detail::closed_on_data, detail::closed_on_send,
                             detail::closed_on_close};

uint64_t next_conn_id() {
  static std::atomic<uint64_t> id{1};
  return id.fetch_add(1, std::memory_order_relaxed);
}

}  // namespace

const char* connection_state_name(ConnectionState state) {
  switch (state) {
    case ConnectionState::kHandshaking: return "handshaking";
    case ConnectionState::kOpen: return "open";
    case ConnectionState::kClosing: return "closing";
    case ConnectionState::kClosed: return "closed";
  }
  return "?";
}

Connection::Connection(sockpp::tcp_socket&& sock, const ConnectionOptions& options)
    : id_(next_conn_id()), socket_(std::move(sock)), options_(options), ops_(&kHandshakeOps),
      parser_(options.max_message_size) {
  socket_.set_non_blocking(true);
}

Connection::Connection(int fd, const ConnectionOptions& options)
    : id_(next_conn_id()), socket_(fd), options_(options), ops_(&kHandshakeOps), parser_(options.max_message_size) {
  socket_.set_non_blocking(true);
}

Connection::~Connection() {
  if (socket_.is_open()) socket_.close();
}

expected<void, ErrorCode> Connection::handle_read() {
  char temp[kTempReadSize];
  ssize_t n = ::recv(socket_.handle(), temp, sizeof(temp), 0);
  if (n > 0) {
    touch_activity();
    auto result = ops_->on_data(*this, std::string_view(temp, static_cast<size_t>(n)));
    if (!result.has_value()) {
      last_error_code_ = result.get_error();
    }
    maybe_finish();
    return expected<void, ErrorCode>::success();
  }
  if (n == 0) {
    peer_closed_ = true;
    last_error_code_ = ErrorCode::kConnectionClosed;
    return expected<void, ErrorCode>::error(ErrorCode::kConnectionClosed);
  }
  int err = errno;
  if (err != EAGAIN && err != EWOULDBLOCK && err != EINTR) {
    last_error_code_ = ErrorCode::kSocketError;
    MCPWS_LOG_DEBUG("Conn", "conn " << id_ << " read error: " << std::strerror(err));
    return expected<void, ErrorCode>::error(ErrorCode::kSocketError);
  }
  return expected<void, ErrorCode>::success();
}

expected<void, ErrorCode> Connection::handle_write() {
  if (tx_queue_.empty()) {
    maybe_finish();
    return expected<void, ErrorCode>::success();
  }

  // Gather whole queued frames; a frame is never split across writers.
  struct iovec iov[kMaxIov];
  size_t iov_count = 0;
  for (auto it = tx_queue_.begin(); it != tx_queue_.end() && iov_count < kMaxIov; ++it, ++iov_count) {
    size_t offset = iov_count == 0 ? tx_offset_ : 0;
    iov[iov_count].iov_base = const_cast<char*>(it->data() + offset);
    iov[iov_count].iov_len = it->size() - offset;
  }

  struct msghdr msg;
  std::memset(&msg, 0, sizeof(msg));
  msg.msg_iov = iov;
  msg.msg_iovlen = iov_count;
  ssize_t n = ::sendmsg(socket_.handle(), &msg, MSG_NOSIGNAL);
  if (n < 0) {
    int err = errno;
    if (err != EAGAIN && err != EWOULDBLOCK && err != EINTR) {
      last_error_code_ = ErrorCode::kSocketError;
      MCPWS_LOG_DEBUG("Conn", "conn " << id_ << " write error: " << std::strerror(err));
      return expected<void, ErrorCode>::error(ErrorCode::kSocketError);
    }
    return expected<void, ErrorCode>::success();
  }

  size_t written = static_cast<size_t>(n);
  while (written > 0 && !tx_queue_.empty()) {
    size_t remaining = tx_queue_.front().size() - tx_offset_;
    if (written >= remaining) {
      written -= remaining;
      tx_bytes_ -= remaining;
      tx_queue_.pop_front();
      tx_offset_ = 0;
    } else {
      tx_offset_ += written;
      tx_bytes_ -= written;
      written = 0;
    }
  }
  maybe_finish();
  return expected<void, ErrorCode>::success();
}

void Connection::close(uint16_t code, std::string_view reason) {
  if (get_state() == ConnectionState::kClosed) {
    return;
  }
  auto result = ops_->on_close(*this, code, reason);
  if (!result.has_value()) {
    MCPWS_LOG_DEBUG("Conn", "conn " << id_ << " close ignored: " << error_code_name(result.get_error()));
  }
}

void Connection::abort() {
  if (get_state() != ConnectionState::kClosed) {
    finish();
  }
}

void Connection::transition_to_state(ConnectionState state) {
  switch (state) {
    case ConnectionState::kHandshaking:
      ops_ = &kHandshakeOps;
      break;
    case ConnectionState::kOpen:
      ops_ = &kOpenOps;
      if (on_open) {
        on_open(shared_from_this());
      }
      break;
    case ConnectionState::kClosing:
      ops_ = &kClosingOps;
      closing_at_ = SteadyClock::now();
      break;
    case ConnectionState::kClosed:
      if (ops_ == &kClosedOps) return;
      ops_ = &kClosedOps;
      if (on_close) {
        on_close(shared_from_this(), close_sent_ && peer_closed_);
      }
      break;
  }
}

expected<void, ErrorCode> Connection::process_handshake(std::string_view data) {
  handshake_buf_.append(data.data(), data.size());
  size_t end = handshake_buf_.find("\r\n\r\n");
  if (end == std::string::npos || end + 4 > kMaxHandshakeSize) {
    if (handshake_buf_.size() > kMaxHandshakeSize) {
      reject(HttpRejection{400, "upgrade request too large"});
      return expected<void, ErrorCode>::error(ErrorCode::kHandshakeFailed);
    }
    return expected<void, ErrorCode>::success();
  }

  std::string rest = handshake_buf_.substr(end + 4);
  handshake_buf_.resize(end + 4);
  auto parsed = parse_upgrade_request(handshake_buf_);
  handshake_buf_.clear();
  handshake_buf_.shrink_to_fit();
  if (!parsed.has_value()) {
    reject(parsed.get_error());
    return expected<void, ErrorCode>::error(ErrorCode::kHandshakeFailed);
  }

  auto auth = options_.authenticator.check(parsed.value());
  if (!auth.has_value()) {
    reject(auth.get_error());
    return expected<void, ErrorCode>::error(ErrorCode::kAuthFailed);
  }

  upgrade_request_ = parsed.value();
  authenticated_ = true;
  enqueue(build_accept_response(upgrade_request_));
  MCPWS_LOG_DEBUG("Conn", "conn " << id_ << " upgraded " << upgrade_request_.target);
  transition_to_state(ConnectionState::kOpen);

  if (!rest.empty() && get_state() == ConnectionState::kOpen) {
    return process_frames(rest);
  }
  return expected<void, ErrorCode>::success();
}

expected<void, ErrorCode> Connection::process_frames(std::string_view data) {
  if (close_after_flush_) {
    return expected<void, ErrorCode>::success();
  }

  frames_.clear();
  auto result = parser_.feed(data, frames_);
  std::vector<Frame> frames;
  frames.swap(frames_);
  for (auto& frame : frames) {
    if (close_after_flush_ || get_state() == ConnectionState::kClosed) break;
    dispatch_frame(frame);
  }

  if (!result.has_value() && !close_after_flush_) {
    fail(result.get_error());
    return expected<void, ErrorCode>::error(last_error_code_);
  }
  return expected<void, ErrorCode>::success();
}

void Connection::dispatch_frame(Frame& frame) {
  switch (frame.opcode) {
    case ws::OpCode::kText:
    case ws::OpCode::kBinary:
      if (get_state() == ConnectionState::kOpen && on_message) {
        on_message(shared_from_this(), frame.payload);
      }
      break;

    case ws::OpCode::kPing:
      if (!close_sent_) {
        write_frame(frame.payload, ws::OpCode::kPong);
      }
      break;

    case ws::OpCode::kPong:
      break;

    case ws::OpCode::kClose:
      peer_closed_ = true;
      if (!close_sent_) {
        uint16_t code = frame.close_code == ws::kCloseNoStatus ? static_cast<uint16_t>(ws::kCloseNormal) : frame.close_code;
        write_close_frame(code, {});
        transition_to_state(ConnectionState::kClosing);
      }
      close_after_flush_ = true;
      break;

    case ws::OpCode::kContinuation:
      break;
  }
}

void Connection::write_frame(std::string_view payload, ws::OpCode opcode) {
  enqueue(ws::encode_frame(opcode, payload));
}

void Connection::write_close_frame(uint16_t code, std::string_view reason) {
  enqueue(ws::encode_frame(ws::OpCode::kClose, ws::encode_close_payload(code, reason)));
  close_sent_ = true;
}

void Connection::reject(const HttpRejection& rejection) {
  last_error_code_ = rejection.status == 401 ? ErrorCode::kAuthFailed : ErrorCode::kHandshakeFailed;
  MCPWS_LOG_WARN("Conn", "conn " << id_ << " upgrade rejected (" << rejection.status << "): " << rejection.reason);
  if (on_rejected) {
    on_rejected(shared_from_this(), rejection);
  }
  enqueue(build_rejection_response(rejection));
  close_after_flush_ = true;
  transition_to_state(ConnectionState::kClosing);
}

void Connection::fail(const FrameError& error) {
  last_error_code_ =
      error.close_code == ws::kCloseMessageTooBig ? ErrorCode::kMessageTooLarge : ErrorCode::kProtocolError;
  MCPWS_LOG_WARN("Conn", "conn " << id_ << " protocol violation (" << error.close_code << "): " << error.reason);
  if (on_error) {
    on_error(shared_from_this(), last_error_code_);
  }
  if (!close_sent_) {
    write_close_frame(error.close_code, error.reason);
    if (get_state() == ConnectionState::kOpen) {
      transition_to_state(ConnectionState::kClosing);
    }
  }
  close_after_flush_ = true;
}

// The close frame may never drain; the close timeout reaps the socket.
void Connection::fail_slow_reader() {
  last_error_code_ = ErrorCode::kBufferFull;
  MCPWS_LOG_WARN("Conn", "conn " << id_ << " send buffer full (" << tx_bytes_ << " bytes queued), closing");
  if (on_error) {
    on_error(shared_from_this(), last_error_code_);
  }
  if (!close_sent_) {
    write_close_frame(ws::kClosePolicyViolation, "send buffer full");
    transition_to_state(ConnectionState::kClosing);
  }
  close_after_flush_ = true;
}

void Connection::enqueue(std::string bytes) {
  tx_bytes_ += bytes.size();
  tx_queue_.push_back(std::move(bytes));
}

void Connection::maybe_finish() {
  if (close_after_flush_ && tx_queue_.empty() && get_state() != ConnectionState::kClosed) {
    finish();
  }
}

void Connection::finish() {
  if (socket_.is_open()) {
    socket_.close();
  }
  transition_to_state(ConnectionState::kClosed);
}

}  // namespace mcpws
