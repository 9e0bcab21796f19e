#include "mcpws.hpp"

#include <sys/socket.h>
#include <unistd.h>

#include <catch2/catch_test_macros.hpp>

using namespace mcpws;

namespace {

// One end of a socketpair wrapped in a Connection, the other end read raw.
struct PairFixture {
  int peer = -1;
  std::shared_ptr<Connection> conn;
  std::vector<ErrorCode> errors;

  explicit PairFixture(size_t max_send_buffer) {
    int fds[2];
    REQUIRE(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds) == 0);
    peer = fds[1];
    ConnectionOptions opts;
    opts.max_send_buffer = max_send_buffer;
    conn = std::make_shared<Connection>(fds[0], opts);
    conn->on_error = [this](const std::shared_ptr<Connection>&, ErrorCode code) { errors.push_back(code); };
  }

  ~PairFixture() {
    conn->abort();
    ::close(peer);
  }

  void upgrade() {
    std::string req =
        "GET / HTTP/1.1\r\n"
        "Host: 127.0.0.1\r\n"
        "Upgrade: websocket\r\n"
        "Connection: Upgrade\r\n"
        "Sec-WebSocket-Key: dGhlIHNhbXBsZSBub25jZQ==\r\n"
        "Sec-WebSocket-Version: 13\r\n\r\n";
    REQUIRE(::write(peer, req.data(), req.size()) == static_cast<ssize_t>(req.size()));
    REQUIRE(conn->handle_read());
    REQUIRE(conn->get_state() == ConnectionState::kOpen);
  }

  // Flushes the connection and returns the frames the peer received after the 101 head.
  std::vector<Frame> drain() {
    REQUIRE(conn->handle_write());
    std::string raw;
    char buf[8192];
    ssize_t n = ::recv(peer, buf, sizeof(buf), MSG_DONTWAIT);
    if (n > 0) raw.assign(buf, static_cast<size_t>(n));
    if (raw.compare(0, 12, "HTTP/1.1 101") == 0) {
      raw.erase(0, raw.find("\r\n\r\n") + 4);
    }
    FrameParser parser(1024 * 1024, false);
    std::vector<Frame> frames;
    REQUIRE(parser.feed(raw, frames));
    return frames;
  }
};

}  // namespace

TEST_CASE("Connection - draining the send buffer makes room", "[connection]") {
  PairFixture f(1024);
  f.upgrade();
  std::string payload(600, 'a');

  REQUIRE(f.conn->send(payload));
  auto frames = f.drain();
  REQUIRE(frames.size() == 1);
  REQUIRE(frames[0].payload == payload);
  REQUIRE(f.conn->tx_bytes() == 0);

  REQUIRE(f.conn->send(payload));
  REQUIRE(f.conn->get_state() == ConnectionState::kOpen);
  REQUIRE(f.errors.empty());
}

TEST_CASE("Connection - a peer that stops reading is closed with 1008", "[connection]") {
  PairFixture f(1024);
  f.upgrade();
  std::string payload(600, 'b');

  REQUIRE(f.conn->send(payload));
  REQUIRE_FALSE(f.conn->send(payload));
  REQUIRE(f.conn->get_state() == ConnectionState::kClosing);
  REQUIRE(f.conn->get_last_error() == ErrorCode::kBufferFull);
  REQUIRE(f.errors.size() == 1);
  REQUIRE(f.errors[0] == ErrorCode::kBufferFull);

  // Nothing more is queued once closing.
  size_t queued = f.conn->tx_bytes();
  REQUIRE_FALSE(f.conn->send("x"));
  REQUIRE(f.conn->tx_bytes() == queued);

  auto frames = f.drain();
  REQUIRE(frames.size() == 2);
  REQUIRE(frames[0].payload == payload);
  REQUIRE(frames[1].opcode == ws::OpCode::kClose);
  REQUIRE(frames[1].close_code == ws::kClosePolicyViolation);
  REQUIRE(frames[1].payload == "send buffer full");
  REQUIRE(f.conn->get_state() == ConnectionState::kClosed);
}
