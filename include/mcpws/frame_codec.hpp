#ifndef MCPWS_FRAME_CODEC_HPP_
#define MCPWS_FRAME_CODEC_HPP_

#include "vocabulary.hpp"

#include <cstddef>
#include <cstdint>

#include <string>
#include <string_view>
#include <vector>

namespace mcpws {

// ============================================================================
// WebSocket wire helpers (RFC 6455)
// ============================================================================

namespace ws {

enum class OpCode : uint8_t {
  kContinuation = 0x0,
  kText = 0x1,
  kBinary = 0x2,
  kClose = 0x8,
  kPing = 0x9,
  kPong = 0xA
};

// Close status codes used by the server.
enum CloseCode : uint16_t {
  kCloseNormal = 1000,
  kCloseGoingAway = 1001,
  kCloseProtocolError = 1002,
  kCloseUnsupportedData = 1003,
  kCloseNoStatus = 1005,
  kCloseInvalidPayload = 1007,
  kClosePolicyViolation = 1008,
  kCloseMessageTooBig = 1009,
  kCloseInternalError = 1011
};

constexpr size_t kMaxFrameHeaderSize = 14;
constexpr size_t kMaxControlPayload = 125;

struct FrameHeader {
  bool fin = false;
  uint8_t rsv = 0;  // RSV1..3 as the low three bits
  OpCode opcode = OpCode::kContinuation;
  bool masked = false;
  uint64_t payload_len = 0;
  uint8_t mask_key[4] = {0, 0, 0, 0};
};

inline bool is_control(OpCode op) { return (static_cast<uint8_t>(op) & 0x08) != 0; }

inline bool is_known_opcode(uint8_t op) {
  return op == 0x0 || op == 0x1 || op == 0x2 || op == 0x8 || op == 0x9 || op == 0xA;
}

// Parse a frame header from the start of data.
// Returns bytes consumed (including the mask key), or 0 if incomplete.
size_t parse_frame_header(std::string_view data, FrameHeader& header);

// Write a frame header into buf (at least kMaxFrameHeaderSize bytes).
// A non-null mask writes the mask bit and the four key bytes.
size_t encode_frame_header(uint8_t* buf, OpCode opcode, uint64_t payload_len, bool fin = true,
                           const uint8_t* mask = nullptr);

// Header plus payload in one buffer, masked with mask when given.
std::string encode_frame(OpCode opcode, std::string_view payload, bool fin = true,
                         const uint8_t* mask = nullptr);

// XOR with the mask key; offset is the position of data[0] within the payload.
void apply_mask(uint8_t* data, size_t len, const uint8_t* mask_key, uint64_t offset = 0);

std::string encode_close_payload(uint16_t code, std::string_view reason = {});

// Sec-WebSocket-Accept for a client Sec-WebSocket-Key.
std::string generate_accept_key(std::string_view client_key);

// Well-formed UTF-8: no overlong forms, surrogates or code points past U+10FFFF.
bool is_valid_utf8(std::string_view data);

}  // namespace ws

// ============================================================================
// Frame / FrameParser
// ============================================================================

/**
 * @brief One logical message or control frame, after reassembly.
 *
 * Text/binary frames carry the concatenated payload of every fragment and
 * the opcode of the first one. Close frames carry the decoded status code.
 */
struct Frame {
  ws::OpCode opcode = ws::OpCode::kText;
  bool fin = true;
  bool masked = false;
  std::string payload;
  uint16_t close_code = ws::kCloseNoStatus;
};

struct FrameError {
  uint16_t close_code = ws::kCloseProtocolError;
  std::string reason;
};

/**
 * @brief Incremental decoder for client-to-server frames.
 *
 * Accepts byte chunks of any size. Partial headers are buffered internally
 * and payload bytes are unmasked as they arrive, so a message never needs
 * to fit in the socket read buffer.
 */
class FrameParser {
 public:
  explicit FrameParser(size_t max_message_size, bool require_mask = true)
      : max_message_size_(max_message_size), require_mask_(require_mask) {}

  // Consume data completely. Finished frames are appended to out.
  // After an error the parser must not be fed again.
  expected<void, FrameError> feed(std::string_view data, std::vector<Frame>& out);

  void reset();

  bool in_fragmented_message() const { return fragment_open_; }
  size_t buffered_bytes() const { return header_buf_.size() + message_.size() + control_.size(); }
  size_t max_message_size() const { return max_message_size_; }

 private:
  expected<void, FrameError> begin_frame(const ws::FrameHeader& header);
  expected<void, FrameError> finish_frame(std::vector<Frame>& out);

  size_t max_message_size_;
  bool require_mask_;

  std::string header_buf_;
  bool in_payload_ = false;
  ws::FrameHeader current_{};
  uint64_t payload_read_ = 0;

  // Data message being reassembled across continuation frames.
  bool fragment_open_ = false;
  ws::OpCode message_opcode_ = ws::OpCode::kText;
  std::string message_;

  // Payload of the control frame in progress.
  std::string control_;
};

}  // namespace mcpws

#endif  // MCPWS_FRAME_CODEC_HPP_
