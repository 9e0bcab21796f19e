#include "mcpws/frame_codec.hpp"

#include "mcpws/crypto.hpp"

#include <algorithm>

namespace mcpws {

namespace ws {

size_t parse_frame_header(std::string_view data, FrameHeader& header) {
  if (data.size() < 2) return 0;

  auto byte = [&data](size_t i) { return static_cast<uint8_t>(data[i]); };

  header.fin = (byte(0) & 0x80) != 0;
  header.rsv = static_cast<uint8_t>((byte(0) >> 4) & 0x07);
  header.opcode = static_cast<OpCode>(byte(0) & 0x0F);
  header.masked = (byte(1) & 0x80) != 0;

  uint64_t len = byte(1) & 0x7F;
  size_t header_size = 2;

  if (len == 126) {
    if (data.size() < 4) return 0;
    len = (static_cast<uint64_t>(byte(2)) << 8) | byte(3);
    header_size = 4;
  } else if (len == 127) {
    if (data.size() < 10) return 0;
    len = 0;
    for (size_t i = 2; i < 10; ++i) {
      len = (len << 8) | byte(i);
    }
    header_size = 10;
  }
  header.payload_len = len;

  if (header.masked) {
    if (data.size() < header_size + 4) return 0;
    for (size_t i = 0; i < 4; ++i) {
      header.mask_key[i] = byte(header_size + i);
    }
    header_size += 4;
  }
  return header_size;
}

size_t encode_frame_header(uint8_t* buf, OpCode opcode, uint64_t payload_len, bool fin,
                           const uint8_t* mask) {
  size_t pos = 0;
  buf[pos++] = static_cast<uint8_t>((fin ? 0x80 : 0x00) | static_cast<uint8_t>(opcode));
  uint8_t mask_bit = mask != nullptr ? 0x80 : 0x00;

  if (payload_len < 126) {
    buf[pos++] = static_cast<uint8_t>(mask_bit | payload_len);
  } else if (payload_len <= 0xFFFF) {
    buf[pos++] = static_cast<uint8_t>(mask_bit | 126);
    buf[pos++] = static_cast<uint8_t>(payload_len >> 8);
    buf[pos++] = static_cast<uint8_t>(payload_len);
  } else {
    buf[pos++] = static_cast<uint8_t>(mask_bit | 127);
    for (int shift = 56; shift >= 0; shift -= 8) {
      buf[pos++] = static_cast<uint8_t>(payload_len >> shift);
    }
  }

  if (mask != nullptr) {
    std::copy(mask, mask + 4, buf + pos);
    pos += 4;
  }
  return pos;
}

std::string encode_frame(OpCode opcode, std::string_view payload, bool fin, const uint8_t* mask) {
  uint8_t header[kMaxFrameHeaderSize];
  size_t header_len = encode_frame_header(header, opcode, payload.size(), fin, mask);

  std::string frame;
  frame.reserve(header_len + payload.size());
  frame.append(reinterpret_cast<const char*>(header), header_len);
  size_t body = frame.size();
  frame.append(payload.data(), payload.size());
  if (mask != nullptr && !payload.empty()) {
    apply_mask(reinterpret_cast<uint8_t*>(&frame[body]), payload.size(), mask);
  }
  return frame;
}

void apply_mask(uint8_t* data, size_t len, const uint8_t* mask_key, uint64_t offset) {
  for (size_t i = 0; i < len; ++i) {
    data[i] ^= mask_key[(offset + i) & 0x03];
  }
}

std::string encode_close_payload(uint16_t code, std::string_view reason) {
  std::string payload;
  payload.push_back(static_cast<char>(code >> 8));
  payload.push_back(static_cast<char>(code & 0xFF));
  size_t take = std::min(reason.size(), kMaxControlPayload - 2);
  while (take < reason.size() && take > 0 && (static_cast<uint8_t>(reason[take]) & 0xC0) == 0x80) {
    --take;
  }
  payload.append(reason.data(), take);
  return payload;
}

std::string generate_accept_key(std::string_view client_key) {
  constexpr std::string_view kMagic = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";
  SHA1 sha1;
  sha1.update(reinterpret_cast<const uint8_t*>(client_key.data()), client_key.size());
  sha1.update(reinterpret_cast<const uint8_t*>(kMagic.data()), kMagic.size());
  SHA1::Digest digest = sha1.finalize();
  return Base64::encode(digest.data(), digest.size());
}

bool is_valid_utf8(std::string_view data) {
  const auto* p = reinterpret_cast<const uint8_t*>(data.data());
  size_t n = data.size();
  size_t i = 0;
  while (i < n) {
    uint8_t c = p[i];
    if (c < 0x80) {
      ++i;
      continue;
    }
    size_t len;
    uint8_t lo = 0x80;
    uint8_t hi = 0xBF;
    if (c >= 0xC2 && c <= 0xDF) {
      len = 2;
    } else if (c >= 0xE0 && c <= 0xEF) {
      len = 3;
      if (c == 0xE0) lo = 0xA0;
      if (c == 0xED) hi = 0x9F;
    } else if (c >= 0xF0 && c <= 0xF4) {
      len = 4;
      if (c == 0xF0) lo = 0x90;
      if (c == 0xF4) hi = 0x8F;
    } else {
      return false;
    }
    if (n - i < len) return false;
    // The bounds tighten only for the second byte.
    if (p[i + 1] < lo || p[i + 1] > hi) return false;
    for (size_t k = 2; k < len; ++k) {
      if ((p[i + k] & 0xC0) != 0x80) return false;
    }
    i += len;
  }
  return true;
}

}  // namespace ws

namespace {

bool is_valid_close_code(uint16_t code) {
  if (code >= 3000 && code <= 4999) return true;
  switch (code) {
    case 1000: case 1001: case 1002: case 1003:
    case 1007: case 1008: case 1009: case 1010: case 1011:
      return true;
    default:
      return false;
  }
}

expected<void, FrameError> fail(uint16_t code, std::string reason) {
  return expected<void, FrameError>::error(FrameError{code, std::move(reason)});
}

}  // namespace

void FrameParser::reset() {
  header_buf_.clear();
  in_payload_ = false;
  current_ = ws::FrameHeader{};
  payload_read_ = 0;
  fragment_open_ = false;
  message_.clear();
  control_.clear();
}

expected<void, FrameError> FrameParser::feed(std::string_view data, std::vector<Frame>& out) {
  size_t pos = 0;
  while (pos < data.size()) {
    if (!in_payload_) {
      size_t before = header_buf_.size();
      size_t take = std::min(ws::kMaxFrameHeaderSize - before, data.size() - pos);
      header_buf_.append(data.data() + pos, take);

      ws::FrameHeader header;
      size_t header_len = ws::parse_frame_header(header_buf_, header);
      if (header_len == 0) {
        pos += take;
        continue;
      }
      pos += header_len - before;
      header_buf_.clear();

      auto started = begin_frame(header);
      if (!started) return started;
      if (current_.payload_len == 0) {
        auto done = finish_frame(out);
        if (!done) return done;
      }
      continue;
    }

    uint64_t remaining = current_.payload_len - payload_read_;
    size_t n = static_cast<size_t>(std::min<uint64_t>(remaining, data.size() - pos));
    std::string& target = ws::is_control(current_.opcode) ? control_ : message_;
    size_t old_size = target.size();
    target.append(data.data() + pos, n);
    if (current_.masked) {
      ws::apply_mask(reinterpret_cast<uint8_t*>(&target[old_size]), n, current_.mask_key, payload_read_);
    }
    payload_read_ += n;
    pos += n;

    if (payload_read_ == current_.payload_len) {
      auto done = finish_frame(out);
      if (!done) return done;
    }
  }
  return expected<void, FrameError>::success();
}

expected<void, FrameError> FrameParser::begin_frame(const ws::FrameHeader& header) {
  uint8_t op = static_cast<uint8_t>(header.opcode);
  if (header.rsv != 0) {
    return fail(ws::kCloseProtocolError, "reserved bits set without extension");
  }
  if (!ws::is_known_opcode(op)) {
    return fail(ws::kCloseProtocolError, "unknown opcode " + std::to_string(op));
  }
  if (require_mask_ && !header.masked) {
    return fail(ws::kCloseProtocolError, "client frame is not masked");
  }
  if ((header.payload_len >> 63) != 0) {
    return fail(ws::kCloseProtocolError, "invalid payload length");
  }

  if (ws::is_control(header.opcode)) {
    if (!header.fin) {
      return fail(ws::kCloseProtocolError, "fragmented control frame");
    }
    if (header.payload_len > ws::kMaxControlPayload) {
      return fail(ws::kCloseProtocolError, "control frame payload exceeds 125 bytes");
    }
    control_.clear();
  } else {
    if (header.opcode == ws::OpCode::kContinuation) {
      if (!fragment_open_) {
        return fail(ws::kCloseProtocolError, "continuation frame without a message");
      }
    } else if (fragment_open_) {
      return fail(ws::kCloseProtocolError, "data frame inside fragmented message");
    }
    if (header.payload_len > max_message_size_ - std::min(message_.size(), max_message_size_)) {
      return fail(ws::kCloseMessageTooBig, "message exceeds " + std::to_string(max_message_size_) + " bytes");
    }
    if (header.opcode != ws::OpCode::kContinuation) {
      message_opcode_ = header.opcode;
      message_.clear();
      message_.reserve(static_cast<size_t>(header.payload_len));
      fragment_open_ = true;
    }
  }

  current_ = header;
  payload_read_ = 0;
  in_payload_ = true;
  return expected<void, FrameError>::success();
}

expected<void, FrameError> FrameParser::finish_frame(std::vector<Frame>& out) {
  in_payload_ = false;

  if (ws::is_control(current_.opcode)) {
    Frame frame;
    frame.opcode = current_.opcode;
    frame.masked = current_.masked;
    if (current_.opcode == ws::OpCode::kClose && !control_.empty()) {
      if (control_.size() < 2) {
        return fail(ws::kCloseProtocolError, "close payload of one byte");
      }
      uint16_t code = static_cast<uint16_t>((static_cast<uint8_t>(control_[0]) << 8) |
                                            static_cast<uint8_t>(control_[1]));
      if (!is_valid_close_code(code)) {
        return fail(ws::kCloseProtocolError, "invalid close code " + std::to_string(code));
      }
      frame.close_code = code;
      frame.payload = control_.substr(2);
      if (!ws::is_valid_utf8(frame.payload)) {
        return fail(ws::kCloseInvalidPayload, "close reason is not valid UTF-8");
      }
    } else {
      frame.payload = std::move(control_);
    }
    control_.clear();
    out.push_back(std::move(frame));
    return expected<void, FrameError>::success();
  }

  if (current_.fin) {
    if (message_opcode_ == ws::OpCode::kText && !ws::is_valid_utf8(message_)) {
      return fail(ws::kCloseInvalidPayload, "text message is not valid UTF-8");
    }
    Frame frame;
    frame.opcode = message_opcode_;
    frame.masked = current_.masked;
    frame.payload = std::move(message_);
    message_.clear();
    fragment_open_ = false;
    out.push_back(std::move(frame));
  }
  return expected<void, FrameError>::success();
}

}  // namespace mcpws
