#include "mcpws/crypto.hpp"

namespace mcpws {

namespace {

constexpr char kBase64Alphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

// 0xFF marks characters outside the alphabet.
int base64_value(char c) {
  if (c >= 'A' && c <= 'Z') return c - 'A';
  if (c >= 'a' && c <= 'z') return c - 'a' + 26;
  if (c >= '0' && c <= '9') return c - '0' + 52;
  if (c == '+') return 62;
  if (c == '/') return 63;
  return 0xFF;
}

inline uint32_t rotl(uint32_t x, int n) { return (x << n) | (x >> (32 - n)); }

}  // namespace

// ============================================================================
// Base64
// ============================================================================

std::string Base64::encode(const uint8_t* data, size_t size) {
  std::string out;
  out.reserve((size + 2) / 3 * 4);
  size_t i = 0;
  for (; i + 3 <= size; i += 3) {
    uint32_t n = (static_cast<uint32_t>(data[i]) << 16) | (static_cast<uint32_t>(data[i + 1]) << 8) | data[i + 2];
    out.push_back(kBase64Alphabet[(n >> 18) & 0x3F]);
    out.push_back(kBase64Alphabet[(n >> 12) & 0x3F]);
    out.push_back(kBase64Alphabet[(n >> 6) & 0x3F]);
    out.push_back(kBase64Alphabet[n & 0x3F]);
  }
  size_t rest = size - i;
  if (rest > 0) {
    uint32_t n = static_cast<uint32_t>(data[i]) << 16;
    if (rest == 2) n |= static_cast<uint32_t>(data[i + 1]) << 8;
    out.push_back(kBase64Alphabet[(n >> 18) & 0x3F]);
    out.push_back(kBase64Alphabet[(n >> 12) & 0x3F]);
    out.push_back(rest == 2 ? kBase64Alphabet[(n >> 6) & 0x3F] : '=');
    out.push_back('=');
  }
  return out;
}

std::vector<uint8_t> Base64::decode(std::string_view encoded) {
  std::vector<uint8_t> out;
  if (encoded.empty() || encoded.size() % 4 != 0) {
    return out;
  }
  out.reserve(encoded.size() / 4 * 3);
  for (size_t i = 0; i < encoded.size(); i += 4) {
    bool last = (i + 4 == encoded.size());
    size_t pad = 0;
    if (last && encoded[i + 3] == '=') pad = (encoded[i + 2] == '=') ? 2 : 1;

    uint32_t n = 0;
    for (size_t j = 0; j < 4 - pad; ++j) {
      int v = base64_value(encoded[i + j]);
      if (v == 0xFF) {
        return {};
      }
      n |= static_cast<uint32_t>(v) << (18 - 6 * j);
    }
    out.push_back(static_cast<uint8_t>(n >> 16));
    if (pad < 2) out.push_back(static_cast<uint8_t>(n >> 8));
    if (pad < 1) out.push_back(static_cast<uint8_t>(n));
  }
  return out;
}

// ============================================================================
// SHA1
// ============================================================================

void SHA1::reset() {
  state_ = {0x67452301, 0xEFCDAB89, 0x98BADCFE, 0x10325476, 0xC3D2E1F0};
  block_len_ = 0;
  total_bits_ = 0;
}

void SHA1::update(const uint8_t* data, size_t size) {
  total_bits_ += static_cast<uint64_t>(size) * 8U;
  for (size_t i = 0; i < size; ++i) {
    block_[block_len_++] = data[i];
    if (block_len_ == block_.size()) {
      process_block(block_.data());
      block_len_ = 0;
    }
  }
}

SHA1::Digest SHA1::finalize() {
  uint64_t bits = total_bits_;
  block_[block_len_++] = 0x80;
  if (block_len_ > 56) {
    while (block_len_ < 64) block_[block_len_++] = 0;
    process_block(block_.data());
    block_len_ = 0;
  }
  while (block_len_ < 56) block_[block_len_++] = 0;
  for (int i = 7; i >= 0; --i) {
    block_[block_len_++] = static_cast<uint8_t>(bits >> (8 * i));
  }
  process_block(block_.data());

  Digest digest{};
  for (size_t i = 0; i < state_.size(); ++i) {
    digest[i * 4] = static_cast<uint8_t>(state_[i] >> 24);
    digest[i * 4 + 1] = static_cast<uint8_t>(state_[i] >> 16);
    digest[i * 4 + 2] = static_cast<uint8_t>(state_[i] >> 8);
    digest[i * 4 + 3] = static_cast<uint8_t>(state_[i]);
  }
  reset();
  return digest;
}

void SHA1::process_block(const uint8_t* block) {
  uint32_t w[80];
  for (int i = 0; i < 16; ++i) {
    w[i] = (static_cast<uint32_t>(block[i * 4]) << 24) | (static_cast<uint32_t>(block[i * 4 + 1]) << 16) |
           (static_cast<uint32_t>(block[i * 4 + 2]) << 8) | static_cast<uint32_t>(block[i * 4 + 3]);
  }
  for (int i = 16; i < 80; ++i) {
    w[i] = rotl(w[i - 3] ^ w[i - 8] ^ w[i - 14] ^ w[i - 16], 1);
  }

  uint32_t a = state_[0];
  uint32_t b = state_[1];
  uint32_t c = state_[2];
  uint32_t d = state_[3];
  uint32_t e = state_[4];

  for (int i = 0; i < 80; ++i) {
    uint32_t f;
    uint32_t k;
    if (i < 20) {
      f = (b & c) | (~b & d);
      k = 0x5A827999;
    } else if (i < 40) {
      f = b ^ c ^ d;
      k = 0x6ED9EBA1;
    } else if (i < 60) {
      f = (b & c) | (b & d) | (c & d);
      k = 0x8F1BBCDC;
    } else {
      f = b ^ c ^ d;
      k = 0xCA62C1D6;
    }
    uint32_t tmp = rotl(a, 5) + f + e + k + w[i];
    e = d;
    d = c;
    c = rotl(b, 30);
    b = a;
    a = tmp;
  }

  state_[0] += a;
  state_[1] += b;
  state_[2] += c;
  state_[3] += d;
  state_[4] += e;
}

std::string SHA1::hex_digest(std::string_view input) {
  Digest d = compute(reinterpret_cast<const uint8_t*>(input.data()), input.size());
  return to_hex(d.data(), d.size());
}

// ============================================================================
// Helpers
// ============================================================================

std::string to_hex(const uint8_t* data, size_t size) {
  static constexpr char kDigits[] = "0123456789abcdef";
  std::string out;
  out.reserve(size * 2);
  for (size_t i = 0; i < size; ++i) {
    out.push_back(kDigits[data[i] >> 4]);
    out.push_back(kDigits[data[i] & 0x0F]);
  }
  return out;
}

bool constant_time_equals(std::string_view a, std::string_view b) noexcept {
  if (a.size() != b.size()) {
    return false;
  }
  uint8_t diff = 0;
  for (size_t i = 0; i < a.size(); ++i) {
    diff |= static_cast<uint8_t>(a[i] ^ b[i]);
  }
  return diff == 0;
}

}  // namespace mcpws
