#ifndef MCPWS_CRYPTO_HPP_
#define MCPWS_CRYPTO_HPP_

#include <cstddef>
#include <cstdint>

#include <array>
#include <string>
#include <string_view>
#include <vector>

namespace mcpws {

// ============================================================================
// Base64 (RFC 4648, standard alphabet, padded)
// ============================================================================

class Base64 {
 public:
  static std::string encode(const uint8_t* data, size_t size);

  // Returns an empty vector on malformed input (bad length or alphabet).
  static std::vector<uint8_t> decode(std::string_view encoded);
};

// ============================================================================
// SHA-1 (FIPS 180-1)
//
// Used for the WebSocket accept key and for fixed-length cache key digests.
// ============================================================================

class SHA1 {
 public:
  using Digest = std::array<uint8_t, 20>;

  SHA1() { reset(); }

  static Digest compute(const uint8_t* data, size_t size) {
    SHA1 sha1;
    sha1.update(data, size);
    return sha1.finalize();
  }

  static std::string hex_digest(std::string_view input);

  void reset();
  void update(const uint8_t* data, size_t size);
  Digest finalize();

 private:
  void process_block(const uint8_t* block);

  std::array<uint32_t, 5> state_{};
  std::array<uint8_t, 64> block_{};
  size_t block_len_ = 0;
  uint64_t total_bits_ = 0;
};

// Lowercase hex of a byte range.
std::string to_hex(const uint8_t* data, size_t size);

// Compares without early exit; unequal lengths compare false.
bool constant_time_equals(std::string_view a, std::string_view b) noexcept;

}  // namespace mcpws

#endif  // MCPWS_CRYPTO_HPP_
