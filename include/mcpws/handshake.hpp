#ifndef MCPWS_HANDSHAKE_HPP_
#define MCPWS_HANDSHAKE_HPP_

#include "vocabulary.hpp"

#include <map>
#include <string>
#include <string_view>

namespace mcpws {

constexpr size_t kMaxHandshakeSize = 8192;
constexpr const char* kDefaultAuthHeader = "x-claude-code-ide-authorization";

// HTTP status sent back instead of 101 when the upgrade is refused.
struct HttpRejection {
  int status = 400;
  std::string reason;
};

/**
 * @brief Parsed HTTP/1.1 upgrade request. Header names are lowercased.
 */
struct UpgradeRequest {
  std::string method;
  std::string target;
  std::string version;
  std::map<std::string, std::string> headers;

  // Empty when absent. name must be lowercase.
  std::string header(std::string_view name) const;
  bool has_header(std::string_view name) const { return headers.count(std::string(name)) != 0; }
};

// Parses the header block (through the blank line) and checks the
// RFC 6455 requirements: GET, HTTP/1.1, Upgrade: websocket, Connection
// containing "upgrade", a 16-byte Sec-WebSocket-Key, version 13.
expected<UpgradeRequest, HttpRejection> parse_upgrade_request(std::string_view raw);

// 101 response; echoes the first requested subprotocol, if any.
std::string build_accept_response(const UpgradeRequest& request);

std::string build_rejection_response(const HttpRejection& rejection);

const char* http_status_text(int status);

/**
 * @brief Checks the credential header of an upgrade request.
 *
 * An empty token disables the check.
 */
class Authenticator {
 public:
  Authenticator() = default;
  Authenticator(std::string token, std::string header_name = kDefaultAuthHeader);

  expected<void, HttpRejection> check(const UpgradeRequest& request) const;

  const std::string& token() const { return token_; }
  const std::string& header_name() const { return header_name_; }

 private:
  std::string token_;
  std::string header_name_ = kDefaultAuthHeader;
};

}  // namespace mcpws

#endif  // MCPWS_HANDSHAKE_HPP_
