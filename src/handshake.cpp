#include "mcpws/handshake.hpp"

#include "mcpws/crypto.hpp"
#include "mcpws/frame_codec.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>

namespace mcpws {

namespace {

std::string to_lower(std::string_view s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

std::string_view trim(std::string_view s) {
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
  while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
  return s;
}

expected<UpgradeRequest, HttpRejection> reject(int status, std::string reason) {
  return expected<UpgradeRequest, HttpRejection>::error(HttpRejection{status, std::move(reason)});
}

// True if the comma separated list contains token, case-insensitively.
bool list_contains(std::string_view list, std::string_view token) {
  std::string lowered = to_lower(list);
  std::string_view rest(lowered);
  while (!rest.empty()) {
    size_t comma = rest.find(',');
    std::string_view item = trim(rest.substr(0, comma));
    if (item == token) return true;
    if (comma == std::string_view::npos) break;
    rest.remove_prefix(comma + 1);
  }
  return false;
}

}  // namespace

std::string UpgradeRequest::header(std::string_view name) const {
  auto it = headers.find(std::string(name));
  return it == headers.end() ? std::string() : it->second;
}

expected<UpgradeRequest, HttpRejection> parse_upgrade_request(std::string_view raw) {
  size_t end = raw.find("\r\n\r\n");
  if (end == std::string_view::npos) {
    return reject(400, "incomplete request");
  }
  std::string_view head = raw.substr(0, end);

  size_t line_end = head.find("\r\n");
  std::string_view request_line = head.substr(0, line_end);
  head = line_end == std::string_view::npos ? std::string_view() : head.substr(line_end + 2);

  UpgradeRequest req;
  size_t sp1 = request_line.find(' ');
  size_t sp2 = sp1 == std::string_view::npos ? sp1 : request_line.find(' ', sp1 + 1);
  if (sp2 == std::string_view::npos) {
    return reject(400, "malformed request line");
  }
  req.method = std::string(request_line.substr(0, sp1));
  req.target = std::string(request_line.substr(sp1 + 1, sp2 - sp1 - 1));
  req.version = std::string(request_line.substr(sp2 + 1));

  while (!head.empty()) {
    line_end = head.find("\r\n");
    std::string_view line = head.substr(0, line_end);
    head = line_end == std::string_view::npos ? std::string_view() : head.substr(line_end + 2);
    size_t colon = line.find(':');
    if (colon == std::string_view::npos || colon == 0) {
      return reject(400, "malformed header line");
    }
    std::string name = to_lower(trim(line.substr(0, colon)));
    std::string value(trim(line.substr(colon + 1)));
    auto it = req.headers.find(name);
    if (it != req.headers.end()) {
      it->second += ", " + value;
    } else {
      req.headers.emplace(std::move(name), std::move(value));
    }
  }

  if (req.method != "GET") {
    return reject(400, "method must be GET");
  }
  if (req.version != "HTTP/1.1") {
    return reject(400, "HTTP/1.1 required");
  }
  if (to_lower(req.header("upgrade")) != "websocket") {
    return reject(400, "missing Upgrade: websocket");
  }
  if (!list_contains(req.header("connection"), "upgrade")) {
    return reject(400, "missing Connection: Upgrade");
  }
  std::string key = req.header("sec-websocket-key");
  if (key.empty() || Base64::decode(key).size() != 16) {
    return reject(400, "invalid Sec-WebSocket-Key");
  }
  if (req.header("sec-websocket-version") != "13") {
    return reject(400, "unsupported Sec-WebSocket-Version");
  }
  return expected<UpgradeRequest, HttpRejection>::success(std::move(req));
}

std::string build_accept_response(const UpgradeRequest& request) {
  std::string response =
      "HTTP/1.1 101 Switching Protocols\r\n"
      "Upgrade: websocket\r\n"
      "Connection: Upgrade\r\n"
      "Sec-WebSocket-Accept: ";
  response += ws::generate_accept_key(request.header("sec-websocket-key"));
  response += "\r\n";

  std::string protocols = request.header("sec-websocket-protocol");
  if (!protocols.empty()) {
    std::string_view first = trim(std::string_view(protocols).substr(0, protocols.find(',')));
    response += "Sec-WebSocket-Protocol: ";
    response.append(first.data(), first.size());
    response += "\r\n";
  }
  response += "\r\n";
  return response;
}

const char* http_status_text(int status) {
  switch (status) {
    case 400: return "Bad Request";
    case 401: return "Unauthorized";
    case 403: return "Forbidden";
    case 413: return "Payload Too Large";
    case 503: return "Service Unavailable";
    default: return "Error";
  }
}

std::string build_rejection_response(const HttpRejection& rejection) {
  char buf[128];
  int n = std::snprintf(buf, sizeof(buf), "HTTP/1.1 %d %s\r\nContent-Length: 0\r\nConnection: close\r\n\r\n",
                        rejection.status, http_status_text(rejection.status));
  return std::string(buf, n > 0 ? static_cast<size_t>(n) : 0U);
}

Authenticator::Authenticator(std::string token, std::string header_name)
    : token_(std::move(token)), header_name_(to_lower(header_name)) {}

expected<void, HttpRejection> Authenticator::check(const UpgradeRequest& request) const {
  if (token_.empty()) {
    return expected<void, HttpRejection>::success();
  }
  if (!request.has_header(header_name_)) {
    return expected<void, HttpRejection>::error(HttpRejection{401, "missing " + header_name_ + " header"});
  }
  if (!constant_time_equals(request.header(header_name_), token_)) {
    return expected<void, HttpRejection>::error(HttpRejection{401, "invalid authentication token"});
  }
  return expected<void, HttpRejection>::success();
}

}  // namespace mcpws
