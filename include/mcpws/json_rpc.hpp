#ifndef MCPWS_JSON_RPC_HPP_
#define MCPWS_JSON_RPC_HPP_

#include "errors.hpp"
#include "vocabulary.hpp"

#include <json/json.h>

#include <cstdint>

#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace mcpws {

constexpr size_t kMaxMethodNameLength = 128;

// ============================================================================
// RequestId - number or string correlation token
// ============================================================================

class RequestId {
 public:
  RequestId() : value_(int64_t{0}) {}
  RequestId(int n) : value_(int64_t{n}) {}           // NOLINT
  RequestId(int64_t n) : value_(n) {}                // NOLINT
  RequestId(std::string s) : value_(std::move(s)) {}  // NOLINT
  RequestId(const char* s) : value_(std::string(s)) {}  // NOLINT

  // Integer or string JSON values only.
  static std::optional<RequestId> from_json(const Json::Value& v);

  Json::Value to_json() const;
  std::string to_string() const;

  bool is_number() const { return std::holds_alternative<int64_t>(value_); }
  int64_t number() const { return std::get<int64_t>(value_); }
  const std::string& text() const { return std::get<std::string>(value_); }

  bool operator==(const RequestId& o) const { return value_ == o.value_; }
  bool operator!=(const RequestId& o) const { return value_ != o.value_; }
  bool operator<(const RequestId& o) const { return value_ < o.value_; }

 private:
  std::variant<int64_t, std::string> value_;
};

// ============================================================================
// Message
// ============================================================================

struct Request {
  RequestId id;
  std::string method;
  Json::Value params;  // object, array, or null when absent
};

struct Notification {
  std::string method;
  Json::Value params;
};

struct Response {
  RequestId id;
  Json::Value result;
};

struct ErrorResponse {
  std::optional<RequestId> id;  // null on the wire when the request id was unrecoverable
  RpcError error;
};

using Message = std::variant<Request, Notification, Response, ErrorResponse>;

struct ParseFailure {
  RpcError error;
  std::optional<RequestId> id;
};

// Parse error (-32700) for bad JSON, Invalid Request (-32600) for a
// well-formed value that is not a JSON-RPC 2.0 message.
expected<Message, ParseFailure> parse_message(std::string_view text);
expected<Message, ParseFailure> message_from_json(const Json::Value& root);

Json::Value to_json(const Message& msg);

// Compact form with object keys in sorted order.
std::string serialize(const Message& msg);
std::string to_compact_string(const Json::Value& value);

// Parses a standalone JSON document (config files, tool output).
expected<Json::Value, std::string> parse_json(std::string_view text);

// At most kMaxMethodNameLength of [A-Za-z0-9_/.-].
bool is_valid_method_name(std::string_view method);

// ============================================================================
// Builders
// ============================================================================

inline Message make_request(RequestId id, std::string method, Json::Value params = Json::Value()) {
  return Request{std::move(id), std::move(method), std::move(params)};
}

inline Message make_notification(std::string method, Json::Value params = Json::Value()) {
  return Notification{std::move(method), std::move(params)};
}

// A null result becomes an empty object.
Message make_response(RequestId id, Json::Value result);

Message make_error(std::optional<RequestId> id, int code, std::string message,
                   Json::Value data = Json::Value());

}  // namespace mcpws

#endif  // MCPWS_JSON_RPC_HPP_
