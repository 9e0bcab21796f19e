#include "mcpws/json_rpc.hpp"

#include <memory>

namespace mcpws {

namespace {

constexpr const char* kVersion = "2.0";

expected<Message, ParseFailure> invalid(std::string reason, std::optional<RequestId> id = std::nullopt) {
  return expected<Message, ParseFailure>::error(
      ParseFailure{RpcError(rpc_code::kInvalidRequest, "Invalid Request: " + reason), std::move(id)});
}

bool valid_params(const Json::Value& v) { return v.isNull() || v.isObject() || v.isArray(); }

}  // namespace

// ============================================================================
// RpcError
// ============================================================================

Json::Value RpcError::to_json() const {
  Json::Value out(Json::objectValue);
  out["code"] = code;
  out["message"] = truncate_error_message(message);
  if (!data.isNull()) {
    out["data"] = data;
  }
  return out;
}

std::string truncate_error_message(std::string msg) {
  if (msg.size() > kMaxErrorMessageLength) {
    // Never split a UTF-8 sequence.
    size_t cut = kMaxErrorMessageLength - 3;
    while (cut > 0 && (static_cast<unsigned char>(msg[cut]) & 0xC0) == 0x80) {
      --cut;
    }
    msg.resize(cut);
    msg += "...";
  }
  return msg;
}

// ============================================================================
// RequestId
// ============================================================================

std::optional<RequestId> RequestId::from_json(const Json::Value& v) {
  if (v.isString()) {
    return RequestId(v.asString());
  }
  if (v.isIntegral() && v.isInt64()) {
    return RequestId(static_cast<int64_t>(v.asInt64()));
  }
  return std::nullopt;
}

Json::Value RequestId::to_json() const {
  if (is_number()) {
    return Json::Value(static_cast<Json::Int64>(number()));
  }
  return Json::Value(text());
}

std::string RequestId::to_string() const { return is_number() ? std::to_string(number()) : "\"" + text() + "\""; }

// ============================================================================
// JSON helpers
// ============================================================================

std::string to_compact_string(const Json::Value& value) {
  static const Json::StreamWriterBuilder builder = [] {
    Json::StreamWriterBuilder b;
    b["indentation"] = "";
    b["emitUTF8"] = true;
    return b;
  }();
  return Json::writeString(builder, value);
}

expected<Json::Value, std::string> parse_json(std::string_view text) {
  Json::CharReaderBuilder builder;
  builder["collectComments"] = false;
  builder["failIfExtra"] = true;
  std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

  Json::Value root;
  std::string errs;
  if (!reader->parse(text.data(), text.data() + text.size(), &root, &errs)) {
    return expected<Json::Value, std::string>::error(errs.empty() ? "invalid JSON" : errs);
  }
  return expected<Json::Value, std::string>::success(std::move(root));
}

bool is_valid_method_name(std::string_view method) {
  if (method.empty() || method.size() > kMaxMethodNameLength) {
    return false;
  }
  for (char c : method) {
    bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_' ||
              c == '/' || c == '.' || c == '-';
    if (!ok) return false;
  }
  return true;
}

// ============================================================================
// Parsing
// ============================================================================

expected<Message, ParseFailure> parse_message(std::string_view text) {
  auto root = parse_json(text);
  if (!root) {
    return expected<Message, ParseFailure>::error(
        ParseFailure{RpcError(rpc_code::kParseError, "Parse error", Json::Value(root.get_error())), std::nullopt});
  }
  return message_from_json(root.value());
}

expected<Message, ParseFailure> message_from_json(const Json::Value& root) {
  if (!root.isObject()) {
    return invalid("message must be a JSON object");
  }

  std::optional<RequestId> id;
  bool has_id = root.isMember("id");
  if (has_id) {
    id = RequestId::from_json(root["id"]);
  }

  const Json::Value& version = root["jsonrpc"];
  if (!version.isString() || version.asString() != kVersion) {
    return invalid("jsonrpc must be \"2.0\"", id);
  }

  if (root.isMember("method")) {
    const Json::Value& method = root["method"];
    if (!method.isString()) {
      return invalid("method must be a string", id);
    }
    std::string name = method.asString();
    if (!is_valid_method_name(name)) {
      return invalid("malformed method name", id);
    }
    Json::Value params = root.get("params", Json::Value());
    if (!valid_params(params)) {
      return invalid("params must be an object or array", id);
    }
    if (!has_id) {
      return expected<Message, ParseFailure>::success(Notification{std::move(name), std::move(params)});
    }
    if (!id) {
      return invalid("id must be a string or integer");
    }
    return expected<Message, ParseFailure>::success(Request{*id, std::move(name), std::move(params)});
  }

  bool has_result = root.isMember("result");
  bool has_error = root.isMember("error");
  if (has_result && has_error) {
    return invalid("response carries both result and error", id);
  }

  if (has_result) {
    if (!id) {
      return invalid("response id must be a string or integer");
    }
    return expected<Message, ParseFailure>::success(Response{*id, root["result"]});
  }

  if (has_error) {
    if (!has_id || (!id && !root["id"].isNull())) {
      return invalid("error response id must be a string, integer or null");
    }
    const Json::Value& err = root["error"];
    if (!err.isObject() || !err["code"].isInt() || !err["message"].isString()) {
      return invalid("error must be an object with integer code and string message", id);
    }
    RpcError e(err["code"].asInt(), err["message"].asString(), err.get("data", Json::Value()));
    return expected<Message, ParseFailure>::success(ErrorResponse{id, std::move(e)});
  }

  return invalid("message has neither method nor result/error", id);
}

// ============================================================================
// Serialization
// ============================================================================

namespace {

struct ToJson {
  Json::Value operator()(const Request& r) const {
    Json::Value out = envelope();
    out["id"] = r.id.to_json();
    out["method"] = r.method;
    if (!r.params.isNull()) out["params"] = r.params;
    return out;
  }

  Json::Value operator()(const Notification& n) const {
    Json::Value out = envelope();
    out["method"] = n.method;
    if (!n.params.isNull()) out["params"] = n.params;
    return out;
  }

  Json::Value operator()(const Response& r) const {
    Json::Value out = envelope();
    out["id"] = r.id.to_json();
    out["result"] = r.result;
    return out;
  }

  Json::Value operator()(const ErrorResponse& e) const {
    Json::Value out = envelope();
    out["id"] = e.id ? e.id->to_json() : Json::Value();
    out["error"] = e.error.to_json();
    return out;
  }

  static Json::Value envelope() {
    Json::Value out(Json::objectValue);
    out["jsonrpc"] = kVersion;
    return out;
  }
};

}  // namespace

Json::Value to_json(const Message& msg) { return std::visit(ToJson{}, msg); }

std::string serialize(const Message& msg) { return to_compact_string(to_json(msg)); }

Message make_response(RequestId id, Json::Value result) {
  if (result.isNull()) {
    result = Json::Value(Json::objectValue);
  }
  return Response{std::move(id), std::move(result)};
}

Message make_error(std::optional<RequestId> id, int code, std::string message, Json::Value data) {
  return ErrorResponse{std::move(id), RpcError(code, truncate_error_message(std::move(message)), std::move(data))};
}

}  // namespace mcpws
