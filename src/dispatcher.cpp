#include "mcpws/dispatcher.hpp"

#include "mcpws/log.hpp"
#include "mcpws/schema_validator.hpp"

#include <algorithm>
#include <exception>
#include <memory>

namespace mcpws {

namespace {

constexpr const char* kToolsCache = "tools";
constexpr const char* kResourcesCache = "resources";
constexpr const char* kRpcCache = "rpc";

MethodResult ok(Json::Value v) { return MethodResult::success(std::move(v)); }

MethodResult fail(int code, std::string message, Json::Value data = Json::Value()) {
  return MethodResult::error(RpcError(code, std::move(message), std::move(data)));
}

bool is_live(const std::optional<EntryStatus>& status) {
  return status && (*status == EntryStatus::kQueued || *status == EntryStatus::kProcessing ||
                    *status == EntryStatus::kRetrying);
}

// MCP logging levels onto the logger threshold.
bool mcp_log_level(const std::string& name, Logger::Level& out) {
  if (name == "debug") {
    out = Logger::Level::kDebug;
  } else if (name == "info" || name == "notice") {
    out = Logger::Level::kInfo;
  } else if (name == "warning") {
    out = Logger::Level::kWarn;
  } else if (name == "error" || name == "critical" || name == "alert" || name == "emergency") {
    out = Logger::Level::kError;
  } else {
    return false;
  }
  return true;
}

}  // namespace

Json::Value normalize_tool_result(const Json::Value& value) {
  if (value.isObject() && value["content"].isArray()) {
    Json::Value out = value;
    if (!out["isError"].isBool()) out["isError"] = false;
    return out;
  }
  Json::Value block(Json::objectValue);
  block["type"] = "text";
  if (value.isString()) {
    block["text"] = value.asString();
  } else if (value.isNull()) {
    block["text"] = "";
  } else {
    block["text"] = to_compact_string(value);
  }
  Json::Value out(Json::objectValue);
  out["content"] = Json::Value(Json::arrayValue);
  out["content"].append(block);
  out["isError"] = false;
  return out;
}

Dispatcher::Dispatcher(ToolRegistry& tools, RequestQueue& queue, CacheRegistry& caches,
                       const DispatcherOptions& options)
    : tools_(tools), queue_(queue), caches_(caches), options_(options) {
  register_builtins();
}

void Dispatcher::register_builtins() {
  add_method(
      "initialize", [this](Session& s, const Json::Value& params) { return initialize(s, params); }, false);
  add_method(
      "ping", [](Session&, const Json::Value&) { return ok(Json::Value(Json::objectValue)); }, false);
  add_method("tools/list", [this](Session&, const Json::Value&) {
    Json::Value result(Json::objectValue);
    result["tools"] = tools_.list_json();
    return ok(result);
  });
  add_method("resources/list", [this](Session&, const Json::Value&) {
    Json::Value result(Json::objectValue);
    result["resources"] = list_resources();
    return ok(result);
  });
  add_method("resources/read", [this](Session&, const Json::Value& params) { return read_resource(params); });
  add_method("logging/setLevel", [this](Session&, const Json::Value& params) { return set_log_level(params); });

  auto initialized = [this](Session& s, const Json::Value&) {
    bool was_ready = s.is_ready();
    if (s.complete_initialize() && !was_ready && on_ready) {
      on_ready(s.shared_from_this());
    }
  };
  add_notification("notifications/initialized", initialized);
  add_notification("initialized", initialized);
  add_notification("notifications/cancelled",
                   [this](Session& s, const Json::Value& params) { cancel_request(s, params); });
}

void Dispatcher::add_method(const std::string& name, MethodHandler handler, bool requires_ready,
                            std::optional<std::chrono::milliseconds> cache_ttl) {
  methods_[name] = MethodEntry{std::move(handler), requires_ready, cache_ttl};
}

void Dispatcher::add_notification(const std::string& name, NotificationHandler handler) {
  notifications_[name] = std::move(handler);
}

void Dispatcher::add_resource(ResourceDescriptor resource) { resources_.push_back(std::move(resource)); }

// ============================================================================
// Routing
// ============================================================================

void Dispatcher::handle_text(const SessionPtr& session, std::string_view text) {
  auto parsed = parse_message(text);
  if (!parsed) {
    const ParseFailure& f = parsed.get_error();
    if (f.id) {
      reply_error(*session, *f.id, f.error);
    } else {
      ++stats_.dropped;
      MCPWS_LOG_WARN("Dispatch", "session " << session->id() << " dropped message: " << f.error.message);
    }
    return;
  }
  dispatch(session, parsed.value());
}

void Dispatcher::dispatch(const SessionPtr& session, const Message& msg) {
  if (const auto* req = std::get_if<Request>(&msg)) {
    handle_request(session, *req);
  } else if (const auto* note = std::get_if<Notification>(&msg)) {
    handle_notification(session, *note);
  } else {
    ++stats_.responses;
    session->handle_response(msg);
  }
}

void Dispatcher::handle_request(const SessionPtr& session, const Request& req) {
  ++stats_.requests;
  MCPWS_LOG_DEBUG("Dispatch", "session " << session->id() << " <- " << req.method << " id " << req.id.to_string());

  auto it = methods_.find(req.method);
  bool exempt = it != methods_.end() && !it->second.requires_ready;
  if (!exempt && !session->is_ready()) {
    reply_error(*session, req.id, RpcError(rpc_code::kServerNotInitialized, "Server not initialized"));
    return;
  }

  if (req.method == "tools/call") {
    call_tool(session, req);
    return;
  }
  if (it == methods_.end()) {
    reply_error(*session, req.id, RpcError(rpc_code::kMethodNotFound, "Method not found: " + req.method));
    return;
  }

  MethodResult result = call_method(*session, req.method, it->second, req.params);
  if (result) {
    session->send(make_response(req.id, result.value()));
  } else {
    reply_error(*session, req.id, result.get_error());
  }
}

MethodResult Dispatcher::call_method(Session& session, const std::string& method, const MethodEntry& entry,
                                     const Json::Value& params) {
  ResponseCache* cache = entry.cache_ttl ? caches_.find(kRpcCache) : nullptr;
  if (cache != nullptr) {
    CacheLookup hit = cache->get(method, params);
    if (hit.hit) {
      ++stats_.cache_hits;
      return ok(hit.value);
    }
  }

  MethodResult result = MethodResult::error(RpcError());
  try {
    result = entry.handler(session, params);
  } catch (const std::exception& e) {
    MCPWS_LOG_ERROR("Dispatch", method << " threw: " << e.what());
    result = fail(rpc_code::kInternalError, e.what());
  }
  if (cache != nullptr && result) {
    cache->set(method, params, result.value(), entry.cache_ttl);
  }
  return result;
}

void Dispatcher::handle_notification(const SessionPtr& session, const Notification& note) {
  ++stats_.notifications;
  auto it = notifications_.find(note.method);
  if (it == notifications_.end()) {
    MCPWS_LOG_DEBUG("Dispatch", "unhandled notification " << note.method);
    return;
  }
  bool handshake = note.method == "notifications/initialized" || note.method == "initialized";
  if (!handshake && !session->is_ready()) {
    MCPWS_LOG_WARN("Dispatch", "session " << session->id() << " sent " << note.method << " before initialized");
    return;
  }
  try {
    it->second(*session, note.params);
  } catch (const std::exception& e) {
    MCPWS_LOG_WARN("Dispatch", "notification " << note.method << " failed: " << e.what());
  }
}

void Dispatcher::reply_error(Session& session, const RequestId& id, const RpcError& error) {
  ++stats_.errors_sent;
  session.send(make_error(id, error.code, truncate_error_message(error.message), error.data));
}

void Dispatcher::session_closed(const SessionPtr& session) {
  session->close();
  size_t n = queue_.cancel_owner(session->id());
  if (n > 0) {
    MCPWS_LOG_INFO("Dispatch", "session " << session->id() << " closed, cancelled " << n << " tool calls");
  }
}

// ============================================================================
// Built-in methods
// ============================================================================

MethodResult Dispatcher::initialize(Session& session, const Json::Value& params) {
  if (session.is_ready()) {
    return fail(rpc_code::kInvalidRequest, "Server already initialized");
  }
  if (!params.isNull() && !params.isObject()) {
    return fail(rpc_code::kInvalidParams, "initialize params must be an object");
  }
  std::string version = session.begin_initialize(params, options_.protocol_version);

  Json::Value result(Json::objectValue);
  result["protocolVersion"] = version;
  Json::Value caps(Json::objectValue);
  caps["tools"]["listChanged"] = true;
  caps["resources"]["listChanged"] = true;
  caps["logging"] = Json::Value(Json::objectValue);
  result["capabilities"] = caps;
  result["serverInfo"]["name"] = options_.server_name;
  result["serverInfo"]["version"] = options_.server_version;
  if (!options_.instructions.empty()) {
    result["instructions"] = options_.instructions;
  }
  return ok(result);
}

MethodResult Dispatcher::set_log_level(const Json::Value& params) {
  Logger::Level level;
  if (!params.isObject() || !params["level"].isString() || !mcp_log_level(params["level"].asString(), level)) {
    return fail(rpc_code::kInvalidParams, "Invalid log level");
  }
  Logger::set_level(level);
  MCPWS_LOG_INFO("Dispatch", "log level set to " << Logger::level_name(level));
  return ok(Json::Value(Json::objectValue));
}

Json::Value Dispatcher::list_resources() const {
  Json::Value out(Json::arrayValue);
  for (const auto& r : resources_) {
    Json::Value item(Json::objectValue);
    item["uri"] = r.uri;
    item["name"] = r.name;
    if (!r.description.empty()) item["description"] = r.description;
    if (!r.mime_type.empty()) item["mimeType"] = r.mime_type;
    out.append(std::move(item));
  }
  return out;
}

MethodResult Dispatcher::read_resource(const Json::Value& params) {
  if (!params.isObject() || !params["uri"].isString()) {
    return fail(rpc_code::kInvalidParams, "Missing required parameter: uri");
  }
  std::string uri = params["uri"].asString();
  auto it = std::find_if(resources_.begin(), resources_.end(),
                         [&uri](const ResourceDescriptor& r) { return r.uri == uri; });
  if (it == resources_.end()) {
    return fail(rpc_code::kInvalidParams, "Resource not found: " + uri);
  }
  if (!it->reader) {
    return fail(rpc_code::kInternalError, "Resource is not readable: " + uri);
  }

  Json::Value key(Json::objectValue);
  key["uri"] = uri;
  ResponseCache* cache = it->cache_ttl ? caches_.find(kResourcesCache) : nullptr;
  if (cache != nullptr) {
    CacheLookup hit = cache->get("resources/read", key);
    if (hit.hit) {
      ++stats_.cache_hits;
      MCPWS_LOG_DEBUG("Dispatch", "resource " << uri << " served from cache");
      return ok(hit.value);
    }
  }

  auto text = it->reader(uri);
  if (!text) {
    MCPWS_LOG_WARN("Dispatch", "reading " << uri << " failed: " << text.get_error());
    Json::Value data(Json::objectValue);
    data["uri"] = uri;
    data["reason"] = truncate_error_message(text.get_error());
    return fail(rpc_code::kInternalError, "Failed to read resource", data);
  }

  Json::Value content(Json::objectValue);
  content["uri"] = uri;
  if (!it->mime_type.empty()) content["mimeType"] = it->mime_type;
  content["text"] = text.value();
  Json::Value result(Json::objectValue);
  result["contents"] = Json::Value(Json::arrayValue);
  result["contents"].append(std::move(content));

  if (cache != nullptr) {
    cache->set("resources/read", key, result, it->cache_ttl);
  }
  return ok(result);
}

void Dispatcher::cancel_request(Session& session, const Json::Value& params) {
  if (!params.isObject()) return;
  auto id = RequestId::from_json(params["requestId"]);
  if (!id) return;
  auto queue_id = session.find_call(*id);
  if (!queue_id) {
    MCPWS_LOG_DEBUG("Dispatch", "cancel for unknown request " << id->to_string());
    return;
  }
  MCPWS_LOG_INFO("Dispatch", "cancelling request " << id->to_string() << ": " << params.get("reason", "").asString());
  queue_.cancel(*queue_id);
}

// ============================================================================
// tools/call
// ============================================================================

void Dispatcher::call_tool(const SessionPtr& session, const Request& req) {
  ++stats_.tool_calls;
  const Json::Value& params = req.params;
  if (!params.isObject()) {
    reply_error(*session, req.id, RpcError(rpc_code::kInvalidParams, "tools/call params must be an object"));
    return;
  }
  if (!params["name"].isString() || !is_valid_tool_name(params["name"].asString())) {
    reply_error(*session, req.id, RpcError(rpc_code::kInvalidParams, "Invalid tool name"));
    return;
  }
  std::string name = params["name"].asString();
  const ToolDescriptor* tool = tools_.find(name);
  if (tool == nullptr) {
    reply_error(*session, req.id, RpcError(rpc_code::kInvalidParams, "Unknown tool: " + name));
    return;
  }

  Json::Value args = params.isMember("arguments") ? params["arguments"] : Json::Value(Json::objectValue);
  if (args.isNull()) args = Json::Value(Json::objectValue);
  if (!args.isObject()) {
    reply_error(*session, req.id, RpcError(rpc_code::kInvalidParams, "Tool arguments must be an object"));
    return;
  }
  if (to_compact_string(args).size() > options_.max_arguments_size) {
    reply_error(*session, req.id, RpcError(rpc_code::kInvalidParams, "Tool arguments too large"));
    return;
  }
  auto valid = validate_schema(args, tool->input_schema);
  if (!valid) {
    Json::Value data(Json::objectValue);
    data["tool"] = name;
    data["reason"] = valid.get_error();
    reply_error(*session, req.id, RpcError(rpc_code::kInvalidParams, "Invalid arguments: " + valid.get_error(), data));
    return;
  }

  ResponseCache* cache = tool->cache_ttl ? caches_.find(kToolsCache) : nullptr;
  if (cache != nullptr) {
    CacheLookup hit = cache->get(name, args);
    if (hit.hit) {
      ++stats_.cache_hits;
      MCPWS_LOG_DEBUG("Dispatch", "tool " << name << " served from cache");
      session->send(make_response(req.id, hit.value));
      return;
    }
  }

  std::weak_ptr<Session> weak = session;
  RequestId request_id = req.id;

  QueueRequest qr;
  qr.method = name;
  qr.params = args;
  qr.priority = tool->priority;
  qr.max_retries = tool->max_retries;
  qr.timeout = tool->timeout;
  qr.owner = session->id();
  qr.handler = [handler = tool->handler, weak](const Json::Value& arguments, const JobPtr& job,
                                               const ProgressFn& progress) {
    ToolContext ctx;
    ctx.session = weak;
    ctx.progress = progress;
    handler(arguments, job, ctx);
  };

  const Json::Value& meta = params["_meta"];
  if (meta.isObject() && (meta["progressToken"].isString() || meta["progressToken"].isIntegral())) {
    Json::Value token = meta["progressToken"];
    qr.on_progress = [weak, token](double progress, const std::string& message) {
      auto s = weak.lock();
      if (!s) return;
      Json::Value p(Json::objectValue);
      p["progressToken"] = token;
      p["progress"] = progress;
      p["total"] = 100;
      if (!message.empty()) p["message"] = message;
      s->notify("notifications/progress", p);
    };
  }

  std::optional<std::chrono::milliseconds> ttl = tool->cache_ttl;
  qr.on_complete = [this, weak, request_id, name, args, ttl](const QueueOutcome& outcome) {
    auto s = weak.lock();
    if (!s) return;
    s->untrack_call(request_id);
    if (outcome) {
      Json::Value result = normalize_tool_result(outcome.value());
      if (ttl && !result["isError"].asBool()) {
        if (ResponseCache* c = caches_.find(kToolsCache)) {
          c->set(name, args, result, *ttl);
        }
      }
      s->send(make_response(request_id, result));
      return;
    }
    const RpcError& err = outcome.get_error();
    if (err.code == rpc_code::kRequestCancelled) {
      reply_error(*s, request_id, err);
      return;
    }
    MCPWS_LOG_WARN("Dispatch", "tool " << name << " failed: " << err.message);
    Json::Value data(Json::objectValue);
    data["tool"] = name;
    data["reason"] = truncate_error_message(err.message);
    data["code"] = err.code;
    reply_error(*s, request_id, RpcError(rpc_code::kInternalError, "Tool execution failed", data));
  };

  auto queue_id = queue_.enqueue(std::move(qr));
  if (!queue_id) {
    reply_error(*session, req.id, RpcError(rpc_code::kQueueFull, "Request queue is full"));
    return;
  }
  if (is_live(queue_.status_of(*queue_id))) {
    session->track_call(req.id, *queue_id);
  }
}

}  // namespace mcpws
