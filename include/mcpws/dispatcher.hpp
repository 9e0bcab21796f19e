#ifndef MCPWS_DISPATCHER_HPP_
#define MCPWS_DISPATCHER_HPP_

#include "errors.hpp"
#include "event_loop.hpp"
#include "json_rpc.hpp"
#include "request_queue.hpp"
#include "response_cache.hpp"
#include "session.hpp"
#include "tool_registry.hpp"
#include "vocabulary.hpp"

#include <json/json.h>

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcpws {

struct DispatcherOptions {
  std::string server_name = "mcpws";
  std::string server_version = "0.0.0";
  std::string instructions;
  std::string protocol_version = kDefaultProtocolVersion;
  size_t max_arguments_size = kMaxToolArgumentsSize;
};

using MethodResult = expected<Json::Value, RpcError>;
using MethodHandler = std::function<MethodResult(Session& session, const Json::Value& params)>;
using NotificationHandler = std::function<void(Session& session, const Json::Value& params)>;

// Text of one resource, or the reason it could not be read.
using ResourceReader = std::function<expected<std::string, std::string>(const std::string& uri)>;

struct ResourceDescriptor {
  std::string uri;
  std::string name;
  std::string description;
  std::string mime_type;
  ResourceReader reader;  // listed but not readable when empty
  std::optional<std::chrono::milliseconds> cache_ttl;  // read results cached only when set
};

struct DispatcherStats {
  uint64_t requests = 0;
  uint64_t notifications = 0;
  uint64_t responses = 0;
  uint64_t errors_sent = 0;
  uint64_t dropped = 0;
  uint64_t tool_calls = 0;
  uint64_t cache_hits = 0;
};

// Wraps a handler's value as MCP content unless it already is one:
// {content:[{type:"text", text}], isError:false}.
Json::Value normalize_tool_result(const Json::Value& value);

/**
 * @brief Routes parsed messages of one session to their handlers.
 *
 * Built in: initialize, ping, tools/list, tools/call, resources/list,
 * resources/read, logging/setLevel and the initialized / cancelled
 * notifications. tools/call goes through the tools cache and the request
 * queue; resources/read through the resources cache; methods added with a
 * cache_ttl through the rpc cache. Every request other than tools/call is
 * answered synchronously. Requests other than initialize and
 * ping are refused with -32002 until the session is ready.
 */
class Dispatcher {
 public:
  Dispatcher(ToolRegistry& tools, RequestQueue& queue, CacheRegistry& caches,
             const DispatcherOptions& options = DispatcherOptions());

  Dispatcher(const Dispatcher&) = delete;
  Dispatcher& operator=(const Dispatcher&) = delete;

  // One text frame from the client.
  void handle_text(const SessionPtr& session, std::string_view text);
  void dispatch(const SessionPtr& session, const Message& msg);

  // requires_ready=false makes the method callable before initialized.
  // With cache_ttl, successful results are kept in the rpc cache per params.
  void add_method(const std::string& name, MethodHandler handler, bool requires_ready = true,
                  std::optional<std::chrono::milliseconds> cache_ttl = std::nullopt);
  void add_notification(const std::string& name, NotificationHandler handler);
  void add_resource(ResourceDescriptor resource);
  bool has_method(const std::string& name) const { return methods_.count(name) != 0 || name == "tools/call"; }

  // Cancels the session's queued and running tool calls.
  void session_closed(const SessionPtr& session);

  const DispatcherStats& stats() const { return stats_; }
  const DispatcherOptions& options() const { return options_; }

  // Fired once a session completes the initialize handshake.
  std::function<void(const SessionPtr&)> on_ready;

 private:
  struct MethodEntry {
    MethodHandler handler;
    bool requires_ready = true;
    std::optional<std::chrono::milliseconds> cache_ttl;
  };

  void handle_request(const SessionPtr& session, const Request& req);
  void handle_notification(const SessionPtr& session, const Notification& note);
  void call_tool(const SessionPtr& session, const Request& req);
  void reply_error(Session& session, const RequestId& id, const RpcError& error);
  void register_builtins();

  MethodResult initialize(Session& session, const Json::Value& params);
  MethodResult set_log_level(const Json::Value& params);
  Json::Value list_resources() const;
  MethodResult read_resource(const Json::Value& params);
  MethodResult call_method(Session& session, const std::string& method, const MethodEntry& entry,
                           const Json::Value& params);
  void cancel_request(Session& session, const Json::Value& params);

  ToolRegistry& tools_;
  RequestQueue& queue_;
  CacheRegistry& caches_;
  DispatcherOptions options_;

  std::map<std::string, MethodEntry> methods_;
  std::map<std::string, NotificationHandler> notifications_;
  std::vector<ResourceDescriptor> resources_;
  DispatcherStats stats_;
};

}  // namespace mcpws

#endif  // MCPWS_DISPATCHER_HPP_
