#include "mcpws.hpp"

#include <catch2/catch_test_macros.hpp>

using namespace mcpws;
using std::chrono::milliseconds;

namespace {

// Loop, registries and one session whose outgoing frames are captured.
struct DispatchFixture {
  EventLoop loop;
  ToolRegistry tools;
  CacheRegistry caches;
  RequestQueue queue;
  Dispatcher dispatcher;
  std::vector<Json::Value> sent;
  SessionPtr session;
  std::vector<JobPtr> parked;

  explicit DispatchFixture(QueueConfig qcfg = quiet_queue())
      : queue(loop, qcfg), dispatcher(tools, queue, caches, options()) {
    caches.create_defaults();
    session = std::make_shared<Session>(1, loop, [this](const std::string& text) {
      sent.push_back(parse_json(text).value());
      return true;
    });
  }

  ~DispatchFixture() {
    queue.shutdown();
    session->close();
  }

  static QueueConfig quiet_queue() {
    QueueConfig cfg;
    cfg.max_retries = 0;
    cfg.rate_limit.enabled = false;
    return cfg;
  }

  static DispatcherOptions options() {
    DispatcherOptions opts;
    opts.server_name = "test-server";
    opts.server_version = "1.2.3";
    opts.instructions = "be nice";
    return opts;
  }

  void recv(const std::string& text) { dispatcher.handle_text(session, text); }

  Json::Value take() {
    REQUIRE_FALSE(sent.empty());
    Json::Value front = sent.front();
    sent.erase(sent.begin());
    return front;
  }

  void make_ready() {
    recv(R"({"jsonrpc":"2.0","id":0,"method":"initialize","params":{"protocolVersion":"2025-03-26",)"
         R"("clientInfo":{"name":"test-client","version":"9"}}})");
    recv(R"({"jsonrpc":"2.0","method":"notifications/initialized"})");
    REQUIRE(session->is_ready());
    sent.clear();
  }

  void call(int id, const std::string& tool, const std::string& args = "{}", const std::string& extra = "") {
    recv(R"({"jsonrpc":"2.0","id":)" + std::to_string(id) + R"(,"method":"tools/call","params":{"name":")" + tool +
         R"(","arguments":)" + args + extra + "}}");
  }

  void add_tool(const std::string& name, ToolHandler handler, const char* schema = nullptr) {
    ToolDescriptor tool;
    tool.name = name;
    tool.description = name + " tool";
    tool.handler = std::move(handler);
    if (schema != nullptr) tool.input_schema = parse_json(schema).value();
    REQUIRE(tools.add(std::move(tool)));
  }

  void add_parked_tool(const std::string& name) {
    add_tool(name, [this](const Json::Value&, const JobPtr& job, const ToolContext&) { parked.push_back(job); });
  }
};

void require_error(const Json::Value& msg, int id, int code) {
  REQUIRE(msg["id"].asInt() == id);
  REQUIRE(msg["error"]["code"].asInt() == code);
  REQUIRE_FALSE(msg.isMember("result"));
}

}  // namespace

// ============================================================================
// Lifecycle
// ============================================================================

TEST_CASE("Dispatcher - requests before initialize are refused", "[dispatcher]") {
  DispatchFixture f;
  bool invoked = false;
  f.dispatcher.add_method("custom/thing", [&invoked](Session&, const Json::Value&) {
    invoked = true;
    return MethodResult::success(Json::Value());
  });

  f.recv(R"({"jsonrpc":"2.0","id":1,"method":"tools/list"})");
  f.recv(R"({"jsonrpc":"2.0","id":2,"method":"custom/thing"})");
  f.recv(R"({"jsonrpc":"2.0","id":3,"method":"no/such/method"})");
  f.recv(R"({"jsonrpc":"2.0","id":4,"method":"tools/call","params":{"name":"x"}})");

  for (int id = 1; id <= 4; ++id) {
    auto msg = f.take();
    require_error(msg, id, rpc_code::kServerNotInitialized);
    REQUIRE(msg["error"]["message"].asString() == "Server not initialized");
  }
  REQUIRE_FALSE(invoked);
}

TEST_CASE("Dispatcher - ping is allowed before initialize", "[dispatcher]") {
  DispatchFixture f;
  f.recv(R"({"jsonrpc":"2.0","id":"p","method":"ping"})");
  auto msg = f.take();
  REQUIRE(msg["id"].asString() == "p");
  REQUIRE(msg["result"].isObject());
  REQUIRE(msg["result"].empty());
}

TEST_CASE("Dispatcher - initialize handshake", "[dispatcher]") {
  DispatchFixture f;
  SessionPtr ready;
  f.dispatcher.on_ready = [&ready](const SessionPtr& s) { ready = s; };

  f.recv(R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{"protocolVersion":"2025-03-26",)"
         R"("capabilities":{},"clientInfo":{"name":"editor","version":"0.1"}}})");
  auto init = f.take();
  REQUIRE(init["id"].asInt() == 1);
  REQUIRE(init["result"]["protocolVersion"].asString() == "2025-03-26");
  REQUIRE(init["result"]["serverInfo"]["name"].asString() == "test-server");
  REQUIRE(init["result"]["serverInfo"]["version"].asString() == "1.2.3");
  REQUIRE(init["result"]["capabilities"]["tools"]["listChanged"].asBool());
  REQUIRE(init["result"]["capabilities"]["logging"].isObject());
  REQUIRE(init["result"]["instructions"].asString() == "be nice");
  REQUIRE(f.session->state() == SessionState::kInitializing);
  REQUIRE(f.session->client().name == "editor");

  // Still gated until the initialized notification.
  f.recv(R"({"jsonrpc":"2.0","id":2,"method":"tools/list"})");
  require_error(f.take(), 2, rpc_code::kServerNotInitialized);

  f.recv(R"({"jsonrpc":"2.0","method":"notifications/initialized"})");
  REQUIRE(f.session->is_ready());
  REQUIRE(ready == f.session);
  REQUIRE(f.sent.empty());

  f.recv(R"({"jsonrpc":"2.0","id":3,"method":"initialize","params":{}})");
  auto again = f.take();
  require_error(again, 3, rpc_code::kInvalidRequest);
  REQUIRE(again["error"]["message"].asString() == "Server already initialized");
}

TEST_CASE("Dispatcher - default protocol version", "[dispatcher]") {
  DispatchFixture f;
  f.recv(R"({"jsonrpc":"2.0","id":1,"method":"initialize"})");
  REQUIRE(f.take()["result"]["protocolVersion"].asString() == kDefaultProtocolVersion);
}

TEST_CASE("Dispatcher - initialized without initialize is ignored", "[dispatcher]") {
  DispatchFixture f;
  f.recv(R"({"jsonrpc":"2.0","method":"initialized"})");
  REQUIRE(f.session->state() == SessionState::kUninitialized);
  REQUIRE(f.sent.empty());
}

// ============================================================================
// Routing and errors
// ============================================================================

TEST_CASE("Dispatcher - unknown method after ready", "[dispatcher]") {
  DispatchFixture f;
  f.make_ready();
  f.recv(R"({"jsonrpc":"2.0","id":5,"method":"editor/teleport"})");
  auto msg = f.take();
  require_error(msg, 5, rpc_code::kMethodNotFound);
  REQUIRE(msg["error"]["message"].asString() == "Method not found: editor/teleport");
}

TEST_CASE("Dispatcher - unparseable text is dropped, invalid requests answered", "[dispatcher]") {
  DispatchFixture f;
  f.recv("{this is not json");
  REQUIRE(f.sent.empty());
  REQUIRE(f.dispatcher.stats().dropped == 1);

  f.recv(R"({"jsonrpc":"1.0","id":8,"method":"ping"})");
  require_error(f.take(), 8, rpc_code::kInvalidRequest);
}

TEST_CASE("Dispatcher - custom methods and thrown handlers", "[dispatcher]") {
  DispatchFixture f;
  f.make_ready();
  f.dispatcher.add_method("math/double", [](Session&, const Json::Value& params) {
    if (!params["n"].isInt()) return MethodResult::error(RpcError(rpc_code::kInvalidParams, "n required"));
    return MethodResult::success(Json::Value(params["n"].asInt() * 2));
  });
  f.dispatcher.add_method("boom", [](Session&, const Json::Value&) -> MethodResult {
    throw std::runtime_error("kaboom");
  });
  REQUIRE(f.dispatcher.has_method("math/double"));

  f.recv(R"({"jsonrpc":"2.0","id":1,"method":"math/double","params":{"n":21}})");
  REQUIRE(f.take()["result"].asInt() == 42);
  f.recv(R"({"jsonrpc":"2.0","id":2,"method":"math/double","params":{}})");
  require_error(f.take(), 2, rpc_code::kInvalidParams);
  f.recv(R"({"jsonrpc":"2.0","id":3,"method":"boom"})");
  auto boom = f.take();
  require_error(boom, 3, rpc_code::kInternalError);
  REQUIRE(boom["error"]["message"].asString() == "kaboom");
}

TEST_CASE("Dispatcher - logging/setLevel", "[dispatcher]") {
  DispatchFixture f;
  f.make_ready();
  auto before = Logger::level();

  f.recv(R"({"jsonrpc":"2.0","id":1,"method":"logging/setLevel","params":{"level":"warning"}})");
  REQUIRE(f.take()["result"].isObject());
  REQUIRE(Logger::level() == Logger::Level::kWarn);

  f.recv(R"({"jsonrpc":"2.0","id":2,"method":"logging/setLevel","params":{"level":"loud"}})");
  require_error(f.take(), 2, rpc_code::kInvalidParams);
  Logger::set_level(before);
}

TEST_CASE("Dispatcher - tools/list and resources/list", "[dispatcher]") {
  DispatchFixture f;
  f.make_ready();
  f.add_tool("echo", [](const Json::Value& a, const JobPtr& job, const ToolContext&) { job->resolve(a); });
  f.dispatcher.add_resource(ResourceDescriptor{"file:///readme.md", "readme", "Project readme", "text/markdown"});

  f.recv(R"({"jsonrpc":"2.0","id":1,"method":"tools/list"})");
  auto tools = f.take()["result"]["tools"];
  REQUIRE(tools.size() == 1);
  REQUIRE(tools[0]["name"].asString() == "echo");
  REQUIRE(tools[0]["inputSchema"]["type"].asString() == "object");

  f.recv(R"({"jsonrpc":"2.0","id":2,"method":"resources/list"})");
  auto resources = f.take()["result"]["resources"];
  REQUIRE(resources.size() == 1);
  REQUIRE(resources[0]["uri"].asString() == "file:///readme.md");
  REQUIRE(resources[0]["mimeType"].asString() == "text/markdown");
}

TEST_CASE("Dispatcher - resources/read returns the reader's text", "[dispatcher]") {
  DispatchFixture f;
  f.make_ready();
  ResourceDescriptor readme{"file:///readme.md", "readme", "Project readme", "text/markdown"};
  readme.reader = [](const std::string& uri) {
    return expected<std::string, std::string>::success("# " + uri);
  };
  f.dispatcher.add_resource(readme);
  ResourceDescriptor locked{"file:///locked", "locked", "", ""};
  locked.reader = [](const std::string&) { return expected<std::string, std::string>::error("permission denied"); };
  f.dispatcher.add_resource(locked);
  f.dispatcher.add_resource(ResourceDescriptor{"file:///listed-only", "listed", "", ""});

  f.recv(R"({"jsonrpc":"2.0","id":1,"method":"resources/read","params":{"uri":"file:///readme.md"}})");
  auto read = f.take();
  REQUIRE(read["id"].asInt() == 1);
  const Json::Value& contents = read["result"]["contents"];
  REQUIRE(contents.size() == 1);
  REQUIRE(contents[0]["uri"].asString() == "file:///readme.md");
  REQUIRE(contents[0]["mimeType"].asString() == "text/markdown");
  REQUIRE(contents[0]["text"].asString() == "# file:///readme.md");

  f.recv(R"({"jsonrpc":"2.0","id":2,"method":"resources/read","params":{"uri":"file:///nope"}})");
  auto unknown = f.take();
  require_error(unknown, 2, rpc_code::kInvalidParams);
  REQUIRE(unknown["error"]["message"].asString() == "Resource not found: file:///nope");

  f.recv(R"({"jsonrpc":"2.0","id":3,"method":"resources/read","params":{}})");
  require_error(f.take(), 3, rpc_code::kInvalidParams);
  f.recv(R"({"jsonrpc":"2.0","id":4,"method":"resources/read","params":{"uri":7}})");
  require_error(f.take(), 4, rpc_code::kInvalidParams);

  f.recv(R"({"jsonrpc":"2.0","id":5,"method":"resources/read","params":{"uri":"file:///locked"}})");
  auto denied = f.take();
  require_error(denied, 5, rpc_code::kInternalError);
  REQUIRE(denied["error"]["data"]["reason"].asString() == "permission denied");
  REQUIRE_FALSE(denied["result"].isObject());

  f.recv(R"({"jsonrpc":"2.0","id":6,"method":"resources/read","params":{"uri":"file:///listed-only"}})");
  require_error(f.take(), 6, rpc_code::kInternalError);
}

TEST_CASE("Dispatcher - resources/read before initialize is refused", "[dispatcher]") {
  DispatchFixture f;
  f.recv(R"({"jsonrpc":"2.0","id":1,"method":"resources/read","params":{"uri":"file:///readme.md"}})");
  require_error(f.take(), 1, rpc_code::kServerNotInitialized);
}

TEST_CASE("Dispatcher - resources with a ttl are served from the resources cache", "[dispatcher]") {
  DispatchFixture f;
  f.make_ready();
  int reads = 0;
  ResourceDescriptor cached{"file:///config.json", "config", "", "application/json"};
  cached.cache_ttl = milliseconds(60000);
  cached.reader = [&reads](const std::string&) {
    ++reads;
    return expected<std::string, std::string>::success("{}");
  };
  f.dispatcher.add_resource(cached);
  int plain_reads = 0;
  ResourceDescriptor plain{"file:///live.log", "log", "", "text/plain"};
  plain.reader = [&plain_reads](const std::string&) {
    ++plain_reads;
    return expected<std::string, std::string>::success("line");
  };
  f.dispatcher.add_resource(plain);

  f.recv(R"({"jsonrpc":"2.0","id":1,"method":"resources/read","params":{"uri":"file:///config.json"}})");
  f.recv(R"({"jsonrpc":"2.0","id":2,"method":"resources/read","params":{"uri":"file:///config.json"}})");
  auto first = f.take();
  auto second = f.take();
  REQUIRE(reads == 1);
  REQUIRE(first["result"] == second["result"]);
  REQUIRE(second["id"].asInt() == 2);
  REQUIRE(f.dispatcher.stats().cache_hits == 1);
  REQUIRE(f.caches.find("resources")->size() == 1);

  f.recv(R"({"jsonrpc":"2.0","id":3,"method":"resources/read","params":{"uri":"file:///live.log"}})");
  f.recv(R"({"jsonrpc":"2.0","id":4,"method":"resources/read","params":{"uri":"file:///live.log"}})");
  REQUIRE(plain_reads == 2);
  REQUIRE(f.caches.find("resources")->size() == 1);

  f.caches.invalidate_all();
  f.recv(R"({"jsonrpc":"2.0","id":5,"method":"resources/read","params":{"uri":"file:///config.json"}})");
  REQUIRE(reads == 2);
}

TEST_CASE("Dispatcher - methods with a ttl are served from the rpc cache", "[dispatcher]") {
  DispatchFixture f;
  f.make_ready();
  int runs = 0;
  f.dispatcher.add_method(
      "workspace/symbols",
      [&runs](Session&, const Json::Value& params) -> MethodResult {
        ++runs;
        if (!params["query"].isString()) return MethodResult::error(RpcError(rpc_code::kInvalidParams, "query"));
        return MethodResult::success(Json::Value(params["query"].asString() + "!"));
      },
      true, milliseconds(60000));

  f.recv(R"({"jsonrpc":"2.0","id":1,"method":"workspace/symbols","params":{"query":"main"}})");
  f.recv(R"({"jsonrpc":"2.0","id":2,"method":"workspace/symbols","params":{"query":"main"}})");
  REQUIRE(f.take()["result"].asString() == "main!");
  REQUIRE(f.take()["result"].asString() == "main!");
  REQUIRE(runs == 1);
  REQUIRE(f.dispatcher.stats().cache_hits == 1);
  REQUIRE(f.caches.find("rpc")->size() == 1);

  // Different params miss; errors are never stored.
  f.recv(R"({"jsonrpc":"2.0","id":3,"method":"workspace/symbols","params":{"query":"init"}})");
  REQUIRE(f.take()["result"].asString() == "init!");
  REQUIRE(runs == 2);
  f.recv(R"({"jsonrpc":"2.0","id":4,"method":"workspace/symbols","params":{}})");
  f.recv(R"({"jsonrpc":"2.0","id":5,"method":"workspace/symbols","params":{}})");
  require_error(f.take(), 4, rpc_code::kInvalidParams);
  require_error(f.take(), 5, rpc_code::kInvalidParams);
  REQUIRE(runs == 4);
  REQUIRE(f.caches.find("rpc")->size() == 2);
}

// ============================================================================
// tools/call
// ============================================================================

TEST_CASE("Dispatcher - tool results are wrapped as content", "[dispatcher]") {
  REQUIRE(normalize_tool_result(Json::Value("hi"))["content"][0]["text"].asString() == "hi");
  REQUIRE(normalize_tool_result(Json::Value())["content"][0]["text"].asString() == "");
  auto obj = parse_json(R"({"b":1,"a":[true]})").value();
  REQUIRE(normalize_tool_result(obj)["content"][0]["text"].asString() == R"({"a":[true],"b":1})");
  REQUIRE(normalize_tool_result(obj)["isError"].asBool() == false);

  auto content = parse_json(R"({"content":[{"type":"text","text":"x"}],"isError":true})").value();
  REQUIRE(normalize_tool_result(content) == content);
}

TEST_CASE("Dispatcher - tools/call runs through the queue", "[dispatcher]") {
  DispatchFixture f;
  f.make_ready();
  f.add_tool(
      "echo",
      [](const Json::Value& args, const JobPtr& job, const ToolContext&) { job->resolve(args["message"]); },
      R"({"type":"object","properties":{"message":{"type":"string"}},"required":["message"]})");

  f.call(10, "echo", R"({"message":"hello"})");
  auto msg = f.take();
  REQUIRE(msg["id"].asInt() == 10);
  REQUIRE(msg["result"]["content"][0]["type"].asString() == "text");
  REQUIRE(msg["result"]["content"][0]["text"].asString() == "hello");
  REQUIRE(msg["result"]["isError"].asBool() == false);
  REQUIRE(f.queue.stats().processed == 1);
  REQUIRE(f.session->active_calls() == 0);
}

TEST_CASE("Dispatcher - tools/call parameter errors", "[dispatcher]") {
  DispatchFixture f;
  f.make_ready();
  f.add_tool(
      "echo", [](const Json::Value& args, const JobPtr& job, const ToolContext&) { job->resolve(args); },
      R"({"type":"object","properties":{"message":{"type":"string"}},"required":["message"]})");

  f.call(1, "nope");
  auto unknown = f.take();
  require_error(unknown, 1, rpc_code::kInvalidParams);
  REQUIRE(unknown["error"]["message"].asString() == "Unknown tool: nope");

  f.call(2, "echo", "{}");
  auto invalid = f.take();
  require_error(invalid, 2, rpc_code::kInvalidParams);
  REQUIRE(invalid["error"]["data"]["tool"].asString() == "echo");
  REQUIRE(invalid["error"]["data"]["reason"].asString() == "arguments.message: required property missing");

  f.call(3, "echo", "[1]");
  require_error(f.take(), 3, rpc_code::kInvalidParams);

  f.recv(R"({"jsonrpc":"2.0","id":4,"method":"tools/call","params":{"name":"bad name!"}})");
  require_error(f.take(), 4, rpc_code::kInvalidParams);

  f.recv(R"({"jsonrpc":"2.0","id":5,"method":"tools/call","params":[1]})");
  require_error(f.take(), 5, rpc_code::kInvalidParams);
  REQUIRE(f.queue.stats().queued == 0);
}

TEST_CASE("Dispatcher - failing tool reports Tool execution failed", "[dispatcher]") {
  DispatchFixture f;
  f.make_ready();
  f.add_tool("fragile", [](const Json::Value&, const JobPtr& job, const ToolContext&) {
    job->reject(RpcError(rpc_code::kInternalError, "file not found"));
  });

  f.call(7, "fragile");
  auto msg = f.take();
  require_error(msg, 7, rpc_code::kInternalError);
  REQUIRE(msg["error"]["message"].asString() == "Tool execution failed");
  REQUIRE(msg["error"]["data"]["tool"].asString() == "fragile");
  REQUIRE(msg["error"]["data"]["reason"].asString() == "file not found");
}

TEST_CASE("Dispatcher - cacheable tools are served from the tools cache", "[dispatcher]") {
  DispatchFixture f;
  f.make_ready();
  int runs = 0;
  ToolDescriptor tool;
  tool.name = "getWorkspaceFolders";
  tool.cache_ttl = milliseconds(60000);
  tool.handler = [&runs](const Json::Value&, const JobPtr& job, const ToolContext&) {
    ++runs;
    job->resolve(Json::Value("/src"));
  };
  REQUIRE(f.tools.add(tool));

  f.call(1, "getWorkspaceFolders");
  f.call(2, "getWorkspaceFolders");
  auto first = f.take();
  auto second = f.take();
  REQUIRE(runs == 1);
  REQUIRE(first["result"] == second["result"]);
  REQUIRE(second["id"].asInt() == 2);
  REQUIRE(f.dispatcher.stats().cache_hits == 1);

  f.caches.find("tools")->invalidate("getWorkspaceFolders");
  f.call(3, "getWorkspaceFolders");
  REQUIRE(runs == 2);
}

TEST_CASE("Dispatcher - progress notifications carry the token", "[dispatcher]") {
  DispatchFixture f;
  f.make_ready();
  f.add_tool("index", [](const Json::Value&, const JobPtr& job, const ToolContext& ctx) {
    ctx.report(40, "scanning");
    job->resolve(Json::Value("done"));
  });

  f.call(3, "index", "{}", R"(,"_meta":{"progressToken":"tok-1"})");
  auto progress = f.take();
  REQUIRE(progress["method"].asString() == "notifications/progress");
  REQUIRE(progress["params"]["progressToken"].asString() == "tok-1");
  REQUIRE(progress["params"]["progress"].asDouble() == 40);
  REQUIRE(progress["params"]["message"].asString() == "scanning");
  REQUIRE(f.take()["id"].asInt() == 3);

  // No token, no notification.
  f.call(4, "index");
  REQUIRE(f.take()["id"].asInt() == 4);
  REQUIRE(f.sent.empty());
}

TEST_CASE("Dispatcher - notifications/cancelled answers with -32800 once", "[dispatcher]") {
  DispatchFixture f;
  f.make_ready();
  f.add_parked_tool("slow");

  f.call(21, "slow");
  REQUIRE(f.sent.empty());
  REQUIRE(f.session->find_call(RequestId(21)).has_value());

  f.recv(R"({"jsonrpc":"2.0","method":"notifications/cancelled","params":{"requestId":21,"reason":"user"}})");
  auto msg = f.take();
  require_error(msg, 21, rpc_code::kRequestCancelled);
  REQUIRE(f.session->active_calls() == 0);

  f.parked[0]->resolve(Json::Value("late"));
  REQUIRE(f.sent.empty());

  // Unknown ids are ignored.
  f.recv(R"({"jsonrpc":"2.0","method":"notifications/cancelled","params":{"requestId":99}})");
  REQUIRE(f.sent.empty());
}

TEST_CASE("Dispatcher - full queue answers -32003", "[dispatcher]") {
  QueueConfig cfg = DispatchFixture::quiet_queue();
  cfg.max_concurrent = 1;
  cfg.max_queue_size = 1;
  DispatchFixture f(cfg);
  f.make_ready();
  f.add_parked_tool("slow");

  f.call(1, "slow");
  f.call(2, "slow");
  f.call(3, "slow");
  auto msg = f.take();
  require_error(msg, 3, rpc_code::kQueueFull);
  REQUIRE(msg["error"]["message"].asString() == "Request queue is full");
}

// ============================================================================
// Server-initiated requests
// ============================================================================

TEST_CASE("Session - server request resolved by client response", "[dispatcher]") {
  DispatchFixture f;
  f.make_ready();

  auto job = f.session->request("openDiff", parse_json(R"({"old":"a","new":"b"})").value());
  auto out = f.take();
  REQUIRE(out["method"].asString() == "openDiff");
  REQUIRE(out["id"].asInt() == 1);
  REQUIRE(f.session->pending_requests() == 1);

  f.recv(R"({"jsonrpc":"2.0","id":1,"result":{"accepted":true}})");
  REQUIRE(job->is_resolved());
  REQUIRE((*job->result())["accepted"].asBool());
  REQUIRE(f.session->pending_requests() == 0);

  auto second = f.session->request("openDiff");
  REQUIRE(f.take()["id"].asInt() == 2);
  f.recv(R"({"jsonrpc":"2.0","id":2,"error":{"code":-32000,"message":"user rejected"}})");
  REQUIRE(second->is_rejected());
  REQUIRE(second->error()->message == "user rejected");

  // Responses for unknown ids change nothing.
  f.recv(R"({"jsonrpc":"2.0","id":77,"result":{}})");
  REQUIRE(f.dispatcher.stats().responses == 3);
}

TEST_CASE("Session - server request times out", "[dispatcher]") {
  DispatchFixture f;
  f.make_ready();
  auto job = f.session->request("slowClient", Json::Value(), milliseconds(20));
  REQUIRE(f.loop.run_until([&job] { return !job->is_pending(); }, milliseconds(1000)));
  REQUIRE(job->error()->code == rpc_code::kInternalError);
  REQUIRE(job->error()->message == "Request timeout");

  // A late answer is ignored.
  f.recv(R"({"jsonrpc":"2.0","id":1,"result":{}})");
  REQUIRE(job->is_rejected());
}

TEST_CASE("Session - close rejects pending and cancels tool calls", "[dispatcher]") {
  DispatchFixture f;
  f.make_ready();
  f.add_parked_tool("slow");
  f.call(1, "slow");
  auto job = f.session->request("openFile");
  f.sent.clear();

  f.dispatcher.session_closed(f.session);
  REQUIRE(f.session->is_closed());
  REQUIRE(job->is_rejected());
  REQUIRE(job->error()->message == "Connection closed");
  REQUIRE(f.queue.stats().cancelled == 1);
  REQUIRE(f.sent.empty());

  auto after = f.session->request("openFile");
  REQUIRE(after->is_rejected());
  REQUIRE_FALSE(f.session->notify("notifications/message"));
}

TEST_CASE("Session - pending request cap", "[dispatcher]") {
  EventLoop loop;
  SessionOptions opts;
  opts.max_pending_requests = 2;
  auto session = std::make_shared<Session>(9, loop, [](const std::string&) { return true; }, opts);
  REQUIRE(session->request("a")->is_pending());
  REQUIRE(session->request("b")->is_pending());
  auto third = session->request("c");
  REQUIRE(third->is_rejected());
  REQUIRE(third->error()->message == "Too many pending requests");
  session->close();
}

TEST_CASE("Dispatcher - tool asks the client and answers with its reply", "[dispatcher]") {
  DispatchFixture f;
  f.make_ready();
  f.add_tool("confirm", [](const Json::Value&, const JobPtr& job, const ToolContext& ctx) {
    auto session = ctx.session.lock();
    REQUIRE(session);
    session->request("ide/confirm")->then([job](const Job& reply) {
      if (reply.is_resolved()) {
        job->resolve((*reply.result())["answer"]);
      } else {
        job->reject(*reply.error());
      }
    });
  });

  f.call(5, "confirm");
  auto outgoing = f.take();
  REQUIRE(outgoing["method"].asString() == "ide/confirm");
  int64_t server_id = outgoing["id"].asInt64();

  f.recv(R"({"jsonrpc":"2.0","id":)" + std::to_string(server_id) + R"(,"result":{"answer":"yes"}})");
  auto reply = f.take();
  REQUIRE(reply["id"].asInt() == 5);
  REQUIRE(reply["result"]["content"][0]["text"].asString() == "yes");
}
