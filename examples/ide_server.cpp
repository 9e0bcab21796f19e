#include "mcpws.hpp"

#include <csignal>
#include <iostream>
#include <string>

namespace {

mcpws::Server* g_server = nullptr;

void on_signal(int) {
  if (g_server != nullptr) g_server->stop();
}

Json::Value schema(const char* text) {
  auto parsed = mcpws::parse_json(text);
  return parsed ? parsed.value() : Json::Value(Json::objectValue);
}

}  // namespace

int main(int argc, char* argv[]) {
  mcpws::ServerConfig config;
  if (argc > 1) {
    auto loaded = mcpws::load_config(argv[1]);
    if (!loaded) {
      std::cerr << "Error: " << loaded.get_error().reason << std::endl;
      return 1;
    }
    config = loaded.value();
  }
  if (config.workspace_folders.empty()) {
    config.workspace_folders.push_back(".");
  }

  try {
    mcpws::Server server(config);
    g_server = &server;
    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    mcpws::ToolDescriptor workspace;
    workspace.name = "getWorkspaceFolders";
    workspace.description = "List the folders open in the editor";
    workspace.cache_ttl = std::chrono::minutes(10);
    workspace.handler = [folders = config.workspace_folders](const Json::Value&, const mcpws::JobPtr& job,
                                                              const mcpws::ToolContext&) {
      Json::Value result(Json::objectValue);
      result["folders"] = Json::Value(Json::arrayValue);
      for (const auto& f : folders) result["folders"].append(f);
      job->resolve(result);
    };

    // Asks the client to confirm, then reports its answer.
    mcpws::ToolDescriptor confirm;
    confirm.name = "confirmAction";
    confirm.description = "Ask the connected client to accept or reject an action";
    confirm.input_schema = schema(R"({"type":"object","properties":{"message":{"type":"string","minLength":1}},)"
                                  R"("required":["message"]})");
    confirm.timeout = std::chrono::minutes(5);
    confirm.max_retries = 0;
    confirm.handler = [](const Json::Value& args, const mcpws::JobPtr& job, const mcpws::ToolContext& ctx) {
      auto session = ctx.session.lock();
      if (!session) {
        job->reject(mcpws::RpcError(mcpws::rpc_code::kInternalError, "Connection closed"));
        return;
      }
      ctx.report(10, "waiting for the client");
      Json::Value params(Json::objectValue);
      params["message"] = args["message"];
      session->request("ide/confirm", params)->then([job](const mcpws::Job& reply) {
        if (reply.is_resolved()) {
          job->resolve(*reply.result());
        } else {
          job->reject(*reply.error());
        }
      });
    };

    for (auto* tool : {&workspace, &confirm}) {
      auto added = server.tools().add(*tool);
      if (!added) {
        std::cerr << "Error: " << added.get_error() << std::endl;
        return 1;
      }
    }

    // The workspace folder list, readable as a resource and cached for a minute.
    mcpws::ResourceDescriptor folders{"ide://workspace/folders", "workspaceFolders", "Folders open in the editor",
                                      "text/plain"};
    folders.cache_ttl = std::chrono::minutes(1);
    folders.reader = [list = config.workspace_folders](const std::string&) {
      std::string text;
      for (const auto& f : list) text += f + "\n";
      return mcpws::expected<std::string, std::string>::success(text);
    };
    server.dispatcher().add_resource(folders);

    server.on_ready = [](const mcpws::SessionPtr& session) {
      std::cout << "Session #" << session->id() << " ready (" << session->client().name << ")" << std::endl;
    };
    server.on_disconnect = [](const std::shared_ptr<mcpws::Connection>& conn, bool clean) {
      std::cout << "Client #" << conn->get_id() << " closed (" << (clean ? "clean" : "unclean") << ")" << std::endl;
    };

    auto started = server.start();
    if (!started) {
      std::cerr << "Error: " << mcpws::error_code_name(started.get_error()) << std::endl;
      return 1;
    }
    std::cout << "Listening on port " << server.port() << ", lock file " << server.discovery().lock_path()
              << std::endl;
    server.run();
    g_server = nullptr;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
