#ifndef MCPWS_CONFIG_HPP_
#define MCPWS_CONFIG_HPP_

#include "handshake.hpp"
#include "request_queue.hpp"
#include "response_cache.hpp"
#include "session.hpp"
#include "vocabulary.hpp"

#include <json/json.h>

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#define MCPWS_VERSION "0.3.0"

namespace mcpws {

struct ConfigError {
  ErrorCode code = ErrorCode::kConfigError;
  std::string reason;
};

/**
 * @brief Everything a Server needs, with the defaults it runs on.
 *
 * JSON keys are the field names; durations carry an _ms suffix.
 */
struct ServerConfig {
  // Transport
  std::string host = "127.0.0.1";
  uint16_t port = 0;  // 0 picks an ephemeral port
  size_t max_connections = 16;
  size_t max_message_size = 1024 * 1024;
  size_t max_send_buffer = 8 * 1024 * 1024;  // per connection; a peer past it is closed with 1008
  std::chrono::milliseconds heartbeat_interval{30000};
  std::chrono::milliseconds handshake_timeout{5000};
  std::chrono::milliseconds close_timeout{5000};
  std::chrono::milliseconds housekeeping_interval{1000};

  // Discovery / auth
  bool require_auth = true;
  bool enable_discovery = true;
  bool export_env = true;
  std::string auth_header = kDefaultAuthHeader;
  std::string lock_dir;  // empty means default_lock_dir()
  std::string ide_name = "mcpws";
  std::vector<std::string> workspace_folders;

  // MCP
  std::string server_name = "mcpws";
  std::string server_version = MCPWS_VERSION;
  std::string instructions;
  std::string protocol_version = kDefaultProtocolVersion;
  SessionOptions session;

  QueueConfig queue;
  CacheConfig cache;  // base for every named cache; max_size and default_ttl come from the presets

  // Logging
  std::string log_level = "info";
  std::string log_file;
};

// Applies the members present in root over base.
expected<ServerConfig, ConfigError> config_from_json(const Json::Value& root, ServerConfig base = ServerConfig());

// Reads a JSON file over base. kIoError when unreadable.
expected<ServerConfig, ConfigError> load_config(const std::string& path, ServerConfig base = ServerConfig());

// Loopback host, sane limits, known log level.
expected<void, ConfigError> validate_config(const ServerConfig& config);

Json::Value config_to_json(const ServerConfig& config);

}  // namespace mcpws

#endif  // MCPWS_CONFIG_HPP_
