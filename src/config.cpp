#include "mcpws/config.hpp"

#include "mcpws/discovery.hpp"
#include "mcpws/json_rpc.hpp"
#include "mcpws/log.hpp"

#include <fstream>
#include <sstream>

namespace mcpws {

namespace {

using Result = expected<void, ConfigError>;

Result type_error(const std::string& key, const char* expected_type) {
  return Result::error(ConfigError{ErrorCode::kConfigError, key + ": expected " + expected_type});
}

// Each reader leaves out untouched when key is absent.
Result read(const Json::Value& obj, const std::string& prefix, const char* key, std::string& out) {
  if (!obj.isMember(key)) return Result::success();
  if (!obj[key].isString()) return type_error(prefix + key, "string");
  out = obj[key].asString();
  return Result::success();
}

Result read(const Json::Value& obj, const std::string& prefix, const char* key, bool& out) {
  if (!obj.isMember(key)) return Result::success();
  if (!obj[key].isBool()) return type_error(prefix + key, "boolean");
  out = obj[key].asBool();
  return Result::success();
}

template <typename T>
Result read_uint(const Json::Value& obj, const std::string& prefix, const char* key, T& out) {
  if (!obj.isMember(key)) return Result::success();
  if (!obj[key].isUInt64()) return type_error(prefix + key, "non-negative integer");
  out = static_cast<T>(obj[key].asUInt64());
  return Result::success();
}

Result read_ms(const Json::Value& obj, const std::string& prefix, const char* key, std::chrono::milliseconds& out) {
  uint64_t ms = static_cast<uint64_t>(out.count());
  auto r = read_uint(obj, prefix, key, ms);
  if (r) out = std::chrono::milliseconds(ms);
  return r;
}

Result read(const Json::Value& obj, const std::string& prefix, const char* key, std::vector<std::string>& out) {
  if (!obj.isMember(key)) return Result::success();
  const Json::Value& v = obj[key];
  if (!v.isArray()) return type_error(prefix + key, "array of strings");
  std::vector<std::string> items;
  for (const auto& item : v) {
    if (!item.isString()) return type_error(prefix + key, "array of strings");
    items.push_back(item.asString());
  }
  out = std::move(items);
  return Result::success();
}

#define MCPWS_CONFIG_TRY(expr) \
  do {                         \
    auto r_ = (expr);          \
    if (!r_) return r_;        \
  } while (0)

Result apply(const Json::Value& root, ServerConfig& cfg) {
  if (!root.isObject()) {
    return Result::error(ConfigError{ErrorCode::kConfigError, "configuration must be a JSON object"});
  }
  const std::string top;
  MCPWS_CONFIG_TRY(read(root, top, "host", cfg.host));
  MCPWS_CONFIG_TRY(read_uint(root, top, "port", cfg.port));
  if (root["port"].isUInt64() && root["port"].asUInt64() > 65535) {
    return Result::error(ConfigError{ErrorCode::kConfigError, "port: out of range"});
  }
  MCPWS_CONFIG_TRY(read_uint(root, top, "max_connections", cfg.max_connections));
  MCPWS_CONFIG_TRY(read_uint(root, top, "max_message_size", cfg.max_message_size));
  MCPWS_CONFIG_TRY(read_uint(root, top, "max_send_buffer", cfg.max_send_buffer));
  MCPWS_CONFIG_TRY(read_ms(root, top, "heartbeat_interval_ms", cfg.heartbeat_interval));
  MCPWS_CONFIG_TRY(read_ms(root, top, "handshake_timeout_ms", cfg.handshake_timeout));
  MCPWS_CONFIG_TRY(read_ms(root, top, "close_timeout_ms", cfg.close_timeout));
  MCPWS_CONFIG_TRY(read_ms(root, top, "housekeeping_interval_ms", cfg.housekeeping_interval));
  MCPWS_CONFIG_TRY(read(root, top, "require_auth", cfg.require_auth));
  MCPWS_CONFIG_TRY(read(root, top, "enable_discovery", cfg.enable_discovery));
  MCPWS_CONFIG_TRY(read(root, top, "export_env", cfg.export_env));
  MCPWS_CONFIG_TRY(read(root, top, "auth_header", cfg.auth_header));
  MCPWS_CONFIG_TRY(read(root, top, "lock_dir", cfg.lock_dir));
  MCPWS_CONFIG_TRY(read(root, top, "ide_name", cfg.ide_name));
  MCPWS_CONFIG_TRY(read(root, top, "workspace_folders", cfg.workspace_folders));
  MCPWS_CONFIG_TRY(read(root, top, "server_name", cfg.server_name));
  MCPWS_CONFIG_TRY(read(root, top, "server_version", cfg.server_version));
  MCPWS_CONFIG_TRY(read(root, top, "instructions", cfg.instructions));
  MCPWS_CONFIG_TRY(read(root, top, "protocol_version", cfg.protocol_version));
  MCPWS_CONFIG_TRY(read_ms(root, top, "request_timeout_ms", cfg.session.request_timeout));
  MCPWS_CONFIG_TRY(read_uint(root, top, "max_pending_requests", cfg.session.max_pending_requests));
  MCPWS_CONFIG_TRY(read(root, top, "log_level", cfg.log_level));
  MCPWS_CONFIG_TRY(read(root, top, "log_file", cfg.log_file));

  if (root.isMember("queue")) {
    const Json::Value& q = root["queue"];
    if (!q.isObject()) return type_error("queue", "object");
    const std::string p = "queue.";
    MCPWS_CONFIG_TRY(read_uint(q, p, "max_concurrent", cfg.queue.max_concurrent));
    MCPWS_CONFIG_TRY(read_uint(q, p, "max_queue_size", cfg.queue.max_queue_size));
    MCPWS_CONFIG_TRY(read_ms(q, p, "timeout_ms", cfg.queue.timeout));
    MCPWS_CONFIG_TRY(read_uint(q, p, "max_retries", cfg.queue.max_retries));
    MCPWS_CONFIG_TRY(read_ms(q, p, "retry_base_delay_ms", cfg.queue.retry_base_delay));
    MCPWS_CONFIG_TRY(read_ms(q, p, "max_retry_delay_ms", cfg.queue.max_retry_delay));
    if (q.isMember("rate_limit")) {
      const Json::Value& rl = q["rate_limit"];
      if (!rl.isObject()) return type_error("queue.rate_limit", "object");
      const std::string rp = "queue.rate_limit.";
      MCPWS_CONFIG_TRY(read(rl, rp, "enabled", cfg.queue.rate_limit.enabled));
      MCPWS_CONFIG_TRY(read_uint(rl, rp, "max_requests", cfg.queue.rate_limit.max_requests));
      MCPWS_CONFIG_TRY(read_ms(rl, rp, "window_ms", cfg.queue.rate_limit.window));
      MCPWS_CONFIG_TRY(read_ms(rl, rp, "retry_after_ms", cfg.queue.rate_limit.retry_after));
    }
  }

  if (root.isMember("cache")) {
    const Json::Value& c = root["cache"];
    if (!c.isObject()) return type_error("cache", "object");
    const std::string p = "cache.";
    MCPWS_CONFIG_TRY(read_uint(c, p, "memory_limit", cfg.cache.memory_limit));
    MCPWS_CONFIG_TRY(read_uint(c, p, "max_entry_size", cfg.cache.max_entry_size));
    MCPWS_CONFIG_TRY(read_uint(c, p, "max_key_depth", cfg.cache.max_key_depth));
    MCPWS_CONFIG_TRY(read_ms(c, p, "cleanup_interval_ms", cfg.cache.cleanup_interval));
  }
  return Result::success();
}

#undef MCPWS_CONFIG_TRY

}  // namespace

expected<ServerConfig, ConfigError> config_from_json(const Json::Value& root, ServerConfig base) {
  auto r = apply(root, base);
  if (!r) {
    return expected<ServerConfig, ConfigError>::error(r.get_error());
  }
  return expected<ServerConfig, ConfigError>::success(std::move(base));
}

expected<ServerConfig, ConfigError> load_config(const std::string& path, ServerConfig base) {
  std::ifstream in(path);
  if (!in) {
    return expected<ServerConfig, ConfigError>::error(ConfigError{ErrorCode::kIoError, "cannot read " + path});
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  auto parsed = parse_json(ss.str());
  if (!parsed) {
    return expected<ServerConfig, ConfigError>::error(
        ConfigError{ErrorCode::kConfigError, path + ": " + parsed.get_error()});
  }
  MCPWS_LOG_DEBUG("Config", "loaded " << path);
  return config_from_json(parsed.value(), std::move(base));
}

expected<void, ConfigError> validate_config(const ServerConfig& config) {
  auto fail = [](std::string reason) { return Result::error(ConfigError{ErrorCode::kConfigError, std::move(reason)}); };

  if (!is_loopback_host(config.host)) {
    return fail("host must be a loopback address, got " + config.host);
  }
  if (config.max_connections == 0) return fail("max_connections must be positive");
  if (config.max_message_size == 0) return fail("max_message_size must be positive");
  if (config.max_send_buffer < config.max_message_size) {
    return fail("max_send_buffer must be at least max_message_size");
  }
  if (config.auth_header.empty()) return fail("auth_header must not be empty");
  if (config.protocol_version.empty()) return fail("protocol_version must not be empty");
  if (config.handshake_timeout.count() <= 0) return fail("handshake_timeout_ms must be positive");
  if (config.housekeeping_interval.count() <= 0) return fail("housekeeping_interval_ms must be positive");
  if (config.session.max_pending_requests == 0) return fail("max_pending_requests must be positive");
  if (config.queue.max_concurrent == 0) return fail("queue.max_concurrent must be positive");
  if (config.queue.max_queue_size == 0) return fail("queue.max_queue_size must be positive");
  if (config.queue.timeout.count() <= 0) return fail("queue.timeout_ms must be positive");
  if (config.queue.rate_limit.enabled) {
    if (config.queue.rate_limit.max_requests == 0) return fail("queue.rate_limit.max_requests must be positive");
    if (config.queue.rate_limit.window.count() <= 0) return fail("queue.rate_limit.window_ms must be positive");
    if (config.queue.rate_limit.retry_after.count() <= 0) {
      return fail("queue.rate_limit.retry_after_ms must be positive");
    }
  }
  if (config.cache.memory_limit == 0) return fail("cache.memory_limit must be positive");
  if (config.cache.max_entry_size == 0) return fail("cache.max_entry_size must be positive");
  Logger::Level level;
  if (!Logger::parse_level(config.log_level, level)) return fail("unknown log_level " + config.log_level);
  return Result::success();
}

Json::Value config_to_json(const ServerConfig& config) {
  Json::Value root(Json::objectValue);
  root["host"] = config.host;
  root["port"] = config.port;
  root["max_connections"] = static_cast<Json::UInt64>(config.max_connections);
  root["max_message_size"] = static_cast<Json::UInt64>(config.max_message_size);
  root["max_send_buffer"] = static_cast<Json::UInt64>(config.max_send_buffer);
  root["heartbeat_interval_ms"] = static_cast<Json::Int64>(config.heartbeat_interval.count());
  root["handshake_timeout_ms"] = static_cast<Json::Int64>(config.handshake_timeout.count());
  root["require_auth"] = config.require_auth;
  root["enable_discovery"] = config.enable_discovery;
  root["auth_header"] = config.auth_header;
  root["lock_dir"] = config.lock_dir;
  root["ide_name"] = config.ide_name;
  Json::Value folders(Json::arrayValue);
  for (const auto& f : config.workspace_folders) folders.append(f);
  root["workspace_folders"] = folders;
  root["server_name"] = config.server_name;
  root["server_version"] = config.server_version;
  root["protocol_version"] = config.protocol_version;
  root["log_level"] = config.log_level;

  Json::Value q(Json::objectValue);
  q["max_concurrent"] = config.queue.max_concurrent;
  q["max_queue_size"] = config.queue.max_queue_size;
  q["timeout_ms"] = static_cast<Json::Int64>(config.queue.timeout.count());
  q["max_retries"] = config.queue.max_retries;
  Json::Value rl(Json::objectValue);
  rl["enabled"] = config.queue.rate_limit.enabled;
  rl["max_requests"] = config.queue.rate_limit.max_requests;
  rl["window_ms"] = static_cast<Json::Int64>(config.queue.rate_limit.window.count());
  rl["retry_after_ms"] = static_cast<Json::Int64>(config.queue.rate_limit.retry_after.count());
  q["rate_limit"] = rl;
  root["queue"] = q;

  Json::Value c(Json::objectValue);
  c["memory_limit"] = static_cast<Json::UInt64>(config.cache.memory_limit);
  c["max_entry_size"] = static_cast<Json::UInt64>(config.cache.max_entry_size);
  c["max_key_depth"] = static_cast<Json::UInt64>(config.cache.max_key_depth);
  c["cleanup_interval_ms"] = static_cast<Json::Int64>(config.cache.cleanup_interval.count());
  root["cache"] = c;
  return root;
}

}  // namespace mcpws
