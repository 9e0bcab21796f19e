#ifndef MCPWS_DISCOVERY_HPP_
#define MCPWS_DISCOVERY_HPP_

#include "vocabulary.hpp"

#include <json/json.h>

#include <cstdint>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcpws {

// ============================================================================
// Random tokens
// ============================================================================

// 16 bytes from a CTR-DRBG seeded by the platform entropy source, printed
// as 8-4-4-4-12 lowercase hex.
expected<std::string, ErrorCode> generate_auth_token();

// 127.0.0.0/8, ::1 and "localhost".
bool is_loopback_host(std::string_view host);

// $HOME/.claude/ide
std::string default_lock_dir();

// ============================================================================
// Discovery record (lock file)
// ============================================================================

struct DiscoveryRecord {
  int pid = 0;
  std::vector<std::string> workspace_folders;
  std::string ide_name;
  std::string transport = "ws";
  bool running_in_windows = false;
  std::string auth_token;
  std::string host;
  uint16_t port = 0;
  std::string path;  // where it was read from; not serialized

  Json::Value to_json() const;
  static expected<DiscoveryRecord, std::string> from_json(const Json::Value& v);
};

/**
 * @brief Owns the lock file that advertises a running server.
 *
 * The file is <lock_dir>/<port>.lock, mode 0600, written through a
 * temporary file and rename so readers never see a partial record.
 */
class Discovery {
 public:
  explicit Discovery(std::string lock_dir = default_lock_dir());
  ~Discovery();

  Discovery(const Discovery&) = delete;
  Discovery& operator=(const Discovery&) = delete;

  // Generates the auth token and writes the record. kConfigError for a
  // non-loopback host, kIoError if the file cannot be written.
  expected<void, ErrorCode> start(uint16_t port, const std::vector<std::string>& workspace_folders,
                                  const std::string& ide_name, const std::string& host);

  // Removes the record. Safe to call repeatedly.
  void stop();

  bool active() const { return active_; }
  const std::string& token() const { return token_; }
  uint16_t port() const { return port_; }
  const std::string& lock_dir() const { return lock_dir_; }
  std::string lock_path() const;

  static std::string lock_path_for(const std::string& lock_dir, uint16_t port);

  static expected<DiscoveryRecord, std::string> read_record(const std::string& path);

  // Every parseable record in lock_dir, ordered by port.
  static std::vector<DiscoveryRecord> list(const std::string& lock_dir);

  // Record whose workspace contains path (longest folder match).
  static std::optional<DiscoveryRecord> find_for_workspace(const std::string& lock_dir, const std::string& path);

  // Deletes records whose pid is no longer alive. Returns the count removed.
  static size_t clean_stale(const std::string& lock_dir);

  static bool is_process_alive(int pid);

 private:
  std::string lock_dir_;
  std::string token_;
  uint16_t port_ = 0;
  bool active_ = false;
};

}  // namespace mcpws

#endif  // MCPWS_DISCOVERY_HPP_
