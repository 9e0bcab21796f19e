#include "mcpws/discovery.hpp"

#include "mcpws/crypto.hpp"
#include "mcpws/json_rpc.hpp"
#include "mcpws/log.hpp"

#include <mbedtls/ctr_drbg.h>
#include <mbedtls/entropy.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>

#include <arpa/inet.h>
#include <fcntl.h>
#include <signal.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace mcpws {

namespace {

constexpr const char* kLockSuffix = ".lock";

// RAII wrapper around an mbedTLS CTR-DRBG instance.
class DrbgContext {
 public:
  DrbgContext() {
    mbedtls_entropy_init(&entropy_);
    mbedtls_ctr_drbg_init(&drbg_);
  }
  ~DrbgContext() {
    mbedtls_ctr_drbg_free(&drbg_);
    mbedtls_entropy_free(&entropy_);
  }

  DrbgContext(const DrbgContext&) = delete;
  DrbgContext& operator=(const DrbgContext&) = delete;

  int seed(std::string_view personalization) {
    return mbedtls_ctr_drbg_seed(&drbg_, mbedtls_entropy_func, &entropy_,
                                 reinterpret_cast<const unsigned char*>(personalization.data()),
                                 personalization.size());
  }

  int fill(uint8_t* out, size_t len) { return mbedtls_ctr_drbg_random(&drbg_, out, len); }

 private:
  mbedtls_entropy_context entropy_;
  mbedtls_ctr_drbg_context drbg_;
};

bool write_all(int fd, const std::string& data) {
  size_t off = 0;
  while (off < data.size()) {
    ssize_t n = ::write(fd, data.data() + off, data.size() - off);
    if (n < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    off += static_cast<size_t>(n);
  }
  return true;
}

std::string pretty_json(const Json::Value& v) {
  Json::StreamWriterBuilder builder;
  builder["indentation"] = "  ";
  return Json::writeString(builder, v);
}

}  // namespace

// ============================================================================
// Free functions
// ============================================================================

expected<std::string, ErrorCode> generate_auth_token() {
  DrbgContext drbg;
  int rc = drbg.seed("mcpws-auth-token");
  uint8_t bytes[16];
  if (rc == 0) {
    rc = drbg.fill(bytes, sizeof(bytes));
  }
  if (rc != 0) {
    MCPWS_LOG_ERROR("Discovery", "CTR-DRBG failure: -0x" << std::hex << -rc);
    return expected<std::string, ErrorCode>::error(ErrorCode::kInternalError);
  }

  std::string hex = to_hex(bytes, sizeof(bytes));
  std::string token;
  token.reserve(36);
  const size_t groups[] = {8, 4, 4, 4, 12};
  size_t pos = 0;
  for (size_t g : groups) {
    if (!token.empty()) token.push_back('-');
    token.append(hex, pos, g);
    pos += g;
  }
  return expected<std::string, ErrorCode>::success(std::move(token));
}

bool is_loopback_host(std::string_view host) {
  if (host == "localhost" || host == "::1") {
    return true;
  }
  in_addr addr{};
  std::string h(host);
  if (::inet_pton(AF_INET, h.c_str(), &addr) != 1) {
    return false;
  }
  return (ntohl(addr.s_addr) >> 24) == 127;
}

std::string default_lock_dir() {
  const char* home = std::getenv("HOME");
  std::string base = (home != nullptr && *home != '\0') ? home : "/tmp";
  return base + "/.claude/ide";
}

// ============================================================================
// DiscoveryRecord
// ============================================================================

Json::Value DiscoveryRecord::to_json() const {
  Json::Value v(Json::objectValue);
  v["pid"] = pid;
  Json::Value folders(Json::arrayValue);
  for (const auto& f : workspace_folders) folders.append(f);
  v["workspaceFolders"] = folders;
  v["ideName"] = ide_name;
  v["transport"] = transport;
  v["runningInWindows"] = running_in_windows;
  v["authToken"] = auth_token;
  if (!host.empty()) v["host"] = host;
  if (port != 0) v["port"] = port;
  return v;
}

expected<DiscoveryRecord, std::string> DiscoveryRecord::from_json(const Json::Value& v) {
  using Result = expected<DiscoveryRecord, std::string>;
  if (!v.isObject()) return Result::error("record is not an object");
  if (!v["pid"].isInt()) return Result::error("pid missing");
  if (!v["authToken"].isString()) return Result::error("authToken missing");

  DiscoveryRecord r;
  r.pid = v["pid"].asInt();
  r.auth_token = v["authToken"].asString();
  r.ide_name = v.get("ideName", "").asString();
  r.transport = v.get("transport", "ws").asString();
  r.running_in_windows = v.get("runningInWindows", false).asBool();
  r.host = v.get("host", "").asString();
  if (v["port"].isUInt() && v["port"].asUInt() <= 0xFFFF) {
    r.port = static_cast<uint16_t>(v["port"].asUInt());
  }
  for (const auto& f : v["workspaceFolders"]) {
    if (f.isString()) r.workspace_folders.push_back(f.asString());
  }
  return Result::success(std::move(r));
}

// ============================================================================
// Discovery
// ============================================================================

Discovery::Discovery(std::string lock_dir) : lock_dir_(std::move(lock_dir)) {}

Discovery::~Discovery() { stop(); }

std::string Discovery::lock_path_for(const std::string& lock_dir, uint16_t port) {
  return lock_dir + "/" + std::to_string(port) + kLockSuffix;
}

std::string Discovery::lock_path() const { return lock_path_for(lock_dir_, port_); }

expected<void, ErrorCode> Discovery::start(uint16_t port, const std::vector<std::string>& workspace_folders,
                                           const std::string& ide_name, const std::string& host) {
  if (!is_loopback_host(host)) {
    MCPWS_LOG_ERROR("Discovery", "refusing non-loopback host " << host);
    return expected<void, ErrorCode>::error(ErrorCode::kConfigError);
  }
  stop();

  auto token = generate_auth_token();
  if (!token) {
    return expected<void, ErrorCode>::error(token.get_error());
  }

  std::error_code ec;
  fs::create_directories(lock_dir_, ec);
  if (ec) {
    MCPWS_LOG_ERROR("Discovery", "cannot create " << lock_dir_ << ": " << ec.message());
    return expected<void, ErrorCode>::error(ErrorCode::kIoError);
  }
  fs::permissions(lock_dir_, fs::perms::owner_all, fs::perm_options::replace, ec);

  DiscoveryRecord record;
  record.pid = static_cast<int>(::getpid());
  record.workspace_folders = workspace_folders;
  record.ide_name = ide_name;
  record.auth_token = token.value();
  record.host = host;
  record.port = port;

  std::string final_path = lock_path_for(lock_dir_, port);
  std::string tmp_path = final_path + ".tmp." + std::to_string(record.pid);

  int fd = ::open(tmp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, S_IRUSR | S_IWUSR);
  if (fd < 0) {
    MCPWS_LOG_ERROR("Discovery", "cannot open " << tmp_path << ": " << std::strerror(errno));
    return expected<void, ErrorCode>::error(ErrorCode::kIoError);
  }
  ScopeGuard remove_tmp([&tmp_path] { ::unlink(tmp_path.c_str()); });

  // The umask may have narrowed the mode; an existing file keeps its old one.
  bool ok = ::fchmod(fd, S_IRUSR | S_IWUSR) == 0 && write_all(fd, pretty_json(record.to_json()));
  ok = (::close(fd) == 0) && ok;
  if (!ok || ::rename(tmp_path.c_str(), final_path.c_str()) != 0) {
    MCPWS_LOG_ERROR("Discovery", "cannot write " << final_path << ": " << std::strerror(errno));
    return expected<void, ErrorCode>::error(ErrorCode::kIoError);
  }
  remove_tmp.release();

  token_ = token.value();
  port_ = port;
  active_ = true;
  MCPWS_LOG_INFO("Discovery", "lock file written: " << final_path);
  return expected<void, ErrorCode>::success();
}

void Discovery::stop() {
  if (!active_) {
    return;
  }
  active_ = false;
  std::string path = lock_path();
  if (::unlink(path.c_str()) != 0 && errno != ENOENT) {
    MCPWS_LOG_WARN("Discovery", "cannot remove " << path << ": " << std::strerror(errno));
    return;
  }
  MCPWS_LOG_INFO("Discovery", "lock file removed: " << path);
}

expected<DiscoveryRecord, std::string> Discovery::read_record(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    return expected<DiscoveryRecord, std::string>::error("cannot open " + path);
  }
  std::stringstream ss;
  ss << in.rdbuf();
  auto json = parse_json(ss.str());
  if (!json) {
    return expected<DiscoveryRecord, std::string>::error(json.get_error());
  }
  auto record = DiscoveryRecord::from_json(json.value());
  if (!record) {
    return record;
  }
  DiscoveryRecord r = record.value();
  r.path = path;
  if (r.port == 0) {
    std::string stem = fs::path(path).stem().string();
    char* end = nullptr;
    unsigned long p = std::strtoul(stem.c_str(), &end, 10);
    if (end != nullptr && *end == '\0' && p > 0 && p <= 0xFFFF) {
      r.port = static_cast<uint16_t>(p);
    }
  }
  return expected<DiscoveryRecord, std::string>::success(std::move(r));
}

std::vector<DiscoveryRecord> Discovery::list(const std::string& lock_dir) {
  std::vector<DiscoveryRecord> out;
  std::error_code ec;
  for (fs::directory_iterator it(lock_dir, ec), end; !ec && it != end; it.increment(ec)) {
    if (it->path().extension() != kLockSuffix) continue;
    auto record = read_record(it->path().string());
    if (record) {
      out.push_back(record.value());
    } else {
      MCPWS_LOG_DEBUG("Discovery", "skipping " << it->path().string() << ": " << record.get_error());
    }
  }
  std::sort(out.begin(), out.end(),
            [](const DiscoveryRecord& a, const DiscoveryRecord& b) { return a.port < b.port; });
  return out;
}

std::optional<DiscoveryRecord> Discovery::find_for_workspace(const std::string& lock_dir, const std::string& path) {
  std::optional<DiscoveryRecord> best;
  size_t best_len = 0;
  for (auto& record : list(lock_dir)) {
    for (const auto& folder : record.workspace_folders) {
      if (folder.empty()) continue;
      bool inside = path.compare(0, folder.size(), folder) == 0 &&
                    (path.size() == folder.size() || path[folder.size()] == '/' || folder.back() == '/');
      if (inside && folder.size() > best_len) {
        best_len = folder.size();
        best = record;
      }
    }
  }
  return best;
}

bool Discovery::is_process_alive(int pid) {
  if (pid <= 0) return false;
  return ::kill(pid, 0) == 0 || errno == EPERM;
}

size_t Discovery::clean_stale(const std::string& lock_dir) {
  size_t removed = 0;
  for (const auto& record : list(lock_dir)) {
    if (is_process_alive(record.pid)) continue;
    if (::unlink(record.path.c_str()) == 0) {
      ++removed;
      MCPWS_LOG_INFO("Discovery", "removed stale lock file " << record.path << " (pid " << record.pid << ")");
    }
  }
  return removed;
}

}  // namespace mcpws
