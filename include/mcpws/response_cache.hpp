#ifndef MCPWS_RESPONSE_CACHE_HPP_
#define MCPWS_RESPONSE_CACHE_HPP_

#include "event_loop.hpp"

#include <json/json.h>

#include <chrono>
#include <cstdint>
#include <functional>
#include <list>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace mcpws {

struct CacheConfig {
  size_t max_size = 100;
  std::optional<std::chrono::milliseconds> default_ttl = std::chrono::milliseconds(300000);
  size_t memory_limit = 10 * 1024 * 1024;
  size_t max_entry_size = 1024 * 1024;
  size_t max_key_depth = 10;
  std::chrono::milliseconds cleanup_interval{300000};
};

enum class EvictionReason : uint8_t { kLru, kMemory, kExpired, kInvalidated, kReplaced };

const char* eviction_reason_name(EvictionReason reason);

struct CacheStats {
  size_t entries = 0;
  size_t memory_bytes = 0;
  size_t max_size = 0;
  size_t memory_limit = 0;
  uint64_t hits = 0;
  uint64_t misses = 0;
  uint64_t sets = 0;
  uint64_t rejected = 0;
  uint64_t evictions = 0;
  uint64_t expirations = 0;
};

struct CacheLookup {
  Json::Value value;
  bool hit = false;
};

// Deterministic serialization: object keys sorted, nesting past max_depth
// replaced by a marker.
std::string canonicalize(const Json::Value& value, size_t max_depth);

/**
 * @brief LRU + TTL memoization of responses keyed by method and params.
 *
 * Keys are "<method>:<sha1 of canonical params>". Entry count stays at or
 * below max_size and the summed size estimate at or below memory_limit
 * after every mutation.
 */
class ResponseCache {
 public:
  using Clock = std::chrono::steady_clock;
  using EvictFn = std::function<void(const std::string& key, const std::string& method, EvictionReason reason)>;

  explicit ResponseCache(const CacheConfig& config = CacheConfig(), std::string name = "cache");
  ~ResponseCache();

  ResponseCache(const ResponseCache&) = delete;
  ResponseCache& operator=(const ResponseCache&) = delete;

  CacheLookup get(std::string_view method, const Json::Value& params);

  // False when the value is refused (too large); the cache is unchanged.
  bool set(std::string_view method, const Json::Value& params, const Json::Value& value,
           std::optional<std::chrono::milliseconds> ttl = std::nullopt);

  // ECMAScript regex searched in the method name.
  size_t invalidate(std::string_view method_pattern);
  size_t invalidate_all();

  // Drops expired entries. Returns how many.
  size_t cleanup();

  void start_cleanup(EventLoop& loop);
  void stop_cleanup();

  std::string make_key(std::string_view method, const Json::Value& params) const;

  size_t size() const { return lru_.size(); }
  size_t memory_usage() const { return memory_; }
  bool contains(std::string_view method, const Json::Value& params) const;
  CacheStats stats() const;
  const CacheConfig& config() const { return config_; }
  const std::string& name() const { return name_; }

  EvictFn on_evict;

 private:
  struct Entry {
    std::string key;
    std::string method;
    Json::Value value;
    Clock::time_point created_at;
    std::optional<std::chrono::milliseconds> ttl;
    Clock::time_point last_access;
    uint64_t access_count = 0;
    size_t size_estimate = 0;

    bool expired(Clock::time_point now) const { return ttl && now - created_at >= *ttl; }
  };

  using LruList = std::list<Entry>;

  void erase(LruList::iterator it, EvictionReason reason);
  void enforce_limits();

  CacheConfig config_;
  std::string name_;
  LruList lru_;  // front is most recently used
  std::unordered_map<std::string, LruList::iterator> index_;
  size_t memory_ = 0;

  EventLoop* loop_ = nullptr;
  EventLoop::TimerId cleanup_timer_ = EventLoop::kInvalidTimer;

  uint64_t hits_ = 0;
  uint64_t misses_ = 0;
  uint64_t sets_ = 0;
  uint64_t rejected_ = 0;
  uint64_t evictions_ = 0;
  uint64_t expirations_ = 0;
};

// ============================================================================
// CacheRegistry - named caches owned by the server
// ============================================================================

class CacheRegistry {
 public:
  CacheRegistry() = default;
  ~CacheRegistry() { stop_cleanup(); }

  // Creates the cache on first use; config is ignored afterwards.
  ResponseCache& get(const std::string& name, const CacheConfig& config = CacheConfig());
  ResponseCache* find(const std::string& name);

  // tools (50, 60s), resources (200, 600s), rpc (100, 120s). Each preset
  // takes memory_limit, max_entry_size and max_key_depth from base.
  void create_defaults(const CacheConfig& base = CacheConfig());

  size_t invalidate_all();
  size_t cleanup_all();
  std::map<std::string, CacheStats> all_stats() const;

  // One periodic sweep over every cache.
  void start_cleanup(EventLoop& loop, std::chrono::milliseconds interval);
  void stop_cleanup();

 private:
  std::map<std::string, std::unique_ptr<ResponseCache>> caches_;
  EventLoop* loop_ = nullptr;
  EventLoop::TimerId cleanup_timer_ = EventLoop::kInvalidTimer;
};

}  // namespace mcpws

#endif  // MCPWS_RESPONSE_CACHE_HPP_
