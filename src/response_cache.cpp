#include "mcpws/response_cache.hpp"

#include "mcpws/crypto.hpp"
#include "mcpws/json_rpc.hpp"
#include "mcpws/log.hpp"

#include <algorithm>
#include <regex>
#include <vector>

namespace mcpws {

namespace {

constexpr size_t kEntryOverhead = 64;

void canonicalize_into(const Json::Value& v, size_t depth, size_t max_depth, std::string& out) {
  if ((v.isObject() || v.isArray()) && depth >= max_depth) {
    out += "\"<max-depth>\"";
    return;
  }
  if (v.isObject()) {
    std::vector<std::string> names = v.getMemberNames();
    std::sort(names.begin(), names.end());
    out.push_back('{');
    bool first = true;
    for (const auto& name : names) {
      if (!first) out.push_back(',');
      first = false;
      out += to_compact_string(Json::Value(name));
      out.push_back(':');
      canonicalize_into(v[name], depth + 1, max_depth, out);
    }
    out.push_back('}');
  } else if (v.isArray()) {
    out.push_back('[');
    for (Json::ArrayIndex i = 0; i < v.size(); ++i) {
      if (i > 0) out.push_back(',');
      canonicalize_into(v[i], depth + 1, max_depth, out);
    }
    out.push_back(']');
  } else {
    out += to_compact_string(v);
  }
}

}  // namespace

const char* eviction_reason_name(EvictionReason reason) {
  switch (reason) {
    case EvictionReason::kLru: return "lru";
    case EvictionReason::kMemory: return "memory";
    case EvictionReason::kExpired: return "expired";
    case EvictionReason::kInvalidated: return "invalidated";
    case EvictionReason::kReplaced: return "replaced";
  }
  return "unknown";
}

std::string canonicalize(const Json::Value& value, size_t max_depth) {
  std::string out;
  canonicalize_into(value, 0, max_depth, out);
  return out;
}

// ============================================================================
// ResponseCache
// ============================================================================

ResponseCache::ResponseCache(const CacheConfig& config, std::string name)
    : config_(config), name_(std::move(name)) {}

ResponseCache::~ResponseCache() { stop_cleanup(); }

std::string ResponseCache::make_key(std::string_view method, const Json::Value& params) const {
  std::string key(method);
  key.push_back(':');
  key += SHA1::hex_digest(canonicalize(params, config_.max_key_depth));
  return key;
}

CacheLookup ResponseCache::get(std::string_view method, const Json::Value& params) {
  auto found = index_.find(make_key(method, params));
  if (found == index_.end()) {
    ++misses_;
    return CacheLookup{};
  }
  auto it = found->second;
  auto now = Clock::now();
  if (it->expired(now)) {
    ++misses_;
    erase(it, EvictionReason::kExpired);
    return CacheLookup{};
  }
  it->last_access = now;
  ++it->access_count;
  lru_.splice(lru_.begin(), lru_, it);
  ++hits_;
  return CacheLookup{it->value, true};
}

bool ResponseCache::contains(std::string_view method, const Json::Value& params) const {
  auto found = index_.find(make_key(method, params));
  return found != index_.end() && !found->second->expired(Clock::now());
}

bool ResponseCache::set(std::string_view method, const Json::Value& params, const Json::Value& value,
                        std::optional<std::chrono::milliseconds> ttl) {
  std::string key = make_key(method, params);
  size_t estimate = to_compact_string(value).size() + key.size() + method.size() + kEntryOverhead;
  if (estimate > config_.max_entry_size || estimate > config_.memory_limit) {
    ++rejected_;
    MCPWS_LOG_WARN("Cache", name_ << ": refusing " << estimate << " byte entry for " << method);
    return false;
  }

  auto found = index_.find(key);
  if (found != index_.end()) {
    erase(found->second, EvictionReason::kReplaced);
  }

  auto now = Clock::now();
  Entry entry;
  entry.key = key;
  entry.method = std::string(method);
  entry.value = value;
  entry.created_at = now;
  entry.ttl = ttl ? ttl : config_.default_ttl;
  entry.last_access = now;
  entry.size_estimate = estimate;

  lru_.push_front(std::move(entry));
  index_[key] = lru_.begin();
  memory_ += estimate;
  ++sets_;

  enforce_limits();
  return true;
}

void ResponseCache::enforce_limits() {
  while (memory_ > config_.memory_limit && !lru_.empty()) {
    erase(std::prev(lru_.end()), EvictionReason::kMemory);
  }
  while (lru_.size() > config_.max_size && !lru_.empty()) {
    erase(std::prev(lru_.end()), EvictionReason::kLru);
  }
}

void ResponseCache::erase(LruList::iterator it, EvictionReason reason) {
  std::string key = it->key;
  std::string method = it->method;
  memory_ -= it->size_estimate;
  index_.erase(key);
  lru_.erase(it);

  if (reason == EvictionReason::kLru || reason == EvictionReason::kMemory) {
    ++evictions_;
    MCPWS_LOG_TRACE("Cache", name_ << ": evicted " << key << " (" << eviction_reason_name(reason) << ")");
  } else if (reason == EvictionReason::kExpired) {
    ++expirations_;
  }
  if (on_evict) {
    on_evict(key, method, reason);
  }
}

size_t ResponseCache::invalidate(std::string_view method_pattern) {
  std::regex re;
  try {
    re = std::regex(method_pattern.begin(), method_pattern.end());
  } catch (const std::regex_error& ex) {
    MCPWS_LOG_WARN("Cache", name_ << ": bad invalidation pattern '" << method_pattern << "': " << ex.what());
    return 0;
  }
  size_t removed = 0;
  for (auto it = lru_.begin(); it != lru_.end();) {
    auto next = std::next(it);
    if (std::regex_search(it->method, re)) {
      erase(it, EvictionReason::kInvalidated);
      ++removed;
    }
    it = next;
  }
  return removed;
}

size_t ResponseCache::invalidate_all() {
  size_t removed = lru_.size();
  while (!lru_.empty()) {
    erase(lru_.begin(), EvictionReason::kInvalidated);
  }
  return removed;
}

size_t ResponseCache::cleanup() {
  auto now = Clock::now();
  size_t removed = 0;
  for (auto it = lru_.begin(); it != lru_.end();) {
    auto next = std::next(it);
    if (it->expired(now)) {
      erase(it, EvictionReason::kExpired);
      ++removed;
    }
    it = next;
  }
  if (removed > 0) {
    MCPWS_LOG_DEBUG("Cache", name_ << ": cleanup removed " << removed << " expired entries");
  }
  return removed;
}

void ResponseCache::start_cleanup(EventLoop& loop) {
  stop_cleanup();
  loop_ = &loop;
  cleanup_timer_ = loop.call_every(config_.cleanup_interval, [this] { cleanup(); });
}

void ResponseCache::stop_cleanup() {
  if (loop_ != nullptr && cleanup_timer_ != EventLoop::kInvalidTimer) {
    loop_->cancel(cleanup_timer_);
  }
  cleanup_timer_ = EventLoop::kInvalidTimer;
  loop_ = nullptr;
}

CacheStats ResponseCache::stats() const {
  CacheStats s;
  s.entries = lru_.size();
  s.memory_bytes = memory_;
  s.max_size = config_.max_size;
  s.memory_limit = config_.memory_limit;
  s.hits = hits_;
  s.misses = misses_;
  s.sets = sets_;
  s.rejected = rejected_;
  s.evictions = evictions_;
  s.expirations = expirations_;
  return s;
}

// ============================================================================
// CacheRegistry
// ============================================================================

ResponseCache& CacheRegistry::get(const std::string& name, const CacheConfig& config) {
  auto it = caches_.find(name);
  if (it == caches_.end()) {
    it = caches_.emplace(name, std::make_unique<ResponseCache>(config, name)).first;
  }
  return *it->second;
}

ResponseCache* CacheRegistry::find(const std::string& name) {
  auto it = caches_.find(name);
  return it == caches_.end() ? nullptr : it->second.get();
}

void CacheRegistry::create_defaults(const CacheConfig& base) {
  struct Preset {
    const char* name;
    size_t max_size;
    int ttl_s;
  };
  const Preset presets[] = {{"tools", 50, 60}, {"resources", 200, 600}, {"rpc", 100, 120}};
  for (const auto& p : presets) {
    CacheConfig cfg = base;
    cfg.max_size = p.max_size;
    cfg.default_ttl = std::chrono::seconds(p.ttl_s);
    get(p.name, cfg);
  }
}

size_t CacheRegistry::invalidate_all() {
  size_t removed = 0;
  for (auto& kv : caches_) removed += kv.second->invalidate_all();
  return removed;
}

size_t CacheRegistry::cleanup_all() {
  size_t removed = 0;
  for (auto& kv : caches_) removed += kv.second->cleanup();
  return removed;
}

std::map<std::string, CacheStats> CacheRegistry::all_stats() const {
  std::map<std::string, CacheStats> out;
  for (const auto& kv : caches_) out.emplace(kv.first, kv.second->stats());
  return out;
}

void CacheRegistry::start_cleanup(EventLoop& loop, std::chrono::milliseconds interval) {
  stop_cleanup();
  loop_ = &loop;
  cleanup_timer_ = loop.call_every(interval, [this] { cleanup_all(); });
}

void CacheRegistry::stop_cleanup() {
  if (loop_ != nullptr && cleanup_timer_ != EventLoop::kInvalidTimer) {
    loop_->cancel(cleanup_timer_);
  }
  cleanup_timer_ = EventLoop::kInvalidTimer;
  loop_ = nullptr;
}

}  // namespace mcpws
