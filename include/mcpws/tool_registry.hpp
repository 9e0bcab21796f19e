#ifndef MCPWS_TOOL_REGISTRY_HPP_
#define MCPWS_TOOL_REGISTRY_HPP_

#include "job.hpp"
#include "request_queue.hpp"
#include "vocabulary.hpp"

#include <json/json.h>

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace mcpws {

class Session;

constexpr size_t kMaxToolNameLength = 128;
constexpr size_t kMaxToolArgumentsSize = 1024 * 1024;

// At most kMaxToolNameLength of [A-Za-z0-9_].
bool is_valid_tool_name(std::string_view name);

// What a running tool can reach besides its arguments.
struct ToolContext {
  std::weak_ptr<Session> session;
  ProgressFn progress;

  // progress is 0..100.
  void report(double progress_value, const std::string& message) const {
    if (progress) progress(progress_value, message);
  }
};

// Settles job with either a content result ({content:[...]}) or any other
// value, which is wrapped as JSON text.
using ToolHandler = std::function<void(const Json::Value& arguments, const JobPtr& job, const ToolContext& ctx)>;

struct ToolDescriptor {
  std::string name;
  std::string description;
  Json::Value input_schema;
  ToolHandler handler;
  std::optional<std::chrono::milliseconds> cache_ttl;  // cached only when set
  int priority = priority::kNormal;
  std::optional<uint32_t> max_retries;
  std::optional<std::chrono::milliseconds> timeout;
};

/**
 * @brief Named tools exposed through tools/list and tools/call.
 */
class ToolRegistry {
 public:
  // Fails on an invalid name, a missing handler or a duplicate.
  expected<void, std::string> add(ToolDescriptor tool);
  bool remove(const std::string& name);

  const ToolDescriptor* find(const std::string& name) const;
  size_t size() const { return tools_.size(); }

  // tools/list entries {name, description, inputSchema}, sorted by name.
  Json::Value list_json() const;

  // Fired after add/remove, used for notifications/tools/list_changed.
  std::function<void()> on_changed;

 private:
  std::map<std::string, ToolDescriptor> tools_;
};

}  // namespace mcpws

#endif  // MCPWS_TOOL_REGISTRY_HPP_
