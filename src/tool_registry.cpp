#include "mcpws/tool_registry.hpp"

#include "mcpws/log.hpp"
#include "mcpws/schema_validator.hpp"

namespace mcpws {

bool is_valid_tool_name(std::string_view name) {
  if (name.empty() || name.size() > kMaxToolNameLength) {
    return false;
  }
  for (char c : name) {
    bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_';
    if (!ok) return false;
  }
  return true;
}

expected<void, std::string> ToolRegistry::add(ToolDescriptor tool) {
  if (!is_valid_tool_name(tool.name)) {
    return expected<void, std::string>::error("invalid tool name: " + tool.name);
  }
  if (!tool.handler) {
    return expected<void, std::string>::error("tool has no handler: " + tool.name);
  }
  if (tools_.count(tool.name) != 0) {
    return expected<void, std::string>::error("tool already registered: " + tool.name);
  }
  tool.input_schema = normalize_input_schema(tool.input_schema);
  MCPWS_LOG_DEBUG("Tools", "registered " << tool.name);
  std::string name = tool.name;
  tools_.emplace(std::move(name), std::move(tool));
  if (on_changed) on_changed();
  return expected<void, std::string>::success();
}

bool ToolRegistry::remove(const std::string& name) {
  if (tools_.erase(name) == 0) {
    return false;
  }
  if (on_changed) on_changed();
  return true;
}

const ToolDescriptor* ToolRegistry::find(const std::string& name) const {
  auto it = tools_.find(name);
  return it == tools_.end() ? nullptr : &it->second;
}

Json::Value ToolRegistry::list_json() const {
  Json::Value out(Json::arrayValue);
  for (const auto& kv : tools_) {
    Json::Value t(Json::objectValue);
    t["name"] = kv.second.name;
    t["description"] = kv.second.description;
    t["inputSchema"] = kv.second.input_schema;
    out.append(std::move(t));
  }
  return out;
}

}  // namespace mcpws
