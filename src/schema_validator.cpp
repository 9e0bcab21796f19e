#include "mcpws/schema_validator.hpp"

namespace mcpws {

namespace {

using Result = expected<void, std::string>;

Result ok() { return Result::success(); }
Result fail(const std::string& path, const std::string& what) { return Result::error(path + ": " + what); }

bool matches_type(const Json::Value& v, const std::string& type) {
  if (type == "object") return v.isObject();
  if (type == "array") return v.isArray();
  if (type == "string") return v.isString();
  if (type == "boolean") return v.isBool();
  if (type == "null") return v.isNull();
  if (type == "integer") return v.isIntegral();
  if (type == "number") return v.isNumeric() && !v.isBool();
  return true;
}

Result check_type(const Json::Value& v, const Json::Value& type, const std::string& path) {
  if (type.isString()) {
    if (!matches_type(v, type.asString())) return fail(path, "expected " + type.asString());
    return ok();
  }
  if (type.isArray()) {
    for (const auto& t : type) {
      if (t.isString() && matches_type(v, t.asString())) return ok();
    }
    return fail(path, "type not allowed");
  }
  return ok();
}

Result validate_at(const Json::Value& v, const Json::Value& schema, const std::string& path) {
  if (schema.isBool()) {
    return schema.asBool() ? ok() : fail(path, "not allowed");
  }
  if (!schema.isObject()) {
    return ok();
  }

  if (schema.isMember("type")) {
    auto r = check_type(v, schema["type"], path);
    if (!r) return r;
  }

  if (schema["enum"].isArray()) {
    bool found = false;
    for (const auto& option : schema["enum"]) {
      if (option == v) {
        found = true;
        break;
      }
    }
    if (!found) return fail(path, "value not in enum");
  }
  if (schema.isMember("const") && schema["const"] != v) {
    return fail(path, "value does not match const");
  }

  if (v.isString()) {
    size_t len = v.asString().size();
    if (schema["minLength"].isUInt() && len < schema["minLength"].asUInt()) return fail(path, "string too short");
    if (schema["maxLength"].isUInt() && len > schema["maxLength"].asUInt()) return fail(path, "string too long");
  }

  if (v.isNumeric() && !v.isBool()) {
    double d = v.asDouble();
    if (schema["minimum"].isNumeric() && d < schema["minimum"].asDouble()) return fail(path, "below minimum");
    if (schema["maximum"].isNumeric() && d > schema["maximum"].asDouble()) return fail(path, "above maximum");
  }

  if (v.isArray()) {
    if (schema["minItems"].isUInt() && v.size() < schema["minItems"].asUInt()) return fail(path, "too few items");
    if (schema["maxItems"].isUInt() && v.size() > schema["maxItems"].asUInt()) return fail(path, "too many items");
    if (schema.isMember("items")) {
      for (Json::ArrayIndex i = 0; i < v.size(); ++i) {
        auto r = validate_at(v[i], schema["items"], path + "[" + std::to_string(i) + "]");
        if (!r) return r;
      }
    }
  }

  if (v.isObject()) {
    const Json::Value& props = schema["properties"];
    for (const auto& name : schema["required"]) {
      if (name.isString() && !v.isMember(name.asString())) {
        return fail(path + "." + name.asString(), "required property missing");
      }
    }
    const Json::Value& extra = schema["additionalProperties"];
    for (const auto& name : v.getMemberNames()) {
      std::string child = path + "." + name;
      if (props.isObject() && props.isMember(name)) {
        auto r = validate_at(v[name], props[name], child);
        if (!r) return r;
      } else if (extra.isBool() && !extra.asBool()) {
        return fail(child, "unexpected property");
      } else if (extra.isObject()) {
        auto r = validate_at(v[name], extra, child);
        if (!r) return r;
      }
    }
  }
  return ok();
}

}  // namespace

expected<void, std::string> validate_schema(const Json::Value& instance, const Json::Value& schema,
                                            const std::string& root) {
  return validate_at(instance, schema, root);
}

Json::Value normalize_input_schema(const Json::Value& schema) {
  Json::Value out = schema.isObject() ? schema : Json::Value(Json::objectValue);
  if (!out.isMember("type")) out["type"] = "object";
  if (!out.isMember("properties")) out["properties"] = Json::Value(Json::objectValue);
  if (!out.isMember("additionalProperties")) out["additionalProperties"] = false;
  if (!out.isMember("required")) out["required"] = Json::Value(Json::arrayValue);
  if (!out.isMember("$schema")) out["$schema"] = "http://json-schema.org/draft-07/schema#";
  return out;
}

}  // namespace mcpws
