#ifndef MCPWS_SCHEMA_VALIDATOR_HPP_
#define MCPWS_SCHEMA_VALIDATOR_HPP_

#include "vocabulary.hpp"

#include <json/json.h>

#include <string>

namespace mcpws {

/**
 * @brief Checks a value against the JSON Schema (draft-07) keywords tool
 *        descriptors use.
 *
 * Supported: type (string or list), enum, const, properties, required,
 * additionalProperties (bool or schema), items, minItems, maxItems,
 * minLength, maxLength, minimum, maximum. Unknown keywords are ignored.
 * The error names the first failing location, e.g. "arguments.path".
 */
expected<void, std::string> validate_schema(const Json::Value& instance, const Json::Value& schema,
                                            const std::string& root = "arguments");

// Schema accepted by tools/list: an object schema. Missing
// additionalProperties/required are filled with false / [].
Json::Value normalize_input_schema(const Json::Value& schema);

}  // namespace mcpws

#endif  // MCPWS_SCHEMA_VALIDATOR_HPP_
