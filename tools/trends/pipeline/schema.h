#pragma once

#include "../common/trends-common.h"

#include <string>

using trends::json;

namespace pipeline {

// Check value against a schema subset (object/array/string/integer/number/boolean,
// properties, required, items). Type names are case-insensitive.
// Returns an empty string when valid, otherwise a message naming the offending path.
// Unknown properties are ignored; missing required ones are never defaulted.
std::string validate_schema(const json& value, const json& schema, const std::string& path = "$");

// Strip a ``` or ```json fence that wraps the whole answer; any other text is returned trimmed
std::string extract_json_payload(const std::string& text);

// Parse a model answer and validate it against schema.
// Raises pipeline_error(SCHEMA_VIOLATION) on parse or validation failure.
json parse_structured_output(const std::string& text, const json& schema);

} // namespace pipeline
