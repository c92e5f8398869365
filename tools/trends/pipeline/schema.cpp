#include "schema.h"
#include "../common/errors.h"

#include <algorithm>
#include <cctype>

namespace pipeline {

static std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

static const char* type_name(const json& value) {
    if (value.is_null())            return "null";
    if (value.is_boolean())         return "boolean";
    if (value.is_number_integer())  return "integer";
    if (value.is_number())          return "number";
    if (value.is_string())          return "string";
    if (value.is_array())           return "array";
    if (value.is_object())          return "object";
    return "unknown";
}

static bool matches_type(const json& value, const std::string& type) {
    if (type == "object")  return value.is_object();
    if (type == "array")   return value.is_array();
    if (type == "string")  return value.is_string();
    if (type == "integer") return value.is_number_integer();
    if (type == "number")  return value.is_number();
    if (type == "boolean") return value.is_boolean();
    return false;
}

std::string validate_schema(const json& value, const json& schema, const std::string& path) {
    if (!schema.is_object() || !schema.contains("type")) {
        return "";
    }

    std::string type = lower(schema["type"].get<std::string>());
    if (!matches_type(value, type)) {
        return path + ": expected " + type + ", got " + type_name(value);
    }

    if (type == "object") {
        if (schema.contains("required")) {
            for (const auto& key : schema["required"]) {
                std::string name = key.get<std::string>();
                if (!value.contains(name)) {
                    return path + ": missing required field \"" + name + "\"";
                }
            }
        }
        if (schema.contains("properties")) {
            for (const auto& [name, sub_schema] : schema["properties"].items()) {
                if (!value.contains(name)) {
                    continue;
                }
                std::string err = validate_schema(value[name], sub_schema, path + "." + name);
                if (!err.empty()) {
                    return err;
                }
            }
        }
    } else if (type == "array" && schema.contains("items")) {
        for (size_t i = 0; i < value.size(); i++) {
            std::string err = validate_schema(value[i], schema["items"], path + "[" + std::to_string(i) + "]");
            if (!err.empty()) {
                return err;
            }
        }
    }

    return "";
}

std::string extract_json_payload(const std::string& text) {
    std::string trimmed = trends::trim(text);

    // Only a fence wrapping the whole answer is stripped; fences inside string values stay
    const std::string fence = "```";
    if (trimmed.size() < 2 * fence.size() || trimmed.rfind(fence, 0) != 0 ||
        trimmed.compare(trimmed.size() - fence.size(), fence.size(), fence) != 0) {
        return trimmed;
    }

    std::string body = trimmed.substr(fence.size(), trimmed.size() - 2 * fence.size());

    // Drop the info string ("json") on the opening line
    size_t nl = body.find('\n');
    if (nl != std::string::npos) {
        std::string info = trends::trim(body.substr(0, nl));
        bool is_tag = std::all_of(info.begin(), info.end(),
                                  [](unsigned char c) { return std::isalnum(c) != 0; });
        if (is_tag) {
            body = body.substr(nl + 1);
        }
    }
    return trends::trim(body);
}

json parse_structured_output(const std::string& text, const json& schema) {
    std::string payload = extract_json_payload(text);
    if (payload.empty()) {
        throw trends::schema_violation("structured output is empty");
    }

    json parsed;
    try {
        parsed = json::parse(payload);
    } catch (const json::exception& e) {
        throw trends::schema_violation(trends::format_error("Parsing structured output", e.what()));
    }

    std::string err = validate_schema(parsed, schema);
    if (!err.empty()) {
        throw trends::schema_violation(err);
    }

    return parsed;
}

} // namespace pipeline
