#pragma once

#include <stdexcept>
#include <string>

namespace trends {

// Failure categories of a pipeline run. All of them are terminal for the request.
enum class error_kind {
    CONFIGURATION,          // Missing credentials; fatal at startup
    UPSTREAM_UNAVAILABLE,   // Network, timeout or non-2xx from a provider
    SCHEMA_VIOLATION,       // Structured output failed to parse or validate
    EMPTY_UPSTREAM_RESULT,  // Research produced no text
    INTERNAL,               // Anything else raised inside a run
};

// Wire name of an error kind (used in the "error" event)
inline const char* error_kind_to_string(error_kind kind) {
    switch (kind) {
        case error_kind::CONFIGURATION:         return "configuration_error";
        case error_kind::UPSTREAM_UNAVAILABLE:  return "upstream_unavailable";
        case error_kind::SCHEMA_VIOLATION:      return "schema_violation";
        case error_kind::EMPTY_UPSTREAM_RESULT: return "empty_upstream_result";
        case error_kind::INTERNAL:              return "internal_error";
        default:                                return "unknown";
    }
}

class pipeline_error : public std::runtime_error {
public:
    pipeline_error(error_kind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    error_kind kind() const { return kind_; }

private:
    error_kind kind_;
};

inline pipeline_error configuration_error(const std::string& message) {
    return pipeline_error(error_kind::CONFIGURATION, message);
}

inline pipeline_error upstream_unavailable(const std::string& message) {
    return pipeline_error(error_kind::UPSTREAM_UNAVAILABLE, message);
}

inline pipeline_error schema_violation(const std::string& message) {
    return pipeline_error(error_kind::SCHEMA_VIOLATION, message);
}

inline pipeline_error empty_upstream_result(const std::string& message) {
    return pipeline_error(error_kind::EMPTY_UPSTREAM_RESULT, message);
}

} // namespace trends
