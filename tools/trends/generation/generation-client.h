#pragma once

#include "../common/trends-common.h"

#include <string>
#include <vector>

using trends::json;

struct tool_def;

/**
 * Per-stage generation settings.
 *
 * Built once per stage and reused across requests. A null response_schema means
 * free-text output; otherwise the capability is asked for JSON matching it.
 */
struct generation_config {
    std::string system_instruction;
    double temperature = 1.0;
    json response_schema;             // null = unstructured output
    std::vector<std::string> tools;   // Names of registered tools bound to this stage
};

// A tool invocation requested by the model
struct tool_call {
    std::string id;
    std::string name;
    json arguments = json::object();
};

// Result of one generation turn
struct generation_response {
    std::string text;                   // Concatenated text parts (may be empty)
    std::vector<tool_call> tool_calls;  // Empty when the model produced its final answer
    json provider_content;              // Provider-native turn, replayed verbatim in later turns
};

/**
 * Generation capability.
 *
 * Messages use a provider-neutral chat format:
 *   {"role": "user", "content": "..."}
 *   {"role": "assistant", "content": "...", "tool_calls": [{"id", "name", "arguments"}]}
 *   {"role": "tool", "tool_call_id": "...", "name": "...", "content": "..."}
 *
 * Implementations raise pipeline_error(UPSTREAM_UNAVAILABLE) on transport failure
 * or a non-2xx provider response. One instance is shared process-wide and must
 * be safe to call from concurrent requests.
 */
class generation_client {
public:
    virtual ~generation_client() = default;

    virtual generation_response generate(const std::string & model,
                                         const generation_config & config,
                                         const json & messages,
                                         const std::vector<const tool_def *> & tools) = 0;
};
