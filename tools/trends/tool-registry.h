#pragma once

#include "common/trends-common.h"

#include <functional>
#include <map>
#include <string>
#include <vector>

using trends::json;

class search_provider;

// Per-run capabilities and limits a tool may use
struct tool_context {
    // Search capability used by web_search (required for that tool)
    search_provider * search = nullptr;

    // Default snippet count when the model does not pass max_results
    int max_results = 5;

    // Session id of the pipeline run, for log lines
    std::string session_id;
};

/**
 * What a tool hands back to the agent loop.
 *
 * On success output is the text shown to the model. On failure error explains
 * the problem (bad arguments, tool unavailable) and is shown to the model
 * instead, so it can retry. Upstream failures are not tool results: they
 * propagate as pipeline_error and abort the stage.
 */
struct tool_result {
    bool success = true;
    std::string output;
    std::string error;
};

// A model-callable function
struct tool_def {
    std::string name;
    std::string description;
    std::string parameters;  // JSON schema (lowercase type names), parsed on declaration

    std::function<tool_result(const json &, const tool_context &)> execute;

    // Declaration handed to the generation capability
    json to_declaration() const {
        return json{
            {"name", name},
            {"description", description},
            {"parameters", json::parse(parameters)}
        };
    }
};

// Process-wide table of tools, filled during static initialization
class tool_registry {
public:
    static tool_registry & instance();

    // Replaces any tool already registered under the same name
    void register_tool(const tool_def & tool);

    // nullptr when no such tool exists
    const tool_def * get_tool(const std::string & name) const;

    // Resolve the tool names bound to a stage, skipping unknown names
    std::vector<const tool_def *> get_tools(const std::vector<std::string> & names) const;

    // Unknown names and non-object arguments yield a failed tool_result
    tool_result execute(const std::string & name, const json & args, const tool_context & ctx) const;

private:
    tool_registry() = default;
    std::map<std::string, tool_def> tools_;
};

// Registers a tool from a static initializer in the tool's own source file
struct tool_registrar {
    tool_registrar(const tool_def & tool) {
        tool_registry::instance().register_tool(tool);
    }
};

#define REGISTER_TOOL(name, tool_instance) \
    static tool_registrar _tool_reg_##name(tool_instance)
