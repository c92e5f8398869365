#include "tool-registry.h"

tool_registry & tool_registry::instance() {
    static tool_registry registry;
    return registry;
}

void tool_registry::register_tool(const tool_def & tool) {
    tools_[tool.name] = tool;
}

const tool_def * tool_registry::get_tool(const std::string & name) const {
    auto it = tools_.find(name);
    if (it == tools_.end()) {
        return nullptr;
    }
    return &it->second;
}

std::vector<const tool_def *> tool_registry::get_tools(const std::vector<std::string> & names) const {
    std::vector<const tool_def *> result;
    for (const auto & name : names) {
        if (const tool_def * tool = get_tool(name)) {
            result.push_back(tool);
        }
    }
    return result;
}

tool_result tool_registry::execute(const std::string & name, const json & args, const tool_context & ctx) const {
    const tool_def * tool = get_tool(name);
    if (!tool) {
        return {false, "", "Unknown tool: " + name};
    }
    if (!args.is_object()) {
        return {false, "", "Arguments for " + name + " must be a JSON object"};
    }
    return tool->execute(args, ctx);
}
