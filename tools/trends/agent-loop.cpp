#include "agent-loop.h"

#include <spdlog/spdlog.h>

agent_loop::agent_loop(generation_client & client, const agent_config & config)
    : client_(client)
    , config_(config)
    , tools_(tool_registry::instance().get_tools(config.generation.tools))
    , messages_(json::array()) {
    if (tools_.size() != config_.generation.tools.size()) {
        spdlog::warn("[{}] {} of {} configured tools are not registered",
                     config_.tools.session_id,
                     config_.generation.tools.size() - tools_.size(),
                     config_.generation.tools.size());
    }
}

void agent_loop::clear() {
    messages_ = json::array();
}

void agent_loop::add_message(const json & message) {
    messages_.push_back(message);
    if (config_.on_message) {
        config_.on_message(message);
    }
}

tool_result agent_loop::execute_tool_call(const tool_call & call) {
    spdlog::debug("[{}] tool call {} {}", config_.tools.session_id, call.name,
                  trends::preview(call.arguments.dump(), 200));

    bool allowed = false;
    for (const auto * tool : tools_) {
        if (tool->name == call.name) {
            allowed = true;
            break;
        }
    }
    if (!allowed) {
        return {false, "", "Tool not available: " + call.name};
    }

    return tool_registry::instance().execute(call.name, call.arguments, config_.tools);
}

void agent_loop::add_tool_result_message(const tool_call & call, const tool_result & result) {
    std::string content = result.success ? result.output : ("Error: " + result.error);
    add_message(json{
        {"role", "tool"},
        {"tool_call_id", call.id},
        {"name", call.name},
        {"content", content}
    });
}

agent_loop_result agent_loop::run(const std::string & user_prompt) {
    agent_loop_result result;
    result.stop_reason = agent_stop_reason::MAX_ITERATIONS;

    add_message(json{{"role", "user"}, {"content", user_prompt}});

    while (result.iterations < config_.max_iterations) {
        result.iterations++;

        generation_response response = client_.generate(config_.model, config_.generation, messages_, tools_);
        result.final_response = response.text;

        json assistant = {{"role", "assistant"}, {"content", response.text}};
        if (!response.tool_calls.empty()) {
            json calls = json::array();
            for (const auto & call : response.tool_calls) {
                calls.push_back(json{{"id", call.id}, {"name", call.name}, {"arguments", call.arguments}});
            }
            assistant["tool_calls"] = calls;
        }
        if (!response.provider_content.is_null()) {
            assistant["provider_content"] = response.provider_content;
        }
        add_message(assistant);

        if (response.tool_calls.empty()) {
            result.stop_reason = agent_stop_reason::COMPLETED;
            break;
        }

        for (const auto & call : response.tool_calls) {
            tool_result tr = execute_tool_call(call);
            result.tool_calls++;
            if (!tr.success) {
                spdlog::warn("[{}] tool {} failed: {}", config_.tools.session_id, call.name, tr.error);
            }
            add_tool_result_message(call, tr);
        }
    }

    if (result.stop_reason == agent_stop_reason::MAX_ITERATIONS) {
        spdlog::warn("[{}] agent loop stopped after {} turns without a final answer",
                     config_.tools.session_id, result.iterations);
    }

    return result;
}
