#pragma once

#include "tool-registry.h"
#include "common/constants.h"
#include "common/trends-common.h"
#include "generation/generation-client.h"

#include <functional>
#include <string>
#include <vector>

using trends::json;

// Why agent_loop::run() returned
enum class agent_stop_reason {
    COMPLETED,        // A turn requested no tools; its text is the answer
    MAX_ITERATIONS,   // Turn budget spent while the model was still calling tools
};

// Callback type for message observation (logging, tests)
using message_callback = std::function<void(const json& message)>;

/**
 * Configuration for the agent loop.
 *
 * The generation settings (system instruction, temperature, bound tools) live in
 * generation; the loop itself only adds turn limits and the tool context.
 */
struct agent_config {
    std::string model = trends::config::DEFAULT_MODEL;
    generation_config generation;
    int max_iterations = trends::config::DEFAULT_MAX_TURNS;  // Max model turns per run()
    tool_context tools;                                      // Passed to every tool call
    message_callback on_message;                             // Callback when message is added
};

struct agent_loop_result {
    agent_stop_reason stop_reason;
    std::string final_response;
    int iterations = 0;
    int tool_calls = 0;
};

/**
 * Explicit multi-turn tool-use loop.
 *
 * Alternates model turns and tool executions until the model answers without
 * requesting a tool, or the turn limit is reached. The conversation history is
 * held explicitly in messages_ and replayed on every turn.
 *
 * Thread safety: NOT thread-safe. One instance per request.
 *
 * Lifecycle:
 * 1. Construct with a generation client and config
 * 2. Call run() with the user prompt
 * 3. Call clear() to reset conversation state
 */
class agent_loop {
public:
    agent_loop(generation_client & client, const agent_config & config);

    /**
     * Append user_prompt and alternate model turns with tool executions.
     *
     * Upstream failures (generation or tool) propagate as pipeline_error.
     * On MAX_ITERATIONS final_response holds the text of the last turn, if any.
     */
    agent_loop_result run(const std::string & user_prompt);

    // Clear conversation history
    void clear();

    // Get current messages (for debugging)
    const json & get_messages() const { return messages_; }

private:
    // Refuses tools not bound to this loop
    tool_result execute_tool_call(const tool_call & call);

    // Append the "tool" message answering call
    void add_tool_result_message(const tool_call & call, const tool_result & result);

    // Add a message and trigger the callback
    void add_message(const json & message);

    generation_client & client_;
    agent_config config_;
    std::vector<const tool_def *> tools_;

    json messages_;
};
