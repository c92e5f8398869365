#pragma once

namespace pipeline {

// Pipeline run states, strictly linear; FAILED is absorbing
enum class pipeline_state {
    START,
    RESEARCHING,
    RESEARCHED,
    ANALYSING,
    ANALYSED,
    WRITING,
    WRITTEN,
    DONE,
    FAILED
};

// Convert state to string for display/logging
const char* state_to_string(pipeline_state state);

// State machine for one pipeline run
class pipeline_state_machine {
public:
    // State transitions; returns false (and stays put) on an invalid transition
    bool transition_to(pipeline_state new_state);

    // Move to FAILED from any non-terminal state
    bool fail();

    // State queries
    pipeline_state current_state() const { return state_; }
    bool is_terminal() const;

    static bool validate_transition(pipeline_state from, pipeline_state to);

private:
    pipeline_state state_ = pipeline_state::START;
};

} // namespace pipeline
