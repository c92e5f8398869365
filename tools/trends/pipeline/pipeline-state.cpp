#include "pipeline-state.h"

namespace pipeline {

const char* state_to_string(pipeline_state state) {
    switch (state) {
        case pipeline_state::START:       return "start";
        case pipeline_state::RESEARCHING: return "researching";
        case pipeline_state::RESEARCHED:  return "researched";
        case pipeline_state::ANALYSING:   return "analysing";
        case pipeline_state::ANALYSED:    return "analysed";
        case pipeline_state::WRITING:     return "writing";
        case pipeline_state::WRITTEN:     return "written";
        case pipeline_state::DONE:        return "done";
        case pipeline_state::FAILED:      return "failed";
        default:                          return "unknown";
    }
}

bool pipeline_state_machine::validate_transition(pipeline_state from, pipeline_state to) {
    if (to == pipeline_state::FAILED) {
        return from != pipeline_state::DONE && from != pipeline_state::FAILED;
    }

    switch (from) {
        case pipeline_state::START:       return to == pipeline_state::RESEARCHING;
        case pipeline_state::RESEARCHING: return to == pipeline_state::RESEARCHED;
        case pipeline_state::RESEARCHED:  return to == pipeline_state::ANALYSING;
        case pipeline_state::ANALYSING:   return to == pipeline_state::ANALYSED;
        case pipeline_state::ANALYSED:    return to == pipeline_state::WRITING;
        case pipeline_state::WRITING:     return to == pipeline_state::WRITTEN;
        case pipeline_state::WRITTEN:     return to == pipeline_state::DONE;

        case pipeline_state::DONE:
        case pipeline_state::FAILED:
            return false;

        default:
            return false;
    }
}

bool pipeline_state_machine::transition_to(pipeline_state new_state) {
    if (!validate_transition(state_, new_state)) {
        return false;
    }
    state_ = new_state;
    return true;
}

bool pipeline_state_machine::fail() {
    return transition_to(pipeline_state::FAILED);
}

bool pipeline_state_machine::is_terminal() const {
    return state_ == pipeline_state::DONE || state_ == pipeline_state::FAILED;
}

} // namespace pipeline
