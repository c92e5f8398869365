#include <gtest/gtest.h>

#include "pipeline/pipeline-state.h"

using namespace pipeline;

// ─── Basic State Tests ───────────────────────────────────────────────────────

TEST(PipelineStateMachine, InitialState) {
    pipeline_state_machine sm;
    EXPECT_EQ(sm.current_state(), pipeline_state::START);
    EXPECT_FALSE(sm.is_terminal());
}

TEST(PipelineStateMachine, StateToString) {
    EXPECT_STREQ(state_to_string(pipeline_state::START), "start");
    EXPECT_STREQ(state_to_string(pipeline_state::RESEARCHING), "researching");
    EXPECT_STREQ(state_to_string(pipeline_state::ANALYSED), "analysed");
    EXPECT_STREQ(state_to_string(pipeline_state::DONE), "done");
    EXPECT_STREQ(state_to_string(pipeline_state::FAILED), "failed");
}

// ─── Valid Transitions ───────────────────────────────────────────────────────

TEST(PipelineStateMachine, HappyPath) {
    pipeline_state_machine sm;
    const pipeline_state path[] = {
        pipeline_state::RESEARCHING, pipeline_state::RESEARCHED,
        pipeline_state::ANALYSING,   pipeline_state::ANALYSED,
        pipeline_state::WRITING,     pipeline_state::WRITTEN,
        pipeline_state::DONE,
    };
    for (pipeline_state s : path) {
        EXPECT_TRUE(sm.transition_to(s)) << state_to_string(s);
    }
    EXPECT_EQ(sm.current_state(), pipeline_state::DONE);
    EXPECT_TRUE(sm.is_terminal());
}

TEST(PipelineStateMachine, FailFromAnyActiveState) {
    pipeline_state_machine sm;
    ASSERT_TRUE(sm.transition_to(pipeline_state::RESEARCHING));
    ASSERT_TRUE(sm.transition_to(pipeline_state::RESEARCHED));
    ASSERT_TRUE(sm.transition_to(pipeline_state::ANALYSING));
    EXPECT_TRUE(sm.fail());
    EXPECT_EQ(sm.current_state(), pipeline_state::FAILED);
    EXPECT_TRUE(sm.is_terminal());
}

TEST(PipelineStateMachine, FailFromStart) {
    EXPECT_TRUE(pipeline_state_machine::validate_transition(pipeline_state::START, pipeline_state::FAILED));
}

// ─── Invalid Transitions ─────────────────────────────────────────────────────

TEST(PipelineStateMachine, CannotSkipStages) {
    pipeline_state_machine sm;
    EXPECT_FALSE(sm.transition_to(pipeline_state::ANALYSING));
    EXPECT_EQ(sm.current_state(), pipeline_state::START);

    ASSERT_TRUE(sm.transition_to(pipeline_state::RESEARCHING));
    EXPECT_FALSE(sm.transition_to(pipeline_state::WRITING));
    EXPECT_FALSE(sm.transition_to(pipeline_state::DONE));
    EXPECT_EQ(sm.current_state(), pipeline_state::RESEARCHING);
}

TEST(PipelineStateMachine, CannotGoBackwards) {
    EXPECT_FALSE(pipeline_state_machine::validate_transition(pipeline_state::ANALYSED, pipeline_state::RESEARCHING));
    EXPECT_FALSE(pipeline_state_machine::validate_transition(pipeline_state::WRITTEN, pipeline_state::WRITING));
}

TEST(PipelineStateMachine, TerminalStatesAreAbsorbing) {
    for (pipeline_state from : {pipeline_state::DONE, pipeline_state::FAILED}) {
        EXPECT_FALSE(pipeline_state_machine::validate_transition(from, pipeline_state::FAILED));
        EXPECT_FALSE(pipeline_state_machine::validate_transition(from, pipeline_state::START));
        EXPECT_FALSE(pipeline_state_machine::validate_transition(from, pipeline_state::RESEARCHING));
    }

    pipeline_state_machine sm;
    ASSERT_TRUE(sm.fail());
    EXPECT_FALSE(sm.fail());
    EXPECT_FALSE(sm.transition_to(pipeline_state::RESEARCHING));
}
