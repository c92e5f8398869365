#pragma once

#include "events.h"
#include "pipeline-state.h"
#include "report-types.h"
#include "stages.h"

#include <optional>
#include <string>

namespace pipeline {

using research_step = stage<std::string, std::string>;
using analysis_step = stage<std::string, analysis_result>;
using report_step = stage<analysis_result, final_report>;

// Outcome of one pipeline run
struct pipeline_run_result {
    pipeline_state state = pipeline_state::START;
    std::string session_id;
    std::optional<final_report> report;                        // Set when state == DONE
    trends::error_kind error_kind = trends::error_kind::INTERNAL;
    std::string error;                                         // Set when state == FAILED
    std::string failed_stage;                                  // name() of the stage that raised, if any
    bool disconnected = false;                                 // Consumer left before the end
};

/**
 * Drives research -> analysis -> report for one query.
 *
 * Events are emitted in the order of the state transitions:
 *   stage(researching) stage(researching, done) stage(analysing) ...
 *   stage(writing, done) result done
 * Any stage failure stops the run, emits a single error event and closes the
 * sink. The sink is closed on every path.
 *
 * Stages are borrowed and may be shared by concurrent runs; all per-run state
 * lives on the stack of run().
 */
class pipeline_orchestrator {
public:
    pipeline_orchestrator(research_step & research, analysis_step & analysis, report_step & report);

    pipeline_run_result run(const std::string & query, event_sink & sink,
                            const std::string & session_id = "");

    // "pipeline-" followed by 8 hex characters
    static std::string new_session_id();

private:
    research_step & research_;
    analysis_step & analysis_;
    report_step & report_;
};

} // namespace pipeline
