#include "orchestrator.h"

#include <spdlog/spdlog.h>

#include <chrono>

namespace pipeline {

namespace {

// Per-run bookkeeping: state machine plus the event sink
class run_tracker {
public:
    run_tracker(event_sink & sink, std::string session_id)
        : sink_(sink), session_id_(std::move(session_id)) {}

    void advance(pipeline_state next) {
        pipeline_state from = machine_.current_state();
        if (!machine_.transition_to(next)) {
            throw trends::pipeline_error(trends::error_kind::INTERNAL,
                std::string("invalid pipeline transition ") + state_to_string(from) +
                " -> " + state_to_string(next));
        }
        spdlog::debug("[{}] {} -> {}", session_id_, state_to_string(from), state_to_string(next));
    }

    void emit(pipeline_event event) {
        if (!sink_.emit(std::move(event)) && !disconnected_) {
            disconnected_ = true;
            spdlog::info("[{}] client disconnected, remaining events are discarded", session_id_);
        }
    }

    // No new stage starts once the consumer is gone
    bool disconnected() const { return disconnected_; }

    bool fail() { return machine_.fail(); }
    pipeline_state state() const { return machine_.current_state(); }

private:
    event_sink & sink_;
    std::string session_id_;
    pipeline_state_machine machine_;
    bool disconnected_ = false;
};

} // namespace

pipeline_orchestrator::pipeline_orchestrator(research_step & research, analysis_step & analysis, report_step & report)
    : research_(research)
    , analysis_(analysis)
    , report_(report) {
}

std::string pipeline_orchestrator::new_session_id() {
    return "pipeline-" + trends::random_hex(8);
}

pipeline_run_result pipeline_orchestrator::run(const std::string & query, event_sink & sink,
                                               const std::string & session_id) {
    pipeline_run_result result;
    result.session_id = session_id.empty() ? new_session_id() : session_id;

    stage_context ctx;
    ctx.session_id = result.session_id;

    run_tracker tracker(sink, result.session_id);
    const char* current = "";   // name() of the stage in progress
    auto start = std::chrono::steady_clock::now();

    spdlog::info("[{}] pipeline started: {}", result.session_id, trends::preview(query));

    try {
        // --- Research ---
        tracker.advance(pipeline_state::RESEARCHING);
        tracker.emit(pipeline_event::stage(STAGE_RESEARCHING, "Searching the web..."));
        current = research_.name();
        std::string summary = research_.run(query, ctx);
        current = "";
        tracker.advance(pipeline_state::RESEARCHED);
        tracker.emit(pipeline_event::stage(STAGE_RESEARCHING, "Research complete", true));

        // --- Analysis ---
        if (!tracker.disconnected()) {
            tracker.advance(pipeline_state::ANALYSING);
            tracker.emit(pipeline_event::stage(STAGE_ANALYSING, "Analysing findings..."));
            current = analysis_.name();
            analysis_result analysis = analysis_.run(summary, ctx);
            current = "";
            tracker.advance(pipeline_state::ANALYSED);
            tracker.emit(pipeline_event::stage(STAGE_ANALYSING, "Analysis complete", true));

            // --- Report ---
            if (!tracker.disconnected()) {
                tracker.advance(pipeline_state::WRITING);
                tracker.emit(pipeline_event::stage(STAGE_WRITING, "Writing report..."));
                current = report_.name();
                final_report report = report_.run(analysis, ctx);
                current = "";
                tracker.advance(pipeline_state::WRITTEN);
                tracker.emit(pipeline_event::stage(STAGE_WRITING, "Report ready", true));

                // --- Final result ---
                tracker.emit(pipeline_event::result(report));
                tracker.emit(pipeline_event::done());
                tracker.advance(pipeline_state::DONE);
                result.report = std::move(report);
            }
        }

        if (tracker.state() != pipeline_state::DONE) {
            tracker.fail();
            result.error = "client disconnected";
        }
    } catch (const trends::pipeline_error & e) {
        tracker.fail();
        result.error_kind = e.kind();
        result.error = e.what();
        result.failed_stage = current;
        spdlog::error("[{}] {} stage failed ({}): {}", result.session_id, current,
                      trends::error_kind_to_string(e.kind()), e.what());
        tracker.emit(pipeline_event::error(e.kind(), e.what()));
    } catch (const std::exception & e) {
        tracker.fail();
        result.error_kind = trends::error_kind::INTERNAL;
        result.error = e.what();
        result.failed_stage = current;
        spdlog::error("[{}] {} stage failed: {}", result.session_id, current, e.what());
        tracker.emit(pipeline_event::error(trends::error_kind::INTERNAL, e.what()));
    } catch (...) {
        // Runs on a server worker thread: nothing may escape
        tracker.fail();
        result.error_kind = trends::error_kind::INTERNAL;
        result.error = "unknown exception";
        result.failed_stage = current;
        spdlog::error("[{}] {} stage failed with a non-standard exception", result.session_id, current);
        tracker.emit(pipeline_event::error(trends::error_kind::INTERNAL, result.error));
    }

    sink.close();

    result.state = tracker.state();
    result.disconnected = tracker.disconnected();

    auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    spdlog::info("[{}] pipeline {} in {:.1f}s", result.session_id, state_to_string(result.state), elapsed);

    return result;
}

} // namespace pipeline
