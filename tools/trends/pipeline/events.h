#pragma once

#include "report-types.h"
#include "../common/errors.h"
#include "../common/trends-common.h"

#include <ostream>
#include <string>

using trends::json;

namespace pipeline {

// Stage names as they appear on the wire
constexpr const char* STAGE_RESEARCHING = "researching";
constexpr const char* STAGE_ANALYSING = "analysing";
constexpr const char* STAGE_WRITING = "writing";

enum class event_type {
    STAGE,   // stage-progress
    RESULT,  // final report
    DONE,    // completion
    FAILURE, // terminal error (not ERROR due to Windows macro conflict)
};

const char* event_type_to_string(event_type type);

// One notification of the progress stream
struct pipeline_event {
    event_type type = event_type::DONE;
    json data = json::object();

    static pipeline_event stage(const std::string& stage, const std::string& message, bool done = false);
    static pipeline_event result(const final_report& report);
    static pipeline_event done();
    static pipeline_event error(trends::error_kind kind, const std::string& message);
};

// Serialize as "event: <name>\ndata: <json>\n\n"
std::string format_sse(const pipeline_event& event);

/**
 * Destination of pipeline events.
 *
 * emit() returns false once the consumer is gone; the producer may keep running
 * but its events are discarded. close() marks end-of-stream.
 */
class event_sink {
public:
    virtual ~event_sink() = default;

    virtual bool emit(pipeline_event event) = 0;
    virtual void close() = 0;
};

// Writes each event as SSE text to a stream (one-shot CLI mode, tests)
class ostream_sink : public event_sink {
public:
    explicit ostream_sink(std::ostream& out) : out_(out) {}

    bool emit(pipeline_event event) override;
    void close() override { out_.flush(); }

private:
    std::ostream& out_;
};

} // namespace pipeline
