#include "events.h"

namespace pipeline {

const char* event_type_to_string(event_type type) {
    switch (type) {
        case event_type::STAGE:   return "stage";
        case event_type::RESULT:  return "result";
        case event_type::DONE:    return "done";
        case event_type::FAILURE: return "error";
        default:                  return "unknown";
    }
}

pipeline_event pipeline_event::stage(const std::string& stage, const std::string& message, bool done) {
    pipeline_event e;
    e.type = event_type::STAGE;
    e.data = json{{"stage", stage}, {"message", message}};
    if (done) {
        e.data["done"] = true;
    }
    return e;
}

pipeline_event pipeline_event::result(const final_report& report) {
    pipeline_event e;
    e.type = event_type::RESULT;
    e.data = report.to_json();
    return e;
}

pipeline_event pipeline_event::done() {
    pipeline_event e;
    e.type = event_type::DONE;
    e.data = json::object();
    return e;
}

pipeline_event pipeline_event::error(trends::error_kind kind, const std::string& message) {
    pipeline_event e;
    e.type = event_type::FAILURE;
    e.data = json{{"kind", trends::error_kind_to_string(kind)}, {"message", message}};
    return e;
}

std::string format_sse(const pipeline_event& event) {
    // dump() escapes newlines, so the payload always fits on a single data: line
    std::string out = "event: ";
    out += event_type_to_string(event.type);
    out += "\ndata: ";
    out += event.data.dump(-1, ' ', false, json::error_handler_t::replace);
    out += "\n\n";
    return out;
}

bool ostream_sink::emit(pipeline_event event) {
    out_ << format_sse(event);
    out_.flush();
    return static_cast<bool>(out_);
}

} // namespace pipeline
