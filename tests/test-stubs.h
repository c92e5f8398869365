#pragma once

// In-process fakes for the provider seams. No network is touched by the tests.

#include "common/errors.h"
#include "common/trends-common.h"
#include "generation/generation-client.h"
#include "http/http-transport.h"
#include "pipeline/events.h"
#include "search/web-search.h"
#include "tool-registry.h"

#include <deque>
#include <mutex>
#include <string>
#include <vector>

using trends::json;

// A generation request as seen by the fake client
struct recorded_generation {
    std::string model;
    generation_config config;
    json messages;
    std::vector<std::string> tool_names;
};

// Returns queued responses in order; throws UPSTREAM_UNAVAILABLE when exhausted
class scripted_generation_client : public generation_client {
public:
    static generation_response text(const std::string & text) {
        generation_response r;
        r.text = text;
        return r;
    }

    static generation_response call(const std::string & name, const json & args, const std::string & id = "call_0") {
        generation_response r;
        r.tool_calls.push_back(tool_call{id, name, args});
        return r;
    }

    void push(generation_response response) {
        std::lock_guard<std::mutex> lock(mutex_);
        script_.push_back(std::move(response));
    }

    void push_failure(const std::string & message) {
        std::lock_guard<std::mutex> lock(mutex_);
        generation_response r;
        r.text = failure_marker + message;
        script_.push_back(std::move(r));
    }

    generation_response generate(const std::string & model,
                                 const generation_config & config,
                                 const json & messages,
                                 const std::vector<const tool_def *> & tools) override {
        std::lock_guard<std::mutex> lock(mutex_);

        recorded_generation rec{model, config, messages, {}};
        for (const auto * t : tools) {
            rec.tool_names.push_back(t->name);
        }
        requests_.push_back(std::move(rec));

        if (script_.empty()) {
            throw trends::upstream_unavailable("scripted generation client exhausted");
        }
        generation_response next = script_.front();
        script_.pop_front();
        if (next.text.rfind(failure_marker, 0) == 0) {
            throw trends::upstream_unavailable(next.text.substr(failure_marker.size()));
        }
        return next;
    }

    std::vector<recorded_generation> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

    size_t remaining() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return script_.size();
    }

private:
    const std::string failure_marker = "\x01fail:";
    mutable std::mutex mutex_;
    std::deque<generation_response> script_;
    std::vector<recorded_generation> requests_;
};

class fake_search_provider : public search_provider {
public:
    std::vector<search_result> results;
    bool fail = false;
    int calls = 0;
    std::string last_query;
    int last_max_results = 0;

    std::vector<search_result> search(const std::string & query, int max_results) override {
        calls++;
        last_query = query;
        last_max_results = max_results;
        if (fail) {
            throw trends::upstream_unavailable("search provider unreachable");
        }
        std::vector<search_result> out = results;
        if (static_cast<int>(out.size()) > max_results) {
            out.resize(max_results);
        }
        return out;
    }
};

class fake_transport : public http_transport {
public:
    http_response response{200, "{}"};
    bool fail = false;

    std::string last_url;
    std::map<std::string, std::string> last_headers;
    std::string last_body;
    int last_timeout_ms = -1;
    int calls = 0;

    http_response post_json(const std::string & url,
                            const std::map<std::string, std::string> & headers,
                            const std::string & body,
                            int timeout_ms) override {
        calls++;
        last_url = url;
        last_headers = headers;
        last_body = body;
        last_timeout_ms = timeout_ms;
        if (fail) {
            throw trends::upstream_unavailable("connection refused");
        }
        return response;
    }
};

// Collects emitted events; can simulate a consumer that disconnects
class recording_sink : public pipeline::event_sink {
public:
    std::vector<pipeline::pipeline_event> events;
    bool closed = false;
    int accept_limit = -1;   // -1 = unlimited

    bool emit(pipeline::pipeline_event event) override {
        if (accept_limit >= 0 && static_cast<int>(events.size()) >= accept_limit) {
            return false;
        }
        events.push_back(std::move(event));
        return true;
    }

    void close() override { closed = true; }

    // "stage:researching", "stage:researching:done", "result", "done", "error:<kind>"
    std::vector<std::string> trace() const {
        std::vector<std::string> out;
        for (const auto & e : events) {
            std::string name = pipeline::event_type_to_string(e.type);
            if (e.type == pipeline::event_type::STAGE) {
                name += ":" + e.data["stage"].get<std::string>();
                if (e.data.value("done", false)) {
                    name += ":done";
                }
            } else if (e.type == pipeline::event_type::FAILURE) {
                name += ":" + e.data["kind"].get<std::string>();
            }
            out.push_back(name);
        }
        return out;
    }
};

inline std::vector<search_result> sample_search_results() {
    return {
        {"Office vacancies climb", "https://example.com/vacancy", "Vacancy rates reached a record high."},
        {"Hybrid work is here to stay", "https://example.com/hybrid", "Most firms adopted hybrid schedules."},
    };
}
