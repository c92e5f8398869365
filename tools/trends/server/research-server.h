#pragma once

#include "../common/trends-common.h"
#include "../pipeline/orchestrator.h"

#include <memory>
#include <string>

namespace httplib {
class Server;
}

using trends::json;

// Outcome of validating a POST /research body
struct research_request {
    bool valid = false;
    std::string query;
    std::string error;   // Set when !valid
};

// Validate {"query": string}
research_request parse_research_request(const std::string & body);

/**
 * HTTP front end of the pipeline.
 *
 * Routes:
 *   GET  /health    -> {"status": "ok"}
 *   POST /research  -> text/event-stream of pipeline events
 *   OPTIONS *       -> permissive CORS preflight
 *
 * Each /research request runs the orchestrator on its own thread, which feeds
 * an event_channel drained by the chunked response writer.
 */
class research_server {
public:
    explicit research_server(pipeline::pipeline_orchestrator & orchestrator);
    ~research_server();

    // Blocking; returns false when the socket could not be bound
    bool listen(const std::string & host, int port);

    // Make listen() return; safe to call from another thread
    void stop();

    // Bind to an OS-chosen port on host; returns the port or -1
    int bind_to_any_port(const std::string & host);

    // Serve on a socket bound by bind_to_any_port(); blocking
    bool listen_after_bind();

private:
    // Install the routes on svr
    void register_routes(httplib::Server & svr);

    pipeline::pipeline_orchestrator & orchestrator_;
    std::unique_ptr<httplib::Server> svr_;
};
