#include "research-server.h"
#include "../pipeline/event-channel.h"

#include <httplib.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <thread>

namespace {

// State shared between the pipeline thread and the response writer of one request
struct stream_session {
    std::string session_id;
    pipeline::event_channel channel;
    std::thread worker;
};

void send_json(httplib::Response & res, int status, const json & body) {
    res.status = status;
    res.set_content(body.dump(), "application/json");
}

} // namespace

research_request parse_research_request(const std::string & body) {
    research_request req;

    json data;
    try {
        data = json::parse(body);
    } catch (const json::exception & e) {
        req.error = std::string("body is not valid JSON: ") + e.what();
        return req;
    }

    if (!data.is_object() || !data.contains("query")) {
        req.error = "field required: query";
        return req;
    }
    if (!data["query"].is_string()) {
        req.error = "query must be a string";
        return req;
    }

    req.valid = true;
    req.query = data["query"].get<std::string>();
    return req;
}

research_server::research_server(pipeline::pipeline_orchestrator & orchestrator)
    : orchestrator_(orchestrator)
    , svr_(std::make_unique<httplib::Server>()) {
    register_routes(*svr_);
}

research_server::~research_server() = default;

void research_server::register_routes(httplib::Server & svr) {
    svr.set_default_headers({
        {"Access-Control-Allow-Origin", "*"},
    });

    svr.Options(R"(.*)", [](const httplib::Request &, httplib::Response & res) {
        res.set_header("Access-Control-Allow-Methods", "*");
        res.set_header("Access-Control-Allow-Headers", "*");
        res.status = 204;
    });

    svr.Get("/health", [](const httplib::Request &, httplib::Response & res) {
        send_json(res, 200, json{{"status", "ok"}});
    });

    svr.Post("/research", [this](const httplib::Request & req, httplib::Response & res) {
        research_request parsed = parse_research_request(req.body);
        if (!parsed.valid) {
            spdlog::warn("rejected /research request from {}: {}", req.remote_addr, parsed.error);
            send_json(res, 422, json{{"detail", parsed.error}});
            return;
        }

        auto session = std::make_shared<stream_session>();
        session->session_id = pipeline::pipeline_orchestrator::new_session_id();
        spdlog::info("[{}] /research from {}", session->session_id, req.remote_addr);

        // The releaser below joins the worker, so the raw pointer outlives the thread
        stream_session * raw = session.get();
        pipeline::pipeline_orchestrator & orchestrator = orchestrator_;
        std::string query = parsed.query;
        session->worker = std::thread([raw, &orchestrator, query]() {
            orchestrator.run(query, raw->channel, raw->session_id);
        });

        res.set_header("Cache-Control", "no-cache");
        res.set_header("X-Accel-Buffering", "no");
        res.set_chunked_content_provider(
            "text/event-stream",
            [session](size_t /* offset */, httplib::DataSink & sink) {
                pipeline::pipeline_event event;
                if (!session->channel.pop(event)) {
                    sink.done();
                    return true;
                }
                std::string chunk = pipeline::format_sse(event);
                return sink.write(chunk.data(), chunk.size());
            },
            [session](bool success) {
                if (!success) {
                    spdlog::info("[{}] stream aborted by client", session->session_id);
                    session->channel.abandon();
                }
                if (session->worker.joinable()) {
                    session->worker.join();
                }
            });
    });

    svr.set_logger([](const httplib::Request & req, const httplib::Response & res) {
        spdlog::debug("{} {} -> {}", req.method, req.path, res.status);
    });
}

bool research_server::listen(const std::string & host, int port) {
    spdlog::info("listening on {}:{}", host, port);
    return svr_->listen(host, port);
}

int research_server::bind_to_any_port(const std::string & host) {
    int port = svr_->bind_to_any_port(host);
    if (port > 0) {
        spdlog::info("bound to {}:{}", host, port);
    }
    return port;
}

bool research_server::listen_after_bind() {
    return svr_->listen_after_bind();
}

void research_server::stop() {
    svr_->stop();
}
