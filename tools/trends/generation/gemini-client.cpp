#include "gemini-client.h"
#include "../common/constants.h"
#include "../common/errors.h"
#include "../tool-registry.h"

#include <spdlog/spdlog.h>

gemini_client::gemini_client(http_transport & transport, std::string api_key, std::string base_url)
    : transport_(transport)
    , api_key_(std::move(api_key))
    , base_url_(std::move(base_url)) {
    while (!base_url_.empty() && base_url_.back() == '/') {
        base_url_.pop_back();
    }
}

std::string gemini_client::endpoint(const std::string & model) const {
    return base_url_ + "/v1beta/models/" + model + ":generateContent";
}

static json text_part(const std::string & text) {
    return json{{"text", text}};
}

// Map one assistant message to a "model" content entry
static json model_content(const json & msg) {
    if (msg.contains("provider_content") && msg["provider_content"].is_object()) {
        return msg["provider_content"];
    }

    json parts = json::array();
    std::string text = msg.value("content", "");
    if (!text.empty()) {
        parts.push_back(text_part(text));
    }
    if (msg.contains("tool_calls")) {
        for (const auto & tc : msg["tool_calls"]) {
            parts.push_back(json{{"functionCall", {
                {"name", tc.value("name", "")},
                {"args", tc.value("arguments", json::object())}
            }}});
        }
    }
    return json{{"role", "model"}, {"parts", parts}};
}

json gemini_client::build_request(const generation_config & config,
                                  const json & messages,
                                  const std::vector<const tool_def *> & tools) {
    json contents = json::array();

    for (const auto & msg : messages) {
        std::string role = msg.value("role", "");

        if (role == "user") {
            contents.push_back(json{
                {"role", "user"},
                {"parts", json::array({text_part(msg.value("content", ""))})}
            });
        } else if (role == "assistant") {
            contents.push_back(model_content(msg));
        } else if (role == "tool") {
            json part = {{"functionResponse", {
                {"name", msg.value("name", "")},
                {"response", {{"result", msg.value("content", "")}}}
            }}};
            // All responses to one model turn travel together in a single user turn
            if (!contents.empty() && contents.back().value("role", "") == "user" &&
                contents.back()["parts"].front().contains("functionResponse")) {
                contents.back()["parts"].push_back(part);
            } else {
                contents.push_back(json{{"role", "user"}, {"parts", json::array({part})}});
            }
        }
    }

    json request = {{"contents", contents}};

    if (!config.system_instruction.empty()) {
        request["systemInstruction"] = {{"parts", json::array({text_part(config.system_instruction)})}};
    }

    json generation = {{"temperature", config.temperature}};
    if (!config.response_schema.is_null()) {
        generation["responseMimeType"] = "application/json";
        generation["responseSchema"] = config.response_schema;
    }
    request["generationConfig"] = generation;

    if (!tools.empty()) {
        json declarations = json::array();
        for (const auto * tool : tools) {
            declarations.push_back(tool->to_declaration());
        }
        json tool_entry = {{"functionDeclarations", declarations}};
        request["tools"] = json::array({tool_entry});
    }

    return request;
}

generation_response gemini_client::parse_response(const std::string & body) {
    json data;
    try {
        data = json::parse(body);
    } catch (const json::exception & e) {
        throw trends::upstream_unavailable(trends::format_error("Generation", "invalid JSON response", e.what()));
    }

    generation_response result;

    if (!data.contains("candidates") || !data["candidates"].is_array() || data["candidates"].empty()) {
        std::string reason = "no candidates";
        if (data.contains("promptFeedback")) {
            reason += ", blockReason=" + data["promptFeedback"].value("blockReason", "unspecified");
        }
        spdlog::warn("generation returned {}", reason);
        return result;
    }

    const json & candidate = data["candidates"][0];
    if (!candidate.contains("content") || !candidate["content"].contains("parts")) {
        spdlog::warn("generation candidate has no content (finishReason={})",
                     candidate.value("finishReason", "unspecified"));
        return result;
    }

    result.provider_content = candidate["content"];
    if (!result.provider_content.contains("role")) {
        result.provider_content["role"] = "model";
    }

    int call_index = 0;
    for (const auto & part : candidate["content"]["parts"]) {
        if (part.contains("functionCall")) {
            const json & fc = part["functionCall"];
            tool_call call;
            call.name = fc.value("name", "");
            call.arguments = fc.value("args", json::object());
            call.id = fc.value("id", "call_" + std::to_string(call_index));
            call_index++;
            result.tool_calls.push_back(std::move(call));
        } else if (part.contains("text") && !part.value("thought", false)) {
            result.text += part["text"].get<std::string>();
        }
    }

    return result;
}

generation_response gemini_client::generate(const std::string & model,
                                            const generation_config & config,
                                            const json & messages,
                                            const std::vector<const tool_def *> & tools) {
    json request = build_request(config, messages, tools);

    http_response response = transport_.post_json(
        endpoint(model), {{"x-goog-api-key", api_key_}}, request.dump(),
        trends::config::GENERATION_TIMEOUT_MS);

    if (!response.ok()) {
        throw trends::upstream_unavailable(trends::format_error(
            "Generation", "HTTP " + std::to_string(response.status), trends::preview(response.body, 200)));
    }

    return parse_response(response.body);
}
