#include "web-search.h"
#include "../common/constants.h"
#include "../common/errors.h"

#include <spdlog/spdlog.h>

#include <sstream>

tavily_search_provider::tavily_search_provider(http_transport& transport,
                                               std::string api_key,
                                               std::string url,
                                               int timeout_ms)
    : transport_(transport)
    , api_key_(std::move(api_key))
    , url_(std::move(url))
    , timeout_ms_(timeout_ms) {
}

json tavily_search_provider::build_request(const std::string& query, int max_results) const {
    return json{
        {"api_key", api_key_},
        {"query", query},
        {"max_results", max_results}
    };
}

std::vector<search_result> tavily_search_provider::search(const std::string& query, int max_results) {
    http_response response = transport_.post_json(url_, {}, build_request(query, max_results).dump(), timeout_ms_);

    if (!response.ok()) {
        throw trends::upstream_unavailable(trends::format_error(
            "Web search", "HTTP " + std::to_string(response.status), trends::preview(response.body, 200)));
    }

    auto results = parse_response(response.body);
    spdlog::debug("web search '{}' returned {} results", trends::preview(query), results.size());
    return results;
}

std::vector<search_result> tavily_search_provider::parse_response(const std::string& body) {
    json data;
    try {
        data = json::parse(body);
    } catch (const json::exception& e) {
        throw trends::upstream_unavailable(trends::format_error("Web search", "invalid JSON response", e.what()));
    }

    std::vector<search_result> results;
    if (!data.is_object() || !data.contains("results")) {
        return results;
    }

    const json& items = data["results"];
    if (!items.is_array()) {
        throw trends::upstream_unavailable(trends::format_error("Web search", "\"results\" is not an array"));
    }

    for (const auto& item : items) {
        if (!item.is_object()) {
            continue;
        }
        // Providers occasionally send null for missing fields
        auto field = [&item](const char* key) {
            auto it = item.find(key);
            return (it != item.end() && it->is_string()) ? it->get<std::string>() : std::string();
        };
        search_result r;
        r.title = field("title");
        r.url = field("url");
        r.content = field("content");
        results.push_back(std::move(r));
    }

    return results;
}

std::string format_search_results(const std::vector<search_result>& results) {
    if (results.empty()) {
        return trends::config::NO_RESULTS_TEXT;
    }

    std::vector<std::string> blocks;
    blocks.reserve(results.size());
    for (const auto& r : results) {
        std::ostringstream ss;
        ss << "Title: " << r.title << "\n";
        ss << "URL: " << r.url << "\n";
        ss << "Content: " << r.content << "\n";
        blocks.push_back(ss.str());
    }

    return trends::join(blocks, trends::config::RESULT_SEPARATOR);
}
