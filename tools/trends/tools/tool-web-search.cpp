#include "../tool-registry.h"
#include "../common/constants.h"
#include "../search/web-search.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdint>

static tool_result web_search_execute(const json& args, const tool_context& ctx) {
    if (!ctx.search) {
        return {false, "", "Search provider not available in this context"};
    }

    if (!args.contains("query") || !args["query"].is_string()) {
        return {false, "", "query is required"};
    }
    std::string query = trends::trim(args["query"].get<std::string>());
    if (query.empty()) {
        return {false, "", "query must not be empty"};
    }

    int max_results = ctx.max_results;
    if (args.contains("max_results") && args["max_results"].is_number_integer()) {
        // Clamp before narrowing: the model may send any 64-bit value
        const json& requested = args["max_results"];
        int64_t value = requested.is_number_unsigned()
            ? static_cast<int64_t>(std::min<uint64_t>(requested.get<uint64_t>(), trends::config::MAX_MAX_RESULTS))
            : requested.get<int64_t>();
        max_results = static_cast<int>(std::clamp<int64_t>(value,
                                                           trends::config::MIN_MAX_RESULTS,
                                                           trends::config::MAX_MAX_RESULTS));
    }

    spdlog::info("[{}] web_search: {}", ctx.session_id, trends::preview(query));

    // Upstream failures propagate: the stage aborts instead of feeding an error to the model
    std::vector<search_result> results = ctx.search->search(query, max_results);

    return {true, format_search_results(results), ""};
}

static tool_def web_search_tool = {
    "web_search",
    R"(Search the web and return relevant results.

Each result contains the page title, its source URL and a content excerpt.
Call this before summarizing, and search again with different phrasing to cover other angles.)",
    R"json({
        "type": "object",
        "properties": {
            "query": {
                "type": "string",
                "description": "The search query to send to the search engine"
            },
            "max_results": {
                "type": "integer",
                "description": "Maximum number of results to return (default: 5)"
            }
        },
        "required": ["query"]
    })json",
    web_search_execute
};

REGISTER_TOOL(web_search, web_search_tool);
