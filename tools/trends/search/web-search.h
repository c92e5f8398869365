#pragma once

#include "../common/trends-common.h"
#include "../http/http-transport.h"

#include <string>
#include <vector>

using trends::json;

// One snippet returned by the search provider
struct search_result {
    std::string title;
    std::string url;
    std::string content;
};

// Web search capability bound to the research stage's web_search tool
class search_provider {
public:
    virtual ~search_provider() = default;

    // Raises pipeline_error(UPSTREAM_UNAVAILABLE) on network or provider failure
    virtual std::vector<search_result> search(const std::string& query, int max_results) = 0;
};

// Tavily REST search
class tavily_search_provider : public search_provider {
public:
    tavily_search_provider(http_transport& transport,
                           std::string api_key,
                           std::string url,
                           int timeout_ms);

    std::vector<search_result> search(const std::string& query, int max_results) override;

    // Request body sent to the provider
    json build_request(const std::string& query, int max_results) const;

    // Decode the provider response. Raises UPSTREAM_UNAVAILABLE on a malformed body.
    static std::vector<search_result> parse_response(const std::string& body);

private:
    http_transport& transport_;
    std::string api_key_;
    std::string url_;
    int timeout_ms_;
};

// Render snippets as "Title/URL/Content" blocks joined by "\n---\n",
// or "No results found." when empty.
std::string format_search_results(const std::vector<search_result>& results);
