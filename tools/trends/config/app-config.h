#pragma once

#include "../common/constants.h"

#include <map>
#include <string>

namespace trends {

/**
 * Process configuration.
 *
 * Provider credentials come from the environment (optionally seeded from a
 * .env file); everything else has a default and can be overridden by flags.
 */
struct app_config {
    // Server
    std::string host = config::DEFAULT_HOST;
    int port = config::DEFAULT_PORT;

    // Providers
    std::string tavily_api_key;
    std::string gemini_api_key;
    std::string tavily_url = config::DEFAULT_TAVILY_URL;
    std::string gemini_base_url = config::DEFAULT_GEMINI_BASE_URL;
    std::string model = config::DEFAULT_MODEL;

    // Pipeline
    int max_results = config::DEFAULT_MAX_RESULTS;
    int max_turns = config::DEFAULT_MAX_TURNS;

    // Misc
    std::string env_file = ".env";
    std::string query;   // Non-empty = one-shot mode
    bool verbose = false;
};

// Parse KEY=VALUE lines. Accepts "#" comments, an "export " prefix and
// single or double quotes around the value.
std::map<std::string, std::string> parse_env_file(const std::string& content);

// Read path and export its variables without overriding ones already set.
// A missing file is not an error. Returns the number of variables exported.
int load_env_file(const std::string& path);

// Fill credentials and endpoint overrides from the environment.
// Raises pipeline_error(CONFIGURATION) when a required key is missing.
void load_credentials(app_config& cfg);

} // namespace trends
