#include "app-config.h"
#include "../common/errors.h"
#include "../common/trends-common.h"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>
#include <sstream>

namespace trends {

static std::string get_env(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::map<std::string, std::string> parse_env_file(const std::string& content) {
    std::map<std::string, std::string> vars;
    std::istringstream in(content);
    std::string line;

    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }
        if (line.rfind("export ", 0) == 0) {
            line = trim(line.substr(7));
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos || eq == 0) {
            continue;
        }

        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));
        if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
            value.back() == value.front()) {
            value = value.substr(1, value.size() - 2);
        } else {
            // Unquoted values may carry a trailing comment
            size_t hash = value.find(" #");
            if (hash != std::string::npos) {
                value = trim(value.substr(0, hash));
            }
        }
        vars[key] = value;
    }

    return vars;
}

int load_env_file(const std::string& path) {
    std::ifstream f(path);
    if (!f) {
        spdlog::debug("no env file at {}", path);
        return 0;
    }

    std::ostringstream ss;
    ss << f.rdbuf();

    int exported = 0;
    for (const auto& [key, value] : parse_env_file(ss.str())) {
        if (std::getenv(key.c_str()) != nullptr) {
            continue;
        }
        if (setenv(key.c_str(), value.c_str(), 0) == 0) {
            exported++;
        }
    }

    spdlog::debug("loaded {} variables from {}", exported, path);
    return exported;
}

void load_credentials(app_config& cfg) {
    cfg.tavily_api_key = get_env("TAVILY_API_KEY");
    cfg.gemini_api_key = get_env("GEMINI_API_KEY");

    std::string missing;
    if (cfg.tavily_api_key.empty()) {
        missing = "TAVILY_API_KEY";
    }
    if (cfg.gemini_api_key.empty()) {
        missing += missing.empty() ? "GEMINI_API_KEY" : ", GEMINI_API_KEY";
    }
    if (!missing.empty()) {
        throw configuration_error("missing required environment variable(s): " + missing);
    }

    std::string tavily_url = get_env("TAVILY_BASE_URL");
    if (!tavily_url.empty()) {
        cfg.tavily_url = tavily_url;
    }
    std::string gemini_url = get_env("GEMINI_BASE_URL");
    if (!gemini_url.empty()) {
        cfg.gemini_base_url = gemini_url;
    }
}

} // namespace trends
