#pragma once

// Common utilities and type aliases for the trends-analyser module.
// This header consolidates declarations shared across the codebase.

#include <iomanip>
#include <random>
#include <sstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace trends {

// JSON type alias - ordered so payload fields keep their declaration order on the wire
using json = nlohmann::ordered_json;

// Format error messages consistently.
// Pattern: "<action> failed: <reason> (<context>)"
inline std::string format_error(const std::string& action,
                                const std::string& reason,
                                const std::string& context = "") {
    std::string msg = action + " failed: " + reason;
    if (!context.empty()) {
        msg += " (" + context + ")";
    }
    return msg;
}

// Trim whitespace from both ends of a string
inline std::string trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

// Join strings with a separator
inline std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string result;
    for (size_t i = 0; i < parts.size(); i++) {
        if (i > 0) {
            result += sep;
        }
        result += parts[i];
    }
    return result;
}

// Random lowercase hex string of the given length (used for session ids)
inline std::string random_hex(size_t length) {
    static thread_local std::mt19937_64 gen{std::random_device{}()};
    std::uniform_int_distribution<int> dis(0, 15);

    std::stringstream ss;
    ss << std::hex;
    for (size_t i = 0; i < length; i++) {
        ss << dis(gen);
    }
    return ss.str();
}

// Truncate long strings for log lines
inline std::string preview(const std::string& str, size_t max_len = 80) {
    if (str.size() <= max_len) {
        return str;
    }
    return str.substr(0, max_len - 3) + "...";
}

} // namespace trends
