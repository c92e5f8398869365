#pragma once

#include "../common/trends-common.h"

#include <string>
#include <vector>

using trends::json;

namespace pipeline {

// Structured output of the analysis stage
struct analysis_result {
    std::vector<std::string> trends;
    std::vector<std::string> risks;
    std::vector<std::string> insights;

    json to_json() const;
    // Raises SCHEMA_VIOLATION when j does not match analysis_schema()
    static analysis_result from_json(const json& j);
};

// Terminal artifact of the pipeline
struct final_report {
    std::string executive_summary;
    std::string markdown_report;
    std::vector<std::string> follow_up_questions;  // 3-5 suggested, not enforced

    json to_json() const;
    // Raises SCHEMA_VIOLATION when j does not match report_schema()
    static final_report from_json(const json& j);
};

// Output schemas handed to the generation capability and used for validation
const json& analysis_schema();
const json& report_schema();

// Flatten an analysis into the Trends/Risks/Insights bulleted block
std::string format_analysis(const analysis_result& analysis);

} // namespace pipeline
