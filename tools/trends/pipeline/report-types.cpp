#include "report-types.h"
#include "schema.h"
#include "../common/errors.h"

namespace pipeline {

static json string_list_schema(const std::string& description) {
    return json{
        {"type", "ARRAY"},
        {"description", description},
        {"items", {{"type", "STRING"}}}
    };
}

const json& analysis_schema() {
    static const json schema = {
        {"type", "OBJECT"},
        {"properties", {
            {"trends", string_list_schema("Key trends identified from the research")},
            {"risks", string_list_schema("Potential risks or challenges")},
            {"insights", string_list_schema("Actionable insights and observations")}
        }},
        {"required", {"trends", "risks", "insights"}},
        {"propertyOrdering", {"trends", "risks", "insights"}}
    };
    return schema;
}

const json& report_schema() {
    static const json schema = {
        {"type", "OBJECT"},
        {"properties", {
            {"executive_summary", {
                {"type", "STRING"},
                {"description", "A concise executive summary (2-3 paragraphs)"}
            }},
            {"markdown_report", {
                {"type", "STRING"},
                {"description", "A detailed markdown-formatted report with sections and bullet points"}
            }},
            {"follow_up_questions", string_list_schema("3-5 follow-up questions for further research")}
        }},
        {"required", {"executive_summary", "markdown_report", "follow_up_questions"}},
        {"propertyOrdering", {"executive_summary", "markdown_report", "follow_up_questions"}}
    };
    return schema;
}

// analysis_result

json analysis_result::to_json() const {
    return json{
        {"trends", trends},
        {"risks", risks},
        {"insights", insights}
    };
}

analysis_result analysis_result::from_json(const json& j) {
    std::string err = validate_schema(j, analysis_schema());
    if (!err.empty()) {
        throw trends::schema_violation(err);
    }

    analysis_result a;
    a.trends = j["trends"].get<std::vector<std::string>>();
    a.risks = j["risks"].get<std::vector<std::string>>();
    a.insights = j["insights"].get<std::vector<std::string>>();
    return a;
}

// final_report

json final_report::to_json() const {
    return json{
        {"executive_summary", executive_summary},
        {"markdown_report", markdown_report},
        {"follow_up_questions", follow_up_questions}
    };
}

final_report final_report::from_json(const json& j) {
    std::string err = validate_schema(j, report_schema());
    if (!err.empty()) {
        throw trends::schema_violation(err);
    }

    final_report r;
    r.executive_summary = j["executive_summary"].get<std::string>();
    r.markdown_report = j["markdown_report"].get<std::string>();
    r.follow_up_questions = j["follow_up_questions"].get<std::vector<std::string>>();
    return r;
}

static void append_section(std::string& out, const char* title, const std::vector<std::string>& items) {
    out += title;
    out += ":\n";
    for (size_t i = 0; i < items.size(); i++) {
        if (i > 0) {
            out += "\n";
        }
        out += "- " + items[i];
    }
}

std::string format_analysis(const analysis_result& analysis) {
    std::string out;
    append_section(out, "Trends", analysis.trends);
    out += "\n\n";
    append_section(out, "Risks", analysis.risks);
    out += "\n\n";
    append_section(out, "Insights", analysis.insights);
    return out;
}

} // namespace pipeline
