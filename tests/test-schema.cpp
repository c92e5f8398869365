#include <gtest/gtest.h>

#include "common/errors.h"
#include "pipeline/report-types.h"
#include "pipeline/schema.h"

#include <functional>

using namespace pipeline;

static trends::error_kind kind_of(const std::function<void()> & fn) {
    try {
        fn();
    } catch (const trends::pipeline_error & e) {
        return e.kind();
    }
    ADD_FAILURE() << "expected pipeline_error";
    return trends::error_kind::INTERNAL;
}

// ─── validate_schema ─────────────────────────────────────────────────────────

TEST(ValidateSchema, CompleteAnalysis_IsValid) {
    json value = {{"trends", {"a"}}, {"risks", json::array()}, {"insights", {"b", "c"}}};
    EXPECT_EQ(validate_schema(value, analysis_schema()), "");
}

TEST(ValidateSchema, MissingRequiredField_NamesIt) {
    json value = {{"trends", {"a"}}, {"insights", {"b"}}};
    std::string err = validate_schema(value, analysis_schema());
    EXPECT_NE(err.find("risks"), std::string::npos) << err;
}

TEST(ValidateSchema, NonStringListElement_ReportsPath) {
    json value = {{"trends", {"a", 3}}, {"risks", json::array()}, {"insights", json::array()}};
    std::string err = validate_schema(value, analysis_schema());
    EXPECT_NE(err.find("$.trends[1]"), std::string::npos) << err;
}

TEST(ValidateSchema, StringInsteadOfList_IsRejected) {
    json value = {{"trends", "a"}, {"risks", json::array()}, {"insights", json::array()}};
    EXPECT_NE(validate_schema(value, analysis_schema()), "");
}

TEST(ValidateSchema, TopLevelArray_IsRejected) {
    EXPECT_NE(validate_schema(json::array(), analysis_schema()), "");
}

TEST(ValidateSchema, UnknownFields_AreIgnored) {
    json value = {{"trends", json::array()}, {"risks", json::array()}, {"insights", json::array()}, {"extra", 1}};
    EXPECT_EQ(validate_schema(value, analysis_schema()), "");
}

TEST(ValidateSchema, LowercaseTypeNames_Accepted) {
    json schema = {{"type", "object"}, {"properties", {{"n", {{"type", "integer"}}}}}, {"required", {"n"}}};
    EXPECT_EQ(validate_schema(json{{"n", 4}}, schema), "");
    EXPECT_NE(validate_schema(json{{"n", "4"}}, schema), "");
}

// ─── extract_json_payload ────────────────────────────────────────────────────

TEST(ExtractJsonPayload, PlainJson_Unchanged) {
    EXPECT_EQ(extract_json_payload("  {\"a\":1}\n"), "{\"a\":1}");
}

TEST(ExtractJsonPayload, FencedJson_Unwrapped) {
    EXPECT_EQ(extract_json_payload("```json\n{\"a\":1}\n```"), "{\"a\":1}");
}

TEST(ExtractJsonPayload, BareFence_Unwrapped) {
    EXPECT_EQ(extract_json_payload("```\n[1,2]\n```"), "[1,2]");
}

TEST(ExtractJsonPayload, FenceInsideStringValue_Untouched) {
    std::string text = R"({"markdown_report":"# Data\n```json\n{\"a\":1}\n```\n"})";
    EXPECT_EQ(extract_json_payload(text), text);
}

TEST(ExtractJsonPayload, UnclosedFence_Unchanged) {
    EXPECT_EQ(extract_json_payload("```json\n{\"a\":1}"), "```json\n{\"a\":1}");
}

// ─── parse_structured_output ─────────────────────────────────────────────────

TEST(ParseStructuredOutput, ValidReport_Parses) {
    std::string text = R"({"executive_summary":"s","markdown_report":"# R","follow_up_questions":["Q1"]})";
    json parsed = parse_structured_output(text, report_schema());
    EXPECT_EQ(parsed["markdown_report"], "# R");
}

TEST(ParseStructuredOutput, ReportWithEmbeddedJsonCodeBlock_Parses) {
    std::string text = R"({"executive_summary":"s","markdown_report":"# Data\n```json\n{\"a\":1}\n```\n",)"
                       R"("follow_up_questions":["a","b","c"]})";
    json parsed = parse_structured_output(text, report_schema());
    EXPECT_EQ(parsed["markdown_report"], "# Data\n```json\n{\"a\":1}\n```\n");
    EXPECT_EQ(final_report::from_json(parsed).follow_up_questions.size(), 3u);
}

TEST(ParseStructuredOutput, FencedReportWithEmbeddedCodeBlock_Parses) {
    std::string inner = R"({"executive_summary":"s","markdown_report":"```json\n{}\n```",)"
                        R"("follow_up_questions":["a"]})";
    json parsed = parse_structured_output("```json\n" + inner + "\n```", report_schema());
    EXPECT_EQ(parsed["markdown_report"], "```json\n{}\n```");
}

TEST(ParseStructuredOutput, InvalidJson_IsSchemaViolation) {
    EXPECT_EQ(kind_of([] { parse_structured_output("not json", analysis_schema()); }),
              trends::error_kind::SCHEMA_VIOLATION);
}

TEST(ParseStructuredOutput, EmptyText_IsSchemaViolation) {
    EXPECT_EQ(kind_of([] { parse_structured_output("   ", analysis_schema()); }),
              trends::error_kind::SCHEMA_VIOLATION);
}

TEST(ParseStructuredOutput, MissingRisks_IsSchemaViolation) {
    EXPECT_EQ(kind_of([] {
                  parse_structured_output(R"({"trends":["x"],"insights":["y"]})", analysis_schema());
              }),
              trends::error_kind::SCHEMA_VIOLATION);
}

// ─── report types ────────────────────────────────────────────────────────────

TEST(FinalReport, ToJson_KeepsFieldOrder) {
    final_report r;
    r.executive_summary = "s";
    r.markdown_report = "m";
    r.follow_up_questions = {"q"};
    EXPECT_EQ(r.to_json().dump(),
              R"({"executive_summary":"s","markdown_report":"m","follow_up_questions":["q"]})");
}

TEST(FinalReport, FromJson_AcceptsAnyQuestionCount) {
    json j = {{"executive_summary", "s"}, {"markdown_report", "m"},
              {"follow_up_questions", {"1", "2", "3", "4", "5", "6", "7"}}};
    EXPECT_EQ(final_report::from_json(j).follow_up_questions.size(), 7u);

    j["follow_up_questions"] = json::array();
    EXPECT_TRUE(final_report::from_json(j).follow_up_questions.empty());
}

TEST(FinalReport, FromJson_MissingSummary_IsSchemaViolation) {
    json j = {{"markdown_report", "m"}, {"follow_up_questions", json::array()}};
    EXPECT_EQ(kind_of([&] { final_report::from_json(j); }), trends::error_kind::SCHEMA_VIOLATION);
}

TEST(FormatAnalysis, RendersThreeBulletedSections) {
    analysis_result a;
    a.trends = {"hybrid adoption", "downsizing"};
    a.risks = {"vacancy rates"};
    a.insights = {"repurposing offices"};
    EXPECT_EQ(format_analysis(a),
              "Trends:\n- hybrid adoption\n- downsizing\n\n"
              "Risks:\n- vacancy rates\n\n"
              "Insights:\n- repurposing offices");
}

TEST(FormatAnalysis, EmptyListsKeepHeadings) {
    EXPECT_EQ(format_analysis(analysis_result{}), "Trends:\n\n\nRisks:\n\n\nInsights:\n");
}
