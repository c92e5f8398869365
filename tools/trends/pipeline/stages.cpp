#include "stages.h"
#include "schema.h"
#include "../agent-loop.h"
#include "../common/errors.h"
#include "../search/web-search.h"

#include <spdlog/spdlog.h>

namespace pipeline {

// Run a single structured generation turn and return the raw answer text
static std::string generate_once(generation_client & client,
                                 const std::string & model,
                                 const generation_config & config,
                                 const std::string & content) {
    json messages = json::array();
    messages.push_back(json{{"role", "user"}, {"content", content}});
    return client.generate(model, config, messages, {}).text;
}

// research_stage

research_stage::research_stage(generation_client & client, search_provider & search, research_options options)
    : client_(client)
    , search_(search)
    , options_(std::move(options)) {
}

const generation_config & research_stage::config() {
    static const generation_config cfg = [] {
        generation_config c;
        c.system_instruction =
            "You are a thorough research assistant. "
            "When given a query, you MUST use the web_search tool to gather "
            "real sources from the web before summarizing. "
            "Make multiple searches if needed to cover different angles. "
            "Return a comprehensive research summary that includes key facts, "
            "data points, and source URLs.";
        c.temperature = trends::config::RESEARCH_TEMPERATURE;
        c.tools = {"web_search"};
        return c;
    }();
    return cfg;
}

std::string research_stage::run(const std::string & query, const stage_context & ctx) {
    agent_config loop_config;
    loop_config.model = options_.model;
    loop_config.generation = config();
    loop_config.max_iterations = options_.max_turns;
    loop_config.tools.search = &search_;
    loop_config.tools.max_results = options_.max_results;
    loop_config.tools.session_id = ctx.session_id;

    // Fresh conversation per request
    agent_loop loop(client_, loop_config);
    agent_loop_result result = loop.run(query);

    spdlog::debug("[{}] research finished after {} turns, {} tool calls",
                  ctx.session_id, result.iterations, result.tool_calls);

    if (trends::trim(result.final_response).empty()) {
        std::string reason = result.stop_reason == agent_stop_reason::MAX_ITERATIONS
            ? "no final answer after " + std::to_string(result.iterations) + " turns"
            : "model returned no text";
        throw trends::empty_upstream_result(trends::format_error("Research", reason));
    }

    return result.final_response;
}

// analysis_stage

analysis_stage::analysis_stage(generation_client & client, std::string model)
    : client_(client)
    , model_(std::move(model)) {
}

const generation_config & analysis_stage::config() {
    static const generation_config cfg = [] {
        generation_config c;
        c.system_instruction =
            "You are a senior analyst. Given a research summary, identify the most "
            "important trends, potential risks, and actionable insights. "
            "Be specific and back up your analysis with evidence from the research.";
        c.temperature = trends::config::ANALYSIS_TEMPERATURE;
        c.response_schema = analysis_schema();
        return c;
    }();
    return cfg;
}

std::string analysis_stage::build_input(const std::string & summary) {
    return "Analyse the following research:\n\n" + summary;
}

analysis_result analysis_stage::run(const std::string & summary, const stage_context & ctx) {
    std::string text = generate_once(client_, model_, config(), build_input(summary));
    analysis_result analysis = analysis_result::from_json(parse_structured_output(text, analysis_schema()));

    spdlog::debug("[{}] analysis: {} trends, {} risks, {} insights", ctx.session_id,
                  analysis.trends.size(), analysis.risks.size(), analysis.insights.size());
    return analysis;
}

// report_stage

report_stage::report_stage(generation_client & client, std::string model)
    : client_(client)
    , model_(std::move(model)) {
}

const generation_config & report_stage::config() {
    static const generation_config cfg = [] {
        generation_config c;
        c.system_instruction =
            "You are an expert report writer. Given an analysis with trends, risks, "
            "and insights, produce a polished final report. "
            "The executive_summary should be 2-3 concise paragraphs. "
            "The markdown_report should be a detailed, well-structured document with "
            "headings, bullet points, and clear sections. "
            "Include 3-5 follow_up_questions that would deepen the research.";
        c.temperature = trends::config::REPORT_TEMPERATURE;
        c.response_schema = report_schema();
        return c;
    }();
    return cfg;
}

final_report report_stage::run(const analysis_result & analysis, const stage_context & ctx) {
    std::string text = generate_once(client_, model_, config(), format_analysis(analysis));
    final_report report = final_report::from_json(parse_structured_output(text, report_schema()));

    int questions = static_cast<int>(report.follow_up_questions.size());
    if (questions < trends::config::MIN_FOLLOW_UP_QUESTIONS ||
        questions > trends::config::MAX_FOLLOW_UP_QUESTIONS) {
        spdlog::warn("[{}] report has {} follow-up questions (expected {}-{})", ctx.session_id, questions,
                     trends::config::MIN_FOLLOW_UP_QUESTIONS, trends::config::MAX_FOLLOW_UP_QUESTIONS);
    }
    return report;
}

} // namespace pipeline
