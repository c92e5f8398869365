#pragma once

#include "report-types.h"
#include "../common/constants.h"
#include "../generation/generation-client.h"

#include <string>

class search_provider;

namespace pipeline {

// Per-request data handed to every stage
struct stage_context {
    std::string session_id;
};

/**
 * Contract shared by the pipeline stages.
 *
 * A stage turns its input into its output through exactly one delegated
 * generation (the research stage lets the model call tools first). Its
 * generation_config is built once and shared by all requests; the upstream
 * input is the only content sent.
 *
 * Failures are raised as pipeline_error:
 * - structured stages: SCHEMA_VIOLATION when the answer does not match the schema
 * - the free-text stage: EMPTY_UPSTREAM_RESULT when the answer is empty
 * - any stage: UPSTREAM_UNAVAILABLE from the providers
 */
template <typename In, typename Out>
class stage {
public:
    virtual ~stage() = default;

    virtual const char* name() const = 0;
    virtual Out run(const In & input, const stage_context & ctx) = 0;
};

struct research_options {
    std::string model = trends::config::DEFAULT_MODEL;
    int max_turns = trends::config::DEFAULT_MAX_TURNS;
    int max_results = trends::config::DEFAULT_MAX_RESULTS;
};

// Query -> research summary (free text), backed by the web_search tool loop
class research_stage : public stage<std::string, std::string> {
public:
    research_stage(generation_client & client, search_provider & search, research_options options);

    const char* name() const override { return "research"; }
    std::string run(const std::string & query, const stage_context & ctx) override;

    static const generation_config & config();

private:
    generation_client & client_;
    search_provider & search_;
    research_options options_;
};

// Research summary -> trends/risks/insights
class analysis_stage : public stage<std::string, analysis_result> {
public:
    analysis_stage(generation_client & client, std::string model);

    const char* name() const override { return "analysis"; }
    analysis_result run(const std::string & summary, const stage_context & ctx) override;

    static const generation_config & config();

    // Content payload built from the research summary
    static std::string build_input(const std::string & summary);

private:
    generation_client & client_;
    std::string model_;
};

// Analysis -> final report
class report_stage : public stage<analysis_result, final_report> {
public:
    report_stage(generation_client & client, std::string model);

    const char* name() const override { return "report"; }
    final_report run(const analysis_result & analysis, const stage_context & ctx) override;

    static const generation_config & config();

private:
    generation_client & client_;
    std::string model_;
};

} // namespace pipeline
