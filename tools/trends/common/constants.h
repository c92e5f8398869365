#pragma once

// Centralized constants for the trends-analyser module.
// All magic numbers should be defined here for consistency.

namespace trends::config {

// =============================================================================
// Generation
// =============================================================================

// Default generation model
constexpr const char* DEFAULT_MODEL = "gemini-2.5-flash";

// Default Gemini REST endpoint (without the /v1beta/models suffix)
constexpr const char* DEFAULT_GEMINI_BASE_URL = "https://generativelanguage.googleapis.com";

// Sampling temperatures per stage
constexpr double RESEARCH_TEMPERATURE = 0.4;
constexpr double ANALYSIS_TEMPERATURE = 0.3;
constexpr double REPORT_TEMPERATURE = 0.5;

// =============================================================================
// Web search
// =============================================================================

// Default Tavily search endpoint
constexpr const char* DEFAULT_TAVILY_URL = "https://api.tavily.com/search";

// Default number of snippets returned per search
constexpr int DEFAULT_MAX_RESULTS = 5;

// Bounds for --max-results
constexpr int MIN_MAX_RESULTS = 1;
constexpr int MAX_MAX_RESULTS = 20;

// Sentinel text returned when a search yields nothing
constexpr const char* NO_RESULTS_TEXT = "No results found.";

// Separator between formatted search snippets
constexpr const char* RESULT_SEPARATOR = "\n---\n";

// =============================================================================
// Timeouts (milliseconds)
// =============================================================================

// Timeout for a single web search call
constexpr int SEARCH_TIMEOUT_MS = 30000;

// Generation calls run without a timeout
constexpr int GENERATION_TIMEOUT_MS = 0;

// =============================================================================
// Iteration limits
// =============================================================================

// Default maximum model turns in the research tool loop
constexpr int DEFAULT_MAX_TURNS = 10;

// Bounds for --max-turns
constexpr int MIN_MAX_TURNS = 1;
constexpr int MAX_MAX_TURNS = 50;

// =============================================================================
// Report
// =============================================================================

// Suggested range for follow-up questions (deviations are surfaced, not rejected)
constexpr int MIN_FOLLOW_UP_QUESTIONS = 3;
constexpr int MAX_FOLLOW_UP_QUESTIONS = 5;

// =============================================================================
// Server
// =============================================================================

constexpr const char* DEFAULT_HOST = "0.0.0.0";
constexpr int DEFAULT_PORT = 8000;

} // namespace trends::config
