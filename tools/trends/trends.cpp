#include "common/constants.h"
#include "common/errors.h"
#include "common/trends-common.h"
#include "config/app-config.h"
#include "generation/gemini-client.h"
#include "http/http-transport.h"
#include "pipeline/orchestrator.h"
#include "pipeline/stages.h"
#include "search/web-search.h"
#include "server/research-server.h"

#include <curl/curl.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <csignal>
#include <cstdio>
#include <iostream>
#include <string>

static research_server *g_server = nullptr;

static void signal_handler(int) {
  if (g_server) {
    g_server->stop();
  }
}

static void print_usage(const char *prog) {
  fprintf(stdout, "usage: %s [options]\n\n", prog);
  fprintf(stdout, "options:\n");
  fprintf(stdout, "  --host <addr>         address to bind (default: %s)\n", trends::config::DEFAULT_HOST);
  fprintf(stdout, "  --port <n>            port to listen on (default: %d)\n", trends::config::DEFAULT_PORT);
  fprintf(stdout, "  --model <name>        generation model (default: %s)\n", trends::config::DEFAULT_MODEL);
  fprintf(stdout, "  --max-results <n>     search results per call, %d-%d (default: %d)\n",
          trends::config::MIN_MAX_RESULTS, trends::config::MAX_MAX_RESULTS, trends::config::DEFAULT_MAX_RESULTS);
  fprintf(stdout, "  --max-turns <n>       research tool-loop turns, %d-%d (default: %d)\n",
          trends::config::MIN_MAX_TURNS, trends::config::MAX_MAX_TURNS, trends::config::DEFAULT_MAX_TURNS);
  fprintf(stdout, "  --env-file <path>     env file to load (default: .env)\n");
  fprintf(stdout, "  -q, --query <text>    run one query and print the event stream to stdout\n");
  fprintf(stdout, "  -v, --verbose         debug logging\n");
  fprintf(stdout, "  -h, --help            show this help\n");
  fprintf(stdout, "\nenvironment: TAVILY_API_KEY, GEMINI_API_KEY (required), TAVILY_BASE_URL, GEMINI_BASE_URL\n");
}

// Parse an integer flag value and clamp it into [lo, hi]
static bool parse_int_flag(const std::string &flag, const char *value, int lo, int hi, int &out) {
  try {
    out = std::clamp(std::stoi(value), lo, hi);
    return true;
  } catch (const std::exception &) {
    fprintf(stderr, "Invalid %s value: %s\n", flag.c_str(), value);
    return false;
  }
}

// Returns -1 to continue, otherwise the process exit code
static int parse_args(int argc, char **argv, trends::app_config &cfg) {
  for (int i = 1; i < argc; i++) {
    std::string arg = argv[i];
    bool has_value = i + 1 < argc;

    if (arg == "-h" || arg == "--help") {
      print_usage(argv[0]);
      return 0;
    } else if (arg == "-v" || arg == "--verbose") {
      cfg.verbose = true;
    } else if (arg == "--host" || arg == "--model" || arg == "--env-file" ||
               arg == "-q" || arg == "--query") {
      if (!has_value) {
        fprintf(stderr, "%s requires a value\n", arg.c_str());
        return 1;
      }
      std::string value = argv[++i];
      if (arg == "--host") {
        cfg.host = value;
      } else if (arg == "--model") {
        cfg.model = value;
      } else if (arg == "--env-file") {
        cfg.env_file = value;
      } else {
        cfg.query = value;
      }
    } else if (arg == "--port") {
      if (!has_value) {
        fprintf(stderr, "--port requires a value\n");
        return 1;
      }
      if (!parse_int_flag(arg, argv[++i], 1, 65535, cfg.port)) {
        return 1;
      }
    } else if (arg == "--max-results") {
      if (!has_value) {
        fprintf(stderr, "--max-results requires a value\n");
        return 1;
      }
      if (!parse_int_flag(arg, argv[++i], trends::config::MIN_MAX_RESULTS,
                          trends::config::MAX_MAX_RESULTS, cfg.max_results)) {
        return 1;
      }
    } else if (arg == "--max-turns") {
      if (!has_value) {
        fprintf(stderr, "--max-turns requires a value\n");
        return 1;
      }
      if (!parse_int_flag(arg, argv[++i], trends::config::MIN_MAX_TURNS,
                          trends::config::MAX_MAX_TURNS, cfg.max_turns)) {
        return 1;
      }
    } else {
      fprintf(stderr, "Unknown argument: %s\n", arg.c_str());
      print_usage(argv[0]);
      return 1;
    }
  }
  return -1;
}

int main(int argc, char **argv) {
  trends::app_config cfg;

  int rc = parse_args(argc, argv, cfg);
  if (rc >= 0) {
    return rc;
  }

  // Logs go to stderr so one-shot mode keeps stdout for the event stream
  spdlog::set_default_logger(spdlog::stderr_color_mt("trends"));
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
  spdlog::set_level(cfg.verbose ? spdlog::level::debug : spdlog::level::info);

  trends::load_env_file(cfg.env_file);
  try {
    trends::load_credentials(cfg);
  } catch (const trends::pipeline_error &e) {
    spdlog::critical("configuration error: {}", e.what());
    return 1;
  }

  if (curl_global_init(CURL_GLOBAL_ALL) != CURLE_OK) {
    spdlog::critical("failed to initialise libcurl");
    return 1;
  }

  // Process-wide provider handles; stateless between requests
  curl_transport transport;
  tavily_search_provider search(transport, cfg.tavily_api_key, cfg.tavily_url,
                                trends::config::SEARCH_TIMEOUT_MS);
  gemini_client generator(transport, cfg.gemini_api_key, cfg.gemini_base_url);

  pipeline::research_options research_opts;
  research_opts.model = cfg.model;
  research_opts.max_turns = cfg.max_turns;
  research_opts.max_results = cfg.max_results;

  pipeline::research_stage research(generator, search, research_opts);
  pipeline::analysis_stage analysis(generator, cfg.model);
  pipeline::report_stage report(generator, cfg.model);
  pipeline::pipeline_orchestrator orchestrator(research, analysis, report);

  spdlog::info("model      : {}", cfg.model);
  spdlog::info("max results: {}", cfg.max_results);
  spdlog::info("max turns  : {}", cfg.max_turns);

  int exit_code = 0;
  if (!cfg.query.empty()) {
    // One-shot mode: stream events to stdout
    pipeline::ostream_sink sink(std::cout);
    pipeline::pipeline_run_result result = orchestrator.run(cfg.query, sink);
    exit_code = result.state == pipeline::pipeline_state::DONE ? 0 : 1;
  } else {
    research_server server(orchestrator);
    g_server = &server;
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    if (!server.listen(cfg.host, cfg.port)) {
      spdlog::critical("failed to listen on {}:{}", cfg.host, cfg.port);
      exit_code = 1;
    }
    g_server = nullptr;
    spdlog::info("shutting down");
  }

  curl_global_cleanup();
  return exit_code;
}
