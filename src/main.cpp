/**
 * @file main.cpp
 * @brief faasbox - Command-line interface
 *
 * Entry point for the sandboxed function execution engine. Initializes the
 * engine (runtime check, metrics sink, images, prewarm) and runs code in a
 * warm container on a chosen sandbox backend, or on both for comparison.
 *
 * Results are printed to stdout as JSON; logs go to stderr.
 *
 * @date 2025
 */

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <nlohmann/json.hpp>

#include "faasbox/core/engine.hpp"
#include "faasbox/reporters/json_reporter.hpp"

#include <iostream>
#include <fstream>
#include <sstream>
#include <optional>

using json = nlohmann::json;

/*******************************************************************************
 * Helpers
 ******************************************************************************/

namespace {

std::optional<std::string> ReadSource(const CLI::Option* code_opt, const std::string& code,
                                      const std::string& file) {
    if (code_opt->count() > 0) {
        return code;
    }

    std::ifstream in(file);
    if (!in) {
        spdlog::error("Cannot read {}", file);
        return std::nullopt;
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

void PrintJson(const json& j) {
    std::cout << j.dump(2) << std::endl;
}

} // anonymous namespace

/*******************************************************************************
 * Main Application Entry Point
 ******************************************************************************/

int main(int argc, char** argv) {
    CLI::App app{"faasbox - sandboxed function execution engine"};
    app.require_subcommand(1);

    std::string config_path;
    std::string metrics_log;
    bool verbose = false;
    bool no_prewarm = false;

    app.add_option("-c,--config", config_path, "Engine configuration (JSON)")
        ->check(CLI::ExistingFile);
    app.add_option("--metrics-log", metrics_log, "Metrics log file (JSON lines)");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");
    app.add_flag("--no-prewarm", no_prewarm, "Do not start idle containers during initialization");

    // init
    auto* init_cmd = app.add_subcommand("init", "Check the runtime, build images and prewarm pools");

    // run
    auto* run_cmd = app.add_subcommand("run", "Execute code on one sandbox backend");
    std::string run_language = "python";
    std::string run_backend = "runc";
    int run_timeout = 5;
    std::string run_name = "cli";
    std::string run_code;
    std::string run_file;
    bool run_stream = false;

    run_cmd->add_option("-l,--language", run_language, "Language (python, node)")->default_val("python");
    run_cmd->add_option("-b,--backend", run_backend, "Sandbox backend (runc, runsc)")->default_val("runc");
    run_cmd->add_option("-t,--timeout", run_timeout, "Timeout in seconds")->default_val(5);
    run_cmd->add_option("-n,--name", run_name, "Function name for metrics")->default_val("cli");
    auto* run_code_opt = run_cmd->add_option("--code", run_code, "Source code");
    auto* run_file_opt = run_cmd->add_option("-f,--file", run_file, "Source file")->check(CLI::ExistingFile);
    run_code_opt->excludes(run_file_opt);
    run_cmd->add_flag("--stream", run_stream, "Echo output to stderr while it is produced");

    // compare
    auto* compare_cmd = app.add_subcommand("compare", "Execute code on runc and runsc");
    std::string cmp_language = "python";
    int cmp_timeout = 5;
    std::string cmp_name = "cli";
    std::string cmp_code;
    std::string cmp_file;

    compare_cmd->add_option("-l,--language", cmp_language, "Language (python, node)")->default_val("python");
    compare_cmd->add_option("-t,--timeout", cmp_timeout, "Timeout in seconds")->default_val(5);
    compare_cmd->add_option("-n,--name", cmp_name, "Function name for metrics")->default_val("cli");
    auto* cmp_code_opt = compare_cmd->add_option("--code", cmp_code, "Source code");
    auto* cmp_file_opt = compare_cmd->add_option("-f,--file", cmp_file, "Source file")->check(CLI::ExistingFile);
    cmp_code_opt->excludes(cmp_file_opt);

    CLI11_PARSE(app, argc, argv);

    // Logs on stderr keep stdout clean for JSON
    spdlog::set_default_logger(spdlog::stderr_color_mt("faasbox"));
    spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    try {
        // Configuration
        faasbox::core::EngineConfig config;
        if (!config_path.empty()) {
            std::string error;
            auto loaded = faasbox::core::LoadConfig(config_path, error);
            if (!loaded) {
                spdlog::error("Configuration error: {}", error);
                return 1;
            }
            config = *loaded;
        }
        if (!metrics_log.empty()) {
            config.metrics_log = metrics_log;
        }
        if (no_prewarm || !init_cmd->parsed()) {
            // One-shot runs start their container on demand
            config.prewarm_on_start = false;
        }

        std::string error;
        if (!faasbox::core::ValidateConfig(config, error)) {
            spdlog::error("Configuration error: {}", error);
            return 1;
        }

        faasbox::core::Engine engine(config);
        auto report = engine.Initialize();

        if (init_cmd->parsed()) {
            PrintJson(faasbox::reporters::JsonReporter::ToJson(report));
            return report.ok ? 0 : 1;
        }

        if (!report.ok) {
            std::cerr << faasbox::reporters::JsonReporter::ToJson(report).dump(2) << std::endl;
            return 1;
        }

        if (run_cmd->parsed()) {
            if (run_code_opt->count() == 0 && run_file_opt->count() == 0) {
                spdlog::error("run requires --code or --file");
                return 1;
            }
            auto source = ReadSource(run_code_opt, run_code, run_file);
            if (!source) {
                return 1;
            }

            faasbox::core::ExecutionRequest request;
            request.code = *source;
            request.language = run_language;
            request.backend = run_backend;
            request.timeout_seconds = run_timeout;
            request.function_name = run_name;

            faasbox::core::OutputStreams streams;
            streams.on_stdout = [](const std::string& chunk) { std::cerr << chunk << std::flush; };
            streams.on_stderr = [](const std::string& chunk) { std::cerr << chunk << std::flush; };

            auto outcome = engine.Execute(request, run_stream ? &streams : nullptr);
            PrintJson(faasbox::reporters::JsonReporter::ToJson(outcome));
            return outcome.result.success ? 0 : 1;
        }

        if (compare_cmd->parsed()) {
            if (cmp_code_opt->count() == 0 && cmp_file_opt->count() == 0) {
                spdlog::error("compare requires --code or --file");
                return 1;
            }
            auto source = ReadSource(cmp_code_opt, cmp_code, cmp_file);
            if (!source) {
                return 1;
            }

            faasbox::core::ComparisonRequest request;
            request.code = *source;
            request.language = cmp_language;
            request.timeout_seconds = cmp_timeout;
            request.function_name = cmp_name;

            auto comparison = engine.Compare(request);
            PrintJson(faasbox::reporters::JsonReporter::ToJson(comparison));
            return 0;
        }

        return 0;

    } catch (const std::invalid_argument& e) {
        spdlog::error("Invalid argument: {}", e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
