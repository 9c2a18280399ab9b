/**
 * @file main.cpp
 * @brief Monolith sandboxed code runner - Command-line interface
 *
 * Entry point for the monolith runner. Reads a source file (or stdin),
 * runs it in a fresh sandbox session for the chosen language, optionally
 * installing libraries first, and prints the result as a console summary or
 * as the JSON payload.
 *
 * @date 2025
 */

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "monolith/core/config_loader.hpp"
#include "monolith/core/docker_backend.hpp"
#include "monolith/core/errors.hpp"
#include "monolith/core/execution_service.hpp"
#include "monolith/reporters/json_reporter.hpp"

#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>

using namespace monolith;

/*******************************************************************************
 * UI and Display Functions
 ******************************************************************************/

void PrintBanner() {
    std::cerr << R"(
╔═══════════════════════════════════════════════════════════════╗
║                                                               ║
║     ███╗   ███╗ ██████╗ ███╗   ██╗ ██████╗ ██╗     ██╗████████╗██╗  ██╗
║     ████╗ ████║██╔═══██╗████╗  ██║██╔═══██╗██║     ██║╚══██╔══╝██║  ██║
║     ██╔████╔██║██║   ██║██╔██╗ ██║██║   ██║██║     ██║   ██║   ███████║
║     ██║╚██╔╝██║██║   ██║██║╚██╗██║██║   ██║██║     ██║   ██║   ██╔══██║
║     ██║ ╚═╝ ██║╚██████╔╝██║ ╚████║╚██████╔╝███████╗██║   ██║   ██║  ██║
║     ╚═╝     ╚═╝ ╚═════╝ ╚═╝  ╚═══╝ ╚═════╝ ╚══════╝╚═╝   ╚═╝   ╚═╝  ╚═╝
║                                                               ║
║                 Sandboxed Code Execution Runner               ║
║                              v1.0.0                           ║
║                                                               ║
╚═══════════════════════════════════════════════════════════════╝
)" << std::endl;
}

std::string ReadSource(const std::string& path) {
    if (path.empty() || path == "-") {
        return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    }
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Cannot read source file: " + path);
    }
    std::ostringstream content;
    content << file.rdbuf();
    return content.str();
}

void PrintConsoleSummary(const core::ExecutionReport& report) {
    std::cout << "\n";
    std::cout << "╔═══════════════════════════════════════════════════════════════╗\n";
    std::cout << "║                     EXECUTION SUMMARY                         ║\n";
    std::cout << "╚═══════════════════════════════════════════════════════════════╝\n";
    std::cout << reporters::JsonReporter::GenerateSummary(report);
}

/*******************************************************************************
 * Main Application Entry Point
 ******************************************************************************/

int main(int argc, char** argv) {
    CLI::App app{"Monolith Sandboxed Code Runner"};

    std::string language_name;
    std::string source_path;
    std::vector<std::string> libraries;
    bool profile = true;
    std::string image;
    std::string dockerfile;
    bool keep_template = false;
    bool commit = false;
    int setup_timeout = 120;
    int run_timeout = 60;
    std::size_t memory_mb = 0;
    std::string config_path;
    bool json_output = false;
    std::string output_path;
    bool verbose = false;

    app.add_option("language", language_name,
                   "Language: python, java, javascript, cpp, go, ruby")
        ->required();
    app.add_option("source", source_path, "Source file to run ('-' or omitted: stdin)");
    app.add_option("-l,--lib", libraries, "Library to install before running (repeatable)");
    app.add_flag("--profile,!--no-profile", profile, "Sample memory usage while running (default on)");
    auto* image_opt = app.add_option("--image", image, "Base image instead of the language default");
    auto* dockerfile_opt = app.add_option("--dockerfile", dockerfile, "Build the base image from a Dockerfile")
        ->check(CLI::ExistingFile);
    image_opt->excludes(dockerfile_opt);
    auto* keep_opt = app.add_flag("--keep-template", keep_template,
                                  "Keep a pulled or built image after the session");
    auto* commit_opt = app.add_flag("--commit", commit, "Commit the container back into the image tag");
    auto* setup_opt = app.add_option("--setup-timeout", setup_timeout, "Library setup budget in seconds")
        ->check(CLI::PositiveNumber);
    auto* run_opt = app.add_option("--run-timeout", run_timeout, "Run budget in seconds")
        ->check(CLI::PositiveNumber);
    auto* memory_opt = app.add_option("--memory", memory_mb, "Container memory limit in MB");
    app.add_option("--config", config_path, "Configuration file (JSON)");
    app.add_flag("--json", json_output, "Print the result payload as JSON");
    app.add_option("-o,--output", output_path, "Also write the JSON payload to a file");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");

    CLI11_PARSE(app, argc, argv);

    // Logs go to stderr so stdout carries only the program result
    spdlog::set_default_logger(spdlog::stderr_color_mt("monolith"));
    if (verbose) {
        spdlog::set_level(spdlog::level::debug);
        spdlog::debug("[DEBUG] Verbose logging enabled");
    } else {
        spdlog::set_level(spdlog::level::info);
    }
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    if (!json_output) {
        PrintBanner();
    }

    try {
        core::ServiceConfig config;
        auto resolved_config = core::ResolveConfigPath(config_path);
        if (!resolved_config.empty()) {
            config = core::LoadServiceConfig(resolved_config, config);
            spdlog::info("[CONFIG] Loaded {}", resolved_config.string());
        }

        // Command-line flags override the configuration file
        auto& session = config.session_defaults;
        if (verbose) session.verbose = true;
        if (image_opt->count() > 0) session.image.image = image;
        if (dockerfile_opt->count() > 0) session.image.dockerfile = dockerfile;
        if (keep_opt->count() > 0) session.retention.keep_template = keep_template;
        if (commit_opt->count() > 0) session.retention.commit_on_close = commit;
        if (setup_opt->count() > 0) config.setup_timeout = std::chrono::seconds(setup_timeout);
        if (run_opt->count() > 0) config.run_timeout = std::chrono::seconds(run_timeout);
        if (memory_opt->count() > 0) session.environment.limits.memory_mb = memory_mb;

        core::ExecutionRequest request;
        request.language = core::ParseLanguage(language_name);
        request.code = ReadSource(source_path);
        request.libraries = libraries;
        request.profile = profile;

        spdlog::info("[INIT] Connecting to container runtime...");
        auto backend = std::make_shared<core::DockerBackend>();

        core::ExecutionService service(config, backend, [](double fraction, const std::string& text) {
            spdlog::info("[{:3.0f}%] {}", fraction * 100.0, text);
        });

        spdlog::info("━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━");
        spdlog::info("[START] Running {} code", core::ToString(request.language));
        auto report = service.Execute(request);
        spdlog::info("━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━");

        reporters::JsonReporter json_reporter;
        if (!output_path.empty() && !json_reporter.WriteReport(report, output_path)) {
            spdlog::warn("[WARN] Failed to write JSON report");
        }

        if (json_output) {
            std::cout << json_reporter.GenerateJsonString(report) << std::endl;
        } else {
            PrintConsoleSummary(report);
        }

        // "failed" only says the program wrote to stderr; anything else is a session failure
        if (report.HasError() && report.error != "failed") {
            return 1;
        }
        return report.exit_code == 0 ? 0 : 2;
    } catch (const core::SandboxError& e) {
        spdlog::error("[ERROR] {}", e.what());
        return 1;
    } catch (const std::filesystem::filesystem_error& e) {
        spdlog::error("[ERROR] Filesystem error: {}", e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("[ERROR] Fatal error: {}", e.what());
        return 1;
    }
}
