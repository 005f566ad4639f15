/**
 * @file main.cpp
 * @brief repoprobe - Runtime sandbox command-line interface
 *
 * Runs one untrusted repository in a disposable, resource-capped container
 * and reports whether it starts and stays healthy. The result document is
 * written as JSON (file or stdout) next to a console summary.
 *
 * @date 2025
 */

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "repoprobe/core/runtime_sandbox.hpp"
#include "repoprobe/core/sandbox_config.hpp"
#include "repoprobe/reporters/json_reporter.hpp"

#include <iostream>
#include <string>
#include <chrono>

using repoprobe::core::Classification;
using repoprobe::core::Severity;

/*******************************************************************************
 * UI and Display Functions
 ******************************************************************************/

void PrintBanner() {
    std::cout << R"(
╔═══════════════════════════════════════════════════════════════╗
║                                                               ║
║   repoprobe  ·  runtime sandbox for untrusted repositories    ║
║                             v1.0.0                            ║
║                                                               ║
╚═══════════════════════════════════════════════════════════════╝
)" << std::endl;
}

std::string PadRight(const std::string& text, std::size_t width) {
    if (text.size() >= width) {
        return text.substr(0, width > 3 ? width - 3 : width) + (width > 3 ? "..." : "");
    }
    return text + std::string(width - text.size(), ' ');
}

std::string SeverityTag(Severity severity) {
    switch (severity) {
        case Severity::OK: return "[OK]";
        case Severity::WARNING: return "[WARNING]";
        case Severity::CRITICAL: return "[CRITICAL]";
        default: return "[UNKNOWN]";
    }
}

void PrintConsoleSummary(const repoprobe::core::SandboxResult& result) {
    constexpr std::size_t kWidth = 52;

    auto row = [&](const std::string& label, const std::string& value) {
        std::cout << "║  " << PadRight(label, 9) << PadRight(value, kWidth) << "║\n";
    };

    std::cout << "\n";
    std::cout << "╔═══════════════════════════════════════════════════════════════╗\n";
    std::cout << "║                     SANDBOX SUMMARY                           ║\n";
    std::cout << "╚═══════════════════════════════════════════════════════════════╝\n";

    row("Result:", repoprobe::core::ToString(result.classification));
    row("Health:", SeverityTag(result.health.severity));
    row("Docker:", repoprobe::core::ToString(result.dockerfile_source) + " Dockerfile, " +
                   (result.build.image_built
                        ? "built in " + std::to_string(result.build.build_time_ms) + " ms"
                        : std::string("not built")));
    row("Status:", result.execution.status +
                   (result.execution.exit_code
                        ? " (exit " + std::to_string(*result.execution.exit_code) + ")"
                        : std::string()));

    std::string ports = result.health.detected_app_port
        ? "app " + std::to_string(*result.health.detected_app_port)
        : std::string("app none");
    ports += ", exposed [";
    for (std::size_t i = 0; i < result.health.docker_exposed_ports.size(); ++i) {
        ports += (i ? ", " : "") + std::to_string(result.health.docker_exposed_ports[i]);
    }
    ports += "]";
    row("Ports:", ports);

    std::cout << "╚═══════════════════════════════════════════════════════════════╝\n";

    for (const auto& error : result.errors) {
        std::cout << "[!] " << error << "\n";
    }
    for (const auto& error : result.build.build_errors) {
        std::cout << "[build] " << error << "\n";
    }
}

/*******************************************************************************
 * Main Application Entry Point
 ******************************************************************************/

int main(int argc, char** argv) {
    CLI::App app{"repoprobe - build and run an untrusted repository in a disposable container"};

    std::string repo_path;
    std::string language;
    std::string start_cmd;
    std::string config_path;
    std::string output_path;
    int warmup_seconds = 8;
    double cpu_fraction = 0.5;
    std::string memory_limit = "512m";
    bool fixed_warmup = false;
    bool keep_artifacts = false;
    bool verify_cleanup = false;
    bool verbose = false;
    bool json_only = false;

    app.add_option("repo_path", repo_path, "Path to the checked-out repository")
        ->required()
        ->check(CLI::ExistingDirectory);

    app.add_option("-l,--language", language, "Inferred language (e.g. Python, Node.js)");
    app.add_option("-s,--start-cmd", start_cmd, "Inferred start instruction");
    app.add_option("-c,--config", config_path, "JSON sandbox configuration file")
        ->check(CLI::ExistingFile);
    app.add_option("-o,--output", output_path, "Write the JSON result to this file");

    auto* warmup_opt = app.add_option("--warmup", warmup_seconds, "Warm-up seconds before observation")
        ->check(CLI::PositiveNumber);
    auto* cpu_opt = app.add_option("--cpu", cpu_fraction, "CPU fraction for the container")
        ->check(CLI::PositiveNumber);
    auto* memory_opt = app.add_option("--memory", memory_limit, "Memory ceiling (e.g. 512m, 1g)");

    app.add_flag("--fixed-warmup", fixed_warmup, "Sleep the whole warm-up instead of polling");
    app.add_flag("--keep-artifacts", keep_artifacts,
                 "Do not remove the image and container (debugging only)");
    app.add_flag("--verify-cleanup", verify_cleanup, "List leftovers after teardown");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");
    app.add_flag("--json-only", json_only, "Print only the JSON result");

    CLI11_PARSE(app, argc, argv);

    // Keep stdout clean for the JSON document
    if (json_only) {
        spdlog::set_default_logger(spdlog::stderr_color_mt("repoprobe"));
    }

    if (verbose) {
        spdlog::set_level(spdlog::level::debug);
        spdlog::debug("[DEBUG] Verbose logging enabled");
    } else {
        spdlog::set_level(json_only ? spdlog::level::warn : spdlog::level::info);
    }
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    if (!json_only) {
        PrintBanner();
    }

    try {
        // Defaults < config file < command-line flags
        repoprobe::core::SandboxConfig base;
        if (!config_path.empty()) {
            base = repoprobe::core::LoadSandboxConfig(config_path);
            spdlog::info("[CONFIG] Loaded {}", config_path);
        }

        repoprobe::core::SandboxBuilder builder(base);
        if (warmup_opt->count() > 0) {
            builder.WithWarmup(std::chrono::seconds(warmup_seconds));
        }
        if (cpu_opt->count() > 0) {
            builder.WithCpuFraction(cpu_fraction);
        }
        if (memory_opt->count() > 0) {
            builder.WithMemoryLimit(memory_limit);
        }
        if (fixed_warmup) {
            builder.WithReadinessMode(repoprobe::core::ReadinessMode::FIXED);
        }
        if (keep_artifacts) {
            builder.KeepArtifacts();
        }
        if (verify_cleanup) {
            builder.VerifyCleanup();
        }

        auto config = builder.Build();
        if (config.keep_artifacts) {
            spdlog::warn("[WARN] keep_artifacts is enabled: image and container will NOT be removed");
        }

        repoprobe::core::SandboxRequest request;
        request.repo_root = std::filesystem::absolute(repo_path);
        request.context.language = language;
        request.context.start_instruction = start_cmd;

        repoprobe::core::RuntimeSandbox sandbox(config);
        auto result = sandbox.Analyze(request);

        repoprobe::reporters::JsonReporter reporter;

        if (!output_path.empty()) {
            if (!reporter.GenerateReport(result, output_path)) {
                spdlog::error("[ERROR] Failed to write report: {}", output_path);
                return 1;
            }
        }

        if (!json_only) {
            PrintConsoleSummary(result);
        }

        if (output_path.empty()) {
            std::cout << reporter.GenerateJsonString(result) << std::endl;
        }

        return 0;

    } catch (const std::invalid_argument& e) {
        spdlog::error("[ERROR] Invalid configuration: {}", e.what());
        return 1;
    } catch (const std::filesystem::filesystem_error& e) {
        spdlog::error("[ERROR] Filesystem error: {}", e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("[ERROR] Fatal error: {}", e.what());
        return 1;
    }
}
