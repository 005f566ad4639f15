/**
 * @file json_reporter.cpp
 * @brief Implementation of the sandbox result JSON document
 *
 * **Document Layout**:
 * ```json
 * {
 *   "dockerfile_source": "generated",
 *   "build": {"image_built": true, "build_time_ms": 5120, "build_errors": []},
 *   "execution": {"status": "running", "exit_code": 0, "startup_time_ms": 8034,
 *                 "logs": {"stdout": "...", "stderr": ""}},
 *   "health": {"process_alive": true, "port_opened": true,
 *              "detected_app_port": 3000, "docker_exposed_ports": [3000, 8080],
 *              "port_mismatch": false, "severity": "ok"},
 *   "classification": "healthy_verified_port",
 *   "errors": [],
 *   "env_injected": ["NODE_ENV", "PORT", "..."]
 * }
 * ```
 *
 * @date 2025
 */

#include "repoprobe/reporters/json_reporter.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <fstream>
#include <system_error>

using json = nlohmann::json;

namespace repoprobe {
namespace reporters {

JsonReporter::JsonReporter(const JsonReporterConfig& config)
    : config_(config) {
    spdlog::debug("JSON Reporter initialized (pretty: {})", config_.pretty_print);
}

json JsonReporter::ToJson(const core::SandboxResult& result) const {
    json j;

    j["dockerfile_source"] = core::ToString(result.dockerfile_source);

    j["build"] = {
        {"image_built", result.build.image_built},
        {"build_time_ms", result.build.build_time_ms},
        {"build_errors", result.build.build_errors}
    };

    json execution;
    execution["status"] = result.execution.status;
    execution["exit_code"] = result.execution.exit_code
        ? json(*result.execution.exit_code) : json(nullptr);
    execution["startup_time_ms"] = result.execution.startup_time_ms;
    execution["logs"] = {
        {"stdout", result.execution.stdout_log},
        {"stderr", result.execution.stderr_log}
    };
    j["execution"] = execution;

    json health;
    health["process_alive"] = result.health.process_alive;
    health["port_opened"] = result.health.port_opened;
    health["detected_app_port"] = result.health.detected_app_port
        ? json(*result.health.detected_app_port) : json(nullptr);
    health["docker_exposed_ports"] = result.health.docker_exposed_ports;
    health["port_mismatch"] = result.health.port_mismatch;
    health["severity"] = core::ToString(result.health.severity);
    j["health"] = health;

    j["classification"] = core::ToString(result.classification);
    j["errors"] = result.errors;
    j["env_injected"] = result.env_injected;

    if (config_.include_image_tag) {
        j["image_tag"] = result.image_tag;
    }

    return j;
}

std::string JsonReporter::GenerateJsonString(const core::SandboxResult& result) const {
    const auto j = ToJson(result);
    const int indent = config_.pretty_print ? config_.indent_size : -1;
    return j.dump(indent, ' ', false, json::error_handler_t::replace);
}

bool JsonReporter::GenerateReport(const core::SandboxResult& result,
                                  const std::filesystem::path& output_path) const {
    spdlog::info("Generating JSON report: {}", output_path.string());

    const auto json_content = GenerateJsonString(result);

    if (config_.validate_json && !ValidateSyntax(json_content)) {
        spdlog::error("Generated JSON is invalid");
        return false;
    }

    if (output_path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(output_path.parent_path(), ec);
        if (ec) {
            spdlog::error("Cannot create report directory {}: {}",
                          output_path.parent_path().string(), ec.message());
            return false;
        }
    }

    if (!SaveJson(json_content, output_path)) {
        return false;
    }

    spdlog::info("[REPORT] JSON report saved: {}", output_path.string());
    return true;
}

bool JsonReporter::ValidateSyntax(const std::string& json_str) {
    try {
        (void)json::parse(json_str);
        return true;
    }
    catch (const json::parse_error& e) {
        spdlog::error("JSON validation failed: {}", e.what());
        return false;
    }
}

bool JsonReporter::SaveJson(const std::string& json_content,
                            const std::filesystem::path& output_path) {
    std::ofstream file(output_path, std::ios::binary | std::ios::trunc);
    if (!file) {
        spdlog::error("Failed to open file for writing: {}", output_path.string());
        return false;
    }

    file << json_content << '\n';
    file.close();

    if (!file) {
        spdlog::error("Failed to write JSON: {}", output_path.string());
        return false;
    }
    return true;
}

} // namespace reporters
} // namespace repoprobe
