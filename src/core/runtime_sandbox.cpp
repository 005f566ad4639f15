/**
 * @file runtime_sandbox.cpp
 * @brief Provisioner + runner composition
 *
 * @date 2025
 */

#include "repoprobe/core/runtime_sandbox.hpp"

#include <spdlog/spdlog.h>

namespace repoprobe {
namespace core {

RuntimeSandbox::RuntimeSandbox(SandboxConfig config)
    : RuntimeSandbox(std::move(config), std::make_shared<utils::ProcessRunner>()) {}

RuntimeSandbox::RuntimeSandbox(SandboxConfig config,
                               std::shared_ptr<utils::ICommandRunner> command_runner)
    : runner_(std::move(config), std::move(command_runner)) {}

SandboxResult RuntimeSandbox::Analyze(const SandboxRequest& request) {
    last_provision_ = provisioner_.Provision(request.repo_root, request.context);

    if (last_provision_.source == DockerfileSource::ERROR) {
        spdlog::warn("Dockerfile provisioning failed ({}), attempting build anyway",
                     last_provision_.error.value_or("unknown error"));
    } else if (!last_provision_.dockerfile_sha256.empty()) {
        spdlog::info("Dockerfile ({}) sha256 {}", ToString(last_provision_.source),
                     last_provision_.dockerfile_sha256.substr(0, 12));
    }

    SandboxResult result;
    try {
        result = runner_.Run(request.repo_root, request.context);
    }
    catch (const std::exception& e) {
        spdlog::error("Unexpected sandbox failure: {}", e.what());
        result = SandboxResult{};
        result.execution.status = "system_error";
        result.classification = Classification::SYSTEM_ERROR;
        result.health.severity = Severity::CRITICAL;
        result.errors.push_back(e.what());
    }

    result.dockerfile_source = last_provision_.source;
    return result;
}

} // namespace core
} // namespace repoprobe
