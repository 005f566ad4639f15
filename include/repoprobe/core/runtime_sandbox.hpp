/**
 * @file runtime_sandbox.hpp
 * @brief Single entry point of the runtime sandbox
 *
 * Composes Dockerfile provisioning and the sandbox runner. This is the only
 * call external pipelines need.
 *
 * @date 2025
 */

#pragma once

#include "repoprobe/core/sandbox_types.hpp"
#include "repoprobe/core/sandbox_config.hpp"
#include "repoprobe/core/artifact_provisioner.hpp"
#include "repoprobe/core/sandbox_runner.hpp"
#include "repoprobe/utils/command_runner.hpp"

#include <memory>

namespace repoprobe {
namespace core {

/**
 * @class RuntimeSandbox
 * @brief Provision, then run, one repository
 *
 * **Usage Example**:
 * @code
 * RuntimeSandbox sandbox(SandboxBuilder().Build());
 *
 * SandboxRequest request;
 * request.repo_root = "/tmp/checkout";
 * request.context = {"Python", "python app.py"};
 *
 * auto result = sandbox.Analyze(request);
 * reporters::JsonReporter().GenerateReport(result, "result.json");
 * @endcode
 */
class RuntimeSandbox {
public:
    /// Uses a ProcessRunner for docker commands
    explicit RuntimeSandbox(SandboxConfig config);

    RuntimeSandbox(SandboxConfig config,
                   std::shared_ptr<utils::ICommandRunner> command_runner);

    /**
     * @brief Analyze one repository
     *
     * Never throws. Provisioning errors are logged and recorded as the
     * Dockerfile source; the build is attempted regardless.
     */
    SandboxResult Analyze(const SandboxRequest& request);

    /// Outcome of the most recent provisioning step
    const ProvisionResult& GetLastProvision() const { return last_provision_; }

    const SandboxRunner& GetRunner() const { return runner_; }

private:
    ArtifactProvisioner provisioner_;
    SandboxRunner runner_;
    ProvisionResult last_provision_;
};

} // namespace core
} // namespace repoprobe
