/**
 * @file sandbox_runner.hpp
 * @brief Build, run, observe, classify and reclaim one untrusted repository
 *
 * The runner owns every docker resource it creates for a request. Whatever
 * happens between build and classification, the image and container are
 * removed before Run() returns (unless keep_artifacts is set for debugging).
 *
 * @date 2025
 */

#pragma once

#include "repoprobe/core/sandbox_types.hpp"
#include "repoprobe/core/sandbox_config.hpp"
#include "repoprobe/analyzers/log_analyzer.hpp"
#include "repoprobe/utils/command_runner.hpp"
#include "repoprobe/utils/container_client.hpp"

#include <string>
#include <memory>
#include <optional>
#include <filesystem>

namespace repoprobe {
namespace core {

/**
 * @enum RunnerState
 * @brief Progress of one Run() call
 */
enum class RunnerState {
    INIT,
    BUILDING,
    BUILD_FAILED,    ///< Terminal
    BUILT,
    STARTING,
    START_FAILED,    ///< Terminal
    RUNNING,
    OBSERVED,
    CLASSIFIED,      ///< Terminal
    SYSTEM_ERROR     ///< Terminal (client acquisition or unexpected failure)
};

std::string ToString(RunnerState state);

/**
 * @class SandboxRunner
 * @brief Stateful orchestrator for one analysis at a time
 *
 * **Run Lifecycle**:
 * ```
 * INIT ─▶ BUILDING ─┬─▶ BUILD_FAILED
 *                   └─▶ BUILT ─▶ STARTING ─┬─▶ START_FAILED
 *                                          └─▶ RUNNING ─▶ OBSERVED ─▶ CLASSIFIED
 *
 * every terminal state ─▶ reclaim (stop, rm, rmi)
 * ```
 *
 * **Usage Example**:
 * @code
 * SandboxRunner runner(SandboxBuilder().Build(),
 *                      std::make_shared<utils::ProcessRunner>());
 * auto result = runner.Run("/tmp/repo", {"Python", "python app.py"});
 * spdlog::info("{}", ToString(result.classification));
 * @endcode
 *
 * **Thread Safety**: NOT thread-safe. Use one runner per concurrent request;
 * image tags stay unique across runners in the same process.
 */
class SandboxRunner {
public:
    /**
     * @param config Validated sandbox configuration
     * @param command_runner Subprocess runner used for every docker call
     * @throws std::invalid_argument if command_runner is null or config is invalid
     */
    SandboxRunner(SandboxConfig config,
                  std::shared_ptr<utils::ICommandRunner> command_runner);

    ~SandboxRunner();

    SandboxRunner(const SandboxRunner&) = delete;
    SandboxRunner& operator=(const SandboxRunner&) = delete;

    /**
     * @brief Execute the full build-run-observe-classify sequence
     *
     * Never throws. Every failure is reported through the returned result.
     */
    SandboxResult Run(const std::filesystem::path& repo_root,
                      const InferredContext& context);

    /// State reached by the most recent Run()
    RunnerState GetState() const { return state_; }

    const SandboxConfig& GetConfig() const { return config_; }

    /**
     * @brief Unique image tag: <prefix>-<pid>-<counter>-<random hex>
     *
     * Unique across concurrent runs in this process (atomic counter) and
     * across processes sharing a daemon (pid plus CSPRNG suffix).
     */
    std::string GenerateImageTag() const;

private:
    SandboxConfig config_;
    std::shared_ptr<utils::ICommandRunner> command_runner_;
    analyzers::LogAnalyzer log_analyzer_;
    RunnerState state_{RunnerState::INIT};

    utils::ContainerClientOptions MakeClientOptions() const;
    utils::ContainerConfig MakeContainerConfig(const std::string& image_tag) const;

    /**
     * @brief Spend the warm-up window
     *
     * Bounded by min(warmup, execution_timeout). In POLL mode returns early
     * once the container is no longer running.
     */
    void WarmUp(utils::ContainerClient& client, const std::string& container_id) const;

    void Observe(utils::ContainerClient& client,
                 const std::string& container_id,
                 const utils::ContainerInfo& info,
                 SandboxResult& result);

    void MarkSystemError(SandboxResult& result, const std::string& message);
};

} // namespace core
} // namespace repoprobe
