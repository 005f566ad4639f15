/**
 * @file container_client.hpp
 * @brief Docker CLI client for ephemeral image and container lifecycle
 *
 * Wraps the docker command-line client: image build and removal, detached
 * container start with resource caps, state inspection, log capture, port
 * discovery, stop/remove and leftover listing. All calls go through an
 * ICommandRunner with explicit deadlines.
 *
 * @date 2025
 */

#pragma once

#include "repoprobe/utils/command_runner.hpp"

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <optional>
#include <filesystem>
#include <chrono>

namespace repoprobe {
namespace utils {

/**
 * @enum ContainerState
 * @brief Container lifecycle states as reported by docker inspect
 */
enum class ContainerState {
    CREATED,     ///< Created, never started
    RUNNING,     ///< Running (or restarting)
    PAUSED,      ///< Paused
    EXITED,      ///< Main process exited
    DEAD,        ///< Removal failed half way
    UNKNOWN      ///< Anything else
};

/**
 * @struct ContainerClientOptions
 * @brief Client-level settings
 */
struct ContainerClientOptions {
    std::string docker_binary{"docker"};                  ///< Executable looked up on PATH
    std::chrono::seconds connect_timeout{300};            ///< Daemon probe deadline
    std::chrono::seconds build_timeout{900};              ///< docker build deadline
    std::chrono::seconds command_timeout{60};             ///< Every other command
    std::string run_label_key{"repoprobe.run"};           ///< Label used to find leftovers
};

/**
 * @struct ContainerConfig
 * @brief Settings for one detached container
 */
struct ContainerConfig {
    std::string name;                                     ///< Container name
    std::string image;                                    ///< Image tag
    double cpu_limit{0.5};                                ///< Fraction of one core
    std::string memory_limit{"512m"};                     ///< docker --memory value
    int pids_limit{256};                                  ///< 0 disables the limit
    bool publish_all_ports{true};                         ///< -P
    std::map<std::string, std::string> environment_vars;  ///< -e KEY=VALUE
    std::map<std::string, std::string> labels;            ///< --label KEY=VALUE
};

/**
 * @struct ContainerInfo
 * @brief Snapshot of container state from docker inspect
 */
struct ContainerInfo {
    std::string id;
    std::string name;
    std::string status;                 ///< Raw runtime status ("running", "exited", ...)
    ContainerState state{ContainerState::UNKNOWN};
    bool running{false};
    std::optional<int> exit_code;
    std::vector<int> exposed_ports;     ///< Container-side ports with a published binding entry
    std::map<int, int> port_mappings;   ///< Container port -> first host port
};

/**
 * @struct ImageBuildResult
 * @brief Outcome of docker build
 */
struct ImageBuildResult {
    bool success{false};
    bool timed_out{false};
    std::string output;                      ///< Merged build output
    std::chrono::milliseconds duration{0};
};

/**
 * @struct ContainerStartResult
 * @brief Outcome of docker run -d
 */
struct ContainerStartResult {
    bool success{false};
    std::string container_id;
    std::string error;
};

/**
 * @class ContainerClient
 * @brief Docker lifecycle operations for one analysis run
 *
 * Construction probes the daemon (`docker version`) within the connect
 * timeout and throws std::runtime_error when it does not answer, so a live
 * ContainerClient always refers to a reachable runtime.
 *
 * **Usage Example**:
 * @code
 * ContainerClient client(std::make_shared<ProcessRunner>());
 * auto build = client.BuildImage("/tmp/repo", "repoprobe-analysis-1-ab12");
 * if (build.success) {
 *     auto started = client.RunDetached(config);
 *     auto info = client.InspectContainer(started.container_id);
 *     client.StopContainer(started.container_id, std::chrono::seconds(1));
 *     client.RemoveContainer(started.container_id, true);
 *     client.RemoveImage("repoprobe-analysis-1-ab12", true);
 * }
 * @endcode
 *
 * **Thread Safety**: Holds no mutable state beyond the shared runner;
 * concurrent runs should still use separate instances.
 */
class ContainerClient {
public:
    /**
     * @brief Connect to the container runtime
     * @param runner Subprocess runner (shared)
     * @param options Client settings
     * @throws std::runtime_error if the daemon cannot be reached
     */
    explicit ContainerClient(std::shared_ptr<ICommandRunner> runner,
                             ContainerClientOptions options = ContainerClientOptions{});

    ~ContainerClient();

    ContainerClient(const ContainerClient&) = delete;
    ContainerClient& operator=(const ContainerClient&) = delete;

    /// Server version reported during the connection probe
    const std::string& GetServerVersion() const { return server_version_; }

    /**
     * @brief Build an image from a directory
     *
     * Runs `docker build --rm --force-rm` so intermediate containers are
     * removed even when a step fails. The image is labeled with the run
     * label so leftovers can be found by VerifyReclaimed-style listings.
     */
    ImageBuildResult BuildImage(const std::filesystem::path& context_dir,
                                const std::string& tag);

    /// Start a detached container
    ContainerStartResult RunDetached(const ContainerConfig& config);

    /// Inspect container state; nullopt when inspect fails or is unparsable
    std::optional<ContainerInfo> InspectContainer(const std::string& container_id);

    /**
     * @brief Combined stdout/stderr of a container
     * @return Raw bytes as emitted by the program (may be invalid UTF-8)
     */
    std::optional<std::string> GetContainerLogs(const std::string& container_id);

    bool StopContainer(const std::string& container_id,
                       std::chrono::seconds grace = std::chrono::seconds(10));
    bool RemoveContainer(const std::string& container_id, bool force = false);
    bool RemoveImage(const std::string& tag, bool force = false);

    /// Image ids whose reference matches tag
    std::vector<std::string> ListImages(const std::string& tag);

    /// Container ids (running or not) carrying the run label value
    std::vector<std::string> ListContainersByLabel(const std::string& label_value);

    /// Build the argument vector for docker run (without the binary)
    static std::vector<std::string> BuildRunArgs(const ContainerConfig& config);

    /// Parse `docker inspect` JSON output (array or single object)
    static ContainerInfo ParseInspectOutput(const std::string& json_str);

    /// "3000->49153, 8080->49154", or "none"
    static std::string FormatPortMappings(const ContainerInfo& info);

    static ContainerState ParseState(const std::string& state_str);
    static std::string StateToString(ContainerState state);

private:
    std::shared_ptr<ICommandRunner> runner_;
    ContainerClientOptions options_;
    std::string server_version_;

    CommandResult ExecuteDockerCommand(const std::vector<std::string>& args,
                                       std::chrono::milliseconds timeout,
                                       bool merge_output = false) const;
    CommandResult ExecuteDockerCommand(const std::vector<std::string>& args) const;
    static std::vector<std::string> ParseIdList(const std::string& output);
};

} // namespace utils
} // namespace repoprobe
