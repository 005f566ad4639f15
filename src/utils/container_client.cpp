/**
 * @file container_client.cpp
 * @brief Implementation of the docker CLI client
 *
 * **Container Lifecycle** (one analysis run):
 * ```
 * build ─▶ run -d ─▶ inspect / logs ─▶ stop ─▶ rm ─▶ rmi
 * ```
 *
 * **Hardening applied to every container**:
 * - CPU quota (--cpus) and memory ceiling (--memory)
 * - Process limit (--pids-limit)
 * - Never --privileged, never host mounts
 *
 * Every docker invocation is executed through ICommandRunner with an
 * explicit deadline, so a wedged daemon cannot hang a run indefinitely.
 *
 * @date 2025
 */

#include "repoprobe/utils/container_client.hpp"
#include "repoprobe/utils/string_utils.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace repoprobe {
namespace utils {

namespace {

/// Environment values are placeholders, but never print them anyway
std::vector<std::string> MaskEnvironment(const std::vector<std::string>& args) {
    std::vector<std::string> masked = args;
    for (std::size_t i = 0; i + 1 < masked.size(); ++i) {
        if (masked[i] == "-e") {
            auto& kv = masked[i + 1];
            auto eq = kv.find('=');
            if (eq != std::string::npos) {
                kv = kv.substr(0, eq + 1) + "***";
            }
        }
    }
    return masked;
}

std::string FirstLine(const std::string& text) {
    auto lines = StringUtils::SplitLines(StringUtils::Trim(text));
    return lines.empty() ? std::string() : lines.front();
}

} // anonymous namespace

// ============================================================================
// CONSTRUCTOR / DESTRUCTOR
// ============================================================================
// Probes the daemon; a client that cannot reach it is never constructed

ContainerClient::ContainerClient(std::shared_ptr<ICommandRunner> runner,
                                 ContainerClientOptions options)
    : runner_(std::move(runner))
    , options_(std::move(options)) {

    if (!runner_) {
        throw std::runtime_error("Container client requires a command runner");
    }

    spdlog::debug("Connecting to container runtime ({}, timeout {}s)",
                  options_.docker_binary, options_.connect_timeout.count());

    auto result = ExecuteDockerCommand(
        {"version", "--format", "{{.Server.Version}}"},
        std::chrono::duration_cast<std::chrono::milliseconds>(options_.connect_timeout));

    if (!result.success) {
        std::string reason = result.timed_out
            ? "daemon did not respond within " + std::to_string(options_.connect_timeout.count()) + "s"
            : FirstLine(result.stderr_output.empty() ? result.stdout_output : result.stderr_output);
        if (reason.empty()) {
            reason = "docker exited with code " + std::to_string(result.exit_code);
        }
        spdlog::error("Container runtime not available: {}", reason);
        throw std::runtime_error(reason);
    }

    server_version_ = StringUtils::Trim(result.stdout_output);
    spdlog::info("Container runtime connected (server {})", server_version_);
}

ContainerClient::~ContainerClient() {
    spdlog::debug("Container client released");
}

// ============================================================================
// IMAGE OPERATIONS
// ============================================================================

ImageBuildResult ContainerClient::BuildImage(const std::filesystem::path& context_dir,
                                             const std::string& tag) {
    spdlog::info("Building image {} from {}", tag, context_dir.string());

    ImageBuildResult build;

    auto result = ExecuteDockerCommand(
        {"build", "--rm", "--force-rm",
         "--label", options_.run_label_key + "=" + tag,
         "-t", tag,
         context_dir.string()},
        std::chrono::duration_cast<std::chrono::milliseconds>(options_.build_timeout),
        true);

    build.success = result.success;
    build.timed_out = result.timed_out;
    build.output = result.stdout_output;
    build.duration = result.duration;

    if (build.success) {
        spdlog::info("Image built in {} ms", build.duration.count());
    } else if (build.timed_out) {
        spdlog::error("Image build timed out after {}s", options_.build_timeout.count());
    } else {
        spdlog::error("Image build failed (exit code {})", result.exit_code);
    }

    return build;
}

bool ContainerClient::RemoveImage(const std::string& tag, bool force) {
    spdlog::debug("Removing image: {} (force: {})", tag, force);

    std::vector<std::string> args = {"rmi"};
    if (force) {
        args.push_back("--force");
    }
    args.push_back(tag);

    auto result = ExecuteDockerCommand(args);
    if (!result.success) {
        spdlog::warn("Failed to remove image {}: {}", tag, FirstLine(result.stderr_output));
    }
    return result.success;
}

std::vector<std::string> ContainerClient::ListImages(const std::string& tag) {
    auto result = ExecuteDockerCommand(
        {"images", "--quiet", "--filter", "reference=" + tag});

    if (!result.success) {
        spdlog::warn("Failed to list images: {}", FirstLine(result.stderr_output));
        return {};
    }
    return ParseIdList(result.stdout_output);
}

// ============================================================================
// CONTAINER LIFECYCLE
// ============================================================================

ContainerStartResult ContainerClient::RunDetached(const ContainerConfig& config) {
    ContainerStartResult started;

    if (config.image.empty()) {
        started.error = "Container image not specified";
        spdlog::error("{}", started.error);
        return started;
    }

    auto args = BuildRunArgs(config);
    spdlog::debug("docker {}", FormatCommand(MaskEnvironment(args)));

    auto result = ExecuteDockerCommand(args);

    if (!result.success) {
        started.error = result.timed_out
            ? "docker run timed out"
            : StringUtils::Trim(result.stderr_output);
        if (started.error.empty()) {
            started.error = "docker run exited with code " + std::to_string(result.exit_code);
        }
        spdlog::error("Failed to start container: {}", started.error);
        return started;
    }

    started.container_id = FirstLine(result.stdout_output);
    started.success = !started.container_id.empty();
    if (!started.success) {
        started.error = "docker run returned no container id";
        spdlog::error("{}", started.error);
    } else {
        spdlog::info("Container started: {}", started.container_id.substr(0, 12));
    }
    return started;
}

std::optional<ContainerInfo> ContainerClient::InspectContainer(const std::string& container_id) {
    auto result = ExecuteDockerCommand({"inspect", container_id});

    if (!result.success) {
        spdlog::error("Failed to inspect container {}: {}",
                      container_id, FirstLine(result.stderr_output));
        return std::nullopt;
    }

    try {
        return ParseInspectOutput(result.stdout_output);
    }
    catch (const std::exception& e) {
        spdlog::error("Failed to parse inspect output: {}", e.what());
    }

    return std::nullopt;
}

std::optional<std::string> ContainerClient::GetContainerLogs(const std::string& container_id) {
    auto result = ExecuteDockerCommand(
        {"logs", container_id},
        std::chrono::duration_cast<std::chrono::milliseconds>(options_.command_timeout),
        true);

    if (result.timed_out || result.exit_code != 0) {
        spdlog::warn("Failed to read logs of {}", container_id);
        return std::nullopt;
    }
    return result.stdout_output;
}

bool ContainerClient::StopContainer(const std::string& container_id,
                                    std::chrono::seconds grace) {
    spdlog::debug("Stopping container: {} (grace: {}s)", container_id, grace.count());

    auto result = ExecuteDockerCommand({
        "stop", "--time", std::to_string(grace.count()), container_id});

    if (!result.success) {
        spdlog::warn("Failed to stop container {}: {}",
                     container_id, FirstLine(result.stderr_output));
    }
    return result.success;
}

bool ContainerClient::RemoveContainer(const std::string& container_id, bool force) {
    spdlog::debug("Removing container: {} (force: {})", container_id, force);

    std::vector<std::string> args = {"rm"};
    if (force) {
        args.push_back("--force");
    }
    args.push_back(container_id);

    auto result = ExecuteDockerCommand(args);
    if (!result.success) {
        spdlog::warn("Failed to remove container {}: {}",
                     container_id, FirstLine(result.stderr_output));
    }
    return result.success;
}

std::vector<std::string> ContainerClient::ListContainersByLabel(const std::string& label_value) {
    auto result = ExecuteDockerCommand(
        {"ps", "--all", "--quiet", "--filter",
         "label=" + options_.run_label_key + "=" + label_value});

    if (!result.success) {
        spdlog::warn("Failed to list containers: {}", FirstLine(result.stderr_output));
        return {};
    }
    return ParseIdList(result.stdout_output);
}

// ============================================================================
// COMMAND CONSTRUCTION AND PARSING
// ============================================================================

std::vector<std::string> ContainerClient::BuildRunArgs(const ContainerConfig& config) {
    std::vector<std::string> args;

    args.push_back("run");
    args.push_back("-d");

    if (!config.name.empty()) {
        args.push_back("--name");
        args.push_back(config.name);
    }

    for (const auto& [key, value] : config.labels) {
        args.push_back("--label");
        args.push_back(key + "=" + value);
    }

    if (config.cpu_limit > 0.0) {
        std::ostringstream cpus;
        cpus << config.cpu_limit;
        args.push_back("--cpus");
        args.push_back(cpus.str());
    }

    if (!config.memory_limit.empty()) {
        args.push_back("--memory");
        args.push_back(config.memory_limit);
    }

    if (config.pids_limit > 0) {
        args.push_back("--pids-limit");
        args.push_back(std::to_string(config.pids_limit));
    }

    if (config.publish_all_ports) {
        args.push_back("--publish-all");
    }

    for (const auto& [key, value] : config.environment_vars) {
        args.push_back("-e");
        args.push_back(key + "=" + value);
    }

    // Image must be last; the image's own CMD is used
    args.push_back(config.image);

    return args;
}

ContainerInfo ContainerClient::ParseInspectOutput(const std::string& json_str) {
    json j = json::parse(json_str);

    // docker inspect returns an array with a single object
    if (j.is_array()) {
        if (j.empty()) {
            throw std::runtime_error("empty inspect output");
        }
        j = j[0];
    }

    ContainerInfo info;
    info.id = j.value("Id", "");
    info.name = j.value("Name", "");
    if (!info.name.empty() && info.name.front() == '/') {
        info.name.erase(0, 1);
    }

    if (j.contains("State") && j["State"].is_object()) {
        const auto& state = j["State"];
        info.status = state.value("Status", "");
        info.state = ParseState(info.status);
        info.running = state.value("Running", false);
        if (state.contains("ExitCode") && state["ExitCode"].is_number_integer()) {
            info.exit_code = state["ExitCode"].get<int>();
        }
    }

    if (j.contains("NetworkSettings") && j["NetworkSettings"].is_object()) {
        const auto& network = j["NetworkSettings"];
        if (network.contains("Ports") && network["Ports"].is_object()) {
            for (const auto& [port_spec, bindings] : network["Ports"].items()) {
                // "3000/tcp"
                int container_port = 0;
                try {
                    container_port = std::stoi(port_spec.substr(0, port_spec.find('/')));
                }
                catch (const std::exception&) {
                    spdlog::debug("Ignoring unparsable port spec: {}", port_spec);
                    continue;
                }

                if (std::find(info.exposed_ports.begin(), info.exposed_ports.end(),
                              container_port) == info.exposed_ports.end()) {
                    info.exposed_ports.push_back(container_port);
                }

                if (bindings.is_array() && !bindings.empty() && bindings[0].is_object()) {
                    const std::string host_port = bindings[0].value("HostPort", "");
                    try {
                        if (!host_port.empty() && !info.port_mappings.count(container_port)) {
                            info.port_mappings[container_port] = std::stoi(host_port);
                        }
                    }
                    catch (const std::exception&) {
                        spdlog::debug("Ignoring unparsable host port: {}", host_port);
                    }
                }
            }
        }
    }

    std::sort(info.exposed_ports.begin(), info.exposed_ports.end());
    return info;
}

std::string ContainerClient::FormatPortMappings(const ContainerInfo& info) {
    if (info.port_mappings.empty()) {
        return "none";
    }
    std::string out;
    for (const auto& [container_port, host_port] : info.port_mappings) {
        if (!out.empty()) {
            out += ", ";
        }
        out += std::to_string(container_port) + "->" + std::to_string(host_port);
    }
    return out;
}

ContainerState ContainerClient::ParseState(const std::string& state_str) {
    if (state_str == "created") return ContainerState::CREATED;
    if (state_str == "running") return ContainerState::RUNNING;
    if (state_str == "restarting") return ContainerState::RUNNING;
    if (state_str == "paused") return ContainerState::PAUSED;
    if (state_str == "exited") return ContainerState::EXITED;
    if (state_str == "dead") return ContainerState::DEAD;
    return ContainerState::UNKNOWN;
}

std::string ContainerClient::StateToString(ContainerState state) {
    switch (state) {
        case ContainerState::CREATED: return "created";
        case ContainerState::RUNNING: return "running";
        case ContainerState::PAUSED: return "paused";
        case ContainerState::EXITED: return "exited";
        case ContainerState::DEAD: return "dead";
        default: return "unknown";
    }
}

std::vector<std::string> ContainerClient::ParseIdList(const std::string& output) {
    std::vector<std::string> ids;
    for (const auto& line : StringUtils::SplitLines(output)) {
        auto id = StringUtils::Trim(line);
        if (!id.empty()) {
            ids.push_back(id);
        }
    }
    return ids;
}

// ============================================================================
// PRIVATE HELPERS
// ============================================================================

CommandResult ContainerClient::ExecuteDockerCommand(const std::vector<std::string>& args,
                                                    std::chrono::milliseconds timeout,
                                                    bool merge_output) const {
    std::vector<std::string> argv;
    argv.reserve(args.size() + 1);
    argv.push_back(options_.docker_binary);
    argv.insert(argv.end(), args.begin(), args.end());

    CommandOptions command_options;
    command_options.timeout = timeout;
    command_options.merge_output = merge_output;

    return runner_->Run(argv, command_options);
}

CommandResult ContainerClient::ExecuteDockerCommand(const std::vector<std::string>& args) const {
    return ExecuteDockerCommand(
        args, std::chrono::duration_cast<std::chrono::milliseconds>(options_.command_timeout));
}

} // namespace utils
} // namespace repoprobe
