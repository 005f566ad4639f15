/**
 * @file sandbox_runner.cpp
 * @brief Sandbox run orchestration with guaranteed teardown
 *
 * **Execution Flow**:
 * 1. Acquire the container client (daemon probe)
 * 2. Build the ephemeral image
 * 3. Start one capped container with the mock environment
 * 4. Warm up, then inspect state and collect logs
 * 5. Analyze logs and classify health
 * 6. Reclaim container and image (RAII, runs on every exit path)
 *
 * @date 2025
 */

#include "repoprobe/core/sandbox_runner.hpp"
#include "repoprobe/analyzers/health_classifier.hpp"
#include "repoprobe/utils/hash_utils.hpp"
#include "repoprobe/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <stdexcept>
#include <thread>

#include <unistd.h>

namespace repoprobe {
namespace core {

using utils::ContainerClient;
using utils::HashUtils;
using utils::StringUtils;

namespace {

std::atomic<unsigned long long> g_tag_counter{0};

/**
 * @brief Scoped owner of the docker resources of one run
 *
 * Stops and removes the container (if one was started or attempted) and
 * force-removes the image (if one was built) when it goes out of scope.
 * Failures are logged and never propagate.
 */
class ReclaimGuard {
public:
    ReclaimGuard(ContainerClient& client, const SandboxConfig& config, std::string image_tag)
        : client_(client)
        , config_(config)
        , image_tag_(std::move(image_tag)) {}

    ~ReclaimGuard() {
        try {
            Reclaim();
        }
        catch (const std::exception& e) {
            spdlog::warn("Reclamation error: {}", e.what());
        }
    }

    ReclaimGuard(const ReclaimGuard&) = delete;
    ReclaimGuard& operator=(const ReclaimGuard&) = delete;

    void TrackImage() { image_owned_ = true; }
    void TrackContainer(const std::string& ref) { container_ref_ = ref; }

private:
    ContainerClient& client_;
    const SandboxConfig& config_;
    std::string image_tag_;
    std::string container_ref_;
    bool image_owned_{false};

    void Reclaim() {
        if (!image_owned_ && container_ref_.empty()) {
            return;
        }

        spdlog::info("═══════════════════════════════════════════════════════════════");
        spdlog::info("TEARDOWN");
        spdlog::info("═══════════════════════════════════════════════════════════════");

        if (config_.keep_artifacts) {
            spdlog::warn("keep_artifacts set: leaving image {} and container {}",
                         image_tag_, container_ref_.empty() ? "(none)" : container_ref_);
            return;
        }

        if (!container_ref_.empty()) {
            if (!client_.StopContainer(container_ref_, config_.stop_grace)) {
                spdlog::debug("Stop failed for {}, forcing removal", container_ref_);
            }
            if (client_.RemoveContainer(container_ref_, true)) {
                spdlog::info("✓ Container removed");
            }
        }

        if (image_owned_ && client_.RemoveImage(image_tag_, true)) {
            spdlog::info("✓ Image removed: {}", image_tag_);
        }

        if (config_.verify_cleanup) {
            auto images = client_.ListImages(image_tag_);
            auto containers = client_.ListContainersByLabel(image_tag_);
            if (!images.empty() || !containers.empty()) {
                spdlog::warn("Leftovers after teardown: {} image(s), {} container(s)",
                             images.size(), containers.size());
            } else {
                spdlog::debug("Teardown verified: no leftovers for {}", image_tag_);
            }
        }
    }
};

} // anonymous namespace

std::string ToString(RunnerState state) {
    switch (state) {
        case RunnerState::INIT: return "init";
        case RunnerState::BUILDING: return "building";
        case RunnerState::BUILD_FAILED: return "build_failed";
        case RunnerState::BUILT: return "built";
        case RunnerState::STARTING: return "starting";
        case RunnerState::START_FAILED: return "start_failed";
        case RunnerState::RUNNING: return "running";
        case RunnerState::OBSERVED: return "observed";
        case RunnerState::CLASSIFIED: return "classified";
        case RunnerState::SYSTEM_ERROR: return "system_error";
        default: return "unknown";
    }
}

// ============================================================================
// CONSTRUCTOR / DESTRUCTOR
// ============================================================================

SandboxRunner::SandboxRunner(SandboxConfig config,
                             std::shared_ptr<utils::ICommandRunner> command_runner)
    : config_(std::move(config))
    , command_runner_(std::move(command_runner)) {

    if (!command_runner_) {
        throw std::invalid_argument("SandboxRunner requires a command runner");
    }
    ValidateConfig(config_);
}

SandboxRunner::~SandboxRunner() = default;

std::string SandboxRunner::GenerateImageTag() const {
    const auto counter = g_tag_counter.fetch_add(1);
    return config_.image_tag_prefix + "-" + std::to_string(getpid()) + "-" +
           std::to_string(counter) + "-" + HashUtils::RandomHex(4);
}

// ============================================================================
// RUN
// ============================================================================

SandboxResult SandboxRunner::Run(const std::filesystem::path& repo_root,
                                 const InferredContext& context) {
    SandboxResult result;
    state_ = RunnerState::INIT;

    for (const auto& entry : config_.mock_environment) {
        result.env_injected.push_back(entry.first);
    }

    spdlog::info("═══════════════════════════════════════════════════════════════");
    spdlog::info("RUNTIME SANDBOX");
    spdlog::info("═══════════════════════════════════════════════════════════════");
    spdlog::info("Repository: {}", repo_root.string());
    spdlog::info("Language hint: {}", context.language.empty() ? "(none)" : context.language);
    spdlog::info("Limits: {} CPU, {} memory, {}s warm-up ({})",
                 config_.cpu_fraction, config_.memory_limit,
                 config_.warmup.count(), ToString(config_.readiness_mode));

    // 1. Client acquisition
    std::unique_ptr<ContainerClient> client;
    try {
        client = std::make_unique<ContainerClient>(command_runner_, MakeClientOptions());
    }
    catch (const std::exception& e) {
        state_ = RunnerState::SYSTEM_ERROR;
        result.classification = Classification::SYSTEM_ERROR;
        result.health.severity = Severity::CRITICAL;
        result.errors.push_back(std::string("Docker Client Init Failed: ") + e.what());
        spdlog::error("{}", result.errors.back());
        return result;
    }

    result.image_tag = GenerateImageTag();
    spdlog::debug("Run tag {}", result.image_tag);

    ReclaimGuard guard(*client, config_, result.image_tag);

    try {
        // 2. Build
        spdlog::info("═══════════════════════════════════════════════════════════════");
        spdlog::info("BUILD");
        spdlog::info("═══════════════════════════════════════════════════════════════");
        state_ = RunnerState::BUILDING;

        auto build = client->BuildImage(repo_root, result.image_tag);
        result.build.build_time_ms = build.duration.count();

        if (build.success || build.timed_out) {
            // A timed-out build may still be committed by the daemon
            guard.TrackImage();
        }

        if (!build.success) {
            state_ = RunnerState::BUILD_FAILED;
            if (build.timed_out) {
                result.build.build_errors.push_back(
                    "Build timed out after " + std::to_string(config_.build_timeout.count()) + "s");
            }
            auto tail = StringUtils::TailBytes(
                StringUtils::SanitizeUtf8(build.output), config_.build_error_bytes);
            if (!tail.empty()) {
                result.build.build_errors.push_back(std::move(tail));
            }
            result.classification = Classification::BUILD_FAILURE;
            result.health.severity = Severity::CRITICAL;
            result.errors.push_back("Docker build failed");
            return result;
        }

        result.build.image_built = true;
        state_ = RunnerState::BUILT;

        // 3. Start
        spdlog::info("═══════════════════════════════════════════════════════════════");
        spdlog::info("RUN");
        spdlog::info("═══════════════════════════════════════════════════════════════");
        state_ = RunnerState::STARTING;

        const auto container_config = MakeContainerConfig(result.image_tag);
        const auto run_started = std::chrono::steady_clock::now();
        auto started = client->RunDetached(container_config);

        if (!started.success) {
            state_ = RunnerState::START_FAILED;
            // docker run may leave a created container behind
            guard.TrackContainer(container_config.name);
            result.execution.status = "system_error";
            result.classification = Classification::SYSTEM_ERROR;
            result.health.severity = Severity::CRITICAL;
            result.errors.push_back("Container start failed: " + started.error);
            return result;
        }

        guard.TrackContainer(started.container_id);
        state_ = RunnerState::RUNNING;

        // 4. Warm-up & observe
        WarmUp(*client, started.container_id);

        auto info = client->InspectContainer(started.container_id);
        if (!info) {
            MarkSystemError(result, "Container inspect failed: " + started.container_id);
            return result;
        }

        result.execution.startup_time_ms =
            std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - run_started).count();

        // 5-6. Analyze & classify
        Observe(*client, started.container_id, *info, result);
        state_ = RunnerState::CLASSIFIED;

        spdlog::info("Classification: {} ({})",
                     ToString(result.classification), ToString(result.health.severity));
    }
    catch (const std::exception& e) {
        MarkSystemError(result, e.what());
    }

    return result;
}

// ============================================================================
// PRIVATE HELPERS
// ============================================================================

utils::ContainerClientOptions SandboxRunner::MakeClientOptions() const {
    utils::ContainerClientOptions options;
    options.docker_binary = config_.docker_binary;
    options.connect_timeout = config_.client_timeout;
    options.build_timeout = config_.build_timeout;
    options.command_timeout = config_.command_timeout;
    return options;
}

utils::ContainerConfig SandboxRunner::MakeContainerConfig(const std::string& image_tag) const {
    utils::ContainerConfig container;
    container.name = image_tag + "-ctr";
    container.image = image_tag;
    container.cpu_limit = config_.cpu_fraction;
    container.memory_limit = config_.memory_limit;
    container.pids_limit = config_.pids_limit;
    container.publish_all_ports = true;
    container.labels[MakeClientOptions().run_label_key] = image_tag;
    for (const auto& [name, value] : config_.mock_environment) {
        container.environment_vars[name] = value;
    }
    return container;
}

void SandboxRunner::WarmUp(ContainerClient& client, const std::string& container_id) const {
    const auto window = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::min(config_.warmup, config_.execution_timeout));

    spdlog::info("Warming up for up to {} ms ({})", window.count(),
                 ToString(config_.readiness_mode));

    if (config_.readiness_mode == ReadinessMode::FIXED) {
        std::this_thread::sleep_for(window);
        return;
    }

    const auto deadline = std::chrono::steady_clock::now() + window;
    while (true) {
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            return;
        }
        std::this_thread::sleep_for(std::min(remaining, config_.poll_interval));

        auto probe = client.InspectContainer(container_id);
        if (probe && !probe->running) {
            spdlog::info("Container exited during warm-up (status {})", probe->status);
            return;
        }
    }
}

void SandboxRunner::Observe(ContainerClient& client,
                            const std::string& container_id,
                            const utils::ContainerInfo& info,
                            SandboxResult& result) {
    result.execution.status = info.status;
    result.execution.exit_code = info.exit_code;

    std::string raw_logs;
    if (auto logs = client.GetContainerLogs(container_id)) {
        raw_logs = std::move(*logs);
    } else {
        spdlog::warn("Container logs unavailable; classifying without them");
    }

    result.execution.stdout_log = StringUtils::TruncateUtf8(
        StringUtils::SanitizeUtf8(raw_logs), config_.log_capture_chars);
    state_ = RunnerState::OBSERVED;

    const auto analysis = log_analyzer_.Analyze(raw_logs);

    result.health.process_alive = info.running;
    result.health.detected_app_port = analysis.detected_port;
    result.health.docker_exposed_ports = info.exposed_ports;
    result.health.port_opened = !info.exposed_ports.empty();

    analyzers::ClassifierInput input;
    input.exit_code = info.exit_code;
    input.is_running = info.running;
    input.findings = analysis.findings;
    input.detected_port = analysis.detected_port;
    input.exposed_ports = info.exposed_ports;

    auto verdict = analyzers::HealthClassifier::Classify(input);
    result.classification = verdict.classification;
    result.health.severity = verdict.severity;
    result.health.port_mismatch = verdict.port_mismatch;
    result.errors.insert(result.errors.end(), verdict.errors.begin(), verdict.errors.end());

    spdlog::info("Status: {}, exit code: {}, alive: {}",
                 info.status,
                 info.exit_code ? std::to_string(*info.exit_code) : "none",
                 info.running);
    spdlog::info("Published ports (container->host): {}",
                 ContainerClient::FormatPortMappings(info));
}

void SandboxRunner::MarkSystemError(SandboxResult& result, const std::string& message) {
    state_ = RunnerState::SYSTEM_ERROR;
    result.execution.status = "system_error";
    result.classification = Classification::SYSTEM_ERROR;
    result.health.severity = Severity::CRITICAL;
    result.errors.push_back(message);
    spdlog::error("Sandbox run failed: {}", message);
}

} // namespace core
} // namespace repoprobe
