/**
 * @file sandbox_config.hpp
 * @brief Runtime sandbox configuration, fluent builder and JSON loader
 *
 * Resource caps, warm-up policy, deadlines, the mock environment injected
 * into every container and debug switches. Defaults reproduce the standard
 * analysis profile; a JSON file and CLI flags may override them.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>
#include <utility>
#include <chrono>
#include <cstddef>
#include <filesystem>

#include <nlohmann/json_fwd.hpp>

namespace repoprobe {
namespace core {

/**
 * @enum ReadinessMode
 * @brief How the warm-up interval is spent
 */
enum class ReadinessMode {
    POLL,    ///< Check liveness every poll interval, stop early on exit
    FIXED    ///< Sleep the whole warm-up interval
};

/// Ordered NAME=VALUE pairs
using EnvironmentTable = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief Placeholder values for commonly required variables
 *
 * Lets genuine startup bugs be told apart from missing configuration.
 * Values are harmless and never reported, only the names are.
 */
EnvironmentTable DefaultMockEnvironment();

/**
 * @struct SandboxConfig
 * @brief Complete sandbox configuration
 */
struct SandboxConfig {
    // Resource Caps
    double cpu_fraction{0.5};                          ///< --cpus
    std::string memory_limit{"512m"};                  ///< --memory
    int pids_limit{256};                               ///< --pids-limit (0 disables)

    // Timing
    std::chrono::seconds warmup{8};                    ///< Observation delay after start
    std::chrono::milliseconds poll_interval{500};      ///< Liveness probe period (POLL mode)
    ReadinessMode readiness_mode{ReadinessMode::POLL};
    std::chrono::seconds execution_timeout{60};        ///< Upper bound on observation
    std::chrono::seconds client_timeout{300};          ///< Daemon connection probe
    std::chrono::seconds build_timeout{900};           ///< docker build
    std::chrono::seconds command_timeout{60};          ///< Every other docker command
    std::chrono::seconds stop_grace{1};                ///< docker stop --time

    // Output
    std::size_t log_capture_chars{15000};              ///< Retained log prefix (code points)
    std::size_t build_error_bytes{4000};               ///< Retained build output tail

    // Docker
    std::string docker_binary{"docker"};
    std::string image_tag_prefix{"repoprobe-analysis"};
    EnvironmentTable mock_environment{DefaultMockEnvironment()};

    // Debug
    bool keep_artifacts{false};                        ///< Skip reclamation (never in production)
    bool verify_cleanup{false};                        ///< List leftovers after reclamation
};

/**
 * @brief Check a configuration for out-of-range values
 * @throws std::invalid_argument describing the first offending field
 */
void ValidateConfig(const SandboxConfig& config);

/**
 * @brief True for docker memory strings such as "512m", "1g" or "268435456"
 */
bool IsValidMemoryLimit(const std::string& value);

std::string ToString(ReadinessMode mode);

/// @throws std::invalid_argument for anything but "poll" or "fixed"
ReadinessMode ParseReadinessMode(const std::string& value);

/**
 * @brief Overlay the keys present in a JSON object onto config
 *
 * Keys (all optional): cpu_fraction, memory_limit, pids_limit,
 * warmup_seconds, poll_interval_ms, readiness_mode, execution_timeout_seconds,
 * client_timeout_seconds, build_timeout_seconds, command_timeout_seconds,
 * log_capture_chars, docker_binary, image_tag_prefix, keep_artifacts,
 * verify_cleanup, mock_environment (object of NAME: VALUE, replaces the table).
 *
 * @throws std::invalid_argument on unknown keys, wrong types or invalid values
 */
void ApplyConfigJson(const nlohmann::json& j, SandboxConfig& config);

/**
 * @brief Load defaults overlaid with a JSON config file
 * @throws std::invalid_argument if the file cannot be read, parsed or validated
 */
SandboxConfig LoadSandboxConfig(const std::filesystem::path& path);

/**
 * @class SandboxBuilder
 * @brief Fluent API for constructing sandbox configurations
 *
 * **Usage Example**:
 * @code
 * auto config = SandboxBuilder()
 *     .WithCpuFraction(1.0)
 *     .WithMemoryLimit("1g")
 *     .WithWarmup(std::chrono::seconds(15))
 *     .WithReadinessMode(ReadinessMode::FIXED)
 *     .Build();
 *
 * SandboxRunner runner(config, std::make_shared<utils::ProcessRunner>());
 * @endcode
 */
class SandboxBuilder {
public:
    SandboxBuilder() = default;
    explicit SandboxBuilder(SandboxConfig base) : config_(std::move(base)) {}

    SandboxBuilder& WithCpuFraction(double fraction) {
        config_.cpu_fraction = fraction;
        return *this;
    }

    SandboxBuilder& WithMemoryLimit(const std::string& limit) {
        config_.memory_limit = limit;
        return *this;
    }

    SandboxBuilder& WithPidsLimit(int limit) {
        config_.pids_limit = limit;
        return *this;
    }

    SandboxBuilder& WithWarmup(std::chrono::seconds warmup) {
        config_.warmup = warmup;
        return *this;
    }

    SandboxBuilder& WithPollInterval(std::chrono::milliseconds interval) {
        config_.poll_interval = interval;
        return *this;
    }

    SandboxBuilder& WithReadinessMode(ReadinessMode mode) {
        config_.readiness_mode = mode;
        return *this;
    }

    SandboxBuilder& WithExecutionTimeout(std::chrono::seconds timeout) {
        config_.execution_timeout = timeout;
        return *this;
    }

    SandboxBuilder& WithClientTimeout(std::chrono::seconds timeout) {
        config_.client_timeout = timeout;
        return *this;
    }

    SandboxBuilder& WithDockerBinary(const std::string& binary) {
        config_.docker_binary = binary;
        return *this;
    }

    SandboxBuilder& WithMockEnvironment(EnvironmentTable env) {
        config_.mock_environment = std::move(env);
        return *this;
    }

    /// Keep image and container after the run (debugging only)
    SandboxBuilder& KeepArtifacts(bool keep = true) {
        config_.keep_artifacts = keep;
        return *this;
    }

    SandboxBuilder& VerifyCleanup(bool verify = true) {
        config_.verify_cleanup = verify;
        return *this;
    }

    /**
     * @brief Validate and return the configuration
     * @throws std::invalid_argument if validation fails
     */
    SandboxConfig Build() const {
        ValidateConfig(config_);
        return config_;
    }

private:
    SandboxConfig config_;
};

} // namespace core
} // namespace repoprobe
