/**
 * @file sandbox_types.hpp
 * @brief Shared data model of the runtime sandbox
 *
 * Request, provisioning, finding, health and result records exchanged between
 * the provisioner, the runner, the analyzers and the reporters. Only
 * SandboxResult leaves the library; everything else is internal plumbing.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>

namespace repoprobe {
namespace core {

/**
 * @enum DockerfileSource
 * @brief Provenance of the Dockerfile used for the build
 */
enum class DockerfileSource {
    EXISTING,    ///< Repository ships its own Dockerfile
    GENERATED,   ///< Rendered from a language template
    ERROR        ///< Generation attempted and failed
};

/**
 * @enum Severity
 * @brief Coarse health severity attached to every result
 */
enum class Severity {
    OK,
    WARNING,
    CRITICAL,
    UNKNOWN
};

/**
 * @enum Classification
 * @brief Outcome label of one sandbox run
 *
 * UNKNOWN is only the initial value; a completed run always carries one of
 * the other labels.
 */
enum class Classification {
    UNKNOWN,
    BUILD_FAILURE,
    CRASHED_ON_START,
    UNHEALTHY_RUNTIME_ERRORS,
    RUNNING_PORT_MISMATCH,
    HEALTHY_VERIFIED_PORT,
    RUNNING_BLIND_PORTS,
    RUNNING_NO_PORT_DETECTED,
    EXITED_CLEANLY,
    SYSTEM_ERROR
};

/**
 * @enum Language
 * @brief Coarse language family used to pick a Dockerfile template
 */
enum class Language {
    PYTHON,
    NODE,
    GENERIC
};

/**
 * @struct InferredContext
 * @brief Best-effort hints produced by the external repository classifier
 *
 * Both fields are untrusted free text and may be empty.
 */
struct InferredContext {
    std::string language;            ///< e.g. "Python", "Node.js", "TypeScript"
    std::string start_instruction;   ///< e.g. "npm start (runs: node index.js)"
};

/**
 * @struct SandboxRequest
 * @brief One analysis request
 */
struct SandboxRequest {
    std::filesystem::path repo_root;  ///< Checked-out repository (caller owned)
    InferredContext context;          ///< Classifier output
};

/**
 * @struct ProvisionResult
 * @brief Outcome of Dockerfile provisioning
 */
struct ProvisionResult {
    DockerfileSource source{DockerfileSource::EXISTING};
    std::filesystem::path dockerfile_path;
    std::optional<std::string> content;   ///< Rendered template (GENERATED only)
    std::optional<std::string> error;     ///< Failure description (ERROR only)
    std::string dockerfile_sha256;        ///< Digest of the Dockerfile handed to the build (empty if unreadable)
};

/**
 * @struct LogFinding
 * @brief One labeled problem detected in container output
 */
struct LogFinding {
    std::string label;    ///< Human-readable category, e.g. "Missing Python Dependency"
    std::string detail;   ///< First matching excerpt (at most 150 characters)

    /// "[label] detail"
    std::string Render() const { return "[" + label + "] " + detail; }

    bool operator==(const LogFinding& other) const {
        return label == other.label && detail == other.detail;
    }
};

/**
 * @struct BuildInfo
 * @brief Image build section of the result
 */
struct BuildInfo {
    bool image_built{false};
    long long build_time_ms{0};
    std::vector<std::string> build_errors;
};

/**
 * @struct ExecutionInfo
 * @brief Container execution section of the result
 */
struct ExecutionInfo {
    std::string status{"pending"};     ///< Runtime status ("running", "exited", ...)
    std::optional<int> exit_code;      ///< Absent until the container was observed
    long long startup_time_ms{0};
    std::string stdout_log;            ///< Combined stdout/stderr, capped
    std::string stderr_log;            ///< Always empty: output is captured combined
};

/**
 * @struct HealthReport
 * @brief Derived health signals of one run
 */
struct HealthReport {
    bool process_alive{false};
    bool port_opened{false};
    std::optional<int> detected_app_port;
    std::vector<int> docker_exposed_ports;
    bool port_mismatch{false};
    Severity severity{Severity::UNKNOWN};
};

/**
 * @struct SandboxResult
 * @brief Complete, always well-formed output of one sandbox run
 */
struct SandboxResult {
    DockerfileSource dockerfile_source{DockerfileSource::EXISTING};
    BuildInfo build;
    ExecutionInfo execution;
    HealthReport health;
    Classification classification{Classification::UNKNOWN};
    std::vector<std::string> errors;
    std::vector<std::string> env_injected;   ///< Names only, never values
    std::string image_tag;                   ///< Ephemeral tag used for this run
};

// String conversions (wire names used by the JSON report)

std::string ToString(DockerfileSource source);
std::string ToString(Severity severity);
std::string ToString(Classification classification);
std::string ToString(Language language);

std::optional<Classification> ParseClassification(const std::string& value);
std::optional<Severity> ParseSeverity(const std::string& value);

/**
 * @brief Map free-text language hint to a template family
 *
 * Case-insensitive substring match: "python" -> PYTHON; "node", "javascript"
 * or "typescript" -> NODE; anything else -> GENERIC.
 */
Language DetectLanguage(const std::string& language_hint);

} // namespace core
} // namespace repoprobe
