/**
 * @file artifact_provisioner.hpp
 * @brief Ensures a buildable Dockerfile exists in the repository root
 *
 * An existing Dockerfile is always used as is. Otherwise a minimal one is
 * rendered from the language template and written next to the sources. The
 * start instruction is untrusted free text and is sanitized before it is
 * embedded in the CMD line.
 *
 * @date 2025
 */

#pragma once

#include "repoprobe/core/sandbox_types.hpp"

#include <string>
#include <filesystem>

namespace repoprobe {
namespace core {

/// Command used when sanitization leaves nothing runnable
inline constexpr const char* kNoStartCommand = "echo 'No start command determined'";

/**
 * @class ArtifactProvisioner
 * @brief Dockerfile provisioning for one repository
 *
 * **Sanitization pipeline** (start instruction):
 * ```
 * "npm start (runs: node index.js)"
 *   1. cut at first '('        -> "npm start "
 *   2. cut at first line break
 *   3. trim, strip surrounding quote characters
 *   -> "npm start"
 *   4. escape \ and "          -> CMD ["/bin/sh", "-c", "npm start"]
 * ```
 *
 * **Usage Example**:
 * @code
 * ArtifactProvisioner provisioner;
 * auto provision = provisioner.Provision("/tmp/repo", {"Node.js", "npm start"});
 * if (provision.source == DockerfileSource::ERROR) {
 *     spdlog::warn("Provisioning failed: {}", *provision.error);
 * }
 * @endcode
 */
class ArtifactProvisioner {
public:
    /**
     * @brief Use or generate <repo_root>/Dockerfile
     *
     * Never throws. Write failures are reported as DockerfileSource::ERROR
     * and the caller proceeds with the build anyway.
     */
    ProvisionResult Provision(const std::filesystem::path& repo_root,
                              const InferredContext& context) const;

    /**
     * @brief Reduce free text to a single shell command line
     *
     * Steps 1-3 of the pipeline; idempotent. May return an empty string.
     */
    static std::string SanitizeStartCommand(const std::string& instruction);

    /**
     * @brief Exec-form CMD array for a sanitized command
     *
     * Empty input is replaced by kNoStartCommand.
     */
    static std::string RenderExecForm(const std::string& sanitized_command);

    /// Full Dockerfile text for a language family and raw start instruction
    static std::string RenderDockerfile(Language language,
                                        const std::string& start_instruction);
};

} // namespace core
} // namespace repoprobe
