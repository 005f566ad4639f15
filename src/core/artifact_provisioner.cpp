/**
 * @file artifact_provisioner.cpp
 * @brief Dockerfile detection, template rendering and start-command sanitization
 *
 * @date 2025
 */

#include "repoprobe/core/artifact_provisioner.hpp"
#include "repoprobe/core/dockerfile_templates.hpp"
#include "repoprobe/utils/hash_utils.hpp"
#include "repoprobe/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <sstream>
#include <system_error>

namespace repoprobe {
namespace core {

using utils::StringUtils;

namespace {

bool IsQuote(char c) {
    return c == '"' || c == '\'';
}

/**
 * @brief Peel wrapper quotes until nothing changes
 *
 * A matching pair is removed, and so is a lone quote at either end whose
 * character occurs nowhere else (the other half was cut off). Quotes that
 * belong to the command, as in `echo "hi"`, are kept.
 */
std::string StripWrapperQuotes(std::string cmd) {
    while (true) {
        cmd = StringUtils::Trim(cmd);
        if (cmd.empty()) {
            return cmd;
        }

        const char front = cmd.front();
        const char back = cmd.back();

        if (cmd.size() >= 2 && IsQuote(front) && front == back) {
            cmd = cmd.substr(1, cmd.size() - 2);
        } else if (IsQuote(front) && std::count(cmd.begin(), cmd.end(), front) == 1) {
            cmd.erase(0, 1);
        } else if (IsQuote(back) && std::count(cmd.begin(), cmd.end(), back) == 1) {
            cmd.pop_back();
        } else {
            return cmd;
        }
    }
}

} // anonymous namespace

// ============================================================================
// SANITIZATION
// ============================================================================

std::string ArtifactProvisioner::SanitizeStartCommand(const std::string& instruction) {
    std::string cmd = instruction;

    auto paren = cmd.find('(');
    if (paren != std::string::npos) {
        cmd.erase(paren);
    }

    auto newline = cmd.find_first_of("\r\n");
    if (newline != std::string::npos) {
        cmd.erase(newline);
    }

    return StripWrapperQuotes(cmd);
}

std::string ArtifactProvisioner::RenderExecForm(const std::string& sanitized_command) {
    std::string cmd = sanitized_command.empty() ? std::string(kNoStartCommand)
                                                : sanitized_command;

    std::string escaped;
    escaped.reserve(cmd.size() + 8);
    for (char c : cmd) {
        if (c == '\\' || c == '"') {
            escaped.push_back('\\');
        }
        escaped.push_back(c);
    }

    return "[\"/bin/sh\", \"-c\", \"" + escaped + "\"]";
}

std::string ArtifactProvisioner::RenderDockerfile(Language language,
                                                  const std::string& start_instruction) {
    const auto& tmpl = GetDockerfileTemplate(language);
    const auto cmd = RenderExecForm(SanitizeStartCommand(start_instruction));
    return StringUtils::ReplaceAll(tmpl.body, kStartCommandPlaceholder, cmd);
}

// ============================================================================
// PROVISIONING
// ============================================================================

namespace {

std::string Fingerprint(const std::string& dockerfile) {
    try {
        return utils::HashUtils::ComputeSHA256(dockerfile);
    }
    catch (const std::exception& e) {
        spdlog::debug("Dockerfile fingerprint unavailable: {}", e.what());
        return "";
    }
}

} // anonymous namespace

ProvisionResult ArtifactProvisioner::Provision(const std::filesystem::path& repo_root,
                                               const InferredContext& context) const {
    ProvisionResult result;
    result.dockerfile_path = repo_root / "Dockerfile";

    std::error_code ec;
    if (std::filesystem::exists(result.dockerfile_path, ec)) {
        spdlog::info("Using existing Dockerfile: {}", result.dockerfile_path.string());
        result.source = DockerfileSource::EXISTING;

        std::ifstream existing(result.dockerfile_path, std::ios::binary);
        if (existing) {
            std::stringstream buffer;
            buffer << existing.rdbuf();
            result.dockerfile_sha256 = Fingerprint(buffer.str());
        } else {
            spdlog::debug("Existing Dockerfile not readable for fingerprinting");
        }
        return result;
    }

    const Language language = DetectLanguage(context.language);
    spdlog::info("No Dockerfile found, generating {} template", ToString(language));

    std::string content;
    try {
        content = RenderDockerfile(language, context.start_instruction);
    }
    catch (const std::exception& e) {
        result.source = DockerfileSource::ERROR;
        result.error = std::string("Template rendering failed: ") + e.what();
        spdlog::warn("{}", *result.error);
        return result;
    }

    std::ofstream file(result.dockerfile_path, std::ios::binary | std::ios::trunc);
    if (!file) {
        result.source = DockerfileSource::ERROR;
        result.error = "Cannot write " + result.dockerfile_path.string();
        spdlog::warn("Failed to generate Dockerfile: {}", *result.error);
        return result;
    }

    file << content;
    file.close();
    if (!file) {
        result.source = DockerfileSource::ERROR;
        result.error = "Write error on " + result.dockerfile_path.string();
        spdlog::warn("Failed to generate Dockerfile: {}", *result.error);
        return result;
    }

    spdlog::debug("Generated Dockerfile:\n{}", content);
    result.source = DockerfileSource::GENERATED;
    result.dockerfile_sha256 = Fingerprint(content);
    result.content = std::move(content);
    return result;
}

} // namespace core
} // namespace repoprobe
