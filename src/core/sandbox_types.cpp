#include "repoprobe/core/sandbox_types.hpp"
#include "repoprobe/utils/string_utils.hpp"

#include <array>
#include <utility>

namespace repoprobe {
namespace core {

namespace {

const std::array<std::pair<Classification, const char*>, 10> kClassificationNames = {{
    {Classification::UNKNOWN, "unknown"},
    {Classification::BUILD_FAILURE, "build_failure"},
    {Classification::CRASHED_ON_START, "crashed_on_start"},
    {Classification::UNHEALTHY_RUNTIME_ERRORS, "unhealthy_runtime_errors"},
    {Classification::RUNNING_PORT_MISMATCH, "running_port_mismatch"},
    {Classification::HEALTHY_VERIFIED_PORT, "healthy_verified_port"},
    {Classification::RUNNING_BLIND_PORTS, "running_blind_ports"},
    {Classification::RUNNING_NO_PORT_DETECTED, "running_no_port_detected"},
    {Classification::EXITED_CLEANLY, "exited_cleanly"},
    {Classification::SYSTEM_ERROR, "system_error"},
}};

const std::array<std::pair<Severity, const char*>, 4> kSeverityNames = {{
    {Severity::OK, "ok"},
    {Severity::WARNING, "warning"},
    {Severity::CRITICAL, "critical"},
    {Severity::UNKNOWN, "unknown"},
}};

} // anonymous namespace

std::string ToString(DockerfileSource source) {
    switch (source) {
        case DockerfileSource::EXISTING: return "existing";
        case DockerfileSource::GENERATED: return "generated";
        case DockerfileSource::ERROR: return "error";
    }
    return "error";
}

std::string ToString(Severity severity) {
    for (const auto& [value, name] : kSeverityNames) {
        if (value == severity) return name;
    }
    return "unknown";
}

std::string ToString(Classification classification) {
    for (const auto& [value, name] : kClassificationNames) {
        if (value == classification) return name;
    }
    return "unknown";
}

std::string ToString(Language language) {
    switch (language) {
        case Language::PYTHON: return "python";
        case Language::NODE: return "node";
        case Language::GENERIC: return "generic";
    }
    return "generic";
}

std::optional<Classification> ParseClassification(const std::string& value) {
    for (const auto& [classification, name] : kClassificationNames) {
        if (value == name) return classification;
    }
    return std::nullopt;
}

std::optional<Severity> ParseSeverity(const std::string& value) {
    for (const auto& [severity, name] : kSeverityNames) {
        if (value == name) return severity;
    }
    return std::nullopt;
}

Language DetectLanguage(const std::string& language_hint) {
    using utils::StringUtils;

    const std::string hint = StringUtils::ToLower(language_hint);

    if (StringUtils::Contains(hint, "python")) {
        return Language::PYTHON;
    }
    if (StringUtils::Contains(hint, "node") ||
        StringUtils::Contains(hint, "javascript") ||
        StringUtils::Contains(hint, "typescript")) {
        return Language::NODE;
    }
    return Language::GENERIC;
}

} // namespace core
} // namespace repoprobe
