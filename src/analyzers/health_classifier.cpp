/**
 * @file health_classifier.cpp
 * @brief Health classification decision table
 *
 * @date 2025
 */

#include "repoprobe/analyzers/health_classifier.hpp"

#include <algorithm>

namespace repoprobe {
namespace analyzers {

using core::Classification;
using core::Severity;

std::string HealthClassifier::FormatPortMismatch(int detected_port,
                                                 const std::vector<int>& exposed_ports) {
    std::string list;
    for (std::size_t i = 0; i < exposed_ports.size(); ++i) {
        if (i > 0) {
            list += ", ";
        }
        list += std::to_string(exposed_ports[i]);
    }
    return "Port Mismatch: App listens on " + std::to_string(detected_port) +
           ", but Dockerfile exposes [" + list + "]";
}

HealthVerdict HealthClassifier::Classify(const ClassifierInput& input) {
    HealthVerdict verdict;

    const bool port_listed = input.detected_port &&
        std::find(input.exposed_ports.begin(), input.exposed_ports.end(),
                  *input.detected_port) != input.exposed_ports.end();

    if (input.detected_port && !input.exposed_ports.empty() && !port_listed) {
        verdict.port_mismatch = true;
        verdict.errors.push_back(FormatPortMismatch(*input.detected_port, input.exposed_ports));
    }

    if (input.exit_code && *input.exit_code != 0) {
        verdict.classification = Classification::CRASHED_ON_START;
        verdict.severity = Severity::CRITICAL;
        verdict.errors.push_back("Exit Code " + std::to_string(*input.exit_code));
        for (const auto& finding : input.findings) {
            verdict.errors.push_back(finding.Render());
        }
    } else if (!input.findings.empty()) {
        verdict.classification = Classification::UNHEALTHY_RUNTIME_ERRORS;
        verdict.severity = Severity::CRITICAL;
        for (const auto& finding : input.findings) {
            verdict.errors.push_back(finding.Render());
        }
    } else if (input.is_running && input.detected_port) {
        if (!port_listed) {
            verdict.classification = Classification::RUNNING_PORT_MISMATCH;
            verdict.severity = Severity::WARNING;
        } else {
            verdict.classification = Classification::HEALTHY_VERIFIED_PORT;
            verdict.severity = Severity::OK;
        }
    } else if (input.is_running && !input.exposed_ports.empty()) {
        verdict.classification = Classification::RUNNING_BLIND_PORTS;
        verdict.severity = Severity::WARNING;
    } else if (input.is_running) {
        verdict.classification = Classification::RUNNING_NO_PORT_DETECTED;
        verdict.severity = Severity::WARNING;
    } else {
        verdict.classification = Classification::EXITED_CLEANLY;
        verdict.severity = Severity::OK;
    }

    return verdict;
}

} // namespace analyzers
} // namespace repoprobe
