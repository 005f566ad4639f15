/**
 * @file health_classifier.hpp
 * @brief Deterministic health classification of an observed container
 *
 * @date 2025
 */

#pragma once

#include "repoprobe/core/sandbox_types.hpp"

#include <string>
#include <vector>
#include <optional>

namespace repoprobe {
namespace analyzers {

/**
 * @struct ClassifierInput
 * @brief Observation of one container after warm-up
 */
struct ClassifierInput {
    std::optional<int> exit_code;                ///< nullopt when unknown
    bool is_running{false};
    std::vector<core::LogFinding> findings;
    std::optional<int> detected_port;
    std::vector<int> exposed_ports;
};

/**
 * @struct HealthVerdict
 * @brief Classification outcome and the error lines it contributes
 */
struct HealthVerdict {
    core::Classification classification{core::Classification::UNKNOWN};
    core::Severity severity{core::Severity::UNKNOWN};
    bool port_mismatch{false};
    std::vector<std::string> errors;   ///< Mismatch message first, then label-specific lines
};

/**
 * @class HealthClassifier
 * @brief Pure decision table over exit state, findings and port data
 *
 * **Decision Order**:
 * ```
 * exit code not in {0, none}        -> crashed_on_start          critical
 * findings present                  -> unhealthy_runtime_errors  critical
 * running, port detected
 *     port not among exposed ports  -> running_port_mismatch     warning
 *     otherwise                     -> healthy_verified_port     ok
 * running, ports exposed            -> running_blind_ports       warning
 * running                           -> running_no_port_detected  warning
 * otherwise                         -> exited_cleanly            ok
 * ```
 *
 * port_mismatch is set only when both a detected port and a non-empty exposed
 * list exist and the port is not in the list.
 */
class HealthClassifier {
public:
    static HealthVerdict Classify(const ClassifierInput& input);

    /// "Port Mismatch: App listens on 5000, but Dockerfile exposes [3000, 8080]"
    static std::string FormatPortMismatch(int detected_port,
                                          const std::vector<int>& exposed_ports);
};

} // namespace analyzers
} // namespace repoprobe
