/**
 * @file json_reporter.hpp
 * @brief JSON serialization of sandbox results
 *
 * Produces the result document consumed by downstream correlation stages:
 * dockerfile_source, build, execution, health, classification, errors and
 * env_injected, with snake_case keys and lowercase enum names.
 *
 * @date 2025
 */

#pragma once

#include "repoprobe/core/sandbox_types.hpp"

#include <string>
#include <filesystem>

#include <nlohmann/json_fwd.hpp>

namespace repoprobe {
namespace reporters {

/**
 * @struct JsonReporterConfig
 * @brief Configuration for JSON report generation
 */
struct JsonReporterConfig {
    bool pretty_print{true};        ///< Indented output
    int indent_size{2};             ///< Spaces per level when pretty printing
    bool include_image_tag{false};  ///< Add "image_tag" (debugging aid)
    bool validate_json{true};       ///< Re-parse before writing
};

/**
 * @class JsonReporter
 * @brief Serializes SandboxResult
 *
 * Log text is sanitized upstream, and the dump replaces any remaining
 * invalid UTF-8 instead of throwing, so serialization cannot fail on
 * hostile container output.
 *
 * **Usage Example**:
 * @code
 * JsonReporter reporter;
 * std::cout << reporter.GenerateJsonString(result) << std::endl;
 * reporter.GenerateReport(result, "reports/result.json");
 * @endcode
 */
class JsonReporter {
public:
    explicit JsonReporter(const JsonReporterConfig& config = JsonReporterConfig{});

    /// Result as a JSON object
    nlohmann::json ToJson(const core::SandboxResult& result) const;

    std::string GenerateJsonString(const core::SandboxResult& result) const;

    /**
     * @brief Write the document to output_path
     *
     * Parent directories are created as needed.
     * @return true on success; failures are logged
     */
    bool GenerateReport(const core::SandboxResult& result,
                        const std::filesystem::path& output_path) const;

    /// True when json_str parses
    static bool ValidateSyntax(const std::string& json_str);

private:
    JsonReporterConfig config_;

    static bool SaveJson(const std::string& json_content,
                         const std::filesystem::path& output_path);
};

} // namespace reporters
} // namespace repoprobe
