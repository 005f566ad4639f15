/**
 * @file log_analyzer.hpp
 * @brief Signature and listening-port extraction from container output
 *
 * Scans the combined stdout/stderr of a container for well-known failure
 * signatures (missing modules, tracebacks, unhandled rejections, ...) and for
 * the first "listening on" style announcement of an application port.
 *
 * @date 2025
 */

#pragma once

#include "repoprobe/core/sandbox_types.hpp"

#include <string>
#include <vector>
#include <optional>
#include <regex>
#include <cstddef>

namespace repoprobe {
namespace analyzers {

/**
 * @struct ErrorSignature
 * @brief One entry of the failure signature table
 */
struct ErrorSignature {
    std::string pattern;   ///< ECMAScript regex, matched case-insensitively
    std::string label;     ///< Finding label
};

/**
 * @struct LogAnalysis
 * @brief Output of LogAnalyzer::Analyze
 */
struct LogAnalysis {
    std::vector<core::LogFinding> findings;   ///< Signature table order
    std::optional<int> detected_port;         ///< First announced port, 1..65535
};

/**
 * @class LogAnalyzer
 * @brief Pure log text analyzer
 *
 * Signatures are evaluated independently in table order; each one that fires
 * yields exactly one finding whose detail is the text from the first match to
 * the end of that line (trimmed, at most 150 characters). Port patterns are
 * case-sensitive and tried in order; the first pattern that matches anywhere
 * wins.
 *
 * Input is sanitized to valid UTF-8 and processed line by line, with very long
 * lines split into fixed-size segments, so cost stays linear in input size.
 *
 * **Usage Example**:
 * @code
 * LogAnalyzer analyzer;
 * auto analysis = analyzer.Analyze(raw_logs);
 * for (const auto& finding : analysis.findings) {
 *     spdlog::warn("{}", finding.Render());
 * }
 * if (analysis.detected_port) {
 *     spdlog::info("App announced port {}", *analysis.detected_port);
 * }
 * @endcode
 *
 * **Thread Safety**: Analyze is const and reentrant.
 */
class LogAnalyzer {
public:
    static constexpr std::size_t kMaxDetailChars = 150;
    static constexpr std::size_t kSegmentBytes = 4096;
    static constexpr std::size_t kSegmentOverlap = 256;  ///< Longer than any signature or port phrase

    LogAnalyzer();

    /// Analyze raw container output (any bytes)
    LogAnalysis Analyze(const std::string& log_text) const;

    static const std::vector<ErrorSignature>& DefaultSignatures();
    static const std::vector<std::string>& DefaultPortPatterns();

private:
    struct CompiledSignature {
        std::regex regex;
        std::string label;
    };

    /// Bounded window of one log line; consecutive windows overlap
    struct LineSegment {
        std::size_t line;     ///< Index into the split lines
        std::size_t offset;   ///< Byte offset of text within the line
        std::string text;
        bool continues;       ///< More of the line follows this window
    };

    std::vector<CompiledSignature> signatures_;
    std::vector<std::regex> port_patterns_;

    static std::vector<LineSegment> Segment(const std::vector<std::string>& lines);
    static std::optional<int> ParsePort(const std::string& digits);
};

} // namespace analyzers
} // namespace repoprobe
