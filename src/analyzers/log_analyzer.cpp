/**
 * @file log_analyzer.cpp
 * @brief Failure signature and port detection over container logs
 *
 * @date 2025
 */

#include "repoprobe/analyzers/log_analyzer.hpp"
#include "repoprobe/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace repoprobe {
namespace analyzers {

using utils::StringUtils;

// ============================================================================
// PATTERN TABLES
// ============================================================================

const std::vector<ErrorSignature>& LogAnalyzer::DefaultSignatures() {
    static const std::vector<ErrorSignature> signatures = {
        {R"(MongooseError)", "Database Connection Fail"},
        {R"(ModuleNotFoundError)", "Missing Python Dependency"},
        {R"(ImportError)", "Import Error"},
        {R"(SyntaxError)", "Syntax Error"},
        {R"(ReferenceError)", "Code Reference Error"},
        {R"(TypeError)", "Type Mismatch"},
        {R"(Traceback \(most recent call last\))", "Python Crash Trace"},
        {R"(Error: Cannot find module)", "Missing Node Module"},
        {R"(unhandledRejection)", "Unhandled Promise Rejection"},
        {R"(Address already in use)", "Port Conflict"},
        {R"(CRITICAL:)", "Critical Log Level"},
        {R"(Exception:)", "Generic Exception"},
        {R"(Error:)", "Generic Error"},
    };
    return signatures;
}

const std::vector<std::string>& LogAnalyzer::DefaultPortPatterns() {
    static const std::vector<std::string> patterns = {
        R"(Running on http://.*:(\d+))",
        R"(Listening on port (\d+))",
        R"(started on port (\d+))",
        R"(server listening on (\d+))",
        R"(:(\d+) \.\.\.)",
        R"(localhost:(\d+))",
        R"(0\.0\.0\.0:(\d+))",
    };
    return patterns;
}

LogAnalyzer::LogAnalyzer() {
    for (const auto& signature : DefaultSignatures()) {
        signatures_.push_back({
            std::regex(signature.pattern, std::regex::ECMAScript | std::regex::icase),
            signature.label});
    }
    for (const auto& pattern : DefaultPortPatterns()) {
        port_patterns_.emplace_back(pattern, std::regex::ECMAScript);
    }
}

// ============================================================================
// ANALYSIS
// ============================================================================

LogAnalysis LogAnalyzer::Analyze(const std::string& log_text) const {
    LogAnalysis analysis;
    if (log_text.empty()) {
        return analysis;
    }

    const auto lines = StringUtils::SplitLines(StringUtils::SanitizeUtf8(log_text));
    const auto segments = Segment(lines);

    for (const auto& signature : signatures_) {
        for (const auto& segment : segments) {
            std::smatch match;
            if (!std::regex_search(segment.text, match, signature.regex)) {
                continue;
            }

            // Match to end of line, taken from the whole line
            const auto start = segment.offset + static_cast<std::size_t>(match.position(0));
            auto excerpt = StringUtils::Trim(lines[segment.line].substr(start));
            analysis.findings.push_back({
                signature.label,
                StringUtils::TruncateUtf8(excerpt, kMaxDetailChars)});
            break;
        }
    }

    for (const auto& pattern : port_patterns_) {
        for (const auto& segment : segments) {
            std::smatch match;
            if (!std::regex_search(segment.text, match, pattern)) {
                continue;
            }
            // Digits running into the window edge may be cut; the next window has them whole
            const auto match_end = static_cast<std::size_t>(match.position(0) + match.length(0));
            if (segment.continues && match_end == segment.text.size()) {
                continue;
            }
            auto port = ParsePort(match[1].str());
            if (port) {
                analysis.detected_port = port;
                break;
            }
            spdlog::debug("Ignoring out-of-range port announcement: {}", match[1].str());
        }
        if (analysis.detected_port) {
            break;
        }
    }

    spdlog::debug("Log analysis: {} findings, port {}",
                  analysis.findings.size(),
                  analysis.detected_port ? std::to_string(*analysis.detected_port) : "none");
    return analysis;
}

std::vector<LogAnalyzer::LineSegment> LogAnalyzer::Segment(const std::vector<std::string>& lines) {
    auto is_continuation = [](char c) {
        return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
    };

    std::vector<LineSegment> segments;
    for (std::size_t i = 0; i < lines.size(); ++i) {
        const auto& line = lines[i];
        if (line.size() <= kSegmentBytes) {
            segments.push_back({i, 0, line, false});
            continue;
        }

        std::size_t offset = 0;
        while (true) {
            std::size_t end = std::min(offset + kSegmentBytes, line.size());
            // Back off to a code point boundary
            while (end < line.size() && end > offset && is_continuation(line[end])) {
                --end;
            }
            if (end == offset) {
                end = std::min(offset + kSegmentBytes, line.size());
            }

            const bool continues = end < line.size();
            segments.push_back({i, offset, line.substr(offset, end - offset), continues});
            if (!continues) {
                break;
            }

            // Step back so a phrase straddling the edge lands whole in the next window
            std::size_t next = end - std::min(kSegmentOverlap, end - offset - 1);
            while (next < end && is_continuation(line[next])) {
                ++next;
            }
            offset = next;
        }
    }
    return segments;
}

std::optional<int> LogAnalyzer::ParsePort(const std::string& digits) {
    if (digits.empty() || digits.size() > 5) {
        return std::nullopt;
    }
    const int port = std::stoi(digits);
    if (port < 1 || port > 65535) {
        return std::nullopt;
    }
    return port;
}

} // namespace analyzers
} // namespace repoprobe
