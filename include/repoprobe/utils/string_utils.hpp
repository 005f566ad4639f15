/**
 * @file string_utils.hpp
 * @brief String helpers for untrusted container output and user input
 *
 * Trimming, splitting and replacing helpers plus UTF-8 aware sanitization and
 * truncation. Container logs are arbitrary bytes; every helper here accepts
 * any input without throwing.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>
#include <cstddef>

namespace repoprobe {
namespace utils {

/**
 * @class StringUtils
 * @brief Static string utilities
 *
 * **Usage Example**:
 * @code
 * std::string text = StringUtils::SanitizeUtf8(raw_bytes);
 * for (const auto& line : StringUtils::SplitLines(text)) {
 *     auto clipped = StringUtils::TruncateUtf8(StringUtils::Trim(line), 150);
 * }
 * @endcode
 */
class StringUtils {
public:
    /***************************************************************************
     * String Manipulation
     ***************************************************************************/

    /// Strip leading/trailing ASCII whitespace
    static std::string Trim(const std::string& str);

    static std::string ToLower(const std::string& str);

    /**
     * @brief Split string by delimiter
     * @param str Input string
     * @param delimiter Separator character
     * @return Non-empty tokens in order
     */
    static std::vector<std::string> Split(const std::string& str, char delimiter);

    /**
     * @brief Split text into lines
     *
     * Accepts "\n" and "\r\n" line endings. Empty lines are preserved so that
     * line numbers stay meaningful; a trailing newline does not produce an
     * extra empty line.
     */
    static std::vector<std::string> SplitLines(const std::string& text);

    static std::string Join(const std::vector<std::string>& strings,
                            const std::string& delimiter);

    static std::string ReplaceAll(const std::string& str,
                                  const std::string& from,
                                  const std::string& to);

    static bool StartsWith(const std::string& str, const std::string& prefix);
    static bool Contains(const std::string& str, const std::string& substring);

    /***************************************************************************
     * Sanitization
     ***************************************************************************/

    /**
     * @brief Replace invalid UTF-8 sequences with U+FFFD
     *
     * Overlong encodings, surrogates, truncated sequences and stray
     * continuation bytes are each replaced by one replacement character.
     * Valid input is returned unchanged.
     */
    static std::string SanitizeUtf8(const std::string& bytes);

    /**
     * @brief Truncate to at most max_chars code points
     *
     * Never splits a multi-byte sequence. Input is assumed to be valid UTF-8
     * (run SanitizeUtf8 first).
     */
    static std::string TruncateUtf8(const std::string& str, std::size_t max_chars);

    /// Number of code points in valid UTF-8 text
    static std::size_t CountUtf8Chars(const std::string& str);

    /**
     * @brief Keep the last max_bytes bytes, prefixed with "..." when clipped
     *
     * Used for build output where the tail carries the actual error.
     */
    static std::string TailBytes(const std::string& str, std::size_t max_bytes);
};

} // namespace utils
} // namespace repoprobe
