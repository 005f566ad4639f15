/**
 * @file string_utils.cpp
 * @brief Implementation of string helpers for untrusted text
 *
 * @date 2025
 */

#include "repoprobe/utils/string_utils.hpp"

#include <sstream>
#include <algorithm>
#include <cctype>

namespace repoprobe {
namespace utils {

namespace {

constexpr const char* kReplacementChar = "\xEF\xBF\xBD";

bool IsContinuation(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

/**
 * @brief Length of the valid UTF-8 sequence starting at pos, or 0 if invalid
 */
std::size_t ValidSequenceLength(const std::string& s, std::size_t pos) {
    const auto c0 = static_cast<unsigned char>(s[pos]);
    const std::size_t remaining = s.size() - pos;

    if (c0 < 0x80) {
        return 1;
    }

    if (c0 >= 0xC2 && c0 <= 0xDF) {
        if (remaining >= 2 && IsContinuation(static_cast<unsigned char>(s[pos + 1]))) {
            return 2;
        }
        return 0;
    }

    if (c0 >= 0xE0 && c0 <= 0xEF) {
        if (remaining < 3) return 0;
        const auto c1 = static_cast<unsigned char>(s[pos + 1]);
        const auto c2 = static_cast<unsigned char>(s[pos + 2]);
        if (!IsContinuation(c1) || !IsContinuation(c2)) return 0;
        if (c0 == 0xE0 && c1 < 0xA0) return 0;   // overlong
        if (c0 == 0xED && c1 > 0x9F) return 0;   // UTF-16 surrogate
        return 3;
    }

    if (c0 >= 0xF0 && c0 <= 0xF4) {
        if (remaining < 4) return 0;
        const auto c1 = static_cast<unsigned char>(s[pos + 1]);
        const auto c2 = static_cast<unsigned char>(s[pos + 2]);
        const auto c3 = static_cast<unsigned char>(s[pos + 3]);
        if (!IsContinuation(c1) || !IsContinuation(c2) || !IsContinuation(c3)) return 0;
        if (c0 == 0xF0 && c1 < 0x90) return 0;   // overlong
        if (c0 == 0xF4 && c1 > 0x8F) return 0;   // above U+10FFFF
        return 4;
    }

    return 0;
}

} // anonymous namespace

// ============================================================================
// STRING MANIPULATION UTILITIES
// ============================================================================

std::string StringUtils::Trim(const std::string& str) {
    auto start = std::find_if_not(str.begin(), str.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(str.rbegin(), str.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();
    return (start < end) ? std::string(start, end) : std::string();
}

std::string StringUtils::ToLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::vector<std::string> StringUtils::Split(const std::string& str, char delimiter) {
    std::vector<std::string> tokens;
    std::string token;
    std::istringstream token_stream(str);

    while (std::getline(token_stream, token, delimiter)) {
        if (!token.empty()) {
            tokens.push_back(token);
        }
    }

    return tokens;
}

std::vector<std::string> StringUtils::SplitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::size_t start = 0;

    while (start < text.size()) {
        std::size_t end = text.find('\n', start);
        if (end == std::string::npos) {
            end = text.size();
        }

        std::size_t line_end = end;
        if (line_end > start && text[line_end - 1] == '\r') {
            --line_end;
        }
        lines.emplace_back(text, start, line_end - start);
        start = end + 1;
    }

    return lines;
}

std::string StringUtils::Join(const std::vector<std::string>& strings,
                              const std::string& delimiter) {
    if (strings.empty()) {
        return "";
    }

    std::ostringstream oss;
    oss << strings[0];

    for (std::size_t i = 1; i < strings.size(); ++i) {
        oss << delimiter << strings[i];
    }

    return oss.str();
}

std::string StringUtils::ReplaceAll(const std::string& str,
                                    const std::string& from,
                                    const std::string& to) {
    if (from.empty()) {
        return str;
    }

    std::string result = str;
    std::size_t pos = 0;

    while ((pos = result.find(from, pos)) != std::string::npos) {
        result.replace(pos, from.length(), to);
        pos += to.length();
    }

    return result;
}

bool StringUtils::StartsWith(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() &&
           str.compare(0, prefix.size(), prefix) == 0;
}

bool StringUtils::Contains(const std::string& str, const std::string& substring) {
    return str.find(substring) != std::string::npos;
}

// ============================================================================
// UTF-8 SANITIZATION AND TRUNCATION
// ============================================================================
// Container output is raw bytes; JSON serialization and regex matching both
// require valid UTF-8.

std::string StringUtils::SanitizeUtf8(const std::string& bytes) {
    std::string result;
    result.reserve(bytes.size());

    std::size_t pos = 0;
    while (pos < bytes.size()) {
        const std::size_t len = ValidSequenceLength(bytes, pos);
        if (len == 0) {
            result += kReplacementChar;
            ++pos;
            // Swallow the continuation bytes of the broken sequence
            while (pos < bytes.size() &&
                   IsContinuation(static_cast<unsigned char>(bytes[pos])) &&
                   ValidSequenceLength(bytes, pos) == 0) {
                ++pos;
            }
            continue;
        }
        result.append(bytes, pos, len);
        pos += len;
    }

    return result;
}

std::string StringUtils::TruncateUtf8(const std::string& str, std::size_t max_chars) {
    std::size_t chars = 0;
    std::size_t pos = 0;

    while (pos < str.size()) {
        if (chars == max_chars) {
            return str.substr(0, pos);
        }
        ++pos;
        while (pos < str.size() && IsContinuation(static_cast<unsigned char>(str[pos]))) {
            ++pos;
        }
        ++chars;
    }

    return str;
}

std::size_t StringUtils::CountUtf8Chars(const std::string& str) {
    return static_cast<std::size_t>(std::count_if(str.begin(), str.end(), [](char c) {
        return !IsContinuation(static_cast<unsigned char>(c));
    }));
}

std::string StringUtils::TailBytes(const std::string& str, std::size_t max_bytes) {
    if (str.size() <= max_bytes) {
        return str;
    }

    std::size_t start = str.size() - max_bytes;
    while (start < str.size() && IsContinuation(static_cast<unsigned char>(str[start]))) {
        ++start;
    }
    return "..." + str.substr(start);
}

} // namespace utils
} // namespace repoprobe
