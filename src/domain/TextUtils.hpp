/**
 * @file TextUtils.hpp
 * @brief Small string helpers shared by the evidence and edit pipelines.
 */

#pragma once
#include <string>
#include <optional>
#include <cstddef>

namespace reflect::domain {

inline std::string Trim(const std::string& s) {
    const char* ws = " \t\r\n\f\v";
    size_t start = s.find_first_not_of(ws);
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

inline std::string ReplaceAll(std::string text, const std::string& from, const std::string& to) {
    if (from.empty()) return text;
    size_t pos = text.find(from);
    while (pos != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos = text.find(from, pos + to.size());
    }
    return text;
}

/**
 * @brief Cuts text to limit characters and appends "\n[...truncated, N chars omitted]".
 *
 * Text at or under the limit is returned unchanged.
 */
inline std::string TruncateText(const std::string& text, std::size_t limit) {
    if (text.size() <= limit) return text;
    return text.substr(0, limit) + "\n[...truncated, " + std::to_string(text.size() - limit) + " chars omitted]";
}

inline std::optional<std::string> TruncateText(const std::optional<std::string>& text, std::size_t limit) {
    if (!text) return text;
    return TruncateText(*text, limit);
}

inline bool StartsWith(const std::string& s, const std::string& prefix) {
    return s.rfind(prefix, 0) == 0;
}

} // namespace reflect::domain
