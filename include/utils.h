#pragma once

#include <string>
#include <algorithm>
#include <cctype>
#include <vector>

namespace voicegate {

/**
 * @brief String utility functions
 */
namespace utils {

/**
 * @brief Trim whitespace from both ends of a string
 * @param str String to trim (modified in place)
 * @return Reference to the trimmed string
 */
inline std::string& trim(std::string& str) {
    str.erase(0, str.find_first_not_of(" \t\n\r"));
    str.erase(str.find_last_not_of(" \t\n\r") + 1);
    return str;
}

/**
 * @brief Trim whitespace from both ends of a string (returns copy)
 */
inline std::string trim_copy(const std::string& str) {
    std::string result = str;
    trim(result);
    return result;
}

/**
 * @brief Normalize string to lowercase (modified in place)
 */
inline std::string& normalize(std::string& str) {
    std::transform(str.begin(), str.end(), str.begin(),
                  [](unsigned char c) { return std::tolower(c); });
    return str;
}

inline std::string normalize_copy(const std::string& str) {
    std::string result = str;
    normalize(result);
    return result;
}

/**
 * @brief Check if string is empty or contains only whitespace
 */
inline bool is_empty_or_whitespace(const std::string& str) {
    return str.find_first_not_of(" \t\n\r") == std::string::npos;
}

/**
 * @brief Case-insensitive prefix test after trimming leading whitespace
 * @param str Text to test (e.g. an LLM reply)
 * @param prefix Prefix to look for (e.g. "DELEGATE:")
 */
inline bool starts_with_ci(const std::string& str, const std::string& prefix) {
    std::string t = trim_copy(str);
    if (t.size() < prefix.size()) return false;
    return normalize_copy(t.substr(0, prefix.size())) == normalize_copy(prefix);
}

/**
 * @brief Remove a leading prefix (case-insensitive) and trim the remainder
 * @return Remainder, or the trimmed input when the prefix is absent
 */
inline std::string strip_prefix_ci(const std::string& str, const std::string& prefix) {
    std::string t = trim_copy(str);
    if (!starts_with_ci(t, prefix)) return t;
    return trim_copy(t.substr(prefix.size()));
}

/**
 * @brief Shorten text for log lines ("abc..." when longer than max_len)
 */
inline std::string truncate_for_log(const std::string& str, size_t max_len = 80) {
    if (str.size() <= max_len) return str;
    return str.substr(0, max_len) + "...";
}

} // namespace utils

} // namespace voicegate
