#pragma once

#include <string>
#include <algorithm>
#include <cctype>
#include <vector>

namespace conductor {

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
 * @brief Normalize string to lowercase (returns copy)
 */
inline std::string normalize_copy(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                  [](unsigned char c) { return std::tolower(c); });
    return result;
}

/**
 * @brief Check if string is empty or contains only whitespace
 */
inline bool is_empty_or_whitespace(const std::string& str) {
    return str.find_first_not_of(" \t\n\r") == std::string::npos;
}

inline bool starts_with(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

inline bool ends_with(const std::string& str, const std::string& suffix) {
    return str.size() >= suffix.size() &&
           str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

inline std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += sep;
        out += parts[i];
    }
    return out;
}

/**
 * @brief Cut str to max_chars and append marker when it was longer
 * @param max_chars 0 disables truncation
 */
inline std::string truncate_with_marker(const std::string& str, size_t max_chars,
                                        const std::string& marker = "\n...[truncated]") {
    if (max_chars == 0 || str.size() <= max_chars) return str;
    return str.substr(0, max_chars) + marker;
}

/**
 * @brief Split a command line into argv words
 *
 * Whitespace separates words; single and double quotes group, backslash
 * escapes the next character outside single quotes. No variable or glob
 * expansion is performed.
 * @param ok Set to false when a quote is left unterminated
 */
inline std::vector<std::string> split_command_line(const std::string& line, bool& ok) {
    std::vector<std::string> words;
    std::string current;
    bool in_word = false;
    char quote = 0;
    ok = true;

    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (quote != 0) {
            if (c == quote) {
                quote = 0;
            } else if (c == '\\' && quote == '"' && i + 1 < line.size()) {
                current += line[++i];
            } else {
                current += c;
            }
            continue;
        }
        if (c == '\'' || c == '"') {
            quote = c;
            in_word = true;
        } else if (c == '\\' && i + 1 < line.size()) {
            current += line[++i];
            in_word = true;
        } else if (std::isspace(static_cast<unsigned char>(c))) {
            if (in_word) {
                words.push_back(current);
                current.clear();
                in_word = false;
            }
        } else {
            current += c;
            in_word = true;
        }
    }
    if (quote != 0) ok = false;
    if (in_word) words.push_back(current);
    return words;
}

} // namespace utils

} // namespace conductor
