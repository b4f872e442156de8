#pragma once

#include <string>
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <vector>

namespace job_diary {

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
 * @brief Lowercase a copy of the string
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

/**
 * @brief Trim and drop trailing sentence punctuation ("Save it." -> "Save it")
 */
inline std::string strip_utterance(const std::string& str) {
    std::string t = trim_copy(str);
    while (!t.empty()) {
        char c = t.back();
        if (c == '.' || c == '!' || c == '?' || c == ',' || c == ';' || c == ':') {
            t.pop_back();
            trim(t);
        } else {
            break;
        }
    }
    return t;
}

/**
 * @brief Join strings with a separator
 */
inline std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += sep;
        out += parts[i];
    }
    return out;
}

/**
 * @brief Replace every '_' with ' ' ("in_progress" -> "in progress")
 */
inline std::string underscores_to_spaces(std::string str) {
    std::replace(str.begin(), str.end(), '_', ' ');
    return str;
}

/**
 * @brief Standard base64 (RFC 4648) of raw bytes, with padding
 */
inline std::string base64_encode(const uint8_t* data, size_t len) {
    static const char table[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    std::string out;
    out.reserve(((len + 2) / 3) * 4);
    size_t i = 0;
    for (; i + 2 < len; i += 3) {
        uint32_t n = (uint32_t(data[i]) << 16) | (uint32_t(data[i + 1]) << 8) | data[i + 2];
        out += table[(n >> 18) & 0x3F];
        out += table[(n >> 12) & 0x3F];
        out += table[(n >> 6) & 0x3F];
        out += table[n & 0x3F];
    }
    if (i + 1 == len) {
        uint32_t n = uint32_t(data[i]) << 16;
        out += table[(n >> 18) & 0x3F];
        out += table[(n >> 12) & 0x3F];
        out += "==";
    } else if (i + 2 == len) {
        uint32_t n = (uint32_t(data[i]) << 16) | (uint32_t(data[i + 1]) << 8);
        out += table[(n >> 18) & 0x3F];
        out += table[(n >> 12) & 0x3F];
        out += table[(n >> 6) & 0x3F];
        out += '=';
    }
    return out;
}

} // namespace utils

} // namespace job_diary
