#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include <vector>

namespace CommonUtils {

inline std::string trim(std::string_view s) {
    const size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    const size_t e = s.find_last_not_of(" \t\r\n");
    return std::string(s.substr(b, e - b + 1));
}

inline std::string toLower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

/**
 * @brief Lower-cases and drops every ASCII character that is not a letter or digit.
 * @details Bytes >= 0x80 are kept so UTF-8 names (e.g. Thai headers) still compare.
 */
inline std::string normalizeName(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char ch : s) {
        const unsigned char c = static_cast<unsigned char>(ch);
        if (c >= 0x80) {
            out.push_back(ch);
        } else if (std::isalnum(c) != 0) {
            out.push_back(static_cast<char>(std::tolower(c)));
        }
    }
    return out;
}

// Splits on runs of any character in `delimiters`, trims tokens and drops empty ones.
inline std::vector<std::string> splitOnAny(std::string_view s, std::string_view delimiters) {
    std::vector<std::string> out;
    size_t pos = 0;
    while (pos < s.size()) {
        const size_t start = s.find_first_not_of(delimiters, pos);
        if (start == std::string::npos) break;
        size_t end = s.find_first_of(delimiters, start);
        if (end == std::string::npos) end = s.size();
        std::string token = trim(s.substr(start, end - start));
        if (!token.empty()) out.push_back(std::move(token));
        pos = end;
    }
    return out;
}

inline std::string join(const std::vector<std::string>& parts, std::string_view separator) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out.append(separator);
        out.append(parts[i]);
    }
    return out;
}

} // namespace CommonUtils
