#pragma once

#include <algorithm>
#include <cctype>
#include <string>

namespace StringUtils {

inline std::string trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\r\n\f\v");
    if (start == std::string::npos) return "";
    auto end = str.find_last_not_of(" \t\r\n\f\v");
    return str.substr(start, end - start + 1);
}

inline std::string to_lower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

// Collapse every run of ASCII whitespace to one space and trim the ends.
inline std::string collapse_whitespace(const std::string& str) {
    std::string out;
    out.reserve(str.size());
    bool pending_space = false;
    for (unsigned char c : str) {
        if (std::isspace(c)) {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) {
            out += ' ';
            pending_space = false;
        }
        out += static_cast<char>(c);
    }
    return out;
}

}  // namespace StringUtils
