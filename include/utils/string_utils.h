// String helpers shared by config, providers and the CLI.
#pragma once

#include <algorithm>
#include <cctype>
#include <string>

namespace ontoreg {

inline std::string toLowerAscii(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return s;
}

inline std::string trimAscii(const std::string& s) {
    size_t start = 0;
    size_t end = s.size();
    while (start < end && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

inline std::string ensureTrailingSlash(std::string value) {
    if (value.empty() || value.back() != '/') {
        value.push_back('/');
    }
    return value;
}

inline std::string trimTrailingSlash(std::string value) {
    while (!value.empty() && value.back() == '/') {
        value.pop_back();
    }
    return value;
}

}  // namespace ontoreg
