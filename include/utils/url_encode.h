#pragma once

#include <string>

namespace ontoreg {

// Percent-encode everything outside the RFC 3986 unreserved set.
inline std::string urlEncodePathSegment(const std::string& input) {
    static const char* kHex = "0123456789ABCDEF";
    std::string out;
    out.reserve(input.size());
    for (unsigned char c : input) {
        const bool unreserved =
            (c >= 'A' && c <= 'Z') ||
            (c >= 'a' && c <= 'z') ||
            (c >= '0' && c <= '9') ||
            c == '-' || c == '_' || c == '.' || c == '~';
        if (unreserved) {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(kHex[(c >> 4) & 0x0F]);
            out.push_back(kHex[c & 0x0F]);
        }
    }
    return out;
}

// Join already-split path segments as "/a/b/c", encoding each one.
template <typename... Segments>
std::string buildEncodedPath(const std::string& base_path, const Segments&... segments) {
    std::string out = base_path;
    while (!out.empty() && out.back() == '/') {
        out.pop_back();
    }
    ((out += "/" + urlEncodePathSegment(segments)), ...);
    return out;
}

}  // namespace ontoreg
