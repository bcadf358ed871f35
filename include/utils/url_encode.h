#pragma once

#include <string>

namespace sitemirror {

// Percent-encodes a URL path. Letters, digits and "/:@!$&'()*+,;=-._~%" pass through
// unchanged, so already-encoded sequences in mirrored file names are preserved.
inline std::string percentEncodePath(const std::string& input) {
    static const char* kHex = "0123456789ABCDEF";
    static const std::string kSafe = "/:@!$&'()*+,;=-._~%";
    std::string out;
    out.reserve(input.size());
    for (unsigned char c : input) {
        const bool keep =
            (c >= 'A' && c <= 'Z') ||
            (c >= 'a' && c <= 'z') ||
            (c >= '0' && c <= '9') ||
            kSafe.find(static_cast<char>(c)) != std::string::npos;
        if (keep) {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(kHex[(c >> 4) & 0x0F]);
            out.push_back(kHex[c & 0x0F]);
        }
    }
    return out;
}

namespace detail {
inline int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}
}  // namespace detail

// Decodes %XX sequences. Malformed sequences are copied through literally; '+' is not
// treated as a space since this is a path, not a form body.
inline std::string percentDecode(const std::string& input) {
    std::string out;
    out.reserve(input.size());
    for (size_t i = 0; i < input.size(); ++i) {
        if (input[i] == '%' && i + 2 < input.size()) {
            const int hi = detail::hexValue(input[i + 1]);
            const int lo = detail::hexValue(input[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>((hi << 4) | lo));
                i += 2;
                continue;
            }
        }
        out.push_back(input[i]);
    }
    return out;
}

}  // namespace sitemirror
