#pragma once

#include <optional>
#include <string>

namespace sitemirror {

// Compresses input into a gzip member (RFC 1952) at the given zlib level (0-9).
// Returns nullopt when zlib reports an error.
std::optional<std::string> gzipCompress(const std::string& input, int level = 6);

// Inflates a gzip member. Returns nullopt on malformed input.
std::optional<std::string> gzipDecompress(const std::string& input);

}  // namespace sitemirror
