#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace sitemirror {

/// A resolved file under the mirror root together with the metadata the serving
/// path keys on.
struct LocalFile {
    std::filesystem::path path;
    uint64_t size{0};
    int64_t mtime_ns{0};    // nanoseconds since the Unix epoch
    std::string extension;  // lower-case, with the leading dot; empty if none
};

/// stat() a regular file. Returns nullopt if it is missing or not a regular file.
std::optional<LocalFile> statLocalFile(const std::filesystem::path& path);

}  // namespace sitemirror
