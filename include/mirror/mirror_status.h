#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

#include "mirror/manifest.h"

namespace sitemirror {

struct MirrorStatusReport {
    size_t total{0};
    size_t present{0};
    size_t missing{0};
    uint64_t present_bytes{0};
    std::vector<ManifestEntry> pending;
    // (category, missing count), highest count first
    std::vector<std::pair<std::string, size_t>> missing_categories;

    double percentComplete() const { return total ? 100.0 * present / total : 0.0; }
};

// An entry is present when the guard accepts it and a non-empty regular file exists.
MirrorStatusReport scanMirror(const Manifest& manifest,
                              const std::filesystem::path& root,
                              size_t top_categories = 15);

// "a/b/c/file" -> "a/b"; "a/file" -> "a"; "file" -> "file".
std::string missingCategory(const ManifestEntry& entry);

}  // namespace sitemirror
