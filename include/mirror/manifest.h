#pragma once

#include <filesystem>
#include <istream>
#include <string>
#include <vector>

namespace sitemirror {

/// Relative path of one mirrored file, '/'-separated with no leading '/'.
using ManifestEntry = std::string;

/// Ordered, duplicate-free list of the files the mirror must contain.
class Manifest {
public:
    Manifest() = default;

    /// Read a manifest file. Throws std::runtime_error if it cannot be opened.
    static Manifest load(const std::filesystem::path& path);

    /// One path per line; blank lines and lines starting with '#' are skipped.
    static Manifest parse(std::istream& in);

    static Manifest fromEntries(const std::vector<std::string>& lines);

    /// Trim whitespace, strip leading '/', turn '\' into '/' and collapse "." and "//"
    /// segments lexically. Empty result means "skip".
    static ManifestEntry normalize(const std::string& line);

    const std::vector<ManifestEntry>& entries() const { return entries_; }
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

private:
    void add(const std::string& line);

    std::vector<ManifestEntry> entries_;
};

}  // namespace sitemirror
