#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace sitemirror {

/// Traversal guard shared by the fetch engine and the static resolver.
///
/// resolve() joins a relative path under the root, canonicalizes it (following any
/// symlinks that already exist) and accepts it only if the result is a strict
/// descendant of the canonical root. Rejection is reported as nullopt; no filesystem
/// mutation happens and no exception escapes. Instances are immutable, so one guard
/// may be shared by any number of threads.
class PathGuard {
public:
    explicit PathGuard(const std::filesystem::path& root);

    std::optional<std::filesystem::path> resolve(const std::string& relative_path) const;

    /// True when candidate (already canonical) lies strictly below the root.
    bool contains(const std::filesystem::path& candidate) const;

    const std::filesystem::path& root() const { return root_; }

    /// One-shot form for callers without a long-lived guard.
    static std::optional<std::filesystem::path> resolve(const std::filesystem::path& root,
                                                        const std::string& relative_path);

private:
    std::filesystem::path root_;
};

}  // namespace sitemirror
