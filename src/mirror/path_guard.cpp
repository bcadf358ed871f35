#include "mirror/path_guard.h"

#include <system_error>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace sitemirror {

namespace {

fs::path canonicalRoot(const fs::path& root) {
    std::error_code ec;
    auto absolute = fs::absolute(root, ec);
    if (ec) return root.lexically_normal();
    auto canonical = fs::weakly_canonical(absolute, ec);
    if (ec) return absolute.lexically_normal();
    return canonical;
}

// weakly_canonical keeps a trailing separator as an empty last element; drop it so
// component comparison sees the same shape for "site" and "site/".
fs::path stripTrailingSeparator(fs::path p) {
    if (!p.empty() && !p.has_filename() && p.has_parent_path() && p != p.root_path()) {
        p = p.parent_path();
    }
    return p;
}

}  // namespace

PathGuard::PathGuard(const fs::path& root)
    : root_(stripTrailingSeparator(canonicalRoot(root))) {}

bool PathGuard::contains(const fs::path& candidate) const {
    const fs::path normalized = stripTrailingSeparator(candidate);
    auto root_it = root_.begin();
    auto cand_it = normalized.begin();
    for (; root_it != root_.end(); ++root_it, ++cand_it) {
        if (cand_it == normalized.end() || *root_it != *cand_it) {
            return false;
        }
    }
    // strict descendant: at least one component below the root
    return cand_it != normalized.end();
}

std::optional<fs::path> PathGuard::resolve(const std::string& relative_path) const {
    if (relative_path.find('\0') != std::string::npos) {
        return std::nullopt;
    }
    const auto first = relative_path.find_first_not_of("/\\");
    if (first == std::string::npos) {
        return std::nullopt;
    }

    const fs::path joined = root_ / fs::path(relative_path.substr(first));
    std::error_code ec;
    fs::path canonical = fs::weakly_canonical(joined, ec);
    if (ec) {
        spdlog::debug("PathGuard: cannot resolve '{}': {}", relative_path, ec.message());
        return std::nullopt;
    }
    if (!contains(canonical)) {
        spdlog::debug("PathGuard: rejected '{}' -> {}", relative_path, canonical.string());
        return std::nullopt;
    }
    return stripTrailingSeparator(canonical);
}

std::optional<fs::path> PathGuard::resolve(const fs::path& root, const std::string& relative_path) {
    return PathGuard(root).resolve(relative_path);
}

}  // namespace sitemirror
