#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "mirror/path_guard.h"
#include "serve/local_file.h"

namespace sitemirror {

/// Maps an inbound request target onto a file below the mirror root.
///
/// Mirrored names may legitimately contain percent sequences on disk, so the
/// percent-decoded form is tried first and the raw form second. "/" maps to the
/// site's root index; a directory maps to its index file. Every candidate goes
/// through the PathGuard before it is touched, and a rejection is a plain miss.
class StaticResolver {
public:
    explicit StaticResolver(const std::filesystem::path& root,
                            std::string index_file = "index.html",
                            std::string root_index = "index/index.html");

    /// request_target is the raw target as sent by the client (query and fragment allowed).
    std::optional<LocalFile> resolve(const std::string& request_target) const;

    const std::filesystem::path& root() const { return guard_.root(); }

private:
    std::optional<LocalFile> tryCandidate(const std::string& candidate) const;
    std::optional<LocalFile> tryGuarded(const std::string& relative) const;

    PathGuard guard_;
    std::string index_file_;
    std::string root_index_;
};

}  // namespace sitemirror
