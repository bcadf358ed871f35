#include "serve/static_resolver.h"

#include <spdlog/spdlog.h>

#include "utils/url_encode.h"

namespace sitemirror {

StaticResolver::StaticResolver(const std::filesystem::path& root, std::string index_file, std::string root_index)
    : guard_(root), index_file_(std::move(index_file)), root_index_(std::move(root_index)) {}

std::optional<LocalFile> StaticResolver::tryGuarded(const std::string& relative) const {
    auto guarded = guard_.resolve(relative);
    if (!guarded) {
        return std::nullopt;
    }
    return statLocalFile(*guarded);
}

std::optional<LocalFile> StaticResolver::tryCandidate(const std::string& candidate) const {
    const auto first = candidate.find_first_not_of('/');
    if (first == std::string::npos) {
        return tryGuarded(root_index_);
    }

    std::string relative = candidate.substr(first);
    if (auto file = tryGuarded(relative)) {
        return file;
    }

    while (!relative.empty() && relative.back() == '/') relative.pop_back();
    return tryGuarded(relative + "/" + index_file_);
}

std::optional<LocalFile> StaticResolver::resolve(const std::string& request_target) const {
    const std::string raw = request_target.substr(0, request_target.find_first_of("?#"));
    const std::string decoded = percentDecode(raw);

    if (auto file = tryCandidate(decoded)) {
        return file;
    }
    if (decoded != raw) {
        if (auto file = tryCandidate(raw)) {
            spdlog::debug("StaticResolver: '{}' matched a percent-encoded file name", raw);
            return file;
        }
    }
    return std::nullopt;
}

}  // namespace sitemirror
