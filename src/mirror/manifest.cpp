#include "mirror/manifest.h"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <unordered_set>
#include <spdlog/spdlog.h>

namespace sitemirror {

namespace {
bool isSpace(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\v' || c == '\f';
}
}  // namespace

ManifestEntry Manifest::normalize(const std::string& line) {
    size_t begin = 0;
    size_t end = line.size();
    while (begin < end && isSpace(line[begin])) ++begin;
    while (end > begin && isSpace(line[end - 1])) --end;
    std::string out = line.substr(begin, end - begin);
    // UTF-8 byte order mark on the first line
    if (out.rfind("\xEF\xBB\xBF", 0) == 0) out.erase(0, 3);
    if (out.empty() || out.front() == '#') return {};
    std::replace(out.begin(), out.end(), '\\', '/');
    const auto first = out.find_first_not_of('/');
    if (first == std::string::npos) return {};
    // "a/./b", "a//b" and "a/b" must be one entry; leading ".." survives for PathGuard.
    auto normal = std::filesystem::path(out.substr(first)).lexically_normal().generic_string();
    if (normal.empty() || normal == ".") return {};
    return normal;
}

void Manifest::add(const std::string& line) {
    auto entry = normalize(line);
    if (entry.empty()) return;
    entries_.push_back(std::move(entry));
}

Manifest Manifest::parse(std::istream& in) {
    Manifest manifest;
    std::string line;
    while (std::getline(in, line)) {
        manifest.add(line);
    }

    // keep first occurrence order
    std::unordered_set<std::string> seen;
    std::vector<ManifestEntry> unique;
    unique.reserve(manifest.entries_.size());
    for (auto& e : manifest.entries_) {
        if (seen.insert(e).second) unique.push_back(std::move(e));
    }
    if (unique.size() != manifest.entries_.size()) {
        spdlog::debug("Manifest: dropped {} duplicate entries", manifest.entries_.size() - unique.size());
    }
    manifest.entries_ = std::move(unique);
    return manifest;
}

Manifest Manifest::fromEntries(const std::vector<std::string>& lines) {
    std::string joined;
    for (const auto& l : lines) {
        joined += l;
        joined.push_back('\n');
    }
    std::istringstream iss(joined);
    return parse(iss);
}

Manifest Manifest::load(const std::filesystem::path& path) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        throw std::runtime_error("manifest not found: " + path.string());
    }
    auto manifest = parse(ifs);
    spdlog::info("Manifest: loaded {} entries from {}", manifest.size(), path.string());
    return manifest;
}

}  // namespace sitemirror
