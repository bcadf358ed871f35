#include "mirror/mirror_status.h"

#include <algorithm>
#include <unordered_map>

#include "mirror/path_guard.h"

namespace fs = std::filesystem;

namespace sitemirror {

std::string missingCategory(const ManifestEntry& entry) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (start <= entry.size()) {
        size_t pos = entry.find('/', start);
        if (pos == std::string::npos) pos = entry.size();
        if (pos > start) parts.push_back(entry.substr(start, pos - start));
        start = pos + 1;
    }
    if (parts.empty()) return entry;
    if (parts.size() > 2) return parts[0] + "/" + parts[1];
    return parts[0];
}

MirrorStatusReport scanMirror(const Manifest& manifest, const fs::path& root, size_t top_categories) {
    const PathGuard guard(root);
    MirrorStatusReport report;
    report.total = manifest.size();

    std::vector<std::pair<std::string, size_t>> categories;
    std::unordered_map<std::string, size_t> category_index;

    for (const auto& entry : manifest.entries()) {
        bool present = false;
        uint64_t size = 0;
        if (auto target = guard.resolve(entry)) {
            std::error_code ec;
            if (fs::is_regular_file(*target, ec)) {
                size = fs::file_size(*target, ec);
                present = !ec && size > 0;
            }
        }

        if (present) {
            ++report.present;
            report.present_bytes += size;
            continue;
        }

        ++report.missing;
        report.pending.push_back(entry);
        const auto category = missingCategory(entry);
        auto it = category_index.find(category);
        if (it == category_index.end()) {
            category_index.emplace(category, categories.size());
            categories.emplace_back(category, 1);
        } else {
            ++categories[it->second].second;
        }
    }

    std::stable_sort(categories.begin(), categories.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });
    if (categories.size() > top_categories) categories.resize(top_categories);
    report.missing_categories = std::move(categories);
    return report;
}

}  // namespace sitemirror
