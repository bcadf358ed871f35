#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>

namespace sitemirror {

struct MirrorConfig {
    std::string base_url{"https://homdgcat.wiki"};
    std::string site_dir{"site"};
    std::string manifest_path{"filelist.txt"};
    std::string failure_report_path{"download_failures.txt"};
    size_t workers{10};
    int retries{3};
    std::chrono::milliseconds backoff_unit{1000};
    std::chrono::milliseconds timeout{30000};
    size_t chunk_size{65536};
    uint16_t port{9000};
    std::string bind_address{"::"};
    size_t cache_entries{1024};
    std::string lang;  // "zh", "en" or empty for locale detection
};

MirrorConfig loadMirrorConfig();

// Layering: defaults < JSON file (SITEMIRROR_CONFIG or ~/.sitemirror/config.json) < environment.
// The second element describes the sources that contributed, e.g. "env:WORKERS=4 |sources=env".
std::pair<MirrorConfig, std::string> loadMirrorConfigWithLog();

}  // namespace sitemirror
