#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

#include "mirror/download_outcome.h"
#include "mirror/manifest.h"
#include "mirror/path_guard.h"

namespace sitemirror {

struct FetchOptions {
    std::string base_url;
    std::filesystem::path root;
    size_t concurrency{10};
    int max_attempts{3};
    // Attempt n (0-based) sleeps backoff_unit * 2^n before attempt n+1.
    std::chrono::milliseconds backoff_unit{1000};
    std::chrono::milliseconds timeout{30000};
    size_t chunk_size{65536};
    std::string user_agent{"Mozilla/5.0 (Windows NT 10.0; Win64; x64)"};
    // Entries ending in this suffix are requested as the bare directory URL.
    std::string index_suffix{"/index.html"};
};

/// Called once per entry, in completion order. Calls are serialized by the engine.
using OutcomeCallback = std::function<void(const ManifestEntry&, const DownloadOutcome&)>;

/// Pulls manifest entries through a fixed pool of blocking workers. Each entry is
/// streamed into "<target>.tmp" and renamed over the target only after a complete,
/// non-empty body arrived, so readers never observe a partially written file.
class FetchEngine {
public:
    explicit FetchEngine(FetchOptions options);

    void run(const std::vector<ManifestEntry>& entries, const OutcomeCallback& on_outcome);
    void run(const Manifest& manifest, const OutcomeCallback& on_outcome) {
        run(manifest.entries(), on_outcome);
    }

    /// Process a single entry synchronously. Never throws.
    DownloadOutcome fetchOne(const ManifestEntry& entry);

    /// Remote request path for an entry, before percent-encoding
    /// ("sr/char/1001/index.html" -> "/sr/char/1001/").
    static std::string remotePathFor(const ManifestEntry& entry, const std::string& index_suffix);

    /// Number of HTTP requests issued so far.
    uint64_t requestCount() const { return requests_.load(); }

    const FetchOptions& options() const { return options_; }

private:
    DownloadOutcome fetchResolved(const ManifestEntry& entry, const std::filesystem::path& target);

    FetchOptions options_;
    PathGuard guard_;
    std::atomic<uint64_t> requests_{0};
};

}  // namespace sitemirror
