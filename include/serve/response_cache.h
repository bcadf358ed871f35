#pragma once

#include <cstddef>
#include <cstdint>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "serve/local_file.h"

namespace sitemirror {

/// (absolute path, mtime, size). A modified file produces a new key, so stale
/// entries are never returned; they simply age out of the LRU.
struct CacheFingerprint {
    std::string path;
    int64_t mtime_ns{0};
    uint64_t size{0};

    static CacheFingerprint of(const LocalFile& file);
    std::string key() const;
};

/// LRU cache of gzip-compressed file bodies.
///
/// Compression runs outside the lock. Two threads missing on the same fingerprint
/// both compress and the later insert wins; the bytes are identical because the
/// input file and the compression level are the same.
class ResponseCache {
public:
    struct Stats {
        uint64_t hits{0};
        uint64_t misses{0};
        size_t entry_count{0};
        size_t max_entries{0};
        size_t current_bytes{0};
    };

    /// max_entries == 0 disables caching; every call compresses afresh.
    explicit ResponseCache(size_t max_entries = 1024, int compression_level = 6);

    /// Compressed body for file; nullopt if the file cannot be read or compressed.
    std::optional<std::string> getCompressed(const LocalFile& file);

    void clear();
    Stats stats() const;
    bool enabled() const { return max_entries_ > 0; }

private:
    struct Entry {
        std::string key;
        std::string bytes;
    };

    std::optional<std::string> lookup(const std::string& key);
    void insert(const std::string& key, const std::string& bytes);

    mutable std::mutex mutex_;
    size_t max_entries_;
    int compression_level_;
    size_t current_bytes_{0};
    uint64_t hits_{0};
    uint64_t misses_{0};

    // front = most recently used
    std::list<Entry> entries_;
    std::unordered_map<std::string, std::list<Entry>::iterator> lookup_;
};

}  // namespace sitemirror
