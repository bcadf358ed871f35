#include "serve/response_cache.h"

#include <fstream>
#include <iterator>
#include <spdlog/spdlog.h>

#include "utils/gzip.h"

namespace sitemirror {

CacheFingerprint CacheFingerprint::of(const LocalFile& file) {
    return CacheFingerprint{file.path.string(), file.mtime_ns, file.size};
}

std::string CacheFingerprint::key() const {
    return path + "\n" + std::to_string(mtime_ns) + "\n" + std::to_string(size);
}

ResponseCache::ResponseCache(size_t max_entries, int compression_level)
    : max_entries_(max_entries), compression_level_(compression_level) {}

std::optional<std::string> ResponseCache::lookup(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = lookup_.find(key);
    if (it == lookup_.end()) {
        ++misses_;
        return std::nullopt;
    }
    entries_.splice(entries_.begin(), entries_, it->second);
    ++hits_;
    return it->second->bytes;
}

void ResponseCache::insert(const std::string& key, const std::string& bytes) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto existing = lookup_.find(key);
    if (existing != lookup_.end()) {
        // lost a population race; last writer wins
        current_bytes_ -= existing->second->bytes.size();
        existing->second->bytes = bytes;
        current_bytes_ += bytes.size();
        entries_.splice(entries_.begin(), entries_, existing->second);
        return;
    }

    while (!entries_.empty() && entries_.size() >= max_entries_) {
        auto& victim = entries_.back();
        current_bytes_ -= victim.bytes.size();
        lookup_.erase(victim.key);
        entries_.pop_back();
    }

    entries_.push_front(Entry{key, bytes});
    lookup_[key] = entries_.begin();
    current_bytes_ += bytes.size();
}

std::optional<std::string> ResponseCache::getCompressed(const LocalFile& file) {
    const std::string key = CacheFingerprint::of(file).key();
    if (enabled()) {
        if (auto hit = lookup(key)) {
            return hit;
        }
    }

    std::ifstream ifs(file.path, std::ios::binary);
    if (!ifs.is_open()) {
        spdlog::warn("ResponseCache: cannot open {}", file.path.string());
        return std::nullopt;
    }
    std::string raw((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    if (ifs.bad()) {
        spdlog::warn("ResponseCache: read error on {}", file.path.string());
        return std::nullopt;
    }

    auto compressed = gzipCompress(raw, compression_level_);
    if (!compressed) {
        spdlog::warn("ResponseCache: gzip failed for {}", file.path.string());
        return std::nullopt;
    }

    if (enabled()) {
        insert(key, *compressed);
        spdlog::debug("ResponseCache: stored {} ({} -> {} bytes)", file.path.string(), raw.size(),
                      compressed->size());
    }
    return compressed;
}

void ResponseCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    lookup_.clear();
    current_bytes_ = 0;
}

ResponseCache::Stats ResponseCache::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    Stats s;
    s.hits = hits_;
    s.misses = misses_;
    s.entry_count = entries_.size();
    s.max_entries = max_entries_;
    s.current_bytes = current_bytes_;
    return s;
}

}  // namespace sitemirror
