#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

#include "serve/local_file.h"
#include "serve/response_cache.h"

namespace sitemirror {

/// Request headers the responder looks at.
struct ConditionalRequest {
    std::string if_none_match;
    std::string accept_encoding;
    bool head_only{false};
};

/// Transport-neutral response. Exactly one of body / body_file carries the payload
/// of a 200; content_length always matches it, including for HEAD.
struct StaticResponse {
    int status{200};
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;                   // compressed bytes
    std::filesystem::path body_file;    // raw file to stream
    uint64_t content_length{0};
    bool head_only{false};

    std::string header(const std::string& name) const;
    bool hasHeader(const std::string& name) const;
};

class ConditionalResponder {
public:
    explicit ConditionalResponder(ResponseCache& cache, uint64_t min_compress_size = 256);

    StaticResponse respond(const LocalFile& file, const ConditionalRequest& request) const;

    /// "\"<mtime-ns hex>-<size hex>\""
    static std::string makeEtag(const LocalFile& file);

    /// Matches a comma separated If-None-Match list, honoring "*" and weak "W/" tags.
    static bool etagMatches(const std::string& if_none_match, const std::string& etag);

    static bool acceptsGzip(const std::string& accept_encoding);
    static bool isCompressible(const std::string& extension);
    static std::string contentTypeFor(const std::string& extension);
    static std::string cacheControlFor(const std::string& extension);

    /// RFC 7231 IMF-fixdate, e.g. "Sun, 06 Nov 1994 08:49:37 GMT".
    static std::string httpDate(int64_t epoch_seconds);

private:
    ResponseCache& cache_;
    uint64_t min_compress_size_;
};

}  // namespace sitemirror
