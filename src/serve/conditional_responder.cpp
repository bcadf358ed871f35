#include "serve/conditional_responder.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <unordered_map>
#include <unordered_set>
#include <spdlog/spdlog.h>

namespace sitemirror {

namespace {

const std::unordered_set<std::string> kCompressible = {
    ".js", ".css", ".html", ".json", ".svg", ".txt", ".xml",
};

// images, fonts, audio: content never changes under the same name
const std::unordered_set<std::string> kLongLived = {
    ".png", ".jpg", ".jpeg", ".gif", ".webp", ".woff", ".woff2", ".wav", ".ico",
};

const std::unordered_map<std::string, std::string> kMimeTypes = {
    {".js", "application/javascript; charset=utf-8"},
    {".css", "text/css; charset=utf-8"},
    {".json", "application/json; charset=utf-8"},
    {".html", "text/html; charset=utf-8"},
    {".png", "image/png"},
    {".jpg", "image/jpeg"},
    {".jpeg", "image/jpeg"},
    {".gif", "image/gif"},
    {".svg", "image/svg+xml; charset=utf-8"},
    {".webp", "image/webp"},
    {".wav", "audio/wav"},
    {".woff2", "font/woff2"},
    {".woff", "font/woff"},
    {".xml", "application/xml; charset=utf-8"},
    {".txt", "text/plain; charset=utf-8"},
    {".ico", "image/x-icon"},
};

std::string trim(const std::string& s) {
    const auto begin = s.find_first_not_of(" \t");
    if (begin == std::string::npos) return {};
    const auto end = s.find_last_not_of(" \t");
    return s.substr(begin, end - begin + 1);
}

std::string toHex(uint64_t value) {
    static const char* kHex = "0123456789abcdef";
    if (value == 0) return "0";
    std::string out;
    while (value) {
        out.push_back(kHex[value & 0xF]);
        value >>= 4;
    }
    std::reverse(out.begin(), out.end());
    return out;
}

}  // namespace

std::string StaticResponse::header(const std::string& name) const {
    for (const auto& h : headers) {
        if (h.first == name) return h.second;
    }
    return {};
}

bool StaticResponse::hasHeader(const std::string& name) const {
    return std::any_of(headers.begin(), headers.end(), [&](const auto& h) { return h.first == name; });
}

ConditionalResponder::ConditionalResponder(ResponseCache& cache, uint64_t min_compress_size)
    : cache_(cache), min_compress_size_(min_compress_size) {}

std::string ConditionalResponder::makeEtag(const LocalFile& file) {
    return "\"" + toHex(static_cast<uint64_t>(file.mtime_ns)) + "-" + toHex(file.size) + "\"";
}

bool ConditionalResponder::etagMatches(const std::string& if_none_match, const std::string& etag) {
    size_t start = 0;
    while (start <= if_none_match.size()) {
        size_t comma = if_none_match.find(',', start);
        if (comma == std::string::npos) comma = if_none_match.size();
        std::string tag = trim(if_none_match.substr(start, comma - start));
        if (tag == "*") return true;
        if (tag.rfind("W/", 0) == 0) tag.erase(0, 2);
        if (!tag.empty() && tag == etag) return true;
        start = comma + 1;
    }
    return false;
}

bool ConditionalResponder::acceptsGzip(const std::string& accept_encoding) {
    std::string enc = accept_encoding;
    std::transform(enc.begin(), enc.end(), enc.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return enc.find("gzip") != std::string::npos;
}

bool ConditionalResponder::isCompressible(const std::string& extension) {
    return kCompressible.count(extension) > 0;
}

std::string ConditionalResponder::contentTypeFor(const std::string& extension) {
    auto it = kMimeTypes.find(extension);
    return it == kMimeTypes.end() ? "application/octet-stream" : it->second;
}

std::string ConditionalResponder::cacheControlFor(const std::string& extension) {
    if (kLongLived.count(extension)) return "public, max-age=604800";
    if (extension == ".js" || extension == ".css") return "public, max-age=86400";
    return "public, max-age=3600";
}

std::string ConditionalResponder::httpDate(int64_t epoch_seconds) {
    std::time_t t = static_cast<std::time_t>(epoch_seconds);
    std::tm tm_utc{};
    gmtime_r(&t, &tm_utc);
    static const char* kDays[] = {"Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat"};
    static const char* kMonths[] = {"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                    "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%s, %02d %s %04d %02d:%02d:%02d GMT", kDays[tm_utc.tm_wday], tm_utc.tm_mday,
                  kMonths[tm_utc.tm_mon], tm_utc.tm_year + 1900, tm_utc.tm_hour, tm_utc.tm_min, tm_utc.tm_sec);
    return buf;
}

StaticResponse ConditionalResponder::respond(const LocalFile& file, const ConditionalRequest& request) const {
    StaticResponse res;
    res.head_only = request.head_only;

    const std::string etag = makeEtag(file);
    const std::string cache_control = cacheControlFor(file.extension);
    const bool compressible = isCompressible(file.extension);

    if (!request.if_none_match.empty() && etagMatches(request.if_none_match, etag)) {
        res.status = 304;
        res.headers.emplace_back("ETag", etag);
        res.headers.emplace_back("Cache-Control", cache_control);
        if (compressible) res.headers.emplace_back("Vary", "Accept-Encoding");
        res.headers.emplace_back("Access-Control-Allow-Origin", "*");
        return res;
    }

    // HEAD takes the same branch as GET so both advertise the same length and encoding.
    const bool use_gzip = compressible && file.size > min_compress_size_ && acceptsGzip(request.accept_encoding);
    if (use_gzip) {
        auto compressed = cache_.getCompressed(file);
        if (!compressed) {
            res.status = 500;
            return res;
        }
        res.body = std::move(*compressed);
        res.content_length = res.body.size();
    } else {
        std::ifstream readable(file.path, std::ios::binary);
        if (!readable.is_open()) {
            spdlog::warn("ConditionalResponder: cannot open {}", file.path.string());
            res.status = 500;
            return res;
        }
        res.body_file = file.path;
        res.content_length = file.size;
    }

    res.status = 200;
    res.headers.emplace_back("Content-Type", contentTypeFor(file.extension));
    res.headers.emplace_back("Content-Length", std::to_string(res.content_length));
    res.headers.emplace_back("ETag", etag);
    res.headers.emplace_back("Cache-Control", cache_control);
    res.headers.emplace_back("Last-Modified", httpDate(file.mtime_ns / 1000000000LL));
    if (use_gzip) {
        res.headers.emplace_back("Content-Encoding", "gzip");
        res.headers.emplace_back("Vary", "Accept-Encoding");
    }
    res.headers.emplace_back("Access-Control-Allow-Origin", "*");
    return res;
}

}  // namespace sitemirror
