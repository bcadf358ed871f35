#include "api/site_endpoints.h"

#include <algorithm>
#include <fstream>
#include <memory>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>

namespace sitemirror {

namespace {
constexpr size_t kStreamChunk = 65536;
}  // namespace

SiteEndpoints::SiteEndpoints(const std::filesystem::path& site_root, size_t cache_entries)
    : resolver_(site_root), cache_(cache_entries), responder_(cache_) {}

void SiteEndpoints::registerRoutes(httplib::Server& server) {
    // HEAD is dispatched to GET handlers; the body is dropped by httplib.
    server.Get(".*", [this](const httplib::Request& req, httplib::Response& res) { handle(req, res); });
}

void SiteEndpoints::handle(const httplib::Request& req, httplib::Response& res) {
    const std::string& target = req.target.empty() ? req.path : req.target;
    auto file = resolver_.resolve(target);
    if (!file) {
        res.status = 404;
        return;
    }

    ConditionalRequest request;
    request.if_none_match = req.get_header_value("If-None-Match");
    request.accept_encoding = req.get_header_value("Accept-Encoding");
    request.head_only = req.method == "HEAD";

    apply(responder_.respond(*file, request), res);
}

void SiteEndpoints::apply(const StaticResponse& out, httplib::Response& res) {
    res.status = out.status;
    if (out.status >= 500) {
        return;
    }

    std::string content_type;
    for (const auto& h : out.headers) {
        if (h.first == "Content-Type") {
            content_type = h.second;
        } else if (h.first != "Content-Length") {
            // httplib derives Content-Length from the body or provider length
            res.set_header(h.first, h.second);
        }
    }
    if (out.status != 200) {
        return;
    }
    // httplib adds this to HEAD only; set it here so GET and HEAD carry the same headers.
    res.set_header("Accept-Ranges", "bytes");

    // Fixed-length providers are never re-encoded by httplib, even with CPPHTTPLIB_ZLIB_SUPPORT.
    if (out.body_file.empty()) {
        auto body = std::make_shared<std::string>(out.body);
        res.set_content_provider(
            body->size(), content_type,
            [body](size_t offset, size_t length, httplib::DataSink& sink) {
                if (offset >= body->size()) {
                    return false;
                }
                const size_t n = std::min({length, body->size() - offset, kStreamChunk});
                return sink.write(body->data() + offset, n);
            });
        return;
    }

    auto stream = std::make_shared<std::ifstream>(out.body_file, std::ios::binary);
    if (!stream->is_open()) {
        spdlog::warn("SiteEndpoints: file vanished before streaming: {}", out.body_file.string());
        res.headers.clear();
        res.status = 500;
        return;
    }
    res.set_content_provider(
        static_cast<size_t>(out.content_length), content_type,
        [stream](size_t offset, size_t length, httplib::DataSink& sink) {
            std::vector<char> buffer(std::min(length, kStreamChunk));
            stream->clear();
            stream->seekg(static_cast<std::streamoff>(offset));
            stream->read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            const auto n = stream->gcount();
            if (n <= 0) {
                return false;
            }
            return sink.write(buffer.data(), static_cast<size_t>(n));
        });
}

}  // namespace sitemirror
