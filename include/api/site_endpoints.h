#pragma once

#include <filesystem>
#include <httplib.h>

#include "serve/conditional_responder.h"
#include "serve/response_cache.h"
#include "serve/static_resolver.h"

namespace sitemirror {

/// GET/HEAD handler serving the mirrored tree.
class SiteEndpoints {
public:
    explicit SiteEndpoints(const std::filesystem::path& site_root, size_t cache_entries = 1024);

    void registerRoutes(httplib::Server& server);

    void handle(const httplib::Request& req, httplib::Response& res);

    ResponseCache& cache() { return cache_; }

    /// Copy a StaticResponse onto an httplib response; raw bodies are streamed.
    static void apply(const StaticResponse& out, httplib::Response& res);

private:
    StaticResolver resolver_;
    ResponseCache cache_;
    ConditionalResponder responder_;
};

}  // namespace sitemirror
