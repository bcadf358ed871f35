#include "cli/commands.h"

#include <chrono>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <spdlog/spdlog.h>

#include "api/http_server.h"
#include "api/serve_engine.h"
#include "api/site_endpoints.h"
#include "runtime/state.h"

namespace sitemirror {
namespace cli {
namespace commands {

int serve(const MirrorConfig& config, const ServeOptions& options, Language lang, std::ostream& out) {
    std::error_code ec;
    if (!std::filesystem::is_directory(config.site_dir, ec)) {
        spdlog::error("serve: site directory {} does not exist", config.site_dir);
        out << tr(lang, "srv_no_site", fmt::arg("path", config.site_dir)) << std::endl;
        return 1;
    }

    std::unique_ptr<ServeEngine> engine;
    try {
        engine = selectServeEngine(options.cert, options.key);
    } catch (const std::runtime_error& e) {
        spdlog::error("serve: {}", e.what());
        if (!options.cert.empty() && !options.key.empty() && !tlsSupported()) {
            out << tr(lang, "srv_no_tls") << std::endl;
        } else {
            out << tr(lang, "srv_failed", fmt::arg("reason", e.what())) << std::endl;
        }
        return 1;
    }

    SiteEndpoints site(config.site_dir, config.cache_entries);
    ListenerOptions listener;
    listener.bind_address = config.bind_address;
    listener.port = options.port != 0 ? options.port : config.port;

    HttpServer server(*engine, site, listener);
    try {
        server.start();
    } catch (const std::runtime_error& e) {
        spdlog::error("serve: {}", e.what());
        out << tr(lang, "srv_failed", fmt::arg("reason", e.what())) << std::endl;
        return 1;
    }

    const std::string rule(55, '=');
    const std::string url = engine->scheme() + "://localhost:" + std::to_string(server.port());
    out << rule << "\n"
        << tr(lang, "srv_title") << "\n"
        << rule << "\n"
        << tr(lang, "srv_engine", fmt::arg("e", engine->name())) << "\n"
        << tr(lang, "srv_proto", fmt::arg("p", engine->protocol())) << "\n"
        << tr(lang, "srv_addr", fmt::arg("url", url)) << "\n"
        << tr(lang, "srv_stop") << "\n"
        << rule << std::endl;

    while (is_running()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    server.stop();
    const auto stats = site.cache().stats();
    spdlog::info("serve: stopped after {} requests (cache hits={} misses={})", total_request_count(), stats.hits,
                 stats.misses);
    out << tr(lang, "srv_stopped") << std::endl;
    return 0;
}

}  // namespace commands
}  // namespace cli
}  // namespace sitemirror
