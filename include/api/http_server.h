#pragma once

#include <httplib.h>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace sitemirror {

class ServeEngine;
class SiteEndpoints;

using Logger = std::function<void(const httplib::Request&, const httplib::Response&)>;

struct ListenerOptions {
    // "::" asks for one dual-stack socket and falls back to 0.0.0.0 without IPv6.
    std::string bind_address{"::"};
    uint16_t port{9000};  // 0 picks a free port
    size_t worker_threads{32};
    size_t keep_alive_max_count{100};
    std::chrono::seconds keep_alive_timeout{5};
};

/// Accepts connections and dispatches them to the site endpoints. Connections
/// are persistent and served by a fixed thread pool.
class HttpServer {
public:
    HttpServer(const ServeEngine& engine, SiteEndpoints& site, ListenerOptions options = {});
    ~HttpServer();

    /// Binds and starts the accept loop on a background thread.
    /// Throws std::runtime_error if no address could be bound.
    void start();
    void stop();

    void setLogger(Logger logger) { logger_ = std::move(logger); }

    /// Bound port (resolved after start() when options.port was 0).
    int port() const { return port_; }
    bool dualStack() const { return dual_stack_; }
    const std::string& boundAddress() const { return bound_address_; }

private:
    bool bindTo(const std::string& host, int family, bool dual_stack);

    const ServeEngine& engine_;
    SiteEndpoints& site_;
    ListenerOptions options_;
    std::unique_ptr<httplib::Server> server_;
    std::thread thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> accept_done_{false};
    int port_{0};
    bool dual_stack_{false};
    std::string bound_address_;
    Logger logger_{};
};

}  // namespace sitemirror
