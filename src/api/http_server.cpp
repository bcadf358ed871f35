#include "api/http_server.h"

#include <netinet/in.h>
#include <sys/socket.h>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "api/serve_engine.h"
#include "api/site_endpoints.h"
#include "runtime/state.h"

namespace sitemirror {

namespace {

void setSocketOptions(socket_t sock, bool dual_stack) {
    int yes = 1;
    if (setsockopt(sock, SOL_SOCKET, SO_REUSEADDR, reinterpret_cast<const char*>(&yes), sizeof(yes)) != 0) {
        spdlog::debug("HttpServer: SO_REUSEADDR not applied");
    }
    if (dual_stack) {
        int no = 0;
        if (setsockopt(sock, IPPROTO_IPV6, IPV6_V6ONLY, reinterpret_cast<const char*>(&no), sizeof(no)) != 0) {
            spdlog::debug("HttpServer: IPV6_V6ONLY could not be cleared");
        }
    }
}

}  // namespace

HttpServer::HttpServer(const ServeEngine& engine, SiteEndpoints& site, ListenerOptions options)
    : engine_(engine), site_(site), options_(std::move(options)) {}

HttpServer::~HttpServer() { stop(); }

bool HttpServer::bindTo(const std::string& host, int family, bool dual_stack) {
    server_ = engine_.createServer();
    auto& server = *server_;

    server.set_address_family(family);
    server.set_socket_options([dual_stack](socket_t sock) { setSocketOptions(sock, dual_stack); });

    const size_t threads = options_.worker_threads == 0 ? 1 : options_.worker_threads;
    server.new_task_queue = [threads] { return new httplib::ThreadPool(threads); };
    server.set_keep_alive_max_count(options_.keep_alive_max_count);
    server.set_keep_alive_timeout(static_cast<time_t>(options_.keep_alive_timeout.count()));

    server.set_post_routing_handler([](const httplib::Request&, httplib::Response& res) {
        if (!res.has_header("Access-Control-Allow-Origin")) {
            res.set_header("Access-Control-Allow-Origin", "*");
        }
    });

    server.set_logger([this](const httplib::Request& req, const httplib::Response& res) {
        ++g_total_requests;
        if (logger_) {
            logger_(req, res);
            return;
        }
        spdlog::info("{} {} {} {}", req.method, req.path, res.status, res.get_header_value("Content-Length"));
    });

    server.set_error_handler([](const httplib::Request& req, httplib::Response& res) {
        if (!res.body.empty()) {
            return;
        }
        nlohmann::json body = {
            {"error", res.status == 404 ? "not_found" : "http_error"},
            {"status", res.status},
            {"path", req.path}
        };
        res.set_content(body.dump(), "application/json");
    });

    server.set_exception_handler([](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
        std::string what = "unknown";
        if (ep) {
            try {
                std::rethrow_exception(ep);
            } catch (const std::exception& e) {
                what = e.what();
            }
        }
        spdlog::error("HttpServer: handler failed for {}: {}", req.path, what);
        nlohmann::json body = {
            {"error", "internal_error"},
            {"path", req.path},
            {"message", what}
        };
        res.status = 500;
        res.set_content(body.dump(), "application/json");
    });

    site_.registerRoutes(server);

    if (options_.port == 0) {
        port_ = server.bind_to_any_port(host);
        return port_ > 0;
    }
    port_ = options_.port;
    return server.bind_to_port(host, options_.port);
}

void HttpServer::start() {
    if (running_) return;

    const bool wildcard_v6 = options_.bind_address == "::";
    bool bound = false;
    if (wildcard_v6) {
        bound = bindTo("::", AF_INET6, true);
        if (bound) {
            dual_stack_ = true;
            bound_address_ = "::";
        } else {
            spdlog::warn("HttpServer: dual-stack bind on port {} failed, falling back to IPv4", options_.port);
            bound = bindTo("0.0.0.0", AF_INET, false);
            bound_address_ = "0.0.0.0";
        }
    } else {
        bound = bindTo(options_.bind_address, AF_UNSPEC, false);
        bound_address_ = options_.bind_address;
    }
    if (!bound) {
        server_.reset();
        throw std::runtime_error("cannot bind " + options_.bind_address + ":" + std::to_string(options_.port));
    }

    spdlog::info("HttpServer: {} listening on {}:{} (dual_stack={}, workers={})", engine_.protocol(),
                 bound_address_, port_, dual_stack_, options_.worker_threads);

    running_ = true;
    accept_done_ = false;
    auto* server = server_.get();
    thread_ = std::thread([this, server]() {
        if (!server->listen_after_bind()) {
            spdlog::error("HttpServer: accept loop ended with an error");
        }
        accept_done_ = true;
    });
    while (!server->is_running() && !accept_done_) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

void HttpServer::stop() {
    if (!running_) return;
    server_->stop();
    if (thread_.joinable()) thread_.join();
    running_ = false;
}

}  // namespace sitemirror
