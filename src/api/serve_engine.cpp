#include "api/serve_engine.h"

#include <stdexcept>
#include <spdlog/spdlog.h>

namespace sitemirror {

namespace {

class PlainEngine : public ServeEngine {
public:
    std::string name() const override { return "httplib"; }
    std::string protocol() const override { return "HTTP/1.1"; }
    std::string scheme() const override { return "http"; }

    std::unique_ptr<httplib::Server> createServer() const override {
        return std::make_unique<httplib::Server>();
    }
};

#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
class TlsEngine : public ServeEngine {
public:
    TlsEngine(std::string cert_path, std::string key_path)
        : cert_path_(std::move(cert_path)), key_path_(std::move(key_path)) {}

    std::string name() const override { return "httplib + OpenSSL"; }
    std::string protocol() const override { return "HTTPS (HTTP/1.1)"; }
    std::string scheme() const override { return "https"; }

    std::unique_ptr<httplib::Server> createServer() const override {
        auto server = std::make_unique<httplib::SSLServer>(cert_path_.c_str(), key_path_.c_str());
        if (!server->is_valid()) {
            throw std::runtime_error("invalid TLS certificate or key: " + cert_path_ + ", " + key_path_);
        }
        return server;
    }

private:
    std::string cert_path_;
    std::string key_path_;
};
#endif

}  // namespace

bool tlsSupported() {
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
    return true;
#else
    return false;
#endif
}

std::unique_ptr<ServeEngine> makePlainEngine() {
    return std::make_unique<PlainEngine>();
}

std::unique_ptr<ServeEngine> makeTlsEngine(const std::string& cert_path, const std::string& key_path) {
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
    return std::make_unique<TlsEngine>(cert_path, key_path);
#else
    (void)cert_path;
    (void)key_path;
    throw std::runtime_error("TLS serving requires a build with OpenSSL support");
#endif
}

std::unique_ptr<ServeEngine> selectServeEngine(const std::string& cert_path, const std::string& key_path) {
    if (cert_path.empty() != key_path.empty()) {
        throw std::runtime_error("--cert and --key must be given together");
    }
    if (cert_path.empty()) {
        spdlog::info("ServeEngine: plain HTTP (tls available={})", tlsSupported());
        return makePlainEngine();
    }
    spdlog::info("ServeEngine: TLS with cert={}", cert_path);
    return makeTlsEngine(cert_path, key_path);
}

}  // namespace sitemirror
