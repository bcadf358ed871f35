#pragma once

#include <httplib.h>
#include <memory>
#include <string>

namespace sitemirror {

/// Serving capability chosen once at startup. The plain engine is always
/// available; the TLS engine exists only in builds with OpenSSL support.
class ServeEngine {
public:
    virtual ~ServeEngine() = default;

    virtual std::string name() const = 0;
    virtual std::string protocol() const = 0;
    virtual std::string scheme() const = 0;

    /// A fresh, unconfigured server. Throws std::runtime_error if it cannot be created.
    virtual std::unique_ptr<httplib::Server> createServer() const = 0;
};

bool tlsSupported();

std::unique_ptr<ServeEngine> makePlainEngine();

/// Throws std::runtime_error when this build has no TLS support.
std::unique_ptr<ServeEngine> makeTlsEngine(const std::string& cert_path, const std::string& key_path);

/// TLS when both paths are given, plain when neither is. Exactly one of the two is
/// an error, as is asking for TLS in a build without it (std::runtime_error).
std::unique_ptr<ServeEngine> selectServeEngine(const std::string& cert_path, const std::string& key_path);

}  // namespace sitemirror
