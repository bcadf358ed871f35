#include <gtest/gtest.h>
#include <httplib.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "api/http_server.h"
#include "api/serve_engine.h"
#include "api/site_endpoints.h"
#include "runtime/state.h"
#include "utils/gzip.h"

using namespace sitemirror;
namespace fs = std::filesystem;

namespace {
class TempDir {
public:
    TempDir() {
        auto base = fs::temp_directory_path() / fs::path("http-server-XXXXXX");
        std::string tmpl = base.string();
        std::vector<char> buf(tmpl.begin(), tmpl.end());
        buf.push_back('\0');
        char* created = mkdtemp(buf.data());
        path = created ? fs::path(created) : fs::temp_directory_path();
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }

    fs::path path;
};

void writeFile(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream(path, std::ios::binary) << content;
}

std::string scriptBody() {
    std::string body;
    for (int i = 0; i < 500; ++i) body += "var v" + std::to_string(i) + " = " + std::to_string(i) + ";\n";
    return body;
}

std::string styleBody() {
    std::string body;
    for (int i = 0; i < 200; ++i) body += ".c" + std::to_string(i) + " { margin: " + std::to_string(i) + "px; }\n";
    return body;
}

// True when ::1 can be bound, i.e. the host has an IPv6 loopback.
bool hasIpv6Loopback() {
    int fd = socket(AF_INET6, SOCK_STREAM, 0);
    if (fd < 0) return false;
    sockaddr_in6 addr{};
    addr.sin6_family = AF_INET6;
    addr.sin6_addr = in6addr_loopback;
    addr.sin6_port = 0;
    const bool ok = bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0;
    close(fd);
    return ok;
}

class HttpServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        writeFile(tmp.path / "site/index/index.html", "<html>home</html>");
        writeFile(tmp.path / "site/sr/char/1001/index.html", "<html>char</html>");
        writeFile(tmp.path / "site/js/app.js", scriptBody());
        writeFile(tmp.path / "site/css/main.css", styleBody());
        writeFile(tmp.path / "site/images/a.png", std::string(2048, 'p'));
        writeFile(tmp.path / "site/images/a b.png", "spaced");
        writeFile(tmp.path / "secret.txt", "secret");

        engine = makePlainEngine();
        site = std::make_unique<SiteEndpoints>(tmp.path / "site", 64);
        ListenerOptions opts;
        opts.port = 0;
        opts.worker_threads = 8;
        server = std::make_unique<HttpServer>(*engine, *site, opts);
        server->start();
        ASSERT_GT(server->port(), 0);
    }

    void TearDown() override {
        if (server) server->stop();
    }

    httplib::Client client() const {
        httplib::Client cli("127.0.0.1", server->port());
        cli.set_decompress(false);
        return cli;
    }

    TempDir tmp;
    std::unique_ptr<ServeEngine> engine;
    std::unique_ptr<SiteEndpoints> site;
    std::unique_ptr<HttpServer> server;
};
}  // namespace

TEST_F(HttpServerTest, ServesFileWithCachingHeaders) {
    auto cli = client();
    auto res = cli.Get("/images/a.png");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_EQ(res->body, std::string(2048, 'p'));
    EXPECT_EQ(res->get_header_value("Content-Type"), "image/png");
    EXPECT_EQ(res->get_header_value("Content-Length"), "2048");
    EXPECT_EQ(res->get_header_value("Cache-Control"), "public, max-age=604800");
    EXPECT_EQ(res->get_header_value("Access-Control-Allow-Origin"), "*");
    EXPECT_FALSE(res->get_header_value("ETag").empty());
    EXPECT_FALSE(res->get_header_value("Last-Modified").empty());
    EXPECT_FALSE(res->has_header("Content-Encoding"));
}

TEST_F(HttpServerTest, CompressesTextWhenClientAcceptsGzip) {
    auto cli = client();
    auto res = cli.Get("/js/app.js", {{"Accept-Encoding", "gzip, deflate"}});
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_EQ(res->get_header_value("Content-Encoding"), "gzip");
    EXPECT_EQ(res->get_header_value("Vary"), "Accept-Encoding");
    EXPECT_EQ(res->get_header_value("Content-Length"), std::to_string(res->body.size()));
    auto inflated = gzipDecompress(res->body);
    ASSERT_TRUE(inflated.has_value());
    EXPECT_EQ(*inflated, scriptBody());

    auto plain = cli.Get("/js/app.js");
    ASSERT_TRUE(plain);
    EXPECT_FALSE(plain->has_header("Content-Encoding"));
    EXPECT_EQ(plain->body, scriptBody());
}

TEST_F(HttpServerTest, MatchingEtagYieldsNotModified) {
    auto cli = client();
    auto first = cli.Get("/js/app.js");
    ASSERT_TRUE(first);
    const auto etag = first->get_header_value("ETag");

    auto second = cli.Get("/js/app.js", {{"If-None-Match", etag}});
    ASSERT_TRUE(second);
    EXPECT_EQ(second->status, 304);
    EXPECT_TRUE(second->body.empty());
    EXPECT_EQ(second->get_header_value("ETag"), etag);
    EXPECT_EQ(second->get_header_value("Cache-Control"), "public, max-age=86400");
    EXPECT_EQ(second->get_header_value("Vary"), "Accept-Encoding");
    EXPECT_EQ(second->get_header_value("Access-Control-Allow-Origin"), "*");
}

TEST_F(HttpServerTest, HeadMatchesGetWithoutBody) {
    auto cli = client();
    const httplib::Headers gzip{{"Accept-Encoding", "gzip"}};
    auto get = cli.Get("/js/app.js", gzip);
    auto head = cli.Head("/js/app.js", gzip);
    ASSERT_TRUE(get);
    ASSERT_TRUE(head);
    EXPECT_EQ(head->status, 200);
    EXPECT_TRUE(head->body.empty());
    EXPECT_EQ(head->headers, get->headers);
    EXPECT_EQ(head->get_header_value("Content-Encoding"), "gzip");
    EXPECT_EQ(head->get_header_value("Accept-Ranges"), "bytes");

    auto raw_get = cli.Get("/images/a.png");
    auto raw_head = cli.Head("/images/a.png");
    ASSERT_TRUE(raw_get);
    ASSERT_TRUE(raw_head);
    EXPECT_TRUE(raw_head->body.empty());
    EXPECT_EQ(raw_head->headers, raw_get->headers);
    EXPECT_EQ(raw_head->get_header_value("Content-Length"), "2048");
}

TEST_F(HttpServerTest, TextBodyIsGzippedExactlyOnce) {
    auto cli = client();
    auto res = cli.Get("/css/main.css", {{"Accept-Encoding", "gzip, deflate"}});
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_EQ(res->get_header_value("Content-Type"), "text/css; charset=utf-8");
    EXPECT_EQ(res->get_header_value_count("Content-Encoding"), 1u);
    EXPECT_EQ(res->get_header_value("Content-Length"), std::to_string(res->body.size()));
    auto inflated = gzipDecompress(res->body);
    ASSERT_TRUE(inflated.has_value());
    EXPECT_EQ(*inflated, styleBody());
}

TEST_F(HttpServerTest, RootAndDirectoryIndexes) {
    auto cli = client();
    auto root = cli.Get("/");
    ASSERT_TRUE(root);
    EXPECT_EQ(root->status, 200);
    EXPECT_EQ(root->body, "<html>home</html>");
    EXPECT_EQ(root->get_header_value("Content-Type"), "text/html; charset=utf-8");

    auto dir = cli.Get("/sr/char/1001/?lang=en");
    ASSERT_TRUE(dir);
    EXPECT_EQ(dir->status, 200);
    EXPECT_EQ(dir->body, "<html>char</html>");
}

TEST_F(HttpServerTest, PercentEncodedNamesResolve) {
    auto cli = client();
    auto res = cli.Get("/images/a%20b.png");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_EQ(res->body, "spaced");
}

TEST_F(HttpServerTest, MissingAndEscapingPathsAre404) {
    auto cli = client();
    auto missing = cli.Get("/nope.js");
    ASSERT_TRUE(missing);
    EXPECT_EQ(missing->status, 404);
    EXPECT_EQ(missing->get_header_value("Access-Control-Allow-Origin"), "*");
    EXPECT_NE(missing->body.find("not_found"), std::string::npos);

    auto escaped = cli.Get("/%2e%2e/secret.txt");
    ASSERT_TRUE(escaped);
    EXPECT_EQ(escaped->status, 404);
    EXPECT_NE(escaped->body, "secret");
}

TEST_F(HttpServerTest, PersistentConnectionServesManyRequests) {
    auto cli = client();
    cli.set_keep_alive(true);
    for (int i = 0; i < 10; ++i) {
        auto res = cli.Get("/images/a.png");
        ASSERT_TRUE(res);
        EXPECT_EQ(res->status, 200);
    }
}

TEST_F(HttpServerTest, ConcurrentClientsAllSucceed) {
    std::atomic<int> ok{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([this, &ok]() {
            auto cli = client();
            for (int i = 0; i < 5; ++i) {
                auto res = cli.Get("/js/app.js", {{"Accept-Encoding", "gzip"}});
                if (res && res->status == 200) ++ok;
            }
        });
    }
    for (auto& th : threads) th.join();
    EXPECT_EQ(ok.load(), 40);
    EXPECT_EQ(site->cache().stats().entry_count, 1u);
}

TEST_F(HttpServerTest, RequestsAreCounted) {
    const auto before = total_request_count();
    auto cli = client();
    ASSERT_TRUE(cli.Get("/"));
    ASSERT_TRUE(cli.Get("/nope"));
    // the access logger runs after the response is on the wire
    for (int i = 0; i < 100 && total_request_count() < before + 2; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    EXPECT_GE(total_request_count(), before + 2);
}

TEST(HttpServerBindTest, BusyPortIsAStartupError) {
    TempDir tmp;
    fs::create_directories(tmp.path / "site");
    auto engine = makePlainEngine();
    SiteEndpoints site(tmp.path / "site");

    ListenerOptions first_opts;
    first_opts.port = 0;
    first_opts.bind_address = "127.0.0.1";
    HttpServer first(*engine, site, first_opts);
    first.start();

    ListenerOptions second_opts;
    second_opts.port = static_cast<uint16_t>(first.port());
    second_opts.bind_address = "127.0.0.1";
    HttpServer second(*engine, site, second_opts);
    EXPECT_THROW(second.start(), std::runtime_error);
    first.stop();
}

TEST(HttpServerBindTest, WildcardBindReachesBothFamilies) {
    TempDir tmp;
    writeFile(tmp.path / "site/a.txt", "hello");
    auto engine = makePlainEngine();
    SiteEndpoints site(tmp.path / "site");

    ListenerOptions opts;
    opts.port = 0;
    opts.worker_threads = 2;
    HttpServer server(*engine, site, opts);

    std::mutex log_mutex;
    std::vector<std::string> logged;
    server.setLogger([&](const httplib::Request& req, const httplib::Response& res) {
        std::lock_guard<std::mutex> lock(log_mutex);
        logged.push_back(req.method + " " + req.path + " " + std::to_string(res.status));
    });
    server.start();
    ASSERT_GT(server.port(), 0);

    size_t expected = 1;
    httplib::Client v4("127.0.0.1", server.port());
    auto res4 = v4.Get("/a.txt");
    ASSERT_TRUE(res4);
    EXPECT_EQ(res4->status, 200);
    EXPECT_EQ(res4->body, "hello");

    if (server.dualStack()) {
        EXPECT_EQ(server.boundAddress(), "::");
        if (hasIpv6Loopback()) {
            httplib::Client v6("::1", server.port());
            auto res6 = v6.Get("/a.txt");
            ASSERT_TRUE(res6);
            EXPECT_EQ(res6->status, 200);
            EXPECT_EQ(res6->body, "hello");
            ++expected;
        }
    } else {
        EXPECT_EQ(server.boundAddress(), "0.0.0.0");
    }

    for (int i = 0; i < 100; ++i) {
        {
            std::lock_guard<std::mutex> lock(log_mutex);
            if (logged.size() >= expected) break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    server.stop();
    std::lock_guard<std::mutex> lock(log_mutex);
    ASSERT_EQ(logged.size(), expected);
    EXPECT_EQ(logged[0], "GET /a.txt 200");
}

TEST(HttpServerBindTest, ExplicitIpv4AddressIsNotDualStack) {
    TempDir tmp;
    fs::create_directories(tmp.path / "site");
    auto engine = makePlainEngine();
    SiteEndpoints site(tmp.path / "site");

    ListenerOptions opts;
    opts.port = 0;
    opts.bind_address = "127.0.0.1";
    HttpServer server(*engine, site, opts);
    server.start();
    EXPECT_FALSE(server.dualStack());
    EXPECT_EQ(server.boundAddress(), "127.0.0.1");
    server.stop();
}
