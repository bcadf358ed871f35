#include <gtest/gtest.h>
#include <httplib.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "mirror/fetch_engine.h"
#include "mirror/progress_aggregator.h"

using namespace sitemirror;
namespace fs = std::filesystem;

namespace {
class TempDir {
public:
    TempDir() {
        auto base = fs::temp_directory_path() / fs::path("fetch-engine-XXXXXX");
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

std::string readFile(const fs::path& path) {
    std::ifstream ifs(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
}

struct Route {
    int status{200};
    std::string body;
};

// Fake origin: serves a fixed route table and records what it was asked for.
class FetchEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        addRoute("/a.html", 200, "<html>a</html>");
        addRoute("/b.png", 200, std::string("\x89PNG\r\n\x1a\n", 8) + std::string(100, '\0'));
        addRoute("/empty.js", 200, "");
        addRoute("/flaky.js", 500, "upstream exploded");
        addRoute("/sr/char/1001/", 200, "<html>char 1001</html>");
        addRoute("/images/a b.png", 200, "spaced");

        // Sends half of the body, then blocks until the test releases it.
        streams_["/slow.bin"] = [this](httplib::Response& res) {
            res.set_chunked_content_provider("application/octet-stream", [this](size_t, httplib::DataSink& sink) {
                const std::string half(4096, 's');
                if (!sink.write(half.data(), half.size())) return false;
                first_half_sent_ = true;
                while (!release_slow_) {
                    std::this_thread::sleep_for(std::chrono::milliseconds(5));
                }
                if (!sink.write(half.data(), half.size())) return false;
                sink.done();
                return true;
            });
        };
        // Announces 4096 bytes and closes the connection after 1024.
        streams_["/truncated.bin"] = [](httplib::Response& res) {
            res.set_content_provider(4096, "application/octet-stream",
                                     [](size_t offset, size_t, httplib::DataSink& sink) {
                                         if (offset > 0) return false;
                                         const std::string part(1024, 't');
                                         return sink.write(part.data(), part.size());
                                     });
        };

        server_.Get(".*", [this](const httplib::Request& req, httplib::Response& res) {
            std::lock_guard<std::mutex> lock(mutex_);
            paths_.push_back(req.path);
            targets_.push_back(req.target);
            user_agents_.push_back(req.get_header_value("User-Agent"));
            referers_.push_back(req.get_header_value("Referer"));
            auto stream = streams_.find(req.path);
            if (stream != streams_.end()) {
                stream->second(res);
                return;
            }
            auto it = routes_.find(req.path);
            if (it == routes_.end()) {
                res.status = 404;
                return;
            }
            res.status = it->second.status;
            res.set_content(it->second.body, "application/octet-stream");
        });

        port_ = server_.bind_to_any_port("127.0.0.1");
        ASSERT_GT(port_, 0);
        thread_ = std::thread([this]() { server_.listen_after_bind(); });
        while (!server_.is_running()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
    }

    void TearDown() override {
        release_slow_ = true;
        server_.stop();
        if (thread_.joinable()) thread_.join();
    }

    void addRoute(const std::string& path, int status, const std::string& body) {
        std::lock_guard<std::mutex> lock(mutex_);
        routes_[path] = Route{status, body};
    }

    size_t hits(const std::string& path) {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t n = 0;
        for (const auto& p : paths_) {
            if (p == path) ++n;
        }
        return n;
    }

    size_t totalHits() {
        std::lock_guard<std::mutex> lock(mutex_);
        return paths_.size();
    }

    FetchOptions options(const fs::path& root, size_t concurrency = 4) const {
        FetchOptions opts;
        opts.base_url = "http://127.0.0.1:" + std::to_string(port_);
        opts.root = root;
        opts.concurrency = concurrency;
        opts.max_attempts = 3;
        opts.backoff_unit = std::chrono::milliseconds(1);
        opts.timeout = std::chrono::milliseconds(5000);
        return opts;
    }

    httplib::Server server_;
    std::thread thread_;
    int port_{0};
    std::mutex mutex_;
    std::map<std::string, Route> routes_;
    std::map<std::string, std::function<void(httplib::Response&)>> streams_;
    std::atomic<bool> first_half_sent_{false};
    std::atomic<bool> release_slow_{false};
    std::vector<std::string> paths_;
    std::vector<std::string> targets_;
    std::vector<std::string> user_agents_;
    std::vector<std::string> referers_;
};
}  // namespace

TEST_F(FetchEngineTest, TalliesFetchedAndNotFound) {
    TempDir tmp;
    FetchEngine engine(options(tmp.path / "site"));
    const std::vector<ManifestEntry> entries{"a.html", "missing.js", "b.png"};
    ProgressAggregator progress(entries.size());
    engine.run(entries, [&](const ManifestEntry& e, const DownloadOutcome& o) { progress.record(e, o); });

    auto s = progress.snapshot();
    EXPECT_EQ(s.fetched, 2u);
    EXPECT_EQ(s.not_found, 1u);
    EXPECT_EQ(s.failed, 0u);
    EXPECT_EQ(s.processed, 3u);
    EXPECT_EQ(readFile(tmp.path / "site/a.html"), "<html>a</html>");
    EXPECT_EQ(fs::file_size(tmp.path / "site/b.png"), 108u);
    EXPECT_FALSE(fs::exists(tmp.path / "site/missing.js"));
    EXPECT_FALSE(fs::exists(tmp.path / "site/missing.js.tmp"));
}

TEST_F(FetchEngineTest, SecondRunIssuesNoRequests) {
    TempDir tmp;
    const std::vector<ManifestEntry> entries{"a.html", "b.png"};
    {
        FetchEngine engine(options(tmp.path / "site"));
        engine.run(entries, nullptr);
    }
    const auto before = totalHits();

    FetchEngine again(options(tmp.path / "site"));
    std::vector<DownloadOutcome> outcomes;
    again.run(entries, [&](const ManifestEntry&, const DownloadOutcome& o) { outcomes.push_back(o); });

    ASSERT_EQ(outcomes.size(), 2u);
    for (const auto& o : outcomes) EXPECT_TRUE(o.isAlreadyPresent());
    EXPECT_EQ(again.requestCount(), 0u);
    EXPECT_EQ(totalHits(), before);
}

TEST_F(FetchEngineTest, ZeroLengthLocalFileIsFetchedAgain) {
    TempDir tmp;
    fs::create_directories(tmp.path / "site");
    std::ofstream(tmp.path / "site/a.html").close();

    FetchEngine engine(options(tmp.path / "site"));
    auto outcome = engine.fetchOne("a.html");
    EXPECT_TRUE(outcome.isFetched());
    EXPECT_EQ(readFile(tmp.path / "site/a.html"), "<html>a</html>");
}

TEST_F(FetchEngineTest, TraversalIsBlockedWithoutNetworkAccess) {
    TempDir tmp;
    FetchEngine engine(options(tmp.path / "site"));
    auto outcome = engine.fetchOne("../escape.txt");

    EXPECT_TRUE(outcome.isFailed());
    EXPECT_EQ(outcome.reason, FailureReason::TraversalBlocked);
    EXPECT_EQ(engine.requestCount(), 0u);
    EXPECT_EQ(totalHits(), 0u);
    EXPECT_FALSE(fs::exists(tmp.path / "escape.txt"));
}

TEST_F(FetchEngineTest, EmptyBodyLeavesNoFile) {
    TempDir tmp;
    FetchEngine engine(options(tmp.path / "site"));
    auto outcome = engine.fetchOne("empty.js");

    EXPECT_EQ(outcome.reason, FailureReason::EmptyBody);
    EXPECT_FALSE(fs::exists(tmp.path / "site/empty.js"));
    EXPECT_FALSE(fs::exists(tmp.path / "site/empty.js.tmp"));
    EXPECT_EQ(hits("/empty.js"), 1u);
}

TEST_F(FetchEngineTest, ServerErrorsAreRetriedUntilExhausted) {
    TempDir tmp;
    FetchEngine engine(options(tmp.path / "site"));
    auto outcome = engine.fetchOne("flaky.js");

    EXPECT_EQ(outcome.reason, FailureReason::ExhaustedRetries);
    EXPECT_EQ(outcome.detail, "HTTP 500");
    EXPECT_EQ(hits("/flaky.js"), 3u);
    EXPECT_EQ(engine.requestCount(), 3u);
    EXPECT_FALSE(fs::exists(tmp.path / "site/flaky.js"));
    EXPECT_FALSE(fs::exists(tmp.path / "site/flaky.js.tmp"));
}

TEST_F(FetchEngineTest, NotFoundIsNeverRetried) {
    TempDir tmp;
    FetchEngine engine(options(tmp.path / "site"));
    auto outcome = engine.fetchOne("missing.js");

    EXPECT_TRUE(outcome.isNotFound());
    EXPECT_EQ(hits("/missing.js"), 1u);
}

TEST_F(FetchEngineTest, DirectoryIndexIsRequestedAsDirectoryUrl) {
    TempDir tmp;
    FetchEngine engine(options(tmp.path / "site"));
    auto outcome = engine.fetchOne("sr/char/1001/index.html");

    EXPECT_TRUE(outcome.isFetched());
    EXPECT_EQ(hits("/sr/char/1001/"), 1u);
    EXPECT_EQ(readFile(tmp.path / "site/sr/char/1001/index.html"), "<html>char 1001</html>");
}

TEST_F(FetchEngineTest, RequestPathIsPercentEncoded) {
    TempDir tmp;
    FetchEngine engine(options(tmp.path / "site"));
    auto outcome = engine.fetchOne("images/a b.png");

    EXPECT_TRUE(outcome.isFetched());
    std::lock_guard<std::mutex> lock(mutex_);
    ASSERT_EQ(targets_.size(), 1u);
    EXPECT_EQ(targets_[0], "/images/a%20b.png");
}

TEST_F(FetchEngineTest, SendsBrowserLikeHeaders) {
    TempDir tmp;
    FetchEngine engine(options(tmp.path / "site"));
    ASSERT_TRUE(engine.fetchOne("a.html").isFetched());

    std::lock_guard<std::mutex> lock(mutex_);
    ASSERT_EQ(user_agents_.size(), 1u);
    EXPECT_EQ(user_agents_[0], "Mozilla/5.0 (Windows NT 10.0; Win64; x64)");
    EXPECT_EQ(referers_[0], "http://127.0.0.1:" + std::to_string(port_) + "/");
}

TEST_F(FetchEngineTest, LargeBodyIsStreamedInChunks) {
    std::string big;
    for (int i = 0; i < 20000; ++i) big += std::to_string(i) + ",";
    addRoute("/big.js", 200, big);

    TempDir tmp;
    auto opts = options(tmp.path / "site");
    opts.chunk_size = 1024;
    FetchEngine engine(opts);
    auto outcome = engine.fetchOne("big.js");

    EXPECT_TRUE(outcome.isFetched());
    EXPECT_EQ(outcome.bytes, big.size());
    EXPECT_EQ(readFile(tmp.path / "site/big.js"), big);
}

TEST_F(FetchEngineTest, OutcomesDoNotDependOnPoolSize) {
    std::vector<ManifestEntry> entries;
    for (int i = 0; i < 30; ++i) {
        const std::string name = "data/EN/" + std::to_string(i) + ".js";
        if (i % 3 != 0) addRoute("/" + name, 200, "var v" + std::to_string(i) + ";");
        entries.push_back(name);
    }
    entries.push_back("../outside.js");

    auto tally = [&](size_t workers) {
        TempDir tmp;
        FetchEngine engine(options(tmp.path / "site", workers));
        ProgressAggregator progress(entries.size());
        engine.run(entries, [&](const ManifestEntry& e, const DownloadOutcome& o) { progress.record(e, o); });
        return progress.snapshot();
    };

    auto serial = tally(1);
    auto parallel = tally(8);
    EXPECT_EQ(serial.processed, entries.size());
    EXPECT_EQ(serial.fetched, 20u);
    EXPECT_EQ(serial.not_found, 10u);
    EXPECT_EQ(serial.failed, 1u);
    EXPECT_EQ(parallel.processed, serial.processed);
    EXPECT_EQ(parallel.fetched, serial.fetched);
    EXPECT_EQ(parallel.not_found, serial.not_found);
    EXPECT_EQ(parallel.failed, serial.failed);
    EXPECT_EQ(parallel.bytes, serial.bytes);
}

TEST_F(FetchEngineTest, UnreachableOriginIsReportedAfterRetries) {
    TempDir tmp;
    auto opts = options(tmp.path / "site");
    opts.base_url = "http://127.0.0.1:1";
    opts.max_attempts = 2;
    opts.timeout = std::chrono::milliseconds(1000);
    FetchEngine engine(opts);
    auto outcome = engine.fetchOne("a.html");

    EXPECT_EQ(outcome.reason, FailureReason::ExhaustedRetries);
    EXPECT_FALSE(outcome.detail.empty());
    EXPECT_EQ(engine.requestCount(), 2u);
    EXPECT_FALSE(fs::exists(tmp.path / "site/a.html"));
}

TEST_F(FetchEngineTest, TargetIsAbsentWhileBodyIsArriving) {
    TempDir tmp;
    auto opts = options(tmp.path / "site");
    opts.chunk_size = 1024;
    FetchEngine engine(opts);

    DownloadOutcome outcome;
    std::atomic<bool> finished{false};
    std::thread worker([&]() {
        outcome = engine.fetchOne("slow.bin");
        finished = true;
    });

    for (int i = 0; i < 500 && !first_half_sent_; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    EXPECT_TRUE(first_half_sent_.load());
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    EXPECT_FALSE(finished.load());
    EXPECT_FALSE(fs::exists(tmp.path / "site/slow.bin"));
    EXPECT_TRUE(fs::exists(tmp.path / "site/slow.bin.tmp"));

    release_slow_ = true;
    worker.join();

    EXPECT_TRUE(outcome.isFetched());
    EXPECT_EQ(outcome.bytes, 8192u);
    EXPECT_EQ(readFile(tmp.path / "site/slow.bin"), std::string(8192, 's'));
    EXPECT_FALSE(fs::exists(tmp.path / "site/slow.bin.tmp"));
}

TEST_F(FetchEngineTest, DroppedConnectionLeavesNoFiles) {
    TempDir tmp;
    FetchEngine engine(options(tmp.path / "site"));
    auto outcome = engine.fetchOne("truncated.bin");

    EXPECT_EQ(outcome.reason, FailureReason::ExhaustedRetries);
    EXPECT_NE(outcome.detail, "HTTP 200");
    EXPECT_EQ(hits("/truncated.bin"), 3u);
    EXPECT_FALSE(fs::exists(tmp.path / "site/truncated.bin"));
    EXPECT_FALSE(fs::exists(tmp.path / "site/truncated.bin.tmp"));
}

TEST_F(FetchEngineTest, LocalWriteErrorIsNotRetried) {
    if (!fs::exists("/dev/full")) {
        GTEST_SKIP() << "/dev/full is not available";
    }
    addRoute("/full.bin", 200, std::string(256 * 1024, 'f'));

    TempDir tmp;
    fs::create_directories(tmp.path / "site");
    // every write to the temp file fails with ENOSPC
    fs::create_symlink("/dev/full", tmp.path / "site/full.bin.tmp");

    auto opts = options(tmp.path / "site");
    opts.chunk_size = 1024;
    FetchEngine engine(opts);
    auto outcome = engine.fetchOne("full.bin");

    EXPECT_EQ(outcome.reason, FailureReason::TransportError);
    EXPECT_NE(outcome.detail.find("write failed"), std::string::npos);
    EXPECT_EQ(engine.requestCount(), 1u);
    EXPECT_EQ(hits("/full.bin"), 1u);
    EXPECT_FALSE(fs::exists(tmp.path / "site/full.bin"));
    EXPECT_FALSE(fs::is_symlink(tmp.path / "site/full.bin.tmp"));
}

TEST_F(FetchEngineTest, EquivalentManifestSpellingsAreFetchedOnce) {
    TempDir tmp;
    FetchEngine engine(options(tmp.path / "site", 4));
    auto manifest = Manifest::fromEntries({"./a.html", "a.html", "x/../a.html", "/a.html"});
    ASSERT_EQ(manifest.size(), 1u);

    std::vector<DownloadOutcome> outcomes;
    engine.run(manifest, [&](const ManifestEntry&, const DownloadOutcome& o) { outcomes.push_back(o); });

    ASSERT_EQ(outcomes.size(), 1u);
    EXPECT_TRUE(outcomes[0].isFetched());
    EXPECT_EQ(hits("/a.html"), 1u);
    EXPECT_EQ(readFile(tmp.path / "site/a.html"), "<html>a</html>");
}

TEST(FetchEngineStaticTest, RemotePathStripsIndexSuffix) {
    EXPECT_EQ(FetchEngine::remotePathFor("sr/char/1001/index.html", "/index.html"), "/sr/char/1001/");
    EXPECT_EQ(FetchEngine::remotePathFor("a.html", "/index.html"), "/a.html");
    EXPECT_EQ(FetchEngine::remotePathFor("sr/char/1001/index.html", ""), "/sr/char/1001/index.html");
}
