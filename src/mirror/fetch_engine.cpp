#include "mirror/fetch_engine.h"

#include <algorithm>
#include <fstream>
#include <httplib.h>
#include <memory>
#include <mutex>
#include <regex>
#include <thread>
#include <spdlog/spdlog.h>

#include "utils/url_encode.h"

namespace fs = std::filesystem;

namespace sitemirror {

namespace {

struct HttpUrl {
    std::string scheme;
    std::string host;
    int port{0};
    std::string path;
};

HttpUrl parseUrl(const std::string& url) {
    static const std::regex re(R"(^([a-zA-Z][a-zA-Z0-9+.-]*)://([^/:]+)(?::(\d+))?(.*)$)");
    std::smatch match;
    HttpUrl parsed;
    if (std::regex_match(url, match, re)) {
        parsed.scheme = match[1].str();
        parsed.host = match[2].str();
        parsed.port = match[3].matched ? std::stoi(match[3].str()) : (parsed.scheme == "https" ? 443 : 80);
        parsed.path = match[4].str().empty() ? "/" : match[4].str();
    }
    return parsed;
}

std::unique_ptr<httplib::Client> makeClient(const HttpUrl& url, std::chrono::milliseconds timeout) {
    if (url.scheme.empty() || url.host.empty()) {
        return nullptr;
    }

#ifndef CPPHTTPLIB_OPENSSL_SUPPORT
    if (url.scheme == "https") {
        return nullptr;  // HTTPS is not supported in this build
    }
#endif

    std::string scheme_host_port = url.scheme + "://" + url.host;
    if (url.port != 0) {
        scheme_host_port += ":" + std::to_string(url.port);
    }

    auto client = std::make_unique<httplib::Client>(scheme_host_port);
    if (client && client->is_valid()) {
        const auto sec = static_cast<time_t>(timeout.count() / 1000);
        const auto usec = static_cast<time_t>((timeout.count() % 1000) * 1000);
        client->set_connection_timeout(sec, usec);
        client->set_read_timeout(sec, usec);
        client->set_write_timeout(sec, usec);
        client->set_follow_location(true);
        return client;
    }

    return nullptr;
}

std::string trimTrailingSlash(std::string value) {
    while (!value.empty() && value.back() == '/') {
        value.pop_back();
    }
    return value;
}

bool endsWith(const std::string& value, const std::string& suffix) {
    if (value.size() < suffix.size()) return false;
    return value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool isPresent(const fs::path& target) {
    std::error_code ec;
    if (!fs::is_regular_file(target, ec)) return false;
    const auto size = fs::file_size(target, ec);
    return !ec && size > 0;
}

void removeQuietly(const fs::path& path) {
    std::error_code ec;
    fs::remove(path, ec);
}

}  // namespace

FetchEngine::FetchEngine(FetchOptions options)
    : options_(std::move(options)), guard_(options_.root) {
    options_.concurrency = std::max<size_t>(1, options_.concurrency);
    options_.max_attempts = std::max(1, options_.max_attempts);
    options_.chunk_size = std::max<size_t>(1, options_.chunk_size);
}

std::string FetchEngine::remotePathFor(const ManifestEntry& entry, const std::string& index_suffix) {
    std::string path = "/" + entry;
    if (!index_suffix.empty() && endsWith(path, index_suffix)) {
        // keep the directory's trailing '/'
        path.erase(path.size() - index_suffix.size() + 1);
    }
    return path;
}

DownloadOutcome FetchEngine::fetchOne(const ManifestEntry& entry) {
    auto target = guard_.resolve(entry);
    if (!target) {
        spdlog::warn("FetchEngine: traversal blocked for '{}'", entry);
        return DownloadOutcome::failed(FailureReason::TraversalBlocked);
    }
    if (isPresent(*target)) {
        return DownloadOutcome::alreadyPresent();
    }
    try {
        return fetchResolved(entry, *target);
    } catch (const std::exception& e) {
        spdlog::warn("FetchEngine: unexpected error for '{}': {}", entry, e.what());
        return DownloadOutcome::failed(FailureReason::TransportError, e.what());
    }
}

DownloadOutcome FetchEngine::fetchResolved(const ManifestEntry& entry, const fs::path& target) {
    HttpUrl base = parseUrl(options_.base_url);
    auto client = makeClient(base, options_.timeout);
    if (!client) {
        spdlog::warn("FetchEngine: failed to create HTTP client for base url '{}'", options_.base_url);
        return DownloadOutcome::failed(FailureReason::TransportError, "unsupported base url " + options_.base_url);
    }

    std::error_code ec;
    fs::create_directories(target.parent_path(), ec);
    if (ec) {
        return DownloadOutcome::failed(FailureReason::TransportError,
                                       "cannot create " + target.parent_path().string() + ": " + ec.message());
    }

    const std::string base_path = base.path == "/" ? "" : trimTrailingSlash(base.path);
    const std::string request_path = base_path + percentEncodePath(remotePathFor(entry, options_.index_suffix));
    const httplib::Headers headers{
        {"User-Agent", options_.user_agent},
        {"Referer", trimTrailingSlash(options_.base_url) + "/"},
    };

    fs::path tmp_path = target;
    tmp_path += ".tmp";

    std::string last_error;
    for (int attempt = 0; attempt < options_.max_attempts; ++attempt) {
        std::ofstream ofs(tmp_path, std::ios::binary | std::ios::trunc);
        if (!ofs.is_open()) {
            return DownloadOutcome::failed(FailureReason::TransportError,
                                           "cannot open " + tmp_path.string());
        }

        int status = 0;
        uint64_t total = 0;
        bool write_failed = false;
        std::string pending;
        pending.reserve(options_.chunk_size);

        ++requests_;
        auto result = client->Get(
            request_path, headers,
            [&](const httplib::Response& res) {
                status = res.status;
                return status >= 200 && status < 300;
            },
            [&](const char* data, size_t data_length) {
                pending.append(data, data_length);
                total += data_length;
                if (pending.size() >= options_.chunk_size) {
                    ofs.write(pending.data(), static_cast<std::streamsize>(pending.size()));
                    pending.clear();
                }
                write_failed = !ofs;
                return !write_failed;
            });

        // a local write error cancels the transfer; it is not a network fault
        if (write_failed) {
            ofs.close();
            removeQuietly(tmp_path);
            spdlog::warn("FetchEngine: write failed for '{}' at {} bytes", entry, total);
            return DownloadOutcome::failed(FailureReason::TransportError, "write failed: " + tmp_path.string());
        }

        if (result && status >= 200 && status < 300) {
            if (!pending.empty()) {
                ofs.write(pending.data(), static_cast<std::streamsize>(pending.size()));
            }
            ofs.close();
            if (!ofs) {
                removeQuietly(tmp_path);
                return DownloadOutcome::failed(FailureReason::TransportError, "write failed: " + tmp_path.string());
            }
            if (total == 0) {
                removeQuietly(tmp_path);
                return DownloadOutcome::failed(FailureReason::EmptyBody);
            }
            fs::rename(tmp_path, target, ec);
            if (ec) {
                removeQuietly(tmp_path);
                return DownloadOutcome::failed(FailureReason::TransportError,
                                               "rename failed: " + ec.message());
            }
            spdlog::debug("FetchEngine: fetched '{}' ({} bytes)", entry, total);
            return DownloadOutcome::fetched(total);
        }

        ofs.close();
        removeQuietly(tmp_path);

        if (status == 404) {
            spdlog::debug("FetchEngine: not found '{}'", entry);
            return DownloadOutcome::failed(FailureReason::NotFound);
        }

        const bool http_error = status != 0 && (status < 200 || status >= 300);
        last_error = http_error ? "HTTP " + std::to_string(status) : httplib::to_string(result.error());
        if (attempt + 1 < options_.max_attempts) {
            const auto delay = options_.backoff_unit * (int64_t{1} << std::min(attempt, 20));
            spdlog::debug("FetchEngine: '{}' attempt {}/{} failed ({}), retrying in {} ms", entry, attempt + 1,
                          options_.max_attempts, last_error, delay.count());
            std::this_thread::sleep_for(delay);
        }
    }

    spdlog::warn("FetchEngine: giving up on '{}' after {} attempts: {}", entry, options_.max_attempts, last_error);
    return DownloadOutcome::failed(FailureReason::ExhaustedRetries, last_error);
}

void FetchEngine::run(const std::vector<ManifestEntry>& entries, const OutcomeCallback& on_outcome) {
    if (entries.empty()) return;

    const size_t conc = std::min(options_.concurrency, entries.size());
    spdlog::info("FetchEngine: {} entries, {} workers, {} attempts, base={}", entries.size(), conc,
                 options_.max_attempts, options_.base_url);

    std::mutex deliver_mutex;
    std::atomic<size_t> index{0};
    std::vector<std::thread> workers;
    workers.reserve(conc);
    for (size_t i = 0; i < conc; ++i) {
        workers.emplace_back([&]() {
            while (true) {
                size_t idx = index.fetch_add(1);
                if (idx >= entries.size()) break;
                const auto outcome = fetchOne(entries[idx]);
                if (on_outcome) {
                    std::lock_guard<std::mutex> lock(deliver_mutex);
                    on_outcome(entries[idx], outcome);
                }
            }
        });
    }
    for (auto& th : workers) {
        if (th.joinable()) th.join();
    }
}

}  // namespace sitemirror
