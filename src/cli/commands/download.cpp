#include "cli/commands.h"

#include <filesystem>
#include <stdexcept>
#include <string>
#include <spdlog/spdlog.h>

#include "mirror/fetch_engine.h"
#include "mirror/manifest.h"
#include "mirror/mirror_status.h"
#include "mirror/progress_aggregator.h"

namespace sitemirror {
namespace cli {
namespace commands {

namespace {
constexpr double kMiB = 1024.0 * 1024.0;
const std::string kRule(55, '=');
}  // namespace

int download(const MirrorConfig& config, const DownloadOptions& options, Language lang, std::ostream& out) {
    Manifest manifest;
    try {
        manifest = Manifest::load(config.manifest_path);
    } catch (const std::runtime_error& e) {
        spdlog::error("download: {}", e.what());
        out << tr(lang, "err_no_manifest", fmt::arg("path", config.manifest_path)) << "\n"
            << tr(lang, "err_manifest_hint") << std::endl;
        return 1;
    }

    const size_t workers = options.workers > 0 ? options.workers : config.workers;
    const int retries = options.retries > 0 ? options.retries : config.retries;
    const auto scan = scanMirror(manifest, config.site_dir, 0);

    out << kRule << "\n"
        << tr(lang, "dl_title") << "\n"
        << kRule << "\n"
        << tr(lang, "dl_filelist", fmt::arg("n", scan.total)) << "\n"
        << tr(lang, "dl_existing", fmt::arg("n", scan.present)) << "\n"
        << tr(lang, "dl_pending", fmt::arg("n", scan.pending.size())) << "\n"
        << tr(lang, "dl_workers", fmt::arg("n", workers)) << "\n"
        << tr(lang, "dl_retries", fmt::arg("n", retries)) << "\n"
        << kRule << std::endl;

    if (scan.pending.empty()) {
        out << tr(lang, "dl_nothing") << std::endl;
        return 0;
    }

    std::error_code ec;
    std::filesystem::create_directories(config.site_dir, ec);
    if (ec) {
        spdlog::error("download: cannot create {}: {}", config.site_dir, ec.message());
        return 1;
    }

    FetchOptions fetch;
    fetch.base_url = config.base_url;
    fetch.root = config.site_dir;
    fetch.concurrency = workers;
    fetch.max_attempts = retries;
    fetch.backoff_unit = config.backoff_unit;
    fetch.timeout = config.timeout;
    fetch.chunk_size = config.chunk_size;

    ProgressAggregator progress(scan.pending.size(), 200, [&](const ProgressSnapshot& s) {
        out << tr(lang, "dl_progress", fmt::arg("i", s.processed), fmt::arg("total", s.total),
                  fmt::arg("ok", s.fetched), fmt::arg("nf", s.not_found), fmt::arg("fail", s.failed),
                  fmt::arg("speed", s.bytesPerSecond() / 1024.0))
            << std::endl;
    });

    FetchEngine engine(fetch);
    engine.run(scan.pending, [&progress](const ManifestEntry& entry, const DownloadOutcome& outcome) {
        progress.record(entry, outcome);
    });

    const auto summary = progress.snapshot();
    spdlog::info("download finished: fetched={} not_found={} failed={} bytes={} requests={}", summary.fetched,
                 summary.not_found, summary.failed, summary.bytes, engine.requestCount());

    out << "\n" << kRule << "\n"
        << tr(lang, "dl_done", fmt::arg("sec", summary.elapsed_seconds)) << "\n"
        << tr(lang, "dl_new", fmt::arg("n", summary.fetched), fmt::arg("mb", summary.bytes / kMiB)) << "\n"
        << tr(lang, "dl_404", fmt::arg("n", summary.not_found)) << "\n"
        << tr(lang, "dl_failed", fmt::arg("n", summary.failed)) << "\n"
        << kRule << std::endl;

    try {
        if (progress.writeFailureReport(config.failure_report_path)) {
            out << tr(lang, "dl_fail_saved", fmt::arg("path", config.failure_report_path)) << std::endl;
        }
    } catch (const std::runtime_error& e) {
        spdlog::error("download: {}", e.what());
        return 1;
    }
    return 0;
}

}  // namespace commands
}  // namespace cli
}  // namespace sitemirror
