#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <mutex>
#include <ostream>
#include <string>
#include <vector>

#include "mirror/download_outcome.h"

namespace sitemirror {

struct ProgressSnapshot {
    size_t processed{0};
    size_t total{0};
    size_t fetched{0};
    size_t already_present{0};
    size_t not_found{0};
    size_t failed{0};
    uint64_t bytes{0};
    double elapsed_seconds{0.0};

    double bytesPerSecond() const { return elapsed_seconds > 0.0 ? bytes / elapsed_seconds : 0.0; }
};

struct FailureRecord {
    ManifestEntry path;
    std::string reason;
};

/// Tallies the outcome stream. Observational only: it never influences fetching.
class ProgressAggregator {
public:
    /// The sink runs under the aggregator lock and must not call back into it.
    using SnapshotSink = std::function<void(const ProgressSnapshot&)>;

    explicit ProgressAggregator(size_t expected_total,
                                size_t snapshot_interval = 200,
                                SnapshotSink sink = nullptr);

    /// Thread-safe. Emits a snapshot every snapshot_interval items and on the last one.
    void record(const ManifestEntry& entry, const DownloadOutcome& outcome);

    ProgressSnapshot snapshot() const;

    /// Failed entries, excluding not-found, in completion order.
    std::vector<FailureRecord> failures() const;

    /// One "<path>\t<reason>" line per failure.
    void writeFailureReport(std::ostream& out) const;

    /// Writes the report to path when there is at least one failure. Returns true when a
    /// report was written; throws std::runtime_error if the file cannot be created.
    bool writeFailureReport(const std::filesystem::path& path) const;

private:
    ProgressSnapshot snapshotLocked() const;

    mutable std::mutex mutex_;
    size_t expected_total_;
    size_t snapshot_interval_;
    SnapshotSink sink_;
    std::chrono::steady_clock::time_point start_;
    ProgressSnapshot counts_;
    std::vector<FailureRecord> failures_;
};

}  // namespace sitemirror
