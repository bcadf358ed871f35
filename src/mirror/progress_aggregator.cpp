#include "mirror/progress_aggregator.h"

#include <fstream>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace sitemirror {

ProgressAggregator::ProgressAggregator(size_t expected_total, size_t snapshot_interval, SnapshotSink sink)
    : expected_total_(expected_total),
      snapshot_interval_(snapshot_interval == 0 ? 1 : snapshot_interval),
      sink_(std::move(sink)),
      start_(std::chrono::steady_clock::now()) {
    counts_.total = expected_total_;
}

void ProgressAggregator::record(const ManifestEntry& entry, const DownloadOutcome& outcome) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++counts_.processed;
    switch (outcome.kind) {
        case OutcomeKind::Fetched:
            ++counts_.fetched;
            counts_.bytes += outcome.bytes;
            break;
        case OutcomeKind::AlreadyPresent:
            ++counts_.already_present;
            break;
        case OutcomeKind::Failed:
            if (outcome.reason == FailureReason::NotFound) {
                ++counts_.not_found;
            } else {
                ++counts_.failed;
                failures_.push_back({entry, describeFailure(outcome)});
            }
            break;
    }

    if (sink_ && (counts_.processed % snapshot_interval_ == 0 || counts_.processed == expected_total_)) {
        sink_(snapshotLocked());
    }
}

ProgressSnapshot ProgressAggregator::snapshotLocked() const {
    ProgressSnapshot s = counts_;
    s.elapsed_seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - start_).count();
    return s;
}

ProgressSnapshot ProgressAggregator::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return snapshotLocked();
}

std::vector<FailureRecord> ProgressAggregator::failures() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failures_;
}

void ProgressAggregator::writeFailureReport(std::ostream& out) const {
    for (const auto& f : failures()) {
        out << f.path << '\t' << f.reason << '\n';
    }
}

bool ProgressAggregator::writeFailureReport(const std::filesystem::path& path) const {
    if (failures().empty()) return false;
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    if (!ofs.is_open()) {
        throw std::runtime_error("cannot write failure report: " + path.string());
    }
    writeFailureReport(ofs);
    spdlog::info("Failure report written: {}", path.string());
    return true;
}

}  // namespace sitemirror
