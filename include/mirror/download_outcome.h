#pragma once

#include <cstdint>
#include <string>

#include "mirror/manifest.h"

namespace sitemirror {

enum class OutcomeKind {
    Fetched,
    AlreadyPresent,
    Failed,
};

enum class FailureReason {
    NotFound,
    TraversalBlocked,
    EmptyBody,
    TransportError,
    ExhaustedRetries,
};

/// Result for one manifest entry. Exactly one is produced per entry per run.
struct DownloadOutcome {
    OutcomeKind kind{OutcomeKind::Failed};
    uint64_t bytes{0};                  // Fetched only
    FailureReason reason{FailureReason::TransportError};  // Failed only
    std::string detail;                 // last error description, may be empty

    static DownloadOutcome fetched(uint64_t bytes);
    static DownloadOutcome alreadyPresent();
    static DownloadOutcome failed(FailureReason reason, std::string detail = {});

    bool isFetched() const { return kind == OutcomeKind::Fetched; }
    bool isAlreadyPresent() const { return kind == OutcomeKind::AlreadyPresent; }
    bool isFailed() const { return kind == OutcomeKind::Failed; }
    bool isNotFound() const { return isFailed() && reason == FailureReason::NotFound; }
};

/// Stable token used in the failure report: "not-found", "traversal-blocked", ...
const char* failureReasonName(FailureReason reason);

/// "<reason>" or "<reason>: <detail>".
std::string describeFailure(const DownloadOutcome& outcome);

}  // namespace sitemirror
