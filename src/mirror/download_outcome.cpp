#include "mirror/download_outcome.h"

#include <utility>

namespace sitemirror {

DownloadOutcome DownloadOutcome::fetched(uint64_t bytes) {
    DownloadOutcome o;
    o.kind = OutcomeKind::Fetched;
    o.bytes = bytes;
    return o;
}

DownloadOutcome DownloadOutcome::alreadyPresent() {
    DownloadOutcome o;
    o.kind = OutcomeKind::AlreadyPresent;
    return o;
}

DownloadOutcome DownloadOutcome::failed(FailureReason reason, std::string detail) {
    DownloadOutcome o;
    o.kind = OutcomeKind::Failed;
    o.reason = reason;
    o.detail = std::move(detail);
    return o;
}

const char* failureReasonName(FailureReason reason) {
    switch (reason) {
        case FailureReason::NotFound:
            return "not-found";
        case FailureReason::TraversalBlocked:
            return "traversal-blocked";
        case FailureReason::EmptyBody:
            return "empty-body";
        case FailureReason::TransportError:
            return "transport-error";
        case FailureReason::ExhaustedRetries:
            return "exhausted-retries";
    }
    return "transport-error";
}

std::string describeFailure(const DownloadOutcome& outcome) {
    std::string out = failureReasonName(outcome.reason);
    if (!outcome.detail.empty()) {
        out += ": ";
        out += outcome.detail;
    }
    return out;
}

}  // namespace sitemirror
