#include "ProcessingOutcome.h"

namespace metamerger {

bool isProcessedSuccessfully(const ProcessingOutcome& outcome) {
    return outcome.kind == OutcomeKind::Updated || outcome.kind == OutcomeKind::SkippedUnsupportedFormat;
}

const char* outcomeName(OutcomeKind kind) {
    switch (kind) {
        case OutcomeKind::Updated: return "Updated";
        case OutcomeKind::SkippedUnmatched: return "SkippedUnmatched";
        case OutcomeKind::SkippedUnsupportedFormat: return "SkippedUnsupportedFormat";
        case OutcomeKind::Failed: return "Failed";
    }
    return "?";
}

const char* failureName(FailureKind kind) {
    switch (kind) {
        case FailureKind::NoFailure: return "None";
        case FailureKind::UnsupportedMediaType: return "UnsupportedMediaType";
        case FailureKind::CorruptMetadata: return "CorruptMetadata";
        case FailureKind::WriteFailure: return "WriteFailure";
        case FailureKind::TimestampFailure: return "TimestampFailure";
    }
    return "?";
}

std::string describeOutcome(const ProcessingOutcome& outcome) {
    std::string out = outcome.mediaPath.filename().string();
    if (outcome.family != FormatFamily::Unsupported) {
        out += " [";
        out += formatFamilyName(outcome.family);
        out += "]";
    }
    out += " | ";
    out += outcomeName(outcome.kind);
    if (outcome.kind == OutcomeKind::Failed) {
        out += " (";
        out += failureName(outcome.failure);
        out += ")";
    }
    if (!outcome.sidecarPath.empty()) {
        out += " | sidecar: ";
        out += outcome.sidecarPath.filename().string();
    }
    if (outcome.embeddedWritten)
        out += " | embedded metadata written";
    if (!outcome.reason.empty()) {
        out += " | ";
        out += outcome.reason;
    }
    return out;
}

void RunSummary::record(const ProcessingOutcome& outcome) {
    switch (outcome.kind) {
        case OutcomeKind::Updated: ++updated_; break;
        case OutcomeKind::SkippedUnmatched: ++skippedUnmatched_; break;
        case OutcomeKind::SkippedUnsupportedFormat: ++skippedUnsupported_; break;
        case OutcomeKind::Failed:
            failures_.emplace_back(outcome.mediaPath.string(),
                                   std::string(failureName(outcome.failure)) + ": " + outcome.reason);
            break;
    }
}

void RunSummary::merge(const RunSummary& other) {
    updated_ += other.updated_;
    skippedUnmatched_ += other.skippedUnmatched_;
    skippedUnsupported_ += other.skippedUnsupported_;
    failures_.insert(failures_.end(), other.failures_.begin(), other.failures_.end());
}

}  // namespace metamerger
