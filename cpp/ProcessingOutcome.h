#pragma once

#include "MediaFormat.h"
#include <cstddef>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace metamerger {

enum class OutcomeKind {
    Updated,
    SkippedUnmatched,
    SkippedUnsupportedFormat,   // embedded write not possible, filesystem time restored
    Failed
};

// Why a file ended up Failed (FailureKind::NoFailure otherwise)
enum class FailureKind {
    NoFailure,
    UnsupportedMediaType,
    CorruptMetadata,
    WriteFailure,
    TimestampFailure
};

struct ProcessingOutcome {
    fs::path mediaPath;
    fs::path sidecarPath;   // empty when unmatched
    FormatFamily family = FormatFamily::Unsupported;
    OutcomeKind kind = OutcomeKind::Failed;
    FailureKind failure = FailureKind::NoFailure;
    std::string reason;
    bool embeddedWritten = false;   // content of the media file was rewritten
};

// Only these outcomes may be moved to the completed folder or have their sidecar deleted.
bool isProcessedSuccessfully(const ProcessingOutcome& outcome);

const char* outcomeName(OutcomeKind kind);
const char* failureName(FailureKind kind);

// One-line description for console and log output
std::string describeOutcome(const ProcessingOutcome& outcome);

// Counts per outcome kind for one run. Has a single owner; merge per-directory results into it.
class RunSummary {
public:
    void record(const ProcessingOutcome& outcome);
    void merge(const RunSummary& other);

    std::size_t updated() const { return updated_; }
    std::size_t skippedUnmatched() const { return skippedUnmatched_; }
    std::size_t skippedUnsupported() const { return skippedUnsupported_; }
    std::size_t failed() const { return failures_.size(); }
    std::size_t total() const { return updated_ + skippedUnmatched_ + skippedUnsupported_ + failures_.size(); }

    // (media path, reason) for every Failed outcome, in record order
    const std::vector<std::pair<std::string, std::string>>& failures() const { return failures_; }

private:
    std::size_t updated_ = 0;
    std::size_t skippedUnmatched_ = 0;
    std::size_t skippedUnsupported_ = 0;
    std::vector<std::pair<std::string, std::string>> failures_;
};

}  // namespace metamerger
