#include "Pipeline.h"
#include "FormatWriter.h"
#include "MetadataExtractor.h"
#include <algorithm>
#include <exception>

namespace metamerger {

namespace {

ProcessingOutcome failedOutcome(ProcessingOutcome outcome, FailureKind failure, const std::string& reason) {
    outcome.kind = OutcomeKind::Failed;
    outcome.failure = failure;
    outcome.reason = reason;
    return outcome;
}

ProcessingOutcome runStages(const fs::path& mediaPath, SidecarPool& pool, const FileTimeSetter& setTimes) {
    ProcessingOutcome outcome;
    outcome.mediaPath = mediaPath;

    std::unique_ptr<FormatWriter> writer = makeFormatWriter(resolveFormatFamily(mediaPath));
    if (!writer)
        return failedOutcome(outcome, FailureKind::UnsupportedMediaType,
                             "Unsupported extension: " + mediaPath.extension().string());
    outcome.family = writer->family();

    MatchRule rule = MatchRule::NoMatch;
    auto sidecar = pool.claim(mediaPath.filename().string(), &rule);
    if (!sidecar) {
        outcome.kind = OutcomeKind::SkippedUnmatched;
        outcome.reason = "No sidecar JSON found";
        return outcome;
    }
    outcome.sidecarPath = *sidecar;

    CanonicalMetadata metadata;
    std::string error;
    if (!extractMetadata(*sidecar, metadata, error))
        return failedOutcome(outcome, FailureKind::CorruptMetadata, error);

    WriteResult written = writer->apply(mediaPath, metadata);
    if (written.status == WriteStatus::Failed)
        return failedOutcome(outcome, FailureKind::WriteFailure, written.message);
    outcome.embeddedWritten = written.status == WriteStatus::Written;

    if (!setTimes(mediaPath, metadata.takenAt, error)) {
        std::string reason = error;
        if (outcome.embeddedWritten) reason += " (embedded metadata was already updated)";
        return failedOutcome(outcome, FailureKind::TimestampFailure, reason);
    }

    if (written.status == WriteStatus::Unsupported) {
        outcome.kind = OutcomeKind::SkippedUnsupportedFormat;
        outcome.reason = written.message;
    } else {
        outcome.kind = OutcomeKind::Updated;
        if (rule != MatchRule::Exact) outcome.reason = std::string("matched by rule ") + matchRuleName(rule);
    }
    return outcome;
}

}  // namespace

bool DirectoryReport::allSucceeded() const {
    return std::all_of(outcomes.begin(), outcomes.end(), isProcessedSuccessfully);
}

ProcessingOutcome processMediaFile(const fs::path& mediaPath, SidecarPool& pool,
                                   const FileTimeSetter& setTimes) {
    try {
        return runStages(mediaPath, pool, setTimes);
    } catch (const fs::filesystem_error& e) {
        ProcessingOutcome outcome;
        outcome.mediaPath = mediaPath;
        return failedOutcome(outcome, FailureKind::WriteFailure, std::string("Filesystem error: ") + e.what());
    } catch (const std::exception& e) {
        ProcessingOutcome outcome;
        outcome.mediaPath = mediaPath;
        return failedOutcome(outcome, FailureKind::WriteFailure, std::string("Exception: ") + e.what());
    }
}

DirectoryReport processDirectory(const fs::path& directory,
                                 const std::vector<fs::path>& mediaFiles,
                                 const std::vector<fs::path>& sidecarFiles,
                                 const RunConfig& config,
                                 const FileTimeSetter& setTimes) {
    DirectoryReport report;
    report.directory = directory;
    SidecarPool pool(sidecarFiles, config.truncationLength);
    std::vector<std::string> names;
    for (const auto& media : mediaFiles) {
        if (resolveFormatFamily(media) != FormatFamily::Unsupported)
            names.push_back(media.filename().string());
    }
    pool.assign(names);
    for (const auto& media : mediaFiles) {
        ProcessingOutcome outcome = processMediaFile(media, pool, setTimes);
        report.summary.record(outcome);
        report.outcomes.push_back(std::move(outcome));
    }
    return report;
}

}  // namespace metamerger
