#pragma once

#include "FileTimeHelper.h"
#include "ProcessingOutcome.h"
#include "RunConfig.h"
#include "SidecarMatcher.h"
#include <ctime>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace metamerger {

struct DirectoryReport {
    fs::path directory;
    std::vector<ProcessingOutcome> outcomes;   // one per media file, in processing order
    RunSummary summary;

    // True when every media file of the directory was processed successfully
    bool allSucceeded() const;
};

// Last stage of a file: set the file times to the taken instant
using FileTimeSetter = std::function<bool(const fs::path&, std::time_t, std::string&)>;

// Match -> extract -> embedded write -> file times for one media file.
// Every failure becomes a recorded outcome; nothing is thrown.
ProcessingOutcome processMediaFile(const fs::path& mediaPath, SidecarPool& pool,
                                   const FileTimeSetter& setTimes = setFileTimes);

// Process the media files of one directory against that directory's sidecars, in the given order.
// Sidecars are paired with the whole directory before the first file is touched and consumed at most once.
DirectoryReport processDirectory(const fs::path& directory,
                                 const std::vector<fs::path>& mediaFiles,
                                 const std::vector<fs::path>& sidecarFiles,
                                 const RunConfig& config,
                                 const FileTimeSetter& setTimes = setFileTimes);

}  // namespace metamerger
