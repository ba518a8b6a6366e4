#pragma once

#include "Metadata.h"
#include "WriteResult.h"
#include <filesystem>
#include <string>

namespace fs = std::filesystem;

namespace metamerger {

struct ContainerTags {
    std::string creationTime;   // "YYYY-MM-DDTHH:MM:SS", empty if absent
    std::string location;       // ISO 6709 as stored, empty if absent
};

/// True if ffmpeg and ffprobe can be run from PATH.
bool ffmpegAvailable();

/// ISO 6709 location string as written to QuickTime/MP4 "location", e.g. "+37.7749-122.4194+12.500/".
std::string formatIso6709(const GpsPosition& gps);

/// Read creation_time and location format tags via ffprobe. False if ffprobe fails.
bool readContainerTags(const fs::path& filePath, ContainerTags& tags);

/// Rewrite creation_time (and location where the container has one) via "ffmpeg -c copy" into a temp
/// file beside the original, then atomically replace it. Tags already equal -> AlreadyCurrent.
WriteResult writeContainerMetadata(const fs::path& filePath, const CanonicalMetadata& metadata);

/// Short string describing container time/location tags for logging.
std::string getVideoInfoString(const fs::path& filePath);

}  // namespace metamerger
