#pragma once

#include "Metadata.h"
#include <filesystem>
#include <string>

namespace fs = std::filesystem;

namespace metamerger {

// Parse sidecar JSON text. Reads photoTakenTime.timestamp (string or integer epoch seconds)
// and geoData (falling back to geoDataExif); a 0.0/0.0 position means no GPS.
// Returns false with error set when the JSON is unparsable or the timestamp is missing/invalid.
bool parseSidecarJson(const std::string& jsonText, CanonicalMetadata& metadata, std::string& error);

// Read and parse one sidecar file
bool extractMetadata(const fs::path& sidecarPath, CanonicalMetadata& metadata, std::string& error);

}  // namespace metamerger
