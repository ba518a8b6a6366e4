#pragma once

#include <filesystem>
#include <string>

namespace fs = std::filesystem;

namespace metamerger {

// Format family resolved once from the extension; the pipeline dispatches on this only.
enum class FormatFamily {
    Unsupported,
    JpegLike,          // EXIF through Exiv2 (.jpg .jpeg .png .webp .gif)
    Heic,              // EXIF through Exiv2 when BMFF writing is available
    ContainerTagged,   // creation_time / location container tags (.mp4 .mov .mkv .flv)
    FilesystemOnly     // RAW: file times only (.nef .cr2 .arw .dng)
};

// Lower-case extension including the dot, e.g. ".jpg"
std::string lowerExtension(const fs::path& filePath);

FormatFamily resolveFormatFamily(const fs::path& filePath);

bool isSupportedMediaFile(const fs::path& filePath);

bool isSidecarFile(const fs::path& filePath);

// Containers whose metadata scheme has a location tag (QuickTime/MP4 family)
bool containerSupportsLocation(const fs::path& filePath);

const char* formatFamilyName(FormatFamily family);

}  // namespace metamerger
