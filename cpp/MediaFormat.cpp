#include "MediaFormat.h"
#include <algorithm>
#include <cctype>
#include <vector>

namespace metamerger {

static bool hasExtension(const fs::path& filePath, const std::vector<std::string>& extensions) {
    std::string ext = lowerExtension(filePath);
    return std::find(extensions.begin(), extensions.end(), ext) != extensions.end();
}

std::string lowerExtension(const fs::path& filePath) {
    std::string ext = filePath.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

FormatFamily resolveFormatFamily(const fs::path& filePath) {
    static const std::vector<std::string> imageExtensions = {
        ".jpg", ".jpeg", ".png", ".webp", ".gif"
    };
    static const std::vector<std::string> containerExtensions = {
        ".mp4", ".mov", ".mkv", ".flv"
    };
    static const std::vector<std::string> rawExtensions = {
        ".nef", ".cr2", ".arw", ".dng"
    };
    if (hasExtension(filePath, imageExtensions)) return FormatFamily::JpegLike;
    if (lowerExtension(filePath) == ".heic") return FormatFamily::Heic;
    if (hasExtension(filePath, containerExtensions)) return FormatFamily::ContainerTagged;
    if (hasExtension(filePath, rawExtensions)) return FormatFamily::FilesystemOnly;
    return FormatFamily::Unsupported;
}

bool isSupportedMediaFile(const fs::path& filePath) {
    return resolveFormatFamily(filePath) != FormatFamily::Unsupported;
}

bool isSidecarFile(const fs::path& filePath) {
    return lowerExtension(filePath) == ".json";
}

bool containerSupportsLocation(const fs::path& filePath) {
    return hasExtension(filePath, { ".mp4", ".mov" });
}

const char* formatFamilyName(FormatFamily family) {
    switch (family) {
        case FormatFamily::Unsupported: return "Unsupported";
        case FormatFamily::JpegLike: return "JpegLike";
        case FormatFamily::Heic: return "Heic";
        case FormatFamily::ContainerTagged: return "ContainerTagged";
        case FormatFamily::FilesystemOnly: return "FilesystemOnly";
    }
    return "?";
}

}  // namespace metamerger
