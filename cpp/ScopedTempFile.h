#pragma once

#include <filesystem>
#include <string>

namespace fs = std::filesystem;

namespace metamerger {

// Temporary file beside a target. commit() atomically renames it over the target;
// otherwise the destructor removes it, so the target is never partially written.
class ScopedTempFile {
public:
    // Temp path in the target's directory, keeping the target's extension (ffmpeg picks the muxer by it).
    explicit ScopedTempFile(const fs::path& target);
    ~ScopedTempFile();

    ScopedTempFile(const ScopedTempFile&) = delete;
    ScopedTempFile& operator=(const ScopedTempFile&) = delete;

    // Copy the target's current content into the temp file
    bool copyFromTarget(std::string& error);

    bool commit(std::string& error);

    const fs::path& path() const { return tempPath_; }

private:
    fs::path target_;
    fs::path tempPath_;
    bool committed_ = false;
};

// Leftover temp files carry this infix
bool isTempFileName(const std::string& fileName);

}  // namespace metamerger
