#pragma once

#include <filesystem>
#include <fstream>
#include <string>

namespace fs = std::filesystem;

namespace metamerger {

// On Windows convert ACP string to UTF-8 for log file; on other platforms return as-is.
std::string toUtf8ForLog(const std::string& s);

// <logDirectory>/<input folder name>_<YYYYMMDD_HHMMSS>.log, current directory when logDirectory is empty
fs::path runLogPath(const fs::path& logDirectory, const fs::path& input);

// Per-run log file, opened for append. A new or empty file starts with a UTF-8 BOM.
class RunLog {
public:
    RunLog(const fs::path& logFile, const fs::path& input);

    void line(const std::string& text);

    const fs::path& path() const { return path_; }
    bool isOpen() const { return static_cast<bool>(file_); }

private:
    fs::path path_;
    std::ofstream file_;
};

}  // namespace metamerger
