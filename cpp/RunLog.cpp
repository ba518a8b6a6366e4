#include "RunLog.h"
#include "TimeConvert.h"
#include <iostream>
#include <system_error>
#ifdef _WIN32
#include <windows.h>
#endif

namespace metamerger {

namespace {

std::string sanitizeForLogFilename(const std::string& s) {
    std::string out;
    for (char c : s) {
        if (c == '\\' || c == '/' || c == ':' || c == '*' || c == '?' || c == '"' || c == '<' || c == '>' || c == '|')
            out += '_';
        else
            out += c;
    }
    return out;
}

}  // namespace

std::string toUtf8ForLog(const std::string& s) {
#ifdef _WIN32
    if (s.empty()) return s;
    int wlen = MultiByteToWideChar(CP_ACP, 0, s.c_str(), -1, nullptr, 0);
    if (wlen <= 0) return s;
    std::wstring wbuf(static_cast<size_t>(wlen), 0);
    MultiByteToWideChar(CP_ACP, 0, s.c_str(), -1, &wbuf[0], wlen);
    int ulen = WideCharToMultiByte(CP_UTF8, 0, wbuf.c_str(), -1, nullptr, 0, nullptr, nullptr);
    if (ulen <= 0) return s;
    std::string out(static_cast<size_t>(ulen), 0);
    WideCharToMultiByte(CP_UTF8, 0, wbuf.c_str(), -1, &out[0], ulen, nullptr, nullptr);
    out.resize(static_cast<size_t>(ulen - 1));
    return out;
#else
    return s;
#endif
}

fs::path runLogPath(const fs::path& logDirectory, const fs::path& input) {
    std::string folderName = input.filename().string();
    if (folderName.empty()) folderName = "folder";
    fs::path dir = logDirectory.empty() ? fs::current_path() : logDirectory;
    return dir / (sanitizeForLogFilename(folderName) + "_" + localRunStamp() + ".log");
}

RunLog::RunLog(const fs::path& logFile, const fs::path& input)
    : path_(logFile) {
    // tellp() after opening in append mode is 0 even for a non-empty file
    std::error_code ec;
    const bool needsBom = !fs::exists(path_, ec) || fs::file_size(path_, ec) == 0;
    file_.open(path_, std::ios::out | std::ios::app);
    if (file_) {
        if (needsBom)
            file_ << "\xEF\xBB\xBF";  // UTF-8 BOM
        file_ << "===== MetaMerger run " << localRunStamp() << " =====\n";
        file_ << "Input: " << toUtf8ForLog(input.string()) << "\n";
    } else {
        std::cerr << "Cannot open log file " << path_ << "; logging to console only" << std::endl;
    }
}

void RunLog::line(const std::string& text) {
    if (file_) file_ << toUtf8ForLog(text) << "\n";
}

}  // namespace metamerger
