#include "FileTimeHelper.h"
#include <cerrno>
#include <cstring>
#include <sys/stat.h>
#ifdef _WIN32
#include <windows.h>
#else
#include <fcntl.h>
#include <unistd.h>
#endif

namespace metamerger {

bool setFileTimes(const fs::path& filepath, std::time_t timestamp, std::string& error) {
#if defined(_WIN32)
    FILETIME ftCreate, ftAccess, ftWrite;
    LONGLONG ll = static_cast<LONGLONG>(timestamp) * 10000000LL + 116444736000000000LL;
    ftCreate.dwLowDateTime = (DWORD)ll;
    ftCreate.dwHighDateTime = (DWORD)(ll >> 32);
    ftAccess = ftWrite = ftCreate;
    std::wstring wpath = filepath.wstring();
    HANDLE hFile = CreateFileW(wpath.c_str(), FILE_WRITE_ATTRIBUTES,
        FILE_SHARE_READ | FILE_SHARE_WRITE, NULL, OPEN_EXISTING,
        FILE_ATTRIBUTE_NORMAL, NULL);
    if (hFile == INVALID_HANDLE_VALUE) {
        error = "CreateFile failed: " + std::to_string(GetLastError());
        return false;
    }
    BOOL result = SetFileTime(hFile, &ftCreate, &ftAccess, &ftWrite);
    DWORD lastError = GetLastError();
    CloseHandle(hFile);
    if (!result) {
        error = "SetFileTime failed: " + std::to_string(lastError);
        return false;
    }
#else
    struct timespec times[2];
    times[0].tv_sec = timestamp;   // access
    times[0].tv_nsec = 0;
    times[1].tv_sec = timestamp;   // modification
    times[1].tv_nsec = 0;
    if (utimensat(AT_FDCWD, filepath.c_str(), times, 0) != 0) {
        error = std::string("utimensat failed: ") + std::strerror(errno);
        return false;
    }
#endif
    return true;
}

std::time_t getModificationTime(const fs::path& filepath) {
#ifdef _WIN32
    struct _stat64 fileStat;
    if (_wstat64(filepath.wstring().c_str(), &fileStat) != 0) return static_cast<std::time_t>(-1);
#else
    struct stat fileStat;
    if (stat(filepath.c_str(), &fileStat) != 0) return static_cast<std::time_t>(-1);
#endif
    return fileStat.st_mtime;
}

bool moveFile(const fs::path& from, const fs::path& to, std::string& error) {
    std::error_code ec;
    if (fs::exists(to, ec)) {
        error = "Target already exists: " + to.string();
        return false;
    }
    if (to.has_parent_path()) {
        fs::create_directories(to.parent_path(), ec);
        if (ec) {
            error = "Cannot create " + to.parent_path().string() + ": " + ec.message();
            return false;
        }
    }
    fs::rename(from, to, ec);
    if (ec) {
        // Across filesystems rename fails; copy keeps the file times, then drop the source.
        ec.clear();
        fs::copy_file(from, to, fs::copy_options::none, ec);
        if (ec) {
            error = "Move failed: " + ec.message();
            return false;
        }
        std::string timeError;
        std::time_t mtime = getModificationTime(from);
        if (mtime != static_cast<std::time_t>(-1) && !setFileTimes(to, mtime, timeError)) {
            error = timeError;
            fs::remove(to, ec);
            return false;
        }
        fs::remove(from, ec);
        if (ec) {
            error = "Copied but could not remove source: " + ec.message();
            return false;
        }
    }
    return true;
}

}  // namespace metamerger
