#include "TimeConvert.h"
#include <cstdio>
#include <iomanip>
#include <sstream>
#ifdef _WIN32
#include <time.h>
#endif

namespace metamerger {

static bool toUtcTm(std::time_t timestamp, std::tm& tm) {
    if (timestamp < 0 || timestamp > kLatestFormattableTimestamp) return false;
#ifdef _WIN32
    return gmtime_s(&tm, &timestamp) == 0;
#else
    return gmtime_r(&timestamp, &tm) != nullptr;
#endif
}

static std::string formatUtc(std::time_t timestamp, const char* format) {
    std::tm tm = {};
    if (!toUtcTm(timestamp, tm)) return "";
    std::ostringstream ss;
    ss << std::put_time(&tm, format);
    return ss.str();
}

bool parseUTCStringToTm(std::tm& tm, const std::string& utcTimeStr) {
    std::istringstream ss(utcTimeStr);
    if (utcTimeStr.empty()) return false;
    if (utcTimeStr.find('T') != std::string::npos && utcTimeStr.find('-') != std::string::npos) {
        ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
        if (!ss.fail()) return true;
    }
    if (utcTimeStr.find('-') != std::string::npos) {
        ss.clear();
        ss.str(utcTimeStr);
        ss >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");
        if (!ss.fail()) return true;
    }
    if (utcTimeStr.find(':') != std::string::npos) {
        ss.clear();
        ss.str(utcTimeStr);
        ss >> std::get_time(&tm, "%Y:%m:%d %H:%M:%S");
        if (!ss.fail()) return true;
    }
    return false;
}

std::time_t utcStringToTimestamp(const std::string& timeStr) {
    std::tm tm = {};
    if (!parseUTCStringToTm(tm, timeStr)) return static_cast<std::time_t>(-1);
    tm.tm_isdst = 0;
#ifdef _WIN32
    return _mkgmtime(&tm);
#else
    return timegm(&tm);
#endif
}

std::string timestampToUTCString(std::time_t timestamp) {
    return formatUtc(timestamp, "%Y-%m-%dT%H:%M:%S");
}

std::string timestampToExifString(std::time_t timestamp) {
    return formatUtc(timestamp, "%Y:%m:%d %H:%M:%S");
}

std::string timestampToContainerString(std::time_t timestamp) {
    std::string s = formatUtc(timestamp, "%Y-%m-%dT%H:%M:%S");
    if (s.empty()) return s;
    return s + ".000000Z";
}

std::string localRunStamp() {
    std::time_t now = std::time(nullptr);
    std::tm lt = {};
#ifdef _WIN32
    localtime_s(&lt, &now);
#else
    localtime_r(&now, &lt);
#endif
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d%02d%02d_%02d%02d%02d",
        lt.tm_year + 1900, lt.tm_mon + 1, lt.tm_mday,
        lt.tm_hour, lt.tm_min, lt.tm_sec);
    return buf;
}

}  // namespace metamerger
