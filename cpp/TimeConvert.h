#pragma once

#include <ctime>
#include <string>

namespace metamerger {

// 9999-12-31T23:59:59Z, the last instant with a four-digit year. Formatting later instants yields "".
constexpr std::time_t kLatestFormattableTimestamp = 253402300799;

// Parse UTC/EXIF time string into tm ("YYYY-MM-DDTHH:MM:SS", "YYYY-MM-DD HH:MM:SS", "YYYY:MM:DD HH:MM:SS")
bool parseUTCStringToTm(std::tm& tm, const std::string& utcTimeStr);

// UTC time string -> time_t (returns (time_t)-1 on parse failure)
std::time_t utcStringToTimestamp(const std::string& timeStr);

// time_t -> UTC string "YYYY-MM-DDTHH:MM:SS"
std::string timestampToUTCString(std::time_t timestamp);

// time_t -> EXIF DateTime "YYYY:MM:DD HH:MM:SS", serialized in UTC
std::string timestampToExifString(std::time_t timestamp);

// time_t -> ffmpeg creation_time "YYYY-MM-DDTHH:MM:SS.000000Z"
std::string timestampToContainerString(std::time_t timestamp);

// Local wall-clock time as "YYYYMMDD_HHMMSS" (log file names)
std::string localRunStamp();

}  // namespace metamerger
