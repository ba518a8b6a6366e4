#include "VideoMetaHelper.h"
#include "MediaFormat.h"
#include "ScopedTempFile.h"
#include "TimeConvert.h"
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <sstream>
#ifndef _WIN32
#include <sys/wait.h>
#endif

namespace metamerger {

namespace {

/// Run a command, collect stdout into output and return its exit status (-1 if it could not be started).
int runCommand(const std::string& command, std::string& output) {
#ifdef _WIN32
    FILE* pipe = _popen(command.c_str(), "r");
#else
    FILE* pipe = popen(command.c_str(), "r");
#endif
    if (!pipe) return -1;
    output.clear();
    char buf[256];
    while (fgets(buf, sizeof(buf), pipe) != nullptr)
        output += buf;
#ifdef _WIN32
    return _pclose(pipe);
#else
    int status = pclose(pipe);
    if (status == -1) return -1;
    return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
#endif
}

/// Quote an argument for the shell.
std::string quoteArg(const std::string& arg) {
#ifdef _WIN32
    std::string out = "\"";
    for (char c : arg) {
        if (c == '"') out += "\\\"";
        else out += c;
    }
    out += "\"";
#else
    std::string out = "'";
    for (char c : arg) {
        if (c == '\'') out += "'\\''";
        else out += c;
    }
    out += "'";
#endif
    return out;
}

/// Normalize ffprobe creation_time (e.g. "2023-10-23T12:00:00.000000Z") to "YYYY-MM-DDTHH:MM:SS".
std::string normalizeCreationTime(const std::string& s) {
    std::string t = s;
    while (!t.empty() && (t.back() == '\r' || t.back() == '\n' || t.back() == ' '))
        t.pop_back();
    if (t.size() < 19) return "";
    t = t.substr(0, 19);
    if (t[10] != 'T' && t[10] != ' ') return "";
    if (t[10] == ' ') t[10] = 'T';
    return t;
}

std::string trimLine(std::string s) {
    while (!s.empty() && (s.back() == '\r' || s.back() == '\n' || s.back() == ' '))
        s.pop_back();
    return s;
}

// Stored ISO 6709 location denotes the position. Muxers keep fixed-point values and readers
// reformat them, so compare numerically rather than as text.
bool sameLocation(const std::string& stored, const GpsPosition& gps) {
    const char* p = stored.c_str();
    char* end = nullptr;
    double latitude = std::strtod(p, &end);
    if (end == p) return false;
    p = end;
    double longitude = std::strtod(p, &end);
    if (end == p) return false;
    p = end;
    bool hasAltitude = *p == '+' || *p == '-';
    double altitude = hasAltitude ? std::strtod(p, &end) : 0.0;
    if (std::fabs(latitude - gps.latitude) > 5e-5 || std::fabs(longitude - gps.longitude) > 5e-5)
        return false;
    if (hasAltitude != gps.altitude.has_value()) return false;
    return !hasAltitude || std::fabs(altitude - *gps.altitude) < 5e-3;
}

}  // namespace

bool ffmpegAvailable() {
    std::string out;
    return runCommand("ffmpeg -version 2>&1", out) == 0 && runCommand("ffprobe -version 2>&1", out) == 0;
}

std::string formatIso6709(const GpsPosition& gps) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%+08.4f%+09.4f", gps.latitude, gps.longitude);
    std::string out = buf;
    if (gps.altitude) {
        std::snprintf(buf, sizeof(buf), "%+.3f", *gps.altitude);
        out += buf;
    }
    return out + "/";
}

bool readContainerTags(const fs::path& filePath, ContainerTags& tags) {
    std::string out;
    std::string cmd = "ffprobe -v error -show_entries format_tags=creation_time,location "
                      "-of default=noprint_wrappers=1 " + quoteArg(filePath.string());
    if (runCommand(cmd, out) != 0) return false;

    ContainerTags result;
    std::istringstream lines(out);
    std::string line;
    while (std::getline(lines, line)) {
        line = trimLine(line);
        const std::string prefix = "TAG:";
        if (line.compare(0, prefix.size(), prefix) == 0) line = line.substr(prefix.size());
        std::size_t eq = line.find('=');
        if (eq == std::string::npos) continue;
        std::string key = line.substr(0, eq);
        std::string value = line.substr(eq + 1);
        if (key == "creation_time") result.creationTime = normalizeCreationTime(value);
        else if (key == "location") result.location = value;
    }
    tags = result;
    return true;
}

WriteResult writeContainerMetadata(const fs::path& filePath, const CanonicalMetadata& metadata) {
    const std::string creationTime = timestampToContainerString(metadata.takenAt);
    if (creationTime.empty())
        return WriteResult::failed("Taken time cannot be written as creation_time: " + std::to_string(metadata.takenAt));
    const bool writeLocation = metadata.gps.has_value() && containerSupportsLocation(filePath);
    const std::string location = writeLocation ? formatIso6709(*metadata.gps) : std::string();

    ContainerTags current;
    if (readContainerTags(filePath, current) &&
        current.creationTime == timestampToUTCString(metadata.takenAt) &&
        (!writeLocation || sameLocation(current.location, *metadata.gps)))
        return WriteResult::alreadyCurrent();

    ScopedTempFile temp(filePath);
    std::string cmd = "ffmpeg -nostdin -v error -y -i " + quoteArg(filePath.string()) +
                      " -map 0 -c copy -map_metadata 0 -metadata creation_time=" +
                      quoteArg(creationTime);
    if (writeLocation)
        cmd += " -metadata location=" + quoteArg(location);
    cmd += " " + quoteArg(temp.path().string()) + " 2>&1";

    std::string out;
    int ret = runCommand(cmd, out);
    if (ret != 0) {
        std::string why = ret == -1 ? "ffmpeg could not be run" : "ffmpeg exited with status " + std::to_string(ret);
        out = trimLine(out);
        if (!out.empty()) why += ": " + out.substr(0, 200);
        return WriteResult::failed(why);
    }
    std::string error;
    if (!temp.commit(error))
        return WriteResult::failed(error);
    return WriteResult::written();
}

std::string getVideoInfoString(const fs::path& filePath) {
    ContainerTags tags;
    if (!readContainerTags(filePath, tags)) return "(ffprobe failed)";
    if (tags.creationTime.empty() && tags.location.empty()) return "(no video metadata)";
    std::string out = "creation_time=" + (tags.creationTime.empty() ? std::string("(none)") : tags.creationTime);
    if (!tags.location.empty()) out += "; location=" + tags.location;
    return out;
}

}  // namespace metamerger
