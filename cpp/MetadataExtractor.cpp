#include "MetadataExtractor.h"
#include "TimeConvert.h"
#include <nlohmann/json.hpp>
#include <cctype>
#include <cmath>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace metamerger {

namespace {

// Epoch seconds from "1700000000" or 1700000000; 0 on anything else
std::time_t readEpochSeconds(const json& value) {
    if (value.is_number_integer()) {
        long long v = value.get<long long>();
        return v > 0 ? static_cast<std::time_t>(v) : 0;
    }
    if (!value.is_string()) return 0;
    const std::string s = value.get<std::string>();
    if (s.empty() || s.size() > 18) return 0;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return 0;
    }
    return static_cast<std::time_t>(std::stoll(s));
}

bool readCoordinate(const json& geo, const char* key, double& out) {
    auto it = geo.find(key);
    if (it == geo.end()) return false;
    if (it->is_number()) {
        out = it->get<double>();
    } else if (it->is_string()) {
        try {
            std::size_t used = 0;
            const std::string s = it->get<std::string>();
            out = std::stod(s, &used);
            if (used != s.size()) return false;
        } catch (const std::exception&) {
            return false;
        }
    } else {
        return false;
    }
    return std::isfinite(out);
}

// Position from a geoData-style object; empty for the 0/0 placeholder or out-of-range values
std::optional<GpsPosition> readGeo(const json& root, const char* key) {
    auto it = root.find(key);
    if (it == root.end() || !it->is_object()) return std::nullopt;
    GpsPosition pos;
    if (!readCoordinate(*it, "latitude", pos.latitude) || !readCoordinate(*it, "longitude", pos.longitude))
        return std::nullopt;
    if (pos.latitude == 0.0 && pos.longitude == 0.0) return std::nullopt;
    if (std::fabs(pos.latitude) > 90.0 || std::fabs(pos.longitude) > 180.0) return std::nullopt;
    double altitude = 0.0;
    if (readCoordinate(*it, "altitude", altitude))
        pos.altitude = altitude;
    return pos;
}

}  // namespace

bool parseSidecarJson(const std::string& jsonText, CanonicalMetadata& metadata, std::string& error) {
    json root;
    try {
        root = json::parse(jsonText);
    } catch (const json::exception& e) {
        error = std::string("JSON parse error: ") + e.what();
        return false;
    }
    if (!root.is_object()) {
        error = "JSON root is not an object";
        return false;
    }

    auto taken = root.find("photoTakenTime");
    if (taken == root.end() || !taken->is_object() || !taken->contains("timestamp")) {
        error = "Missing photoTakenTime.timestamp";
        return false;
    }
    std::time_t takenAt = readEpochSeconds((*taken)["timestamp"]);
    if (takenAt <= 0) {
        error = "Invalid photoTakenTime.timestamp: " + (*taken)["timestamp"].dump();
        return false;
    }
    if (takenAt > kLatestFormattableTimestamp) {
        error = "photoTakenTime.timestamp is past year 9999: " + (*taken)["timestamp"].dump();
        return false;
    }

    CanonicalMetadata result;
    result.takenAt = takenAt;
    result.gps = readGeo(root, "geoData");
    if (!result.gps)
        result.gps = readGeo(root, "geoDataExif");
    metadata = result;
    return true;
}

bool extractMetadata(const fs::path& sidecarPath, CanonicalMetadata& metadata, std::string& error) {
    std::ifstream in(sidecarPath, std::ios::binary);
    if (!in) {
        error = "Cannot open sidecar: " + sidecarPath.string();
        return false;
    }
    std::ostringstream content;
    content << in.rdbuf();
    if (in.bad()) {
        error = "Read error on sidecar: " + sidecarPath.string();
        return false;
    }
    return parseSidecarJson(content.str(), metadata, error);
}

}  // namespace metamerger
