#include "ExifHelper.h"
#include "ScopedTempFile.h"
#include "TimeConvert.h"
#include <algorithm>
#include <cmath>
#include <utility>
#include <vector>
#ifdef _WIN32
#include <windows.h>
#endif

namespace metamerger {

namespace {

// Path string that Exiv2 can open. On Windows without EXIV2_ENABLE_WIN_UNICODE, fopen() expects ACP.
std::string pathForExiv2(const std::string& filepath) {
#ifdef _WIN32
    std::filesystem::path p(filepath);
    std::wstring wpath = p.wstring();
    int n = WideCharToMultiByte(CP_ACP, 0, wpath.c_str(), -1, nullptr, 0, nullptr, nullptr);
    if (n <= 0) return filepath;
    std::string result(static_cast<size_t>(n) - 1, '\0');
    WideCharToMultiByte(CP_ACP, 0, wpath.c_str(), -1, &result[0], n, nullptr, nullptr);
    std::replace(result.begin(), result.end(), '\\', '/');
    return result;
#else
    return filepath;
#endif
}

const std::vector<std::string>& exifTimeTags() {
    static const std::vector<std::string> tags = {
        "Exif.Photo.DateTimeOriginal",
        "Exif.Photo.DateTimeDigitized",
        "Exif.Image.DateTime",
    };
    return tags;
}

// Date strings are serialized in UTC, so the offsets say so
const std::vector<std::string>& exifOffsetTags() {
    static const std::vector<std::string> tags = {
        "Exif.Photo.OffsetTimeOriginal",
        "Exif.Photo.OffsetTimeDigitized",
        "Exif.Photo.OffsetTime",
    };
    return tags;
}

const char kUtcOffset[] = "+00:00";

// 1/10000 arc-second resolution for the seconds rational
constexpr long long kSecondsDenominator = 10000;
constexpr long long kAltitudeDenominator = 100;

using TagAssignments = std::vector<std::pair<std::string, Exiv2::Value::UniquePtr>>;

Exiv2::Value::UniquePtr makeValue(Exiv2::TypeId type, const std::string& text) {
    auto value = Exiv2::Value::create(type);
    value->read(text);
    return value;
}

TagAssignments buildAssignments(const CanonicalMetadata& metadata) {
    TagAssignments tags;
    const std::string dateTime = timestampToExifString(metadata.takenAt);
    for (const auto& tag : exifTimeTags())
        tags.emplace_back(tag, makeValue(Exiv2::asciiString, dateTime));
    for (const auto& tag : exifOffsetTags())
        tags.emplace_back(tag, makeValue(Exiv2::asciiString, kUtcOffset));

    if (metadata.gps) {
        const GpsPosition& gps = *metadata.gps;
        tags.emplace_back("Exif.GPSInfo.GPSVersionID", makeValue(Exiv2::unsignedByte, "2 2 0 0"));
        tags.emplace_back("Exif.GPSInfo.GPSLatitudeRef", makeValue(Exiv2::asciiString, gps.latitude >= 0.0 ? "N" : "S"));
        tags.emplace_back("Exif.GPSInfo.GPSLatitude", makeValue(Exiv2::unsignedRational, formatGpsRational(gps.latitude)));
        tags.emplace_back("Exif.GPSInfo.GPSLongitudeRef", makeValue(Exiv2::asciiString, gps.longitude >= 0.0 ? "E" : "W"));
        tags.emplace_back("Exif.GPSInfo.GPSLongitude", makeValue(Exiv2::unsignedRational, formatGpsRational(gps.longitude)));
        if (gps.altitude) {
            long long centimeters = std::llround(std::fabs(*gps.altitude) * kAltitudeDenominator);
            tags.emplace_back("Exif.GPSInfo.GPSAltitudeRef", makeValue(Exiv2::unsignedByte, *gps.altitude < 0.0 ? "1" : "0"));
            tags.emplace_back("Exif.GPSInfo.GPSAltitude",
                              makeValue(Exiv2::unsignedRational, std::to_string(centimeters) + "/" + std::to_string(kAltitudeDenominator)));
        }
    }
    return tags;
}

bool tagsAlreadyCurrent(const Exiv2::ExifData& exifData, const TagAssignments& tags) {
    for (const auto& tag : tags) {
        auto pos = exifData.findKey(Exiv2::ExifKey(tag.first));
        if (pos == exifData.end() || pos->toString() != tag.second->toString())
            return false;
    }
    return true;
}

void applyAssignments(Exiv2::ExifData& exifData, const TagAssignments& tags) {
    for (const auto& tag : tags) {
        Exiv2::ExifKey key(tag.first);
        auto pos = exifData.findKey(key);
        if (pos != exifData.end())
            pos->setValue(tag.second.get());
        else
            exifData.add(key, tag.second.get());
    }
}

std::string findString(const Exiv2::ExifData& exifData, const char* key) {
    auto pos = exifData.findKey(Exiv2::ExifKey(key));
    return pos == exifData.end() ? std::string() : pos->toString();
}

}  // namespace

bool getExifData(const std::string& filepath, Exiv2::ExifData& exifData) {
    try {
        auto image = Exiv2::ImageFactory::open(pathForExiv2(filepath));
        if (!image.get()) return false;
        image->readMetadata();
        exifData = image->exifData();
        return true;
    } catch (const Exiv2::Error&) {
        return false;
    }
}

std::string formatGpsRational(double decimalDegrees) {
    constexpr long long perMinute = 60 * kSecondsDenominator;
    constexpr long long perDegree = 60 * perMinute;
    long long total = std::llround(std::fabs(decimalDegrees) * static_cast<double>(perDegree));
    long long degrees = total / perDegree;
    long long minutes = (total % perDegree) / perMinute;
    long long seconds = total % perMinute;
    return std::to_string(degrees) + "/1 " + std::to_string(minutes) + "/1 " +
           std::to_string(seconds) + "/" + std::to_string(kSecondsDenominator);
}

double gpsRationalToDecimal(const Exiv2::Exifdatum& datum, const std::string& ref) {
    static const double divisors[3] = { 1.0, 60.0, 3600.0 };
    double value = 0.0;
    for (size_t i = 0; i < 3 && i < datum.count(); ++i) {
        Exiv2::Rational r = datum.toRational(i);
        if (r.second != 0)
            value += static_cast<double>(r.first) / r.second / divisors[i];
    }
    return (ref == "S" || ref == "W") ? -value : value;
}

WriteResult writeExifMetadata(const fs::path& filepath, const CanonicalMetadata& metadata,
                              bool unidentifiedIsUnsupported) {
    const std::string pathToOpen = pathForExiv2(filepath.string());
    try {
        auto type = Exiv2::ImageFactory::getType(pathToOpen);
        if (type == Exiv2::ImageType::none) {
            const std::string why = "Exiv2 does not recognize the image data";
            return unidentifiedIsUnsupported ? WriteResult::unsupported(why) : WriteResult::failed(why);
        }
        Exiv2::AccessMode mode = Exiv2::ImageFactory::checkMode(type, Exiv2::mdExif);
        if (mode != Exiv2::amWrite && mode != Exiv2::amReadWrite)
            return WriteResult::unsupported("Exiv2 cannot write EXIF to this image type");

        if (timestampToExifString(metadata.takenAt).empty())
            return WriteResult::failed("Taken time cannot be written as an EXIF date: " + std::to_string(metadata.takenAt));
        const TagAssignments tags = buildAssignments(metadata);
        {
            auto image = Exiv2::ImageFactory::open(pathToOpen);
            if (!image.get()) return WriteResult::failed("Exiv2 could not open the file");
            image->readMetadata();
            if (tagsAlreadyCurrent(image->exifData(), tags))
                return WriteResult::alreadyCurrent();
        }

        ScopedTempFile temp(filepath);
        std::string error;
        if (!temp.copyFromTarget(error))
            return WriteResult::failed(error);
        {
            auto image = Exiv2::ImageFactory::open(pathForExiv2(temp.path().string()));
            if (!image.get()) return WriteResult::failed("Exiv2 could not open the temp copy");
            image->readMetadata();
            applyAssignments(image->exifData(), tags);
            image->writeMetadata();
        }
        if (!temp.commit(error))
            return WriteResult::failed(error);
        return WriteResult::written();
    } catch (const Exiv2::Error& e) {
        if (e.code() == Exiv2::ErrorCode::kerWritingImageFormatUnsupported)
            return WriteResult::unsupported(std::string("Exiv2: ") + e.what());
        return WriteResult::failed(std::string("Exiv2: ") + e.what());
    }
}

bool readExifMetadata(const fs::path& filepath, CanonicalMetadata& metadata) {
    Exiv2::ExifData exifData;
    if (!getExifData(filepath.string(), exifData)) return false;

    std::string dateTime = findString(exifData, "Exif.Photo.DateTimeOriginal");
    if (dateTime.empty()) dateTime = findString(exifData, "Exif.Image.DateTime");
    std::time_t takenAt = utcStringToTimestamp(dateTime);
    if (takenAt == static_cast<std::time_t>(-1)) return false;

    CanonicalMetadata result;
    result.takenAt = takenAt;
    auto lat = exifData.findKey(Exiv2::ExifKey("Exif.GPSInfo.GPSLatitude"));
    auto lon = exifData.findKey(Exiv2::ExifKey("Exif.GPSInfo.GPSLongitude"));
    if (lat != exifData.end() && lon != exifData.end()) {
        GpsPosition gps;
        gps.latitude = gpsRationalToDecimal(*lat, findString(exifData, "Exif.GPSInfo.GPSLatitudeRef"));
        gps.longitude = gpsRationalToDecimal(*lon, findString(exifData, "Exif.GPSInfo.GPSLongitudeRef"));
        auto alt = exifData.findKey(Exiv2::ExifKey("Exif.GPSInfo.GPSAltitude"));
        if (alt != exifData.end()) {
            Exiv2::Rational r = alt->toRational(0);
            if (r.second != 0) {
                double meters = static_cast<double>(r.first) / r.second;
                gps.altitude = findString(exifData, "Exif.GPSInfo.GPSAltitudeRef") == "1" ? -meters : meters;
            }
        }
        result.gps = gps;
    }
    metadata = result;
    return true;
}

std::string getExifInfoString(const fs::path& filepath) {
    Exiv2::ExifData exifData;
    if (!getExifData(filepath.string(), exifData)) return "(EXIF read failed)";
    static const std::vector<std::string> gpsTags = {
        "Exif.GPSInfo.GPSLatitudeRef", "Exif.GPSInfo.GPSLatitude",
        "Exif.GPSInfo.GPSLongitudeRef", "Exif.GPSInfo.GPSLongitude",
        "Exif.GPSInfo.GPSAltitude",
    };
    std::string out;
    auto append = [&](const std::string& tag) {
        auto pos = exifData.findKey(Exiv2::ExifKey(tag));
        if (pos == exifData.end()) return;
        if (!out.empty()) out += "; ";
        out += tag + "=" + pos->toString();
    };
    for (const auto& tag : exifTimeTags()) append(tag);
    for (const auto& tag : gpsTags) append(tag);
    return out.empty() ? "(no EXIF date/GPS tags)" : out;
}

}  // namespace metamerger
