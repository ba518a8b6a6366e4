#pragma once

#include "Metadata.h"
#include "WriteResult.h"
#include <exiv2/exiv2.hpp>
#include <filesystem>
#include <string>

namespace fs = std::filesystem;

namespace metamerger {

bool getExifData(const std::string& filepath, Exiv2::ExifData& exifData);

// |decimal degrees| as EXIF rationals "D/1 M/1 S/10000"
std::string formatGpsRational(double decimalDegrees);

// Decimal degrees from a GPSLatitude/GPSLongitude datum and its reference ("N","S","E","W")
double gpsRationalToDecimal(const Exiv2::Exifdatum& datum, const std::string& ref);

// Read-modify-write the date and GPS tags, preserving every other tag. The write goes through a
// temp copy that replaces the file only on success. When Exiv2 does not recognize the image type
// the result is Unsupported if unidentifiedIsUnsupported, Failed otherwise.
WriteResult writeExifMetadata(const fs::path& filepath, const CanonicalMetadata& metadata,
                              bool unidentifiedIsUnsupported);

// Read DateTimeOriginal (as UTC) and GPS back; false if no date tag is present
bool readExifMetadata(const fs::path& filepath, CanonicalMetadata& metadata);

// Date and GPS tags as one string for the log; "(none)" style text on failure
std::string getExifInfoString(const fs::path& filepath);

}  // namespace metamerger
