#pragma once

#include <ctime>
#include <optional>

namespace metamerger {

// GPS position restored from a sidecar. Altitude is meters above sea level.
struct GpsPosition {
    double latitude = 0.0;
    double longitude = 0.0;
    std::optional<double> altitude;
};

// Reconciled record applied to a media file.
// takenAt is UTC epoch seconds and always set once extraction succeeds.
struct CanonicalMetadata {
    std::time_t takenAt = 0;
    std::optional<GpsPosition> gps;
};

}  // namespace metamerger
