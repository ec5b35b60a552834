#include "Track.hpp"
#include <cmath>
#include <unordered_map>

namespace sailtrack {

void Track::updateTimeBounds() {
    if (points.empty()) {
        startTime = 0;
        endTime = 0;
        return;
    }
    startTime = points.front().timestamp;
    endTime = points.back().timestamp;
}

std::string sourceFormatToString(SourceFormat format) {
    static const std::unordered_map<SourceFormat, std::string> formatMap = {
        {SourceFormat::Gpx, "gpx"},
        {SourceFormat::Vcc, "vcc"},
        {SourceFormat::DelimitedText, "csv"}
    };

    auto it = formatMap.find(format);
    return (it != formatMap.end()) ? it->second : "unknown";
}

SourceFormat stringToSourceFormat(const std::string& str) {
    static const std::unordered_map<std::string, SourceFormat> stringMap = {
        {"gpx", SourceFormat::Gpx},
        {"vcc", SourceFormat::Vcc},
        {"csv", SourceFormat::DelimitedText},
        {"txt", SourceFormat::DelimitedText}
    };

    auto it = stringMap.find(str);
    return (it != stringMap.end()) ? it->second : SourceFormat::Gpx;
}

std::string distanceUnitToString(DistanceUnit unit) {
    switch (unit) {
        case DistanceUnit::NauticalMiles: return "nm";
        case DistanceUnit::Kilometers: return "km";
        case DistanceUnit::Meters: return "m";
    }
    return "nm";
}

DistanceUnit stringToDistanceUnit(const std::string& str) {
    static const std::unordered_map<std::string, DistanceUnit> stringMap = {
        {"nm", DistanceUnit::NauticalMiles},
        {"nmi", DistanceUnit::NauticalMiles},
        {"km", DistanceUnit::Kilometers},
        {"m", DistanceUnit::Meters}
    };

    auto it = stringMap.find(str);
    return (it != stringMap.end()) ? it->second : DistanceUnit::NauticalMiles;
}

bool isValidLatitude(double lat) {
    return std::isfinite(lat) && lat >= -90.0 && lat <= 90.0;
}

bool isValidLongitude(double lng) {
    return std::isfinite(lng) && lng >= -180.0 && lng <= 180.0;
}

} // namespace sailtrack
