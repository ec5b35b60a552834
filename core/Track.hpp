#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sailtrack {

enum class SourceFormat {
    Gpx,
    Vcc,
    DelimitedText
};

enum class DistanceUnit {
    NauticalMiles,
    Kilometers,
    Meters
};

struct TrackPoint {
    double lat = 0.0;
    double lng = 0.0;
    int64_t timestamp = 0;   // epoch millis

    std::optional<double> speed;      // knots
    std::optional<double> heading;    // degrees true
    std::optional<double> cog;        // degrees true
    std::optional<double> altitude;   // meters
    std::optional<double> twa;        // degrees, signed
    std::optional<double> tws;        // knots
};

struct Track {
    std::vector<TrackPoint> points;
    int64_t startTime = 0;
    int64_t endTime = 0;

    std::optional<std::string> name;
    std::optional<std::string> device;

    bool empty() const { return points.empty(); }
    std::size_t size() const { return points.size(); }

    // Sets startTime/endTime from the first and last point.
    void updateTimeBounds();
};

// One message of the live position feed.
struct LivePosition {
    std::string boatId;
    double lat = 0.0;
    double lng = 0.0;
    int64_t timestamp = 0;   // epoch millis

    std::optional<double> speed;
    std::optional<double> heading;
};

struct TrackImportResult {
    bool success = false;
    std::vector<Track> tracks;
    std::vector<std::string> errors;
    SourceFormat format = SourceFormat::Gpx;
};

std::string sourceFormatToString(SourceFormat format);
SourceFormat stringToSourceFormat(const std::string& str);

std::string distanceUnitToString(DistanceUnit unit);
DistanceUnit stringToDistanceUnit(const std::string& str);

bool isValidLatitude(double lat);
bool isValidLongitude(double lng);

} // namespace sailtrack
