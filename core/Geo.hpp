#pragma once

#include "Track.hpp"
#include <array>
#include <vector>

namespace sailtrack {

struct LatLng {
    double lat = 0.0;
    double lng = 0.0;
};

struct BoundingBox {
    double west = 0.0;
    double south = 0.0;
    double east = 0.0;
    double north = 0.0;

    // [west, south, east, north], the GeoJSON bbox order.
    std::array<double, 4> toArray() const { return {west, south, east, north}; }
};

class Geo {
public:
    static constexpr double EARTH_RADIUS_NM = 3440.065;
    static constexpr double EARTH_RADIUS_KM = 6371.0;
    static constexpr double EARTH_RADIUS_METERS = 6371000.0;
    static constexpr double METERS_PER_NM = 1852.0;
    static constexpr double DEFAULT_BOUNDS_PADDING_DEG = 0.005;

    static double distance(const LatLng& a, const LatLng& b,
                           DistanceUnit unit = DistanceUnit::NauticalMiles);
    static double distanceMeters(double lat1, double lon1, double lat2, double lon2);
    static double initialBearing(const LatLng& from, const LatLng& to);

    static LatLng destination(const LatLng& from, double bearingDeg, double distance,
                              DistanceUnit unit = DistanceUnit::NauticalMiles);

    static double normalizeBearing(double degrees);
    static double normalizeAngle(double degrees);

    static LatLng centroid(const std::vector<LatLng>& points);
    static BoundingBox boundingBox(const std::vector<LatLng>& points,
                                   double paddingDegrees = DEFAULT_BOUNDS_PADDING_DEG);

    static double radiusFor(DistanceUnit unit);
    static double convert(double value, DistanceUnit from, DistanceUnit to);

    static double toRadians(double degrees);
    static double toDegrees(double radians);
};

inline LatLng toLatLng(const TrackPoint& point) {
    return LatLng{point.lat, point.lng};
}

} // namespace sailtrack
