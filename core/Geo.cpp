#include "Geo.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace sailtrack {

double Geo::radiusFor(DistanceUnit unit) {
    switch (unit) {
        case DistanceUnit::NauticalMiles: return EARTH_RADIUS_NM;
        case DistanceUnit::Kilometers: return EARTH_RADIUS_KM;
        case DistanceUnit::Meters: return EARTH_RADIUS_METERS;
    }
    return EARTH_RADIUS_NM;
}

double Geo::convert(double value, DistanceUnit from, DistanceUnit to) {
    if (from == to) {
        return value;
    }
    double meters = value;
    if (from == DistanceUnit::NauticalMiles) meters = value * METERS_PER_NM;
    else if (from == DistanceUnit::Kilometers) meters = value * 1000.0;

    if (to == DistanceUnit::NauticalMiles) return meters / METERS_PER_NM;
    if (to == DistanceUnit::Kilometers) return meters / 1000.0;
    return meters;
}

double Geo::distance(const LatLng& a, const LatLng& b, DistanceUnit unit) {
    double dLat = toRadians(b.lat - a.lat);
    double dLon = toRadians(b.lng - a.lng);

    double h = std::sin(dLat/2) * std::sin(dLat/2) +
               std::cos(toRadians(a.lat)) * std::cos(toRadians(b.lat)) *
               std::sin(dLon/2) * std::sin(dLon/2);

    double c = 2 * std::atan2(std::sqrt(h), std::sqrt(1-h));
    return radiusFor(unit) * c;
}

double Geo::distanceMeters(double lat1, double lon1, double lat2, double lon2) {
    return distance(LatLng{lat1, lon1}, LatLng{lat2, lon2}, DistanceUnit::Meters);
}

double Geo::initialBearing(const LatLng& from, const LatLng& to) {
    double dLon = toRadians(to.lng - from.lng);
    double y = std::sin(dLon) * std::cos(toRadians(to.lat));
    double x = std::cos(toRadians(from.lat)) * std::sin(toRadians(to.lat)) -
               std::sin(toRadians(from.lat)) * std::cos(toRadians(to.lat)) * std::cos(dLon);

    return normalizeBearing(toDegrees(std::atan2(y, x)));
}

LatLng Geo::destination(const LatLng& from, double bearingDeg, double distance, DistanceUnit unit) {
    double bearing = toRadians(bearingDeg);
    double d = distance / radiusFor(unit);

    double lat1 = toRadians(from.lat);
    double lon1 = toRadians(from.lng);

    double lat2 = std::asin(std::sin(lat1) * std::cos(d) +
                           std::cos(lat1) * std::sin(d) * std::cos(bearing));

    double lon2 = lon1 + std::atan2(std::sin(bearing) * std::sin(d) * std::cos(lat1),
                                   std::cos(d) - std::sin(lat1) * std::sin(lat2));

    return LatLng{toDegrees(lat2), normalizeAngle(toDegrees(lon2))};
}

double Geo::normalizeBearing(double degrees) {
    double result = std::fmod(degrees, 360.0);
    if (result < 0.0) {
        result += 360.0;
    }
    // fmod of a tiny negative value can round back up to 360
    return result >= 360.0 ? 0.0 : result;
}

double Geo::normalizeAngle(double degrees) {
    double result = normalizeBearing(degrees);
    return result > 180.0 ? result - 360.0 : result;
}

LatLng Geo::centroid(const std::vector<LatLng>& points) {
    if (points.empty()) {
        throw std::invalid_argument("Geo::centroid: no points");
    }

    double latSum = 0.0;
    double lngSum = 0.0;
    for (const auto& p : points) {
        latSum += p.lat;
        lngSum += p.lng;
    }
    auto n = static_cast<double>(points.size());
    return LatLng{latSum / n, lngSum / n};
}

BoundingBox Geo::boundingBox(const std::vector<LatLng>& points, double paddingDegrees) {
    if (points.empty()) {
        throw std::invalid_argument("Geo::boundingBox: no points");
    }

    BoundingBox box{points.front().lng, points.front().lat,
                    points.front().lng, points.front().lat};
    for (const auto& p : points) {
        box.west = std::min(box.west, p.lng);
        box.east = std::max(box.east, p.lng);
        box.south = std::min(box.south, p.lat);
        box.north = std::max(box.north, p.lat);
    }

    box.west -= paddingDegrees;
    box.south -= paddingDegrees;
    box.east += paddingDegrees;
    box.north += paddingDegrees;
    return box;
}

double Geo::toRadians(double degrees) {
    return degrees * M_PI / 180.0;
}

double Geo::toDegrees(double radians) {
    return radians * 180.0 / M_PI;
}

} // namespace sailtrack
