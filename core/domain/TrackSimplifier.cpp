#include "TrackSimplifier.hpp"
#include "../Geo.hpp"
#include <cmath>
#include <stdexcept>
#include <utility>

namespace sailtrack::domain {

TrackSimplifier::TrackSimplifier(double toleranceMeters) : toleranceMeters_(toleranceMeters) {
    if (!std::isfinite(toleranceMeters) || toleranceMeters < 0.0) {
        throw std::invalid_argument("Simplification tolerance must be a non-negative number");
    }
}

double TrackSimplifier::segmentDistanceMeters(const TrackPoint& p, const TrackPoint& a,
                                              const TrackPoint& b) {
    const double metersPerDegree = Geo::toRadians(1.0) * Geo::EARTH_RADIUS_METERS;
    const double cosLat = std::cos(Geo::toRadians(a.lat));

    // Local plane centered on a
    const double bx = (b.lng - a.lng) * cosLat * metersPerDegree;
    const double by = (b.lat - a.lat) * metersPerDegree;
    const double px = (p.lng - a.lng) * cosLat * metersPerDegree;
    const double py = (p.lat - a.lat) * metersPerDegree;

    const double lengthSq = bx * bx + by * by;
    if (lengthSq == 0.0) {
        return std::hypot(px, py);
    }

    double t = (px * bx + py * by) / lengthSq;
    if (t < 0.0) t = 0.0;
    if (t > 1.0) t = 1.0;
    return std::hypot(px - t * bx, py - t * by);
}

std::vector<TrackPoint> TrackSimplifier::simplify(const std::vector<TrackPoint>& points) const {
    if (points.size() <= 2) {
        return points;
    }

    std::vector<bool> keep(points.size(), false);
    keep.front() = true;
    keep.back() = true;

    std::vector<std::pair<std::size_t, std::size_t>> stack;
    stack.emplace_back(0, points.size() - 1);

    while (!stack.empty()) {
        auto [first, last] = stack.back();
        stack.pop_back();
        if (last <= first + 1) {
            continue;
        }

        double maxDistance = 0.0;
        std::size_t index = first;
        for (std::size_t i = first + 1; i < last; ++i) {
            double d = segmentDistanceMeters(points[i], points[first], points[last]);
            if (d > maxDistance) {
                maxDistance = d;
                index = i;
            }
        }

        if (maxDistance > toleranceMeters_) {
            keep[index] = true;
            stack.emplace_back(index, last);
            stack.emplace_back(first, index);
        }
    }

    std::vector<TrackPoint> result;
    for (std::size_t i = 0; i < points.size(); ++i) {
        if (keep[i]) {
            result.push_back(points[i]);
        }
    }
    return result;
}

Track TrackSimplifier::simplify(const Track& track) const {
    Track result = track;
    result.points = simplify(track.points);
    result.updateTimeBounds();
    return result;
}

} // namespace sailtrack::domain
