#pragma once

#include "../Track.hpp"
#include <vector>

namespace sailtrack::domain {

/**
 * @brief Douglas-Peucker reduction of a point sequence
 *
 * Distances are measured in meters on a local planar projection (longitude
 * scaled by cos(latitude)) against the chord segment, so every dropped point
 * lies within the tolerance of the simplified line. First and last points
 * are always kept; inputs of two points or fewer come back unchanged.
 */
class TrackSimplifier {
public:
    explicit TrackSimplifier(double toleranceMeters);

    std::vector<TrackPoint> simplify(const std::vector<TrackPoint>& points) const;
    Track simplify(const Track& track) const;

    double tolerance() const { return toleranceMeters_; }

    // Meters from p to the segment a-b.
    static double segmentDistanceMeters(const TrackPoint& p, const TrackPoint& a,
                                        const TrackPoint& b);

private:
    double toleranceMeters_;
};

} // namespace sailtrack::domain
