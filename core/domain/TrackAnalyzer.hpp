#pragma once

#include "../Track.hpp"
#include <optional>
#include <string>
#include <vector>

namespace sailtrack::domain {

enum class ManeuverType {
    Tack,
    Gybe,
    Unclassified
};

std::string maneuverTypeToString(ManeuverType type);

struct Maneuver {
    std::size_t pointIndex = 0;        // the point the boat turned onto
    int64_t timestamp = 0;
    double headingChange = 0.0;        // signed, (-180, 180]
    std::optional<double> twa;
    ManeuverType type = ManeuverType::Unclassified;
};

struct TrackStats {
    double maxSpeed = 0.0;             // knots
    double avgSpeed = 0.0;             // knots, over points reporting speed
    double totalDistance = 0.0;        // nautical miles
    int64_t duration = 0;              // millis
    std::size_t pointCount = 0;
    std::size_t tackCount = 0;
    std::size_t gybeCount = 0;
    std::vector<Maneuver> maneuvers;
};

struct VmgResult {
    std::optional<double> upwindVmg;
    std::optional<double> downwindVmg;
    std::size_t upwindSamples = 0;
    std::size_t downwindSamples = 0;
};

/**
 * @brief Derived performance metrics for a track
 *
 * Maneuver detection is a heuristic over heading samples: a heading change
 * above the threshold between two consecutive points is a maneuver, and the
 * true wind angle at the turn point decides tack (|TWA| < 90) or gybe. Slow
 * roll tacks spread over several samples fall below the threshold and are
 * missed; sharp course changes on a reach are counted. Maneuvers at points
 * without TWA are reported as Unclassified and counted as neither.
 */
class TrackAnalyzer {
public:
    static constexpr double DEFAULT_MANEUVER_THRESHOLD_DEG = 60.0;
    static constexpr double BEAM_REACH_DEG = 90.0;

    explicit TrackAnalyzer(double maneuverThresholdDeg = DEFAULT_MANEUVER_THRESHOLD_DEG);

    TrackStats computeStats(const Track& track) const;
    std::vector<Maneuver> detectManeuvers(const Track& track) const;

    // windDirection is the true direction the wind blows from, degrees.
    static VmgResult computeVmg(const Track& track, double windDirection);

    // Breaks the track wherever consecutive timestamps are more than gapMs apart.
    static std::vector<Track> splitByGap(const Track& track, int64_t gapMs);

private:
    double maneuverThresholdDeg_;
};

} // namespace sailtrack::domain
