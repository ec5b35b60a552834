#include "TrackAnalyzer.hpp"
#include "../Geo.hpp"
#include <cmath>
#include <stdexcept>

namespace sailtrack::domain {

std::string maneuverTypeToString(ManeuverType type) {
    switch (type) {
        case ManeuverType::Tack: return "tack";
        case ManeuverType::Gybe: return "gybe";
        case ManeuverType::Unclassified: return "unclassified";
    }
    return "unclassified";
}

TrackAnalyzer::TrackAnalyzer(double maneuverThresholdDeg)
    : maneuverThresholdDeg_(maneuverThresholdDeg) {
    if (!std::isfinite(maneuverThresholdDeg) || maneuverThresholdDeg <= 0.0 ||
        maneuverThresholdDeg >= 180.0) {
        throw std::invalid_argument("Maneuver threshold must be within (0, 180) degrees");
    }
}

TrackStats TrackAnalyzer::computeStats(const Track& track) const {
    TrackStats stats;
    stats.pointCount = track.points.size();
    if (track.points.empty()) {
        return stats;
    }

    double speedSum = 0.0;
    std::size_t speedSamples = 0;
    for (std::size_t i = 0; i < track.points.size(); ++i) {
        const auto& point = track.points[i];
        if (point.speed) {
            speedSum += *point.speed;
            ++speedSamples;
            if (*point.speed > stats.maxSpeed) {
                stats.maxSpeed = *point.speed;
            }
        }
        if (i > 0) {
            stats.totalDistance += Geo::distance(toLatLng(track.points[i - 1]), toLatLng(point),
                                                 DistanceUnit::NauticalMiles);
        }
    }
    if (speedSamples > 0) {
        stats.avgSpeed = speedSum / static_cast<double>(speedSamples);
    }

    stats.duration = track.points.back().timestamp - track.points.front().timestamp;

    stats.maneuvers = detectManeuvers(track);
    for (const auto& maneuver : stats.maneuvers) {
        if (maneuver.type == ManeuverType::Tack) {
            ++stats.tackCount;
        } else if (maneuver.type == ManeuverType::Gybe) {
            ++stats.gybeCount;
        }
    }
    return stats;
}

std::vector<Maneuver> TrackAnalyzer::detectManeuvers(const Track& track) const {
    std::vector<Maneuver> maneuvers;
    for (std::size_t i = 1; i < track.points.size(); ++i) {
        const auto& previous = track.points[i - 1];
        const auto& current = track.points[i];
        if (!previous.heading || !current.heading) {
            continue;
        }

        double delta = Geo::normalizeAngle(*current.heading - *previous.heading);
        if (std::fabs(delta) <= maneuverThresholdDeg_) {
            continue;
        }

        Maneuver maneuver;
        maneuver.pointIndex = i;
        maneuver.timestamp = current.timestamp;
        maneuver.headingChange = delta;
        maneuver.twa = current.twa;
        if (current.twa) {
            maneuver.type = std::fabs(Geo::normalizeAngle(*current.twa)) < BEAM_REACH_DEG
                                ? ManeuverType::Tack
                                : ManeuverType::Gybe;
        }
        maneuvers.push_back(maneuver);
    }
    return maneuvers;
}

VmgResult TrackAnalyzer::computeVmg(const Track& track, double windDirection) {
    VmgResult result;
    double upwindSum = 0.0;
    double downwindSum = 0.0;

    for (const auto& point : track.points) {
        if (!point.speed || !point.heading) {
            continue;
        }
        double twa = Geo::normalizeAngle(*point.heading - windDirection);
        double component = *point.speed * std::cos(Geo::toRadians(twa));
        if (std::fabs(twa) < BEAM_REACH_DEG) {
            upwindSum += component;
            ++result.upwindSamples;
        } else {
            downwindSum += std::fabs(component);
            ++result.downwindSamples;
        }
    }

    if (result.upwindSamples > 0) {
        result.upwindVmg = upwindSum / static_cast<double>(result.upwindSamples);
    }
    if (result.downwindSamples > 0) {
        result.downwindVmg = downwindSum / static_cast<double>(result.downwindSamples);
    }
    return result;
}

std::vector<Track> TrackAnalyzer::splitByGap(const Track& track, int64_t gapMs) {
    if (gapMs <= 0) {
        throw std::invalid_argument("Session gap must be positive");
    }

    std::vector<Track> sessions;
    Track current;
    current.name = track.name;
    current.device = track.device;

    for (const auto& point : track.points) {
        if (!current.points.empty() && point.timestamp - current.points.back().timestamp > gapMs) {
            current.updateTimeBounds();
            sessions.push_back(current);
            current.points.clear();
        }
        current.points.push_back(point);
    }
    if (!current.points.empty()) {
        current.updateTimeBounds();
        sessions.push_back(current);
    }
    return sessions;
}

} // namespace sailtrack::domain
