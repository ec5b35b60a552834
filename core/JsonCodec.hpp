#pragma once

#include "Track.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace sailtrack {

class JsonCodec {
public:
    static std::string serialize(const Track& track, int indent = -1);
    static Track deserialize(const std::string& json);

    static nlohmann::json trackToJson(const Track& track);
    static Track jsonToTrack(const nlohmann::json& json);

    static nlohmann::json pointToJson(const TrackPoint& point);
    static TrackPoint jsonToPoint(const nlohmann::json& json);

    // {"boatId", "lat", "lng", "ts", "speed"?, "heading"?}
    // Throws nlohmann::json::exception or std::runtime_error on bad input.
    static LivePosition decodeLivePosition(const std::string& payload);
    static nlohmann::json livePositionToJson(const LivePosition& position);
};

} // namespace sailtrack
