#include "JsonCodec.hpp"
#include <cmath>
#include <cstdint>
#include <limits>
#include <stdexcept>

namespace sailtrack {

namespace {

void putOptional(nlohmann::json& j, const char* key, const std::optional<double>& value) {
    if (value) {
        j[key] = *value;
    }
}

std::optional<double> getOptional(const nlohmann::json& json, const char* key) {
    auto it = json.find(key);
    if (it == json.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_number()) {
        throw std::runtime_error(std::string("field '") + key + "' is not a number");
    }
    return it->get<double>();
}

double getRequiredNumber(const nlohmann::json& json, const char* key) {
    auto it = json.find(key);
    if (it == json.end() || !it->is_number()) {
        throw std::runtime_error(std::string("missing numeric field '") + key + "'");
    }
    return it->get<double>();
}

// Epoch milliseconds; floats are truncated, values outside int64 rejected
int64_t getTimestamp(const nlohmann::json& value, const char* key) {
    if (value.is_number_unsigned()) {
        if (value.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            throw std::runtime_error(std::string("field '") + key + "' is out of range");
        }
        return static_cast<int64_t>(value.get<uint64_t>());
    }
    if (value.is_number_integer()) {
        return value.get<int64_t>();
    }
    if (!value.is_number()) {
        throw std::runtime_error(std::string("missing numeric field '") + key + "'");
    }

    // 2^63: the first double that does not fit
    constexpr double kLimit = 9223372036854775808.0;
    const double ms = std::trunc(value.get<double>());
    if (!std::isfinite(ms) || ms >= kLimit || ms < -kLimit) {
        throw std::runtime_error(std::string("field '") + key + "' is out of range");
    }
    return static_cast<int64_t>(ms);
}

} // namespace

std::string JsonCodec::serialize(const Track& track, int indent) {
    return trackToJson(track).dump(indent);
}

Track JsonCodec::deserialize(const std::string& json) {
    return jsonToTrack(nlohmann::json::parse(json));
}

nlohmann::json JsonCodec::trackToJson(const Track& track) {
    nlohmann::json j;

    if (track.name) {
        j["name"] = *track.name;
    }
    if (track.device) {
        j["device"] = *track.device;
    }
    j["startTime"] = track.startTime;
    j["endTime"] = track.endTime;

    nlohmann::json points = nlohmann::json::array();
    for (const auto& point : track.points) {
        points.push_back(pointToJson(point));
    }
    j["points"] = points;

    return j;
}

Track JsonCodec::jsonToTrack(const nlohmann::json& json) {
    Track track;

    if (json.contains("name") && json["name"].is_string()) {
        track.name = json["name"].get<std::string>();
    }
    if (json.contains("device") && json["device"].is_string()) {
        track.device = json["device"].get<std::string>();
    }

    if (json.contains("points") && json["points"].is_array()) {
        for (const auto& point : json["points"]) {
            track.points.push_back(jsonToPoint(point));
        }
    }
    track.updateTimeBounds();
    return track;
}

nlohmann::json JsonCodec::pointToJson(const TrackPoint& point) {
    nlohmann::json j;
    j["ts"] = point.timestamp;
    j["lat"] = point.lat;
    j["lng"] = point.lng;
    putOptional(j, "speed", point.speed);
    putOptional(j, "heading", point.heading);
    putOptional(j, "cog", point.cog);
    putOptional(j, "altitude", point.altitude);
    putOptional(j, "twa", point.twa);
    putOptional(j, "tws", point.tws);
    return j;
}

TrackPoint JsonCodec::jsonToPoint(const nlohmann::json& json) {
    TrackPoint point;
    auto ts = json.find("ts");
    point.timestamp = (ts == json.end() || ts->is_null()) ? 0 : getTimestamp(*ts, "ts");
    point.lat = json.value("lat", 0.0);
    point.lng = json.value("lng", 0.0);
    point.speed = getOptional(json, "speed");
    point.heading = getOptional(json, "heading");
    point.cog = getOptional(json, "cog");
    point.altitude = getOptional(json, "altitude");
    point.twa = getOptional(json, "twa");
    point.tws = getOptional(json, "tws");
    return point;
}

LivePosition JsonCodec::decodeLivePosition(const std::string& payload) {
    nlohmann::json json = nlohmann::json::parse(payload);
    if (!json.is_object()) {
        throw std::runtime_error("position message is not a JSON object");
    }

    LivePosition position;
    auto boatId = json.find("boatId");
    if (boatId == json.end() || !boatId->is_string() || boatId->get<std::string>().empty()) {
        throw std::runtime_error("missing 'boatId'");
    }
    position.boatId = boatId->get<std::string>();
    position.lat = getRequiredNumber(json, "lat");
    position.lng = getRequiredNumber(json, "lng");
    auto ts = json.find("ts");
    if (ts == json.end()) {
        throw std::runtime_error("missing numeric field 'ts'");
    }
    position.timestamp = getTimestamp(*ts, "ts");

    if (!isValidLatitude(position.lat) || !isValidLongitude(position.lng)) {
        throw std::runtime_error("position out of range");
    }

    position.speed = getOptional(json, "speed");
    position.heading = getOptional(json, "heading");
    return position;
}

nlohmann::json JsonCodec::livePositionToJson(const LivePosition& position) {
    nlohmann::json j;
    j["boatId"] = position.boatId;
    j["lat"] = position.lat;
    j["lng"] = position.lng;
    j["ts"] = position.timestamp;
    putOptional(j, "speed", position.speed);
    putOptional(j, "heading", position.heading);
    return j;
}

} // namespace sailtrack
