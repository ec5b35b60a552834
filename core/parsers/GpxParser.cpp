#include "GpxParser.hpp"
#include "TextUtil.hpp"
#include "../IClock.hpp"
#include <cstring>
#include <iostream>
#include <pugixml.hpp>

namespace sailtrack::parsers {

namespace {

// Element name without its namespace prefix ("gpxtpx:speed" -> "speed").
std::string localName(const pugi::xml_node& node) {
    const char* name = node.name();
    const char* colon = std::strrchr(name, ':');
    return toLower(colon ? std::string(colon + 1) : std::string(name));
}

pugi::xml_node childByLocalName(const pugi::xml_node& parent, const std::string& name) {
    for (pugi::xml_node child : parent.children()) {
        if (child.type() == pugi::node_element && localName(child) == name) {
            return child;
        }
    }
    return pugi::xml_node();
}

std::optional<std::string> childText(const pugi::xml_node& parent, const std::string& name) {
    pugi::xml_node child = childByLocalName(parent, name);
    if (!child) {
        return std::nullopt;
    }
    std::string text = trim(child.child_value());
    if (text.empty()) {
        return std::nullopt;
    }
    return text;
}

} // namespace

TrackImportResult GpxParser::parse(const std::vector<std::uint8_t>& data,
                                   const std::string& sourceName) const {
    TrackImportResult result;
    result.format = SourceFormat::Gpx;

    pugi::xml_document doc;
    pugi::xml_parse_result parsed = doc.load_buffer(data.data(), data.size());
    if (!parsed) {
        result.errors.push_back(sourceName + ": XML error at offset " +
                                std::to_string(parsed.offset) + ": " + parsed.description());
        return result;
    }

    pugi::xml_node root;
    for (pugi::xml_node child : doc.children()) {
        if (child.type() == pugi::node_element && localName(child) == "gpx") {
            root = child;
            break;
        }
    }
    if (!root) {
        result.errors.push_back(sourceName + ": missing <gpx> root element");
        return result;
    }

    std::optional<std::string> device;
    std::string creator = trim(root.attribute("creator").value());
    if (!creator.empty()) {
        device = creator;
    }

    std::size_t trackIndex = 0;
    for (pugi::xml_node node : root.children()) {
        if (node.type() != pugi::node_element) {
            continue;
        }
        std::string kind = localName(node);
        if (kind != "trk" && kind != "rte") {
            continue;
        }

        ++trackIndex;
        std::optional<std::string> name = childText(node, "name");
        std::string label = name ? "'" + *name + "'" : "#" + std::to_string(trackIndex);

        std::optional<Track> track = parseTrack(node, label, result.errors);
        if (!track) {
            continue;
        }
        track->name = name;
        track->device = device;
        result.tracks.push_back(std::move(*track));
    }

    if (trackIndex == 0) {
        result.errors.push_back(sourceName + ": no <trk> or <rte> elements");
    }

    result.success = !result.tracks.empty();
    if (!result.errors.empty()) {
        std::cout << "[GPX] " << sourceName << ": " << result.tracks.size() << " track(s), "
                  << result.errors.size() << " problem(s)" << std::endl;
    }
    return result;
}

std::optional<Track> GpxParser::parseTrack(const pugi::xml_node& trk, const std::string& label,
                                           std::vector<std::string>& errors) const {
    Track track;
    std::size_t index = 0;

    auto consume = [&](const pugi::xml_node& pt) {
        auto point = parsePoint(pt, label, index++, errors);
        if (point) {
            track.points.push_back(*point);
        }
    };

    if (localName(trk) == "rte") {
        for (pugi::xml_node pt : trk.children()) {
            if (pt.type() == pugi::node_element && localName(pt) == "rtept") {
                consume(pt);
            }
        }
    } else {
        for (pugi::xml_node seg : trk.children()) {
            if (seg.type() != pugi::node_element || localName(seg) != "trkseg") {
                continue;
            }
            for (pugi::xml_node pt : seg.children()) {
                if (pt.type() == pugi::node_element && localName(pt) == "trkpt") {
                    consume(pt);
                }
            }
        }
    }

    if (track.points.empty()) {
        errors.push_back("Track " + label + ": no valid points");
        return std::nullopt;
    }
    track.updateTimeBounds();
    return track;
}

std::optional<TrackPoint> GpxParser::parsePoint(const pugi::xml_node& pt, const std::string& label,
                                                std::size_t index,
                                                std::vector<std::string>& errors) const {
    const std::string where = "Track " + label + " point " + std::to_string(index);

    auto lat = parseDouble(pt.attribute("lat").value());
    auto lng = parseDouble(pt.attribute("lon").value());
    if (!lat || !lng) {
        errors.push_back(where + ": missing or non-numeric lat/lon");
        return std::nullopt;
    }
    if (!isValidLatitude(*lat) || !isValidLongitude(*lng)) {
        errors.push_back(where + ": coordinates out of range");
        return std::nullopt;
    }

    auto timeText = childText(pt, "time");
    if (!timeText) {
        errors.push_back(where + ": missing <time>");
        return std::nullopt;
    }
    auto timestamp = parseIso8601(*timeText);
    if (!timestamp) {
        errors.push_back(where + ": unparseable <time> '" + *timeText + "'");
        return std::nullopt;
    }

    TrackPoint point;
    point.lat = *lat;
    point.lng = *lng;
    point.timestamp = *timestamp;

    if (auto ele = childText(pt, "ele")) {
        point.altitude = parseDouble(*ele);
    }

    pugi::xml_node extensions = childByLocalName(pt, "extensions");
    if (extensions) {
        readExtensions(extensions, point);
    }
    return point;
}

void GpxParser::readExtensions(const pugi::xml_node& node, TrackPoint& point) const {
    for (pugi::xml_node child : node.children()) {
        if (child.type() != pugi::node_element) {
            continue;
        }
        std::string name = localName(child);
        if (child.first_child().type() == pugi::node_element) {
            readExtensions(child, point);
            continue;
        }

        auto value = parseDouble(child.child_value());
        if (!value) {
            continue;
        }
        if (name == "speed" || name == "sog") {
            point.speed = *value;
        } else if (name == "course" || name == "cog") {
            point.cog = *value;
        } else if (name == "heading" || name == "hdg") {
            point.heading = *value;
        } else if (name == "twa") {
            point.twa = *value;
        } else if (name == "tws") {
            point.tws = *value;
        }
    }
}

} // namespace sailtrack::parsers
