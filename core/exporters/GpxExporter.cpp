#include "GpxExporter.hpp"
#include "../IClock.hpp"
#include <iomanip>
#include <pugixml.hpp>
#include <sstream>

namespace sailtrack::exporters {

namespace {

std::string formatNumber(double value, int precision) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(precision) << value;
    return ss.str();
}

void appendValue(pugi::xml_node parent, const char* name, double value, int precision) {
    parent.append_child(name).text().set(formatNumber(value, precision).c_str());
}

} // namespace

std::string GpxExporter::render(const Track& track) const {
    pugi::xml_document doc;

    pugi::xml_node decl = doc.append_child(pugi::node_declaration);
    decl.append_attribute("version") = "1.0";
    decl.append_attribute("encoding") = "UTF-8";

    pugi::xml_node gpx = doc.append_child("gpx");
    gpx.append_attribute("version") = "1.1";
    gpx.append_attribute("creator") = track.device ? track.device->c_str() : CREATOR;
    gpx.append_attribute("xmlns") = "http://www.topografix.com/GPX/1/1";
    gpx.append_attribute("xmlns:sailtrack") = EXTENSION_NAMESPACE;

    if (!track.points.empty()) {
        pugi::xml_node metadata = gpx.append_child("metadata");
        metadata.append_child("time").text().set(formatIso8601(track.startTime).c_str());
    }

    pugi::xml_node trk = gpx.append_child("trk");
    if (track.name) {
        trk.append_child("name").text().set(track.name->c_str());
    }
    pugi::xml_node seg = trk.append_child("trkseg");

    for (const auto& point : track.points) {
        pugi::xml_node pt = seg.append_child("trkpt");
        pt.append_attribute("lat") = formatNumber(point.lat, 7).c_str();
        pt.append_attribute("lon") = formatNumber(point.lng, 7).c_str();

        if (point.altitude) {
            appendValue(pt, "ele", *point.altitude, 1);
        }
        pt.append_child("time").text().set(formatIso8601(point.timestamp).c_str());

        if (point.speed || point.cog || point.heading || point.twa || point.tws) {
            pugi::xml_node ext = pt.append_child("extensions");
            if (point.speed) appendValue(ext, "sailtrack:speed", *point.speed, 2);
            if (point.cog) appendValue(ext, "sailtrack:course", *point.cog, 1);
            if (point.heading) appendValue(ext, "sailtrack:heading", *point.heading, 1);
            if (point.twa) appendValue(ext, "sailtrack:twa", *point.twa, 1);
            if (point.tws) appendValue(ext, "sailtrack:tws", *point.tws, 2);
        }
    }

    std::ostringstream out;
    doc.save(out, "  ", pugi::format_default, pugi::encoding_utf8);
    return out.str();
}

} // namespace sailtrack::exporters
