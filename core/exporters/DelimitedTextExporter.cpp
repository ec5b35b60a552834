#include "DelimitedTextExporter.hpp"
#include "../IClock.hpp"
#include <iomanip>
#include <sstream>

namespace sailtrack::exporters {

namespace {

void writeOptional(std::ostringstream& out, const std::optional<double>& value, int precision) {
    out << ',';
    if (value) {
        out << std::fixed << std::setprecision(precision) << *value;
    }
}

} // namespace

std::string DelimitedTextExporter::render(const Track& track) const {
    std::ostringstream out;
    out << HEADER << '\n';

    for (const auto& point : track.points) {
        out << formatIso8601(point.timestamp) << ','
            << std::fixed << std::setprecision(7) << point.lat << ','
            << point.lng;
        writeOptional(out, point.speed, 2);
        writeOptional(out, point.heading, 1);
        writeOptional(out, point.cog, 1);
        writeOptional(out, point.altitude, 1);
        writeOptional(out, point.twa, 1);
        writeOptional(out, point.tws, 2);
        out << '\n';
    }
    return out.str();
}

} // namespace sailtrack::exporters
