#pragma once

#include "../ports/ITrackParser.hpp"
#include <optional>

namespace pugi {
class xml_node;
}

namespace sailtrack::parsers {

/**
 * @brief GPX 1.0/1.1 reader
 *
 * Every <trk> (all of its <trkseg>s concatenated) and every timed <rte>
 * becomes one Track. A point needs lat, lon and <time>; <ele> and the
 * extension elements speed (knots), course/cog, heading, twa and tws are
 * read when present, matched by local name under any namespace prefix.
 */
class GpxParser : public ports::ITrackParser {
public:
    SourceFormat format() const override { return SourceFormat::Gpx; }
    bool requiresBinary() const override { return false; }

    TrackImportResult parse(const std::vector<std::uint8_t>& data,
                            const std::string& sourceName) const override;

private:
    std::optional<Track> parseTrack(const pugi::xml_node& trk, const std::string& label,
                                    std::vector<std::string>& errors) const;
    std::optional<TrackPoint> parsePoint(const pugi::xml_node& pt, const std::string& label,
                                         std::size_t index, std::vector<std::string>& errors) const;
    void readExtensions(const pugi::xml_node& node, TrackPoint& point) const;
};

} // namespace sailtrack::parsers
