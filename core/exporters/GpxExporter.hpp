#pragma once

#include "../ports/ITrackExporter.hpp"

namespace sailtrack::exporters {

/**
 * @brief GPX 1.1 writer
 *
 * Optional point values go into <extensions> under the sailtrack
 * TrackPointExtension namespace; altitude is written as <ele>.
 */
class GpxExporter : public ports::ITrackExporter {
public:
    static constexpr const char* EXTENSION_NAMESPACE =
        "https://sailtrack.dev/xmlschemas/TrackPointExtension/v1";
    static constexpr const char* CREATOR = "sailtrack";

    ports::ExportFormat format() const override { return ports::ExportFormat::Gpx; }
    std::string fileExtension() const override { return "gpx"; }
    std::string render(const Track& track) const override;
};

} // namespace sailtrack::exporters
