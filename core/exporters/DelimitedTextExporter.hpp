#pragma once

#include "../ports/ITrackExporter.hpp"

namespace sailtrack::exporters {

// Fixed column order, ISO-8601 UTC timestamps, blank cells for missing values.
class DelimitedTextExporter : public ports::ITrackExporter {
public:
    static constexpr const char* HEADER = "timestamp,lat,lng,speed,heading,cog,altitude,twa,tws";

    ports::ExportFormat format() const override { return ports::ExportFormat::DelimitedText; }
    std::string fileExtension() const override { return "csv"; }
    std::string render(const Track& track) const override;
};

} // namespace sailtrack::exporters
