#pragma once

#include "../Track.hpp"
#include <string>

namespace sailtrack::ports {

enum class ExportFormat {
    Gpx,
    DelimitedText,
    Json
};

class ITrackExporter {
public:
    virtual ~ITrackExporter() = default;

    virtual ExportFormat format() const = 0;
    virtual std::string fileExtension() const = 0;
    virtual std::string render(const Track& track) const = 0;
};

} // namespace sailtrack::ports
