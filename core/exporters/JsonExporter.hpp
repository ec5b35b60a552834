#pragma once

#include "../ports/ITrackExporter.hpp"

namespace sailtrack::exporters {

class JsonExporter : public ports::ITrackExporter {
public:
    explicit JsonExporter(int indent = 2) : indent_(indent) {}

    ports::ExportFormat format() const override { return ports::ExportFormat::Json; }
    std::string fileExtension() const override { return "json"; }
    std::string render(const Track& track) const override;

private:
    int indent_;
};

} // namespace sailtrack::exporters
