#pragma once

#include "../ports/ITrackExporter.hpp"
#include "../ports/ITrackParser.hpp"
#include "TrackAnalyzer.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace sailtrack::domain {

struct ExportOptions {
    ports::ExportFormat format = ports::ExportFormat::Gpx;
    bool simplify = false;
    double toleranceMeters = 5.0;
};

std::string exportFormatToString(ports::ExportFormat format);
std::optional<ports::ExportFormat> stringToExportFormat(const std::string& str);

/**
 * @brief Import, analysis and export entry point for tracks
 *
 * Parsers and exporters are looked up by format tag in tables fixed at
 * construction; the service keeps no other state and can be shared freely.
 */
class TrackService {
public:
    using ParserTable = std::unordered_map<SourceFormat, std::shared_ptr<const ports::ITrackParser>>;
    using ExporterTable =
        std::unordered_map<ports::ExportFormat, std::shared_ptr<const ports::ITrackExporter>>;

    TrackService();
    TrackService(ParserTable parsers, ExporterTable exporters,
                 double maneuverThresholdDeg = TrackAnalyzer::DEFAULT_MANEUVER_THRESHOLD_DEG);

    static ParserTable defaultParsers();
    static ExporterTable defaultExporters();

    // By file extension; unknown extensions are treated as GPX.
    static SourceFormat detectFormat(const std::string& fileName);

    TrackImportResult importData(const std::vector<std::uint8_t>& data,
                                 const std::string& fileName) const;
    TrackImportResult importFile(const std::string& path) const;

    /// @throws std::invalid_argument if no exporter is registered for the format
    std::string exportTrack(const Track& track, const ExportOptions& options) const;
    bool exportToFile(const Track& track, const std::string& path,
                      const ExportOptions& options) const;

    TrackStats computeStats(const Track& track) const;
    VmgResult computeVmg(const Track& track, double windDirection) const;

    const TrackAnalyzer& analyzer() const { return analyzer_; }

private:
    ParserTable parsers_;
    ExporterTable exporters_;
    TrackAnalyzer analyzer_;
};

} // namespace sailtrack::domain
