#include "TrackService.hpp"
#include "TrackSimplifier.hpp"
#include "../exporters/DelimitedTextExporter.hpp"
#include "../exporters/GpxExporter.hpp"
#include "../exporters/JsonExporter.hpp"
#include "../parsers/DelimitedTextParser.hpp"
#include "../parsers/GpxParser.hpp"
#include "../parsers/TextUtil.hpp"
#include "../parsers/VccParser.hpp"
#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>

namespace sailtrack::domain {

std::string exportFormatToString(ports::ExportFormat format) {
    switch (format) {
        case ports::ExportFormat::Gpx: return "gpx";
        case ports::ExportFormat::DelimitedText: return "csv";
        case ports::ExportFormat::Json: return "json";
    }
    return "gpx";
}

std::optional<ports::ExportFormat> stringToExportFormat(const std::string& str) {
    static const std::unordered_map<std::string, ports::ExportFormat> stringMap = {
        {"gpx", ports::ExportFormat::Gpx},
        {"csv", ports::ExportFormat::DelimitedText},
        {"txt", ports::ExportFormat::DelimitedText},
        {"json", ports::ExportFormat::Json}
    };

    auto it = stringMap.find(parsers::toLower(str));
    if (it == stringMap.end()) {
        return std::nullopt;
    }
    return it->second;
}

TrackService::TrackService() : TrackService(defaultParsers(), defaultExporters()) {
}

TrackService::TrackService(ParserTable parsers, ExporterTable exporters,
                           double maneuverThresholdDeg)
    : parsers_(std::move(parsers)),
      exporters_(std::move(exporters)),
      analyzer_(maneuverThresholdDeg) {
}

TrackService::ParserTable TrackService::defaultParsers() {
    return {
        {SourceFormat::Gpx, std::make_shared<parsers::GpxParser>()},
        {SourceFormat::Vcc, std::make_shared<parsers::VccParser>()},
        {SourceFormat::DelimitedText, std::make_shared<parsers::DelimitedTextParser>()}
    };
}

TrackService::ExporterTable TrackService::defaultExporters() {
    return {
        {ports::ExportFormat::Gpx, std::make_shared<exporters::GpxExporter>()},
        {ports::ExportFormat::DelimitedText, std::make_shared<exporters::DelimitedTextExporter>()},
        {ports::ExportFormat::Json, std::make_shared<exporters::JsonExporter>()}
    };
}

SourceFormat TrackService::detectFormat(const std::string& fileName) {
    auto dot = fileName.find_last_of('.');
    auto slash = fileName.find_last_of("/\\");
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) {
        return SourceFormat::Gpx;
    }
    return stringToSourceFormat(parsers::toLower(fileName.substr(dot + 1)));
}

TrackImportResult TrackService::importData(const std::vector<std::uint8_t>& data,
                                           const std::string& fileName) const {
    const SourceFormat format = detectFormat(fileName);

    auto it = parsers_.find(format);
    if (it == parsers_.end() || !it->second) {
        TrackImportResult result;
        result.format = format;
        result.errors.push_back("No parser registered for format " + sourceFormatToString(format));
        std::cerr << "[TrackService] " << result.errors.back() << std::endl;
        return result;
    }

    TrackImportResult result;
    try {
        result = it->second->parse(data, fileName);
    } catch (const std::exception& e) {
        result = TrackImportResult{};
        result.format = format;
        result.errors.push_back(fileName + ": " + e.what());
    }

    std::size_t points = 0;
    for (const auto& track : result.tracks) {
        points += track.points.size();
    }
    if (result.success) {
        std::cout << "[TrackService] Imported " << result.tracks.size() << " track(s), " << points
                  << " points from " << fileName << " (" << sourceFormatToString(format) << ")";
        if (!result.errors.empty()) {
            std::cout << ", " << result.errors.size() << " problem(s)";
        }
        std::cout << std::endl;
    } else {
        std::cerr << "[TrackService] Import of " << fileName << " failed: "
                  << (result.errors.empty() ? "no tracks" : result.errors.front()) << std::endl;
    }
    return result;
}

TrackImportResult TrackService::importFile(const std::string& path) const {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        TrackImportResult result;
        result.format = detectFormat(path);
        result.errors.push_back("Cannot open file: " + path);
        std::cerr << "[TrackService] " << result.errors.back() << std::endl;
        return result;
    }

    std::vector<std::uint8_t> data((std::istreambuf_iterator<char>(file)),
                                   std::istreambuf_iterator<char>());
    if (file.bad()) {
        TrackImportResult result;
        result.format = detectFormat(path);
        result.errors.push_back("Error reading file: " + path);
        std::cerr << "[TrackService] " << result.errors.back() << std::endl;
        return result;
    }
    return importData(data, path);
}

std::string TrackService::exportTrack(const Track& track, const ExportOptions& options) const {
    auto it = exporters_.find(options.format);
    if (it == exporters_.end() || !it->second) {
        throw std::invalid_argument("No exporter registered for format " +
                                    exportFormatToString(options.format));
    }

    if (options.simplify) {
        TrackSimplifier simplifier(options.toleranceMeters);
        Track simplified = simplifier.simplify(track);
        std::cout << "[TrackService] Simplified " << track.points.size() << " -> "
                  << simplified.points.size() << " points (tolerance "
                  << options.toleranceMeters << " m)" << std::endl;
        return it->second->render(simplified);
    }
    return it->second->render(track);
}

bool TrackService::exportToFile(const Track& track, const std::string& path,
                                const ExportOptions& options) const {
    std::string content;
    try {
        content = exportTrack(track, options);
    } catch (const std::exception& e) {
        std::cerr << "[TrackService] Export failed: " << e.what() << std::endl;
        return false;
    }

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        std::cerr << "[TrackService] Cannot write file: " << path << std::endl;
        return false;
    }
    file << content;
    file.close();
    if (!file) {
        std::cerr << "[TrackService] Error writing file: " << path << std::endl;
        return false;
    }

    std::cout << "[TrackService] Wrote " << exportFormatToString(options.format) << " to "
              << path << std::endl;
    return true;
}

TrackStats TrackService::computeStats(const Track& track) const {
    return analyzer_.computeStats(track);
}

VmgResult TrackService::computeVmg(const Track& track, double windDirection) const {
    return TrackAnalyzer::computeVmg(track, windDirection);
}

} // namespace sailtrack::domain
