/**
 * @file main_cli.cpp
 * @brief Command-line interface for the sailtrack engine
 *
 * Imports GPS tracks (GPX, VCC logger dumps, CSV), prints statistics and
 * VMG, exports to GPX/CSV/JSON with optional simplification, validates race
 * course mark tables and renders them as GeoJSON, and follows a live
 * position feed over MQTT.
 *
 * @note Handles SIGINT/SIGTERM so the live feed disconnects cleanly
 */

#include "TomlConfig.hpp"
#include "PahoMqttClient.hpp"
#include "adapters/MqttTransportAdapter.hpp"
#include "course/CourseGeometry.hpp"
#include "course/CourseValidator.hpp"
#include "course/MarkListParser.hpp"
#include "domain/LiveTrackingAdapter.hpp"
#include "domain/TrackService.hpp"
#include "parsers/TextUtil.hpp"
#include "IClock.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>

using namespace sailtrack;

/// Global flag for graceful shutdown coordination
static std::atomic<bool> g_running{true};

void signalHandler(int signal) {
    (void)signal;
    g_running = false;
}

struct CliOptions {
    std::string configFile = "sailtrack.toml";
    std::string importFile;
    std::string courseFile;
    std::string outFile;
    std::optional<double> windDirection;
    std::optional<ports::ExportFormat> exportFormat;
    std::optional<double> simplifyMeters;
    bool simplify = false;
    bool strict = false;
    bool live = false;
};

void printUsage(const char* programName) {
    std::cout << "Usage: " << programName << " [options]\n"
              << "Options:\n"
              << "  --config FILE         Configuration file (default: sailtrack.toml)\n"
              << "  --import FILE         Import a track (.gpx, .vcc, .csv, .txt) and print statistics\n"
              << "  --wind DEG            True wind direction for VMG and leg classification\n"
              << "  --export FORMAT       Export the imported track as gpx, csv or json\n"
              << "  --out FILE            Output file for --export or the course GeoJSON (default: stdout)\n"
              << "  --simplify [METERS]   Simplify before export (default tolerance from config)\n"
              << "  --course FILE         Validate a mark table (name,lat,lng[,type,rounding,order])\n"
              << "  --strict              Treat course validation warnings as errors\n"
              << "  --live                Follow the configured live position feed until Ctrl+C\n"
              << "  --help                Show this help message\n"
              << "\nConfiguration file format (TOML):\n"
              << "  [track]\n"
              << "  simplify_tolerance_m = 5\n"
              << "  [live]\n"
              << "  host = \"broker.example.org\"\n"
              << "  session_id = \"race-42\"\n"
              << "\nEnvironment: SAILTRACK_LIVE_HOST, SAILTRACK_SESSION override [live] host and session_id\n"
              << std::endl;
}

std::string formatDuration(int64_t millis) {
    int64_t seconds = millis / 1000;
    std::ostringstream out;
    out << seconds / 3600 << "h " << std::setw(2) << std::setfill('0') << (seconds / 60) % 60 << "m "
        << std::setw(2) << std::setfill('0') << seconds % 60 << "s";
    return out.str();
}

void printStats(const domain::TrackStats& stats) {
    std::cout << std::fixed << std::setprecision(2)
              << "  Points:        " << stats.pointCount << "\n"
              << "  Duration:      " << formatDuration(stats.duration) << "\n"
              << "  Distance:      " << stats.totalDistance << " nm\n"
              << "  Max speed:     " << stats.maxSpeed << " kn\n"
              << "  Avg speed:     " << stats.avgSpeed << " kn\n"
              << "  Tacks / gybes: " << stats.tackCount << " / " << stats.gybeCount << "\n";
    for (const auto& maneuver : stats.maneuvers) {
        std::cout << "    " << formatIso8601(maneuver.timestamp) << "  "
                  << domain::maneuverTypeToString(maneuver.type) << "  "
                  << std::setprecision(0) << maneuver.headingChange << " deg" << std::setprecision(2) << "\n";
    }
    std::cout.unsetf(std::ios::fixed);
}

// ("out.csv", 1, 3) -> "out-2.csv"
std::string numberedPath(const std::string& path, std::size_t index, std::size_t count) {
    if (count <= 1) {
        return path;
    }
    auto dot = path.find_last_of('.');
    auto slash = path.find_last_of("/\\");
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) {
        return path + "-" + std::to_string(index + 1);
    }
    return path.substr(0, dot) + "-" + std::to_string(index + 1) + path.substr(dot);
}

bool runImport(const CliOptions& options, const EngineConfig& config) {
    domain::TrackService service(domain::TrackService::defaultParsers(),
                                 domain::TrackService::defaultExporters(),
                                 config.track.maneuverThresholdDeg);

    TrackImportResult result = service.importFile(options.importFile);
    for (const auto& error : result.errors) {
        std::cerr << "  " << error << std::endl;
    }
    if (!result.success) {
        std::cerr << "Import failed: " << options.importFile << std::endl;
        return false;
    }

    for (std::size_t i = 0; i < result.tracks.size(); ++i) {
        const Track& track = result.tracks[i];
        std::cout << "Track " << (i + 1) << ": " << track.name.value_or("(unnamed)");
        if (track.device) {
            std::cout << " [" << *track.device << "]";
        }
        std::cout << "\n  Start:         " << formatIso8601(track.startTime)
                  << "\n  End:           " << formatIso8601(track.endTime) << "\n";
        printStats(service.computeStats(track));

        auto sessions = domain::TrackAnalyzer::splitByGap(track, config.track.sessionGapSeconds * 1000);
        if (sessions.size() > 1) {
            std::cout << "  Sessions:      " << sessions.size() << " (gap > "
                      << config.track.sessionGapSeconds << "s)\n";
            for (const auto& session : sessions) {
                std::cout << "    " << formatIso8601(session.startTime) << " - "
                          << formatIso8601(session.endTime) << "  " << session.size() << " points\n";
            }
        }

        if (options.windDirection) {
            auto vmg = service.computeVmg(track, *options.windDirection);
            std::cout << std::fixed << std::setprecision(2) << "  VMG (wind " << *options.windDirection << "):\n"
                      << "    upwind:   ";
            if (vmg.upwindVmg) {
                std::cout << *vmg.upwindVmg << " kn (" << vmg.upwindSamples << " samples)";
            } else {
                std::cout << "n/a";
            }
            std::cout << "\n    downwind: ";
            if (vmg.downwindVmg) {
                std::cout << *vmg.downwindVmg << " kn (" << vmg.downwindSamples << " samples)";
            } else {
                std::cout << "n/a";
            }
            std::cout << "\n";
            std::cout.unsetf(std::ios::fixed);
        }
    }
    std::cout << std::flush;

    if (!options.exportFormat) {
        return true;
    }

    domain::ExportOptions exportOptions;
    exportOptions.format = *options.exportFormat;
    exportOptions.simplify = options.simplify;
    exportOptions.toleranceMeters = options.simplifyMeters.value_or(config.track.simplifyToleranceMeters);

    bool ok = true;
    for (std::size_t i = 0; i < result.tracks.size(); ++i) {
        const Track& track = result.tracks[i];
        try {
            if (options.outFile.empty()) {
                std::cout << service.exportTrack(track, exportOptions);
            } else {
                const std::string path = numberedPath(options.outFile, i, result.tracks.size());
                if (service.exportToFile(track, path, exportOptions)) {
                    std::cout << "Exported " << domain::exportFormatToString(exportOptions.format)
                              << " to " << path << std::endl;
                } else {
                    ok = false;
                }
            }
        } catch (const std::invalid_argument& e) {
            std::cerr << "Export failed: " << e.what() << std::endl;
            ok = false;
        }
    }
    return ok;
}

bool runCourse(const CliOptions& options, const EngineConfig& config) {
    course::MarkListParser parser;
    course::MarkListResult loaded = parser.parseFile(options.courseFile);
    for (const auto& error : loaded.errors) {
        std::cerr << "  " << error << std::endl;
    }
    if (!loaded.success) {
        std::cerr << "Course load failed: " << options.courseFile << std::endl;
        return false;
    }

    course::CourseValidator validator(config.validation.thresholds);
    course::AutoFixResult fixed = validator.autoFixMarks(loaded.marks);
    for (const auto& fix : fixed.fixes) {
        std::cout << "Fixed: " << fix << std::endl;
    }

    std::vector<course::Mark> marks = course::CourseGeometry::sortByOrder(fixed.marks);
    std::vector<course::CourseLeg> legs = options.windDirection
        ? course::CourseGeometry::generateLegs(marks, config.track.distanceUnit, *options.windDirection)
        : course::CourseGeometry::generateLegs(marks, config.track.distanceUnit);

    const bool strict = options.strict || config.validation.strict;
    course::ValidationResult validation = validator.validateCourse(marks, legs, strict);
    for (const auto& error : validation.errors) {
        std::cerr << "Error: " << error << std::endl;
    }
    for (const auto& warning : validation.warnings) {
        std::cout << "Warning: " << warning << std::endl;
    }
    std::cout << "Course " << (validation.valid ? "valid" : "invalid") << ": "
              << validation.errors.size() << " error(s), " << validation.warnings.size() << " warning(s)"
              << std::endl;

    if (marks.size() < 2) {
        return validation.valid;
    }

    course::CourseSummary summary = course::CourseGeometry::computeCourseGeometry(
        marks, config.course.boundsPaddingDeg, config.track.distanceUnit);
    std::cout << std::fixed << std::setprecision(2)
              << "Type: " << course::courseTypeToString(summary.courseType)
              << ", " << summary.legs.size() << " legs, "
              << summary.totalDistance << " " << distanceUnitToString(summary.unit) << std::endl;
    for (const auto& leg : legs) {
        std::cout << "  " << leg.from << " -> " << leg.to << "  " << course::legTypeToString(leg.type)
                  << "  " << leg.distance << " " << distanceUnitToString(leg.unit)
                  << "  " << std::setprecision(0) << leg.bearing << " deg" << std::setprecision(2) << std::endl;
    }
    std::cout.unsetf(std::ios::fixed);

    course::GeometryOptions geometryOptions;
    geometryOptions.includeCourseLine = config.course.includeCourseLine;
    geometryOptions.boundsPaddingDeg = config.course.boundsPaddingDeg;
    const std::string geoJson =
        course::CourseGeometry::toGeoJson(course::CourseGeometry::buildGeometry(marks, legs, geometryOptions))
            .dump(2);

    // With --import the output file belongs to the track export.
    if (options.outFile.empty() || !options.importFile.empty()) {
        std::cout << geoJson << std::endl;
    } else {
        std::ofstream out(options.outFile, std::ios::binary | std::ios::trunc);
        if (!out.is_open() || !(out << geoJson << "\n")) {
            std::cerr << "Cannot write file: " << options.outFile << std::endl;
            return false;
        }
        std::cout << "Wrote course GeoJSON to " << options.outFile << std::endl;
    }
    return validation.valid;
}

bool runLive(const EngineConfig& config) {
    if (!config.hasLiveConfig()) {
        std::cerr << "Error: [live] host and session_id are required for --live" << std::endl;
        return false;
    }

    auto mqttClient = std::make_shared<PahoMqttClient>();
    auto transport = std::make_shared<adapters::MqttTransportAdapter>(mqttClient);
    domain::LiveTrackingAdapter tracker(std::make_shared<SystemClock>());

    tracker.addObserver([](const domain::LivePositionSnapshot& snapshot) {
        std::cout << "[" << formatIso8601(snapshot.updatedAt) << "] v" << snapshot.version << ", "
                  << snapshot.positions.size() << " boat(s)" << std::endl;
        for (const auto& entry : snapshot.positions) {
            const LivePosition& position = entry.second;
            std::cout << "  " << entry.first << "  " << std::fixed << std::setprecision(6)
                      << position.lat << ", " << position.lng;
            if (position.speed) {
                std::cout << std::setprecision(1) << "  " << *position.speed << " kn";
            }
            if (position.heading) {
                std::cout << std::setprecision(0) << "  " << *position.heading << " deg";
            }
            std::cout.unsetf(std::ios::fixed);
            std::cout << std::endl;
        }
    });

    std::cout << "Connecting to " << config.live.credentials.host << ":" << config.live.credentials.port
              << ", session " << config.live.sessionId << std::endl;
    if (!tracker.connect(transport, config.live)) {
        std::cerr << "Error: could not connect to the live feed" << std::endl;
        return false;
    }
    std::cout << "Subscribed to " << tracker.topicFilter() << ". Press Ctrl+C to stop." << std::endl;

    while (g_running) {
        tracker.processEvents();
        std::this_thread::sleep_for(std::chrono::milliseconds(250));
    }

    std::cout << "Disconnecting..." << std::endl;
    tracker.disconnect();
    std::cout << "Invalid messages: " << tracker.invalidMessageCount()
              << ", dropped: " << tracker.droppedMessageCount() << std::endl;
    return true;
}

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    CliOptions options;
    auto requireValue = [&](int& i, const std::string& flag) -> std::optional<std::string> {
        if (i + 1 >= argc) {
            std::cerr << "Missing value for " << flag << std::endl;
            return std::nullopt;
        }
        return std::string(argv[++i]);
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--config" || arg == "--import" || arg == "--course" || arg == "--out") {
            auto value = requireValue(i, arg);
            if (!value) {
                return 1;
            }
            if (arg == "--config") options.configFile = *value;
            else if (arg == "--import") options.importFile = *value;
            else if (arg == "--course") options.courseFile = *value;
            else options.outFile = *value;
        } else if (arg == "--wind") {
            auto value = requireValue(i, arg);
            if (!value) {
                return 1;
            }
            auto degrees = parsers::parseDouble(*value);
            if (!degrees) {
                std::cerr << "Invalid wind direction: " << *value << std::endl;
                return 1;
            }
            options.windDirection = *degrees;
        } else if (arg == "--export") {
            auto value = requireValue(i, arg);
            if (!value) {
                return 1;
            }
            options.exportFormat = domain::stringToExportFormat(parsers::toLower(*value));
            if (!options.exportFormat) {
                std::cerr << "Unknown export format: " << *value << " (expected gpx, csv or json)" << std::endl;
                return 1;
            }
        } else if (arg == "--simplify") {
            options.simplify = true;
            if (i + 1 < argc && argv[i + 1][0] != '-') {
                auto meters = parsers::parseDouble(argv[++i]);
                if (!meters || *meters < 0.0) {
                    std::cerr << "Invalid simplify tolerance: " << argv[i] << std::endl;
                    return 1;
                }
                options.simplifyMeters = *meters;
            }
        } else if (arg == "--strict") {
            options.strict = true;
        } else if (arg == "--live") {
            options.live = true;
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            printUsage(argv[0]);
            return 1;
        }
    }

    if (options.importFile.empty() && options.courseFile.empty() && !options.live) {
        printUsage(argv[0]);
        return 1;
    }
    if (options.exportFormat && options.importFile.empty()) {
        std::cerr << "--export requires --import" << std::endl;
        return 1;
    }

    EngineConfig config;
    try {
        config = TomlConfig::loadFromFile(options.configFile);
        TomlConfig::applyEnvironment(config);
    } catch (const std::runtime_error& e) {
        std::cerr << "[Config] " << e.what() << std::endl;
        return 1;
    }

    bool ok = true;
    try {
        if (!options.importFile.empty()) {
            ok = runImport(options, config) && ok;
        }
        if (!options.courseFile.empty()) {
            ok = runCourse(options, config) && ok;
        }
        if (options.live) {
            ok = runLive(config) && ok;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return ok ? 0 : 1;
}
