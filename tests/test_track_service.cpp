#include <gtest/gtest.h>
#include "../core/domain/TrackService.hpp"
#include "../core/exporters/JsonExporter.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <stdexcept>

using namespace sailtrack;
using namespace sailtrack::domain;

namespace {

std::vector<std::uint8_t> bytes(const std::string& text) {
    return std::vector<std::uint8_t>(text.begin(), text.end());
}

const char* kCsv =
    "timestamp,lat,lng,speed,heading,twa\n"
    "2024-03-09T14:30:00Z,22.3000,114.2000,6.0,0,40\n"
    "2024-03-09T14:30:10Z,22.3005,114.2000,6.5,0,40\n"
    "2024-03-09T14:30:20Z,22.3010,114.2000,7.0,0,40\n"
    "2024-03-09T14:30:30Z,22.3015,114.2005,6.0,70,-35\n"
    "2024-03-09T14:30:40Z,22.3020,114.2010,5.5,70,-35\n";

class ThrowingParser : public ports::ITrackParser {
public:
    SourceFormat format() const override { return SourceFormat::Gpx; }
    bool requiresBinary() const override { return false; }
    TrackImportResult parse(const std::vector<std::uint8_t>&, const std::string&) const override {
        throw std::runtime_error("parser exploded");
    }
};

} // namespace

class TrackServiceTest : public ::testing::Test {
protected:
    void TearDown() override {
        for (const auto& path : tempFiles_) {
            std::error_code ec;
            std::filesystem::remove(path, ec);
        }
    }

    std::string tempPath(const std::string& name) {
        auto path = (std::filesystem::temp_directory_path() / ("sailtrack_test_" + name)).string();
        tempFiles_.push_back(path);
        return path;
    }

    TrackService service_;
    std::vector<std::string> tempFiles_;
};

TEST_F(TrackServiceTest, DetectsFormatFromExtension) {
    EXPECT_EQ(TrackService::detectFormat("race.GPX"), SourceFormat::Gpx);
    EXPECT_EQ(TrackService::detectFormat("logs/race.vcc"), SourceFormat::Vcc);
    EXPECT_EQ(TrackService::detectFormat("race.csv"), SourceFormat::DelimitedText);
    EXPECT_EQ(TrackService::detectFormat("race.txt"), SourceFormat::DelimitedText);
    EXPECT_EQ(TrackService::detectFormat("race"), SourceFormat::Gpx);
    EXPECT_EQ(TrackService::detectFormat("dir.v2/race"), SourceFormat::Gpx);
    EXPECT_EQ(TrackService::detectFormat("race.kml"), SourceFormat::Gpx);
}

TEST_F(TrackServiceTest, ImportsDelimitedText) {
    TrackImportResult result = service_.importData(bytes(kCsv), "race.csv");

    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.format, SourceFormat::DelimitedText);
    ASSERT_EQ(result.tracks.size(), 1u);
    EXPECT_EQ(result.tracks[0].points.size(), 5u);

    TrackStats stats = service_.computeStats(result.tracks[0]);
    EXPECT_EQ(stats.tackCount, 1u);
    EXPECT_DOUBLE_EQ(stats.maxSpeed, 7.0);
    EXPECT_EQ(stats.duration, 40000);
}

TEST_F(TrackServiceTest, ParserExceptionBecomesFailedResult) {
    TrackService::ParserTable parsers = {{SourceFormat::Gpx, std::make_shared<ThrowingParser>()}};
    TrackService service(parsers, TrackService::defaultExporters());

    TrackImportResult result = service.importData(bytes("<gpx/>"), "boom.gpx");
    EXPECT_FALSE(result.success);
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0], "boom.gpx: parser exploded");
}

TEST_F(TrackServiceTest, MissingParserIsReported) {
    TrackService service(TrackService::ParserTable{}, TrackService::defaultExporters());
    TrackImportResult result = service.importData(bytes(kCsv), "race.csv");
    EXPECT_FALSE(result.success);
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0], "No parser registered for format csv");
}

TEST_F(TrackServiceTest, MissingFileIsReported) {
    TrackImportResult result = service_.importFile("/nonexistent/dir/race.gpx");
    EXPECT_FALSE(result.success);
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0], "Cannot open file: /nonexistent/dir/race.gpx");
}

TEST_F(TrackServiceTest, ImportsFromDisk) {
    const std::string path = tempPath("disk.csv");
    {
        std::ofstream out(path, std::ios::binary);
        out << kCsv;
    }
    TrackImportResult result = service_.importFile(path);
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.tracks[0].name, std::optional<std::string>("sailtrack_test_disk"));
}

TEST_F(TrackServiceTest, ExportWithSimplification) {
    Track track = service_.importData(bytes(kCsv), "race.csv").tracks.at(0);

    ExportOptions options;
    options.format = ports::ExportFormat::DelimitedText;
    std::string full = service_.exportTrack(track, options);

    options.simplify = true;
    options.toleranceMeters = 1000.0;
    std::string simplified = service_.exportTrack(track, options);

    auto lineCount = [](const std::string& text) {
        return std::count(text.begin(), text.end(), '\n');
    };
    EXPECT_EQ(lineCount(full), 6);
    EXPECT_EQ(lineCount(simplified), 3);
}

TEST_F(TrackServiceTest, ExportRejectsNegativeTolerance) {
    Track track = service_.importData(bytes(kCsv), "race.csv").tracks.at(0);
    ExportOptions options;
    options.simplify = true;
    options.toleranceMeters = -1.0;
    EXPECT_THROW(service_.exportTrack(track, options), std::invalid_argument);
}

TEST_F(TrackServiceTest, UnregisteredExporterThrows) {
    TrackService::ExporterTable exporters = {
        {ports::ExportFormat::Json, std::make_shared<exporters::JsonExporter>()}};
    TrackService service(TrackService::defaultParsers(), exporters);

    ExportOptions options;
    options.format = ports::ExportFormat::Gpx;
    EXPECT_THROW(service.exportTrack(Track{}, options), std::invalid_argument);
    options.format = ports::ExportFormat::Json;
    EXPECT_NO_THROW(service.exportTrack(Track{}, options));
}

TEST_F(TrackServiceTest, ExportToFileAndBack) {
    Track track = service_.importData(bytes(kCsv), "race.csv").tracks.at(0);
    const std::string path = tempPath("export.gpx");

    ExportOptions options;
    options.format = ports::ExportFormat::Gpx;
    ASSERT_TRUE(service_.exportToFile(track, path, options));

    TrackImportResult result = service_.importFile(path);
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.tracks[0].points.size(), track.points.size());
    EXPECT_EQ(result.tracks[0].startTime, track.startTime);
}

TEST_F(TrackServiceTest, ExportToUnwritablePathFails) {
    Track track = service_.importData(bytes(kCsv), "race.csv").tracks.at(0);
    EXPECT_FALSE(service_.exportToFile(track, "/nonexistent/dir/out.gpx", ExportOptions{}));
}

TEST(ExportFormatTest, StringConversion) {
    EXPECT_EQ(stringToExportFormat("GPX"), std::optional<ports::ExportFormat>(ports::ExportFormat::Gpx));
    EXPECT_EQ(stringToExportFormat("txt"), std::optional<ports::ExportFormat>(ports::ExportFormat::DelimitedText));
    EXPECT_EQ(stringToExportFormat("json"), std::optional<ports::ExportFormat>(ports::ExportFormat::Json));
    EXPECT_FALSE(stringToExportFormat("kml").has_value());
    EXPECT_EQ(exportFormatToString(ports::ExportFormat::DelimitedText), "csv");
}
