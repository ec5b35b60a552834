#include "DelimitedTextParser.hpp"
#include "TextUtil.hpp"
#include "../Coordinate.hpp"
#include "../IClock.hpp"
#include <cmath>

namespace sailtrack::parsers {

namespace {

std::optional<double> parseCoordinateCell(const std::string& cell) {
    if (auto value = parseDouble(cell)) {
        return value;
    }
    try {
        return Coordinate::toDecimal(cell);
    } catch (const CoordinateError&) {
        return std::nullopt;
    }
}

std::string columnName(Column column) {
    switch (column) {
        case Column::Timestamp: return "timestamp";
        case Column::Latitude: return "lat";
        case Column::Longitude: return "lng";
        case Column::Speed: return "speed";
        case Column::Heading: return "heading";
        case Column::Cog: return "cog";
        case Column::Altitude: return "altitude";
        case Column::Twa: return "twa";
        case Column::Tws: return "tws";
    }
    return "unknown";
}

} // namespace

char DelimitedTextParser::detectDelimiter(const std::string& headerLine) {
    std::size_t commas = 0, semicolons = 0, tabs = 0;
    for (char c : headerLine) {
        if (c == ',') ++commas;
        else if (c == ';') ++semicolons;
        else if (c == '\t') ++tabs;
    }
    if (tabs > commas && tabs >= semicolons) {
        return '\t';
    }
    if (semicolons > commas) {
        return ';';
    }
    return ',';
}

std::optional<Column> DelimitedTextParser::columnForHeader(const std::string& header) {
    static const std::unordered_map<std::string, Column> aliases = {
        {"timestamp", Column::Timestamp},
        {"time", Column::Timestamp},
        {"datetime", Column::Timestamp},
        {"lat", Column::Latitude},
        {"latitude", Column::Latitude},
        {"lng", Column::Longitude},
        {"lon", Column::Longitude},
        {"long", Column::Longitude},
        {"longitude", Column::Longitude},
        {"speed", Column::Speed},
        {"sog", Column::Speed},
        {"heading", Column::Heading},
        {"hdg", Column::Heading},
        {"cog", Column::Cog},
        {"course", Column::Cog},
        {"altitude", Column::Altitude},
        {"alt", Column::Altitude},
        {"ele", Column::Altitude},
        {"twa", Column::Twa},
        {"tws", Column::Tws}
    };

    auto it = aliases.find(toLower(trim(unquote(trim(header)))));
    if (it == aliases.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<int64_t> DelimitedTextParser::parseTimestamp(const std::string& text) {
    if (auto numeric = parseDouble(text)) {
        double value = *numeric;
        if (std::fabs(value) < EPOCH_SECONDS_LIMIT) {
            value *= 1000.0;
        }
        return static_cast<int64_t>(std::llround(value));
    }
    return parseIso8601(text);
}

TrackImportResult DelimitedTextParser::parse(const std::vector<std::uint8_t>& data,
                                             const std::string& sourceName) const {
    TrackImportResult result;
    result.format = SourceFormat::DelimitedText;

    std::string text(data.begin(), data.end());
    // UTF-8 byte order mark
    if (text.size() >= 3 && text.compare(0, 3, "\xEF\xBB\xBF") == 0) {
        text.erase(0, 3);
    }
    std::vector<std::string> lines = splitLines(text);

    std::size_t lineIndex = 0;
    while (lineIndex < lines.size()) {
        std::string line = trim(lines[lineIndex]);
        if (!line.empty() && line[0] != '#') {
            break;
        }
        ++lineIndex;
    }
    if (lineIndex >= lines.size()) {
        result.errors.push_back(sourceName + ": no header line");
        return result;
    }

    const char delimiter = detectDelimiter(lines[lineIndex]);
    std::unordered_map<Column, std::size_t> columns;
    std::vector<std::string> headers = splitFields(lines[lineIndex], delimiter);
    for (std::size_t i = 0; i < headers.size(); ++i) {
        auto column = columnForHeader(headers[i]);
        if (column && columns.find(*column) == columns.end()) {
            columns[*column] = i;
        }
    }

    std::string missing;
    for (Column required : {Column::Timestamp, Column::Latitude, Column::Longitude}) {
        if (columns.find(required) == columns.end()) {
            missing += (missing.empty() ? "" : ", ") + columnName(required);
        }
    }
    if (!missing.empty()) {
        result.errors.push_back(sourceName + ": missing required column(s): " + missing);
        return result;
    }

    Track track;
    for (++lineIndex; lineIndex < lines.size(); ++lineIndex) {
        const std::string& raw = lines[lineIndex];
        if (trim(raw).empty() || trim(raw)[0] == '#') {
            continue;
        }
        const std::string where = "line " + std::to_string(lineIndex + 1);
        std::vector<std::string> fields = splitFields(raw, delimiter);

        auto cell = [&](Column column) -> std::optional<std::string> {
            auto it = columns.find(column);
            if (it == columns.end() || it->second >= fields.size()) {
                return std::nullopt;
            }
            std::string value = unquote(fields[it->second]);
            if (value.empty()) {
                return std::nullopt;
            }
            return value;
        };

        auto timeCell = cell(Column::Timestamp);
        auto latCell = cell(Column::Latitude);
        auto lngCell = cell(Column::Longitude);
        if (!timeCell || !latCell || !lngCell) {
            result.errors.push_back(where + ": missing timestamp, lat or lng");
            continue;
        }

        auto timestamp = parseTimestamp(*timeCell);
        if (!timestamp) {
            result.errors.push_back(where + ": unparseable timestamp '" + *timeCell + "'");
            continue;
        }
        auto lat = parseCoordinateCell(*latCell);
        auto lng = parseCoordinateCell(*lngCell);
        if (!lat || !lng) {
            result.errors.push_back(where + ": unparseable coordinates");
            continue;
        }
        if (!isValidLatitude(*lat) || !isValidLongitude(*lng)) {
            result.errors.push_back(where + ": coordinates out of range");
            continue;
        }

        TrackPoint point;
        point.timestamp = *timestamp;
        point.lat = *lat;
        point.lng = *lng;

        auto optionalField = [&](Column column, std::optional<double>& target) {
            auto value = cell(column);
            if (!value) {
                return;
            }
            target = parseDouble(*value);
            if (!target) {
                result.errors.push_back(where + ": ignoring invalid " + columnName(column) +
                                        " '" + *value + "'");
            }
        };
        optionalField(Column::Speed, point.speed);
        optionalField(Column::Heading, point.heading);
        optionalField(Column::Cog, point.cog);
        optionalField(Column::Altitude, point.altitude);
        optionalField(Column::Twa, point.twa);
        optionalField(Column::Tws, point.tws);

        track.points.push_back(point);
    }

    if (track.points.empty()) {
        result.errors.push_back(sourceName + ": no valid rows");
        return result;
    }

    track.updateTimeBounds();
    track.name = fileStem(sourceName);
    result.tracks.push_back(std::move(track));
    result.success = true;
    return result;
}

} // namespace sailtrack::parsers
