#include "MarkListParser.hpp"
#include "../Coordinate.hpp"
#include "../parsers/DelimitedTextParser.hpp"
#include "../parsers/TextUtil.hpp"
#include <fstream>
#include <iostream>
#include <iterator>
#include <unordered_map>

namespace sailtrack::course {

using parsers::trim;
using parsers::toLower;
using parsers::unquote;

namespace {

enum class MarkColumn {
    Id,
    Name,
    Latitude,
    Longitude,
    Type,
    Rounding,
    Order
};

std::optional<MarkColumn> markColumnForHeader(const std::string& header) {
    static const std::unordered_map<std::string, MarkColumn> aliases = {
        {"id", MarkColumn::Id},
        {"name", MarkColumn::Name},
        {"mark", MarkColumn::Name},
        {"lat", MarkColumn::Latitude},
        {"latitude", MarkColumn::Latitude},
        {"lng", MarkColumn::Longitude},
        {"lon", MarkColumn::Longitude},
        {"long", MarkColumn::Longitude},
        {"longitude", MarkColumn::Longitude},
        {"type", MarkColumn::Type},
        {"rounding", MarkColumn::Rounding},
        {"order", MarkColumn::Order},
        {"seq", MarkColumn::Order}
    };

    auto it = aliases.find(toLower(trim(unquote(trim(header)))));
    if (it == aliases.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace

MarkListResult MarkListParser::parse(const std::string& input, const std::string& sourceName) const {
    MarkListResult result;

    std::string text = input;
    if (text.size() >= 3 && text.compare(0, 3, "\xEF\xBB\xBF") == 0) {
        text.erase(0, 3);
    }
    std::vector<std::string> lines = parsers::splitLines(text);

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

    const char delimiter = parsers::DelimitedTextParser::detectDelimiter(lines[lineIndex]);
    std::unordered_map<MarkColumn, std::size_t> columns;
    std::vector<std::string> headers = parsers::splitFields(lines[lineIndex], delimiter);
    for (std::size_t i = 0; i < headers.size(); ++i) {
        auto column = markColumnForHeader(headers[i]);
        if (column && columns.find(*column) == columns.end()) {
            columns[*column] = i;
        }
    }
    if (columns.count(MarkColumn::Name) == 0 || columns.count(MarkColumn::Latitude) == 0 ||
        columns.count(MarkColumn::Longitude) == 0) {
        result.errors.push_back(sourceName + ": header must name name, lat and lng columns");
        return result;
    }

    for (++lineIndex; lineIndex < lines.size(); ++lineIndex) {
        const std::string line = trim(lines[lineIndex]);
        if (line.empty() || line[0] == '#') {
            continue;
        }
        const std::string where = "line " + std::to_string(lineIndex + 1);
        std::vector<std::string> fields = parsers::splitFields(line, delimiter);

        auto cell = [&](MarkColumn column) -> std::string {
            auto it = columns.find(column);
            if (it == columns.end() || it->second >= fields.size()) {
                return "";
            }
            return unquote(fields[it->second]);
        };

        double lat = 0.0;
        double lng = 0.0;
        try {
            lat = Coordinate::toDecimal(cell(MarkColumn::Latitude));
            lng = Coordinate::toDecimal(cell(MarkColumn::Longitude));
        } catch (const CoordinateError& e) {
            result.errors.push_back(where + ": " + e.what());
            continue;
        }

        std::optional<int> order;
        const std::string orderText = cell(MarkColumn::Order);
        if (!orderText.empty()) {
            auto value = parsers::parseDouble(orderText);
            if (value && *value >= 0.0 && *value <= 1e6 && *value == static_cast<int>(*value)) {
                order = static_cast<int>(*value);
            } else {
                result.errors.push_back(where + ": ignoring invalid order '" + orderText + "'");
            }
        }

        // Range problems are left to the validator so they are reported per mark.
        result.marks.push_back(Mark::fromText(cell(MarkColumn::Id), cell(MarkColumn::Name), lat, lng,
                                              cell(MarkColumn::Type), cell(MarkColumn::Rounding), order));
    }

    if (result.marks.empty()) {
        result.errors.push_back(sourceName + ": no marks");
        return result;
    }
    result.success = true;
    return result;
}

MarkListResult MarkListParser::parseFile(const std::string& path) const {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        MarkListResult result;
        result.errors.push_back("Cannot open file: " + path);
        std::cerr << "[Course] Cannot open file: " << path << std::endl;
        return result;
    }
    std::string text((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    return parse(text, path);
}

} // namespace sailtrack::course
