#pragma once

#include "../ports/ITrackParser.hpp"
#include <optional>
#include <unordered_map>

namespace sailtrack::parsers {

enum class Column {
    Timestamp,
    Latitude,
    Longitude,
    Speed,
    Heading,
    Cog,
    Altitude,
    Twa,
    Tws
};

/**
 * @brief Header-driven CSV/TSV reader
 *
 * The first non-empty, non-comment line is the header. Column names are
 * matched case-insensitively against a set of aliases; timestamp, lat and
 * lng are required. Latitude/longitude cells may use any notation
 * Coordinate::toDecimal accepts.
 */
class DelimitedTextParser : public ports::ITrackParser {
public:
    // Epoch values below this are seconds, at or above it milliseconds.
    static constexpr double EPOCH_SECONDS_LIMIT = 1e11;

    SourceFormat format() const override { return SourceFormat::DelimitedText; }
    bool requiresBinary() const override { return false; }

    TrackImportResult parse(const std::vector<std::uint8_t>& data,
                            const std::string& sourceName) const override;

    static char detectDelimiter(const std::string& headerLine);
    static std::optional<Column> columnForHeader(const std::string& header);
    static std::optional<int64_t> parseTimestamp(const std::string& text);
};

} // namespace sailtrack::parsers
