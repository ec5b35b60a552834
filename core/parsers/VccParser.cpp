#include "VccParser.hpp"
#include "TextUtil.hpp"
#include "../Geo.hpp"
#include <cmath>
#include <cstring>
#include <iomanip>
#include <limits>
#include <sstream>

namespace sailtrack::parsers {

namespace {

std::uint64_t readU64(const std::uint8_t* p) {
    std::uint64_t value = 0;
    for (int i = 7; i >= 0; --i) {
        value = (value << 8) | p[i];
    }
    return value;
}

std::uint32_t readU32(const std::uint8_t* p) {
    return static_cast<std::uint32_t>(p[0]) |
           (static_cast<std::uint32_t>(p[1]) << 8) |
           (static_cast<std::uint32_t>(p[2]) << 16) |
           (static_cast<std::uint32_t>(p[3]) << 24);
}

std::int32_t readI32(const std::uint8_t* p) {
    std::uint32_t raw = readU32(p);
    std::int32_t value;
    std::memcpy(&value, &raw, sizeof(value));
    return value;
}

float readF32(const std::uint8_t* p) {
    std::uint32_t raw = readU32(p);
    float value;
    std::memcpy(&value, &raw, sizeof(value));
    return value;
}

std::string hexKey(std::uint8_t key) {
    std::ostringstream ss;
    ss << "0x" << std::uppercase << std::hex << std::setw(2) << std::setfill('0')
       << static_cast<int>(key);
    return ss.str();
}

} // namespace

std::size_t VccParser::payloadSize(std::uint8_t key) {
    switch (key) {
    case KEY_PAGE_HEADER:
        return 7;
    case KEY_PAGE_TERMINATOR:
        return 2;
    case KEY_POSITION:
        return POSITION_ROW_SIZE;
    case KEY_DECLINATION:
        return 21;
    case KEY_RACE_TIMER:
        return 10;
    case KEY_LINE_POSITION:
        return 18;
    case KEY_SHIFT_ANGLE:
        return 14;
    case KEY_WIND:
        return WIND_ROW_SIZE;
    default:
        return 0;
    }
}

TrackImportResult VccParser::parse(const std::vector<std::uint8_t>& data,
                                   const std::string& sourceName) const {
    TrackImportResult result;
    result.format = SourceFormat::Vcc;

    if (data.empty()) {
        result.errors.push_back(sourceName + ": empty file");
        return result;
    }
    if (data[0] != KEY_PAGE_HEADER) {
        result.errors.push_back(sourceName + ": not a logger dump (expected page header " +
                                hexKey(KEY_PAGE_HEADER) + ", found " + hexKey(data[0]) + ")");
        return result;
    }

    Track track;
    std::optional<double> twa;
    std::optional<double> tws;

    std::size_t offset = 0;
    while (offset < data.size()) {
        const std::uint8_t key = data[offset];
        const std::size_t size = payloadSize(key);
        if (size == 0) {
            result.errors.push_back(sourceName + ": unknown row key " + hexKey(key) +
                                    " at offset " + std::to_string(offset));
            break;
        }
        if (offset + 1 + size > data.size()) {
            result.errors.push_back(sourceName + ": truncated " + hexKey(key) + " row at offset " +
                                    std::to_string(offset));
            break;
        }

        const std::uint8_t* row = data.data() + offset + 1;
        if (key == KEY_POSITION) {
            const std::uint64_t timestamp = readU64(row);
            if (timestamp > static_cast<std::uint64_t>(std::numeric_limits<int64_t>::max())) {
                result.errors.push_back(sourceName + ": timestamp out of range at offset " +
                                        std::to_string(offset));
                break;
            }

            TrackPoint point;
            point.timestamp = static_cast<int64_t>(timestamp);
            point.lat = readI32(row + 8) * 1e-7;
            point.lng = readI32(row + 12) * 1e-7;

            if (!isValidLatitude(point.lat) || !isValidLongitude(point.lng)) {
                result.errors.push_back(sourceName + ": position out of range at offset " +
                                        std::to_string(offset));
            } else {
                float sog = readF32(row + 16);
                float cog = readF32(row + 20);
                float altitude = readF32(row + 24);
                if (std::isfinite(sog)) {
                    point.speed = sog * KNOTS_PER_MPS;
                }
                if (std::isfinite(cog)) {
                    point.cog = Geo::normalizeBearing(Geo::toDegrees(cog));
                }
                if (std::isfinite(altitude)) {
                    point.altitude = altitude;
                }

                double w = readF32(row + 28);
                double x = readF32(row + 32);
                double y = readF32(row + 36);
                double z = readF32(row + 40);
                if (std::isfinite(w) && std::isfinite(x) && std::isfinite(y) && std::isfinite(z) &&
                    (w != 0.0 || x != 0.0 || y != 0.0 || z != 0.0)) {
                    double yaw = std::atan2(2.0 * (w * z + x * y), 1.0 - 2.0 * (y * y + z * z));
                    point.heading = Geo::normalizeBearing(Geo::toDegrees(yaw));
                }

                point.twa = twa;
                point.tws = tws;
                track.points.push_back(point);
            }
        } else if (key == KEY_WIND) {
            float angle = readF32(row + 8);
            float speed = readF32(row + 12);
            twa = std::isfinite(angle) ? std::optional<double>(Geo::normalizeAngle(angle)) : std::nullopt;
            tws = std::isfinite(speed) ? std::optional<double>(speed) : std::nullopt;
        }

        offset += 1 + size;
    }

    if (!track.points.empty()) {
        track.updateTimeBounds();
        track.name = fileStem(sourceName);
        track.device = "VCC logger";
        result.tracks.push_back(std::move(track));
    } else if (result.errors.empty()) {
        result.errors.push_back(sourceName + ": no position rows");
    }

    result.success = !result.tracks.empty();
    return result;
}

} // namespace sailtrack::parsers
