#pragma once

#include "../ports/ITrackParser.hpp"
#include <cstddef>
#include <cstdint>

namespace sailtrack::parsers {

/**
 * @brief Reader for the vendor logger's binary dump (.vcc)
 *
 * The file is a flat sequence of rows. Each row is a one-byte key followed
 * by a fixed-size payload; all multi-byte values are little-endian.
 *
 *   key   payload  contents
 *   0xFF   7       page header: u8 format version, u16 page number, u32 reserved
 *   0xFE   2       page terminator: u16 page length
 *   0x02  44       position:
 *                    u64  timestamp, epoch milliseconds
 *                    i32  latitude,  1e-7 degrees
 *                    i32  longitude, 1e-7 degrees
 *                    f32  speed over ground, m/s
 *                    f32  course over ground, radians true
 *                    f32  altitude, meters
 *                    f32  orientation quaternion W, X, Y, Z
 *   0x0A  16       wind: u64 timestamp, f32 true wind angle (deg), f32 true wind speed (knots)
 *   0x03  21       declination (skipped)
 *   0x04  10       race timer event (skipped)
 *   0x05  18       start line position (skipped)
 *   0x06  14       shift angle (skipped)
 *
 * The first row must be a page header. A wind row applies to every
 * following position until the next wind row. Heading is the yaw of the
 * orientation quaternion; an all-zero quaternion leaves heading unset.
 *
 * Decoding is strict: an unknown key, a truncated row or a timestamp past
 * the int64 range stops the decode with an error. Positions decoded before that point are still returned.
 */
class VccParser : public ports::ITrackParser {
public:
    static constexpr std::uint8_t KEY_PAGE_HEADER = 0xFF;
    static constexpr std::uint8_t KEY_PAGE_TERMINATOR = 0xFE;
    static constexpr std::uint8_t KEY_POSITION = 0x02;
    static constexpr std::uint8_t KEY_DECLINATION = 0x03;
    static constexpr std::uint8_t KEY_RACE_TIMER = 0x04;
    static constexpr std::uint8_t KEY_LINE_POSITION = 0x05;
    static constexpr std::uint8_t KEY_SHIFT_ANGLE = 0x06;
    static constexpr std::uint8_t KEY_WIND = 0x0A;

    static constexpr std::size_t POSITION_ROW_SIZE = 44;
    static constexpr std::size_t WIND_ROW_SIZE = 16;

    static constexpr double KNOTS_PER_MPS = 1.943844;

    SourceFormat format() const override { return SourceFormat::Vcc; }
    bool requiresBinary() const override { return true; }

    TrackImportResult parse(const std::vector<std::uint8_t>& data,
                            const std::string& sourceName) const override;

    // Payload size for a row key, 0 when the key is unknown.
    static std::size_t payloadSize(std::uint8_t key);
};

} // namespace sailtrack::parsers
