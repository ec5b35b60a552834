/**
 * @file Coordinate.hpp
 * @brief Coordinate notation detection, parsing and formatting
 *
 * Race documents give mark positions in three incompatible notations:
 * - Decimal degrees:          "22.279333, 114.1628" or "22.2793N 114.1628E"
 * - Degrees decimal minutes:  "22° 16.760' N" or the bare "114 09.768E"
 * - Degrees minutes seconds:  "22°16'45.6\"N"
 *
 * Conversions that cannot produce a value throw a typed error instead of
 * returning NaN or zero.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace sailtrack {

enum class CoordinateFormat {
    Decimal,
    DegreesDecimalMinutes,
    DegreesMinutesSeconds
};

class CoordinateError : public std::runtime_error {
public:
    explicit CoordinateError(const std::string& message) : std::runtime_error(message) {}
};

/// Text did not match any supported notation
class CoordinateParseError : public CoordinateError {
public:
    explicit CoordinateParseError(const std::string& message) : CoordinateError(message) {}
};

/// Latitude outside [-90, 90] or longitude outside [-180, 180]
class CoordinateRangeError : public CoordinateError {
public:
    explicit CoordinateRangeError(const std::string& message) : CoordinateError(message) {}
};

struct CoordinatePair {
    double lat = 0.0;
    double lng = 0.0;
    CoordinateFormat format = CoordinateFormat::Decimal;
};

class Coordinate {
public:
    static constexpr int DEFAULT_PRECISION = 4;

    /**
     * @brief Classify the notation of a single value or a pair
     * @note A degree glyph with a seconds glyph is DMS; a degree (or minute)
     *       glyph alone, or unmarked "deg min.dec hemisphere" (once or as
     *       a pair), is DDM; anything else is treated as decimal degrees.
     */
    static CoordinateFormat detectFormat(const std::string& text);

    /**
     * @brief Convert one coordinate component to signed decimal degrees
     * @throws CoordinateParseError when the text does not match its notation
     */
    static double toDecimal(const std::string& text);

    /**
     * @brief Parse a latitude/longitude pair in any supported notation
     *
     * DMS/DDM components are assigned by hemisphere letter (N/S latitude,
     * E/W longitude). Decimal pairs are read latitude first, also when
     * only one of them carries a hemisphere letter ("22.5 114.2W").
     *
     * @throws CoordinateParseError if two components cannot be extracted
     * @throws CoordinateRangeError if the result is out of range
     */
    static CoordinatePair parsePair(const std::string& text);

    /// @throws CoordinateRangeError
    static void validateRange(double lat, double lng);

    /**
     * @brief Render a pair in the requested notation
     * @param precision Decimal places of the smallest unit (degrees, minutes
     *        or seconds depending on the notation)
     * @throws CoordinateRangeError for out of range input
     */
    static std::string format(double lat, double lng, CoordinateFormat target,
                              int precision = DEFAULT_PRECISION);

    static std::string formatSingle(double value, bool isLatitude, CoordinateFormat target,
                                    int precision = DEFAULT_PRECISION);
};

std::string coordinateFormatToString(CoordinateFormat format);

} // namespace sailtrack
