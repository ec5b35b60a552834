#include <gtest/gtest.h>
#include "../core/Coordinate.hpp"

using namespace sailtrack;

TEST(CoordinateTest, DegreesMinutesSecondsToDecimal) {
    EXPECT_NEAR(Coordinate::toDecimal("22\xC2\xB0" "16'45.6\"N"), 22.279333, 1e-6);
    EXPECT_NEAR(Coordinate::toDecimal("22\xC2\xB0" "16'45.6\"S"), -22.279333, 1e-6);
}

TEST(CoordinateTest, DegreesDecimalMinutesToDecimal) {
    EXPECT_NEAR(Coordinate::toDecimal("114 09.768E"), 114.1628, 1e-6);
    EXPECT_NEAR(Coordinate::toDecimal("114\xC2\xB0 09.768' W"), -114.1628, 1e-6);
}

TEST(CoordinateTest, DecimalPassesThrough) {
    EXPECT_DOUBLE_EQ(Coordinate::toDecimal("-33.8568"), -33.8568);
    EXPECT_DOUBLE_EQ(Coordinate::toDecimal("  151.2153 "), 151.2153);
}

TEST(CoordinateTest, DetectFormat) {
    EXPECT_EQ(Coordinate::detectFormat("22.5"), CoordinateFormat::Decimal);
    EXPECT_EQ(Coordinate::detectFormat("22\xC2\xB0" "16'45.6\"N"), CoordinateFormat::DegreesMinutesSeconds);
    EXPECT_EQ(Coordinate::detectFormat("22 16.5N"), CoordinateFormat::DegreesDecimalMinutes);
    EXPECT_EQ(Coordinate::detectFormat("22\xC2\xB0 16.5'"), CoordinateFormat::DegreesDecimalMinutes);
}

TEST(CoordinateTest, RejectsMalformedText) {
    EXPECT_THROW(Coordinate::toDecimal("abc"), CoordinateParseError);
    EXPECT_THROW(Coordinate::toDecimal(""), CoordinateParseError);
    EXPECT_THROW(Coordinate::toDecimal("22\xC2\xB0 61' N"), CoordinateParseError);
    EXPECT_THROW(Coordinate::toDecimal("-22.5S"), CoordinateParseError);
}

TEST(CoordinateTest, ParsePairWithHemispheres) {
    CoordinatePair pair = Coordinate::parsePair("22.5N 114.25W");
    EXPECT_DOUBLE_EQ(pair.lat, 22.5);
    EXPECT_DOUBLE_EQ(pair.lng, -114.25);
}

TEST(CoordinateTest, ParsePairSwapsLongitudeFirst) {
    CoordinatePair pair = Coordinate::parsePair("114.25E, 22.5S");
    EXPECT_DOUBLE_EQ(pair.lat, -22.5);
    EXPECT_DOUBLE_EQ(pair.lng, 114.25);
}

TEST(CoordinateTest, ParsePairChecksRange) {
    EXPECT_THROW(Coordinate::parsePair("91, 10"), CoordinateRangeError);
    EXPECT_THROW(Coordinate::parsePair("10, 181"), CoordinateRangeError);
    EXPECT_THROW(Coordinate::parsePair("22.5N 10.0S"), CoordinateParseError);
}

TEST(CoordinateTest, FormatDecimal) {
    EXPECT_EQ(Coordinate::format(22.5, -114.25, CoordinateFormat::Decimal, 4), "22.5000, -114.2500");
}

TEST(CoordinateTest, FormatDegreesDecimalMinutes) {
    EXPECT_EQ(Coordinate::format(22.5, -114.25, CoordinateFormat::DegreesDecimalMinutes, 3),
              "22\xC2\xB0 30.000' N, 114\xC2\xB0 15.000' W");
}

TEST(CoordinateTest, FormatDegreesMinutesSeconds) {
    EXPECT_EQ(Coordinate::formatSingle(22.279333, true, CoordinateFormat::DegreesMinutesSeconds, 1),
              "22\xC2\xB0 16' 45.6\" N");
}

TEST(CoordinateTest, FormatRejectsOutOfRange) {
    EXPECT_THROW(Coordinate::format(95.0, 0.0, CoordinateFormat::Decimal), CoordinateRangeError);
}

TEST(CoordinateTest, FormattedValueParsesBack) {
    const double lat = -36.84853;
    std::string text = Coordinate::formatSingle(lat, true, CoordinateFormat::DegreesMinutesSeconds, 2);
    EXPECT_NEAR(Coordinate::toDecimal(text), lat, 1e-5);
}

TEST(CoordinateTest, OverlongNumberIsParseError) {
    const std::string huge(400, '9');
    EXPECT_THROW(Coordinate::toDecimal(huge), CoordinateParseError);
    EXPECT_THROW(Coordinate::parsePair(huge + ", 10"), CoordinateParseError);
    EXPECT_EQ(Coordinate::detectFormat(huge), CoordinateFormat::Decimal);
}

TEST(CoordinateTest, DegreesDecimalMinutesPairRoundTrip) {
    const double lats[] = {-90.0, -45.123456, -0.00001, 0.0, 0.00001, 22.279333, 89.99999, 90.0};
    const double lngs[] = {-180.0, -114.1628, -0.00003, 0.0, 0.00002, 151.2153, 179.99999, 180.0};

    for (double lat : lats) {
        for (double lng : lngs) {
            std::string text = Coordinate::format(lat, lng, CoordinateFormat::DegreesDecimalMinutes);
            CoordinatePair pair = Coordinate::parsePair(text);
            EXPECT_NEAR(pair.lat, lat, 1e-4) << text;
            EXPECT_NEAR(pair.lng, lng, 1e-4) << text;
            EXPECT_EQ(pair.format, CoordinateFormat::DegreesDecimalMinutes) << text;
        }
    }
}

TEST(CoordinateTest, DetectFormatUnmarkedDegreesMinutesPair) {
    EXPECT_EQ(Coordinate::detectFormat("22 16.76N 114 09.768E"), CoordinateFormat::DegreesDecimalMinutes);
    EXPECT_EQ(Coordinate::detectFormat("N22 16.76 E114 09.768"), CoordinateFormat::DegreesDecimalMinutes);
    EXPECT_EQ(Coordinate::detectFormat("22.5N 114.25W"), CoordinateFormat::Decimal);

    CoordinatePair pair = Coordinate::parsePair("22 16.76N 114 09.768E");
    EXPECT_NEAR(pair.lat, 22.279333, 1e-6);
    EXPECT_NEAR(pair.lng, 114.1628, 1e-6);
    EXPECT_EQ(pair.format, CoordinateFormat::DegreesDecimalMinutes);
}

TEST(CoordinateTest, DecimalPairWithOneHemisphereLetter) {
    CoordinatePair trailing = Coordinate::parsePair("22.5 114.2W");
    EXPECT_DOUBLE_EQ(trailing.lat, 22.5);
    EXPECT_DOUBLE_EQ(trailing.lng, -114.2);
    EXPECT_EQ(trailing.format, CoordinateFormat::Decimal);

    CoordinatePair leading = Coordinate::parsePair("S33.85 151.21");
    EXPECT_DOUBLE_EQ(leading.lat, -33.85);
    EXPECT_DOUBLE_EQ(leading.lng, 151.21);
}
