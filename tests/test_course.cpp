#include <gtest/gtest.h>
#include "../core/course/CourseGeometry.hpp"
#include "../core/course/CoursePositioning.hpp"
#include "../core/course/MarkListParser.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <vector>

using namespace sailtrack;
using namespace sailtrack::course;

namespace {

Mark makeMark(const std::string& id, const std::string& name, double lat, double lng,
              std::optional<int> order = std::nullopt) {
    Mark mark;
    mark.id = id;
    mark.name = name;
    mark.lat = lat;
    mark.lng = lng;
    mark.order = order;
    return mark;
}

std::vector<std::string> namesOf(const std::vector<Mark>& marks) {
    std::vector<std::string> names;
    for (const auto& mark : marks) {
        names.push_back(mark.name);
    }
    return names;
}

} // namespace

TEST(MarkTest, FromTextMapsKnownValues) {
    Mark mark = Mark::fromText("m1", "Start Boat", 22.3, 114.2, "Committee_Boat", "STBD", 2);
    ASSERT_TRUE(mark.type.has_value());
    EXPECT_EQ(*mark.type, MarkType::CommitteeBoat);
    ASSERT_TRUE(mark.rounding.has_value());
    EXPECT_EQ(*mark.rounding, Rounding::Starboard);
    EXPECT_EQ(mark.order, 2);
    EXPECT_TRUE(mark.rawType.empty());
    EXPECT_TRUE(mark.rawRounding.empty());
}

TEST(MarkTest, FromTextKeepsUnknownText) {
    Mark mark = Mark::fromText("m2", "Yellow", 22.3, 114.2, "buoy", "sideways");
    EXPECT_FALSE(mark.type.has_value());
    EXPECT_EQ(mark.rawType, "buoy");
    EXPECT_FALSE(mark.rounding.has_value());
    EXPECT_EQ(mark.rawRounding, "sideways");

    Mark blank = Mark::fromText("m3", "Blank", 22.3, 114.2, "", "");
    EXPECT_FALSE(blank.type.has_value());
    EXPECT_TRUE(blank.rawType.empty());
}

TEST(MarkTest, EnumStrings) {
    EXPECT_EQ(markTypeToString(MarkType::StartFinish), "start-finish");
    EXPECT_EQ(stringToMarkType("Start Line"), MarkType::StartLine);
    EXPECT_EQ(stringToMarkType("finish"), MarkType::FinishLine);
    EXPECT_FALSE(stringToMarkType("lighthouse").has_value());

    EXPECT_EQ(roundingToString(Rounding::Either), "either");
    EXPECT_EQ(stringToRounding("p"), Rounding::Port);

    EXPECT_EQ(legTypeToString(LegType::Downwind), "downwind");
    EXPECT_EQ(courseTypeToString(CourseType::WindwardLeeward), "windward-leeward");
    EXPECT_EQ(stringToCourseType("Windward_Leeward"), CourseType::WindwardLeeward);
    EXPECT_FALSE(stringToCourseType("figure-eight").has_value());
}

TEST(CourseGeometryTest, DetectsCourseTypeFromNames) {
    std::vector<Mark> windwardLeeward = {
        makeMark("a", "Windward Mark", 22.31, 114.2),
        makeMark("b", "Leeward Mark", 22.30, 114.2)
    };
    EXPECT_EQ(CourseGeometry::detectCourseType(windwardLeeward), CourseType::WindwardLeeward);

    std::vector<Mark> triangle = windwardLeeward;
    triangle.push_back(makeMark("c", "Wing Mark", 22.305, 114.21));
    EXPECT_EQ(CourseGeometry::detectCourseType(triangle), CourseType::Triangle);

    std::vector<Mark> trapezoid = {
        makeMark("a", "Windward", 22.31, 114.2),
        makeMark("b", "Offset", 22.31, 114.201),
        makeMark("c", "Reach Mark", 22.305, 114.21),
        makeMark("d", "Leeward", 22.30, 114.2),
        makeMark("e", "Finish", 22.30, 114.19)
    };
    EXPECT_EQ(CourseGeometry::detectCourseType(trapezoid), CourseType::Trapezoid);

    std::vector<Mark> olympic = {
        makeMark("a", "Top", 22.31, 114.2),
        makeMark("b", "Wing", 22.305, 114.21),
        makeMark("c", "Mark 3", 22.30, 114.2),
        makeMark("d", "Mark 4", 22.30, 114.19),
        makeMark("e", "Mark 5", 22.29, 114.19)
    };
    EXPECT_EQ(CourseGeometry::detectCourseType(olympic), CourseType::Olympic);

    std::vector<Mark> custom = {
        makeMark("a", "Alpha", 22.31, 114.2),
        makeMark("b", "Bravo", 22.30, 114.2)
    };
    EXPECT_EQ(CourseGeometry::detectCourseType(custom), CourseType::Custom);
}

TEST(CourseGeometryTest, ClassifyLegSectorBoundaries) {
    EXPECT_EQ(CourseGeometry::classifyLeg(0.0), LegType::Upwind);
    EXPECT_EQ(CourseGeometry::classifyLeg(45.0), LegType::Upwind);
    EXPECT_EQ(CourseGeometry::classifyLeg(45.5), LegType::Reaching);
    EXPECT_EQ(CourseGeometry::classifyLeg(135.0), LegType::Downwind);
    EXPECT_EQ(CourseGeometry::classifyLeg(134.5), LegType::Reaching);
    EXPECT_EQ(CourseGeometry::classifyLeg(225.0), LegType::Downwind);
    EXPECT_EQ(CourseGeometry::classifyLeg(315.0), LegType::Upwind);
    EXPECT_EQ(CourseGeometry::classifyLeg(-10.0), LegType::Upwind);
}

TEST(CourseGeometryTest, SortByOrderPutsUnorderedMarksLast) {
    std::vector<Mark> marks = {
        makeMark("a", "Second", 22.3, 114.2, 2),
        makeMark("b", "LooseA", 22.3, 114.2),
        makeMark("c", "First", 22.3, 114.2, 0),
        makeMark("d", "LooseB", 22.3, 114.2)
    };

    std::vector<std::string> expected = {"First", "Second", "LooseA", "LooseB"};
    EXPECT_EQ(namesOf(CourseGeometry::sortByOrder(marks)), expected);
}

TEST(CourseGeometryTest, GenerateLegsFollowsSailingOrder) {
    std::vector<Mark> marks = {
        makeMark("w", "Windward", 22.01, 114.0, 1),
        makeMark("s", "Start", 22.0, 114.0, 0),
        makeMark("r", "Reach", 22.01, 114.01, 2)
    };

    auto legs = CourseGeometry::generateLegs(marks);
    ASSERT_EQ(legs.size(), 2u);

    EXPECT_EQ(legs[0].from, "Start");
    EXPECT_EQ(legs[0].to, "Windward");
    EXPECT_NEAR(legs[0].bearing, 0.0, 1e-9);
    EXPECT_NEAR(legs[0].distance, 0.6, 0.001);
    EXPECT_EQ(legs[0].unit, DistanceUnit::NauticalMiles);
    EXPECT_EQ(legs[0].type, LegType::Upwind);

    EXPECT_EQ(legs[1].from, "Windward");
    EXPECT_EQ(legs[1].to, "Reach");
    EXPECT_NEAR(legs[1].bearing, 90.0, 0.1);
    EXPECT_EQ(legs[1].type, LegType::Reaching);

    auto kmLegs = CourseGeometry::generateLegs(marks, DistanceUnit::Kilometers);
    EXPECT_NEAR(kmLegs[0].distance, 1.112, 0.001);
}

TEST(CourseGeometryTest, GenerateLegsRelativeToWind) {
    std::vector<Mark> marks = {
        makeMark("s", "Start", 22.0, 114.0),
        makeMark("e", "East", 22.0, 114.01),
        makeMark("b", "Back", 22.0, 114.0)
    };

    auto legs = CourseGeometry::generateLegs(marks, DistanceUnit::NauticalMiles, 90.0);
    ASSERT_EQ(legs.size(), 2u);
    EXPECT_EQ(legs[0].type, LegType::Upwind);
    EXPECT_EQ(legs[1].type, LegType::Downwind);

    EXPECT_TRUE(CourseGeometry::generateLegs({marks[0]}).empty());
}

TEST(CourseGeometryTest, BuildGeometryMarksAndCourseLine) {
    std::vector<Mark> marks = {
        makeMark("start", "Start", 22.30, 114.20),
        makeMark("", "Windward", 22.31, 114.20),
        makeMark("lee", "Leeward", 22.30, 114.21)
    };

    FeatureCollection collection = CourseGeometry::buildGeometry(marks, true);
    ASSERT_EQ(collection.features.size(), 4u);
    EXPECT_EQ(collection.features[0].id, "start");
    EXPECT_EQ(collection.features[1].id, "mark-2");
    EXPECT_EQ(collection.features[2].id, "lee");
    EXPECT_EQ(collection.features[0].geometryType, GeometryType::Point);

    const Feature& line = collection.features[3];
    EXPECT_EQ(line.id, "course-line");
    EXPECT_EQ(line.geometryType, GeometryType::LineString);
    ASSERT_EQ(line.coordinates.size(), 3u);
    EXPECT_DOUBLE_EQ(line.coordinates[1].lat, 22.31);
    EXPECT_FALSE(collection.bbox.has_value());

    FeatureCollection single = CourseGeometry::buildGeometry({marks[0]}, true);
    EXPECT_EQ(single.features.size(), 1u);

    FeatureCollection noLine = CourseGeometry::buildGeometry(marks, false);
    EXPECT_EQ(noLine.features.size(), 3u);
}

TEST(CourseGeometryTest, BuildGeometryWithLegsAndBounds) {
    std::vector<Mark> marks = {
        makeMark("a", "Start", 22.30, 114.20),
        makeMark("b", "Windward", 22.31, 114.20)
    };
    std::vector<CourseLeg> legs = CourseGeometry::generateLegs(marks);
    CourseLeg orphan;
    orphan.from = "Windward";
    orphan.to = "Nowhere";
    legs.push_back(orphan);

    GeometryOptions options;
    options.includeCourseLine = false;
    options.boundsPaddingDeg = 0.0;
    FeatureCollection collection = CourseGeometry::buildGeometry(marks, legs, options);

    ASSERT_EQ(collection.features.size(), 3u);
    const Feature& leg = collection.features[2];
    EXPECT_EQ(leg.id, "leg-1");
    EXPECT_EQ(leg.properties["type"], "leg");
    EXPECT_EQ(leg.properties["from"], "Start");
    EXPECT_EQ(leg.properties["legType"], "upwind");
    EXPECT_EQ(leg.properties["unit"], "nm");

    ASSERT_TRUE(collection.bbox.has_value());
    EXPECT_DOUBLE_EQ(collection.bbox->south, 22.30);
    EXPECT_DOUBLE_EQ(collection.bbox->north, 22.31);
    EXPECT_DOUBLE_EQ(collection.bbox->west, 114.20);
}

TEST(CourseGeometryTest, GeoJsonUsesLongitudeFirst) {
    std::vector<Mark> marks = {
        makeMark("a", "Start", 22.30, 114.20),
        Mark::fromText("b", "Yellow", 22.31, 114.21, "buoy", "")
    };
    GeometryOptions options;
    options.boundsPaddingDeg = 0.0;
    nlohmann::json json = CourseGeometry::toGeoJson(
        CourseGeometry::buildGeometry(marks, CourseGeometry::generateLegs(marks), options));

    EXPECT_EQ(json["type"], "FeatureCollection");
    const auto& first = json["features"][0];
    EXPECT_EQ(first["type"], "Feature");
    EXPECT_EQ(first["id"], "a");
    EXPECT_EQ(first["geometry"]["type"], "Point");
    EXPECT_DOUBLE_EQ(first["geometry"]["coordinates"][0].get<double>(), 114.20);
    EXPECT_DOUBLE_EQ(first["geometry"]["coordinates"][1].get<double>(), 22.30);

    const auto& second = json["features"][1];
    EXPECT_EQ(second["properties"]["type"], "buoy");
    EXPECT_TRUE(second["properties"]["rounding"].is_null());
    EXPECT_TRUE(second["properties"]["order"].is_null());

    const auto& line = json["features"][2];
    EXPECT_EQ(line["id"], "course-line");
    EXPECT_EQ(line["geometry"]["type"], "LineString");
    EXPECT_DOUBLE_EQ(line["geometry"]["coordinates"][1][0].get<double>(), 114.21);

    ASSERT_TRUE(json.contains("bbox"));
    ASSERT_EQ(json["bbox"].size(), 4u);
    EXPECT_DOUBLE_EQ(json["bbox"][0].get<double>(), 114.20);
    EXPECT_DOUBLE_EQ(json["bbox"][1].get<double>(), 22.30);
    EXPECT_DOUBLE_EQ(json["bbox"][2].get<double>(), 114.21);
    EXPECT_DOUBLE_EQ(json["bbox"][3].get<double>(), 22.31);
}

TEST(CourseGeometryTest, ComputeCourseGeometrySummary) {
    std::vector<Mark> marks = {
        makeMark("w", "Windward Mark", 22.01, 114.0),
        makeMark("l", "Leeward Mark", 22.0, 114.0),
        makeMark("f", "Finish", 22.0, 114.01)
    };

    CourseSummary summary = CourseGeometry::computeCourseGeometry(marks);
    ASSERT_EQ(summary.legs.size(), 2u);
    EXPECT_DOUBLE_EQ(summary.totalDistance, summary.legs[0].distance + summary.legs[1].distance);
    EXPECT_NEAR(summary.bounds.south, 21.995, 1e-9);
    EXPECT_NEAR(summary.bounds.north, 22.015, 1e-9);
    EXPECT_NEAR(summary.centroid.lat, (22.01 + 22.0 + 22.0) / 3.0, 1e-6);
    EXPECT_EQ(summary.courseType, CourseType::WindwardLeeward);

    EXPECT_THROW(CourseGeometry::computeCourseGeometry({}), std::invalid_argument);
}

class CoursePositioningTest : public ::testing::Test {
protected:
    void SetUp() override {
        options_.startLineCenter = LatLng{22.30, 114.20};
        options_.windDirection = 0.0;
        options_.courseType = CourseType::WindwardLeeward;
    }

    PositioningOptions options_;
};

TEST_F(CoursePositioningTest, PlacesWindwardLeewardTemplate) {
    PositionedCourse course = CoursePositioning::positionCourse(options_);

    ASSERT_EQ(course.marks.size(), 3u);
    for (std::size_t i = 0; i < course.marks.size(); ++i) {
        EXPECT_EQ(course.marks[i].id, "mark-" + std::to_string(i + 1));
        EXPECT_EQ(course.marks[i].order, static_cast<int>(i));
    }

    const Mark& windward = course.marks[0];
    EXPECT_EQ(windward.name, "Windward Mark");
    LatLng position{windward.lat, windward.lng};
    EXPECT_NEAR(Geo::distance(options_.startLineCenter, position), 0.5, 1e-6);
    EXPECT_NEAR(Geo::initialBearing(options_.startLineCenter, position), 0.0, 1e-6);

    // Gate halves straddle the wind axis
    EXPECT_LT(course.marks[1].lng, options_.startLineCenter.lng);
    EXPECT_GT(course.marks[2].lng, options_.startLineCenter.lng);
    EXPECT_EQ(course.marks[2].rounding, Rounding::Starboard);

    EXPECT_LE(course.bounds.south, course.startLine.pin.lat);
    EXPECT_GE(course.bounds.north, windward.lat);
}

TEST_F(CoursePositioningTest, RotatesWithWindAndScalesLegLength) {
    options_.windDirection = 225.0;
    options_.legLengthNm = 1.2;
    PositionedCourse course = CoursePositioning::positionCourse(options_);

    LatLng windward{course.marks[0].lat, course.marks[0].lng};
    EXPECT_NEAR(Geo::distance(options_.startLineCenter, windward), 1.2, 1e-6);
    EXPECT_NEAR(Geo::initialBearing(options_.startLineCenter, windward), 225.0, 1e-3);
}

TEST_F(CoursePositioningTest, RejectsInvalidOptions) {
    PositioningOptions badCenter = options_;
    badCenter.startLineCenter.lat = 95.0;
    EXPECT_THROW(CoursePositioning::positionCourse(badCenter), std::invalid_argument);

    PositioningOptions badLeg = options_;
    badLeg.legLengthNm = 0.0;
    EXPECT_THROW(CoursePositioning::positionCourse(badLeg), std::invalid_argument);

    PositioningOptions badLine = options_;
    badLine.startLineLengthMeters = -1.0;
    EXPECT_THROW(CoursePositioning::positionCourse(badLine), std::invalid_argument);
}

TEST_F(CoursePositioningTest, CustomTemplateHasOnlyStartLine) {
    options_.courseType = CourseType::Custom;
    PositionedCourse course = CoursePositioning::positionCourse(options_);
    EXPECT_TRUE(course.marks.empty());
    EXPECT_NEAR(course.startLine.lengthMeters(), 100.0, 0.01);
}

TEST_F(CoursePositioningTest, StartLineIsPerpendicularToWind) {
    StartLine line = CoursePositioning::startLine(options_.startLineCenter, 0.0);
    EXPECT_NEAR(line.lengthMeters(), 100.0, 0.01);
    EXPECT_NEAR(Geo::initialBearing(line.pin, line.committee), 90.0, 0.01);
    EXPECT_NEAR(line.center().lat, options_.startLineCenter.lat, 1e-6);
    EXPECT_NEAR(line.center().lng, options_.startLineCenter.lng, 1e-9);

    StartLine longer = CoursePositioning::startLine(options_.startLineCenter, 90.0, 240.0);
    EXPECT_NEAR(longer.lengthMeters(), 240.0, 0.01);
    EXPECT_NEAR(Geo::initialBearing(longer.pin, longer.committee), 180.0, 0.01);
}

TEST(CoursePositioningHelpersTest, StartLineLengthIsClamped) {
    EXPECT_DOUBLE_EQ(CoursePositioning::startLineLength(2), 50.0);
    EXPECT_DOUBLE_EQ(CoursePositioning::startLineLength(20), 240.0);
    EXPECT_DOUBLE_EQ(CoursePositioning::startLineLength(100), 500.0);
    EXPECT_DOUBLE_EQ(CoursePositioning::startLineLength(10, 12.0, 2.0), 240.0);
}

TEST(CoursePositioningHelpersTest, FinishMarkReflectsPinThroughCommittee) {
    StartLine line;
    line.pin = LatLng{0.0, 0.0};
    line.committee = LatLng{0.0, 1.0};
    LatLng finish = CoursePositioning::finishMark(line);
    EXPECT_DOUBLE_EQ(finish.lat, 0.0);
    EXPECT_DOUBLE_EQ(finish.lng, 2.0);
}

TEST(CoursePositioningHelpersTest, TemplatesCoverEveryCourseType) {
    EXPECT_EQ(CoursePositioning::templates().size(), 5u);
    EXPECT_EQ(CoursePositioning::courseTemplate(CourseType::Triangle).marks.size(), 3u);
    EXPECT_EQ(CoursePositioning::courseTemplate(CourseType::Olympic).marks.size(), 4u);
    EXPECT_DOUBLE_EQ(CoursePositioning::courseTemplate(CourseType::Triangle).defaultLegLengthNm, 0.4);
}

TEST_F(CoursePositioningTest, RepositionMovesEverythingTogether) {
    PositionedCourse course = CoursePositioning::positionCourse(options_);
    LatLng newCenter{22.35, 114.25};

    PositionedCourse moved = CoursePositioning::repositionCourse(course.marks, course.startLine, newCenter);
    EXPECT_NEAR(moved.startLine.center().lat, newCenter.lat, 1e-9);
    EXPECT_NEAR(moved.startLine.center().lng, newCenter.lng, 1e-9);
    ASSERT_EQ(moved.marks.size(), course.marks.size());
    const double dLat = newCenter.lat - course.startLine.center().lat;
    for (std::size_t i = 0; i < moved.marks.size(); ++i) {
        EXPECT_NEAR(moved.marks[i].lat, course.marks[i].lat + dLat, 1e-9);
        EXPECT_EQ(moved.marks[i].id, course.marks[i].id);
    }
}

TEST_F(CoursePositioningTest, RepositionRejectsPositionsOffTheGlobe) {
    PositionedCourse course = CoursePositioning::positionCourse(options_);

    EXPECT_THROW(CoursePositioning::repositionCourse(course.marks, course.startLine, LatLng{95.0, 114.2}),
                 std::invalid_argument);
    EXPECT_THROW(CoursePositioning::repositionCourse(course.marks, course.startLine, LatLng{22.3, 181.0}),
                 std::invalid_argument);
    // The center fits but the windward mark half a mile north would not
    EXPECT_THROW(CoursePositioning::repositionCourse(course.marks, course.startLine, LatLng{89.995, 114.2}),
                 std::invalid_argument);
    // Start line ends straddle the antimeridian
    EXPECT_THROW(CoursePositioning::repositionCourse({}, course.startLine, LatLng{0.0, 180.0}),
                 std::invalid_argument);
}

TEST_F(CoursePositioningTest, WindChangeKeepsUserAdjustedMarks) {
    PositionedCourse course = CoursePositioning::positionCourse(options_);
    const LatLng center = options_.startLineCenter;

    std::vector<Mark> marks = CoursePositioning::updateMarkPosition(course.marks, "mark-2", LatLng{22.301, 114.199});
    LatLng extraPosition = Geo::destination(center, 45.0, 0.3);
    Mark extra = makeMark("extra", "Extra", extraPosition.lat, extraPosition.lng, 3);
    marks.push_back(extra);

    std::vector<Mark> rotated = CoursePositioning::recalculateForWindChange(
        marks, center, 0.0, 90.0, 0.5, CourseType::WindwardLeeward);
    ASSERT_EQ(rotated.size(), 4u);

    LatLng windward{rotated[0].lat, rotated[0].lng};
    EXPECT_NEAR(Geo::distance(center, windward), 0.5, 1e-6);
    EXPECT_NEAR(Geo::initialBearing(center, windward), 90.0, 1e-3);

    EXPECT_DOUBLE_EQ(rotated[1].lat, 22.301);
    EXPECT_DOUBLE_EQ(rotated[1].lng, 114.199);
    EXPECT_TRUE(rotated[1].userAdjusted);

    // Past the template: rotated about the center by the wind shift
    LatLng moved{rotated[3].lat, rotated[3].lng};
    EXPECT_NEAR(Geo::distance(center, moved), 0.3, 1e-6);
    EXPECT_NEAR(Geo::initialBearing(center, moved), 135.0, 1e-3);

    EXPECT_THROW(CoursePositioning::recalculateForWindChange(marks, center, 0.0, std::nan(""), 0.5,
                                                             CourseType::WindwardLeeward),
                 std::invalid_argument);
    EXPECT_THROW(CoursePositioning::recalculateForWindChange(marks, center, 0.0, 90.0, 0.0,
                                                             CourseType::WindwardLeeward),
                 std::invalid_argument);
}

TEST_F(CoursePositioningTest, LegLengthChangeScalesUserAdjustedMarks) {
    options_.legLengthNm = 0.5;
    PositionedCourse course = CoursePositioning::positionCourse(options_);
    const LatLng center = options_.startLineCenter;

    LatLng adjusted = Geo::destination(center, 10.0, 0.6);
    std::vector<Mark> marks = CoursePositioning::updateMarkPosition(course.marks, "mark-1", adjusted);
    Mark extra = makeMark("extra", "Extra", 22.31, 114.21, 3);
    marks.push_back(extra);

    std::vector<Mark> stretched = CoursePositioning::recalculateForLegLengthChange(
        marks, center, 0.0, 0.5, 1.0, CourseType::WindwardLeeward);
    ASSERT_EQ(stretched.size(), 4u);

    LatLng windward{stretched[0].lat, stretched[0].lng};
    EXPECT_NEAR(Geo::distance(center, windward), 1.2, 1e-6);
    EXPECT_NEAR(Geo::initialBearing(center, windward), 10.0, 1e-3);

    options_.legLengthNm = 1.0;
    PositionedCourse longer = CoursePositioning::positionCourse(options_);
    EXPECT_NEAR(stretched[1].lat, longer.marks[1].lat, 1e-12);
    EXPECT_NEAR(stretched[2].lng, longer.marks[2].lng, 1e-12);

    EXPECT_DOUBLE_EQ(stretched[3].lat, 22.31);
    EXPECT_DOUBLE_EQ(stretched[3].lng, 114.21);

    EXPECT_THROW(CoursePositioning::recalculateForLegLengthChange(marks, center, 0.0, 0.0, 1.0,
                                                                  CourseType::WindwardLeeward),
                 std::invalid_argument);
}

TEST_F(CoursePositioningTest, RealignDropsManualAdjustments) {
    std::vector<Mark> marks = CoursePositioning::realignCourseToWind(options_.startLineCenter, 90.0, 0.5,
                                                                     CourseType::Triangle);
    ASSERT_EQ(marks.size(), 3u);
    for (const auto& mark : marks) {
        EXPECT_FALSE(mark.userAdjusted);
    }
    LatLng windward{marks[0].lat, marks[0].lng};
    EXPECT_NEAR(Geo::initialBearing(options_.startLineCenter, windward), 90.0, 1e-3);
    EXPECT_NEAR(Geo::distance(options_.startLineCenter, windward), 0.5, 1e-6);
}

TEST_F(CoursePositioningTest, AddUpdateAndRemoveMarks) {
    PositionedCourse course = CoursePositioning::positionCourse(options_);

    std::vector<Mark> marks = CoursePositioning::addCustomMark(course.marks, LatLng{22.305, 114.205}, "Spreader");
    ASSERT_EQ(marks.size(), 4u);
    EXPECT_EQ(marks[3].id, "custom-mark-4");
    EXPECT_EQ(marks[3].order, 3);
    EXPECT_EQ(marks[3].type, MarkType::Offset);
    EXPECT_EQ(marks[3].rounding, Rounding::Port);
    EXPECT_TRUE(marks[3].userAdjusted);

    marks = CoursePositioning::addCustomMark(marks, LatLng{22.306, 114.206}, "Gybe", MarkType::Mark,
                                             Rounding::Starboard);
    EXPECT_EQ(marks[4].id, "custom-mark-5");
    EXPECT_THROW(CoursePositioning::addCustomMark(marks, LatLng{22.3, 114.2}, ""), std::invalid_argument);
    EXPECT_THROW(CoursePositioning::addCustomMark(marks, LatLng{91.0, 114.2}, "Off"), std::invalid_argument);

    marks = CoursePositioning::updateMarkPosition(marks, "mark-3", LatLng{22.299, 114.201});
    EXPECT_TRUE(marks[2].userAdjusted);
    EXPECT_DOUBLE_EQ(marks[2].lat, 22.299);
    EXPECT_FALSE(marks[0].userAdjusted);
    EXPECT_THROW(CoursePositioning::updateMarkPosition(marks, "nope", LatLng{22.3, 114.2}),
                 std::invalid_argument);

    marks = CoursePositioning::removeMark(marks, "mark-2");
    ASSERT_EQ(marks.size(), 4u);
    EXPECT_EQ(marks[1].id, "mark-3");
    EXPECT_EQ(CoursePositioning::removeMark(marks, "nope").size(), 4u);

    // A removed id is free again
    marks = CoursePositioning::removeMark(marks, "custom-mark-4");
    marks = CoursePositioning::addCustomMark(marks, LatLng{22.307, 114.207}, "Late");
    EXPECT_EQ(marks.back().id, "custom-mark-4");

    course.marks = marks;
    FeatureCollection collection = CoursePositioning::toGeometry(course);
    auto custom = std::find_if(collection.features.begin(), collection.features.end(),
                               [](const Feature& f) { return f.id == "custom-mark-5"; });
    ASSERT_NE(custom, collection.features.end());
    EXPECT_EQ(custom->properties["userAdjusted"], true);
}

TEST_F(CoursePositioningTest, ToGeometryStartsWithStartLine) {
    PositionedCourse course = CoursePositioning::positionCourse(options_);
    FeatureCollection collection = CoursePositioning::toGeometry(course);

    ASSERT_EQ(collection.features.size(), 5u);
    EXPECT_EQ(collection.features[0].id, "start-line");
    EXPECT_EQ(collection.features[0].coordinates.size(), 2u);
    EXPECT_EQ(collection.features[1].id, "mark-1");
    EXPECT_EQ(collection.features[4].id, "course-line");
    ASSERT_TRUE(collection.bbox.has_value());
    EXPECT_DOUBLE_EQ(collection.bbox->north, course.bounds.north);
}

TEST(MarkListParserTest, ParsesMixedNotationTable) {
    const std::string text =
        "# Race 12 marks\n"
        "name;lat;lng;type;rounding;order\n"
        "Windward;22 16.760N;114 09.768E;mark;port;1\n"
        "Start Pin;22.25;114.15;pin;;0\n"
        "Broken;abc;114.1;mark;port;\n"
        "Gate;22.27;114.16;buoy;sideways;x\n";

    MarkListParser parser;
    MarkListResult result = parser.parse(text, "marks.csv");

    ASSERT_TRUE(result.success);
    ASSERT_EQ(result.marks.size(), 3u);
    EXPECT_EQ(result.marks[0].name, "Windward");
    EXPECT_NEAR(result.marks[0].lat, 22.279333, 1e-6);
    EXPECT_NEAR(result.marks[0].lng, 114.1628, 1e-6);
    EXPECT_EQ(result.marks[0].order, 1);
    EXPECT_EQ(result.marks[0].rounding, Rounding::Port);

    EXPECT_EQ(result.marks[1].type, MarkType::Pin);
    EXPECT_FALSE(result.marks[1].rounding.has_value());
    EXPECT_EQ(result.marks[1].order, 0);

    EXPECT_EQ(result.marks[2].rawType, "buoy");
    EXPECT_EQ(result.marks[2].rawRounding, "sideways");
    EXPECT_FALSE(result.marks[2].order.has_value());

    ASSERT_EQ(result.errors.size(), 2u);
    EXPECT_EQ(result.errors[0].rfind("line 5: ", 0), 0u);
    EXPECT_EQ(result.errors[1], "line 6: ignoring invalid order 'x'");
}

TEST(MarkListParserTest, OverlongCoordinateIsRowError) {
    const std::string text =
        "name,lat,lng\n"
        "Top,22.31,114.20\n"
        "Huge," + std::string(400, '9') + ",114.20\n"
        "Committee,22.30,114.20\n";

    MarkListResult result = MarkListParser().parse(text, "huge.csv");
    ASSERT_TRUE(result.success);
    ASSERT_EQ(result.marks.size(), 2u);
    EXPECT_EQ(result.marks[1].name, "Committee");
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].rfind("line 3: ", 0), 0u);
}

TEST(MarkListParserTest, AcceptsHeaderAliases) {
    const std::string text =
        "\xEF\xBB\xBF" "ID,Mark,Latitude,Longitude,Seq\n"
        "w1,Top,22.31,114.20,1\n"
        "s1,Committee,22.30,114.20,0\n";

    MarkListResult result = MarkListParser().parse(text, "aliases.csv");
    ASSERT_TRUE(result.success);
    ASSERT_EQ(result.marks.size(), 2u);
    EXPECT_EQ(result.marks[0].id, "w1");
    EXPECT_EQ(result.marks[0].name, "Top");
    EXPECT_EQ(result.marks[1].order, 0);
    EXPECT_TRUE(result.errors.empty());
}

TEST(MarkListParserTest, ReportsStructuralErrors) {
    MarkListParser parser;

    MarkListResult missingColumns = parser.parse("name,lat\nA,22.3\n", "marks.csv");
    EXPECT_FALSE(missingColumns.success);
    ASSERT_EQ(missingColumns.errors.size(), 1u);
    EXPECT_EQ(missingColumns.errors[0], "marks.csv: header must name name, lat and lng columns");

    MarkListResult empty = parser.parse("# nothing here\n\n", "empty.csv");
    EXPECT_FALSE(empty.success);
    ASSERT_EQ(empty.errors.size(), 1u);
    EXPECT_EQ(empty.errors[0], "empty.csv: no header line");

    MarkListResult headerOnly = parser.parse("name,lat,lng\n", "header.csv");
    EXPECT_FALSE(headerOnly.success);
    ASSERT_EQ(headerOnly.errors.size(), 1u);
    EXPECT_EQ(headerOnly.errors[0], "header.csv: no marks");

    MarkListResult missing = parser.parseFile("/nonexistent/marks.csv");
    EXPECT_FALSE(missing.success);
    ASSERT_EQ(missing.errors.size(), 1u);
    EXPECT_EQ(missing.errors[0], "Cannot open file: /nonexistent/marks.csv");
}
