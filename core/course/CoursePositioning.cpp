#include "CoursePositioning.hpp"
#include <algorithm>
#include <cmath>
#include <iterator>
#include <stdexcept>

namespace sailtrack::course {

namespace {

// Below this many nautical miles a sideways offset is not applied.
constexpr double kMinSideOffsetNm = 0.0001;

LatLng placeMark(const LatLng& center, double windDirection, double legLengthNm,
                 const MarkTemplate& tmpl) {
    LatLng position = Geo::destination(center, windDirection, tmpl.relY * legLengthNm,
                                       DistanceUnit::NauticalMiles);
    const double side = tmpl.relX * legLengthNm;
    if (std::fabs(side) > kMinSideOffsetNm) {
        const double sideBearing = Geo::normalizeBearing(windDirection + (side > 0 ? 90.0 : -90.0));
        position = Geo::destination(position, sideBearing, std::fabs(side), DistanceUnit::NauticalMiles);
    }
    return position;
}

bool onEarth(const LatLng& position) {
    return isValidLatitude(position.lat) && isValidLongitude(position.lng);
}

void requireCourseInputs(const LatLng& center, double windDirection, double legLengthNm) {
    if (!onEarth(center)) {
        throw std::invalid_argument("Start line center out of range");
    }
    if (!std::isfinite(windDirection)) {
        throw std::invalid_argument("Wind direction must be finite");
    }
    if (!(legLengthNm > 0.0) || !std::isfinite(legLengthNm)) {
        throw std::invalid_argument("Leg length must be positive");
    }
}

} // namespace

LatLng StartLine::center() const {
    return LatLng{(pin.lat + committee.lat) / 2.0, (pin.lng + committee.lng) / 2.0};
}

double StartLine::lengthMeters() const {
    return Geo::distance(pin, committee, DistanceUnit::Meters);
}

const std::vector<CourseTemplate>& CoursePositioning::templates() {
    static const std::vector<CourseTemplate> courseTemplates = {
        {CourseType::WindwardLeeward, "Windward/Leeward", "Upwind/downwind course with a leeward gate", 0.5, {
            {"Windward Mark", MarkType::Mark, 0.0, 1.0, Rounding::Port},
            {"Leeward Gate Left", MarkType::Gate, -0.08, 0.2, Rounding::Port},
            {"Leeward Gate Right", MarkType::Gate, 0.08, 0.2, Rounding::Starboard}
        }},
        {CourseType::Triangle, "Triangle", "Triangular course with reaching legs", 0.4, {
            {"Windward Mark", MarkType::Mark, 0.0, 1.0, Rounding::Port},
            {"Wing Mark", MarkType::Mark, 0.866, 0.5, Rounding::Port},
            {"Leeward Mark", MarkType::Mark, 0.0, 0.0, Rounding::Port}
        }},
        {CourseType::Olympic, "Olympic", "Windward, wing, leeward and offset marks", 0.5, {
            {"Windward Mark", MarkType::Mark, 0.0, 1.0, Rounding::Port},
            {"Wing Mark", MarkType::Mark, 0.5, 0.5, Rounding::Port},
            {"Leeward Mark", MarkType::Mark, 0.0, 0.0, Rounding::Port},
            {"Offset Mark", MarkType::Offset, 0.1, 0.9, Rounding::Starboard}
        }},
        {CourseType::Trapezoid, "Trapezoid", "Four-mark trapezoid course", 0.5, {
            {"Windward Left", MarkType::Mark, -0.3, 1.0, Rounding::Port},
            {"Windward Right", MarkType::Mark, 0.3, 1.0, Rounding::Starboard},
            {"Leeward Left", MarkType::Mark, -0.2, 0.0, Rounding::Port},
            {"Leeward Right", MarkType::Mark, 0.2, 0.0, Rounding::Starboard}
        }},
        {CourseType::Custom, "Custom", "User-defined course layout", 0.5, {}}
    };
    return courseTemplates;
}

const CourseTemplate& CoursePositioning::courseTemplate(CourseType type) {
    const auto& all = templates();
    auto it = std::find_if(all.begin(), all.end(),
                           [type](const CourseTemplate& t) { return t.type == type; });
    return it != all.end() ? *it : all.back();
}

StartLine CoursePositioning::startLine(const LatLng& center, double windDirection, double lengthMeters) {
    const double perpendicular = Geo::normalizeBearing(windDirection + 90.0);
    const double halfLength = lengthMeters / 2.0;

    StartLine line;
    line.pin = Geo::destination(center, Geo::normalizeBearing(perpendicular + 180.0), halfLength,
                                DistanceUnit::Meters);
    line.committee = Geo::destination(center, perpendicular, halfLength, DistanceUnit::Meters);
    return line;
}

double CoursePositioning::startLineLength(int numberOfBoats, double boatLengthMeters,
                                          double spacingMultiplier) {
    const double calculated = numberOfBoats * boatLengthMeters * spacingMultiplier;
    return std::max(MIN_START_LINE_LENGTH_M, std::min(MAX_START_LINE_LENGTH_M, calculated));
}

LatLng CoursePositioning::finishMark(const StartLine& startLine) {
    const double dLat = startLine.pin.lat - startLine.committee.lat;
    const double dLng = startLine.pin.lng - startLine.committee.lng;
    return LatLng{startLine.committee.lat - dLat, startLine.committee.lng - dLng};
}

PositionedCourse CoursePositioning::positionCourse(const PositioningOptions& options) {
    const CourseTemplate& tmpl = courseTemplate(options.courseType);
    const double legLength = options.legLengthNm.value_or(tmpl.defaultLegLengthNm);
    requireCourseInputs(options.startLineCenter, options.windDirection, legLength);
    if (!(options.startLineLengthMeters > 0.0)) {
        throw std::invalid_argument("Start line length must be positive");
    }

    PositionedCourse course;
    course.startLine = startLine(options.startLineCenter, options.windDirection,
                                 options.startLineLengthMeters);

    for (std::size_t i = 0; i < tmpl.marks.size(); ++i) {
        const MarkTemplate& markTemplate = tmpl.marks[i];
        LatLng position = placeMark(options.startLineCenter, options.windDirection, legLength,
                                    markTemplate);

        Mark mark;
        mark.id = "mark-" + std::to_string(i + 1);
        mark.name = markTemplate.name;
        mark.lat = position.lat;
        mark.lng = position.lng;
        mark.type = markTemplate.type;
        mark.rounding = markTemplate.rounding;
        mark.order = static_cast<int>(i);
        course.marks.push_back(mark);
    }

    course.bounds = boundsFor(course.marks, course.startLine);
    return course;
}

PositionedCourse CoursePositioning::repositionCourse(const std::vector<Mark>& marks,
                                                     const StartLine& startLine,
                                                     const LatLng& newCenter) {
    if (!onEarth(newCenter)) {
        throw std::invalid_argument("New course center out of range");
    }

    const LatLng oldCenter = startLine.center();
    const double dLat = newCenter.lat - oldCenter.lat;
    const double dLng = newCenter.lng - oldCenter.lng;

    auto translate = [&](const LatLng& from, const std::string& what) {
        LatLng to{from.lat + dLat, from.lng + dLng};
        if (!onEarth(to)) {
            throw std::invalid_argument(what + " would leave the valid coordinate range");
        }
        return to;
    };

    PositionedCourse course;
    course.startLine.pin = translate(startLine.pin, "Start line pin");
    course.startLine.committee = translate(startLine.committee, "Committee boat");
    for (const auto& mark : marks) {
        LatLng position = translate(LatLng{mark.lat, mark.lng}, "Mark '" + mark.name + "'");
        Mark moved = mark;
        moved.lat = position.lat;
        moved.lng = position.lng;
        course.marks.push_back(moved);
    }
    course.bounds = boundsFor(course.marks, course.startLine);
    return course;
}

std::vector<Mark> CoursePositioning::recalculateForWindChange(const std::vector<Mark>& marks,
                                                              const LatLng& center, double oldWind,
                                                              double newWind, double legLengthNm,
                                                              CourseType courseType) {
    requireCourseInputs(center, newWind, legLengthNm);
    if (!std::isfinite(oldWind)) {
        throw std::invalid_argument("Wind direction must be finite");
    }

    const CourseTemplate& tmpl = courseTemplate(courseType);
    const double rotation = newWind - oldWind;

    std::vector<Mark> result = marks;
    for (std::size_t i = 0; i < result.size(); ++i) {
        Mark& mark = result[i];
        if (mark.userAdjusted) {
            continue;
        }

        LatLng position;
        if (i < tmpl.marks.size()) {
            position = placeMark(center, newWind, legLengthNm, tmpl.marks[i]);
        } else {
            const LatLng current{mark.lat, mark.lng};
            const double distance = Geo::distance(center, current);
            const double bearing = Geo::normalizeBearing(Geo::initialBearing(center, current) + rotation);
            position = Geo::destination(center, bearing, distance);
        }
        mark.lat = position.lat;
        mark.lng = position.lng;
    }
    return result;
}

std::vector<Mark> CoursePositioning::recalculateForLegLengthChange(const std::vector<Mark>& marks,
                                                                   const LatLng& center, double windDirection,
                                                                   double oldLegLengthNm, double newLegLengthNm,
                                                                   CourseType courseType) {
    requireCourseInputs(center, windDirection, newLegLengthNm);
    if (!(oldLegLengthNm > 0.0) || !std::isfinite(oldLegLengthNm)) {
        throw std::invalid_argument("Leg length must be positive");
    }

    const CourseTemplate& tmpl = courseTemplate(courseType);
    const double scale = newLegLengthNm / oldLegLengthNm;

    std::vector<Mark> result = marks;
    for (std::size_t i = 0; i < result.size(); ++i) {
        Mark& mark = result[i];

        LatLng position;
        if (mark.userAdjusted) {
            const LatLng current{mark.lat, mark.lng};
            const double distance = Geo::distance(center, current) * scale;
            position = Geo::destination(center, Geo::initialBearing(center, current), distance);
        } else if (i < tmpl.marks.size()) {
            position = placeMark(center, windDirection, newLegLengthNm, tmpl.marks[i]);
        } else {
            continue;
        }
        mark.lat = position.lat;
        mark.lng = position.lng;
    }
    return result;
}

std::vector<Mark> CoursePositioning::realignCourseToWind(const LatLng& center, double windDirection,
                                                         double legLengthNm, CourseType courseType) {
    PositioningOptions options;
    options.startLineCenter = center;
    options.windDirection = windDirection;
    options.courseType = courseType;
    options.legLengthNm = legLengthNm;
    return positionCourse(options).marks;
}

std::vector<Mark> CoursePositioning::addCustomMark(const std::vector<Mark>& marks, const LatLng& position,
                                                   const std::string& name, MarkType type,
                                                   Rounding rounding) {
    if (name.empty()) {
        throw std::invalid_argument("Custom mark needs a name");
    }
    if (!onEarth(position)) {
        throw std::invalid_argument("Custom mark position out of range");
    }

    auto idTaken = [&marks](const std::string& id) {
        return std::any_of(marks.begin(), marks.end(), [&id](const Mark& m) { return m.id == id; });
    };
    std::size_t n = marks.size() + 1;
    while (idTaken("custom-mark-" + std::to_string(n))) {
        ++n;
    }

    Mark mark;
    mark.id = "custom-mark-" + std::to_string(n);
    mark.name = name;
    mark.lat = position.lat;
    mark.lng = position.lng;
    mark.type = type;
    mark.rounding = rounding;
    mark.order = static_cast<int>(marks.size());
    mark.userAdjusted = true;

    std::vector<Mark> result = marks;
    result.push_back(mark);
    return result;
}

std::vector<Mark> CoursePositioning::updateMarkPosition(const std::vector<Mark>& marks,
                                                        const std::string& markId, const LatLng& position) {
    if (!onEarth(position)) {
        throw std::invalid_argument("Mark position out of range");
    }

    std::vector<Mark> result = marks;
    auto it = std::find_if(result.begin(), result.end(), [&markId](const Mark& m) { return m.id == markId; });
    if (it == result.end()) {
        throw std::invalid_argument("No mark with id '" + markId + "'");
    }
    it->lat = position.lat;
    it->lng = position.lng;
    it->userAdjusted = true;
    return result;
}

std::vector<Mark> CoursePositioning::removeMark(const std::vector<Mark>& marks, const std::string& markId) {
    std::vector<Mark> result;
    std::copy_if(marks.begin(), marks.end(), std::back_inserter(result),
                 [&markId](const Mark& m) { return m.id != markId; });
    return result;
}

FeatureCollection CoursePositioning::toGeometry(const PositionedCourse& course) {
    FeatureCollection collection;

    Feature line;
    line.id = "start-line";
    line.geometryType = GeometryType::LineString;
    line.coordinates = {course.startLine.pin, course.startLine.committee};
    line.properties = {{"type", "start-line"}, {"name", "Start Line"}};
    collection.features.push_back(line);

    FeatureCollection marks = CourseGeometry::buildGeometry(CourseGeometry::sortByOrder(course.marks), true);
    for (auto& feature : marks.features) {
        collection.features.push_back(std::move(feature));
    }
    collection.bbox = course.bounds;
    return collection;
}

BoundingBox CoursePositioning::boundsFor(const std::vector<Mark>& marks, const StartLine& startLine) {
    std::vector<LatLng> points = {startLine.pin, startLine.committee};
    for (const auto& mark : marks) {
        points.push_back({mark.lat, mark.lng});
    }
    return Geo::boundingBox(points);
}

} // namespace sailtrack::course
