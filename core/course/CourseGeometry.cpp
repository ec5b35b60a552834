#include "CourseGeometry.hpp"
#include <algorithm>
#include <cctype>

namespace sailtrack::course {

namespace {

const std::vector<std::string> kWindwardKeywords = {"windward", "weather", "top"};
const std::vector<std::string> kLeewardKeywords = {"leeward", "lee", "bottom"};
const std::vector<std::string> kReachingKeywords = {"reach", "wing", "gybe"};

std::string lowercase(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

bool anyNameContains(const std::vector<std::string>& names, const std::vector<std::string>& keywords) {
    for (const auto& name : names) {
        for (const auto& keyword : keywords) {
            if (name.find(keyword) != std::string::npos) {
                return true;
            }
        }
    }
    return false;
}

std::vector<CourseLeg> buildLegs(const std::vector<Mark>& marks, DistanceUnit unit,
                                 double referenceBearing) {
    std::vector<CourseLeg> legs;
    std::vector<Mark> ordered = CourseGeometry::sortByOrder(marks);
    for (std::size_t i = 1; i < ordered.size(); ++i) {
        const Mark& from = ordered[i - 1];
        const Mark& to = ordered[i];

        CourseLeg leg;
        leg.from = from.name;
        leg.to = to.name;
        leg.unit = unit;
        leg.distance = Geo::distance({from.lat, from.lng}, {to.lat, to.lng}, unit);
        leg.bearing = Geo::initialBearing({from.lat, from.lng}, {to.lat, to.lng});
        leg.type = CourseGeometry::classifyLeg(Geo::normalizeBearing(leg.bearing - referenceBearing));
        legs.push_back(leg);
    }
    return legs;
}

std::string featureId(const Mark& mark, std::size_t index) {
    return mark.id.empty() ? "mark-" + std::to_string(index + 1) : mark.id;
}

} // namespace

nlohmann::json CourseGeometry::markProperties(const Mark& mark) {
    nlohmann::json properties = nlohmann::json::object();
    properties["id"] = mark.id;
    properties["name"] = mark.name;
    if (mark.type) {
        properties["type"] = markTypeToString(*mark.type);
    } else if (!mark.rawType.empty()) {
        properties["type"] = mark.rawType;
    } else {
        properties["type"] = nullptr;
    }
    if (mark.rounding) {
        properties["rounding"] = roundingToString(*mark.rounding);
    } else if (!mark.rawRounding.empty()) {
        properties["rounding"] = mark.rawRounding;
    } else {
        properties["rounding"] = nullptr;
    }
    if (mark.order) {
        properties["order"] = *mark.order;
    } else {
        properties["order"] = nullptr;
    }
    if (mark.userAdjusted) {
        properties["userAdjusted"] = true;
    }
    return properties;
}

FeatureCollection CourseGeometry::buildGeometry(const std::vector<Mark>& marks, bool includeCourseLine) {
    FeatureCollection collection;

    for (std::size_t i = 0; i < marks.size(); ++i) {
        Feature feature;
        feature.id = featureId(marks[i], i);
        feature.geometryType = GeometryType::Point;
        feature.coordinates.push_back({marks[i].lat, marks[i].lng});
        feature.properties = markProperties(marks[i]);
        collection.features.push_back(std::move(feature));
    }

    if (includeCourseLine && marks.size() >= 2) {
        Feature line;
        line.id = "course-line";
        line.geometryType = GeometryType::LineString;
        for (const auto& mark : marks) {
            line.coordinates.push_back({mark.lat, mark.lng});
        }
        line.properties = {{"type", "course-line"}, {"name", "Course"}};
        collection.features.push_back(std::move(line));
    }

    return collection;
}

FeatureCollection CourseGeometry::buildGeometry(const std::vector<Mark>& marks,
                                                const std::vector<CourseLeg>& legs,
                                                const GeometryOptions& options) {
    FeatureCollection collection = buildGeometry(marks, options.includeCourseLine);

    if (options.includeLegs) {
        for (std::size_t i = 0; i < legs.size(); ++i) {
            const CourseLeg& leg = legs[i];
            auto from = std::find_if(marks.begin(), marks.end(),
                                     [&](const Mark& m) { return m.name == leg.from; });
            auto to = std::find_if(marks.begin(), marks.end(),
                                   [&](const Mark& m) { return m.name == leg.to; });
            if (from == marks.end() || to == marks.end()) {
                continue;
            }

            Feature feature;
            feature.id = "leg-" + std::to_string(i + 1);
            feature.geometryType = GeometryType::LineString;
            feature.coordinates = {{from->lat, from->lng}, {to->lat, to->lng}};
            feature.properties = {
                {"type", "leg"},
                {"from", leg.from},
                {"to", leg.to},
                {"legType", legTypeToString(leg.type)},
                {"distance", leg.distance},
                {"unit", distanceUnitToString(leg.unit)},
                {"bearing", leg.bearing}
            };
            collection.features.push_back(std::move(feature));
        }
    }

    if (options.includeBounds && !marks.empty()) {
        std::vector<LatLng> points;
        for (const auto& mark : marks) {
            points.push_back({mark.lat, mark.lng});
        }
        collection.bbox = Geo::boundingBox(points, options.boundsPaddingDeg);
    }
    return collection;
}

CourseType CourseGeometry::detectCourseType(const std::vector<Mark>& marks) {
    std::vector<std::string> names;
    for (const auto& mark : marks) {
        names.push_back(lowercase(mark.name));
    }

    const bool windward = anyNameContains(names, kWindwardKeywords);
    const bool leeward = anyNameContains(names, kLeewardKeywords);
    const bool reaching = anyNameContains(names, kReachingKeywords);
    const bool offset = anyNameContains(names, {"offset"});
    const std::size_t count = marks.size();

    if (windward && leeward && !reaching) {
        return CourseType::WindwardLeeward;
    }
    if (reaching && count >= 3 && count <= 4) {
        return CourseType::Triangle;
    }
    if (offset && windward && leeward) {
        return CourseType::Trapezoid;
    }
    if (count >= 5 && count <= 7 && windward) {
        return CourseType::Olympic;
    }
    return CourseType::Custom;
}

std::vector<Mark> CourseGeometry::sortByOrder(const std::vector<Mark>& marks) {
    std::vector<Mark> ordered = marks;
    std::stable_sort(ordered.begin(), ordered.end(), [](const Mark& a, const Mark& b) {
        if (a.order && b.order) {
            return *a.order < *b.order;
        }
        return a.order.has_value() && !b.order.has_value();
    });
    return ordered;
}

LegType CourseGeometry::classifyLeg(double relativeBearing) {
    const double bearing = Geo::normalizeBearing(relativeBearing);
    if (bearing <= LEG_SECTOR_DEG || bearing >= 360.0 - LEG_SECTOR_DEG) {
        return LegType::Upwind;
    }
    if (bearing >= 180.0 - LEG_SECTOR_DEG && bearing <= 180.0 + LEG_SECTOR_DEG) {
        return LegType::Downwind;
    }
    return LegType::Reaching;
}

std::vector<CourseLeg> CourseGeometry::generateLegs(const std::vector<Mark>& marks, DistanceUnit unit) {
    return buildLegs(marks, unit, 0.0);
}

std::vector<CourseLeg> CourseGeometry::generateLegs(const std::vector<Mark>& marks, DistanceUnit unit,
                                                    double windDirection) {
    return buildLegs(marks, unit, windDirection);
}

CourseSummary CourseGeometry::computeCourseGeometry(const std::vector<Mark>& marks,
                                                    double boundsPaddingDeg, DistanceUnit unit) {
    std::vector<LatLng> points;
    for (const auto& mark : marks) {
        points.push_back({mark.lat, mark.lng});
    }

    CourseSummary summary;
    summary.bounds = Geo::boundingBox(points, boundsPaddingDeg);
    summary.centroid = Geo::centroid(points);
    summary.unit = unit;
    summary.legs = generateLegs(marks, unit);
    for (const auto& leg : summary.legs) {
        summary.totalDistance += leg.distance;
    }
    summary.courseType = detectCourseType(marks);
    return summary;
}

nlohmann::json CourseGeometry::toGeoJson(const FeatureCollection& collection) {
    nlohmann::json features = nlohmann::json::array();
    for (const auto& feature : collection.features) {
        nlohmann::json geometry;
        if (feature.geometryType == GeometryType::Point) {
            geometry["type"] = "Point";
            if (!feature.coordinates.empty()) {
                geometry["coordinates"] = {feature.coordinates.front().lng,
                                           feature.coordinates.front().lat};
            } else {
                geometry["coordinates"] = nlohmann::json::array();
            }
        } else {
            geometry["type"] = "LineString";
            nlohmann::json coordinates = nlohmann::json::array();
            for (const auto& point : feature.coordinates) {
                coordinates.push_back({point.lng, point.lat});
            }
            geometry["coordinates"] = coordinates;
        }

        nlohmann::json j;
        j["type"] = "Feature";
        j["id"] = feature.id;
        j["geometry"] = geometry;
        j["properties"] = feature.properties;
        features.push_back(j);
    }

    nlohmann::json j;
    j["type"] = "FeatureCollection";
    j["features"] = features;
    if (collection.bbox) {
        j["bbox"] = collection.bbox->toArray();
    }
    return j;
}

} // namespace sailtrack::course
