#pragma once

#include "Mark.hpp"
#include "../Geo.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace sailtrack::course {

enum class GeometryType {
    Point,
    LineString
};

// Coordinates are stored as LatLng but always serialized [longitude, latitude].
struct Feature {
    std::string id;
    GeometryType geometryType = GeometryType::Point;
    std::vector<LatLng> coordinates;
    nlohmann::json properties = nlohmann::json::object();
};

struct FeatureCollection {
    std::vector<Feature> features;
    std::optional<BoundingBox> bbox;
};

struct GeometryOptions {
    bool includeCourseLine = true;
    bool includeLegs = true;
    bool includeBounds = true;
    double boundsPaddingDeg = Geo::DEFAULT_BOUNDS_PADDING_DEG;
};

struct CourseSummary {
    BoundingBox bounds;
    LatLng centroid;
    double totalDistance = 0.0;
    DistanceUnit unit = DistanceUnit::NauticalMiles;
    std::vector<CourseLeg> legs;
    CourseType courseType = CourseType::Custom;
};

class CourseGeometry {
public:
    static constexpr double LEG_SECTOR_DEG = 45.0;

    /**
     * @brief One Point feature per mark, optionally a "course-line" LineString
     *        through all marks in array order (only with two or more marks)
     */
    static FeatureCollection buildGeometry(const std::vector<Mark>& marks, bool includeCourseLine);

    /**
     * @brief As above plus one LineString per leg carrying the leg attributes
     * @note Legs whose endpoint names match no mark are left out
     */
    static FeatureCollection buildGeometry(const std::vector<Mark>& marks,
                                           const std::vector<CourseLeg>& legs,
                                           const GeometryOptions& options);

    /**
     * @brief Guess the course layout from mark names
     *
     * Keyword heuristic, evaluated in this order:
     *  1. windward and leeward keywords, no reaching keyword: windward-leeward
     *  2. a reaching keyword with 3 or 4 marks: triangle
     *  3. "offset" together with windward and leeward keywords: trapezoid
     *  4. 5 to 7 marks with a windward keyword: olympic
     *  5. anything else: custom
     * Unconventional mark names defeat it; the result is a hint, not a fact.
     */
    static CourseType detectCourseType(const std::vector<Mark>& marks);

    /**
     * @brief Legs between consecutive marks in sailing order
     *
     * Marks with an order index come first, ascending; marks without one
     * follow in their original array position. Leg type is taken from the
     * bearing relative to north.
     */
    static std::vector<CourseLeg> generateLegs(const std::vector<Mark>& marks,
                                               DistanceUnit unit = DistanceUnit::NauticalMiles);

    // Same, classifying each leg by its bearing relative to windDirection.
    static std::vector<CourseLeg> generateLegs(const std::vector<Mark>& marks, DistanceUnit unit,
                                               double windDirection);

    // Within 45 degrees of 0 upwind, of 180 downwind, otherwise reaching.
    static LegType classifyLeg(double relativeBearing);

    static std::vector<Mark> sortByOrder(const std::vector<Mark>& marks);

    /// @throws std::invalid_argument when marks is empty
    static CourseSummary computeCourseGeometry(const std::vector<Mark>& marks,
                                               double boundsPaddingDeg = Geo::DEFAULT_BOUNDS_PADDING_DEG,
                                               DistanceUnit unit = DistanceUnit::NauticalMiles);

    static nlohmann::json toGeoJson(const FeatureCollection& collection);
    static nlohmann::json markProperties(const Mark& mark);
};

} // namespace sailtrack::course
