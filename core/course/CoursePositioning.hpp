#pragma once

#include "CourseGeometry.hpp"
#include "Mark.hpp"
#include "../Geo.hpp"
#include <optional>
#include <string>
#include <vector>

namespace sailtrack::course {

struct StartLine {
    LatLng pin;          // port end looking upwind
    LatLng committee;    // starboard end

    LatLng center() const;
    double lengthMeters() const;
};

// Mark placement in leg-length units from the start line center:
// relY along the wind (positive upwind), relX across it (positive to starboard).
struct MarkTemplate {
    std::string name;
    MarkType type = MarkType::Mark;
    double relX = 0.0;
    double relY = 0.0;
    Rounding rounding = Rounding::Port;
};

struct CourseTemplate {
    CourseType type = CourseType::Custom;
    std::string name;
    std::string description;
    double defaultLegLengthNm = 0.5;
    std::vector<MarkTemplate> marks;
};

struct PositioningOptions {
    LatLng startLineCenter;
    double windDirection = 0.0;                  // degrees the wind blows from
    CourseType courseType = CourseType::WindwardLeeward;
    std::optional<double> legLengthNm;           // template default when empty
    double startLineLengthMeters = 100.0;
};

struct PositionedCourse {
    std::vector<Mark> marks;
    StartLine startLine;
    BoundingBox bounds;
};

class CoursePositioning {
public:
    static constexpr double DEFAULT_START_LINE_LENGTH_M = 100.0;
    static constexpr double DEFAULT_BOAT_LOA_M = 8.0;
    static constexpr double DEFAULT_SPACING_MULTIPLIER = 1.5;
    static constexpr double MIN_START_LINE_LENGTH_M = 50.0;
    static constexpr double MAX_START_LINE_LENGTH_M = 500.0;

    static const CourseTemplate& courseTemplate(CourseType type);
    static const std::vector<CourseTemplate>& templates();

    /**
     * @brief Place a template course on the water
     * @throws std::invalid_argument for an out-of-range center, a non-positive
     *         leg length or start line length
     */
    static PositionedCourse positionCourse(const PositioningOptions& options);

    // Perpendicular to the wind, centered on center.
    static StartLine startLine(const LatLng& center, double windDirection,
                               double lengthMeters = DEFAULT_START_LINE_LENGTH_M);

    // boats x loa x multiplier, clamped to [50, 500] m.
    static double startLineLength(int numberOfBoats, double boatLengthMeters = DEFAULT_BOAT_LOA_M,
                                  double spacingMultiplier = DEFAULT_SPACING_MULTIPLIER);

    // The pin reflected through the committee boat.
    static LatLng finishMark(const StartLine& startLine);

    /**
     * @brief Translate marks and start line so the start line center lands on newCenter
     * @throws std::invalid_argument if newCenter, or any translated position,
     *         is outside [-90, 90] / [-180, 180]
     */
    static PositionedCourse repositionCourse(const std::vector<Mark>& marks, const StartLine& startLine,
                                             const LatLng& newCenter);

    /**
     * @brief Rotate a positioned course to a new wind direction
     *
     * Marks with a template slot (by index) are placed again for newWind;
     * marks past the template are rotated about the center by the wind shift.
     * User-adjusted marks stay where they are.
     *
     * @throws std::invalid_argument for an out-of-range center, a non-finite
     *         wind direction or a non-positive leg length
     */
    static std::vector<Mark> recalculateForWindChange(const std::vector<Mark>& marks, const LatLng& center,
                                                      double oldWind, double newWind, double legLengthNm,
                                                      CourseType courseType);

    /**
     * @brief Stretch a positioned course to a new leg length
     *
     * Template marks are placed again at the new length. User-adjusted marks
     * keep their bearing from the center and scale their distance by
     * newLegLengthNm / oldLegLengthNm. Marks past the template stay put.
     *
     * @throws std::invalid_argument for an out-of-range center, a non-finite
     *         wind direction or a non-positive leg length
     */
    static std::vector<Mark> recalculateForLegLengthChange(const std::vector<Mark>& marks, const LatLng& center,
                                                           double windDirection, double oldLegLengthNm,
                                                           double newLegLengthNm, CourseType courseType);

    // Drops every manual adjustment: the template placed fresh for windDirection.
    static std::vector<Mark> realignCourseToWind(const LatLng& center, double windDirection,
                                                 double legLengthNm, CourseType courseType);

    /**
     * @brief Append a hand-placed mark
     *
     * The mark gets the next free "custom-mark-<n>" id, the next order and
     * userAdjusted set.
     *
     * @throws std::invalid_argument for an empty name or an out-of-range position
     */
    static std::vector<Mark> addCustomMark(const std::vector<Mark>& marks, const LatLng& position,
                                           const std::string& name, MarkType type = MarkType::Offset,
                                           Rounding rounding = Rounding::Port);

    /// @throws std::invalid_argument for an unknown id or an out-of-range position
    static std::vector<Mark> updateMarkPosition(const std::vector<Mark>& marks, const std::string& markId,
                                                const LatLng& position);

    // Unknown ids leave the list unchanged.
    static std::vector<Mark> removeMark(const std::vector<Mark>& marks, const std::string& markId);

    // Start line, marks and course line as a feature collection.
    static FeatureCollection toGeometry(const PositionedCourse& course);

private:
    static BoundingBox boundsFor(const std::vector<Mark>& marks, const StartLine& startLine);
};

} // namespace sailtrack::course
