#pragma once

#include "../Track.hpp"
#include <optional>
#include <string>

namespace sailtrack::course {

enum class MarkType {
    StartLine,
    FinishLine,
    StartFinish,
    Mark,
    Gate,
    Offset,
    CommitteeBoat,
    Pin
};

enum class Rounding {
    Port,
    Starboard,
    Either
};

enum class LegType {
    Upwind,
    Downwind,
    Reaching,
    Run
};

enum class CourseType {
    WindwardLeeward,
    Triangle,
    Trapezoid,
    Olympic,
    Custom
};

struct Mark {
    std::string id;
    std::string name;
    double lat = 0.0;
    double lng = 0.0;

    std::optional<MarkType> type;
    std::optional<Rounding> rounding;
    std::optional<int> order;

    // Placed or moved by hand; kept in place when the course is recalculated.
    bool userAdjusted = false;

    // Source text of type/rounding when it did not name a known value.
    std::string rawType;
    std::string rawRounding;

    // Maps typeText/roundingText onto the enums, keeping unknown text in raw*.
    static Mark fromText(const std::string& id, const std::string& name, double lat, double lng,
                         const std::string& typeText, const std::string& roundingText,
                         std::optional<int> order = std::nullopt);
};

struct CourseLeg {
    std::string from;
    std::string to;
    LegType type = LegType::Reaching;
    double distance = 0.0;
    DistanceUnit unit = DistanceUnit::NauticalMiles;
    double bearing = 0.0;       // degrees true, [0, 360)
};

std::string markTypeToString(MarkType type);
std::optional<MarkType> stringToMarkType(const std::string& str);

std::string roundingToString(Rounding rounding);
std::optional<Rounding> stringToRounding(const std::string& str);

std::string legTypeToString(LegType type);
std::string courseTypeToString(CourseType type);
std::optional<CourseType> stringToCourseType(const std::string& str);

} // namespace sailtrack::course
